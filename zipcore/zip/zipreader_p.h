// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_ZIP_ZIPREADER_P_H_INCLUDED
#define ZIPCORE_ZIP_ZIPREADER_P_H_INCLUDED

#include <zipcore/core/api-internal_p.h>
#include <zipcore/zip/zipformat_p.h>
#include <zipcore/zip/zipreader.h>

//! \cond INTERNAL
//! \addtogroup zipcore_internal
//! \{

//! Data of an open ZIP reader.
struct ZCZipReaderImpl {
  ZC_NONCOPYABLE(ZCZipReaderImpl)

  //! Archive data.
  zc::Zip::ZipSource source;
  //! Raw central directory as read from the archive.
  ZCByteArray central_dir;
  //! Parsed records (`zc::Zip::EntryRecord`), one per central directory record.
  ZCByteArray records;
  //! Archive comment.
  ZCByteArray comment;
  //! Offset of the central directory (where the data of an appended entry would start).
  uint64_t central_dir_ofs = 0;
  ZCZipReaderFlags flags = ZC_ZIP_READER_NO_FLAGS;

  ZC_INLINE ZCZipReaderImpl() noexcept {}

  ZC_INLINE_NODEBUG uint32_t entry_count() const noexcept { return uint32_t(zc::Zip::entry_record_count(records)); }
  ZC_INLINE_NODEBUG const zc::Zip::EntryRecord& record(uint32_t index) const noexcept { return zc::Zip::entry_records(records)[index]; }
};

//! \}
//! \endcond

#endif // ZIPCORE_ZIP_ZIPREADER_P_H_INCLUDED
