// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_ZIP_ZIPENTRY_H_INCLUDED
#define ZIPCORE_ZIP_ZIPENTRY_H_INCLUDED

#include <zipcore/core/api.h>

#include <time.h>

//! \addtogroup zc_zip
//! \{

//! \name ZIP Constants
//! \{

//! Maximum size of \ref ZCZipEntry::filename and \ref ZCZipEntry::comment including the null terminator.
#define ZC_ZIP_ENTRY_STRING_CAPACITY 512

//! Compression method of a ZIP entry.
enum ZCZipMethod : uint32_t {
  //! Entry is stored (no compression).
  ZC_ZIP_METHOD_STORE = 0,
  //! Entry is compressed by DEFLATE.
  ZC_ZIP_METHOD_DEFLATE = 8
};

//! ZIP reader flags, see \ref ZCZipReader::open_file().
enum ZCZipReaderFlags : uint32_t {
  //! No flags.
  ZC_ZIP_READER_NO_FLAGS = 0u,
  //! Don't verify CRC32 of extracted entries.
  ZC_ZIP_READER_FLAG_SKIP_CRC_CHECK = 0x00000001u
};

//! ZIP writer flags, see \ref ZCZipWriter::open_file().
enum ZCZipWriterFlags : uint32_t {
  //! No flags.
  ZC_ZIP_WRITER_NO_FLAGS = 0u,
  //! Refuses to write zip64 records - archives that would need them fail instead.
  ZC_ZIP_WRITER_FLAG_DISABLE_ZIP64 = 0x00000001u
};

//! ZIP extraction flags, used by extraction functions of \ref ZCZipReader.
enum ZCZipExtractFlags : uint32_t {
  //! No flags.
  ZC_ZIP_EXTRACT_NO_FLAGS = 0u,
  //! Don't verify CRC32 of this entry (the same as \ref ZC_ZIP_READER_FLAG_SKIP_CRC_CHECK, but per call).
  ZC_ZIP_EXTRACT_FLAG_SKIP_CRC_CHECK = 0x00000001u,
  //! Fail with `ZC_ERROR_FILE_CREATE_FAILED` if the destination file already exists.
  ZC_ZIP_EXTRACT_FLAG_NO_OVERWRITE = 0x00000002u
};

ZC_DEFINE_ENUM_FLAGS(ZCZipReaderFlags)
ZC_DEFINE_ENUM_FLAGS(ZCZipWriterFlags)
ZC_DEFINE_ENUM_FLAGS(ZCZipExtractFlags)

//! \}

//! \name ZIP Types
//! \{

//! Sink function used by streaming extraction.
//!
//! Receives decompressed data of a single entry in order, `offset` is relative to the beginning of the entry. The
//! sink must return the number of bytes it accepted, any value other than `size` aborts the extraction with
//! `ZC_ERROR_WRITE_CALLBACK_FAILED`.
typedef size_t (ZC_CDECL* ZCZipSinkFunc)(void* user_data, uint64_t offset, const void* data, size_t size);

//! Information about a single ZIP entry.
struct ZCZipEntry {
  //! Index of the entry in the central directory.
  uint32_t file_index;
  //! Version made by (host system in the high byte).
  uint16_t version_made_by;
  //! Version needed to extract.
  uint16_t version_needed;
  //! Absolute offset of the entry's central directory record in the archive.
  uint64_t central_dir_ofs;
  //! General purpose bit flag.
  uint16_t bit_flag;
  //! Compression method, see \ref ZCZipMethod.
  uint16_t method;
  //! Internal file attributes.
  uint16_t internal_attr;
  //! Size of the entry comment in bytes (not truncated).
  uint16_t comment_size;
  //! CRC32 of uncompressed data.
  uint32_t crc32;
  //! External file attributes (host dependent, MS-DOS attributes in the low byte).
  uint32_t external_attr;
  //! Compressed size.
  uint64_t comp_size;
  //! Uncompressed size.
  uint64_t uncomp_size;
  //! Absolute offset of the entry's local header in the archive.
  uint64_t local_header_ofs;
  //! Last modification time converted from MS-DOS date and time (local time).
  time_t time;
  //! Entry is a directory.
  bool is_directory;
  //! Entry is encrypted (never supported).
  bool is_encrypted;
  //! Entry can be extracted (known method, not encrypted).
  bool is_supported;
  //! Entry name, null terminated, truncated if it doesn't fit.
  char filename[ZC_ZIP_ENTRY_STRING_CAPACITY];
  //! Entry comment, null terminated, truncated if it doesn't fit.
  char comment[ZC_ZIP_ENTRY_STRING_CAPACITY];

#ifdef __cplusplus
  ZC_INLINE_NODEBUG void reset() noexcept { *this = ZCZipEntry{}; }
#endif
};

//! \}

//! \}

#endif // ZIPCORE_ZIP_ZIPENTRY_H_INCLUDED
