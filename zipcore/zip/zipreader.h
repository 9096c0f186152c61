// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_ZIP_ZIPREADER_H_INCLUDED
#define ZIPCORE_ZIP_ZIPREADER_H_INCLUDED

#include <zipcore/core/api.h>
#include <zipcore/core/bytearray.h>
#include <zipcore/zip/zipentry.h>

//! \addtogroup zc_zip
//! \{

//! \name ZCZipReader C API Structs
//! \{

struct ZCZipReaderImpl;

//! ZIP archive reader [C API].
struct ZCZipReaderCore {
  //! Archive data, `nullptr` if the reader is closed.
  ZCZipReaderImpl* impl;
  //! Result of the last operation that failed.
  ZCResult last_error_code;
};

//! \}

//! \name ZCZipReader C API Functions
//! \{

ZC_BEGIN_C_DECLS

ZC_API ZCResult ZC_CDECL zc_zip_reader_init(ZCZipReaderCore* self) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_reader_destroy(ZCZipReaderCore* self) ZC_NOEXCEPT_C;

ZC_API ZCResult ZC_CDECL zc_zip_reader_open_file(ZCZipReaderCore* self, const char* file_name, ZCZipReaderFlags flags) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_reader_open_memory(ZCZipReaderCore* self, const void* data, size_t size, ZCZipReaderFlags flags) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_reader_close(ZCZipReaderCore* self) ZC_NOEXCEPT_C;

ZC_API bool ZC_CDECL zc_zip_reader_is_open(const ZCZipReaderCore* self) ZC_NOEXCEPT_C;
ZC_API uint32_t ZC_CDECL zc_zip_reader_get_entry_count(const ZCZipReaderCore* self) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_reader_get_archive_comment(ZCZipReaderCore* self, ZCDataView* out) ZC_NOEXCEPT_C;

ZC_API ZCResult ZC_CDECL zc_zip_reader_stat(ZCZipReaderCore* self, uint32_t index, ZCZipEntry* out) ZC_NOEXCEPT_C;
ZC_API bool ZC_CDECL zc_zip_reader_is_directory(const ZCZipReaderCore* self, uint32_t index) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_reader_get_name(ZCZipReaderCore* self, uint32_t index, ZCDataView* out) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_reader_locate(ZCZipReaderCore* self, const char* name, size_t name_size, uint32_t* index_out) ZC_NOEXCEPT_C;

ZC_API ZCResult ZC_CDECL zc_zip_reader_extract_to_memory(ZCZipReaderCore* self, uint32_t index, ZCByteArrayCore* dst, ZCZipExtractFlags flags) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_reader_extract_to_buffer(ZCZipReaderCore* self, uint32_t index, void* buffer, size_t buffer_size, size_t* size_out, ZCZipExtractFlags flags) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_reader_extract_to_file(ZCZipReaderCore* self, uint32_t index, const char* file_name, ZCZipExtractFlags flags) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_reader_extract_to_sink(ZCZipReaderCore* self, uint32_t index, ZCZipSinkFunc sink, void* user_data, ZCZipExtractFlags flags) ZC_NOEXCEPT_C;

ZC_API ZCResult ZC_CDECL zc_zip_reader_validate(ZCZipReaderCore* self, uint32_t index) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_reader_validate_all(ZCZipReaderCore* self) ZC_NOEXCEPT_C;

ZC_END_C_DECLS

//! \}

#ifdef __cplusplus
//! \name ZCZipReader C++ API
//! \{

//! ZIP archive reader [C++ API].
//!
//! The central directory is parsed eagerly by `open_file()` or `open_memory()`, entries are then accessed by their
//! index. Entry data is read on demand, only the central directory is kept in memory. The reader owns the opened
//! file and releases it in `close()` or in the destructor.
//!
//! Every failing function returns the error and also stores it, so it can be queried later by `last_error()`.
class ZCZipReader final : public ZCZipReaderCore {
public:
  ZC_INLINE_NODEBUG ZCZipReader(const ZCZipReader& other) noexcept = delete;
  ZC_INLINE_NODEBUG ZCZipReader& operator=(const ZCZipReader& other) noexcept = delete;

  //! \name Construction & Destruction
  //! \{

  ZC_INLINE_NODEBUG ZCZipReader() noexcept { zc_zip_reader_init(this); }
  ZC_INLINE_NODEBUG ~ZCZipReader() noexcept { zc_zip_reader_destroy(this); }

  //! \}

  //! \name Open & Close
  //! \{

  //! Opens an archive file and reads its central directory.
  ZC_INLINE_NODEBUG ZCResult open_file(const char* file_name, ZCZipReaderFlags flags = ZC_ZIP_READER_NO_FLAGS) noexcept {
    return zc_zip_reader_open_file(this, file_name, flags);
  }

  //! Opens an archive stored in memory. The memory must stay valid until the reader is closed.
  ZC_INLINE_NODEBUG ZCResult open_memory(const void* data, size_t size, ZCZipReaderFlags flags = ZC_ZIP_READER_NO_FLAGS) noexcept {
    return zc_zip_reader_open_memory(this, data, size, flags);
  }

  ZC_INLINE_NODEBUG ZCResult open_memory(const ZCDataView& view, ZCZipReaderFlags flags = ZC_ZIP_READER_NO_FLAGS) noexcept {
    return zc_zip_reader_open_memory(this, view.data, view.size, flags);
  }

  //! Closes the archive. Closing a reader that is not open does nothing.
  ZC_INLINE_NODEBUG ZCResult close() noexcept { return zc_zip_reader_close(this); }

  //! \}

  //! \name Archive Information
  //! \{

  ZC_INLINE_NODEBUG bool is_open() const noexcept { return zc_zip_reader_is_open(this); }
  ZC_INLINE_NODEBUG uint32_t entry_count() const noexcept { return zc_zip_reader_get_entry_count(this); }
  ZC_INLINE_NODEBUG ZCResult last_error() const noexcept { return last_error_code; }

  //! Stores a view of the archive comment to `out`, which stays valid until the reader is closed.
  //!
  //! Returns `ZC_ERROR_INVALID_STATE` and an empty view if the reader is not open.
  ZC_INLINE_NODEBUG ZCResult archive_comment(ZCDataView* out) noexcept { return zc_zip_reader_get_archive_comment(this, out); }

  //! \}

  //! \name Entries
  //! \{

  //! Fills `out` with information about the entry at `index`.
  ZC_INLINE_NODEBUG ZCResult stat(uint32_t index, ZCZipEntry* out) noexcept { return zc_zip_reader_stat(this, index, out); }

  //! Tests whether the entry at `index` is a directory, returns false if `index` is out of range.
  ZC_INLINE_NODEBUG bool is_directory(uint32_t index) const noexcept { return zc_zip_reader_is_directory(this, index); }

  //! Returns the full (not truncated) name of the entry at `index`, the view is valid until the reader is closed.
  ZC_INLINE_NODEBUG ZCResult get_name(uint32_t index, ZCDataView* out) noexcept { return zc_zip_reader_get_name(this, index, out); }

  //! Finds an entry by its name (exact, case-sensitive), fails with `ZC_ERROR_FILE_NOT_FOUND` if there is none.
  ZC_INLINE_NODEBUG ZCResult locate(const char* name, uint32_t* index_out) noexcept {
    return zc_zip_reader_locate(this, name, SIZE_MAX, index_out);
  }

  ZC_INLINE_NODEBUG ZCResult locate(const char* name, size_t name_size, uint32_t* index_out) noexcept {
    return zc_zip_reader_locate(this, name, name_size, index_out);
  }

  //! \}

  //! \name Extraction
  //! \{

  //! Extracts the entry at `index` into `dst` (replacing its content).
  ZC_INLINE_NODEBUG ZCResult extract_to_memory(uint32_t index, ZCByteArray& dst, ZCZipExtractFlags flags = ZC_ZIP_EXTRACT_NO_FLAGS) noexcept {
    return zc_zip_reader_extract_to_memory(this, index, &dst, flags);
  }

  ZC_INLINE_NODEBUG ZCResult extract_to_memory(const char* name, ZCByteArray& dst, ZCZipExtractFlags flags = ZC_ZIP_EXTRACT_NO_FLAGS) noexcept {
    uint32_t index;
    ZC_PROPAGATE(locate(name, &index));
    return extract_to_memory(index, dst, flags);
  }

  //! Extracts the entry at `index` into a fixed size `buffer`.
  //!
  //! Fails with `ZC_ERROR_BUF_TOO_SMALL` if the entry doesn't fit. The number of bytes written is stored to
  //! `size_out`, which is optional.
  ZC_INLINE_NODEBUG ZCResult extract_to_buffer(uint32_t index, void* buffer, size_t buffer_size, size_t* size_out = nullptr, ZCZipExtractFlags flags = ZC_ZIP_EXTRACT_NO_FLAGS) noexcept {
    return zc_zip_reader_extract_to_buffer(this, index, buffer, buffer_size, size_out, flags);
  }

  ZC_INLINE_NODEBUG ZCResult extract_to_buffer(const char* name, void* buffer, size_t buffer_size, size_t* size_out = nullptr, ZCZipExtractFlags flags = ZC_ZIP_EXTRACT_NO_FLAGS) noexcept {
    uint32_t index;
    ZC_PROPAGATE(locate(name, &index));
    return extract_to_buffer(index, buffer, buffer_size, size_out, flags);
  }

  //! Extracts the entry at `index` into a file, a directory entry creates a directory instead.
  ZC_INLINE_NODEBUG ZCResult extract_to_file(uint32_t index, const char* file_name, ZCZipExtractFlags flags = ZC_ZIP_EXTRACT_NO_FLAGS) noexcept {
    return zc_zip_reader_extract_to_file(this, index, file_name, flags);
  }

  ZC_INLINE_NODEBUG ZCResult extract_to_file(const char* name, const char* file_name, ZCZipExtractFlags flags = ZC_ZIP_EXTRACT_NO_FLAGS) noexcept {
    uint32_t index;
    ZC_PROPAGATE(locate(name, &index));
    return extract_to_file(index, file_name, flags);
  }

  //! Extracts the entry at `index` through a `sink` function, see \ref ZCZipSinkFunc.
  ZC_INLINE_NODEBUG ZCResult extract_to_sink(uint32_t index, ZCZipSinkFunc sink, void* user_data, ZCZipExtractFlags flags = ZC_ZIP_EXTRACT_NO_FLAGS) noexcept {
    return zc_zip_reader_extract_to_sink(this, index, sink, user_data, flags);
  }

  ZC_INLINE_NODEBUG ZCResult extract_to_sink(const char* name, ZCZipSinkFunc sink, void* user_data, ZCZipExtractFlags flags = ZC_ZIP_EXTRACT_NO_FLAGS) noexcept {
    uint32_t index;
    ZC_PROPAGATE(locate(name, &index));
    return extract_to_sink(index, sink, user_data, flags);
  }

  //! \}

  //! \name Validation
  //! \{

  //! Validates headers and data of the entry at `index`, fails with `ZC_ERROR_VALIDATION_FAILED` on any mismatch.
  ZC_INLINE_NODEBUG ZCResult validate(uint32_t index) noexcept { return zc_zip_reader_validate(this, index); }

  //! Validates all entries.
  ZC_INLINE_NODEBUG ZCResult validate_all() noexcept { return zc_zip_reader_validate_all(this); }

  //! \}
};

//! \}
#endif

//! \}

#endif // ZIPCORE_ZIP_ZIPREADER_H_INCLUDED
