// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_ZIP_ZIPWRITER_H_INCLUDED
#define ZIPCORE_ZIP_ZIPWRITER_H_INCLUDED

#include <zipcore/core/api.h>
#include <zipcore/core/bytearray.h>
#include <zipcore/zip/zipentry.h>

//! \addtogroup zc_zip
//! \{

//! \name ZCZipWriter C API Structs
//! \{

struct ZCZipWriterImpl;

//! ZIP archive writer [C API].
struct ZCZipWriterCore {
  //! Archive being written, `nullptr` if the writer is closed.
  ZCZipWriterImpl* impl;
  //! Result of the last operation that failed.
  ZCResult last_error_code;
};

//! \}

//! \name ZCZipWriter C API Functions
//! \{

ZC_BEGIN_C_DECLS

ZC_API ZCResult ZC_CDECL zc_zip_writer_init(ZCZipWriterCore* self) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_writer_destroy(ZCZipWriterCore* self) ZC_NOEXCEPT_C;

ZC_API ZCResult ZC_CDECL zc_zip_writer_open_file(ZCZipWriterCore* self, const char* file_name, uint64_t reserve_size, ZCZipWriterFlags flags) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_writer_open_memory(ZCZipWriterCore* self, uint64_t reserve_size, ZCZipWriterFlags flags) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_writer_open_append(ZCZipWriterCore* self, const char* file_name, ZCZipWriterFlags flags) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_writer_close(ZCZipWriterCore* self) ZC_NOEXCEPT_C;

ZC_API bool ZC_CDECL zc_zip_writer_is_open(const ZCZipWriterCore* self) ZC_NOEXCEPT_C;
ZC_API bool ZC_CDECL zc_zip_writer_is_finalized(const ZCZipWriterCore* self) ZC_NOEXCEPT_C;
ZC_API uint32_t ZC_CDECL zc_zip_writer_get_entry_count(const ZCZipWriterCore* self) ZC_NOEXCEPT_C;

ZC_API ZCResult ZC_CDECL zc_zip_writer_add_buffer(ZCZipWriterCore* self, const char* name, const void* data, size_t size, const char* comment, int32_t level) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_writer_add_file(ZCZipWriterCore* self, const char* name, const char* source_file_name, const char* comment, int32_t level) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_writer_add_directory(ZCZipWriterCore* self, const char* name, const char* comment) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_writer_set_archive_comment(ZCZipWriterCore* self, const void* comment, size_t size) ZC_NOEXCEPT_C;

ZC_API ZCResult ZC_CDECL zc_zip_writer_finalize(ZCZipWriterCore* self) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_writer_take_memory(ZCZipWriterCore* self, ZCByteArrayCore* dst) ZC_NOEXCEPT_C;

ZC_END_C_DECLS

//! \}

#ifdef __cplusplus
//! \name ZCZipWriter C++ API
//! \{

//! ZIP archive writer [C++ API].
//!
//! Entries are written sequentially, each one is compressed as a whole before its local header is written, so no
//! header is ever patched. The central directory is kept in memory and written by `finalize()`, after which no
//! entries can be added (`ZC_ERROR_INVALID_STATE`).
//!
//! Closing a writer that was not finalized leaves an incomplete archive behind, which is not a valid ZIP file.
class ZCZipWriter final : public ZCZipWriterCore {
public:
  ZC_INLINE_NODEBUG ZCZipWriter(const ZCZipWriter& other) noexcept = delete;
  ZC_INLINE_NODEBUG ZCZipWriter& operator=(const ZCZipWriter& other) noexcept = delete;

  //! \name Construction & Destruction
  //! \{

  ZC_INLINE_NODEBUG ZCZipWriter() noexcept { zc_zip_writer_init(this); }
  ZC_INLINE_NODEBUG ~ZCZipWriter() noexcept { zc_zip_writer_destroy(this); }

  //! \}

  //! \name Open & Close
  //! \{

  //! Creates a new archive file, `reserve_size` zero bytes are written before the first entry.
  ZC_INLINE_NODEBUG ZCResult open_file(const char* file_name, uint64_t reserve_size = 0, ZCZipWriterFlags flags = ZC_ZIP_WRITER_NO_FLAGS) noexcept {
    return zc_zip_writer_open_file(this, file_name, reserve_size, flags);
  }

  //! Creates a new archive in memory, use `take_memory()` to get it after `finalize()`.
  ZC_INLINE_NODEBUG ZCResult open_memory(uint64_t reserve_size = 0, ZCZipWriterFlags flags = ZC_ZIP_WRITER_NO_FLAGS) noexcept {
    return zc_zip_writer_open_memory(this, reserve_size, flags);
  }

  //! Opens an existing archive for appending.
  //!
  //! New entries overwrite the old central directory, which is written again (including all previous records and
  //! the archive comment) by `finalize()`.
  ZC_INLINE_NODEBUG ZCResult open_append(const char* file_name, ZCZipWriterFlags flags = ZC_ZIP_WRITER_NO_FLAGS) noexcept {
    return zc_zip_writer_open_append(this, file_name, flags);
  }

  //! Releases all resources. Closing a writer that is not open does nothing.
  ZC_INLINE_NODEBUG ZCResult close() noexcept { return zc_zip_writer_close(this); }

  //! \}

  //! \name Writer Information
  //! \{

  ZC_INLINE_NODEBUG bool is_open() const noexcept { return zc_zip_writer_is_open(this); }
  ZC_INLINE_NODEBUG bool is_finalized() const noexcept { return zc_zip_writer_is_finalized(this); }
  ZC_INLINE_NODEBUG uint32_t entry_count() const noexcept { return zc_zip_writer_get_entry_count(this); }
  ZC_INLINE_NODEBUG ZCResult last_error() const noexcept { return last_error_code; }

  //! \}

  //! \name Entries
  //! \{

  //! Adds an entry of the given `name` having `data` as its content.
  //!
  //! The entry is stored when `level` is `ZC_COMPRESSION_LEVEL_STORE` or when compression doesn't make it smaller.
  ZC_INLINE_NODEBUG ZCResult add_buffer(const char* name, const void* data, size_t size, const char* comment = nullptr, int32_t level = ZC_COMPRESSION_LEVEL_DEFAULT) noexcept {
    return zc_zip_writer_add_buffer(this, name, data, size, comment, level);
  }

  ZC_INLINE_NODEBUG ZCResult add_buffer(const char* name, const ZCDataView& view, const char* comment = nullptr, int32_t level = ZC_COMPRESSION_LEVEL_DEFAULT) noexcept {
    return zc_zip_writer_add_buffer(this, name, view.data, view.size, comment, level);
  }

  //! Adds an entry of the given `name` having the content of `source_file_name`.
  ZC_INLINE_NODEBUG ZCResult add_file(const char* name, const char* source_file_name, const char* comment = nullptr, int32_t level = ZC_COMPRESSION_LEVEL_DEFAULT) noexcept {
    return zc_zip_writer_add_file(this, name, source_file_name, comment, level);
  }

  //! Adds a directory entry, a trailing `/` is appended to `name` if it doesn't have one.
  ZC_INLINE_NODEBUG ZCResult add_directory(const char* name, const char* comment = nullptr) noexcept {
    return zc_zip_writer_add_directory(this, name, comment);
  }

  //! Sets the comment written to the end of central directory record.
  ZC_INLINE_NODEBUG ZCResult set_archive_comment(const char* comment) noexcept {
    return zc_zip_writer_set_archive_comment(this, comment, comment ? strlen(comment) : size_t(0));
  }

  ZC_INLINE_NODEBUG ZCResult set_archive_comment(const ZCDataView& comment) noexcept {
    return zc_zip_writer_set_archive_comment(this, comment.data, comment.size);
  }

  //! \}

  //! \name Finalization
  //! \{

  //! Writes the central directory and the end record.
  ZC_INLINE_NODEBUG ZCResult finalize() noexcept { return zc_zip_writer_finalize(this); }

  //! Moves the finalized in-memory archive to `dst`.
  ZC_INLINE_NODEBUG ZCResult take_memory(ZCByteArray& dst) noexcept { return zc_zip_writer_take_memory(this, &dst); }

  //! \}
};

//! \}
#endif

//! \}

#endif // ZIPCORE_ZIP_ZIPWRITER_H_INCLUDED
