// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_ZIP_ZIPARCHIVE_H_INCLUDED
#define ZIPCORE_ZIP_ZIPARCHIVE_H_INCLUDED

#include <zipcore/core/api.h>
#include <zipcore/zip/zipentry.h>

//! \addtogroup zc_zip
//! \{

//! \name ZCZipArchive C API Functions
//!
//! Whole-archive operations built on top of \ref ZCZipReader and \ref ZCZipWriter.
//!
//! \{

ZC_BEGIN_C_DECLS

ZC_API ZCResult ZC_CDECL zc_zip_archive_zip(const char* archive_name, const char* const* file_names, size_t file_count, int32_t level, const char* comment) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_archive_unzip(const char* archive_name, const char* dest_dir) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_archive_add_in_place(const char* archive_name, const char* entry_name, const void* data, size_t size, int32_t level, const char* comment) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_archive_extract_streaming(const char* archive_name, ZCZipSinkFunc sink, void* user_data) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_zip_archive_get_stats(const char* archive_name, ZCZipEntry* entries, size_t capacity, size_t* count_out) ZC_NOEXCEPT_C;

ZC_END_C_DECLS

//! \}

#ifdef __cplusplus
//! \name ZCZipArchive C++ API
//! \{

//! Whole-archive operations (wraps C API).
namespace ZCZipArchive {

//! Creates `archive_name` from `file_names`.
//!
//! Every file is stored under its last path component and `comment` (optional) is attached to every entry. Fails
//! with `ZC_ERROR_INVALID_PARAMETER` if two files have the same last path component.
static ZC_INLINE_NODEBUG ZCResult zip(const char* archive_name, const char* const* file_names, size_t file_count, int32_t level = ZC_COMPRESSION_LEVEL_DEFAULT, const char* comment = nullptr) noexcept {
  return zc_zip_archive_zip(archive_name, file_names, file_count, level, comment);
}

//! Extracts all entries of `archive_name` into `dest_dir`, which is created if it doesn't exist.
//!
//! Entries with empty names are skipped. Entries whose names would escape `dest_dir` (absolute paths, `..`
//! segments) fail the extraction with `ZC_ERROR_INVALID_FILENAME`.
static ZC_INLINE_NODEBUG ZCResult unzip(const char* archive_name, const char* dest_dir) noexcept {
  return zc_zip_archive_unzip(archive_name, dest_dir);
}

//! Adds a single entry to `archive_name`, the archive is created if it doesn't exist.
//!
//! The new entry is written over the old central directory, which is then written again including the new record.
static ZC_INLINE_NODEBUG ZCResult add_in_place(const char* archive_name, const char* entry_name, const void* data, size_t size, int32_t level = ZC_COMPRESSION_LEVEL_DEFAULT, const char* comment = nullptr) noexcept {
  return zc_zip_archive_add_in_place(archive_name, entry_name, data, size, level, comment);
}

//! Extracts all entries of `archive_name` in index order through `sink`.
//!
//! Offsets passed to the sink are relative to the beginning of the current entry.
static ZC_INLINE_NODEBUG ZCResult extract_streaming(const char* archive_name, ZCZipSinkFunc sink, void* user_data) noexcept {
  return zc_zip_archive_extract_streaming(archive_name, sink, user_data);
}

//! Reads information about all entries of `archive_name`.
//!
//! The number of entries is always stored to `count_out`. Pass null `entries` with zero `capacity` to query it,
//! a non-zero `capacity` smaller than the number of entries fails with `ZC_ERROR_BUF_TOO_SMALL`.
static ZC_INLINE_NODEBUG ZCResult get_stats(const char* archive_name, ZCZipEntry* entries, size_t capacity, size_t* count_out) noexcept {
  return zc_zip_archive_get_stats(archive_name, entries, capacity, count_out);
}

} // {ZCZipArchive}

//! \}
#endif

//! \}

#endif // ZIPCORE_ZIP_ZIPARCHIVE_H_INCLUDED
