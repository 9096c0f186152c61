// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zipcore/core/api-build_p.h>
#include <zipcore/core/filesystem.h>
#include <zipcore/core/trace_p.h>
#include <zipcore/zip/ziparchive.h>
#include <zipcore/zip/zipformat_p.h>
#include <zipcore/zip/zipreader.h>
#include <zipcore/zip/zipwriter.h>

namespace zc {
namespace ZipArchiveInternal {

// zc::ZipArchive - Trace
// ======================

#if defined(ZC_TRACE_ZIP_ALL) || defined(ZC_TRACE_ZIP)
#define Trace ZCDebugTrace
#else
#define Trace ZCDummyTrace
#endif

// zc::ZipArchive - Paths
// ======================

static ZC_INLINE bool is_path_separator(char c) noexcept {
#if defined(_WIN32)
  return c == '/' || c == '\\';
#else
  return c == '/';
#endif
}

//! Returns the last component of `path`.
static const char* tail_name(const char* path) noexcept {
  const char* tail = path;
  for (const char* p = path; *p; p++)
    if (is_path_separator(*p))
      tail = p + 1;
  return tail;
}

//! Joins `dir` and the first `name_size` bytes of `name` into a null terminated `dst`.
static ZCResult join_path(ZCByteArray& dst, const char* dir, const char* name, size_t name_size) noexcept {
  size_t dir_size = strlen(dir);

  ZC_PROPAGATE(dst.assign_data(dir, dir_size));
  if (dir_size && !is_path_separator(dir[dir_size - 1]))
    ZC_PROPAGATE(dst.append('/'));

  ZC_PROPAGATE(dst.append_data(name, name_size));
  return dst.append('\0');
}

// zc::ZipArchive - Operations
// ===========================

static ZCResult zip_files(const char* archive_name, const char* const* file_names, size_t file_count, int32_t level, const char* comment) noexcept {
  ZCZipWriter writer;
  ZC_PROPAGATE(writer.open_file(archive_name));

  for (size_t i = 0; i < file_count; i++) {
    if (ZC_UNLIKELY(!file_names[i]))
      return zc_make_error(ZC_ERROR_INVALID_PARAMETER);

    ZC_PROPAGATE(writer.add_file(tail_name(file_names[i]), file_names[i], comment, level));
  }

  ZC_PROPAGATE(writer.finalize());
  return writer.close();
}

static ZCResult unzip_entry(ZCZipReader& reader, uint32_t index, const char* dest_dir, ZCByteArray& path) noexcept {
  Trace trace;

  ZCDataView name_view;
  ZC_PROPAGATE(reader.get_name(index, &name_view));

  const char* name = reinterpret_cast<const char*>(name_view.data);
  size_t name_size = name_view.size;

  if (name_size == 0u)
    return ZC_SUCCESS;

  if (ZC_UNLIKELY(!Zip::is_safe_entry_name(name, name_size))) {
    trace.fail("Entry '%.*s' would be extracted outside of the destination\n", int(name_size), name);
    return zc_make_error(ZC_ERROR_INVALID_FILENAME);
  }

  ZC_PROPAGATE(join_path(path, dest_dir, name, name_size));
  const char* path_str = reinterpret_cast<const char*>(path.data);

  if (reader.is_directory(index))
    return ZCFileSystem::create_directories(path_str);

  // Create parent directories of the entry (the entry name itself uses '/' separators only).
  size_t parent_size = 0;
  for (size_t i = 0; i < name_size; i++)
    if (name[i] == '/')
      parent_size = i;

  if (parent_size) {
    ZCByteArray parent;
    ZC_PROPAGATE(join_path(parent, dest_dir, name, parent_size));
    ZC_PROPAGATE(ZCFileSystem::create_directories(reinterpret_cast<const char*>(parent.data)));
  }

  return reader.extract_to_file(index, path_str);
}

static ZCResult unzip_archive(const char* archive_name, const char* dest_dir) noexcept {
  if (ZC_UNLIKELY(!dest_dir || !dest_dir[0]))
    return zc_make_error(ZC_ERROR_INVALID_PARAMETER);

  ZCZipReader reader;
  ZC_PROPAGATE(reader.open_file(archive_name));
  ZC_PROPAGATE(ZCFileSystem::create_directories(dest_dir));

  ZCByteArray path;
  uint32_t count = reader.entry_count();

  for (uint32_t i = 0; i < count; i++) {
    ZC_PROPAGATE(unzip_entry(reader, i, dest_dir, path));
  }

  return reader.close();
}

static ZCResult add_in_place(const char* archive_name, const char* entry_name, const void* data, size_t size, int32_t level, const char* comment) noexcept {
  ZCFileInfo info;
  ZCResult info_result = ZCFileSystem::file_info(archive_name, &info);

  ZCZipWriter writer;
  bool created = info_result == ZC_ERROR_FILE_NOT_FOUND;

  if (created) {
    ZC_PROPAGATE(writer.open_file(archive_name));
  }
  else {
    ZC_PROPAGATE(info_result);
    ZC_PROPAGATE(writer.open_append(archive_name));
  }

  ZCResult result = writer.add_buffer(entry_name, data, size, comment, level);
  if (result == ZC_SUCCESS)
    result = writer.finalize();

  if (result == ZC_SUCCESS)
    return writer.close();

  if (created) {
    // Nothing of the archive existed before the call, so nothing is left behind.
    zc_unused(writer.close());
    zc_unused(ZCFileSystem::remove_file(archive_name));
  }
  else if (writer.is_open() && !writer.is_finalized()) {
    // The entry was rejected before anything was written, so writing the central directory again restores the
    // archive. A failed write leaves the writer in a state where `finalize()` is refused.
    zc_unused(writer.finalize());
  }

  return result;
}

static ZCResult extract_streaming(const char* archive_name, ZCZipSinkFunc sink, void* user_data) noexcept {
  if (ZC_UNLIKELY(!sink))
    return zc_make_error(ZC_ERROR_INVALID_PARAMETER);

  ZCZipReader reader;
  ZC_PROPAGATE(reader.open_file(archive_name));

  uint32_t count = reader.entry_count();
  for (uint32_t i = 0; i < count; i++) {
    ZC_PROPAGATE(reader.extract_to_sink(i, sink, user_data));
  }

  return reader.close();
}

static ZCResult get_stats(const char* archive_name, ZCZipEntry* entries, size_t capacity, size_t* count_out) noexcept {
  *count_out = 0;

  ZCZipReader reader;
  ZC_PROPAGATE(reader.open_file(archive_name));

  uint32_t count = reader.entry_count();
  *count_out = count;

  if (!entries)
    return reader.close();

  if (ZC_UNLIKELY(capacity < count))
    return zc_make_error(ZC_ERROR_BUF_TOO_SMALL);

  for (uint32_t i = 0; i < count; i++) {
    ZC_PROPAGATE(reader.stat(i, &entries[i]));
  }

  return reader.close();
}

} // {ZipArchiveInternal}
} // {zc}

// zc::ZipArchive - API
// ====================

ZC_API_IMPL ZCResult zc_zip_archive_zip(const char* archive_name, const char* const* file_names, size_t file_count, int32_t level, const char* comment) noexcept {
  if (ZC_UNLIKELY(!archive_name || (!file_names && file_count)))
    return zc_make_error(ZC_ERROR_INVALID_PARAMETER);

  return zc::ZipArchiveInternal::zip_files(archive_name, file_names, file_count, level, comment);
}

ZC_API_IMPL ZCResult zc_zip_archive_unzip(const char* archive_name, const char* dest_dir) noexcept {
  if (ZC_UNLIKELY(!archive_name))
    return zc_make_error(ZC_ERROR_INVALID_PARAMETER);

  return zc::ZipArchiveInternal::unzip_archive(archive_name, dest_dir);
}

ZC_API_IMPL ZCResult zc_zip_archive_add_in_place(const char* archive_name, const char* entry_name, const void* data, size_t size, int32_t level, const char* comment) noexcept {
  if (ZC_UNLIKELY(!archive_name || !entry_name || (!data && size)))
    return zc_make_error(ZC_ERROR_INVALID_PARAMETER);

  return zc::ZipArchiveInternal::add_in_place(archive_name, entry_name, data, size, level, comment);
}

ZC_API_IMPL ZCResult zc_zip_archive_extract_streaming(const char* archive_name, ZCZipSinkFunc sink, void* user_data) noexcept {
  if (ZC_UNLIKELY(!archive_name))
    return zc_make_error(ZC_ERROR_INVALID_PARAMETER);

  return zc::ZipArchiveInternal::extract_streaming(archive_name, sink, user_data);
}

ZC_API_IMPL ZCResult zc_zip_archive_get_stats(const char* archive_name, ZCZipEntry* entries, size_t capacity, size_t* count_out) noexcept {
  if (ZC_UNLIKELY(!archive_name || !count_out))
    return zc_make_error(ZC_ERROR_INVALID_PARAMETER);

  return zc::ZipArchiveInternal::get_stats(archive_name, entries, capacity, count_out);
}
