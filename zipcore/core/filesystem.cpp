// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zipcore/core/api-build_p.h>
#include <zipcore/core/filesystem.h>
#include <zipcore/core/runtime.h>
#include <zipcore/support/ptrops_p.h>

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

#if defined(__linux__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__DragonFly__)
  #define ZC_FS_STAT_MTIMESPEC(s) s.st_mtim
#elif defined(__NetBSD__) || defined(__APPLE__)
  #define ZC_FS_STAT_MTIMESPEC(s) s.st_mtimespec
#endif

// ZCFile - Internals
// ==================

static ZC_INLINE bool is_file_open(const ZCFileCore* self) noexcept {
  return static_cast<const ZCFile*>(self)->is_open();
}

// ZCFile - API - Construction & Destruction
// =========================================

ZC_API_IMPL ZCResult zc_file_reset(ZCFileCore* self) noexcept {
  return zc_file_close(self);
}

// ZCFileSystem - POSIX Implementation (Internal)
// ==============================================

namespace zc {
namespace FileSystem {

#if defined(ZC_FS_STAT_MTIMESPEC)
template<typename T>
static ZC_INLINE int64_t unix_micro_from_time_spec(const T& ts) noexcept {
  return int64_t(ts.tv_sec) * 1000000 + int64_t(uint32_t(ts.tv_nsec) / 1000u);
}
#else
template<typename T>
static ZC_INLINE int64_t unix_micro_from_file_time(const T& t) noexcept {
  return int64_t(t) * 1000000;
}
#endif

static ZCResult file_info_from_stat(ZCFileInfo& info, struct ZC_FILE64_API(stat)& s) noexcept {
  uint32_t flags = ZC_FILE_INFO_VALID;

  if (S_ISREG(s.st_mode)) flags |= ZC_FILE_INFO_REGULAR;
  if (S_ISDIR(s.st_mode)) flags |= ZC_FILE_INFO_DIRECTORY;

  info = ZCFileInfo{};

  if (flags & ZC_FILE_INFO_REGULAR) {
    info.size = uint64_t(s.st_size);
  }

  info.flags = ZCFileInfoFlags(flags);

#if defined(ZC_FS_STAT_MTIMESPEC)
  info.modified_time = unix_micro_from_time_spec(ZC_FS_STAT_MTIMESPEC(s));
#else
  info.modified_time = unix_micro_from_file_time(s.st_mtime);
#endif

  return ZC_SUCCESS;
}

} // {FileSystem}
} // {zc}

// ZCFile - API - POSIX Implementation
// ===================================

ZC_API_IMPL ZCResult zc_file_open(ZCFileCore* self, const char* file_name, ZCFileOpenFlags open_flags) noexcept {
  if (ZC_UNLIKELY(!file_name || !file_name[0])) {
    return zc_make_error(ZC_ERROR_INVALID_FILENAME);
  }

  int of = 0;

  switch (open_flags & ZC_FILE_OPEN_RW) {
    case ZC_FILE_OPEN_READ : of |= O_RDONLY; break;
    case ZC_FILE_OPEN_WRITE: of |= O_WRONLY; break;
    case ZC_FILE_OPEN_RW   : of |= O_RDWR  ; break;

    default:
      return zc_make_error(ZC_ERROR_INVALID_PARAMETER);
  }

  uint32_t kExtFlags = ZC_FILE_OPEN_CREATE | ZC_FILE_OPEN_CREATE_EXCLUSIVE | ZC_FILE_OPEN_TRUNCATE;

  if ((open_flags & kExtFlags) && !(open_flags & ZC_FILE_OPEN_WRITE)) {
    return zc_make_error(ZC_ERROR_INVALID_PARAMETER);
  }

  if (open_flags & ZC_FILE_OPEN_CREATE          ) of |= O_CREAT;
  if (open_flags & ZC_FILE_OPEN_CREATE_EXCLUSIVE) of |= O_CREAT | O_EXCL;
  if (open_flags & ZC_FILE_OPEN_TRUNCATE        ) of |= O_TRUNC;

  mode_t om = S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH ;

  // NOTE: Do not close the file before calling `open()`. The existing file must stay open if `open()` fails.
  int fd = ZC_FILE64_API(open)(file_name, of, om);
  if (fd < 0) {
    ZCResult fallback = (of & O_CREAT) ? ZC_ERROR_FILE_CREATE_FAILED : ZC_ERROR_FILE_OPEN_FAILED;
    return zc_make_error(zc_result_from_posix_error(errno, fallback));
  }

  zc_unused(zc_file_close(self));
  self->handle = intptr_t(fd);

  return ZC_SUCCESS;
}

ZC_API_IMPL ZCResult zc_file_close(ZCFileCore* self) noexcept {
  if (is_file_open(self)) {
    int fd = int(self->handle);
    int result = close(fd);

    // NOTE: Even when `close()` fails the handle cannot be used again as it could have already been reused.
    self->handle = -1;

    if (ZC_UNLIKELY(result != 0)) {
      return zc_make_error(zc_result_from_posix_error(errno, ZC_ERROR_FILE_CLOSE_FAILED));
    }
  }

  return ZC_SUCCESS;
}

// Transfers exactly `n` bytes at `offset` unless the end of file is reached while reading. Positional IO is
// used exclusively, ZIP readers and writers address records by their absolute offsets.
template<bool kWrite, typename Buffer>
static ZCResult transfer_at(ZCFileCore* self, uint64_t offset, Buffer buffer, size_t n, size_t* transferred_out) noexcept {
  *transferred_out = 0;

  if (!is_file_open(self)) {
    return zc_make_error(ZC_ERROR_INVALID_STATE);
  }

  if (ZC_UNLIKELY(offset > uint64_t(INT64_MAX) || n > uint64_t(INT64_MAX) - offset)) {
    return zc_make_error(ZC_ERROR_INVALID_PARAMETER);
  }

  int fd = int(self->handle);
  size_t done = 0;

  while (done < n) {
    int64_t position = int64_t(offset + done);
    ssize_t result;

    if constexpr (kWrite)
      result = ZC_FILE64_API(pwrite)(fd, zc::PtrOps::offset(buffer, done), n - done, position);
    else
      result = ZC_FILE64_API(pread)(fd, zc::PtrOps::offset(buffer, done), n - done, position);

    if (result < 0) {
      int e = errno;
      if (e == EINTR)
        continue;

      *transferred_out = done;
      return zc_make_error(zc_result_from_posix_error(e, kWrite ? ZC_ERROR_FILE_WRITE_FAILED : ZC_ERROR_FILE_READ_FAILED));
    }

    if (result == 0) {
      // A short read means EOF, a write that makes no progress is an error.
      if (kWrite) {
        *transferred_out = done;
        return zc_make_error(ZC_ERROR_FILE_WRITE_FAILED);
      }
      break;
    }

    done += size_t(result);
  }

  *transferred_out = done;
  return ZC_SUCCESS;
}

ZC_API_IMPL ZCResult zc_file_read_at(ZCFileCore* self, uint64_t offset, void* buffer, size_t n, size_t* bytes_read_out) noexcept {
  return transfer_at<false>(self, offset, buffer, n, bytes_read_out);
}

ZC_API_IMPL ZCResult zc_file_write_at(ZCFileCore* self, uint64_t offset, const void* buffer, size_t n, size_t* bytes_written_out) noexcept {
  return transfer_at<true>(self, offset, buffer, n, bytes_written_out);
}

ZC_API_IMPL ZCResult zc_file_truncate(ZCFileCore* self, int64_t max_size) noexcept {
  if (!is_file_open(self)) {
    return zc_make_error(ZC_ERROR_INVALID_STATE);
  }

  if (max_size < 0) {
    return zc_make_error(ZC_ERROR_INVALID_PARAMETER);
  }

  int fd = int(self->handle);
  int result = ZC_FILE64_API(ftruncate)(fd, max_size);

  if (result != 0) {
    int e = errno;

    // File was smaller than `max_size` - we don't consider this to be an error.
    if (e == EFBIG) {
      return ZC_SUCCESS;
    }

    return zc_make_error(zc_result_from_posix_error(e, ZC_ERROR_FILE_WRITE_FAILED));
  }

  return ZC_SUCCESS;
}

ZC_API_IMPL ZCResult zc_file_get_info(ZCFileCore* self, ZCFileInfo* info_out) noexcept {
  if (!is_file_open(self)) {
    *info_out = ZCFileInfo{};
    return zc_make_error(ZC_ERROR_INVALID_STATE);
  }

  int fd = int(self->handle);
  struct ZC_FILE64_API(stat) s;

  if (ZC_FILE64_API(fstat)(fd, &s) != 0) {
    *info_out = ZCFileInfo{};
    return zc_make_error(zc_result_from_posix_error(errno, ZC_ERROR_FILE_STAT_FAILED));
  }

  return zc::FileSystem::file_info_from_stat(*info_out, s);
}

ZC_API_IMPL ZCResult zc_file_get_size(ZCFileCore* self, uint64_t* file_size_out) noexcept {
  if (!is_file_open(self)) {
    *file_size_out = 0;
    return zc_make_error(ZC_ERROR_INVALID_STATE);
  }

  int fd = int(self->handle);
  struct ZC_FILE64_API(stat) s;

  if (ZC_FILE64_API(fstat)(fd, &s) != 0) {
    *file_size_out = 0;
    return zc_make_error(zc_result_from_posix_error(errno, ZC_ERROR_FILE_STAT_FAILED));
  }

  *file_size_out = uint64_t(s.st_size);
  return ZC_SUCCESS;
}

// ZCFileSystem - API - POSIX Implementation
// =========================================

ZC_API_IMPL ZCResult zc_file_system_get_info(const char* file_name, ZCFileInfo* info_out) noexcept {
  struct ZC_FILE64_API(stat) s;

  if (ZC_FILE64_API(stat)(file_name, &s) != 0) {
    *info_out = ZCFileInfo{};
    int e = errno;
    return zc_make_error(e == ENOENT ? ZC_ERROR_FILE_NOT_FOUND : zc_result_from_posix_error(e, ZC_ERROR_FILE_STAT_FAILED));
  }

  return zc::FileSystem::file_info_from_stat(*info_out, s);
}

static ZCResult create_directory(const char* path) noexcept {
  if (ZC_UNLIKELY(!path || !path[0])) {
    return zc_make_error(ZC_ERROR_INVALID_FILENAME);
  }

  if (mkdir(path, S_IRWXU | S_IRWXG | S_IRWXO) == 0) {
    return ZC_SUCCESS;
  }

  int e = errno;
  if (e == EEXIST) {
    ZCFileInfo info;
    if (zc_file_system_get_info(path, &info) == ZC_SUCCESS && info.is_directory()) {
      return ZC_SUCCESS;
    }
  }

  return zc_make_error(zc_result_from_posix_error(e, ZC_ERROR_FILE_CREATE_FAILED));
}

ZC_API_IMPL ZCResult zc_file_system_remove_file(const char* file_name) noexcept {
  if (ZC_UNLIKELY(!file_name || !file_name[0])) {
    return zc_make_error(ZC_ERROR_INVALID_FILENAME);
  }

  if (unlink(file_name) != 0) {
    int e = errno;
    return zc_make_error(e == ENOENT ? ZC_ERROR_FILE_NOT_FOUND : zc_result_from_posix_error(e, ZC_ERROR_FILE_WRITE_FAILED));
  }

  return ZC_SUCCESS;
}

// ZCFileSystem - API - Portable Implementation
// ============================================

ZC_API_IMPL ZCResult zc_file_system_create_directories(const char* path) noexcept {
  if (ZC_UNLIKELY(!path || !path[0])) {
    return zc_make_error(ZC_ERROR_INVALID_FILENAME);
  }

  ZCByteArray tmp;
  ZC_PROPAGATE(tmp.assign_data(path, strlen(path) + 1u));

  char* p = reinterpret_cast<char*>(tmp.data);
  size_t n = tmp.size - 1u;

  // Strip trailing separators, but keep a lone root.
  while (n > 1u && (p[n - 1] == '/' || p[n - 1] == '\\')) {
    p[--n] = '\0';
  }

  // Create every intermediate component, skipping the leading separator of an absolute path.
  for (size_t i = 1; i < n; i++) {
    if (p[i] == '/' || p[i] == '\\') {
      char sep = p[i];
      p[i] = '\0';
      ZCResult result = create_directory(p);
      p[i] = sep;

      if (result != ZC_SUCCESS)
        return result;
    }
  }

  return create_directory(p);
}
