// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_CORE_FILESYSTEM_H_INCLUDED
#define ZIPCORE_CORE_FILESYSTEM_H_INCLUDED

#include <zipcore/core/bytearray.h>

//! \addtogroup zc_filesystem
//! \{

//! \name ZCFile API Constants
//! \{

//! File information flags, used by \ref ZCFileInfo.
enum ZCFileInfoFlags : uint32_t {
  //! No flags.
  ZC_FILE_INFO_NO_FLAGS = 0u,

  //! A flag specifying that this is a regular file.
  ZC_FILE_INFO_REGULAR = 0x00010000u,
  //! A flag specifying that this is a directory.
  ZC_FILE_INFO_DIRECTORY = 0x00020000u,

  //! File information is valid (the request succeeded).
  ZC_FILE_INFO_VALID = 0x80000000u
};

ZC_DEFINE_ENUM_FLAGS(ZCFileInfoFlags)

//! File open flags, see \ref ZCFile::open().
enum ZCFileOpenFlags : uint32_t {
  //! No flags.
  ZC_FILE_OPEN_NO_FLAGS = 0u,

  //! Opens the file for reading (`O_RDONLY`).
  ZC_FILE_OPEN_READ = 0x00000001u,

  //! Opens the file for writing (`O_WRONLY`).
  ZC_FILE_OPEN_WRITE = 0x00000002u,

  //! Opens the file for reading & writing (`O_RDWR`).
  ZC_FILE_OPEN_RW = 0x00000003u,

  //! Creates the file if it doesn't exist or opens it if it does (`O_CREAT`).
  ZC_FILE_OPEN_CREATE = 0x00000004u,

  //! Truncates the file (`O_TRUNC`).
  ZC_FILE_OPEN_TRUNCATE = 0x00000010u,

  //! Creates the file in exclusive mode - fails if the file already exists (`O_EXCL`).
  ZC_FILE_OPEN_CREATE_EXCLUSIVE = 0x40000000u
};

ZC_DEFINE_ENUM_FLAGS(ZCFileOpenFlags)

//! \}

//! \name ZCFile C API Structs
//! \{

//! A thin abstraction over a native OS file IO [C API].
struct ZCFileCore {
  //! A file descriptor, always `intptr_t` to make FFI easier.
  //!
  //! \note A handle of value `-1` is considered invalid and/or uninitialized.
  intptr_t handle;
};

//! File information.
struct ZCFileInfo {
  //! \name Members
  //! \{

  uint64_t size;
  //! Modification time in microseconds since Unix epoch.
  int64_t modified_time;
  ZCFileInfoFlags flags;
  uint32_t reserved;

  //! \}

#if defined(__cplusplus)

  //! \name Accessors
  //! \{

  //! Tests whether the file information has the given `flag` set in `flags`.
  ZC_INLINE_NODEBUG bool has_flag(ZCFileInfoFlags flag) const noexcept { return (flags & flag) != 0; }

  ZC_INLINE_NODEBUG bool is_regular() const noexcept { return has_flag(ZC_FILE_INFO_REGULAR); }
  ZC_INLINE_NODEBUG bool is_directory() const noexcept { return has_flag(ZC_FILE_INFO_DIRECTORY); }
  ZC_INLINE_NODEBUG bool is_valid() const noexcept { return has_flag(ZC_FILE_INFO_VALID); }

  //! Returns the modification time in seconds since Unix epoch.
  ZC_INLINE_NODEBUG int64_t modified_time_seconds() const noexcept { return modified_time / 1000000; }

  //! \}

#endif
};

//! \}

//! \name ZCFile C API Functions
//!
//! File read/write functionality is provided by \ref ZCFileCore in C API and wrapped by \ref ZCFile in C++ API.
//!
//! \{

ZC_BEGIN_C_DECLS

ZC_API ZCResult ZC_CDECL zc_file_reset(ZCFileCore* self) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_file_open(ZCFileCore* self, const char* file_name, ZCFileOpenFlags open_flags) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_file_close(ZCFileCore* self) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_file_read_at(ZCFileCore* self, uint64_t offset, void* buffer, size_t n, size_t* bytes_read_out) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_file_write_at(ZCFileCore* self, uint64_t offset, const void* buffer, size_t n, size_t* bytes_written_out) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_file_truncate(ZCFileCore* self, int64_t max_size) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_file_get_info(ZCFileCore* self, ZCFileInfo* info_out) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_file_get_size(ZCFileCore* self, uint64_t* file_size_out) ZC_NOEXCEPT_C;

ZC_API ZCResult ZC_CDECL zc_file_system_get_info(const char* file_name, ZCFileInfo* info_out) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_file_system_create_directories(const char* path) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_file_system_remove_file(const char* file_name) ZC_NOEXCEPT_C;

ZC_END_C_DECLS

//! \}

#ifdef __cplusplus
//! \name ZCFile C++ API
//! \{

//! A thin abstraction over a native OS file IO [C++ API].
class ZCFile final : public ZCFileCore {
public:
  ZC_INLINE_NODEBUG ZCFile(const ZCFile& other) noexcept = delete;
  ZC_INLINE_NODEBUG ZCFile& operator=(const ZCFile& other) noexcept = delete;

  //! \name Construction & Destruction
  //! \{

  //! Creates an empty file instance, which doesn't represent any open file.
  ZC_INLINE_NODEBUG ZCFile() noexcept
    : ZCFileCore { -1 } {}

  //! Closes the file descriptor when it's referencing an open file.
  ZC_INLINE_NODEBUG ~ZCFile() noexcept { zc_file_reset(this); }

  //! \}

  //! \name Interface
  //! \{

  //! Tests whether the file is open.
  ZC_INLINE_NODEBUG bool is_open() const noexcept { return handle != -1; }

  //! Attempts to open a file specified by `file_name` with the given `open_flags`.
  ZC_INLINE_NODEBUG ZCResult open(const char* file_name, ZCFileOpenFlags open_flags) noexcept {
    return zc_file_open(this, file_name, open_flags);
  }

  //! Closes the file (if open) and sets the file handle to -1.
  ZC_INLINE_NODEBUG ZCResult close() noexcept {
    return zc_file_close(this);
  }

  //! Reads `n` bytes at the given `offset` without changing the file position.
  ZC_INLINE_NODEBUG ZCResult read_at(uint64_t offset, void* buffer, size_t n, size_t* bytes_read_out) noexcept {
    return zc_file_read_at(this, offset, buffer, n, bytes_read_out);
  }

  //! Writes `n` bytes at the given `offset` without changing the file position.
  ZC_INLINE_NODEBUG ZCResult write_at(uint64_t offset, const void* buffer, size_t n, size_t* bytes_written_out) noexcept {
    return zc_file_write_at(this, offset, buffer, n, bytes_written_out);
  }

  //! Truncates the file to the given maximum size `max_size`.
  ZC_INLINE_NODEBUG ZCResult truncate(int64_t max_size) noexcept {
    return zc_file_truncate(this, max_size);
  }

  //! Queries an information of the file and stores it to `info_out`.
  ZC_INLINE_NODEBUG ZCResult get_info(ZCFileInfo* info_out) noexcept {
    return zc_file_get_info(this, info_out);
  }

  //! Queries a size of the file and stores it to `size_out`.
  ZC_INLINE_NODEBUG ZCResult get_size(uint64_t* size_out) noexcept {
    return zc_file_get_size(this, size_out);
  }

  //! \}
};

//! File-system utilities.
namespace ZCFileSystem {

static ZC_INLINE_NODEBUG ZCResult file_info(const char* file_name, ZCFileInfo* info_out) noexcept {
  return zc_file_system_get_info(file_name, info_out);
}

//! Creates a directory and all its missing parents.
static ZC_INLINE_NODEBUG ZCResult create_directories(const char* path) noexcept {
  return zc_file_system_create_directories(path);
}

static ZC_INLINE_NODEBUG ZCResult remove_file(const char* file_name) noexcept {
  return zc_file_system_remove_file(file_name);
}

} // {ZCFileSystem}

//! \}
#endif

//! \}

#endif // ZIPCORE_CORE_FILESYSTEM_H_INCLUDED
