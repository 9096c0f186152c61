// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_CORE_RUNTIME_H_INCLUDED
#define ZIPCORE_CORE_RUNTIME_H_INCLUDED

#include <zipcore/core/api.h>

//! \addtogroup zc_runtime
//! \{

//! \name Runtime - Constants
//! \{

//! ZipCore build type.
enum ZCRuntimeBuildType : uint32_t {
  //! Describes a ZipCore debug build.
  ZC_RUNTIME_BUILD_TYPE_DEBUG = 0,
  //! Describes a ZipCore release build.
  ZC_RUNTIME_BUILD_TYPE_RELEASE = 1
};

//! \}

//! \name Runtime - Structs
//! \{

//! ZipCore build information.
struct ZCRuntimeBuildInfo {
  //! Major version number.
  uint32_t major_version;
  //! Minor version number.
  uint32_t minor_version;
  //! Patch version number.
  uint32_t patch_version;

  //! ZipCore build type, see \ref ZCRuntimeBuildType.
  uint32_t build_type;

  //! Maximum compression level accepted by the compressor.
  uint32_t max_compression_level;

  //! Reserved, must be zero.
  uint32_t reserved[3];

  //! Identification of the C++ compiler used to build ZipCore.
  char compiler_info[32];

#ifdef __cplusplus
  ZC_INLINE_NODEBUG void reset() noexcept { *this = ZCRuntimeBuildInfo{}; }
#endif
};

//! \}

//! \name Runtime - C API
//! \{

ZC_BEGIN_C_DECLS

ZC_API ZCResult ZC_CDECL zc_runtime_get_build_info(ZCRuntimeBuildInfo* out) ZC_NOEXCEPT_C;

ZC_API ZCResult ZC_CDECL zc_runtime_message_out(const char* msg) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_runtime_message_fmt(const char* fmt, ...) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_runtime_message_vfmt(const char* fmt, va_list ap) ZC_NOEXCEPT_C;

//! Translates a POSIX `errno` value into a ZipCore result code.
//!
//! Errors that have a dedicated result code (out of memory, file too large) are mapped to it, everything else is
//! mapped to `fallback`, which describes the operation that failed (for example `ZC_ERROR_FILE_READ_FAILED`).
ZC_API ZCResult ZC_CDECL zc_result_from_posix_error(int e, ZCResult fallback) ZC_NOEXCEPT_C;

ZC_END_C_DECLS

//! \}

//! \name Runtime - C++ API
//! \{
#ifdef __cplusplus

//! Interface to access ZipCore runtime (wraps C API).
namespace ZCRuntime {

static ZC_INLINE_NODEBUG ZCResult query_build_info(ZCRuntimeBuildInfo* out) noexcept {
  return zc_runtime_get_build_info(out);
}

static ZC_INLINE_NODEBUG ZCResult message(const char* msg) noexcept {
  return zc_runtime_message_out(msg);
}

template<typename... Args>
static ZC_INLINE_NODEBUG ZCResult message(const char* fmt, Args&&... args) noexcept {
  return zc_runtime_message_fmt(fmt, args...);
}

} // {ZCRuntime}

#endif
//! \}

//! \}

#endif // ZIPCORE_CORE_RUNTIME_H_INCLUDED
