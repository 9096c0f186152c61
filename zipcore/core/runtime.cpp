// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zipcore/core/api-build_p.h>
#include <zipcore/core/runtime.h>

#include <stdio.h>
#include <errno.h>

#if defined(_WIN32)
  #include <windows.h>
#endif

// ZCRuntime - Build Information
// =============================

static const ZCRuntimeBuildInfo zc_runtime_build_info = {
  // ZipCore major version.
  (ZC_VERSION >> 16),
  // ZipCore minor version.
  (ZC_VERSION >> 8) & 0xFF,
  // ZipCore patch version.
  (ZC_VERSION >> 0) & 0xFF,

  // Build Type.
#ifdef ZC_BUILD_DEBUG
  ZC_RUNTIME_BUILD_TYPE_DEBUG,
#else
  ZC_RUNTIME_BUILD_TYPE_RELEASE,
#endif

  // Maximum compression level.
  uint32_t(ZC_COMPRESSION_LEVEL_UBER),

  // Reserved
  { 0 },

  // Compiler Info.
#if defined(__clang_minor__)
  "Clang " ZC_STRINGIFY(__clang_major__) "." ZC_STRINGIFY(__clang_minor__)
#elif defined(__GNUC_MINOR__)
  "GCC "  ZC_STRINGIFY(__GNUC__) "." ZC_STRINGIFY(__GNUC_MINOR__)
#elif defined(_MSC_VER)
  "MSC"
#else
  "Unknown"
#endif
};

ZC_API_IMPL ZCResult zc_runtime_get_build_info(ZCRuntimeBuildInfo* out) noexcept {
  if (ZC_UNLIKELY(!out))
    return zc_make_error(ZC_ERROR_INVALID_PARAMETER);

  memcpy(out, &zc_runtime_build_info, sizeof(ZCRuntimeBuildInfo));
  return ZC_SUCCESS;
}

// ZCRuntime - Message
// ===================

ZC_API_IMPL ZCResult zc_runtime_message_out(const char* msg) noexcept {
#if defined(_WIN32)
  // Support both Console and GUI applications on Windows.
  OutputDebugStringA(msg);
#endif

  fputs(msg, stderr);
  return ZC_SUCCESS;
}

ZC_API_IMPL ZCResult zc_runtime_message_fmt(const char* fmt, ...) noexcept {
  va_list ap;
  va_start(ap, fmt);
  ZCResult result = zc_runtime_message_vfmt(fmt, ap);
  va_end(ap);

  return result;
}

ZC_API_IMPL ZCResult zc_runtime_message_vfmt(const char* fmt, va_list ap) noexcept {
  char buf[1024];
  vsnprintf(buf, ZC_ARRAY_SIZE(buf), fmt, ap);
  return zc_runtime_message_out(buf);
}

// ZCRuntime - Assertion Failure
// =============================

ZC_API_IMPL void zc_runtime_assertion_failure(const char* file, int line, const char* msg) noexcept {
  zc_runtime_message_fmt("[ZipCore] ASSERTION FAILURE: '%s' at '%s' [line %d]\n", msg, file, line);
  abort();
}

// ZCRuntime - Result To String
// ============================

static const char zc_result_strings[] =
  "undefined error\0"
  "too many files\0"
  "file too large\0"
  "unsupported method\0"
  "unsupported encryption\0"
  "unsupported feature\0"
  "failed finding central directory\0"
  "not a ZIP archive\0"
  "invalid header or archive is corrupted\0"
  "unsupported multidisk archive\0"
  "decompression failed or archive is corrupted\0"
  "compression failed\0"
  "unexpected decompressed size\0"
  "CRC-32 check failed\0"
  "unsupported central directory size\0"
  "allocation failed\0"
  "file open failed\0"
  "file create failed\0"
  "file write failed\0"
  "file read failed\0"
  "file close failed\0"
  "file seek failed\0"
  "file stat failed\0"
  "invalid parameter\0"
  "invalid filename\0"
  "buffer too small\0"
  "internal error\0"
  "file not found\0"
  "archive is too large\0"
  "validation failed\0"
  "write callback failed\0"
  "invalid state\0"
  "data truncated\0";

ZC_API_IMPL const char* zc_result_to_string(ZCResult result_code) noexcept {
  if (result_code == ZC_SUCCESS)
    return "no error";

  if (result_code < ZC_ERROR_START_INDEX || result_code >= ZC_ERROR_END_INDEX)
    return "unknown error";

  // Walks the packed string table, the number of codes is small so there is no need for an index.
  const char* p = zc_result_strings;
  for (uint32_t i = ZC_ERROR_START_INDEX; i < result_code; i++)
    p += strlen(p) + 1;
  return p;
}

// ZCRuntime - Result From Posix Error
// ===================================

ZC_API_IMPL ZCResult zc_result_from_posix_error(int e, ZCResult fallback) noexcept {
  #define MAP(C_ERROR, ZC_ERROR) case C_ERROR: return ZC_ERROR

  switch (e) {
  #ifdef ENOMEM
    MAP(ENOMEM, ZC_ERROR_ALLOC_FAILED);
  #endif
  #ifdef EFBIG
    MAP(EFBIG, ZC_ERROR_FILE_TOO_LARGE);
  #endif
  #ifdef EOVERFLOW
    MAP(EOVERFLOW, ZC_ERROR_FILE_TOO_LARGE);
  #endif
  }

  #undef MAP

  return fallback;
}
