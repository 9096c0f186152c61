// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_CORE_API_H_INCLUDED
#define ZIPCORE_CORE_API_H_INCLUDED

// C Headers
// =========

#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#include <string.h>

#if defined(__cplusplus)
  #include <type_traits>
#endif

//! \addtogroup zc_globals
//! \{

// Version
// =======

//! Makes a version number representing a `MAJOR.MINOR.PATCH` combination.
#define ZC_MAKE_VERSION(MAJOR, MINOR, PATCH) (((MAJOR) << 16) | ((MINOR) << 8) | (PATCH))

//! ZipCore library version.
#define ZC_VERSION ZC_MAKE_VERSION(1, 0, 0)

// Build Type
// ==========

//! \cond NEVER
#if !defined(ZC_STATIC) && defined(ZC_BUILD_STATIC)
  #define ZC_STATIC
#endif

#if !defined(ZC_BUILD_DEBUG) && !defined(ZC_BUILD_RELEASE)
  #if !defined(NDEBUG)
    #define ZC_BUILD_DEBUG
  #else
    #define ZC_BUILD_RELEASE
  #endif
#endif
//! \endcond

// Public Macros
// =============

//! \def ZC_API
//!
//! A base API decorator that marks functions and variables exported by ZipCore.
#if !defined(ZC_STATIC)
  #if defined(_WIN32) && (defined(_MSC_VER) || defined(__MINGW32__))
    #if defined(ZC_BUILD_EXPORT)
      #define ZC_API __declspec(dllexport)
    #else
      #define ZC_API __declspec(dllimport)
    #endif
  #elif defined(__GNUC__)
    #define ZC_API __attribute__((__visibility__("default")))
  #endif
#endif

#if !defined(ZC_API)
  #define ZC_API
#endif

//! \def ZC_CDECL
//!
//! Calling convention used by all exported functions and function callbacks.
#if defined(__GNUC__) && defined(__i386__) && !defined(__x86_64__)
  #define ZC_CDECL __attribute__((__cdecl__))
#elif defined(_MSC_VER)
  #define ZC_CDECL __cdecl
#else
  #define ZC_CDECL
#endif

//! \def ZC_INLINE
//!
//! Marks functions that should always be inlined.
#if defined(__GNUC__) && !defined(ZC_BUILD_DEBUG)
  #define ZC_INLINE inline __attribute__((__always_inline__))
#elif defined(_MSC_VER) && !defined(ZC_BUILD_DEBUG)
  #define ZC_INLINE __forceinline
#else
  #define ZC_INLINE inline
#endif

//! \def ZC_INLINE_NODEBUG
//!
//! The same as `ZC_INLINE` combined with `__attribute__((artificial))` if supported.
#if defined(__clang__)
  #define ZC_INLINE_NODEBUG inline __attribute__((__always_inline__, __nodebug__))
#elif defined(__GNUC__)
  #define ZC_INLINE_NODEBUG inline __attribute__((__always_inline__, __artificial__))
#else
  #define ZC_INLINE_NODEBUG ZC_INLINE
#endif

//! \def ZC_INLINE_CONSTEXPR
//!
//! The same as `ZC_INLINE_NODEBUG`, but having also `constexpr` keyword.
#define ZC_INLINE_CONSTEXPR constexpr ZC_INLINE_NODEBUG

//! \def ZC_NORETURN
//!
//! Function attribute used by functions that never return (that terminate the process).
#if defined(__GNUC__)
  #define ZC_NORETURN __attribute__((__noreturn__))
#elif defined(_MSC_VER)
  #define ZC_NORETURN __declspec(noreturn)
#else
  #define ZC_NORETURN
#endif

//! \def ZC_NOEXCEPT_C
//!
//! Guarantees that a function marked by this macro will not throw when called from C++ code.
#if defined(__cplusplus)
  #define ZC_NOEXCEPT_C noexcept
#else
  #define ZC_NOEXCEPT_C
#endif

//! \def ZC_LIKELY(EXP)
//!
//! A condition is likely.
#if defined(__GNUC__)
  #define ZC_LIKELY(...) __builtin_expect(!!(__VA_ARGS__), 1)
#else
  #define ZC_LIKELY(...) (__VA_ARGS__)
#endif

//! \def ZC_UNLIKELY(EXP)
//!
//! A condition is unlikely.
#if defined(__GNUC__)
  #define ZC_UNLIKELY(...) __builtin_expect(!!(__VA_ARGS__), 0)
#else
  #define ZC_UNLIKELY(...) (__VA_ARGS__)
#endif

//! \def ZC_ASSERT(EXP)
//!
//! Run-time assertion executed in debug builds.
#if defined(ZC_BUILD_DEBUG)
  #define ZC_ASSERT(...)                                                      \
    do {                                                                      \
      if (ZC_UNLIKELY(!(__VA_ARGS__)))                                        \
        zc_runtime_assertion_failure(__FILE__, __LINE__, #__VA_ARGS__);       \
    } while (0)
#else
  #define ZC_ASSERT(...) ((void)0)
#endif

//! \def ZC_PROPAGATE(...)
//!
//! Executes the code within the macro and returns if it returned any value other than `ZC_SUCCESS`.
#define ZC_PROPAGATE(...)                                                     \
  do {                                                                        \
    ZCResult result_to_propagate = (__VA_ARGS__);                             \
    if (ZC_UNLIKELY(result_to_propagate != ZC_SUCCESS)) {                     \
      return result_to_propagate;                                             \
    }                                                                         \
  } while (0)

#if defined(__cplusplus)
//! \def ZC_DEFINE_ENUM_FLAGS(T)
//!
//! Defines operations for enumeration flags (C++ only).
#define ZC_DEFINE_ENUM_FLAGS(T)                                               \
  static ZC_INLINE_CONSTEXPR T operator~(T a) noexcept {                      \
    return T(~std::underlying_type_t<T>(a));                                  \
  }                                                                           \
                                                                              \
  static ZC_INLINE_CONSTEXPR T operator|(T a, T b) noexcept {                 \
    return T(std::underlying_type_t<T>(a) | std::underlying_type_t<T>(b));    \
  }                                                                           \
  static ZC_INLINE_CONSTEXPR T operator&(T a, T b) noexcept {                 \
    return T(std::underlying_type_t<T>(a) & std::underlying_type_t<T>(b));    \
  }                                                                           \
  static ZC_INLINE_CONSTEXPR T operator^(T a, T b) noexcept {                 \
    return T(std::underlying_type_t<T>(a) ^ std::underlying_type_t<T>(b));    \
  }                                                                           \
                                                                              \
  static ZC_INLINE_CONSTEXPR T& operator|=(T& a, T b) noexcept {              \
    a = T(std::underlying_type_t<T>(a) | std::underlying_type_t<T>(b));       \
    return a;                                                                 \
  }                                                                           \
  static ZC_INLINE_CONSTEXPR T& operator&=(T& a, T b) noexcept {              \
    a = T(std::underlying_type_t<T>(a) & std::underlying_type_t<T>(b));       \
    return a;                                                                 \
  }                                                                           \
  static ZC_INLINE_CONSTEXPR T& operator^=(T& a, T b) noexcept {              \
    a = T(std::underlying_type_t<T>(a) ^ std::underlying_type_t<T>(b));       \
    return a;                                                                 \
  }
#else
  #define ZC_DEFINE_ENUM_FLAGS(T)
#endif

//! \cond INTERNAL
#if defined(__cplusplus)
  #define ZC_BEGIN_C_DECLS extern "C" {
  #define ZC_END_C_DECLS } /* {ExternC} */
#else
  #define ZC_BEGIN_C_DECLS
  #define ZC_END_C_DECLS
#endif
//! \endcond

// Result
// ======

//! Result code used by most ZipCore functions (32-bit unsigned integer).
//!
//! The `ZCResultCode` enumeration contains ZipCore result codes that contain ZipCore specific set of errors.
typedef uint32_t ZCResult;

//! ZipCore result code.
enum ZCResultCode : uint32_t {
  //! Successful result code.
  ZC_SUCCESS = 0,

  //! Start of ZipCore error codes.
  ZC_ERROR_START_INDEX = 0x00010000u,

  ZC_ERROR_UNDEFINED = 0x00010000u,        //!< Undefined error.
  ZC_ERROR_TOO_MANY_FILES,                 //!< Too many files in the archive.
  ZC_ERROR_FILE_TOO_LARGE,                 //!< File is too large.
  ZC_ERROR_UNSUPPORTED_METHOD,             //!< Unsupported compression method.
  ZC_ERROR_UNSUPPORTED_ENCRYPTION,         //!< Encrypted entries are not supported.
  ZC_ERROR_UNSUPPORTED_FEATURE,            //!< Unsupported ZIP feature.
  ZC_ERROR_FAILED_FINDING_CENTRAL_DIR,     //!< Central directory could not be located.
  ZC_ERROR_NOT_AN_ARCHIVE,                 //!< Not a ZIP archive.
  ZC_ERROR_INVALID_HEADER_OR_CORRUPTED,    //!< Invalid header or corrupted archive.
  ZC_ERROR_UNSUPPORTED_MULTIDISK,          //!< Multi-disk archives are not supported.
  ZC_ERROR_DECOMPRESSION_FAILED,           //!< Decompression failed (invalid or truncated stream).
  ZC_ERROR_COMPRESSION_FAILED,             //!< Compression failed.
  ZC_ERROR_UNEXPECTED_DECOMPRESSED_SIZE,   //!< Decompressed size doesn't match the recorded size.
  ZC_ERROR_CRC_CHECK_FAILED,               //!< CRC32 check failed.
  ZC_ERROR_UNSUPPORTED_CDIR_SIZE,          //!< Central directory size is inconsistent or unsupported.
  ZC_ERROR_ALLOC_FAILED,                   //!< Memory allocation failed.
  ZC_ERROR_FILE_OPEN_FAILED,               //!< File open failed.
  ZC_ERROR_FILE_CREATE_FAILED,             //!< File create failed.
  ZC_ERROR_FILE_WRITE_FAILED,              //!< File write failed.
  ZC_ERROR_FILE_READ_FAILED,               //!< File read failed.
  ZC_ERROR_FILE_CLOSE_FAILED,              //!< File close failed.
  ZC_ERROR_FILE_SEEK_FAILED,               //!< File seek failed.
  ZC_ERROR_FILE_STAT_FAILED,               //!< File stat failed.
  ZC_ERROR_INVALID_PARAMETER,              //!< Invalid parameter.
  ZC_ERROR_INVALID_FILENAME,               //!< Invalid filename.
  ZC_ERROR_BUF_TOO_SMALL,                  //!< Buffer too small.
  ZC_ERROR_INTERNAL_ERROR,                 //!< Internal error.
  ZC_ERROR_FILE_NOT_FOUND,                 //!< File not found in the archive.
  ZC_ERROR_ARCHIVE_TOO_LARGE,              //!< Archive is too large.
  ZC_ERROR_VALIDATION_FAILED,              //!< Archive validation failed.
  ZC_ERROR_WRITE_CALLBACK_FAILED,          //!< Write callback accepted fewer bytes than requested.
  ZC_ERROR_INVALID_STATE,                  //!< Operation invoked in a wrong state.
  ZC_ERROR_DATA_TRUNCATED,                 //!< More input is required to continue (decoder).

  //! Count of result codes (not a result code).
  ZC_ERROR_END_INDEX
};

// Public Types
// ============

//! Provides information about a memory region.
struct ZCDataView {
  const uint8_t* data;
  size_t size;

#ifdef __cplusplus
  ZC_INLINE_NODEBUG void reset() noexcept {
    data = nullptr;
    size = 0;
  }

  ZC_INLINE_NODEBUG void reset(const uint8_t* data_in, size_t size_in) noexcept {
    data = data_in;
    size = size_in;
  }
#endif
};

//! Array modification operation used by containers, see `ZCByteArray::modify_op()`.
enum ZCModifyOp : uint32_t {
  //! Assign operation, which reserves space only to fit the requested input.
  ZC_MODIFY_OP_ASSIGN_FIT = 0,
  //! Assign operation, which takes into consideration successive appends.
  ZC_MODIFY_OP_ASSIGN_GROW = 1,
  //! Append operation, which reserves space only to fit the current and appended content.
  ZC_MODIFY_OP_APPEND_FIT = 2,
  //! Append operation, which takes into consideration successive appends.
  ZC_MODIFY_OP_APPEND_GROW = 3
};

//! Compression level.
//!
//! Levels between 0 (store) and 9 (best) are supported, 10 is accepted and behaves like 9.
enum ZCCompressionLevel : int32_t {
  //! Default compression level (maps to 6).
  ZC_COMPRESSION_LEVEL_DEFAULT = -1,
  //! No compression, data is stored.
  ZC_COMPRESSION_LEVEL_STORE = 0,
  //! Fastest compression.
  ZC_COMPRESSION_LEVEL_FASTEST = 1,
  //! Best compression.
  ZC_COMPRESSION_LEVEL_BEST = 9,
  //! Maximum accepted compression level.
  ZC_COMPRESSION_LEVEL_UBER = 10
};

// Public API
// ==========

ZC_BEGIN_C_DECLS

//! Returns a human-readable description of the given `result_code`.
ZC_API const char* ZC_CDECL zc_result_to_string(ZCResult result_code) ZC_NOEXCEPT_C;

ZC_NORETURN ZC_API void ZC_CDECL zc_runtime_assertion_failure(const char* file, int line, const char* msg) ZC_NOEXCEPT_C;

ZC_END_C_DECLS

//! Returns `result_code`. Every error originates from this function so a breakpoint can catch it.
static ZC_INLINE_NODEBUG ZCResult zc_make_error(ZCResult result_code) ZC_NOEXCEPT_C { return result_code; }

//! \}

#endif // ZIPCORE_CORE_API_H_INCLUDED
