// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_CORE_API_INTERNAL_P_H_INCLUDED
#define ZIPCORE_CORE_API_INTERNAL_P_H_INCLUDED

#include <zipcore/core/api.h>

// C Headers
// =========

#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>

// C++ Headers
// ===========

#include <type_traits>

// Some intrinsics defined by MSVC compiler are useful and used across the library.
#ifdef _MSC_VER
  #include <intrin.h>
#endif

//! \cond INTERNAL
//! \addtogroup zipcore_internal
//! \{

// Build - Target Architecture
// ===========================

#if defined(_M_X64) || defined(__amd64) || defined(__amd64__) || defined(__x86_64) || defined(__x86_64__)
  #define ZC_TARGET_ARCH_X86 64
#elif defined(_M_IX86) || defined(__i386) || defined(__i386__)
  #define ZC_TARGET_ARCH_X86 32
#else
  #define ZC_TARGET_ARCH_X86 0
#endif

#if defined(_M_ARM64) || defined(__ARM64__) || defined(__aarch64__)
  #define ZC_TARGET_ARCH_ARM 64
#elif defined(_M_ARM) || defined(_M_ARMT) || defined(__arm__) || defined(__thumb__) || defined(__thumb2__)
  #define ZC_TARGET_ARCH_ARM 32
#else
  #define ZC_TARGET_ARCH_ARM 0
#endif

#define ZC_TARGET_ARCH_BITS (ZC_TARGET_ARCH_X86 | ZC_TARGET_ARCH_ARM)
#if ZC_TARGET_ARCH_BITS == 0
  #undef ZC_TARGET_ARCH_BITS
  #if defined(__LP64__) || defined(_LP64)
    #define ZC_TARGET_ARCH_BITS 64
  #else
    #define ZC_TARGET_ARCH_BITS 32
  #endif
#endif

// Build - Byte Order
// ==================

#if defined(__ARMEB__) || defined(__BIG_ENDIAN__) || \
    (defined(__BYTE_ORDER__) && defined(__ORDER_BIG_ENDIAN__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__)
  #define ZC_BYTE_ORDER 4321
#else
  #define ZC_BYTE_ORDER 1234
#endif

static constexpr uint32_t ZC_BYTE_ORDER_LE = 0;
static constexpr uint32_t ZC_BYTE_ORDER_BE = 1;
static constexpr uint32_t ZC_BYTE_ORDER_NATIVE = ZC_BYTE_ORDER == 1234 ? ZC_BYTE_ORDER_LE : ZC_BYTE_ORDER_BE;

// C++ Compiler Support
// ====================

//! \def ZC_HIDDEN
//!
//! Decorates a function that is used across more than one source file, but should never be exported.
#if defined(__GNUC__) && !defined(__MINGW32__)
  #define ZC_HIDDEN __attribute__((__visibility__("hidden")))
#else
  #define ZC_HIDDEN
#endif

//! \def ZC_NOINLINE
//!
//! Decorates a function that should never be inlined. Used to decorate functions that are called rarely, like
//! buffer reallocation and error paths.
#if defined(__GNUC__)
  #define ZC_NOINLINE __attribute__((__noinline__))
#elif defined(_MSC_VER)
  #define ZC_NOINLINE __declspec(noinline)
#else
  #define ZC_NOINLINE
#endif

//! \def ZC_NOUNROLL
//!
//! Compiler-specific macro that annotates a do/for/while loop to not get unrolled.
#if defined(__clang__)
  #define ZC_NOUNROLL _Pragma("nounroll")
#else
  #define ZC_NOUNROLL
#endif

//! \def ZC_API_IMPL
//!
//! Decorator used to mark all functions that are exported - it expands to "extern C", which ensures that an exported
//! function can be implemented within a private namespace and it would still be exported properly.
#define ZC_API_IMPL extern "C" ZC_API

#define ZC_STRINGIFY_WRAP(N) #N
#define ZC_STRINGIFY(N) ZC_STRINGIFY_WRAP(N)

#define ZC_STATIC_ASSERT(...) static_assert(__VA_ARGS__, "Failed ZC_STATIC_ASSERT(" #__VA_ARGS__ ")")

// Internal C++ Macros
// ===================

//! \def ZC_NONCOPYABLE
//!
//! Makes a class noncopyable by making its copy constructor and copy assignment operator deleted.
#define ZC_NONCOPYABLE(...)                                                   \
  __VA_ARGS__(const __VA_ARGS__& other) = delete;                             \
  __VA_ARGS__& operator=(const __VA_ARGS__& other) = delete;

#if defined(_MSC_VER)
  #define ZC_RESTRICT __restrict
#elif defined(__GNUC__)
  #define ZC_RESTRICT __restrict__
#else
  #define ZC_RESTRICT
#endif

#define ZC_ARRAY_SIZE(X) uint32_t(sizeof(X) / sizeof(X[0]))

#define ZC_PROPAGATE_(exp, cleanup)                                           \
  do {                                                                        \
    ZCResult _result_to_propagate = (exp);                                    \
    if (ZC_UNLIKELY(_result_to_propagate != ZC_SUCCESS)) {                    \
      cleanup                                                                 \
      return _result_to_propagate;                                            \
    }                                                                         \
  } while (0)

// Internal Macros
// ===============

#define ZC_RETURN_ERROR_IF_NULL(ptr)                  \
  do {                                                \
    if (!(ptr))                                       \
      return zc_make_error(ZC_ERROR_ALLOC_FAILED);    \
  } while (0)

// Internal Types
// ==============

//! A type used to store a pack of bits (typedef to `uintptr_t`).
//!
//! BitWord should be equal in size to a machine word.
using ZCBitWord = uintptr_t;

// Internal Constants
// ==================

//! Host memory allocator overhead (estimated).
static constexpr uint32_t ZC_ALLOC_OVERHEAD = uint32_t(sizeof(void*)) * 4u;

//! Limits doubling of a container size after the limit size [in bytes] has reached 8MB. The container will
//! use a more conservative approach after the threshold has been reached.
static constexpr size_t ZC_ALLOC_GROW_LIMIT = size_t(1) << 23;

//! To make checks for APPEND operation easier.
static constexpr ZCModifyOp ZC_MODIFY_OP_APPEND_START = ZCModifyOp(2);
//! Mask that can be used to check whether `ZCModifyOp` has a grow hint.
static constexpr ZCModifyOp ZC_MODIFY_OP_GROW_MASK = ZCModifyOp(1);

static ZC_INLINE_CONSTEXPR bool zc_modify_op_is_assign(ZCModifyOp modify_op) noexcept { return modify_op < ZC_MODIFY_OP_APPEND_START; }
static ZC_INLINE_CONSTEXPR bool zc_modify_op_is_append(ZCModifyOp modify_op) noexcept { return modify_op >= ZC_MODIFY_OP_APPEND_START; }
static ZC_INLINE_CONSTEXPR bool zc_modify_op_does_grow(ZCModifyOp modify_op) noexcept { return (modify_op & ZC_MODIFY_OP_GROW_MASK) != 0; }

// Internal C++ Functions
// ======================

template<typename T>
static ZC_INLINE_CONSTEXPR T zc_min(const T& a, const T& b) noexcept { return b < a ? b : a; }

template<typename T>
static ZC_INLINE_CONSTEXPR T zc_max(const T& a, const T& b) noexcept { return a < b ? b : a; }

//! Used to silence warnings about unused arguments or variables.
template<typename... Args>
static ZC_INLINE_NODEBUG void zc_unused(Args&&...) noexcept {}

template<typename T>
static ZC_INLINE_CONSTEXPR bool zc_test_flag(const T& x, const T& y) noexcept {
  return (std::underlying_type_t<T>(x) & std::underlying_type_t<T>(y)) != std::underlying_type_t<T>(0);
}

//! \}
//! \endcond

#endif // ZIPCORE_CORE_API_INTERNAL_P_H_INCLUDED
