// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_SUPPORT_INTOPS_P_H_INCLUDED
#define ZIPCORE_SUPPORT_INTOPS_P_H_INCLUDED

#include <zipcore/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup zipcore_internal
//! \{

namespace zc {

//! Utility functions simplifying integer operations.
namespace IntOps {
namespace {

//! \name Integer Type Conversion
//! \{

//! Cast an integer `x` to either `uint32_t` or `uint64_t`.
template<typename T>
[[nodiscard]]
static ZC_INLINE_CONSTEXPR std::conditional_t<(sizeof(T) > 4), uint64_t, uint32_t> as_uint32_at_least(T x) noexcept {
  return std::conditional_t<(sizeof(T) > 4), uint64_t, uint32_t>(std::make_unsigned_t<T>(x));
}

//! \}

//! \name Byte Swap Operations
//! \{

template<typename T>
[[nodiscard]]
static ZC_INLINE T byte_swap16(const T& x) noexcept {
#if defined(_MSC_VER)
  return T(uint16_t(_byteswap_ushort(uint16_t(x))));
#else
  return T(uint16_t((uint16_t(x) << 8) | (uint16_t(x) >> 8)));
#endif
}

template<typename T>
[[nodiscard]]
static ZC_INLINE T byte_swap32(const T& x) noexcept {
#if defined(__GNUC__)
  return T(uint32_t(__builtin_bswap32(uint32_t(x))));
#elif defined(_MSC_VER)
  return T(uint32_t(_byteswap_ulong(uint32_t(x))));
#else
  return T((uint32_t(x) << 24) | (uint32_t(x) >> 24) | ((uint32_t(x) << 8) & 0x00FF0000u) | ((uint32_t(x) >> 8) & 0x0000FF00));
#endif
}

template<typename T>
[[nodiscard]]
static ZC_INLINE T byte_swap64(const T& x) noexcept {
#if defined(__GNUC__)
  return T(uint64_t(__builtin_bswap64(uint64_t(x))));
#elif defined(_MSC_VER)
  return T(uint64_t(_byteswap_uint64(uint64_t(x))));
#else
  return T( (uint64_t(byte_swap32(uint32_t(uint64_t(x) >> 32        )))      ) |
            (uint64_t(byte_swap32(uint32_t(uint64_t(x) & 0xFFFFFFFFu))) << 32) );
#endif
}

template<typename T>
[[nodiscard]]
static ZC_INLINE T byte_swap(const T& x) noexcept {
  if constexpr (sizeof(T) == 1)
    return x;
  else if constexpr (sizeof(T) == 2)
    return byte_swap16(x);
  else if constexpr (sizeof(T) == 4)
    return byte_swap32(x);
  else
    return byte_swap64(x);
}

//! \}

//! \name Bit Manipulation
//! \{

//! Returns the number of bits of `T`.
template<typename T>
[[nodiscard]]
static ZC_INLINE_CONSTEXPR uint32_t bit_size_of() noexcept { return uint32_t(sizeof(T) * 8u); }

//! Returns `0 - x` in a safe way (no undefined behavior), works for unsigned numbers as well.
template<typename T>
[[nodiscard]]
static ZC_INLINE_CONSTEXPR T negate(const T& x) noexcept {
  using U = std::make_unsigned_t<T>;
  return T(U(0) - U(x));
}

//! \}

//! \name Bit Scan
//! \{

template<typename T>
[[nodiscard]]
static ZC_INLINE_CONSTEXPR uint32_t clz_static(const T& x) noexcept {
  uint32_t n = 0;
  for (T mask = T(T(1) << (bit_size_of<T>() - 1u)); mask && !(x & mask); mask = T(mask >> 1))
    n++;
  return n;
}

template<typename T>
[[nodiscard]]
static ZC_INLINE_CONSTEXPR uint32_t ctz_static(const T& x) noexcept {
  uint32_t n = 0;
  for (T mask = T(1); mask && !(x & mask); mask = T(mask << 1))
    n++;
  return n;
}

template<typename T> [[nodiscard]] ZC_INLINE_NODEBUG uint32_t clz_impl(const T& x) noexcept { return clz_static(x); }
template<typename T> [[nodiscard]] ZC_INLINE_NODEBUG uint32_t ctz_impl(const T& x) noexcept { return ctz_static(x); }

#if defined(__GNUC__)
template<> [[nodiscard]] ZC_INLINE_NODEBUG uint32_t clz_impl(const uint32_t& x) noexcept { return uint32_t(__builtin_clz(x)); }
template<> [[nodiscard]] ZC_INLINE_NODEBUG uint32_t clz_impl(const uint64_t& x) noexcept { return uint32_t(__builtin_clzll(x)); }
template<> [[nodiscard]] ZC_INLINE_NODEBUG uint32_t ctz_impl(const uint32_t& x) noexcept { return uint32_t(__builtin_ctz(x)); }
template<> [[nodiscard]] ZC_INLINE_NODEBUG uint32_t ctz_impl(const uint64_t& x) noexcept { return uint32_t(__builtin_ctzll(x)); }
#elif defined(_MSC_VER)
template<> [[nodiscard]] ZC_INLINE_NODEBUG uint32_t clz_impl(const uint32_t& x) noexcept { unsigned long i; _BitScanReverse(&i, x); return uint32_t(i ^ 31); }
template<> [[nodiscard]] ZC_INLINE_NODEBUG uint32_t ctz_impl(const uint32_t& x) noexcept { unsigned long i; _BitScanForward(&i, x); return uint32_t(i); }
#if ZC_TARGET_ARCH_BITS == 64
template<> [[nodiscard]] ZC_INLINE_NODEBUG uint32_t clz_impl(const uint64_t& x) noexcept { unsigned long i; _BitScanReverse64(&i, x); return uint32_t(i ^ 63); }
template<> [[nodiscard]] ZC_INLINE_NODEBUG uint32_t ctz_impl(const uint64_t& x) noexcept { unsigned long i; _BitScanForward64(&i, x); return uint32_t(i); }
#endif
#endif

//! Counts leading zeros in `x`, which must be non-zero.
template<typename T>
[[nodiscard]]
static ZC_INLINE_NODEBUG uint32_t clz(T x) noexcept { return clz_impl(as_uint32_at_least(x)) - (bit_size_of<decltype(as_uint32_at_least(x))>() - bit_size_of<T>()); }

//! Counts trailing zeros in `x`, which must be non-zero.
template<typename T>
[[nodiscard]]
static ZC_INLINE_NODEBUG uint32_t ctz(T x) noexcept { return ctz_impl(as_uint32_at_least(x)); }

//! \}

//! \name Alignment
//! \{

//! Aligns `x` up to `alignment`, which must be a power of 2.
template<typename X, typename Y>
[[nodiscard]]
static ZC_INLINE_CONSTEXPR X align_up(const X& x, const Y& alignment) noexcept {
  using U = std::make_unsigned_t<X>;
  return X((U(x) + U(alignment) - 1u) & ~(U(alignment) - 1u));
}

//! Returns the smallest power of 2 that is greater than `x`.
template<typename T>
[[nodiscard]]
static ZC_INLINE_NODEBUG T grow_to_power_of_2(const T& x) noexcept {
  return T(T(1u) << (bit_size_of<T>() - clz(T(x | 1u))));
}

//! \}

} // {anonymous}
} // {IntOps}
} // {zc}

//! \}
//! \endcond

#endif // ZIPCORE_SUPPORT_INTOPS_P_H_INCLUDED
