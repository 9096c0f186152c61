// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_SUPPORT_MEMOPS_P_H_INCLUDED
#define ZIPCORE_SUPPORT_MEMOPS_P_H_INCLUDED

#include <zipcore/core/api-internal_p.h>
#include <zipcore/support/intops_p.h>

//! \cond INTERNAL
//! \addtogroup zipcore_internal
//! \{

namespace zc {
namespace MemOps {
namespace {

//! \name Unaligned Constants
//! \{

static const constexpr bool kUnalignedMemIO = (ZC_TARGET_ARCH_X86 != 0) || (ZC_TARGET_ARCH_ARM == 64);
static const constexpr bool kUnalignedMem32 = (ZC_TARGET_ARCH_X86 != 0) || (ZC_TARGET_ARCH_ARM == 64);

//! \}

//! \name Memory Load & Store
//! \{

//! Loads `T` from a possibly unaligned memory location in native byte order.
template<typename T>
[[nodiscard]] static ZC_INLINE_NODEBUG T loadu(const void* p) noexcept {
  T tmp;
  memcpy(&tmp, p, sizeof(T));
  return tmp;
}

//! Loads `T` from a possibly unaligned memory location in little endian byte order.
template<typename T>
[[nodiscard]] static ZC_INLINE_NODEBUG T loadu_le(const void* p) noexcept {
  T tmp;
  memcpy(&tmp, p, sizeof(T));

  if constexpr (ZC_BYTE_ORDER_NATIVE != ZC_BYTE_ORDER_LE) {
    tmp = IntOps::byte_swap(tmp);
  }

  return tmp;
}

template<typename T>
static ZC_INLINE_NODEBUG void storeu_le(void* p, const T& v) noexcept {
  T tmp = v;

  if constexpr (ZC_BYTE_ORDER_NATIVE != ZC_BYTE_ORDER_LE) {
    tmp = IntOps::byte_swap(tmp);
  }

  memcpy(p, &tmp, sizeof(T));
}

template<typename T>
static ZC_INLINE_NODEBUG void storeu_be(void* p, const T& v) noexcept {
  T tmp = v;

  if constexpr (ZC_BYTE_ORDER_NATIVE != ZC_BYTE_ORDER_BE) {
    tmp = IntOps::byte_swap(tmp);
  }

  memcpy(p, &tmp, sizeof(T));
}

//! \}

//! \name Memory Read
//! \{

[[nodiscard]] static ZC_INLINE_NODEBUG uint32_t readU8(const void* p) noexcept { return uint32_t(static_cast<const uint8_t*>(p)[0]); }

[[nodiscard]] static ZC_INLINE_NODEBUG uint32_t readU16uLE(const void* p) noexcept { return uint32_t(loadu_le<uint16_t>(p)); }
[[nodiscard]] static ZC_INLINE_NODEBUG uint32_t readU32u(const void* p) noexcept { return loadu<uint32_t>(p); }
[[nodiscard]] static ZC_INLINE_NODEBUG uint32_t readU32uLE(const void* p) noexcept { return loadu_le<uint32_t>(p); }
[[nodiscard]] static ZC_INLINE_NODEBUG uint64_t readU64uLE(const void* p) noexcept { return loadu_le<uint64_t>(p); }

//! Reads 3 bytes in native byte order, used to compare 3-byte sequences.
template<uint32_t ByteOrder = ZC_BYTE_ORDER_NATIVE>
[[nodiscard]]
static ZC_INLINE_NODEBUG uint32_t readU24u(const void* p) noexcept {
  uint32_t b0 = readU8(static_cast<const uint8_t*>(p) + (ByteOrder == ZC_BYTE_ORDER_LE ? 2 : 0));
  uint32_t b1 = readU8(static_cast<const uint8_t*>(p) + 1);
  uint32_t b2 = readU8(static_cast<const uint8_t*>(p) + (ByteOrder == ZC_BYTE_ORDER_LE ? 0 : 2));
  return (b0 << 16) | (b1 << 8) | b2;
}

//! \}

//! \name Memory Write
//! \{

static ZC_INLINE_NODEBUG void writeU16uLE(void* p, uint32_t x) noexcept { storeu_le(p, uint16_t(x)); }
static ZC_INLINE_NODEBUG void writeU16uBE(void* p, uint32_t x) noexcept { storeu_be(p, uint16_t(x)); }
static ZC_INLINE_NODEBUG void writeU32uLE(void* p, uint32_t x) noexcept { storeu_le(p, x); }
static ZC_INLINE_NODEBUG void writeU32uBE(void* p, uint32_t x) noexcept { storeu_be(p, x); }
static ZC_INLINE_NODEBUG void writeU64uLE(void* p, uint64_t x) noexcept { storeu_le(p, x); }

//! \}

} // {anonymous}
} // {MemOps}
} // {zc}

//! \}
//! \endcond

#endif // ZIPCORE_SUPPORT_MEMOPS_P_H_INCLUDED
