// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_SUPPORT_PTROPS_P_H_INCLUDED
#define ZIPCORE_SUPPORT_PTROPS_P_H_INCLUDED

#include <zipcore/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup zipcore_internal
//! \{

namespace zc {
namespace PtrOps {
namespace {

//! \name Pointer Arithmetic
//! \{

template<typename T, typename Offset>
[[nodiscard]]
static ZC_INLINE_NODEBUG T* offset(T* ptr, Offset offset) noexcept { return (T*)((uintptr_t)(ptr) + (uintptr_t)(intptr_t)offset); }

[[nodiscard]]
static ZC_INLINE_NODEBUG size_t byte_offset(const void* base, const void* ptr) noexcept {
  // The result must be zero or positive as it's represented by an unsigned type.
  ZC_ASSERT(static_cast<const uint8_t*>(ptr) >= static_cast<const uint8_t*>(base));

  return (size_t)(static_cast<const uint8_t*>(ptr) - static_cast<const uint8_t*>(base));
}

[[nodiscard]]
static ZC_INLINE_NODEBUG size_t bytes_until(const void* ptr, const void* end) noexcept {
  // `end` describes the end of a buffer where data is stored or read from.
  ZC_ASSERT(static_cast<const uint8_t*>(ptr) <= static_cast<const uint8_t*>(end));

  return (size_t)(static_cast<const uint8_t*>(end) - static_cast<const uint8_t*>(ptr));
}

//! \}

} // {anonymous}
} // {PtrOps}
} // {zc}

//! \}
//! \endcond

#endif // ZIPCORE_SUPPORT_PTROPS_P_H_INCLUDED
