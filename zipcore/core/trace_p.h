// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_CORE_TRACE_P_H_INCLUDED
#define ZIPCORE_CORE_TRACE_P_H_INCLUDED

#include <zipcore/core/api-internal_p.h>
#include <zipcore/core/runtime.h>

//! \cond INTERNAL
//! \addtogroup zipcore_internal
//! \{

//! Dummy trace - no tracing, no runtime overhead.
class ZCDummyTrace {
public:
  ZC_INLINE_NODEBUG void indent() noexcept {}
  ZC_INLINE_NODEBUG void deindent() noexcept {}

  template<typename... Args>
  ZC_INLINE_NODEBUG void out(Args&&...) noexcept {}

  template<typename... Args>
  ZC_INLINE_NODEBUG void info(Args&&...) noexcept {}

  template<typename... Args>
  ZC_INLINE_NODEBUG bool warn(Args&&...) noexcept { return false; }

  template<typename... Args>
  ZC_INLINE_NODEBUG bool fail(Args&&...) noexcept { return false; }
};

//! Debug trace - active, prints to runtime output.
class ZCDebugTrace {
public:
  uint32_t indentation = 0;

  ZC_INLINE_NODEBUG void indent() noexcept { indentation++; }
  ZC_INLINE_NODEBUG void deindent() noexcept { indentation--; }

  template<typename... Args>
  ZC_INLINE void out(Args&&... args) noexcept { log(0, 0xFFFFFFFFu, args...); }

  template<typename... Args>
  ZC_INLINE void info(Args&&... args) noexcept { log(0, indentation, args...); }

  template<typename... Args>
  ZC_INLINE bool warn(Args&&... args) noexcept { log(1, indentation, args...); return false; }

  template<typename... Args>
  ZC_INLINE bool fail(Args&&... args) noexcept { log(2, indentation, args...); return false; }

  ZC_HIDDEN static void log(uint32_t severity, uint32_t indentation, const char* fmt, ...) noexcept;
};

//! \}
//! \endcond

#endif // ZIPCORE_CORE_TRACE_P_H_INCLUDED
