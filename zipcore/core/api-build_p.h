// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// This is an internal header file that is always included first by each ZipCore source file. This means that any
// macros we might need to define to build 'zipcore' can be defined here instead of passing them to the compiler
// through command line.

#ifndef ZIPCORE_CORE_API_BUILD_P_H_INCLUDED
#define ZIPCORE_CORE_API_BUILD_P_H_INCLUDED

// Build - Export
// ==============

//! \cond INTERNAL

//! Export mode is on when `ZC_BUILD_EXPORT` is defined - this MUST be defined before including any other header
//! as "api.h" uses `ZC_BUILD_EXPORT` to define a proper `ZC_API` decorator that is used by all exported functions.
#define ZC_BUILD_EXPORT

//! \endcond

// Build - Configuration
// =====================

// #define ZC_STATIC
// -----------------
//
// Builds ZipCore as a static library. Set by CMakeLists.txt when ZIPCORE_STATIC option is enabled, and must be
// also defined by users that link to a static build.

// #define ZC_TRACE_ZIP_ALL         // Trace ZIP reading and writing (all).
// #define ZC_TRACE_ZIP             // Trace ZIP central directory parsing and entry writing.
//
// ZipCore provides traces that can be enabled during development. Traces can help to understand how archives are
// laid out and can be used to track bugs in archives produced by other tools.

// Build - Requirements
// ====================

//! \cond NEVER

#ifdef _MSC_VER
  #if !defined(_CRT_SECURE_NO_DEPRECATE)
    #define _CRT_SECURE_NO_DEPRECATE
  #endif
  #if !defined(_CRT_SECURE_NO_WARNINGS)
    #define _CRT_SECURE_NO_WARNINGS
  #endif
#endif

// The file API works fully with 64-bit file sizes and offsets (zip64 archives), however, this feature must be
// enabled before including any header.
#if !defined(_WIN32) && !defined(_LARGEFILE64_SOURCE)
  #define _LARGEFILE64_SOURCE 1

  // These OSes use 64-bit offsets by default.
  #if defined(__APPLE__    ) || \
      defined(__HAIKU__    ) || \
      defined(__bsdi__     ) || \
      defined(__DragonFly__) || \
      defined(__FreeBSD__  ) || \
      defined(__NetBSD__   ) || \
      defined(__OpenBSD__  )
    #define ZC_FILE64_API(NAME) NAME
  #else
    #define ZC_FILE64_API(NAME) NAME##64
  #endif
#endif

#if defined(__linux__) && !defined(_GNU_SOURCE)
  #define _GNU_SOURCE
#endif

//! \endcond

// Build - Compiler Diagnostics
// ============================

//! \cond NEVER

#if defined(__clang__)
  #pragma clang diagnostic warning "-Wattributes"
  #pragma clang diagnostic ignored "-Wunused-function"
#elif defined(__GNUC__)
  #pragma GCC diagnostic warning "-Wattributes"
  #pragma GCC diagnostic ignored "-Wmaybe-uninitialized" // Unfortunately GCC emits lots of false positives.
  #pragma GCC diagnostic ignored "-Wunused-function"
#elif defined(_MSC_VER)
  #pragma warning(disable: 4102) // Unreferenced label.
  #pragma warning(disable: 4127) // Conditional expression is constant.
  #pragma warning(disable: 4201) // Nameless struct/union.
  #pragma warning(disable: 4324) // Structure was padded due to alignment specifier.
  #pragma warning(disable: 4505) // Unreferenced local function has been removed.
  #pragma warning(disable: 4800) // Forcing value to bool true or false.
#endif

//! \endcond

// Build - Include API
// ===================

#include <zipcore/core/api.h>
#include <zipcore/core/api-internal_p.h>

#endif // ZIPCORE_CORE_API_BUILD_P_H_INCLUDED
