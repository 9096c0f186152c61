// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zipcore/core/api-build_p.h>
#include <zipcore/core/runtime.h>
#include <zipcore/core/trace_p.h>

// ZCDebugTrace - Log
// ==================

void ZCDebugTrace::log(uint32_t severity, uint32_t indentation, const char* fmt, ...) noexcept {
  const char* prefix = "";
  if (indentation < 0xFFFFFFFFu) {
    switch (severity) {
      case 1: prefix = "[WARN] "; break;
      case 2: prefix = "[FAIL] "; break;
    }
    zc_runtime_message_fmt("%*s%s", int(indentation * 2), "", prefix);
  }

  va_list ap;
  va_start(ap, fmt);
  zc_runtime_message_vfmt(fmt, ap);
  va_end(ap);
}
