// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_COMPRESSION_CHECKSUM_P_H_INCLUDED
#define ZIPCORE_COMPRESSION_CHECKSUM_P_H_INCLUDED

#include <zipcore/core/api-internal_p.h>

//! \cond INTERNAL

namespace zc::Compression::Checksum {

struct Crc32Table {
  uint32_t data[256];
};

ZC_HIDDEN extern const Crc32Table crc32_table;

// Initial value used by CRC32 checksum.
static constexpr uint32_t kCrc32Initial = 0xFFFFFFFFu;

// Initial value used by ADLER32 checksum.
static constexpr uint32_t kAdler32Initial = 0x00000001u;

// The Adler32 divisor - highest prime that fits into 16 bits.
static constexpr uint32_t kAdler32Divisor = 65521u;

// kAdler32MaxBytesPerChunk is the most bytes that can be processed without the possibility of s2 overflowing when
// it is represented as an unsigned 32-bit integer. To get the correct worst-case value, we must assume that every
// byte in the input equals 0xFF and that s1 and s2 started with the highest possible values modulo the divisor.
static constexpr uint32_t kAdler32MaxBytesPerChunk = 5552u;

namespace {
static ZC_INLINE uint32_t crc32_update_byte(uint32_t checksum, uint8_t b) noexcept { return (checksum >> 8) ^ crc32_table.data[(checksum ^ b) & 0xFFu]; }
static ZC_INLINE uint32_t crc32_finalize(uint32_t checksum) noexcept { return ~checksum; }
} // {anonymous}

//! Calculates a finalized CRC32 of `data`.
ZC_HIDDEN uint32_t ZC_CDECL crc32(const uint8_t* data, size_t size) noexcept;

//! Updates a running (not finalized) CRC32 `checksum`, which must start as `kCrc32Initial`.
ZC_HIDDEN uint32_t ZC_CDECL crc32_update(uint32_t checksum, const uint8_t* data, size_t size) noexcept;

//! Calculates ADLER32 of `data`.
ZC_HIDDEN uint32_t ZC_CDECL adler32(const uint8_t* data, size_t size) noexcept;

//! Updates ADLER32 `checksum`, which must start as `kAdler32Initial`.
ZC_HIDDEN uint32_t ZC_CDECL adler32_update(uint32_t checksum, const uint8_t* data, size_t size) noexcept;

//! Incremental CRC32 calculator used by readers and writers that see data in chunks.
class Crc32Accumulator {
public:
  uint32_t _state = kCrc32Initial;

  ZC_INLINE_NODEBUG void reset() noexcept { _state = kCrc32Initial; }
  ZC_INLINE_NODEBUG void update(const uint8_t* data, size_t size) noexcept { _state = crc32_update(_state, data, size); }
  ZC_INLINE_NODEBUG uint32_t value() const noexcept { return crc32_finalize(_state); }
};

} // {zc::Compression::Checksum}

//! \endcond

#endif // ZIPCORE_COMPRESSION_CHECKSUM_P_H_INCLUDED
