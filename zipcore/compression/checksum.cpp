// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zipcore/core/api-build_p.h>
#include <zipcore/compression/checksum_p.h>

namespace zc::Compression::Checksum {

// zc::Compression::Checksum - CRC32 Table
// =======================================

// Reflected CRC32 polynomial (IEEE 802.3), as used by ZIP, gzip and PNG.
static constexpr uint32_t kCrc32Polynomial = 0xEDB88320u;

static constexpr Crc32Table make_crc32_table() noexcept {
  Crc32Table table {};

  for (uint32_t i = 0; i < 256; i++) {
    uint32_t c = i;
    for (uint32_t k = 0; k < 8; k++) {
      c = (c & 1u) ? (c >> 1) ^ kCrc32Polynomial : (c >> 1);
    }
    table.data[i] = c;
  }

  return table;
}

const Crc32Table crc32_table = make_crc32_table();

// zc::Compression::Checksum - CRC32
// =================================

uint32_t ZC_CDECL crc32_update(uint32_t checksum, const uint8_t* data, size_t size) noexcept {
  // Process 4 bytes at a time while there is enough input, the rest byte by byte.
  while (size >= 4u) {
    checksum = crc32_update_byte(checksum, data[0]);
    checksum = crc32_update_byte(checksum, data[1]);
    checksum = crc32_update_byte(checksum, data[2]);
    checksum = crc32_update_byte(checksum, data[3]);

    data += 4;
    size -= 4;
  }

  while (size) {
    checksum = crc32_update_byte(checksum, *data++);
    size--;
  }

  return checksum;
}

uint32_t ZC_CDECL crc32(const uint8_t* data, size_t size) noexcept {
  return crc32_finalize(crc32_update(kCrc32Initial, data, size));
}

// zc::Compression::Checksum - Adler32
// ===================================

uint32_t ZC_CDECL adler32_update(uint32_t checksum, const uint8_t* data, size_t size) noexcept {
  uint32_t s1 = checksum & 0xFFFFu;
  uint32_t s2 = checksum >> 16;

  while (size) {
    size_t n = zc_min<size_t>(size, kAdler32MaxBytesPerChunk);
    size -= n;

    while (n >= 4u) {
      s1 += data[0]; s2 += s1;
      s1 += data[1]; s2 += s1;
      s1 += data[2]; s2 += s1;
      s1 += data[3]; s2 += s1;

      data += 4;
      n -= 4;
    }

    while (n) {
      s1 += *data++;
      s2 += s1;
      n--;
    }

    s1 %= kAdler32Divisor;
    s2 %= kAdler32Divisor;
  }

  return (s2 << 16) | s1;
}

uint32_t ZC_CDECL adler32(const uint8_t* data, size_t size) noexcept {
  return adler32_update(kAdler32Initial, data, size);
}

} // {zc::Compression::Checksum}
