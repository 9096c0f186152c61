// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_COMPRESSION_DEFLATEENCODERUTILS_P_H_INCLUDED
#define ZIPCORE_COMPRESSION_DEFLATEENCODERUTILS_P_H_INCLUDED

#include <zipcore/core/api-internal_p.h>
#include <zipcore/compression/deflatedefs_p.h>
#include <zipcore/support/intops_p.h>
#include <zipcore/support/memops_p.h>
#include <zipcore/support/ptrops_p.h>

//! \cond INTERNAL

namespace zc::Compression::Deflate {

// Bits are flushed a machine word at a time, so the output buffer must always have a machine word of padding.
static constexpr uint32_t kMinOutputBufferPadding = sizeof(ZCBitWord);

namespace {

static constexpr bool can_buffer_n(size_t n) noexcept { return n + 7 < IntOps::bit_size_of<ZCBitWord>(); }

//! Output buffer, which the encoder writes to (byte granularity).
struct OutputBuffer {
  //! Pointer to the beginning of the output buffer.
  uint8_t* begin;
  //! Current pointer in the output buffer (points to the position where a next byte will be written).
  uint8_t* ptr;
  //! End of the output buffer excluding the padding.
  uint8_t* end;

  ZC_INLINE_NODEBUG void init(uint8_t* output, size_t size) noexcept {
    ZC_ASSERT(size >= kMinOutputBufferPadding);
    begin = output;
    ptr = output;
    end = output + size - kMinOutputBufferPadding;
  }

  ZC_INLINE_NODEBUG bool can_write() const noexcept { return ptr < end; }

  ZC_INLINE_NODEBUG size_t byte_offset() const noexcept { return PtrOps::byte_offset(begin, ptr); }
  ZC_INLINE_NODEBUG size_t remaining_bytes() const noexcept { return PtrOps::bytes_until(ptr, end); }
};

//! Bit-buffer used by the output stream.
//!
//! The bit-buffer never holds more than `bit_size_of<ZCBitWord>() - 1` bits, because shifting by the full width
//! of a machine word is undefined behavior.
struct OutputBits {
  //! Bits to flush.
  ZCBitWord bit_word;
  //! Number of bits in `bit_word`.
  size_t bit_length;

  ZC_INLINE_NODEBUG size_t length() const noexcept { return bit_length; }
  ZC_INLINE_NODEBUG bool is_empty() const noexcept { return bit_length == 0; }
  ZC_INLINE_NODEBUG bool was_properly_flushed() const noexcept { return bit_length <= 7 && (bit_word >> bit_length) == 0; }

  template<typename T>
  ZC_INLINE_NODEBUG void add(const T& bits, size_t count) noexcept {
    ZC_ASSERT(bit_length + count < IntOps::bit_size_of<ZCBitWord>());

    bit_word |= ZCBitWord(bits) << bit_length;
    bit_length += count;
  }

  ZC_INLINE_NODEBUG void align_to_bytes() noexcept {
    bit_length = (bit_length + 7u) & ~size_t(7);
  }

  ZC_INLINE_NODEBUG void flush(OutputBuffer& buffer) noexcept {
    size_t n = bit_length / 8u;
    ZC_ASSERT(buffer.can_write());

    if constexpr (MemOps::kUnalignedMemIO) {
      MemOps::storeu_le(buffer.ptr, bit_word);
      buffer.ptr += n;

      // Shifting by the full word width is not allowed, `n` can be `sizeof(ZCBitWord) - 1` at most here.
      bit_word >>= n * 8u;
      bit_length &= 7;
    }
    else {
      while (n) {
        buffer.ptr[0] = uint8_t(bit_word & 0xFFu);
        buffer.ptr++;
        bit_word >>= 8;
        n--;
      }
      bit_length &= 7;
    }
  }

  template<size_t kN>
  ZC_INLINE_NODEBUG void flush_if_cannot_buffer_n(OutputBuffer& buffer) noexcept {
    if constexpr (!can_buffer_n(kN)) {
      flush(buffer);
    }
  }

  ZC_INLINE_NODEBUG void flush_final_byte(OutputBuffer& buffer) noexcept {
    if (!is_empty()) {
      ZC_ASSERT(length() <= 7u);
      buffer.ptr[0] = uint8_t(bit_word & 0xFFu);
      buffer.ptr++;

      bit_word = 0;
      bit_length = 0;
    }
  }
};

//! Output stream combines `OutputBits` and `OutputBuffer` - so it offers both bit & byte granularity.
struct OutputStream {
  OutputBits bits;
  OutputBuffer buffer;
};

} // {anonymous}
} // {zc::Compression::Deflate}

//! \endcond

#endif // ZIPCORE_COMPRESSION_DEFLATEENCODERUTILS_P_H_INCLUDED
