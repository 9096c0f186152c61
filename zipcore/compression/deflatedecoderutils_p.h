// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_COMPRESSION_DEFLATEDECODERUTILS_P_H_INCLUDED
#define ZIPCORE_COMPRESSION_DEFLATEDECODERUTILS_P_H_INCLUDED

#include <zipcore/core/api-internal_p.h>
#include <zipcore/compression/deflatedecoder_p.h>
#include <zipcore/support/intops_p.h>

//! \cond INTERNAL

namespace zc::Compression::Deflate::DecoderUtils {
namespace {

template<typename T>
ZC_INLINE_NODEBUG uint32_t mask32(const T& n) noexcept { return uint32_t((uint64_t(1) << n) - 1u); }

ZC_INLINE_NODEBUG uint32_t extract_n(uint64_t src, size_t n) noexcept { return uint32_t(src) & mask32(uint32_t(n)); }

ZC_INLINE_NODEBUG bool is_literal(DecodeEntry e) noexcept { return (e.value & DecodeEntry::kLiteralFlag) != 0u; }
ZC_INLINE_NODEBUG bool is_off_or_len(DecodeEntry e) noexcept { return (e.value & DecodeEntry::kOffOrLenFlag) != 0u; }
ZC_INLINE_NODEBUG bool is_end_of_block(DecodeEntry e) noexcept { return (e.value & DecodeEntry::kEndOfBlockFlag) != 0u; }
ZC_INLINE_NODEBUG bool is_end_of_block_invalid(DecodeEntry e) noexcept { return (e.value & DecodeEntry::kEndOfBlockInvalidFlag) != 0u; }

// Extracts a field from DecodeEntry.
template<uint32_t kOffset, uint32_t kNBits>
ZC_INLINE_NODEBUG uint32_t extract_field(DecodeEntry e) noexcept { return (e.value >> kOffset) & mask32(kNBits); }

ZC_INLINE_NODEBUG uint32_t base_length(DecodeEntry e) noexcept { return extract_field<DecodeEntry::kBaseLengthOffset, DecodeEntry::kBaseLengthNBits>(e); }
ZC_INLINE_NODEBUG uint32_t full_length(DecodeEntry e) noexcept { return extract_field<DecodeEntry::kFullLengthOffset, DecodeEntry::kFullLengthNBits>(e); }
ZC_INLINE_NODEBUG uint32_t payload_field(DecodeEntry e) noexcept { return extract_field<DecodeEntry::kPayloadOffset, DecodeEntry::kPayloadNBits>(e); }

ZC_INLINE_NODEBUG uint32_t precode_value(DecodeEntry e) noexcept { return extract_field<DecodeEntry::kPrecodeValueOffset, DecodeEntry::kPrecodeValueNBits>(e); }
ZC_INLINE_NODEBUG uint32_t precode_repeat(DecodeEntry e) noexcept { return extract_field<DecodeEntry::kPrecodeRepeatOffset, DecodeEntry::kPrecodeRepeatNBits>(e); }

// Extra bits of an entry are the bits between its base length and full length.
ZC_INLINE_NODEBUG uint32_t extract_extra(uint64_t src, DecodeEntry e) noexcept { return extract_n(src, full_length(e)) >> base_length(e); }

} // {anonymous}
} // {zc::Compression::Deflate::DecoderUtils}

// zc::Compression::Deflate - Decoder Bits
// =======================================

namespace zc::Compression::Deflate {
namespace {

struct DecoderTableMask {
  uint32_t _mask;

  ZC_INLINE_NODEBUG explicit DecoderTableMask(uint32_t bitlen) noexcept
    : _mask(DecoderUtils::mask32(bitlen)) {}

  ZC_INLINE_NODEBUG uint32_t extract_index(uint64_t bits) const noexcept {
    return uint32_t(bits) & _mask;
  }
};

//! Bit accumulator of the decoder.
//!
//! The accumulator is always 64-bit, even on 32-bit targets. It's refilled byte by byte up to 56 bits, which is
//! enough to hold a complete match (length codeword with its extra bits followed by an offset codeword with its
//! extra bits), so a match is never split across input chunks.
struct DecoderBits {
  uint64_t bit_word {};
  size_t bit_length {};

  ZC_INLINE_NODEBUG void reset() noexcept {
    bit_word = 0;
    bit_length = 0;
  }

  ZC_INLINE_NODEBUG void load_state(const Decoder* ctx) noexcept {
    bit_word = ctx->_bit_word;
    bit_length = ctx->_bit_length;
  }

  ZC_INLINE_NODEBUG void store_state(Decoder* ctx) const noexcept {
    ctx->_bit_word = bit_word;
    ctx->_bit_length = bit_length;
  }

  ZC_INLINE_NODEBUG size_t length() const noexcept { return bit_length; }
  ZC_INLINE_NODEBUG bool is_empty() const noexcept { return bit_length == 0; }

  ZC_INLINE_NODEBUG bool can_refill_byte() const noexcept { return bit_length <= 56u; }

  ZC_INLINE_NODEBUG void refill_byte(uint8_t b) noexcept {
    ZC_ASSERT(can_refill_byte());

    bit_word |= uint64_t(b) << bit_length;
    bit_length += 8;
  }

  template<size_t Index = 0>
  ZC_INLINE_NODEBUG uint32_t extract(size_t n) const noexcept {
    return DecoderUtils::extract_n(bit_word >> Index, n);
  }

  ZC_INLINE_NODEBUG uint32_t extract(DecoderTableMask msk) const noexcept {
    return msk.extract_index(bit_word);
  }

  ZC_INLINE_NODEBUG uint32_t extract_extra(DecodeEntry entry) const noexcept {
    return DecoderUtils::extract_extra(bit_word, entry);
  }

  ZC_INLINE_NODEBUG uint32_t operator&(uint32_t mask) const noexcept {
    return uint32_t(bit_word) & mask;
  }

  ZC_INLINE_NODEBUG void consumed(size_t n) noexcept {
    ZC_ASSERT(n <= bit_length);

    bit_word >>= n;
    bit_length -= n;
  }

  ZC_INLINE_NODEBUG bool is_byte_aligned() const noexcept { return (bit_length & 0x7u) == 0u; }
  ZC_INLINE_NODEBUG void make_byte_aligned() noexcept { consumed(bit_length & 0x7u); }
};

} // {anonymous}
} // {zc::Compression::Deflate}

//! \endcond

#endif // ZIPCORE_COMPRESSION_DEFLATEDECODERUTILS_P_H_INCLUDED
