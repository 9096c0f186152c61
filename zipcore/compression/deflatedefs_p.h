// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_COMPRESSION_DEFLATEDEFS_P_H_INCLUDED
#define ZIPCORE_COMPRESSION_DEFLATEDEFS_P_H_INCLUDED

#include <zipcore/core/api-internal_p.h>

//! \cond INTERNAL

namespace zc::Compression::Deflate {

//! Container of a DEFLATE stream.
enum class FormatType : uint32_t {
  //! Raw DEFLATE stream (used by ZIP entries).
  kRaw,
  //! DEFLATE stream wrapped by a 2-byte Zlib header and ADLER32 trailer.
  kZlib
};

//! Block type.
enum class BlockType : uint32_t {
  kUncompressed = 0,
  kStaticHuffman = 1,
  kDynamicHuffman = 2
};

//! Minimum supported match length (in bytes).
static constexpr uint32_t kMinMatchLen = 3;
//! Maximum supported match length (in bytes).
static constexpr uint32_t kMaxMatchLen = 258;

//! Minimum supported match offset (in bytes).
static constexpr uint32_t kMinMatchOffset = 1;
//! Maximum supported match offset (in bytes).
static constexpr uint32_t kMaxMatchOffset = 32768;

//! Maximum window size.
static constexpr uint32_t kMaxWindowSize = 32768;

// Number of symbols in each Huffman code.
//
// NOTE for the literal/length and offset codes, these are actually the maximum values; a given block might use
// fewer symbols.
static constexpr uint32_t kNumPrecodeSymbols = 19;
static constexpr uint32_t kNumLitLenSymbols = 288;
static constexpr uint32_t kNumOffsetSymbols = 32;

// Division of symbols in the literal/length code.
static constexpr uint32_t kNumLiterals = 256;
static constexpr uint32_t kEndOfBlock = 256;
static constexpr uint32_t kFirstLengthSymbol = 257;
static constexpr uint32_t kNumLengthSymbols = 31;

//! The maximum number of symbols across all codes.
static constexpr uint32_t kMaxSymbolCount = zc_max(zc_max(kNumPrecodeSymbols, kNumLitLenSymbols), kNumOffsetSymbols);

// Maximum codeword length, in bits, within each Huffman code.
static constexpr uint32_t kMaxPreCodeWordLen = 7;
static constexpr uint32_t kMaxLitLenCodeWordLen = 15;
static constexpr uint32_t kMaxOffsetCodeWordLen = 15;

//! The maximum codeword length across all codes.
static constexpr uint32_t kMaxCodeWordLen = 15;

// Maximum number of extra bits that may be required to represent a match length.
static constexpr uint32_t kMaxExtraLengthBits = 5;
// Maximum number of extra bits that may be required to represent a match offset.
static constexpr uint32_t kMaxExtraOffsetBits = 13;

//! Maximum possible overrun when decoding codeword lengths.
static constexpr uint32_t kMaxLensOverrun = 137;

//! Highest compression level the encoder distinguishes, higher levels are clamped to it.
static constexpr uint32_t kMaxCompressionLevel = 9;

//! Compression level used when `ZC_COMPRESSION_LEVEL_DEFAULT` is passed.
static constexpr uint32_t kDefaultCompressionLevel = 6;

// The order in which precode lengths are stored.
ZC_HIDDEN extern const uint8_t kPrecodeLensPermutation[kNumPrecodeSymbols];

#define ZC_DIV_ROUND_UP(n, d)  (((n) + (d) - 1) / (d))

static ZC_INLINE uint32_t loaded_u32_to_u24(uint32_t v) noexcept {
  return ZC_BYTE_ORDER == 1234 ? v & 0xFFFFFFu : v >> 8;
}

//! Translates a public compression level (see `ZCCompressionLevel`) into an encoder level in `[0, 9]` range.
//!
//! Returns `ZC_ERROR_INVALID_PARAMETER` if the level is neither the default sentinel nor within `[0, 10]`.
static ZC_INLINE ZCResult resolve_compression_level(int32_t level, uint32_t* level_out) noexcept {
  if (level == ZC_COMPRESSION_LEVEL_DEFAULT) {
    *level_out = kDefaultCompressionLevel;
    return ZC_SUCCESS;
  }

  if (ZC_UNLIKELY(level < 0 || level > ZC_COMPRESSION_LEVEL_UBER)) {
    return zc_make_error(ZC_ERROR_INVALID_PARAMETER);
  }

  *level_out = zc_min(uint32_t(level), kMaxCompressionLevel);
  return ZC_SUCCESS;
}

} // {zc::Compression::Deflate}

//! \endcond

#endif // ZIPCORE_COMPRESSION_DEFLATEDEFS_P_H_INCLUDED
