// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// Based on code written in 2014-2016 by Eric Biggers <ebiggers3@gmail.com>
//
// To the extent possible under law, the author(s) have dedicated all copyright
// and related and neighboring rights to this software to the public domain
// worldwide. This software is distributed without any warranty.
//
// You should have received a copy of the CC0 Public Domain Dedication along
// with this software. If not, see <http://creativecommons.org/publicdomain/zero/1.0/>.

#include <zipcore/core/api-build_p.h>
#include <zipcore/compression/checksum_p.h>
#include <zipcore/compression/deflatedefs_p.h>
#include <zipcore/compression/deflateencoder_p.h>
#include <zipcore/compression/deflateencoderutils_p.h>
#include <zipcore/compression/matchfinder_p.h>
#include <zipcore/support/intops_p.h>
#include <zipcore/support/ptrops_p.h>

#include <stddef.h>
#include <stdlib.h>
#include <string.h>

namespace zc::Compression::Deflate {

// zc::Compression::Deflate::Encoder - Options & Settings
// ======================================================

// One is subtracted from this table, which then forms the real value.
static constexpr uint8_t kMinimumInputSizeToCompress[kMaxCompressionLevel + 1] = {
  0,      // Level #0 (underflows to SIZE_MAX when 1 is subtracted when it's zero extended to size_t).
  1 + 60, // Level #1
  1 + 55, // Level #2
  1 + 50, // Level #3
  1 + 45, // Level #4
  1 + 40, // Level #5
  1 + 35, // Level #6
  1 + 30, // Level #7
  1 + 25, // Level #8
  1 + 20  // Level #9
};

struct EncoderCompressionOptions {
  uint16_t max_search_depth;
  uint16_t nice_match_length;
};

static constexpr EncoderCompressionOptions kEncoderCompressionOptions[kMaxCompressionLevel + 1] = {
  // MaxDepth | NiceMatchLength
  {         0 ,               0 }, // Compression level #00 (Store).

  {         2 ,               8 }, // Compression level #01 (Greedy).
  {         6 ,              10 }, // Compression level #02 (Greedy).
  {        12 ,              14 }, // Compression level #03 (Greedy).
  {        16 ,              30 }, // Compression level #04 (Greedy).

  {        16 ,              30 }, // Compression level #05 (Lazy).
  {        35 ,              65 }, // Compression level #06 (Lazy).
  {       100 ,             130 }, // Compression level #07 (Lazy).
  {       256 ,             160 }, // Compression level #08 (Lazy).
  {       512 ,             258 }  // Compression level #09 (Lazy).
};

// zc::Compression::Deflate::Encoder - Constants
// =============================================

// The compressor always chooses a block of at least kEncoderMinBlockLength bytes, except if the last block has
// to be shorter.
static constexpr uint32_t kEncoderMinBlockLength = 10000u;

// The compressor attempts to end blocks after kEncoderSoftMaxBlockLength bytes, but the final length might be
// slightly longer due to matches extending beyond this limit.
static constexpr uint32_t kEncoderSoftMaxBlockLength = 300000u;

// The number of observed matches or literals that represents sufficient data to decide whether the current block
// should be terminated or not.
static constexpr uint32_t kEncoderNumObservationsPerBlockCheck = 512u;

// Compressor-side limit of litlen codeword lengths, lower than the format's limit so more codewords can be
// buffered before flushing.
static constexpr uint32_t kEncoderMaxLitlenCodewordLen = 14;

// zc::Compression::Deflate::Encoder - Tables
// ==========================================

static const uint8_t kDeflateMinOutputSizeByFormat[] = {
  0,    // RAW  - no extra size.
  2 + 4 // ZLIB - 2 bytes header and 4 bytes ADLER32 checksum.
};

static const uint8_t kDeflateExtraPrecodeBitCount[kNumPrecodeSymbols] = {
  0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 2, 3, 7
};

// Length slot => length slot base value.
static const uint32_t kEncoderLengthSlotBase[29] = {
  3   , 4   , 5   , 6   , 7   , 8   , 9   , 10  ,
  11  , 13  , 15  , 17  , 19  , 23  , 27  , 31  ,
  35  , 43  , 51  , 59  , 67  , 83  , 99  , 115 ,
  131 , 163 , 195 , 227 , 258
};

// Length slot => number of extra length bits.
static const uint8_t kEncoderExtraLengthBitCount[29] = {
  0   , 0   , 0   , 0   , 0   , 0   , 0   , 0 ,
  1   , 1   , 1   , 1   , 2   , 2   , 2   , 2 ,
  3   , 3   , 3   , 3   , 4   , 4   , 4   , 4 ,
  5   , 5   , 5   , 5   , 0
};

// Length => Length slot.
static const uint8_t kEncoderLengthSlotLUT[kMaxMatchLen + 1] = {
  0, 0, 0, 0, 1, 2, 3, 4, 5, 6, 7, 8, 8, 9, 9, 10, 10, 11, 11, 12, 12, 12,
  12, 13, 13, 13, 13, 14, 14, 14, 14, 15, 15, 15, 15, 16, 16, 16, 16, 16,
  16, 16, 16, 17, 17, 17, 17, 17, 17, 17, 17, 18, 18, 18, 18, 18, 18, 18,
  18, 19, 19, 19, 19, 19, 19, 19, 19, 20, 20, 20, 20, 20, 20, 20, 20, 20,
  20, 20, 20, 20, 20, 20, 20, 21, 21, 21, 21, 21, 21, 21, 21, 21, 21, 21,
  21, 21, 21, 21, 21, 22, 22, 22, 22, 22, 22, 22, 22, 22, 22, 22, 22, 22,
  22, 22, 22, 23, 23, 23, 23, 23, 23, 23, 23, 23, 23, 23, 23, 23, 23, 23,
  23, 24, 24, 24, 24, 24, 24, 24, 24, 24, 24, 24, 24, 24, 24, 24, 24, 24,
  24, 24, 24, 24, 24, 24, 24, 24, 24, 24, 24, 24, 24, 24, 24, 25, 25, 25,
  25, 25, 25, 25, 25, 25, 25, 25, 25, 25, 25, 25, 25, 25, 25, 25, 25, 25,
  25, 25, 25, 25, 25, 25, 25, 25, 25, 25, 25, 26, 26, 26, 26, 26, 26, 26,
  26, 26, 26, 26, 26, 26, 26, 26, 26, 26, 26, 26, 26, 26, 26, 26, 26, 26,
  26, 26, 26, 26, 26, 26, 26, 27, 27, 27, 27, 27, 27, 27, 27, 27, 27, 27,
  27, 27, 27, 27, 27, 27, 27, 27, 27, 27, 27, 27, 27, 27, 27, 27, 27, 27,
  27, 27, 28
};

// Offset slot => offset slot base value.
static constexpr uint32_t kEncoderOffsetSlotBase[30] = {
  1    , 2    , 3    , 4     , 5     , 7     , 9     , 13    ,
  17   , 25   , 33   , 49    , 65    , 97    , 129   , 193   ,
  257  , 385  , 513  , 769   , 1025  , 1537  , 2049  , 3073  ,
  4097 , 6145 , 8193 , 12289 , 16385 , 24577
};

// Offset slot => number of extra offset bits.
static const uint8_t kEncoderExtraOffsetBitCount[30] = {
  0    , 0    , 0    , 0     , 1     , 1     , 2     , 2     ,
  3    , 3    , 4    , 4     , 5     , 5     , 6     , 6     ,
  7    , 7    , 8    , 8     , 9     , 9     , 10    , 10    ,
  11   , 11   , 12   , 12    , 13    , 13
};

// Table: 'offset - 1 => offset_slot' for offset <= 256.
struct OffsetSlotTable {
  uint8_t data[256];
};

static constexpr OffsetSlotTable make_offset_slot_table() noexcept {
  OffsetSlotTable table {};
  uint32_t slot = 0;

  for (uint32_t offset = 1; offset <= 256; offset++) {
    while (slot + 1 < 16 && offset >= kEncoderOffsetSlotBase[slot + 1])
      slot++;
    table.data[offset - 1] = uint8_t(slot);
  }

  return table;
}

static constexpr OffsetSlotTable kEncoderOffsetSlotLUT = make_offset_slot_table();

// Offset => Offset Slot.
static ZC_INLINE uint32_t deflate_get_offset_slot(uint32_t offset) noexcept {
  // 1 <= offset <= 32768 here. For 1 <= offset <= 256, kEncoderOffsetSlotLUT[offset - 1] gives the slot.
  //
  // For 257 <= offset <= 32768, slot 16 begins at 257 and each slot in [16, 30) is exactly 128 times larger than
  // each slot in [2, 16), because the number of extra bits increases by 1 every 2 slots. Thus, the slot is:
  //
  //   kEncoderOffsetSlotLUT[(offset - 1) >> 7] + 14
  //
  // Any offset is handled by 'kEncoderOffsetSlotLUT[(offset - 1) >> n] + (n << 1)' where `n` is 0 for offsets
  // up to 256 and 7 otherwise, which equals to '(256 - offset) >> 29' for all valid offsets.
  uint32_t n = (256 - offset) >> 29;
  return kEncoderOffsetSlotLUT.data[(offset - 1) >> n] + (n << 1);
}

// zc::Compression::Deflate::Encoder - Structs
// ===========================================

//! Codewords for the DEFLATE Huffman codes.
struct CodeWords {
  uint32_t litlen[kNumLitLenSymbols];
  uint32_t offset[kNumOffsetSymbols];
};

//! Codeword lengths (in bits) for the DEFLATE Huffman codes.
//!
//! A zero length means the corresponding symbol had zero frequency.
struct Lens {
  uint8_t litlen[kNumLitLenSymbols];
  uint8_t offset[kNumOffsetSymbols];
};

//! Codewords and lengths for the DEFLATE Huffman codes.
struct Codes {
  CodeWords codewords;
  Lens lens;
};

//! Symbol frequency counters for the DEFLATE Huffman codes.
struct Freqs {
  uint32_t litlen[kNumLitLenSymbols];
  uint32_t offset[kNumOffsetSymbols];
};

//! A run of literals followed by a match or end-of-block.
//!
//! Items chosen by the parser are stored temporarily, because they cannot be written until all items of the block
//! have been chosen and the block's Huffman codes have been computed.
struct Sequence {
  // Bits 0..22: the number of literals in this run. Literals are not stored, they are read from the input.
  // Bits 23..31: the length of the match which follows the literals, or 0 if this is the last run in the block.
  uint32_t litrunlen_and_length;

  //! Offset of the match which follows the literals.
  uint16_t offset;
  //! Offset symbol of the match which follows the literals.
  uint8_t offset_symbol;
  //! Length slot of the match which follows the literals.
  uint8_t length_slot;
};

// Block split statistics. See "Block Splitting" below.
static constexpr uint32_t kNumLiteralObservationTypes = 8u;
static constexpr uint32_t kNumMatchObservationTypes = 2u;
static constexpr uint32_t kNumObservationTypes = kNumLiteralObservationTypes + kNumMatchObservationTypes;

struct BlockSplitStats {
  uint32_t new_observations[kNumObservationTypes];
  uint32_t observations[kNumObservationTypes];
  uint32_t num_new_observations;
  uint32_t num_observations;
};

// zc::Compression::Deflate::Encoder - Encoder Impl
// ================================================

// Deflate encoder implementation.
struct EncoderImpl {
  using CompressFunc = size_t (ZC_CDECL*)(EncoderImpl* impl, const uint8_t*, size_t, uint8_t*, size_t) noexcept;

  //! The pointer, which must be freed in order to free the Impl, because of an alignment requirement of Impl.
  void* allocated_ptr;

  // Format type.
  FormatType format;
  // The compression level with which this compressor was created.
  uint32_t compression_level;
  // Minimum input size to actually attempt to compress it (depends on compression level).
  size_t min_input_size;

  // Pointer to the compress() implementation (null if the encoder only emits uncompressed blocks).
  CompressFunc compress_func;

  // Frequency counters for the current block.
  Freqs freqs;
  // Dynamic Huffman codes for the current block.
  Codes codes;
  // Static Huffman codes.
  Codes static_codes;
  // Block split statistics for the currently pending block.
  BlockSplitStats split_stats;

  // If a match of this length is found, choose it immediately without further consideration.
  uint32_t nice_match_length;
  // Consider at most this many potential matches at each position.
  uint32_t max_search_depth;

  struct Precode {
    uint32_t freqs[kNumPrecodeSymbols];
    uint8_t lens[kNumPrecodeSymbols];
    uint32_t codewords[kNumPrecodeSymbols];
    uint32_t items[kNumLitLenSymbols + kNumOffsetSymbols];
    uint32_t litlen_symbol_count;
    uint32_t offset_symbol_count;
    uint32_t explicit_len_count;
    uint32_t item_count;
  };

  // Temporary space for Huffman code output.
  Precode precode;
};

//! Encoder implementation used by greedy and lazy parsers, which both use hash chains matchfinder.
struct HcEncoderImpl : public EncoderImpl {
  HcMatchFinder hc_mf;

  // The matches and literals that the parser has chosen for the current block. The length of this array is
  // limited by the maximum number of matches that can be chosen for a single block, plus one for the special
  // entry at the end.
  Sequence sequences[ZC_DIV_ROUND_UP(kEncoderSoftMaxBlockLength, kMinMatchLen) + 1];
};

// zc::Compression::Deflate::Encoder - Heap
// ========================================

// Given the binary tree node A[subtree_idx] whose children already satisfy the maxheap property, swap the node with
// its greater child until it is greater than both its children.
static void heapify_subtree(uint32_t* A, uint32_t length, uint32_t subtree_idx) noexcept {
  uint32_t v = A[subtree_idx];
  uint32_t parent_idx = subtree_idx;
  uint32_t child_idx;

  while ((child_idx = parent_idx * 2) <= length) {
    if (child_idx < length && A[child_idx + 1] > A[child_idx])
      child_idx++;
    if (v >= A[child_idx])
      break;
    A[parent_idx] = A[child_idx];
    parent_idx = child_idx;
  }
  A[parent_idx] = v;
}

// Rearrange the array 'A' so that it satisfies the maxheap property. 'A' uses 1-based indices.
static void heapify_array(uint32_t* A, uint32_t length) noexcept {
  for (uint32_t subtree_idx = length / 2; subtree_idx >= 1; subtree_idx--) {
    heapify_subtree(A, length, subtree_idx);
  }
}

static void heap_sort(uint32_t* A, uint32_t length) noexcept {
  A--; // Use 1-based indices.

  heapify_array(A, length);

  while (length >= 2) {
    uint32_t tmp = A[length];
    A[length] = A[1];
    A[1] = tmp;
    length--;
    heapify_subtree(A, length, 1);
  }
}

// zc::Compression::Deflate::Encoder - Huffman Tree Building
// =========================================================

static constexpr uint32_t kNumSymbolBits = 10;
static constexpr uint32_t kSymbolMask = (1u << kNumSymbolBits) - 1u;

// Sorts the symbols primarily by frequency and secondarily by symbol value. Symbols with zero frequency are
// discarded (and get zero codeword length), the remaining ones are stored to `symout` with the symbol value in
// low `kNumSymbolBits` bits and the frequency in the remaining bits.
//
// Returns the number of symbols that have nonzero frequency.
static uint32_t sort_symbols(uint32_t num_syms, const uint32_t* ZC_RESTRICT freqs, uint8_t* ZC_RESTRICT lens, uint32_t* ZC_RESTRICT symout) noexcept {
  uint32_t sym;

  uint32_t num_counters = num_syms;
  uint32_t counters[kMaxSymbolCount] {};

  for (sym = 0; sym < num_syms; sym++)
    counters[zc_min(freqs[sym], num_counters - 1)]++;

  // Make the counters cumulative, ignoring the zero-th, which counted symbols with zero frequency.
  uint32_t num_used_syms = 0;
  for (uint32_t i = 1; i < num_counters; i++) {
    uint32_t count = counters[i];
    counters[i] = num_used_syms;
    num_used_syms += count;
  }

  for (sym = 0; sym < num_syms; sym++) {
    uint32_t freq = freqs[sym];
    if (freq != 0)
      symout[counters[zc_min(freq, num_counters - 1)]++] = sym | (freq << kNumSymbolBits);
    else
      lens[sym] = 0;
  }

  // Sort the symbols counted in the last counter.
  heap_sort(symout + counters[num_counters - 2], counters[num_counters - 1] - counters[num_counters - 2]);

  return num_used_syms;
}

// Builds the non-leaf nodes of a Huffman tree in place.
//
// On input `A` contains `sym_count` (at least 2) entries sorted by increasing frequency (frequency is stored in
// bits above `kNumSymbolBits`). On output the first `sym_count - 1` entries are non-leaf nodes, `A[sym_count - 2]`
// being the root, and each node contains the index of its parent in bits above `kNumSymbolBits`. Low bits are
// kept as-is and have no relationship with the node occupying the slot.
static void build_tree(uint32_t* A, uint32_t sym_count) noexcept {
  uint32_t i = 0u; // Index of next lowest frequency symbol that has not yet been processed.
  uint32_t b = 0u; // Index of next lowest frequency parentless non-leaf node, or `e` if there is no such node.
  uint32_t e = 0u; // Index of next node to allocate as a non-leaf.

  do {
    uint32_t m = (i != sym_count && (b == e || (A[i] >> kNumSymbolBits) <= (A[b] >> kNumSymbolBits))) ? i++ : b++;
    uint32_t n = (i != sym_count && (b == e || (A[i] >> kNumSymbolBits) <= (A[b] >> kNumSymbolBits))) ? i++ : b++;

    // Linking a leaf visited for the first time has no effect, as it will be overwritten by a non-leaf later.
    uint32_t freq_shifted = (A[m] & ~kSymbolMask) + (A[n] & ~kSymbolMask);
    A[m] = (A[m] & kSymbolMask) | (e << kNumSymbolBits);
    A[n] = (A[n] & kSymbolMask) | (e << kNumSymbolBits);
    A[e] = (A[e] & kSymbolMask) | freq_shifted;
    e++;
  } while (sym_count - e > 1);
}

// Computes the number of codewords of each length from the tree built by build_tree(), limiting the lengths to
// `max_codeword_len`. The tree is destroyed (parent indexes are replaced by depths).
static void compute_length_counts(uint32_t* ZC_RESTRICT A, uint32_t root_idx, uint32_t* ZC_RESTRICT len_counts, uint32_t max_codeword_len) noexcept {
  for (uint32_t len = 0; len <= max_codeword_len; len++)
    len_counts[len] = 0;
  len_counts[1] = 2;

  // Set the root node's depth to 0.
  A[root_idx] &= kSymbolMask;

  // A parent always has a greater index than its children, so iterating in reverse visits parents first.
  for (int node = int(root_idx) - 1; node >= 0; node--) {
    uint32_t parent = A[node] >> kNumSymbolBits;
    uint32_t parent_depth = A[parent] >> kNumSymbolBits;
    uint32_t depth = parent_depth + 1;
    uint32_t len = depth;

    A[node] = (A[node] & kSymbolMask) | (depth << kNumSymbolBits);

    // Use the largest available length when the depth exceeds the limit. Not optimal, but good enough.
    if (len >= max_codeword_len) {
      len = max_codeword_len;
      do {
        len--;
      } while (len_counts[len] == 0);
    }

    // A non-leaf node at the current depth: one codeword less at `len`, two more at `len + 1`.
    len_counts[len]--;
    len_counts[len + 1] += 2;
  }
}

// Generates codewords of a canonical Huffman code.
static void gen_codewords(uint32_t* ZC_RESTRICT A, uint8_t* ZC_RESTRICT lens, const uint32_t* ZC_RESTRICT len_counts, uint32_t max_codeword_len, uint32_t num_syms) noexcept {
  // Assign lengths in decreasing order to the symbols sorted by increasing frequency.
  for (uint32_t i = 0, len = max_codeword_len; len >= 1; len--) {
    uint32_t count = len_counts[len];
    while (count--)
      lens[A[i++] & kSymbolMask] = uint8_t(len);
  }

  uint32_t next_codewords[kMaxCodeWordLen + 1];
  next_codewords[0] = 0;
  next_codewords[1] = 0;
  for (uint32_t len = 2; len <= max_codeword_len; len++) {
    next_codewords[len] = (next_codewords[len - 1] + len_counts[len - 1]) << 1;
  }

  for (uint32_t sym = 0; sym < num_syms; sym++) {
    A[sym] = next_codewords[lens[sym]]++;
  }
}

// zc::Compression::Deflate::Encoder - Huffman Code Building
// =========================================================

// Constructs a length-limited canonical Huffman code of `num_syms` symbols from their frequencies.
//
// Symbols with zero frequency get zero length. The symbols are first sorted by frequency, which allows building
// the tree without a heap. Only non-leaf nodes are built, in the same array the codewords are generated to, as
// they are sufficient to compute the number of codewords of each length.
static void make_canonical_huffman_code(uint32_t num_syms, uint32_t max_codeword_len, const uint32_t* ZC_RESTRICT freqs, uint8_t* ZC_RESTRICT lens, uint32_t* ZC_RESTRICT codewords) noexcept {
  ZC_STATIC_ASSERT(kMaxSymbolCount <= 1 << kNumSymbolBits);

  uint32_t num_used_syms = sort_symbols(num_syms, freqs, lens, codewords);

  // A complete Huffman code must contain at least 2 codewords. Some decoders reject codes with a single codeword
  // and older zlib rejects empty offset codes, so always generate 2 codewords of length 1: codeword '0' for
  // symbol 0 and codeword '1' for the used symbol if it's not 0, otherwise symbol 1.
  if (ZC_UNLIKELY(num_used_syms < 2u)) {
    uint32_t sym = num_used_syms ? (codewords[0] & kSymbolMask) : 0;
    uint32_t nonzero_idx = sym ? sym : 1;

    codewords[0] = 0;
    lens[0] = 1;
    codewords[nonzero_idx] = 1;
    lens[nonzero_idx] = 1;
    return;
  }

  build_tree(codewords, num_used_syms);

  uint32_t len_counts[kMaxCodeWordLen + 1];
  compute_length_counts(codewords, num_used_syms - 2, len_counts, max_codeword_len);
  gen_codewords(codewords, lens, len_counts, max_codeword_len, num_syms);
}

// Clears the Huffman symbol frequency counters, must be called when starting a new DEFLATE block.
static ZC_INLINE void reset_symbol_frequencies(EncoderImpl* impl) noexcept {
  memset(&impl->freqs, 0, sizeof(impl->freqs));
}

// Reverses the Huffman codeword 'codeword', which is 'len' bits in length.
static ZC_INLINE uint32_t reverse16_bit_code(uint32_t codeword, uint32_t len) noexcept {
  ZC_STATIC_ASSERT(kMaxCodeWordLen <= 16);

  codeword = ((codeword & 0x5555) << 1) | ((codeword & 0xAAAA) >> 1);
  codeword = ((codeword & 0x3333) << 2) | ((codeword & 0xCCCC) >> 2);
  codeword = ((codeword & 0x0F0F) << 4) | ((codeword & 0xF0F0) >> 4);
  codeword = ((codeword & 0x00FF) << 8) | ((codeword & 0xFF00) >> 8);

  // Return the high `len` bits of the bit-reversed 16-bit value.
  return codeword >> (16 - len);
}

// Makes a canonical Huffman code with bit-reversed codewords, as DEFLATE emits codewords starting from MSB.
static ZC_NOINLINE void deflate_make_huffman_code(
  uint32_t num_syms,
  uint32_t max_codeword_len,
  const uint32_t freqs[],
  uint8_t lens[],
  uint32_t codewords[]) noexcept {

  make_canonical_huffman_code(num_syms, max_codeword_len, freqs, lens, codewords);

  for (uint32_t sym = 0; sym < num_syms; sym++) {
    codewords[sym] = reverse16_bit_code(codewords[sym], lens[sym]);
  }
}

// Builds the literal/length and offset Huffman codes for a DEFLATE block.
static ZC_NOINLINE void deflate_make_huffman_codes(const Freqs* freqs, Codes* codes) noexcept {
  ZC_STATIC_ASSERT(kEncoderMaxLitlenCodewordLen <= kMaxLitLenCodeWordLen);

  deflate_make_huffman_code(kNumLitLenSymbols, kEncoderMaxLitlenCodewordLen, freqs->litlen, codes->lens.litlen, codes->codewords.litlen);
  deflate_make_huffman_code(kNumOffsetSymbols, kMaxOffsetCodeWordLen, freqs->offset, codes->lens.offset, codes->codewords.offset);
}

// Initializes impl->static_codes. Frequencies are chosen so the generated code matches the fixed DEFLATE code.
static ZC_NOINLINE void init_static_codes(EncoderImpl* impl) noexcept {
  uint32_t i;

  for (i = 0; i < 144; i++)
    impl->freqs.litlen[i] = 1 << (9 - 8);
  for (; i < 256; i++)
    impl->freqs.litlen[i] = 1 << (9 - 9);
  for (; i < 280; i++)
    impl->freqs.litlen[i] = 1 << (9 - 7);
  for (; i < 288; i++)
    impl->freqs.litlen[i] = 1 << (9 - 8);

  for (i = 0; i < 32; i++)
    impl->freqs.offset[i] = 1 << (5 - 5);

  deflate_make_huffman_codes(&impl->freqs, &impl->static_codes);
}

// Computes RLE items of codeword lengths. Each item holds a precode symbol in low 5 bits and its extra bits above.
static uint32_t deflate_compute_precode_items(
  const uint8_t* ZC_RESTRICT lens,
  const uint32_t num_lens,
  uint32_t* ZC_RESTRICT precode_freqs,
  uint32_t* ZC_RESTRICT precode_items) noexcept {

  uint32_t* itemptr = precode_items;
  uint32_t run_start = 0;

  memset(precode_freqs, 0, kNumPrecodeSymbols * sizeof(precode_freqs[0]));

  do {
    // The length being repeated.
    uint8_t len = lens[run_start];

    uint32_t run_end = run_start;
    do {
      run_end++;
    } while (run_end != num_lens && len == lens[run_end]);

    if (len == 0) {
      // Symbol 18: RLE 11 to 138 zeroes at a time.
      while ((run_end - run_start) >= 11) {
        uint32_t extra_bits = zc_min<uint32_t>((run_end - run_start) - 11, 0x7F);
        precode_freqs[18]++;
        *itemptr++ = 18 | (extra_bits << 5);
        run_start += 11 + extra_bits;
      }

      // Symbol 17: RLE 3 to 10 zeroes at a time.
      if ((run_end - run_start) >= 3) {
        uint32_t extra_bits = zc_min<uint32_t>((run_end - run_start) - 3, 0x7);
        precode_freqs[17]++;
        *itemptr++ = 17 | (extra_bits << 5);
        run_start += 3 + extra_bits;
      }
    }
    else {
      // Symbol 16: RLE 3 to 6 of the previous length.
      if ((run_end - run_start) >= 4) {
        precode_freqs[len]++;
        *itemptr++ = len;
        run_start++;
        do {
          uint32_t extra_bits = zc_min<uint32_t>((run_end - run_start) - 3, 0x3);
          precode_freqs[16]++;
          *itemptr++ = 16 | (extra_bits << 5);
          run_start += 3 + extra_bits;
        } while ((run_end - run_start) >= 3);
      }
    }

    // Output any remaining lengths without RLE.
    while (run_start != run_end) {
      precode_freqs[len]++;
      *itemptr++ = len;
      run_start++;
    }
  } while (run_start != num_lens);

  return uint32_t(itemptr - precode_items);
}

// Precomputes the information needed to output dynamic Huffman codes.
//
// Codeword lengths of dynamic blocks are compressed by a separate Huffman code, the precode, which contains a
// symbol for each possible codeword length and 3 symbols that represent repeated lengths.
static void deflate_precompute_huffman_header(EncoderImpl* impl) noexcept {
  EncoderImpl::Precode& precode = impl->precode;

  for (precode.litlen_symbol_count = kNumLitLenSymbols; precode.litlen_symbol_count > 257; precode.litlen_symbol_count--) {
    if (impl->codes.lens.litlen[precode.litlen_symbol_count - 1] != 0) {
      break;
    }
  }

  for (precode.offset_symbol_count = kNumOffsetSymbols; precode.offset_symbol_count > 1; precode.offset_symbol_count--) {
    if (impl->codes.lens.offset[precode.offset_symbol_count - 1] != 0) {
      break;
    }
  }

  // Litlen and offset lengths are RLE encoded as one sequence, so move offset lengths next to the used litlen
  // lengths temporarily.
  ZC_STATIC_ASSERT(offsetof(Lens, offset) == kNumLitLenSymbols);
  uint8_t* lens = reinterpret_cast<uint8_t*>(&impl->codes.lens);

  if (precode.litlen_symbol_count != kNumLitLenSymbols) {
    memmove(lens + precode.litlen_symbol_count, lens + kNumLitLenSymbols, precode.offset_symbol_count);
  }

  precode.item_count = deflate_compute_precode_items(lens, precode.litlen_symbol_count + precode.offset_symbol_count, precode.freqs, precode.items);
  deflate_make_huffman_code(kNumPrecodeSymbols, kMaxPreCodeWordLen, precode.freqs, precode.lens, precode.codewords);

  for (precode.explicit_len_count = kNumPrecodeSymbols; precode.explicit_len_count > 4; precode.explicit_len_count--) {
    if (precode.lens[kPrecodeLensPermutation[precode.explicit_len_count - 1]] != 0) {
      break;
    }
  }

  if (precode.litlen_symbol_count != kNumLitLenSymbols) {
    memmove(lens + kNumLitLenSymbols, lens + precode.litlen_symbol_count, precode.offset_symbol_count);
  }
}

// zc::Compression::Deflate::Encoder - Uncompressed Blocks
// =======================================================

// Writes `data` as a sequence of stored blocks of at most 65535 bytes. Empty data produces a single empty block.
static void write_uncompressed_blocks(OutputStream& os, const uint8_t* data, size_t data_size, bool is_final) noexcept {
  ZC_ASSERT(os.bits.was_properly_flushed());

  OutputBits bits = os.bits;
  OutputBuffer buf = os.buffer;

  size_t block_size = zc_min<size_t>(data_size, 0xFFFFu);
  uint32_t block_is_final = uint32_t(is_final && data_size == block_size);

  // The first header uses the remaining bits of the current byte, the following headers always start at a
  // byte boundary as stored data ends on one.
  bits.add(block_is_final, 1);
  bits.add(uint32_t(BlockType::kUncompressed), 2);
  bits.align_to_bytes();
  bits.flush(buf);

  ZC_ASSERT(bits.length() == 0);
  ZC_ASSERT(buf.remaining_bytes() >= 4 + block_size);

  os.bits = bits;

  for (;;) {
    MemOps::writeU16uLE(buf.ptr, uint32_t(block_size));
    buf.ptr += 2;

    MemOps::writeU16uLE(buf.ptr, uint32_t(block_size ^ 0xFFFFu));
    buf.ptr += 2;

    if (block_size) {
      memcpy(buf.ptr, data, block_size);
    }

    data += block_size;
    buf.ptr += block_size;

    data_size -= block_size;
    if (data_size == 0) {
      break;
    }

    block_size = zc_min<size_t>(data_size, 0xFFFFu);
    block_is_final = uint32_t(is_final && data_size == block_size);

    ZC_ASSERT(buf.remaining_bytes() >= 5 + block_size);
    buf.ptr[0] = uint8_t(block_is_final | (uint32_t(BlockType::kUncompressed) << 1));
    buf.ptr++;
  }

  os.buffer.ptr = buf.ptr;
}

// zc::Compression::Deflate::Encoder - Block Writing
// =================================================

// Chooses the cheapest block type (dynamic Huffman, static Huffman, or uncompressed) and writes the block.
static void flush_block(HcEncoderImpl* impl, OutputStream& os, const uint8_t* ZC_RESTRICT block_begin, uint32_t block_length, bool is_final_block) noexcept {
  ZC_ASSERT(os.bits.was_properly_flushed());

  // Costs are measured in bits.
  uint32_t static_cost = 0;
  uint32_t dynamic_cost = 0;

  impl->freqs.litlen[kEndOfBlock]++;
  deflate_make_huffman_codes(&impl->freqs, &impl->codes);

  // Cost of dynamic Huffman codes.
  deflate_precompute_huffman_header(impl);
  dynamic_cost += 5 + 5 + 4 + (3 * impl->precode.explicit_len_count);

  for (uint32_t sym = 0; sym < kNumPrecodeSymbols; sym++) {
    uint32_t extra = kDeflateExtraPrecodeBitCount[sym];
    dynamic_cost += impl->precode.freqs[sym] * (extra + impl->precode.lens[sym]);
  }

  // Cost of literals.
  uint32_t static_len8 = 0;
  for (uint32_t sym = 0; sym < 144; sym++) {
    static_len8 += impl->freqs.litlen[sym];
    dynamic_cost += impl->freqs.litlen[sym] * impl->codes.lens.litlen[sym];
  }

  uint32_t static_len9 = 0;
  for (uint32_t sym = 144; sym < 256; sym++) {
    static_len9 += impl->freqs.litlen[sym];
    dynamic_cost += impl->freqs.litlen[sym] * impl->codes.lens.litlen[sym];
  }

  // Cost of the end-of-block symbol.
  static_cost += 7u + (static_len8 * 8u) + (static_len9 * 9u);
  dynamic_cost += impl->codes.lens.litlen[kEndOfBlock];

  // Cost of lengths.
  for (uint32_t sym = kFirstLengthSymbol; sym < kFirstLengthSymbol + ZC_ARRAY_SIZE(kEncoderExtraLengthBitCount); sym++) {
    uint32_t extra = kEncoderExtraLengthBitCount[sym - kFirstLengthSymbol];
    static_cost += impl->freqs.litlen[sym] * (extra + impl->static_codes.lens.litlen[sym]);
    dynamic_cost += impl->freqs.litlen[sym] * (extra + impl->codes.lens.litlen[sym]);
  }

  // Cost of offsets.
  for (uint32_t sym = 0; sym < ZC_ARRAY_SIZE(kEncoderExtraOffsetBitCount); sym++) {
    uint32_t extra = kEncoderExtraOffsetBitCount[sym];
    static_cost += impl->freqs.offset[sym] * (extra + 5);
    dynamic_cost += impl->freqs.offset[sym] * (extra + impl->codes.lens.offset[sym]);
  }

  uint32_t uncompressed_cost = (IntOps::negate(uint32_t(os.bits.length()) + 3u) & 7u) + 32u +
                               (40u * (ZC_DIV_ROUND_UP(block_length, uint32_t(UINT16_MAX)) - 1u)) +
                               (8u * block_length);

  uint32_t huffman_cost = zc_min(static_cost, dynamic_cost);
  if (uncompressed_cost < huffman_cost) {
    write_uncompressed_blocks(os, block_begin, block_length, is_final_block);
    return;
  }

  BlockType block_type = static_cost < dynamic_cost ? BlockType::kStaticHuffman : BlockType::kDynamicHuffman;
  const Codes& codes = static_cost < dynamic_cost ? impl->static_codes : impl->codes;

  OutputBits bits = os.bits;
  OutputBuffer buf = os.buffer;

  // Block Header
  // ------------

  bits.add(uint32_t(is_final_block), 1);
  bits.add(uint32_t(block_type), 2);

  if (block_type == BlockType::kDynamicHuffman) {
    const EncoderImpl::Precode& precode = impl->precode;

    // header(3) + 5 + 5 + 4 + 2 * 3 -> 23 bits for block header and the first 2 precode lens.
    bits.add(precode.litlen_symbol_count - 257u, 5u);
    bits.add(precode.offset_symbol_count - 1u, 5u);
    bits.add(precode.explicit_len_count - 4u, 4u);
    bits.add(precode.lens[kPrecodeLensPermutation[0]], 3);
    bits.add(precode.lens[kPrecodeLensPermutation[1]], 3);
    bits.flush(buf);

    for (uint32_t i = 2; i < precode.explicit_len_count; i++) {
      bits.add(precode.lens[kPrecodeLensPermutation[i]], 3);
      bits.flush(buf);
    }

    // Encoded lengths of the codewords in the larger code.
    for (uint32_t i = 0; i < precode.item_count; i++) {
      uint32_t precode_item = precode.items[i];
      uint32_t precode_sym = precode_item & 0x1Fu;
      bits.add(precode.codewords[precode_sym], precode.lens[precode_sym]);

      if (precode_sym >= 16u) {
        bits.add(precode_item >> 5, kDeflateExtraPrecodeBitCount[precode_sym]);
      }
      bits.flush(buf);
    }
  }
  else {
    bits.flush(buf);
  }

  // Literals and Matches
  // --------------------

  const Sequence* seq = impl->sequences;
  const uint8_t* in_next = block_begin;

  for (;;) {
    uint32_t litrunlen = seq->litrunlen_and_length & 0x7FFFFFu;
    uint32_t length = seq->litrunlen_and_length >> 23;

    while (litrunlen >= 4) {
      uint32_t lit0 = in_next[0];
      uint32_t lit1 = in_next[1];
      uint32_t lit2 = in_next[2];
      uint32_t lit3 = in_next[3];

      bits.add(codes.codewords.litlen[lit0], codes.lens.litlen[lit0]);
      bits.flush_if_cannot_buffer_n<2 * kEncoderMaxLitlenCodewordLen>(buf);

      bits.add(codes.codewords.litlen[lit1], codes.lens.litlen[lit1]);
      bits.flush_if_cannot_buffer_n<3 * kEncoderMaxLitlenCodewordLen>(buf);

      bits.add(codes.codewords.litlen[lit2], codes.lens.litlen[lit2]);
      bits.flush_if_cannot_buffer_n<4 * kEncoderMaxLitlenCodewordLen>(buf);

      bits.add(codes.codewords.litlen[lit3], codes.lens.litlen[lit3]);
      bits.flush(buf);

      in_next += 4;
      litrunlen -= 4;
    }

    while (litrunlen) {
      uint32_t lit = in_next[0];
      bits.add(codes.codewords.litlen[lit], codes.lens.litlen[lit]);
      bits.flush(buf);

      in_next++;
      litrunlen--;
    }

    if (length == 0) {
      break;
    }

    in_next += length;
    uint32_t length_slot = seq->length_slot;
    uint32_t litlen_symbol = kFirstLengthSymbol + length_slot;

    // Match length + extra bits.
    bits.add(codes.codewords.litlen[litlen_symbol], codes.lens.litlen[litlen_symbol]);
    bits.add(length - kEncoderLengthSlotBase[length_slot], kEncoderExtraLengthBitCount[length_slot]);
    bits.flush_if_cannot_buffer_n<kEncoderMaxLitlenCodewordLen + kMaxExtraLengthBits + kMaxOffsetCodeWordLen + kMaxExtraOffsetBits>(buf);

    // Match offset + extra bits.
    uint32_t offset_symbol = seq->offset_symbol;
    bits.add(codes.codewords.offset[offset_symbol], codes.lens.offset[offset_symbol]);
    bits.flush_if_cannot_buffer_n<kMaxOffsetCodeWordLen + kMaxExtraOffsetBits>(buf);
    bits.add(seq->offset - kEncoderOffsetSlotBase[offset_symbol], kEncoderExtraOffsetBitCount[offset_symbol]);
    bits.flush(buf);

    seq++;
  }

  // End of Block
  // ------------

  bits.add(codes.codewords.litlen[kEndOfBlock], codes.lens.litlen[kEndOfBlock]);
  bits.flush(buf);

  os.bits = bits;
  os.buffer.ptr = buf.ptr;
}

static ZC_INLINE void choose_literal(EncoderImpl* impl, uint32_t literal, uint32_t* litrunlen_p) noexcept {
  impl->freqs.litlen[literal]++;
  ++*litrunlen_p;
}

static ZC_INLINE void choose_match(EncoderImpl* impl, uint32_t length, uint32_t offset, uint32_t* litrunlen_p, Sequence** next_seq_p) noexcept {
  Sequence* seq = *next_seq_p;
  uint32_t length_slot = kEncoderLengthSlotLUT[length];
  uint32_t offset_slot = deflate_get_offset_slot(offset);

  impl->freqs.litlen[kFirstLengthSymbol + length_slot]++;
  impl->freqs.offset[offset_slot]++;

  seq->litrunlen_and_length = (uint32_t(length) << 23) | *litrunlen_p;
  seq->offset = uint16_t(offset);
  seq->length_slot = uint8_t(length_slot);
  seq->offset_symbol = uint8_t(offset_slot);

  *litrunlen_p = 0;
  *next_seq_p = seq + 1;
}

static ZC_INLINE void finish_sequence(Sequence* seq, uint32_t litrunlen) noexcept {
  seq->litrunlen_and_length = litrunlen;
}

// zc::Compression::Deflate::Encoder - Block Splitting
// ===================================================

// A new block with new Huffman codes is started when the distribution of recently observed symbols differs "enough"
// from the distribution observed so far in the block. Instead of individual symbols, observations are aggregated
// into a few types: literals by their top 2 bits and lowest bit, matches by being short or long. The block is ended
// when the sum of absolute differences exceeds a threshold, which grows with the block length.

static void init_block_split_stats(BlockSplitStats* stats) noexcept {
  for (uint32_t i = 0; i < kNumObservationTypes; i++) {
    stats->new_observations[i] = 0;
    stats->observations[i] = 0;
  }
  stats->num_new_observations = 0;
  stats->num_observations = 0;
}

static ZC_INLINE void observe_literal(BlockSplitStats* stats, uint8_t lit) noexcept {
  stats->new_observations[((lit >> 5) & 0x6) | (lit & 1)]++;
  stats->num_new_observations++;
}

static ZC_INLINE void observe_match(BlockSplitStats* stats, uint32_t length) noexcept {
  stats->new_observations[kNumLiteralObservationTypes + (length >= 9)]++;
  stats->num_new_observations++;
}

static bool do_end_block_check(BlockSplitStats* stats, uint32_t block_length) noexcept {
  if (stats->num_observations > 0) {
    // All math is done with numbers multiplied by `num_observations` to avoid divisions.
    uint32_t total_delta = 0;

    for (uint32_t i = 0; i < kNumObservationTypes; i++) {
      uint32_t expected = stats->observations[i] * stats->num_new_observations;
      uint32_t actual = stats->new_observations[i] * stats->num_observations;
      uint32_t delta = (actual > expected) ? actual - expected : expected - actual;

      total_delta += delta;
    }

    if (total_delta + (block_length / 4096) * stats->num_observations >= kEncoderNumObservationsPerBlockCheck * 200 / 512 * stats->num_observations)
      return true;
  }

  for (uint32_t i = 0; i < kNumObservationTypes; i++) {
    stats->num_observations += stats->new_observations[i];
    stats->observations[i] += stats->new_observations[i];
    stats->new_observations[i] = 0;
  }

  stats->num_new_observations = 0;
  return false;
}

static ZC_INLINE bool should_end_block(BlockSplitStats* stats, const uint8_t* in_block_begin, const uint8_t* in_next, const uint8_t* in_end) noexcept {
  if (stats->num_new_observations < kEncoderNumObservationsPerBlockCheck ||
      PtrOps::byte_offset(in_block_begin, in_next) < kEncoderMinBlockLength ||
      PtrOps::bytes_until(in_next, in_end) < kEncoderMinBlockLength) {
    return false;
  }

  return do_end_block_check(stats, uint32_t(in_next - in_block_begin));
}

// zc::Compression::Deflate::Encoder - Greedy Compressor
// =====================================================

// Greedy DEFLATE compressor, which always chooses the longest match.
static size_t ZC_CDECL compress_greedy(EncoderImpl* impl_, const uint8_t* ZC_RESTRICT in, size_t in_nbytes, uint8_t* ZC_RESTRICT out, size_t out_nbytes_avail) noexcept {
  HcEncoderImpl* impl = static_cast<HcEncoderImpl*>(impl_);

  OutputStream os{};
  os.buffer.init(out, out_nbytes_avail);

  const uint8_t* in_next = in;
  const uint8_t* in_end = in_next + in_nbytes;
  const uint8_t* in_cur_base = in_next;

  uint32_t max_len = kMaxMatchLen;
  uint32_t nice_len = zc_min(impl->nice_match_length, max_len);
  uint32_t next_hashes[2] = {0, 0};

  impl->hc_mf.init();

  do {
    const uint8_t* in_block_begin = in_next;
    const uint8_t* in_max_block_end = in_next + zc_min<size_t>(PtrOps::bytes_until(in_next, in_end), kEncoderSoftMaxBlockLength);

    uint32_t litrunlen = 0;
    Sequence* next_seq = impl->sequences;

    init_block_split_stats(&impl->split_stats);
    reset_symbol_frequencies(impl);

    do {
      // Decrease the maximum and nice match lengths when approaching the end of the input buffer.
      if (ZC_UNLIKELY(max_len > PtrOps::bytes_until(in_next, in_end))) {
        max_len = uint32_t(PtrOps::bytes_until(in_next, in_end));
        nice_len = zc_min(nice_len, max_len);
      }

      uint32_t offset;
      uint32_t length = impl->hc_mf.longest_match(&in_cur_base, in_next, kMinMatchLen - 1, max_len, nice_len, impl->max_search_depth, next_hashes, &offset);

      if (length >= kMinMatchLen) {
        choose_match(impl, length, offset, &litrunlen, &next_seq);
        observe_match(&impl->split_stats, length);
        in_next = impl->hc_mf.skip_positions(&in_cur_base, in_next + 1, in_end, length - 1, next_hashes);
      }
      else {
        choose_literal(impl, *in_next, &litrunlen);
        observe_literal(&impl->split_stats, *in_next);
        in_next++;
      }
    } while (in_next < in_max_block_end && !should_end_block(&impl->split_stats, in_block_begin, in_next, in_end));

    finish_sequence(next_seq, litrunlen);
    flush_block(impl, os, in_block_begin, uint32_t(in_next - in_block_begin), in_next == in_end);
  } while (in_next != in_end);

  os.bits.flush_final_byte(os.buffer);
  return os.buffer.byte_offset();
}

// zc::Compression::Deflate::Encoder - Lazy Compressor
// ===================================================

// Lazy DEFLATE compressor. Before choosing a match it checks whether there is a longer match at the next position.
// If there is, it outputs a literal and continues from the next position, otherwise it outputs the match.
static size_t ZC_CDECL compress_lazy(EncoderImpl* impl_, const uint8_t* ZC_RESTRICT in, size_t in_nbytes, uint8_t* ZC_RESTRICT out, size_t out_nbytes_avail) noexcept {
  HcEncoderImpl* impl = static_cast<HcEncoderImpl*>(impl_);

  OutputStream os{};
  os.buffer.init(out, out_nbytes_avail);

  const uint8_t* in_next = in;
  const uint8_t* in_end = in_next + in_nbytes;
  const uint8_t* in_cur_base = in_next;

  uint32_t max_len = kMaxMatchLen;
  uint32_t nice_len = zc_min(impl->nice_match_length, max_len);
  uint32_t next_hashes[2] = {0, 0};

  impl->hc_mf.init();

  do {
    const uint8_t* const in_block_begin = in_next;
    const uint8_t* const in_max_block_end = in_next + zc_min<size_t>(PtrOps::bytes_until(in_next, in_end), kEncoderSoftMaxBlockLength);

    uint32_t litrunlen = 0;
    Sequence* next_seq = impl->sequences;

    init_block_split_stats(&impl->split_stats);
    reset_symbol_frequencies(impl);

    do {
      uint32_t cur_offset;
      uint32_t next_len;
      uint32_t next_offset;

      if (ZC_UNLIKELY(PtrOps::bytes_until(in_next, in_end) < kMaxMatchLen)) {
        max_len = uint32_t(PtrOps::bytes_until(in_next, in_end));
        nice_len = zc_min(nice_len, max_len);
      }

      uint32_t cur_len = impl->hc_mf.longest_match(&in_cur_base, in_next, kMinMatchLen - 1, max_len, nice_len, impl->max_search_depth, next_hashes, &cur_offset);
      in_next += 1;

      if (cur_len < kMinMatchLen) {
        choose_literal(impl, *(in_next - 1), &litrunlen);
        observe_literal(&impl->split_stats, *(in_next - 1));
        continue;
      }

have_cur_match:
      observe_match(&impl->split_stats, cur_len);

      // Choose a very long match immediately.
      if (cur_len >= nice_len) {
        choose_match(impl, cur_len, cur_offset, &litrunlen, &next_seq);
        in_next = impl->hc_mf.skip_positions(&in_cur_base, in_next, in_end, cur_len - 1, next_hashes);
        continue;
      }

      // Try to find a longer match at the next position, using only half of the search depth.
      if (ZC_UNLIKELY(PtrOps::bytes_until(in_next, in_end) < kMaxMatchLen)) {
        max_len = uint32_t(PtrOps::bytes_until(in_next, in_end));
        nice_len = zc_min(nice_len, max_len);
      }

      next_len = impl->hc_mf.longest_match(&in_cur_base, in_next, cur_len, max_len, nice_len, impl->max_search_depth / 2, next_hashes, &next_offset);
      in_next += 1;

      if (next_len > cur_len) {
        // Output a literal, the next match becomes the current match.
        choose_literal(impl, *(in_next - 2), &litrunlen);
        cur_len = next_len;
        cur_offset = next_offset;
        goto have_cur_match;
      }

      choose_match(impl, cur_len, cur_offset, &litrunlen, &next_seq);
      in_next = impl->hc_mf.skip_positions(&in_cur_base, in_next, in_end, cur_len - 2, next_hashes);
    } while (in_next < in_max_block_end && !should_end_block(&impl->split_stats, in_block_begin, in_next, in_end));

    finish_sequence(next_seq, litrunlen);
    flush_block(impl, os, in_block_begin, uint32_t(in_next - in_block_begin), in_next == in_end);
  } while (in_next != in_end);

  os.bits.flush_final_byte(os.buffer);
  return os.buffer.byte_offset();
}

// zc::Compression::Deflate::Encoder - Public API
// ==============================================

static size_t get_minimum_input_size_to_compress(uint32_t compression_level) noexcept {
  ZC_ASSERT(compression_level < ZC_ARRAY_SIZE(kMinimumInputSizeToCompress));
  return size_t(kMinimumInputSizeToCompress[compression_level]) - 1u;
}

static ZC_INLINE uint32_t get_zlib_compression_level_hint(uint32_t compression_level) noexcept {
  constexpr uint32_t kZlibCompressionFastest = 0;
  constexpr uint32_t kZlibCompressionFast    = 1;
  constexpr uint32_t kZlibCompressionDefault = 2;
  constexpr uint32_t kZlibCompressionSlowest = 3;

  return compression_level < 2u ? kZlibCompressionFastest :
         compression_level < 6u ? kZlibCompressionFast    :
         compression_level < 8u ? kZlibCompressionDefault : kZlibCompressionSlowest;
}

ZCResult Encoder::init(FormatType format, uint32_t compression_level) noexcept {
  compression_level = zc_min(compression_level, kMaxCompressionLevel);

  constexpr size_t kImplAlignment = 64;
  size_t impl_size = compression_level == 0u ? sizeof(EncoderImpl) : sizeof(HcEncoderImpl);

  void* allocated_ptr = malloc(impl_size + kImplAlignment);
  if (ZC_UNLIKELY(!allocated_ptr)) {
    return zc_make_error(ZC_ERROR_ALLOC_FAILED);
  }

  EncoderImpl* new_impl = reinterpret_cast<EncoderImpl*>(IntOps::align_up(uintptr_t(allocated_ptr), kImplAlignment));
  new_impl->allocated_ptr = allocated_ptr;
  new_impl->format = format;
  new_impl->compression_level = compression_level;
  new_impl->min_input_size = get_minimum_input_size_to_compress(compression_level);
  new_impl->compress_func = nullptr;

  EncoderCompressionOptions encoder_options = kEncoderCompressionOptions[compression_level];
  new_impl->max_search_depth = encoder_options.max_search_depth;
  new_impl->nice_match_length = encoder_options.nice_match_length;

  if (compression_level >= 5u)
    new_impl->compress_func = compress_lazy;
  else if (compression_level >= 1u)
    new_impl->compress_func = compress_greedy;

  reset();
  impl = new_impl;

  return ZC_SUCCESS;
}

void Encoder::reset() noexcept {
  if (impl) {
    free(impl->allocated_ptr);
    impl = nullptr;
  }
}

// The worst case is all uncompressed blocks where one block has `length <= kEncoderMinBlockLength` and the others
// have length `kEncoderMinBlockLength`. Each uncompressed block has 5 bytes of overhead: 1 for BFINAL, BTYPE, and
// alignment to a byte boundary; 2 for LEN; and 2 for NLEN.
size_t output_bound(FormatType format, size_t input_size) noexcept {
  constexpr size_t kUncompressedBlockOverhead = 1u + 2u + 2u;

  size_t max_block_count = zc_max<size_t>(ZC_DIV_ROUND_UP(input_size, kEncoderMinBlockLength), 1);
  size_t extra_bytes = size_t(kMinOutputBufferPadding) + kDeflateMinOutputSizeByFormat[size_t(format)] + 1u;

  return extra_bytes + (max_block_count * kUncompressedBlockOverhead) + input_size;
}

size_t Encoder::minimum_output_buffer_size(size_t input_size) const noexcept {
  return output_bound(impl->format, input_size);
}

static ZC_NOINLINE size_t compress_deflate(EncoderImpl* impl, uint8_t* output, size_t output_size, const uint8_t* input, size_t input_size) noexcept {
  if (input_size <= impl->min_input_size || input_size == 0) {
    // Extremely small inputs use uncompressed blocks only.
    OutputStream os{};
    os.buffer.init(output, output_size);
    write_uncompressed_blocks(os, input, input_size, true);
    return os.buffer.byte_offset();
  }

  ZC_ASSERT(impl->compress_func != nullptr);

  init_static_codes(impl);
  return impl->compress_func(impl, input, input_size, output, output_size);
}

size_t Encoder::compress_to(uint8_t* output, size_t output_size, const uint8_t* input, size_t input_size) noexcept {
  if (ZC_UNLIKELY(output_size < minimum_output_buffer_size(input_size)))
    return 0;

  switch (impl->format) {
    case FormatType::kRaw: {
      return compress_deflate(impl, output, output_size, input, input_size);
    }

    case FormatType::kZlib: {
      static constexpr uint32_t kZlibCompressionMethodDeflate = 8;
      static constexpr uint32_t kZlibCompressionWindow32KiB = 7;

      size_t compressed_size = compress_deflate(impl, output + 2, output_size - 6, input, input_size);
      if (compressed_size == 0) {
        return 0;
      }

      // Zlib header - 2 bytes (CMF and FLG), FLG is adjusted so the header is a multiple of 31.
      uint32_t hdr = (get_zlib_compression_level_hint(impl->compression_level) << 6) |
                     (kZlibCompressionMethodDeflate << 8) |
                     (kZlibCompressionWindow32KiB << 12);

      hdr |= 31u - (hdr % 31u);
      MemOps::writeU16uBE(output, hdr);

      // Zlib checksum - ADLER32 (4 bytes).
      uint32_t checksum = Checksum::adler32(input, input_size);
      MemOps::writeU32uBE(output + 2 + compressed_size, checksum);

      return compressed_size + 6;
    }

    default:
      return 0;
  }
}

ZCResult Encoder::compress(ZCByteArray& dst, ZCModifyOp modify_op, ZCDataView input) noexcept {
  if (ZC_UNLIKELY(!impl)) {
    return zc_make_error(ZC_ERROR_INVALID_STATE);
  }

  size_t prior_size = zc_modify_op_is_append(modify_op) ? dst.size : size_t(0);
  size_t min_output_size = minimum_output_buffer_size(input.size);
  uint8_t* output_buffer;

  ZC_PROPAGATE(dst.modify_op(modify_op, min_output_size, &output_buffer));

  size_t output_size = compress_to(output_buffer, min_output_size, input.data, input.size);
  if (ZC_UNLIKELY(output_size == 0)) {
    ZC_PROPAGATE(dst.truncate(prior_size));
    return zc_make_error(ZC_ERROR_COMPRESSION_FAILED);
  }

  return dst.truncate(prior_size + output_size);
}

} // {zc::Compression::Deflate}
