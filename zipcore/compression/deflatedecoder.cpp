// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zipcore/core/api-build_p.h>
#include <zipcore/compression/checksum_p.h>
#include <zipcore/compression/deflatedecoder_p.h>
#include <zipcore/compression/deflatedecoderutils_p.h>
#include <zipcore/support/intops_p.h>
#include <zipcore/support/ptrops_p.h>

#include <string.h>

// Decoding Notes:
//
// The `build_decode_table()` function uses the same algorithm that libdeflate uses (Eric Biggers, CC0), with minor
// modifications. The rest of the decoder follows libdeflate ideas, but it's designed to support streaming, so the
// input can come in arbitrary chunks and the decoder resumes exactly where the previous chunk ended.
//
// The fastest way to decode Huffman-encoded data is to use a decode table that maps the table bits of data to their
// symbol. Each entry in a decode table maps to the symbol whose codeword is a prefix of 'i'. A symbol with codeword
// length 'n' has '2**(TableBits-n)' entries in the table.
//
// In DEFLATE, the maximum litlen and offset codeword lengths are 15 bits, which is too large for a single table.
// The workaround is to use a single level of subtables: entries for prefixes of codewords longer than TableBits
// contain an index to the appropriate subtable along with the number of bits it is indexed with. Subtables are
// allocated after the main table, the worst-case number of entries is precomputed by the `enough` tool from Zlib.
//
// Codeword lengths are stored in the decode table entries together with DEFLATE specific information (extra bits,
// literal/length/end-of-block division), see `DecodeEntry` for the exact format.

namespace zc::Compression::Deflate {

// zc::Compression::Deflate - Constants
// ====================================

const uint8_t kPrecodeLensPermutation[kNumPrecodeSymbols] = {
  16, 17, 18, 0, 8, 7, 9, 6, 10, 5, 11, 4, 12, 3, 13, 2, 14, 1, 15
};

// Static part of pre-code entries (the pre-code decode table never has subtables).
static constexpr DecodeEntry kPrecodeDecodeResults[] = {
  #define ENTRY(value, repeat, extra) {                       \
    (uint32_t(value ) << DecodeEntry::kPrecodeValueOffset ) | \
    (uint32_t(repeat) << DecodeEntry::kPrecodeRepeatOffset) | \
    (uint32_t(extra ) << DecodeEntry::kFullLengthOffset   )   \
  }

  ENTRY(0 , 1, 0), ENTRY(1 , 1, 0), ENTRY(2 , 1 , 0), ENTRY(3 , 1, 0),
  ENTRY(4 , 1, 0), ENTRY(5 , 1, 0), ENTRY(6 , 1 , 0), ENTRY(7 , 1, 0),
  ENTRY(8 , 1, 0), ENTRY(9 , 1, 0), ENTRY(10, 1 , 0), ENTRY(11, 1, 0),
  ENTRY(12, 1, 0), ENTRY(13, 1, 0), ENTRY(14, 1 , 0), ENTRY(15, 1, 0),
  ENTRY(16, 3, 2), ENTRY(17, 3, 3), ENTRY(18, 11, 7)

  #undef ENTRY
};

// Literals+Length decode entries.
static constexpr DecodeEntry kLitLenDecodeResults[] = {
  // Literal entries.
  #define ENTRY(value) {(uint32_t(value) << DecodeEntry::kPayloadOffset) | DecodeEntry::kLiteralFlag}

  ENTRY(0)  , ENTRY(1)  , ENTRY(2)  , ENTRY(3)  , ENTRY(4)  , ENTRY(5)  , ENTRY(6)  , ENTRY(7)  ,
  ENTRY(8)  , ENTRY(9)  , ENTRY(10) , ENTRY(11) , ENTRY(12) , ENTRY(13) , ENTRY(14) , ENTRY(15) ,
  ENTRY(16) , ENTRY(17) , ENTRY(18) , ENTRY(19) , ENTRY(20) , ENTRY(21) , ENTRY(22) , ENTRY(23) ,
  ENTRY(24) , ENTRY(25) , ENTRY(26) , ENTRY(27) , ENTRY(28) , ENTRY(29) , ENTRY(30) , ENTRY(31) ,
  ENTRY(32) , ENTRY(33) , ENTRY(34) , ENTRY(35) , ENTRY(36) , ENTRY(37) , ENTRY(38) , ENTRY(39) ,
  ENTRY(40) , ENTRY(41) , ENTRY(42) , ENTRY(43) , ENTRY(44) , ENTRY(45) , ENTRY(46) , ENTRY(47) ,
  ENTRY(48) , ENTRY(49) , ENTRY(50) , ENTRY(51) , ENTRY(52) , ENTRY(53) , ENTRY(54) , ENTRY(55) ,
  ENTRY(56) , ENTRY(57) , ENTRY(58) , ENTRY(59) , ENTRY(60) , ENTRY(61) , ENTRY(62) , ENTRY(63) ,
  ENTRY(64) , ENTRY(65) , ENTRY(66) , ENTRY(67) , ENTRY(68) , ENTRY(69) , ENTRY(70) , ENTRY(71) ,
  ENTRY(72) , ENTRY(73) , ENTRY(74) , ENTRY(75) , ENTRY(76) , ENTRY(77) , ENTRY(78) , ENTRY(79) ,
  ENTRY(80) , ENTRY(81) , ENTRY(82) , ENTRY(83) , ENTRY(84) , ENTRY(85) , ENTRY(86) , ENTRY(87) ,
  ENTRY(88) , ENTRY(89) , ENTRY(90) , ENTRY(91) , ENTRY(92) , ENTRY(93) , ENTRY(94) , ENTRY(95) ,
  ENTRY(96) , ENTRY(97) , ENTRY(98) , ENTRY(99) , ENTRY(100), ENTRY(101), ENTRY(102), ENTRY(103),
  ENTRY(104), ENTRY(105), ENTRY(106), ENTRY(107), ENTRY(108), ENTRY(109), ENTRY(110), ENTRY(111),
  ENTRY(112), ENTRY(113), ENTRY(114), ENTRY(115), ENTRY(116), ENTRY(117), ENTRY(118), ENTRY(119),
  ENTRY(120), ENTRY(121), ENTRY(122), ENTRY(123), ENTRY(124), ENTRY(125), ENTRY(126), ENTRY(127),
  ENTRY(128), ENTRY(129), ENTRY(130), ENTRY(131), ENTRY(132), ENTRY(133), ENTRY(134), ENTRY(135),
  ENTRY(136), ENTRY(137), ENTRY(138), ENTRY(139), ENTRY(140), ENTRY(141), ENTRY(142), ENTRY(143),
  ENTRY(144), ENTRY(145), ENTRY(146), ENTRY(147), ENTRY(148), ENTRY(149), ENTRY(150), ENTRY(151),
  ENTRY(152), ENTRY(153), ENTRY(154), ENTRY(155), ENTRY(156), ENTRY(157), ENTRY(158), ENTRY(159),
  ENTRY(160), ENTRY(161), ENTRY(162), ENTRY(163), ENTRY(164), ENTRY(165), ENTRY(166), ENTRY(167),
  ENTRY(168), ENTRY(169), ENTRY(170), ENTRY(171), ENTRY(172), ENTRY(173), ENTRY(174), ENTRY(175),
  ENTRY(176), ENTRY(177), ENTRY(178), ENTRY(179), ENTRY(180), ENTRY(181), ENTRY(182), ENTRY(183),
  ENTRY(184), ENTRY(185), ENTRY(186), ENTRY(187), ENTRY(188), ENTRY(189), ENTRY(190), ENTRY(191),
  ENTRY(192), ENTRY(193), ENTRY(194), ENTRY(195), ENTRY(196), ENTRY(197), ENTRY(198), ENTRY(199),
  ENTRY(200), ENTRY(201), ENTRY(202), ENTRY(203), ENTRY(204), ENTRY(205), ENTRY(206), ENTRY(207),
  ENTRY(208), ENTRY(209), ENTRY(210), ENTRY(211), ENTRY(212), ENTRY(213), ENTRY(214), ENTRY(215),
  ENTRY(216), ENTRY(217), ENTRY(218), ENTRY(219), ENTRY(220), ENTRY(221), ENTRY(222), ENTRY(223),
  ENTRY(224), ENTRY(225), ENTRY(226), ENTRY(227), ENTRY(228), ENTRY(229), ENTRY(230), ENTRY(231),
  ENTRY(232), ENTRY(233), ENTRY(234), ENTRY(235), ENTRY(236), ENTRY(237), ENTRY(238), ENTRY(239),
  ENTRY(240), ENTRY(241), ENTRY(242), ENTRY(243), ENTRY(244), ENTRY(245), ENTRY(246), ENTRY(247),
  ENTRY(248), ENTRY(249), ENTRY(250), ENTRY(251), ENTRY(252), ENTRY(253), ENTRY(254), ENTRY(255),

  #undef ENTRY

  {DecodeEntry::kEndOfBlockFlag},

  #define ENTRY(base, extra) {                            \
    (uint32_t(base) << DecodeEntry::kPayloadOffset)     | \
    (uint32_t(extra) << DecodeEntry::kFullLengthOffset) | \
    DecodeEntry::kOffOrLenFlag                            \
  }

  ENTRY(3  , 0) , ENTRY(4  , 0) , ENTRY(5  , 0) , ENTRY(6  , 0),
  ENTRY(7  , 0) , ENTRY(8  , 0) , ENTRY(9  , 0) , ENTRY(10 , 0),
  ENTRY(11 , 1) , ENTRY(13 , 1) , ENTRY(15 , 1) , ENTRY(17 , 1),
  ENTRY(19 , 2) , ENTRY(23 , 2) , ENTRY(27 , 2) , ENTRY(31 , 2),
  ENTRY(35 , 3) , ENTRY(43 , 3) , ENTRY(51 , 3) , ENTRY(59 , 3),
  ENTRY(67 , 4) , ENTRY(83 , 4) , ENTRY(99 , 4) , ENTRY(115, 4),
  ENTRY(131, 5) , ENTRY(163, 5) , ENTRY(195, 5) , ENTRY(227, 5),
  ENTRY(258, 0) ,

  #undef ENTRY

  // Symbols 286 and 287 take part in the code construction, but must never appear in the data.
  {DecodeEntry::kEndOfBlockFlag | DecodeEntry::kEndOfBlockInvalidFlag},
  {DecodeEntry::kEndOfBlockFlag | DecodeEntry::kEndOfBlockInvalidFlag}
};

static constexpr DecodeEntry kOffsetDecodeResults[] = {
  #define ENTRY(base, extra) {                            \
    (uint32_t(base) << DecodeEntry::kPayloadOffset)     | \
    (uint32_t(extra) << DecodeEntry::kFullLengthOffset) | \
    DecodeEntry::kOffOrLenFlag                            \
  }

  ENTRY(1    , 0)  , ENTRY(2    , 0)  , ENTRY(3    , 0)  , ENTRY(4    , 0)  ,
  ENTRY(5    , 1)  , ENTRY(7    , 1)  , ENTRY(9    , 2)  , ENTRY(13   , 2)  ,
  ENTRY(17   , 3)  , ENTRY(25   , 3)  , ENTRY(33   , 4)  , ENTRY(49   , 4)  ,
  ENTRY(65   , 5)  , ENTRY(97   , 5)  , ENTRY(129  , 6)  , ENTRY(193  , 6)  ,
  ENTRY(257  , 7)  , ENTRY(385  , 7)  , ENTRY(513  , 8)  , ENTRY(769  , 8)  ,
  ENTRY(1025 , 9)  , ENTRY(1537 , 9)  , ENTRY(2049 , 10) , ENTRY(3073 , 10) ,
  ENTRY(4097 , 11) , ENTRY(6145 , 11) , ENTRY(8193 , 12) , ENTRY(12289, 12) ,
  ENTRY(16385, 13) , ENTRY(24577, 13) ,

  #undef ENTRY

  {DecodeEntry::kEndOfBlockFlag | DecodeEntry::kEndOfBlockInvalidFlag},
  {DecodeEntry::kEndOfBlockFlag | DecodeEntry::kEndOfBlockInvalidFlag}
};

// zc::Compression::Deflate - Decode Table Builder
// ===============================================

namespace {

ZC_INLINE_NODEBUG DecodeEntry make_top_entry(DecodeEntry entry, uint32_t length) noexcept {
  uint32_t base_length = length << DecodeEntry::kBaseLengthOffset;
  uint32_t full_length = length << DecodeEntry::kFullLengthOffset;

  // End of block entries are looked up again (as a subtable that links itself), so they have no base length.
  if (DecoderUtils::is_end_of_block(entry)) {
    base_length = 0;
  }

  return DecodeEntry{entry.value + (full_length | base_length)};
}

ZC_INLINE_NODEBUG DecodeEntry make_sub_link(uint32_t start_index, uint32_t base_length, uint32_t full_length) noexcept {
  return DecodeEntry{
    (base_length << DecodeEntry::kBaseLengthOffset) |
    (full_length << DecodeEntry::kFullLengthOffset) |
    (start_index << DecodeEntry::kPayloadOffset   )
  };
}

ZC_INLINE_NODEBUG DecodeEntry make_sub_entry(DecodeEntry entry, uint32_t length) noexcept {
  uint32_t base_length = length << DecodeEntry::kBaseLengthOffset;
  uint32_t full_length = length << DecodeEntry::kFullLengthOffset;

  return DecodeEntry{entry.value + full_length + base_length};
}

enum class DecodeTableType : uint32_t {
  kPrecode,
  kLitLen,
  kOffset
};

// Builds a table for fast decoding of symbols from a Huffman code. As input, this function takes the codeword length
// of each symbol which may be used in the code. As output, it produces a decode table for the canonical Huffman code
// described by the codeword lengths. The decode table is built with the assumption that it will be indexed with
// "bit-reversed" codewords, where the low-order bit is the first bit of the codeword. This format is used for all
// Huffman codes in DEFLATE.
//
// Returns `DecodeTableInfo` with non-zero `table_bits` if the table was built successfully, or zeroed info if the
// codeword lengths do not form a valid Huffman code.
static ZC_NOINLINE DecodeTableInfo build_decode_table(
  DecodeEntry decode_table[],
  const uint8_t lens[],
  uint32_t num_syms,
  const DecodeEntry decode_results[],
  uint32_t max_table_bits,
  uint32_t max_codeword_len,
  DecodeTableType table_type
) noexcept {
  uint32_t len_counts[kMaxCodeWordLen + 1] {};
  uint32_t len_mask = 0;

  // Count how many codewords have each length, including 0.
  for (uint32_t sym = 0; sym < num_syms; sym++) {
    uint32_t len = lens[sym];
    len_counts[len]++;
    len_mask |= 1u << len;
  }

  // Determine the actual maximum codeword length that was used, and decrease table_bits to it if allowed.
  max_codeword_len = zc_min<uint32_t>(max_codeword_len, 32u - IntOps::clz(len_mask | 1u));
  uint32_t table_bits = zc_max<uint32_t>(zc_min(max_table_bits, max_codeword_len), 1u);

  // Sort the symbols primarily by increasing codeword length and secondarily by increasing symbol value; or
  // equivalently by their codewords in lexicographic order, since a canonical code is assumed.
  //
  // For efficiency, also compute 'codespace_used' in the same pass over 'len_counts[]' used to build 'offsets[]'.
  uint32_t offsets[kMaxCodeWordLen + 1];
  offsets[0] = 0;
  offsets[1] = len_counts[0];

  // Codespace used out of '2^max_codeword_len'.
  uint32_t codespace_used = 0;
  ZC_STATIC_ASSERT(~uint32_t(0) / (1u << (kMaxCodeWordLen - 1)) >= kMaxSymbolCount);

  {
    uint32_t len;
    for (len = 1; len < max_codeword_len; len++) {
      offsets[len + 1] = offsets[len] + len_counts[len];
      codespace_used = (codespace_used << 1) + len_counts[len];
    }
    codespace_used = (codespace_used << 1) + len_counts[len];
  }

  uint16_t sorted_syms_data[kMaxSymbolCount];
  for (uint32_t sym = 0; sym < num_syms; sym++) {
    uint32_t len = lens[sym];
    sorted_syms_data[offsets[len]++] = uint16_t(sym);
  }

  // Skip unused symbols.
  uint16_t* sorted_syms = sorted_syms_data + offsets[0];

  // Overfull code - more codewords than the codespace can hold.
  if (ZC_UNLIKELY(codespace_used > (1u << max_codeword_len))) {
    return DecodeTableInfo{};
  }

  // Incomplete code.
  if (ZC_UNLIKELY(codespace_used < (1u << max_codeword_len))) {
    uint32_t table_size = 1u << table_bits;
    DecodeEntry first_entry;
    DecodeEntry invalid_entry = make_top_entry(DecodeEntry{DecodeEntry::kEndOfBlockFlag | DecodeEntry::kEndOfBlockInvalidFlag}, 1u);

    if (codespace_used == 0u) {
      // An empty code is only allowed for offsets, it's used by blocks that contain only literals.
      if (table_type != DecodeTableType::kOffset) {
        return DecodeTableInfo{};
      }
      first_entry = invalid_entry;
    }
    else {
      // Allow codes with a single used symbol, with codeword length 1. The DEFLATE RFC is unclear regarding this
      // case; what zlib's decompressor does is to treat the single codeword as if it were "0" and the unused
      // codeword "1" as invalid. The precode is always required to be complete.
      if (table_type == DecodeTableType::kPrecode) {
        return DecodeTableInfo{};
      }

      if (codespace_used != (1u << (max_codeword_len - 1)) || len_counts[1] != 1) {
        return DecodeTableInfo{};
      }

      first_entry = make_top_entry(decode_results[sorted_syms[0]], 1u);
    }

    for (uint32_t i = 0; i < table_size; i += 2) {
      decode_table[i + 0u] = first_entry;
      decode_table[i + 1u] = invalid_entry;
    }
  }
  else {
    // The lengths form a complete code. Now, enumerate the codewords in lexicographic order and fill the decode
    // table entries for each one.
    //
    // First, process all codewords with len <= table_bits. Each one gets '2^(table_bits-len)' direct entries in
    // the table. Since codewords are processed in order, the direct entries are filled by filling the entries of
    // the current (possibly shorter) table and then doubling the table size by copying it, which keeps the
    // replicated entries in place.
    uint32_t codeword = 0; // Current codeword, bit-reversed.
    uint32_t len = 1;      // Current codeword length in bits.
    uint32_t count;        // Num codewords remaining with this length.

    while ((count = len_counts[len]) == 0) {
      len++;
    }

    // End index of current table.
    uint32_t cur_table_end = 1u << len;

    while (len <= table_bits) {
      // Process all 'count' codewords with length 'len' bits.
      do {
        decode_table[codeword] = make_top_entry(decode_results[*sorted_syms++], len);

        if (codeword == cur_table_end - 1) {
          // Last codeword (all 1's).
          for (; len < table_bits; len++) {
            memcpy(&decode_table[cur_table_end], decode_table, cur_table_end * sizeof(DecodeEntry));
            cur_table_end <<= 1;
          }
          goto Done;
        }

        // To advance to the lexicographically next codeword in the canonical code, the codeword must be incremented,
        // then 0's must be appended to the codeword as needed to match the next codeword's length. Since the
        // codeword is bit-reversed, incrementing is done by flipping the highest zero bit and clearing the bits above.
        uint32_t bit = 1u << (31 - IntOps::clz(codeword ^ (cur_table_end - 1)));
        codeword &= bit - 1;
        codeword |= bit;
      } while (--count);

      // Advance to the next codeword length.
      do {
        if (++len <= table_bits) {
          memcpy(&decode_table[cur_table_end], decode_table, cur_table_end * sizeof(DecodeEntry));
          cur_table_end <<= 1;
        }
      } while ((count = len_counts[len]) == 0);
    }

    // Process codewords with len > table_bits. These require subtables.
    cur_table_end = 1u << table_bits;

    uint32_t subtable_start = 0;            // Start index of current subtable.
    uint32_t subtable_prefix = 0xFFFFFFFFu; // Codeword prefix of current subtable.

    for (;;) {
      // Start a new subtable if the first 'table_bits' bits of the codeword don't match the prefix of the current
      // subtable.
      if ((codeword & DecoderUtils::mask32(table_bits)) != subtable_prefix) {
        subtable_prefix = codeword & DecoderUtils::mask32(table_bits);
        subtable_start = cur_table_end;

        // Calculate the subtable length. If the codeword has length 'table_bits + n', then the subtable needs
        // '2^n' entries. But it may need more; if fewer than '2^n' codewords of length 'table_bits + n' remain,
        // then the length will need to be incremented to bring in longer codewords until the subtable can be
        // completely filled.
        uint32_t subtable_bits = len - table_bits;
        codespace_used = count;

        ZC_NOUNROLL
        while (codespace_used < (1u << subtable_bits)) {
          subtable_bits++;
          codespace_used = (codespace_used << 1) + len_counts[table_bits + subtable_bits];
        }

        cur_table_end = subtable_start + (1u << subtable_bits);
        decode_table[subtable_prefix] = make_sub_link(subtable_start, table_bits, table_bits + subtable_bits);
      }

      // Fill the subtable entries for the current codeword.
      DecodeEntry entry = make_sub_entry(decode_results[*sorted_syms++], len);
      uint32_t i = subtable_start + (codeword >> table_bits);
      uint32_t stride = 1u << (len - table_bits);

      do {
        decode_table[i] = entry;
        i += stride;
      } while (i < cur_table_end);

      // Advance to the next codeword.
      if (codeword == DecoderUtils::mask32(len)) {
        break;
      }

      uint32_t bit = 1u << (31 - IntOps::clz(codeword ^ DecoderUtils::mask32(len)));
      codeword &= bit - 1;
      codeword |= bit;

      count--;
      while (count == 0) {
        count = len_counts[++len];
      }
    }
  }

Done:
  return DecodeTableInfo{uint8_t(table_bits), uint8_t(max_codeword_len)};
}

// Brings the running ADLER32 up to date with the decoded data, which is only verified by the zlib format.
static ZC_INLINE void update_checksum(Decoder* ctx, const ZCByteArray& dst) noexcept {
  if (ctx->_format != FormatType::kZlib || dst.size <= ctx->_checksum_offset) {
    return;
  }

  ctx->_adler32 = Checksum::adler32_update(ctx->_adler32, dst.data + ctx->_checksum_offset, dst.size - ctx->_checksum_offset);
  ctx->_checksum_offset = dst.size;
}

} // {anonymous}

// zc::Compression::Deflate - Decoder
// ==================================

ZCResult Decoder::init(FormatType format, DecoderOptions options) noexcept {
  _state = format == FormatType::kZlib ? DecoderState::kZlibHeader : DecoderState::kBlockHeader;
  _flags = DecoderFlags::kNone;
  _options = options;
  _format = format;

  _bit_word = 0;
  _bit_length = 0;
  _copy_remaining = 0;

  _litlen_symbol_count = 0;
  _offset_symbol_count = 0;
  _work_index = 0;
  _work_count = 0;

  _adler32 = Checksum::kAdler32Initial;
  _checksum_offset = SIZE_MAX;
  _output_start = SIZE_MAX;
  _processed_bytes = 0;

  _precode_table_info = DecodeTableInfo{};
  _litlen_table_info = DecodeTableInfo{};
  _offset_table_info = DecodeTableInfo{};

  return ZC_SUCCESS;
}

ZCResult Decoder::decode(ZCByteArray& dst, ZCDataView input) noexcept {
  // The first call defines where the decoded stream starts, everything before it isn't part of the match history.
  if (_output_start == SIZE_MAX) {
    _output_start = dst.size;
    _checksum_offset = dst.size;
  }

  uint8_t* dst_start = dst.data;
  uint8_t* dst_ptr = dst_start + dst.size;
  uint8_t* dst_end = dst_start + dst.capacity;

  const uint8_t* src_data = input.data;
  const uint8_t* src_ptr = src_data;
  const uint8_t* src_end = src_data + input.size;

  DecodeTables& tables = _tables;
  DecoderBits bits;
  DecoderState state = _state;

  bits.load_state(this);

  for (;;) {
    ZC_NOUNROLL
    while (src_ptr != src_end && bits.can_refill_byte()) {
      bits.refill_byte(*src_ptr++);
    }

    switch (state) {
      // Zlib Header
      // -----------

      case DecoderState::kZlibHeader: {
        if (ZC_UNLIKELY(bits.length() < 16u)) {
          goto NotEnoughInputBytes;
        }

        uint32_t cmf = bits.extract<0>(8); // CMF (8 bits) - Compression method & info.
        uint32_t flg = bits.extract<8>(8); // FLG (8 bits) - Zlib flags.
        uint32_t fdict = (flg >> 5) & 0x1u;

        if (ZC_UNLIKELY(((cmf << 8) + flg) % 31u != 0u))
          goto ErrorInvalidData;

        // Only DEFLATE with window size up to 32kB is defined.
        if (ZC_UNLIKELY((cmf & 0xFu) != 8u || (cmf >> 4) > 7u))
          goto ErrorInvalidData;

        // Preset dictionaries are not supported.
        if (ZC_UNLIKELY(fdict))
          goto ErrorInvalidData;

        bits.consumed(16);
        state = DecoderState::kBlockHeader;
        continue;
      }

      // Block Header
      // ------------

      case DecoderState::kBlockHeader: {
        if (ZC_UNLIKELY(bits.length() < 3u)) {
          goto NotEnoughInputBytes;
        }

        uint32_t final_block = bits.extract<0>(1); // BFINAL (1 bit) - Final block flag.
        uint32_t block_type = bits.extract<1>(2);  // BTYPE (2 bits) - Type of the block.

        static constexpr uint8_t next_state[4] = {
          uint8_t(DecoderState::kUncompressedHeader),   // Uncompressed.
          uint8_t(DecoderState::kStaticHuffmanHeader),  // Static Huffman.
          uint8_t(DecoderState::kDynamicHuffmanHeader), // Dynamic Huffman.
          uint8_t(0)                                    // Invalid.
        };

        if (block_type == 3) {
          goto ErrorInvalidData;
        }

        bits.consumed(3);
        state = DecoderState(next_state[block_type]);

        if (final_block) {
          _flags |= DecoderFlags::kFinalBlock;
        }

        if (block_type == uint32_t(BlockType::kUncompressed)) {
          bits.make_byte_aligned();
        }

        continue;
      }

      // Uncompressed Block Header
      // -------------------------

      case DecoderState::kUncompressedHeader: {
        ZC_ASSERT(bits.is_byte_aligned());

        if (ZC_UNLIKELY(bits.length() < 32u)) {
          goto NotEnoughInputBytes;
        }

        // The maximum number of bytes to copy is 65535.
        uint32_t len = bits.extract<0>(16);
        uint32_t len_check = bits.extract<16>(16) ^ 0xFFFFu;

        // len == nlen ^ 0xFFFF;
        if (ZC_UNLIKELY(len != len_check)) {
          goto ErrorInvalidData;
        }

        bits.consumed(32);

        // Allowed: "The uncompressed data size can range between 0 and 65535 bytes".
        if (ZC_UNLIKELY(len == 0u)) {
          goto BlockDone;
        }

        _copy_remaining = len;
        state = DecoderState::kCopyUncompressedBlock;
        continue;
      }

      // Static Huffman Block Header
      // ---------------------------

      case DecoderState::kStaticHuffmanHeader: {
        // Skip building the tables if they are already set up from an earlier static block; this speeds up
        // decompression of degenerate input of many empty or very short static blocks.
        if (zc_test_flag(_flags, DecoderFlags::kStaticTableActive)) {
          state = DecoderState::kDecompressHuffmanBlock;
          continue;
        }

        _flags |= DecoderFlags::kStaticTableActive;
        _litlen_symbol_count = kNumLitLenSymbols;
        _offset_symbol_count = kNumOffsetSymbols;

        uint32_t i;
        for (i = 0; i < 144; i++) {
          tables.lens[i] = 8;
        }

        for (; i < 256; i++) {
          tables.lens[i] = 9;
        }

        for (; i < 280; i++) {
          tables.lens[i] = 7;
        }

        for (; i < kNumLitLenSymbols; i++) {
          tables.lens[i] = 8;
        }

        for (; i < kNumLitLenSymbols + kNumOffsetSymbols; i++) {
          tables.lens[i] = 5;
        }

        goto BuildHuffmanTables;
      }

      // Dynamic Huffman Block Header
      // ----------------------------

      case DecoderState::kDynamicHuffmanHeader: {
        // HLIT (5 bits), HDIST (5 bits), HCLEN (4 bits), and the first 4 precode lengths, which are always present.
        constexpr uint32_t kHeaderPrecodeLens = 4u;
        constexpr uint32_t kHeaderMinLength = (5u + 5u + 4u) + (3u * kHeaderPrecodeLens);

        if (ZC_UNLIKELY(bits.length() < kHeaderMinLength)) {
          goto NotEnoughInputBytes;
        }

        _litlen_symbol_count = bits.extract<0>(5) + 257u;
        _offset_symbol_count = bits.extract<5>(5) + 1u;

        _flags &= ~DecoderFlags::kStaticTableActive;
        _work_index = kHeaderPrecodeLens;
        _work_count = bits.extract<10>(4) + 4u;

        memset(tables.precode_lens, 0, kNumPrecodeSymbols);
        tables.precode_lens[kPrecodeLensPermutation[0]] = uint8_t(bits.extract<14>(3));
        tables.precode_lens[kPrecodeLensPermutation[1]] = uint8_t(bits.extract<17>(3));
        tables.precode_lens[kPrecodeLensPermutation[2]] = uint8_t(bits.extract<20>(3));
        tables.precode_lens[kPrecodeLensPermutation[3]] = uint8_t(bits.extract<23>(3));

        bits.consumed(kHeaderMinLength);
        state = DecoderState::kDynamicHuffmanPreCodeLens;
        continue;
      }

      case DecoderState::kDynamicHuffmanPreCodeLens: {
        // At most 15 precode lengths remain (45 bits), which always fit the bit-buffer after a refill.
        uint32_t i = _work_index;
        uint32_t required_bits = (_work_count - i) * 3u;

        if (ZC_UNLIKELY(bits.length() < required_bits)) {
          goto NotEnoughInputBytes;
        }

        while (i != _work_count) {
          tables.precode_lens[kPrecodeLensPermutation[i]] = uint8_t(bits.extract<0>(3));
          bits.consumed(3);
          i++;
        }

        _work_index = 0;

        _precode_table_info = build_decode_table(
          tables.precode_decode_table.entries,
          tables.precode_lens,
          kNumPrecodeSymbols,
          kPrecodeDecodeResults,
          kDecoderPrecodeTableBits,
          kMaxPreCodeWordLen,
          DecodeTableType::kPrecode);

        if (_precode_table_info.table_bits == 0) {
          goto ErrorInvalidData;
        }

        state = DecoderState::kDynamicHuffmanLitLenOffsetCodes;
        continue;
      }

      case DecoderState::kDynamicHuffmanLitLenOffsetCodes: {
        // Decode the litlen and offset codeword lengths.
        {
          uint32_t i = _work_index;
          uint32_t count = _litlen_symbol_count + _offset_symbol_count;
          uint32_t precode_lookup_mask = DecoderUtils::mask32(_precode_table_info.table_bits);

          // The code below assumes that the pre-code decode table doesn't have any subtables.
          ZC_STATIC_ASSERT(kDecoderPrecodeTableBits == kMaxPreCodeWordLen);

          do {
            while (bits.can_refill_byte() && src_ptr != src_end) {
              bits.refill_byte(*src_ptr++);
            }

            DecodeEntry entry = tables.precode_decode_table[bits & precode_lookup_mask];

            uint32_t presym = DecoderUtils::precode_value(entry);
            uint32_t entry_len = DecoderUtils::full_length(entry);

            if (ZC_UNLIKELY(bits.length() < entry_len)) {
              _work_index = i;
              goto NotEnoughInputBytes;
            }

            // Explicit codeword length.
            if (presym < 16u) {
              tables.lens[i++] = uint8_t(presym);
              bits.consumed(entry_len);
              continue;
            }

            uint32_t n = (bits.extract(entry_len) >> DecoderUtils::base_length(entry)) + DecoderUtils::precode_repeat(entry);
            bits.consumed(entry_len);

            // The repeat count is not checked against the number of remaining lengths here, the lens array has
            // enough extra space for the worst-case overrun (138 zeros when only 1 length was remaining). The
            // final count is verified after the loop.
            ZC_STATIC_ASSERT(kMaxLensOverrun == 138 - 1);

            if (presym == 16) {
              // Repeat the previous length 3 - 6 times - this is invalid if this is the first entry.
              if (ZC_UNLIKELY(i == 0)) {
                goto ErrorInvalidData;
              }

              uint8_t v = tables.lens[i - 1];
              memset(tables.lens + i, v, 6);
              i += n;
            }
            else if (presym == 17) {
              // Repeat zero 3 - 10 times.
              memset(tables.lens + i, 0, 10);
              i += n;
            }
            else {
              // Repeat zero 11 - 138 times.
              memset(tables.lens + i, 0, n);
              i += n;
            }
          } while (i < count);

          // A repeat that overruns the number of lengths is invalid (compatible with both zlib and libdeflate).
          if (ZC_UNLIKELY(i != count)) {
            goto ErrorInvalidData;
          }

          _work_index = 0;

          // The end-of-block symbol must have a codeword, otherwise the block could never end.
          if (ZC_UNLIKELY(tables.lens[kEndOfBlock] == 0)) {
            goto ErrorInvalidData;
          }
        }

BuildHuffmanTables:
        // The offset table must be built first as 'lens' share the memory with the litlen table.
        _offset_table_info = build_decode_table(
          tables.offset_decode_table.entries,
          tables.lens + _litlen_symbol_count,
          _offset_symbol_count,
          kOffsetDecodeResults,
          kDecoderOffsetTableBits,
          kMaxOffsetCodeWordLen,
          DecodeTableType::kOffset);

        if (_offset_table_info.table_bits == 0) {
          goto ErrorInvalidData;
        }

        _litlen_table_info = build_decode_table(
          tables.litlen_decode_table.entries,
          tables.lens,
          _litlen_symbol_count,
          kLitLenDecodeResults,
          kDecoderLitLenTableBits,
          kMaxLitLenCodeWordLen,
          DecodeTableType::kLitLen);

        if (_litlen_table_info.table_bits == 0) {
          goto ErrorInvalidData;
        }

        state = DecoderState::kDecompressHuffmanBlock;
        continue;
      }

      // Compressed Block
      // ----------------

      case DecoderState::kDecompressHuffmanBlock: {
        _copy_remaining = 0;

        DecoderTableMask litlen_table_mask(_litlen_table_info.table_bits);
        DecoderTableMask offset_table_mask(_offset_table_info.table_bits);

        const uint8_t* window_start = dst_start + _output_start;

        // This loop is safe when it comes to both source and destination buffers - it cannot read after `src_end`
        // and it cannot write after `dst_end`. Each iteration refills the bit-buffer to at least 57 bits (unless the
        // input is exhausted), which is enough to decode a complete match, so a match is either decoded completely
        // or not at all. An incomplete symbol restores the bit-buffer and leaves the loop to wait for more input.
        for (;;) {
          while (bits.can_refill_byte() && src_ptr != src_end) {
            bits.refill_byte(*src_ptr++);
          }

          DecodeEntry entry = tables.litlen_decode_table[bits.extract(litlen_table_mask)];
          DecoderBits saved_bits = bits;

          uint32_t base_len = DecoderUtils::base_length(entry);
          uint32_t length = DecoderUtils::payload_field(entry);

          if (DecoderUtils::is_literal(entry)) {
            if (ZC_UNLIKELY(dst_ptr == dst_end)) {
              goto NotEnoughOutputBytes;
            }

            if (ZC_UNLIKELY(bits.length() < base_len)) {
              goto NotEnoughInputBytes;
            }

            bits.consumed(base_len);
            *dst_ptr++ = uint8_t(length & 0xFFu);
            continue;
          }

          // End-of-block entries are treated as a subtable - the top-level entry has zero base length, so the
          // lookup below just lands on the same entry again. This keeps the length path free of extra branches.
          uint32_t full_len = DecoderUtils::full_length(entry);
          length += saved_bits.extract(full_len) >> base_len;

          if (ZC_UNLIKELY(!DecoderUtils::is_off_or_len(entry))) {
            entry = tables.litlen_decode_table[length];
            length = DecoderUtils::payload_field(entry);
            full_len = DecoderUtils::full_length(entry);

            if (bits.length() < full_len) {
              goto NotEnoughInputBytes;
            }

            if (DecoderUtils::is_literal(entry)) {
              if (ZC_UNLIKELY(dst_ptr == dst_end)) {
                goto NotEnoughOutputBytes;
              }

              bits.consumed(full_len);
              *dst_ptr++ = uint8_t(length & 0xFFu);
              continue;
            }

            length += saved_bits.extract_extra(entry);

            if (ZC_UNLIKELY(DecoderUtils::is_end_of_block(entry))) {
              bits.consumed(full_len);

              if (ZC_LIKELY(!DecoderUtils::is_end_of_block_invalid(entry)))
                goto BlockDone;
              else
                goto ErrorInvalidData;
            }
          }

          // Length decoded - `length` now holds the match length.
          if (ZC_UNLIKELY(bits.length() < full_len)) {
            goto NotEnoughInputBytes;
          }

          if (ZC_UNLIKELY(PtrOps::bytes_until(dst_ptr, dst_end) < length)) {
            _copy_remaining = length;
            goto NotEnoughOutputBytes;
          }

          bits.consumed(full_len);

          entry = tables.offset_decode_table[bits.extract(offset_table_mask)];
          full_len = DecoderUtils::full_length(entry);
          uint32_t offset = DecoderUtils::payload_field(entry) + bits.extract_extra(entry);

          if (ZC_UNLIKELY(!DecoderUtils::is_off_or_len(entry))) {
            entry = tables.offset_decode_table[offset];
            full_len = DecoderUtils::full_length(entry);
            offset = DecoderUtils::payload_field(entry) + bits.extract_extra(entry);

            if (ZC_UNLIKELY(DecoderUtils::is_end_of_block(entry))) {
              if (bits.length() < full_len) {
                bits = saved_bits;
                goto NotEnoughInputBytes;
              }
              goto ErrorInvalidData;
            }
          }

          if (ZC_UNLIKELY(bits.length() < full_len)) {
            // The bit-buffer holds a complete match unless the input is exhausted - decode it again once there
            // is more input.
            bits = saved_bits;
            goto NotEnoughInputBytes;
          }

          bits.consumed(full_len);

          size_t window_size = PtrOps::byte_offset(window_start, dst_ptr);
          if (ZC_UNLIKELY(offset > window_size)) {
            goto ErrorInvalidData;
          }

          const uint8_t* match_ptr = dst_ptr - offset;
          const uint8_t* match_end = match_ptr + length;

          // Overlapping copies must be done byte by byte, they repeat the recently decoded sequence.
          ZC_STATIC_ASSERT(kMinMatchLen == 3);
          *dst_ptr++ = *match_ptr++;
          *dst_ptr++ = *match_ptr++;

          do {
            *dst_ptr++ = *match_ptr++;
          } while (match_ptr != match_end);
        }
      }

      // Uncompressed Block
      // ------------------

      case DecoderState::kCopyUncompressedBlock: {
        ZC_ASSERT(bits.is_byte_aligned());
        ZC_ASSERT(_copy_remaining != 0u);

        if (ZC_UNLIKELY(PtrOps::bytes_until(dst_ptr, dst_end) < _copy_remaining)) {
          goto NotEnoughOutputBytes;
        }

        // Bytes that were already refilled to the bit-buffer must be copied first.
        if (!bits.is_empty()) {
          size_t n = zc_min<size_t>(_copy_remaining, bits.length() >> 3u);

          if (n) {
            _copy_remaining -= n;

            do {
              *dst_ptr++ = uint8_t(bits & 0xFFu);
              bits.consumed(8);
            } while (--n);
          }

          if (_copy_remaining == 0) {
            goto BlockDone;
          }
        }

        size_t n = zc_min<size_t>(_copy_remaining, PtrOps::bytes_until(src_ptr, src_end));
        if (n == 0) {
          goto NotEnoughInputBytes;
        }

        memcpy(dst_ptr, src_ptr, n);
        dst_ptr += n;
        src_ptr += n;

        _copy_remaining -= n;
        if (_copy_remaining == 0) {
          goto BlockDone;
        }

        continue;
      }

      // Zlib Trailer
      // ------------

      case DecoderState::kZlibTrailer: {
        bits.make_byte_aligned();

        if (ZC_UNLIKELY(bits.length() < 32u)) {
          goto NotEnoughInputBytes;
        }

        // ADLER32 is stored in big endian byte order.
        uint32_t expected = (bits.extract<0>(8) << 24) |
                            (bits.extract<8>(8) << 16) |
                            (bits.extract<16>(8) << 8) |
                            (bits.extract<24>(8));
        bits.consumed(32);

        dst.size = PtrOps::byte_offset(dst_start, dst_ptr);
        update_checksum(this, dst);

        if (ZC_UNLIKELY(_adler32 != expected)) {
          goto ErrorInvalidData;
        }

        goto StreamDone;
      }

      // Other States
      // ------------

      case DecoderState::kDone: {
        dst.size = PtrOps::byte_offset(dst_start, dst_ptr);
        return ZC_SUCCESS;
      }

      case DecoderState::kInvalid:
      default: {
        return zc_make_error(ZC_ERROR_DECOMPRESSION_FAILED);
      }
    }

    // Hit when the destination is full and thus requires to grow.
NotEnoughOutputBytes:
    {
      size_t dst_size = PtrOps::byte_offset(dst_start, dst_ptr);
      dst.size = dst_size;

      // Save the current status so the exact state could be recovered in case that growing fails.
      _state = state;
      bits.store_state(this);

      _processed_bytes += PtrOps::byte_offset(src_data, src_ptr);
      src_data = src_ptr;

      // When decoding data where the uncompressed size is known it's desired to fail early if the stream
      // decompresses to more bytes than it should.
      if (zc_test_flag(_options, DecoderOptions::kNeverReallocOutputBuffer)) {
        update_checksum(this, dst);
        return zc_make_error(ZC_ERROR_BUF_TOO_SMALL);
      }

      // We can calculate the number of bytes required exactly if this is a last block, which is uncompressed.
      uint64_t size_estimate = dst_size;
      if (state == DecoderState::kCopyUncompressedBlock && zc_test_flag(_flags, DecoderFlags::kFinalBlock)) {
        size_estimate += _copy_remaining;
      }
      else {
        // Estimate the size of the rest of the current input chunk from the current compression ratio.
        size_t decoded_size = dst_size - _output_start;
        double estimated_ratio = _processed_bytes ? (double(decoded_size) / double(_processed_bytes)) + 0.05 : 4.0;

        uint64_t generic_estimate = zc_max<uint64_t>(decoded_size, 4096u);
        uint64_t chunk_estimate = uint64_t(double(PtrOps::bytes_until(src_ptr, src_end)) * estimated_ratio);

        size_estimate += zc_max<uint64_t>(zc_max<uint64_t>(generic_estimate, chunk_estimate) + 4096u, _copy_remaining);
      }

#if ZC_TARGET_ARCH_BITS < 64
      if (size_estimate > uint64_t(SIZE_MAX)) {
        return zc_make_error(ZC_ERROR_ALLOC_FAILED);
      }
#endif

      ZC_PROPAGATE(dst.reserve(size_t(size_estimate)));

      // Destination pointers were invalidated by reallocating `dst`.
      dst_start = dst.data;
      dst_ptr = dst_start + dst_size;
      dst_end = dst_start + dst.capacity;
      continue;
    }

BlockDone:
    if (!zc_test_flag(_flags, DecoderFlags::kFinalBlock)) {
      // Expect an additional block if this block was not the last.
      state = DecoderState::kBlockHeader;
      continue;
    }

    if (_format == FormatType::kZlib) {
      state = DecoderState::kZlibTrailer;
      continue;
    }

StreamDone:
    // The decoding is done - bytes that were refilled to the bit-buffer, but not consumed, are not processed.
    _processed_bytes += PtrOps::byte_offset(src_data, src_ptr);
    _processed_bytes -= bits.length() >> 3u;

    _state = DecoderState::kDone;
    _bit_word = 0;
    _bit_length = 0;

    dst.size = PtrOps::byte_offset(dst_start, dst_ptr);
    update_checksum(this, dst);
    return ZC_SUCCESS;
  }

  // A label where we jump in case we need more input bytes - the input chunk must be fully consumed - the only
  // non-consumed bits can be stored in the bit-buffer or in the decode tables of the decoder.
NotEnoughInputBytes:
  ZC_ASSERT(src_ptr == src_end);

  dst.size = PtrOps::byte_offset(dst_start, dst_ptr);
  update_checksum(this, dst);

  bits.store_state(this);
  _state = state;
  _processed_bytes += PtrOps::byte_offset(src_data, src_ptr);
  return ZC_ERROR_DATA_TRUNCATED;

  // Error in a bit-stream or malformed data - the decoding should never continue if this happens.
ErrorInvalidData:
  dst.size = PtrOps::byte_offset(dst_start, dst_ptr);

  bits.store_state(this);
  _state = DecoderState::kInvalid;
  _processed_bytes += PtrOps::byte_offset(src_data, src_ptr);

  return zc_make_error(ZC_ERROR_DECOMPRESSION_FAILED);
}

ZCResult Decoder::discard_history(ZCByteArray& dst, size_t* removed_out) noexcept {
  *removed_out = 0;

  if (dst.size <= kMaxWindowSize || _output_start == SIZE_MAX) {
    return ZC_SUCCESS;
  }

  size_t n = dst.size - kMaxWindowSize;
  update_checksum(this, dst);
  ZC_PROPAGATE(dst.remove_range(0, n));

  _output_start -= zc_min(_output_start, n);
  _checksum_offset -= zc_min(_checksum_offset, n);

  *removed_out = n;
  return ZC_SUCCESS;
}

ZCResult decode_all(ZCByteArray& dst, ZCModifyOp modify_op, ZCDataView input, FormatType format, DecoderOptions options) noexcept {
  if (zc_modify_op_is_assign(modify_op)) {
    ZC_PROPAGATE(dst.clear());
  }

  size_t prior_size = dst.size;

  Decoder decoder;
  ZC_PROPAGATE(decoder.init(format, options));

  ZCResult result = decoder.decode(dst, input);

  // The whole stream was passed, so an unfinished stream is an error here.
  if (result == ZC_ERROR_DATA_TRUNCATED) {
    result = zc_make_error(ZC_ERROR_DECOMPRESSION_FAILED);
  }

  if (result != ZC_SUCCESS) {
    ZC_PROPAGATE(dst.truncate(prior_size));
    return result;
  }

  return ZC_SUCCESS;
}

} // {zc::Compression::Deflate}
