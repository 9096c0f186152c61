// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_COMPRESSION_DEFLATEDECODER_P_H_INCLUDED
#define ZIPCORE_COMPRESSION_DEFLATEDECODER_P_H_INCLUDED

#include <zipcore/core/api-internal_p.h>
#include <zipcore/core/bytearray.h>
#include <zipcore/compression/deflatedefs_p.h>

//! \cond INTERNAL

namespace zc::Compression::Deflate {

//! Deflate decoder state.
enum class DecoderState : uint32_t {
  kZlibHeader,
  kBlockHeader,
  kUncompressedHeader,
  kStaticHuffmanHeader,
  kDynamicHuffmanHeader,
  kDynamicHuffmanPreCodeLens,
  kDynamicHuffmanLitLenOffsetCodes,

  kDecompressHuffmanBlock,
  kCopyUncompressedBlock,

  kZlibTrailer,

  kDone,
  kInvalid
};

//! Deflate decoder flags.
enum class DecoderFlags : uint8_t {
  //! No flags.
  kNone = 0u,

  //! Decompressing a final block (after the block ends the decompression is done).
  kFinalBlock = 0x01u,

  //! Static Huffman tables are active, which means they don't have to be recreated in case that additional static
  //! Huffman block is encountered immediately after the previous block.
  kStaticTableActive = 0x02u
};

ZC_DEFINE_ENUM_FLAGS(DecoderFlags)

//! Deflate decoder options that can be set by users.
enum class DecoderOptions : uint8_t {
  //! No options.
  kNone = 0,

  //! The output buffer has enough capacity for the decoded stream, thus the decoder should never realloc.
  //!
  //! Used when the uncompressed size is known in advance (ZIP entries, fixed size buffers), in which case the
  //! decoder fails with `ZC_ERROR_BUF_TOO_SMALL` as soon as the stream decodes to more bytes than expected.
  kNeverReallocOutputBuffer = 0x01u
};

ZC_DEFINE_ENUM_FLAGS(DecoderOptions)

// Number of main table bits used by each Huffman code, along with the worst-case number of entries including all
// subtables (computed by the `enough` utility from Zlib).
//
// The precode uses 7 bits, which is its maximum codeword length, so its table never needs subtables.
static constexpr uint32_t kDecoderPrecodeTableBits = 7;
static constexpr uint32_t kDecoderPrecodeTableEntries = 128; // ./enough 19 7 7.

static constexpr uint32_t kDecoderLitLenTableBits = 11;
static constexpr uint32_t kDecoderLitLenTableEntries = 2342; // ./enough 288 11 15.

static constexpr uint32_t kDecoderOffsetTableBits = 9;
static constexpr uint32_t kDecoderOffsetTableEntries = 594;  // ./enough 32 9 15.

//! Decode entry is an entry in a deflate decode table, which represents either a static or dynamic Huffman table.
//!
//! Literals are always checked first. When the entry is not a literal and not a length (or offset), it's always
//! a subtable pointer, which can point to itself. End-of-block and invalid entries are handled this way, which
//! keeps the number of branches in the decode loop low.
//!
//! - LitLen Table:
//!
//!   - Literal Entry:
//!      - Bits [31-28] -  4 bits - bit-length of the literal codeword.
//!      - Bits [27   ] -  1 bit  - literal flag (set).
//!      - Bits [25   ] -  1 bit  - offset | length flag (unset).
//!      - Bits [24   ] -  1 bit  - end of block flag (unset).
//!      - Bits [15-08] -  8 bits - literal value.
//!      - Bits [07-00] -  8 bits - bit-length of the literal codeword.
//!
//!   - Length Entry:
//!      - Bits [31-28] -  4 bits - base bit-length of the length entry (without extra bits).
//!      - Bits [25   ] -  1 bit  - offset | length flag (set).
//!      - Bits [22-08] - 15 bits - base length value (9 bits used).
//!      - Bits [07-00] -  8 bits - full bit-length of length entry.
//!
//!   - End of Block Entry:
//!      - Bits [31-28] -  4 bits - base bit-length of the end-of-block entry (zero if top entry).
//!      - Bits [24   ] -  1 bit  - end of block flag (set).
//!      - Bits [23   ] -  1 bit  - zero if valid end-of-block, non-zero if this entry is invalid.
//!      - Bits [07-00] -  8 bits - full bit-length of end-of-block entry.
//!
//!   - Subtable Pointer:
//!      - Bits [31-28] -  4 bits - base bit-length excluding the number of subtable index bits.
//!      - Bits [22-08] - 15 bits - subtable start (base) index (12 bits used).
//!      - Bits [07-00] -  8 bits - full bit-length including the number of subtable index bits.
//!
//! - Offset Table:
//!
//!   - Offset Entry:
//!      - Bits [31-28] -  4 bits - base bit-length of the offset entry excluding extra bits.
//!      - Bits [25   ] -  1 bit  - offset | length flag (set).
//!      - Bits [22-08] - 15 bits - offset value.
//!      - Bits [07-00] -  8 bits - full bit-length of the offset entry including extra bits.
//!
//!   - Subtable pointer: the same as in LitLen table.
//!
//! - Precode Table
//!
//!   - Precode Entry
//!      - Bits [31-28] -  4 bits - pre-code base length bits.
//!      - Bits [23-16] -  8 bits - pre-code repeat.
//!      - Bits [15-08] -  8 bits - pre-code value (only 5 bits used).
//!      - Bits [07-00] -  8 bits - pre-code entry bit-length including extra length bits.
struct DecodeEntry {
  uint32_t value;

  //! Shifts and sizes of packed decode entry values.
  enum Constants : uint32_t {
    kFullLengthOffset      = 0,    //!< Entry Full length (including extra) bit-offset.
    kFullLengthNBits       = 8,    //!< Entry Full length (including extra) bit-length.

    kBaseLengthOffset      = 28,   //!< Entry Base length (excluding extra) bit-offset.
    kBaseLengthNBits       = 4,    //!< Entry Base length (excluding extra) bit-length.

    kPayloadOffset         = 8,    //!< Entry payload bit-offset (shared between offset, length, and sub-table handling).
    kPayloadNBits          = 15,   //!< Entry payload bit-length (shared between offset, length, and sub-table handling).

    kEndOfBlockInvalidFlag = 1u << 23,
    kEndOfBlockFlag        = 1u << 24,
    kOffOrLenFlag          = 1u << 25,
    kLiteralFlag           = 1u << 27,

    kPrecodeValueOffset    = 8,    //!< Precode value bit-offset.
    kPrecodeValueNBits     = 8,    //!< Precode value bit-length (only 5 bits used)

    kPrecodeRepeatOffset   = 16,   //!< Precode repeat bit-offset.
    kPrecodeRepeatNBits    = 8     //!< Precode repeat bit-length (only 4 bits used).
  };
};

template<typename Entry, uint32_t Size>
struct DecodeTable {
  Entry entries[Size];

  ZC_INLINE_NODEBUG Entry& operator[](size_t index) noexcept {
    ZC_ASSERT(index < Size);
    return entries[index];
  }

  ZC_INLINE_NODEBUG const Entry& operator[](size_t index) const noexcept {
    ZC_ASSERT(index < Size);
    return entries[index];
  }
};

struct DecodeTables {
  // The arrays aren't all needed at the same time. 'precode_lens' and 'precode_decode_table' are unneeded after
  // 'lens' has been filled. Furthermore, 'lens' need not be retained after building the litlen and offset decode
  // tables. In fact, 'lens' can be in union with 'litlen_decode_table' provided that 'offset_decode_table' is
  // separate and is built first.
  union {
    uint8_t precode_lens[kNumPrecodeSymbols];
    struct {
      uint8_t lens[kNumLitLenSymbols + kNumOffsetSymbols + kMaxLensOverrun];
      DecodeTable<DecodeEntry, kDecoderPrecodeTableEntries> precode_decode_table;
    };
    struct {
      DecodeTable<DecodeEntry, kDecoderLitLenTableEntries> litlen_decode_table;
    };
  };

  DecodeTable<DecodeEntry, kDecoderOffsetTableEntries> offset_decode_table;
};

//! Information of a decode table that the decoder can take advantage of.
struct DecodeTableInfo {
  //! The number of table bits (table size in bits) - if this value is 0 the table is invalid.
  uint8_t table_bits;
  //! Maximum codeword bit-length.
  uint8_t max_code_len;
};

//! Streaming DEFLATE decoder.
//!
//! The decoder is stateful, the input can be passed in arbitrary chunks. When the current chunk is consumed and the
//! stream is not complete, `decode()` returns `ZC_ERROR_DATA_TRUNCATED` and the next call continues exactly where
//! the previous one stopped. All decoded bytes are appended to the destination, which must not be modified between
//! calls, because it's used as a history window for matches.
class Decoder {
public:
  ZC_NONCOPYABLE(Decoder)

  DecoderState _state {};                 // Decoder state - it's stateful to support data streaming.
  DecoderFlags _flags {};                 // Decoder flags - for example last block flag.
  DecoderOptions _options {};             // Decoder options.
  FormatType _format {};                  // Stream container (raw or zlib).

  uint64_t _bit_word {};                  // Bit-buffer of the decoder.
  size_t _bit_length {};                  // Bit-length of data in the bit-buffer.
  size_t _copy_remaining {};              // Bytes to copy from an uncompressed block (kCopyUncompressedBlock state).

  uint32_t _litlen_symbol_count {};       // Number of litlen symbols of a dynamic block.
  uint32_t _offset_symbol_count {};       // Number of offset symbols of a dynamic block.
  uint32_t _work_index {};                // Index of the item being processed (state dependent).
  uint32_t _work_count {};                // Number of items to process (state dependent).

  uint32_t _adler32 {};                   // Running ADLER32 of the decoded data (zlib format only).
  size_t _checksum_offset {};             // Offset in the destination up to which ADLER32 was calculated.
  size_t _output_start {};                // Size of the destination when the decoding started.
  uint64_t _processed_bytes {};           // Number of input bytes processed.

  DecodeTableInfo _precode_table_info {};
  DecodeTableInfo _litlen_table_info {};
  DecodeTableInfo _offset_table_info {};

  DecodeTables _tables;

  ZC_INLINE Decoder() noexcept {}

  //! Initializes the decoder to decode a stream of the given `format`.
  ZCResult init(FormatType format, DecoderOptions options = DecoderOptions::kNone) noexcept;

  //! Decodes the next `input` chunk and appends the decoded bytes to `dst`.
  //!
  //! Returns:
  //!   - `ZC_SUCCESS` when the end of the final block (and zlib trailer) was reached.
  //!   - `ZC_ERROR_DATA_TRUNCATED` when the input chunk was consumed and more input is required.
  //!   - `ZC_ERROR_DECOMPRESSION_FAILED` when the stream is invalid (the decoder cannot continue).
  //!   - `ZC_ERROR_BUF_TOO_SMALL` when `kNeverReallocOutputBuffer` is set and the stream doesn't fit `dst`.
  ZCResult decode(ZCByteArray& dst, ZCDataView input) noexcept;

  //! Discards decoded bytes at the beginning of `dst` while keeping enough bytes for the match history.
  //!
  //! This is used by streaming consumers that emit decoded data as it's produced and don't want the destination
  //! to grow indefinitely. Returns the number of bytes removed.
  ZCResult discard_history(ZCByteArray& dst, size_t* removed_out) noexcept;

  ZC_INLINE_NODEBUG bool is_done() const noexcept { return _state == DecoderState::kDone; }
};

//! Decodes a complete DEFLATE `input` stream of `format` and appends or assigns the result to `dst`.
//!
//! A stream that ends before its final block is reported as `ZC_ERROR_DECOMPRESSION_FAILED`.
ZCResult decode_all(ZCByteArray& dst, ZCModifyOp modify_op, ZCDataView input, FormatType format, DecoderOptions options = DecoderOptions::kNone) noexcept;

} // {zc::Compression::Deflate}

//! \endcond

#endif // ZIPCORE_COMPRESSION_DEFLATEDECODER_P_H_INCLUDED
