// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zipcore/core/api-build_test_p.h>
#if defined(ZC_TEST)

#include <zipcore/core/bytearray.h>
#include <zipcore/compression/checksum_p.h>
#include <zipcore/compression/deflatedecoder_p.h>
#include <zipcore/compression/deflatedefs_p.h>
#include <zipcore/compression/deflateencoder_p.h>
#include <zipcore/support/ptrops_p.h>

#include <string.h>

// zc::Compression - Deflate - Tests
// =================================

namespace zc::Compression::Tests {

enum class TestStrategy {
  kWholeData = 0,
  kChunkedData = 1,
  kBytePerByte = 2,

  kMaxValue = kBytePerByte
};

enum class TestRandomMode {
  //! Random data where there are repeat sequences, to test both literals and lengths.
  kRandomDataWithRepeats = 0,
  //! Random data that only uses nibbles, but don't have repeat sequences - to test Huffman literals.
  kRandomDataWithNibbles = 1,
  //! Random data contains only two values (0x00 and 0xFF).
  kRandomDataWithTwoLiterals = 2,
  //! The whole input data contains zeros
  kAllZeros = 3,

  kMaxValue = kAllZeros
};

static const char* stringify_strategy(TestStrategy strategy) noexcept {
  switch (strategy) {
    case TestStrategy::kWholeData: return "whole data";
    case TestStrategy::kChunkedData: return "chunked data";
    case TestStrategy::kBytePerByte: return "byte per byte";
    default:
      return "unknown";
  }
}

static const char* stringify_random_mode(TestRandomMode mode) noexcept {
  switch (mode) {
    case TestRandomMode::kRandomDataWithRepeats: return "repeats";
    case TestRandomMode::kRandomDataWithNibbles: return "nibbles";
    case TestRandomMode::kRandomDataWithTwoLiterals: return "two-literals";
    case TestRandomMode::kAllZeros: return "zeros";
    default:
      return "unknown";
  }
}

// Deterministic xorshift generator, the same seed always produces the same data.
class TestRandom {
public:
  uint64_t _state;

  explicit TestRandom(uint64_t seed) noexcept : _state(seed * 0x9E3779B97F4A7C15u + 1u) {}

  uint64_t next_uint64() noexcept {
    uint64_t x = _state;
    x ^= x << 13;
    x ^= x >> 7;
    x ^= x << 17;
    _state = x;
    return x;
  }

  uint32_t next_uint32() noexcept { return uint32_t(next_uint64() >> 32); }
};

class SimpleBitWriter {
public:
  ZCByteArray& dst;
  uint64_t bit_word {};
  size_t bit_length {};

  explicit SimpleBitWriter(ZCByteArray& dst) noexcept : dst(dst) {}
  ~SimpleBitWriter() noexcept { finalize(); }

  void align_to_byte() noexcept {
    bit_length = (bit_length + 7u) & ~size_t(7);
  }

  void flush() noexcept {
    while (bit_length >= 8) {
      EXPECT_SUCCESS(dst.append(uint8_t(bit_word & 0xFFu)));
      bit_word >>= 8;
      bit_length -= 8;
    }
  }

  void finalize() noexcept {
    align_to_byte();
    flush();
  }

  void append(uint64_t bits, size_t n) noexcept {
    bit_word |= bits << bit_length;
    bit_length += n;
    flush();
  }
};

static ZCResult append_random_bytes(ZCByteArray& array, TestRandom& rnd, size_t n, TestRandomMode random_mode) noexcept {
  uint8_t* dst_data;
  ZC_PROPAGATE(array.modify_op(ZC_MODIFY_OP_APPEND_GROW, n, &dst_data));

  uint8_t* dst_ptr = dst_data;
  size_t i = n;

  switch (random_mode) {
    case TestRandomMode::kRandomDataWithRepeats: {
      while (i >= 4) {
        uint32_t cat = rnd.next_uint32();

        size_t pos = PtrOps::byte_offset(dst_data, dst_ptr);
        if ((cat & 0x7) == 0x7 && pos > 16) {
          // Repeat sequence of some past bytes.
          size_t offset = (size_t((cat >> 16)) % zc_min<size_t>(pos, 32767)) + 1;
          size_t length = zc_max<size_t>((((cat >> 8) & 0xFF) + 3) % i, 3u);
          size_t end = i - length;

          while (i != end) {
            dst_ptr[0] = dst_ptr[-intptr_t(offset)];
            dst_ptr++;
            i--;
          }
          continue;
        }

        uint32_t val = rnd.next_uint32();
        if (cat & 0x80000000u) {
          // Repeat sequence of a single byte.
          val = (val & 0xFFu) * 0x01010101u;
        }

        memcpy(dst_ptr, &val, 4);
        dst_ptr += 4;
        i -= 4;
      }

      if (i) {
        uint32_t val = rnd.next_uint32();
        memcpy(dst_ptr, &val, i);
      }
      break;
    }

    case TestRandomMode::kRandomDataWithNibbles: {
      while (i) {
        uint64_t val = rnd.next_uint64() & 0x0F0F0F0F0F0F0F0Fu;
        size_t n_bytes = zc_min<size_t>(i, 8u);

        memcpy(dst_ptr, &val, n_bytes);
        dst_ptr += n_bytes;
        i -= n_bytes;
      }
      break;
    }

    case TestRandomMode::kRandomDataWithTwoLiterals: {
      while (i) {
        uint64_t val = (rnd.next_uint64() & 0x0101010101010101u) * 0xFFu;
        size_t n_bytes = zc_min<size_t>(i, 8u);

        memcpy(dst_ptr, &val, n_bytes);
        dst_ptr += n_bytes;
        i -= n_bytes;
      }
      break;
    }

    case TestRandomMode::kAllZeros: {
      memset(dst_ptr, 0, i);
      break;
    }
  }

  return ZC_SUCCESS;
}

static size_t compare_decoded_data(const uint8_t* a, const uint8_t* b, size_t n) noexcept {
  for (size_t i = 0; i < n; i++) {
    if (a[i] != b[i]) {
      return i;
    }
  }
  return SIZE_MAX;
}

static ZCResult decode_stream(Deflate::FormatType format, ZCDataView input, ZCByteArray& output) noexcept {
  Deflate::Decoder decoder;
  ZC_PROPAGATE(decoder.init(format));
  return decoder.decode(output, input);
}

static void test_deflate_roundtrip(ZCDataView input, Deflate::FormatType format, uint32_t compression_level, const char* test_data_name) {
  ZCByteArray encoded;

  {
    Deflate::Encoder encoder;
    ASSERT_SUCCESS(encoder.init(format, compression_level));
    ASSERT_SUCCESS(encoder.compress(encoded, ZC_MODIFY_OP_APPEND_GROW, input));
  }

  uint32_t max_strategy = input.size <= 4096u ? uint32_t(TestStrategy::kMaxValue) : uint32_t(TestStrategy::kChunkedData);

  for (uint32_t strategy_index = 0; strategy_index <= max_strategy; strategy_index++) {
    TestStrategy strategy = TestStrategy(strategy_index);

    Deflate::Decoder decoder;
    ASSERT_SUCCESS(decoder.init(format));

    ZCByteArray decoded;

    if (strategy == TestStrategy::kWholeData) {
      EXPECT_SUCCESS(decoder.decode(decoded, encoded.view()))
        << stringify_strategy(strategy) << "/" << test_data_name << " input.size=" << input.size << " level=" << compression_level;
    }
    else {
      size_t max_chunk_size = strategy == TestStrategy::kChunkedData ? (encoded.size + 15u) / 16u : 1;
      size_t i = 0;

      for (;;) {
        size_t chunk_size = zc_min<size_t>(encoded.size - i, max_chunk_size);
        ZCResult result = decoder.decode(decoded, ZCDataView{encoded.data + i, chunk_size});

        if (result == ZC_SUCCESS)
          break;

        if (result == ZC_ERROR_DATA_TRUNCATED) {
          i += chunk_size;
          if (i < encoded.size)
            continue;
        }

        ADD_FAILURE() << "Decompression failed (" << stringify_strategy(strategy) << "/" << test_data_name
                      << "): input.size=" << input.size << " encoded.size=" << encoded.size
                      << " result=" << zc_result_to_string(result);
        break;
      }
    }

    ASSERT_EQ(input.size, decoded.size)
      << stringify_strategy(strategy) << "/" << test_data_name << " level=" << compression_level;

    size_t mismatch_index = compare_decoded_data(input.data, decoded.data, input.size);
    EXPECT_EQ(mismatch_index, SIZE_MAX)
      << "Decoded data is invalid (" << stringify_strategy(strategy) << "/" << test_data_name << ") at offset=" << mismatch_index;
  }
}

static void test_deflate_random_data(size_t min_bytes, size_t max_bytes, size_t size_increment, uint32_t compression_level, TestRandomMode random_mode) {
  ZCByteArray input;

  for (size_t n = min_bytes; n <= max_bytes; n += size_increment) {
    ASSERT_SUCCESS(input.clear());

    TestRandom rnd(0x1234u + n * 33u);
    ASSERT_SUCCESS(append_random_bytes(input, rnd, n, random_mode));

    test_deflate_roundtrip(input.view(), Deflate::FormatType::kRaw, compression_level, stringify_random_mode(random_mode));
  }
}

// Handcrafted Streams
// -------------------

// The content of this test comes from a libdeflate test - `test_incomplete_codes.c`.
TEST(ZipCore_Compression, DeflateEmptyOffsetCode) {
  // A "dynamic Huffman" block containing literals, but no offsets; and having an empty offset code (all codeword
  // lengths set to 0).
  static const uint8_t expected[] = { uint8_t('A'), uint8_t('B'), uint8_t('A'), uint8_t('A') };

  // Litlen code:
  //   litlensym_A                   freq=3 len=1 codeword= 0
  //   litlensym_B                   freq=1 len=2 codeword=01
  //   litlensym_256 (end-of-block)  freq=1 len=2 codeword=11
  //
  // Precode:
  //   presym_0   freq=1 len=3 codeword=011
  //   presym_1   freq=1 len=3 codeword=111
  //   presym_2   freq=2 len=2 codeword= 01
  //   presym_18  freq=3 len=1 codeword=  0
  ZCByteArray input;
  {
    SimpleBitWriter writer(input);

    writer.append(1, 1);    // BFINAL: 1
    writer.append(2, 2);    // BTYPE: DYNAMIC_HUFFMAN
    writer.append(0, 5);    // num litlen symbols: 0 + 257
    writer.append(0, 5);    // num offset symbols: 0 + 1
    writer.append(14, 4);   // num explicit precode lens: 14 + 4

    // Precode codeword lengths in permutation order [16, 17, 18, 0, 8, 7, 9, 6, 10, 5, 11, 4, 12, 3, 13, 2, 14, 1, 15].
    writer.append(0, 3);    // presym_16: len=0
    writer.append(0, 3);    // presym_17: len=0
    writer.append(1, 3);    // presym_18: len=1
    writer.append(3, 3);    // presym_0 : len=3
    for (uint32_t i = 0; i < 11; i++) {
      writer.append(0, 3);  // presym_8 .. presym_13: len=0
    }
    writer.append(2, 3);    // presym_2 : len=2
    writer.append(0, 3);    // presym_14: len=0
    writer.append(3, 3);    // presym_1 : len=3

    // Litlen and offset codeword lengths:
    writer.append(0x0, 1);  // presym_18
    writer.append(54, 7);   // ... 11 + 54 zeroes
    writer.append(0x7, 3);  // presym_1
    writer.append(0x1, 2);  // presym_2
    writer.append(0x0, 1);  // presym_18,
    writer.append(89, 7);   // ... 11 + 89 zeroes
    writer.append(0x0, 1);  // presym_18
    writer.append(78, 7);   // ... 11 + 78 zeroes
    writer.append(0x1, 2);  // presym_2
    writer.append(0x3, 3);  // presym_0

    // Litlen symbols:
    writer.append(0x0, 1);  // litlensym_A
    writer.append(0x1, 2);  // litlensym_B
    writer.append(0x0, 1);  // litlensym_A
    writer.append(0x0, 1);  // litlensym_A
    writer.append(0x3, 2);  // litlensym_256 (end-of-block)
  }

  ZCByteArray output;
  EXPECT_SUCCESS(decode_stream(Deflate::FormatType::kRaw, input.view(), output));
  ASSERT_EQ(output.size, sizeof(expected));
  EXPECT_EQ(memcmp(output.data, expected, sizeof(expected)), 0);
}

// The content of this test comes from a libdeflate test - `test_incomplete_codes.c`.
TEST(ZipCore_Compression, DeflateSingletonLitLenCode) {
  // A litlen code containing only the end-of-block symbol (codeword length 1) is accepted.
  ZCByteArray input;
  {
    SimpleBitWriter writer(input);

    writer.append(1, 1);    // BFINAL: 1
    writer.append(2, 2);    // BTYPE: DYNAMIC_HUFFMAN
    writer.append(0, 5);    // num litlen symbols: 0 + 257
    writer.append(0, 5);    // num offset symbols: 0 + 1
    writer.append(14, 4);   // num explicit precode lens: 14 + 4

    writer.append(0, 3);    // presym_16: len=0
    writer.append(0, 3);    // presym_17: len=0
    writer.append(1, 3);    // presym_18: len=1
    writer.append(2, 3);    // presym_0 : len=2
    for (uint32_t i = 0; i < 13; i++) {
      writer.append(0, 3);  // presym_8 .. presym_14: len=0
    }
    writer.append(2, 3);    // presym_1 : len=2

    writer.append(0, 1);    // presym_18
    writer.append(117, 7);  // ... 11 + 117 zeroes
    writer.append(0, 1);    // presym_18
    writer.append(117, 7);  // ... 11 + 117 zeroes
    writer.append(0x3, 2);  // presym_1
    writer.append(0x1, 2);  // presym_0

    writer.append(0x0, 1);  // litlensym_256 (end-of-block)
  }

  ZCByteArray output;
  EXPECT_SUCCESS(decode_stream(Deflate::FormatType::kRaw, input.view(), output));
  EXPECT_EQ(output.size, 0u);
}

// The content of this test comes from a libdeflate test - `test_incomplete_codes.c`.
TEST(ZipCore_Compression, DeflateSingletonOffsetCode) {
  // An offset code containing only one symbol is accepted, even if that symbol is not symbol 0.
  static const uint8_t expected[] = { 254, 255, 254, 255, 254 };

  // Litlen code:
  //   litlensym_254                 len=2 codeword=00
  //   litlensym_255                 len=2 codeword=10
  //   litlensym_256 (end-of-block)  len=2 codeword=01
  //   litlensym_257 (len 3)         len=2 codeword=11
  //
  // Offset code:
  //   offsetsym_1 (offset 2)        len=1 codeword=0
  //
  // Precode:
  //   presym_0   len=2 codeword=00
  //   presym_1   len=2 codeword=10
  //   presym_2   len=2 codeword=01
  //   presym_18  len=2 codeword=11
  ZCByteArray input;
  {
    SimpleBitWriter writer(input);

    writer.append(1, 1);    // BFINAL: 1
    writer.append(2, 2);    // BTYPE: DYNAMIC_HUFFMAN
    writer.append(1, 5);    // num litlen symbols: 1 + 257
    writer.append(1, 5);    // num offset symbols: 1 + 1
    writer.append(14, 4);   // num explicit precode lens: 14 + 4

    writer.append(0, 3);    // presym_16: len=0
    writer.append(0, 3);    // presym_17: len=0
    writer.append(2, 3);    // presym_18: len=2
    writer.append(2, 3);    // presym_0 : len=2
    for (uint32_t i = 0; i < 11; i++) {
      writer.append(0, 3);  // presym_8 .. presym_13: len=0
    }
    writer.append(2, 3);    // presym_2 : len=2
    writer.append(0, 3);    // presym_14: len=0
    writer.append(2, 3);    // presym_1 : len=2

    writer.append(0x3, 2);  // presym_18
    writer.append(117, 7);  // ... 11 + 117 zeroes
    writer.append(0x3, 2);  // presym_18
    writer.append(115, 7);  // ... 11 + 115 zeroes
    writer.append(0x1, 2);  // presym_2
    writer.append(0x1, 2);  // presym_2
    writer.append(0x1, 2);  // presym_2
    writer.append(0x1, 2);  // presym_2
    writer.append(0x0, 2);  // presym_0
    writer.append(0x2, 2);  // presym_1

    writer.append(0x0, 2);  // litlensym_254
    writer.append(0x2, 2);  // litlensym_255
    writer.append(0x3, 2);  // litlensym_257
    writer.append(0x0, 1);  // offsetsym_1
    writer.append(0x1, 2);  // litlensym_256
  }

  ZCByteArray output;
  EXPECT_SUCCESS(decode_stream(Deflate::FormatType::kRaw, input.view(), output));
  ASSERT_EQ(output.size, sizeof(expected));
  EXPECT_EQ(memcmp(output.data, expected, sizeof(expected)), 0);
}

// The content of this test comes from a libdeflate test - `test_invalid_streams.c`.
TEST(ZipCore_Compression, DeflateTooManyCodewordLengths) {
  ZCByteArray input;
  {
    SimpleBitWriter writer(input);

    writer.append(1, 1);    // BFINAL: 1
    writer.append(2, 2);    // BTYPE: DYNAMIC_HUFFMAN
    writer.append(0, 5);    // num litlen symbols: 0 + 257
    writer.append(0, 5);    // num offset symbols: 0 + 1
    writer.append(14, 4);   // num explicit precode lens: 14 + 4

    writer.append(0, 3);    // presym_16: len=0
    writer.append(0, 3);    // presym_17: len=0
    writer.append(1, 3);    // presym_18: len=1
    for (uint32_t i = 0; i < 14; i++) {
      writer.append(0, 3);  // presym_0 .. presym_14: len=0
    }
    writer.append(1, 3);    // presym_1 : len=1

    writer.append(0x1, 1);  // presym_18
    writer.append(117, 7);  // ... 11 + 117 zeroes
    writer.append(0x1, 1);  // presym_18
    writer.append(116, 7);  // ... 11 + 116 zeroes
    writer.append(0x0, 1);  // presym_1
    writer.append(0x0, 1);  // presym_1
    writer.append(0x1, 1);  // presym_18
    writer.append(117, 7);  // ... 11 + 117 zeroes (too many)
    writer.append(0x1, 1);  // litlensym_256
  }

  ZCByteArray output;
  EXPECT_EQ(decode_stream(Deflate::FormatType::kRaw, input.view(), output), ZC_ERROR_DECOMPRESSION_FAILED);
}

TEST(ZipCore_Compression, DeflateInvalidBlockType) {
  // BFINAL=1, BTYPE=3 (reserved).
  static const uint8_t stream[] = { 0x07, 0x00, 0x00, 0x00 };

  ZCByteArray output;
  EXPECT_EQ(decode_stream(Deflate::FormatType::kRaw, ZCDataView{stream, sizeof(stream)}, output), ZC_ERROR_DECOMPRESSION_FAILED);
}

TEST(ZipCore_Compression, DeflateStoredBlock) {
  // BFINAL=1, BTYPE=0, LEN=5, NLEN=~5, "Hello".
  static const uint8_t valid[] = { 0x01, 0x05, 0x00, 0xFA, 0xFF, 'H', 'e', 'l', 'l', 'o' };
  static const uint8_t invalid_nlen[] = { 0x01, 0x05, 0x00, 0xFB, 0xFF, 'H', 'e', 'l', 'l', 'o' };

  ZCByteArray output;
  EXPECT_SUCCESS(decode_stream(Deflate::FormatType::kRaw, ZCDataView{valid, sizeof(valid)}, output));
  ASSERT_EQ(output.size, 5u);
  EXPECT_EQ(memcmp(output.data, "Hello", 5), 0);

  ZCByteArray output2;
  EXPECT_EQ(decode_stream(Deflate::FormatType::kRaw, ZCDataView{invalid_nlen, sizeof(invalid_nlen)}, output2), ZC_ERROR_DECOMPRESSION_FAILED);

  // Truncated stored block waits for more input.
  ZCByteArray output3;
  EXPECT_EQ(decode_stream(Deflate::FormatType::kRaw, ZCDataView{valid, 7}, output3), ZC_ERROR_DATA_TRUNCATED);

  ZCByteArray output4;
  EXPECT_EQ(Deflate::decode_all(output4, ZC_MODIFY_OP_ASSIGN_GROW, ZCDataView{valid, 7}, Deflate::FormatType::kRaw), ZC_ERROR_DECOMPRESSION_FAILED);
  EXPECT_EQ(output4.size, 0u);
}

TEST(ZipCore_Compression, DeflateOffsetBeforeStart) {
  // A static Huffman block that starts with a match - there is no history to copy from.
  ZCByteArray input;
  {
    SimpleBitWriter writer(input);

    writer.append(1, 1);    // BFINAL: 1
    writer.append(1, 2);    // BTYPE: STATIC_HUFFMAN
    writer.append(0x40, 7); // litlensym_257 (length 3), codeword 0000001 bit-reversed
    writer.append(0x00, 5); // offsetsym_0 (offset 1)
    writer.append(0x00, 7); // litlensym_256 (end-of-block)
  }

  ZCByteArray output;
  EXPECT_EQ(decode_stream(Deflate::FormatType::kRaw, input.view(), output), ZC_ERROR_DECOMPRESSION_FAILED);
}

TEST(ZipCore_Compression, DeflateInvalidOffsetSymbol) {
  // Offset symbols 30 and 31 take part in the static code, but must never appear in the data.
  ZCByteArray input;
  {
    SimpleBitWriter writer(input);

    writer.append(1, 1);    // BFINAL: 1
    writer.append(1, 2);    // BTYPE: STATIC_HUFFMAN
    writer.append(0x8E, 8); // literal 'A' (codeword 0x30 + 0x41 = 0x71, bit-reversed)
    writer.append(0x40, 7); // litlensym_257 (length 3)
    writer.append(0x0F, 5); // offsetsym_30 (codeword 11110, bit-reversed)
    writer.append(0x00, 7); // litlensym_256 (end-of-block)
  }

  ZCByteArray output;
  EXPECT_EQ(decode_stream(Deflate::FormatType::kRaw, input.view(), output), ZC_ERROR_DECOMPRESSION_FAILED);
}

TEST(ZipCore_Compression, DeflateZlibHeaderAndTrailer) {
  static const char text[] = "ZipCore zlib stream ZipCore zlib stream ZipCore zlib stream";
  ZCDataView input{reinterpret_cast<const uint8_t*>(text), sizeof(text) - 1};

  ZCByteArray encoded;
  {
    Deflate::Encoder encoder;
    ASSERT_SUCCESS(encoder.init(Deflate::FormatType::kZlib, 6));
    ASSERT_SUCCESS(encoder.compress(encoded, ZC_MODIFY_OP_ASSIGN_GROW, input));
  }

  ASSERT_GT(encoded.size, 6u);
  EXPECT_EQ(((uint32_t(encoded[0]) << 8) | encoded[1]) % 31u, 0u);
  EXPECT_EQ(encoded[0] & 0x0Fu, 8u);

  uint32_t adler = Checksum::adler32(input.data, input.size);
  const uint8_t* trailer = encoded.data + encoded.size - 4;
  EXPECT_EQ((uint32_t(trailer[0]) << 24) | (uint32_t(trailer[1]) << 16) | (uint32_t(trailer[2]) << 8) | uint32_t(trailer[3]), adler);

  {
    ZCByteArray output;
    EXPECT_SUCCESS(decode_stream(Deflate::FormatType::kZlib, encoded.view(), output));
    ASSERT_EQ(output.size, input.size);
    EXPECT_EQ(memcmp(output.data, input.data, input.size), 0);
  }

  // Corrupted header check bits.
  {
    ZCByteArray corrupted;
    ASSERT_SUCCESS(corrupted.assign_data(encoded.view()));
    corrupted.data[1] ^= 0x01u;

    ZCByteArray output;
    EXPECT_EQ(decode_stream(Deflate::FormatType::kZlib, corrupted.view(), output), ZC_ERROR_DECOMPRESSION_FAILED);
  }

  // Preset dictionary is not supported (FDICT set, check bits fixed).
  {
    ZCByteArray corrupted;
    ASSERT_SUCCESS(corrupted.assign_data(encoded.view()));

    uint32_t cmf = corrupted.data[0];
    uint32_t flg = (corrupted.data[1] & 0xC0u) | 0x20u;
    flg |= 31u - ((cmf << 8) | flg) % 31u;
    corrupted.data[1] = uint8_t(flg);

    ZCByteArray output;
    EXPECT_EQ(decode_stream(Deflate::FormatType::kZlib, corrupted.view(), output), ZC_ERROR_DECOMPRESSION_FAILED);
  }

  // Corrupted ADLER32 trailer.
  {
    ZCByteArray corrupted;
    ASSERT_SUCCESS(corrupted.assign_data(encoded.view()));
    corrupted.data[corrupted.size - 1] ^= 0x55u;

    ZCByteArray output;
    EXPECT_EQ(decode_stream(Deflate::FormatType::kZlib, corrupted.view(), output), ZC_ERROR_DECOMPRESSION_FAILED);
  }

  // Missing trailer means the stream is incomplete.
  {
    ZCByteArray output;
    EXPECT_EQ(decode_stream(Deflate::FormatType::kZlib, ZCDataView{encoded.data, encoded.size - 2}, output), ZC_ERROR_DATA_TRUNCATED);
  }
}

TEST(ZipCore_Compression, DeflateNeverReallocOutputBuffer) {
  ZCByteArray input;
  TestRandom rnd(42);
  ASSERT_SUCCESS(append_random_bytes(input, rnd, 10000, TestRandomMode::kRandomDataWithRepeats));

  ZCByteArray encoded;
  {
    Deflate::Encoder encoder;
    ASSERT_SUCCESS(encoder.init(Deflate::FormatType::kRaw, 6));
    ASSERT_SUCCESS(encoder.compress(encoded, ZC_MODIFY_OP_ASSIGN_GROW, input.view()));
  }

  // Exact capacity is fine.
  {
    ZCByteArray output;
    ASSERT_SUCCESS(output.reserve(input.size));

    Deflate::Decoder decoder;
    ASSERT_SUCCESS(decoder.init(Deflate::FormatType::kRaw, Deflate::DecoderOptions::kNeverReallocOutputBuffer));
    EXPECT_SUCCESS(decoder.decode(output, encoded.view()));
    EXPECT_TRUE(output == input);
  }

  // Smaller capacity fails instead of growing.
  {
    ZCByteArray output;
    ASSERT_SUCCESS(output.reserve(input.size / 2));
    size_t capacity = output.capacity;

    Deflate::Decoder decoder;
    ASSERT_SUCCESS(decoder.init(Deflate::FormatType::kRaw, Deflate::DecoderOptions::kNeverReallocOutputBuffer));
    EXPECT_EQ(decoder.decode(output, encoded.view()), ZC_ERROR_BUF_TOO_SMALL);
    EXPECT_EQ(output.capacity, capacity);
    EXPECT_LE(output.size, capacity);
  }
}

TEST(ZipCore_Compression, DeflateAppendMode) {
  static const char prefix[] = "prefix:";
  static const char text[] = "abcabcabcabcabcabcabcabcabcabcabc-xyz-xyz-xyz";

  ZCByteArray encoded;
  ASSERT_SUCCESS(encoded.assign_data(prefix, sizeof(prefix) - 1));

  {
    Deflate::Encoder encoder;
    ASSERT_SUCCESS(encoder.init(Deflate::FormatType::kRaw, 6));
    ASSERT_SUCCESS(encoder.compress(encoded, ZC_MODIFY_OP_APPEND_GROW, ZCDataView{reinterpret_cast<const uint8_t*>(text), sizeof(text) - 1}));
  }

  ASSERT_GT(encoded.size, sizeof(prefix) - 1);
  EXPECT_EQ(memcmp(encoded.data, prefix, sizeof(prefix) - 1), 0);

  // Decoded data is appended after existing content, which is not a part of the match history.
  ZCByteArray decoded;
  ASSERT_SUCCESS(decoded.assign_data(prefix, sizeof(prefix) - 1));

  ZCDataView stream{encoded.data + sizeof(prefix) - 1, encoded.size - (sizeof(prefix) - 1)};
  ASSERT_SUCCESS(Deflate::decode_all(decoded, ZC_MODIFY_OP_APPEND_GROW, stream, Deflate::FormatType::kRaw));

  ASSERT_EQ(decoded.size, sizeof(prefix) - 1 + sizeof(text) - 1);
  EXPECT_EQ(memcmp(decoded.data, prefix, sizeof(prefix) - 1), 0);
  EXPECT_EQ(memcmp(decoded.data + sizeof(prefix) - 1, text, sizeof(text) - 1), 0);
}

TEST(ZipCore_Compression, DeflateEmptyInput) {
  for (uint32_t level = 0; level <= Deflate::kMaxCompressionLevel; level++) {
    for (Deflate::FormatType format : { Deflate::FormatType::kRaw, Deflate::FormatType::kZlib }) {
      ZCByteArray encoded;
      Deflate::Encoder encoder;

      ASSERT_SUCCESS(encoder.init(format, level));
      ASSERT_SUCCESS(encoder.compress(encoded, ZC_MODIFY_OP_ASSIGN_GROW, ZCDataView{nullptr, 0}));
      EXPECT_GT(encoded.size, 0u);

      ZCByteArray decoded;
      EXPECT_SUCCESS(decode_stream(format, encoded.view(), decoded));
      EXPECT_EQ(decoded.size, 0u);
    }
  }
}

TEST(ZipCore_Compression, DeflateEncoderState) {
  Deflate::Encoder encoder;
  ZCByteArray dst;

  EXPECT_FALSE(encoder.is_initialized());
  EXPECT_EQ(encoder.compress(dst, ZC_MODIFY_OP_ASSIGN_GROW, ZCDataView{nullptr, 0}), ZC_ERROR_INVALID_STATE);

  uint32_t level = 0;
  EXPECT_SUCCESS(Deflate::resolve_compression_level(ZC_COMPRESSION_LEVEL_DEFAULT, &level));
  EXPECT_EQ(level, Deflate::kDefaultCompressionLevel);
  EXPECT_SUCCESS(Deflate::resolve_compression_level(ZC_COMPRESSION_LEVEL_UBER, &level));
  EXPECT_EQ(level, Deflate::kMaxCompressionLevel);
  EXPECT_EQ(Deflate::resolve_compression_level(11, &level), ZC_ERROR_INVALID_PARAMETER);
  EXPECT_EQ(Deflate::resolve_compression_level(-2, &level), ZC_ERROR_INVALID_PARAMETER);

  // Encoder state is allocated with a 64-byte alignment at every level.
  for (uint32_t i = 0; i <= Deflate::kMaxCompressionLevel; i++) {
    ASSERT_SUCCESS(encoder.init(Deflate::FormatType::kRaw, i));
    EXPECT_EQ(uintptr_t(encoder.impl) & 63u, 0u) << "level " << i;
    EXPECT_SUCCESS(encoder.compress(dst, ZC_MODIFY_OP_ASSIGN_GROW, ZCDataView{reinterpret_cast<const uint8_t*>("aaaaaaaa"), 8}));
    EXPECT_GT(dst.size, 0u);
    encoder.reset();
  }
}

TEST(ZipCore_Compression, DeflateDiscardHistory) {
  ZCByteArray input;
  TestRandom rnd(7);
  ASSERT_SUCCESS(append_random_bytes(input, rnd, 300000, TestRandomMode::kRandomDataWithRepeats));

  ZCByteArray encoded;
  {
    Deflate::Encoder encoder;
    ASSERT_SUCCESS(encoder.init(Deflate::FormatType::kZlib, 9));
    ASSERT_SUCCESS(encoder.compress(encoded, ZC_MODIFY_OP_ASSIGN_GROW, input.view()));
  }

  // Decode in chunks while emitting and discarding everything except the match history.
  Deflate::Decoder decoder;
  ASSERT_SUCCESS(decoder.init(Deflate::FormatType::kZlib));

  ZCByteArray window;
  ZCByteArray emitted;
  size_t emitted_in_window = 0;
  size_t i = 0;
  ZCResult result = ZC_ERROR_DATA_TRUNCATED;

  while (result == ZC_ERROR_DATA_TRUNCATED && i < encoded.size) {
    size_t chunk_size = zc_min<size_t>(encoded.size - i, 4099u);
    result = decoder.decode(window, ZCDataView{encoded.data + i, chunk_size});
    i += chunk_size;

    ASSERT_SUCCESS(emitted.append_data(window.data + emitted_in_window, window.size - emitted_in_window));
    emitted_in_window = window.size;

    size_t removed;
    ASSERT_SUCCESS(decoder.discard_history(window, &removed));
    emitted_in_window -= removed;
    EXPECT_LE(window.size, size_t(Deflate::kMaxWindowSize));
  }

  EXPECT_SUCCESS(result);
  EXPECT_TRUE(decoder.is_done());
  EXPECT_TRUE(emitted == input);
}

// Round Trips
// -----------

TEST(ZipCore_Compression, DeflateLitRunLen) {
  // The content of this test comes from a libdeflate test - `test_litrunlen_overflow.c`.
  //
  // Data longer than 65535 bytes where no 3-byte sequence is repeated within the window, so the compressor outputs
  // a compressed block containing more than 65535 consecutive literals.
  ZCByteArray arr;

  for (uint32_t i = 0; i < 2; i++) {
    for (uint32_t stride = 1; stride < 251u; stride++) {
      for (uint32_t multiple = 0; multiple < 251u; multiple++) {
        ASSERT_SUCCESS(arr.append(uint8_t((stride * multiple) % 251u)));
      }
    }
  }

  for (uint32_t level = 0; level <= Deflate::kMaxCompressionLevel; level++) {
    test_deflate_roundtrip(arr.view(), Deflate::FormatType::kRaw, level, "litrunlen");
  }
}

TEST(ZipCore_Compression, DeflateRoundTripSmall) {
  for (uint32_t level = 0; level <= Deflate::kMaxCompressionLevel; level++) {
    for (uint32_t mode = 0; mode <= uint32_t(TestRandomMode::kMaxValue); mode++) {
      test_deflate_random_data(1, 600, 7, level, TestRandomMode(mode));
    }
  }
}

TEST(ZipCore_Compression, DeflateRoundTripMedium) {
  for (uint32_t level = 0; level <= Deflate::kMaxCompressionLevel; level++) {
    for (uint32_t mode = 0; mode <= uint32_t(TestRandomMode::kMaxValue); mode++) {
      test_deflate_random_data(2000, 10000, 2333, level, TestRandomMode(mode));
    }
  }
}

TEST(ZipCore_Compression, DeflateRoundTripLarge) {
  for (uint32_t level : { 0u, 1u, 4u, 6u, 9u }) {
    test_deflate_random_data(100000, 500000, 199999, level, TestRandomMode::kRandomDataWithRepeats);
    test_deflate_random_data(100000, 500000, 199999, level, TestRandomMode::kRandomDataWithNibbles);
    test_deflate_random_data(300000, 300000, 1, level, TestRandomMode::kAllZeros);
  }
}

TEST(ZipCore_Compression, DeflateRoundTripZlib) {
  ZCByteArray input;
  TestRandom rnd(99);
  ASSERT_SUCCESS(append_random_bytes(input, rnd, 70000, TestRandomMode::kRandomDataWithRepeats));

  for (uint32_t level = 0; level <= Deflate::kMaxCompressionLevel; level++) {
    test_deflate_roundtrip(input.view(), Deflate::FormatType::kZlib, level, "zlib");
  }
}

} // {zc::Compression::Tests}

#endif // ZC_TEST
