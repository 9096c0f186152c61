// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_COMPRESSION_DEFLATEENCODER_P_H_INCLUDED
#define ZIPCORE_COMPRESSION_DEFLATEENCODER_P_H_INCLUDED

#include <zipcore/core/api-internal_p.h>
#include <zipcore/core/bytearray.h>
#include <zipcore/compression/deflatedefs_p.h>

//! \cond INTERNAL

namespace zc::Compression::Deflate {

struct EncoderImpl;

//! DEFLATE encoder.
//!
//! Level 0 emits stored blocks only, levels 1 to 4 use greedy parsing and levels 5 to 9 use lazy parsing. The
//! encoder compresses the whole input at once, so the complete input must be available when compressing.
class Encoder {
public:
  ZC_NONCOPYABLE(Encoder)

  EncoderImpl* impl;

  ZC_INLINE Encoder() noexcept : impl(nullptr) {}
  ZC_INLINE ~Encoder() noexcept { reset(); }

  ZC_INLINE bool is_initialized() const noexcept { return impl != nullptr; }

  //! Initializes the encoder to produce `format` at the given `compression_level` (0 to 9).
  ZCResult init(FormatType format, uint32_t compression_level) noexcept;
  void reset() noexcept;

  //! Returns the size of an output buffer that is always sufficient to compress `input_size` bytes.
  size_t minimum_output_buffer_size(size_t input_size) const noexcept;

  //! Compresses `input` into `output` and returns the number of bytes written or zero if the output buffer was
  //! too small.
  size_t compress_to(uint8_t* output, size_t output_size, const uint8_t* input, size_t input_size) noexcept;

  //! Compresses `input` and assigns or appends the result to `dst` depending on `modify_op`.
  ZCResult compress(ZCByteArray& dst, ZCModifyOp modify_op, ZCDataView input) noexcept;
};

//! Returns the worst-case size of a `format` stream produced from `input_size` bytes at any compression level.
size_t output_bound(FormatType format, size_t input_size) noexcept;

} // {zc::Compression::Deflate}

//! \endcond

#endif // ZIPCORE_COMPRESSION_DEFLATEENCODER_P_H_INCLUDED
