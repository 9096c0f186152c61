// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zipcore/core/api-build_p.h>
#include <zipcore/core/bytearray.h>
#include <zipcore/compression/buffercompressor.h>
#include <zipcore/compression/deflatedecoder_p.h>
#include <zipcore/compression/deflatedefs_p.h>
#include <zipcore/compression/deflateencoder_p.h>

namespace zc {
namespace BufferCompressorInternal {

// zc::BufferCompressor - Internals
// ================================

using Compression::Deflate::FormatType;

// Initial capacity used when the decompressed size is unknown. The decoder grows the buffer when the estimate
// is not enough.
static constexpr size_t kUnknownSizeRatio = 4u;
static constexpr size_t kUnknownSizeInitialLimit = size_t(1) << 26;

static ZCResult compress_impl(ZCByteArrayCore* self, ZCModifyOp modify_op, const void* data, size_t size, int32_t level, FormatType format) noexcept {
  ZCByteArray& dst = *static_cast<ZCByteArray*>(self);

  if (ZC_UNLIKELY(!data && size)) {
    return zc_make_error(ZC_ERROR_INVALID_PARAMETER);
  }

  uint32_t encoder_level;
  ZC_PROPAGATE(Compression::Deflate::resolve_compression_level(level, &encoder_level));

  Compression::Deflate::Encoder encoder;
  ZC_PROPAGATE(encoder.init(format, encoder_level));

  return encoder.compress(dst, modify_op, ZCDataView{static_cast<const uint8_t*>(data), size});
}

static ZCResult uncompress_impl(ZCByteArrayCore* self, ZCModifyOp modify_op, const void* data, size_t size, FormatType format) noexcept {
  ZCByteArray& dst = *static_cast<ZCByteArray*>(self);

  if (ZC_UNLIKELY(!data && size)) {
    return zc_make_error(ZC_ERROR_INVALID_PARAMETER);
  }

  if (zc_modify_op_is_assign(modify_op)) {
    ZC_PROPAGATE(dst.clear());
  }

  size_t estimate = zc_min(size, kUnknownSizeInitialLimit / kUnknownSizeRatio) * kUnknownSizeRatio;
  if (dst.capacity - dst.size < estimate) {
    ZC_PROPAGATE(dst.reserve(dst.size + estimate));
  }

  return Compression::Deflate::decode_all(dst, ZC_MODIFY_OP_APPEND_GROW, ZCDataView{static_cast<const uint8_t*>(data), size}, format);
}

static ZCResult uncompress_sized_impl(ZCByteArrayCore* self, ZCModifyOp modify_op, const void* data, size_t size, size_t uncompressed_size, FormatType format) noexcept {
  ZCByteArray& dst = *static_cast<ZCByteArray*>(self);

  if (ZC_UNLIKELY(!data && size)) {
    return zc_make_error(ZC_ERROR_INVALID_PARAMETER);
  }

  if (zc_modify_op_is_assign(modify_op)) {
    ZC_PROPAGATE(dst.clear());
  }

  size_t prior_size = dst.size;
  if (ZC_UNLIKELY(uncompressed_size > SIZE_MAX - prior_size)) {
    return zc_make_error(ZC_ERROR_ALLOC_FAILED);
  }

  ZC_PROPAGATE(dst.reserve(prior_size + uncompressed_size));
  ZC_PROPAGATE(Compression::Deflate::decode_all(dst, ZC_MODIFY_OP_APPEND_FIT, ZCDataView{static_cast<const uint8_t*>(data), size}, format,
                                                Compression::Deflate::DecoderOptions::kNeverReallocOutputBuffer));

  // The destination could have had a greater capacity than requested.
  if (ZC_UNLIKELY(dst.size - prior_size > uncompressed_size)) {
    ZC_PROPAGATE(dst.truncate(prior_size));
    return zc_make_error(ZC_ERROR_BUF_TOO_SMALL);
  }

  return ZC_SUCCESS;
}

} // {BufferCompressorInternal}
} // {zc}

// zc::BufferCompressor - API
// ==========================

ZC_API_IMPL size_t zc_compress_bound(size_t size) noexcept {
  return zc::Compression::Deflate::output_bound(zc::Compression::Deflate::FormatType::kZlib, size);
}

ZC_API_IMPL size_t zc_compress_raw_bound(size_t size) noexcept {
  return zc::Compression::Deflate::output_bound(zc::Compression::Deflate::FormatType::kRaw, size);
}

ZC_API_IMPL ZCResult zc_compress(ZCByteArrayCore* dst, ZCModifyOp modify_op, const void* data, size_t size, int32_t level) noexcept {
  using namespace zc::BufferCompressorInternal;
  return compress_impl(dst, modify_op, data, size, level, FormatType::kZlib);
}

ZC_API_IMPL ZCResult zc_compress_raw(ZCByteArrayCore* dst, ZCModifyOp modify_op, const void* data, size_t size, int32_t level) noexcept {
  using namespace zc::BufferCompressorInternal;
  return compress_impl(dst, modify_op, data, size, level, FormatType::kRaw);
}

ZC_API_IMPL ZCResult zc_uncompress(ZCByteArrayCore* dst, ZCModifyOp modify_op, const void* data, size_t size) noexcept {
  using namespace zc::BufferCompressorInternal;
  return uncompress_impl(dst, modify_op, data, size, FormatType::kZlib);
}

ZC_API_IMPL ZCResult zc_uncompress_sized(ZCByteArrayCore* dst, ZCModifyOp modify_op, const void* data, size_t size, size_t uncompressed_size) noexcept {
  using namespace zc::BufferCompressorInternal;
  return uncompress_sized_impl(dst, modify_op, data, size, uncompressed_size, FormatType::kZlib);
}

ZC_API_IMPL ZCResult zc_uncompress_raw(ZCByteArrayCore* dst, ZCModifyOp modify_op, const void* data, size_t size) noexcept {
  using namespace zc::BufferCompressorInternal;
  return uncompress_impl(dst, modify_op, data, size, FormatType::kRaw);
}

ZC_API_IMPL ZCResult zc_uncompress_raw_sized(ZCByteArrayCore* dst, ZCModifyOp modify_op, const void* data, size_t size, size_t uncompressed_size) noexcept {
  using namespace zc::BufferCompressorInternal;
  return uncompress_sized_impl(dst, modify_op, data, size, uncompressed_size, FormatType::kRaw);
}
