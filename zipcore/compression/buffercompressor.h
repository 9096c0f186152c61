// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_COMPRESSION_BUFFERCOMPRESSOR_H_INCLUDED
#define ZIPCORE_COMPRESSION_BUFFERCOMPRESSOR_H_INCLUDED

#include <zipcore/core/bytearray.h>

//! \addtogroup zc_compression
//! \{

//! \name Buffer Compressor C API
//!
//! Whole-buffer compression and decompression. The default format is a zlib wrapped DEFLATE stream (2 bytes header,
//! DEFLATE data, big-endian ADLER32 trailer). The `raw` variants produce and consume a bare DEFLATE stream, which is
//! what ZIP entries use.
//!
//! All functions either assign or append to `dst` depending on `modify_op`. When a function fails, `dst` keeps the
//! content it had before the call (appended bytes are discarded).
//!
//! Errors:
//!   - `ZC_ERROR_ALLOC_FAILED` - memory allocation failed.
//!   - `ZC_ERROR_BUF_TOO_SMALL` - the stream decompresses to more bytes than `uncompressed_size`.
//!   - `ZC_ERROR_DECOMPRESSION_FAILED` - the input is not a valid (or complete) stream.
//!   - `ZC_ERROR_INVALID_PARAMETER` - invalid compression level or a null input with non-zero size.
//!
//! \{

ZC_BEGIN_C_DECLS

//! Returns the maximum size of a zlib stream produced by \ref zc_compress() from `size` bytes.
ZC_API size_t ZC_CDECL zc_compress_bound(size_t size) ZC_NOEXCEPT_C;

//! Returns the maximum size of a raw DEFLATE stream produced by \ref zc_compress_raw() from `size` bytes.
ZC_API size_t ZC_CDECL zc_compress_raw_bound(size_t size) ZC_NOEXCEPT_C;

ZC_API ZCResult ZC_CDECL zc_compress(ZCByteArrayCore* dst, ZCModifyOp modify_op, const void* data, size_t size, int32_t level) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_compress_raw(ZCByteArrayCore* dst, ZCModifyOp modify_op, const void* data, size_t size, int32_t level) ZC_NOEXCEPT_C;

ZC_API ZCResult ZC_CDECL zc_uncompress(ZCByteArrayCore* dst, ZCModifyOp modify_op, const void* data, size_t size) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_uncompress_sized(ZCByteArrayCore* dst, ZCModifyOp modify_op, const void* data, size_t size, size_t uncompressed_size) ZC_NOEXCEPT_C;

ZC_API ZCResult ZC_CDECL zc_uncompress_raw(ZCByteArrayCore* dst, ZCModifyOp modify_op, const void* data, size_t size) ZC_NOEXCEPT_C;
ZC_API ZCResult ZC_CDECL zc_uncompress_raw_sized(ZCByteArrayCore* dst, ZCModifyOp modify_op, const void* data, size_t size, size_t uncompressed_size) ZC_NOEXCEPT_C;

ZC_END_C_DECLS

//! \}

#ifdef __cplusplus
//! \name Buffer Compressor C++ API
//! \{

//! Whole-buffer compression (wraps C API).
namespace ZCBufferCompressor {

static ZC_INLINE_NODEBUG size_t compress_bound(size_t size) noexcept {
  return zc_compress_bound(size);
}

static ZC_INLINE_NODEBUG size_t compress_raw_bound(size_t size) noexcept {
  return zc_compress_raw_bound(size);
}

//! Compresses `input` into a zlib stream at the given compression `level` and assigns it to `dst`.
static ZC_INLINE_NODEBUG ZCResult compress(ZCByteArray& dst, ZCDataView input, int32_t level = ZC_COMPRESSION_LEVEL_DEFAULT) noexcept {
  return zc_compress(&dst, ZC_MODIFY_OP_ASSIGN_FIT, input.data, input.size, level);
}

static ZC_INLINE_NODEBUG ZCResult compress(ZCByteArray& dst, ZCModifyOp modify_op, ZCDataView input, int32_t level = ZC_COMPRESSION_LEVEL_DEFAULT) noexcept {
  return zc_compress(&dst, modify_op, input.data, input.size, level);
}

//! Compresses `input` into a raw DEFLATE stream at the given compression `level` and assigns it to `dst`.
static ZC_INLINE_NODEBUG ZCResult compress_raw(ZCByteArray& dst, ZCDataView input, int32_t level = ZC_COMPRESSION_LEVEL_DEFAULT) noexcept {
  return zc_compress_raw(&dst, ZC_MODIFY_OP_ASSIGN_FIT, input.data, input.size, level);
}

static ZC_INLINE_NODEBUG ZCResult compress_raw(ZCByteArray& dst, ZCModifyOp modify_op, ZCDataView input, int32_t level = ZC_COMPRESSION_LEVEL_DEFAULT) noexcept {
  return zc_compress_raw(&dst, modify_op, input.data, input.size, level);
}

//! Decompresses a zlib stream `input` of unknown decompressed size and assigns the result to `dst`.
static ZC_INLINE_NODEBUG ZCResult uncompress(ZCByteArray& dst, ZCDataView input) noexcept {
  return zc_uncompress(&dst, ZC_MODIFY_OP_ASSIGN_FIT, input.data, input.size);
}

//! Decompresses a zlib stream `input` that decompresses to at most `uncompressed_size` bytes.
static ZC_INLINE_NODEBUG ZCResult uncompress(ZCByteArray& dst, ZCDataView input, size_t uncompressed_size) noexcept {
  return zc_uncompress_sized(&dst, ZC_MODIFY_OP_ASSIGN_FIT, input.data, input.size, uncompressed_size);
}

static ZC_INLINE_NODEBUG ZCResult uncompress_raw(ZCByteArray& dst, ZCDataView input) noexcept {
  return zc_uncompress_raw(&dst, ZC_MODIFY_OP_ASSIGN_FIT, input.data, input.size);
}

static ZC_INLINE_NODEBUG ZCResult uncompress_raw(ZCByteArray& dst, ZCDataView input, size_t uncompressed_size) noexcept {
  return zc_uncompress_raw_sized(&dst, ZC_MODIFY_OP_ASSIGN_FIT, input.data, input.size, uncompressed_size);
}

} // {ZCBufferCompressor}

//! \}
#endif

//! \}

#endif // ZIPCORE_COMPRESSION_BUFFERCOMPRESSOR_H_INCLUDED
