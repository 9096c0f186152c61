// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zipcore/core/api-build_p.h>
#include <zipcore/core/filesystem.h>
#include <zipcore/core/trace_p.h>
#include <zipcore/compression/checksum_p.h>
#include <zipcore/compression/deflatedecoder_p.h>
#include <zipcore/zip/zipformat_p.h>
#include <zipcore/zip/zipreader_p.h>

#include <new>

namespace zc {
namespace ZipReaderInternal {

// zc::ZipReader - Trace
// =====================

#if defined(ZC_TRACE_ZIP_ALL) || defined(ZC_TRACE_ZIP)
#define Trace ZCDebugTrace
#else
#define Trace ZCDummyTrace
#endif

using Zip::EntryRecord;

//! Size of a chunk of compressed data read at once during extraction.
static constexpr size_t kExtractChunkSize = 65536;

// zc::ZipReader - Utilities
// =========================

static ZC_INLINE ZCResult update_last_error(ZCZipReaderCore* self, ZCResult result) noexcept {
  if (result != ZC_SUCCESS)
    self->last_error_code = result;
  return result;
}

static ZCResult create_impl(ZCZipReaderCore* self, ZCZipReaderImpl** impl_out) noexcept {
  void* p = malloc(sizeof(ZCZipReaderImpl));
  ZC_RETURN_ERROR_IF_NULL(p);

  *impl_out = new(p) ZCZipReaderImpl();
  self->impl = *impl_out;
  return ZC_SUCCESS;
}

static void destroy_impl(ZCZipReaderCore* self) noexcept {
  ZCZipReaderImpl* impl = self->impl;
  if (impl) {
    impl->~ZCZipReaderImpl();
    free(impl);
    self->impl = nullptr;
  }
}

// zc::ZipReader - Central Directory
// =================================

static ZCResult read_central_dir(ZCZipReaderImpl* impl) noexcept {
  Trace trace;

  Zip::EndOfCentralDirInfo eocd {};
  ZC_PROPAGATE(Zip::read_end_of_central_dir(impl->source, &eocd));

  size_t cdir_size = size_t(eocd.cdir_size);
  size_t entry_count = size_t(eocd.entry_count);

  uint8_t* cdir_data;
  ZC_PROPAGATE(impl->central_dir.modify_op(ZC_MODIFY_OP_ASSIGN_FIT, cdir_size, &cdir_data));
  ZC_PROPAGATE(impl->source.read_at(eocd.cdir_ofs, cdir_data, cdir_size));

  uint8_t* record_data;
  ZC_PROPAGATE(impl->records.modify_op(ZC_MODIFY_OP_ASSIGN_FIT, entry_count * sizeof(EntryRecord), &record_data));

  EntryRecord* records = reinterpret_cast<EntryRecord*>(record_data);
  size_t offset = 0;

  if (entry_count && (cdir_size < 4u || MemOps::readU32uLE(cdir_data) != Zip::CentralDirHeader::kSignature)) {
    trace.fail("Central directory not found at %llu\n", (unsigned long long)eocd.cdir_ofs);
    return zc_make_error(ZC_ERROR_FAILED_FINDING_CENTRAL_DIR);
  }

  for (size_t i = 0; i < entry_count; i++) {
    ZC_PROPAGATE(Zip::parse_central_dir_record(impl->central_dir, offset, eocd.cdir_ofs, &records[i]));
    offset += records[i].record_size();
  }

  // The end record must describe all records present.
  if (cdir_size - offset >= 4u && MemOps::readU32uLE(cdir_data + offset) == Zip::CentralDirHeader::kSignature) {
    trace.fail("Central directory has more records than the end record describes [Count=%zu]\n", entry_count);
    return zc_make_error(ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);
  }

  impl->comment.swap(eocd.comment);
  impl->central_dir_ofs = eocd.cdir_ofs;

  trace.info("Central directory read [Entries=%zu]\n", entry_count);
  return ZC_SUCCESS;
}

static ZCResult finish_open(ZCZipReaderCore* self, ZCZipReaderImpl* impl, ZCZipReaderFlags flags) noexcept {
  impl->flags = flags;

  ZCResult result = read_central_dir(impl);
  if (result != ZC_SUCCESS) {
    destroy_impl(self);
    return result;
  }

  return ZC_SUCCESS;
}

// zc::ZipReader - Entry Data
// ==========================

static ZCResult check_index(const ZCZipReaderImpl* impl, uint32_t index) noexcept {
  if (ZC_UNLIKELY(!impl))
    return zc_make_error(ZC_ERROR_INVALID_STATE);

  if (ZC_UNLIKELY(index >= impl->entry_count()))
    return zc_make_error(ZC_ERROR_INVALID_PARAMETER);

  return ZC_SUCCESS;
}

static ZCResult check_supported(const EntryRecord& record) noexcept {
  if (record.is_encrypted())
    return zc_make_error(ZC_ERROR_UNSUPPORTED_ENCRYPTION);

  if (record.method != ZC_ZIP_METHOD_STORE && record.method != ZC_ZIP_METHOD_DEFLATE)
    return zc_make_error(ZC_ERROR_UNSUPPORTED_METHOD);

  if (record.bit_flag & Zip::kFlagUnsupportedMask)
    return zc_make_error(ZC_ERROR_UNSUPPORTED_FEATURE);

  return ZC_SUCCESS;
}

//! Reads the local header of `record` and returns the offset of its data.
static ZCResult read_local_header(ZCZipReaderImpl* impl, const EntryRecord& record, Zip::LocalFileHeader* header, uint64_t* data_ofs_out) noexcept {
  ZC_PROPAGATE(impl->source.read_at(record.local_header_ofs, header, Zip::LocalFileHeader::kBaseSize));

  if (ZC_UNLIKELY(header->signature() != Zip::LocalFileHeader::kSignature))
    return zc_make_error(ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);

  uint64_t data_ofs = record.local_header_ofs + Zip::LocalFileHeader::kBaseSize + header->name_size() + header->extra_size();
  if (ZC_UNLIKELY(!impl->source.contains(data_ofs, record.comp_size)))
    return zc_make_error(ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);

  *data_ofs_out = data_ofs;
  return ZC_SUCCESS;
}

// zc::ZipReader - Consumers
// =========================

// Consumers receive extracted data in order, `offset` is relative to the start of the entry.

struct MemoryConsumer {
  ZCByteArray& dst;

  ZC_INLINE ZCResult consume(uint64_t offset, const uint8_t* data, size_t size) noexcept {
    zc_unused(offset);
    return dst.append_data(data, size);
  }
};

struct BufferConsumer {
  uint8_t* buffer;
  size_t capacity;

  ZC_INLINE ZCResult consume(uint64_t offset, const uint8_t* data, size_t size) noexcept {
    if (ZC_UNLIKELY(offset > capacity || capacity - size_t(offset) < size))
      return zc_make_error(ZC_ERROR_BUF_TOO_SMALL);

    memcpy(buffer + size_t(offset), data, size);
    return ZC_SUCCESS;
  }
};

struct FileConsumer {
  ZCFile& file;

  ZC_INLINE ZCResult consume(uint64_t offset, const uint8_t* data, size_t size) noexcept {
    size_t bytes_written;
    ZC_PROPAGATE(file.write_at(offset, data, size, &bytes_written));

    if (ZC_UNLIKELY(bytes_written != size))
      return zc_make_error(ZC_ERROR_FILE_WRITE_FAILED);

    return ZC_SUCCESS;
  }
};

struct SinkConsumer {
  ZCZipSinkFunc sink;
  void* user_data;

  ZC_INLINE ZCResult consume(uint64_t offset, const uint8_t* data, size_t size) noexcept {
    if (ZC_UNLIKELY(sink(user_data, offset, data, size) != size))
      return zc_make_error(ZC_ERROR_WRITE_CALLBACK_FAILED);
    return ZC_SUCCESS;
  }
};

struct NullConsumer {
  ZC_INLINE ZCResult consume(uint64_t offset, const uint8_t* data, size_t size) noexcept {
    zc_unused(offset, data, size);
    return ZC_SUCCESS;
  }
};

// zc::ZipReader - Extraction
// ==========================

template<typename Consumer>
static ZCResult extract_stored(ZCZipReaderImpl* impl, const EntryRecord& record, uint64_t data_ofs, Compression::Checksum::Crc32Accumulator& crc, Consumer& consumer) noexcept {
  ZCByteArray chunk;
  ZC_PROPAGATE(chunk.reserve(size_t(zc_min<uint64_t>(record.comp_size, kExtractChunkSize))));

  uint64_t offset = 0;
  while (offset < record.comp_size) {
    size_t n = size_t(zc_min<uint64_t>(record.comp_size - offset, kExtractChunkSize));

    ZC_PROPAGATE(impl->source.read_at(data_ofs + offset, chunk.data, n));
    crc.update(chunk.data, n);
    ZC_PROPAGATE(consumer.consume(offset, chunk.data, n));

    offset += n;
  }

  return ZC_SUCCESS;
}

template<typename Consumer>
static ZCResult extract_deflated(ZCZipReaderImpl* impl, const EntryRecord& record, uint64_t data_ofs, Compression::Checksum::Crc32Accumulator& crc, Consumer& consumer, uint64_t* output_size_out) noexcept {
  Trace trace;
  *output_size_out = 0;

  // An empty entry without any data (some archivers emit these instead of an empty final block).
  if (record.comp_size == 0u)
    return ZC_SUCCESS;

  Compression::Deflate::Decoder decoder;
  ZC_PROPAGATE(decoder.init(Compression::Deflate::FormatType::kRaw));

  ZCByteArray chunk;
  ZCByteArray window;
  ZC_PROPAGATE(chunk.reserve(size_t(zc_min<uint64_t>(record.comp_size, kExtractChunkSize))));

  uint64_t input_ofs = 0;
  uint64_t output_ofs = 0;
  size_t emitted = 0;

  for (;;) {
    size_t n = size_t(zc_min<uint64_t>(record.comp_size - input_ofs, kExtractChunkSize));
    ZC_PROPAGATE(impl->source.read_at(data_ofs + input_ofs, chunk.data, n));
    input_ofs += n;

    ZCResult result = decoder.decode(window, ZCDataView{chunk.data, n});
    if (result != ZC_SUCCESS && result != ZC_ERROR_DATA_TRUNCATED) {
      trace.fail("Failed to decompress entry data at %llu\n", (unsigned long long)(data_ofs + input_ofs));
      return result;
    }

    size_t produced = window.size - emitted;
    if (ZC_UNLIKELY(record.uncomp_size - output_ofs < produced)) {
      trace.fail("Entry decompresses to more than %llu bytes\n", (unsigned long long)record.uncomp_size);
      return zc_make_error(ZC_ERROR_UNEXPECTED_DECOMPRESSED_SIZE);
    }

    if (produced) {
      crc.update(window.data + emitted, produced);
      ZC_PROPAGATE(consumer.consume(output_ofs, window.data + emitted, produced));
      output_ofs += produced;
      *output_size_out = output_ofs;
    }

    size_t removed;
    ZC_PROPAGATE(decoder.discard_history(window, &removed));
    emitted = window.size;

    if (result == ZC_SUCCESS)
      return ZC_SUCCESS;

    if (input_ofs == record.comp_size) {
      trace.fail("Entry data ends before the end of the compressed stream\n");
      return zc_make_error(ZC_ERROR_DECOMPRESSION_FAILED);
    }
  }
}

//! Extracts the entry at `index` through `consumer`, verifies its size and CRC32 (unless disabled).
template<typename Consumer>
static ZCResult extract_entry(ZCZipReaderImpl* impl, uint32_t index, ZCZipExtractFlags flags, Consumer& consumer) noexcept {
  const EntryRecord& record = impl->record(index);
  ZC_PROPAGATE(check_supported(record));

  Zip::LocalFileHeader header;
  uint64_t data_ofs;
  ZC_PROPAGATE(read_local_header(impl, record, &header, &data_ofs));

  Compression::Checksum::Crc32Accumulator crc;
  uint64_t output_size = 0;

  if (record.method == ZC_ZIP_METHOD_STORE) {
    ZC_PROPAGATE(extract_stored(impl, record, data_ofs, crc, consumer));
    output_size = record.comp_size;
  }
  else {
    ZC_PROPAGATE(extract_deflated(impl, record, data_ofs, crc, consumer, &output_size));
  }

  if (ZC_UNLIKELY(output_size != record.uncomp_size))
    return zc_make_error(ZC_ERROR_UNEXPECTED_DECOMPRESSED_SIZE);

  bool check_crc = !(impl->flags & ZC_ZIP_READER_FLAG_SKIP_CRC_CHECK) && !(flags & ZC_ZIP_EXTRACT_FLAG_SKIP_CRC_CHECK);
  if (check_crc && ZC_UNLIKELY(crc.value() != record.crc32))
    return zc_make_error(ZC_ERROR_CRC_CHECK_FAILED);

  return ZC_SUCCESS;
}

// zc::ZipReader - Validation
// ==========================

static ZCResult validate_entry(ZCZipReaderImpl* impl, uint32_t index) noexcept {
  Trace trace;
  const EntryRecord& record = impl->record(index);

  trace.info("zc::ZipReader::Validate [Index=%u]\n", index);
  trace.indent();

  Zip::LocalFileHeader header;
  uint64_t data_ofs;

  ZCResult result = read_local_header(impl, record, &header, &data_ofs);
  if (result == ZC_ERROR_INVALID_HEADER_OR_CORRUPTED) {
    trace.fail("Invalid local header or data outside of the archive\n");
    return zc_make_error(ZC_ERROR_VALIDATION_FAILED);
  }
  ZC_PROPAGATE(result);

  if (header.method() != record.method) {
    trace.fail("Local header method %u doesn't match central directory method %u\n", header.method(), record.method);
    return zc_make_error(ZC_ERROR_VALIDATION_FAILED);
  }

  if (header.name_size() != record.name_size) {
    trace.fail("Local header name doesn't match central directory name\n");
    return zc_make_error(ZC_ERROR_VALIDATION_FAILED);
  }

  if (record.name_size) {
    ZCByteArray local_name;
    uint8_t* local_name_data;

    ZC_PROPAGATE(local_name.modify_op(ZC_MODIFY_OP_ASSIGN_FIT, record.name_size, &local_name_data));
    ZC_PROPAGATE(impl->source.read_at(record.local_header_ofs + Zip::LocalFileHeader::kBaseSize, local_name_data, record.name_size));

    ZCDataView name = Zip::entry_name(impl->central_dir, record);
    if (memcmp(local_name_data, name.data, name.size) != 0) {
      trace.fail("Local header name doesn't match central directory name\n");
      return zc_make_error(ZC_ERROR_VALIDATION_FAILED);
    }
  }

  ZC_PROPAGATE(check_supported(record));

  NullConsumer consumer;
  result = extract_entry(impl, index, ZC_ZIP_EXTRACT_NO_FLAGS, consumer);

  switch (result) {
    case ZC_SUCCESS:
      return ZC_SUCCESS;

    case ZC_ERROR_DECOMPRESSION_FAILED:
    case ZC_ERROR_UNEXPECTED_DECOMPRESSED_SIZE:
    case ZC_ERROR_CRC_CHECK_FAILED:
      trace.fail("Entry data is corrupted [%s]\n", zc_result_to_string(result));
      return zc_make_error(ZC_ERROR_VALIDATION_FAILED);

    default:
      return result;
  }
}

} // {ZipReaderInternal}
} // {zc}

// zc::ZipReader - API - Construction & Destruction
// ================================================

ZC_API_IMPL ZCResult zc_zip_reader_init(ZCZipReaderCore* self) noexcept {
  self->impl = nullptr;
  self->last_error_code = ZC_SUCCESS;
  return ZC_SUCCESS;
}

ZC_API_IMPL ZCResult zc_zip_reader_destroy(ZCZipReaderCore* self) noexcept {
  zc::ZipReaderInternal::destroy_impl(self);
  return ZC_SUCCESS;
}

// zc::ZipReader - API - Open & Close
// ==================================

ZC_API_IMPL ZCResult zc_zip_reader_open_file(ZCZipReaderCore* self, const char* file_name, ZCZipReaderFlags flags) noexcept {
  using namespace zc::ZipReaderInternal;

  destroy_impl(self);

  ZCZipReaderImpl* impl;
  ZC_PROPAGATE(update_last_error(self, create_impl(self, &impl)));

  ZCResult result = impl->source.open_file(file_name);
  if (result != ZC_SUCCESS) {
    destroy_impl(self);
    return update_last_error(self, result);
  }

  return update_last_error(self, finish_open(self, impl, flags));
}

ZC_API_IMPL ZCResult zc_zip_reader_open_memory(ZCZipReaderCore* self, const void* data, size_t size, ZCZipReaderFlags flags) noexcept {
  using namespace zc::ZipReaderInternal;

  destroy_impl(self);

  if (ZC_UNLIKELY(!data && size))
    return update_last_error(self, zc_make_error(ZC_ERROR_INVALID_PARAMETER));

  ZCZipReaderImpl* impl;
  ZC_PROPAGATE(update_last_error(self, create_impl(self, &impl)));

  impl->source.open_memory(ZCDataView{static_cast<const uint8_t*>(data), size});
  return update_last_error(self, finish_open(self, impl, flags));
}

ZC_API_IMPL ZCResult zc_zip_reader_close(ZCZipReaderCore* self) noexcept {
  zc::ZipReaderInternal::destroy_impl(self);
  return ZC_SUCCESS;
}

// zc::ZipReader - API - Archive Information
// =========================================

ZC_API_IMPL bool zc_zip_reader_is_open(const ZCZipReaderCore* self) noexcept {
  return self->impl != nullptr;
}

ZC_API_IMPL uint32_t zc_zip_reader_get_entry_count(const ZCZipReaderCore* self) noexcept {
  return self->impl ? self->impl->entry_count() : 0u;
}

ZC_API_IMPL ZCResult zc_zip_reader_get_archive_comment(ZCZipReaderCore* self, ZCDataView* out) noexcept {
  using namespace zc::ZipReaderInternal;

  out->reset();
  if (ZC_UNLIKELY(!self->impl))
    return update_last_error(self, zc_make_error(ZC_ERROR_INVALID_STATE));

  *out = self->impl->comment.view();
  return ZC_SUCCESS;
}

// zc::ZipReader - API - Entries
// =============================

ZC_API_IMPL ZCResult zc_zip_reader_stat(ZCZipReaderCore* self, uint32_t index, ZCZipEntry* out) noexcept {
  using namespace zc;
  using namespace zc::ZipReaderInternal;

  out->reset();

  ZCZipReaderImpl* impl = self->impl;
  ZC_PROPAGATE(update_last_error(self, check_index(impl, index)));

  const EntryRecord& record = impl->record(index);

  out->file_index = index;
  out->version_made_by = record.version_made_by;
  out->version_needed = record.version_needed;
  out->central_dir_ofs = impl->central_dir_ofs + record.record_ofs;
  out->bit_flag = record.bit_flag;
  out->method = record.method;
  out->internal_attr = record.internal_attr;
  out->comment_size = record.comment_size;
  out->crc32 = record.crc32;
  out->external_attr = record.external_attr;
  out->comp_size = record.comp_size;
  out->uncomp_size = record.uncomp_size;
  out->local_header_ofs = record.local_header_ofs;
  out->time = Zip::unix_time_from_dos_time(record.dos_time, record.dos_date);
  out->is_directory = Zip::is_directory_entry(impl->central_dir, record);
  out->is_encrypted = record.is_encrypted();
  out->is_supported = record.is_supported();

  // Both strings are truncated to fit, the archive keeps the full versions.
  ZCDataView name = Zip::entry_name(impl->central_dir, record);
  size_t name_size = zc_min<size_t>(name.size, ZC_ZIP_ENTRY_STRING_CAPACITY - 1u);
  memcpy(out->filename, name.data, name_size);
  out->filename[name_size] = '\0';

  ZCDataView comment = Zip::entry_comment(impl->central_dir, record);
  size_t comment_size = zc_min<size_t>(comment.size, ZC_ZIP_ENTRY_STRING_CAPACITY - 1u);
  memcpy(out->comment, comment.data, comment_size);
  out->comment[comment_size] = '\0';

  return ZC_SUCCESS;
}

ZC_API_IMPL bool zc_zip_reader_is_directory(const ZCZipReaderCore* self, uint32_t index) noexcept {
  const ZCZipReaderImpl* impl = self->impl;
  if (!impl || index >= impl->entry_count())
    return false;

  return zc::Zip::is_directory_entry(impl->central_dir, impl->record(index));
}

ZC_API_IMPL ZCResult zc_zip_reader_get_name(ZCZipReaderCore* self, uint32_t index, ZCDataView* out) noexcept {
  using namespace zc::ZipReaderInternal;

  out->reset();

  ZCZipReaderImpl* impl = self->impl;
  ZC_PROPAGATE(update_last_error(self, check_index(impl, index)));

  *out = zc::Zip::entry_name(impl->central_dir, impl->record(index));
  return ZC_SUCCESS;
}

ZC_API_IMPL ZCResult zc_zip_reader_locate(ZCZipReaderCore* self, const char* name, size_t name_size, uint32_t* index_out) noexcept {
  using namespace zc::ZipReaderInternal;

  *index_out = 0;

  ZCZipReaderImpl* impl = self->impl;
  if (ZC_UNLIKELY(!impl))
    return update_last_error(self, zc_make_error(ZC_ERROR_INVALID_STATE));

  if (ZC_UNLIKELY(!name))
    return update_last_error(self, zc_make_error(ZC_ERROR_INVALID_PARAMETER));

  if (name_size == SIZE_MAX)
    name_size = strlen(name);

  uint32_t count = impl->entry_count();
  for (uint32_t i = 0; i < count; i++) {
    ZCDataView entry_name = zc::Zip::entry_name(impl->central_dir, impl->record(i));
    if (entry_name.size == name_size && memcmp(entry_name.data, name, name_size) == 0) {
      *index_out = i;
      return ZC_SUCCESS;
    }
  }

  return update_last_error(self, zc_make_error(ZC_ERROR_FILE_NOT_FOUND));
}

// zc::ZipReader - API - Extraction
// ================================

ZC_API_IMPL ZCResult zc_zip_reader_extract_to_memory(ZCZipReaderCore* self, uint32_t index, ZCByteArrayCore* dst, ZCZipExtractFlags flags) noexcept {
  using namespace zc::ZipReaderInternal;

  ZCByteArray& dst_array = *static_cast<ZCByteArray*>(dst);
  ZC_PROPAGATE(update_last_error(self, dst_array.clear()));

  ZCZipReaderImpl* impl = self->impl;
  ZC_PROPAGATE(update_last_error(self, check_index(impl, index)));

  uint64_t uncomp_size = impl->record(index).uncomp_size;
  if (ZC_UNLIKELY(uncomp_size > uint64_t(SIZE_MAX)))
    return update_last_error(self, zc_make_error(ZC_ERROR_FILE_TOO_LARGE));

  ZC_PROPAGATE(update_last_error(self, dst_array.reserve(size_t(uncomp_size))));

  MemoryConsumer consumer { dst_array };
  ZCResult result = extract_entry(impl, index, flags, consumer);

  if (result != ZC_SUCCESS) {
    zc_unused(dst_array.clear());
    return update_last_error(self, result);
  }

  return ZC_SUCCESS;
}

ZC_API_IMPL ZCResult zc_zip_reader_extract_to_buffer(ZCZipReaderCore* self, uint32_t index, void* buffer, size_t buffer_size, size_t* size_out, ZCZipExtractFlags flags) noexcept {
  using namespace zc::ZipReaderInternal;

  if (size_out)
    *size_out = 0;

  ZCZipReaderImpl* impl = self->impl;
  ZC_PROPAGATE(update_last_error(self, check_index(impl, index)));

  uint64_t uncomp_size = impl->record(index).uncomp_size;
  if (ZC_UNLIKELY(uncomp_size > buffer_size))
    return update_last_error(self, zc_make_error(ZC_ERROR_BUF_TOO_SMALL));

  if (ZC_UNLIKELY(!buffer && buffer_size))
    return update_last_error(self, zc_make_error(ZC_ERROR_INVALID_PARAMETER));

  BufferConsumer consumer { static_cast<uint8_t*>(buffer), buffer_size };
  ZC_PROPAGATE(update_last_error(self, extract_entry(impl, index, flags, consumer)));

  if (size_out)
    *size_out = size_t(uncomp_size);
  return ZC_SUCCESS;
}

ZC_API_IMPL ZCResult zc_zip_reader_extract_to_file(ZCZipReaderCore* self, uint32_t index, const char* file_name, ZCZipExtractFlags flags) noexcept {
  using namespace zc::ZipReaderInternal;

  ZCZipReaderImpl* impl = self->impl;
  ZC_PROPAGATE(update_last_error(self, check_index(impl, index)));

  if (ZC_UNLIKELY(!file_name || !file_name[0]))
    return update_last_error(self, zc_make_error(ZC_ERROR_INVALID_PARAMETER));

  // A directory entry never creates a file.
  if (zc::Zip::is_directory_entry(impl->central_dir, impl->record(index)))
    return update_last_error(self, ZCFileSystem::create_directories(file_name));

  // Check before the destination is created, so nothing is left behind for entries that cannot be extracted.
  ZC_PROPAGATE(update_last_error(self, check_supported(impl->record(index))));

  ZCFileOpenFlags open_flags = ZC_FILE_OPEN_WRITE;
  if (flags & ZC_ZIP_EXTRACT_FLAG_NO_OVERWRITE)
    open_flags |= ZC_FILE_OPEN_CREATE_EXCLUSIVE;
  else
    open_flags |= ZC_FILE_OPEN_CREATE | ZC_FILE_OPEN_TRUNCATE;

  ZCFile file;
  ZC_PROPAGATE(update_last_error(self, file.open(file_name, open_flags)));

  FileConsumer consumer { file };
  ZCResult result = extract_entry(impl, index, flags, consumer);

  if (result != ZC_SUCCESS) {
    // The partially written file is of no use.
    zc_unused(file.close());
    zc_unused(ZCFileSystem::remove_file(file_name));
    return update_last_error(self, result);
  }

  return update_last_error(self, file.close());
}

ZC_API_IMPL ZCResult zc_zip_reader_extract_to_sink(ZCZipReaderCore* self, uint32_t index, ZCZipSinkFunc sink, void* user_data, ZCZipExtractFlags flags) noexcept {
  using namespace zc::ZipReaderInternal;

  ZCZipReaderImpl* impl = self->impl;
  ZC_PROPAGATE(update_last_error(self, check_index(impl, index)));

  if (ZC_UNLIKELY(!sink))
    return update_last_error(self, zc_make_error(ZC_ERROR_INVALID_PARAMETER));

  SinkConsumer consumer { sink, user_data };
  return update_last_error(self, extract_entry(impl, index, flags, consumer));
}

// zc::ZipReader - API - Validation
// ================================

ZC_API_IMPL ZCResult zc_zip_reader_validate(ZCZipReaderCore* self, uint32_t index) noexcept {
  using namespace zc::ZipReaderInternal;

  ZCZipReaderImpl* impl = self->impl;
  ZC_PROPAGATE(update_last_error(self, check_index(impl, index)));

  return update_last_error(self, validate_entry(impl, index));
}

ZC_API_IMPL ZCResult zc_zip_reader_validate_all(ZCZipReaderCore* self) noexcept {
  using namespace zc::ZipReaderInternal;

  ZCZipReaderImpl* impl = self->impl;
  if (ZC_UNLIKELY(!impl))
    return update_last_error(self, zc_make_error(ZC_ERROR_INVALID_STATE));

  uint32_t count = impl->entry_count();
  for (uint32_t i = 0; i < count; i++) {
    ZC_PROPAGATE(update_last_error(self, validate_entry(impl, i)));
  }

  return ZC_SUCCESS;
}
