// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zipcore/core/api-build_p.h>
#include <zipcore/core/filesystem.h>
#include <zipcore/core/trace_p.h>
#include <zipcore/compression/checksum_p.h>
#include <zipcore/compression/deflatedefs_p.h>
#include <zipcore/compression/deflateencoder_p.h>
#include <zipcore/zip/zipformat_p.h>
#include <zipcore/zip/zipreader_p.h>
#include <zipcore/zip/zipwriter.h>

#include <new>
#include <time.h>

// zc::ZipWriter - Impl
// ====================

//! State of an open writer.
enum class ZCZipWriterState : uint32_t {
  //! Entries can be added.
  kOpened,
  //! The central directory was written, only `take_memory()` and `close()` are allowed.
  kFinalized,
  //! Writing failed, the archive is incomplete and the writer cannot continue.
  kFailed
};

//! Data of an open ZIP writer.
struct ZCZipWriterImpl {
  ZC_NONCOPYABLE(ZCZipWriterImpl)

  zc::Zip::ZipTarget target;
  //! Central directory records of all entries written so far.
  ZCByteArray central_dir;
  //! Parsed records (`zc::Zip::EntryRecord`), one per central directory record.
  ZCByteArray records;
  //! Archive comment.
  ZCByteArray comment;
  ZCZipWriterFlags flags = ZC_ZIP_WRITER_NO_FLAGS;
  ZCZipWriterState state = ZCZipWriterState::kOpened;

  ZC_INLINE ZCZipWriterImpl() noexcept {}

  ZC_INLINE_NODEBUG uint32_t entry_count() const noexcept { return uint32_t(zc::Zip::entry_record_count(records)); }
  ZC_INLINE_NODEBUG bool zip64_allowed() const noexcept { return !(flags & ZC_ZIP_WRITER_FLAG_DISABLE_ZIP64); }
};

namespace zc {
namespace ZipWriterInternal {

// zc::ZipWriter - Trace
// =====================

#if defined(ZC_TRACE_ZIP_ALL) || defined(ZC_TRACE_ZIP)
#define Trace ZCDebugTrace
#else
#define Trace ZCDummyTrace
#endif

using Zip::EntryRecord;

//! Entry prepared for writing, data are already compressed (or stored).
struct PendingEntry {
  const char* name;
  size_t name_size;
  const char* comment;
  size_t comment_size;
  const uint8_t* data;
  size_t data_size;
  uint64_t uncomp_size;
  uint32_t crc32;
  uint32_t external_attr;
  uint16_t method;
  uint16_t dos_time;
  uint16_t dos_date;
  bool is_directory;
};

// zc::ZipWriter - Utilities
// =========================

static ZC_INLINE ZCResult update_last_error(ZCZipWriterCore* self, ZCResult result) noexcept {
  if (result != ZC_SUCCESS)
    self->last_error_code = result;
  return result;
}

static ZCResult create_impl(ZCZipWriterCore* self, ZCZipWriterFlags flags, ZCZipWriterImpl** impl_out) noexcept {
  void* p = malloc(sizeof(ZCZipWriterImpl));
  ZC_RETURN_ERROR_IF_NULL(p);

  ZCZipWriterImpl* impl = new(p) ZCZipWriterImpl();
  impl->flags = flags;

  self->impl = impl;
  *impl_out = impl;
  return ZC_SUCCESS;
}

static ZCResult destroy_impl(ZCZipWriterCore* self) noexcept {
  ZCZipWriterImpl* impl = self->impl;
  if (!impl)
    return ZC_SUCCESS;

  ZCResult result = impl->target.reset();

  impl->~ZCZipWriterImpl();
  free(impl);
  self->impl = nullptr;

  return result;
}

static ZCResult check_opened(const ZCZipWriterImpl* impl) noexcept {
  if (ZC_UNLIKELY(!impl || impl->state != ZCZipWriterState::kOpened))
    return zc_make_error(ZC_ERROR_INVALID_STATE);
  return ZC_SUCCESS;
}

static bool has_non_ascii(const char* s, size_t size) noexcept {
  for (size_t i = 0; i < size; i++)
    if (uint8_t(s[i]) >= 0x80u)
      return true;
  return false;
}

static ZCResult check_comment(const char* comment, size_t* size_out) noexcept {
  size_t size = comment ? strlen(comment) : size_t(0);
  if (ZC_UNLIKELY(size > Zip::kMaxFieldSize))
    return zc_make_error(ZC_ERROR_INVALID_PARAMETER);

  *size_out = size;
  return ZC_SUCCESS;
}

//! Checks whether `name` can be added - it must be safe to extract and unique in the archive.
static ZCResult check_name(const ZCZipWriterImpl* impl, const char* name, size_t name_size) noexcept {
  if (ZC_UNLIKELY(name_size > Zip::kMaxFieldSize || !Zip::is_safe_entry_name(name, name_size)))
    return zc_make_error(ZC_ERROR_INVALID_FILENAME);

  const EntryRecord* records = Zip::entry_records(impl->records);
  size_t count = Zip::entry_record_count(impl->records);

  for (size_t i = 0; i < count; i++) {
    ZCDataView existing = Zip::entry_name(impl->central_dir, records[i]);
    if (existing.size == name_size && memcmp(existing.data, name, name_size) == 0)
      return zc_make_error(ZC_ERROR_INVALID_PARAMETER);
  }

  return ZC_SUCCESS;
}

// zc::ZipWriter - Entries
// =======================

static ZCResult write_local_header(ZCZipWriterImpl* impl, const PendingEntry& entry, uint16_t version_needed, uint16_t bit_flag, bool zip64_sizes) noexcept {
  uint8_t buffer[Zip::LocalFileHeader::kBaseSize + Zip::kLocalZip64ExtraSize];
  Zip::LocalFileHeader* header = reinterpret_cast<Zip::LocalFileHeader*>(buffer);

  header->signature = Zip::LocalFileHeader::kSignature;
  header->version_needed = version_needed;
  header->bit_flag = bit_flag;
  header->method = entry.method;
  header->dos_time = entry.dos_time;
  header->dos_date = entry.dos_date;
  header->crc32 = entry.crc32;
  header->comp_size = zip64_sizes ? Zip::kZip64Marker32 : uint32_t(entry.data_size);
  header->uncomp_size = zip64_sizes ? Zip::kZip64Marker32 : uint32_t(entry.uncomp_size);
  header->name_size = uint16_t(entry.name_size);
  header->extra_size = uint16_t(zip64_sizes ? Zip::kLocalZip64ExtraSize : 0u);

  ZC_PROPAGATE(impl->target.write(buffer, Zip::LocalFileHeader::kBaseSize));
  ZC_PROPAGATE(impl->target.write(entry.name, entry.name_size));

  if (zip64_sizes) {
    uint8_t* extra = buffer + Zip::LocalFileHeader::kBaseSize;
    MemOps::writeU16uLE(extra + 0, Zip::kZip64ExtraFieldId);
    MemOps::writeU16uLE(extra + 2, 16u);
    MemOps::writeU64uLE(extra + 4, entry.uncomp_size);
    MemOps::writeU64uLE(extra + 12, uint64_t(entry.data_size));
    ZC_PROPAGATE(impl->target.write(extra, Zip::kLocalZip64ExtraSize));
  }

  return ZC_SUCCESS;
}

static ZCResult write_entry(ZCZipWriterImpl* impl, const PendingEntry& entry) noexcept {
  Trace trace;

  uint64_t local_ofs = impl->target.position();
  uint64_t comp_size = entry.data_size;
  uint32_t count = impl->entry_count();

  bool need_uncomp64 = entry.uncomp_size >= Zip::kZip64Marker32;
  bool need_comp64 = comp_size >= Zip::kZip64Marker32;
  bool need_offset64 = local_ofs >= Zip::kZip64Marker32;

  if (ZC_UNLIKELY(count >= Zip::kMaxEntryCount64 - 1u || (!impl->zip64_allowed() && count >= Zip::kMaxEntryCount - 1u)))
    return zc_make_error(ZC_ERROR_TOO_MANY_FILES);

  if (!impl->zip64_allowed()) {
    if (ZC_UNLIKELY(need_uncomp64 || need_comp64))
      return zc_make_error(ZC_ERROR_FILE_TOO_LARGE);

    if (ZC_UNLIKELY(need_offset64))
      return zc_make_error(ZC_ERROR_ARCHIVE_TOO_LARGE);
  }

  bool zip64_sizes = need_uncomp64 || need_comp64;
  bool zip64 = zip64_sizes || need_offset64;

  uint32_t central_extra_size = 0;
  if (zip64)
    central_extra_size = Zip::ExtraFieldHeader::kBaseSize + 8u * (uint32_t(need_uncomp64) + uint32_t(need_comp64) + uint32_t(need_offset64));

  size_t record_size = Zip::CentralDirHeader::kBaseSize + entry.name_size + central_extra_size + entry.comment_size;
  if (ZC_UNLIKELY(uint64_t(impl->central_dir.size) + record_size > uint64_t(0xFFFFFFFFu)))
    return zc_make_error(ZC_ERROR_UNSUPPORTED_CDIR_SIZE);

  uint16_t version_needed = uint16_t(zip64 ? Zip::kVersionZip64 :
                                     entry.method == ZC_ZIP_METHOD_DEFLATE || entry.is_directory ? Zip::kVersionDeflate : Zip::kVersionStore);
  uint16_t version_made_by = uint16_t(zip64 ? Zip::kVersionZip64 : Zip::kVersionDeflate);
  uint16_t bit_flag = uint16_t(has_non_ascii(entry.name, entry.name_size) || has_non_ascii(entry.comment, entry.comment_size) ? Zip::kFlagUtf8 : 0u);

  trace.info("zc::ZipWriter::AddEntry [Name=%.*s Offset=%llu Method=%u Size=%llu CompSize=%llu]\n",
             int(entry.name_size), entry.name,
             (unsigned long long)local_ofs,
             unsigned(entry.method),
             (unsigned long long)entry.uncomp_size,
             (unsigned long long)comp_size);

  // Local header and data. The archive cannot continue after a partial write.
  ZCResult result = write_local_header(impl, entry, version_needed, bit_flag, zip64_sizes);
  if (result == ZC_SUCCESS)
    result = impl->target.write(entry.data, entry.data_size);

  if (result != ZC_SUCCESS) {
    trace.fail("Failed to write entry data [%s]\n", zc_result_to_string(result));
    impl->state = ZCZipWriterState::kFailed;
    return result;
  }

  // Central directory record.
  size_t record_ofs = impl->central_dir.size;
  uint8_t* p;
  ZC_PROPAGATE(impl->central_dir.modify_op(ZC_MODIFY_OP_APPEND_GROW, record_size, &p));

  Zip::CentralDirHeader* header = reinterpret_cast<Zip::CentralDirHeader*>(p);
  header->signature = Zip::CentralDirHeader::kSignature;
  header->version_made_by = version_made_by;
  header->version_needed = version_needed;
  header->bit_flag = bit_flag;
  header->method = entry.method;
  header->dos_time = entry.dos_time;
  header->dos_date = entry.dos_date;
  header->crc32 = entry.crc32;
  header->comp_size = need_comp64 ? Zip::kZip64Marker32 : uint32_t(comp_size);
  header->uncomp_size = need_uncomp64 ? Zip::kZip64Marker32 : uint32_t(entry.uncomp_size);
  header->name_size = uint16_t(entry.name_size);
  header->extra_size = uint16_t(central_extra_size);
  header->comment_size = uint16_t(entry.comment_size);
  header->disk_start = uint16_t(0);
  header->internal_attr = uint16_t(0);
  header->external_attr = entry.external_attr;
  header->local_header_ofs = need_offset64 ? Zip::kZip64Marker32 : uint32_t(local_ofs);

  p += Zip::CentralDirHeader::kBaseSize;
  memcpy(p, entry.name, entry.name_size);
  p += entry.name_size;

  if (central_extra_size) {
    MemOps::writeU16uLE(p + 0, Zip::kZip64ExtraFieldId);
    MemOps::writeU16uLE(p + 2, central_extra_size - Zip::ExtraFieldHeader::kBaseSize);
    p += Zip::ExtraFieldHeader::kBaseSize;

    if (need_uncomp64) { MemOps::writeU64uLE(p, entry.uncomp_size); p += 8; }
    if (need_comp64) { MemOps::writeU64uLE(p, comp_size); p += 8; }
    if (need_offset64) { MemOps::writeU64uLE(p, local_ofs); p += 8; }
  }

  if (entry.comment_size)
    memcpy(p, entry.comment, entry.comment_size);

  EntryRecord record {};
  record.comp_size = comp_size;
  record.uncomp_size = entry.uncomp_size;
  record.local_header_ofs = local_ofs;
  record.record_ofs = uint32_t(record_ofs);
  record.crc32 = entry.crc32;
  record.external_attr = entry.external_attr;
  record.version_made_by = version_made_by;
  record.version_needed = version_needed;
  record.bit_flag = bit_flag;
  record.method = entry.method;
  record.dos_time = entry.dos_time;
  record.dos_date = entry.dos_date;
  record.name_size = uint16_t(entry.name_size);
  record.extra_size = uint16_t(central_extra_size);
  record.comment_size = uint16_t(entry.comment_size);

  ZCResult append_result = impl->records.append_data(&record, sizeof(record));
  if (append_result != ZC_SUCCESS) {
    // The central directory would not describe the entry just written.
    ZC_PROPAGATE(impl->central_dir.truncate(record_ofs));
    return append_result;
  }

  return ZC_SUCCESS;
}

//! Compresses `data` at `level` and writes it as a new entry.
static ZCResult add_entry(ZCZipWriterImpl* impl, const char* name, const uint8_t* data, size_t size, const char* comment, int32_t level, time_t modified_time) noexcept {
  ZC_PROPAGATE(check_opened(impl));

  if (ZC_UNLIKELY(!name || (!data && size)))
    return zc_make_error(ZC_ERROR_INVALID_PARAMETER);

  size_t name_size = strlen(name);
  size_t comment_size;

  ZC_PROPAGATE(check_comment(comment, &comment_size));
  ZC_PROPAGATE(check_name(impl, name, name_size));

  // Data of a directory entry would be lost on extraction.
  bool is_directory = Zip::has_trailing_separator(name, name_size);
  if (ZC_UNLIKELY(is_directory && size))
    return zc_make_error(ZC_ERROR_INVALID_FILENAME);

  uint32_t encoder_level;
  ZC_PROPAGATE(Compression::Deflate::resolve_compression_level(level, &encoder_level));

  PendingEntry entry {};
  entry.name = name;
  entry.name_size = name_size;
  entry.comment = comment;
  entry.comment_size = comment_size;
  entry.data = data;
  entry.data_size = size;
  entry.uncomp_size = size;
  entry.crc32 = Compression::Checksum::crc32(data, size);
  entry.external_attr = is_directory ? Zip::kDosDirectoryAttribute : 0u;
  entry.method = ZC_ZIP_METHOD_STORE;
  entry.is_directory = is_directory;
  Zip::dos_time_from_unix_time(modified_time, &entry.dos_time, &entry.dos_date);

  // Compressed data are only used when smaller than the input.
  ZCByteArray compressed;
  if (encoder_level != 0u && size != 0u) {
    Compression::Deflate::Encoder encoder;
    ZC_PROPAGATE(encoder.init(Compression::Deflate::FormatType::kRaw, encoder_level));
    ZC_PROPAGATE(encoder.compress(compressed, ZC_MODIFY_OP_ASSIGN_FIT, ZCDataView{data, size}));

    if (compressed.size < size) {
      entry.method = ZC_ZIP_METHOD_DEFLATE;
      entry.data = compressed.data;
      entry.data_size = compressed.size;
    }
  }

  return write_entry(impl, entry);
}

//! Reads a whole regular file for `add_file()`.
static ZCResult read_source_file(const char* file_name, ZCByteArray& dst, time_t* modified_time_out) noexcept {
  ZCFile file;
  ZC_PROPAGATE(file.open(file_name, ZC_FILE_OPEN_READ));

  ZCFileInfo info;
  ZC_PROPAGATE(file.get_info(&info));

  if (ZC_UNLIKELY(!info.is_regular()))
    return zc_make_error(ZC_ERROR_FILE_OPEN_FAILED);

  if (ZC_UNLIKELY(info.size > uint64_t(SIZE_MAX)))
    return zc_make_error(ZC_ERROR_FILE_TOO_LARGE);

  size_t size = size_t(info.size);
  uint8_t* p;
  ZC_PROPAGATE(dst.modify_op(ZC_MODIFY_OP_ASSIGN_FIT, size, &p));

  size_t bytes_read;
  ZC_PROPAGATE(file.read_at(0, p, size, &bytes_read));

  // The file was truncated while being read.
  if (ZC_UNLIKELY(bytes_read != size))
    return zc_make_error(ZC_ERROR_FILE_READ_FAILED);

  *modified_time_out = time_t(info.modified_time_seconds());
  return file.close();
}

// zc::ZipWriter - Finalization
// ============================

static ZCResult write_end_records(ZCZipWriterImpl* impl) noexcept {
  Trace trace;

  uint64_t cdir_ofs = impl->target.position();
  uint64_t cdir_size = impl->central_dir.size;
  uint32_t count = impl->entry_count();

  bool zip64 = count >= Zip::kMaxEntryCount || cdir_ofs >= Zip::kZip64Marker32 || cdir_size >= Zip::kZip64Marker32;
  if (zip64 && !impl->zip64_allowed())
    return zc_make_error(count >= Zip::kMaxEntryCount ? ZC_ERROR_TOO_MANY_FILES : ZC_ERROR_ARCHIVE_TOO_LARGE);

  trace.info("zc::ZipWriter::Finalize [Entries=%u CDirOffset=%llu CDirSize=%llu Zip64=%u]\n",
             count, (unsigned long long)cdir_ofs, (unsigned long long)cdir_size, unsigned(zip64));

  ZC_PROPAGATE(impl->target.write(impl->central_dir.data, impl->central_dir.size));

  if (zip64) {
    uint64_t zip64_eocd_ofs = impl->target.position();

    Zip::Zip64EndOfCentralDir record;
    record.signature = Zip::Zip64EndOfCentralDir::kSignature;
    record.record_size = uint64_t(Zip::Zip64EndOfCentralDir::kBaseSize - 12u);
    record.version_made_by = uint16_t(Zip::kVersionZip64);
    record.version_needed = uint16_t(Zip::kVersionZip64);
    record.disk_number = 0u;
    record.cdir_disk = 0u;
    record.entries_on_disk = uint64_t(count);
    record.total_entries = uint64_t(count);
    record.cdir_size = cdir_size;
    record.cdir_ofs = cdir_ofs;
    ZC_PROPAGATE(impl->target.write(&record, sizeof(record)));

    Zip::Zip64EndOfCentralDirLocator locator;
    locator.signature = Zip::Zip64EndOfCentralDirLocator::kSignature;
    locator.zip64_eocd_disk = 0u;
    locator.zip64_eocd_ofs = zip64_eocd_ofs;
    locator.total_disks = 1u;
    ZC_PROPAGATE(impl->target.write(&locator, sizeof(locator)));
  }

  Zip::EndOfCentralDir eocd;
  uint16_t count16 = uint16_t(zc_min<uint32_t>(count, Zip::kZip64Marker16));

  eocd.signature = Zip::EndOfCentralDir::kSignature;
  eocd.disk_number = uint16_t(0);
  eocd.cdir_disk = uint16_t(0);
  eocd.entries_on_disk = count16;
  eocd.total_entries = count16;
  eocd.cdir_size = uint32_t(zc_min<uint64_t>(cdir_size, Zip::kZip64Marker32));
  eocd.cdir_ofs = uint32_t(zc_min<uint64_t>(cdir_ofs, Zip::kZip64Marker32));
  eocd.comment_size = uint16_t(impl->comment.size);

  ZC_PROPAGATE(impl->target.write(&eocd, sizeof(eocd)));
  ZC_PROPAGATE(impl->target.write(impl->comment.data, impl->comment.size));

  return impl->target.finish();
}

} // {ZipWriterInternal}
} // {zc}

// zc::ZipWriter - API - Construction & Destruction
// ================================================

ZC_API_IMPL ZCResult zc_zip_writer_init(ZCZipWriterCore* self) noexcept {
  self->impl = nullptr;
  self->last_error_code = ZC_SUCCESS;
  return ZC_SUCCESS;
}

ZC_API_IMPL ZCResult zc_zip_writer_destroy(ZCZipWriterCore* self) noexcept {
  return zc::ZipWriterInternal::destroy_impl(self);
}

// zc::ZipWriter - API - Open & Close
// ==================================

ZC_API_IMPL ZCResult zc_zip_writer_open_file(ZCZipWriterCore* self, const char* file_name, uint64_t reserve_size, ZCZipWriterFlags flags) noexcept {
  using namespace zc::ZipWriterInternal;

  ZC_PROPAGATE(update_last_error(self, destroy_impl(self)));

  ZCZipWriterImpl* impl;
  ZC_PROPAGATE(update_last_error(self, create_impl(self, flags, &impl)));

  ZCResult result = impl->target.create_file(file_name);
  if (result == ZC_SUCCESS)
    result = impl->target.write_zeros(reserve_size);

  if (result != ZC_SUCCESS) {
    zc_unused(destroy_impl(self));
    return update_last_error(self, result);
  }

  return ZC_SUCCESS;
}

ZC_API_IMPL ZCResult zc_zip_writer_open_memory(ZCZipWriterCore* self, uint64_t reserve_size, ZCZipWriterFlags flags) noexcept {
  using namespace zc::ZipWriterInternal;

  ZC_PROPAGATE(update_last_error(self, destroy_impl(self)));

  if (ZC_UNLIKELY(reserve_size > uint64_t(SIZE_MAX)))
    return update_last_error(self, zc_make_error(ZC_ERROR_INVALID_PARAMETER));

  ZCZipWriterImpl* impl;
  ZC_PROPAGATE(update_last_error(self, create_impl(self, flags, &impl)));

  impl->target.open_memory();
  ZCResult result = impl->target.write_zeros(reserve_size);

  if (result != ZC_SUCCESS) {
    zc_unused(destroy_impl(self));
    return update_last_error(self, result);
  }

  return ZC_SUCCESS;
}

ZC_API_IMPL ZCResult zc_zip_writer_open_append(ZCZipWriterCore* self, const char* file_name, ZCZipWriterFlags flags) noexcept {
  using namespace zc;
  using namespace zc::ZipWriterInternal;

  ZC_PROPAGATE(update_last_error(self, destroy_impl(self)));

  ZCZipReader reader;
  ZC_PROPAGATE(update_last_error(self, reader.open_file(file_name)));

  const ZCZipReaderImpl* reader_impl = reader.impl;
  uint32_t count = reader_impl->entry_count();

  // Only records are kept, anything that follows them in the old central directory is dropped.
  size_t records_size = 0;
  if (count) {
    const EntryRecord& last = reader_impl->record(count - 1u);
    records_size = last.record_ofs + last.record_size();
  }

  ZCZipWriterImpl* impl;
  ZC_PROPAGATE(update_last_error(self, create_impl(self, flags, &impl)));

  ZCResult result = impl->central_dir.assign_data(reader_impl->central_dir.data, records_size);
  if (result == ZC_SUCCESS)
    result = impl->records.assign_data(reader_impl->records.view());
  if (result == ZC_SUCCESS)
    result = impl->comment.assign_data(reader_impl->comment.view());

  uint64_t central_dir_ofs = reader_impl->central_dir_ofs;
  if (result == ZC_SUCCESS)
    result = reader.close();

  // New entries start where the old central directory was.
  if (result == ZC_SUCCESS)
    result = impl->target.open_existing_file(file_name, central_dir_ofs);

  if (result != ZC_SUCCESS) {
    zc_unused(destroy_impl(self));
    return update_last_error(self, result);
  }

  return ZC_SUCCESS;
}

ZC_API_IMPL ZCResult zc_zip_writer_close(ZCZipWriterCore* self) noexcept {
  using namespace zc::ZipWriterInternal;
  return update_last_error(self, destroy_impl(self));
}

// zc::ZipWriter - API - Writer Information
// ========================================

ZC_API_IMPL bool zc_zip_writer_is_open(const ZCZipWriterCore* self) noexcept {
  return self->impl != nullptr;
}

ZC_API_IMPL bool zc_zip_writer_is_finalized(const ZCZipWriterCore* self) noexcept {
  return self->impl != nullptr && self->impl->state == ZCZipWriterState::kFinalized;
}

ZC_API_IMPL uint32_t zc_zip_writer_get_entry_count(const ZCZipWriterCore* self) noexcept {
  return self->impl ? self->impl->entry_count() : 0u;
}

// zc::ZipWriter - API - Entries
// =============================

ZC_API_IMPL ZCResult zc_zip_writer_add_buffer(ZCZipWriterCore* self, const char* name, const void* data, size_t size, const char* comment, int32_t level) noexcept {
  using namespace zc::ZipWriterInternal;
  return update_last_error(self, add_entry(self->impl, name, static_cast<const uint8_t*>(data), size, comment, level, time(nullptr)));
}

ZC_API_IMPL ZCResult zc_zip_writer_add_file(ZCZipWriterCore* self, const char* name, const char* source_file_name, const char* comment, int32_t level) noexcept {
  using namespace zc::ZipWriterInternal;

  ZC_PROPAGATE(update_last_error(self, check_opened(self->impl)));

  if (ZC_UNLIKELY(!source_file_name))
    return update_last_error(self, zc_make_error(ZC_ERROR_INVALID_PARAMETER));

  ZCByteArray content;
  time_t modified_time;
  ZC_PROPAGATE(update_last_error(self, read_source_file(source_file_name, content, &modified_time)));

  return update_last_error(self, add_entry(self->impl, name, content.data, content.size, comment, level, modified_time));
}

ZC_API_IMPL ZCResult zc_zip_writer_add_directory(ZCZipWriterCore* self, const char* name, const char* comment) noexcept {
  using namespace zc::ZipWriterInternal;

  if (ZC_UNLIKELY(!name || !name[0]))
    return update_last_error(self, zc_make_error(ZC_ERROR_INVALID_FILENAME));

  size_t name_size = strlen(name);
  if (zc::Zip::has_trailing_separator(name, name_size))
    return update_last_error(self, add_entry(self->impl, name, nullptr, 0, comment, ZC_COMPRESSION_LEVEL_STORE, time(nullptr)));

  ZCByteArray dir_name;
  ZC_PROPAGATE(update_last_error(self, dir_name.assign_data(name, name_size)));
  ZC_PROPAGATE(update_last_error(self, dir_name.append('/')));
  ZC_PROPAGATE(update_last_error(self, dir_name.append('\0')));

  return update_last_error(self, add_entry(self->impl, reinterpret_cast<const char*>(dir_name.data), nullptr, 0, comment, ZC_COMPRESSION_LEVEL_STORE, time(nullptr)));
}

ZC_API_IMPL ZCResult zc_zip_writer_set_archive_comment(ZCZipWriterCore* self, const void* comment, size_t size) noexcept {
  using namespace zc::ZipWriterInternal;

  ZC_PROPAGATE(update_last_error(self, check_opened(self->impl)));

  if (ZC_UNLIKELY((!comment && size) || size > zc::Zip::kMaxFieldSize))
    return update_last_error(self, zc_make_error(ZC_ERROR_INVALID_PARAMETER));

  return update_last_error(self, self->impl->comment.assign_data(comment, size));
}

// zc::ZipWriter - API - Finalization
// ==================================

ZC_API_IMPL ZCResult zc_zip_writer_finalize(ZCZipWriterCore* self) noexcept {
  using namespace zc::ZipWriterInternal;

  ZCZipWriterImpl* impl = self->impl;
  ZC_PROPAGATE(update_last_error(self, check_opened(impl)));

  ZCResult result = write_end_records(impl);
  if (result != ZC_SUCCESS) {
    // A partially written central directory makes the archive unusable.
    impl->state = ZCZipWriterState::kFailed;
    return update_last_error(self, result);
  }

  impl->state = ZCZipWriterState::kFinalized;
  return ZC_SUCCESS;
}

ZC_API_IMPL ZCResult zc_zip_writer_take_memory(ZCZipWriterCore* self, ZCByteArrayCore* dst) noexcept {
  using namespace zc::ZipWriterInternal;

  ZCZipWriterImpl* impl = self->impl;
  if (ZC_UNLIKELY(!impl || impl->state != ZCZipWriterState::kFinalized || !impl->target._is_memory))
    return update_last_error(self, zc_make_error(ZC_ERROR_INVALID_STATE));

  ZCByteArray& dst_array = *static_cast<ZCByteArray*>(dst);
  ZC_PROPAGATE(update_last_error(self, dst_array.clear()));

  dst_array.swap(impl->target._memory);
  return ZC_SUCCESS;
}
