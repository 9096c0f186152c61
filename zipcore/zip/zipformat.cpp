// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zipcore/core/api-build_p.h>
#include <zipcore/core/trace_p.h>
#include <zipcore/zip/zipformat_p.h>

#include <time.h>

namespace zc::Zip {

// zc::Zip - Trace
// ===============

#if defined(ZC_TRACE_ZIP_ALL) || defined(ZC_TRACE_ZIP)
#define Trace ZCDebugTrace
#else
#define Trace ZCDummyTrace
#endif

// zc::Zip - Entry Record
// ======================

bool is_directory_entry(const ZCByteArray& central_dir, const EntryRecord& record) noexcept {
  ZCDataView name = entry_name(central_dir, record);
  if (has_trailing_separator(reinterpret_cast<const char*>(name.data), name.size)) {
    return true;
  }

  return record.uncomp_size == 0u && (record.external_attr & kDosDirectoryAttribute) != 0u;
}

// Replaces values marked by `kZip64Marker32` by values stored in zip64 extended information.
static ZCResult resolve_zip64_extra_field(const uint8_t* extra, size_t extra_size, EntryRecord* record, bool need_offset) noexcept {
  bool need_uncomp = record->uncomp_size == kZip64Marker32;
  bool need_comp = record->comp_size == kZip64Marker32;

  while (extra_size >= ExtraFieldHeader::kBaseSize) {
    const ExtraFieldHeader* header = reinterpret_cast<const ExtraFieldHeader*>(extra);
    uint32_t field_id = header->id();
    uint32_t field_size = header->size();

    extra += ExtraFieldHeader::kBaseSize;
    extra_size -= ExtraFieldHeader::kBaseSize;

    if (ZC_UNLIKELY(field_size > extra_size)) {
      return zc_make_error(ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);
    }

    if (field_id == kZip64ExtraFieldId) {
      const uint8_t* p = extra;
      const uint8_t* end = extra + field_size;

      if (need_uncomp) {
        if (ZC_UNLIKELY(PtrOps::bytes_until(p, end) < 8u))
          return zc_make_error(ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);
        record->uncomp_size = MemOps::readU64uLE(p);
        p += 8;
      }

      if (need_comp) {
        if (ZC_UNLIKELY(PtrOps::bytes_until(p, end) < 8u))
          return zc_make_error(ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);
        record->comp_size = MemOps::readU64uLE(p);
        p += 8;
      }

      if (need_offset) {
        if (ZC_UNLIKELY(PtrOps::bytes_until(p, end) < 8u))
          return zc_make_error(ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);
        record->local_header_ofs = MemOps::readU64uLE(p);
      }

      return ZC_SUCCESS;
    }

    extra += field_size;
    extra_size -= field_size;
  }

  // The record references zip64 extended information, which is not present.
  return zc_make_error(ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);
}

ZCResult parse_central_dir_record(const ZCByteArray& central_dir, size_t offset, uint64_t data_limit, EntryRecord* out) noexcept {
  Trace trace;

  if (ZC_UNLIKELY(central_dir.size - offset < CentralDirHeader::kBaseSize)) {
    trace.fail("Central directory record at %zu is truncated\n", offset);
    return zc_make_error(ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);
  }

  const CentralDirHeader* header = reinterpret_cast<const CentralDirHeader*>(central_dir.data + offset);
  if (ZC_UNLIKELY(header->signature() != CentralDirHeader::kSignature)) {
    trace.fail("Central directory record at %zu has invalid signature 0x%08X\n", offset, header->signature());
    return zc_make_error(ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);
  }

  EntryRecord& record = *out;
  record.comp_size = header->comp_size();
  record.uncomp_size = header->uncomp_size();
  record.local_header_ofs = header->local_header_ofs();
  record.record_ofs = uint32_t(offset);
  record.crc32 = header->crc32();
  record.external_attr = header->external_attr();
  record.version_made_by = header->version_made_by();
  record.version_needed = header->version_needed();
  record.bit_flag = header->bit_flag();
  record.method = header->method();
  record.dos_time = header->dos_time();
  record.dos_date = header->dos_date();
  record.internal_attr = header->internal_attr();
  record.name_size = header->name_size();
  record.extra_size = header->extra_size();
  record.comment_size = header->comment_size();

  size_t record_size = record.record_size();
  if (ZC_UNLIKELY(central_dir.size - offset < record_size)) {
    trace.fail("Central directory record at %zu exceeds the central directory [Size=%zu]\n", offset, record_size);
    return zc_make_error(ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);
  }

  uint32_t disk_start = header->disk_start();
  bool need_offset = record.local_header_ofs == kZip64Marker32;

  if (record.comp_size == kZip64Marker32 || record.uncomp_size == kZip64Marker32 || need_offset) {
    const uint8_t* extra = central_dir.data + offset + CentralDirHeader::kBaseSize + record.name_size;
    ZC_PROPAGATE(resolve_zip64_extra_field(extra, record.extra_size, &record, need_offset));
  }

  if (ZC_UNLIKELY(disk_start != 0u && disk_start != kZip64Marker16)) {
    trace.fail("Entry starts on disk %u\n", disk_start);
    return zc_make_error(ZC_ERROR_UNSUPPORTED_MULTIDISK);
  }

  // Sizes of stored entries must match, encrypted entries have a 12 byte header that makes them differ.
  if (ZC_UNLIKELY(record.method == ZC_ZIP_METHOD_STORE && !record.is_encrypted() && record.comp_size != record.uncomp_size)) {
    trace.fail("Stored entry has different compressed and uncompressed sizes\n");
    return zc_make_error(ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);
  }

  if (ZC_UNLIKELY(record.uncomp_size != 0u && record.comp_size == 0u)) {
    trace.fail("Non-empty entry has no compressed data\n");
    return zc_make_error(ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);
  }

  // Local header and the data must precede the central directory.
  if (ZC_UNLIKELY(record.local_header_ofs > data_limit ||
                  data_limit - record.local_header_ofs < uint64_t(LocalFileHeader::kBaseSize) + record.name_size ||
                  data_limit - record.local_header_ofs - LocalFileHeader::kBaseSize < record.comp_size)) {
    trace.fail("Entry data [Offset=%llu Size=%llu] is outside of the archive\n",
               (unsigned long long)record.local_header_ofs, (unsigned long long)record.comp_size);
    return zc_make_error(ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);
  }

  return ZC_SUCCESS;
}

// zc::Zip - End of Central Directory
// ==================================

static ZCResult read_zip64_end_of_central_dir(ZipSource& source, EndOfCentralDirInfo* out, Trace& trace) noexcept {
  uint64_t locator_ofs = out->eocd_ofs - Zip64EndOfCentralDirLocator::kBaseSize;

  uint8_t locator_data[Zip64EndOfCentralDirLocator::kBaseSize];
  ZC_PROPAGATE(source.read_at(locator_ofs, locator_data, Zip64EndOfCentralDirLocator::kBaseSize));

  const Zip64EndOfCentralDirLocator* locator = reinterpret_cast<const Zip64EndOfCentralDirLocator*>(locator_data);
  if (locator->signature() != Zip64EndOfCentralDirLocator::kSignature) {
    return ZC_SUCCESS;
  }

  trace.info("Zip64 Locator [Offset=%llu]\n", (unsigned long long)locator_ofs);

  if (ZC_UNLIKELY(locator->total_disks() > 1u || locator->zip64_eocd_disk() != 0u)) {
    trace.fail("Multi-disk archive [Disks=%u]\n", locator->total_disks());
    return zc_make_error(ZC_ERROR_UNSUPPORTED_MULTIDISK);
  }

  uint64_t zip64_eocd_ofs = locator->zip64_eocd_ofs();
  if (ZC_UNLIKELY(zip64_eocd_ofs > locator_ofs || locator_ofs - zip64_eocd_ofs < Zip64EndOfCentralDir::kBaseSize)) {
    trace.fail("Invalid zip64 end of central directory offset %llu\n", (unsigned long long)zip64_eocd_ofs);
    return zc_make_error(ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);
  }

  uint8_t record_data[Zip64EndOfCentralDir::kBaseSize];
  ZC_PROPAGATE(source.read_at(zip64_eocd_ofs, record_data, Zip64EndOfCentralDir::kBaseSize));

  const Zip64EndOfCentralDir* record = reinterpret_cast<const Zip64EndOfCentralDir*>(record_data);
  if (ZC_UNLIKELY(record->signature() != Zip64EndOfCentralDir::kSignature)) {
    trace.fail("Invalid zip64 end of central directory signature\n");
    return zc_make_error(ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);
  }

  if (ZC_UNLIKELY(record->disk_number() != 0u || record->cdir_disk() != 0u || record->entries_on_disk() != record->total_entries())) {
    trace.fail("Multi-disk archive\n");
    return zc_make_error(ZC_ERROR_UNSUPPORTED_MULTIDISK);
  }

  out->zip64 = true;
  out->cdir_limit = zip64_eocd_ofs;
  out->cdir_ofs = record->cdir_ofs();
  out->cdir_size = record->cdir_size();
  out->entry_count = record->total_entries();

  return ZC_SUCCESS;
}

ZCResult read_end_of_central_dir(ZipSource& source, EndOfCentralDirInfo* out) noexcept {
  Trace trace;
  uint64_t archive_size = source.size();

  trace.info("zc::Zip::ReadEndOfCentralDir [ArchiveSize=%llu]\n", (unsigned long long)archive_size);
  trace.indent();

  if (archive_size < EndOfCentralDir::kBaseSize) {
    trace.fail("Archive is too small\n");
    return zc_make_error(ZC_ERROR_NOT_AN_ARCHIVE);
  }

  size_t scan_size = size_t(zc_min<uint64_t>(archive_size, kEndOfCentralDirScanSize));
  uint64_t scan_ofs = archive_size - scan_size;

  ZCByteArray tail;
  uint8_t* tail_data;
  ZC_PROPAGATE(tail.modify_op(ZC_MODIFY_OP_ASSIGN_FIT, scan_size, &tail_data));
  ZC_PROPAGATE(source.read_at(scan_ofs, tail_data, scan_size));

  // Scan backwards, the first signature whose comment fits the remaining data wins.
  size_t i = scan_size - EndOfCentralDir::kBaseSize;
  const EndOfCentralDir* eocd = nullptr;

  for (;;) {
    const EndOfCentralDir* candidate = reinterpret_cast<const EndOfCentralDir*>(tail_data + i);
    if (candidate->signature() == EndOfCentralDir::kSignature &&
        candidate->comment_size() <= scan_size - i - EndOfCentralDir::kBaseSize) {
      eocd = candidate;
      break;
    }

    if (i == 0)
      break;
    i--;
  }

  if (!eocd) {
    trace.fail("End of central directory record not found\n");
    return zc_make_error(ZC_ERROR_NOT_AN_ARCHIVE);
  }

  out->eocd_ofs = scan_ofs + i;
  out->cdir_limit = out->eocd_ofs;
  out->cdir_ofs = eocd->cdir_ofs();
  out->cdir_size = eocd->cdir_size();
  out->entry_count = eocd->total_entries();
  out->zip64 = false;

  trace.info("EndOfCentralDir [Offset=%llu Entries=%llu CDirOffset=%llu CDirSize=%llu]\n",
             (unsigned long long)out->eocd_ofs,
             (unsigned long long)out->entry_count,
             (unsigned long long)out->cdir_ofs,
             (unsigned long long)out->cdir_size);

  ZC_PROPAGATE(out->comment.assign_data(tail_data + i + EndOfCentralDir::kBaseSize, eocd->comment_size()));

  uint32_t disk_number = eocd->disk_number();
  uint32_t cdir_disk = eocd->cdir_disk();

  if (out->eocd_ofs >= Zip64EndOfCentralDirLocator::kBaseSize) {
    ZC_PROPAGATE(read_zip64_end_of_central_dir(source, out, trace));
  }

  if (!out->zip64) {
    if (ZC_UNLIKELY(disk_number != 0u || cdir_disk != 0u || eocd->entries_on_disk() != eocd->total_entries())) {
      trace.fail("Multi-disk archive [Disk=%u CDirDisk=%u]\n", disk_number, cdir_disk);
      return zc_make_error(ZC_ERROR_UNSUPPORTED_MULTIDISK);
    }
  }

  if (ZC_UNLIKELY(out->entry_count > kMaxEntryCount64)) {
    trace.fail("Too many entries\n");
    return zc_make_error(ZC_ERROR_TOO_MANY_FILES);
  }

  if (ZC_UNLIKELY(out->cdir_size > 0xFFFFFFFFu)) {
    trace.fail("Central directory is too large\n");
    return zc_make_error(ZC_ERROR_UNSUPPORTED_CDIR_SIZE);
  }

  if (ZC_UNLIKELY(out->entry_count * CentralDirHeader::kBaseSize > out->cdir_size)) {
    trace.fail("Central directory is smaller than its entries\n");
    return zc_make_error(ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);
  }

  if (ZC_UNLIKELY(out->cdir_ofs > out->cdir_limit || out->cdir_limit - out->cdir_ofs < out->cdir_size)) {
    trace.fail("Central directory is outside of the archive\n");
    return zc_make_error(ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);
  }

  return ZC_SUCCESS;
}

// zc::Zip - Names
// ===============

bool is_safe_entry_name(const char* name, size_t size) noexcept {
  if (size == 0u || name[0] == '/')
    return false;

  // Drive letters and backslashes are never part of a portable entry name.
  for (size_t i = 0; i < size; i++) {
    char c = name[i];
    if (c == '\\' || c == ':' || c == '\0')
      return false;
  }

  // Reject '..' segments.
  size_t segment_start = 0;
  for (size_t i = 0; i <= size; i++) {
    if (i == size || name[i] == '/') {
      size_t segment_size = i - segment_start;
      if (segment_size == 2u && name[segment_start] == '.' && name[segment_start + 1] == '.')
        return false;
      segment_start = i + 1;
    }
  }

  return true;
}

// zc::Zip - DOS Time
// ==================

static ZC_INLINE bool local_time_from_unix_time(time_t t, struct tm* out) noexcept {
#if defined(_WIN32)
  return localtime_s(out, &t) == 0;
#else
  return localtime_r(&t, out) != nullptr;
#endif
}

void dos_time_from_unix_time(time_t t, uint16_t* dos_time_out, uint16_t* dos_date_out) noexcept {
  struct tm tm_value {};

  if (!local_time_from_unix_time(t, &tm_value) || tm_value.tm_year < 80) {
    // 1980-01-01 00:00:00.
    *dos_time_out = 0;
    *dos_date_out = uint16_t((1u << 5) | 1u);
    return;
  }

  if (tm_value.tm_year > 207) {
    // 2107-12-31 23:59:58.
    *dos_time_out = uint16_t((23u << 11) | (59u << 5) | 29u);
    *dos_date_out = uint16_t((127u << 9) | (12u << 5) | 31u);
    return;
  }

  *dos_time_out = uint16_t((uint32_t(tm_value.tm_hour) << 11) | (uint32_t(tm_value.tm_min) << 5) | (uint32_t(tm_value.tm_sec) >> 1));
  *dos_date_out = uint16_t((uint32_t(tm_value.tm_year - 80) << 9) | (uint32_t(tm_value.tm_mon + 1) << 5) | uint32_t(tm_value.tm_mday));
}

time_t unix_time_from_dos_time(uint32_t dos_time, uint32_t dos_date) noexcept {
  struct tm tm_value {};

  tm_value.tm_year = int((dos_date >> 9) & 0x7Fu) + 80;
  tm_value.tm_mon = int((dos_date >> 5) & 0x0Fu) - 1;
  tm_value.tm_mday = int(dos_date & 0x1Fu);
  tm_value.tm_hour = int((dos_time >> 11) & 0x1Fu);
  tm_value.tm_min = int((dos_time >> 5) & 0x3Fu);
  tm_value.tm_sec = int((dos_time << 1) & 0x3Eu);
  tm_value.tm_isdst = -1;

  return mktime(&tm_value);
}

// zc::Zip - Source
// ================

ZCResult ZipSource::open_file(const char* file_name) noexcept {
  reset();

  ZC_PROPAGATE(_file.open(file_name, ZC_FILE_OPEN_READ));
  ZC_PROPAGATE_(_file.get_size(&_size), { reset(); });

  return ZC_SUCCESS;
}

void ZipSource::open_memory(ZCDataView view) noexcept {
  reset();

  _data = view.data;
  _size = view.size;
}

void ZipSource::reset() noexcept {
  // Read-only file, closing cannot lose any data.
  zc_unused(_file.close());

  _data = nullptr;
  _size = 0;
}

ZCResult ZipSource::read_at(uint64_t offset, void* dst, size_t n) noexcept {
  if (ZC_UNLIKELY(!contains(offset, n))) {
    return zc_make_error(ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);
  }

  if (!is_file()) {
    memcpy(dst, _data + size_t(offset), n);
    return ZC_SUCCESS;
  }

  size_t bytes_read;
  ZC_PROPAGATE(_file.read_at(offset, dst, n, &bytes_read));

  // The file was truncated after it was opened.
  if (ZC_UNLIKELY(bytes_read != n)) {
    return zc_make_error(ZC_ERROR_FILE_READ_FAILED);
  }

  return ZC_SUCCESS;
}

// zc::Zip - Target
// ================

ZCResult ZipTarget::create_file(const char* file_name) noexcept {
  ZC_PROPAGATE(reset());
  ZC_PROPAGATE(_file.open(file_name, ZC_FILE_OPEN_WRITE | ZC_FILE_OPEN_CREATE | ZC_FILE_OPEN_TRUNCATE));

  _position = 0;
  _is_memory = false;
  return ZC_SUCCESS;
}

ZCResult ZipTarget::open_existing_file(const char* file_name, uint64_t position) noexcept {
  ZC_PROPAGATE(reset());
  ZC_PROPAGATE(_file.open(file_name, ZC_FILE_OPEN_WRITE));

  _position = position;
  _is_memory = false;
  return ZC_SUCCESS;
}

void ZipTarget::open_memory() noexcept {
  zc_unused(reset());

  _position = 0;
  _is_memory = true;
}

ZCResult ZipTarget::reset() noexcept {
  ZCResult result = _file.close();

  zc_unused(_memory.reset());
  _position = 0;
  _is_memory = false;

  return result;
}

ZCResult ZipTarget::write(const void* data, size_t n) noexcept {
  if (_is_memory) {
    ZC_PROPAGATE(_memory.append_data(data, n));
    _position += n;
    return ZC_SUCCESS;
  }

  size_t bytes_written;
  ZC_PROPAGATE(_file.write_at(_position, data, n, &bytes_written));

  _position += bytes_written;
  if (ZC_UNLIKELY(bytes_written != n)) {
    return zc_make_error(ZC_ERROR_FILE_WRITE_FAILED);
  }

  return ZC_SUCCESS;
}

ZCResult ZipTarget::write_zeros(uint64_t n) noexcept {
  static const uint8_t zeros[4096] {};

  while (n) {
    size_t chunk = size_t(zc_min<uint64_t>(n, sizeof(zeros)));
    ZC_PROPAGATE(write(zeros, chunk));
    n -= chunk;
  }

  return ZC_SUCCESS;
}

ZCResult ZipTarget::finish() noexcept {
  if (_is_memory) {
    return ZC_SUCCESS;
  }

  if (ZC_UNLIKELY(_position > uint64_t(INT64_MAX))) {
    return zc_make_error(ZC_ERROR_ARCHIVE_TOO_LARGE);
  }

  return _file.truncate(int64_t(_position));
}

} // {zc::Zip}
