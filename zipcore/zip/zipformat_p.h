// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef ZIPCORE_ZIP_ZIPFORMAT_P_H_INCLUDED
#define ZIPCORE_ZIP_ZIPFORMAT_P_H_INCLUDED

#include <zipcore/core/api-internal_p.h>
#include <zipcore/core/bytearray.h>
#include <zipcore/core/filesystem.h>
#include <zipcore/support/memops_p.h>
#include <zipcore/support/ptrops_p.h>
#include <zipcore/zip/zipentry.h>

//! \cond INTERNAL
//! \addtogroup zipcore_internal
//! \{

//! \namespace zc::Zip
//! Low-level ZIP format functionality, not exposed to users directly.

namespace zc::Zip {

// zc::Zip - Data Types
// ====================

template<size_t Size>
struct DataAccess {};

template<>
struct DataAccess<2> {
  static ZC_INLINE_NODEBUG uint32_t read_value(const uint8_t* data) noexcept { return MemOps::readU16uLE(data); }
  static ZC_INLINE void write_value(uint8_t* data, uint32_t value) noexcept { MemOps::writeU16uLE(data, value); }
};

template<>
struct DataAccess<4> {
  static ZC_INLINE_NODEBUG uint32_t read_value(const uint8_t* data) noexcept { return MemOps::readU32uLE(data); }
  static ZC_INLINE void write_value(uint8_t* data, uint32_t value) noexcept { MemOps::writeU32uLE(data, value); }
};

template<>
struct DataAccess<8> {
  static ZC_INLINE_NODEBUG uint64_t read_value(const uint8_t* data) noexcept { return MemOps::readU64uLE(data); }
  static ZC_INLINE void write_value(uint8_t* data, uint64_t value) noexcept { MemOps::writeU64uLE(data, value); }
};

#pragma pack(push, 1)
template<typename T, size_t Size>
struct DataType {
  uint8_t data[Size];

  ZC_INLINE_NODEBUG T value() const noexcept { return T(DataAccess<Size>::read_value(data)); }
  ZC_INLINE void set_value(T value) noexcept { DataAccess<Size>::write_value(data, value); }

  ZC_INLINE_NODEBUG T operator()() const noexcept { return value(); }
  ZC_INLINE_NODEBUG DataType& operator=(T other) noexcept { set_value(other); return *this; }
};
#pragma pack(pop)

// Everything in ZIP is little-endian.
typedef DataType<uint16_t, 2> UInt16;
typedef DataType<uint32_t, 4> UInt32;
typedef DataType<uint64_t, 8> UInt64;

// zc::Zip - Constants
// ===================

//! Maximum size of the area at the end of the archive that is searched for the end of central directory record
//! (the record itself followed by the longest possible comment).
static constexpr uint32_t kEndOfCentralDirScanSize = 22u + 0xFFFFu;

//! Maximum size of a name, comment, or extra field (16-bit size fields).
static constexpr uint32_t kMaxFieldSize = 0xFFFFu;

//! Maximum number of entries an archive without zip64 records can have.
static constexpr uint32_t kMaxEntryCount = 0xFFFFu;

//! Maximum number of entries of any archive.
static constexpr uint32_t kMaxEntryCount64 = 0xFFFFFFFFu;

//! A 32-bit value that marks a field stored in zip64 extended information.
static constexpr uint32_t kZip64Marker32 = 0xFFFFFFFFu;

//! A 16-bit value that marks a field stored in zip64 extended information.
static constexpr uint32_t kZip64Marker16 = 0xFFFFu;

//! Header ID of zip64 extended information extra field.
static constexpr uint32_t kZip64ExtraFieldId = 0x0001u;

//! MS-DOS directory attribute.
static constexpr uint32_t kDosDirectoryAttribute = 0x10u;

//! General purpose bit flags.
enum GeneralFlags : uint32_t {
  kFlagEncrypted           = 0x0001u,
  kFlagDataDescriptor      = 0x0008u,
  kFlagCompressedPatched   = 0x0020u,
  kFlagStrongEncryption    = 0x0040u,
  kFlagUtf8                = 0x0800u,
  kFlagLocalHeaderMasked   = 0x2000u,

  kFlagUnsupportedMask     = kFlagCompressedPatched | kFlagStrongEncryption | kFlagLocalHeaderMasked
};

//! Versions written to local and central headers (version needed to extract / version made by).
enum Version : uint32_t {
  kVersionStore            = 10u,
  kVersionDeflate          = 20u,
  kVersionZip64            = 45u
};

// zc::Zip - Records
// =================

#pragma pack(push, 1)

struct LocalFileHeader {
  enum : uint32_t {
    kBaseSize = 30,
    kSignature = 0x04034B50u
  };

  UInt32 signature;
  UInt16 version_needed;
  UInt16 bit_flag;
  UInt16 method;
  UInt16 dos_time;
  UInt16 dos_date;
  UInt32 crc32;
  UInt32 comp_size;
  UInt32 uncomp_size;
  UInt16 name_size;
  UInt16 extra_size;
};

struct CentralDirHeader {
  enum : uint32_t {
    kBaseSize = 46,
    kSignature = 0x02014B50u
  };

  UInt32 signature;
  UInt16 version_made_by;
  UInt16 version_needed;
  UInt16 bit_flag;
  UInt16 method;
  UInt16 dos_time;
  UInt16 dos_date;
  UInt32 crc32;
  UInt32 comp_size;
  UInt32 uncomp_size;
  UInt16 name_size;
  UInt16 extra_size;
  UInt16 comment_size;
  UInt16 disk_start;
  UInt16 internal_attr;
  UInt32 external_attr;
  UInt32 local_header_ofs;
};

struct EndOfCentralDir {
  enum : uint32_t {
    kBaseSize = 22,
    kSignature = 0x06054B50u
  };

  UInt32 signature;
  UInt16 disk_number;
  UInt16 cdir_disk;
  UInt16 entries_on_disk;
  UInt16 total_entries;
  UInt32 cdir_size;
  UInt32 cdir_ofs;
  UInt16 comment_size;
};

struct Zip64EndOfCentralDirLocator {
  enum : uint32_t {
    kBaseSize = 20,
    kSignature = 0x07064B50u
  };

  UInt32 signature;
  UInt32 zip64_eocd_disk;
  UInt64 zip64_eocd_ofs;
  UInt32 total_disks;
};

struct Zip64EndOfCentralDir {
  enum : uint32_t {
    kBaseSize = 56,
    kSignature = 0x06064B50u
  };

  UInt32 signature;
  //! Size of the remaining record (excluding `signature` and `record_size` fields).
  UInt64 record_size;
  UInt16 version_made_by;
  UInt16 version_needed;
  UInt32 disk_number;
  UInt32 cdir_disk;
  UInt64 entries_on_disk;
  UInt64 total_entries;
  UInt64 cdir_size;
  UInt64 cdir_ofs;
};

struct ExtraFieldHeader {
  enum : uint32_t { kBaseSize = 4 };

  UInt16 id;
  UInt16 size;
};

#pragma pack(pop)

ZC_STATIC_ASSERT(sizeof(LocalFileHeader) == LocalFileHeader::kBaseSize);
ZC_STATIC_ASSERT(sizeof(CentralDirHeader) == CentralDirHeader::kBaseSize);
ZC_STATIC_ASSERT(sizeof(EndOfCentralDir) == EndOfCentralDir::kBaseSize);
ZC_STATIC_ASSERT(sizeof(Zip64EndOfCentralDirLocator) == Zip64EndOfCentralDirLocator::kBaseSize);
ZC_STATIC_ASSERT(sizeof(Zip64EndOfCentralDir) == Zip64EndOfCentralDir::kBaseSize);

//! Maximum size of zip64 extended information in a local header (header + uncompressed and compressed sizes).
static constexpr uint32_t kLocalZip64ExtraSize = ExtraFieldHeader::kBaseSize + 16u;

//! Maximum size of zip64 extended information in a central directory header (header + sizes + local offset).
static constexpr uint32_t kCentralZip64ExtraSize = ExtraFieldHeader::kBaseSize + 24u;

// zc::Zip - Entry Record
// ======================

//! Parsed central directory record.
//!
//! Records are kept in a `ZCByteArray` next to the raw central directory, which holds the name, extra field, and
//! comment of each record at `record_ofs`. Values stored in zip64 extended information are already resolved.
struct EntryRecord {
  uint64_t comp_size;
  uint64_t uncomp_size;
  uint64_t local_header_ofs;

  //! Offset of the record in the central directory.
  uint32_t record_ofs;
  uint32_t crc32;
  uint32_t external_attr;

  uint16_t version_made_by;
  uint16_t version_needed;
  uint16_t bit_flag;
  uint16_t method;
  uint16_t dos_time;
  uint16_t dos_date;
  uint16_t internal_attr;
  uint16_t name_size;
  uint16_t extra_size;
  uint16_t comment_size;

  ZC_INLINE_NODEBUG size_t record_size() const noexcept {
    return CentralDirHeader::kBaseSize + size_t(name_size) + size_t(extra_size) + size_t(comment_size);
  }

  ZC_INLINE_NODEBUG bool is_encrypted() const noexcept {
    return (bit_flag & (kFlagEncrypted | kFlagStrongEncryption)) != 0u;
  }

  ZC_INLINE_NODEBUG bool is_supported() const noexcept {
    return !is_encrypted() &&
           (bit_flag & kFlagUnsupportedMask) == 0u &&
           (method == ZC_ZIP_METHOD_STORE || method == ZC_ZIP_METHOD_DEFLATE);
  }
};

//! Typed view of records stored in a `ZCByteArray`.
static ZC_INLINE_NODEBUG EntryRecord* entry_records(const ZCByteArray& array) noexcept {
  return reinterpret_cast<EntryRecord*>(array.data);
}

static ZC_INLINE_NODEBUG size_t entry_record_count(const ZCByteArray& array) noexcept {
  return array.size / sizeof(EntryRecord);
}

//! Returns the name of `record`, which is stored in `central_dir`.
static ZC_INLINE_NODEBUG ZCDataView entry_name(const ZCByteArray& central_dir, const EntryRecord& record) noexcept {
  return ZCDataView{central_dir.data + record.record_ofs + CentralDirHeader::kBaseSize, record.name_size};
}

//! Returns the comment of `record`, which is stored in `central_dir`.
static ZC_INLINE_NODEBUG ZCDataView entry_comment(const ZCByteArray& central_dir, const EntryRecord& record) noexcept {
  size_t offset = record.record_ofs + CentralDirHeader::kBaseSize + size_t(record.name_size) + size_t(record.extra_size);
  return ZCDataView{central_dir.data + offset, record.comment_size};
}

//! Tests whether `record` describes a directory.
//!
//! A name that ends with a path separator is always a directory. Otherwise an empty entry that carries MS-DOS
//! directory attribute is a directory as well.
bool is_directory_entry(const ZCByteArray& central_dir, const EntryRecord& record) noexcept;

//! Parses a single central directory record at `offset` of `central_dir` and stores it to `out`.
//!
//! The record must fit `central_dir` and its data must precede `data_limit` (the central directory offset).
ZCResult parse_central_dir_record(const ZCByteArray& central_dir, size_t offset, uint64_t data_limit, EntryRecord* out) noexcept;

// zc::Zip - End of Central Directory
// ==================================

//! Resolved end of central directory (either from a classic or zip64 record).
struct EndOfCentralDirInfo {
  //! Offset of the classic end of central directory record.
  uint64_t eocd_ofs;
  //! Offset where the central directory data must end (either zip64 record or the classic record).
  uint64_t cdir_limit;
  uint64_t cdir_ofs;
  uint64_t cdir_size;
  uint64_t entry_count;
  //! Archive comment, read from the end record.
  ZCByteArray comment;
  bool zip64;
};

//! Locates the end of central directory record by scanning the tail of `source`.
//!
//! Fails with `ZC_ERROR_NOT_AN_ARCHIVE` when the record is not found in the last `kEndOfCentralDirScanSize` bytes.
class ZipSource;
ZCResult read_end_of_central_dir(ZipSource& source, EndOfCentralDirInfo* out) noexcept;

// zc::Zip - Names
// ===============

//! Tests whether `name` is a relative path that stays within its root when extracted.
//!
//! Rejects empty names, absolute paths, drive letters, backslashes, and `..` segments.
bool is_safe_entry_name(const char* name, size_t size) noexcept;

//! Tests whether `name` ends with a path separator.
static ZC_INLINE_NODEBUG bool has_trailing_separator(const char* name, size_t size) noexcept {
  return size != 0u && (name[size - 1u] == '/' || name[size - 1u] == '\\');
}

// zc::Zip - DOS Time
// ==================

//! Converts `t` (local time) to MS-DOS time and date. Times before 1980 are clamped to 1980-01-01 00:00:00.
void dos_time_from_unix_time(time_t t, uint16_t* dos_time_out, uint16_t* dos_date_out) noexcept;

//! Converts MS-DOS time and date (local time) to `time_t`.
time_t unix_time_from_dos_time(uint32_t dos_time, uint32_t dos_date) noexcept;

// zc::Zip - Source & Target
// =========================

//! Random access source of archive data (a file or a memory region).
class ZipSource {
public:
  ZC_NONCOPYABLE(ZipSource)

  ZCFile _file;
  const uint8_t* _data = nullptr;
  uint64_t _size = 0;

  ZC_INLINE ZipSource() noexcept {}

  ZCResult open_file(const char* file_name) noexcept;
  void open_memory(ZCDataView view) noexcept;
  void reset() noexcept;

  ZC_INLINE_NODEBUG bool is_file() const noexcept { return _file.is_open(); }
  ZC_INLINE_NODEBUG uint64_t size() const noexcept { return _size; }

  //! Tests whether `[offset, offset + n)` is within the source.
  ZC_INLINE_NODEBUG bool contains(uint64_t offset, uint64_t n) const noexcept {
    return offset <= _size && n <= _size - offset;
  }

  //! Reads exactly `n` bytes at `offset`. A range outside of the source is reported as a corrupted archive.
  ZCResult read_at(uint64_t offset, void* dst, size_t n) noexcept;
};

//! Sequential target of archive data (a file or a memory buffer).
class ZipTarget {
public:
  ZC_NONCOPYABLE(ZipTarget)

  ZCFile _file;
  ZCByteArray _memory;
  uint64_t _position = 0;
  bool _is_memory = false;

  ZC_INLINE ZipTarget() noexcept {}

  //! Creates (or truncates) `file_name`.
  ZCResult create_file(const char* file_name) noexcept;
  //! Opens an existing `file_name` for writing at `position`, data after `position` is replaced.
  ZCResult open_existing_file(const char* file_name, uint64_t position) noexcept;
  //! Builds the archive in memory.
  void open_memory() noexcept;
  //! Closes the file (if any) and releases the memory buffer.
  ZCResult reset() noexcept;

  ZC_INLINE_NODEBUG uint64_t position() const noexcept { return _position; }

  ZCResult write(const void* data, size_t n) noexcept;
  ZCResult write_zeros(uint64_t n) noexcept;

  //! Makes the target end at the current position.
  ZCResult finish() noexcept;
};

} // {zc::Zip}

//! \}
//! \endcond

#endif // ZIPCORE_ZIP_ZIPFORMAT_P_H_INCLUDED
