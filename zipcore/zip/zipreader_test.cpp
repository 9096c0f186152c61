// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zipcore/core/api-build_test_p.h>
#if defined(ZC_TEST)

#include <zipcore/compression/checksum_p.h>
#include <zipcore/core/filesystem.h>
#include <zipcore/zip/zipformat_p.h>
#include <zipcore/zip/zipreader.h>
#include <zipcore/zip/zipwriter.h>

#include <string>
#include <vector>

// zc::ZipReader - Tests
// =====================

namespace zc::ZipReaderInternal::Tests {

using namespace zc::Zip;

static std::string make_text(size_t size) {
  static const char kWords[] = "The quick brown fox jumps over the lazy dog. Pack my box with five dozen liquor jugs. ";
  std::string s;
  while (s.size() < size)
    s += kWords;
  s.resize(size);
  return s;
}

static void make_noise(ZCByteArray& dst, size_t size, uint32_t seed) {
  uint8_t* p;
  ASSERT_SUCCESS(dst.modify_op(ZC_MODIFY_OP_ASSIGN_FIT, size, &p));

  for (size_t i = 0; i < size; i++) {
    seed = seed * 1103515245u + 12345u;
    p[i] = uint8_t(seed >> 24);
  }
}

struct SampleArchive {
  std::string text;
  ZCByteArray noise;
  ZCByteArray data;
};

// Contains "hello.txt" (stored), "text.txt" (deflated), "dir/" and "noise.bin" (stored, 200KB).
static void make_sample_archive(SampleArchive& sample) {
  sample.text = make_text(30000);
  make_noise(sample.noise, 200000, 42u);

  ZCZipWriter writer;
  ASSERT_SUCCESS(writer.open_memory());
  ASSERT_SUCCESS(writer.add_buffer("hello.txt", "hello world", 11, nullptr, ZC_COMPRESSION_LEVEL_STORE));
  ASSERT_SUCCESS(writer.add_buffer("text.txt", sample.text.data(), sample.text.size(), "deflated"));
  ASSERT_SUCCESS(writer.add_directory("dir"));
  ASSERT_SUCCESS(writer.add_buffer("noise.bin", sample.noise.view()));
  ASSERT_SUCCESS(writer.finalize());
  ASSERT_SUCCESS(writer.take_memory(sample.data));
}

static uint64_t entry_data_offset(ZCZipReader& reader, uint32_t index) {
  ZCZipEntry entry;
  EXPECT_SUCCESS(reader.stat(index, &entry));
  return entry.local_header_ofs + LocalFileHeader::kBaseSize + strlen(entry.filename);
}

struct SinkData {
  std::vector<uint8_t> content;
  std::vector<uint64_t> offsets;
  size_t fail_after;
};

static size_t ZC_CDECL collect_sink(void* user_data, uint64_t offset, const void* data, size_t size) {
  SinkData* sink = static_cast<SinkData*>(user_data);
  if (sink->offsets.size() >= sink->fail_after)
    return 0;

  sink->offsets.push_back(offset);
  sink->content.insert(sink->content.end(), static_cast<const uint8_t*>(data), static_cast<const uint8_t*>(data) + size);
  return size;
}

TEST(ZipCore_ZipReader, OpenFailures) {
  ZCTestTempDir tmp;
  std::string missing = tmp.file("missing.zip");

  ZCZipReader reader;
  EXPECT_EQ(reader.open_file(missing.c_str()), ZC_ERROR_FILE_OPEN_FAILED);
  EXPECT_FALSE(reader.is_open());

  const char kText[] = "this is certainly not a zip archive";
  EXPECT_EQ(reader.open_memory(kText, sizeof(kText) - 1), ZC_ERROR_NOT_AN_ARCHIVE);
  EXPECT_EQ(reader.last_error(), ZC_ERROR_NOT_AN_ARCHIVE);
  EXPECT_FALSE(reader.is_open());
  EXPECT_EQ(reader.entry_count(), 0u);

  std::string text_file = tmp.file("text.zip");
  ASSERT_SUCCESS(zc_test_write_file(text_file, kText, sizeof(kText) - 1));
  EXPECT_EQ(reader.open_file(text_file.c_str()), ZC_ERROR_NOT_AN_ARCHIVE);

  // Operations on a closed reader.
  ZCZipEntry entry;
  uint32_t index;
  ZCByteArray content;
  EXPECT_EQ(reader.stat(0u, &entry), ZC_ERROR_INVALID_STATE);
  EXPECT_EQ(reader.locate("a.txt", &index), ZC_ERROR_INVALID_STATE);
  EXPECT_EQ(reader.extract_to_memory(0u, content), ZC_ERROR_INVALID_STATE);
  EXPECT_EQ(reader.validate_all(), ZC_ERROR_INVALID_STATE);

  ZCDataView comment { reinterpret_cast<const uint8_t*>("x"), 1u };
  EXPECT_EQ(reader.archive_comment(&comment), ZC_ERROR_INVALID_STATE);
  EXPECT_EQ(comment.size, 0u);
  EXPECT_EQ(reader.last_error(), ZC_ERROR_INVALID_STATE);
}

TEST(ZipCore_ZipReader, StatAndExtract) {
  SampleArchive sample;
  make_sample_archive(sample);

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_memory(sample.data.view()));
  ASSERT_EQ(reader.entry_count(), 4u);
  ZCDataView comment;
  ASSERT_SUCCESS(reader.archive_comment(&comment));
  EXPECT_EQ(comment.size, 0u);

  ZCZipEntry entry;
  ASSERT_SUCCESS(reader.stat(1u, &entry));
  EXPECT_EQ(entry.file_index, 1u);
  EXPECT_STREQ(entry.filename, "text.txt");
  EXPECT_STREQ(entry.comment, "deflated");
  EXPECT_EQ(entry.method, ZC_ZIP_METHOD_DEFLATE);
  EXPECT_EQ(entry.uncomp_size, uint64_t(sample.text.size()));
  EXPECT_EQ(entry.crc32, Compression::Checksum::crc32(reinterpret_cast<const uint8_t*>(sample.text.data()), sample.text.size()));
  EXPECT_GT(entry.central_dir_ofs, entry.local_header_ofs);

  ZCDataView name;
  ASSERT_SUCCESS(reader.get_name(2u, &name));
  ASSERT_EQ(name.size, 4u);
  EXPECT_EQ(memcmp(name.data, "dir/", 4), 0);

  ZCByteArray content;
  ASSERT_SUCCESS(reader.extract_to_memory(0u, content));
  ASSERT_EQ(content.size, 11u);
  EXPECT_EQ(memcmp(content.data, "hello world", 11), 0);

  ASSERT_SUCCESS(reader.extract_to_memory("text.txt", content));
  ASSERT_EQ(content.size, sample.text.size());
  EXPECT_EQ(memcmp(content.data, sample.text.data(), sample.text.size()), 0);

  ASSERT_SUCCESS(reader.extract_to_memory(3u, content));
  EXPECT_TRUE(content == sample.noise);

  ASSERT_SUCCESS(reader.extract_to_memory(2u, content));
  EXPECT_EQ(content.size, 0u);

  EXPECT_SUCCESS(reader.validate_all());
}

TEST(ZipCore_ZipReader, IndexOutOfRange) {
  SampleArchive sample;
  make_sample_archive(sample);

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_memory(sample.data.view()));

  ZCZipEntry entry;
  ZCDataView name;
  ZCByteArray content;
  uint8_t buffer[16];

  EXPECT_EQ(reader.stat(4u, &entry), ZC_ERROR_INVALID_PARAMETER);
  EXPECT_EQ(reader.get_name(100u, &name), ZC_ERROR_INVALID_PARAMETER);
  EXPECT_EQ(reader.extract_to_memory(4u, content), ZC_ERROR_INVALID_PARAMETER);
  EXPECT_EQ(reader.extract_to_buffer(4u, buffer, sizeof(buffer)), ZC_ERROR_INVALID_PARAMETER);
  EXPECT_EQ(reader.validate(4u), ZC_ERROR_INVALID_PARAMETER);
  EXPECT_EQ(reader.last_error(), ZC_ERROR_INVALID_PARAMETER);
  EXPECT_FALSE(reader.is_directory(4u));

  // The reader is still usable.
  ASSERT_SUCCESS(reader.stat(3u, &entry));
}

TEST(ZipCore_ZipReader, Locate) {
  SampleArchive sample;
  make_sample_archive(sample);

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_memory(sample.data.view()));

  uint32_t index;
  ASSERT_SUCCESS(reader.locate("noise.bin", &index));
  EXPECT_EQ(index, 3u);

  ASSERT_SUCCESS(reader.locate("dir/", &index));
  EXPECT_EQ(index, 2u);

  ASSERT_SUCCESS(reader.locate("text.txt.bak", 8, &index));
  EXPECT_EQ(index, 1u);

  EXPECT_EQ(reader.locate("HELLO.TXT", &index), ZC_ERROR_FILE_NOT_FOUND);
  EXPECT_EQ(reader.locate("dir", &index), ZC_ERROR_FILE_NOT_FOUND);

  ZCByteArray content;
  EXPECT_EQ(reader.extract_to_memory("missing.txt", content), ZC_ERROR_FILE_NOT_FOUND);
}

TEST(ZipCore_ZipReader, ExtractToBuffer) {
  SampleArchive sample;
  make_sample_archive(sample);

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_memory(sample.data.view()));

  char small[10];
  size_t size = 1234;
  EXPECT_EQ(reader.extract_to_buffer(0u, small, sizeof(small), &size), ZC_ERROR_BUF_TOO_SMALL);
  EXPECT_EQ(size, 0u);

  char exact[11];
  ASSERT_SUCCESS(reader.extract_to_buffer(0u, exact, sizeof(exact), &size));
  EXPECT_EQ(size, 11u);
  EXPECT_EQ(memcmp(exact, "hello world", 11), 0);

  std::vector<char> large(sample.text.size() + 100);
  ASSERT_SUCCESS(reader.extract_to_buffer("text.txt", large.data(), large.size(), &size));
  ASSERT_EQ(size, sample.text.size());
  EXPECT_EQ(memcmp(large.data(), sample.text.data(), size), 0);
}

TEST(ZipCore_ZipReader, ExtractToSink) {
  SampleArchive sample;
  make_sample_archive(sample);

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_memory(sample.data.view()));

  for (uint32_t index : { 1u, 3u }) {
    SinkData sink {};
    sink.fail_after = SIZE_MAX;
    ASSERT_SUCCESS(reader.extract_to_sink(index, collect_sink, &sink));

    const uint8_t* expected = index == 1u ? reinterpret_cast<const uint8_t*>(sample.text.data()) : sample.noise.data;
    size_t expected_size = index == 1u ? sample.text.size() : sample.noise.size;

    ASSERT_EQ(sink.content.size(), expected_size);
    EXPECT_EQ(memcmp(sink.content.data(), expected, expected_size), 0);

    // Offsets start at zero and grow monotonically.
    ASSERT_FALSE(sink.offsets.empty());
    EXPECT_EQ(sink.offsets[0], 0u);
    for (size_t i = 1; i < sink.offsets.size(); i++)
      EXPECT_GT(sink.offsets[i], sink.offsets[i - 1]);
  }

  // Large stored entry is delivered in more than one call.
  SinkData sink {};
  sink.fail_after = SIZE_MAX;
  ASSERT_SUCCESS(reader.extract_to_sink("noise.bin", collect_sink, &sink));
  EXPECT_GT(sink.offsets.size(), 1u);

  // Directory has no data.
  SinkData dir_sink {};
  dir_sink.fail_after = SIZE_MAX;
  ASSERT_SUCCESS(reader.extract_to_sink(2u, collect_sink, &dir_sink));
  EXPECT_TRUE(dir_sink.offsets.empty());

  SinkData failing {};
  failing.fail_after = 0;
  EXPECT_EQ(reader.extract_to_sink(3u, collect_sink, &failing), ZC_ERROR_WRITE_CALLBACK_FAILED);
  EXPECT_EQ(reader.extract_to_sink(3u, nullptr, &failing), ZC_ERROR_INVALID_PARAMETER);
}

TEST(ZipCore_ZipReader, ExtractToFile) {
  ZCTestTempDir tmp;
  SampleArchive sample;
  make_sample_archive(sample);

  std::string archive_name = tmp.file("sample.zip");
  ASSERT_SUCCESS(zc_test_write_file(archive_name, sample.data));

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_file(archive_name.c_str()));
  ASSERT_EQ(reader.entry_count(), 4u);

  std::string text_name = tmp.file("text.txt");
  ASSERT_SUCCESS(reader.extract_to_file("text.txt", text_name.c_str()));

  ZCByteArray content;
  ASSERT_SUCCESS(zc_test_read_file(text_name, content));
  ASSERT_EQ(content.size, sample.text.size());
  EXPECT_EQ(memcmp(content.data, sample.text.data(), content.size), 0);

  // Overwrite is the default.
  ASSERT_SUCCESS(reader.extract_to_file(0u, text_name.c_str()));
  ASSERT_SUCCESS(zc_test_read_file(text_name, content));
  ASSERT_EQ(content.size, 11u);

  EXPECT_EQ(reader.extract_to_file(1u, text_name.c_str(), ZC_ZIP_EXTRACT_FLAG_NO_OVERWRITE), ZC_ERROR_FILE_CREATE_FAILED);
  ASSERT_SUCCESS(zc_test_read_file(text_name, content));
  EXPECT_EQ(content.size, 11u);

  // Directory entry creates a directory.
  std::string dir_name = tmp.file("out/dir");
  ASSERT_SUCCESS(reader.extract_to_file(2u, dir_name.c_str()));

  ZCFileInfo info;
  ASSERT_SUCCESS(ZCFileSystem::file_info(dir_name.c_str(), &info));
  EXPECT_TRUE(info.is_directory());
}

TEST(ZipCore_ZipReader, CorruptedStoredEntry) {
  SampleArchive sample;
  make_sample_archive(sample);

  {
    ZCZipReader reader;
    ASSERT_SUCCESS(reader.open_memory(sample.data.view()));
    sample.data.data[entry_data_offset(reader, 0u) + 4] ^= 0x20u;
  }

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_memory(sample.data.view()));

  ZCByteArray content;
  EXPECT_EQ(reader.extract_to_memory(0u, content), ZC_ERROR_CRC_CHECK_FAILED);
  EXPECT_EQ(content.size, 0u);
  EXPECT_EQ(reader.validate(0u), ZC_ERROR_VALIDATION_FAILED);
  EXPECT_EQ(reader.validate_all(), ZC_ERROR_VALIDATION_FAILED);

  // Other entries are not affected.
  EXPECT_SUCCESS(reader.validate(1u));

  ASSERT_SUCCESS(reader.extract_to_memory(0u, content, ZC_ZIP_EXTRACT_FLAG_SKIP_CRC_CHECK));
  ASSERT_EQ(content.size, 11u);
  EXPECT_EQ(memcmp(content.data, "hellO world", 11), 0);

  ZCZipReader unchecked;
  ASSERT_SUCCESS(unchecked.open_memory(sample.data.view(), ZC_ZIP_READER_FLAG_SKIP_CRC_CHECK));
  EXPECT_SUCCESS(unchecked.extract_to_memory(0u, content));
}

TEST(ZipCore_ZipReader, CorruptedDeflatedEntry) {
  SampleArchive sample;
  make_sample_archive(sample);

  {
    ZCZipReader reader;
    ASSERT_SUCCESS(reader.open_memory(sample.data.view()));

    ZCZipEntry entry;
    ASSERT_SUCCESS(reader.stat(1u, &entry));
    ASSERT_EQ(entry.method, ZC_ZIP_METHOD_DEFLATE);
    sample.data.data[entry_data_offset(reader, 1u) + entry.comp_size / 2u] ^= 0x55u;
  }

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_memory(sample.data.view()));

  ZCByteArray content;
  EXPECT_NE(reader.extract_to_memory(1u, content), ZC_SUCCESS);
  EXPECT_EQ(content.size, 0u);
  EXPECT_EQ(reader.validate(1u), ZC_ERROR_VALIDATION_FAILED);
  EXPECT_SUCCESS(reader.validate(0u));
}

TEST(ZipCore_ZipReader, LocalHeaderMismatch) {
  SampleArchive sample;
  make_sample_archive(sample);

  {
    ZCZipReader reader;
    ASSERT_SUCCESS(reader.open_memory(sample.data.view()));

    ZCZipEntry entry;
    ASSERT_SUCCESS(reader.stat(0u, &entry));
    sample.data.data[entry.local_header_ofs + LocalFileHeader::kBaseSize] = 'j';
  }

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_memory(sample.data.view()));
  EXPECT_EQ(reader.validate(0u), ZC_ERROR_VALIDATION_FAILED);

  // Broken local header signature.
  ZCZipEntry entry;
  ASSERT_SUCCESS(reader.stat(1u, &entry));
  sample.data.data[entry.local_header_ofs] = 'X';

  ZCByteArray content;
  EXPECT_EQ(reader.extract_to_memory(1u, content), ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);
  EXPECT_EQ(reader.validate(1u), ZC_ERROR_VALIDATION_FAILED);
}

TEST(ZipCore_ZipReader, UnsupportedEntries) {
  ZCTestTempDir tmp;
  SampleArchive sample;
  make_sample_archive(sample);

  ZCZipEntry hello;
  ZCZipEntry text;
  {
    ZCZipReader reader;
    ASSERT_SUCCESS(reader.open_memory(sample.data.view()));
    ASSERT_SUCCESS(reader.stat(0u, &hello));
    ASSERT_SUCCESS(reader.stat(1u, &text));
  }

  // Mark "hello.txt" as encrypted and "text.txt" as compressed by an unknown method.
  CentralDirHeader* hello_header = reinterpret_cast<CentralDirHeader*>(sample.data.data + hello.central_dir_ofs);
  hello_header->bit_flag = hello_header->bit_flag() | 0x1u;

  CentralDirHeader* text_header = reinterpret_cast<CentralDirHeader*>(sample.data.data + text.central_dir_ofs);
  text_header->method = 12u;

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_memory(sample.data.view()));

  ZCZipEntry entry;
  ASSERT_SUCCESS(reader.stat(0u, &entry));
  EXPECT_TRUE(entry.is_encrypted);
  EXPECT_FALSE(entry.is_supported);

  ASSERT_SUCCESS(reader.stat(1u, &entry));
  EXPECT_FALSE(entry.is_encrypted);
  EXPECT_FALSE(entry.is_supported);
  EXPECT_EQ(entry.method, 12u);

  ZCByteArray content;
  EXPECT_EQ(reader.extract_to_memory(0u, content), ZC_ERROR_UNSUPPORTED_ENCRYPTION);
  EXPECT_EQ(reader.extract_to_memory(1u, content), ZC_ERROR_UNSUPPORTED_METHOD);

  // Nothing is created for entries that cannot be extracted.
  std::string out = tmp.file("text.txt");
  EXPECT_EQ(reader.extract_to_file(1u, out.c_str()), ZC_ERROR_UNSUPPORTED_METHOD);

  ZCFileInfo info;
  EXPECT_EQ(ZCFileSystem::file_info(out.c_str(), &info), ZC_ERROR_FILE_NOT_FOUND);

  // Supported entries can still be extracted.
  ASSERT_SUCCESS(reader.extract_to_memory(3u, content));
  EXPECT_TRUE(content == sample.noise);
}

TEST(ZipCore_ZipReader, InconsistentCentralDirectory) {
  SampleArchive sample;
  make_sample_archive(sample);

  size_t eocd_ofs = sample.data.size - EndOfCentralDir::kBaseSize;
  EndOfCentralDir* eocd = reinterpret_cast<EndOfCentralDir*>(sample.data.data + eocd_ofs);
  uint32_t cdir_ofs = eocd->cdir_ofs();

  ZCZipReader reader;

  // Fewer entries than records.
  eocd->entries_on_disk = 3u;
  eocd->total_entries = 3u;
  EXPECT_EQ(reader.open_memory(sample.data.view()), ZC_ERROR_INVALID_HEADER_OR_CORRUPTED);

  // Central directory points to a local header.
  eocd->entries_on_disk = 4u;
  eocd->total_entries = 4u;
  eocd->cdir_ofs = 0u;
  EXPECT_EQ(reader.open_memory(sample.data.view()), ZC_ERROR_FAILED_FINDING_CENTRAL_DIR);

  eocd->cdir_ofs = cdir_ofs;
  ASSERT_SUCCESS(reader.open_memory(sample.data.view()));
  EXPECT_EQ(reader.entry_count(), 4u);

  // Truncated archive.
  EXPECT_EQ(reader.open_memory(sample.data.data, eocd_ofs), ZC_ERROR_NOT_AN_ARCHIVE);
}

TEST(ZipCore_ZipReader, LongNamesAreTruncated) {
  std::string long_name = std::string(600, 'a') + ".txt";

  ZCZipWriter writer;
  ASSERT_SUCCESS(writer.open_memory());
  ASSERT_SUCCESS(writer.add_buffer(long_name.c_str(), "x", 1));
  ASSERT_SUCCESS(writer.finalize());

  ZCByteArray archive;
  ASSERT_SUCCESS(writer.take_memory(archive));

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_memory(archive.view()));

  ZCZipEntry entry;
  ASSERT_SUCCESS(reader.stat(0u, &entry));
  EXPECT_EQ(strlen(entry.filename), size_t(ZC_ZIP_ENTRY_STRING_CAPACITY - 1));
  EXPECT_EQ(memcmp(entry.filename, long_name.data(), ZC_ZIP_ENTRY_STRING_CAPACITY - 1), 0);

  ZCDataView name;
  ASSERT_SUCCESS(reader.get_name(0u, &name));
  EXPECT_EQ(name.size, long_name.size());

  uint32_t index;
  ASSERT_SUCCESS(reader.locate(long_name.c_str(), &index));
  EXPECT_EQ(index, 0u);
}

TEST(ZipCore_ZipReader, Zip64Records) {
  // Single stored entry described only by zip64 records.
  static const char kName[] = "z.txt";
  static const char kData[] = "hello";
  const uint32_t kNameSize = 5;
  const uint32_t kDataSize = 5;
  uint32_t crc = Compression::Checksum::crc32(reinterpret_cast<const uint8_t*>(kData), kDataSize);

  uint8_t local_extra[20];
  MemOps::writeU16uLE(local_extra + 0, kZip64ExtraFieldId);
  MemOps::writeU16uLE(local_extra + 2, 16u);
  MemOps::writeU64uLE(local_extra + 4, uint64_t(kDataSize));
  MemOps::writeU64uLE(local_extra + 12, uint64_t(kDataSize));

  ZCByteArray archive;

  LocalFileHeader local;
  memset(&local, 0, sizeof(local));
  local.signature = LocalFileHeader::kSignature;
  local.version_needed = uint32_t(kVersionZip64);
  local.method = uint32_t(ZC_ZIP_METHOD_STORE);
  local.crc32 = crc;
  local.comp_size = kZip64Marker32;
  local.uncomp_size = kZip64Marker32;
  local.name_size = kNameSize;
  local.extra_size = uint32_t(sizeof(local_extra));

  ASSERT_SUCCESS(archive.append_data(&local, sizeof(local)));
  ASSERT_SUCCESS(archive.append_data(kName, kNameSize));
  ASSERT_SUCCESS(archive.append_data(local_extra, sizeof(local_extra)));
  ASSERT_SUCCESS(archive.append_data(kData, kDataSize));

  uint64_t cdir_ofs = archive.size;

  CentralDirHeader central;
  memset(&central, 0, sizeof(central));
  central.signature = CentralDirHeader::kSignature;
  central.version_made_by = uint32_t(kVersionZip64);
  central.version_needed = uint32_t(kVersionZip64);
  central.method = uint32_t(ZC_ZIP_METHOD_STORE);
  central.crc32 = crc;
  central.comp_size = kZip64Marker32;
  central.uncomp_size = kZip64Marker32;
  central.name_size = kNameSize;
  central.extra_size = uint32_t(sizeof(local_extra));
  central.local_header_ofs = 0u;

  ASSERT_SUCCESS(archive.append_data(&central, sizeof(central)));
  ASSERT_SUCCESS(archive.append_data(kName, kNameSize));
  ASSERT_SUCCESS(archive.append_data(local_extra, sizeof(local_extra)));

  uint64_t cdir_size = archive.size - cdir_ofs;
  uint64_t zip64_eocd_ofs = archive.size;

  Zip64EndOfCentralDir zip64_eocd;
  memset(&zip64_eocd, 0, sizeof(zip64_eocd));
  zip64_eocd.signature = Zip64EndOfCentralDir::kSignature;
  zip64_eocd.record_size = uint64_t(Zip64EndOfCentralDir::kBaseSize - 12u);
  zip64_eocd.version_made_by = uint32_t(kVersionZip64);
  zip64_eocd.version_needed = uint32_t(kVersionZip64);
  zip64_eocd.entries_on_disk = uint64_t(1);
  zip64_eocd.total_entries = uint64_t(1);
  zip64_eocd.cdir_size = cdir_size;
  zip64_eocd.cdir_ofs = cdir_ofs;
  ASSERT_SUCCESS(archive.append_data(&zip64_eocd, sizeof(zip64_eocd)));

  Zip64EndOfCentralDirLocator locator;
  locator.signature = Zip64EndOfCentralDirLocator::kSignature;
  locator.zip64_eocd_disk = 0u;
  locator.zip64_eocd_ofs = zip64_eocd_ofs;
  locator.total_disks = 1u;
  ASSERT_SUCCESS(archive.append_data(&locator, sizeof(locator)));

  EndOfCentralDir eocd;
  memset(&eocd, 0, sizeof(eocd));
  eocd.signature = EndOfCentralDir::kSignature;
  eocd.entries_on_disk = kZip64Marker16;
  eocd.total_entries = kZip64Marker16;
  eocd.cdir_size = kZip64Marker32;
  eocd.cdir_ofs = kZip64Marker32;
  ASSERT_SUCCESS(archive.append_data(&eocd, sizeof(eocd)));

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_memory(archive.view()));
  ASSERT_EQ(reader.entry_count(), 1u);

  ZCZipEntry entry;
  ASSERT_SUCCESS(reader.stat(0u, &entry));
  EXPECT_STREQ(entry.filename, "z.txt");
  EXPECT_EQ(entry.comp_size, 5u);
  EXPECT_EQ(entry.uncomp_size, 5u);
  EXPECT_EQ(entry.central_dir_ofs, cdir_ofs);

  ZCByteArray content;
  ASSERT_SUCCESS(reader.extract_to_memory(0u, content));
  ASSERT_EQ(content.size, 5u);
  EXPECT_EQ(memcmp(content.data, "hello", 5), 0);
  EXPECT_SUCCESS(reader.validate_all());
}

} // {zc::ZipReaderInternal::Tests}

#endif // ZC_TEST
