// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zipcore/core/api-build_test_p.h>
#if defined(ZC_TEST)

#include <zipcore/core/filesystem.h>
#include <zipcore/zip/zipreader.h>
#include <zipcore/zip/zipwriter.h>

#include <string>

#include <time.h>

// zc::ZipWriter - Tests
// =====================

namespace zc::ZipWriterInternal::Tests {

static std::string make_text(size_t size) {
  static const char kWords[] = "lorem ipsum dolor sit amet consectetur adipiscing elit sed do eiusmod tempor ";
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

static void expect_entry_content(ZCZipReader& reader, const char* name, const void* data, size_t size) {
  ZCByteArray content;
  ASSERT_SUCCESS(reader.extract_to_memory(name, content));
  ASSERT_EQ(content.size, size) << name;
  if (size)
    EXPECT_EQ(memcmp(content.data, data, size), 0) << name;
}

TEST(ZipCore_ZipWriter, StoredEntries) {
  ZCZipWriter writer;
  ASSERT_SUCCESS(writer.open_memory());
  ASSERT_SUCCESS(writer.add_buffer("a.txt", "hello", 5, nullptr, ZC_COMPRESSION_LEVEL_STORE));
  ASSERT_SUCCESS(writer.add_buffer("b.txt", "world", 5, nullptr, ZC_COMPRESSION_LEVEL_STORE));
  EXPECT_EQ(writer.entry_count(), 2u);
  ASSERT_SUCCESS(writer.finalize());
  EXPECT_TRUE(writer.is_finalized());

  ZCByteArray archive;
  ASSERT_SUCCESS(writer.take_memory(archive));

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_memory(archive.view()));
  ASSERT_EQ(reader.entry_count(), 2u);

  ZCZipEntry entry;
  ASSERT_SUCCESS(reader.stat(0u, &entry));
  EXPECT_STREQ(entry.filename, "a.txt");
  EXPECT_EQ(entry.method, ZC_ZIP_METHOD_STORE);
  EXPECT_EQ(entry.uncomp_size, 5u);
  EXPECT_EQ(entry.comp_size, 5u);
  EXPECT_EQ(entry.crc32, 0x3610A686u);
  EXPECT_EQ(entry.local_header_ofs, 0u);
  EXPECT_EQ(entry.version_needed, 10u);
  EXPECT_FALSE(entry.is_directory);
  EXPECT_FALSE(entry.is_encrypted);
  EXPECT_TRUE(entry.is_supported);

  ASSERT_SUCCESS(reader.stat(1u, &entry));
  EXPECT_STREQ(entry.filename, "b.txt");
  EXPECT_EQ(entry.local_header_ofs, 30u + 5u + 5u);

  expect_entry_content(reader, "a.txt", "hello", 5);
  expect_entry_content(reader, "b.txt", "world", 5);
}

TEST(ZipCore_ZipWriter, CompressionIsUsedOnlyWhenSmaller) {
  std::string text = make_text(50000);
  ZCByteArray noise;
  make_noise(noise, 4000, 1234u);

  ZCZipWriter writer;
  ASSERT_SUCCESS(writer.open_memory());
  ASSERT_SUCCESS(writer.add_buffer("text.txt", text.data(), text.size()));
  ASSERT_SUCCESS(writer.add_buffer("noise.bin", noise.view(), nullptr, ZC_COMPRESSION_LEVEL_BEST));
  ASSERT_SUCCESS(writer.add_buffer("empty.txt", nullptr, 0));
  ASSERT_SUCCESS(writer.finalize());

  ZCByteArray archive;
  ASSERT_SUCCESS(writer.take_memory(archive));

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_memory(archive.view()));

  ZCZipEntry entry;
  ASSERT_SUCCESS(reader.stat(0u, &entry));
  EXPECT_EQ(entry.method, ZC_ZIP_METHOD_DEFLATE);
  EXPECT_EQ(entry.version_needed, 20u);
  EXPECT_EQ(entry.uncomp_size, uint64_t(text.size()));
  EXPECT_LT(entry.comp_size, entry.uncomp_size / 10u);

  ASSERT_SUCCESS(reader.stat(1u, &entry));
  EXPECT_EQ(entry.method, ZC_ZIP_METHOD_STORE);
  EXPECT_EQ(entry.comp_size, 4000u);

  ASSERT_SUCCESS(reader.stat(2u, &entry));
  EXPECT_EQ(entry.method, ZC_ZIP_METHOD_STORE);
  EXPECT_EQ(entry.comp_size, 0u);
  EXPECT_EQ(entry.crc32, 0u);

  expect_entry_content(reader, "text.txt", text.data(), text.size());
  expect_entry_content(reader, "noise.bin", noise.data, noise.size);
  expect_entry_content(reader, "empty.txt", "", 0);
  EXPECT_SUCCESS(reader.validate_all());
}

TEST(ZipCore_ZipWriter, AllCompressionLevels) {
  std::string text = make_text(20000);

  ZCZipWriter writer;
  ASSERT_SUCCESS(writer.open_memory());

  for (int32_t level = ZC_COMPRESSION_LEVEL_STORE; level <= ZC_COMPRESSION_LEVEL_UBER; level++) {
    std::string name = "level" + std::to_string(level) + ".txt";
    ASSERT_SUCCESS(writer.add_buffer(name.c_str(), text.data(), text.size(), nullptr, level));
  }

  EXPECT_EQ(writer.add_buffer("bad-level.txt", "x", 1, nullptr, 11), ZC_ERROR_INVALID_PARAMETER);
  EXPECT_EQ(writer.add_buffer("bad-level.txt", "x", 1, nullptr, -2), ZC_ERROR_INVALID_PARAMETER);
  ASSERT_SUCCESS(writer.finalize());

  ZCByteArray archive;
  ASSERT_SUCCESS(writer.take_memory(archive));

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_memory(archive.view()));
  ASSERT_EQ(reader.entry_count(), 11u);

  for (uint32_t i = 0; i < reader.entry_count(); i++) {
    ZCByteArray content;
    ASSERT_SUCCESS(reader.extract_to_memory(i, content));
    ASSERT_EQ(content.size, text.size());
    EXPECT_EQ(memcmp(content.data, text.data(), text.size()), 0);
  }
}

TEST(ZipCore_ZipWriter, InvalidNames) {
  ZCZipWriter writer;
  ASSERT_SUCCESS(writer.open_memory());

  EXPECT_EQ(writer.add_buffer("", "x", 1), ZC_ERROR_INVALID_FILENAME);
  EXPECT_EQ(writer.add_buffer("/etc/passwd", "x", 1), ZC_ERROR_INVALID_FILENAME);
  EXPECT_EQ(writer.add_buffer("../x", "x", 1), ZC_ERROR_INVALID_FILENAME);
  EXPECT_EQ(writer.add_buffer("a/../../x", "x", 1), ZC_ERROR_INVALID_FILENAME);
  EXPECT_EQ(writer.add_buffer("c:\\x", "x", 1), ZC_ERROR_INVALID_FILENAME);
  EXPECT_EQ(writer.last_error(), ZC_ERROR_INVALID_FILENAME);

  std::string long_name(70000, 'n');
  EXPECT_EQ(writer.add_buffer(long_name.c_str(), "x", 1), ZC_ERROR_INVALID_FILENAME);

  // Directory entries cannot carry data.
  EXPECT_EQ(writer.add_buffer("dir/", "x", 1), ZC_ERROR_INVALID_FILENAME);

  ASSERT_SUCCESS(writer.add_buffer("a.txt", "x", 1));
  EXPECT_EQ(writer.add_buffer("a.txt", "y", 1), ZC_ERROR_INVALID_PARAMETER);

  std::string long_comment(70000, 'c');
  EXPECT_EQ(writer.add_buffer("b.txt", "x", 1, long_comment.c_str()), ZC_ERROR_INVALID_PARAMETER);
  EXPECT_EQ(writer.set_archive_comment(long_comment.c_str()), ZC_ERROR_INVALID_PARAMETER);

  // Rejected entries leave nothing behind.
  EXPECT_EQ(writer.entry_count(), 1u);
  ASSERT_SUCCESS(writer.finalize());

  ZCByteArray archive;
  ASSERT_SUCCESS(writer.take_memory(archive));

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_memory(archive.view()));
  EXPECT_EQ(reader.entry_count(), 1u);
  EXPECT_SUCCESS(reader.validate_all());
}

TEST(ZipCore_ZipWriter, InvalidState) {
  ZCZipWriter writer;
  EXPECT_FALSE(writer.is_open());
  EXPECT_EQ(writer.add_buffer("a.txt", "x", 1), ZC_ERROR_INVALID_STATE);
  EXPECT_EQ(writer.finalize(), ZC_ERROR_INVALID_STATE);

  ASSERT_SUCCESS(writer.open_memory());
  EXPECT_TRUE(writer.is_open());

  ZCByteArray archive;
  EXPECT_EQ(writer.take_memory(archive), ZC_ERROR_INVALID_STATE);

  ASSERT_SUCCESS(writer.add_buffer("a.txt", "x", 1));
  ASSERT_SUCCESS(writer.finalize());

  EXPECT_EQ(writer.add_buffer("b.txt", "y", 1), ZC_ERROR_INVALID_STATE);
  EXPECT_EQ(writer.add_directory("dir"), ZC_ERROR_INVALID_STATE);
  EXPECT_EQ(writer.set_archive_comment("late"), ZC_ERROR_INVALID_STATE);
  EXPECT_EQ(writer.finalize(), ZC_ERROR_INVALID_STATE);
  EXPECT_EQ(writer.last_error(), ZC_ERROR_INVALID_STATE);

  ASSERT_SUCCESS(writer.take_memory(archive));
  EXPECT_GT(archive.size, 0u);
  EXPECT_SUCCESS(writer.close());
  EXPECT_FALSE(writer.is_open());
}

TEST(ZipCore_ZipWriter, Directories) {
  ZCZipWriter writer;
  ASSERT_SUCCESS(writer.open_memory());
  ASSERT_SUCCESS(writer.add_directory("docs"));
  ASSERT_SUCCESS(writer.add_directory("docs/sub/"));
  ASSERT_SUCCESS(writer.add_buffer("docs/sub/readme.txt", "read me", 7));
  EXPECT_EQ(writer.add_directory("docs"), ZC_ERROR_INVALID_PARAMETER);
  EXPECT_EQ(writer.add_directory(""), ZC_ERROR_INVALID_FILENAME);
  ASSERT_SUCCESS(writer.finalize());

  ZCByteArray archive;
  ASSERT_SUCCESS(writer.take_memory(archive));

  // The name of "docs" is stored as "docs/" without a terminator, the data follows the name.
  ASSERT_GT(archive.size, 36u);
  EXPECT_EQ(uint32_t(archive.data[26]) | (uint32_t(archive.data[27]) << 8), 5u);
  EXPECT_EQ(memcmp(archive.data + 30, "docs/PK", 7), 0);

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_memory(archive.view()));
  ASSERT_EQ(reader.entry_count(), 3u);

  ZCZipEntry entry;
  ASSERT_SUCCESS(reader.stat(0u, &entry));
  EXPECT_STREQ(entry.filename, "docs/");
  EXPECT_TRUE(entry.is_directory);
  EXPECT_EQ(entry.uncomp_size, 0u);
  EXPECT_EQ(entry.external_attr & 0x10u, 0x10u);

  EXPECT_TRUE(reader.is_directory(0u));
  EXPECT_TRUE(reader.is_directory(1u));
  EXPECT_FALSE(reader.is_directory(2u));
}

TEST(ZipCore_ZipWriter, Comments) {
  ZCZipWriter writer;
  ASSERT_SUCCESS(writer.open_memory());
  ASSERT_SUCCESS(writer.add_buffer("a.txt", "x", 1, "entry comment"));
  ASSERT_SUCCESS(writer.set_archive_comment("archive comment"));
  ASSERT_SUCCESS(writer.finalize());

  ZCByteArray archive;
  ASSERT_SUCCESS(writer.take_memory(archive));

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_memory(archive.view()));

  ZCDataView comment;
  ASSERT_SUCCESS(reader.archive_comment(&comment));
  ASSERT_EQ(comment.size, 15u);
  EXPECT_EQ(memcmp(comment.data, "archive comment", 15), 0);

  ZCZipEntry entry;
  ASSERT_SUCCESS(reader.stat(0u, &entry));
  EXPECT_STREQ(entry.comment, "entry comment");
  EXPECT_EQ(entry.comment_size, 13u);
}

TEST(ZipCore_ZipWriter, ReservedPrefix) {
  ZCZipWriter writer;
  ASSERT_SUCCESS(writer.open_memory(100));
  ASSERT_SUCCESS(writer.add_buffer("a.txt", "hello", 5));
  ASSERT_SUCCESS(writer.finalize());

  ZCByteArray archive;
  ASSERT_SUCCESS(writer.take_memory(archive));

  for (size_t i = 0; i < 100; i++)
    ASSERT_EQ(archive.data[i], 0u);

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_memory(archive.view()));

  ZCZipEntry entry;
  ASSERT_SUCCESS(reader.stat(0u, &entry));
  EXPECT_EQ(entry.local_header_ofs, 100u);
  expect_entry_content(reader, "a.txt", "hello", 5);
}

TEST(ZipCore_ZipWriter, ModificationTime) {
  ZCTestTempDir tmp;
  std::string src = tmp.file("source.txt");
  ASSERT_SUCCESS(zc_test_write_file(src, "source", 6));

  ZCFileInfo info;
  ASSERT_SUCCESS(ZCFileSystem::file_info(src.c_str(), &info));

  time_t before = time(nullptr);

  ZCZipWriter writer;
  ASSERT_SUCCESS(writer.open_memory());
  ASSERT_SUCCESS(writer.add_buffer("now.txt", "now", 3));
  ASSERT_SUCCESS(writer.add_file("source.txt", src.c_str()));
  ASSERT_SUCCESS(writer.finalize());

  ZCByteArray archive;
  ASSERT_SUCCESS(writer.take_memory(archive));

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_memory(archive.view()));

  // MS-DOS time has 2 second resolution.
  ZCZipEntry entry;
  ASSERT_SUCCESS(reader.stat(0u, &entry));
  EXPECT_LE(entry.time, time(nullptr));
  EXPECT_GE(entry.time, before - 2);

  ASSERT_SUCCESS(reader.stat(1u, &entry));
  EXPECT_LE(entry.time, time_t(info.modified_time_seconds()));
  EXPECT_GE(entry.time, time_t(info.modified_time_seconds()) - 2);

  expect_entry_content(reader, "source.txt", "source", 6);
}

TEST(ZipCore_ZipWriter, AddFileFailures) {
  ZCTestTempDir tmp;
  std::string missing = tmp.file("missing.txt");

  ZCZipWriter writer;
  ASSERT_SUCCESS(writer.open_memory());
  EXPECT_EQ(writer.add_file("missing.txt", missing.c_str()), ZC_ERROR_FILE_OPEN_FAILED);

  std::string dir = tmp.path().string();
  EXPECT_NE(writer.add_file("dir.txt", dir.c_str()), ZC_SUCCESS);

  // The writer is still usable.
  ASSERT_SUCCESS(writer.add_buffer("a.txt", "x", 1));
  ASSERT_SUCCESS(writer.finalize());
}

TEST(ZipCore_ZipWriter, FileArchiveAndAppend) {
  ZCTestTempDir tmp;
  std::string name = tmp.file("archive.zip");
  std::string text = make_text(10000);

  {
    ZCZipWriter writer;
    ASSERT_SUCCESS(writer.open_file(name.c_str()));
    ASSERT_SUCCESS(writer.add_buffer("a.txt", "first", 5));
    ASSERT_SUCCESS(writer.add_buffer("b.txt", text.data(), text.size()));
    ASSERT_SUCCESS(writer.set_archive_comment("kept"));
    ASSERT_SUCCESS(writer.finalize());
    ASSERT_SUCCESS(writer.close());
  }

  {
    ZCZipWriter writer;
    ASSERT_SUCCESS(writer.open_append(name.c_str()));
    EXPECT_EQ(writer.entry_count(), 2u);
    EXPECT_EQ(writer.add_buffer("a.txt", "again", 5), ZC_ERROR_INVALID_PARAMETER);
    ASSERT_SUCCESS(writer.add_buffer("c.txt", "third", 5));
    ASSERT_SUCCESS(writer.add_directory("d"));
    ASSERT_SUCCESS(writer.finalize());
    ASSERT_SUCCESS(writer.close());
  }

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_file(name.c_str()));
  ASSERT_EQ(reader.entry_count(), 4u);
  EXPECT_SUCCESS(reader.validate_all());

  ZCDataView comment;
  ASSERT_SUCCESS(reader.archive_comment(&comment));
  ASSERT_EQ(comment.size, 4u);
  EXPECT_EQ(memcmp(comment.data, "kept", 4), 0);

  expect_entry_content(reader, "a.txt", "first", 5);
  expect_entry_content(reader, "b.txt", text.data(), text.size());
  expect_entry_content(reader, "c.txt", "third", 5);
  EXPECT_TRUE(reader.is_directory(3u));
}

TEST(ZipCore_ZipWriter, AppendToNonArchive) {
  ZCTestTempDir tmp;
  std::string name = tmp.file("not-an-archive.zip");
  ASSERT_SUCCESS(zc_test_write_file(name, "this is not an archive", 22));

  ZCZipWriter writer;
  EXPECT_EQ(writer.open_append(name.c_str()), ZC_ERROR_NOT_AN_ARCHIVE);
  EXPECT_FALSE(writer.is_open());

  // The file is left untouched.
  ZCByteArray content;
  ASSERT_SUCCESS(zc_test_read_file(name, content));
  EXPECT_EQ(content.size, 22u);
}

} // {zc::ZipWriterInternal::Tests}

#endif // ZC_TEST
