// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <zipcore/core/api-build_test_p.h>
#if defined(ZC_TEST)

#include <zipcore/core/filesystem.h>
#include <zipcore/zip/ziparchive.h>
#include <zipcore/zip/zipreader.h>
#include <zipcore/zip/zipwriter.h>

#include <string>
#include <vector>

// zc::ZipArchive - Tests
// ======================

namespace zc::ZipArchiveInternal::Tests {

static std::string make_text(size_t size, char salt) {
  std::string s;
  while (s.size() < size) {
    s += "line ";
    s += std::to_string(s.size() % 97);
    s += salt;
    s += '\n';
  }
  s.resize(size);
  return s;
}

static void write_text_file(const std::string& name, const std::string& content) {
  ASSERT_SUCCESS(zc_test_write_file(name, content.data(), content.size()));
}

static void expect_file_content(const std::string& name, const void* data, size_t size) {
  ZCByteArray content;
  ASSERT_SUCCESS(zc_test_read_file(name, content));
  ASSERT_EQ(content.size, size) << name;
  if (size)
    EXPECT_EQ(memcmp(content.data, data, size), 0) << name;
}

struct StreamedEntry {
  std::vector<uint8_t> content;
  uint32_t calls;
};

struct StreamState {
  std::vector<StreamedEntry> entries;
  size_t fail_at_call;
  size_t total_calls;
};

// A new entry starts whenever the offset goes back to zero.
static size_t ZC_CDECL stream_sink(void* user_data, uint64_t offset, const void* data, size_t size) {
  StreamState* state = static_cast<StreamState*>(user_data);
  if (state->total_calls++ == state->fail_at_call)
    return 0;

  if (offset == 0u)
    state->entries.push_back(StreamedEntry{});

  StreamedEntry& entry = state->entries.back();
  if (offset != entry.content.size())
    return 0;

  entry.content.insert(entry.content.end(), static_cast<const uint8_t*>(data), static_cast<const uint8_t*>(data) + size);
  entry.calls++;
  return size;
}

TEST(ZipCore_ZipArchive, ZipAndUnzip) {
  ZCTestTempDir tmp;
  std::string src_dir = tmp.file("src");
  std::string sub_dir = tmp.file("src/sub");
  ASSERT_SUCCESS(ZCFileSystem::create_directories(sub_dir.c_str()));

  std::string a_text = make_text(1000, 'a');
  std::string b_text = make_text(100000, 'b');
  std::string c_text = make_text(10, 'c');

  std::string a_name = tmp.file("src/a.txt");
  std::string b_name = tmp.file("src/b.log");
  std::string c_name = tmp.file("src/sub/c.txt");
  write_text_file(a_name, a_text);
  write_text_file(b_name, b_text);
  write_text_file(c_name, c_text);

  std::string archive_name = tmp.file("out.zip");
  const char* files[] = { a_name.c_str(), b_name.c_str(), c_name.c_str() };
  ASSERT_SUCCESS(ZCZipArchive::zip(archive_name.c_str(), files, 3, ZC_COMPRESSION_LEVEL_DEFAULT, "zipped"));

  // Entries are stored under their last path component.
  size_t count = 0;
  ASSERT_SUCCESS(ZCZipArchive::get_stats(archive_name.c_str(), nullptr, 0, &count));
  ASSERT_EQ(count, 3u);

  std::vector<ZCZipEntry> entries(count);
  ASSERT_SUCCESS(ZCZipArchive::get_stats(archive_name.c_str(), entries.data(), entries.size(), &count));
  EXPECT_STREQ(entries[0].filename, "a.txt");
  EXPECT_STREQ(entries[1].filename, "b.log");
  EXPECT_STREQ(entries[2].filename, "c.txt");
  EXPECT_STREQ(entries[1].comment, "zipped");
  EXPECT_EQ(entries[1].uncomp_size, uint64_t(b_text.size()));
  EXPECT_EQ(entries[1].method, ZC_ZIP_METHOD_DEFLATE);

  std::string dest_dir = tmp.file("dest/nested");
  ASSERT_SUCCESS(ZCZipArchive::unzip(archive_name.c_str(), dest_dir.c_str()));

  expect_file_content(tmp.file("dest/nested/a.txt"), a_text.data(), a_text.size());
  expect_file_content(tmp.file("dest/nested/b.log"), b_text.data(), b_text.size());
  expect_file_content(tmp.file("dest/nested/c.txt"), c_text.data(), c_text.size());
}

TEST(ZipCore_ZipArchive, ZipFailures) {
  ZCTestTempDir tmp;
  ASSERT_SUCCESS(ZCFileSystem::create_directories(tmp.file("x").c_str()));
  ASSERT_SUCCESS(ZCFileSystem::create_directories(tmp.file("y").c_str()));

  std::string first = tmp.file("x/same.txt");
  std::string second = tmp.file("y/same.txt");
  write_text_file(first, "first");
  write_text_file(second, "second");

  std::string archive_name = tmp.file("dup.zip");
  const char* files[] = { first.c_str(), second.c_str() };
  EXPECT_EQ(ZCZipArchive::zip(archive_name.c_str(), files, 2), ZC_ERROR_INVALID_PARAMETER);

  std::string missing = tmp.file("missing.txt");
  const char* missing_files[] = { missing.c_str() };
  EXPECT_EQ(ZCZipArchive::zip(archive_name.c_str(), missing_files, 1), ZC_ERROR_FILE_OPEN_FAILED);

  EXPECT_EQ(ZCZipArchive::zip(nullptr, files, 2), ZC_ERROR_INVALID_PARAMETER);
  EXPECT_EQ(ZCZipArchive::zip(archive_name.c_str(), files, 2, 42), ZC_ERROR_INVALID_PARAMETER);
}

TEST(ZipCore_ZipArchive, UnzipDirectories) {
  ZCTestTempDir tmp;
  std::string archive_name = tmp.file("dirs.zip");

  ZCZipWriter writer;
  ASSERT_SUCCESS(writer.open_file(archive_name.c_str()));
  ASSERT_SUCCESS(writer.add_directory("empty"));
  ASSERT_SUCCESS(writer.add_buffer("deep/er/file.txt", "deep", 4));
  ASSERT_SUCCESS(writer.add_buffer("top.txt", "", 0));
  ASSERT_SUCCESS(writer.finalize());
  ASSERT_SUCCESS(writer.close());

  std::string dest_dir = tmp.file("dest");
  ASSERT_SUCCESS(ZCZipArchive::unzip(archive_name.c_str(), dest_dir.c_str()));

  ZCFileInfo info;
  ASSERT_SUCCESS(ZCFileSystem::file_info(tmp.file("dest/empty").c_str(), &info));
  EXPECT_TRUE(info.is_directory());

  expect_file_content(tmp.file("dest/deep/er/file.txt"), "deep", 4);
  expect_file_content(tmp.file("dest/top.txt"), "", 0);
}

TEST(ZipCore_ZipArchive, UnzipRejectsTraversal) {
  ZCTestTempDir tmp;

  ZCZipWriter writer;
  ASSERT_SUCCESS(writer.open_memory());
  ASSERT_SUCCESS(writer.add_buffer("aa/evil.txt", "evil", 4));
  ASSERT_SUCCESS(writer.finalize());

  ZCByteArray archive;
  ASSERT_SUCCESS(writer.take_memory(archive));

  // Rename the entry in both local and central headers.
  size_t renamed = 0;
  for (size_t i = 0; i + 11 <= archive.size; i++) {
    if (memcmp(archive.data + i, "aa/evil.txt", 11) == 0) {
      memcpy(archive.data + i, "../evil.txt", 11);
      renamed++;
    }
  }
  ASSERT_EQ(renamed, 2u);

  std::string archive_name = tmp.file("evil.zip");
  ASSERT_SUCCESS(zc_test_write_file(archive_name, archive));

  std::string dest_dir = tmp.file("dest");
  EXPECT_EQ(ZCZipArchive::unzip(archive_name.c_str(), dest_dir.c_str()), ZC_ERROR_INVALID_FILENAME);

  ZCFileInfo info;
  EXPECT_EQ(ZCFileSystem::file_info(tmp.file("evil.txt").c_str(), &info), ZC_ERROR_FILE_NOT_FOUND);
}

TEST(ZipCore_ZipArchive, UnzipFailures) {
  ZCTestTempDir tmp;
  std::string not_archive = tmp.file("not.zip");
  write_text_file(not_archive, "not an archive");

  std::string dest_dir = tmp.file("dest");
  EXPECT_EQ(ZCZipArchive::unzip(not_archive.c_str(), dest_dir.c_str()), ZC_ERROR_NOT_AN_ARCHIVE);

  // Nothing is created when the archive cannot be read.
  ZCFileInfo info;
  EXPECT_EQ(ZCFileSystem::file_info(dest_dir.c_str(), &info), ZC_ERROR_FILE_NOT_FOUND);

  EXPECT_EQ(ZCZipArchive::unzip(tmp.file("missing.zip").c_str(), dest_dir.c_str()), ZC_ERROR_FILE_OPEN_FAILED);
  EXPECT_EQ(ZCZipArchive::unzip(not_archive.c_str(), ""), ZC_ERROR_INVALID_PARAMETER);
}

TEST(ZipCore_ZipArchive, AddInPlace) {
  ZCTestTempDir tmp;
  std::string archive_name = tmp.file("grow.zip");
  std::string big = make_text(50000, 'z');

  // The archive is created by the first call.
  ASSERT_SUCCESS(ZCZipArchive::add_in_place(archive_name.c_str(), "first.txt", "one", 3));
  ASSERT_SUCCESS(ZCZipArchive::add_in_place(archive_name.c_str(), "second.txt", big.data(), big.size()));
  ASSERT_SUCCESS(ZCZipArchive::add_in_place(archive_name.c_str(), "third.txt", "three", 5, ZC_COMPRESSION_LEVEL_STORE, "note"));

  // Duplicate name is rejected and the archive stays valid.
  EXPECT_EQ(ZCZipArchive::add_in_place(archive_name.c_str(), "first.txt", "again", 5), ZC_ERROR_INVALID_PARAMETER);
  EXPECT_EQ(ZCZipArchive::add_in_place(archive_name.c_str(), "../escape.txt", "x", 1), ZC_ERROR_INVALID_FILENAME);

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_file(archive_name.c_str()));
  ASSERT_EQ(reader.entry_count(), 3u);
  EXPECT_SUCCESS(reader.validate_all());

  ZCByteArray content;
  ASSERT_SUCCESS(reader.extract_to_memory("first.txt", content));
  ASSERT_EQ(content.size, 3u);
  EXPECT_EQ(memcmp(content.data, "one", 3), 0);

  ASSERT_SUCCESS(reader.extract_to_memory("second.txt", content));
  ASSERT_EQ(content.size, big.size());
  EXPECT_EQ(memcmp(content.data, big.data(), big.size()), 0);

  ZCZipEntry entry;
  ASSERT_SUCCESS(reader.stat(2u, &entry));
  EXPECT_STREQ(entry.filename, "third.txt");
  EXPECT_STREQ(entry.comment, "note");
  EXPECT_EQ(entry.method, ZC_ZIP_METHOD_STORE);
}

TEST(ZipCore_ZipArchive, AddInPlaceRejectedEntryCreatesNothing) {
  ZCTestTempDir tmp;
  std::string archive_name = tmp.file("never.zip");
  ZCFileInfo info;

  EXPECT_EQ(ZCZipArchive::add_in_place(archive_name.c_str(), "../escape.txt", "x", 1), ZC_ERROR_INVALID_FILENAME);
  EXPECT_EQ(ZCFileSystem::file_info(archive_name.c_str(), &info), ZC_ERROR_FILE_NOT_FOUND);

  EXPECT_EQ(ZCZipArchive::add_in_place(archive_name.c_str(), "a.txt", "x", 1, 42), ZC_ERROR_INVALID_PARAMETER);
  EXPECT_EQ(ZCFileSystem::file_info(archive_name.c_str(), &info), ZC_ERROR_FILE_NOT_FOUND);

  // A valid entry still creates the archive.
  ASSERT_SUCCESS(ZCZipArchive::add_in_place(archive_name.c_str(), "a.txt", "x", 1));

  ZCZipReader reader;
  ASSERT_SUCCESS(reader.open_file(archive_name.c_str()));
  EXPECT_EQ(reader.entry_count(), 1u);
}

TEST(ZipCore_ZipArchive, AddInPlaceToNonArchive) {
  ZCTestTempDir tmp;
  std::string name = tmp.file("plain.txt");
  write_text_file(name, "plain text");

  EXPECT_EQ(ZCZipArchive::add_in_place(name.c_str(), "a.txt", "x", 1), ZC_ERROR_NOT_AN_ARCHIVE);
  expect_file_content(name, "plain text", 10);
}

TEST(ZipCore_ZipArchive, ExtractStreaming) {
  ZCTestTempDir tmp;
  std::string archive_name = tmp.file("stream.zip");
  std::string big = make_text(300000, 's');

  ZCZipWriter writer;
  ASSERT_SUCCESS(writer.open_file(archive_name.c_str()));
  ASSERT_SUCCESS(writer.add_buffer("small.txt", "small", 5));
  ASSERT_SUCCESS(writer.add_directory("dir"));
  ASSERT_SUCCESS(writer.add_buffer("big.txt", big.data(), big.size()));
  ASSERT_SUCCESS(writer.add_buffer("empty.txt", "", 0));
  ASSERT_SUCCESS(writer.add_buffer("stored.txt", big.data(), 70000, nullptr, ZC_COMPRESSION_LEVEL_STORE));
  ASSERT_SUCCESS(writer.finalize());
  ASSERT_SUCCESS(writer.close());

  StreamState state {};
  state.fail_at_call = SIZE_MAX;
  ASSERT_SUCCESS(ZCZipArchive::extract_streaming(archive_name.c_str(), stream_sink, &state));

  // Entries without data never reach the sink.
  ASSERT_EQ(state.entries.size(), 3u);

  ASSERT_EQ(state.entries[0].content.size(), 5u);
  EXPECT_EQ(memcmp(state.entries[0].content.data(), "small", 5), 0);

  ASSERT_EQ(state.entries[1].content.size(), big.size());
  EXPECT_EQ(memcmp(state.entries[1].content.data(), big.data(), big.size()), 0);

  ASSERT_EQ(state.entries[2].content.size(), 70000u);
  EXPECT_EQ(memcmp(state.entries[2].content.data(), big.data(), 70000), 0);
  EXPECT_GT(state.entries[2].calls, 1u);

  StreamState failing {};
  failing.fail_at_call = 1;
  EXPECT_EQ(ZCZipArchive::extract_streaming(archive_name.c_str(), stream_sink, &failing), ZC_ERROR_WRITE_CALLBACK_FAILED);
  EXPECT_EQ(ZCZipArchive::extract_streaming(archive_name.c_str(), nullptr, nullptr), ZC_ERROR_INVALID_PARAMETER);
}

TEST(ZipCore_ZipArchive, GetStats) {
  ZCTestTempDir tmp;
  std::string archive_name = tmp.file("stats.zip");

  ASSERT_SUCCESS(ZCZipArchive::add_in_place(archive_name.c_str(), "a.txt", "aaaa", 4));
  ASSERT_SUCCESS(ZCZipArchive::add_in_place(archive_name.c_str(), "b.txt", "bbbbbbbb", 8));
  ASSERT_SUCCESS(ZCZipArchive::add_in_place(archive_name.c_str(), "c.txt", "", 0));

  size_t count = 0;
  ASSERT_SUCCESS(ZCZipArchive::get_stats(archive_name.c_str(), nullptr, 0, &count));
  EXPECT_EQ(count, 3u);

  ZCZipEntry small[2];
  EXPECT_EQ(ZCZipArchive::get_stats(archive_name.c_str(), small, 2, &count), ZC_ERROR_BUF_TOO_SMALL);
  EXPECT_EQ(count, 3u);

  ZCZipEntry entries[4];
  ASSERT_SUCCESS(ZCZipArchive::get_stats(archive_name.c_str(), entries, 4, &count));
  ASSERT_EQ(count, 3u);

  EXPECT_EQ(entries[0].file_index, 0u);
  EXPECT_EQ(entries[0].uncomp_size, 4u);
  EXPECT_EQ(entries[1].file_index, 1u);
  EXPECT_EQ(entries[1].uncomp_size, 8u);
  EXPECT_STREQ(entries[2].filename, "c.txt");
  EXPECT_EQ(entries[2].uncomp_size, 0u);
  EXPECT_LT(entries[0].local_header_ofs, entries[1].local_header_ofs);

  EXPECT_EQ(ZCZipArchive::get_stats(tmp.file("missing.zip").c_str(), nullptr, 0, &count), ZC_ERROR_FILE_OPEN_FAILED);
  EXPECT_EQ(count, 0u);
}

} // {zc::ZipArchiveInternal::Tests}

#endif // ZC_TEST
