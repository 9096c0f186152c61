// This file is part of ZipCore project
//
// See zipcore.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// This is an internal header file that is always included first by each ZipCore test file.

#ifndef ZIPCORE_CORE_API_BUILD_TEST_P_H_INCLUDED
#define ZIPCORE_CORE_API_BUILD_TEST_P_H_INCLUDED

#include <zipcore/core/api-build_p.h>

// zc::Build - Tests
// =================

//! \cond NEVER
// Make sure '#ifdef'ed unit tests are not disabled by IDE.
#if !defined(ZC_TEST) && defined(__INTELLISENSE__)
  #define ZC_TEST
#endif
//! \endcond

// Include a unit testing package if this is a `zipcore_test` build.
#if defined(ZC_TEST)

#include <zipcore/core/bytearray.h>
#include <zipcore/core/filesystem.h>

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <string>

//! \cond INTERNAL
//! Predicate formatter used by `EXPECT_SUCCESS()` and `ASSERT_SUCCESS()`, which prints the failing result code.
static inline ::testing::AssertionResult zc_test_is_success(const char* expression, ZCResult result) {
  if (result == ZC_SUCCESS)
    return ::testing::AssertionSuccess();

  return ::testing::AssertionFailure()
    << expression << " failed with '" << zc_result_to_string(result) << "' (" << result << ")";
}

#define EXPECT_SUCCESS(...) EXPECT_PRED_FORMAT1(zc_test_is_success, (__VA_ARGS__))
#define ASSERT_SUCCESS(...) ASSERT_PRED_FORMAT1(zc_test_is_success, (__VA_ARGS__))

//! Scratch directory unique to a single test, removed with its content on destruction.
class ZCTestTempDir {
public:
  std::filesystem::path _path;

  ZCTestTempDir() {
    static std::atomic<uint32_t> counter{0};
    const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();

    std::string name = "zipcore-";
    if (info) {
      name += info->test_suite_name();
      name += "-";
      name += info->name();
    }
    name += "-" + std::to_string(counter.fetch_add(1)) + "-" + std::to_string(uintptr_t(this));

    _path = std::filesystem::temp_directory_path() / name;
    std::error_code ec;
    std::filesystem::remove_all(_path, ec);
    std::filesystem::create_directories(_path, ec);
  }

  ~ZCTestTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(_path, ec);
  }

  ZCTestTempDir(const ZCTestTempDir&) = delete;
  ZCTestTempDir& operator=(const ZCTestTempDir&) = delete;

  const std::filesystem::path& path() const { return _path; }

  //! Returns an absolute path of `name` inside the directory.
  std::string file(const char* name) const { return (_path / name).string(); }
};

//! Creates or replaces `file_name` with `size` bytes of `data`.
static inline ZCResult zc_test_write_file(const std::string& file_name, const void* data, size_t size) {
  ZCFile file;
  ZC_PROPAGATE(file.open(file_name.c_str(), ZC_FILE_OPEN_WRITE | ZC_FILE_OPEN_CREATE | ZC_FILE_OPEN_TRUNCATE));

  size_t bytes_written;
  ZC_PROPAGATE(file.write_at(0, data, size, &bytes_written));
  return file.close();
}

static inline ZCResult zc_test_write_file(const std::string& file_name, const ZCByteArray& content) {
  return zc_test_write_file(file_name, content.data, content.size);
}

//! Reads the whole content of `file_name` into `dst`.
static inline ZCResult zc_test_read_file(const std::string& file_name, ZCByteArray& dst) {
  ZCFile file;
  ZC_PROPAGATE(file.open(file_name.c_str(), ZC_FILE_OPEN_READ));

  uint64_t size;
  ZC_PROPAGATE(file.get_size(&size));

  uint8_t* data;
  ZC_PROPAGATE(dst.modify_op(ZC_MODIFY_OP_ASSIGN_FIT, size_t(size), &data));

  size_t bytes_read;
  ZC_PROPAGATE(file.read_at(0, data, size_t(size), &bytes_read));
  return dst.truncate(bytes_read);
}
//! \endcond

#endif // ZC_TEST

#endif // ZIPCORE_CORE_API_BUILD_TEST_P_H_INCLUDED
