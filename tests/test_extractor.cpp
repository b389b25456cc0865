// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "minitest.hpp"
#include "test_fs.hpp"
#include "crtime/CreationTimeExtractor.h"
#include "crtime/CrtimeErrors.h"
#include <cerrno>
#include <string>
#include <sys/stat.h>
#include <sys/xattr.h>

namespace {
  const std::string kTestAttribute = "user.kcrtime_test.crtime_be";

  // Stores value under kTestAttribute. false when the scratch filesystem has no
  // user xattrs, in which case the caller skips its checks.
  bool set_attribute(const std::filesystem::path& file, const std::string& value) {
    if (::setxattr(file.c_str(), kTestAttribute.c_str(), value.data(), value.size(), 0) == 0) return true;
    std::cout << "  (user xattrs unavailable on " << file.parent_path().string() << ", skipped)\n";
    return false;
  }
}

using Crtime::FilesystemType;

TEST(other_is_unsupported_without_touching_path) {
  auto result = CreationTimeExtractor::extract("/definitely/not/here", FilesystemType::Other);
  ASSERT_TRUE(Crtime::isUnsupported(result));
  ASSERT_TRUE(std::get<Crtime::Unsupported>(result).filesystem == FilesystemType::Other);
}

TEST(fat32_returns_status_change_time_unchanged) {
  auto root = testfs::make_root("ex_fat");
  auto file = testfs::touch(root / "f.txt");

  struct stat st {};
  ASSERT_EQ(::stat(file.c_str(), &st), 0);

  auto result = CreationTimeExtractor::extract(file, FilesystemType::Fat32);
  ASSERT_TRUE(!Crtime::isUnsupported(result));
  const auto& instant = std::get<Crtime::CreationInstant>(result);
  ASSERT_EQ(instant.seconds, static_cast<int64_t>(st.st_ctim.tv_sec));
  ASSERT_EQ(instant.nanoseconds, static_cast<uint32_t>(st.st_ctim.tv_nsec));
}

TEST(fat32_works_for_directories) {
  auto root = testfs::make_root("ex_fatdir");
  auto instant = CreationTimeExtractor::extractFat32(root);
  ASSERT_TRUE(instant.seconds > 0);
}

TEST(fat32_missing_file_throws_metadata_error) {
  auto root = testfs::make_root("ex_fatmissing");
  try {
    (void)CreationTimeExtractor::extract(root / "gone", FilesystemType::Fat32);
    ASSERT_TRUE(false);
  } catch (const Crtime::MetadataReadError& e) {
    ASSERT_EQ(e.path(), root / "gone");
    ASSERT_EQ(e.code().value(), ENOENT);
  }
}

TEST(ntfs_without_attribute_throws_attribute_error) {
  // The scratch directory lives on a filesystem that has no ntfs-3g attributes.
  auto root = testfs::make_root("ex_ntfs");
  auto file = testfs::touch(root / "f.txt");
  ASSERT_THROWS(CreationTimeExtractor::extract(file, FilesystemType::NtfsCompatible), Crtime::AttributeReadError);
  ASSERT_THROWS(CreationTimeExtractor::extractNtfs(root / "gone"), Crtime::AttributeReadError);
}

TEST(attribute_error_is_a_crtime_error) {
  auto root = testfs::make_root("ex_ntfs_base");
  auto file = testfs::touch(root / "f.txt");
  ASSERT_THROWS(CreationTimeExtractor::extractNtfs(file), Crtime::Error);
  ASSERT_THROWS(CreationTimeExtractor::extractNtfs(file), std::runtime_error);
}

TEST(extraction_is_idempotent) {
  auto root = testfs::make_root("ex_idem");
  auto file = testfs::touch(root / "f.txt");
  auto a = CreationTimeExtractor::extract(file, FilesystemType::Fat32);
  auto b = CreationTimeExtractor::extract(file, FilesystemType::Fat32);
  ASSERT_TRUE(a == b);
}

TEST(ntfs_attribute_decodes_big_endian_filetime) {
  auto root = testfs::make_root("ex_ntfs_ok");
  auto file = testfs::touch(root / "f.txt");
  // 116444736000000000 ticks = 1970-01-01T00:00:00Z
  if (!set_attribute(file, std::string("\x01\x9D\xB1\xDE\xD5\x3E\x80\x00", 8))) return;

  const auto instant = CreationTimeExtractor::extractNtfs(file, kTestAttribute);
  ASSERT_TRUE(instant == (Crtime::CreationInstant{0, 0}));
}

TEST(ntfs_attribute_before_1970_is_negative) {
  auto root = testfs::make_root("ex_ntfs_old");
  auto file = testfs::touch(root / "f.txt");
  // 1601-01-01T00:00:01Z = 10000000 ticks
  if (!set_attribute(file, std::string("\x00\x00\x00\x00\x00\x98\x96\x80", 8))) return;

  const auto instant = CreationTimeExtractor::extractNtfs(file, kTestAttribute);
  ASSERT_EQ(instant.seconds, int64_t{1 - 11'644'473'600LL});
  ASSERT_EQ(instant.nanoseconds, 0u);
}

TEST(ntfs_attribute_too_short_is_rejected) {
  auto root = testfs::make_root("ex_ntfs_short");
  auto file = testfs::touch(root / "f.txt");
  if (!set_attribute(file, std::string("\x01\x02\x03\x04", 4))) return;

  try {
    (void)CreationTimeExtractor::extractNtfs(file, kTestAttribute);
    ASSERT_TRUE(false);
  } catch (const Crtime::AttributeReadError& e) {
    ASSERT_TRUE(e.code() == std::make_error_code(std::errc::bad_message));
    ASSERT_TRUE(std::string(e.what()).find("4 bytes") != std::string::npos);
  }
}

TEST(ntfs_attribute_too_long_is_malformed) {
  auto root = testfs::make_root("ex_ntfs_long");
  auto file = testfs::touch(root / "f.txt");
  if (!set_attribute(file, std::string(16, '\x01'))) return;

  try {
    (void)CreationTimeExtractor::extractNtfs(file, kTestAttribute);
    ASSERT_TRUE(false);
  } catch (const Crtime::AttributeReadError& e) {
    ASSERT_EQ(e.code().value(), ERANGE);
    ASSERT_TRUE(std::string(e.what()).find("malformed") != std::string::npos);
  }
}

TEST(ntfs_missing_named_attribute_reports_not_present) {
  auto root = testfs::make_root("ex_ntfs_absent");
  auto file = testfs::touch(root / "f.txt");
  if (!set_attribute(file, std::string(8, '\0'))) return;
  ASSERT_EQ(::removexattr(file.c_str(), kTestAttribute.c_str()), 0);

  try {
    (void)CreationTimeExtractor::extractNtfs(file, kTestAttribute);
    ASSERT_TRUE(false);
  } catch (const Crtime::AttributeReadError& e) {
    ASSERT_EQ(e.code().value(), ENODATA);
  }
}
