// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "minitest.hpp"
#include "test_fs.hpp"
#include "crtime/CreationTime.h"
#include "crtime/MountTable.h"
#include <cstdlib>
#include <sys/stat.h>

namespace {
  // Points the library at a fake mount table for the lifetime of the object.
  struct MountInfoOverride {
    explicit MountInfoOverride(const std::filesystem::path& file) {
      ::setenv(MountTable::kMountInfoEnv, file.c_str(), 1);
    }
    ~MountInfoOverride() { ::unsetenv(MountTable::kMountInfoEnv); }
  };
}

TEST(creation_time_on_fat32_mount) {
  auto root = testfs::make_root("ct_fat");
  auto file = testfs::touch(root / "photo.jpg");
  MountInfoOverride guard(testfs::write_mountinfo(root, root, "vfat"));

  struct stat st {};
  ASSERT_EQ(::stat(file.c_str(), &st), 0);

  auto result = CreationTime::creationTime(file);
  ASSERT_TRUE(!Crtime::isUnsupported(result));
  ASSERT_EQ(std::get<Crtime::CreationInstant>(result).seconds, static_cast<int64_t>(st.st_ctim.tv_sec));
}

TEST(creation_time_on_other_mount_is_unsupported) {
  auto root = testfs::make_root("ct_other");
  auto file = testfs::touch(root / "a.txt");
  MountInfoOverride guard(testfs::write_mountinfo(root, root, "ext4"));

  auto result = CreationTime::creationTime(file);
  ASSERT_TRUE(Crtime::isUnsupported(result));
  ASSERT_TRUE(std::get<Crtime::Unsupported>(result).filesystem == Crtime::FilesystemType::Other);
}

TEST(creation_time_on_ntfs_mount_without_attribute_fails) {
  auto root = testfs::make_root("ct_ntfs");
  auto file = testfs::touch(root / "a.txt");
  MountInfoOverride guard(testfs::write_mountinfo(root, root, "fuseblk"));
  ASSERT_THROWS(CreationTime::creationTime(file), Crtime::AttributeReadError);
}

TEST(creation_time_missing_path_fails_classification) {
  auto root = testfs::make_root("ct_missing");
  MountInfoOverride guard(testfs::write_mountinfo(root, root, "vfat"));
  ASSERT_THROWS(CreationTime::creationTime(root / "missing"), Crtime::ClassificationError);
}

TEST(creation_time_rereads_mount_table_each_call) {
  auto root = testfs::make_root("ct_fresh");
  auto file = testfs::touch(root / "a.txt");
  MountInfoOverride guard(testfs::write_mountinfo(root, root, "ext4"));
  ASSERT_TRUE(Crtime::isUnsupported(CreationTime::creationTime(file)));

  // Same file, remounted as vfat
  (void)testfs::write_mountinfo(root, root, "vfat");
  ASSERT_TRUE(!Crtime::isUnsupported(CreationTime::creationTime(file)));
}
