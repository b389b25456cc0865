// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KCRTIME_FILESYSTEMCLASSIFIER_H
#define KCRTIME_FILESYSTEMCLASSIFIER_H

#include <filesystem>
#include <string_view>
#include "CrtimeTypes.h"
#include "MountTable.h"

namespace FilesystemClassifier {
    /**
     * Maps a mount table driver name to a filesystem type.
     *
     * "fuseblk", "fuse.ntfs-3g", "ntfs-3g" and "fuse.ntfs" map to NtfsCompatible,
     * "vfat" maps to Fat32, everything else (including the in-kernel "ntfs3"
     * driver, which does not provide the ntfs-3g attributes) maps to Other.
     */
    [[nodiscard]] Crtime::FilesystemType filesystemTypeFromDriver(std::string_view driverName);

    /**
     * Resolves the path and returns the mount table entry that backs it.
     * Among the entries on the path's device, the longest mount point prefix wins.
     *
     * @throws Crtime::ClassificationError if the path cannot be resolved, the
     *         mount table cannot be read or no entry covers the path.
     */
    [[nodiscard]] MountTable::MountInfoEntry coveringMount(const std::filesystem::path& path,
                                                           const std::filesystem::path& mountInfoFile);

    /**
     * Classifies the filesystem backing path, reading the mount table fresh on every call.
     *
     * @param path Existing file or directory.
     * @param mountInfoFile Mount table to consult; defaults to MountTable::mountInfoPath().
     * @throws Crtime::ClassificationError when the type cannot be determined.
     *         Never falls back to Other on failure.
     */
    [[nodiscard]] Crtime::FilesystemType classify(const std::filesystem::path& path);
    [[nodiscard]] Crtime::FilesystemType classify(const std::filesystem::path& path,
                                                  const std::filesystem::path& mountInfoFile);
}

#endif //KCRTIME_FILESYSTEMCLASSIFIER_H
