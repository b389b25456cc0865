// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KCRTIME_CREATIONTIMEEXTRACTOR_H
#define KCRTIME_CREATIONTIMEEXTRACTOR_H

#include <filesystem>
#include <string>
#include "CrtimeTypes.h"

namespace CreationTimeExtractor {
    // Extended attribute ntfs-3g uses to publish the file's NTFS creation time, big-endian.
    inline constexpr const char* kNtfsCrtimeAttribute = "system.ntfs_crtime_be";

    /**
     * Reads the creation time ntfs-3g exposes as an extended attribute.
     *
     * @throws Crtime::AttributeReadError if the attribute is missing, unreadable
     *         or not exactly 8 bytes long.
     */
    [[nodiscard]] Crtime::CreationInstant extractNtfs(const std::filesystem::path& path);

    /**
     * Same as extractNtfs(path), reading the big-endian FILETIME from the named attribute.
     */
    [[nodiscard]] Crtime::CreationInstant extractNtfs(const std::filesystem::path& path, const std::string& attributeName);

    /**
     * Reads the creation time of a file on a vfat mount.
     *
     * The kernel FAT driver reports the directory entry's creation time in
     * st_ctime, so the value is returned exactly as stat() reports it.
     *
     * @throws Crtime::MetadataReadError if stat() fails.
     */
    [[nodiscard]] Crtime::CreationInstant extractFat32(const std::filesystem::path& path);

    /**
     * Runs the strategy for the given filesystem type.
     *
     * The type is taken as given; no reclassification happens here. For
     * FilesystemType::Other the path is not touched and Unsupported is returned.
     */
    [[nodiscard]] Crtime::ExtractionResult extract(const std::filesystem::path& path, Crtime::FilesystemType type);
}

#endif //KCRTIME_CREATIONTIMEEXTRACTOR_H
