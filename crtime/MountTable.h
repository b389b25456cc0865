// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KCRTIME_MOUNTTABLE_H
#define KCRTIME_MOUNTTABLE_H

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <sys/types.h>

namespace MountTable {
    // Environment variable that redirects the mount table to another file.
    inline constexpr const char* kMountInfoEnv = "KCRTIME_MOUNTINFO";
    inline constexpr const char* kDefaultMountInfo = "/proc/self/mountinfo";

    struct MountInfoEntry {
        std::string mountPoint;
        std::string fsType;      // driver name, e.g. "fuseblk", "vfat", "ext4"
        std::string mountSource; // e.g. "/dev/sdb1"
        dev_t device = 0;        // from the major:minor field
    };

    /**
     * Parses a mountinfo "major:minor" field.
     * Returns std::nullopt if the field is not two decimal numbers separated by ':'.
     */
    [[nodiscard]] std::optional<dev_t> parseDeviceNumber(std::string_view field);

    /**
     * Returns the mount table file to read: $KCRTIME_MOUNTINFO when set and
     * non-empty, /proc/self/mountinfo otherwise.
     */
    [[nodiscard]] std::filesystem::path mountInfoPath();

    /**
     * Decodes the octal escapes the kernel applies to mountinfo fields
     * (space as \040, tab as \011, newline as \012, backslash as \134).
     */
    [[nodiscard]] std::string unescapeField(std::string_view field);

    /**
     * Reads and parses a mountinfo file.
     *
     * mountinfo format:
     *  id parent major:minor root mount_point opts [optional...] - fstype mount_source superopts
     *
     * Lines that do not follow this layout are skipped.
     *
     * @param file Path to the mountinfo file.
     * @return The parsed entries in file order, or std::nullopt if the file cannot be opened.
     */
    [[nodiscard]] std::optional<std::vector<MountInfoEntry>> readMountInfo(const std::filesystem::path& file);

    /**
     * Finds the mount that contains the given path.
     *
     * The covering mount is the one whose mount point is the longest
     * path-component prefix of resolvedPath. When two entries share a mount
     * point the later one wins, since it is stacked on top of the earlier.
     *
     * @param entries Mount table in file order.
     * @param resolvedPath Absolute, symlink-free path.
     */
    [[nodiscard]] std::optional<MountInfoEntry> findCoveringMount(const std::vector<MountInfoEntry>& entries,
                                                                  const std::filesystem::path& resolvedPath);

    /**
     * Like findCoveringMount(entries, resolvedPath), but only entries whose device
     * is the one stat() reports for the path are candidates. A mount stacked on a
     * parent directory hides the mounts below it; this overload skips the hidden ones.
     *
     * If no entry carries the device (btrfs subvolumes report their own st_dev),
     * the path-only selection is used.
     */
    [[nodiscard]] std::optional<MountInfoEntry> findCoveringMount(const std::vector<MountInfoEntry>& entries,
                                                                  const std::filesystem::path& resolvedPath,
                                                                  dev_t device);

    /**
     * Probes the superblock of a block device with libblkid and returns its TYPE
     * (e.g. "ntfs", "vfat"). Returns std::nullopt for non-device sources or when
     * the probe fails (typically EACCES for unprivileged users).
     */
    [[nodiscard]] std::optional<std::string> probeDeviceType(const std::string& devNode);
}

#endif //KCRTIME_MOUNTTABLE_H
