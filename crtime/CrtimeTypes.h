// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KCRTIME_CRTIMETYPES_H
#define KCRTIME_CRTIMETYPES_H

#include <cstdint>
#include <string_view>
#include <variant>

namespace Crtime {

    /**
     * Classification of the mount backing a path.
     *
     * The set is closed on purpose: every switch over it must handle each
     * enumerator, so adding a filesystem is caught by -Wswitch at compile time.
     */
    enum class FilesystemType {
        NtfsCompatible, // NTFS volume behind a FUSE passthrough driver (ntfs-3g / fuseblk)
        Fat32,          // kernel vfat driver
        Other
    };

    /**
     * A point in time, seconds since 1970-01-01T00:00:00 UTC.
     * nanoseconds is always 0 for NTFS (the conversion truncates to whole seconds).
     */
    struct CreationInstant {
        int64_t seconds = 0;
        uint32_t nanoseconds = 0;

        bool operator==(const CreationInstant&) const = default;
    };

    /**
     * Marker returned for filesystems this library has no strategy for.
     * This is a defined outcome, not an error.
     */
    struct Unsupported {
        FilesystemType filesystem = FilesystemType::Other;

        bool operator==(const Unsupported&) const = default;
    };

    /**
     * Either a creation instant or the unsupported marker.
     * Failures are reported as exceptions derived from Crtime::Error.
     */
    using ExtractionResult = std::variant<CreationInstant, Unsupported>;

    [[nodiscard]] inline bool isUnsupported(const ExtractionResult& result) {
        return std::holds_alternative<Unsupported>(result);
    }

    /**
     * Short identifier for a filesystem type ("ntfs-compatible", "fat32", "other").
     */
    [[nodiscard]] constexpr std::string_view describe(FilesystemType type) {
        switch (type) {
            case FilesystemType::NtfsCompatible: return "ntfs-compatible";
            case FilesystemType::Fat32: return "fat32";
            case FilesystemType::Other: return "other";
        }
        return "other";
    }
}

#endif //KCRTIME_CRTIMETYPES_H
