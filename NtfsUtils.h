// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KCRTIME_NTFSUTILS_H
#define KCRTIME_NTFSUTILS_H

#include <cstddef>
#include <cstdint>

namespace NtfsUtils {
    // Seconds between 1601-01-01 (NTFS epoch) and 1970-01-01 (Unix epoch).
    inline constexpr int64_t kSecsBetween1601And1970 = 11'644'473'600LL;

    // NTFS FILETIME resolution: 100ns ticks per second.
    inline constexpr uint64_t kTicksPerSecond = 10'000'000ULL;

    // Size of the ntfs-3g "system.ntfs_crtime_be" attribute value.
    inline constexpr std::size_t kTimestampSize = 8;

    /**
     * Decodes an 8-byte big-endian unsigned integer.
     *
     * ntfs-3g exposes timestamps through the *_be attribute variants in
     * network byte order, independent of the host's endianness.
     */
    [[nodiscard]] uint64_t readBigEndianU64(const unsigned char (&bytes)[kTimestampSize]);

    /**
     * Converts an NTFS FILETIME (100ns ticks since 1601-01-01 UTC) to Unix seconds.
     *
     * The tick count is divided down to whole seconds before the epoch shift,
     * so sub-second precision is discarded. Values before 1970 yield negative seconds.
     */
    [[nodiscard]] int64_t ntfsTicksToUnixSeconds(uint64_t ntfsTime);
}

#endif //KCRTIME_NTFSUTILS_H
