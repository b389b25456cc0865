// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "NtfsUtils.h"

namespace NtfsUtils {
    uint64_t readBigEndianU64(const unsigned char (&bytes)[kTimestampSize]) {
        uint64_t value = 0;
        for (unsigned char b : bytes) {
            value = (value << 8) | static_cast<uint64_t>(b);
        }
        return value;
    }

    int64_t ntfsTicksToUnixSeconds(const uint64_t ntfsTime) {
        // Max FILETIME is about 1.84e12 seconds, which fits int64_t comfortably.
        const auto secs1601 = static_cast<int64_t>(ntfsTime / kTicksPerSecond);
        return secs1601 - kSecsBetween1601And1970;
    }
}
