// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "minitest.hpp"
#include "NtfsUtils.h"
#include <cstdint>

TEST(ntfs_unix_epoch_decodes_to_zero) {
  ASSERT_EQ(NtfsUtils::ntfsTicksToUnixSeconds(116'444'736'000'000'000ULL), 0);
}

TEST(ntfs_conversion_truncates_sub_second_ticks) {
  // 0.9999999 s after the epoch still reports second 0
  ASSERT_EQ(NtfsUtils::ntfsTicksToUnixSeconds(116'444'736'009'999'999ULL), 0);
  ASSERT_EQ(NtfsUtils::ntfsTicksToUnixSeconds(116'444'736'010'000'000ULL), 1);
}

TEST(ntfs_conversion_before_1970_is_negative) {
  ASSERT_EQ(NtfsUtils::ntfsTicksToUnixSeconds(0), -11'644'473'600LL);
  ASSERT_EQ(NtfsUtils::ntfsTicksToUnixSeconds(116'444'735'990'000'000ULL), -1);
}

TEST(ntfs_conversion_known_date) {
  // 2021-01-01T00:00:00Z = 1609459200
  const uint64_t ticks = (1'609'459'200ULL + 11'644'473'600ULL) * 10'000'000ULL + 1234567ULL;
  ASSERT_EQ(NtfsUtils::ntfsTicksToUnixSeconds(ticks), 1'609'459'200LL);
}

TEST(ntfs_max_ticks_do_not_overflow) {
  const int64_t secs = NtfsUtils::ntfsTicksToUnixSeconds(UINT64_MAX);
  ASSERT_EQ(secs, static_cast<int64_t>(UINT64_MAX / 10'000'000ULL) - 11'644'473'600LL);
  ASSERT_TRUE(secs > 0);
}

TEST(big_endian_decoding_is_host_independent) {
  const unsigned char bytes[8] = {0x01, 0x9D, 0xB1, 0xDE, 0xD5, 0x3E, 0x80, 0x00};
  ASSERT_EQ(NtfsUtils::readBigEndianU64(bytes), 116'444'736'000'000'000ULL);

  const unsigned char low[8] = {0, 0, 0, 0, 0, 0, 0, 0x2A};
  ASSERT_EQ(NtfsUtils::readBigEndianU64(low), 42ULL);

  const unsigned char high[8] = {0x80, 0, 0, 0, 0, 0, 0, 0};
  ASSERT_EQ(NtfsUtils::readBigEndianU64(high), 0x8000000000000000ULL);
}
