// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KCRTIME_VERSION_H
#define KCRTIME_VERSION_H

#include <string_view>

namespace Version {
    inline constexpr std::string_view VERSION = "1.0.0";
};

#endif //KCRTIME_VERSION_H
