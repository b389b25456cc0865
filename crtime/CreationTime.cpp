// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "CreationTime.h"
#include "CreationTimeExtractor.h"
#include "FilesystemClassifier.h"

namespace CreationTime {
    Crtime::ExtractionResult creationTime(const std::filesystem::path& path) {
        const Crtime::FilesystemType type = FilesystemClassifier::classify(path);
        return CreationTimeExtractor::extract(path, type);
    }
}
