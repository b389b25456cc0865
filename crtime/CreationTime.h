// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KCRTIME_CREATIONTIME_H
#define KCRTIME_CREATIONTIME_H

#include <filesystem>
#include "CrtimeErrors.h"
#include "CrtimeTypes.h"

namespace CreationTime {
    /**
     * Returns the creation time of the file at path.
     *
     * Classifies the mount backing the path, then runs the matching extraction
     * strategy. Nothing is cached between calls.
     *
     * @return The creation instant, or Crtime::Unsupported when the filesystem
     *         has no strategy.
     * @throws Crtime::ClassificationError, Crtime::AttributeReadError,
     *         Crtime::MetadataReadError
     */
    [[nodiscard]] Crtime::ExtractionResult creationTime(const std::filesystem::path& path);
}

#endif //KCRTIME_CREATIONTIME_H
