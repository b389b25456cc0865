// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <utility>
#include "CrtimeErrors.h"

namespace Crtime {
    namespace {
        std::string composeMessage(const std::string& prefix,
                                   const std::filesystem::path& path,
                                   const std::string& reason,
                                   const std::error_code& cause) {
            std::string msg = prefix + " '" + path.string() + "': " + reason;
            if (cause) {
                msg += " (" + cause.message() + ")";
            }
            return msg;
        }
    }

    Error::Error(const std::string& what, std::filesystem::path path, std::error_code cause)
        : std::runtime_error(what), m_path(std::move(path)), m_code(cause) {}

    ClassificationError::ClassificationError(const std::filesystem::path& path,
                                             const std::string& reason,
                                             std::error_code cause)
        : Error(composeMessage("Cannot determine filesystem of", path, reason, cause), path, cause) {}

    AttributeReadError::AttributeReadError(const std::filesystem::path& path,
                                           const std::string& reason,
                                           std::error_code cause)
        : Error(composeMessage("Cannot read NTFS creation time of", path, reason, cause), path, cause) {}

    MetadataReadError::MetadataReadError(const std::filesystem::path& path,
                                         const std::string& reason,
                                         std::error_code cause)
        : Error(composeMessage("Cannot read metadata of", path, reason, cause), path, cause) {}
}
