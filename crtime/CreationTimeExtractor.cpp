// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <cerrno>
#include <string>
#include <system_error>
#include <sys/stat.h>
#include <sys/xattr.h>

#include "../NtfsUtils.h"
#include "CrtimeErrors.h"
#include "CreationTimeExtractor.h"

namespace CreationTimeExtractor {
    Crtime::CreationInstant extractNtfs(const std::filesystem::path& path) {
        return extractNtfs(path, kNtfsCrtimeAttribute);
    }

    Crtime::CreationInstant extractNtfs(const std::filesystem::path& path, const std::string& attributeName) {
        unsigned char raw[NtfsUtils::kTimestampSize] = {};

        const ssize_t len = ::getxattr(path.c_str(), attributeName.c_str(), raw, sizeof(raw));
        if (len < 0) {
            const int err = errno;
            // ERANGE: the value is larger than a FILETIME
            const std::string reason = (err == ENODATA) ? "attribute " + attributeName + " not present"
                                     : (err == ERANGE) ? "attribute " + attributeName + " is malformed"
                                     : "cannot read attribute " + attributeName;
            throw Crtime::AttributeReadError(path, reason, std::error_code(err, std::generic_category()));
        }

        if (static_cast<size_t>(len) != sizeof(raw)) {
            throw Crtime::AttributeReadError(
                path,
                "attribute " + attributeName + " has " + std::to_string(len) + " bytes, expected 8",
                std::make_error_code(std::errc::bad_message));
        }

        return Crtime::CreationInstant{NtfsUtils::ntfsTicksToUnixSeconds(NtfsUtils::readBigEndianU64(raw)), 0};
    }

    Crtime::CreationInstant extractFat32(const std::filesystem::path& path) {
        struct stat st {};
        if (::stat(path.c_str(), &st) != 0) {
            const int err = errno;
            throw Crtime::MetadataReadError(path, "stat() failed", std::error_code(err, std::generic_category()));
        }

        // vfat stores the creation time where other filesystems keep the status change time.
        return Crtime::CreationInstant{static_cast<int64_t>(st.st_ctim.tv_sec),
                                       static_cast<uint32_t>(st.st_ctim.tv_nsec)};
    }

    Crtime::ExtractionResult extract(const std::filesystem::path& path, const Crtime::FilesystemType type) {
        switch (type) {
            case Crtime::FilesystemType::NtfsCompatible:
                return extractNtfs(path);
            case Crtime::FilesystemType::Fat32:
                return extractFat32(path);
            case Crtime::FilesystemType::Other:
                return Crtime::Unsupported{type};
        }
        return Crtime::Unsupported{type};
    }
}
