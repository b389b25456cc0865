// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <memory>
#include <string>
#include <sys/stat.h>

#include "CrtimeErrors.h"
#include "FilesystemClassifier.h"

namespace FilesystemClassifier {
    namespace {
        constexpr std::array<std::string_view, 4> kNtfsFuseDrivers = {
            "fuseblk", "fuse.ntfs-3g", "ntfs-3g", "fuse.ntfs"};

        constexpr std::string_view kFat32Driver = "vfat";

        std::filesystem::path resolvePath(const std::filesystem::path& path) {
            if (path.empty()) {
                throw Crtime::ClassificationError(path, "empty path", std::make_error_code(std::errc::invalid_argument));
            }

            // realpath() fails if the path doesn't exist, which is what we want here.
            std::unique_ptr<char, decltype(&std::free)> resolved(::realpath(path.c_str(), nullptr), &std::free);
            if (!resolved) {
                const int err = errno;
                throw Crtime::ClassificationError(path, "cannot resolve path", std::error_code(err, std::generic_category()));
            }
            return std::filesystem::path(resolved.get());
        }
    }

    Crtime::FilesystemType filesystemTypeFromDriver(std::string_view driverName) {
        for (std::string_view ntfs : kNtfsFuseDrivers) {
            if (driverName == ntfs) {
                return Crtime::FilesystemType::NtfsCompatible;
            }
        }
        if (driverName == kFat32Driver) {
            return Crtime::FilesystemType::Fat32;
        }
        return Crtime::FilesystemType::Other;
    }

    MountTable::MountInfoEntry coveringMount(const std::filesystem::path& path,
                                             const std::filesystem::path& mountInfoFile) {
        const std::filesystem::path resolved = resolvePath(path);

        const auto entries = MountTable::readMountInfo(mountInfoFile);
        if (!entries) {
            throw Crtime::ClassificationError(path, "cannot read mount table " + mountInfoFile.string(),
                                              std::make_error_code(std::errc::no_such_file_or_directory));
        }

        struct stat st {};
        if (::stat(resolved.c_str(), &st) != 0) {
            const int err = errno;
            throw Crtime::ClassificationError(path, "cannot stat " + resolved.string(),
                                              std::error_code(err, std::generic_category()));
        }

        auto entry = MountTable::findCoveringMount(*entries, resolved, st.st_dev);
        if (!entry) {
            throw Crtime::ClassificationError(path, "no mount table entry covers " + resolved.string(),
                                              std::make_error_code(std::errc::no_such_device));
        }

        return *entry;
    }

    Crtime::FilesystemType classify(const std::filesystem::path& path) {
        return classify(path, MountTable::mountInfoPath());
    }

    Crtime::FilesystemType classify(const std::filesystem::path& path,
                                    const std::filesystem::path& mountInfoFile) {
        return filesystemTypeFromDriver(coveringMount(path, mountInfoFile).fsType);
    }
}
