// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef KCRTIME_CRTIMEERRORS_H
#define KCRTIME_CRTIMEERRORS_H

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace Crtime {

    /**
     * Base class of every failure the creation-time core reports.
     *
     * Carries the path the operation was asked about and the underlying cause
     * as a std::error_code (usually an errno value from the failing system call).
     * Callers that only want to know "did it work" catch this type; callers that
     * need to react differently catch the concrete kinds below.
     */
    class Error : public std::runtime_error {
    public:
        Error(const std::string& what, std::filesystem::path path, std::error_code cause);

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }
        [[nodiscard]] std::error_code code() const noexcept { return m_code; }

    private:
        std::filesystem::path m_path;
        std::error_code m_code;
    };

    // The mount backing the path could not be determined (bad path, unreadable mount table, ...).
    class ClassificationError final : public Error {
    public:
        ClassificationError(const std::filesystem::path& path, const std::string& reason, std::error_code cause);
    };

    // The NTFS creation-time extended attribute is missing, unreadable or malformed.
    class AttributeReadError final : public Error {
    public:
        AttributeReadError(const std::filesystem::path& path, const std::string& reason, std::error_code cause);
    };

    // stat() failed while reading the FAT32 creation time.
    class MetadataReadError final : public Error {
    public:
        MetadataReadError(const std::filesystem::path& path, const std::string& reason, std::error_code cause);
    };
}

#endif //KCRTIME_CRTIMEERRORS_H
