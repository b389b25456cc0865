// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <array>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "crtime/CreationTime.h"
#include "crtime/FilesystemClassifier.h"
#include "crtime/MountTable.h"
#include "Version.h"

namespace {
    constexpr int kExitUnsupported = 1;
    constexpr int kExitClassification = 2;
    constexpr int kExitAttribute = 3;
    constexpr int kExitMetadata = 4;
    constexpr int kExitUsage = 64; // EX_USAGE

    struct CliOptions {
        bool showHelp = false;
        bool showVersion = false;
        bool iso = false;
        bool utc = false;
        bool raw = false;
        bool verbose = false;
        bool filesystemOnly = false;
        std::optional<std::string> path;
        std::string error;
    };

    void printUsage(std::ostream& out, const char* argv0) {
        out << "Usage:\n"
            << "  " << argv0 << " [--iso] [--utc] [--raw] [--verbose] <path>\n"
            << "  " << argv0 << " --filesystem <path>\n"
            << "  " << argv0 << " --version\n"
            << "\n"
            << "Prints the creation time of a file on an NTFS (ntfs-3g) or FAT32 (vfat) mount.\n"
            << "\n"
            << "Options:\n"
            << "  --iso          ISO-8601 output instead of ctime-style output\n"
            << "  --utc          Render in UTC instead of the local time zone\n"
            << "  --raw          Print seconds.nanoseconds since the Unix epoch\n"
            << "  --filesystem   Only print how the path's mount is classified\n"
            << "  --verbose      Describe the mount backing the path on stderr\n"
            << "  -h, --help     Show this help message and exit\n";
    }

    CliOptions parseArgs(int argc, char* argv[]) {
        CliOptions opts;
        bool literal = false;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];
            if (!literal) {
                if (arg == "--") { literal = true; continue; }
                if (arg == "-h" || arg == "--help") { opts.showHelp = true; continue; }
                if (arg == "--version") { opts.showVersion = true; continue; }
                if (arg == "--iso") { opts.iso = true; continue; }
                if (arg == "--utc") { opts.utc = true; continue; }
                if (arg == "--raw") { opts.raw = true; continue; }
                if (arg == "--verbose" || arg == "-v") { opts.verbose = true; continue; }
                if (arg == "--filesystem") { opts.filesystemOnly = true; continue; }
                if (!arg.empty() && arg.front() == '-') {
                    opts.error = "unknown option '" + std::string(arg) + "'";
                    return opts;
                }
            }
            positional.emplace_back(arg);
        }

        if (opts.showHelp || opts.showVersion) {
            return opts;
        }

        if (positional.empty()) {
            opts.error = "need one command line argument: filename";
        } else if (positional.size() > 1) {
            opts.error = "unexpected extra argument '" + positional[1] + "'";
        } else {
            opts.path = positional.front();
        }
        return opts;
    }

    std::optional<std::tm> toCalendar(int64_t seconds, bool utc) {
        using time_limits = std::numeric_limits<std::time_t>;
        if (seconds < static_cast<int64_t>(time_limits::min()) || seconds > static_cast<int64_t>(time_limits::max())) {
            return std::nullopt;
        }

        const auto tt = static_cast<std::time_t>(seconds);
        std::tm tm{};
        if ((utc ? ::gmtime_r(&tt, &tm) : ::localtime_r(&tt, &tm)) == nullptr) {
            return std::nullopt;
        }
        return tm;
    }

    std::optional<std::string> formatInstant(const Crtime::CreationInstant& instant, const CliOptions& opts) {
        if (opts.raw) {
            std::array<char, 32> frac{};
            std::snprintf(frac.data(), frac.size(), ".%09u", static_cast<unsigned>(instant.nanoseconds));
            return std::to_string(instant.seconds) + frac.data();
        }

        const auto tm = toCalendar(instant.seconds, opts.utc);
        if (!tm) {
            return std::nullopt;
        }

        std::array<char, 64> buf{};
        if (!opts.iso) {
            // Same layout as ctime(3), without the trailing newline
            if (std::strftime(buf.data(), buf.size(), "%a %b %e %H:%M:%S %Y", &*tm) == 0) {
                return std::nullopt;
            }
            return std::string{buf.data()};
        }

        if (std::strftime(buf.data(), buf.size(), "%Y-%m-%dT%H:%M:%S", &*tm) == 0) {
            return std::nullopt;
        }
        std::string out{buf.data()};

        if (instant.nanoseconds != 0) {
            std::array<char, 16> frac{};
            std::snprintf(frac.data(), frac.size(), ".%09u", static_cast<unsigned>(instant.nanoseconds));
            out += frac.data();
        }

        if (opts.utc) {
            out += 'Z';
        } else if (std::strftime(buf.data(), buf.size(), "%z", &*tm) != 0) {
            // %z gives +hhmm; the extended form needs +hh:mm
            std::string offset{buf.data()};
            if (offset.size() == 5) {
                offset.insert(3, 1, ':');
            }
            out += offset;
        }
        return out;
    }

    void describeMount(const std::filesystem::path& path) {
        const std::filesystem::path table = MountTable::mountInfoPath();
        const MountTable::MountInfoEntry mount = FilesystemClassifier::coveringMount(path, table);

        std::cerr << "Mount table: " << table.string() << "\n"
                  << "Mount point: " << mount.mountPoint << "\n"
                  << "Driver:      " << mount.fsType << " ("
                  << Crtime::describe(FilesystemClassifier::filesystemTypeFromDriver(mount.fsType)) << ")\n"
                  << "Source:      " << mount.mountSource;

        if (auto probed = MountTable::probeDeviceType(mount.mountSource)) {
            std::cerr << " [" << *probed << "]";
        }
        std::cerr << "\n";
    }

    int run(const CliOptions& opts) {
        const std::filesystem::path path = *opts.path;

        if (opts.verbose) {
            describeMount(path);
        }

        if (opts.filesystemOnly) {
            std::cout << Crtime::describe(FilesystemClassifier::classify(path)) << std::endl;
            return 0;
        }

        const Crtime::ExtractionResult result = CreationTime::creationTime(path);

        if (const auto* unsupported = std::get_if<Crtime::Unsupported>(&result)) {
            std::cerr << "Error: Unsupported filesystem (" << Crtime::describe(unsupported->filesystem)
                      << ") for '" << path.string() << "'.\n";
            return kExitUnsupported;
        }

        const auto& instant = std::get<Crtime::CreationInstant>(result);
        const auto text = formatInstant(instant, opts);
        if (!text) {
            // outside the range time_t / struct tm can represent
            std::cerr << "Warning: creation time " << instant.seconds << " cannot be rendered as a calendar date.\n";
            std::cout << instant.seconds << std::endl;
            return 0;
        }

        std::cout << *text << std::endl;
        return std::cout ? 0 : 1;
    }
}

/**
 * kcrtime:
 * 1. Takes a single path argument.
 * 2. Classifies the mount backing it and extracts the creation time.
 * 3. Prints it, or reports why there is none.
 */
int main(int argc, char* argv[]) {
    const CliOptions opts = parseArgs(argc, argv);

    if (opts.showVersion) {
        std::cout << "kcrtime v" << Version::VERSION << std::endl;
        return 0;
    }

    if (opts.showHelp) {
        printUsage(std::cout, argv[0]);
        return 0;
    }

    if (!opts.error.empty()) {
        std::cerr << "ERROR: " << opts.error << "\n";
        printUsage(std::cerr, argv[0]);
        return kExitUsage;
    }

    try {
        return run(opts);
    } catch (const Crtime::ClassificationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitClassification;
    } catch (const Crtime::AttributeReadError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitAttribute;
    } catch (const Crtime::MetadataReadError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitMetadata;
    }
}
