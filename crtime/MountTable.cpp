// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <charconv>
#include <sys/sysmacros.h>

#include <blkid/blkid.h>

#include "MountTable.h"

namespace MountTable {
    namespace {
        bool isOctalDigit(char c) {
            return c >= '0' && c <= '7';
        }

        bool coversPath(const std::string& mountPoint, const std::string& path) {
            if (mountPoint == "/") {
                return !path.empty() && path.front() == '/';
            }
            if (path.size() < mountPoint.size() || path.compare(0, mountPoint.size(), mountPoint) != 0) {
                return false;
            }
            // "/mnt/a" must not cover "/mnt/ab"
            return path.size() == mountPoint.size() || path[mountPoint.size()] == '/';
        }
    }

    std::filesystem::path mountInfoPath() {
        const char* overridePath = std::getenv(kMountInfoEnv);
        if (overridePath && *overridePath) {
            return overridePath;
        }
        return kDefaultMountInfo;
    }

    std::optional<dev_t> parseDeviceNumber(std::string_view field) {
        const auto colon = field.find(':');
        if (colon == std::string_view::npos) return std::nullopt;

        unsigned int maj = 0;
        unsigned int min = 0;
        const std::string_view majStr = field.substr(0, colon);
        const std::string_view minStr = field.substr(colon + 1);

        auto r = std::from_chars(majStr.data(), majStr.data() + majStr.size(), maj);
        if (r.ec != std::errc() || r.ptr != majStr.data() + majStr.size() || majStr.empty()) return std::nullopt;
        r = std::from_chars(minStr.data(), minStr.data() + minStr.size(), min);
        if (r.ec != std::errc() || r.ptr != minStr.data() + minStr.size() || minStr.empty()) return std::nullopt;

        return makedev(maj, min);
    }

    std::string unescapeField(std::string_view field) {
        std::string out;
        out.reserve(field.size());

        for (size_t i = 0; i < field.size(); ++i) {
            if (field[i] == '\\' && i + 3 < field.size()
                && isOctalDigit(field[i + 1]) && isOctalDigit(field[i + 2]) && isOctalDigit(field[i + 3])) {
                const int value = (field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8 + (field[i + 3] - '0');
                out.push_back(static_cast<char>(value));
                i += 3;
                continue;
            }
            out.push_back(field[i]);
        }

        return out;
    }

    std::optional<std::vector<MountInfoEntry>> readMountInfo(const std::filesystem::path& file) {
        std::ifstream f(file);
        if (!f) return std::nullopt;

        std::vector<MountInfoEntry> out;
        std::string line;
        while (std::getline(f, line)) {
            // The optional fields between opts and " - " vary in count,
            // so split on the separator first.
            const auto sep = line.find(" - ");
            if (sep == std::string::npos) continue;

            const std::string left = line.substr(0, sep);
            const std::string right = line.substr(sep + 3);

            // left: id, parent, maj:min, root, mount_point, opts
            std::string id, parent, majmin, root, mountPoint;
            {
                std::istringstream iss(left);
                std::string opts;
                if (!(iss >> id >> parent >> majmin >> root >> mountPoint >> opts)) continue;
            }

            // right: fstype mount_source superopts
            std::string fstype, mountSource;
            {
                std::istringstream iss(right);
                std::string superopts;
                if (!(iss >> fstype >> mountSource >> superopts)) continue;
            }

            const auto device = parseDeviceNumber(majmin);
            if (!device) continue;

            out.push_back({unescapeField(mountPoint), fstype, unescapeField(mountSource), *device});
        }

        return out;
    }

    std::optional<MountInfoEntry> findCoveringMount(const std::vector<MountInfoEntry>& entries,
                                                    const std::filesystem::path& resolvedPath) {
        const std::string& path = resolvedPath.native();

        const MountInfoEntry* best = nullptr;
        for (const auto& entry : entries) {
            if (!coversPath(entry.mountPoint, path)) continue;

            // >= so that a later over-mount of the same point replaces the earlier one
            if (!best || entry.mountPoint.size() >= best->mountPoint.size()) {
                best = &entry;
            }
        }

        if (!best) return std::nullopt;
        return *best;
    }

    std::optional<MountInfoEntry> findCoveringMount(const std::vector<MountInfoEntry>& entries,
                                                    const std::filesystem::path& resolvedPath,
                                                    const dev_t device) {
        std::vector<MountInfoEntry> sameDevice;
        for (const auto& entry : entries) {
            if (entry.device == device) {
                sameDevice.push_back(entry);
            }
        }

        if (auto hit = findCoveringMount(sameDevice, resolvedPath)) {
            return hit;
        }
        return findCoveringMount(entries, resolvedPath);
    }

    std::optional<std::string> probeDeviceType(const std::string& devNode) {
        if (devNode.rfind("/dev/", 0) != 0) return std::nullopt;

        blkid_probe pr = blkid_new_probe_from_filename(devNode.c_str());
        if (!pr) return std::nullopt;

        blkid_probe_enable_superblocks(pr, 1);
        blkid_probe_set_superblocks_flags(pr, BLKID_SUBLKS_TYPE);

        const int rc = blkid_do_safeprobe(pr);

        const char* data = nullptr;
        size_t len = 0;

        std::optional<std::string> out;
        if (rc == 0 && blkid_probe_lookup_value(pr, "TYPE", &data, &len) == 0 && data && len > 0) {
            // len includes the terminating NUL
            out = std::string(data);
        }

        blkid_free_probe(pr);
        return out;
    }
}
