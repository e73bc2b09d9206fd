// SPDX-License-Identifier: GPL-3.0-or-later

#include "system_disks.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace filedialog {

namespace {

bool is_octal_digit(char c) {
    return c >= '0' && c <= '7';
}

} // namespace

ProcMountsDisksProvider::ProcMountsDisksProvider(std::filesystem::path mounts_file)
    : mounts_file_(std::move(mounts_file)) {}

std::string ProcMountsDisksProvider::unescape_field(const std::string& field) {
    std::string out;
    out.reserve(field.size());

    for (size_t i = 0; i < field.size(); i++) {
        if (field[i] == '\\' && i + 3 < field.size() && is_octal_digit(field[i + 1]) &&
            is_octal_digit(field[i + 2]) && is_octal_digit(field[i + 3])) {
            int value = (field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8 + (field[i + 3] - '0');
            out.push_back(static_cast<char>(value));
            i += 3;
            continue;
        }
        out.push_back(field[i]);
    }

    return out;
}

std::vector<Disk> ProcMountsDisksProvider::refresh() {
    std::vector<Disk> disks;

    std::ifstream file(mounts_file_);
    if (!file.is_open()) {
        spdlog::warn("[SystemDisks] Cannot open mount table {}", mounts_file_.string());
        return disks;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::istringstream fields(line);
        std::string device;
        std::string mount_point;
        if (!(fields >> device >> mount_point)) {
            continue;
        }

        if (device.rfind("/dev/", 0) != 0) {
            continue; // proc, sysfs, tmpfs, ...
        }

        Disk disk{unescape_field(device), unescape_field(mount_point)};
        bool seen = std::any_of(disks.begin(), disks.end(), [&](const Disk& d) {
            return d.mount_point == disk.mount_point;
        });
        if (!seen) {
            disks.push_back(std::move(disk));
        }
    }

    spdlog::debug("[SystemDisks] Found {} mounted devices in {}", disks.size(),
                  mounts_file_.string());
    return disks;
}

} // namespace filedialog
