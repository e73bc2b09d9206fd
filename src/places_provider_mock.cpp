// SPDX-License-Identifier: GPL-3.0-or-later

#include "places_provider_mock.h"

#include <spdlog/spdlog.h>

namespace filedialog {

MockUserDirectoriesProvider::MockUserDirectoriesProvider(UserDirectories dirs)
    : dirs_(std::move(dirs)) {}

UserDirectories MockUserDirectoriesProvider::refresh() {
    ++refresh_count_;
    spdlog::trace("[MockUserDirectories] refresh #{}", refresh_count_);
    return dirs_;
}

void MockUserDirectoriesProvider::set_directories(UserDirectories dirs) {
    dirs_ = std::move(dirs);
}

MockDisksProvider::MockDisksProvider(std::vector<Disk> disks) : disks_(std::move(disks)) {}

std::vector<Disk> MockDisksProvider::refresh() {
    ++refresh_count_;
    spdlog::trace("[MockDisks] refresh #{} ({} disks)", refresh_count_, disks_.size());
    return disks_;
}

void MockDisksProvider::set_disks(std::vector<Disk> disks) {
    disks_ = std::move(disks);
}

} // namespace filedialog
