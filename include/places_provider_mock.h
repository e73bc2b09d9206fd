// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "system_disks.h"
#include "user_directories.h"

#include <vector>

namespace filedialog {

/**
 * @brief Fixed UserDirectories for tests and headless runs
 *
 * Returns whatever was last passed to set_directories() and counts how often
 * the dialog asked for a refresh.
 */
class MockUserDirectoriesProvider : public UserDirectoriesProvider {
  public:
    MockUserDirectoriesProvider() = default;
    explicit MockUserDirectoriesProvider(UserDirectories dirs);

    UserDirectories refresh() override;

    void set_directories(UserDirectories dirs);

    int refresh_count() const {
        return refresh_count_;
    }

  private:
    UserDirectories dirs_;
    int refresh_count_ = 0;
};

/**
 * @brief Fixed disk list for tests and headless runs
 */
class MockDisksProvider : public DisksProvider {
  public:
    MockDisksProvider() = default;
    explicit MockDisksProvider(std::vector<Disk> disks);

    std::vector<Disk> refresh() override;

    void set_disks(std::vector<Disk> disks);

    int refresh_count() const {
        return refresh_count_;
    }

  private:
    std::vector<Disk> disks_;
    int refresh_count_ = 0;
};

} // namespace filedialog
