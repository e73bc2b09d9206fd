// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file system_disks.h
 * @brief Mounted devices shown as dialog shortcuts
 */

#include <filesystem>
#include <string>
#include <vector>

namespace filedialog {

/**
 * @brief One mounted device
 */
struct Disk {
    std::string name;                  ///< Device name, e.g. "/dev/sda1"
    std::filesystem::path mount_point; ///< Where the device is mounted

    bool operator==(const Disk& other) const {
        return name == other.name && mount_point == other.mount_point;
    }
};

/**
 * @brief Source of mounted device lists
 */
class DisksProvider {
  public:
    virtual ~DisksProvider() = default;

    /// Re-read the system mount table
    virtual std::vector<Disk> refresh() = 0;
};

/**
 * @brief Reads the mount table in /proc/mounts format
 *
 * Keeps block devices (source starting with /dev/), one entry per mount
 * point, in mount table order. Octal escapes (\040 for space) are decoded.
 */
class ProcMountsDisksProvider : public DisksProvider {
  public:
    static constexpr const char* DEFAULT_MOUNTS_FILE = "/proc/mounts";

    explicit ProcMountsDisksProvider(std::filesystem::path mounts_file = DEFAULT_MOUNTS_FILE);

    std::vector<Disk> refresh() override;

    /// Decode the octal escapes used by the kernel in mount table fields
    static std::string unescape_field(const std::string& field);

  private:
    std::filesystem::path mounts_file_;
};

} // namespace filedialog
