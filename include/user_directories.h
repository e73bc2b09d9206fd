// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file user_directories.h
 * @brief Well-known user directories shown as dialog shortcuts
 *
 * The dialog displays these but never owns or modifies them; it asks its
 * provider for a fresh snapshot on every open() and refresh().
 */

#include <filesystem>
#include <optional>
#include <string>

namespace filedialog {

/**
 * @brief Snapshot of the user's well-known directories
 *
 * Each entry is optional; a directory that is not configured or does not
 * exist is left empty.
 */
struct UserDirectories {
    std::optional<std::filesystem::path> home;
    std::optional<std::filesystem::path> desktop;
    std::optional<std::filesystem::path> documents;
    std::optional<std::filesystem::path> downloads;
    std::optional<std::filesystem::path> audio;
    std::optional<std::filesystem::path> pictures;
    std::optional<std::filesystem::path> videos;

    /// True if no directory is known
    bool empty() const {
        return !home && !desktop && !documents && !downloads && !audio && !pictures && !videos;
    }
};

/**
 * @brief Source of UserDirectories snapshots
 */
class UserDirectoriesProvider {
  public:
    virtual ~UserDirectoriesProvider() = default;

    /// Re-read the environment and return a fresh snapshot
    virtual UserDirectories refresh() = 0;
};

/**
 * @brief Linux/XDG implementation
 *
 * Home comes from $HOME. The other directories are read from
 * user-dirs.dirs (XDG_DESKTOP_DIR="$HOME/Desktop" ...) in $XDG_CONFIG_HOME,
 * falling back to ~/.config. Only existing directories are reported.
 */
class XdgUserDirectoriesProvider : public UserDirectoriesProvider {
  public:
    /// Use $HOME and $XDG_CONFIG_HOME from the environment
    XdgUserDirectoriesProvider() = default;

    /**
     * @brief Use explicit locations instead of the environment
     * @param home Home directory
     * @param config_dir Directory containing user-dirs.dirs
     */
    XdgUserDirectoriesProvider(std::filesystem::path home, std::filesystem::path config_dir);

    UserDirectories refresh() override;

    /**
     * @brief Look up one XDG_<key>_DIR entry
     * @param key "DESKTOP", "DOCUMENTS", "DOWNLOAD", "MUSIC", "PICTURES" or "VIDEOS"
     * @return Expanded path, nullopt if the key is absent or empty
     */
    std::optional<std::filesystem::path> read_xdg_dir(const std::string& key) const;

  private:
    std::filesystem::path resolve_home() const;
    std::filesystem::path resolve_config_dir() const;

    std::optional<std::filesystem::path> home_override_;
    std::optional<std::filesystem::path> config_dir_override_;
};

} // namespace filedialog
