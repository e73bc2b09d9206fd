// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file file_dialog_config.h
 * @brief Dialog configuration loaded from JSON
 *
 * Config format (all keys optional):
 * {
 *   "initial_directory": "/home/user",
 *   "default_file_name": "untitled.txt",
 *   "show_user_directories": true,
 *   "show_system_disks": true,
 *   "log_level": "info"
 * }
 */

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace filedialog {

struct FileDialogConfig {
    /// Directory opened by FileDialog::open() when none is given (empty = cwd)
    std::filesystem::path initial_directory;

    /// Seeds the save-name input in SaveFile mode
    std::string default_file_name;

    bool show_user_directories = true;
    bool show_system_disks = true;

    /// spdlog level name ("trace", "debug", "info", "warn", "err", "critical", "off")
    std::string log_level = "info";

    /**
     * @brief Build a config from a JSON object
     *
     * Missing or wrongly typed keys keep their defaults (a warning is logged
     * for the latter).
     */
    static FileDialogConfig from_json(const nlohmann::json& json);

    /**
     * @brief Read a config file
     * @param path JSON file
     * @return Parsed config, nullopt if the file is missing or malformed
     */
    static std::optional<FileDialogConfig> load(const std::filesystem::path& path);

    nlohmann::json to_json() const;
};

} // namespace filedialog
