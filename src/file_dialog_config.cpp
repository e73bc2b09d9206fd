// SPDX-License-Identifier: GPL-3.0-or-later

#include "file_dialog_config.h"

#include <spdlog/spdlog.h>

#include <fstream>

namespace filedialog {

namespace {

template <typename T>
void read_key(const nlohmann::json& json, const char* key, T& out) {
    if (!json.contains(key)) {
        return;
    }
    try {
        out = json.at(key).get<T>();
    } catch (const nlohmann::json::type_error& e) {
        spdlog::warn("[FileDialogConfig] Ignoring '{}': {}", key, e.what());
    }
}

// spdlog::level::from_str() maps unknown names to off
bool is_known_log_level(const std::string& name) {
    return name == "off" || spdlog::level::from_str(name) != spdlog::level::off;
}

} // namespace

FileDialogConfig FileDialogConfig::from_json(const nlohmann::json& json) {
    FileDialogConfig config;
    if (!json.is_object()) {
        spdlog::warn("[FileDialogConfig] Expected a JSON object, using defaults");
        return config;
    }

    std::string initial_directory;
    read_key(json, "initial_directory", initial_directory);
    config.initial_directory = initial_directory;

    read_key(json, "default_file_name", config.default_file_name);
    read_key(json, "show_user_directories", config.show_user_directories);
    read_key(json, "show_system_disks", config.show_system_disks);
    std::string log_level = config.log_level;
    read_key(json, "log_level", log_level);
    if (is_known_log_level(log_level)) {
        config.log_level = log_level;
    } else {
        spdlog::warn("[FileDialogConfig] Unknown log_level '{}', using '{}'", log_level,
                     config.log_level);
    }

    return config;
}

std::optional<FileDialogConfig> FileDialogConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::warn("[FileDialogConfig] Cannot open config file: {}", path.string());
        return std::nullopt;
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("[FileDialogConfig] Failed to parse {}: {}", path.string(), e.what());
        return std::nullopt;
    }

    spdlog::debug("[FileDialogConfig] Loaded {}", path.string());
    return from_json(json);
}

nlohmann::json FileDialogConfig::to_json() const {
    return nlohmann::json{{"initial_directory", initial_directory.string()},
                          {"default_file_name", default_file_name},
                          {"show_user_directories", show_user_directories},
                          {"show_system_disks", show_system_disks},
                          {"log_level", log_level}};
}

} // namespace filedialog
