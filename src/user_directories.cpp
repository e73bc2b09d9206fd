// SPDX-License-Identifier: GPL-3.0-or-later

#include "user_directories.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <system_error>

namespace filedialog {

namespace {

constexpr const char* USER_DIRS_FILENAME = "user-dirs.dirs";

std::optional<std::filesystem::path> existing_directory(const std::filesystem::path& path) {
    std::error_code ec;
    if (!path.empty() && std::filesystem::is_directory(path, ec)) {
        return path;
    }
    return std::nullopt;
}

std::filesystem::path normalized(const std::filesystem::path& path) {
    std::filesystem::path result = path.lexically_normal();
    if (!result.has_filename() && result.has_relative_path()) {
        result = result.parent_path(); // drop trailing separator
    }
    return result;
}

} // namespace

XdgUserDirectoriesProvider::XdgUserDirectoriesProvider(std::filesystem::path home,
                                                       std::filesystem::path config_dir)
    : home_override_(std::move(home)), config_dir_override_(std::move(config_dir)) {}

std::filesystem::path XdgUserDirectoriesProvider::resolve_home() const {
    if (home_override_) {
        return *home_override_;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return home;
    }
    return {};
}

std::filesystem::path XdgUserDirectoriesProvider::resolve_config_dir() const {
    if (config_dir_override_) {
        return *config_dir_override_;
    }

    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && xdg_config[0] != '\0') {
        return xdg_config;
    }

    std::filesystem::path home = resolve_home();
    if (home.empty()) {
        return {};
    }
    return home / ".config";
}

std::optional<std::filesystem::path>
XdgUserDirectoriesProvider::read_xdg_dir(const std::string& key) const {
    std::filesystem::path config_dir = resolve_config_dir();
    if (config_dir.empty()) {
        return std::nullopt;
    }

    std::ifstream file(config_dir / USER_DIRS_FILENAME);
    if (!file.is_open()) {
        return std::nullopt;
    }

    const std::string prefix = "XDG_" + key + "_DIR=";
    const std::string home = resolve_home().string();

    std::string line;
    while (std::getline(file, line)) {
        if (line.rfind(prefix, 0) != 0) {
            continue;
        }

        std::string value = line.substr(prefix.size());
        if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
            value.erase(value.begin());
        }
        if (!value.empty() && (value.back() == '"' || value.back() == '\'')) {
            value.pop_back();
        }

        const std::string home_var = "$HOME";
        auto pos = value.find(home_var);
        if (pos != std::string::npos) {
            value.replace(pos, home_var.size(), home);
        }

        if (value.empty()) {
            return std::nullopt;
        }
        return std::filesystem::path(value);
    }

    return std::nullopt;
}

UserDirectories XdgUserDirectoriesProvider::refresh() {
    UserDirectories dirs;

    std::filesystem::path home = resolve_home();
    dirs.home = existing_directory(home);
    if (!dirs.home) {
        spdlog::debug("[UserDirectories] No home directory available");
        return dirs;
    }

    auto lookup = [&](const char* key,
                      const char* fallback) -> std::optional<std::filesystem::path> {
        auto configured = read_xdg_dir(key);
        if (configured) {
            // xdg-user-dirs disables a directory by pointing it at $HOME
            if (normalized(*configured) == normalized(home)) {
                return std::nullopt;
            }
            return existing_directory(*configured);
        }
        return existing_directory(home / fallback);
    };

    dirs.desktop = lookup("DESKTOP", "Desktop");
    dirs.documents = lookup("DOCUMENTS", "Documents");
    dirs.downloads = lookup("DOWNLOAD", "Downloads");
    dirs.audio = lookup("MUSIC", "Music");
    dirs.pictures = lookup("PICTURES", "Pictures");
    dirs.videos = lookup("VIDEOS", "Videos");

    spdlog::debug("[UserDirectories] Refreshed user directories for {}", home.string());
    return dirs;
}

} // namespace filedialog
