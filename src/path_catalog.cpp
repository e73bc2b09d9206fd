// SPDX-License-Identifier: GPL-3.0-or-later

#include "path_catalog.h"

#include "path_utils.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace filedialog {

std::optional<std::filesystem::path> PathCatalog::canonicalize(const std::filesystem::path& path,
                                                               IoError* error) {
    std::error_code ec;
    std::filesystem::path canonical = std::filesystem::canonical(path, ec);
    if (ec) {
        if (error) {
            *error = IoError{path, ec, ec.message()};
        }
        return std::nullopt;
    }

    if (!std::filesystem::is_directory(canonical, ec)) {
        if (error) {
            std::error_code code = ec ? ec : std::make_error_code(std::errc::not_a_directory);
            *error = IoError{path, code, code.message()};
        }
        return std::nullopt;
    }

    return canonical;
}

std::optional<IoError> PathCatalog::load(const std::filesystem::path& path) {
    clear();

    IoError error;
    auto canonical = canonicalize(path, &error);
    if (!canonical) {
        spdlog::warn("[PathCatalog] Cannot resolve {}: {}", path.string(), error.message);
        return error;
    }

    std::error_code ec;
    std::filesystem::directory_iterator it(*canonical, ec);
    if (ec) {
        spdlog::warn("[PathCatalog] Cannot read {}: {}", canonical->string(), ec.message());
        return IoError{*canonical, ec, ec.message()};
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }

        const std::filesystem::path& entry = it->path();
        if (!display_name(entry)) {
            ++skipped_count_;
            continue;
        }
        entries_.push_back(entry);
    }

    if (ec) {
        // Enumeration stopped early; keep what was read so far
        ++skipped_count_;
        spdlog::warn("[PathCatalog] Listing of {} incomplete: {}", canonical->string(),
                     ec.message());
    }

    directory_ = *canonical;

    if (skipped_count_ > 0) {
        spdlog::debug("[PathCatalog] Skipped {} entries in {}", skipped_count_, directory_.string());
    }
    spdlog::debug("[PathCatalog] Loaded {} entries from {}", entries_.size(), directory_.string());

    return std::nullopt;
}

bool PathCatalog::insert(const std::filesystem::path& path) {
    if (contains(path)) {
        return false;
    }
    entries_.push_back(path);
    return true;
}

bool PathCatalog::contains(const std::filesystem::path& path) const {
    return std::find(entries_.begin(), entries_.end(), path) != entries_.end();
}

std::vector<std::filesystem::path> PathCatalog::filtered(const std::string& query) const {
    if (query.empty()) {
        return entries_;
    }

    std::vector<std::filesystem::path> result;
    for (const auto& entry : entries_) {
        auto name = display_name(entry);
        if (name && contains_ignore_case(*name, query)) {
            result.push_back(entry);
        }
    }
    return result;
}

void PathCatalog::clear() {
    directory_.clear();
    entries_.clear();
    skipped_count_ = 0;
}

} // namespace filedialog
