// SPDX-License-Identifier: GPL-3.0-or-later

#include "create_directory_dialog.h"

#include <spdlog/spdlog.h>

#include <system_error>

namespace filedialog {

void CreateDirectoryDialog::open(const std::filesystem::path& parent) {
    reset();

    open_ = true;
    parent_ = parent;
    error_ = validate(input_, parent_);

    spdlog::debug("[CreateDirectoryDialog] Opened in {}", parent.string());
}

void CreateDirectoryDialog::close() {
    if (open_) {
        spdlog::debug("[CreateDirectoryDialog] Closed");
    }
    reset();
}

bool CreateDirectoryDialog::set_input(const std::string& text) {
    if (!open_) {
        return false;
    }

    input_ = text;
    error_ = validate(input_, parent_);
    return true;
}

void CreateDirectoryDialog::revalidate() {
    if (open_) {
        error_ = validate(input_, parent_);
    }
}

std::optional<std::filesystem::path> CreateDirectoryDialog::commit() {
    if (!open_ || error_) {
        return std::nullopt;
    }

    if (!parent_) {
        error_ = NO_DIRECTORY;
        return std::nullopt;
    }

    std::filesystem::path dir = *parent_ / input_;

    std::error_code ec;
    bool created = std::filesystem::create_directory(dir, ec);
    if (!created && !ec) {
        // Appeared between validation and creation
        ec = std::make_error_code(std::errc::file_exists);
    }

    if (ec) {
        spdlog::warn("[CreateDirectoryDialog] Failed to create {}: {}", dir.string(), ec.message());
        error_ = "Error: " + ec.message();
        return std::nullopt;
    }

    spdlog::info("[CreateDirectoryDialog] Created directory {}", dir.string());
    close();
    return dir;
}

std::optional<std::string>
CreateDirectoryDialog::validate(const std::string& input,
                                const std::optional<std::filesystem::path>& parent) {
    if (input.empty()) {
        return std::string(NAME_EMPTY);
    }

    // Only direct children of the parent
    std::filesystem::path name(input);
    if (input == "." || input == ".." || name.has_root_path() || name.has_parent_path()) {
        return std::string(NAME_INVALID);
    }

    if (!parent) {
        return std::string(NO_DIRECTORY);
    }

    std::error_code ec;
    if (std::filesystem::is_directory(*parent / input, ec)) {
        return std::string(NAME_EXISTS);
    }

    return std::nullopt;
}

void CreateDirectoryDialog::reset() {
    open_ = false;
    parent_.reset();
    input_.clear();
    error_.reset();
}

} // namespace filedialog
