// SPDX-License-Identifier: GPL-3.0-or-later

#include "file_dialog.h"

#include "path_utils.h"
#include "selection_validator.h"

#include <spdlog/spdlog.h>

#include <system_error>

namespace filedialog {

// ============================================================================
// Construction
// ============================================================================

FileDialog::FileDialog(FileDialogConfig config)
    : FileDialog(std::move(config), std::make_unique<XdgUserDirectoriesProvider>(),
                 std::make_unique<ProcMountsDisksProvider>()) {}

FileDialog::FileDialog(FileDialogConfig config,
                       std::unique_ptr<UserDirectoriesProvider> user_directories,
                       std::unique_ptr<DisksProvider> disks)
    : config_(std::move(config)),
      user_directories_provider_(std::move(user_directories)),
      disks_provider_(std::move(disks)) {
    initial_directory_ = config_.initial_directory;
    if (initial_directory_.empty()) {
        std::error_code ec;
        initial_directory_ = std::filesystem::current_path(ec);
        if (ec) {
            spdlog::warn("[FileDialog] Cannot determine working directory: {}", ec.message());
        }
    }
    spdlog::debug("[FileDialog] Created with initial directory {}", initial_directory_.string());
}

FileDialog::~FileDialog() = default;

void FileDialog::set_initial_directory(const std::filesystem::path& directory) {
    initial_directory_ = directory;
}

// ============================================================================
// Session
// ============================================================================

void FileDialog::open(DialogMode mode) {
    open(mode, initial_directory_);
}

void FileDialog::open(DialogMode mode, const std::filesystem::path& initial_directory) {
    reset();

    mode_ = mode;
    state_ = DialogState::open();

    spdlog::info("[FileDialog] Opened in {} mode at {}", to_string(mode),
                 initial_directory.string());

    refresh_places();

    if (mode_ == DialogMode::SaveFile) {
        save_name_ = config_.default_file_name;
    }

    if (!navigate(initial_directory)) {
        spdlog::warn("[FileDialog] Initial directory {} could not be loaded",
                     initial_directory.string());
        // navigate() did not run the save-name validation
        revalidate_save_name();
    }
}

bool FileDialog::confirm() {
    if (!require_open("confirm")) {
        return false;
    }

    if (!is_selection_valid()) {
        spdlog::debug("[FileDialog] confirm refused: selection not valid");
        return false;
    }

    if (mode_ == DialogMode::SaveFile) {
        // A missing directory already shows up as a save-name error
        auto dir = history_.current();
        if (!dir) {
            return false;
        }
        state_ = DialogState::selected(*dir / save_name_);
    } else {
        state_ = DialogState::selected(*selected_item_);
    }

    spdlog::info("[FileDialog] Selected {}", state_.path().string());
    return true;
}

void FileDialog::cancel() {
    state_ = DialogState::cancelled();
    spdlog::info("[FileDialog] Cancelled");
}

// ============================================================================
// Navigation
// ============================================================================

bool FileDialog::navigate(const std::filesystem::path& path) {
    if (!require_open("navigate")) {
        return false;
    }

    std::filesystem::path target = path;
    auto current = history_.current();
    if (target.is_relative() && current) {
        target = *current / target;
    }

    IoError error;
    auto canonical = PathCatalog::canonicalize(target, &error);
    if (!canonical) {
        spdlog::warn("[FileDialog] Cannot navigate to {}: {}", path.string(), error.message);
        return false;
    }

    if (!history_.navigate_to(*canonical)) {
        return false; // Already the current directory
    }

    on_directory_changed();
    return true;
}

bool FileDialog::navigate_up() {
    if (!can_navigate_up()) {
        return false;
    }
    return navigate(history_.current()->parent_path());
}

bool FileDialog::back() {
    if (!require_open("back")) {
        return false;
    }
    if (!history_.back()) {
        return false;
    }
    on_directory_changed();
    return true;
}

bool FileDialog::forward() {
    if (!require_open("forward")) {
        return false;
    }
    if (!history_.forward()) {
        return false;
    }
    on_directory_changed();
    return true;
}

bool FileDialog::refresh() {
    if (!require_open("refresh")) {
        return false;
    }

    refresh_places();
    bool loaded = load_listing();
    create_directory_dialog_.revalidate();

    if (selected_item_ && !catalog_.contains(*selected_item_)) {
        spdlog::debug("[FileDialog] Selection {} no longer listed", selected_item_->string());
        selected_item_.reset();
    }

    return loaded;
}

// ============================================================================
// Selection
// ============================================================================

bool FileDialog::select(const std::filesystem::path& path) {
    if (!require_open("select")) {
        return false;
    }

    if (!catalog_.contains(path)) {
        spdlog::debug("[FileDialog] Cannot select {}: not in the current listing", path.string());
        return false;
    }

    selected_item_ = path;

    std::error_code ec;
    if (mode_ == DialogMode::SaveFile && std::filesystem::is_regular_file(path, ec)) {
        if (auto name = display_name(path)) {
            save_name_ = *name;
            revalidate_save_name();
        }
    }

    return true;
}

bool FileDialog::activate(const std::filesystem::path& path) {
    if (!require_open("activate")) {
        return false;
    }

    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return navigate(path);
    }

    if (!select(path)) {
        return false;
    }
    return confirm();
}

bool FileDialog::set_save_name(const std::string& text) {
    if (!require_open("set_save_name")) {
        return false;
    }
    if (mode_ != DialogMode::SaveFile) {
        spdlog::debug("[FileDialog] set_save_name ignored in {} mode", to_string(mode_));
        return false;
    }

    save_name_ = text;
    revalidate_save_name();
    return true;
}

// ============================================================================
// Create directory
// ============================================================================

bool FileDialog::open_create_directory() {
    if (!require_open("open_create_directory")) {
        return false;
    }
    if (create_directory_dialog_.is_open()) {
        return false;
    }

    auto current = history_.current();
    if (!current) {
        spdlog::debug("[FileDialog] Cannot create a directory: not in a directory");
        return false;
    }

    create_directory_dialog_.open(*current);
    return true;
}

bool FileDialog::set_create_directory_name(const std::string& text) {
    if (!require_open("set_create_directory_name")) {
        return false;
    }
    return create_directory_dialog_.set_input(text);
}

bool FileDialog::commit_create_directory() {
    if (!require_open("commit_create_directory")) {
        return false;
    }

    auto created = create_directory_dialog_.commit();
    if (!created) {
        return false;
    }

    create_directory_result(*created);
    return true;
}

void FileDialog::cancel_create_directory() {
    create_directory_dialog_.close();
}

void FileDialog::create_directory_result(const std::filesystem::path& path) {
    if (path.parent_path() != catalog_.directory()) {
        spdlog::warn("[FileDialog] Created directory {} is not in the listed directory",
                     path.string());
        return;
    }

    catalog_.insert(path);
    if (!select(path)) {
        spdlog::debug("[FileDialog] Created directory {} not selected", path.string());
    }
}

// ============================================================================
// Queries
// ============================================================================

bool FileDialog::is_current_directory(const std::filesystem::path& path) const {
    auto current = history_.current();
    return current && *current == path;
}

std::vector<PathSegment> FileDialog::path_segments() const {
    auto current = history_.current();
    if (!current) {
        return {};
    }
    return split_segments(*current);
}

std::vector<std::filesystem::path> FileDialog::directory_content(const std::string& filter) const {
    return catalog_.filtered(filter);
}

bool FileDialog::can_navigate_up() const {
    auto current = history_.current();
    return current && current->has_parent_path() && current->parent_path() != *current;
}

bool FileDialog::is_selection_valid() const {
    return validation::is_selection_valid(mode_, selected_item_, save_name_error_);
}

// ============================================================================
// Internals
// ============================================================================

bool FileDialog::require_open(const char* operation) const {
    if (state_.is_open()) {
        return true;
    }
    spdlog::debug("[FileDialog] {} ignored: dialog is {}", operation, to_string(state_.kind()));
    return false;
}

void FileDialog::reset() {
    state_ = DialogState::closed();

    history_.clear();
    catalog_.clear();
    create_directory_dialog_.close();

    selected_item_.reset();
    save_name_.clear();
    save_name_error_.reset();

    user_directories_ = UserDirectories{};
    disks_.clear();
}

void FileDialog::refresh_places() {
    user_directories_ = UserDirectories{};
    if (config_.show_user_directories && user_directories_provider_) {
        user_directories_ = user_directories_provider_->refresh();
    }

    disks_.clear();
    if (config_.show_system_disks && disks_provider_) {
        disks_ = disks_provider_->refresh();
    }
}

void FileDialog::on_directory_changed() {
    create_directory_dialog_.close();
    selected_item_.reset();
    load_listing();
}

bool FileDialog::load_listing() {
    bool loaded = false;

    auto current = history_.current();
    if (!current) {
        catalog_.clear();
    } else if (auto error = catalog_.load(*current)) {
        spdlog::warn("[FileDialog] Failed to list {}: {}", current->string(), error->message);
    } else {
        loaded = true;
    }

    revalidate_save_name();
    return loaded;
}

void FileDialog::revalidate_save_name() {
    if (mode_ != DialogMode::SaveFile) {
        return;
    }
    save_name_error_ = validation::validate_save_name(save_name_, history_.current());
}

} // namespace filedialog
