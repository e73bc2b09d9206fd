// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file file_dialog.h
 * @brief Headless file dialog controller
 *
 * Owns one dialog session: navigation history, directory listing, selection,
 * save-name input and the inline create-directory sub-dialog. A presentation
 * layer reads the query methods every frame and forwards user intents to the
 * command methods.
 *
 * All operations are synchronous and run to completion; the filesystem is
 * accessed on the calling thread. The class is not thread-safe.
 *
 * Usage:
 * @code
 *   filedialog::FileDialog dialog(config);
 *   dialog.open(filedialog::DialogMode::SelectFile);
 *
 *   // per frame
 *   for (const auto& entry : dialog.directory_content(search_text)) { ... }
 *   if (clicked) dialog.select(entry);
 *
 *   if (dialog.state().kind() == filedialog::DialogState::Kind::Selected) {
 *       use(dialog.state().path());
 *   }
 * @endcode
 */

#include "create_directory_dialog.h"
#include "file_dialog_config.h"
#include "file_dialog_types.h"
#include "navigation_history.h"
#include "path_catalog.h"
#include "system_disks.h"
#include "user_directories.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace filedialog {

class FileDialog {
  public:
    /// Uses the XDG user directory and /proc/mounts providers
    explicit FileDialog(FileDialogConfig config = {});

    /**
     * @brief Construct with explicit place providers
     *
     * A null provider behaves like a provider that reports nothing.
     */
    FileDialog(FileDialogConfig config, std::unique_ptr<UserDirectoriesProvider> user_directories,
               std::unique_ptr<DisksProvider> disks);

    ~FileDialog();

    FileDialog(const FileDialog&) = delete;
    FileDialog& operator=(const FileDialog&) = delete;

    // ========================================================================
    // Session
    // ========================================================================

    /// Directory used by open() when no directory is passed
    void set_initial_directory(const std::filesystem::path& directory);

    const std::filesystem::path& initial_directory() const {
        return initial_directory_;
    }

    /**
     * @brief Start a new session
     *
     * Resets all session state, refreshes the place providers and loads the
     * initial directory. A directory that cannot be loaded leaves the listing
     * empty; the dialog still opens.
     */
    void open(DialogMode mode);
    void open(DialogMode mode, const std::filesystem::path& initial_directory);

    void select_file() {
        open(DialogMode::SelectFile);
    }
    void select_directory() {
        open(DialogMode::SelectDirectory);
    }
    void save_file() {
        open(DialogMode::SaveFile);
    }

    /**
     * @brief Finish the session with the current selection
     *
     * Refused unless is_selection_valid(). SaveFile mode produces
     * current_directory / save_name().
     *
     * @return true if the state became Selected
     */
    bool confirm();

    /// Finish the session without a result
    void cancel();

    // ========================================================================
    // Navigation
    // ========================================================================

    /**
     * @brief Visit a directory
     *
     * Relative paths are resolved against the current directory. Visiting
     * the current directory again does nothing (use refresh()).
     *
     * @return true if the current directory changed
     */
    bool navigate(const std::filesystem::path& path);

    /// Visit the parent of the current directory
    bool navigate_up();

    bool back();
    bool forward();

    /**
     * @brief Reload the current directory and the place providers
     *
     * History is untouched and an open create-directory sub-dialog stays
     * open. The selection is kept only if it is still listed.
     *
     * @return false if the listing could not be loaded
     */
    bool refresh();

    // ========================================================================
    // Selection
    // ========================================================================

    /**
     * @brief Select an entry of the current listing
     *
     * In SaveFile mode selecting an existing file copies its name into the
     * save-name input.
     *
     * @return false if @p path is not in the listing
     */
    bool select(const std::filesystem::path& path);

    /**
     * @brief Open an entry (double click)
     *
     * Directories are navigated into. Other entries are selected and the
     * dialog is confirmed if the selection is valid.
     */
    bool activate(const std::filesystem::path& path);

    /**
     * @brief Update the typed file name (SaveFile mode)
     * @return false outside SaveFile mode
     */
    bool set_save_name(const std::string& text);

    // ========================================================================
    // Create directory
    // ========================================================================

    /// Open the sub-dialog for the current directory
    bool open_create_directory();
    bool set_create_directory_name(const std::string& text);

    /**
     * @brief Create the directory typed into the sub-dialog
     *
     * On success the new directory is added to the listing and selected.
     */
    bool commit_create_directory();
    void cancel_create_directory();

    /**
     * @brief Add a directory created by the sub-dialog to the listing
     *
     * Inserts @p path into the listing and selects it.
     */
    void create_directory_result(const std::filesystem::path& path);

    // ========================================================================
    // Queries
    // ========================================================================

    const DialogState& state() const {
        return state_;
    }

    DialogMode mode() const {
        return mode_;
    }

    std::optional<std::filesystem::path> current_directory() const {
        return history_.current();
    }

    bool is_current_directory(const std::filesystem::path& path) const;

    /// Breadcrumb segments of the current directory
    std::vector<PathSegment> path_segments() const;

    /**
     * @brief Listing of the current directory
     * @param filter Case-insensitive substring matched against entry names
     */
    std::vector<std::filesystem::path> directory_content(const std::string& filter = "") const;

    /// Entries dropped from the last listing (unreadable or non-UTF-8 names)
    std::size_t skipped_entry_count() const {
        return catalog_.skipped_count();
    }

    const NavigationHistory& history() const {
        return history_;
    }

    bool can_go_back() const {
        return history_.can_go_back();
    }

    bool can_go_forward() const {
        return history_.can_go_forward();
    }

    bool can_navigate_up() const;

    const std::optional<std::filesystem::path>& selected_item() const {
        return selected_item_;
    }

    bool is_selection_valid() const;

    const std::string& save_name() const {
        return save_name_;
    }

    const std::optional<std::string>& save_name_error() const {
        return save_name_error_;
    }

    bool is_create_directory_open() const {
        return create_directory_dialog_.is_open();
    }

    const std::string& create_directory_name() const {
        return create_directory_dialog_.input();
    }

    const std::optional<std::string>& create_directory_error() const {
        return create_directory_dialog_.error();
    }

    const UserDirectories& user_directories() const {
        return user_directories_;
    }

    const std::vector<Disk>& disks() const {
        return disks_;
    }

    const FileDialogConfig& config() const {
        return config_;
    }

  private:
    bool require_open(const char* operation) const;
    void reset();
    void refresh_places();

    /// Current directory changed: drop state that referred to the old one
    void on_directory_changed();

    bool load_listing();
    void revalidate_save_name();

    FileDialogConfig config_;
    std::filesystem::path initial_directory_;

    std::unique_ptr<UserDirectoriesProvider> user_directories_provider_;
    std::unique_ptr<DisksProvider> disks_provider_;
    UserDirectories user_directories_;
    std::vector<Disk> disks_;

    DialogMode mode_ = DialogMode::SelectDirectory;
    DialogState state_;

    NavigationHistory history_;
    PathCatalog catalog_;
    CreateDirectoryDialog create_directory_dialog_;

    std::optional<std::filesystem::path> selected_item_;
    std::string save_name_; ///< Only used in SaveFile mode
    std::optional<std::string> save_name_error_;
};

} // namespace filedialog
