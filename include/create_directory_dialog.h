// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace filedialog {

/**
 * @brief Inline "new folder" sub-dialog
 *
 * Closed -> open(parent) -> Open{parent, input, error} -> commit/close -> Closed.
 *
 * The parent directory is fixed when the sub-dialog opens. The owning
 * FileDialog closes it whenever its current directory changes so the parent
 * never goes stale.
 */
class CreateDirectoryDialog {
  public:
    static constexpr const char* NAME_EMPTY = "Name of the folder can not be empty";
    static constexpr const char* NAME_INVALID = "Name of the folder must be a plain name";
    static constexpr const char* NAME_EXISTS = "A directory with the name already exists";
    static constexpr const char* NO_DIRECTORY = "No directory given";

    CreateDirectoryDialog() = default;

    /**
     * @brief Open for a new child of @p parent
     *
     * Clears the input and computes the initial error, so an untouched
     * sub-dialog already reports the empty-name error.
     */
    void open(const std::filesystem::path& parent);

    /// Discard input and return to the closed state
    void close();

    /**
     * @brief Replace the typed name and re-validate
     * @return false if the sub-dialog is closed
     */
    bool set_input(const std::string& text);

    /// Re-run validation of the current input after the parent's content changed
    void revalidate();

    /**
     * @brief Create parent/input
     *
     * Refused while an error is pending. On filesystem failure the error is
     * replaced with the system message and the sub-dialog stays open with the
     * input intact.
     *
     * @return Path of the created directory, nullopt if nothing was created
     */
    std::optional<std::filesystem::path> commit();

    /**
     * @brief Validation rules for a new directory name
     * @return Error message, nullopt if @p input can be created under @p parent
     */
    static std::optional<std::string> validate(const std::string& input,
                                               const std::optional<std::filesystem::path>& parent);

    bool is_open() const {
        return open_;
    }

    bool can_commit() const {
        return open_ && !error_.has_value();
    }

    const std::optional<std::filesystem::path>& parent() const {
        return parent_;
    }

    const std::string& input() const {
        return input_;
    }

    const std::optional<std::string>& error() const {
        return error_;
    }

  private:
    void reset();

    bool open_ = false;
    std::optional<std::filesystem::path> parent_;
    std::string input_;
    std::optional<std::string> error_;
};

} // namespace filedialog
