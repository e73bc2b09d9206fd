// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file file_dialog_types.h
 * @brief Value types shared by the file dialog components
 */

#include <filesystem>
#include <string>
#include <system_error>

namespace filedialog {

/**
 * @brief What the dialog is asked to produce
 *
 * Fixed for the duration of one session (set by FileDialog::open).
 */
enum class DialogMode {
    SelectFile,      ///< Pick an existing regular file
    SelectDirectory, ///< Pick an existing directory
    SaveFile         ///< Type a (new) file name inside the current directory
};

/**
 * @brief Lifecycle state of a dialog session
 *
 * Selected and Cancelled are terminal. Only Selected carries a path.
 */
class DialogState {
  public:
    enum class Kind { Closed, Open, Selected, Cancelled };

    DialogState() = default;

    static DialogState closed() {
        return DialogState(Kind::Closed, {});
    }
    static DialogState open() {
        return DialogState(Kind::Open, {});
    }
    static DialogState selected(std::filesystem::path path) {
        return DialogState(Kind::Selected, std::move(path));
    }
    static DialogState cancelled() {
        return DialogState(Kind::Cancelled, {});
    }

    Kind kind() const {
        return kind_;
    }

    bool is_open() const {
        return kind_ == Kind::Open;
    }

    /// True for Selected and Cancelled
    bool is_terminal() const {
        return kind_ == Kind::Selected || kind_ == Kind::Cancelled;
    }

    /// Selected path, empty unless kind() == Kind::Selected
    const std::filesystem::path& path() const {
        return path_;
    }

    bool operator==(const DialogState& other) const {
        return kind_ == other.kind_ && path_ == other.path_;
    }
    bool operator!=(const DialogState& other) const {
        return !(*this == other);
    }

  private:
    DialogState(Kind kind, std::filesystem::path path) : kind_(kind), path_(std::move(path)) {}

    Kind kind_ = Kind::Closed;
    std::filesystem::path path_;
};

/**
 * @brief Filesystem read or create failure
 */
struct IoError {
    std::filesystem::path path; ///< Path the operation was applied to
    std::error_code code;       ///< Underlying OS error (may be empty for logical failures)
    std::string message;        ///< Human readable description
};

/**
 * @brief One breadcrumb element of the current directory
 */
struct PathSegment {
    std::string label;          ///< Display text ("/" for the root)
    std::filesystem::path path; ///< Cumulative path up to and including this segment
};

const char* to_string(DialogMode mode);
const char* to_string(DialogState::Kind kind);

} // namespace filedialog
