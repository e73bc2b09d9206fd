// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file selection_validator.h
 * @brief Rules deciding whether a dialog selection can be confirmed
 *
 * Stateless. Re-run by FileDialog on every text change and every directory
 * load; results are never cached across navigation.
 */

#include "file_dialog_types.h"

#include <filesystem>
#include <optional>
#include <string>

namespace filedialog {
namespace validation {

/// Error messages reported by validate_save_name()
constexpr const char* SAVE_NAME_EMPTY = "The file name cannot be empty";
constexpr const char* SAVE_NAME_NO_DIRECTORY = "Currently not in a directory";
constexpr const char* SAVE_NAME_FILE_EXISTS = "A file with this name already exists";

/**
 * @brief Check whether the dialog may be confirmed
 *
 * - SelectDirectory: @p selected_item is an existing directory with a display name
 * - SelectFile: @p selected_item is an existing regular file with a display name
 * - SaveFile: @p save_name_error is empty (the selection is optional)
 */
bool is_selection_valid(DialogMode mode,
                        const std::optional<std::filesystem::path>& selected_item,
                        const std::optional<std::string>& save_name_error);

/**
 * @brief Validate the file name typed in SaveFile mode
 *
 * Only an existing regular file is rejected. A directory with the same name
 * is accepted here.
 *
 * @param input Typed file name
 * @param current_directory Directory the file would be saved into
 * @return Error message, nullopt if the name is acceptable
 */
std::optional<std::string>
validate_save_name(const std::string& input,
                   const std::optional<std::filesystem::path>& current_directory);

} // namespace validation
} // namespace filedialog
