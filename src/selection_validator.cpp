// SPDX-License-Identifier: GPL-3.0-or-later

#include "selection_validator.h"

#include "path_utils.h"

#include <system_error>

namespace filedialog {
namespace validation {

bool is_selection_valid(DialogMode mode,
                        const std::optional<std::filesystem::path>& selected_item,
                        const std::optional<std::string>& save_name_error) {
    if (mode == DialogMode::SaveFile) {
        return !save_name_error.has_value();
    }

    if (!selected_item) {
        return false;
    }

    std::error_code ec;
    const bool has_name = display_name(*selected_item).has_value();

    if (mode == DialogMode::SelectDirectory) {
        return std::filesystem::is_directory(*selected_item, ec) && has_name;
    }

    return std::filesystem::is_regular_file(*selected_item, ec) && has_name;
}

std::optional<std::string>
validate_save_name(const std::string& input,
                   const std::optional<std::filesystem::path>& current_directory) {
    if (input.empty()) {
        return std::string(SAVE_NAME_EMPTY);
    }

    if (!current_directory) {
        // Only reachable if the dialog lost its directory
        return std::string(SAVE_NAME_NO_DIRECTORY);
    }

    std::error_code ec;
    if (std::filesystem::is_regular_file(*current_directory / input, ec)) {
        return std::string(SAVE_NAME_FILE_EXISTS);
    }

    return std::nullopt;
}

} // namespace validation
} // namespace filedialog
