// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file path_utils.h
 * @brief Small path and text helpers shared by the dialog components
 */

#include "file_dialog_types.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace filedialog {

/**
 * @brief Check that @p text is well-formed UTF-8
 *
 * Rejects overlong encodings, surrogates and code points above U+10FFFF.
 */
bool is_valid_utf8(const std::string& text);

/**
 * @brief Get the file name of @p path as displayable text
 * @return File name, nullopt if the path has no file name or it is not UTF-8
 */
std::optional<std::string> display_name(const std::filesystem::path& path);

/**
 * @brief Case-insensitive substring match
 *
 * Both strings are decoded as UTF-8 and lower-cased per code point, so "ä"
 * matches "Ä". An empty needle matches everything.
 */
bool contains_ignore_case(const std::string& haystack, const std::string& needle);

/**
 * @brief Split an absolute path into breadcrumb segments
 *
 * "/home/user" yields {"/", "/"}, {"home", "/home"}, {"user", "/home/user"}.
 * Segments that are not valid UTF-8 are labelled "<ERR>".
 */
std::vector<PathSegment> split_segments(const std::filesystem::path& path);

} // namespace filedialog
