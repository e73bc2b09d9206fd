// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file path_catalog.h
 * @brief Directory listing snapshot for the file dialog
 *
 * Holds the immediate children of one directory, loaded wholesale from the
 * filesystem. The listing is never updated incrementally except through
 * insert(), which the dialog uses for directories it created itself.
 *
 * Entries are kept in the order the filesystem enumerates them. Callers
 * must not rely on any particular ordering.
 */

#include "file_dialog_types.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace filedialog {

class PathCatalog {
  public:
    PathCatalog() = default;

    /**
     * @brief Resolve a path to its canonical absolute directory form
     *
     * Resolves symlinks and relative segments.
     *
     * @param path Path to resolve
     * @param[out] error Set when the path is missing or not a directory
     * @return Canonical path, nullopt on failure
     */
    static std::optional<std::filesystem::path> canonicalize(const std::filesystem::path& path,
                                                             IoError* error = nullptr);

    /**
     * @brief Replace the listing with the children of @p path
     *
     * On failure the listing is left empty and directory() is cleared.
     * Entries whose name is not valid UTF-8 are dropped and counted in
     * skipped_count().
     *
     * @param path Directory to enumerate
     * @return nullopt on success, the error otherwise
     */
    std::optional<IoError> load(const std::filesystem::path& path);

    /**
     * @brief Append an entry that was created after the last load
     * @return false if the entry is already listed
     */
    bool insert(const std::filesystem::path& path);

    bool contains(const std::filesystem::path& path) const;

    /**
     * @brief Entries whose display name contains @p query (case-insensitive)
     *
     * An empty query returns every entry.
     */
    std::vector<std::filesystem::path> filtered(const std::string& query) const;

    const std::vector<std::filesystem::path>& entries() const {
        return entries_;
    }

    /// Canonical directory of the last successful load (empty if none)
    const std::filesystem::path& directory() const {
        return directory_;
    }

    /// Entries dropped by the last load (unreadable or non-UTF-8 names)
    std::size_t skipped_count() const {
        return skipped_count_;
    }

    void clear();

  private:
    std::filesystem::path directory_;
    std::vector<std::filesystem::path> entries_;
    std::size_t skipped_count_ = 0;
};

} // namespace filedialog
