// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

namespace filedialog {

/**
 * @brief Browser-style history of visited directories
 *
 * Stores canonical directory paths in visit order plus an offset counting
 * back from the most recent entry. The current directory is
 * entries()[size() - 1 - offset()].
 *
 * Visiting a new directory while stepped back discards the forward branch.
 */
class NavigationHistory {
  public:
    NavigationHistory() = default;

    /**
     * @brief Visit a directory
     *
     * No-op if @p path is already the current directory. Otherwise drops
     * forward entries, pushes @p path and resets the offset to 0.
     *
     * @param path Canonical directory path
     * @return true if the history changed
     */
    bool navigate_to(const std::filesystem::path& path);

    /**
     * @brief Step one entry back
     * @return false if already at the oldest entry
     */
    bool back();

    /**
     * @brief Step one entry forward
     * @return false if already at the most recent entry
     */
    bool forward();

    bool can_go_back() const {
        return offset_ + 1 < stack_.size();
    }

    bool can_go_forward() const {
        return offset_ > 0;
    }

    /**
     * @brief Get the current directory
     * @return Current directory, nullopt if nothing has been visited
     */
    std::optional<std::filesystem::path> current() const;

    const std::vector<std::filesystem::path>& entries() const {
        return stack_;
    }

    std::size_t size() const {
        return stack_.size();
    }

    std::size_t offset() const {
        return offset_;
    }

    bool empty() const {
        return stack_.empty();
    }

    void clear();

  private:
    std::vector<std::filesystem::path> stack_;
    std::size_t offset_ = 0;
};

} // namespace filedialog
