// SPDX-License-Identifier: GPL-3.0-or-later

#include "navigation_history.h"

namespace filedialog {

bool NavigationHistory::navigate_to(const std::filesystem::path& path) {
    auto current_dir = current();
    if (current_dir && *current_dir == path) {
        return false; // Already there
    }

    if (offset_ > 0 && stack_.size() > offset_) {
        // Discard the forward branch
        stack_.erase(stack_.end() - static_cast<std::ptrdiff_t>(offset_), stack_.end());
    }

    stack_.push_back(path);
    offset_ = 0;
    return true;
}

bool NavigationHistory::back() {
    if (!can_go_back()) {
        return false;
    }
    ++offset_;
    return true;
}

bool NavigationHistory::forward() {
    if (!can_go_forward()) {
        return false;
    }
    --offset_;
    return true;
}

std::optional<std::filesystem::path> NavigationHistory::current() const {
    if (stack_.empty()) {
        return std::nullopt;
    }
    return stack_[stack_.size() - 1 - offset_];
}

void NavigationHistory::clear() {
    stack_.clear();
    offset_ = 0;
}

} // namespace filedialog
