// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file test_temp_dir.h
 * @brief Scratch directory fixture shared by the filesystem tests
 */

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

/**
 * @brief Creates a unique directory under the system temp dir and removes it
 * (with everything inside) on destruction.
 *
 * root() is canonical, so it compares equal to paths produced by the dialog.
 */
class TempDirFixture {
  public:
    TempDirFixture() {
        static std::atomic<int> counter{0};
        fs::path dir = fs::temp_directory_path() /
                       ("filedialog_test_" +
                        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                        "_" + std::to_string(counter++));
        fs::create_directories(dir);
        root_ = fs::canonical(dir);
    }

    ~TempDirFixture() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    TempDirFixture(const TempDirFixture&) = delete;
    TempDirFixture& operator=(const TempDirFixture&) = delete;

    [[nodiscard]] const fs::path& root() const {
        return root_;
    }

    fs::path make_dir(const std::string& relative) const {
        fs::path path = root_ / relative;
        fs::create_directories(path);
        return path;
    }

    fs::path make_file(const std::string& relative, const std::string& content = "") const {
        fs::path path = root_ / relative;
        fs::create_directories(path.parent_path());
        std::ofstream file(path);
        file << content;
        return path;
    }

  private:
    fs::path root_;
};
