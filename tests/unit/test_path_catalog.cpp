// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_path_catalog.cpp
 * @brief Unit tests for directory loading and canonicalization
 */

#include "path_catalog.h"

#include "../test_temp_dir.h"

#include <algorithm>
#include <unistd.h>

#include <catch2/catch_test_macros.hpp>

using filedialog::IoError;
using filedialog::PathCatalog;

namespace {

bool listed(const std::vector<fs::path>& entries, const fs::path& path) {
    return std::find(entries.begin(), entries.end(), path) != entries.end();
}

} // namespace

TEST_CASE("PathCatalog - load lists files and directories", "[path_catalog]") {
    TempDirFixture tmp;
    auto docs = tmp.make_dir("docs");
    auto notes = tmp.make_file("notes.txt", "hello");
    tmp.make_file("docs/nested.txt");

    PathCatalog catalog;
    auto error = catalog.load(tmp.root());

    REQUIRE_FALSE(error.has_value());
    REQUIRE(catalog.entries().size() == 2);
    REQUIRE(listed(catalog.entries(), docs));
    REQUIRE(listed(catalog.entries(), notes));
    REQUIRE(catalog.directory() == tmp.root());
    REQUIRE(catalog.skipped_count() == 0);
}

TEST_CASE("PathCatalog - load canonicalizes relative segments", "[path_catalog]") {
    TempDirFixture tmp;
    tmp.make_dir("a/b");
    tmp.make_file("a/file.txt");

    PathCatalog catalog;
    REQUIRE_FALSE(catalog.load(tmp.root() / "a" / "b" / "..").has_value());

    REQUIRE(catalog.directory() == tmp.root() / "a");
    REQUIRE(listed(catalog.entries(), tmp.root() / "a" / "file.txt"));
}

TEST_CASE("PathCatalog - load resolves symlinks", "[path_catalog]") {
    TempDirFixture tmp;
    auto target = tmp.make_dir("target");
    tmp.make_file("target/inside.txt");
    fs::create_directory_symlink(target, tmp.root() / "link");

    PathCatalog catalog;
    REQUIRE_FALSE(catalog.load(tmp.root() / "link").has_value());

    REQUIRE(catalog.directory() == target);
    REQUIRE(listed(catalog.entries(), target / "inside.txt"));
}

TEST_CASE("PathCatalog - load fails on missing path", "[path_catalog]") {
    TempDirFixture tmp;
    tmp.make_file("keep.txt");

    PathCatalog catalog;
    REQUIRE_FALSE(catalog.load(tmp.root()).has_value());
    REQUIRE_FALSE(catalog.entries().empty());

    auto error = catalog.load(tmp.root() / "does_not_exist");

    REQUIRE(error.has_value());
    REQUIRE(error->code == std::errc::no_such_file_or_directory);
    REQUIRE(catalog.entries().empty());
    REQUIRE(catalog.directory().empty());
}

TEST_CASE("PathCatalog - load fails on a regular file", "[path_catalog]") {
    TempDirFixture tmp;
    auto file = tmp.make_file("plain.txt");

    PathCatalog catalog;
    auto error = catalog.load(file);

    REQUIRE(error.has_value());
    REQUIRE(error->code == std::errc::not_a_directory);
    REQUIRE(error->path == file);
}

TEST_CASE("PathCatalog - load fails without read permission", "[path_catalog]") {
    if (geteuid() == 0) {
        SKIP("root bypasses directory permissions");
    }

    TempDirFixture tmp;
    auto locked = tmp.make_dir("locked");
    fs::permissions(locked, fs::perms::none);

    PathCatalog catalog;
    auto error = catalog.load(locked);

    fs::permissions(locked, fs::perms::owner_all);

    REQUIRE(error.has_value());
    REQUIRE(error->code == std::errc::permission_denied);
}

TEST_CASE("PathCatalog - entries with non-UTF-8 names are skipped", "[path_catalog]") {
    TempDirFixture tmp;
    tmp.make_file("good.txt");

    // Invalid UTF-8 byte sequence; may be refused by some filesystems
    std::string bad_name = "bad\xff\xfe.txt";
    std::ofstream(tmp.root() / bad_name) << "x";
    if (!fs::exists(tmp.root() / bad_name)) {
        SKIP("filesystem rejects non-UTF-8 names");
    }

    PathCatalog catalog;
    REQUIRE_FALSE(catalog.load(tmp.root()).has_value());

    REQUIRE(catalog.entries().size() == 1);
    REQUIRE(catalog.entries()[0] == tmp.root() / "good.txt");
    REQUIRE(catalog.skipped_count() == 1);
}

TEST_CASE("PathCatalog - canonicalize", "[path_catalog]") {
    TempDirFixture tmp;
    auto dir = tmp.make_dir("dir");
    auto file = tmp.make_file("file.txt");

    SECTION("Directory resolves") {
        auto canonical = PathCatalog::canonicalize(tmp.root() / "dir" / "." / ".." / "dir");
        REQUIRE(canonical.has_value());
        REQUIRE(*canonical == dir);
    }

    SECTION("File is rejected") {
        IoError error;
        REQUIRE_FALSE(PathCatalog::canonicalize(file, &error).has_value());
        REQUIRE(error.code == std::errc::not_a_directory);
    }

    SECTION("Missing path is rejected") {
        IoError error;
        REQUIRE_FALSE(PathCatalog::canonicalize(tmp.root() / "missing", &error).has_value());
        REQUIRE(error.code == std::errc::no_such_file_or_directory);
        REQUIRE_FALSE(error.message.empty());
    }
}

TEST_CASE("PathCatalog - insert appends once", "[path_catalog]") {
    TempDirFixture tmp;
    tmp.make_file("a.txt");

    PathCatalog catalog;
    REQUIRE_FALSE(catalog.load(tmp.root()).has_value());

    auto created = tmp.make_dir("created");
    REQUIRE(catalog.insert(created));
    REQUIRE_FALSE(catalog.insert(created));

    REQUIRE(catalog.entries().size() == 2);
    REQUIRE(catalog.entries().back() == created);
    REQUIRE(catalog.contains(created));
}

TEST_CASE("PathCatalog - filtered matches names case-insensitively", "[path_catalog]") {
    TempDirFixture tmp;
    auto report = tmp.make_file("Report.PDF");
    auto summary = tmp.make_file("summary-report.txt");
    tmp.make_file("image.png");

    PathCatalog catalog;
    REQUIRE_FALSE(catalog.load(tmp.root()).has_value());

    SECTION("Empty query returns everything") {
        REQUIRE(catalog.filtered("").size() == 3);
    }

    SECTION("Substring match ignores case") {
        auto result = catalog.filtered("REPORT");
        REQUIRE(result.size() == 2);
        REQUIRE(listed(result, report));
        REQUIRE(listed(result, summary));
    }

    SECTION("Query only matches the entry name, not the parent path") {
        REQUIRE(catalog.filtered("filedialog_test").empty());
    }

    SECTION("No match") {
        REQUIRE(catalog.filtered("zzz").empty());
    }
}

TEST_CASE("PathCatalog - filtered folds non-ASCII case", "[path_catalog]") {
    TempDirFixture tmp;
    auto changes = tmp.make_file("\xC3\x84nderung.txt"); // "Änderung.txt"
    tmp.make_file("andere.txt");

    PathCatalog catalog;
    REQUIRE_FALSE(catalog.load(tmp.root()).has_value());

    auto lower = catalog.filtered("\xC3\xA4"); // "ä"
    REQUIRE(lower.size() == 1);
    REQUIRE(lower.front() == changes);

    auto upper = catalog.filtered("\xC3\x84NDER"); // "ÄNDER"
    REQUIRE(upper.size() == 1);
    REQUIRE(upper.front() == changes);
}
