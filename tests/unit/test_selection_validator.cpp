// SPDX-License-Identifier: GPL-3.0-or-later

#include "selection_validator.h"

#include "../test_temp_dir.h"

#include <catch2/catch_test_macros.hpp>

using filedialog::DialogMode;
using namespace filedialog::validation;

// ============================================================================
// is_selection_valid
// ============================================================================

TEST_CASE("Selection validation - nothing selected", "[selection_validator]") {
    SECTION("SelectFile is invalid") {
        REQUIRE_FALSE(is_selection_valid(DialogMode::SelectFile, std::nullopt, std::nullopt));
    }

    SECTION("SelectDirectory is invalid") {
        REQUIRE_FALSE(is_selection_valid(DialogMode::SelectDirectory, std::nullopt, std::nullopt));
    }

    SECTION("SaveFile is valid without a name error") {
        REQUIRE(is_selection_valid(DialogMode::SaveFile, std::nullopt, std::nullopt));
    }

    SECTION("SaveFile is invalid with a name error") {
        REQUIRE_FALSE(is_selection_valid(DialogMode::SaveFile, std::nullopt,
                                         std::string(SAVE_NAME_EMPTY)));
    }
}

TEST_CASE("Selection validation - selection kind must match mode", "[selection_validator]") {
    TempDirFixture tmp;
    auto dir = tmp.make_dir("folder");
    auto file = tmp.make_file("file.txt");

    SECTION("SelectDirectory accepts a directory") {
        REQUIRE(is_selection_valid(DialogMode::SelectDirectory, dir, std::nullopt));
    }

    SECTION("SelectDirectory rejects a file") {
        REQUIRE_FALSE(is_selection_valid(DialogMode::SelectDirectory, file, std::nullopt));
    }

    SECTION("SelectFile accepts a regular file") {
        REQUIRE(is_selection_valid(DialogMode::SelectFile, file, std::nullopt));
    }

    SECTION("SelectFile rejects a directory") {
        REQUIRE_FALSE(is_selection_valid(DialogMode::SelectFile, dir, std::nullopt));
    }

    SECTION("Deleted selection is invalid") {
        fs::remove(file);
        REQUIRE_FALSE(is_selection_valid(DialogMode::SelectFile, file, std::nullopt));
    }

    SECTION("SaveFile ignores the selection and uses the name error") {
        REQUIRE(is_selection_valid(DialogMode::SaveFile, dir, std::nullopt));
        REQUIRE_FALSE(
            is_selection_valid(DialogMode::SaveFile, file, std::string(SAVE_NAME_FILE_EXISTS)));
    }
}

// ============================================================================
// validate_save_name
// ============================================================================

TEST_CASE("Save name validation", "[selection_validator]") {
    TempDirFixture tmp;
    tmp.make_file("existing.txt");
    tmp.make_dir("existing_dir");

    SECTION("Empty name is an error") {
        auto error = validate_save_name("", tmp.root());
        REQUIRE(error.has_value());
        REQUIRE(*error == SAVE_NAME_EMPTY);
    }

    SECTION("Empty name is an error even without a directory") {
        REQUIRE(validate_save_name("", std::nullopt) == std::string(SAVE_NAME_EMPTY));
    }

    SECTION("No current directory is an error") {
        REQUIRE(validate_save_name("out.txt", std::nullopt) ==
                std::string(SAVE_NAME_NO_DIRECTORY));
    }

    SECTION("Existing regular file is an error") {
        REQUIRE(validate_save_name("existing.txt", tmp.root()) ==
                std::string(SAVE_NAME_FILE_EXISTS));
    }

    SECTION("Existing directory with the same name is accepted") {
        REQUIRE_FALSE(validate_save_name("existing_dir", tmp.root()).has_value());
    }

    SECTION("New name is accepted") {
        REQUIRE_FALSE(validate_save_name("out.txt", tmp.root()).has_value());
    }
}
