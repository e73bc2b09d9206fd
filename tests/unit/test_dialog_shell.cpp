// SPDX-License-Identifier: GPL-3.0-or-later

#include "dialog_shell.h"
#include "places_provider_mock.h"

#include "../test_temp_dir.h"

#include <sstream>

#include <catch2/catch_test_macros.hpp>

using namespace filedialog;

namespace {

std::unique_ptr<FileDialog> make_dialog(const TempDirFixture& tmp) {
    FileDialogConfig config;
    config.initial_directory = tmp.root();

    UserDirectories dirs;
    dirs.home = tmp.root();
    return std::make_unique<FileDialog>(
        config, std::make_unique<MockUserDirectoriesProvider>(dirs),
        std::make_unique<MockDisksProvider>(std::vector<Disk>{{"/dev/sda1", "/"}}));
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("DialogShell - browse and select a file", "[dialog_shell]") {
    TempDirFixture tmp;
    tmp.make_dir("docs");
    tmp.make_file("docs/readme.md");
    auto dialog = make_dialog(tmp);
    dialog->open(DialogMode::SelectFile);
    DialogShell shell(*dialog);
    std::ostringstream out;

    REQUIRE(shell.execute("ls", out));
    REQUIRE(contains(out.str(), "[dir]  docs"));

    REQUIRE(shell.execute("cd docs", out));
    REQUIRE(dialog->current_directory() == tmp.root() / "docs");

    REQUIRE(shell.execute("select readme.md", out));
    REQUIRE(shell.execute("confirm", out));
    REQUIRE(dialog->state() == DialogState::selected(tmp.root() / "docs" / "readme.md"));
}

TEST_CASE("DialogShell - save with a new directory", "[dialog_shell]") {
    TempDirFixture tmp;
    auto dialog = make_dialog(tmp);
    dialog->open(DialogMode::SaveFile);
    DialogShell shell(*dialog);
    std::ostringstream out;

    REQUIRE(shell.execute("mkdir", out));
    REQUIRE(shell.execute("mkdir-name exports", out));
    REQUIRE(shell.execute("mkdir-commit", out));
    REQUIRE(shell.execute("open exports", out));
    REQUIRE(shell.execute("name data.csv", out));
    REQUIRE(shell.execute("confirm", out));

    REQUIRE(dialog->state().path() == tmp.root() / "exports" / "data.csv");
}

TEST_CASE("DialogShell - refused and unknown commands", "[dialog_shell]") {
    TempDirFixture tmp;
    auto dialog = make_dialog(tmp);
    dialog->open(DialogMode::SelectDirectory);
    DialogShell shell(*dialog);
    std::ostringstream out;

    REQUIRE_FALSE(shell.execute("back", out));
    REQUIRE(contains(out.str(), "back: not available"));

    REQUIRE_FALSE(shell.execute("frobnicate", out));
    REQUIRE(contains(out.str(), "unknown command: frobnicate"));

    REQUIRE(shell.execute("   ", out));
}

TEST_CASE("DialogShell - status and places", "[dialog_shell]") {
    TempDirFixture tmp;
    auto dialog = make_dialog(tmp);
    dialog->open(DialogMode::SaveFile);
    DialogShell shell(*dialog);
    std::ostringstream out;

    shell.execute("status", out);
    REQUIRE(contains(out.str(), "state: Open"));
    REQUIRE(contains(out.str(), "mode: SaveFile"));
    REQUIRE(contains(out.str(), "The file name cannot be empty"));

    out.str("");
    shell.execute("places", out);
    REQUIRE(contains(out.str(), "* Home: " + tmp.root().string()));
    REQUIRE(contains(out.str(), "/dev/sda1: /"));
}

TEST_CASE("DialogShell - cancel ends the session", "[dialog_shell]") {
    TempDirFixture tmp;
    auto dialog = make_dialog(tmp);
    dialog->open(DialogMode::SelectFile);
    DialogShell shell(*dialog);
    std::ostringstream out;

    REQUIRE(shell.execute("cancel", out));
    REQUIRE(dialog->state().kind() == DialogState::Kind::Cancelled);
    REQUIRE_FALSE(shell.execute("cd /", out));
}
