// SPDX-License-Identifier: GPL-3.0-or-later

#include "dialog_shell.h"

#include "path_utils.h"

#include <spdlog/spdlog.h>

#include <system_error>

namespace filedialog {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return {};
    }
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

void print_refused(std::ostream& out, const std::string& command) {
    out << command << ": not available\n";
}

} // namespace

std::filesystem::path DialogShell::resolve_entry(const std::string& argument) const {
    std::filesystem::path path(argument);
    auto current = dialog_.current_directory();
    if (path.is_relative() && current) {
        return *current / path;
    }
    return path;
}

bool DialogShell::execute(const std::string& line, std::ostream& out) {
    std::string trimmed = trim(line);
    if (trimmed.empty()) {
        return true;
    }

    std::string command = trimmed;
    std::string argument;
    auto space = trimmed.find_first_of(" \t");
    if (space != std::string::npos) {
        command = trimmed.substr(0, space);
        argument = trim(trimmed.substr(space + 1));
    }

    spdlog::trace("[DialogShell] {} '{}'", command, argument);

    bool ok = true;
    if (command == "ls") {
        print_listing(out, argument);
    } else if (command == "cd") {
        ok = dialog_.navigate(argument.empty() ? std::filesystem::path("/") : std::filesystem::path(argument));
    } else if (command == "up") {
        ok = dialog_.navigate_up();
    } else if (command == "back") {
        ok = dialog_.back();
    } else if (command == "forward") {
        ok = dialog_.forward();
    } else if (command == "refresh") {
        ok = dialog_.refresh();
    } else if (command == "select") {
        ok = dialog_.select(resolve_entry(argument));
    } else if (command == "open") {
        ok = dialog_.activate(resolve_entry(argument));
    } else if (command == "name") {
        ok = dialog_.set_save_name(argument);
        if (ok && dialog_.save_name_error()) {
            out << "name: " << *dialog_.save_name_error() << "\n";
        }
    } else if (command == "mkdir") {
        ok = dialog_.open_create_directory();
    } else if (command == "mkdir-name") {
        ok = dialog_.set_create_directory_name(argument);
        if (ok && dialog_.create_directory_error()) {
            out << "mkdir: " << *dialog_.create_directory_error() << "\n";
        }
    } else if (command == "mkdir-commit") {
        ok = dialog_.commit_create_directory();
        if (!ok && dialog_.create_directory_error()) {
            out << "mkdir: " << *dialog_.create_directory_error() << "\n";
        }
    } else if (command == "mkdir-cancel") {
        dialog_.cancel_create_directory();
    } else if (command == "places") {
        print_places(out);
    } else if (command == "status") {
        print_status(out);
    } else if (command == "confirm") {
        ok = dialog_.confirm();
    } else if (command == "cancel") {
        dialog_.cancel();
    } else if (command == "help") {
        print_help(out);
    } else {
        out << "unknown command: " << command << "\n";
        return false;
    }

    if (!ok) {
        print_refused(out, command);
    }
    return ok;
}

void DialogShell::print_status(std::ostream& out) const {
    out << "state: " << to_string(dialog_.state().kind());
    if (dialog_.state().kind() == DialogState::Kind::Selected) {
        out << " " << dialog_.state().path().string();
    }
    out << "\n";

    out << "mode: " << to_string(dialog_.mode()) << "\n";

    auto current = dialog_.current_directory();
    out << "directory: " << (current ? current->string() : std::string("<none>")) << "\n";
    out << "back: " << (dialog_.can_go_back() ? "yes" : "no")
        << "  forward: " << (dialog_.can_go_forward() ? "yes" : "no")
        << "  up: " << (dialog_.can_navigate_up() ? "yes" : "no") << "\n";

    const auto& selected = dialog_.selected_item();
    out << "selected: " << (selected ? selected->string() : std::string("<none>"))
        << (dialog_.is_selection_valid() ? " (valid)" : " (invalid)") << "\n";

    if (dialog_.mode() == DialogMode::SaveFile) {
        out << "name: " << dialog_.save_name();
        if (dialog_.save_name_error()) {
            out << " [" << *dialog_.save_name_error() << "]";
        }
        out << "\n";
    }

    if (dialog_.is_create_directory_open()) {
        out << "new directory: " << dialog_.create_directory_name();
        if (dialog_.create_directory_error()) {
            out << " [" << *dialog_.create_directory_error() << "]";
        }
        out << "\n";
    }
}

void DialogShell::print_listing(std::ostream& out, const std::string& filter) const {
    const auto& selected = dialog_.selected_item();

    for (const auto& entry : dialog_.directory_content(filter)) {
        std::error_code ec;
        bool is_dir = std::filesystem::is_directory(entry, ec);
        bool is_selected = selected && *selected == entry;

        out << (is_selected ? "* " : "  ") << (is_dir ? "[dir]  " : "[file] ")
            << display_name(entry).value_or("<ERR>") << "\n";
    }

    if (dialog_.skipped_entry_count() > 0) {
        out << "(" << dialog_.skipped_entry_count() << " entries not shown)\n";
    }
}

void DialogShell::print_places(std::ostream& out) const {
    const UserDirectories& dirs = dialog_.user_directories();

    auto print_dir = [&](const char* label, const std::optional<std::filesystem::path>& path) {
        if (!path) {
            return;
        }
        out << (dialog_.is_current_directory(*path) ? "* " : "  ") << label << ": "
            << path->string() << "\n";
    };

    print_dir("Home", dirs.home);
    print_dir("Desktop", dirs.desktop);
    print_dir("Documents", dirs.documents);
    print_dir("Downloads", dirs.downloads);
    print_dir("Audio", dirs.audio);
    print_dir("Pictures", dirs.pictures);
    print_dir("Videos", dirs.videos);

    for (const auto& disk : dialog_.disks()) {
        out << "  " << disk.name << ": " << disk.mount_point.string() << "\n";
    }
}

void DialogShell::print_help(std::ostream& out) {
    out << "ls [filter] | cd PATH | up | back | forward | refresh\n"
           "select PATH | open PATH | name TEXT\n"
           "mkdir | mkdir-name TEXT | mkdir-commit | mkdir-cancel\n"
           "places | status | confirm | cancel | help\n";
}

} // namespace filedialog
