// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main.cpp
 * @brief file-dialog-cli entry point
 *
 * Drives a FileDialog session from stdin, one command per line (see
 * dialog_shell.h). Prints the selected path and exits 0 when the dialog is
 * confirmed, exits 1 when it is cancelled or input ends.
 *
 * Usage: file-dialog-cli [--mode file|dir|save] [--config PATH] [--dir PATH] [-v|-vv]
 */

#include "dialog_shell.h"
#include "file_dialog.h"
#include "file_dialog_config.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <string>

using namespace filedialog;

namespace {

struct CliOptions {
    DialogMode mode = DialogMode::SelectFile;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> directory;
    int verbosity = 0;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--mode file|dir|save] [--config PATH] [--dir PATH] [-v|-vv]\n";
}

std::optional<DialogMode> parse_mode(const std::string& value) {
    if (value == "file") {
        return DialogMode::SelectFile;
    }
    if (value == "dir") {
        return DialogMode::SelectDirectory;
    }
    if (value == "save") {
        return DialogMode::SaveFile;
    }
    return std::nullopt;
}

std::optional<CliOptions> parse_args(int argc, char** argv) {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--mode" && has_value) {
            auto mode = parse_mode(argv[++i]);
            if (!mode) {
                std::cerr << "Unknown mode: " << argv[i] << "\n";
                return std::nullopt;
            }
            options.mode = *mode;
        } else if (arg == "--config" && has_value) {
            options.config_path = argv[++i];
        } else if (arg == "--dir" && has_value) {
            options.directory = argv[++i];
        } else if (arg == "-v") {
            options.verbosity = 1;
        } else if (arg == "-vv") {
            options.verbosity = 2;
        } else {
            return std::nullopt;
        }
    }

    return options;
}

} // namespace

int main(int argc, char** argv) {
    auto options = parse_args(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return 2;
    }

    // Logs go to stderr so stdout carries only dialog output
    spdlog::set_default_logger(spdlog::stderr_color_mt("file-dialog"));

    FileDialogConfig config;
    if (options->config_path) {
        if (auto loaded = FileDialogConfig::load(*options->config_path)) {
            config = *loaded;
        }
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));
    if (options->verbosity == 1) {
        spdlog::set_level(spdlog::level::debug);
    } else if (options->verbosity >= 2) {
        spdlog::set_level(spdlog::level::trace);
    }

    FileDialog dialog(config);
    if (options->directory) {
        dialog.open(options->mode, *options->directory);
    } else {
        dialog.open(options->mode);
    }

    DialogShell shell(dialog);

    std::string line;
    while (dialog.state().is_open() && std::getline(std::cin, line)) {
        shell.execute(line, std::cout);
    }

    if (dialog.state().kind() == DialogState::Kind::Selected) {
        std::cout << dialog.state().path().string() << std::endl;
        return 0;
    }

    return 1;
}
