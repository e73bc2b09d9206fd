// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file dialog_shell.h
 * @brief Line-oriented driver for FileDialog
 *
 * Stands in for a GUI: each input line is one user intent. Used by the
 * file-dialog-cli executable.
 *
 * Commands:
 *   ls [filter]         list the current directory
 *   cd PATH             navigate (relative to the current directory)
 *   up | back | forward | refresh
 *   select PATH         select an entry (name or path)
 *   open PATH           activate an entry (enter directory / select and confirm)
 *   name TEXT           set the save file name
 *   mkdir               open the create-directory sub-dialog
 *   mkdir-name TEXT     set the new directory name
 *   mkdir-commit | mkdir-cancel
 *   places              list user directories and disks
 *   status              print dialog state
 *   confirm | cancel
 *   help
 */

#include "file_dialog.h"

#include <filesystem>
#include <ostream>
#include <string>

namespace filedialog {

class DialogShell {
  public:
    explicit DialogShell(FileDialog& dialog) : dialog_(dialog) {}

    /**
     * @brief Run one command line
     * @param line Command and argument, e.g. "cd /tmp"
     * @param out Receives listings and messages
     * @return false if the command was unknown or refused
     */
    bool execute(const std::string& line, std::ostream& out);

    void print_status(std::ostream& out) const;
    void print_listing(std::ostream& out, const std::string& filter) const;
    void print_places(std::ostream& out) const;
    static void print_help(std::ostream& out);

  private:
    /// Entry names are resolved against the current directory
    std::filesystem::path resolve_entry(const std::string& argument) const;

    FileDialog& dialog_;
};

} // namespace filedialog
