// SPDX-License-Identifier: GPL-3.0-or-later

#include "file_dialog_types.h"

namespace filedialog {

const char* to_string(DialogMode mode) {
    switch (mode) {
    case DialogMode::SelectFile:
        return "SelectFile";
    case DialogMode::SelectDirectory:
        return "SelectDirectory";
    case DialogMode::SaveFile:
        return "SaveFile";
    }
    return "Unknown";
}

const char* to_string(DialogState::Kind kind) {
    switch (kind) {
    case DialogState::Kind::Closed:
        return "Closed";
    case DialogState::Kind::Open:
        return "Open";
    case DialogState::Kind::Selected:
        return "Selected";
    case DialogState::Kind::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

} // namespace filedialog
