// SPDX-License-Identifier: GPL-3.0-or-later

#include "path_utils.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cwchar>
#include <cwctype>

namespace filedialog {

bool is_valid_utf8(const std::string& text) {
    size_t i = 0;
    const size_t n = text.size();

    while (i < n) {
        const auto c = static_cast<unsigned char>(text[i]);
        size_t len = 0;
        uint32_t cp = 0;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (i + len > n) {
            return false;
        }

        for (size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, UTF-16 surrogates, out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }

        i += len;
    }

    return true;
}

std::optional<std::string> display_name(const std::filesystem::path& path) {
    std::string name = path.filename().string();
    if (name.empty() || !is_valid_utf8(name)) {
        return std::nullopt;
    }
    return name;
}

namespace {

// Bytes that do not start a well-formed sequence map to U+DC80..U+DCFF
constexpr char32_t RAW_BYTE_BASE = 0xDC00;

std::u32string decode_utf8(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());

    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        const auto c = static_cast<unsigned char>(text[i]);
        size_t len = 1;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
        }

        if (len > 1 && i + len <= n && is_valid_utf8(text.substr(i, len))) {
            uint32_t cp = c & (0x7F >> len);
            for (size_t k = 1; k < len; ++k) {
                cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
            }
            out.push_back(static_cast<char32_t>(cp));
            i += len;
        } else {
            out.push_back(c < 0x80 ? static_cast<char32_t>(c) : RAW_BYTE_BASE + c);
            ++i;
        }
    }

    return out;
}

char32_t fold_case(char32_t cp) {
    if (cp < 0x80) {
        return static_cast<char32_t>(std::tolower(static_cast<int>(cp)));
    }

    // Latin-1 Supplement
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) {
        return cp + 0x20;
    }

    // Latin Extended-A: pairs of upper/lower case letters
    if ((cp >= 0x100 && cp <= 0x12F) || (cp >= 0x132 && cp <= 0x137) ||
        (cp >= 0x14A && cp <= 0x177)) {
        return cp | 1;
    }
    if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E)) {
        return (cp & 1) ? cp + 1 : cp;
    }
    if (cp == 0x178) {
        return 0xFF;
    }

    // Greek
    if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2) {
        return cp + 0x20;
    }

    // Cyrillic
    if (cp >= 0x400 && cp <= 0x40F) {
        return cp + 0x50;
    }
    if (cp >= 0x410 && cp <= 0x42F) {
        return cp + 0x20;
    }

    if (cp <= static_cast<char32_t>(WCHAR_MAX)) {
        return static_cast<char32_t>(std::towlower(static_cast<wint_t>(cp)));
    }
    return cp;
}

std::u32string fold_utf8(const std::string& text) {
    std::u32string folded = decode_utf8(text);
    std::transform(folded.begin(), folded.end(), folded.begin(), fold_case);
    return folded;
}

} // namespace

bool contains_ignore_case(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) {
        return true;
    }
    return fold_utf8(haystack).find(fold_utf8(needle)) != std::u32string::npos;
}

std::vector<PathSegment> split_segments(const std::filesystem::path& path) {
    std::vector<PathSegment> segments;
    std::filesystem::path cumulative;

    for (const auto& part : path) {
        cumulative /= part;

        std::string label = part.string();
        if (label.empty()) {
            continue; // Trailing separator
        }
        if (!is_valid_utf8(label)) {
            label = "<ERR>";
        }
        segments.push_back({label, cumulative});
    }

    return segments;
}

} // namespace filedialog
