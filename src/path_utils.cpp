#include "path_utils.h"
#include <locale>
#include <stdexcept>
#include <vector>

namespace peerq {

namespace {

bool is_illegal_path_char(char c) {
    switch (c) {
        case '?':
        case ':':
        case '>':
        case '<':
        case '|':
        case '*':
        case '"':
            return true;
        default:
            return static_cast<unsigned char>(c) < 0x20;
    }
}

std::vector<std::string> split_virtual_path(const std::string& virtual_path) {
    std::vector<std::string> parts;
    std::string part;

    for (char c : virtual_path) {
        if (c == '\\' || c == '/') {
            parts.push_back(part);
            part.clear();
        } else {
            part += c;
        }
    }
    parts.push_back(part);

    return parts;
}

const std::locale& user_locale() {
    static const std::locale locale = []() {
        try {
            return std::locale("");
        } catch (const std::runtime_error&) {
            return std::locale::classic();
        }
    }();
    return locale;
}

} // namespace

std::string clean_file(const std::string& filename) {
    std::string result = filename;
    for (char& c : result) {
        if (is_illegal_path_char(c) || c == '\\' || c == '/') {
            c = '_';
        }
    }
    return result;
}

std::string clean_path(const std::string& path) {
    std::string result = path;
    for (char& c : result) {
        if (is_illegal_path_char(c)) {
            c = '_';
        }
    }
    return result;
}

std::string truncate_string_byte(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }

    size_t cut = max_bytes;
    // Step back over continuation bytes of a split character
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        cut--;
    }
    return text.substr(0, cut);
}

std::pair<std::string, std::string> split_extension(const std::string& basename) {
    size_t dot = basename.rfind('.');
    if (dot == std::string::npos) {
        return {basename, ""};
    }

    for (size_t i = 0; i < dot; ++i) {
        if (basename[i] != '.') {
            return {basename.substr(0, dot), basename.substr(dot)};
        }
    }
    return {basename, ""};
}

std::string virtual_path_basename(const std::string& virtual_path) {
    return split_virtual_path(virtual_path).back();
}

std::string virtual_path_parent_name(const std::string& virtual_path) {
    std::vector<std::string> parts = split_virtual_path(virtual_path);
    if (parts.size() < 2) {
        return "";
    }
    return parts[parts.size() - 2];
}

bool locale_less(const std::string& a, const std::string& b) {
    const auto& collate = std::use_facet<std::collate<char>>(user_locale());
    return collate.compare(a.data(), a.data() + a.size(), b.data(), b.data() + b.size()) < 0;
}

} // namespace peerq
