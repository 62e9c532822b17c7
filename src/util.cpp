#include "util.hpp"
#include <algorithm>
#include <cctype>

namespace brewrecents {

namespace {

constexpr const char* ELLIPSIS = "\xe2\x80\xa6";  // U+2026

bool is_continuation_byte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

std::string normalize_name(const std::string& raw,
                           const std::string& prefix,
                           const std::string& extension) {
    std::string name = raw;

    if (!prefix.empty() && starts_with(name, prefix)) {
        name = name.substr(prefix.size());
    }

    size_t slash = name.rfind('/');
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }

    if (!extension.empty() && ends_with(name, extension)) {
        name.resize(name.size() - extension.size());
    }

    return name;
}

NameList normalize_names(const NameList& raw,
                         const std::string& prefix,
                         const std::string& extension) {
    NameList names;
    names.reserve(raw.size());

    for (const auto& line : raw) {
        std::string path = trim(line);
        if (path.empty()) continue;
        if (!prefix.empty() && !starts_with(path, prefix)) continue;
        if (!extension.empty() && !ends_with(path, extension)) continue;

        std::string name = normalize_name(path, prefix, extension);
        if (!name.empty()) {
            names.push_back(name);
        }
    }

    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    return names;
}

std::string strip_ansi(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '\033' && i + 1 < text.size() && text[i + 1] == '[') {
            size_t j = i + 2;
            while (j < text.size() &&
                   (std::isdigit(static_cast<unsigned char>(text[j])) || text[j] == ';')) {
                ++j;
            }
            if (j < text.size() && text[j] == 'm') {
                i = j + 1;
                continue;
            }
        }
        result += text[i];
        ++i;
    }

    return result;
}

int utf8_length(const std::string& text) {
    int count = 0;
    for (char c : text) {
        if (!is_continuation_byte(static_cast<unsigned char>(c))) {
            ++count;
        }
    }
    return count;
}

int visible_length(const std::string& text) {
    return utf8_length(strip_ansi(text));
}

std::string truncate_name(const std::string& name, int max_chars) {
    if (max_chars < 1) max_chars = 1;
    if (utf8_length(name) <= max_chars) {
        return name;
    }

    // Keep max_chars - 1 code points
    int kept = 0;
    size_t end = 0;
    while (end < name.size()) {
        if (!is_continuation_byte(static_cast<unsigned char>(name[end]))) {
            if (kept == max_chars - 1) break;
            ++kept;
        }
        ++end;
    }

    return name.substr(0, end) + ELLIPSIS;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }
    return str.substr(start, end - start);
}

} // namespace brewrecents
