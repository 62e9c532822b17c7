#pragma once

#include "package.hpp"
#include <string>

namespace brewrecents {

// "Formula/a/abc.rb" -> "abc". Strips the prefix when present, then takes
// the basename and drops the extension.
std::string normalize_name(const std::string& raw,
                           const std::string& prefix,
                           const std::string& extension);

// Normalize raw git paths, skipping blank lines and paths outside the
// prefix or without the extension. Result is sorted and unique.
NameList normalize_names(const NameList& raw,
                         const std::string& prefix,
                         const std::string& extension);

// Remove SGR sequences (ESC [ <digits/;> m)
std::string strip_ansi(const std::string& text);

// Number of UTF-8 code points
int utf8_length(const std::string& text);

// Printable length of a styled string
int visible_length(const std::string& text);

// Cut to max_chars code points, the last one replaced by an ellipsis
std::string truncate_name(const std::string& name, int max_chars);

std::string trim(const std::string& str);

} // namespace brewrecents
