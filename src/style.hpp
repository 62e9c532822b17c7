#pragma once

#include "package.hpp"
#include <string>

namespace brewrecents {

struct StyleOptions {
    bool dim_inspected = true;
    bool hide_inspected = false;
    bool plain = false;     // no styling and no installed glyph
    bool color = true;      // false keeps the glyph, drops escape codes
    int truncate_at = 25;
};

// Escape sequences used for entries. All empty when color is off.
struct Palette {
    std::string bold;
    std::string italic;
    std::string accent;
    std::string dim;
    std::string reset;

    static Palette ansi();
    static Palette none();
};

constexpr const char* INSTALLED_INDICATOR = "\xe2\x80\xa2";  // U+2022

// Hidden-if-inspected is decided before installed highlighting, so an
// installed package that was looked up is still dropped with
// hide_inspected.
StyledEntry style_entry(const std::string& name,
                        const MembershipSets& sets,
                        const StyleOptions& options);

} // namespace brewrecents
