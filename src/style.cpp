#include "style.hpp"
#include "terminal.hpp"
#include "util.hpp"

namespace brewrecents {

Palette Palette::ansi() {
    Palette palette;
    palette.bold = Terminal::BOLD;
    palette.italic = Terminal::ITALIC;
    palette.accent = Terminal::GREEN;
    palette.dim = Terminal::DIM;
    palette.reset = Terminal::RESET;
    return palette;
}

Palette Palette::none() {
    return Palette();
}

StyledEntry style_entry(const std::string& name,
                        const MembershipSets& sets,
                        const StyleOptions& options) {
    StyledEntry entry;

    if (options.hide_inspected && sets.is_inspected(name)) {
        entry.suppressed = true;
        return entry;
    }

    std::string display = truncate_name(name, options.truncate_at);

    if (options.plain) {
        entry.text = display;
    } else {
        Palette palette = options.color ? Palette::ansi() : Palette::none();

        switch (sets.classify(name)) {
            case Classification::Installed:
                entry.text = palette.bold + palette.italic + palette.accent +
                             INSTALLED_INDICATOR + display + palette.reset;
                break;
            case Classification::Inspected:
                if (options.dim_inspected) {
                    entry.text = palette.dim + display + palette.reset;
                } else {
                    entry.text = display;
                }
                break;
            case Classification::Plain:
                entry.text = display;
                break;
        }
    }

    entry.visible_length = visible_length(entry.text);
    return entry;
}

} // namespace brewrecents
