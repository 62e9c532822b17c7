#pragma once

#include "style.hpp"
#include <string>

namespace brewrecents {

struct Options {
    int days = 7;

    bool show_formula = true;
    bool show_cask = true;
    bool show_new = true;
    bool show_updated = true;

    StyleOptions style;

    std::string history_file;   // empty: $HOME/.zsh_history
    int width = 0;              // 0: detect from the terminal
    bool debug = false;
};

struct ParseResult {
    enum class Action { Run, Help, Version };

    Action action = Action::Run;
    Options options;
    std::string error;  // Empty if no error

    bool has_error() const { return !error.empty(); }
};

// Catalog and category flags are resolved independently of their order:
// --no-X always disables X, --only-X flags are combined, a plain --X
// re-enables X after an --only flag for the other side, and an --only-Y
// that is itself cancelled by --no-Y does not hide X.
ParseResult parse_args(int argc, const char* const argv[]);

} // namespace brewrecents
