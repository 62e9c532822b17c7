#pragma once

#include <string>

namespace brewrecents {

class Terminal {
public:
    Terminal();

    // Disable copy
    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    // Width used for the column layout: $COLUMNS, then the tty size,
    // then DEFAULT_WIDTH.
    int output_width() const;

    bool is_tty() const { return is_tty_; }

    static constexpr int DEFAULT_WIDTH = 80;

    // ANSI color codes
    static constexpr const char* RESET = "\033[0m";
    static constexpr const char* BOLD = "\033[1m";
    static constexpr const char* DIM = "\033[2m";
    static constexpr const char* ITALIC = "\033[3m";

    static constexpr const char* GREEN = "\033[32m";

private:
    void update_size();

    bool is_tty_ = false;
    int cols_ = 0;  // 0 when stdout is not a terminal
};

// Parse a positive integer, returns 0 on anything else
int parse_width(const char* value);

// $COLUMNS when it is a valid width, else tty_cols when known, else 80
int resolve_width(const char* columns_env, int tty_cols);

} // namespace brewrecents
