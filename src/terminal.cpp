#include "terminal.hpp"
#include <unistd.h>
#include <sys/ioctl.h>
#include <cstdlib>

namespace brewrecents {

Terminal::Terminal() {
    update_size();
}

int Terminal::output_width() const {
    return resolve_width(std::getenv("COLUMNS"), cols_);
}

void Terminal::update_size() {
    is_tty_ = isatty(STDOUT_FILENO) != 0;

    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        cols_ = ws.ws_col;
    } else {
        cols_ = 0;
    }
}

int resolve_width(const char* columns_env, int tty_cols) {
    int columns = parse_width(columns_env);
    if (columns > 0) {
        return columns;
    }
    if (tty_cols > 0) {
        return tty_cols;
    }
    return Terminal::DEFAULT_WIDTH;
}

int parse_width(const char* value) {
    if (value == nullptr || *value == '\0') {
        return 0;
    }

    char* end = nullptr;
    long parsed = std::strtol(value, &end, 10);
    if (*end != '\0' || parsed <= 0 || parsed > 100000) {
        return 0;
    }
    return static_cast<int>(parsed);
}

} // namespace brewrecents
