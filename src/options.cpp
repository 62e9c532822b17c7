#include "options.hpp"
#include <cstdlib>
#include <cstring>

namespace brewrecents {

namespace {

// Flags for one side of a two-way choice (formula/cask, new/updated)
struct Toggle {
    bool only = false;
    bool enable = false;
    bool disable = false;
};

bool resolve(const Toggle& self, const Toggle& other) {
    if (self.disable) return false;
    // An --only for the other side counts only if that side survives
    return self.only || self.enable || !(other.only && !other.disable);
}

bool parse_positive(const std::string& value, int& out) {
    if (value.empty()) return false;

    char* end = nullptr;
    long parsed = std::strtol(value.c_str(), &end, 10);
    if (*end != '\0' || parsed <= 0 || parsed > 1000000) {
        return false;
    }
    out = static_cast<int>(parsed);
    return true;
}

bool is_flag(const char* arg, const char* short_name, const char* long_name) {
    return (short_name != nullptr && strcmp(arg, short_name) == 0) ||
           strcmp(arg, long_name) == 0;
}

} // anonymous namespace

ParseResult parse_args(int argc, const char* const argv[]) {
    ParseResult result;
    Options& opts = result.options;

    Toggle formula, cask, added, updated;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // --name=value form
        std::string inline_value;
        bool has_inline_value = false;
        size_t eq = arg.find('=');
        if (arg.compare(0, 2, "--") == 0 && eq != std::string::npos) {
            inline_value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
            has_inline_value = true;
        }
        const char* flag = arg.c_str();

        // Options taking a value
        const bool wants_int = is_flag(flag, "-d", "--days") ||
                               is_flag(flag, "-t", "--truncate-chars") ||
                               is_flag(flag, nullptr, "--width");
        const bool wants_path = is_flag(flag, nullptr, "--history-file");

        if (wants_int || wants_path) {
            std::string value;
            if (has_inline_value) {
                value = inline_value;
            } else if (i + 1 < argc && strncmp(argv[i + 1], "--", 2) != 0) {
                value = argv[++i];
            } else {
                result.error = arg + " requires a value";
                return result;
            }

            if (wants_path) {
                if (value.empty()) {
                    result.error = arg + " requires a value";
                    return result;
                }
                opts.history_file = value;
                continue;
            }

            int number = 0;
            if (!parse_positive(value, number)) {
                result.error = "Invalid value for " + arg + ": '" + value +
                               "' (expected a positive integer)";
                return result;
            }

            if (is_flag(flag, "-d", "--days")) {
                opts.days = number;
            } else if (is_flag(flag, "-t", "--truncate-chars")) {
                opts.style.truncate_at = number;
            } else {
                opts.width = number;
            }
            continue;
        }

        if (has_inline_value) {
            result.error = "Option " + arg + " does not take a value";
            return result;
        }

        if (is_flag(flag, "-h", "--help")) {
            result.action = ParseResult::Action::Help;
            return result;
        } else if (is_flag(flag, "-v", "--version")) {
            result.action = ParseResult::Action::Version;
            return result;
        } else if (is_flag(flag, nullptr, "--only-formula")) {
            formula.only = true;
        } else if (is_flag(flag, nullptr, "--only-cask")) {
            cask.only = true;
        } else if (is_flag(flag, "-f", "--formula")) {
            formula.enable = true;
        } else if (is_flag(flag, "-F", "--no-formula")) {
            formula.disable = true;
        } else if (is_flag(flag, "-c", "--cask")) {
            cask.enable = true;
        } else if (is_flag(flag, "-C", "--no-cask")) {
            cask.disable = true;
        } else if (is_flag(flag, nullptr, "--only-new")) {
            added.only = true;
        } else if (is_flag(flag, nullptr, "--only-updated")) {
            updated.only = true;
        } else if (is_flag(flag, "-n", "--new")) {
            added.enable = true;
        } else if (is_flag(flag, "-N", "--no-new")) {
            added.disable = true;
        } else if (is_flag(flag, "-u", "--updated")) {
            updated.enable = true;
        } else if (is_flag(flag, "-U", "--no-updated")) {
            updated.disable = true;
        } else if (is_flag(flag, nullptr, "--dim-looked-up")) {
            opts.style.dim_inspected = true;
        } else if (is_flag(flag, nullptr, "--no-dim-looked-up")) {
            opts.style.dim_inspected = false;
        } else if (is_flag(flag, nullptr, "--hide-looked-up")) {
            opts.style.hide_inspected = true;
        } else if (is_flag(flag, nullptr, "--no-color")) {
            opts.style.color = false;
        } else if (is_flag(flag, nullptr, "--plain")) {
            opts.style.plain = true;
        } else if (is_flag(flag, nullptr, "--debug")) {
            opts.debug = true;
        } else {
            result.error = "Unknown argument: " + arg;
            return result;
        }
    }

    opts.show_formula = resolve(formula, cask);
    opts.show_cask = resolve(cask, formula);
    opts.show_new = resolve(added, updated);
    opts.show_updated = resolve(updated, added);

    return result;
}

} // namespace brewrecents
