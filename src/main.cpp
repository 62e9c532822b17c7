#include "app.hpp"
#include "logging.hpp"
#include "options.hpp"
#include <cstdio>
#include <iostream>
#include <utility>

void print_help(const char* program_name) {
    printf("brew-recents - Recently added and updated Homebrew packages\n\n");
    printf("Usage: %s [OPTIONS]\n\n", program_name);
    printf("Options:\n");
    printf("  -d, --days N            Packages added/updated in the last N days (default: 7)\n");
    printf("  -t, --truncate-chars N  Truncate names longer than N characters (default: 25)\n");
    printf("      --only-formula      Show only formulae\n");
    printf("      --only-cask         Show only casks\n");
    printf("  -f, --formula / -F, --no-formula\n");
    printf("  -c, --cask    / -C, --no-cask\n");
    printf("      --only-new          Show only new packages\n");
    printf("      --only-updated      Show only updated packages\n");
    printf("  -n, --new     / -N, --no-new\n");
    printf("  -u, --updated / -U, --no-updated\n");
    printf("      --dim-looked-up     Dim packages you've already looked up (default: on)\n");
    printf("      --no-dim-looked-up  Do not dim packages you've already looked up\n");
    printf("      --hide-looked-up    Hide packages you've already looked up\n");
    printf("      --history-file PATH Shell history to scan for lookups (default: ~/.zsh_history)\n");
    printf("      --width N           Output width (default: $COLUMNS or terminal width)\n");
    printf("      --no-color          Disable colored output\n");
    printf("      --plain             Output without formatting\n");
    printf("      --debug             Print debug logs to stderr\n");
    printf("  -h, --help              Show this help message\n");
    printf("  -v, --version           Show version\n\n");
    printf("Installed packages are shown in bold green with a %s marker.\n",
           brewrecents::INSTALLED_INDICATOR);
    printf("Packages looked up with 'brew info' or 'bi' count as looked up.\n\n");
    printf("Examples:\n");
    printf("  %s --days 5 --only-cask\n", program_name);
    printf("  %s --hide-looked-up\n", program_name);
}

void print_version() {
    printf("brew-recents version 0.4.0\n");
}

int main(int argc, char* argv[]) {
    brewrecents::ParseResult parsed = brewrecents::parse_args(argc, argv);

    if (parsed.has_error()) {
        fprintf(stderr, "Error: %s\n", parsed.error.c_str());
        fprintf(stderr, "Run '%s --help' for usage.\n", argv[0]);
        return 1;
    }

    switch (parsed.action) {
        case brewrecents::ParseResult::Action::Help:
            print_help(argv[0]);
            return 0;
        case brewrecents::ParseResult::Action::Version:
            print_version();
            return 0;
        case brewrecents::ParseResult::Action::Run:
            break;
    }

    brewrecents::init_logging(parsed.options.debug);

    brewrecents::App app(std::move(parsed.options));

    if (!app.init()) {
        fprintf(stderr, "Error: %s\n", app.error().c_str());
        return 1;
    }

    return app.run(std::cout);
}
