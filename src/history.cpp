#include "history.hpp"
#include <cstdlib>
#include <fstream>
#include <regex>

#include <spdlog/spdlog.h>

namespace brewrecents {

std::set<std::string> parse_inspected_packages(std::istream& history) {
    static const std::regex lookup(
        R"((?:^|[\s;&|(])(?:brew\s+info|bi)\s+(?:-\S+\s+)*([^\s;&|()'"`-][^\s;&|()'"`]*))");

    std::set<std::string> inspected;
    std::string line;

    while (std::getline(history, line)) {
        auto begin = std::sregex_iterator(line.begin(), line.end(), lookup);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            inspected.insert((*it)[1].str());
        }
    }

    return inspected;
}

std::set<std::string> load_inspected_packages(const std::string& history_path) {
    if (history_path.empty()) {
        return {};
    }

    std::ifstream file(history_path);
    if (!file) {
        spdlog::debug("No history at {}, nothing marked as looked up", history_path);
        return {};
    }

    auto inspected = parse_inspected_packages(file);
    spdlog::debug("Loaded {} looked-up packages from {}", inspected.size(), history_path);
    return inspected;
}

std::string default_history_path() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return "";
    }
    return std::string(home) + "/.zsh_history";
}

} // namespace brewrecents
