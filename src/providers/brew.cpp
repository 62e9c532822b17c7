#include "providers/brew.hpp"
#include "util.hpp"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <sys/wait.h>

#include <spdlog/spdlog.h>

namespace brewrecents {

namespace {

struct CommandOutput {
    std::string output;
    int status = -1;

    bool ok() const { return status == 0; }
};

CommandOutput exec_command(const std::string& cmd) {
    std::array<char, 4096> buffer;
    CommandOutput result;

    spdlog::debug("exec: {}", cmd);

    auto pipe_deleter = [](FILE* f) { if (f) pclose(f); };
    std::unique_ptr<FILE, decltype(pipe_deleter)> pipe(
        popen(cmd.c_str(), "r"), pipe_deleter);

    if (!pipe) {
        return result;
    }

    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        result.output += buffer.data();
    }

    int status = pclose(pipe.release());
    if (status != -1 && WIFEXITED(status)) {
        result.status = WEXITSTATUS(status);
    }

    return result;
}

bool command_exists(const std::string& cmd) {
    std::string check = "command -v " + cmd + " > /dev/null 2>&1";
    return system(check.c_str()) == 0;
}

NameList split_lines(const std::string& output) {
    NameList lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

void insert_lines(const std::string& output, std::set<std::string>& into) {
    for (const auto& line : split_lines(output)) {
        std::string name = trim(line);
        if (!name.empty()) {
            into.insert(name);
        }
    }
}

} // anonymous namespace

std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string git_log_command(const ChangeQuery& query) {
    std::string since = std::to_string(query.days) + " days ago";
    std::string cmd = "git -C " + shell_quote(query.repository) +
                      " log --diff-filter=" + query.filter +
                      " --since=" + shell_quote(since) +
                      " --name-only --pretty=format:";
    if (!query.path_prefix.empty()) {
        cmd += " -- " + shell_quote(query.path_prefix);
    }
    cmd += " 2>/dev/null";
    return cmd;
}

bool BrewProvider::is_available() const {
    return command_exists("brew") && command_exists("git");
}

std::string BrewProvider::unavailable_reason() const {
    if (!command_exists("brew")) {
        return "Homebrew is not installed (brew not found in PATH).";
    }
    if (!command_exists("git")) {
        return "git is not installed (needed to read the Homebrew taps).";
    }
    return "";
}

RepositoryResult BrewProvider::repository(Catalog catalog) const {
    RepositoryResult result;
    const CatalogInfo& info = catalog_info(catalog);

    std::string cmd = std::string("brew --repo ") + info.tap + " 2>/dev/null";
    CommandOutput out = exec_command(cmd);

    if (!out.ok()) {
        result.error = std::string("Error locating ") + info.tap +
                       " (brew --repo exited with " + std::to_string(out.status) + ")";
        return result;
    }

    result.path = trim(out.output);
    if (result.path.empty()) {
        result.error = std::string("Error locating ") + info.tap + ": empty path";
    }
    return result;
}

ChangeResult BrewProvider::raw_changes(const ChangeQuery& query) const {
    ChangeResult result;

    if (query.repository.empty()) {
        result.error = "No repository given";
        return result;
    }

    CommandOutput out = exec_command(git_log_command(query));
    if (!out.ok()) {
        result.error = "git log failed in " + query.repository +
                       " (exit status " + std::to_string(out.status) + ")";
        return result;
    }

    result.paths = split_lines(out.output);
    return result;
}

std::set<std::string> BrewProvider::installed_packages() const {
    std::set<std::string> installed;

    // Get installed formulae
    CommandOutput formulae = exec_command("brew list --formula 2>/dev/null");
    if (formulae.ok()) {
        insert_lines(formulae.output, installed);
    } else {
        spdlog::warn("brew list --formula failed, installed formulae unknown");
    }

    // Get installed casks
    CommandOutput casks = exec_command("brew list --cask 2>/dev/null");
    if (casks.ok()) {
        insert_lines(casks.output, installed);
    } else {
        spdlog::warn("brew list --cask failed, installed casks unknown");
    }

    return installed;
}

} // namespace brewrecents
