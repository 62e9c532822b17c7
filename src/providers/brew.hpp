#pragma once

#include "provider.hpp"

namespace brewrecents {

// Homebrew taps are git checkouts; changes come from `git log`
class BrewProvider : public Provider {
public:
    std::string name() const override { return "brew"; }
    bool is_available() const override;
    std::string unavailable_reason() const override;
    RepositoryResult repository(Catalog catalog) const override;
    ChangeResult raw_changes(const ChangeQuery& query) const override;
    std::set<std::string> installed_packages() const override;
};

// Single-quote a value for /bin/sh
std::string shell_quote(const std::string& value);

// Shell command listing paths changed in the query's window
std::string git_log_command(const ChangeQuery& query);

} // namespace brewrecents
