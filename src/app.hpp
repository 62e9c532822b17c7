#pragma once

#include "options.hpp"
#include "package.hpp"
#include "provider.hpp"
#include "terminal.hpp"
#include <ostream>
#include <string>

namespace brewrecents {

class App {
public:
    // A null provider means the Homebrew one
    explicit App(Options options, ProviderPtr provider = nullptr);

    // Fails when the package manager is not installed
    bool init();

    // Build and print the report. Returns the process exit code.
    int run(std::ostream& out);

    const std::string& error() const { return error_; }

private:
    MembershipSets load_membership() const;
    int output_width() const;

    Options options_;
    Terminal terminal_;
    ProviderPtr provider_;
    std::string error_;
};

// Factory function to create providers
ProviderPtr create_provider(const std::string& name);

} // namespace brewrecents
