#pragma once

#include "package.hpp"
#include <memory>
#include <set>
#include <string>

namespace brewrecents {

// Where a catalog lives and how its package files are named
struct CatalogInfo {
    const char* tap;        // e.g. "homebrew/core"
    const char* prefix;     // path prefix inside the tap repository
    const char* extension;
    const char* label;      // plural used in section titles
};

const CatalogInfo& catalog_info(Catalog catalog);

// git --diff-filter letter for a category
const char* diff_filter(Category category);

// Result of a repository lookup
struct RepositoryResult {
    std::string path;
    std::string error;  // Empty if no error

    bool has_error() const { return !error.empty(); }
};

struct ChangeQuery {
    std::string repository;
    int days = 7;
    std::string filter;       // "A" or "M"
    std::string path_prefix;
};

// Result of a change retrieval
struct ChangeResult {
    NameList paths;
    std::string error;  // Empty if no error

    bool has_error() const { return !error.empty(); }
};

// Abstract base class for package sources
class Provider {
public:
    virtual ~Provider() = default;

    // Get the name of this provider (e.g., "brew")
    virtual std::string name() const = 0;

    // Check if this provider is available on the system
    virtual bool is_available() const = 0;

    // Message for when is_available() is false
    virtual std::string unavailable_reason() const {
        return name() + " is not installed.";
    }

    // Locate the local checkout of a catalog
    virtual RepositoryResult repository(Catalog catalog) const = 0;

    // Raw file paths changed in the window. Called from several threads
    // at once, implementations must not share mutable state.
    virtual ChangeResult raw_changes(const ChangeQuery& query) const = 0;

    virtual std::set<std::string> installed_packages() const = 0;
};

using ProviderPtr = std::unique_ptr<Provider>;

} // namespace brewrecents
