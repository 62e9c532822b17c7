#pragma once

#include <set>
#include <string>
#include <vector>

namespace brewrecents {

enum class Catalog {
    Formula,
    Cask,
};

enum class Category {
    New,
    Updated,
};

// Installed wins over Inspected when a name is in both sets
enum class Classification {
    Installed,
    Inspected,
    Plain,
};

// Installed packages and packages looked up before (brew info / bi).
// Built once per run, read-only afterwards.
struct MembershipSets {
    std::set<std::string> installed;
    std::set<std::string> inspected;

    bool is_installed(const std::string& name) const {
        return installed.find(name) != installed.end();
    }

    bool is_inspected(const std::string& name) const {
        return inspected.find(name) != inspected.end();
    }

    Classification classify(const std::string& name) const {
        if (is_installed(name)) return Classification::Installed;
        if (is_inspected(name)) return Classification::Inspected;
        return Classification::Plain;
    }
};

struct StyledEntry {
    std::string text;       // may contain ANSI sequences
    int visible_length = 0;
    bool suppressed = false;
};

struct ReportSection {
    Catalog catalog = Catalog::Formula;
    Category category = Category::New;
    std::string title;
    std::vector<StyledEntry> entries;
};

using NameList = std::vector<std::string>;

} // namespace brewrecents
