#include "report.hpp"
#include "layout.hpp"
#include "logging.hpp"
#include "style.hpp"
#include "util.hpp"
#include <algorithm>
#include <array>
#include <exception>
#include <future>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace brewrecents {

namespace {

constexpr const char* NEW_MARKER = "\xf0\x9f\x86\x95";              // U+1F195
constexpr const char* UPDATED_MARKER = "\xe2\x9c\x8f\xef\xb8\x8f";  // U+270F U+FE0F

struct Group {
    Catalog catalog;
    Category category;
};

constexpr std::array<Group, 4> PRINT_ORDER = {{
    {Catalog::Formula, Category::New},
    {Catalog::Formula, Category::Updated},
    {Catalog::Cask, Category::New},
    {Catalog::Cask, Category::Updated},
}};

size_t catalog_index(Catalog catalog) {
    return catalog == Catalog::Cask ? 1 : 0;
}

const char* category_name(Category category) {
    return category == Category::Updated ? "updated" : "new";
}

ChangeResult failed(const std::string& error) {
    ChangeResult result;
    result.error = error;
    return result;
}

} // anonymous namespace

std::string section_title(Catalog catalog, Category category) {
    const char* label = catalog_info(catalog).label;
    if (category == Category::Updated) {
        return std::string(UPDATED_MARKER) + " Updated " + label + ":";
    }
    return std::string(NEW_MARKER) + " New " + label + ":";
}

ReportSection build_section(Catalog catalog,
                            Category category,
                            const NameList& raw_paths,
                            const MembershipSets& sets,
                            const StyleOptions& style) {
    const CatalogInfo& info = catalog_info(catalog);

    ReportSection section;
    section.catalog = catalog;
    section.category = category;
    section.title = section_title(catalog, category);

    for (const auto& name : normalize_names(raw_paths, info.prefix, info.extension)) {
        StyledEntry entry = style_entry(name, sets, style);
        if (!entry.suppressed) {
            section.entries.push_back(std::move(entry));
        }
    }

    return section;
}

ReportAssembler::ReportAssembler(const Provider& provider,
                                 const MembershipSets& sets,
                                 const Options& options)
    : provider_(provider), sets_(sets), options_(options) {
}

bool ReportAssembler::enabled(Catalog catalog, Category category) const {
    bool catalog_on = catalog == Catalog::Formula ? options_.show_formula : options_.show_cask;
    bool category_on = category == Category::New ? options_.show_new : options_.show_updated;
    return catalog_on && category_on;
}

Report ReportAssembler::assemble() const {
    Report report;
    report.days = options_.days;

    std::vector<Group> groups;
    for (const auto& group : PRINT_ORDER) {
        if (enabled(group.catalog, group.category)) {
            groups.push_back(group);
        }
    }

    // One repository lookup per catalog, before the fan-out
    std::array<RepositoryResult, 2> repositories;
    std::array<bool, 2> resolved = {{false, false}};
    for (const auto& group : groups) {
        size_t idx = catalog_index(group.catalog);
        if (resolved[idx]) continue;

        repositories[idx] = provider_.repository(group.catalog);
        resolved[idx] = true;
        if (repositories[idx].has_error()) {
            spdlog::warn("{}", repositories[idx].error);
        } else {
            spdlog::debug("{} repository: {}", catalog_info(group.catalog).tap,
                          repositories[idx].path);
        }
    }

    std::vector<ChangeResult> results(groups.size());
    {
        ScopedTimer timer("gather_lists");

        std::vector<std::future<ChangeResult>> pending;
        pending.reserve(groups.size());

        for (const auto& group : groups) {
            const RepositoryResult& repo = repositories[catalog_index(group.catalog)];
            if (repo.has_error()) {
                std::promise<ChangeResult> skipped;
                skipped.set_value(failed(repo.error));
                pending.push_back(skipped.get_future());
                continue;
            }

            ChangeQuery query;
            query.repository = repo.path;
            query.days = options_.days;
            query.filter = diff_filter(group.category);
            query.path_prefix = catalog_info(group.catalog).prefix;

            const Provider& provider = provider_;
            try {
                pending.push_back(std::async(std::launch::async, [&provider, query]() {
                    return provider.raw_changes(query);
                }));
            } catch (const std::system_error& e) {
                std::promise<ChangeResult> unstarted;
                unstarted.set_value(failed(std::string("could not start retrieval: ") + e.what()));
                pending.push_back(unstarted.get_future());
            }
        }

        // Join every task before anything is classified
        for (size_t i = 0; i < pending.size(); ++i) {
            try {
                results[i] = pending[i].get();
            } catch (const std::exception& e) {
                results[i] = failed(e.what());
            }
        }
    }

    for (size_t i = 0; i < groups.size(); ++i) {
        const Group& group = groups[i];
        const ChangeResult& changes = results[i];

        if (changes.has_error()) {
            spdlog::warn("Could not list {} {}: {}", category_name(group.category),
                         catalog_info(group.catalog).label, changes.error);
        }

        ReportSection section = build_section(group.catalog, group.category,
                                              changes.paths, sets_, options_.style);
        spdlog::debug("{} {}: {} raw paths, {} shown", category_name(group.category),
                      catalog_info(group.catalog).label, changes.paths.size(),
                      section.entries.size());

        report.max_visible_length = std::max(report.max_visible_length,
                                             max_visible_length(section.entries));
        report.sections.push_back(std::move(section));
    }

    spdlog::debug("Global max visible length: {}", report.max_visible_length);
    return report;
}

void print_report(std::ostream& out, const Report& report, int output_width) {
    ScopedTimer timer("print_sections");

    out << "Recent Homebrew packages (last " << report.days
        << (report.days == 1 ? " day" : " days") << "):\n";

    ColumnLayout layout = compute_layout(report.max_visible_length, output_width);

    for (const auto& section : report.sections) {
        if (section.entries.empty()) continue;

        out << "\n" << section.title << "\n";
        print_columns(out, section.entries, layout);
    }

    out << "\n";
}

} // namespace brewrecents
