#pragma once

#include "options.hpp"
#include "package.hpp"
#include "provider.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace brewrecents {

struct Report {
    int days = 7;
    // Enabled sections in print order: formulae new/updated, casks new/updated
    std::vector<ReportSection> sections;
    // Shared by every section so columns line up across the report
    int max_visible_length = 0;
};

// "🆕 New formulae:", "✏️ Updated casks:", ...
std::string section_title(Catalog catalog, Category category);

// Normalize, classify and style one group of raw paths
ReportSection build_section(Catalog catalog,
                            Category category,
                            const NameList& raw_paths,
                            const MembershipSets& sets,
                            const StyleOptions& style);

class ReportAssembler {
public:
    ReportAssembler(const Provider& provider,
                    const MembershipSets& sets,
                    const Options& options);

    // Retrieves all enabled groups concurrently and joins them. A failed
    // group is logged and left empty.
    Report assemble() const;

private:
    bool enabled(Catalog catalog, Category category) const;

    const Provider& provider_;
    const MembershipSets& sets_;
    const Options& options_;
};

void print_report(std::ostream& out, const Report& report, int output_width);

} // namespace brewrecents
