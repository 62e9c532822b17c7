#pragma once

#include "package.hpp"
#include <ostream>
#include <vector>

namespace brewrecents {

struct ColumnLayout {
    int column_width = 0;
    int column_count = 1;
};

constexpr int COLUMN_GUTTER = 4;

// column_width = max_visible + gutter, at least one column per row
ColumnLayout compute_layout(int max_visible_length, int output_width);

int max_visible_length(const std::vector<StyledEntry>& entries);

// Row-major grid. Every cell but the last of a row is padded to
// column_width; each row ends with '\n'. Suppressed entries are skipped.
void print_columns(std::ostream& out,
                   const std::vector<StyledEntry>& entries,
                   const ColumnLayout& layout);

} // namespace brewrecents
