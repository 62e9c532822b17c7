#include "layout.hpp"
#include <algorithm>
#include <string>

namespace brewrecents {

ColumnLayout compute_layout(int max_visible_length, int output_width) {
    ColumnLayout layout;
    layout.column_width = std::max(0, max_visible_length) + COLUMN_GUTTER;
    layout.column_count = std::max(1, output_width / layout.column_width);
    return layout;
}

int max_visible_length(const std::vector<StyledEntry>& entries) {
    int maxlen = 0;
    for (const auto& entry : entries) {
        if (!entry.suppressed) {
            maxlen = std::max(maxlen, entry.visible_length);
        }
    }
    return maxlen;
}

void print_columns(std::ostream& out,
                   const std::vector<StyledEntry>& entries,
                   const ColumnLayout& layout) {
    std::vector<const StyledEntry*> cells;
    cells.reserve(entries.size());
    for (const auto& entry : entries) {
        if (!entry.suppressed) {
            cells.push_back(&entry);
        }
    }

    const size_t per_row = static_cast<size_t>(std::max(1, layout.column_count));

    for (size_t row_start = 0; row_start < cells.size(); row_start += per_row) {
        size_t row_end = std::min(cells.size(), row_start + per_row);

        for (size_t i = row_start; i < row_end; ++i) {
            const StyledEntry& cell = *cells[i];
            out << cell.text;

            // No trailing whitespace after the last cell
            bool last_in_row = (i + 1 == row_end);
            int pad = layout.column_width - cell.visible_length;
            if (!last_in_row && pad > 0) {
                out << std::string(static_cast<size_t>(pad), ' ');
            }
        }
        out << '\n';
    }
}

} // namespace brewrecents
