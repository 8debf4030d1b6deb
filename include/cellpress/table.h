#pragma once

#include "cellpress/document.h"
#include "cellpress/page.h"
#include <optional>
#include <string>
#include <vector>

namespace cellpress {

/// Column separator for `cols` columns in `width` cells:
/// " | " when it fits, else " ", else nothing
std::string tableSeparator(int width, int cols);

/// Widest line (in graphemes, markup stripped) of any cell, per column
std::vector<int> columnMaxWidths(const TableBlock& table, int cols);

/// Start every column at a minimum (3, or 1 when space is tight), then hand out
/// single cells to the column with the most remaining content capacity.
std::vector<int> allocateColumnWidths(const std::vector<int>& maxWidths, int available);

/// Index of the last row of the header run that starts at row 0
std::optional<size_t> headerRunEnd(const std::vector<std::vector<TableCell>>& rows);

/// Lay out a table into lines no wider than `width`
std::vector<AnchoredLine> renderTable(const TableBlock& table, int width);

} // namespace cellpress
