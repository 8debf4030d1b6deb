#include "cellpress/table.h"
#include "cellpress/linebreaker.h"
#include "cellpress/markup.h"
#include "cellpress/unicode.h"
#include "cellpress/log.h"
#include <algorithm>

namespace cellpress {

namespace {

bool rowHasHeader(const std::vector<TableCell>& row) {
    return std::any_of(row.begin(), row.end(),
                       [](const TableCell& cell) { return cell.isHeader; });
}

StyledLine ruleLine(const std::vector<int>& widths, const std::string& sep) {
    if (widths.empty()) return StyledLine::plain("");
    std::string ruleSep = (sep == " | ") ? "-+-" : sep;
    std::string out;
    for (size_t i = 0; i < widths.size(); ++i) {
        out.append(static_cast<size_t>(std::max(widths[i], 1)), '-');
        if (i + 1 < widths.size()) out += ruleSep;
    }
    return StyledLine::plain(out);
}

} // anonymous namespace

std::string tableSeparator(int width, int cols) {
    if (cols <= 1) return "";
    if (width >= cols + (cols - 1) * 3) return " | ";
    if (width >= cols + (cols - 1)) return " ";
    return "";
}

std::vector<int> columnMaxWidths(const TableBlock& table, int cols) {
    std::vector<int> widths(static_cast<size_t>(std::max(cols, 0)), 0);
    for (const auto& row : table.rows) {
        for (size_t col = 0; col < row.size() && col < widths.size(); ++col) {
            std::string plain = markup::strip(row[col].text);
            size_t start = 0;
            while (start <= plain.size()) {
                size_t nl = plain.find('\n', start);
                size_t end = (nl == std::string::npos) ? plain.size() : nl;
                int w = static_cast<int>(unicode::graphemeCount(plain.substr(start, end - start)));
                widths[col] = std::max(widths[col], w);
                if (nl == std::string::npos) break;
                start = nl + 1;
            }
        }
    }
    return widths;
}

std::vector<int> allocateColumnWidths(const std::vector<int>& maxWidths, int available) {
    int cols = static_cast<int>(maxWidths.size());
    if (cols == 0) return {};
    available = std::max(available, 0);

    int minWidth = (available >= cols * 3) ? 3 : 1;
    std::vector<int> widths(maxWidths.size(), minWidth);
    int remaining = std::max(available - minWidth * cols, 0);

    std::vector<int> capacity;
    capacity.reserve(maxWidths.size());
    for (int w : maxWidths) {
        capacity.push_back(std::max(w - minWidth, 0));
    }

    while (remaining > 0) {
        int best = -1;
        int bestCap = 0;
        for (int i = 0; i < cols; ++i) {
            if (capacity[i] > bestCap) {
                bestCap = capacity[i];
                best = i;
            }
        }
        if (best < 0) break;  // Every column already fits its content
        ++widths[best];
        --capacity[best];
        --remaining;
    }
    return widths;
}

std::optional<size_t> headerRunEnd(const std::vector<std::vector<TableCell>>& rows) {
    std::optional<size_t> last;
    for (size_t i = 0; i < rows.size(); ++i) {
        if (!rowHasHeader(rows[i])) break;
        last = i;
    }
    return last;
}

std::vector<AnchoredLine> renderTable(const TableBlock& table, int width) {
    width = std::max(width, 1);
    std::vector<AnchoredLine> out;
    if (table.rows.empty()) return out;

    size_t colCount = 0;
    for (const auto& row : table.rows) {
        colCount = std::max(colCount, row.size());
    }
    if (colCount == 0) return out;
    int cols = static_cast<int>(colCount);

    std::string sep = tableSeparator(width, cols);
    int sepWidth = static_cast<int>(unicode::graphemeCount(sep));
    int available = std::max(width - sepWidth * (cols - 1), 0);
    std::vector<int> colWidths = allocateColumnWidths(columnMaxWidths(table, cols), available);
    std::optional<size_t> headerEnd = headerRunEnd(table.rows);

    CP_LOGD("renderTable: rows=%zu cols=%d sep='%s' available=%d",
            table.rows.size(), cols, sep.c_str(), available);

    for (size_t rowIdx = 0; rowIdx < table.rows.size(); ++rowIdx) {
        const auto& row = table.rows[rowIdx];
        bool header = rowHasHeader(row);

        // Wrap every cell on its own; missing cells are empty
        std::vector<linebreaker::WrappedLines> cells;
        cells.reserve(colCount);
        size_t rowHeight = 1;
        for (size_t col = 0; col < colCount; ++col) {
            std::string text = col < row.size() ? unicode::trim(row[col].text) : std::string();
            cells.push_back(linebreaker::wrapStyledText(text, std::max(colWidths[col], 1)));
            rowHeight = std::max(rowHeight, cells.back().lines.size());
        }

        for (size_t lineIdx = 0; lineIdx < rowHeight; ++lineIdx) {
            AnchoredLine tl;
            for (size_t col = 0; col < colCount; ++col) {
                const auto& wrapped = cells[col];
                std::vector<Segment> segs;
                if (lineIdx < wrapped.lines.size()) {
                    segs = wrapped.lines[lineIdx].segments;
                    const auto& anchors = wrapped.anchors[lineIdx];
                    tl.anchors.insert(tl.anchors.end(), anchors.begin(), anchors.end());
                }
                if (header) {
                    for (auto& seg : segs) seg.style.bold = true;
                }
                int pad = colWidths[col] - linebreaker::segmentsWidth(segs);
                if (pad > 0) {
                    segs.push_back(Segment::plain(std::string(static_cast<size_t>(pad), ' ')));
                }
                tl.line.segments.insert(tl.line.segments.end(), segs.begin(), segs.end());
                if (col + 1 < colCount && !sep.empty()) {
                    tl.line.segments.push_back(Segment::plain(sep));
                }
            }
            out.push_back(std::move(tl));
        }

        if (headerEnd && *headerEnd == rowIdx) {
            out.push_back(AnchoredLine{ruleLine(colWidths, sep), {}});
        }
    }
    return out;
}

} // namespace cellpress
