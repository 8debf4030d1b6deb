#include <gtest/gtest.h>
#include "cellpress/table.h"
#include "cellpress/linebreaker.h"
#include "cellpress/markup.h"

using namespace cellpress;

namespace {

TableBlock makeTable(const std::vector<std::vector<TableCell>>& rows) {
    TableBlock table;
    table.rows = rows;
    return table;
}

int sum(const std::vector<int>& v) {
    int total = 0;
    for (int x : v) total += x;
    return total;
}

} // namespace

// ---------------------------------------------------------------------------
// Separators
// ---------------------------------------------------------------------------

TEST(Table, SeparatorByWidth) {
    EXPECT_EQ(tableSeparator(30, 2), " | ");
    EXPECT_EQ(tableSeparator(5, 2), " | ");  // 2 + 3
    EXPECT_EQ(tableSeparator(4, 2), " ");
    EXPECT_EQ(tableSeparator(3, 2), " ");    // 2 + 1
    EXPECT_EQ(tableSeparator(2, 2), "");
    EXPECT_EQ(tableSeparator(80, 1), "");
}

// ---------------------------------------------------------------------------
// Column widths
// ---------------------------------------------------------------------------

TEST(Table, ColumnMaxWidthsStripMarkupAndSplitLines) {
    auto table = makeTable({
        {TableCell::data(markup::bold("abcd")), TableCell::data("x")},
        {TableCell::data("ab\nabcdef"), TableCell::data("")},
    });
    auto widths = columnMaxWidths(table, 2);
    ASSERT_EQ(widths.size(), 2u);
    EXPECT_EQ(widths[0], 6);
    EXPECT_EQ(widths[1], 1);
}

TEST(Table, AllocationGrowsWideColumn) {
    // 30 wide with " | ": 27 available, minimum 3 each, then the wide column grows
    auto widths = allocateColumnWidths({4, 20}, 27);
    std::vector<int> expected = {4, 20};
    EXPECT_EQ(widths, expected);
}

TEST(Table, AllocationPrefersLargestCapacity) {
    auto widths = allocateColumnWidths({10, 30}, 20);
    // min 3 each, the 14 left all go to the column with more room
    std::vector<int> expected = {3, 17};
    EXPECT_EQ(widths, expected);
    EXPECT_EQ(sum(widths), 20);
    EXPECT_GE(widths[1], widths[0]);
    EXPECT_LE(widths[0], 10);
    EXPECT_LE(widths[1], 30);
}

TEST(Table, AllocationTightUsesMinimumOne) {
    auto widths = allocateColumnWidths({10, 10, 10}, 5);
    std::vector<int> expected = {2, 2, 1};
    EXPECT_EQ(widths, expected);
    for (int w : widths) EXPECT_GE(w, 1);
}

TEST(Table, AllocationStopsWhenContentFits) {
    auto widths = allocateColumnWidths({2, 5}, 40);
    std::vector<int> expected = {3, 5};
    EXPECT_EQ(widths, expected);
}

TEST(Table, HeaderRunFromFirstRow) {
    std::vector<std::vector<TableCell>> rows = {
        {TableCell::header("A")},
        {TableCell::header("B")},
        {TableCell::data("c")},
        {TableCell::header("D")},
    };
    auto end = headerRunEnd(rows);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(*end, 1u);

    rows.erase(rows.begin(), rows.begin() + 2);
    EXPECT_FALSE(headerRunEnd(rows).has_value());
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

TEST(Table, RenderWithHeaderRule) {
    auto table = makeTable({
        {TableCell::header("Name"), TableCell::header("Qty")},
        {TableCell::data("apple"), TableCell::data("3")},
    });
    auto lines = renderTable(table, 40);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].line.text(), "Name  | Qty");
    EXPECT_EQ(lines[1].line.text(), "------+----");
    EXPECT_EQ(lines[2].line.text(), "apple | 3  ");

    // Header cells are bold, padding and separators are not
    EXPECT_TRUE(lines[0].line.segments[0].style.bold);
    EXPECT_FALSE(lines[2].line.segments[0].style.bold);
}

TEST(Table, RuleWithoutPipesMatchesSeparator) {
    auto table = makeTable({
        {TableCell::header("a"), TableCell::header("b")},
        {TableCell::data("c"), TableCell::data("d")},
    });
    // 4 cells: too narrow for " | " (5), wide enough for " " (3)
    auto lines = renderTable(table, 4);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].line.text(), "a b");
    EXPECT_EQ(lines[1].line.text(), "- -");
    EXPECT_EQ(lines[2].line.text(), "c d");
}

TEST(Table, CellsWrapAndRowsPad) {
    auto table = makeTable({
        {TableCell::data("one two three"), TableCell::data("x")},
    });
    auto lines = renderTable(table, 11);  // " | ": 8 available → [5, 3]
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].line.text(), "one   | x  ");
    EXPECT_EQ(lines[1].line.text(), "two   |    ");
    EXPECT_EQ(lines[2].line.text(), "three |    ");
}

TEST(Table, RaggedRowsArePadded) {
    auto table = makeTable({
        {TableCell::data("a"), TableCell::data("b"), TableCell::data("c")},
        {TableCell::data("d")},
    });
    auto lines = renderTable(table, 40);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(linebreaker::lineWidth(lines[0].line), linebreaker::lineWidth(lines[1].line));
}

TEST(Table, WidthBound) {
    auto table = makeTable({
        {TableCell::header("Column one"), TableCell::header("Column two"), TableCell::header("3")},
        {TableCell::data("A long cell that needs wrapping"), TableCell::data("short"),
         TableCell::data("more text here")},
    });
    for (int width : {9, 12, 20, 33, 60}) {
        for (const auto& tl : renderTable(table, width)) {
            EXPECT_LE(linebreaker::lineWidth(tl.line), width) << "width=" << width;
        }
    }
}

TEST(Table, AnchorsInCellsAreReported) {
    auto table = makeTable({
        {TableCell::data(markup::anchor("t1") + "cell")},
    });
    auto lines = renderTable(table, 20);
    ASSERT_EQ(lines.size(), 1u);
    ASSERT_EQ(lines[0].anchors.size(), 1u);
    EXPECT_EQ(lines[0].anchors[0], "t1");
}

TEST(Table, EmptyTableProducesNoLines) {
    EXPECT_TRUE(renderTable(TableBlock{}, 40).empty());
    EXPECT_TRUE(renderTable(makeTable({{}, {}}), 40).empty());
}
