#include <flexgrid/layout/grid_layout.h>
#include <flexgrid/core/diagnostics.h>

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <vector>

using namespace flexgrid;
using namespace flexgrid::layout;

namespace {

// Test cell that reports fixed hints and records what it was given.
class FakeCell : public GridCell {
public:
    FakeCell(SizeHint horizontal, SizeHint vertical)
        : horizontal_(horizontal), vertical_(vertical) {}

    SizeHint size_hint(Axis axis) const override {
        ++hint_calls[static_cast<int>(axis)];
        return axis == Axis::Horizontal ? horizontal_ : vertical_;
    }

    void place(Axis axis, float offset, float size) override {
        int a = static_cast<int>(axis);
        ++place_calls[a];
        this->offset[a] = offset;
        this->size[a] = size;
    }

    mutable int hint_calls[2] = {0, 0};
    int place_calls[2] = {0, 0};
    float offset[2] = {0, 0};
    float size[2] = {0, 0};

private:
    SizeHint horizontal_;
    SizeHint vertical_;
};

struct Grid {
    std::vector<std::unique_ptr<FakeCell>> owned;
    std::vector<GridCell*> cells;

    FakeCell& add(SizeHint horizontal, SizeHint vertical = {}) {
        owned.push_back(std::make_unique<FakeCell>(horizontal, vertical));
        cells.push_back(owned.back().get());
        return *owned.back();
    }
    FakeCell& operator[](std::size_t i) { return *owned[i]; }
};

constexpr int H = 0;
constexpr int V = 1;

} // namespace

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------
TEST(GridLayoutTest, DefaultsToOneColumnAndNoSpacing) {
    GridLayoutGroup group;
    EXPECT_EQ(group.columns(), 1);
    EXPECT_FLOAT_EQ(group.spacing().x, core::config::kDefaultSpacing);
    EXPECT_FLOAT_EQ(group.spacing().y, core::config::kDefaultSpacing);
    EXPECT_FLOAT_EQ(group.padding().left, core::config::kDefaultPadding);
    EXPECT_FLOAT_EQ(group.padding().bottom, core::config::kDefaultPadding);
}

TEST(GridLayoutTest, ColumnsBelowOneAreClampedWithWarning) {
    core::DiagnosticEmitter diagnostics;
    GridLayoutGroup group;
    group.set_diagnostics(&diagnostics);
    group.set_columns(0);
    EXPECT_EQ(group.columns(), 1);
    group.set_columns(-5);
    EXPECT_EQ(group.columns(), 1);
    group.set_columns(4);
    EXPECT_EQ(group.columns(), 4);

    auto warnings = diagnostics.events_by_stage(core::Stage::Config);
    EXPECT_EQ(warnings.size(), 2u);
}

TEST(GridLayoutTest, NegativeSpacingAndPaddingAreClamped) {
    GridLayoutGroup group;
    group.set_spacing({-2, 3});
    group.set_padding({1, -1, 2, -2});
    EXPECT_FLOAT_EQ(group.spacing().x, 0.0f);
    EXPECT_FLOAT_EQ(group.spacing().y, 3.0f);
    EXPECT_FLOAT_EQ(group.padding().left, 1.0f);
    EXPECT_FLOAT_EQ(group.padding().right, 0.0f);
    EXPECT_FLOAT_EQ(group.padding().top, 2.0f);
    EXPECT_FLOAT_EQ(group.padding().bottom, 0.0f);
}

TEST(GridLayoutTest, ConstructorNormalizesConfig) {
    GridConfig config;
    config.columns = 0;
    config.spacing = {-1, -1};
    GridLayoutGroup group(config);
    EXPECT_EQ(group.columns(), 1);
    EXPECT_FLOAT_EQ(group.spacing().x, 0.0f);
}

TEST(GridLayoutTest, NormalizeConfigReportsEachCorrection) {
    core::DiagnosticEmitter diagnostics;
    GridConfig config;
    config.columns = -1;
    config.padding.top = -4;
    GridConfig out = normalize_config(config, &diagnostics);
    EXPECT_EQ(out.columns, 1);
    EXPECT_FLOAT_EQ(out.padding.top, 0.0f);
    EXPECT_EQ(diagnostics.events_by_severity(core::Severity::Warning).size(), 2u);
}

// ---------------------------------------------------------------------------
// Pure pass
// ---------------------------------------------------------------------------
TEST(GridLayoutTest, TwoByTwoScenario) {
    GridConfig config;
    config.columns = 2;
    std::vector<SizeHint> hints = {{10, 10, 0}, {20, 20, 0}, {5, 5, 0}, {5, 5, 0}};

    auto result = compute_axis_layout(hints, config, Axis::Horizontal, 30.0f);
    ASSERT_EQ(result.measure.lines.size(), 2u);
    EXPECT_FLOAT_EQ(result.measure.lines[0].min, 10.0f);
    EXPECT_FLOAT_EQ(result.measure.lines[1].min, 20.0f);
    ASSERT_EQ(result.lines.size(), 2u);
    EXPECT_FLOAT_EQ(result.lines[0].size, 10.0f);
    EXPECT_FLOAT_EQ(result.lines[1].size, 20.0f);
    EXPECT_FLOAT_EQ(result.lines[0].offset, 0.0f);
    EXPECT_FLOAT_EQ(result.lines[1].offset, 10.0f);

    ASSERT_EQ(result.cells.size(), 4u);
    EXPECT_EQ(result.cells[2].line, 0);
    EXPECT_FLOAT_EQ(result.cells[2].size, 10.0f);
    EXPECT_FLOAT_EQ(result.cells[3].offset, 10.0f);
}

TEST(GridLayoutTest, SingleFlexibleCellFillsAxis) {
    GridConfig config;
    auto result = compute_axis_layout({{0, 0, 1}}, config, Axis::Horizontal, 100.0f);
    ASSERT_EQ(result.cells.size(), 1u);
    EXPECT_FLOAT_EQ(result.cells[0].size, 100.0f);
    EXPECT_FLOAT_EQ(result.cells[0].offset, 0.0f);
}

TEST(GridLayoutTest, VerticalPassUsesTopPaddingAndRowSpacing) {
    GridConfig config;
    config.columns = 2;
    config.spacing = {100, 4};
    config.padding = {50, 50, 6, 2};
    std::vector<SizeHint> hints = {{0, 0, 0}, {10, 10, 0}, {20, 20, 0}};

    auto result = compute_axis_layout(hints, config, Axis::Vertical, 0.0f);
    ASSERT_EQ(result.lines.size(), 2u);
    EXPECT_FLOAT_EQ(result.measure.totals.min, 10 + 20 + 4 + 8);
    EXPECT_FLOAT_EQ(result.lines[0].offset, 6.0f);
    EXPECT_FLOAT_EQ(result.lines[1].offset, 6.0f + 10.0f + 4.0f);
}

TEST(GridLayoutTest, EmptyGridHasNoPlacements) {
    GridConfig config;
    config.padding = {3, 4, 0, 0};
    auto result = compute_axis_layout({}, config, Axis::Horizontal, 50.0f);
    EXPECT_TRUE(result.lines.empty());
    EXPECT_TRUE(result.cells.empty());
    EXPECT_FLOAT_EQ(result.measure.totals.min, 7.0f);
}

TEST(GridLayoutTest, SerializeIsDeterministic) {
    GridConfig config;
    config.columns = 2;
    std::vector<SizeHint> hints = {{10, 10, 0}, {20, 20, 0}, {5, 5, 0}};
    auto a = compute_axis_layout(hints, config, Axis::Horizontal, 30.0f);
    auto b = compute_axis_layout(hints, config, Axis::Horizontal, 30.0f);
    EXPECT_EQ(serialize_axis_layout(a), serialize_axis_layout(b));
    EXPECT_EQ(serialize_axis_layout(a),
              "{axis:horizontal available:30 lines:[0+10 10+20] cells:[0@0 1@1 2@0]}");
}

// ---------------------------------------------------------------------------
// Group adapter
// ---------------------------------------------------------------------------
TEST(GridLayoutTest, RequestAxisExtentReportsTotals) {
    Grid grid;
    grid.add({10, 15, 1}, {5, 5, 0});
    grid.add({20, 20, 0}, {8, 9, 2});
    grid.add({12, 12, 0}, {1, 1, 0});

    GridLayoutGroup group;
    group.set_columns(2);
    group.set_spacing({2, 3});
    group.set_padding({1, 1, 4, 4});

    auto h = group.request_axis_extent(grid.cells, Axis::Horizontal).totals;
    EXPECT_FLOAT_EQ(h.min, 12 + 20 + 2 + 2);
    EXPECT_FLOAT_EQ(h.preferred, 15 + 20 + 2 + 2);
    EXPECT_FLOAT_EQ(h.flexible, 1.0f);

    auto v = group.request_axis_extent(grid.cells, Axis::Vertical).totals;
    EXPECT_FLOAT_EQ(v.min, 8 + 1 + 3 + 8);
    EXPECT_FLOAT_EQ(v.preferred, 9 + 1 + 3 + 8);
    EXPECT_FLOAT_EQ(v.flexible, 2.0f);
}

TEST(GridLayoutTest, RequestAxisExtentOfEmptyGridIsPadding) {
    GridLayoutGroup group;
    group.set_padding({2, 3, 4, 5});
    auto h = group.request_axis_extent({}, Axis::Horizontal).totals;
    EXPECT_FLOAT_EQ(h.min, 5.0f);
    EXPECT_FLOAT_EQ(h.preferred, 5.0f);
    EXPECT_FLOAT_EQ(h.flexible, 0.0f);
    auto v = group.request_axis_extent({}, Axis::Vertical).totals;
    EXPECT_FLOAT_EQ(v.min, 9.0f);
}

TEST(GridLayoutTest, LayoutPlacesEveryCellOnBothAxes) {
    Grid grid;
    grid.add({10, 10, 0}, {10, 10, 0});
    grid.add({20, 20, 1}, {5, 5, 0});
    grid.add({5, 5, 0}, {0, 0, 1});

    GridLayoutGroup group;
    group.set_columns(2);
    group.set_spacing({4, 2});
    group.set_padding({3, 3, 1, 1});
    group.layout(grid.cells, 100.0f, 60.0f);

    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(grid[i].hint_calls[H], 1);
        EXPECT_EQ(grid[i].hint_calls[V], 1);
        EXPECT_EQ(grid[i].place_calls[H], 1);
        EXPECT_EQ(grid[i].place_calls[V], 1);
    }

    // Column 1 absorbs the leftover: 100 - 3 - 3 - 4 - 10 - 20 = 60.
    EXPECT_FLOAT_EQ(grid[0].offset[H], 3.0f);
    EXPECT_FLOAT_EQ(grid[0].size[H], 10.0f);
    EXPECT_FLOAT_EQ(grid[1].offset[H], 17.0f);
    EXPECT_FLOAT_EQ(grid[1].size[H], 80.0f);
    EXPECT_FLOAT_EQ(grid[2].offset[H], 3.0f);
    EXPECT_FLOAT_EQ(grid[2].size[H], 10.0f);

    // Row 1 absorbs the leftover: 60 - 1 - 1 - 2 - 10 = 46.
    EXPECT_FLOAT_EQ(grid[0].offset[V], 1.0f);
    EXPECT_FLOAT_EQ(grid[0].size[V], 10.0f);
    EXPECT_FLOAT_EQ(grid[1].size[V], 10.0f);
    EXPECT_FLOAT_EQ(grid[2].offset[V], 13.0f);
    EXPECT_FLOAT_EQ(grid[2].size[V], 46.0f);
}

TEST(GridLayoutTest, ExtentThenLayoutQueriesEachCellOnce) {
    Grid grid;
    grid.add({10, 20, 0}, {5, 5, 0});
    grid.add({15, 15, 1}, {8, 8, 1});

    GridLayoutGroup group;
    group.set_columns(2);

    for (Axis axis : {Axis::Horizontal, Axis::Vertical}) {
        auto measure = group.request_axis_extent(grid.cells, axis);
        group.layout_axis(grid.cells, measure, axis, 100.0f);
    }

    for (std::size_t i = 0; i < 2; ++i) {
        EXPECT_EQ(grid[i].hint_calls[H], 1);
        EXPECT_EQ(grid[i].hint_calls[V], 1);
        EXPECT_EQ(grid[i].place_calls[H], 1);
        EXPECT_EQ(grid[i].place_calls[V], 1);
    }
    // Column 0 reaches its preference, column 1 takes the rest.
    EXPECT_FLOAT_EQ(grid[0].size[H], 20.0f);
    EXPECT_FLOAT_EQ(grid[1].offset[H], 20.0f);
    EXPECT_FLOAT_EQ(grid[1].size[H], 80.0f);
    EXPECT_FLOAT_EQ(grid[1].size[V], 100.0f);
}

TEST(GridLayoutTest, ExtentAndLayoutShareOnePass) {
    core::DiagnosticEmitter diagnostics;
    Grid grid;
    grid.add({1, 1, 0});

    GridLayoutGroup group;
    group.set_diagnostics(&diagnostics);
    auto measure = group.request_axis_extent(grid.cells, Axis::Horizontal);
    group.layout_axis(grid.cells, measure, Axis::Horizontal, 10.0f);

    EXPECT_EQ(group.pass_count(), 1u);
    EXPECT_EQ(diagnostics.events_for_pass(1).size(), diagnostics.size());
}

TEST(GridLayoutTest, StaleMeasureIsRejected) {
    Grid grid;
    for (int i = 0; i < 3; ++i) grid.add({10, 10, 0});

    GridLayoutGroup group;
    group.set_columns(3);
    auto measure = group.request_axis_extent(grid.cells, Axis::Horizontal);
    group.set_columns(2);
    EXPECT_THROW(group.layout_axis(grid.cells, measure, Axis::Horizontal, 30.0f),
                 std::invalid_argument);
    EXPECT_EQ(grid[0].place_calls[H], 0);
}

TEST(GridLayoutTest, EmptyGridMakesNoPlaceCalls) {
    GridLayoutGroup group;
    auto result = group.layout_axis({}, Axis::Horizontal, 100.0f);
    EXPECT_TRUE(result.cells.empty());
    EXPECT_TRUE(result.lines.empty());
}

TEST(GridLayoutTest, NullCellThrows) {
    GridLayoutGroup group;
    std::vector<GridCell*> cells = {nullptr};
    EXPECT_THROW(group.layout_axis(cells, Axis::Horizontal, 10.0f), std::invalid_argument);
}

TEST(GridLayoutTest, ConfigChangeTakesEffectOnNextPass) {
    Grid grid;
    for (int i = 0; i < 4; ++i) grid.add({10, 10, 0});

    GridLayoutGroup group;
    group.set_columns(4);
    auto wide = group.layout_axis(grid.cells, Axis::Horizontal, 40.0f);
    EXPECT_EQ(wide.lines.size(), 4u);
    EXPECT_FLOAT_EQ(grid[3].offset[H], 30.0f);

    group.set_columns(2);
    auto narrow = group.layout_axis(grid.cells, Axis::Horizontal, 40.0f);
    EXPECT_EQ(narrow.lines.size(), 2u);
    EXPECT_FLOAT_EQ(grid[3].offset[H], 10.0f);
}

TEST(GridLayoutTest, PassesAreNumberedInDiagnostics) {
    core::DiagnosticEmitter diagnostics;
    Grid grid;
    grid.add({1, 1, 0}, {1, 1, 0});

    GridLayoutGroup group;
    group.set_diagnostics(&diagnostics);
    group.layout(grid.cells, 10.0f, 10.0f);

    EXPECT_EQ(group.pass_count(), 2u);
    auto placed = diagnostics.events_by_stage(core::Stage::Place);
    ASSERT_EQ(placed.size(), 2u);
    EXPECT_EQ(placed[0].pass, 1u);
    EXPECT_EQ(placed[1].pass, 2u);
    EXPECT_FALSE(diagnostics.has_events_at_or_above(core::Severity::Warning));
}

TEST(GridLayoutTest, VerifiedPassesReportNoErrors) {
    core::DiagnosticEmitter diagnostics;
    Grid grid;
    grid.add({10, 30, 1}, {4, 4, 0});
    grid.add({5, 5, 0}, {6, 12, 0});
    grid.add({0, 0, 3}, {2, 2, 1});
    grid.add({7, 9, 0}, {0, 0, 0});
    grid.add({1, 1, 0}, {3, 8, 2});

    GridLayoutGroup group;
    group.set_columns(3);
    group.set_spacing({2, 2});
    group.set_padding({1, 2, 3, 4});
    group.set_diagnostics(&diagnostics);
    group.set_verify_passes(true);
    group.layout(grid.cells, 120.0f, 40.0f);

    EXPECT_TRUE(diagnostics.events_by_stage(core::Stage::Verify).empty());
    EXPECT_FALSE(diagnostics.has_events_at_or_above(core::Severity::Error));
}
