#pragma once
#include <flexgrid/core/config.h>
#include <cstddef>
#include <vector>

namespace flexgrid::layout {

// Axis 0 sizes columns, axis 1 sizes rows.
enum class Axis {
    Horizontal = 0,
    Vertical = 1
};

const char* axis_name(Axis axis);

struct GridPosition {
    int column = 0;
    int row = 0;

    bool operator==(const GridPosition& other) const {
        return column == other.column && row == other.row;
    }
    bool operator!=(const GridPosition& other) const { return !(*this == other); }
};

// What a cell asks for along one axis. Snapshot for a single pass.
struct SizeHint {
    float min = 0;
    float preferred = 0;
    float flexible = 0;
};

// Aggregate of the hints of every cell sharing a column (or row).
// min <= preferred holds by construction.
struct LineMetrics {
    float min = 0;
    float preferred = 0;
    float flexible = 0;
};

// Sum over the lines of an axis, padding and spacing included in min and
// preferred. This is what the container reports to its own parent.
struct AxisTotals {
    float min = 0;
    float preferred = 0;
    float flexible = 0;
};

// Final geometry of one column or row.
struct Allocation {
    float offset = 0;
    float size = 0;
};

// Final geometry of one cell along one axis.
struct CellPlacement {
    std::size_t cell = 0;
    int line = 0;
    float offset = 0;
    float size = 0;
};

struct EdgeInsets {
    float left = core::config::kDefaultPadding;
    float right = core::config::kDefaultPadding;
    float top = core::config::kDefaultPadding;
    float bottom = core::config::kDefaultPadding;
};

struct Spacing {
    float x = core::config::kDefaultSpacing;
    float y = core::config::kDefaultSpacing;
};

// Container-owned settings, read at the start of every pass.
struct GridConfig {
    int columns = core::config::kDefaultColumns;
    Spacing spacing;
    EdgeInsets padding;

    float padding_start(Axis axis) const { return axis == Axis::Horizontal ? padding.left : padding.top; }
    float padding_end(Axis axis) const { return axis == Axis::Horizontal ? padding.right : padding.bottom; }
    float padding_total(Axis axis) const { return padding_start(axis) + padding_end(axis); }
    float spacing_along(Axis axis) const { return axis == Axis::Horizontal ? spacing.x : spacing.y; }
};

} // namespace flexgrid::layout
