#pragma once
#include <flexgrid/layout/grid_types.h>
#include <vector>

namespace flexgrid::core {
class DiagnosticEmitter;
}

namespace flexgrid::layout {

struct AxisMeasure {
    std::vector<LineMetrics> lines;
    AxisTotals totals;
};

// Clamp negative or non-finite hint values to zero. Returns true in
// `clamped` when anything was changed.
SizeHint sanitize_hint(const SizeHint& hint, bool* clamped = nullptr);

// Sum the lines of an axis. Spacing sits between lines and, like padding, is
// a fixed cost: it is added to min and preferred but never to flexible.
AxisTotals total_line_size(const std::vector<LineMetrics>& lines, float padding, float spacing);

// Aggregate per-cell hints into one LineMetrics per column (horizontal) or
// row (vertical) by taking the maximum of each field.
//   hints[i] and positions[i] describe cell i; the sequences must match in
//   length (std::invalid_argument otherwise).
//   padding is the sum of both edges along the axis.
AxisMeasure measure_axis(const std::vector<SizeHint>& hints,
                         const std::vector<GridPosition>& positions,
                         int columns, Axis axis,
                         float padding, float spacing,
                         core::DiagnosticEmitter* diagnostics = nullptr);

} // namespace flexgrid::layout
