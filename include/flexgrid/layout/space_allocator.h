#pragma once
#include <flexgrid/layout/grid_types.h>
#include <vector>

namespace flexgrid::core {
class DiagnosticEmitter;
}

namespace flexgrid::layout {

// Distribute `available` space along one axis over its lines.
//
// Every line first gets its minimum. Space left after the minimums (and the
// padding and spacing) goes toward preferred sizes, proportionally to how far
// each line is below its preference, but never more than all lines together
// want. Whatever is still left goes to lines with a flexible weight,
// proportionally to that weight; if no line is flexible it stays unused.
//
// When `available` is below the axis minimum every line keeps its minimum and
// the grid overflows; nothing is clamped. Offsets start at `padding_start`
// and advance by size + spacing.
std::vector<Allocation> allocate_space(float available,
                                       float padding_start, float padding_end,
                                       float spacing,
                                       const std::vector<LineMetrics>& lines,
                                       core::DiagnosticEmitter* diagnostics = nullptr);

// How far the axis minimum exceeds `available`; 0 when it fits.
float overflow_amount(float available, const AxisTotals& totals);

// Position just past the last line, end padding included.
float allocated_extent(const std::vector<Allocation>& allocations, float padding_start,
                       float padding_end);

} // namespace flexgrid::layout
