#include <flexgrid/layout/layout_contracts.h>
#include <flexgrid/layout/space_allocator.h>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace flexgrid::layout {

namespace {

float tolerance_for(float magnitude) {
    return core::config::kLayoutTolerance * std::max(1.0f, std::fabs(magnitude));
}

ContractResult pass(const char* name) {
    return {name, true, {}};
}

ContractResult fail(const char* name, const std::string& detail) {
    return {name, false, detail};
}

ContractResult metrics_ordered(const AxisLayout& layout) {
    const auto& lines = layout.measure.lines;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].min > lines[i].preferred) {
            std::ostringstream oss;
            oss << "line " << i << " min " << lines[i].min << " > preferred " << lines[i].preferred;
            return fail("metrics_ordered", oss.str());
        }
    }
    return pass("metrics_ordered");
}

ContractResult minimum_honored(const AxisLayout& layout) {
    const auto& metrics = layout.measure.lines;
    if (metrics.size() != layout.lines.size()) {
        return fail("minimum_honored", std::to_string(layout.lines.size()) +
                                           " allocations for " + std::to_string(metrics.size()) +
                                           " lines");
    }
    for (std::size_t i = 0; i < metrics.size(); ++i) {
        if (layout.lines[i].size < metrics[i].min - tolerance_for(metrics[i].min)) {
            std::ostringstream oss;
            oss << "line " << i << " size " << layout.lines[i].size << " < min " << metrics[i].min;
            return fail("minimum_honored", oss.str());
        }
    }
    return pass("minimum_honored");
}

ContractResult offsets_monotonic(const AxisLayout& layout) {
    const auto& lines = layout.lines;
    if (lines.empty()) return pass("offsets_monotonic");
    if (std::fabs(lines[0].offset - layout.padding_start) > tolerance_for(layout.padding_start)) {
        std::ostringstream oss;
        oss << "first line at " << lines[0].offset << ", padding is " << layout.padding_start;
        return fail("offsets_monotonic", oss.str());
    }
    for (std::size_t i = 0; i + 1 < lines.size(); ++i) {
        float expected = lines[i].offset + lines[i].size + layout.spacing;
        if (lines[i + 1].offset < expected - tolerance_for(expected)) {
            std::ostringstream oss;
            oss << "line " << i + 1 << " at " << lines[i + 1].offset
                << " overlaps previous line ending at " << expected;
            return fail("offsets_monotonic", oss.str());
        }
    }
    return pass("offsets_monotonic");
}

ContractResult space_conserved(const AxisLayout& layout) {
    if (layout.lines.empty()) return pass("space_conserved");
    const auto& totals = layout.measure.totals;
    float tol = tolerance_for(layout.available);
    // Overflowing grids keep their minimums; nothing to conserve.
    if (layout.available < totals.min - tol) return pass("space_conserved");

    float extent = allocated_extent(layout.lines, layout.padding_start, layout.padding_end);
    bool absorbs_all = totals.flexible > 0 || layout.available <= totals.preferred + tol;
    std::ostringstream oss;
    if (absorbs_all && std::fabs(extent - layout.available) > tol) {
        oss << "extent " << extent << " != available " << layout.available;
        return fail("space_conserved", oss.str());
    }
    if (!absorbs_all && extent > layout.available + tol) {
        oss << "extent " << extent << " exceeds available " << layout.available;
        return fail("space_conserved", oss.str());
    }
    return pass("space_conserved");
}

ContractResult cells_placed(const AxisLayout& layout, std::size_t cell_count) {
    if (layout.cells.size() != cell_count) {
        return fail("cells_placed", std::to_string(layout.cells.size()) + " placements for " +
                                        std::to_string(cell_count) + " cells");
    }
    for (std::size_t i = 0; i < layout.cells.size(); ++i) {
        const auto& c = layout.cells[i];
        if (c.cell != i || c.line < 0 || static_cast<std::size_t>(c.line) >= layout.lines.size()) {
            return fail("cells_placed", "cell " + std::to_string(i) + " has no valid line");
        }
        const auto& line = layout.lines[static_cast<std::size_t>(c.line)];
        if (c.offset != line.offset || c.size != line.size) {
            return fail("cells_placed", "cell " + std::to_string(i) + " does not match line " +
                                            std::to_string(c.line));
        }
    }
    return pass("cells_placed");
}

} // namespace

std::vector<ContractResult> check_axis_contracts(const AxisLayout& layout,
                                                 std::size_t cell_count) {
    return {
        metrics_ordered(layout),
        minimum_honored(layout),
        offsets_monotonic(layout),
        space_conserved(layout),
        cells_placed(layout, cell_count),
    };
}

std::vector<ContractResult> failed_contracts(const std::vector<ContractResult>& results) {
    std::vector<ContractResult> failed;
    for (const auto& r : results) {
        if (!r.passed) failed.push_back(r);
    }
    return failed;
}

} // namespace flexgrid::layout
