#include <flexgrid/layout/axis_sizer.h>
#include <flexgrid/layout/cell_index.h>
#include <flexgrid/core/diagnostics.h>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

namespace flexgrid::layout {

namespace {

float non_negative(float v, bool& clamped) {
    if (!std::isfinite(v) || v < 0) {
        clamped = true;
        return 0;
    }
    return v;
}

void emit(core::DiagnosticEmitter* diagnostics, core::Severity severity,
          const std::string& message) {
    if (diagnostics) {
        diagnostics->emit(severity, core::Stage::Measure, message);
    }
}

} // namespace

SizeHint sanitize_hint(const SizeHint& hint, bool* clamped) {
    bool changed = false;
    SizeHint out;
    out.min = non_negative(hint.min, changed);
    out.preferred = non_negative(hint.preferred, changed);
    out.flexible = non_negative(hint.flexible, changed);
    if (clamped) *clamped = changed;
    return out;
}

AxisTotals total_line_size(const std::vector<LineMetrics>& lines, float padding, float spacing) {
    AxisTotals totals;
    for (const auto& line : lines) {
        totals.min += line.min;
        totals.preferred += line.preferred;
        totals.flexible += line.flexible;
    }
    // An empty grid still reserves its padding.
    float total_spacing = lines.empty() ? 0.0f : static_cast<float>(lines.size() - 1) * spacing;
    totals.min += total_spacing + padding;
    totals.preferred += total_spacing + padding;
    return totals;
}

AxisMeasure measure_axis(const std::vector<SizeHint>& hints,
                         const std::vector<GridPosition>& positions,
                         int columns, Axis axis,
                         float padding, float spacing,
                         core::DiagnosticEmitter* diagnostics) {
    if (hints.size() != positions.size()) {
        throw std::invalid_argument("measure_axis: " + std::to_string(hints.size()) +
                                    " hints for " + std::to_string(positions.size()) +
                                    " cells");
    }

    if (columns < core::config::kMinColumns) {
        throw std::invalid_argument("measure_axis: " + std::to_string(columns) + " columns");
    }

    AxisMeasure result;
    if (hints.empty()) {
        result.totals = {padding, padding, 0};
        return result;
    }

    int count = line_count(hints.size(), columns, axis);
    result.lines.assign(static_cast<std::size_t>(count), LineMetrics{});

    for (std::size_t i = 0; i < hints.size(); ++i) {
        int index = line_index(positions[i], axis);
        if (index < 0 || index >= count) {
            throw std::invalid_argument("measure_axis: cell " + std::to_string(i) +
                                        " maps to line " + std::to_string(index) +
                                        " of " + std::to_string(count));
        }

        bool clamped = false;
        SizeHint hint = sanitize_hint(hints[i], &clamped);
        if (clamped) {
            std::ostringstream oss;
            oss << "cell " << i << " has a negative or non-finite " << axis_name(axis)
                << " hint (" << hints[i].min << ", " << hints[i].preferred << ", "
                << hints[i].flexible << "); clamped to zero";
            emit(diagnostics, core::Severity::Warning, oss.str());
        }

        auto& line = result.lines[static_cast<std::size_t>(index)];
        line.min = std::max(line.min, hint.min);
        // Widen by the updated minimum so a cell that only declares a minimum
        // keeps its line from giving that space away to other lines.
        line.preferred = std::max({line.preferred, line.min, hint.preferred});
        line.flexible = std::max(line.flexible, hint.flexible);
    }

    result.totals = total_line_size(result.lines, padding, spacing);

    std::ostringstream oss;
    oss << axis_name(axis) << ": " << count << " lines, min " << result.totals.min
        << ", preferred " << result.totals.preferred
        << ", flexible " << result.totals.flexible;
    emit(diagnostics, core::Severity::Info, oss.str());
    return result;
}

} // namespace flexgrid::layout
