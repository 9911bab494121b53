#include <flexgrid/layout/space_allocator.h>
#include <flexgrid/layout/axis_sizer.h>
#include <flexgrid/core/diagnostics.h>

#include <algorithm>
#include <sstream>

namespace flexgrid::layout {

std::vector<Allocation> allocate_space(float available,
                                       float padding_start, float padding_end,
                                       float spacing,
                                       const std::vector<LineMetrics>& lines,
                                       core::DiagnosticEmitter* diagnostics) {
    std::vector<Allocation> allocations;
    if (lines.empty()) return allocations;

    AxisTotals totals = total_line_size(lines, padding_start + padding_end, spacing);

    float remaining = available - totals.min;
    float ideal_growth = totals.preferred - totals.min;

    // Take at most what the lines want toward their preferred sizes, and no
    // more than is left, or lines would overlap. Floored at zero so an
    // overflowing grid never drops a line below its minimum.
    float reserved = std::max(std::min(remaining, ideal_growth), 0.0f);
    remaining = std::max(remaining - reserved, 0.0f);

    if (diagnostics) {
        float overflow = overflow_amount(available, totals);
        if (overflow > 0) {
            std::ostringstream oss;
            oss << "available " << available << " is below the minimum " << totals.min
                << "; overflowing by " << overflow;
            diagnostics->emit(core::Severity::Warning, core::Stage::Allocate, oss.str());
        }
    }

    allocations.reserve(lines.size());
    float offset = padding_start;
    for (const auto& line : lines) {
        // Split proportionally to each line's share of the total shortfall
        // rather than first come, first served.
        float preferred_share = 0;
        if (ideal_growth > 0) {
            preferred_share = (line.preferred - line.min) / ideal_growth * reserved;
        }
        float flexible_share = 0;
        if (totals.flexible > 0) {
            flexible_share = remaining / totals.flexible * line.flexible;
        }

        Allocation a;
        a.offset = offset;
        a.size = line.min + preferred_share + flexible_share;
        allocations.push_back(a);
        offset += a.size + spacing;
    }

    if (diagnostics) {
        std::ostringstream oss;
        oss << lines.size() << " lines in " << available << ": preferred "
            << reserved << ", flexible " << (totals.flexible > 0 ? remaining : 0.0f);
        if (totals.flexible <= 0 && remaining > 0) {
            oss << ", unused " << remaining;
        }
        diagnostics->emit(core::Severity::Info, core::Stage::Allocate, oss.str());
    }
    return allocations;
}

float overflow_amount(float available, const AxisTotals& totals) {
    return std::max(totals.min - available, 0.0f);
}

float allocated_extent(const std::vector<Allocation>& allocations, float padding_start,
                       float padding_end) {
    if (allocations.empty()) return padding_start + padding_end;
    const auto& last = allocations.back();
    return last.offset + last.size + padding_end;
}

} // namespace flexgrid::layout
