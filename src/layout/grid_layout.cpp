#include <flexgrid/layout/grid_layout.h>
#include <flexgrid/layout/cell_index.h>
#include <flexgrid/layout/layout_contracts.h>
#include <flexgrid/layout/space_allocator.h>
#include <flexgrid/core/diagnostics.h>

#include <sstream>
#include <stdexcept>

namespace flexgrid::layout {

namespace {

void warn(core::DiagnosticEmitter* diagnostics, const std::string& message) {
    if (diagnostics) {
        diagnostics->emit(core::Severity::Warning, core::Stage::Config, message);
    }
}

int clamp_columns_setting(int columns, core::DiagnosticEmitter* diagnostics) {
    int clamped = clamp_columns(columns);
    if (clamped != columns) {
        warn(diagnostics, "columns " + std::to_string(columns) + " is below " +
                              std::to_string(core::config::kMinColumns) + "; using " +
                              std::to_string(clamped));
    }
    return clamped;
}

float clamp_setting(float value, const char* name, core::DiagnosticEmitter* diagnostics) {
    if (value >= 0) return value;
    std::ostringstream oss;
    oss << name << " " << value << " is negative; using 0";
    warn(diagnostics, oss.str());
    return 0;
}

Spacing clamp_spacing(const Spacing& spacing, core::DiagnosticEmitter* diagnostics) {
    return {clamp_setting(spacing.x, "horizontal spacing", diagnostics),
            clamp_setting(spacing.y, "vertical spacing", diagnostics)};
}

EdgeInsets clamp_padding(const EdgeInsets& padding, core::DiagnosticEmitter* diagnostics) {
    return {clamp_setting(padding.left, "left padding", diagnostics),
            clamp_setting(padding.right, "right padding", diagnostics),
            clamp_setting(padding.top, "top padding", diagnostics),
            clamp_setting(padding.bottom, "bottom padding", diagnostics)};
}

} // namespace

GridConfig normalize_config(const GridConfig& config, core::DiagnosticEmitter* diagnostics) {
    GridConfig out;
    out.columns = clamp_columns_setting(config.columns, diagnostics);
    out.spacing = clamp_spacing(config.spacing, diagnostics);
    out.padding = clamp_padding(config.padding, diagnostics);
    return out;
}

AxisLayout allocate_axis_layout(const AxisMeasure& measure, std::size_t cell_count,
                                const GridConfig& config, Axis axis, float available,
                                core::DiagnosticEmitter* diagnostics) {
    GridConfig cfg = normalize_config(config, diagnostics);

    int expected = line_count(cell_count, cfg.columns, axis);
    if (measure.lines.size() != static_cast<std::size_t>(expected)) {
        throw std::invalid_argument("allocate_axis_layout: measure has " +
                                    std::to_string(measure.lines.size()) + " lines, " +
                                    std::to_string(cell_count) + " cells in " +
                                    std::to_string(cfg.columns) + " columns need " +
                                    std::to_string(expected));
    }

    AxisLayout result;
    result.axis = axis;
    result.available = available;
    result.padding_start = cfg.padding_start(axis);
    result.padding_end = cfg.padding_end(axis);
    result.spacing = cfg.spacing_along(axis);
    result.measure = measure;
    result.lines = allocate_space(available, result.padding_start, result.padding_end,
                                  result.spacing, measure.lines, diagnostics);

    result.cells.reserve(cell_count);
    auto positions = map_cells(cell_count, cfg.columns);
    for (std::size_t i = 0; i < positions.size(); ++i) {
        int line = line_index(positions[i], axis);
        const auto& a = result.lines[static_cast<std::size_t>(line)];
        result.cells.push_back({i, line, a.offset, a.size});
    }
    return result;
}

AxisLayout compute_axis_layout(const std::vector<SizeHint>& hints,
                               const GridConfig& config, Axis axis, float available,
                               core::DiagnosticEmitter* diagnostics) {
    GridConfig cfg = normalize_config(config, diagnostics);
    auto measure = measure_axis(hints, map_cells(hints.size(), cfg.columns), cfg.columns, axis,
                                cfg.padding_total(axis), cfg.spacing_along(axis), diagnostics);
    return allocate_axis_layout(measure, hints.size(), cfg, axis, available, diagnostics);
}

std::string serialize_axis_layout(const AxisLayout& layout) {
    std::ostringstream out;
    out << "{axis:" << axis_name(layout.axis) << " available:" << layout.available;
    out << " lines:[";
    for (std::size_t i = 0; i < layout.lines.size(); ++i) {
        if (i) out << " ";
        out << layout.lines[i].offset << "+" << layout.lines[i].size;
    }
    out << "] cells:[";
    for (std::size_t i = 0; i < layout.cells.size(); ++i) {
        if (i) out << " ";
        out << layout.cells[i].cell << "@" << layout.cells[i].line;
    }
    out << "]}";
    return out.str();
}

GridLayoutGroup::GridLayoutGroup(const GridConfig& config)
    : config_(normalize_config(config)) {}

void GridLayoutGroup::set_columns(int columns) {
    config_.columns = clamp_columns_setting(columns, diagnostics_);
}

void GridLayoutGroup::set_spacing(const Spacing& spacing) {
    config_.spacing = clamp_spacing(spacing, diagnostics_);
}

void GridLayoutGroup::set_padding(const EdgeInsets& padding) {
    config_.padding = clamp_padding(padding, diagnostics_);
}

void GridLayoutGroup::check_cells(const std::vector<GridCell*>& cells) {
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (!cells[i]) {
            throw std::invalid_argument("GridLayoutGroup: cell " + std::to_string(i) + " is null");
        }
    }
}

std::vector<SizeHint> GridLayoutGroup::collect_hints(const std::vector<GridCell*>& cells,
                                                     Axis axis) const {
    check_cells(cells);
    std::vector<SizeHint> hints;
    hints.reserve(cells.size());
    for (const auto* cell : cells) {
        hints.push_back(cell->size_hint(axis));
    }
    return hints;
}

void GridLayoutGroup::begin_pass() {
    ++pass_count_;
    if (diagnostics_) diagnostics_->begin_pass(pass_count_);
}

AxisMeasure GridLayoutGroup::request_axis_extent(const std::vector<GridCell*>& cells, Axis axis) {
    begin_pass();
    auto hints = collect_hints(cells, axis);
    return measure_axis(hints, map_cells(hints.size(), config_.columns), config_.columns, axis,
                        config_.padding_total(axis), config_.spacing_along(axis), diagnostics_);
}

AxisLayout GridLayoutGroup::layout_axis(const std::vector<GridCell*>& cells,
                                        const AxisMeasure& measure, Axis axis, float available) {
    check_cells(cells);
    AxisLayout result = allocate_axis_layout(measure, cells.size(), config_, axis, available,
                                             diagnostics_);

    for (const auto& placement : result.cells) {
        cells[placement.cell]->place(axis, placement.offset, placement.size);
    }
    if (diagnostics_) {
        diagnostics_->emit(core::Severity::Info, core::Stage::Place,
                           std::to_string(result.cells.size()) + " cells placed on the " +
                               axis_name(axis) + " axis");
    }

    if (verify_passes_) verify(result, cells.size());
    return result;
}

AxisLayout GridLayoutGroup::layout_axis(const std::vector<GridCell*>& cells, Axis axis,
                                        float available) {
    AxisMeasure measure = request_axis_extent(cells, axis);
    return layout_axis(cells, measure, axis, available);
}

void GridLayoutGroup::layout(const std::vector<GridCell*>& cells, float width, float height) {
    layout_axis(cells, Axis::Horizontal, width);
    layout_axis(cells, Axis::Vertical, height);
}

void GridLayoutGroup::verify(const AxisLayout& result, std::size_t cell_count) {
    auto failed = failed_contracts(check_axis_contracts(result, cell_count));
    if (!diagnostics_) return;
    for (const auto& contract : failed) {
        diagnostics_->emit(core::Severity::Error, core::Stage::Verify,
                           contract.name + ": " + contract.detail);
    }
}

} // namespace flexgrid::layout
