#pragma once
#include <flexgrid/layout/axis_sizer.h>
#include <flexgrid/layout/grid_types.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace flexgrid::core {
class DiagnosticEmitter;
}

namespace flexgrid::layout {

// A layout participant owned by the host. The grid only asks it for its
// size hints and tells it where it goes.
class GridCell {
public:
    virtual ~GridCell() = default;

    // Called once per axis per pass.
    virtual SizeHint size_hint(Axis axis) const = 0;

    // Must not start another layout pass.
    virtual void place(Axis axis, float offset, float size) = 0;
};

// Result of one axis pass.
struct AxisLayout {
    Axis axis = Axis::Horizontal;
    float available = 0;
    float padding_start = 0;
    float padding_end = 0;
    float spacing = 0;
    AxisMeasure measure;
    std::vector<Allocation> lines;
    std::vector<CellPlacement> cells;
};

// Clamp columns to >= 1 and negative spacing/padding to 0.
GridConfig normalize_config(const GridConfig& config,
                            core::DiagnosticEmitter* diagnostics = nullptr);

// Allocate and place `cell_count` cells from an already measured axis. Pure.
// Throws std::invalid_argument when `measure` does not fit the cell count
// and column count.
AxisLayout allocate_axis_layout(const AxisMeasure& measure, std::size_t cell_count,
                                const GridConfig& config, Axis axis, float available,
                                core::DiagnosticEmitter* diagnostics = nullptr);

// Measure, then allocate_axis_layout. Pure: nothing is placed.
AxisLayout compute_axis_layout(const std::vector<SizeHint>& hints,
                               const GridConfig& config, Axis axis, float available,
                               core::DiagnosticEmitter* diagnostics = nullptr);

// Deterministic text form of a pass, e.g.
//   {axis:horizontal available:30 lines:[0+10 10+20] cells:[0@0 1@1]}
std::string serialize_axis_layout(const AxisLayout& layout);

// Container side of the grid: owns the configuration and drives passes over
// a caller-supplied, ordered sequence of cells.
class GridLayoutGroup {
public:
    GridLayoutGroup() = default;
    explicit GridLayoutGroup(const GridConfig& config);

    void set_columns(int columns);
    int columns() const { return config_.columns; }

    void set_spacing(const Spacing& spacing);
    const Spacing& spacing() const { return config_.spacing; }

    void set_padding(const EdgeInsets& padding);
    const EdgeInsets& padding() const { return config_.padding; }

    const GridConfig& config() const { return config_; }

    // Optional sink for warnings and pass summaries. Not owned.
    void set_diagnostics(core::DiagnosticEmitter* diagnostics) { diagnostics_ = diagnostics; }

    // Check layout invariants after each pass and report failures as errors.
    void set_verify_passes(bool verify) { verify_passes_ = verify; }
    bool verify_passes() const { return verify_passes_; }

    // Starts a pass: queries every cell's hint once and measures the axis.
    // `totals` is the desired extent to request from the container's parent;
    // hand the whole measure back to layout_axis once space is granted.
    AxisMeasure request_axis_extent(const std::vector<GridCell*>& cells, Axis axis);

    // Finishes the pass started by request_axis_extent without querying the
    // cells again. `cells` and the configuration must not have changed.
    AxisLayout layout_axis(const std::vector<GridCell*>& cells, const AxisMeasure& measure,
                           Axis axis, float available);

    // A whole pass for hosts that already know the available space.
    AxisLayout layout_axis(const std::vector<GridCell*>& cells, Axis axis, float available);

    // Horizontal pass, then vertical pass.
    void layout(const std::vector<GridCell*>& cells, float width, float height);

    std::uint64_t pass_count() const { return pass_count_; }

private:
    static void check_cells(const std::vector<GridCell*>& cells);
    std::vector<SizeHint> collect_hints(const std::vector<GridCell*>& cells, Axis axis) const;
    void begin_pass();
    void verify(const AxisLayout& result, std::size_t cell_count);

    GridConfig config_;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
    bool verify_passes_ = false;
    std::uint64_t pass_count_ = 0;
};

} // namespace flexgrid::layout
