#include <flexgrid/layout/cell_index.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace flexgrid::layout {

namespace {

std::size_t checked_columns(int columns, const char* caller) {
    if (columns < core::config::kMinColumns) {
        throw std::invalid_argument(std::string(caller) + ": " + std::to_string(columns) +
                                    " columns");
    }
    return static_cast<std::size_t>(columns);
}

} // namespace

const char* axis_name(Axis axis) {
    switch (axis) {
        case Axis::Horizontal: return "horizontal";
        case Axis::Vertical:   return "vertical";
    }
    return "unknown";
}

int clamp_columns(int columns) {
    return std::max(columns, core::config::kMinColumns);
}

GridPosition grid_position(std::size_t index, int columns) {
    auto c = checked_columns(columns, "grid_position");
    return {static_cast<int>(index % c), static_cast<int>(index / c)};
}

int row_count(std::size_t cell_count, int columns) {
    auto c = checked_columns(columns, "row_count");
    if (cell_count == 0) return 0;
    // Round up so a partially filled last row still counts.
    return static_cast<int>((cell_count - 1) / c) + 1;
}

int line_count(std::size_t cell_count, int columns, Axis axis) {
    if (axis == Axis::Vertical) return row_count(cell_count, columns);
    checked_columns(columns, "line_count");
    return cell_count == 0 ? 0 : columns;
}

std::vector<GridPosition> map_cells(std::size_t cell_count, int columns) {
    auto c = checked_columns(columns, "map_cells");
    std::vector<GridPosition> positions;
    positions.reserve(cell_count);
    for (std::size_t i = 0; i < cell_count; ++i) {
        positions.push_back({static_cast<int>(i % c), static_cast<int>(i / c)});
    }
    return positions;
}

} // namespace flexgrid::layout
