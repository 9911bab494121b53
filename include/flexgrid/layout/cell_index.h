#pragma once
#include <flexgrid/layout/grid_types.h>
#include <cstddef>
#include <vector>

namespace flexgrid::layout {

// Lower bound on the column count; anything below it cannot place cells.
int clamp_columns(int columns);

// Row-major coordinate of the cell at linear index `index`.
// The functions below throw std::invalid_argument when `columns` < 1; use
// clamp_columns on untrusted configuration first.
GridPosition grid_position(std::size_t index, int columns);

// ceil(cell_count / columns); 0 for an empty grid.
int row_count(std::size_t cell_count, int columns);

// Number of columns (horizontal) or rows (vertical) an axis pass sizes.
int line_count(std::size_t cell_count, int columns, Axis axis);

inline int line_index(const GridPosition& position, Axis axis) {
    return axis == Axis::Horizontal ? position.column : position.row;
}

std::vector<GridPosition> map_cells(std::size_t cell_count, int columns);

} // namespace flexgrid::layout
