#pragma once
#include <flexgrid/layout/grid_layout.h>
#include <cstddef>
#include <string>
#include <vector>

namespace flexgrid::layout {

struct ContractResult {
    std::string name;
    bool passed = false;
    std::string detail;
};

// Invariants of a finished axis pass, in this order:
//   metrics_ordered    every line has min <= preferred
//   minimum_honored    every line got at least its min
//   offsets_monotonic  lines start at the padding and never overlap
//   space_conserved    no space lost when some line can absorb it, none
//                      invented otherwise
//   cells_placed       one placement per cell, on its line's geometry
// `cell_count` is the number of cells the pass was given.
std::vector<ContractResult> check_axis_contracts(const AxisLayout& layout,
                                                 std::size_t cell_count);

std::vector<ContractResult> failed_contracts(const std::vector<ContractResult>& results);

} // namespace flexgrid::layout
