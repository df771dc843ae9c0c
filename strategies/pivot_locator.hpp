#pragma once

#include "bar.hpp"
#include <vector>

namespace rightv {

struct PivotParams {
    int half_window = 10;  // capitulation-sequence positions on each side
};

/// Mark the structural pivot low among capitulation bars.
/// Walks the capitulation bars in order by their position in that subsequence; from the
/// second one on, a bar whose low equals the minimum low of positions [i-10, i+10) is a
/// pivot low. Scanning stops at the first match, so at most one bar is ever marked.
std::vector<bool> locatePivotLows(const std::vector<IndicatorBar>& bars,
                                  const std::vector<bool>& capitulation,
                                  const PivotParams& params = PivotParams{});

} // namespace rightv
