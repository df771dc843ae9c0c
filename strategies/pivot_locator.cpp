#include "pivot_locator.hpp"
#include <algorithm>

namespace rightv {

std::vector<bool> locatePivotLows(const std::vector<IndicatorBar>& bars,
                                  const std::vector<bool>& capitulation,
                                  const PivotParams& params) {
    std::vector<bool> pivots(bars.size(), false);

    std::vector<std::size_t> caps;
    for (std::size_t i = 0; i < bars.size() && i < capitulation.size(); ++i)
        if (capitulation[i]) caps.push_back(i);

    const std::size_t half = static_cast<std::size_t>(std::max(params.half_window, 0));
    if (half == 0) return pivots;  // empty window: nothing to compare against
    for (std::size_t i = 1; i < caps.size(); ++i) {
        std::size_t start = i > half ? i - half : 0;
        std::size_t end = std::min(caps.size(), i + half);
        double lowest = bars[caps[start]].low;
        for (std::size_t k = start + 1; k < end; ++k)
            lowest = std::min(lowest, bars[caps[k]].low);

        if (bars[caps[i]].low == lowest) {
            pivots[caps[i]] = true;
            break;  // first match ends the scan
        }
    }
    return pivots;
}

} // namespace rightv
