#include "capitulation.hpp"

namespace rightv {

bool isCapitulation(const IndicatorBar& bar, const CapitulationParams& params) {
    // NaN fields fail every comparison, so bars without enough history never qualify.
    return bar.relative_volume > params.rvol_threshold
        && bar.vwap_distance_pct < -params.vwap_distance_threshold
        && bar.drop_atr > params.atr_drop_mult
        && bar.rsi < params.rsi_threshold;
}

std::vector<bool> detectCapitulation(const std::vector<IndicatorBar>& bars, const CapitulationParams& params) {
    std::vector<bool> flags(bars.size(), false);
    for (std::size_t i = 0; i < bars.size(); ++i)
        flags[i] = isCapitulation(bars[i], params);
    return flags;
}

} // namespace rightv
