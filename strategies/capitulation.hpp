#pragma once

#include "bar.hpp"
#include <vector>

namespace rightv {

/// Panic-selloff signature. A bar is capitulation only when every condition holds:
/// relative_volume > rvol_threshold, vwap_distance_pct < -vwap_distance_threshold,
/// drop_atr > atr_drop_mult and rsi < rsi_threshold.
struct CapitulationParams {
    double rvol_threshold = 1.5;
    double vwap_distance_threshold = 0.5;  // percent below VWAP
    double atr_drop_mult = 3.0;
    double rsi_threshold = 35.0;
};

bool isCapitulation(const IndicatorBar& bar, const CapitulationParams& params = CapitulationParams{});

std::vector<bool> detectCapitulation(const std::vector<IndicatorBar>& bars,
                                     const CapitulationParams& params = CapitulationParams{});

} // namespace rightv
