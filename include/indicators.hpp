#pragma once

#include "bar.hpp"
#include <vector>

namespace rightv {

struct IndicatorParams {
    int atr_period = 14;
    int ema_span = 9;
    int vwap_std_window = 20;  // rolling std of vwap for vwap_distance_std
    int drop_window = 20;      // rolling max close for drop_atr
};

/// True range per bar; the first bar uses high - low.
std::vector<double> trueRange(const std::vector<Bar>& bars);

/// Simple rolling mean of true range. NaN for the first period-1 bars.
std::vector<double> averageTrueRange(const std::vector<Bar>& bars, int period = 14);

/// Recursive EMA of close, alpha = 2/(span+1), seeded with the first close.
std::vector<double> emaClose(const std::vector<Bar>& bars, int span = 9);

/// Sample standard deviation over a trailing window. NaN until window values exist.
std::vector<double> rollingStdDev(const std::vector<double>& values, int window);

/// Maximum over a trailing window, inclusive. NaN until window values exist.
std::vector<double> rollingMax(const std::vector<double>& values, int window);

/// Derive every indicator field. Produces a new sequence; input is not modified.
std::vector<IndicatorBar> computeIndicators(const std::vector<Bar>& bars,
                                            const IndicatorParams& params = IndicatorParams{});

} // namespace rightv
