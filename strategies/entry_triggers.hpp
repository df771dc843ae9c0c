#pragma once

#include "bar.hpp"
#include "strategy.hpp"
#include <vector>

namespace rightv {

/// Forward scan from each capitulation bar.
/// Phase 1: the lowest low of pivot_window bars starting at the capitulation bar is the pivot.
/// Phase 2: from the bar after the pivot, up to trigger_window - 1 bars, look for
///   v_turn:     close > EMA9, relative_volume > vturn_rvol, green bar, (close - pivot)/close < vturn_max_risk
///   higher_low: lows of the prior hl_lookback bars (not before the pivot) all above pivot * hl_buffer,
///               and close above their highest high.
/// Any low under the pivot invalidates the candidate (stop hunt).
struct EntryParams {
    int cutoff_hour = 15;        // no entries from capitulation bars at or after this hour
    int pivot_window = 20;
    int trigger_window = 40;
    double vturn_rvol = 1.5;
    double vturn_max_risk = 0.025;
    int hl_lookback = 5;
    double hl_buffer = 1.0005;
};

/// One trigger per bar index; at most one trigger per capitulation cluster.
std::vector<EntryTrigger> findEntryTriggers(const std::vector<IndicatorBar>& bars,
                                            const std::vector<bool>& capitulation,
                                            const EntryParams& params = EntryParams{});

} // namespace rightv
