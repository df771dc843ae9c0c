#include "entry_triggers.hpp"
#include "time_utils.hpp"
#include <algorithm>
#include <set>

namespace rightv {

namespace {

bool isVTurn(const IndicatorBar& bar, double pivot_price, const EntryParams& p) {
    double dist_to_stop = (bar.close - pivot_price) / bar.close;
    return bar.close > bar.ema_9
        && bar.relative_volume > p.vturn_rvol
        && bar.close > bar.open
        && dist_to_stop < p.vturn_max_risk;
}

/// Higher-low breakout at bar i. On match sets stop to the window's lowest low.
bool isHigherLow(const std::vector<IndicatorBar>& bars, std::size_t i, std::size_t pivot_idx,
                 double pivot_price, const EntryParams& p, double& stop) {
    const std::size_t lookback = static_cast<std::size_t>(std::max(p.hl_lookback, 0));
    std::size_t first = std::max(pivot_idx, i >= lookback ? i - lookback : 0);
    if (first >= i) return false;

    double recent_low = bars[first].low;
    double recent_high = bars[first].high;
    for (std::size_t k = first + 1; k < i; ++k) {
        recent_low = std::min(recent_low, bars[k].low);
        recent_high = std::max(recent_high, bars[k].high);
    }
    if (recent_low > pivot_price * p.hl_buffer && bars[i].close > recent_high) {
        stop = recent_low;
        return true;
    }
    return false;
}

} // namespace

std::vector<EntryTrigger> findEntryTriggers(const std::vector<IndicatorBar>& bars,
                                            const std::vector<bool>& capitulation,
                                            const EntryParams& params) {
    const std::size_t n = bars.size();
    std::vector<EntryTrigger> triggers(n);
    if (params.pivot_window <= 0 || params.trigger_window <= 0) return triggers;
    const auto pivot_window = static_cast<std::size_t>(params.pivot_window);
    const auto trigger_window = static_cast<std::size_t>(params.trigger_window);

    // Bars already attributed to an emitted trigger (capitulation bar through entry bar).
    std::set<std::size_t> consumed;

    for (std::size_t cap = 0; cap < n && cap < capitulation.size(); ++cap) {
        if (!capitulation[cap] || consumed.count(cap)) continue;
        if (hourOfDay(bars[cap].time) >= params.cutoff_hour) continue;
        if (cap + pivot_window >= n) continue;

        // Phase 1: pivot = first lowest low of the window starting at the capitulation bar.
        std::size_t pivot_idx = cap;
        for (std::size_t k = cap + 1; k < cap + pivot_window; ++k)
            if (bars[k].low < bars[pivot_idx].low) pivot_idx = k;
        const double pivot_price = bars[pivot_idx].low;

        // Phase 2: trigger search after the pivot.
        const std::size_t end = std::min(n, pivot_idx + trigger_window);
        for (std::size_t i = pivot_idx + 1; i < end; ++i) {
            const IndicatorBar& bar = bars[i];
            if (bar.low < pivot_price) break;  // stop hunt: pattern failed

            EntryTrigger t;
            double hl_stop = 0;
            if (isVTurn(bar, pivot_price, params)) {
                t.triggered = true;
                t.entry_type = EntryType::VTurn;
                t.stop_loss_price = pivot_price;
            } else if (isHigherLow(bars, i, pivot_idx, pivot_price, params, hl_stop)) {
                t.triggered = true;
                t.entry_type = EntryType::HigherLow;
                t.stop_loss_price = hl_stop;
            }

            if (t.triggered) {
                triggers[i] = t;
                for (std::size_t k = cap; k <= i; ++k) consumed.insert(k);
                break;
            }
        }
    }
    return triggers;
}

} // namespace rightv
