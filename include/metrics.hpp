#pragma once

#include "simulator.hpp"
#include "strategy.hpp"
#include <map>
#include <vector>

namespace rightv {

/// Summary statistics over closed trades, all in percent of entry price.
/// profit_factor and recovery_factor are +infinity when their denominator is zero.
struct PerformanceMetrics {
    int total_trades{0};
    double win_rate{0};
    double avg_win{0};
    double avg_loss{0};
    double profit_factor{0};
    double total_pnl{0};
    double max_single_trade_drawdown{0};  // worst single trade pnl, not an equity-curve drawdown
    double recovery_factor{0};
    double avg_bars_held{0};
    double largest_win{0};
    double largest_loss{0};
    std::map<EntryType, int> trades_by_type;

    bool empty() const { return total_trades == 0; }
};

/// Aggregate closed trades; open trades are ignored. No trades gives the neutral result.
PerformanceMetrics computeMetrics(const std::vector<Trade>& trades);

} // namespace rightv
