#include "metrics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace rightv {

PerformanceMetrics computeMetrics(const std::vector<Trade>& trades) {
    PerformanceMetrics m;

    std::vector<const Trade*> closed;
    for (const auto& t : trades)
        if (t.status == TradeStatus::Closed) closed.push_back(&t);
    if (closed.empty()) return m;

    constexpr double INF = std::numeric_limits<double>::infinity();
    int wins = 0, losses = 0;
    double sum_wins = 0, sum_losses = 0, sum_bars = 0;
    double worst = closed.front()->pnl_pct;
    double best = closed.front()->pnl_pct;
    for (const Trade* t : closed) {
        double pnl = t->pnl_pct;
        if (pnl > 0) { ++wins; sum_wins += pnl; }
        else if (pnl < 0) { ++losses; sum_losses += pnl; }
        m.total_pnl += pnl;
        sum_bars += t->bars_held;
        worst = std::min(worst, pnl);
        best = std::max(best, pnl);
        ++m.trades_by_type[t->entry_type];
    }

    m.total_trades = static_cast<int>(closed.size());
    m.win_rate = 100.0 * wins / m.total_trades;
    m.avg_win = wins > 0 ? sum_wins / wins : 0;
    m.avg_loss = losses > 0 ? sum_losses / losses : 0;
    m.profit_factor = losses > 0 ? sum_wins / std::abs(sum_losses) : INF;
    m.max_single_trade_drawdown = worst;
    m.recovery_factor = worst < 0 ? sum_wins / std::abs(worst) : INF;
    m.avg_bars_held = sum_bars / m.total_trades;
    m.largest_win = best;
    m.largest_loss = worst;
    return m;
}

} // namespace rightv
