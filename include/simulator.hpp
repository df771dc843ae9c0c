#pragma once

#include "bar.hpp"
#include "strategy.hpp"
#include <vector>
#include <string>
#include <cstddef>
#include <cstdint>

namespace rightv {

enum class TradeStatus { Open, Closed };

enum class ExitReason { None, PrevCandleLow, Eod1500, NextDayForceClose, EndOfSlice };

const char* exitReasonName(ExitReason reason);

/// Single long trade for reporting.
struct Trade {
    std::string symbol;
    std::size_t entry_index{0};
    std::size_t exit_index{0};
    std::string entry_time;
    std::string exit_time;
    std::int64_t entry_epoch{0};
    std::int64_t exit_epoch{0};
    EntryType entry_type{EntryType::VTurn};
    double entry_price{0};
    double initial_stop{0};
    double risk{0};          // entry - initial_stop, floored at min_risk_pct of entry; informational
    double exit_price{0};
    TradeStatus status{TradeStatus::Open};
    double pnl_pct{0};
    int bars_held{0};
    ExitReason exit_reason{ExitReason::None};
};

struct SimulatorParams {
    std::size_t max_slice_bars = 250;  // entry bar included
    int eod_hour = 15;
    double default_stop_pct = 0.02;    // stop below entry when the trigger has none
    double min_risk_pct = 0.01;
};

/// Replays each entry trigger bar by bar. Every trade is independent (no position
/// netting) and is always closed when its replay ends:
///  - a bar on a later calendar date closes at its open (next_day_force_close);
///  - a low under the previous bar's low closes at min(open, that low) (prev_candle_low);
///  - a bar at or after eod_hour closes at its close (eod_1500);
///  - otherwise the last bar of the slice closes at its close (end_of_slice).
class Simulator {
public:
    explicit Simulator(const SimulatorParams& params = SimulatorParams{});

    /// Trades for every triggered bar, in bar order.
    std::vector<Trade> run(const std::vector<IndicatorBar>& bars,
                           const std::vector<EntryTrigger>& triggers,
                           const std::string& symbol = "") const;

    /// Replay one trade entered at bars[entry_index].close.
    Trade simulateTrade(const std::vector<IndicatorBar>& bars, std::size_t entry_index,
                        const EntryTrigger& trigger) const;

    const SimulatorParams& params() const { return params_; }

private:
    SimulatorParams params_;
};

} // namespace rightv
