#include "simulator.hpp"
#include "time_utils.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace rightv {

namespace {

void closeTrade(Trade& t, const IndicatorBar& bar, std::size_t index, double price, ExitReason reason) {
    t.status = TradeStatus::Closed;
    t.exit_index = index;
    t.exit_time = bar.timestamp;
    t.exit_epoch = bar.time;
    t.exit_price = price;
    t.exit_reason = reason;
}

} // namespace

const char* exitReasonName(ExitReason reason) {
    switch (reason) {
        case ExitReason::None: return "none";
        case ExitReason::PrevCandleLow: return "prev_candle_low";
        case ExitReason::Eod1500: return "eod_1500";
        case ExitReason::NextDayForceClose: return "next_day_force_close";
        case ExitReason::EndOfSlice: return "end_of_slice";
    }
    return "unknown";
}

Simulator::Simulator(const SimulatorParams& params) : params_(params) {}

std::vector<Trade> Simulator::run(const std::vector<IndicatorBar>& bars,
                                  const std::vector<EntryTrigger>& triggers,
                                  const std::string& symbol) const {
    std::vector<Trade> trades;
    const std::size_t n = std::min(bars.size(), triggers.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (!triggers[i].triggered) continue;
        Trade t = simulateTrade(bars, i, triggers[i]);
        t.symbol = symbol;
        trades.push_back(std::move(t));
    }
    return trades;
}

Trade Simulator::simulateTrade(const std::vector<IndicatorBar>& bars, std::size_t entry_index,
                               const EntryTrigger& trigger) const {
    if (entry_index >= bars.size())
        throw std::out_of_range("entry index " + std::to_string(entry_index) + " past end of bars");

    const IndicatorBar& entry_bar = bars[entry_index];
    Trade t;
    t.entry_index = entry_index;
    t.entry_time = entry_bar.timestamp;
    t.entry_epoch = entry_bar.time;
    t.entry_type = trigger.entry_type;
    t.entry_price = entry_bar.close;
    t.initial_stop = std::isnan(trigger.stop_loss_price)
        ? t.entry_price * (1.0 - params_.default_stop_pct)
        : trigger.stop_loss_price;
    t.risk = t.entry_price - t.initial_stop;
    if (t.risk <= 0) t.risk = t.entry_price * params_.min_risk_pct;

    const std::int64_t entry_day = dayNumber(entry_bar.time);
    const std::size_t slice_end = std::min(bars.size(), entry_index + std::max<std::size_t>(params_.max_slice_bars, 1));

    for (std::size_t i = entry_index + 1; i < slice_end; ++i) {
        const IndicatorBar& bar = bars[i];
        if (dayNumber(bar.time) != entry_day) {
            closeTrade(t, bar, i, bar.open, ExitReason::NextDayForceClose);
            break;
        }
        ++t.bars_held;

        // Trailing stop: previous candle's low.
        double stop = bars[i - 1].low;
        if (bar.low < stop) {
            closeTrade(t, bar, i, std::min(bar.open, stop), ExitReason::PrevCandleLow);
            break;
        }
        if (hourOfDay(bar.time) >= params_.eod_hour) {
            closeTrade(t, bar, i, bar.close, ExitReason::Eod1500);
            break;
        }
    }

    if (t.status == TradeStatus::Open) {
        std::size_t last = slice_end - 1;
        closeTrade(t, bars[last], last, bars[last].close, ExitReason::EndOfSlice);
    }

    t.pnl_pct = (t.exit_price - t.entry_price) / t.entry_price * 100.0;
    return t;
}

} // namespace rightv
