#pragma once

#include <string>
#include <cstdint>
#include <limits>

namespace rightv {

/// Single OHLCV bar with the externally supplied per-bar fields.
/// relative_volume, rsi and vwap come from the upstream store and are never recomputed.
struct Bar {
    std::string timestamp;  // e.g. "2024-01-02 09:30:00" (exchange wall clock)
    std::int64_t time{0};   // epoch seconds of timestamp
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};
    double relative_volume{std::numeric_limits<double>::quiet_NaN()};
    double rsi{std::numeric_limits<double>::quiet_NaN()};
    double vwap{std::numeric_limits<double>::quiet_NaN()};
};

/// Bar plus derived indicator fields. NaN until enough history exists.
struct IndicatorBar : Bar {
    double atr{std::numeric_limits<double>::quiet_NaN()};
    double ema_9{std::numeric_limits<double>::quiet_NaN()};
    double vwap_distance_pct{std::numeric_limits<double>::quiet_NaN()};
    double vwap_distance_std{std::numeric_limits<double>::quiet_NaN()};
    double rolling_max_20{std::numeric_limits<double>::quiet_NaN()};
    double drop_atr{0};
};

} // namespace rightv
