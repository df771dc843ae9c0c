#include "indicators.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace rightv {

namespace {
    constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
}

std::vector<double> trueRange(const std::vector<Bar>& bars) {
    std::vector<double> tr(bars.size(), NaN);
    for (std::size_t i = 0; i < bars.size(); ++i) {
        const Bar& b = bars[i];
        double range = b.high - b.low;
        if (i == 0) {
            tr[i] = range;
            continue;
        }
        double prev_close = bars[i - 1].close;
        tr[i] = std::max({ range, std::abs(b.high - prev_close), std::abs(b.low - prev_close) });
    }
    return tr;
}

std::vector<double> averageTrueRange(const std::vector<Bar>& bars, int period) {
    std::vector<double> atr(bars.size(), NaN);
    if (period <= 0) return atr;
    const std::vector<double> tr = trueRange(bars);
    const auto p = static_cast<std::size_t>(period);
    for (std::size_t i = p - 1; i < tr.size(); ++i) {
        double sum = 0;
        for (std::size_t k = i + 1 - p; k <= i; ++k) sum += tr[k];
        atr[i] = sum / period;
    }
    return atr;
}

std::vector<double> emaClose(const std::vector<Bar>& bars, int span) {
    std::vector<double> ema(bars.size(), NaN);
    if (bars.empty() || span <= 0) return ema;
    const double alpha = 2.0 / (span + 1.0);
    ema[0] = bars[0].close;
    for (std::size_t i = 1; i < bars.size(); ++i)
        ema[i] = alpha * bars[i].close + (1.0 - alpha) * ema[i - 1];
    return ema;
}

std::vector<double> rollingStdDev(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), NaN);
    if (window < 2) return out;
    const auto w = static_cast<std::size_t>(window);
    for (std::size_t i = w - 1; i < values.size(); ++i) {
        std::size_t start = i + 1 - w;
        double mean = 0;
        for (std::size_t k = start; k <= i; ++k) mean += values[k];
        mean /= window;
        double sq_sum = 0;
        for (std::size_t k = start; k <= i; ++k) sq_sum += (values[k] - mean) * (values[k] - mean);
        out[i] = std::sqrt(sq_sum / (window - 1));
    }
    return out;
}

std::vector<double> rollingMax(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), NaN);
    if (window <= 0) return out;
    const auto w = static_cast<std::size_t>(window);
    for (std::size_t i = w - 1; i < values.size(); ++i)
        out[i] = *std::max_element(values.begin() + static_cast<std::ptrdiff_t>(i + 1 - w),
                                   values.begin() + static_cast<std::ptrdiff_t>(i + 1));
    return out;
}

std::vector<IndicatorBar> computeIndicators(const std::vector<Bar>& bars, const IndicatorParams& params) {
    std::vector<double> closes, vwaps;
    closes.reserve(bars.size());
    vwaps.reserve(bars.size());
    for (const auto& b : bars) {
        closes.push_back(b.close);
        vwaps.push_back(b.vwap);
    }

    const auto atr = averageTrueRange(bars, params.atr_period);
    const auto ema = emaClose(bars, params.ema_span);
    const auto vwap_std = rollingStdDev(vwaps, params.vwap_std_window);
    const auto max_close = rollingMax(closes, params.drop_window);

    std::vector<IndicatorBar> out;
    out.reserve(bars.size());
    for (std::size_t i = 0; i < bars.size(); ++i) {
        IndicatorBar ib;
        static_cast<Bar&>(ib) = bars[i];
        ib.atr = atr[i];
        ib.ema_9 = ema[i];
        ib.vwap_distance_pct = (ib.close - ib.vwap) / ib.vwap * 100.0;
        // Denominator is the spread of vwap itself, not of the distance series.
        ib.vwap_distance_std = (ib.close - ib.vwap) / vwap_std[i];
        ib.rolling_max_20 = max_close[i];
        ib.drop_atr = (ib.atr > 0) ? (ib.rolling_max_20 - ib.close) / ib.atr : 0.0;
        out.push_back(std::move(ib));
    }
    return out;
}

} // namespace rightv
