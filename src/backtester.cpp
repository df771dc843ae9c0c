#include "backtester.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <optional>
#include <utility>

namespace rightv {

namespace {

/// Run one stage, turning any library exception into a PipelineError for that stage.
template <typename Fn>
auto runStage(Stage stage, const std::string& symbol, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const PipelineError&) {
        throw;
    } catch (const std::exception& e) {
        throw PipelineError(stage, symbol, e.what());
    }
}

struct Outcome {
    std::optional<SymbolResult> result;
    std::optional<SymbolFailure> failure;
};

} // namespace

Backtester::Backtester(const IBarSource& source,
                       std::shared_ptr<const IStrategy> strategy,
                       const IndicatorParams& indicators,
                       const SimulatorParams& simulator,
                       const DateRange& range)
    : source_(source)
    , strategy_(std::move(strategy))
    , indicator_params_(indicators)
    , simulator_(simulator)
    , range_(range)
{
    if (!strategy_) throw std::invalid_argument("Backtester requires a strategy");
}

SymbolResult Backtester::runSymbol(const std::string& symbol) const {
    std::vector<Bar> bars = runStage(Stage::Load, symbol, [&] {
        return source_.loadBars(symbol, range_);
    });
    return runBars(symbol, bars);
}

SymbolResult Backtester::runBars(const std::string& symbol, const std::vector<Bar>& bars) const {
    SymbolResult r;
    r.symbol = symbol;
    r.data_points = bars.size();
    if (bars.empty()) return r;

    if (auto problem = validateBars(bars))
        throw PipelineError(Stage::Validate, symbol, *problem);

    r.bars = runStage(Stage::Indicators, symbol, [&] {
        return computeIndicators(bars, indicator_params_);
    });
    r.signals = runStage(Stage::Signals, symbol, [&] {
        return strategy_->generateSignals(r.bars);
    });
    if (r.signals.capitulation.size() != r.bars.size() || r.signals.pivot_low.size() != r.bars.size() ||
        r.signals.triggers.size() != r.bars.size())
        throw PipelineError(Stage::Signals, symbol, "signal series length does not match bar count");

    r.trades = runStage(Stage::Simulation, symbol, [&] {
        return simulator_.run(r.bars, r.signals.triggers, symbol);
    });
    r.metrics = runStage(Stage::Metrics, symbol, [&] {
        return computeMetrics(r.trades);
    });

    r.capitulation_points = r.signals.capitulationCount();
    r.pivot_lows = r.signals.pivotCount();
    r.entry_triggers = r.signals.triggerCount();
    return r;
}

SuiteResult Backtester::runSuite(const std::vector<std::string>& symbols, std::size_t max_threads) const {
    auto runOne = [this](const std::string& symbol) {
        Outcome o;
        try {
            o.result = runSymbol(symbol);
        } catch (const PipelineError& e) {
            o.failure = SymbolFailure{ symbol, e.stage(), e.detail() };
        }
        return o;
    };

    std::vector<Outcome> outcomes;
    outcomes.reserve(symbols.size());
    if (max_threads <= 1) {
        for (const auto& s : symbols) outcomes.push_back(runOne(s));
    } else {
        // Batches of max_threads symbols; each symbol's state lives only in its own task.
        for (std::size_t start = 0; start < symbols.size(); start += max_threads) {
            std::size_t end = std::min(symbols.size(), start + max_threads);
            std::vector<std::future<Outcome>> futures;
            for (std::size_t i = start; i < end; ++i)
                futures.push_back(std::async(std::launch::async, runOne, symbols[i]));
            for (auto& f : futures) outcomes.push_back(f.get());
        }
    }

    SuiteResult suite;
    std::vector<Trade> combined;
    for (auto& o : outcomes) {
        if (o.failure) {
            const auto& f = *o.failure;
            std::cerr << "Skipped " << f.symbol << ": " << stageName(f.stage) << " failed: " << f.message << "\n";
            suite.failures.push_back(std::move(*o.failure));
            continue;
        }
        combined.insert(combined.end(), o.result->trades.begin(), o.result->trades.end());
        suite.results.push_back(std::move(*o.result));
    }
    suite.total_trades = combined.size();
    suite.combined = computeMetrics(combined);
    return suite;
}

} // namespace rightv
