#pragma once

#include "bar.hpp"
#include "strategy.hpp"
#include "data_source.hpp"
#include "indicators.hpp"
#include "simulator.hpp"
#include "metrics.hpp"
#include "errors.hpp"
#include <memory>
#include <string>
#include <vector>

namespace rightv {

/// Everything one symbol's run produced. An empty store gives zero counts and no trades.
struct SymbolResult {
    std::string symbol;
    std::vector<IndicatorBar> bars;
    SignalSet signals;
    std::vector<Trade> trades;
    std::size_t data_points{0};
    std::size_t capitulation_points{0};
    std::size_t pivot_lows{0};
    std::size_t entry_triggers{0};
    PerformanceMetrics metrics;
};

struct SymbolFailure {
    std::string symbol;
    Stage stage{Stage::Load};
    std::string message;
};

struct SuiteResult {
    std::vector<SymbolResult> results;    // symbols that ran, in request order
    std::vector<SymbolFailure> failures;  // excluded from combined metrics
    PerformanceMetrics combined;          // over the union of all trades
    std::size_t total_trades{0};
};

/// Sequences load -> validate -> indicators -> signals -> simulation -> metrics per symbol.
/// Holds no per-run state, so one instance can serve several threads.
class Backtester {
public:
    Backtester(const IBarSource& source,
               std::shared_ptr<const IStrategy> strategy,
               const IndicatorParams& indicators = IndicatorParams{},
               const SimulatorParams& simulator = SimulatorParams{},
               const DateRange& range = DateRange{});

    /// Load and run one symbol. Throws PipelineError naming the failing stage.
    SymbolResult runSymbol(const std::string& symbol) const;

    /// Run the pipeline on bars already in memory. Throws PipelineError.
    SymbolResult runBars(const std::string& symbol, const std::vector<Bar>& bars) const;

    /// Run every symbol independently, up to max_threads at a time (0 or 1 = sequential).
    /// A failing symbol is logged to stderr and recorded in failures; the batch continues.
    SuiteResult runSuite(const std::vector<std::string>& symbols, std::size_t max_threads = 1) const;

    const IStrategy& strategy() const { return *strategy_; }

private:
    const IBarSource& source_;
    std::shared_ptr<const IStrategy> strategy_;
    IndicatorParams indicator_params_;
    Simulator simulator_;
    DateRange range_;
};

} // namespace rightv
