#pragma once

#include "backtester.hpp"
#include "metrics.hpp"
#include "simulator.hpp"
#include <cstdint>
#include <string>
#include <ostream>
#include <iostream>
#include <vector>

namespace rightv {

/// Chart marker: one for the entry and one for the exit of every trade.
struct TradeMarker {
    std::int64_t time{0};
    bool is_entry{true};
    double price{0};
    EntryType entry_type{EntryType::VTurn};      // entry markers
    double pnl_pct{0};                           // exit markers
    ExitReason exit_reason{ExitReason::None};    // exit markers
    std::string text;
};

/// Entry and exit markers in trade order (entry, exit, entry, exit, ...).
std::vector<TradeMarker> buildTradeMarkers(const std::vector<Trade>& trades);

/// Print metrics block (shared by the single-symbol and batch summaries).
void printMetrics(std::ostream& out, const PerformanceMetrics& m);

class Report {
public:
    /// strategy_name and strategy_params are included in report output.
    explicit Report(const SymbolResult& result,
                    const std::string& strategy_name = "",
                    const std::string& strategy_params = "");

    /// Print summary to console.
    void printSummary(std::ostream& out = std::cout) const;

    /// Write trade log CSV to file. Returns false and logs to stderr on failure.
    bool writeTradeLog(const std::string& filepath) const;

    /// Write full report to a text file. Returns false and logs to stderr on failure.
    bool writeReport(const std::string& filepath) const;

    /// Write candle/volume/VWAP/EMA series (keyed by epoch seconds), trade markers,
    /// raw trades and metrics as JSON for the chart viewer. Returns false on failure.
    bool writeChartJson(const std::string& filepath) const;

private:
    void printReportHeader(std::ostream& out) const;

    const SymbolResult& result_;
    std::string strategy_name_;
    std::string strategy_params_;
};

/// Per-symbol table, failures and combined metrics for a batch run.
void printSuiteSummary(std::ostream& out, const SuiteResult& suite,
                       const std::string& strategy_name, const std::string& strategy_params);

/// Same content as printSuiteSummary, to a file. Returns false and logs to stderr on failure.
bool writeSuiteSummary(const std::string& filepath, const SuiteResult& suite,
                       const std::string& strategy_name, const std::string& strategy_params);

} // namespace rightv
