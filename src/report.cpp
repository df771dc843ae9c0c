#include "report.hpp"
#include <fstream>
#include <iomanip>
#include <cmath>
#include <sstream>
#include <algorithm>
#include <iostream>

namespace rightv {

namespace {

void writeCsvQuoted(std::ostream& out, const std::string& s) {
    out << '"';
    for (char c : s) {
        if (c == '"') out << "\"\"";
        else out << c;
    }
    out << '"';
}

void writeJsonString(std::ostream& out, const std::string& s) {
    out << '"';
    for (char c : s) {
        if (c == '"') out << "\\\"";
        else if (c == '\\') out << "\\\\";
        else if (c == '\n') out << "\\n";
        else if (c == '\r') out << "\\r";
        else out << c;
    }
    out << '"';
}

// JSON has no NaN/Infinity: undefined indicator values and the infinite ratios become null.
void writeJsonNumber(std::ostream& out, double v) {
    if (std::isfinite(v)) out << v;
    else out << "null";
}

std::string formatPrice(double v) {
    std::ostringstream s;
    s << std::fixed << std::setprecision(2) << v;
    return s.str();
}

void writeTableHeader(std::ostream& out) {
    out << std::setw(10) << "Symbol" << std::setw(8) << "Bars" << std::setw(8) << "Caps"
        << std::setw(8) << "Pivots" << std::setw(10) << "Triggers" << std::setw(8) << "Trades"
        << std::setw(10) << "Win %" << std::setw(12) << "P&L %" << std::setw(10) << "PF" << "\n";
    out << std::string(84, '-') << "\n";
}

void writeTableRow(std::ostream& out, const SymbolResult& r) {
    const auto& m = r.metrics;
    out << std::setw(10) << r.symbol << std::setw(8) << r.data_points << std::setw(8) << r.capitulation_points
        << std::setw(8) << r.pivot_lows << std::setw(10) << r.entry_triggers << std::setw(8) << m.total_trades
        << std::setw(10) << m.win_rate << std::setw(12) << m.total_pnl << std::setw(10) << m.profit_factor << "\n";
}

void writeSuite(std::ostream& out, const SuiteResult& suite,
                const std::string& strategy_name, const std::string& strategy_params) {
    out << "Strategy: " << strategy_name;
    if (!strategy_params.empty()) out << " (" << strategy_params << ")";
    out << "\n\n";
    out << std::fixed << std::setprecision(2);
    writeTableHeader(out);
    for (const auto& r : suite.results) writeTableRow(out, r);
    out << std::string(84, '-') << "\n";
    if (!suite.failures.empty()) {
        out << "Failed symbols (excluded from combined):\n";
        for (const auto& f : suite.failures)
            out << "  " << f.symbol << " [" << stageName(f.stage) << "] " << f.message << "\n";
    }
    out << "\nCombined performance (" << suite.total_trades << " total trades)\n";
    if (suite.combined.empty())
        out << "No trades found - no metrics to display\n";
    else
        printMetrics(out, suite.combined);
}

} // namespace

std::vector<TradeMarker> buildTradeMarkers(const std::vector<Trade>& trades) {
    std::vector<TradeMarker> markers;
    markers.reserve(trades.size() * 2);
    for (const auto& t : trades) {
        TradeMarker entry;
        entry.time = t.entry_epoch;
        entry.is_entry = true;
        entry.price = t.entry_price;
        entry.entry_type = t.entry_type;
        entry.text = std::string("Buy ") + entryTypeName(t.entry_type) + " @ " + formatPrice(t.entry_price);
        markers.push_back(entry);

        if (t.status != TradeStatus::Closed) continue;
        TradeMarker exit;
        exit.time = t.exit_epoch;
        exit.is_entry = false;
        exit.price = t.exit_price;
        exit.entry_type = t.entry_type;
        exit.pnl_pct = t.pnl_pct;
        exit.exit_reason = t.exit_reason;
        exit.text = std::string("Sell (") + exitReasonName(t.exit_reason) + ") " + formatPrice(t.pnl_pct) + "%";
        markers.push_back(exit);
    }
    return markers;
}

void printMetrics(std::ostream& out, const PerformanceMetrics& m) {
    out << std::fixed << std::setprecision(2);
    out << "Closed trades:   " << m.total_trades << "\n";
    out << "Win rate:        " << m.win_rate << "%\n";
    out << "Profit factor:   " << m.profit_factor << "\n";
    out << "Total P&L:       " << m.total_pnl << "%\n";
    out << "Max drawdown:    " << m.max_single_trade_drawdown << "% (worst single trade)\n";
    out << "Recovery factor: " << m.recovery_factor << "\n";
    out << "Avg win:         " << m.avg_win << "%\n";
    out << "Avg loss:        " << m.avg_loss << "%\n";
    out << std::setprecision(1);
    out << "Avg bars held:   " << m.avg_bars_held << "\n";
    out << std::setprecision(2);
    out << "Largest win:     " << m.largest_win << "%\n";
    out << "Largest loss:    " << m.largest_loss << "%\n";
    out << "Trade types:    ";
    if (m.trades_by_type.empty()) out << " -";
    for (const auto& [type, count] : m.trades_by_type)
        out << " " << entryTypeName(type) << "=" << count;
    out << "\n";
}

Report::Report(const SymbolResult& result, const std::string& strategy_name, const std::string& strategy_params)
    : result_(result), strategy_name_(strategy_name), strategy_params_(strategy_params) {}

void Report::printReportHeader(std::ostream& out) const {
    if (!strategy_name_.empty()) {
        out << "Strategy: " << strategy_name_;
        if (!strategy_params_.empty()) out << " (" << strategy_params_ << ")";
        out << "\n";
    }
    out << "Symbol:             " << result_.symbol << "\n";
    out << "Bars loaded:        " << result_.data_points << "\n";
    out << "Capitulation bars:  " << result_.capitulation_points << "\n";
    out << "Pivot lows:         " << result_.pivot_lows << "\n";
    out << "Entry triggers:     " << result_.entry_triggers << "\n";
}

void Report::printSummary(std::ostream& out) const {
    out << "\n========== Backtest Report ==========\n";
    printReportHeader(out);
    if (result_.metrics.empty())
        out << "No trades found - no metrics to display\n";
    else
        printMetrics(out, result_.metrics);
    out << "======================================\n\n";
}

bool Report::writeTradeLog(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << static_cast<char>(0xEF) << static_cast<char>(0xBB) << static_cast<char>(0xBF);
    f << "symbol,entry_time,entry_price,initial_stop,entry_type,exit_time,exit_price,status,pnl_pct,bars_held,exit_reason\n";
    f << std::fixed << std::setprecision(4);
    for (const auto& t : result_.trades) {
        writeCsvQuoted(f, t.symbol);
        f << ',';
        writeCsvQuoted(f, t.entry_time);
        f << ',' << t.entry_price << ',' << t.initial_stop << ',' << entryTypeName(t.entry_type) << ',';
        writeCsvQuoted(f, t.exit_time);
        f << ',' << t.exit_price << ',' << (t.status == TradeStatus::Closed ? "closed" : "open") << ','
          << t.pnl_pct << ',' << t.bars_held << ',' << exitReasonName(t.exit_reason) << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write trade log: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeReport(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "Backtest Report\n";
    f << "================\n\n";
    printReportHeader(f);
    f << "\n";
    if (result_.metrics.empty())
        f << "No trades found - no metrics to display\n";
    else
        printMetrics(f, result_.metrics);
    if (!f) {
        std::cerr << "Failed to write report: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeChartJson(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    const auto& bars = result_.bars;
    f << std::fixed << std::setprecision(4);
    f << "{\n  \"symbol\": ";
    writeJsonString(f, result_.symbol);
    f << ",\n  \"strategy\": ";
    writeJsonString(f, strategy_name_);
    f << ",\n  \"params\": ";
    writeJsonString(f, strategy_params_);

    f << ",\n  \"ohlc\": [\n";
    for (std::size_t i = 0; i < bars.size(); ++i) {
        const auto& b = bars[i];
        f << "    {\"time\":" << b.time << ",\"open\":" << b.open << ",\"high\":" << b.high
          << ",\"low\":" << b.low << ",\"close\":" << b.close << "}";
        f << (i + 1 < bars.size() ? ",\n" : "\n");
    }
    f << "  ],\n  \"volume\": [\n";
    for (std::size_t i = 0; i < bars.size(); ++i) {
        const auto& b = bars[i];
        f << "    {\"time\":" << b.time << ",\"value\":";
        writeJsonNumber(f, b.volume);
        f << ",\"up\":" << (b.close >= b.open ? "true" : "false") << "}";
        f << (i + 1 < bars.size() ? ",\n" : "\n");
    }
    // VWAP and EMA series skip undefined points.
    f << "  ],\n  \"vwap\": [";
    bool first = true;
    for (const auto& b : bars) {
        if (!std::isfinite(b.vwap)) continue;
        f << (first ? "\n" : ",\n") << "    {\"time\":" << b.time << ",\"value\":" << b.vwap << "}";
        first = false;
    }
    f << "\n  ],\n  \"ema\": [";
    first = true;
    for (const auto& b : bars) {
        if (!std::isfinite(b.ema_9)) continue;
        f << (first ? "\n" : ",\n") << "    {\"time\":" << b.time << ",\"value\":" << b.ema_9 << "}";
        first = false;
    }

    f << "\n  ],\n  \"markers\": [\n";
    const auto markers = buildTradeMarkers(result_.trades);
    for (std::size_t i = 0; i < markers.size(); ++i) {
        const auto& m = markers[i];
        f << "    {\"time\":" << m.time << ",\"kind\":\"" << (m.is_entry ? "entry" : "exit") << "\""
          << ",\"position\":\"" << (m.is_entry ? "belowBar" : "aboveBar") << "\""
          << ",\"price\":" << m.price;
        if (m.is_entry)
            f << ",\"entry_type\":\"" << entryTypeName(m.entry_type) << "\"";
        else
            f << ",\"pnl_pct\":" << m.pnl_pct << ",\"exit_reason\":\"" << exitReasonName(m.exit_reason) << "\"";
        f << ",\"text\":";
        writeJsonString(f, m.text);
        f << "}" << (i + 1 < markers.size() ? ",\n" : "\n");
    }

    f << "  ],\n  \"trades\": [\n";
    const auto& trades = result_.trades;
    for (std::size_t i = 0; i < trades.size(); ++i) {
        const auto& t = trades[i];
        f << "    {\"entry_time\":";
        writeJsonString(f, t.entry_time);
        f << ",\"entry_price\":" << t.entry_price << ",\"initial_stop\":" << t.initial_stop
          << ",\"type\":\"" << entryTypeName(t.entry_type) << "\",\"exit_time\":";
        writeJsonString(f, t.exit_time);
        f << ",\"exit_price\":" << t.exit_price
          << ",\"status\":\"" << (t.status == TradeStatus::Closed ? "closed" : "open") << "\""
          << ",\"pnl_pct\":" << t.pnl_pct << ",\"bars_held\":" << t.bars_held
          << ",\"exit_reason\":\"" << exitReasonName(t.exit_reason) << "\"}";
        f << (i + 1 < trades.size() ? ",\n" : "\n");
    }

    const auto& m = result_.metrics;
    f << "  ],\n  \"metrics\": {\"total_trades\":" << m.total_trades << ",\"win_rate\":" << m.win_rate
      << ",\"avg_win\":" << m.avg_win << ",\"avg_loss\":" << m.avg_loss << ",\"profit_factor\":";
    writeJsonNumber(f, m.profit_factor);
    f << ",\"total_pnl\":" << m.total_pnl << ",\"max_drawdown\":" << m.max_single_trade_drawdown
      << ",\"recovery_factor\":";
    writeJsonNumber(f, m.recovery_factor);
    f << ",\"avg_bars_held\":" << m.avg_bars_held << ",\"largest_win\":" << m.largest_win
      << ",\"largest_loss\":" << m.largest_loss << ",\"trades_by_type\":{";
    first = true;
    for (const auto& [type, count] : m.trades_by_type) {
        f << (first ? "" : ",") << "\"" << entryTypeName(type) << "\":" << count;
        first = false;
    }
    f << "}}\n}\n";
    if (!f) {
        std::cerr << "Failed to write chart JSON: " << filepath << "\n";
        return false;
    }
    return true;
}

void printSuiteSummary(std::ostream& out, const SuiteResult& suite,
                       const std::string& strategy_name, const std::string& strategy_params) {
    out << "\n========== Backtest (all symbols) ==========\n";
    writeSuite(out, suite, strategy_name, strategy_params);
    out << "============================================\n\n";
}

bool writeSuiteSummary(const std::string& filepath, const SuiteResult& suite,
                       const std::string& strategy_name, const std::string& strategy_params) {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "Backtest all symbols\n";
    writeSuite(f, suite, strategy_name, strategy_params);
    if (!f) {
        std::cerr << "Failed to write summary: " << filepath << "\n";
        return false;
    }
    return true;
}

} // namespace rightv
