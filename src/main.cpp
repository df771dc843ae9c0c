#include "backtester.hpp"
#include "report.hpp"
#include "data_source.hpp"
#include "time_utils.hpp"
#include "right_side_v_strategy.hpp"
#include <iostream>
#include <string>
#include <filesystem>
#include <sstream>
#include <vector>
#include <memory>
#include <stdexcept>
#include <algorithm>
#include <thread>

namespace fs = std::filesystem;

namespace {

//-----------------------------------------------------------------------------
// Config: all CLI and run options in one place
//-----------------------------------------------------------------------------
struct Config {
    std::string data_dir = "data";
    std::string symbol;                 // single-symbol run when set
    std::vector<std::string> symbols;   // batch subset; empty = every symbol in data_dir
    std::string start_date;
    std::string end_date;
    std::string reports_dir = "reports";
    int threads = 1;

    rightv::RightSideVParams strategy;
};

// Safe parse: on failure set error_msg and return false.
bool parseDouble(const char* s, double& out, std::string& error_msg, const char* flag) {
    try {
        std::size_t pos = 0;
        out = std::stod(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument("");
        return true;
    } catch (const std::exception&) {
        error_msg = std::string("Invalid value for ") + flag + ": \"" + s + "\" (expected number)";
        return false;
    }
}
bool parseInt(const char* s, int& out, std::string& error_msg, const char* flag) {
    try {
        std::size_t pos = 0;
        out = std::stoi(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument("");
        return true;
    } catch (const std::exception&) {
        error_msg = std::string("Invalid value for ") + flag + ": \"" + s + "\" (expected integer)";
        return false;
    }
}

std::vector<std::string> splitList(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string part;
    while (std::getline(iss, part, ','))
        if (!part.empty()) out.push_back(part);
    return out;
}

void printUsage(std::ostream& out) {
    out << "Usage: rightv_backtest [options]\n"
        << "  --data-dir DIR       directory of <SYMBOL>.csv bar files (default: data)\n"
        << "  --symbol SYM         run one symbol and write trades.csv, report.txt, chart.json\n"
        << "  --symbols A,B,C      batch over these symbols (default: all in --data-dir)\n"
        << "  --start DATE         first timestamp to load (YYYY-MM-DD[ HH:MM])\n"
        << "  --end DATE           last timestamp to load\n"
        << "  --rvol X             capitulation relative volume threshold (default 1.5)\n"
        << "  --vwap-dist X        capitulation distance below VWAP, percent (default 0.5)\n"
        << "  --atr-drop X         capitulation drop from 20-bar high in ATRs (default 3.0)\n"
        << "  --rsi-max X          capitulation RSI ceiling (default 35)\n"
        << "  --threads N          symbols processed in parallel (0 = hardware threads)\n"
        << "  --reports-dir DIR    output directory (default: reports)\n";
}

/// Returns false and sets error_msg on parse error.
bool parseArgs(int argc, char* argv[], Config& cfg, std::string& error_msg, bool& show_help) {
    auto& cap = cfg.strategy.capitulation;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() { return i + 1 < argc ? argv[++i] : nullptr; };
        auto missing = [&]() { error_msg = "Missing value for " + arg; return false; };

        if (arg == "--help" || arg == "-h") { show_help = true; }
        else if (arg == "--data-dir") { if (!next()) return missing(); cfg.data_dir = argv[i]; }
        else if (arg == "--symbol") { if (!next()) return missing(); cfg.symbol = argv[i]; }
        else if (arg == "--symbols") { if (!next()) return missing(); cfg.symbols = splitList(argv[i]); }
        else if (arg == "--start") { if (!next()) return missing(); cfg.start_date = argv[i]; }
        else if (arg == "--end") { if (!next()) return missing(); cfg.end_date = argv[i]; }
        else if (arg == "--reports-dir") { if (!next()) return missing(); cfg.reports_dir = argv[i]; }
        else if (arg == "--rvol") { if (!next()) return missing(); if (!parseDouble(argv[i], cap.rvol_threshold, error_msg, "--rvol")) return false; }
        else if (arg == "--vwap-dist") { if (!next()) return missing(); if (!parseDouble(argv[i], cap.vwap_distance_threshold, error_msg, "--vwap-dist")) return false; }
        else if (arg == "--atr-drop") { if (!next()) return missing(); if (!parseDouble(argv[i], cap.atr_drop_mult, error_msg, "--atr-drop")) return false; }
        else if (arg == "--rsi-max") { if (!next()) return missing(); if (!parseDouble(argv[i], cap.rsi_threshold, error_msg, "--rsi-max")) return false; }
        else if (arg == "--threads") { if (!next()) return missing(); if (!parseInt(argv[i], cfg.threads, error_msg, "--threads")) return false; }
        else { error_msg = "Unknown option: " + arg; return false; }
    }
    return true;
}

/// Returns false and sets error_msg if config is invalid.
bool validateConfig(const Config& cfg, rightv::DateRange& range, std::string& error_msg) {
    const auto& cap = cfg.strategy.capitulation;
    if (cap.rvol_threshold < 0) { error_msg = "--rvol must be >= 0"; return false; }
    if (cap.vwap_distance_threshold < 0) { error_msg = "--vwap-dist must be >= 0"; return false; }
    if (cap.atr_drop_mult < 0) { error_msg = "--atr-drop must be >= 0"; return false; }
    if (cap.rsi_threshold < 0 || cap.rsi_threshold > 100) { error_msg = "--rsi-max must be between 0 and 100"; return false; }
    if (cfg.threads < 0) { error_msg = "--threads must be >= 0"; return false; }
    if (!cfg.symbol.empty() && !cfg.symbols.empty()) { error_msg = "use either --symbol or --symbols, not both"; return false; }
    if (!cfg.start_date.empty()) {
        range.start = rightv::parseTimestamp(cfg.start_date);
        if (!range.start) { error_msg = "--start is not a date: \"" + cfg.start_date + "\""; return false; }
    }
    if (!cfg.end_date.empty()) {
        range.end = rightv::parseTimestamp(cfg.end_date);
        if (!range.end) { error_msg = "--end is not a date: \"" + cfg.end_date + "\""; return false; }
        // A bare date as the end bound means the whole day.
        if (cfg.end_date.size() == 10) *range.end += 86399;
    }
    if (range.start && range.end && *range.start > *range.end) { error_msg = "--start is after --end"; return false; }
    return true;
}

//-----------------------------------------------------------------------------
// Single-symbol backtest: run, report, write files
//-----------------------------------------------------------------------------
int runSingle(const Config& cfg, const rightv::Backtester& bt) {
    using namespace rightv;
    SymbolResult result;
    try {
        result = bt.runSymbol(cfg.symbol);
    } catch (const PipelineError& e) {
        std::cerr << "Failed to run backtest: " << e.what() << "\n";
        return 1;
    }
    if (result.data_points == 0)
        std::cerr << "No bars for " << cfg.symbol << " in " << cfg.data_dir << "\n";

    const IStrategy& strategy = bt.strategy();
    Report report(result, strategy.name(), strategy.describeParams());
    report.printSummary(std::cout);

    std::error_code ec;
    fs::create_directories(cfg.reports_dir, ec);
    if (ec) {
        std::cerr << "Cannot create " << cfg.reports_dir << ": " << ec.message() << "\n";
        return 1;
    }
    bool ok = report.writeTradeLog((fs::path(cfg.reports_dir) / "trades.csv").string());
    ok = report.writeReport((fs::path(cfg.reports_dir) / "report.txt").string()) && ok;
    ok = report.writeChartJson((fs::path(cfg.reports_dir) / "chart.json").string()) && ok;
    if (!ok) return 1;
    std::cout << "Reports written to " << cfg.reports_dir << "/\n";
    return 0;
}

//-----------------------------------------------------------------------------
// All-symbols backtest: run per symbol, print table, write summary
//-----------------------------------------------------------------------------
int runAllSymbols(const Config& cfg, const rightv::IBarSource& source, const rightv::Backtester& bt) {
    using namespace rightv;
    std::vector<std::string> symbols = cfg.symbols.empty() ? source.listSymbols() : cfg.symbols;
    if (symbols.empty()) {
        std::cerr << "No symbols found in " << cfg.data_dir << "\n";
        return 1;
    }

    std::size_t threads = static_cast<std::size_t>(cfg.threads);
    if (threads == 0) threads = std::max(1u, std::thread::hardware_concurrency());

    SuiteResult suite = bt.runSuite(symbols, threads);
    if (suite.results.empty()) {
        std::cerr << "All symbols failed.\n";
        return 1;
    }

    const IStrategy& strategy = bt.strategy();
    printSuiteSummary(std::cout, suite, strategy.name(), strategy.describeParams());

    std::error_code ec;
    fs::create_directories(cfg.reports_dir, ec);
    if (ec) {
        std::cerr << "Cannot create " << cfg.reports_dir << ": " << ec.message() << "\n";
        return 1;
    }
    std::string path = (fs::path(cfg.reports_dir) / "all_symbols_summary.txt").string();
    if (!writeSuiteSummary(path, suite, strategy.name(), strategy.describeParams())) return 1;
    std::cout << "Summary written to " << path << "\n";
    return 0;
}

} // namespace

//-----------------------------------------------------------------------------
// main
//-----------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    Config cfg;
    std::string error_msg;
    bool show_help = false;
    if (!parseArgs(argc, argv, cfg, error_msg, show_help)) {
        std::cerr << error_msg << "\n";
        printUsage(std::cerr);
        return 1;
    }
    if (show_help) {
        printUsage(std::cout);
        return 0;
    }
    rightv::DateRange range;
    if (!validateConfig(cfg, range, error_msg)) {
        std::cerr << error_msg << "\n";
        return 1;
    }

    // Resolve default data dir when running from build/
    std::error_code ec;
    if (!fs::is_directory(cfg.data_dir, ec) && fs::is_directory("../" + cfg.data_dir, ec))
        cfg.data_dir = "../" + cfg.data_dir;

    rightv::CsvBarSource source(cfg.data_dir);
    std::shared_ptr<const rightv::IStrategy> strategy = rightv::createRightSideVStrategy(cfg.strategy);
    rightv::Backtester bt(source, strategy, rightv::IndicatorParams{}, rightv::SimulatorParams{}, range);

    if (!cfg.symbol.empty())
        return runSingle(cfg, bt);
    return runAllSymbols(cfg, source, bt);
}
