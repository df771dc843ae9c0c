#include "data_source.hpp"
#include "errors.hpp"
#include "time_utils.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace rightv {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> parts;
    std::istringstream iss(line);
    std::string part;
    while (std::getline(iss, part, delim)) {
        parts.push_back(trim(part));
    }
    return parts;
}

void toLower(std::string& s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

int findColumn(const std::vector<std::string>& headers, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        for (std::size_t i = 0; i < headers.size(); ++i) {
            if (headers[i] == name) return static_cast<int>(i);
        }
    }
    return -1;
}

bool parseNumber(const std::vector<std::string>& parts, int col, double& out) {
    if (col < 0 || static_cast<std::size_t>(col) >= parts.size()) return false;
    const std::string& s = parts[static_cast<std::size_t>(col)];
    if (s.empty()) return false;
    try {
        std::size_t pos = 0;
        out = std::stod(s, &pos);
        return pos == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

DataSource::DataSource(const std::string& filepath) : filepath_(filepath) {}

bool DataSource::exists() const {
    std::error_code ec;
    return fs::is_regular_file(filepath_, ec) && !ec;
}

bool DataSource::load() {
    bars_.clear();
    error_.clear();
    std::ifstream f(filepath_);
    if (!f.is_open()) {
        error_ = "cannot open " + filepath_;
        return false;
    }

    std::string line;
    if (!std::getline(f, line)) return true;  // empty file = no bars
    // Strip UTF-8 BOM written by spreadsheet exports.
    if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
        static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF)
        line.erase(0, 3);
    std::vector<std::string> headers = split(line, ',');
    for (auto& h : headers) toLower(h);

    Columns cols;
    cols.timestamp = findColumn(headers, {"timestamp", "date", "datetime", "time"});
    cols.open = findColumn(headers, {"open", "open_price", "o"});
    cols.high = findColumn(headers, {"high", "high_price", "h"});
    cols.low = findColumn(headers, {"low", "low_price", "l"});
    cols.close = findColumn(headers, {"close", "close_price", "c"});
    cols.volume = findColumn(headers, {"volume", "vol", "v"});
    cols.relative_volume = findColumn(headers, {"relative_volume", "rvol"});
    cols.rsi = findColumn(headers, {"rsi"});
    cols.vwap = findColumn(headers, {"vwap"});

    std::vector<std::string> missing;
    if (cols.timestamp < 0) missing.push_back("timestamp");
    if (cols.open < 0) missing.push_back("open");
    if (cols.high < 0) missing.push_back("high");
    if (cols.low < 0) missing.push_back("low");
    if (cols.close < 0) missing.push_back("close");
    if (cols.relative_volume < 0) missing.push_back("relative_volume");
    if (cols.rsi < 0) missing.push_back("rsi");
    if (cols.vwap < 0) missing.push_back("vwap");
    if (!missing.empty()) {
        error_ = filepath_ + ": missing column(s)";
        for (const auto& m : missing) error_ += " " + m;
        return false;
    }

    std::size_t line_no = 1;
    while (std::getline(f, line)) {
        ++line_no;
        if (trim(line).empty()) continue;
        auto bar = parseLine(line, cols);
        if (!bar) {
            error_ = filepath_ + ":" + std::to_string(line_no) + ": malformed row";
            bars_.clear();
            return false;
        }
        bars_.push_back(*bar);
    }
    return true;
}

void DataSource::filterRange(const DateRange& range) {
    bars_.erase(std::remove_if(bars_.begin(), bars_.end(),
                               [&](const Bar& b) { return !range.contains(b.time); }),
                bars_.end());
}

std::optional<Bar> DataSource::parseLine(const std::string& line, const Columns& cols) const {
    auto parts = split(line, ',');
    if (static_cast<std::size_t>(cols.timestamp) >= parts.size()) return std::nullopt;

    Bar b;
    b.timestamp = parts[static_cast<std::size_t>(cols.timestamp)];
    auto t = parseTimestamp(b.timestamp);
    if (!t) return std::nullopt;
    b.time = *t;

    if (!parseNumber(parts, cols.open, b.open) || !parseNumber(parts, cols.high, b.high) ||
        !parseNumber(parts, cols.low, b.low) || !parseNumber(parts, cols.close, b.close) ||
        !parseNumber(parts, cols.relative_volume, b.relative_volume) ||
        !parseNumber(parts, cols.rsi, b.rsi) || !parseNumber(parts, cols.vwap, b.vwap))
        return std::nullopt;
    if (cols.volume >= 0 && !parseNumber(parts, cols.volume, b.volume))
        return std::nullopt;
    return b;
}

std::optional<std::string> validateBars(const std::vector<Bar>& bars) {
    for (std::size_t i = 0; i < bars.size(); ++i) {
        const Bar& b = bars[i];
        if (!std::isfinite(b.open) || !std::isfinite(b.high) || !std::isfinite(b.low) || !std::isfinite(b.close))
            return "bar " + std::to_string(i) + " (" + b.timestamp + "): non-finite OHLC";
        if (!std::isfinite(b.volume))
            return "bar " + std::to_string(i) + " (" + b.timestamp + "): non-finite volume";
        if (!std::isfinite(b.relative_volume))
            return "bar " + std::to_string(i) + " (" + b.timestamp + "): relative_volume not supplied";
        if (!std::isfinite(b.rsi))
            return "bar " + std::to_string(i) + " (" + b.timestamp + "): rsi not supplied";
        if (!std::isfinite(b.vwap))
            return "bar " + std::to_string(i) + " (" + b.timestamp + "): vwap not supplied";
        if (i > 0 && b.time <= bars[i - 1].time)
            return "bar " + std::to_string(i) + " (" + b.timestamp + "): timestamp not after " +
                   bars[i - 1].timestamp;
    }
    return std::nullopt;
}

CsvBarSource::CsvBarSource(const std::string& dir) : dir_(dir) {}

std::string CsvBarSource::pathFor(const std::string& symbol) const {
    return (fs::path(dir_) / (symbol + ".csv")).string();
}

std::vector<Bar> CsvBarSource::loadBars(const std::string& symbol, const DateRange& range) const {
    DataSource ds(pathFor(symbol));
    if (!ds.exists()) return {};
    if (!ds.load())
        throw PipelineError(Stage::Load, symbol, ds.error());
    ds.filterRange(range);
    return ds.takeBars();
}

std::vector<std::string> CsvBarSource::listSymbols() const {
    std::set<std::string> symbols;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec) || ec) return {};

    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (ec || !entry.is_regular_file()) continue;
        std::string ext = entry.path().extension().string();
        toLower(ext);
        if (ext != ".csv") continue;
        std::string stem = entry.path().stem().string();
        if (!stem.empty()) symbols.insert(stem);
    }
    return std::vector<std::string>(symbols.begin(), symbols.end());
}

} // namespace rightv
