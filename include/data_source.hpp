#pragma once

#include "bar.hpp"
#include <vector>
#include <string>
#include <optional>
#include <cstdint>

namespace rightv {

/// Inclusive epoch-seconds bounds; unset side = unbounded.
struct DateRange {
    std::optional<std::int64_t> start;
    std::optional<std::int64_t> end;

    bool contains(std::int64_t t) const {
        return (!start || t >= *start) && (!end || t <= *end);
    }
};

/// Loads bars from one CSV file.
/// Required columns (case-insensitive): timestamp/date/datetime/time, open, high, low, close,
/// relative_volume/rvol, rsi, vwap. Optional: volume/vol.
class DataSource {
public:
    explicit DataSource(const std::string& filepath);

    bool exists() const;

    /// Load bars from the CSV file. Returns false if the file cannot be opened, a required
    /// column is missing or a row cannot be parsed; error() then holds the reason.
    bool load();

    /// Drop bars outside range.
    void filterRange(const DateRange& range);

    const std::vector<Bar>& bars() const { return bars_; }
    std::vector<Bar> takeBars() { return std::move(bars_); }
    std::size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }
    const Bar& at(std::size_t i) const { return bars_.at(i); }
    const std::string& error() const { return error_; }

private:
    struct Columns {
        int timestamp{-1};
        int open{-1};
        int high{-1};
        int low{-1};
        int close{-1};
        int volume{-1};
        int relative_volume{-1};
        int rsi{-1};
        int vwap{-1};
    };

    std::string filepath_;
    std::vector<Bar> bars_;
    std::string error_;

    std::optional<Bar> parseLine(const std::string& line, const Columns& cols) const;
};

/// First violation of the per-bar contract (strictly increasing time, finite OHLC and volume,
/// finite relative_volume/rsi/vwap), or nullopt if bars are well formed.
std::optional<std::string> validateBars(const std::vector<Bar>& bars);

/// The historical-bar store the engine reads from.
/// Implementations must be safe to call from several threads for different symbols.
class IBarSource {
public:
    virtual ~IBarSource() = default;

    /// Time-ordered bars for symbol within range. Empty when the store has no data.
    /// Throws PipelineError (Stage::Load) on malformed data.
    virtual std::vector<Bar> loadBars(const std::string& symbol, const DateRange& range) const = 0;

    /// Symbols available in the store, sorted.
    virtual std::vector<std::string> listSymbols() const = 0;
};

/// Directory of <SYMBOL>.csv files, one per symbol.
class CsvBarSource : public IBarSource {
public:
    explicit CsvBarSource(const std::string& dir);

    std::vector<Bar> loadBars(const std::string& symbol, const DateRange& range) const override;
    std::vector<std::string> listSymbols() const override;

    std::string pathFor(const std::string& symbol) const;

private:
    std::string dir_;
};

} // namespace rightv
