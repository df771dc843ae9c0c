#pragma once

#include "bar.hpp"
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace rightv {

enum class EntryType { VTurn, HigherLow };

const char* entryTypeName(EntryType type);

/// Entry signal on one bar. stop_loss_price is NaN when the pattern gives none.
struct EntryTrigger {
    bool triggered{false};
    EntryType entry_type{EntryType::VTurn};
    double stop_loss_price{std::numeric_limits<double>::quiet_NaN()};
};

/// Per-bar strategy output, each vector indexed like the input bars.
struct SignalSet {
    std::vector<bool> capitulation;
    std::vector<bool> pivot_low;
    std::vector<EntryTrigger> triggers;

    std::size_t capitulationCount() const;
    std::size_t pivotCount() const;
    std::size_t triggerCount() const;
};

/// Interface a signal strategy must implement.
/// generateSignals() sees the whole indicator series for one symbol and must not keep
/// state between calls: the engine shares one instance across symbol threads.
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual SignalSet generateSignals(const std::vector<IndicatorBar>& bars) const = 0;

    /// Short name and parameter description for reports.
    virtual std::string name() const = 0;
    virtual std::string describeParams() const { return ""; }
};

} // namespace rightv
