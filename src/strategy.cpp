#include "strategy.hpp"
#include <algorithm>

namespace rightv {

const char* entryTypeName(EntryType type) {
    switch (type) {
        case EntryType::VTurn: return "v_turn";
        case EntryType::HigherLow: return "higher_low";
    }
    return "unknown";
}

std::size_t SignalSet::capitulationCount() const {
    return static_cast<std::size_t>(std::count(capitulation.begin(), capitulation.end(), true));
}

std::size_t SignalSet::pivotCount() const {
    return static_cast<std::size_t>(std::count(pivot_low.begin(), pivot_low.end(), true));
}

std::size_t SignalSet::triggerCount() const {
    return static_cast<std::size_t>(std::count_if(triggers.begin(), triggers.end(),
        [](const EntryTrigger& t) { return t.triggered; }));
}

} // namespace rightv
