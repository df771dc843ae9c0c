#pragma once

#include "strategy.hpp"
#include "capitulation.hpp"
#include "pivot_locator.hpp"
#include "entry_triggers.hpp"
#include <memory>

namespace rightv {

/// Right Side of the V: buy the first strength after a capitulation low.
/// Capitulation bars -> pivot low -> v_turn (aggressive) or higher_low (conservative) entry.
struct RightSideVParams {
    CapitulationParams capitulation;
    PivotParams pivot;
    EntryParams entry;
};

std::unique_ptr<IStrategy> createRightSideVStrategy(const RightSideVParams& params = RightSideVParams{});

} // namespace rightv
