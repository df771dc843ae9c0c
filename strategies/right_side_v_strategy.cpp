#include "right_side_v_strategy.hpp"
#include <memory>
#include <sstream>
#include <string>

namespace rightv {

class RightSideVStrategy : public IStrategy {
public:
    explicit RightSideVStrategy(const RightSideVParams& params) : p_(params) {}

    SignalSet generateSignals(const std::vector<IndicatorBar>& bars) const override {
        SignalSet s;
        s.capitulation = detectCapitulation(bars, p_.capitulation);
        s.pivot_low = locatePivotLows(bars, s.capitulation, p_.pivot);
        s.triggers = findEntryTriggers(bars, s.capitulation, p_.entry);
        return s;
    }

    std::string name() const override { return "right_side_v"; }

    std::string describeParams() const override {
        std::ostringstream out;
        out << "rvol>" << p_.capitulation.rvol_threshold
            << " vwap<-" << p_.capitulation.vwap_distance_threshold << "%"
            << " drop>" << p_.capitulation.atr_drop_mult << "atr"
            << " rsi<" << p_.capitulation.rsi_threshold
            << " cutoff=" << p_.entry.cutoff_hour << ":00";
        return out.str();
    }

private:
    RightSideVParams p_;
};

std::unique_ptr<IStrategy> createRightSideVStrategy(const RightSideVParams& params) {
    return std::make_unique<RightSideVStrategy>(params);
}

} // namespace rightv
