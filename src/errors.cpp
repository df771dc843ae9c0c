#include "errors.hpp"

namespace rightv {

const char* stageName(Stage stage) {
    switch (stage) {
        case Stage::Load: return "load";
        case Stage::Validate: return "validate";
        case Stage::Indicators: return "indicators";
        case Stage::Signals: return "signals";
        case Stage::Simulation: return "simulation";
        case Stage::Metrics: return "metrics";
    }
    return "unknown";
}

PipelineError::PipelineError(Stage stage, const std::string& symbol, const std::string& message)
    : std::runtime_error(std::string(stageName(stage)) + " failed for " +
                         (symbol.empty() ? std::string("<unnamed>") : symbol) + ": " + message)
    , stage_(stage)
    , symbol_(symbol)
    , detail_(message)
{
}

} // namespace rightv
