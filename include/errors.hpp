#pragma once

#include <stdexcept>
#include <string>

namespace rightv {

/// Pipeline stage in which a per-symbol fault occurred.
enum class Stage { Load, Validate, Indicators, Signals, Simulation, Metrics };

const char* stageName(Stage stage);

/// Unexpected fault while deriving results for one symbol.
/// "No data" and "no trades" are valid outcomes and never raise this.
class PipelineError : public std::runtime_error {
public:
    PipelineError(Stage stage, const std::string& symbol, const std::string& message);

    Stage stage() const { return stage_; }
    const std::string& symbol() const { return symbol_; }
    const std::string& detail() const { return detail_; }

private:
    Stage stage_;
    std::string symbol_;
    std::string detail_;
};

} // namespace rightv
