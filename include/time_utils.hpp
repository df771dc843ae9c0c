#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace rightv {

/// Parse "YYYY-MM-DD", "YYYY-MM-DD HH:MM[:SS]" or "YYYY-MM-DDTHH:MM[:SS][...]" to epoch seconds.
/// The wall-clock time is encoded as if it were UTC. Returns nullopt if unparseable.
std::optional<std::int64_t> parseTimestamp(const std::string& ts);

/// Days since 1970-01-01 for an epoch-seconds value (calendar date of the bar).
std::int64_t dayNumber(std::int64_t epoch_seconds);

/// Hour of day 0-23.
int hourOfDay(std::int64_t epoch_seconds);

/// Format epoch seconds as "YYYY-MM-DD HH:MM:SS".
std::string formatTimestamp(std::int64_t epoch_seconds);

} // namespace rightv
