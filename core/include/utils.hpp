#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Convert Timestamp to ISO 8601 UTC string, e.g. 2024-01-05T00:00:00Z
    std::string timestampToString(const Timestamp& ts);

    // Parse ISO 8601 string (Z or +HH:MM offset, optional fractional seconds) to Timestamp
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Compact UTC stamp used in artifact file names, e.g. 20240105_134500
    std::string compactTimestamp(const Timestamp& ts);

    // Throws InvalidDataException if the series is empty, a close is missing
    // (non-finite or non-positive) or timestamps go backwards.
    void validateBars(const TimeSeries<Candle>& bars);

} // namespace utils
} // namespace core
