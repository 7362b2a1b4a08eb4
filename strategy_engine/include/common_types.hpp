#pragma once
#include "datatypes.hpp"
#include <map>
#include <string>
#include <variant>

namespace strategy_engine {

    // Enum for comparison types
    enum class ComparisonOp {
        GT,  // Greater Than (>)
        LT,  // Less Than (<)
        GTE, // Greater Than or Equal To (>=)
        LTE, // Less Than or Equal To (<=)
        EQ   // Equal To (==)
    };

    std::string comparisonOpToString(ComparisonOp op);

    // Throws core::ParameterValidationException for unknown operators
    ComparisonOp comparisonOpFromString(const std::string& op);

    // A single strategy parameter: periods are int, thresholds and fractions double,
    // MA type a string
    using ParameterValue = std::variant<int, double, std::string>;
    using ParameterMap = std::map<std::string, ParameterValue>;

    std::string parameterToString(const ParameterValue& value);

    // Numeric view of a parameter (int or double); throws ParameterValidationException for strings
    double parameterAsDouble(const ParameterValue& value);

    // Per-run signal summary used in log output
    struct SignalCounts {
        size_t buy = 0;
        size_t sell = 0;
        size_t hold = 0;
    };

    SignalCounts countSignals(const core::TimeSeries<core::SignaledBar>& signaled);

} // namespace strategy_engine
