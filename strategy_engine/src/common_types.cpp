#include "common_types.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

namespace strategy_engine {

std::string comparisonOpToString(ComparisonOp op) {
    switch (op) {
        case ComparisonOp::GT:  return ">";
        case ComparisonOp::LT:  return "<";
        case ComparisonOp::GTE: return ">=";
        case ComparisonOp::LTE: return "<=";
        case ComparisonOp::EQ:  return "==";
    }
    return "InvalidOp";
}

ComparisonOp comparisonOpFromString(const std::string& op) {
    if (op == ">" || op == "GT") return ComparisonOp::GT;
    if (op == "<" || op == "LT") return ComparisonOp::LT;
    if (op == ">=" || op == "GTE") return ComparisonOp::GTE;
    if (op == "<=" || op == "LTE") return ComparisonOp::LTE;
    if (op == "==" || op == "EQ") return ComparisonOp::EQ;
    throw core::ParameterValidationException("Unknown comparison operator: " + op);
}

std::string parameterToString(const ParameterValue& value) {
    if (const int* i = std::get_if<int>(&value)) {
        return std::to_string(*i);
    }
    if (const double* d = std::get_if<double>(&value)) {
        return fmt::format("{}", *d);
    }
    return std::get<std::string>(value);
}

double parameterAsDouble(const ParameterValue& value) {
    if (const int* i = std::get_if<int>(&value)) {
        return static_cast<double>(*i);
    }
    if (const double* d = std::get_if<double>(&value)) {
        return *d;
    }
    throw core::ParameterValidationException("Parameter is not numeric: " + std::get<std::string>(value));
}

SignalCounts countSignals(const core::TimeSeries<core::SignaledBar>& signaled) {
    SignalCounts counts;
    for (const auto& bar : signaled) {
        switch (bar.signal) {
            case core::SignalType::Buy:  ++counts.buy; break;
            case core::SignalType::Sell: ++counts.sell; break;
            case core::SignalType::Hold: ++counts.hold; break;
        }
    }
    return counts;
}

} // namespace strategy_engine
