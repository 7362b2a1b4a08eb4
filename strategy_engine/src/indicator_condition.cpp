#include "indicator_condition.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <stdexcept>

namespace strategy_engine {

IndicatorCondition::IndicatorCondition(const std::string& column1, ComparisonOp op, double value)
    : column1_(column1), op_(op), rhs_(value)
{
    if (column1_.empty()) {
        throw std::invalid_argument("Indicator column name cannot be empty.");
    }
}

IndicatorCondition::IndicatorCondition(const std::string& column1, ComparisonOp op, const std::string& column2)
    : column1_(column1), op_(op), rhs_(column2)
{
    if (column1_.empty() || column2.empty()) {
        throw std::invalid_argument("Indicator column names cannot be empty.");
    }
    if (column1_ == column2) {
        throw std::invalid_argument("Cannot compare a column to itself in IndicatorCondition.");
    }
}

bool IndicatorCondition::evaluate(const MarketDataSnapshot& snapshot) const {
    std::optional<double> lhs = snapshot.value(column1_);
    if (!lhs) {
        core::logging::getLogger()->trace("IndicatorCondition: '{}' unavailable at bar {}.", column1_, snapshot.index);
        return false;
    }

    std::optional<double> rhs;
    if (const double* value = std::get_if<double>(&rhs_)) {
        rhs = *value;
    } else {
        rhs = snapshot.value(std::get<std::string>(rhs_));
    }
    if (!rhs) {
        return false;
    }

    switch (op_) {
        case ComparisonOp::GT:  return *lhs > *rhs;
        case ComparisonOp::LT:  return *lhs < *rhs;
        case ComparisonOp::GTE: return *lhs >= *rhs;
        case ComparisonOp::LTE: return *lhs <= *rhs;
        case ComparisonOp::EQ:  return std::fabs(*lhs - *rhs) < 1e-9;
    }
    return false;
}

std::string IndicatorCondition::describe() const {
    if (const double* value = std::get_if<double>(&rhs_)) {
        return fmt::format("{} {} {}", column1_, comparisonOpToString(op_), *value);
    }
    return fmt::format("{} {} {}", column1_, comparisonOpToString(op_), std::get<std::string>(rhs_));
}

void IndicatorCondition::collectColumns(std::set<std::string>& columns) const {
    columns.insert(column1_);
    if (const std::string* column2 = std::get_if<std::string>(&rhs_)) {
        columns.insert(*column2);
    }
}

} // namespace strategy_engine
