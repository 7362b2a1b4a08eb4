#include "indicator_cross_condition.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace strategy_engine {

CrossType crossTypeFromString(const std::string& type) {
    if (type == "CrossesAbove") return CrossType::CrossesAbove;
    if (type == "CrossesBelow") return CrossType::CrossesBelow;
    throw core::ParameterValidationException("Unknown cross direction: " + type);
}

IndicatorCrossCondition::IndicatorCrossCondition(std::string column1, CrossType cross_type, std::string column2)
    : column1_(std::move(column1)),
      cross_type_(cross_type),
      column2_(std::move(column2))
{
    if (column1_.empty() || column2_.empty()) {
        throw std::invalid_argument("Column names cannot be empty for IndicatorCrossCondition.");
    }
    if (column1_ == column2_) {
        throw std::invalid_argument("Cannot check cross condition for the same column.");
    }
}

bool IndicatorCrossCondition::evaluate(const MarketDataSnapshot& snapshot) const {
    auto now1 = snapshot.value(column1_);
    auto now2 = snapshot.value(column2_);
    auto prev1 = snapshot.value(column1_, 1);
    auto prev2 = snapshot.value(column2_, 1);

    if (!now1 || !now2 || !prev1 || !prev2) {
        core::logging::getLogger()->trace("IndicatorCrossCondition: missing current or previous values ('{}', '{}') at bar {}.",
                                          column1_, column2_, snapshot.index);
        return false;
    }

    if (cross_type_ == CrossType::CrossesAbove) {
        return (*prev1 <= *prev2) && (*now1 > *now2);
    }
    return (*prev1 >= *prev2) && (*now1 < *now2);
}

std::string IndicatorCrossCondition::describe() const {
    return fmt::format("{} {} {}",
                       column1_,
                       cross_type_ == CrossType::CrossesAbove ? "CrossesAbove" : "CrossesBelow",
                       column2_);
}

void IndicatorCrossCondition::collectColumns(std::set<std::string>& columns) const {
    columns.insert(column1_);
    columns.insert(column2_);
}

} // namespace strategy_engine
