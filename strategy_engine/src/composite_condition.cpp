#include "composite_condition.hpp"
#include <sstream>
#include <stdexcept>

namespace strategy_engine {

CompositeCondition::CompositeCondition(std::vector<std::unique_ptr<ICondition>> conditions, std::string joiner)
    : conditions_(std::move(conditions)), joiner_(std::move(joiner))
{
    if (conditions_.empty()) {
        throw std::invalid_argument(joiner_ + " condition must receive at least one condition.");
    }
    for (const auto& condition : conditions_) {
        if (!condition) {
            throw std::invalid_argument(joiner_ + " condition received a null sub-condition.");
        }
    }
}

std::string CompositeCondition::describe() const {
    std::stringstream ss;
    ss << "(";
    for (size_t i = 0; i < conditions_.size(); ++i) {
        ss << conditions_[i]->describe();
        if (i < conditions_.size() - 1) {
            ss << " " << joiner_ << " ";
        }
    }
    ss << ")";
    return ss.str();
}

void CompositeCondition::collectColumns(std::set<std::string>& columns) const {
    for (const auto& condition : conditions_) {
        condition->collectColumns(columns);
    }
}

AndCondition::AndCondition(std::vector<std::unique_ptr<ICondition>> conditions)
    : CompositeCondition(std::move(conditions), "AND") {}

bool AndCondition::evaluate(const MarketDataSnapshot& snapshot) const {
    for (const auto& condition : conditions_) {
        if (!condition->evaluate(snapshot)) {
            return false;
        }
    }
    return true;
}

OrCondition::OrCondition(std::vector<std::unique_ptr<ICondition>> conditions)
    : CompositeCondition(std::move(conditions), "OR") {}

bool OrCondition::evaluate(const MarketDataSnapshot& snapshot) const {
    for (const auto& condition : conditions_) {
        if (condition->evaluate(snapshot)) {
            return true;
        }
    }
    return false;
}

} // namespace strategy_engine
