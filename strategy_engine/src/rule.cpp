#include "rule.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace strategy_engine {

Rule::Rule(std::string rule_name,
           std::unique_ptr<ICondition> condition,
           core::SignalType signal_on_true)
    : name_(std::move(rule_name)),
      condition_(std::move(condition)),
      signal_(signal_on_true)
{
    if (name_.empty()) {
        throw std::invalid_argument("Rule name cannot be empty.");
    }
    if (!condition_) {
        throw std::invalid_argument(fmt::format("Condition cannot be null for Rule '{}'.", name_));
    }
    if (signal_ == core::SignalType::Hold) {
        throw std::invalid_argument(fmt::format("Signal cannot be HOLD for Rule '{}'.", name_));
    }
}

core::SignalType Rule::evaluate(const MarketDataSnapshot& snapshot) const {
    bool condition_result = condition_->evaluate(snapshot);

    core::logging::getLogger()->trace("Rule '{}' evaluated condition '{}' at bar {} -> {}",
                                      name_, condition_->describe(), snapshot.index, condition_result);

    return condition_result ? signal_ : core::SignalType::Hold;
}

std::string Rule::describe() const {
    return fmt::format("Rule('{}'): IF ({}) THEN {}", name_, condition_->describe(), core::toString(signal_));
}

} // namespace strategy_engine
