#pragma once

#include "interfaces.hpp"
#include <string>
#include <memory>

namespace strategy_engine {

    // --- Rule Class ---
    // A named condition and the signal emitted when it holds.
    class Rule : public IRule {
    public:
        // Throws std::invalid_argument for an empty name, null condition or Hold action
        Rule(std::string rule_name,
             std::unique_ptr<ICondition> condition,
             core::SignalType signal_on_true);

        ~Rule() override = default;

        core::SignalType evaluate(const MarketDataSnapshot& snapshot) const override;
        std::string describe() const override;
        std::string getName() const override { return name_; }
        void collectColumns(std::set<std::string>& columns) const override { condition_->collectColumns(columns); }

    private:
        std::string name_;
        std::unique_ptr<ICondition> condition_;
        core::SignalType signal_;
    };

} // namespace strategy_engine
