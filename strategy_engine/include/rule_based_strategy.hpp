#pragma once

#include "strategy.hpp"
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace strategy_engine {

    // User-defined strategy assembled from rules, usually by StrategyFactory from JSON.
    // On each bar the entry rules are checked first and the first one to fire
    // emits BUY (strength 1); otherwise the first exit rule to fire emits SELL
    // (strength -1). Position state is left to the simulator. Indicator columns
    // the rules name but the frame lacks are computed on demand; a name that is
    // neither a price field nor a buildable indicator throws
    // core::ParameterValidationException.
    class RuleBasedStrategy : public StrategyBase {
    public:
        static constexpr const char* kType = "rule_based";

        // Throws ParameterValidationException without entry rules
        RuleBasedStrategy(std::string name,
                          std::vector<std::unique_ptr<IRule>> entry_rules,
                          std::vector<std::unique_ptr<IRule>> exit_rules,
                          double position_size = 0.95,
                          std::string description = "");

        size_t entryRuleCount() const { return entry_rules_.size(); }
        size_t exitRuleCount() const { return exit_rules_.size(); }

        // Every column and price field the entry and exit rules read
        std::set<std::string> referencedColumns() const;

    protected:
        void computeSignals(const core::TimeSeries<core::Candle>& bars,
                            const indicators::IndicatorFrame& frame,
                            core::TimeSeries<core::SignaledBar>& signaled) const override;

    private:
        std::vector<std::unique_ptr<IRule>> entry_rules_;
        std::vector<std::unique_ptr<IRule>> exit_rules_;
    };

} // namespace strategy_engine
