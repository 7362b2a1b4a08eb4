#pragma once

#include "interfaces.hpp"
#include <string>

namespace strategy_engine {

    enum class CrossType {
        CrossesAbove,
        CrossesBelow
    };

    // Throws core::ParameterValidationException for anything but "CrossesAbove"/"CrossesBelow"
    CrossType crossTypeFromString(const std::string& type);

    // --- IndicatorCrossCondition Class ---
    // True on the bar where column1 crosses column2. A tie on the previous bar
    // counts as "not yet crossed", matching the moving average crossover.
    class IndicatorCrossCondition : public ICondition {
    public:
        // e.g. IndicatorCrossCondition("sma_10", CrossType::CrossesAbove, "sma_20")
        IndicatorCrossCondition(std::string column1, CrossType cross_type, std::string column2);

        ~IndicatorCrossCondition() override = default;

        bool evaluate(const MarketDataSnapshot& snapshot) const override;
        std::string describe() const override;
        void collectColumns(std::set<std::string>& columns) const override;

    private:
        std::string column1_;
        CrossType cross_type_;
        std::string column2_;
    };

} // namespace strategy_engine
