#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <string>
#include <variant>

namespace strategy_engine {

    // --- IndicatorCondition Class ---
    // Compares a column (indicator or price field) with a fixed value or another column.
    class IndicatorCondition : public ICondition {
    public:
        // e.g. IndicatorCondition("rsi_14", ComparisonOp::LT, 30.0) -> "rsi_14 < 30"
        IndicatorCondition(const std::string& column1, ComparisonOp op, double value);

        // e.g. IndicatorCondition("close", ComparisonOp::GT, "sma_50") -> "close > sma_50"
        IndicatorCondition(const std::string& column1, ComparisonOp op, const std::string& column2);

        ~IndicatorCondition() override = default;

        // False when either side is missing or NaN at the current bar
        bool evaluate(const MarketDataSnapshot& snapshot) const override;
        std::string describe() const override;
        void collectColumns(std::set<std::string>& columns) const override;

    private:
        std::string column1_;
        ComparisonOp op_;
        std::variant<double, std::string> rhs_;
    };

} // namespace strategy_engine
