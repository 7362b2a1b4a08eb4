#pragma once

#include "strategy.hpp"
#include "moving_average_indicator.hpp"
#include <string>

namespace strategy_engine {

    // BUY when the fast moving average crosses above the slow one, SELL when it
    // crosses below. A tie on the prior bar counts as "not yet crossed".
    class MovingAverageCrossoverStrategy : public StrategyBase {
    public:
        static constexpr const char* kType = "ma_crossover";

        // Throws ParameterValidationException for non-positive periods or fast >= slow
        MovingAverageCrossoverStrategy(int fast_period = 10,
                                       int slow_period = 20,
                                       indicators::MaType ma_type = indicators::MaType::SMA,
                                       double position_size = 0.95,
                                       std::string name = "Moving Average Crossover");

        int getFastPeriod() const { return fast_period_; }
        int getSlowPeriod() const { return slow_period_; }
        indicators::MaType getMaType() const { return ma_type_; }

    protected:
        void computeSignals(const core::TimeSeries<core::Candle>& bars,
                            const indicators::IndicatorFrame& frame,
                            core::TimeSeries<core::SignaledBar>& signaled) const override;

    private:
        core::TimeSeries<double> movingAverage(const core::TimeSeries<core::Candle>& bars,
                                               const indicators::IndicatorFrame& frame,
                                               int period) const;

        int fast_period_;
        int slow_period_;
        indicators::MaType ma_type_;
    };

} // namespace strategy_engine
