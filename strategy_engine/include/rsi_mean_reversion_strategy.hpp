#pragma once

#include "strategy.hpp"
#include <string>

namespace strategy_engine {

    // BUY while RSI is at or below `oversold`, SELL while it is at or above
    // `overbought`. Strength grows with the distance past the threshold.
    class RsiMeanReversionStrategy : public StrategyBase {
    public:
        static constexpr const char* kType = "rsi_mean_reversion";

        // Throws ParameterValidationException when period < 2, a threshold lies
        // outside (0, 100) or oversold >= overbought
        RsiMeanReversionStrategy(int rsi_period = 14,
                                 double oversold = 30.0,
                                 double overbought = 70.0,
                                 double position_size = 0.95,
                                 std::string name = "RSI Mean Reversion");

        int getRsiPeriod() const { return rsi_period_; }
        double getOversold() const { return oversold_; }
        double getOverbought() const { return overbought_; }

    protected:
        void computeSignals(const core::TimeSeries<core::Candle>& bars,
                            const indicators::IndicatorFrame& frame,
                            core::TimeSeries<core::SignaledBar>& signaled) const override;

    private:
        int rsi_period_;
        double oversold_;
        double overbought_;
    };

} // namespace strategy_engine
