#include "rsi_mean_reversion_strategy.hpp"
#include "rsi_indicator.hpp"
#include "indicator_frame.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace strategy_engine {

RsiMeanReversionStrategy::RsiMeanReversionStrategy(int rsi_period,
                                                   double oversold,
                                                   double overbought,
                                                   double position_size,
                                                   std::string name)
    : StrategyBase(std::move(name), kType, position_size),
      rsi_period_(rsi_period),
      oversold_(oversold),
      overbought_(overbought)
{
    // TA-Lib's RSI needs at least two bars per window
    if (rsi_period_ < 2) {
        throw core::ParameterValidationException(fmt::format("RSI period must be at least 2 (got {}).", rsi_period_));
    }
    if (!(oversold_ > 0.0 && oversold_ < 100.0) || !(overbought_ > 0.0 && overbought_ < 100.0)) {
        throw core::ParameterValidationException(
            fmt::format("RSI thresholds must lie in (0, 100) (oversold={}, overbought={}).", oversold_, overbought_));
    }
    if (oversold_ >= overbought_) {
        throw core::ParameterValidationException(
            fmt::format("Oversold ({}) must be below overbought ({}).", oversold_, overbought_));
    }

    description_ = fmt::format("Buy when RSI < {}, sell when RSI > {}", oversold_, overbought_);
    parameters_["rsi_period"] = rsi_period_;
    parameters_["oversold"] = oversold_;
    parameters_["overbought"] = overbought_;
}

void RsiMeanReversionStrategy::computeSignals(const core::TimeSeries<core::Candle>& bars,
                                              const indicators::IndicatorFrame& frame,
                                              core::TimeSeries<core::SignaledBar>& signaled) const {
    core::TimeSeries<double> rsi;
    if (const auto* precomputed = frameColumn(frame, indicators::rsiColumn(rsi_period_), bars.size())) {
        rsi = *precomputed;
    } else {
        rsi = indicators::IndicatorFrame::rsi(bars, rsi_period_);
    }

    for (size_t i = 0; i < bars.size(); ++i) {
        const double value = rsi[i];
        if (std::isnan(value)) {
            continue;
        }
        if (value <= oversold_) {
            signaled[i].signal = core::SignalType::Buy;
            signaled[i].signal_strength = (oversold_ - value) / oversold_;
        } else if (value >= overbought_) {
            signaled[i].signal = core::SignalType::Sell;
            signaled[i].signal_strength = -(value - overbought_) / (100.0 - overbought_);
        }
    }
}

} // namespace strategy_engine
