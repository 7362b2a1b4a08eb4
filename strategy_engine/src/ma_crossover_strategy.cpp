#include "ma_crossover_strategy.hpp"
#include "indicator_frame.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace strategy_engine {

MovingAverageCrossoverStrategy::MovingAverageCrossoverStrategy(int fast_period,
                                                               int slow_period,
                                                               indicators::MaType ma_type,
                                                               double position_size,
                                                               std::string name)
    : StrategyBase(std::move(name), kType, position_size),
      fast_period_(fast_period),
      slow_period_(slow_period),
      ma_type_(ma_type)
{
    if (fast_period_ <= 0 || slow_period_ <= 0) {
        throw core::ParameterValidationException(
            fmt::format("MA periods must be positive (fast={}, slow={}).", fast_period_, slow_period_));
    }
    if (fast_period_ >= slow_period_) {
        throw core::ParameterValidationException(
            fmt::format("Fast period ({}) must be shorter than slow period ({}).", fast_period_, slow_period_));
    }

    const std::string type_name = indicators::maTypeToString(ma_type_);
    description_ = fmt::format("Buy when {}{} crosses above {}{}, sell when it crosses below",
                               type_name, fast_period_, type_name, slow_period_);
    parameters_["fast_period"] = fast_period_;
    parameters_["slow_period"] = slow_period_;
    parameters_["ma_type"] = type_name;
}

core::TimeSeries<double> MovingAverageCrossoverStrategy::movingAverage(const core::TimeSeries<core::Candle>& bars,
                                                                       const indicators::IndicatorFrame& frame,
                                                                       int period) const {
    const std::string column = indicators::movingAverageColumn(ma_type_, period);
    if (const auto* precomputed = frameColumn(frame, column, bars.size())) {
        return *precomputed;
    }
    core::logging::getLogger()->trace("Column '{}' not in frame, computing it for '{}'.", column, getName());
    return indicators::IndicatorFrame::movingAverage(bars, period, ma_type_);
}

void MovingAverageCrossoverStrategy::computeSignals(const core::TimeSeries<core::Candle>& bars,
                                                    const indicators::IndicatorFrame& frame,
                                                    core::TimeSeries<core::SignaledBar>& signaled) const {
    const core::TimeSeries<double> fast = movingAverage(bars, frame, fast_period_);
    const core::TimeSeries<double> slow = movingAverage(bars, frame, slow_period_);

    // Index 0 has no prior bar and stays HOLD
    for (size_t i = 1; i < bars.size(); ++i) {
        if (std::isnan(fast[i]) || std::isnan(slow[i]) || std::isnan(fast[i - 1]) || std::isnan(slow[i - 1])) {
            continue;
        }
        if (fast[i - 1] <= slow[i - 1] && fast[i] > slow[i]) {
            signaled[i].signal = core::SignalType::Buy;
            signaled[i].signal_strength = 1.0;
        } else if (fast[i - 1] >= slow[i - 1] && fast[i] < slow[i]) {
            signaled[i].signal = core::SignalType::Sell;
            signaled[i].signal_strength = -1.0;
        }
    }
}

} // namespace strategy_engine
