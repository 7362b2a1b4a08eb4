#include "strategy.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

namespace strategy_engine {

StrategyBase::StrategyBase(std::string name, std::string type, double position_size)
    : name_(std::move(name)), type_(std::move(type)), position_size_(position_size)
{
    if (name_.empty()) {
        throw core::ParameterValidationException("Strategy name cannot be empty.");
    }
    if (!(position_size_ > 0.0) || position_size_ > 1.0) {
        throw core::ParameterValidationException(
            fmt::format("position_size must be in (0, 1] (got {}) for strategy '{}'.", position_size_, name_));
    }
    parameters_["position_size"] = position_size_;
}

const core::TimeSeries<double>* StrategyBase::frameColumn(const indicators::IndicatorFrame& frame,
                                                          const std::string& name,
                                                          size_t num_bars) {
    if (frame.size() != num_bars || !frame.has(name)) {
        return nullptr;
    }
    return &frame.column(name);
}

core::TimeSeries<core::SignaledBar> StrategyBase::generateSignals(
    const core::TimeSeries<core::Candle>& bars,
    const indicators::IndicatorFrame& frame) const
{
    core::utils::validateBars(bars);

    core::TimeSeries<core::SignaledBar> signaled;
    signaled.reserve(bars.size());
    for (const auto& candle : bars) {
        signaled.push_back(core::SignaledBar{candle, core::SignalType::Hold, 0.0});
    }

    computeSignals(bars, frame, signaled);

    SignalCounts counts = countSignals(signaled);
    core::logging::getLogger()->debug("Strategy '{}' generated signals over {} bars: {} BUY, {} SELL, {} HOLD",
                                      name_, bars.size(), counts.buy, counts.sell, counts.hold);
    return signaled;
}

} // namespace strategy_engine
