#pragma once

#include "datatypes.hpp"
#include "logging.hpp"
#include "strategy.hpp"

#include <chrono>
#include <cmath>
#include <string>
#include <vector>

namespace test_support {

inline bool almost_equal(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

inline void initLogging() {
    core::logging::LoggingOptions options;
    options.to_file = false;
    options.console_level = spdlog::level::warn;
    core::logging::initialize(options);
}

// Daily bars starting 2024-01-01T00:00:00Z; open/high/low bracket the close
inline core::TimeSeries<core::Candle> makeBars(const std::vector<double>& closes) {
    const core::Timestamp start = std::chrono::system_clock::time_point(std::chrono::seconds(1704067200));
    core::TimeSeries<core::Candle> bars;
    for (size_t i = 0; i < closes.size(); ++i) {
        core::Candle candle;
        candle.timestamp = start + std::chrono::hours(24 * static_cast<int>(i));
        candle.open = closes[i];
        candle.high = closes[i] * 1.01;
        candle.low = closes[i] * 0.99;
        candle.close = closes[i];
        candle.volume = 100.0;
        bars.push_back(candle);
    }
    return bars;
}

// Emits a fixed signal per bar; bars past the script are HOLD
class ScriptedStrategy : public strategy_engine::StrategyBase {
public:
    explicit ScriptedStrategy(std::vector<core::SignalType> script, double position_size = 0.95,
                              std::string name = "Scripted")
        : StrategyBase(std::move(name), "scripted", position_size), script_(std::move(script)) {}

protected:
    void computeSignals(const core::TimeSeries<core::Candle>& bars,
                        const indicators::IndicatorFrame&,
                        core::TimeSeries<core::SignaledBar>& signaled) const override {
        for (size_t i = 0; i < bars.size() && i < script_.size(); ++i) {
            signaled[i].signal = script_[i];
            signaled[i].signal_strength = script_[i] == core::SignalType::Buy ? 1.0
                                        : script_[i] == core::SignalType::Sell ? -1.0 : 0.0;
        }
    }

private:
    std::vector<core::SignalType> script_;
};

constexpr core::SignalType B = core::SignalType::Buy;
constexpr core::SignalType S = core::SignalType::Sell;
constexpr core::SignalType H = core::SignalType::Hold;

} // namespace test_support
