#include "config.hpp"
#include "datatypes.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <limits>

namespace {
bool almost_equal(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

core::Candle bar(const std::string& ts, double close) {
    core::Candle candle;
    candle.timestamp = core::utils::stringToTimestamp(ts);
    candle.open = candle.high = candle.low = candle.close = close;
    return candle;
}
}

int main() {
    core::logging::LoggingOptions log_options;
    log_options.to_file = false;
    core::logging::initialize(log_options);

    // --- Timestamps ---
    auto ts = core::utils::stringToTimestamp("2024-01-05T13:45:00Z");
    assert(core::utils::timestampToString(ts) == "2024-01-05T13:45:00Z");
    assert(core::utils::compactTimestamp(ts) == "20240105_134500");

    auto shifted = core::utils::stringToTimestamp("2015-04-20T00:00:00+05:30");
    assert(core::utils::timestampToString(shifted) == "2015-04-19T18:30:00Z");

    auto bare = core::utils::stringToTimestamp("2024-01-05T00:00:00");
    assert(core::utils::timestampToString(bare) == "2024-01-05T00:00:00Z");

    // --- Bar validation ---
    core::TimeSeries<core::Candle> bars{bar("2024-01-01T00:00:00Z", 100.0), bar("2024-01-02T00:00:00Z", 101.0)};
    core::utils::validateBars(bars);

    bool threw = false;
    try {
        core::utils::validateBars({});
    } catch (const core::InvalidDataException&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    auto missing_close = bars;
    missing_close[1].close = std::numeric_limits<double>::quiet_NaN();
    try {
        core::utils::validateBars(missing_close);
    } catch (const core::InvalidDataException&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    auto unordered = bars;
    std::swap(unordered[0], unordered[1]);
    try {
        core::utils::validateBars(unordered);
    } catch (const core::InvalidDataException&) {
        threw = true;
    }
    assert(threw);

    // --- Enum names ---
    assert(core::toString(core::SignalType::Buy) == "BUY");
    assert(core::toString(core::CloseReason::StopLoss) == "STOP_LOSS");
    assert(core::toString(core::CloseReason::EndOfSession) == "END_OF_SESSION");
    assert(core::toString(core::Direction::Short) == "SHORT");

    // --- Config ---
    auto defaults = core::config::parseConfig(nlohmann::json::object());
    assert(almost_equal(defaults.backtest.initial_capital, 10000.0));
    assert(almost_equal(defaults.backtest.position_size, 0.95));
    assert(almost_equal(defaults.risk.stop_loss_pct, 0.02));
    assert(defaults.strategies.empty());
    assert(!defaults.optimizer.enabled());

    auto parsed = core::config::parseConfig(nlohmann::json::parse(R"({
        "logging": { "console_level": "debug", "to_file": false },
        "backtest": { "initial_capital": 1000, "commission": 0, "slippage": 0 },
        "risk": { "trailing_stop_pct": 0.03 },
        "data": { "symbol": "ETH", "interval": "1h" },
        "strategies": [ { "type": "ma_crossover" } ],
        "optimizer": { "strategy_type": "rsi_mean_reversion", "grid": { "rsi_period": [7, 14] } },
        "results_dir": "out"
    })"));
    assert(almost_equal(parsed.backtest.initial_capital, 1000.0));
    assert(almost_equal(parsed.backtest.commission, 0.0));
    assert(almost_equal(parsed.risk.trailing_stop_pct, 0.03));
    assert(parsed.logging.console_level == spdlog::level::debug);
    assert(!parsed.logging.to_file);
    assert(parsed.data.symbol == "ETH");
    assert(parsed.strategies.size() == 1);
    assert(parsed.optimizer.enabled());
    assert(parsed.results_dir == "out");

    threw = false;
    try {
        core::config::parseConfig(nlohmann::json::parse(R"({ "backtest": { "initial_capital": "lots" } })"));
    } catch (const core::ConfigException&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        core::config::parseConfig(nlohmann::json::parse(R"({ "backtest": { "initial_capital": -5 } })"));
    } catch (const core::ConfigException&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    core::config::RiskConfig bad_risk;
    bad_risk.stop_loss_pct = 1.5;
    try {
        core::config::validate(bad_risk);
    } catch (const core::ConfigException&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        core::config::loadConfig("/nonexistent/backtest_config.json");
    } catch (const core::ConfigException&) {
        threw = true;
    }
    assert(threw);

    return 0;
}
