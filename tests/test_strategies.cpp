#include "ma_crossover_strategy.hpp"
#include "rsi_mean_reversion_strategy.hpp"
#include "rule_based_strategy.hpp"
#include "strategy_factory.hpp"
#include "exceptions.hpp"
#include "test_support.hpp"

#include <cassert>
#include <limits>
#include <set>

using test_support::almost_equal;
using test_support::B;
using test_support::S;
using test_support::H;

namespace {
const double kNaN = std::numeric_limits<double>::quiet_NaN();

core::TimeSeries<core::SignalType> signalsOf(const core::TimeSeries<core::SignaledBar>& signaled) {
    core::TimeSeries<core::SignalType> out;
    for (const auto& bar : signaled) {
        out.push_back(bar.signal);
    }
    return out;
}

template <typename Exception, typename Fn>
bool throws(Fn fn) {
    try {
        fn();
    } catch (const Exception&) {
        return true;
    }
    return false;
}
}

int main() {
    test_support::initLogging();

    // --- Moving average crossover over precomputed columns ---
    auto bars = test_support::makeBars({10, 11, 12, 13, 14, 15});
    indicators::IndicatorFrame frame(bars.size());
    frame.setColumn("sma_2", {kNaN, 1, 3, 3, 1, 2});
    frame.setColumn("sma_3", {kNaN, 2, 2, 3, 2, 2});

    strategy_engine::MovingAverageCrossoverStrategy crossover(2, 3);
    auto signaled = crossover.generateSignals(bars, frame);
    assert(signaled.size() == bars.size());
    // Cross up at 2, tie at 3 (no signal), cross down from the tie at 4, touch at 5 (no signal)
    assert((signalsOf(signaled) == core::TimeSeries<core::SignalType>{H, H, B, H, S, H}));
    assert(almost_equal(signaled[2].signal_strength, 1.0));
    assert(almost_equal(signaled[4].signal_strength, -1.0));
    assert(crossover.getType() == "ma_crossover");
    assert(std::get<int>(crossover.getParameters().at("fast_period")) == 2);
    assert(std::get<std::string>(crossover.getParameters().at("ma_type")) == "SMA");

    assert(throws<core::ParameterValidationException>([] { strategy_engine::MovingAverageCrossoverStrategy(20, 10); }));
    assert(throws<core::ParameterValidationException>([] { strategy_engine::MovingAverageCrossoverStrategy(10, 10); }));
    assert(throws<core::ParameterValidationException>(
        [] { strategy_engine::MovingAverageCrossoverStrategy(5, 10, indicators::MaType::SMA, 1.5); }));

    // Too little history for the windows: every bar HOLD
    auto short_bars = test_support::makeBars({10, 11, 12});
    auto quiet = strategy_engine::MovingAverageCrossoverStrategy(5, 10).generateSignals(short_bars);
    assert(strategy_engine::countSignals(quiet).hold == short_bars.size());

    assert(throws<core::InvalidDataException>([&] { crossover.generateSignals({}); }));

    // --- RSI mean reversion ---
    indicators::IndicatorFrame rsi_frame(bars.size());
    rsi_frame.setColumn("rsi_14", {kNaN, 25, 50, 75, 30, 70});
    strategy_engine::RsiMeanReversionStrategy rsi;
    auto rsi_signals = rsi.generateSignals(bars, rsi_frame);
    assert((signalsOf(rsi_signals) == core::TimeSeries<core::SignalType>{H, B, H, S, B, S}));
    assert(almost_equal(rsi_signals[1].signal_strength, 5.0 / 30.0));
    assert(almost_equal(rsi_signals[3].signal_strength, -5.0 / 30.0));
    assert(almost_equal(rsi_signals[4].signal_strength, 0.0));

    assert(throws<core::ParameterValidationException>([] { strategy_engine::RsiMeanReversionStrategy(14, 70, 30); }));
    assert(throws<core::ParameterValidationException>([] { strategy_engine::RsiMeanReversionStrategy(1, 30, 70); }));

    // --- Factory ---
    auto from_json = strategy_engine::StrategyFactory::createStrategy(nlohmann::json::parse(R"({
        "type": "ma_crossover", "name": "Fast EMA",
        "parameters": { "fast_period": 5, "slow_period": 12, "ma_type": "ema", "position_size": 0.5 }
    })"));
    assert(from_json->getName() == "Fast EMA");
    assert(from_json->getType() == "ma_crossover");
    assert(almost_equal(from_json->getPositionSizeFraction(), 0.5));
    assert(std::get<std::string>(from_json->getParameters().at("ma_type")) == "EMA");

    auto by_type = strategy_engine::StrategyFactory::createStrategy(
        "rsi_mean_reversion", strategy_engine::ParameterMap{{"oversold", 25.0}});
    assert(by_type->getName() == "RSI Mean Reversion");
    assert(almost_equal(std::get<double>(by_type->getParameters().at("oversold")), 25.0));

    assert(strategy_engine::StrategyFactory::isRegistered("rule_based"));
    assert(strategy_engine::StrategyFactory::registeredTypes().size() == 3);

    // Unknown types are strategy errors, not parameter errors
    bool unknown_is_parameter_error = false;
    bool unknown_threw = false;
    try {
        strategy_engine::StrategyFactory::createStrategy(nlohmann::json{{"type", "martingale"}});
    } catch (const core::ParameterValidationException&) {
        unknown_is_parameter_error = true;
    } catch (const core::StrategyException&) {
        unknown_threw = true;
    }
    assert(unknown_threw && !unknown_is_parameter_error);

    assert(throws<core::ParameterValidationException>([] {
        strategy_engine::StrategyFactory::createStrategy(nlohmann::json::parse(
            R"({ "type": "ma_crossover", "parameters": { "fast_period": 30, "slow_period": 20 } })"));
    }));
    assert(throws<core::ParameterValidationException>([] {
        strategy_engine::parametersFromJson(nlohmann::json::parse(R"({ "fast_period": true })"));
    }));
    assert(throws<core::ParameterValidationException>([] { strategy_engine::comparisonOpFromString("!="); }));
    // Integral values beyond int are rejected rather than narrowed
    assert(throws<core::ParameterValidationException>([] {
        strategy_engine::StrategyFactory::createStrategy("rsi_mean_reversion", {{"rsi_period", 1e10}});
    }));
    assert(throws<core::ParameterValidationException>([] {
        strategy_engine::StrategyFactory::createStrategy(nlohmann::json::parse(
            R"({ "type": "ma_crossover", "parameters": { "fast_period": 5, "slow_period": 4294967316 } })"));
    }));

    // --- Rule-based strategy ---
    auto flat = test_support::makeBars({50, 50, 50, 50, 50});
    indicators::IndicatorFrame rule_frame(flat.size());
    rule_frame.setColumn("x", {1, 6, 6, 3, 3});
    rule_frame.setColumn("y", {0, 0, 0, 2, 4});

    auto rule_based = strategy_engine::StrategyFactory::createStrategy(nlohmann::json::parse(R"({
        "type": "rule_based",
        "name": "Custom",
        "entry_rules": [
            { "rule_name": "strong x", "condition": { "type": "AND", "conditions": [
                { "type": "Indicator", "indicator1": "x", "op": ">", "value": 5 },
                { "type": "Indicator", "indicator1": "close", "op": "<", "value": 100 } ] } }
        ],
        "exit_rules": [
            { "rule_name": "weak x or y overtakes", "condition": { "type": "OR", "conditions": [
                { "type": "Indicator", "indicator1": "x", "op": "<", "value": 2 },
                { "type": "Cross", "indicator1": "y", "direction": "CrossesAbove", "indicator2": "x" } ] } }
        ]
    })"));
    assert(rule_based->getType() == "rule_based");
    auto rule_signals = rule_based->generateSignals(flat, rule_frame);
    assert((signalsOf(rule_signals) == core::TimeSeries<core::SignalType>{S, B, B, H, S}));

    // Indicator columns the rules name are computed when the frame lacks them
    auto rising = test_support::makeBars({10, 10, 10, 20, 30});
    auto above_sma = strategy_engine::StrategyFactory::createStrategy(nlohmann::json::parse(R"({
        "type": "rule_based",
        "entry_rules": [ { "rule_name": "close above sma", "condition": { "type": "Indicator", "indicator1": "close", "op": ">", "indicator2": "sma_3" } } ],
        "exit_rules":  [ { "rule_name": "close below sma", "condition": { "type": "Indicator", "indicator1": "close", "op": "<", "indicator2": "sma_3" } } ]
    })"));
    const core::TimeSeries<core::SignalType> above_expected{H, H, H, B, B};
    assert(signalsOf(above_sma->generateSignals(rising)) == above_expected);
    indicators::IndicatorFrame unrelated(rising.size());
    unrelated.setColumn("x", {0, 0, 0, 0, 0});
    assert(signalsOf(above_sma->generateSignals(rising, unrelated)) == above_expected);
    assert(!unrelated.has("sma_3"));
    const auto& rule_strategy = dynamic_cast<const strategy_engine::RuleBasedStrategy&>(*above_sma);
    assert((rule_strategy.referencedColumns() == std::set<std::string>{"close", "sma_3"}));

    auto unknown_column = strategy_engine::StrategyFactory::createStrategy(nlohmann::json::parse(R"({
        "type": "rule_based",
        "entry_rules": [ { "rule_name": "typo", "condition": { "type": "Indicator", "indicator1": "smaa_3", "op": ">", "value": 0 } } ]
    })"));
    assert(throws<core::ParameterValidationException>([&] { unknown_column->generateSignals(rising); }));

    // Entry wins when entry and exit fire on the same bar
    auto both = strategy_engine::StrategyFactory::createStrategy(nlohmann::json::parse(R"({
        "type": "rule_based",
        "entry_rules": [ { "rule_name": "always", "condition": { "type": "Indicator", "indicator1": "close", "op": ">", "value": 0 } } ],
        "exit_rules":  [ { "rule_name": "also",   "condition": { "type": "Indicator", "indicator1": "close", "op": ">", "value": 0 } } ]
    })"));
    assert(strategy_engine::countSignals(both->generateSignals(flat)).buy == flat.size());

    assert(throws<core::ParameterValidationException>([] {
        strategy_engine::StrategyFactory::createStrategy(nlohmann::json::parse(R"({ "type": "rule_based", "entry_rules": [] })"));
    }));
    assert(throws<core::ParameterValidationException>([] {
        strategy_engine::StrategyFactory::createStrategy(nlohmann::json::parse(R"({
            "type": "rule_based",
            "entry_rules": [ { "rule_name": "bad", "condition": { "type": "XOR", "conditions": [] } } ] })"));
    }));

    return 0;
}
