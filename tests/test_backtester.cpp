#include "backtester.hpp"
#include "exceptions.hpp"
#include "test_support.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>

using test_support::almost_equal;
using test_support::ScriptedStrategy;
using test_support::B;
using test_support::S;
using test_support::H;

namespace {
core::config::BacktestConfig frictionless(double capital) {
    core::config::BacktestConfig config;
    config.initial_capital = capital;
    config.commission = 0.0;
    config.slippage = 0.0;
    return config;
}
}

int main() {
    test_support::initLogging();
    auto bars = test_support::makeBars({100, 110, 90, 120});

    // --- Zero-cost round trip ---
    backtester::Backtester engine(frictionless(1000.0), "BTC");
    ScriptedStrategy loser({B, H, S, H}, 0.95, "Loser Strategy");
    auto result = engine.run(loser, bars);

    assert(result.strategy_name == "Loser Strategy");
    assert(result.symbol == "BTC");
    assert(result.signaled.size() == bars.size());
    assert(result.trade_ledger.size() == 2);
    assert(almost_equal(result.performance_report.final_value, 905.0));
    assert(almost_equal(result.performance_report.total_return, -95.0));
    assert(almost_equal(result.performance_report.total_return_pct, -9.5));
    assert(result.performance_report.num_completed_trades == 1);
    assert(almost_equal(result.transaction_costs.total_costs, 0.0));
    assert(result.equity_curve.size() == bars.size());
    assert(almost_equal(result.equity_curve.front().portfolio_value, 1000.0));
    assert(almost_equal(result.equity_curve.back().portfolio_value, 905.0));
    assert(result.performance_report.max_drawdown <= 0.0);

    // --- Costs are taken once from the final value ---
    core::config::BacktestConfig with_costs = frictionless(1000.0);
    with_costs.commission = 0.001;
    with_costs.slippage = 0.0005;
    auto costly = backtester::Backtester(with_costs).run(loser, bars);
    assert(almost_equal(costly.transaction_costs.total_costs, 2.7075));
    assert(almost_equal(costly.performance_report.final_value, 905.0 - 2.7075));
    assert(almost_equal(costly.performance_report.total_return, -95.0 - 2.7075));
    assert(almost_equal(costly.equity_curve.back().portfolio_value, 905.0 - 2.7075));
    // The raw ledger still carries the pre-cost values
    assert(almost_equal(costly.trade_ledger.back().portfolio_value_after, 905.0));

    // --- First bar HOLD and no trades: flat equity at the initial capital ---
    ScriptedStrategy idle({H, H, H, H}, 0.95, "Idle");
    auto flat = engine.run(idle, bars);
    assert(flat.trade_ledger.empty());
    assert(almost_equal(flat.performance_report.final_value, 1000.0));
    assert(almost_equal(flat.performance_report.sharpe_ratio, 0.0));
    assert(almost_equal(flat.performance_report.max_drawdown, 0.0));
    for (const auto& point : flat.equity_curve) {
        assert(almost_equal(point.portfolio_value, 1000.0));
    }

    // --- Open position at the end is marked, not closed ---
    ScriptedStrategy holder({H, B, H, H}, 0.95, "Holder");
    auto held = engine.run(holder, bars);
    assert(held.trade_ledger.size() == 1);
    assert(almost_equal(held.performance_report.final_value, 50.0 + 950.0 / 110.0 * 120.0));
    assert(held.performance_report.num_completed_trades == 0);

    // --- Comparison sorted by return ---
    std::vector<std::unique_ptr<strategy_engine::IStrategy>> strategies;
    strategies.push_back(std::make_unique<ScriptedStrategy>(std::vector<core::SignalType>{B, H, S, H}, 0.95, "Loser"));
    strategies.push_back(std::make_unique<ScriptedStrategy>(std::vector<core::SignalType>{B, H, H, S}, 0.95, "Winner"));
    strategies.push_back(std::make_unique<ScriptedStrategy>(std::vector<core::SignalType>{}, 0.95, "Idle"));
    auto rows = engine.compareStrategies(strategies, bars);
    assert(rows.size() == 3);
    assert(rows[0].strategy_name == "Winner");
    assert(almost_equal(rows[0].return_pct, 19.0));
    assert(rows[1].strategy_name == "Idle");
    assert(rows[2].strategy_name == "Loser");
    assert(rows[0].num_trades == 1);
    assert(!rows[0].profit_factor);
    backtester::logComparison(rows);
    assert(backtester::toJson(rows).size() == 3);

    // --- Serialisation ---
    auto doc = backtester::toJson(result);
    assert(doc["strategy_name"] == "Loser Strategy");
    assert(doc["trade_ledger"].size() == 2);
    assert(doc["trade_ledger"][0]["action"] == "BUY");
    assert(doc["trade_ledger"][1]["reason"] == "SIGNAL");
    assert(doc["equity_curve"].size() == bars.size());
    assert(doc["performance_report"]["total_return_pct"].get<double>() == result.performance_report.total_return_pct);
    assert(doc["parameters"]["position_size"].get<double>() == 0.95);

    namespace fs = std::filesystem;
    const fs::path out_dir = fs::temp_directory_path() / "backtester_results_test";
    fs::remove_all(out_dir);
    const std::string path = backtester::saveResultJson(result, out_dir.string());
    assert(fs::exists(path));
    assert(fs::path(path).filename().string().rfind("loser_strategy_", 0) == 0);
    assert(fs::path(path).extension() == ".json");
    std::ifstream saved(path);
    auto reloaded = nlohmann::json::parse(saved);
    assert(reloaded["strategy_name"] == "Loser Strategy");
    fs::remove_all(out_dir);

    // --- Errors ---
    bool threw = false;
    try {
        engine.run(loser, {});
    } catch (const core::InvalidDataException&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        backtester::Backtester bad(frictionless(0.0));
    } catch (const core::ConfigException&) {
        threw = true;
    }
    assert(threw);

    return 0;
}
