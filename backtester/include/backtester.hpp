#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "config.hpp"
#include "interfaces.hpp"
#include "indicator_frame.hpp"
#include "trade_simulator.hpp"
#include "performance_analyzer.hpp"

namespace backtester {

    using json = nlohmann::json;

    // Everything one backtest run produces
    struct BacktestResult {
        std::string strategy_name;
        std::string strategy_type;
        std::string symbol;
        strategy_engine::ParameterMap parameters;
        double initial_capital = 0.0;
        core::TimeSeries<core::SignaledBar> signaled;
        core::TimeSeries<core::Trade> trade_ledger;
        core::EquityCurve equity_curve;
        PerformanceReport performance_report;
        CostAdjustment transaction_costs;
        SimulationResult simulation;
    };

    struct StrategyComparisonRow {
        std::string strategy_name;
        double total_return = 0.0;
        double return_pct = 0.0;
        double sharpe_ratio = 0.0;
        double max_drawdown = 0.0;
        size_t num_trades = 0; // Completed round trips
        double win_rate = 0.0;
        std::optional<double> profit_factor;
    };

    class Backtester {
    public:
        // Throws core::ConfigException for out-of-range settings
        explicit Backtester(core::config::BacktestConfig config, std::string symbol = "");

        // Signals -> simulation -> basic performance -> transaction costs ->
        // detailed metrics -> equity curve. Throws core::InvalidDataException for bad bars.
        BacktestResult run(const strategy_engine::IStrategy& strategy,
                           const core::TimeSeries<core::Candle>& bars,
                           const indicators::IndicatorFrame& frame = indicators::IndicatorFrame{}) const;

        // Runs every strategy on the same bars; rows sorted by return percent, best first
        std::vector<StrategyComparisonRow> compareStrategies(
            const std::vector<std::unique_ptr<strategy_engine::IStrategy>>& strategies,
            const core::TimeSeries<core::Candle>& bars,
            const indicators::IndicatorFrame& frame = indicators::IndicatorFrame{}) const;

        const core::config::BacktestConfig& config() const { return config_; }

    private:
        core::config::BacktestConfig config_;
        std::string symbol_;
        PerformanceAnalyzer analyzer_;
    };

    json toJson(const PerformanceReport& report);
    json toJson(const CostAdjustment& costs);
    json toJson(const core::Trade& trade);
    json toJson(const BacktestResult& result);
    json toJson(const std::vector<StrategyComparisonRow>& rows);

    void logSummary(const BacktestResult& result);
    void logComparison(const std::vector<StrategyComparisonRow>& rows);

    // Writes <strategy_name_lowercase_underscored>_<YYYYmmdd_HHMMSS>.json under `directory`
    // (created if missing) and returns the path. Throws core::BacktestException on I/O failure.
    std::string saveResultJson(const BacktestResult& result, const std::string& directory);

} // namespace backtester
