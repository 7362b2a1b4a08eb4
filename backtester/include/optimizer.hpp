#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "config.hpp"
#include "common_types.hpp"
#include "indicator_frame.hpp"
#include "backtester.hpp"

namespace backtester {

    // Parameter name -> candidate values. Combinations are enumerated in key order,
    // the last key varying fastest.
    using ParameterGrid = std::map<std::string, std::vector<strategy_engine::ParameterValue>>;

    struct OptimizationResult {
        strategy_engine::ParameterMap parameters;
        double total_return = 0.0;
        double total_return_pct = 0.0;
        size_t num_trades = 0; // Completed round trips
        double win_rate = 0.0;
        double sharpe_ratio = 0.0;
        double max_drawdown = 0.0;
    };

    struct OptimizationSummary {
        std::string strategy_type;
        std::vector<OptimizationResult> results; // Best return first
        size_t evaluated = 0;
        size_t skipped = 0;                      // Rejected by parameter validation

        const OptimizationResult* best() const { return results.empty() ? nullptr : &results.front(); }
    };

    // Exhaustive grid search. Every combination is built through the StrategyFactory;
    // combinations rejected with ParameterValidationException are skipped, the rest run
    // through the full Backtester pipeline.
    class Optimizer {
    public:
        explicit Optimizer(core::config::BacktestConfig config, std::string symbol = "");

        // Throws core::StrategyException for an unregistered strategy type and
        // core::InvalidDataException for bad bars
        OptimizationSummary optimize(const std::string& strategy_type,
                                     const ParameterGrid& grid,
                                     const core::TimeSeries<core::Candle>& bars,
                                     const indicators::IndicatorFrame& frame = indicators::IndicatorFrame{}) const;

        // Cartesian product; an empty grid yields one empty combination
        static std::vector<strategy_engine::ParameterMap> expandGrid(const ParameterGrid& grid);

        // { "fast_period": [5, 10], "ma_type": ["SMA", "EMA"] }. Throws ParameterValidationException.
        static ParameterGrid gridFromJson(const nlohmann::json& grid);

    private:
        Backtester backtester_;
    };

    ParameterGrid maCrossoverGrid(const std::vector<int>& fast_periods = {5, 10, 15, 20},
                                  const std::vector<int>& slow_periods = {20, 30, 50, 100},
                                  const std::string& ma_type = "SMA");

    ParameterGrid rsiGrid(const std::vector<int>& rsi_periods = {7, 14, 21},
                          const std::vector<double>& oversold_levels = {20, 30, 40},
                          const std::vector<double>& overbought_levels = {60, 70, 80});

    nlohmann::json toJson(const OptimizationSummary& summary);

    // Logs the best `top_n` combinations
    void logOptimization(const OptimizationSummary& summary, size_t top_n = 5);

} // namespace backtester
