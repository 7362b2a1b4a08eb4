#include "optimizer.hpp"
#include "strategy_factory.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <algorithm>
#include <utility>

namespace backtester {

    namespace {

        std::string describe(const strategy_engine::ParameterMap& parameters) {
            std::vector<std::string> parts;
            for (const auto& entry : parameters) {
                parts.push_back(fmt::format("{}={}", entry.first, strategy_engine::parameterToString(entry.second)));
            }
            return fmt::format("{}", fmt::join(parts, ", "));
        }

    } // anonymous namespace

    Optimizer::Optimizer(core::config::BacktestConfig config, std::string symbol)
        : backtester_(config, std::move(symbol)) {}

    std::vector<strategy_engine::ParameterMap> Optimizer::expandGrid(const ParameterGrid& grid) {
        std::vector<strategy_engine::ParameterMap> combinations(1);
        for (const auto& axis : grid) {
            std::vector<strategy_engine::ParameterMap> next;
            next.reserve(combinations.size() * axis.second.size());
            for (const auto& partial : combinations) {
                for (const auto& value : axis.second) {
                    strategy_engine::ParameterMap combination = partial;
                    combination[axis.first] = value;
                    next.push_back(std::move(combination));
                }
            }
            combinations = std::move(next);
        }
        return combinations;
    }

    ParameterGrid Optimizer::gridFromJson(const nlohmann::json& grid) {
        if (!grid.is_object()) {
            throw core::ParameterValidationException("Optimizer grid must be a JSON object of value arrays.");
        }
        ParameterGrid result;
        for (auto it = grid.begin(); it != grid.end(); ++it) {
            if (!it.value().is_array()) {
                throw core::ParameterValidationException(
                    fmt::format("Optimizer grid entry '{}' must be an array.", it.key()));
            }
            auto& candidates = result[it.key()];
            for (const auto& value : it.value()) {
                // Reuse the factory's scalar conversion rules
                auto converted = strategy_engine::parametersFromJson(nlohmann::json{{it.key(), value}});
                candidates.push_back(converted.at(it.key()));
            }
        }
        return result;
    }

    OptimizationSummary Optimizer::optimize(const std::string& strategy_type,
                                            const ParameterGrid& grid,
                                            const core::TimeSeries<core::Candle>& bars,
                                            const indicators::IndicatorFrame& frame) const {
        auto logger = core::logging::getLogger();
        if (!strategy_engine::StrategyFactory::isRegistered(strategy_type)) {
            throw core::StrategyException(fmt::format("Cannot optimize unknown strategy type '{}'.", strategy_type));
        }

        const auto combinations = expandGrid(grid);
        logger->info("Optimizing {} over {} parameter combinations...", strategy_type, combinations.size());

        OptimizationSummary summary;
        summary.strategy_type = strategy_type;

        for (auto parameters : combinations) {
            if (parameters.count("position_size") == 0) {
                parameters["position_size"] = backtester_.config().position_size;
            }

            std::unique_ptr<strategy_engine::IStrategy> strategy;
            try {
                strategy = strategy_engine::StrategyFactory::createStrategy(strategy_type, parameters);
            } catch (const core::ParameterValidationException& e) {
                logger->debug("Skipping {{{}}}: {}", describe(parameters), e.what());
                summary.skipped++;
                continue;
            }

            logger->info("Testing {{{}}}", describe(parameters));
            BacktestResult backtest = backtester_.run(*strategy, bars, frame);
            const PerformanceReport& report = backtest.performance_report;

            OptimizationResult result;
            result.parameters = strategy->getParameters();
            result.total_return = report.total_return;
            result.total_return_pct = report.total_return_pct;
            result.num_trades = report.num_completed_trades;
            result.win_rate = report.win_rate;
            result.sharpe_ratio = report.sharpe_ratio;
            result.max_drawdown = report.max_drawdown;
            summary.results.push_back(std::move(result));
            summary.evaluated++;
        }

        std::stable_sort(summary.results.begin(), summary.results.end(),
                         [](const OptimizationResult& a, const OptimizationResult& b) {
                             return a.total_return_pct > b.total_return_pct;
                         });

        logger->info("Optimization complete: {} evaluated, {} skipped", summary.evaluated, summary.skipped);
        return summary;
    }

    ParameterGrid maCrossoverGrid(const std::vector<int>& fast_periods,
                                  const std::vector<int>& slow_periods,
                                  const std::string& ma_type) {
        ParameterGrid grid;
        grid["fast_period"].assign(fast_periods.begin(), fast_periods.end());
        grid["slow_period"].assign(slow_periods.begin(), slow_periods.end());
        grid["ma_type"] = {ma_type};
        return grid;
    }

    ParameterGrid rsiGrid(const std::vector<int>& rsi_periods,
                          const std::vector<double>& oversold_levels,
                          const std::vector<double>& overbought_levels) {
        ParameterGrid grid;
        grid["rsi_period"].assign(rsi_periods.begin(), rsi_periods.end());
        grid["oversold"].assign(oversold_levels.begin(), oversold_levels.end());
        grid["overbought"].assign(overbought_levels.begin(), overbought_levels.end());
        return grid;
    }

    nlohmann::json toJson(const OptimizationSummary& summary) {
        nlohmann::json results = nlohmann::json::array();
        for (const auto& result : summary.results) {
            results.push_back({
                {"parameters", strategy_engine::parametersToJson(result.parameters)},
                {"total_return", result.total_return},
                {"total_return_pct", result.total_return_pct},
                {"num_trades", result.num_trades},
                {"win_rate", result.win_rate},
                {"sharpe_ratio", result.sharpe_ratio},
                {"max_drawdown", result.max_drawdown}
            });
        }
        return {
            {"strategy_type", summary.strategy_type},
            {"evaluated", summary.evaluated},
            {"skipped", summary.skipped},
            {"results", results}
        };
    }

    void logOptimization(const OptimizationSummary& summary, size_t top_n) {
        auto logger = core::logging::getLogger();
        logger->info("=== TOP {} PARAMETER COMBINATIONS ({}) ===", std::min(top_n, summary.results.size()),
                     summary.strategy_type);
        for (size_t i = 0; i < summary.results.size() && i < top_n; ++i) {
            const auto& result = summary.results[i];
            logger->info("{}. {{{}}} return {:.2f}% trades {} win rate {:.1f}% sharpe {:.2f}",
                         i + 1, describe(result.parameters), result.total_return_pct,
                         result.num_trades, result.win_rate, result.sharpe_ratio);
        }
    }

} // namespace backtester
