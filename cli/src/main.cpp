// cli/src/main.cpp
//
// Usage: backtest_cli <config.json>
// Loads candles from SQLite, backtests every configured strategy, compares them,
// paper-trades the first one, runs the optional parameter sweep and stores the results.

#include <iostream>
#include <string>
#include <vector>
#include <exception>
#include <chrono>
#include <memory>
#include <optional>

#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "config.hpp"
#include "utils.hpp"
#include "database_manager.hpp"
#include "indicator_frame.hpp"
#include "strategy_factory.hpp"
#include "backtester.hpp"
#include "paper_trading_session.hpp"
#include "optimizer.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <nlohmann/json.hpp>

namespace {

    std::optional<core::Timestamp> parseBound(const std::string& text) {
        if (text.empty()) {
            return std::nullopt;
        }
        return core::utils::stringToTimestamp(text);
    }

    // Backtest position_size acts as the default for strategies that omit it
    nlohmann::json withDefaultPositionSize(nlohmann::json strategy_config, double position_size) {
        if (!strategy_config.contains("parameters") || !strategy_config["parameters"].is_object()) {
            strategy_config["parameters"] = nlohmann::json::object();
        }
        if (!strategy_config["parameters"].contains("position_size")) {
            strategy_config["parameters"]["position_size"] = position_size;
        }
        return strategy_config;
    }

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    if (argc != 2) {
        std::cerr << "Usage: " << (argc > 0 ? argv[0] : "backtest_cli") << " <config.json>" << std::endl;
        return 2;
    }

    try {
        // --- Configuration & Logging ---
        const core::config::AppConfig config = core::config::loadConfig(argv[1]);
        core::logging::initialize(config.logging);
        logger = core::logging::getLogger();
        logger->info("Backtest CLI starting with config: {}", argv[1]);

        if (config.strategies.empty()) {
            throw core::ConfigException("Config lists no strategies to run.");
        }

        // --- Market Data ---
        data::DatabaseManager db_manager(config.data.database_path);
        if (!db_manager.connect() || !db_manager.initializeSchema()) {
            throw core::DataLoadException(fmt::format("Cannot open database '{}'.", config.data.database_path));
        }

        const core::TimeSeries<core::Candle> bars = db_manager.queryCandles(
            config.data.symbol, config.data.interval, parseBound(config.data.start), parseBound(config.data.end));
        if (bars.empty()) {
            throw core::DataLoadException(fmt::format("No candles for {} ({}) in the requested range.",
                                                      config.data.symbol, config.data.interval));
        }
        core::utils::validateBars(bars);
        logger->info("Loaded {} candles for {} ({})", bars.size(), config.data.symbol, config.data.interval);

        indicators::IndicatorFrame frame(bars.size());
        frame.addAll(bars);

        // --- Strategies ---
        std::vector<std::unique_ptr<strategy_engine::IStrategy>> strategies;
        for (const auto& strategy_config : config.strategies) {
            strategies.push_back(strategy_engine::StrategyFactory::createStrategy(
                withDefaultPositionSize(strategy_config, config.backtest.position_size)));
        }

        // --- Backtests ---
        backtester::Backtester backtester(config.backtest, config.data.symbol);
        const auto run_time = std::chrono::system_clock::now();
        for (const auto& strategy : strategies) {
            backtester::BacktestResult result = backtester.run(*strategy, bars, frame);
            backtester::logSummary(result);

            const nlohmann::json result_json = backtester::toJson(result);
            if (!db_manager.saveBacktestRun(result.strategy_name, run_time, result_json.dump())) {
                logger->warn("Backtest run for '{}' was not stored in the database.", result.strategy_name);
            }
            const std::string path = backtester::saveResultJson(result, config.results_dir);
            logger->info("Results written to {}", path);
        }

        if (strategies.size() > 1) {
            backtester::logComparison(backtester.compareStrategies(strategies, bars, frame));
        }

        // --- Paper Trading ---
        backtester::PaperTradingSession session(config.backtest, config.risk, config.data.symbol);
        backtester::PaperTradingResult paper = session.run(*strategies.front(), bars, frame);
        backtester::logPaperResult(paper);
        paper.realized_performance.logMetrics();

        // --- Parameter Sweep ---
        if (config.optimizer.enabled()) {
            backtester::Optimizer optimizer(config.backtest, config.data.symbol);
            backtester::OptimizationSummary summary = optimizer.optimize(
                config.optimizer.strategy_type, backtester::Optimizer::gridFromJson(config.optimizer.grid), bars, frame);
            backtester::logOptimization(summary);

            const std::string sweep_name = "optimizer_" + config.optimizer.strategy_type;
            if (!db_manager.saveBacktestRun(sweep_name, run_time, backtester::toJson(summary).dump())) {
                logger->warn("Optimizer results were not stored in the database.");
            }
        }

        logger->info("Backtest CLI finished.");

    } catch (const core::PlatformException& ex) {
        std::cerr << "Platform Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Platform Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}
