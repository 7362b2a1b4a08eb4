#include "backtester.hpp"
#include "strategy_factory.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace backtester {

    Backtester::Backtester(core::config::BacktestConfig config, std::string symbol)
        : config_(config), symbol_(std::move(symbol))
    {
        core::config::validate(config_);
        core::logging::getLogger()->debug("Backtester initialized with capital: {}, commission: {}, slippage: {}",
                                          config_.initial_capital, config_.commission, config_.slippage);
    }

    BacktestResult Backtester::run(const strategy_engine::IStrategy& strategy,
                                   const core::TimeSeries<core::Candle>& bars,
                                   const indicators::IndicatorFrame& frame) const
    {
        auto logger = core::logging::getLogger();
        logger->info("========================================================");
        logger->info("Starting backtest for strategy: {}", strategy.getName());
        if (!bars.empty()) {
            logger->info("Data period: {} to {} ({} bars)",
                         core::utils::timestampToString(bars.front().timestamp),
                         core::utils::timestampToString(bars.back().timestamp), bars.size());
        }
        logger->info("Initial capital: {:.2f}", config_.initial_capital);

        BacktestResult result;
        result.strategy_name = strategy.getName();
        result.strategy_type = strategy.getType();
        result.symbol = symbol_;
        result.parameters = strategy.getParameters();
        result.initial_capital = config_.initial_capital;

        // 1. Signals (validates the bars)
        result.signaled = strategy.generateSignals(bars, frame);

        // 2. Simulation
        TradeSimulator simulator(config_.initial_capital, symbol_);
        result.simulation = simulator.run(result.signaled, strategy.getPositionSizeFraction());
        result.trade_ledger = result.simulation.ledger;

        // 3. Basic performance
        result.performance_report = analyzer_.calculatePerformance(result.simulation, config_.initial_capital);

        // 4. Transaction costs
        result.transaction_costs = analyzer_.applyTransactionCosts(
            result.trade_ledger, result.simulation.final_value, config_.commission, config_.slippage);
        if (!result.trade_ledger.empty()) {
            PerformanceReport& report = result.performance_report;
            report.final_value = result.transaction_costs.adjusted_final_value;
            report.total_return = report.final_value - config_.initial_capital;
            report.total_return_pct = report.total_return / config_.initial_capital * 100.0;
        }

        // 5./6. Equity curve over cost-adjusted trade values, then detailed metrics from it
        result.equity_curve = analyzer_.buildEquityCurve(
            bars, result.trade_ledger, result.transaction_costs.adjustedValues(), config_.initial_capital);
        analyzer_.addDetailedMetrics(result.performance_report, result.equity_curve, result.trade_ledger);

        logger->info("Backtest complete: {} executions, return {:.2f}%",
                     result.trade_ledger.size(), result.performance_report.total_return_pct);
        return result;
    }

    std::vector<StrategyComparisonRow> Backtester::compareStrategies(
        const std::vector<std::unique_ptr<strategy_engine::IStrategy>>& strategies,
        const core::TimeSeries<core::Candle>& bars,
        const indicators::IndicatorFrame& frame) const
    {
        auto logger = core::logging::getLogger();
        logger->info("Comparing {} strategies...", strategies.size());

        std::vector<StrategyComparisonRow> rows;
        for (const auto& strategy : strategies) {
            if (!strategy) {
                continue;
            }
            BacktestResult result = run(*strategy, bars, frame);
            const PerformanceReport& report = result.performance_report;

            StrategyComparisonRow row;
            row.strategy_name = result.strategy_name;
            row.total_return = report.total_return;
            row.return_pct = report.total_return_pct;
            row.sharpe_ratio = report.sharpe_ratio;
            row.max_drawdown = report.max_drawdown;
            row.num_trades = report.num_completed_trades;
            row.win_rate = report.win_rate;
            row.profit_factor = report.profit_factor;
            rows.push_back(row);
        }

        std::stable_sort(rows.begin(), rows.end(), [](const StrategyComparisonRow& a, const StrategyComparisonRow& b) {
            return a.return_pct > b.return_pct;
        });
        logger->info("Strategy comparison complete");
        return rows;
    }

    // --- Serialisation ---

    namespace {

        json optionalToJson(const std::optional<double>& value) {
            return value ? json(*value) : json(nullptr);
        }

        std::string fileStem(const std::string& strategy_name) {
            std::string stem;
            stem.reserve(strategy_name.size());
            for (unsigned char c : strategy_name) {
                if (std::isalnum(c)) {
                    stem += static_cast<char>(std::tolower(c));
                } else if (c == ' ' || c == '_' || c == '-') {
                    stem += '_';
                }
            }
            return stem.empty() ? "backtest" : stem;
        }

    } // namespace

    json toJson(const PerformanceReport& report) {
        return json{
            {"initial_capital", report.initial_capital},
            {"final_value", report.final_value},
            {"total_return", report.total_return},
            {"total_return_pct", report.total_return_pct},
            {"num_trades", report.num_trades},
            {"num_completed_trades", report.num_completed_trades},
            {"win_rate", report.win_rate},
            {"profit_factor", optionalToJson(report.profit_factor)},
            {"avg_trade", report.avg_trade},
            {"sharpe_ratio", report.sharpe_ratio},
            {"max_drawdown", report.max_drawdown},
            {"max_drawdown_value", report.max_drawdown_value},
            {"avg_win", report.avg_win},
            {"avg_loss", report.avg_loss},
            {"largest_win", report.largest_win},
            {"largest_loss", report.largest_loss}
        };
    }

    json toJson(const CostAdjustment& costs) {
        return json{
            {"total_commission", costs.total_commission},
            {"total_slippage", costs.total_slippage},
            {"total_costs", costs.total_costs},
            {"adjusted_final_value", costs.adjusted_final_value}
        };
    }

    json toJson(const core::Trade& trade) {
        return json{
            {"timestamp", core::utils::timestampToString(trade.timestamp)},
            {"symbol", trade.symbol},
            {"action", core::toString(trade.action)},
            {"price", trade.price},
            {"quantity", trade.quantity},
            {"cash_flow", trade.cash_flow},
            {"portfolio_value", trade.portfolio_value_after},
            {"reason", core::toString(trade.reason)}
        };
    }

    json toJson(const BacktestResult& result) {
        json ledger = json::array();
        for (size_t i = 0; i < result.trade_ledger.size(); ++i) {
            json entry = toJson(result.trade_ledger[i]);
            if (i < result.transaction_costs.per_trade.size()) {
                const TradeCost& cost = result.transaction_costs.per_trade[i];
                entry["commission"] = cost.commission;
                entry["slippage"] = cost.slippage;
                entry["adjusted_portfolio_value"] = cost.adjusted_portfolio_value;
            }
            ledger.push_back(entry);
        }

        json equity = json::array();
        for (const auto& point : result.equity_curve) {
            equity.push_back({{"timestamp", core::utils::timestampToString(point.timestamp)},
                              {"portfolio_value", point.portfolio_value}});
        }

        return json{
            {"strategy_name", result.strategy_name},
            {"strategy_type", result.strategy_type},
            {"symbol", result.symbol},
            {"parameters", strategy_engine::parametersToJson(result.parameters)},
            {"initial_capital", result.initial_capital},
            {"performance_report", toJson(result.performance_report)},
            {"transaction_costs", toJson(result.transaction_costs)},
            {"trade_ledger", ledger},
            {"equity_curve", equity}
        };
    }

    json toJson(const std::vector<StrategyComparisonRow>& rows) {
        json out = json::array();
        for (const auto& row : rows) {
            out.push_back({
                {"strategy_name", row.strategy_name},
                {"total_return", row.total_return},
                {"return_pct", row.return_pct},
                {"sharpe_ratio", row.sharpe_ratio},
                {"max_drawdown", row.max_drawdown},
                {"num_trades", row.num_trades},
                {"win_rate", row.win_rate},
                {"profit_factor", optionalToJson(row.profit_factor)}
            });
        }
        return out;
    }

    void logSummary(const BacktestResult& result) {
        auto logger = core::logging::getLogger();
        logger->info("========================================");
        logger->info("  BACKTEST RESULTS: {}", result.strategy_name);
        logger->info("========================================");
        result.performance_report.logMetrics();
        if (!result.trade_ledger.empty()) {
            logger->info("Total Commission:  {:.2f}", result.transaction_costs.total_commission);
            logger->info("Total Slippage:    {:.2f}", result.transaction_costs.total_slippage);
            logger->info("Total Costs:       {:.2f}", result.transaction_costs.total_costs);
        }
    }

    void logComparison(const std::vector<StrategyComparisonRow>& rows) {
        auto logger = core::logging::getLogger();
        logger->info("=== STRATEGY COMPARISON ===");
        logger->info("{:<32} {:>12} {:>9} {:>8} {:>9} {:>7} {:>8} {:>8}",
                     "Strategy", "Return", "Return%", "Sharpe", "MaxDD%", "Trades", "WinRate", "PF");
        for (const auto& row : rows) {
            logger->info("{:<32} {:>12.2f} {:>9.2f} {:>8.2f} {:>9.2f} {:>7} {:>8.2f} {:>8}",
                         row.strategy_name, row.total_return, row.return_pct, row.sharpe_ratio,
                         row.max_drawdown, row.num_trades, row.win_rate,
                         row.profit_factor ? fmt::format("{:.2f}", *row.profit_factor) : std::string("n/a"));
        }
    }

    std::string saveResultJson(const BacktestResult& result, const std::string& directory) {
        namespace fs = std::filesystem;
        std::error_code ec;
        fs::create_directories(directory, ec);
        if (ec) {
            throw core::BacktestException("Failed to create results directory '" + directory + "': " + ec.message());
        }

        const std::string file_name = fileStem(result.strategy_name) + "_" +
                                      core::utils::compactTimestamp(std::chrono::system_clock::now()) + ".json";
        const std::string path = (fs::path(directory) / file_name).string();

        std::ofstream ofs(path);
        if (!ofs.is_open()) {
            throw core::BacktestException("Failed to open result file for writing: " + path);
        }
        ofs << toJson(result).dump(2) << std::endl;
        if (!ofs) {
            throw core::BacktestException("Failed to write result file: " + path);
        }

        core::logging::getLogger()->info("Backtest results saved to: {}", path);
        return path;
    }

} // namespace backtester
