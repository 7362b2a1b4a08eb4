#pragma once

#include "logging.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace core {
namespace config {

    using json = nlohmann::json;

    struct BacktestConfig {
        double initial_capital = 10000.0;
        double commission = 0.001;    // 0.1% of notional per execution
        double slippage = 0.0005;     // 0.05% of notional per execution
        double position_size = 0.95;  // Fraction of cash committed on entry
    };

    struct RiskConfig {
        double stop_loss_pct = 0.02;
        double take_profit_pct = 0.05;
        double default_risk_pct = 0.02;   // Fixed-fraction fallback
        double max_kelly_fraction = 0.5;
        double max_portfolio_risk = 0.10; // Fraction of capital at risk across open positions
        double atr_multiplier = 2.0;
        double trailing_stop_pct = 0.0;   // 0 disables the trailing stop
    };

    struct DataConfig {
        std::string database_path = "market_data.db";
        std::string symbol = "BTC";
        std::string interval = "day";
        std::string start;  // ISO-8601, empty = unbounded
        std::string end;
    };

    struct OptimizerConfig {
        std::string strategy_type;
        json grid = json::object(); // parameter name -> array of candidate values

        bool enabled() const { return !strategy_type.empty() && !grid.empty(); }
    };

    struct AppConfig {
        logging::LoggingOptions logging;
        BacktestConfig backtest;
        RiskConfig risk;
        DataConfig data;
        std::vector<json> strategies;
        OptimizerConfig optimizer;
        std::string results_dir = "results";
    };

    // Parse an already-loaded JSON document. Missing keys keep their defaults;
    // keys present with the wrong type throw ConfigException.
    AppConfig parseConfig(const json& root);

    // Load and parse a JSON config file. Throws ConfigException.
    AppConfig loadConfig(const std::string& path);

    // Range checks shared by the loader and by components built from code
    void validate(const BacktestConfig& config);
    void validate(const RiskConfig& config);

} // namespace config
} // namespace core
