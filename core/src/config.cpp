#include "config.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <fstream>

namespace core {
namespace config {

    namespace {

        // Reads root[key] into target if present; throws ConfigException on type mismatch
        template <typename T>
        void readOptional(const json& root, const char* section, const char* key, T& target) {
            if (!root.contains(key) || root[key].is_null()) {
                return;
            }
            try {
                target = root[key].get<T>();
            } catch (const json::exception& e) {
                throw ConfigException(fmt::format("Invalid value for '{}.{}': {}", section, key, e.what()));
            }
        }

        const json& section(const json& root, const char* name) {
            static const json empty = json::object();
            if (!root.contains(name)) {
                return empty;
            }
            if (!root[name].is_object()) {
                throw ConfigException(fmt::format("Config section '{}' must be an object.", name));
            }
            return root[name];
        }

        logging::LoggingOptions parseLogging(const json& node) {
            logging::LoggingOptions options;
            std::string console_level = "info";
            std::string file_level = "debug";
            readOptional(node, "logging", "console_level", console_level);
            readOptional(node, "logging", "file_level", file_level);
            readOptional(node, "logging", "to_file", options.to_file);
            readOptional(node, "logging", "log_dir", options.log_dir);
            readOptional(node, "logging", "file_name", options.base_file_name);
            options.console_level = logging::level_from_string(console_level);
            options.file_level = logging::level_from_string(file_level);
            return options;
        }

    } // namespace

    void validate(const BacktestConfig& config) {
        if (!(config.initial_capital > 0.0)) {
            throw ConfigException(fmt::format("backtest.initial_capital must be positive (got {}).", config.initial_capital));
        }
        if (config.commission < 0.0 || config.slippage < 0.0) {
            throw ConfigException("backtest.commission and backtest.slippage must be non-negative.");
        }
        if (!(config.position_size > 0.0) || config.position_size > 1.0) {
            throw ConfigException(fmt::format("backtest.position_size must be in (0, 1] (got {}).", config.position_size));
        }
    }

    void validate(const RiskConfig& config) {
        if (config.stop_loss_pct < 0.0 || config.stop_loss_pct >= 1.0) {
            throw ConfigException("risk.stop_loss_pct must be in [0, 1).");
        }
        if (config.take_profit_pct < 0.0) {
            throw ConfigException("risk.take_profit_pct must be non-negative.");
        }
        if (config.max_kelly_fraction < 0.0 || config.max_kelly_fraction > 1.0) {
            throw ConfigException("risk.max_kelly_fraction must be in [0, 1].");
        }
        if (config.max_portfolio_risk <= 0.0) {
            throw ConfigException("risk.max_portfolio_risk must be positive.");
        }
        if (config.trailing_stop_pct < 0.0 || config.trailing_stop_pct >= 1.0) {
            throw ConfigException("risk.trailing_stop_pct must be in [0, 1).");
        }
    }

    AppConfig parseConfig(const json& root) {
        if (!root.is_object()) {
            throw ConfigException("Config root must be a JSON object.");
        }

        AppConfig config;
        config.logging = parseLogging(section(root, "logging"));

        const json& backtest = section(root, "backtest");
        readOptional(backtest, "backtest", "initial_capital", config.backtest.initial_capital);
        readOptional(backtest, "backtest", "commission", config.backtest.commission);
        readOptional(backtest, "backtest", "slippage", config.backtest.slippage);
        readOptional(backtest, "backtest", "position_size", config.backtest.position_size);
        validate(config.backtest);

        const json& risk = section(root, "risk");
        readOptional(risk, "risk", "stop_loss_pct", config.risk.stop_loss_pct);
        readOptional(risk, "risk", "take_profit_pct", config.risk.take_profit_pct);
        readOptional(risk, "risk", "default_risk_pct", config.risk.default_risk_pct);
        readOptional(risk, "risk", "max_kelly_fraction", config.risk.max_kelly_fraction);
        readOptional(risk, "risk", "max_portfolio_risk", config.risk.max_portfolio_risk);
        readOptional(risk, "risk", "atr_multiplier", config.risk.atr_multiplier);
        readOptional(risk, "risk", "trailing_stop_pct", config.risk.trailing_stop_pct);
        validate(config.risk);

        const json& data = section(root, "data");
        readOptional(data, "data", "database_path", config.data.database_path);
        readOptional(data, "data", "symbol", config.data.symbol);
        readOptional(data, "data", "interval", config.data.interval);
        readOptional(data, "data", "start", config.data.start);
        readOptional(data, "data", "end", config.data.end);

        if (root.contains("strategies")) {
            if (!root["strategies"].is_array()) {
                throw ConfigException("'strategies' must be an array of strategy objects.");
            }
            for (const auto& strategy : root["strategies"]) {
                if (!strategy.is_object()) {
                    throw ConfigException("Each entry in 'strategies' must be an object.");
                }
                config.strategies.push_back(strategy);
            }
        }

        const json& optimizer = section(root, "optimizer");
        readOptional(optimizer, "optimizer", "strategy_type", config.optimizer.strategy_type);
        if (optimizer.contains("grid")) {
            if (!optimizer["grid"].is_object()) {
                throw ConfigException("'optimizer.grid' must map parameter names to arrays.");
            }
            for (const auto& item : optimizer["grid"].items()) {
                if (!item.value().is_array()) {
                    throw ConfigException(fmt::format("'optimizer.grid.{}' must be an array.", item.key()));
                }
            }
            config.optimizer.grid = optimizer["grid"];
        }

        readOptional(root, "root", "results_dir", config.results_dir);
        return config;
    }

    AppConfig loadConfig(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException(fmt::format("Failed to open config file: {}", path));
        }
        json root;
        try {
            root = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
        }
        return parseConfig(root);
    }

} // namespace config
} // namespace core
