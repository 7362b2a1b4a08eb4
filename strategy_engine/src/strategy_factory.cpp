#include "strategy_factory.hpp"
#include "ma_crossover_strategy.hpp"
#include "rsi_mean_reversion_strategy.hpp"
#include "rule_based_strategy.hpp"
#include "rule.hpp"
#include "indicator_condition.hpp"
#include "indicator_cross_condition.hpp"
#include "composite_condition.hpp"
#include "moving_average_indicator.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <cmath>
#include <limits>
#include <stdexcept>

namespace strategy_engine {

    namespace { // file-local helpers

        int readInt(const ParameterMap& params, const std::string& key, int default_value) {
            auto it = params.find(key);
            if (it == params.end()) {
                return default_value;
            }
            if (const int* value = std::get_if<int>(&it->second)) {
                return *value;
            }
            if (const double* value = std::get_if<double>(&it->second)) {
                if (std::floor(*value) == *value) {
                    if (*value < static_cast<double>(std::numeric_limits<int>::min()) ||
                        *value > static_cast<double>(std::numeric_limits<int>::max())) {
                        throw core::ParameterValidationException(
                            fmt::format("Parameter '{}' is out of integer range (got {}).", key, *value));
                    }
                    return static_cast<int>(*value);
                }
            }
            throw core::ParameterValidationException(
                fmt::format("Parameter '{}' must be an integer (got '{}').", key, parameterToString(it->second)));
        }

        double readDouble(const ParameterMap& params, const std::string& key, double default_value) {
            auto it = params.find(key);
            if (it == params.end()) {
                return default_value;
            }
            return parameterAsDouble(it->second);
        }

        std::string readString(const ParameterMap& params, const std::string& key, const std::string& default_value) {
            auto it = params.find(key);
            if (it == params.end()) {
                return default_value;
            }
            if (const std::string* value = std::get_if<std::string>(&it->second)) {
                return *value;
            }
            throw core::ParameterValidationException(fmt::format("Parameter '{}' must be a string.", key));
        }

        bool fitsInt(const json& value) {
            if (value.is_number_unsigned()) {
                return value.get<unsigned long long>() <= static_cast<unsigned long long>(std::numeric_limits<int>::max());
            }
            return value.is_number_integer() &&
                   value.get<long long>() >= std::numeric_limits<int>::min() &&
                   value.get<long long>() <= std::numeric_limits<int>::max();
        }

        std::string readName(const json& config, const std::string& default_name) {
            if (config.contains("name") && config["name"].is_string()) {
                return config["name"].get<std::string>();
            }
            return default_name;
        }

        const std::string& requireString(const json& config, const char* key, const char* context) {
            if (!config.contains(key) || !config[key].is_string()) {
                throw core::ParameterValidationException(fmt::format("{} requires '{}' (string).", context, key));
            }
            return config[key].get_ref<const std::string&>();
        }

    } // namespace

    ParameterMap parametersFromJson(const json& parameters) {
        ParameterMap result;
        if (parameters.is_null()) {
            return result;
        }
        if (!parameters.is_object()) {
            throw core::ParameterValidationException("Strategy 'parameters' must be a JSON object.");
        }
        for (const auto& item : parameters.items()) {
            const json& value = item.value();
            if (fitsInt(value)) {
                result[item.key()] = value.get<int>();
            } else if (value.is_number()) {
                result[item.key()] = value.get<double>();
            } else if (value.is_string()) {
                result[item.key()] = value.get<std::string>();
            } else {
                throw core::ParameterValidationException(
                    fmt::format("Parameter '{}' must be a number or a string.", item.key()));
            }
        }
        return result;
    }

    json parametersToJson(const ParameterMap& parameters) {
        json result = json::object();
        for (const auto& entry : parameters) {
            std::visit([&](const auto& value) { result[entry.first] = value; }, entry.second);
        }
        return result;
    }

    const std::map<std::string, StrategyFactory::Creator>& StrategyFactory::registry() {
        static const std::map<std::string, Creator> creators = {
            {MovingAverageCrossoverStrategy::kType, &StrategyFactory::createMaCrossover},
            {RsiMeanReversionStrategy::kType, &StrategyFactory::createRsiMeanReversion},
            {RuleBasedStrategy::kType, &StrategyFactory::createRuleBased}
        };
        return creators;
    }

    std::vector<std::string> StrategyFactory::registeredTypes() {
        std::vector<std::string> types;
        for (const auto& entry : registry()) {
            types.push_back(entry.first);
        }
        return types;
    }

    bool StrategyFactory::isRegistered(const std::string& type) {
        return registry().count(type) > 0;
    }

    std::unique_ptr<IStrategy> StrategyFactory::createMaCrossover(const ParameterMap& params, const json& config) {
        indicators::MaType ma_type;
        try {
            ma_type = indicators::maTypeFromString(readString(params, "ma_type", "SMA"));
        } catch (const std::invalid_argument& e) {
            throw core::ParameterValidationException(e.what());
        }
        return std::make_unique<MovingAverageCrossoverStrategy>(
            readInt(params, "fast_period", 10),
            readInt(params, "slow_period", 20),
            ma_type,
            readDouble(params, "position_size", 0.95),
            readName(config, "Moving Average Crossover"));
    }

    std::unique_ptr<IStrategy> StrategyFactory::createRsiMeanReversion(const ParameterMap& params, const json& config) {
        return std::make_unique<RsiMeanReversionStrategy>(
            readInt(params, "rsi_period", 14),
            readDouble(params, "oversold", 30.0),
            readDouble(params, "overbought", 70.0),
            readDouble(params, "position_size", 0.95),
            readName(config, "RSI Mean Reversion"));
    }

    std::unique_ptr<ICondition> StrategyFactory::parseCondition(const json& config) {
        if (!config.is_object()) {
            throw core::ParameterValidationException("Condition config must be an object with a 'type' (string).");
        }
        const std::string& type = requireString(config, "type", "Condition");
        core::logging::getLogger()->trace("Parsing condition of type: {}", type);

        try {
            if (type == "Indicator") {
                const std::string& column1 = requireString(config, "indicator1", "Indicator condition");
                ComparisonOp op = comparisonOpFromString(requireString(config, "op", "Indicator condition"));
                if (config.contains("value") && config["value"].is_number()) {
                    return std::make_unique<IndicatorCondition>(column1, op, config["value"].get<double>());
                }
                if (config.contains("indicator2") && config["indicator2"].is_string()) {
                    return std::make_unique<IndicatorCondition>(column1, op, config["indicator2"].get<std::string>());
                }
                throw core::ParameterValidationException("Indicator condition requires 'value' (number) or 'indicator2' (string).");
            }
            if (type == "Cross" || type == "CrossesAbove" || type == "CrossesBelow") {
                CrossType cross = crossTypeFromString(
                    type == "Cross" ? requireString(config, "direction", "Cross condition") : type);
                return std::make_unique<IndicatorCrossCondition>(
                    requireString(config, "indicator1", "Cross condition"),
                    cross,
                    requireString(config, "indicator2", "Cross condition"));
            }
            if (type == "AND" || type == "OR") {
                if (!config.contains("conditions") || !config["conditions"].is_array() || config["conditions"].empty()) {
                    throw core::ParameterValidationException(
                        fmt::format("{} condition requires 'conditions' (non-empty array).", type));
                }
                std::vector<std::unique_ptr<ICondition>> sub_conditions;
                sub_conditions.reserve(config["conditions"].size());
                for (const auto& sub_conf : config["conditions"]) {
                    sub_conditions.push_back(parseCondition(sub_conf));
                }
                if (type == "AND") {
                    return std::make_unique<AndCondition>(std::move(sub_conditions));
                }
                return std::make_unique<OrCondition>(std::move(sub_conditions));
            }
        } catch (const std::invalid_argument& e) {
            // Constructor checks (empty names, self comparison)
            throw core::ParameterValidationException(fmt::format("Invalid '{}' condition: {}", type, e.what()));
        }
        throw core::ParameterValidationException(fmt::format("Unknown condition type '{}' in config.", type));
    }

    std::unique_ptr<IRule> StrategyFactory::parseRule(const json& config, core::SignalType signal) {
        if (!config.is_object() || !config.contains("condition") || !config["condition"].is_object()) {
            throw core::ParameterValidationException("Rule config must be an object with 'rule_name' (string) and 'condition' (object).");
        }
        const std::string& name = requireString(config, "rule_name", "Rule");
        try {
            return std::make_unique<Rule>(name, parseCondition(config["condition"]), signal);
        } catch (const std::invalid_argument& e) {
            throw core::ParameterValidationException(fmt::format("Invalid rule '{}': {}", name, e.what()));
        }
    }

    std::unique_ptr<IStrategy> StrategyFactory::createRuleBased(const ParameterMap& params, const json& config) {
        if (!config.contains("entry_rules") || !config["entry_rules"].is_array()) {
            throw core::ParameterValidationException("Rule-based strategy requires an 'entry_rules' array.");
        }
        std::vector<std::unique_ptr<IRule>> entry_rules;
        for (const auto& rule_conf : config["entry_rules"]) {
            entry_rules.push_back(parseRule(rule_conf, core::SignalType::Buy));
        }

        std::vector<std::unique_ptr<IRule>> exit_rules;
        if (config.contains("exit_rules")) {
            if (!config["exit_rules"].is_array()) {
                throw core::ParameterValidationException("'exit_rules' must be an array.");
            }
            for (const auto& rule_conf : config["exit_rules"]) {
                exit_rules.push_back(parseRule(rule_conf, core::SignalType::Sell));
            }
        }

        std::string description;
        if (config.contains("description") && config["description"].is_string()) {
            description = config["description"].get<std::string>();
        }

        return std::make_unique<RuleBasedStrategy>(
            readName(config, "Rule Based Strategy"),
            std::move(entry_rules),
            std::move(exit_rules),
            readDouble(params, "position_size", 0.95),
            description);
    }

    std::unique_ptr<IStrategy> StrategyFactory::create(const std::string& type, const ParameterMap& parameters, const json& config) {
        auto it = registry().find(type);
        if (it == registry().end()) {
            throw core::StrategyException(fmt::format("Unknown strategy type '{}'. Registered types: {}",
                                                      type, fmt::join(registeredTypes(), ", ")));
        }
        auto strategy = it->second(parameters, config);
        core::logging::getLogger()->debug("Created strategy '{}' ({}): {}",
                                          strategy->getName(), type, strategy->getDescription());
        return strategy;
    }

    std::unique_ptr<IStrategy> StrategyFactory::createStrategy(const json& config) {
        if (!config.is_object()) {
            throw core::ParameterValidationException("Strategy config must be a JSON object.");
        }
        const std::string& type = requireString(config, "type", "Strategy config");

        ParameterMap parameters;
        if (config.contains("parameters")) {
            parameters = parametersFromJson(config["parameters"]);
        }

        try {
            return create(type, parameters, config);
        } catch (const json::exception& e) {
            throw core::ParameterValidationException(fmt::format("Invalid JSON for strategy type '{}': {}", type, e.what()));
        }
    }

    std::unique_ptr<IStrategy> StrategyFactory::createStrategy(const std::string& type, const ParameterMap& parameters) {
        return create(type, parameters, json::object());
    }

} // namespace strategy_engine
