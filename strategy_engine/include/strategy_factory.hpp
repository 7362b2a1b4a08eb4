#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "interfaces.hpp"
#include "common_types.hpp"

namespace strategy_engine {

    using json = nlohmann::json;

    // JSON object <-> parameter map. Integers stay int, other numbers become
    // double; anything but numbers and strings throws ParameterValidationException.
    ParameterMap parametersFromJson(const json& parameters);
    json parametersToJson(const ParameterMap& parameters);

    // Explicit registry of every strategy variant, keyed by type name.
    //
    // Strategy config layout:
    //   { "type": "ma_crossover", "name": "...", "parameters": { "fast_period": 10, ... } }
    //   { "type": "rule_based", "name": "...", "parameters": { "position_size": 0.9 },
    //     "entry_rules": [ { "rule_name": "...", "condition": { ... } } ], "exit_rules": [ ... ] }
    // Condition layout:
    //   { "type": "Indicator", "indicator1": "rsi_14", "op": "<", "value": 30 }
    //   { "type": "Indicator", "indicator1": "close", "op": ">", "indicator2": "sma_50" }
    //   { "type": "Cross", "indicator1": "sma_10", "direction": "CrossesAbove", "indicator2": "sma_20" }
    //   { "type": "AND" | "OR", "conditions": [ ... ] }
    class StrategyFactory {
    public:
        // Malformed parameters or rules throw core::ParameterValidationException,
        // an unknown type throws core::StrategyException.
        static std::unique_ptr<IStrategy> createStrategy(const json& config);
        static std::unique_ptr<IStrategy> createStrategy(const std::string& type, const ParameterMap& parameters);

        static std::vector<std::string> registeredTypes();
        static bool isRegistered(const std::string& type);

    private:
        // `config` carries the optional name and, for rule_based, the rules
        using Creator = std::function<std::unique_ptr<IStrategy>(const ParameterMap&, const json&)>;

        static const std::map<std::string, Creator>& registry();
        static std::unique_ptr<IStrategy> create(const std::string& type, const ParameterMap& parameters, const json& config);

        static std::unique_ptr<IStrategy> createMaCrossover(const ParameterMap& parameters, const json& config);
        static std::unique_ptr<IStrategy> createRsiMeanReversion(const ParameterMap& parameters, const json& config);
        static std::unique_ptr<IStrategy> createRuleBased(const ParameterMap& parameters, const json& config);

        static std::unique_ptr<ICondition> parseCondition(const json& condition_config);
        static std::unique_ptr<IRule> parseRule(const json& rule_config, core::SignalType signal);
    };

} // namespace strategy_engine
