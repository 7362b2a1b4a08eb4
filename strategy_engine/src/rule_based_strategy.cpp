#include "rule_based_strategy.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <set>
#include <stdexcept>

namespace strategy_engine {

namespace {

    bool isPriceField(const std::string& name) {
        return name == "open" || name == "high" || name == "low" || name == "close" || name == "volume";
    }

} // namespace

RuleBasedStrategy::RuleBasedStrategy(std::string name,
                                     std::vector<std::unique_ptr<IRule>> entry_rules,
                                     std::vector<std::unique_ptr<IRule>> exit_rules,
                                     double position_size,
                                     std::string description)
    : StrategyBase(std::move(name), kType, position_size),
      entry_rules_(std::move(entry_rules)),
      exit_rules_(std::move(exit_rules))
{
    if (entry_rules_.empty()) {
        throw core::ParameterValidationException(fmt::format("Strategy '{}' must have at least one entry rule.", getName()));
    }
    for (const auto& rule : entry_rules_) {
        if (!rule) throw core::ParameterValidationException("Entry rules cannot be null.");
    }
    for (const auto& rule : exit_rules_) {
        if (!rule) throw core::ParameterValidationException("Exit rules cannot be null.");
    }

    if (description.empty()) {
        description = fmt::format("{} entry rule(s), {} exit rule(s)", entry_rules_.size(), exit_rules_.size());
    }
    description_ = std::move(description);
    parameters_["entry_rules"] = static_cast<int>(entry_rules_.size());
    parameters_["exit_rules"] = static_cast<int>(exit_rules_.size());

    core::logging::getLogger()->debug("Strategy '{}' created with {} entry and {} exit rules.",
                                      getName(), entry_rules_.size(), exit_rules_.size());
}

std::set<std::string> RuleBasedStrategy::referencedColumns() const {
    std::set<std::string> columns;
    for (const auto& rule : entry_rules_) {
        rule->collectColumns(columns);
    }
    for (const auto& rule : exit_rules_) {
        rule->collectColumns(columns);
    }
    return columns;
}

void RuleBasedStrategy::computeSignals(const core::TimeSeries<core::Candle>& bars,
                                       const indicators::IndicatorFrame& frame,
                                       core::TimeSeries<core::SignaledBar>& signaled) const {
    auto logger = core::logging::getLogger();

    // Columns the rules read that the caller's frame does not carry
    const bool frame_aligned = frame.size() == bars.size();
    std::vector<std::string> missing;
    for (const auto& name : referencedColumns()) {
        if (!isPriceField(name) && !(frame_aligned && frame.has(name))) {
            missing.push_back(name);
        }
    }

    indicators::IndicatorFrame local;
    const indicators::IndicatorFrame* source = &frame;
    if (!missing.empty()) {
        if (frame_aligned) {
            local = frame;
        }
        for (const auto& name : missing) {
            bool built = false;
            try {
                built = local.addColumnByName(bars, name);
            } catch (const std::invalid_argument& e) {
                throw core::ParameterValidationException(
                    fmt::format("Strategy '{}': cannot compute column '{}': {}", getName(), name, e.what()));
            }
            if (!built) {
                throw core::ParameterValidationException(
                    fmt::format("Strategy '{}': column '{}' is neither a price field nor a known indicator "
                                "and is not in the indicator frame.", getName(), name));
            }
        }
        source = &local;
    }

    MarketDataSnapshot snapshot{&bars, source, 0};

    for (size_t i = 0; i < bars.size(); ++i) {
        snapshot.index = i;

        bool entered = false;
        for (const auto& rule : entry_rules_) {
            if (rule->evaluate(snapshot) == core::SignalType::Buy) {
                logger->trace("Strategy '{}': entry rule '{}' fired at bar {}", getName(), rule->getName(), i);
                signaled[i].signal = core::SignalType::Buy;
                signaled[i].signal_strength = 1.0;
                entered = true;
                break; // Take the first entry signal
            }
        }
        if (entered) {
            continue;
        }

        for (const auto& rule : exit_rules_) {
            if (rule->evaluate(snapshot) == core::SignalType::Sell) {
                logger->trace("Strategy '{}': exit rule '{}' fired at bar {}", getName(), rule->getName(), i);
                signaled[i].signal = core::SignalType::Sell;
                signaled[i].signal_strength = -1.0;
                break;
            }
        }
    }
}

} // namespace strategy_engine
