#pragma once

#include <vector>
#include <string>
#include <memory>
#include <optional>
#include <set>

#include "datatypes.hpp"
#include "common_types.hpp"
#include "indicator_frame.hpp"

namespace strategy_engine {

    // Read-only view of one bar of the series together with its indicator columns.
    // Conditions look back through `index` to compare with earlier bars.
    struct MarketDataSnapshot {
        const core::TimeSeries<core::Candle>* bars = nullptr;
        const indicators::IndicatorFrame* frame = nullptr;
        size_t index = 0;

        const core::Candle& currentCandle() const { return (*bars)[index]; }

        // Value of a frame column or of a price field ("open", "high", "low",
        // "close", "volume") `bars_back` bars before the current one.
        // nullopt when the name is unknown, the index is out of range or the value is NaN.
        std::optional<double> value(const std::string& name, size_t bars_back = 0) const;
    };

    // --- Condition Interface ---
    // Represents a single logical condition (e.g., close > sma_50, rsi_14 < 30)
    class ICondition {
    public:
        virtual ~ICondition() = default;
        virtual bool evaluate(const MarketDataSnapshot& snapshot) const = 0;
        virtual std::string describe() const = 0;
        // Adds every column or price field name the condition reads
        virtual void collectColumns(std::set<std::string>& columns) const = 0;
    };

    // --- Rule Interface ---
    // An entry or exit rule: a condition plus the signal it emits when true
    class IRule {
    public:
        virtual ~IRule() = default;
        // Returns the rule's signal if triggered, Hold otherwise
        virtual core::SignalType evaluate(const MarketDataSnapshot& snapshot) const = 0;
        virtual std::string describe() const = 0;
        virtual std::string getName() const = 0;
        virtual void collectColumns(std::set<std::string>& columns) const = 0;
    };

    // --- Strategy Interface ---
    // Maps a bar series (plus optional precomputed indicator columns) to one
    // signal per bar. Implementations are immutable after construction and
    // generateSignals() is deterministic.
    class IStrategy {
    public:
        virtual ~IStrategy() = default;

        virtual std::string getName() const = 0;
        virtual std::string getDescription() const = 0;

        // Registry key, e.g. "ma_crossover"
        virtual std::string getType() const = 0;

        virtual const ParameterMap& getParameters() const = 0;

        // Fraction of available cash committed on entry
        virtual double getPositionSizeFraction() const = 0;

        // Throws core::InvalidDataException when bars are empty, unordered or lack a close.
        // Columns missing from `frame` are computed on demand.
        virtual core::TimeSeries<core::SignaledBar> generateSignals(
            const core::TimeSeries<core::Candle>& bars,
            const indicators::IndicatorFrame& frame) const = 0;

        core::TimeSeries<core::SignaledBar> generateSignals(const core::TimeSeries<core::Candle>& bars) const {
            return generateSignals(bars, indicators::IndicatorFrame{});
        }
    };

} // namespace strategy_engine
