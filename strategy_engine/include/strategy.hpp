#pragma once

#include "interfaces.hpp"
#include "datatypes.hpp"
#include "common_types.hpp"
#include <string>

namespace strategy_engine {

    // Shared plumbing for concrete strategies: identity, parameters, input
    // validation and the all-HOLD output series that computeSignals() fills in.
    class StrategyBase : public IStrategy {
    public:
        ~StrategyBase() override = default;

        std::string getName() const override { return name_; }
        std::string getDescription() const override { return description_; }
        std::string getType() const override { return type_; }
        const ParameterMap& getParameters() const override { return parameters_; }
        double getPositionSizeFraction() const override { return position_size_; }

        using IStrategy::generateSignals;
        core::TimeSeries<core::SignaledBar> generateSignals(
            const core::TimeSeries<core::Candle>& bars,
            const indicators::IndicatorFrame& frame) const override;

    protected:
        // Throws ParameterValidationException unless 0 < position_size <= 1
        StrategyBase(std::string name, std::string type, double position_size);

        // `signaled` arrives sized to bars, every entry HOLD with strength 0
        virtual void computeSignals(const core::TimeSeries<core::Candle>& bars,
                                    const indicators::IndicatorFrame& frame,
                                    core::TimeSeries<core::SignaledBar>& signaled) const = 0;

        // Frame column when present and aligned to bars, otherwise nullptr
        static const core::TimeSeries<double>* frameColumn(const indicators::IndicatorFrame& frame,
                                                           const std::string& name,
                                                           size_t num_bars);

        std::string description_;
        ParameterMap parameters_;

    private:
        std::string name_;
        std::string type_;
        double position_size_;
    };

} // namespace strategy_engine
