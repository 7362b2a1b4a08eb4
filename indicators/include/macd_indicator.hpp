#pragma once

#include "indicators.hpp"
#include <map>
#include <string>

namespace indicators {

// MACD line, signal line and histogram over closing prices.
// Primary result is the MACD line ("macd").
class MacdIndicator : public IIndicator {
public:
    MacdIndicator(int fast_period = 12, int slow_period = 26, int signal_period = 9);

    ~MacdIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;
    std::map<std::string, core::TimeSeries<double>> getNamedResults() const override;

private:
    const int fast_period_;
    const int slow_period_;
    const int signal_period_;
    int lookback_;
    core::TimeSeries<double> macd_;
    core::TimeSeries<double> signal_;
    core::TimeSeries<double> histogram_;
};

} // namespace indicators
