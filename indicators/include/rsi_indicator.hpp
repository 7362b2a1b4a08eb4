#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Column name used for RSI in an IndicatorFrame, e.g. "rsi_14"
std::string rsiColumn(int period);

class RsiIndicator : public IIndicator {
public:
    // Wilder RSI over closing prices, values in [0, 100]
    explicit RsiIndicator(int period);

    ~RsiIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
