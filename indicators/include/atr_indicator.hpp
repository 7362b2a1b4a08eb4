#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Column name used for ATR in an IndicatorFrame, e.g. "atr_14"
std::string atrColumn(int period);

// Average True Range over high/low/close
class AtrIndicator : public IIndicator {
public:
    explicit AtrIndicator(int period = 14);

    ~AtrIndicator() override = default;

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
