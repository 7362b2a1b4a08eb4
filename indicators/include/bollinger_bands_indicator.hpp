#pragma once

#include "indicators.hpp"
#include <map>
#include <string>

namespace indicators {

// Bollinger Bands (SMA middle band, +/- num_std_dev standard deviations).
// Primary result is the middle band.
class BollingerBandsIndicator : public IIndicator {
public:
    explicit BollingerBandsIndicator(int period = 20, double num_std_dev = 2.0);

    ~BollingerBandsIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;
    std::map<std::string, core::TimeSeries<double>> getNamedResults() const override;

private:
    const int period_;
    const double num_std_dev_;
    int lookback_;
    core::TimeSeries<double> upper_;
    core::TimeSeries<double> middle_;
    core::TimeSeries<double> lower_;
};

} // namespace indicators
