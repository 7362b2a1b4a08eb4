#pragma once

#include "indicators.hpp" // Base interface
#include <vector>
#include <string>

namespace indicators {

enum class MaType {
    SMA,
    EMA
};

// Parses "SMA"/"EMA" (case-insensitive); throws std::invalid_argument otherwise
MaType maTypeFromString(const std::string& type);
std::string maTypeToString(MaType type);

// Column name used for a moving average in an IndicatorFrame, e.g. "ema_12"
std::string movingAverageColumn(MaType type, int period);

class MovingAverageIndicator : public IIndicator {
public:
    MovingAverageIndicator(int period, MaType type);

    ~MovingAverageIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    const MaType type_;
    int lookback_;              // TA-Lib lookback for this period/type
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
