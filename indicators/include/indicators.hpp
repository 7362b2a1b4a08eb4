#pragma once

#include "datatypes.hpp" // Needs Candle, TimeSeries
#include <string>
#include <vector>
#include <map>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Column name of the primary output (e.g., "sma_20", "rsi_14")
    virtual std::string getName() const = 0;

    // Get the lookback period required by the indicator calculation.
    // This determines how many initial input data points are consumed
    // before the first valid output can be generated.
    virtual int getLookback() const = 0;

    // Calculate the indicator based on input candle data.
    // Results are stored internally; insufficient input leaves them empty.
    virtual void calculate(const core::TimeSeries<core::Candle>& input) = 0;

    // Primary output. The size is input size minus lookback; caller aligns.
    virtual const core::TimeSeries<double>& getResult() const = 0;

    // All output lines keyed by column name. Single-line indicators return
    // just the primary one; MACD and Bollinger Bands return several.
    virtual std::map<std::string, core::TimeSeries<double>> getNamedResults() const {
        return {{getName(), getResult()}};
    }
};

// Closing prices of the input, in order, as TA-Lib expects them
std::vector<double> closePrices(const core::TimeSeries<core::Candle>& input);

} // namespace indicators
