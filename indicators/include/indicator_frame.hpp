#pragma once

#include "indicators.hpp"
#include "moving_average_indicator.hpp"
#include <map>
#include <string>
#include <vector>

namespace indicators {

// Named indicator columns aligned one-to-one with a bar series.
// Slots inside an indicator's lookback window hold NaN.
class IndicatorFrame {
public:
    IndicatorFrame() = default;
    explicit IndicatorFrame(size_t num_bars);

    // Number of bars every column is aligned to
    size_t size() const { return num_bars_; }
    bool empty() const { return columns_.empty(); }

    // Stores a precomputed column. The first column fixes the frame size when the
    // frame was default-constructed; later columns must match it (std::invalid_argument).
    void setColumn(const std::string& name, core::TimeSeries<double> values);

    // Aligns every output line of an already calculated indicator to the bars,
    // front-padding the lookback with NaN. Empty output becomes an all-NaN column.
    void add(const IIndicator& indicator);

    bool has(const std::string& name) const;

    // Throws core::IndicatorCalculationException for unknown columns
    const core::TimeSeries<double>& column(const std::string& name) const;

    // NaN when the column is missing or the index is out of range
    double value(const std::string& name, size_t index) const;

    std::vector<std::string> columnNames() const;

    // Convenience builders: calculate over bars and add the resulting columns
    void addMovingAverage(const core::TimeSeries<core::Candle>& bars, int period, MaType type);
    void addRsi(const core::TimeSeries<core::Candle>& bars, int period = 14); // also writes "rsi"
    void addMacd(const core::TimeSeries<core::Candle>& bars, int fast = 12, int slow = 26, int signal = 9);
    void addBollinger(const core::TimeSeries<core::Candle>& bars, int period = 20, double num_std_dev = 2.0);
    void addAtr(const core::TimeSeries<core::Candle>& bars, int period = 14);

    // Builds a column from its name: sma_N, ema_N, rsi_N, rsi, atr_N, macd,
    // macd_signal, macd_histogram, bb_upper, bb_middle or bb_lower (default
    // MACD 12/26/9 and BB 20/2). Returns false for any other name. Invalid
    // periods throw std::invalid_argument from the indicator.
    bool addColumnByName(const core::TimeSeries<core::Candle>& bars, const std::string& name);

    // Standard column set: SMA 10/20/50, EMA 12/26, RSI 14, MACD 12/26/9, BB 20/2, ATR 14
    void addAll(const core::TimeSeries<core::Candle>& bars);

    // One-shot helpers used by strategies when a column is not precomputed
    static core::TimeSeries<double> movingAverage(const core::TimeSeries<core::Candle>& bars, int period, MaType type);
    static core::TimeSeries<double> rsi(const core::TimeSeries<core::Candle>& bars, int period);

private:
    void ensureSize(size_t num_bars);
    static core::TimeSeries<double> align(const core::TimeSeries<double>& values, size_t num_bars);

    size_t num_bars_ = 0;
    std::map<std::string, core::TimeSeries<double>> columns_;
};

} // namespace indicators
