#include "indicator_frame.hpp"
#include "moving_average_indicator.hpp"
#include "rsi_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace {
bool almost_equal(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

core::TimeSeries<core::Candle> rising(size_t count) {
    core::TimeSeries<core::Candle> bars;
    const core::Timestamp start = std::chrono::system_clock::time_point(std::chrono::seconds(1704067200));
    for (size_t i = 0; i < count; ++i) {
        core::Candle candle;
        candle.timestamp = start + std::chrono::hours(24 * static_cast<int>(i));
        candle.close = static_cast<double>(i + 1);
        candle.open = candle.close;
        candle.high = candle.close + 0.5;
        candle.low = candle.close - 0.5;
        bars.push_back(candle);
    }
    return bars;
}
}

int main() {
    core::logging::LoggingOptions log_options;
    log_options.to_file = false;
    core::logging::initialize(log_options);

    assert(indicators::movingAverageColumn(indicators::MaType::SMA, 50) == "sma_50");
    assert(indicators::movingAverageColumn(indicators::MaType::EMA, 12) == "ema_12");
    assert(indicators::rsiColumn(14) == "rsi_14");
    assert(indicators::maTypeFromString("ema") == indicators::MaType::EMA);

    bool threw = false;
    try {
        indicators::maTypeFromString("WMA");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        indicators::RsiIndicator too_short(1);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // SMA(3) over 1..6 -> NaN, NaN, 2, 3, 4, 5
    auto bars = rising(6);
    auto sma = indicators::IndicatorFrame::movingAverage(bars, 3, indicators::MaType::SMA);
    assert(sma.size() == bars.size());
    assert(std::isnan(sma[0]) && std::isnan(sma[1]));
    assert(almost_equal(sma[2], 2.0));
    assert(almost_equal(sma[5], 5.0));

    // Strictly rising closes: RSI saturates at 100 once the lookback is filled
    auto long_bars = rising(40);
    indicators::IndicatorFrame frame(long_bars.size());
    frame.addRsi(long_bars, 14);
    const auto& rsi = frame.column("rsi_14");
    assert(frame.has("rsi"));
    assert(std::isnan(rsi[13]));
    assert(almost_equal(rsi[20], 100.0));
    assert(almost_equal(frame.value("rsi", 20), 100.0));

    frame.addAll(long_bars);
    for (const char* name : {"sma_10", "sma_20", "ema_12", "ema_26", "macd", "macd_signal",
                             "macd_histogram", "bb_upper", "bb_middle", "bb_lower", "atr_14"}) {
        assert(frame.has(name));
        assert(frame.column(name).size() == long_bars.size());
    }
    // 50 bars of lookback never fill on 40 bars
    assert(frame.has("sma_50"));
    assert(std::isnan(frame.value("sma_50", 39)));
    assert(frame.value("bb_upper", 39) >= frame.value("bb_lower", 39));

    // Missing columns
    assert(std::isnan(frame.value("unknown", 0)));
    threw = false;
    try {
        frame.column("unknown");
    } catch (const core::IndicatorCalculationException&) {
        threw = true;
    }
    assert(threw);

    // Column lengths are fixed by the first column
    indicators::IndicatorFrame manual;
    manual.setColumn("a", {1.0, 2.0, 3.0});
    assert(manual.size() == 3);
    threw = false;
    try {
        manual.setColumn("b", {1.0, 2.0});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    return 0;
}
