#include "indicator_frame.hpp"
#include "rsi_indicator.hpp"
#include "macd_indicator.hpp"
#include "bollinger_bands_indicator.hpp"
#include "atr_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <cctype>
#include <limits>
#include <optional>
#include <stdexcept>

namespace indicators {

namespace {
    const double kNaN = std::numeric_limits<double>::quiet_NaN();

    // "sma_20" with prefix "sma_" -> 20
    std::optional<int> periodSuffix(const std::string& name, const std::string& prefix) {
        if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
            return std::nullopt;
        }
        const std::string digits = name.substr(prefix.size());
        if (digits.size() > 6) {
            return std::nullopt;
        }
        for (unsigned char c : digits) {
            if (!std::isdigit(c)) {
                return std::nullopt;
            }
        }
        return std::stoi(digits);
    }
}

IndicatorFrame::IndicatorFrame(size_t num_bars) : num_bars_(num_bars) {}

void IndicatorFrame::ensureSize(size_t num_bars) {
    if (columns_.empty() && num_bars_ == 0) {
        num_bars_ = num_bars;
        return;
    }
    if (num_bars != num_bars_) {
        throw std::invalid_argument(fmt::format("Column length {} does not match frame length {}.", num_bars, num_bars_));
    }
}

core::TimeSeries<double> IndicatorFrame::align(const core::TimeSeries<double>& values, size_t num_bars) {
    core::TimeSeries<double> aligned(num_bars, kNaN);
    if (values.size() > num_bars) {
        throw core::IndicatorCalculationException(
            fmt::format("Indicator produced {} values for {} bars.", values.size(), num_bars));
    }
    // TA-Lib output starts at the lookback index and runs to the last bar
    size_t offset = num_bars - values.size();
    for (size_t i = 0; i < values.size(); ++i) {
        aligned[offset + i] = values[i];
    }
    return aligned;
}

void IndicatorFrame::setColumn(const std::string& name, core::TimeSeries<double> values) {
    ensureSize(values.size());
    columns_[name] = std::move(values);
}

void IndicatorFrame::add(const IIndicator& indicator) {
    for (const auto& entry : indicator.getNamedResults()) {
        columns_[entry.first] = align(entry.second, num_bars_);
    }
}

bool IndicatorFrame::has(const std::string& name) const {
    return columns_.count(name) > 0;
}

const core::TimeSeries<double>& IndicatorFrame::column(const std::string& name) const {
    auto it = columns_.find(name);
    if (it == columns_.end()) {
        throw core::IndicatorCalculationException("Indicator column not found: " + name);
    }
    return it->second;
}

double IndicatorFrame::value(const std::string& name, size_t index) const {
    auto it = columns_.find(name);
    if (it == columns_.end() || index >= it->second.size()) {
        return kNaN;
    }
    return it->second[index];
}

std::vector<std::string> IndicatorFrame::columnNames() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& entry : columns_) {
        names.push_back(entry.first);
    }
    return names;
}

void IndicatorFrame::addMovingAverage(const core::TimeSeries<core::Candle>& bars, int period, MaType type) {
    ensureSize(bars.size());
    MovingAverageIndicator indicator(period, type);
    indicator.calculate(bars);
    add(indicator);
}

void IndicatorFrame::addRsi(const core::TimeSeries<core::Candle>& bars, int period) {
    ensureSize(bars.size());
    RsiIndicator indicator(period);
    indicator.calculate(bars);
    add(indicator);
    columns_["rsi"] = columns_[indicator.getName()];
}

void IndicatorFrame::addMacd(const core::TimeSeries<core::Candle>& bars, int fast, int slow, int signal) {
    ensureSize(bars.size());
    MacdIndicator indicator(fast, slow, signal);
    indicator.calculate(bars);
    add(indicator);
}

void IndicatorFrame::addBollinger(const core::TimeSeries<core::Candle>& bars, int period, double num_std_dev) {
    ensureSize(bars.size());
    BollingerBandsIndicator indicator(period, num_std_dev);
    indicator.calculate(bars);
    add(indicator);
}

void IndicatorFrame::addAtr(const core::TimeSeries<core::Candle>& bars, int period) {
    ensureSize(bars.size());
    AtrIndicator indicator(period);
    indicator.calculate(bars);
    add(indicator);
}

bool IndicatorFrame::addColumnByName(const core::TimeSeries<core::Candle>& bars, const std::string& name) {
    if (auto period = periodSuffix(name, "sma_")) {
        addMovingAverage(bars, *period, MaType::SMA);
    } else if (auto period = periodSuffix(name, "ema_")) {
        addMovingAverage(bars, *period, MaType::EMA);
    } else if (auto period = periodSuffix(name, "rsi_")) {
        // Leaves the "rsi" alias as it is
        ensureSize(bars.size());
        RsiIndicator indicator(*period);
        indicator.calculate(bars);
        add(indicator);
    } else if (name == "rsi") {
        addRsi(bars, 14);
    } else if (auto period = periodSuffix(name, "atr_")) {
        addAtr(bars, *period);
    } else if (name == "macd" || name == "macd_signal" || name == "macd_histogram") {
        addMacd(bars);
    } else if (name == "bb_upper" || name == "bb_middle" || name == "bb_lower") {
        addBollinger(bars);
    } else {
        return false;
    }
    core::logging::getLogger()->debug("Indicator column '{}' computed on demand over {} bars.", name, bars.size());
    return true;
}

void IndicatorFrame::addAll(const core::TimeSeries<core::Candle>& bars) {
    for (int period : {10, 20, 50}) {
        addMovingAverage(bars, period, MaType::SMA);
    }
    for (int period : {12, 26}) {
        addMovingAverage(bars, period, MaType::EMA);
    }
    addRsi(bars, 14);
    addMacd(bars, 12, 26, 9);
    addBollinger(bars, 20, 2.0);
    addAtr(bars, 14);
    core::logging::getLogger()->info("Indicator frame ready: {} columns over {} bars.", columns_.size(), num_bars_);
}

core::TimeSeries<double> IndicatorFrame::movingAverage(const core::TimeSeries<core::Candle>& bars, int period, MaType type) {
    MovingAverageIndicator indicator(period, type);
    indicator.calculate(bars);
    return align(indicator.getResult(), bars.size());
}

core::TimeSeries<double> IndicatorFrame::rsi(const core::TimeSeries<core::Candle>& bars, int period) {
    RsiIndicator indicator(period);
    indicator.calculate(bars);
    return align(indicator.getResult(), bars.size());
}

} // namespace indicators
