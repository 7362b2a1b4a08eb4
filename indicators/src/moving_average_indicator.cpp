#include "moving_average_indicator.hpp"
#include "logging.hpp"
#include "ta_libc.h"            // TA-Lib C API header
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace indicators {

namespace {

    TA_MAType toTaMaType(MaType type) {
        return type == MaType::EMA ? TA_MAType_EMA : TA_MAType_SMA;
    }

} // namespace

MaType maTypeFromString(const std::string& type) {
    std::string upper = type;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "SMA") return MaType::SMA;
    if (upper == "EMA") return MaType::EMA;
    throw std::invalid_argument("Unknown moving average type: " + type);
}

std::string maTypeToString(MaType type) {
    return type == MaType::EMA ? "EMA" : "SMA";
}

std::string movingAverageColumn(MaType type, int period) {
    return fmt::format("{}_{}", type == MaType::EMA ? "ema" : "sma", period);
}

MovingAverageIndicator::MovingAverageIndicator(int period, MaType type)
    : period_(period), type_(type), lookback_(0) {
    if (period_ <= 0) {
         throw std::invalid_argument("Moving average period must be positive.");
    }

    lookback_ = TA_MA_Lookback(period_, toTaMaType(type_));
    if (lookback_ < 0) {
         throw std::runtime_error(fmt::format("TA_MA_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = movingAverageColumn(type_, period_);
    core::logging::getLogger()->trace("MovingAverageIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string MovingAverageIndicator::getName() const {
    return name_;
}

int MovingAverageIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& MovingAverageIndicator::getResult() const {
    return results_;
}

void MovingAverageIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    std::vector<double> close_prices = closePrices(input);
    int output_size = static_cast<int>(close_prices.size()) - lookback_;
    results_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_MA(
        0,                                         // startIdx
        static_cast<int>(close_prices.size()) - 1, // endIdx
        close_prices.data(),
        period_,                                   // optInTimePeriod
        toTaMaType(type_),                         // optInMAType
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );

    if (ret_code != TA_SUCCESS) {
        logger->error("TA-Lib TA_MA calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code));
        results_.clear();
        return;
    }

    if (out_begin_idx != lookback_) {
         logger->warn("TA_MA out_begin_idx ({}) does not match calculated lookback ({}) for {}. Results might be misaligned.",
                      out_begin_idx, lookback_, name_);
    }
    if (out_nb_element != output_size) {
         results_.resize(out_nb_element);
    }

    logger->trace("Calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
