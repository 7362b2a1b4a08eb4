#include "atr_indicator.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace indicators {

std::string atrColumn(int period) {
    return fmt::format("atr_{}", period);
}

AtrIndicator::AtrIndicator(int period) : period_(period), lookback_(0) {
    if (period_ < 1) {
        throw std::invalid_argument(fmt::format("ATR period must be positive (got {}).", period_));
    }

    lookback_ = TA_ATR_Lookback(period_);
    if (lookback_ < 0) {
        throw std::runtime_error(fmt::format("TA_ATR_Lookback returned an unexpected value: {}", lookback_));
    }
    name_ = atrColumn(period_);
}

std::string AtrIndicator::getName() const {
    return name_;
}

int AtrIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& AtrIndicator::getResult() const {
    return results_;
}

void AtrIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    std::vector<double> highs;
    std::vector<double> lows;
    std::vector<double> closes;
    highs.reserve(input.size());
    lows.reserve(input.size());
    closes.reserve(input.size());
    for (const auto& candle : input) {
        highs.push_back(candle.high);
        lows.push_back(candle.low);
        closes.push_back(candle.close);
    }

    int output_size = static_cast<int>(closes.size()) - lookback_;
    results_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_ATR(
        0,
        static_cast<int>(closes.size()) - 1,
        highs.data(),
        lows.data(),
        closes.data(),
        period_,
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );

    if (ret_code != TA_SUCCESS) {
        logger->error("TA-Lib TA_ATR calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code));
        results_.clear();
        return;
    }

    if (out_nb_element != output_size) {
        results_.resize(out_nb_element);
    }
}

} // namespace indicators
