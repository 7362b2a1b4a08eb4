#include "rsi_indicator.hpp"
#include "logging.hpp"
#include "ta_libc.h"  // TA-Lib C API header
#include <spdlog/fmt/fmt.h>
#include <vector>
#include <stdexcept>

namespace indicators {

std::string rsiColumn(int period) {
    return fmt::format("rsi_{}", period);
}

RsiIndicator::RsiIndicator(int period) : period_(period), lookback_(0) {
    // TA-Lib accepts RSI periods from 2 upwards
    if (period_ < 2) {
         throw std::invalid_argument(fmt::format("RSI period must be at least 2 (got {}).", period_));
    }

    lookback_ = TA_RSI_Lookback(period_);
    if (lookback_ < 0) {
         throw std::runtime_error(fmt::format("TA_RSI_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = rsiColumn(period_);
    core::logging::getLogger()->trace("RsiIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string RsiIndicator::getName() const {
    return name_;
}

int RsiIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& RsiIndicator::getResult() const {
    return results_;
}

void RsiIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
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

    TA_RetCode ret_code = TA_RSI(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        period_,
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );

    if (ret_code != TA_SUCCESS) {
        logger->error("TA-Lib TA_RSI calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code));
        results_.clear();
        return;
    }

    if (out_begin_idx != lookback_) {
         logger->warn("TA_RSI out_begin_idx ({}) does not match calculated lookback ({}) for {}. Results might be misaligned.",
                      out_begin_idx, lookback_, name_);
    }
    if (out_nb_element != output_size) {
         results_.resize(out_nb_element);
    }
}

} // namespace indicators
