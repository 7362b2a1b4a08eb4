#include "macd_indicator.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace indicators {

MacdIndicator::MacdIndicator(int fast_period, int slow_period, int signal_period)
    : fast_period_(fast_period), slow_period_(slow_period), signal_period_(signal_period), lookback_(0) {
    if (fast_period_ < 2 || slow_period_ < 2 || signal_period_ < 1) {
        throw std::invalid_argument(fmt::format("Invalid MACD periods ({}, {}, {}).",
                                                fast_period_, slow_period_, signal_period_));
    }
    if (fast_period_ >= slow_period_) {
        throw std::invalid_argument("MACD fast period must be shorter than the slow period.");
    }

    lookback_ = TA_MACD_Lookback(fast_period_, slow_period_, signal_period_);
    if (lookback_ < 0) {
        throw std::runtime_error(fmt::format("TA_MACD_Lookback returned an unexpected value: {}", lookback_));
    }
    core::logging::getLogger()->trace("MacdIndicator created: ({}, {}, {}), Lookback={}",
                                      fast_period_, slow_period_, signal_period_, lookback_);
}

std::string MacdIndicator::getName() const {
    return "macd";
}

int MacdIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& MacdIndicator::getResult() const {
    return macd_;
}

std::map<std::string, core::TimeSeries<double>> MacdIndicator::getNamedResults() const {
    return {
        {"macd", macd_},
        {"macd_signal", signal_},
        {"macd_histogram", histogram_}
    };
}

void MacdIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    macd_.clear();
    signal_.clear();
    histogram_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for MACD. No results generated.",
                      input.size(), lookback_);
        return;
    }

    std::vector<double> close_prices = closePrices(input);
    int output_size = static_cast<int>(close_prices.size()) - lookback_;
    macd_.resize(output_size);
    signal_.resize(output_size);
    histogram_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_MACD(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        fast_period_,
        slow_period_,
        signal_period_,
        &out_begin_idx,
        &out_nb_element,
        macd_.data(),
        signal_.data(),
        histogram_.data()
    );

    if (ret_code != TA_SUCCESS) {
        logger->error("TA-Lib TA_MACD calculation failed with error code: {}", static_cast<int>(ret_code));
        macd_.clear();
        signal_.clear();
        histogram_.clear();
        return;
    }

    if (out_begin_idx != lookback_) {
        logger->warn("TA_MACD out_begin_idx ({}) does not match calculated lookback ({}). Results might be misaligned.",
                     out_begin_idx, lookback_);
    }
    if (out_nb_element != output_size) {
        macd_.resize(out_nb_element);
        signal_.resize(out_nb_element);
        histogram_.resize(out_nb_element);
    }
}

} // namespace indicators
