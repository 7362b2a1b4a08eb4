#include "bollinger_bands_indicator.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace indicators {

BollingerBandsIndicator::BollingerBandsIndicator(int period, double num_std_dev)
    : period_(period), num_std_dev_(num_std_dev), lookback_(0) {
    if (period_ < 2) {
        throw std::invalid_argument(fmt::format("Bollinger Bands period must be at least 2 (got {}).", period_));
    }
    if (!(num_std_dev_ > 0.0)) {
        throw std::invalid_argument("Bollinger Bands standard deviation multiplier must be positive.");
    }

    lookback_ = TA_BBANDS_Lookback(period_, num_std_dev_, num_std_dev_, TA_MAType_SMA);
    if (lookback_ < 0) {
        throw std::runtime_error(fmt::format("TA_BBANDS_Lookback returned an unexpected value: {}", lookback_));
    }
}

std::string BollingerBandsIndicator::getName() const {
    return "bb_middle";
}

int BollingerBandsIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& BollingerBandsIndicator::getResult() const {
    return middle_;
}

std::map<std::string, core::TimeSeries<double>> BollingerBandsIndicator::getNamedResults() const {
    return {
        {"bb_upper", upper_},
        {"bb_middle", middle_},
        {"bb_lower", lower_}
    };
}

void BollingerBandsIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    upper_.clear();
    middle_.clear();
    lower_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for Bollinger Bands. No results generated.",
                      input.size(), lookback_);
        return;
    }

    std::vector<double> close_prices = closePrices(input);
    int output_size = static_cast<int>(close_prices.size()) - lookback_;
    upper_.resize(output_size);
    middle_.resize(output_size);
    lower_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_BBANDS(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        period_,
        num_std_dev_,   // optInNbDevUp
        num_std_dev_,   // optInNbDevDn
        TA_MAType_SMA,
        &out_begin_idx,
        &out_nb_element,
        upper_.data(),
        middle_.data(),
        lower_.data()
    );

    if (ret_code != TA_SUCCESS) {
        logger->error("TA-Lib TA_BBANDS calculation failed with error code: {}", static_cast<int>(ret_code));
        upper_.clear();
        middle_.clear();
        lower_.clear();
        return;
    }

    if (out_nb_element != output_size) {
        upper_.resize(out_nb_element);
        middle_.resize(out_nb_element);
        lower_.resize(out_nb_element);
    }
}

} // namespace indicators
