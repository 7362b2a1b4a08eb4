#include "interfaces.hpp"
#include <cmath>

namespace strategy_engine {

namespace {

    std::optional<double> priceField(const core::Candle& candle, const std::string& name) {
        if (name == "open") return candle.open;
        if (name == "high") return candle.high;
        if (name == "low") return candle.low;
        if (name == "close") return candle.close;
        if (name == "volume") return candle.volume;
        return std::nullopt;
    }

} // namespace

std::optional<double> MarketDataSnapshot::value(const std::string& name, size_t bars_back) const {
    if (!bars || bars_back > index || index >= bars->size()) {
        return std::nullopt;
    }
    size_t at = index - bars_back;

    std::optional<double> result;
    if (frame && frame->size() == bars->size() && frame->has(name)) {
        result = frame->value(name, at);
    } else {
        result = priceField((*bars)[at], name);
    }
    if (result && std::isnan(*result)) {
        return std::nullopt;
    }
    return result;
}

} // namespace strategy_engine
