#include "trade_simulator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace backtester {

TradeSimulator::TradeSimulator(double initial_capital, std::string symbol)
    : initial_capital_(initial_capital), symbol_(std::move(symbol))
{
    if (!(initial_capital_ > 0.0)) {
        throw core::BacktestException(fmt::format("Initial capital must be positive (got {}).", initial_capital_));
    }
}

SimulationResult TradeSimulator::run(const core::TimeSeries<core::SignaledBar>& signaled,
                                     double position_size_fraction) const {
    auto logger = core::logging::getLogger();
    if (!(position_size_fraction > 0.0) || position_size_fraction > 1.0) {
        throw core::BacktestException(fmt::format("Position size fraction must be in (0, 1] (got {}).", position_size_fraction));
    }

    SimulationResult result;
    result.initial_capital = initial_capital_;
    double cash = initial_capital_;
    double position = 0.0; // Units held, 0 when FLAT

    for (const auto& bar : signaled) {
        const double price = bar.candle.close;
        if (!std::isfinite(price) || price <= 0.0) {
            continue;
        }

        if (bar.signal == core::SignalType::Buy && position == 0.0 && cash > 0.0) {
            const double buy_amount = cash * position_size_fraction;
            const double quantity = buy_amount / price;
            position = quantity;
            cash -= buy_amount;

            core::Trade trade;
            trade.timestamp = bar.candle.timestamp;
            trade.symbol = symbol_;
            trade.action = core::TradeAction::Buy;
            trade.price = price;
            trade.quantity = quantity;
            trade.cash_flow = -buy_amount;
            trade.portfolio_value_after = cash + position * price;
            trade.reason = core::CloseReason::Signal;
            result.ledger.push_back(trade);

            logger->debug("BUY: {:.6f} units at {:.2f} on {}", quantity, price,
                          core::utils::timestampToString(bar.candle.timestamp));
        } else if (bar.signal == core::SignalType::Sell && position > 0.0) {
            const double sell_amount = position * price;
            cash += sell_amount;

            core::Trade trade;
            trade.timestamp = bar.candle.timestamp;
            trade.symbol = symbol_;
            trade.action = core::TradeAction::Sell;
            trade.price = price;
            trade.quantity = position;
            trade.cash_flow = sell_amount;
            trade.portfolio_value_after = cash;
            trade.reason = core::CloseReason::Signal;
            result.ledger.push_back(trade);

            logger->debug("SELL: {:.6f} units at {:.2f} on {}", position, price,
                          core::utils::timestampToString(bar.candle.timestamp));
            position = 0.0;
        }
    }

    result.final_cash = cash;
    result.final_position = position;
    result.final_value = cash;
    if (!signaled.empty()) {
        result.final_value += position * signaled.back().candle.close;
    }

    logger->debug("Simulation finished: {} executions, final value {:.2f}{}", result.ledger.size(), result.final_value,
                  position > 0.0 ? " (position still open)" : "");
    return result;
}

} // namespace backtester
