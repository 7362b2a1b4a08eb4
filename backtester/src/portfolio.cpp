#include "portfolio.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace backtester {

    namespace {

        const double kCashTolerance = 1e-12; // Relative

        // Capital lost if a long stop fills; zero once the stop is at or above entry
        double longRisk(double quantity, double entry_price, double stop_loss) {
            return quantity * std::max(0.0, entry_price - stop_loss);
        }

    } // namespace


    Portfolio::Portfolio(double initial_capital)
        : initial_capital_(initial_capital), cash_(initial_capital) {
        if (!(initial_capital > 0.0)) {
            throw core::BacktestException(fmt::format("Initial capital must be positive (got {}).", initial_capital));
        }
        core::logging::getLogger()->debug("Paper portfolio created with {:.2f}", initial_capital_);
    }

    bool Portfolio::hasPosition(const std::string& symbol) const {
        return positions_.count(symbol) > 0;
    }

    const core::Position* Portfolio::getPosition(const std::string& symbol) const {
        auto it = positions_.find(symbol);
        return it != positions_.end() ? &it->second : nullptr;
    }

    std::vector<core::Position> Portfolio::openPositions() const {
        std::vector<core::Position> positions;
        positions.reserve(positions_.size());
        for (const auto& entry : positions_) {
            positions.push_back(entry.second);
        }
        return positions;
    }

    double Portfolio::getPortfolioValue(const std::map<std::string, double>& current_prices) const {
        double position_value = 0.0;
        for (const auto& entry : positions_) {
            auto price_it = current_prices.find(entry.first);
            if (price_it != current_prices.end()) {
                position_value += entry.second.quantity * price_it->second;
            } else {
                position_value += entry.second.current_value;
            }
        }
        return cash_ + position_value;
    }

    bool Portfolio::openPosition(const std::string& symbol, double quantity, double price, core::Timestamp time,
                                 std::optional<double> stop_loss, std::optional<double> take_profit) {
        auto logger = core::logging::getLogger();
        if (!(quantity > 0.0) || !(price > 0.0)) {
            logger->warn("Rejected position for {}: quantity {} at price {}", symbol, quantity, price);
            return false;
        }

        double cost = quantity * price;
        // A full-cash order sized as cash / price can overshoot cash by a few ulps
        if (cost > cash_ && cost - cash_ <= cash_ * kCashTolerance) {
            cost = cash_;
        }
        if (cost > cash_) {
            logger->warn("Insufficient cash for {} trade. Need: {:.2f} Have: {:.2f}", symbol, cost, cash_);
            return false;
        }
        if (hasPosition(symbol)) {
            logger->warn("Position already open for {}", symbol);
            return false;
        }

        core::Position position;
        position.symbol = symbol;
        position.quantity = quantity;
        position.entry_price = price;
        position.entry_time = time;
        position.stop_loss = stop_loss;
        position.take_profit = take_profit;
        position.current_value = cost;
        position.risk_amount = stop_loss ? longRisk(quantity, price, *stop_loss) : 0.0;
        positions_[symbol] = position;

        cash_ -= cost;

        core::Trade trade;
        trade.timestamp = time;
        trade.symbol = symbol;
        trade.action = core::TradeAction::Buy;
        trade.price = price;
        trade.quantity = quantity;
        trade.cash_flow = -cost;
        trade.portfolio_value_after = getPortfolioValue({{symbol, price}});
        trade.reason = core::CloseReason::None;
        trade_history_.push_back(trade);
        counters_.total_trades++;

        logger->info("OPENED position: {} {:.6f} units @ {:.2f} Cost: {:.2f} (SL: {}, TP: {})",
                     symbol, quantity, price, cost,
                     stop_loss ? fmt::format("{:.2f}", *stop_loss) : std::string("none"),
                     take_profit ? fmt::format("{:.2f}", *take_profit) : std::string("none"));
        return true;
    }

    bool Portfolio::closePosition(const std::string& symbol, double price, core::Timestamp time,
                                  core::CloseReason reason) {
        auto logger = core::logging::getLogger();
        auto it = positions_.find(symbol);
        if (it == positions_.end()) {
            logger->warn("No open position for {}", symbol);
            return false;
        }

        const core::Position position = it->second;
        const double proceeds = position.quantity * price;
        const double profit = proceeds - position.entryValue();

        cash_ += proceeds;
        positions_.erase(it);

        core::Trade trade;
        trade.timestamp = time;
        trade.symbol = symbol;
        trade.action = core::TradeAction::Sell;
        trade.price = price;
        trade.quantity = position.quantity;
        trade.cash_flow = proceeds;
        trade.portfolio_value_after = getPortfolioValue({{symbol, price}});
        trade.reason = reason;
        trade_history_.push_back(trade);

        counters_.total_trades++;
        if (profit > 0.0) {
            counters_.winning_trades++;
            counters_.total_profit += profit;
        } else {
            counters_.losing_trades++;
            counters_.total_loss += std::fabs(profit);
        }

        logger->info("CLOSED position: {} @ {:.2f} P/L: {:.2f} Reason: {} ({})",
                     symbol, price, profit, core::toString(reason), core::utils::timestampToString(time));
        return true;
    }

    core::CloseReason Portfolio::updatePosition(const std::string& symbol, double price, core::Timestamp time) {
        auto it = positions_.find(symbol);
        if (it == positions_.end()) {
            return core::CloseReason::None;
        }

        core::Position& position = it->second;
        position.current_value = position.quantity * price;
        position.unrealized_pnl = position.current_value - position.entryValue();
        position.unrealized_pnl_pct = position.entryValue() > 0.0
            ? position.unrealized_pnl / position.entryValue() * 100.0 : 0.0;

        if (position.stop_loss && price <= *position.stop_loss) {
            core::logging::getLogger()->info("Stop-loss triggered for {} ({:.2f} <= {:.2f})", symbol, price, *position.stop_loss);
            closePosition(symbol, price, time, core::CloseReason::StopLoss);
            return core::CloseReason::StopLoss;
        }
        if (position.take_profit && price >= *position.take_profit) {
            core::logging::getLogger()->info("Take-profit triggered for {} ({:.2f} >= {:.2f})", symbol, price, *position.take_profit);
            closePosition(symbol, price, time, core::CloseReason::TakeProfit);
            return core::CloseReason::TakeProfit;
        }
        return core::CloseReason::None;
    }

    bool Portfolio::setStopLoss(const std::string& symbol, double stop_loss) {
        auto it = positions_.find(symbol);
        if (it == positions_.end()) {
            return false;
        }
        core::Position& position = it->second;
        position.stop_loss = stop_loss;
        position.risk_amount = longRisk(position.quantity, position.entry_price, stop_loss);
        return true;
    }

} // namespace backtester
