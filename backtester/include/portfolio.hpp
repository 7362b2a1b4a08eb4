#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>

#include "datatypes.hpp"

namespace backtester {

    // Realized trade counters; every open and every close counts as a trade
    struct PerformanceCounters {
        int total_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;   // Closes with profit <= 0
        double total_profit = 0.0;
        double total_loss = 0.0; // Positive magnitude

        int closedTrades() const { return winning_trades + losing_trades; }
    };

    // --- Paper Portfolio ---
    // Cash, at most one open long position per symbol and an append-only trade history.
    class Portfolio {
    public:
        // Throws core::BacktestException unless initial_capital > 0
        explicit Portfolio(double initial_capital);

        // --- Getters ---
        double getInitialCapital() const { return initial_capital_; }
        double getCash() const { return cash_; }
        bool hasPosition(const std::string& symbol) const;
        const core::Position* getPosition(const std::string& symbol) const; // nullptr when flat
        const std::map<std::string, core::Position>& getPositions() const { return positions_; }
        std::vector<core::Position> openPositions() const;
        const core::TimeSeries<core::Trade>& getTradeHistory() const { return trade_history_; }
        const PerformanceCounters& getCounters() const { return counters_; }

        // Cash plus every position marked at `current_prices`; positions without a
        // price are valued at their last update
        double getPortfolioValue(const std::map<std::string, double>& current_prices) const;

        // --- Modifiers ---
        // Returns false (logged, no state change) when quantity * price > cash or the
        // symbol already has an open position. A cost above cash by float rounding
        // only (relative 1e-12) is charged as exactly the available cash.
        bool openPosition(const std::string& symbol, double quantity, double price, core::Timestamp time,
                          std::optional<double> stop_loss = std::nullopt,
                          std::optional<double> take_profit = std::nullopt);

        // Sells the whole position. Returns false when no position is open.
        bool closePosition(const std::string& symbol, double price, core::Timestamp time,
                           core::CloseReason reason = core::CloseReason::Manual);

        // Marks the position to `price`, then closes it if the stop-loss or, failing
        // that, the take-profit is hit. Returns the close reason or CloseReason::None.
        core::CloseReason updatePosition(const std::string& symbol, double price, core::Timestamp time);

        // Replaces the stop-loss of an open position (trailing stops) and recomputes
        // its risk_amount against the entry price. False when flat.
        bool setStopLoss(const std::string& symbol, double stop_loss);

    private:
        double initial_capital_;
        double cash_;
        std::map<std::string, core::Position> positions_;
        core::TimeSeries<core::Trade> trade_history_;
        PerformanceCounters counters_;
    };

} // namespace backtester
