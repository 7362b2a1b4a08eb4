#pragma once

#include <string>
#include <vector>
#include <chrono> // For timestamps
#include <optional> // For stop-loss / take-profit levels

namespace core {

    // Using system_clock for time points, all timestamps are treated as UTC
    using Timestamp = std::chrono::system_clock::time_point;

    // One OHLCV record for a single symbol at a fixed interval
    struct Candle {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        double volume = 0.0; // Crypto volumes are fractional

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    // Discrete decision emitted by a strategy for one bar
    enum class SignalType {
        Hold,
        Buy,
        Sell
    };

    // A candle extended with the strategy's signal for that bar
    struct SignaledBar {
        Candle candle;
        SignalType signal = SignalType::Hold;
        double signal_strength = 0.0; // [-1, 1], positive for BUY, negative for SELL
    };

    enum class TradeAction {
        Buy,
        Sell
    };

    // Why a position was closed (paper trading); backtest trades carry Signal
    enum class CloseReason {
        None,
        Signal,
        StopLoss,
        TakeProfit,
        EndOfSession,
        Manual
    };

    enum class Direction {
        Long,
        Short
    };

    // Ledger entry. Append-only: cost adjustments are derived values, never edits.
    struct Trade {
        Timestamp timestamp;
        std::string symbol;
        TradeAction action = TradeAction::Buy;
        double price = 0.0;
        double quantity = 0.0;
        double cash_flow = 0.0;             // Negative for buys, positive for sells
        double portfolio_value_after = 0.0; // Cash + marked position right after execution
        CloseReason reason = CloseReason::None;
    };

    // Open position held by a paper portfolio
    struct Position {
        std::string symbol;
        double quantity = 0.0;
        double entry_price = 0.0;
        Timestamp entry_time;
        std::optional<double> stop_loss;
        std::optional<double> take_profit;
        double current_value = 0.0;
        double unrealized_pnl = 0.0;
        double unrealized_pnl_pct = 0.0;
        double risk_amount = 0.0; // quantity * distance to stop at entry

        double entryValue() const { return quantity * entry_price; }
    };

    struct EquityPoint {
        Timestamp timestamp;
        double portfolio_value = 0.0;
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

    using EquityCurve = TimeSeries<EquityPoint>;

    std::string toString(SignalType signal);
    std::string toString(TradeAction action);
    std::string toString(CloseReason reason);
    std::string toString(Direction direction);

} // namespace core
