#pragma once

#include "datatypes.hpp"
#include <string>

namespace backtester {

    struct SimulationResult {
        core::TimeSeries<core::Trade> ledger;
        double initial_capital = 0.0;
        double final_cash = 0.0;
        double final_position = 0.0; // Units still held after the last bar
        double final_value = 0.0;    // final_cash + final_position * last close
    };

    // Single-position FLAT/LONG state machine over a signaled series.
    //   FLAT + BUY (cash > 0) -> spend cash * position_size at the close, go LONG
    //   LONG + SELL           -> sell the whole position at the close, go FLAT
    //   anything else         -> no-op
    // An open position is not closed at the end; it is marked at the last close.
    class TradeSimulator {
    public:
        explicit TradeSimulator(double initial_capital, std::string symbol = "");

        SimulationResult run(const core::TimeSeries<core::SignaledBar>& signaled,
                             double position_size_fraction = 0.95) const;

    private:
        double initial_capital_;
        std::string symbol_;
    };

} // namespace backtester
