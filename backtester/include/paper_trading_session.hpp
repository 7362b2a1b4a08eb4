#pragma once

#include <string>

#include "datatypes.hpp"
#include "config.hpp"
#include "interfaces.hpp"
#include "indicator_frame.hpp"
#include "risk_calculator.hpp"
#include "portfolio.hpp"
#include "performance_analyzer.hpp"

namespace backtester {

    struct PaperTradingResult {
        Portfolio portfolio;
        core::EquityCurve equity_curve; // One point per bar, marked at the close
        double initial_capital = 0.0;
        double final_value = 0.0;       // Cash after the end-of-session close
        double total_return = 0.0;
        double total_return_pct = 0.0;
        double win_rate = 0.0;          // Percent of closed positions with profit > 0
        PerformanceReport realized_performance;
    };

    // Replays a strategy bar by bar against a paper Portfolio with reactive
    // stop-loss/take-profit handling. Each bar:
    //   1. mark the open position; close it on a stop-loss, else on a take-profit
    //   2. ratchet the trailing stop (when enabled)
    //   3. SELL with an open position -> close (Signal)
    //   4. BUY with no open position  -> open cash * position_size at the close,
    //      stop/target from the risk configuration, subject to the portfolio risk cap
    //   5. record the equity point
    // Whatever is still open after the last bar is closed at the last close (EndOfSession).
    class PaperTradingSession {
    public:
        // Throws core::ConfigException for out-of-range settings
        PaperTradingSession(core::config::BacktestConfig backtest_config,
                            core::config::RiskConfig risk_config,
                            std::string symbol);

        // Throws core::InvalidDataException for bad bars
        PaperTradingResult run(const strategy_engine::IStrategy& strategy,
                               const core::TimeSeries<core::Candle>& bars,
                               const indicators::IndicatorFrame& frame = indicators::IndicatorFrame{}) const;

    private:
        void openFromSignal(Portfolio& portfolio, const core::Candle& bar, double fraction) const;

        core::config::BacktestConfig backtest_config_;
        risk::RiskCalculator risk_;
        std::string symbol_;
        PerformanceAnalyzer analyzer_;
    };

    void logPaperResult(const PaperTradingResult& result);

} // namespace backtester
