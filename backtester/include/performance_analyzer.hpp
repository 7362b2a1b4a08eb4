#pragma once

#include "datatypes.hpp"
#include "trade_simulator.hpp"
#include <optional>
#include <string>
#include <vector>

namespace backtester {

    // --- Performance Report ---
    struct PerformanceReport {
        double initial_capital = 0.0;
        double final_value = 0.0;
        double total_return = 0.0;
        double total_return_pct = 0.0;
        size_t num_trades = 0;             // Ledger entries (executions)
        size_t num_completed_trades = 0;   // Matched BUY/SELL pairs
        double win_rate = 0.0;             // Percent of completed trades with profit > 0
        std::optional<double> profit_factor; // nullopt when pairs exist but gross loss is 0
        double avg_trade = 0.0;

        // Detailed metrics, filled by PerformanceAnalyzer::addDetailedMetrics
        double sharpe_ratio = 0.0;
        double max_drawdown = 0.0;         // Percent, <= 0
        double max_drawdown_value = 0.0;   // Currency, <= 0
        double avg_win = 0.0;
        double avg_loss = 0.0;             // Negative or 0
        double largest_win = 0.0;
        double largest_loss = 0.0;

        void logMetrics() const;
    };

    // One BUY matched with the SELL that closed it
    struct TradePair {
        std::string symbol;
        core::Timestamp entry_time;
        core::Timestamp exit_time;
        double entry_price = 0.0;
        double exit_price = 0.0;
        double quantity = 0.0;
        double profit = 0.0; // (exit - entry) * BUY quantity
    };

    struct TradeStats {
        size_t num_pairs = 0;
        size_t winning = 0;
        size_t losing = 0;
        double win_rate = 0.0;
        std::optional<double> profit_factor;
        double gross_profit = 0.0;
        double gross_loss = 0.0; // Positive magnitude
        double avg_trade = 0.0;
        double avg_win = 0.0;
        double avg_loss = 0.0;
        double largest_win = 0.0;
        double largest_loss = 0.0;
    };

    struct TradeCost {
        double commission = 0.0;
        double slippage = 0.0;
        double adjusted_portfolio_value = 0.0; // Recorded value minus all costs up to this trade
    };

    struct CostAdjustment {
        std::vector<TradeCost> per_trade; // Parallel to the ledger
        double total_commission = 0.0;
        double total_slippage = 0.0;
        double total_costs = 0.0;
        double adjusted_final_value = 0.0;

        std::vector<double> adjustedValues() const;
    };

    // Stateless: the same inputs always give the same report
    class PerformanceAnalyzer {
    public:
        // Return, trade counts and pair statistics from a finished simulation
        PerformanceReport calculatePerformance(const SimulationResult& simulation, double initial_capital) const;

        // cost_i = |cash_flow_i| * (commission + slippage). The ledger is not modified.
        // adjusted_portfolio_value_i subtracts the running total of costs through trade i,
        // not only cost_i, so the cost-adjusted equity curve never gives earlier costs back.
        CostAdjustment applyTransactionCosts(const core::TimeSeries<core::Trade>& ledger, double final_value,
                                             double commission, double slippage) const;

        // One point per bar. Starts at initial_capital and steps to trade_values[k]
        // from the first bar at or after trade k; values between trades are held.
        core::EquityCurve buildEquityCurve(const core::TimeSeries<core::Candle>& bars,
                                           const core::TimeSeries<core::Trade>& ledger,
                                           const std::vector<double>& trade_values,
                                           double initial_capital) const;

        // Same, stepping to each trade's recorded portfolio_value_after
        core::EquityCurve buildEquityCurve(const core::TimeSeries<core::Candle>& bars,
                                           const core::TimeSeries<core::Trade>& ledger,
                                           double initial_capital) const;

        std::vector<double> calculateReturns(const core::EquityCurve& equity) const;

        // mean / sample std-dev * sqrt(252); 0 with fewer than two returns or zero std-dev
        double sharpeRatio(const std::vector<double>& returns) const;

        double maxDrawdown(const core::EquityCurve& equity) const;
        double maxDrawdownValue(const core::EquityCurve& equity) const;

        // FIFO per symbol: each SELL closes the oldest open BUY. Unmatched SELLs are skipped.
        std::vector<TradePair> pairTrades(const core::TimeSeries<core::Trade>& ledger) const;
        TradeStats tradeStats(const std::vector<TradePair>& pairs) const;

        // Sharpe, drawdown and win/loss extremes from the equity curve and ledger
        void addDetailedMetrics(PerformanceReport& report,
                                const core::EquityCurve& equity,
                                const core::TimeSeries<core::Trade>& ledger) const;
    };

} // namespace backtester
