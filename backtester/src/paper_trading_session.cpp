#include "paper_trading_session.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <utility>

namespace backtester {

    PaperTradingSession::PaperTradingSession(core::config::BacktestConfig backtest_config,
                                             core::config::RiskConfig risk_config,
                                             std::string symbol)
        : backtest_config_(backtest_config), risk_(risk_config), symbol_(std::move(symbol)) {
        core::config::validate(backtest_config_);
        if (symbol_.empty()) {
            symbol_ = "UNKNOWN";
        }
    }

    void PaperTradingSession::openFromSignal(Portfolio& portfolio, const core::Candle& bar, double fraction) const {
        const double price = bar.close;
        const double quantity = portfolio.getCash() * fraction / price;
        if (!(quantity > 0.0)) {
            return;
        }

        const auto& risk_config = risk_.config();
        std::optional<double> stop_loss;
        std::optional<double> take_profit;
        if (risk_config.stop_loss_pct > 0.0) {
            stop_loss = risk_.stopLoss(price);
        }
        if (risk_config.take_profit_pct > 0.0) {
            take_profit = risk_.takeProfit(price);
        }

        core::Position proposed;
        proposed.symbol = symbol_;
        proposed.quantity = quantity;
        proposed.entry_price = price;
        proposed.current_value = quantity * price;
        proposed.risk_amount = stop_loss ? quantity * (price - *stop_loss) : 0.0;

        const double capital = portfolio.getPortfolioValue({{symbol_, price}});
        if (!risk_.withinLimits(proposed, portfolio.openPositions(), capital)) {
            core::logging::getLogger()->info("BUY at {} skipped: position would exceed the portfolio risk cap.",
                                             core::utils::timestampToString(bar.timestamp));
            return;
        }

        portfolio.openPosition(symbol_, quantity, price, bar.timestamp, stop_loss, take_profit);
    }

    PaperTradingResult PaperTradingSession::run(const strategy_engine::IStrategy& strategy,
                                                const core::TimeSeries<core::Candle>& bars,
                                                const indicators::IndicatorFrame& frame) const {
        auto logger = core::logging::getLogger();
        logger->info("Starting paper trading session: {} on {} ({} bars)", strategy.getName(), symbol_, bars.size());

        const auto signaled = strategy.generateSignals(bars, frame);
        const double fraction = strategy.getPositionSizeFraction();

        PaperTradingResult result{Portfolio(backtest_config_.initial_capital)};
        result.initial_capital = backtest_config_.initial_capital;
        Portfolio& portfolio = result.portfolio;
        result.equity_curve.reserve(signaled.size());

        for (const auto& bar : signaled) {
            const core::Candle& candle = bar.candle;
            const double price = candle.close;

            if (portfolio.hasPosition(symbol_)) {
                portfolio.updatePosition(symbol_, price, candle.timestamp);
            }

            if (risk_.trailingEnabled() && portfolio.hasPosition(symbol_)) {
                const core::Position* position = portfolio.getPosition(symbol_);
                const double current_stop = position->stop_loss.value_or(0.0);
                const double trailed = risk_.trail(price, current_stop);
                if (trailed != current_stop) {
                    portfolio.setStopLoss(symbol_, trailed);
                }
            }

            if (bar.signal == core::SignalType::Sell && portfolio.hasPosition(symbol_)) {
                portfolio.closePosition(symbol_, price, candle.timestamp, core::CloseReason::Signal);
            } else if (bar.signal == core::SignalType::Buy && !portfolio.hasPosition(symbol_)) {
                openFromSignal(portfolio, candle, fraction);
            }

            result.equity_curve.push_back({candle.timestamp, portfolio.getPortfolioValue({{symbol_, price}})});
        }

        if (!signaled.empty() && portfolio.hasPosition(symbol_)) {
            const core::Candle& last = signaled.back().candle;
            portfolio.closePosition(symbol_, last.close, last.timestamp, core::CloseReason::EndOfSession);
        }

        result.final_value = portfolio.getCash();
        result.total_return = result.final_value - result.initial_capital;
        result.total_return_pct = result.total_return / result.initial_capital * 100.0;

        const auto& counters = portfolio.getCounters();
        result.win_rate = counters.closedTrades() > 0
            ? static_cast<double>(counters.winning_trades) / counters.closedTrades() * 100.0
            : 0.0;

        SimulationResult realized;
        realized.ledger = portfolio.getTradeHistory();
        realized.initial_capital = result.initial_capital;
        realized.final_cash = result.final_value;
        realized.final_value = result.final_value;
        result.realized_performance = analyzer_.calculatePerformance(realized, result.initial_capital);
        analyzer_.addDetailedMetrics(result.realized_performance, result.equity_curve, realized.ledger);

        logger->info("Paper trading session complete: final value {:.2f} ({:.2f}%)",
                     result.final_value, result.total_return_pct);
        return result;
    }

    void logPaperResult(const PaperTradingResult& result) {
        auto logger = core::logging::getLogger();
        const auto& counters = result.portfolio.getCounters();
        logger->info("========================================");
        logger->info("  PAPER TRADING RESULTS");
        logger->info("========================================");
        logger->info("Initial Capital:      {:.2f}", result.initial_capital);
        logger->info("Final Value:          {:.2f}", result.final_value);
        logger->info("Total Return:         {:.2f} ({:.2f}%)", result.total_return, result.total_return_pct);
        logger->info("Total Trades:         {}", counters.total_trades);
        logger->info("Winning Trades:       {}", counters.winning_trades);
        logger->info("Losing Trades:        {}", counters.losing_trades);
        logger->info("Win Rate:             {:.2f}%", result.win_rate);
        if (counters.total_trades > 0) {
            logger->info("Total Profit:         {:.2f}", counters.total_profit);
            logger->info("Total Loss:           {:.2f}", counters.total_loss);
        }
        logger->info("Open Positions:       {}", result.portfolio.getPositions().size());
    }

} // namespace backtester
