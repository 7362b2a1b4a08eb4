#include "paper_trading_session.hpp"
#include "portfolio.hpp"
#include "exceptions.hpp"
#include "test_support.hpp"

#include <cassert>

using test_support::almost_equal;
using test_support::ScriptedStrategy;
using test_support::B;
using test_support::S;
using test_support::H;

namespace {
core::config::BacktestConfig capital(double amount) {
    core::config::BacktestConfig config;
    config.initial_capital = amount;
    return config;
}

backtester::PaperTradingResult session(const std::vector<double>& closes,
                                       const std::vector<core::SignalType>& script,
                                       const core::config::RiskConfig& risk = core::config::RiskConfig{}) {
    backtester::PaperTradingSession paper(capital(10000.0), risk, "BTC");
    return paper.run(ScriptedStrategy(script), test_support::makeBars(closes));
}
}

int main() {
    test_support::initLogging();

    // --- Portfolio bookkeeping ---
    backtester::Portfolio portfolio(1000.0);
    auto t0 = test_support::makeBars({1}).front().timestamp;
    assert(!portfolio.openPosition("BTC", 20.0, 100.0, t0));           // 2000 > 1000 cash
    assert(almost_equal(portfolio.getCash(), 1000.0));
    assert(portfolio.getTradeHistory().empty());
    assert(portfolio.openPosition("BTC", 5.0, 100.0, t0, 90.0, 120.0));
    assert(!portfolio.openPosition("BTC", 1.0, 100.0, t0));            // already open
    assert(almost_equal(portfolio.getCash(), 500.0));
    assert(almost_equal(portfolio.getPosition("BTC")->risk_amount, 50.0));
    assert(almost_equal(portfolio.getTradeHistory().back().portfolio_value_after, 1000.0));
    assert(almost_equal(portfolio.getPortfolioValue({{"BTC", 110.0}}), 1050.0));
    assert(portfolio.getCounters().total_trades == 1);

    assert(portfolio.updatePosition("BTC", 110.0, t0) == core::CloseReason::None);
    assert(almost_equal(portfolio.getPosition("BTC")->unrealized_pnl, 50.0));
    assert(almost_equal(portfolio.getPosition("BTC")->unrealized_pnl_pct, 10.0));
    assert(portfolio.setStopLoss("BTC", 95.0));
    assert(almost_equal(portfolio.getPosition("BTC")->risk_amount, 25.0)); // 5 * (100 - 95)
    assert(portfolio.setStopLoss("BTC", 105.0));
    assert(almost_equal(portfolio.getPosition("BTC")->risk_amount, 0.0));  // stop above entry
    assert(!portfolio.setStopLoss("ETH", 1.0));
    assert(!portfolio.closePosition("ETH", 1.0, t0));
    assert(portfolio.updatePosition("BTC", 104.0, t0) == core::CloseReason::StopLoss);
    assert(!portfolio.hasPosition("BTC"));
    assert(almost_equal(portfolio.getCash(), 1020.0));
    assert(portfolio.getCounters().total_trades == 2);
    assert(portfolio.getCounters().winning_trades == 1);
    assert(almost_equal(portfolio.getCounters().total_profit, 20.0));
    assert(portfolio.getTradeHistory().back().reason == core::CloseReason::StopLoss);

    // Spending all cash: quantity * price rounds above cash
    backtester::Portfolio all_in(10000.0);
    const double all_in_quantity = 10000.0 * 1.0 / 8.78;
    assert(all_in_quantity * 8.78 > 10000.0);
    assert(all_in.openPosition("BTC", all_in_quantity, 8.78, t0));
    assert(all_in.getCash() == 0.0);
    assert(almost_equal(all_in.getTradeHistory().back().cash_flow, -10000.0));
    assert(!backtester::Portfolio(10000.0).openPosition("BTC", 1139.0, 8.78, t0)); // 10000.42 is a real shortfall

    // Full-size BUY through a session
    {
        core::config::RiskConfig no_stops;
        no_stops.stop_loss_pct = 0.0;
        no_stops.take_profit_pct = 0.0;
        backtester::PaperTradingSession paper(capital(10000.0), no_stops, "BTC");
        auto full = paper.run(ScriptedStrategy({B, H, S}, 1.0), test_support::makeBars({8.78, 9.0, 9.5}));
        assert(full.portfolio.getTradeHistory().size() == 2);
        assert(full.portfolio.getTradeHistory().front().action == core::TradeAction::Buy);
        assert(almost_equal(full.final_value, 10000.0 / 8.78 * 9.5));
    }

    bool threw = false;
    try {
        backtester::Portfolio broke(0.0);
    } catch (const core::BacktestException&) {
        threw = true;
    }
    assert(threw);

    // --- Stop-loss: entry 100, stop 98 ---
    auto stopped = session({100, 97, 97}, {B, H, H});
    const auto& stopped_history = stopped.portfolio.getTradeHistory();
    assert(stopped_history.size() == 2);
    assert(almost_equal(stopped_history[0].quantity, 95.0));
    assert(stopped_history[1].reason == core::CloseReason::StopLoss);
    assert(almost_equal(stopped_history[1].price, 97.0));
    assert(almost_equal(stopped.final_value, 500.0 + 95.0 * 97.0));
    assert(almost_equal(stopped.total_return_pct, (9715.0 - 10000.0) / 100.0));
    assert(almost_equal(stopped.win_rate, 0.0));
    assert(stopped.portfolio.getCounters().losing_trades == 1);
    assert(stopped.equity_curve.size() == 3);
    assert(almost_equal(stopped.equity_curve[0].portfolio_value, 10000.0));
    assert(almost_equal(stopped.equity_curve[2].portfolio_value, 9715.0));
    assert(stopped.realized_performance.num_completed_trades == 1);
    assert(almost_equal(stopped.realized_performance.total_return, -285.0));
    assert(stopped.realized_performance.max_drawdown < 0.0);

    // --- Take-profit: target 105 ---
    auto target = session({100, 106, 110}, {B, H, H});
    assert(target.portfolio.getTradeHistory().size() == 2);
    assert(target.portfolio.getTradeHistory()[1].reason == core::CloseReason::TakeProfit);
    assert(almost_equal(target.final_value, 500.0 + 95.0 * 106.0));
    assert(almost_equal(target.win_rate, 100.0));

    // --- Strategy SELL, then a re-entry force-closed at the end of the session ---
    auto signalled = session({100, 101, 102, 103}, {B, H, S, B});
    const auto& history = signalled.portfolio.getTradeHistory();
    assert(history.size() == 4);
    assert(history[1].reason == core::CloseReason::Signal);
    assert(history[3].reason == core::CloseReason::EndOfSession);
    assert(almost_equal(history[3].price, 103.0));
    assert(signalled.portfolio.getPositions().empty());
    assert(almost_equal(signalled.final_value, 500.0 + 95.0 * 102.0));
    assert(signalled.portfolio.getCounters().total_trades == 4);
    assert(almost_equal(signalled.win_rate, 50.0));               // flat exit counts as a loss
    assert(signalled.realized_performance.num_completed_trades == 2);
    assert(signalled.equity_curve.size() == 4);

    // --- Trailing stop follows the price up, then closes the trade ---
    core::config::RiskConfig trailing;
    trailing.take_profit_pct = 0.0;
    trailing.trailing_stop_pct = 0.05;
    auto trailed = session({100, 110, 104, 120}, {B, H, H, H}, trailing);
    assert(trailed.portfolio.getTradeHistory().size() == 2);
    assert(trailed.portfolio.getTradeHistory()[1].reason == core::CloseReason::StopLoss);
    assert(almost_equal(trailed.portfolio.getTradeHistory()[1].price, 104.0));
    assert(almost_equal(trailed.final_value, 500.0 + 95.0 * 104.0));
    assert(almost_equal(trailed.win_rate, 100.0));

    // --- Portfolio risk cap blocks the entry ---
    core::config::RiskConfig tight;
    tight.max_portfolio_risk = 0.01;
    auto blocked = session({100, 101, 102}, {B, H, H}, tight);
    assert(blocked.portfolio.getTradeHistory().empty());
    assert(almost_equal(blocked.final_value, 10000.0));
    assert(almost_equal(blocked.total_return, 0.0));

    // --- A BUY on the bar that stopped out reopens immediately ---
    auto reopened = session({100, 97}, {B, B});
    const auto& reopened_history = reopened.portfolio.getTradeHistory();
    assert(reopened_history.size() == 4);
    assert(reopened_history[1].reason == core::CloseReason::StopLoss);
    assert(reopened_history[2].action == core::TradeAction::Buy);
    assert(reopened_history[3].reason == core::CloseReason::EndOfSession);

    backtester::logPaperResult(signalled);

    threw = false;
    try {
        backtester::PaperTradingSession paper(capital(10000.0), core::config::RiskConfig{}, "BTC");
        paper.run(ScriptedStrategy({B}), {});
    } catch (const core::InvalidDataException&) {
        threw = true;
    }
    assert(threw);

    return 0;
}
