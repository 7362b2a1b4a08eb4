#include "performance_analyzer.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>
#include <deque>
#include <map>
#include <numeric>

namespace backtester {

void PerformanceReport::logMetrics() const {
    auto logger = core::logging::getLogger();
    logger->info("--- Performance Metrics ---");
    logger->info("Initial Capital:   {:.2f}", initial_capital);
    logger->info("Final Value:       {:.2f}", final_value);
    logger->info("Total Return:      {:.2f} ({:.2f}%)", total_return, total_return_pct);
    logger->info("Total Trades:      {}", num_trades);
    logger->info("Completed Trades:  {}", num_completed_trades);
    if (num_completed_trades > 0) {
        logger->info("Win Rate:          {:.2f}%", win_rate);
        if (profit_factor) {
            logger->info("Profit Factor:     {:.2f}", *profit_factor);
        } else {
            logger->info("Profit Factor:     n/a (no losing trades)");
        }
        logger->info("Avg Trade:         {:.2f}", avg_trade);
        logger->info("Avg Win:           {:.2f}", avg_win);
        logger->info("Avg Loss:          {:.2f}", avg_loss);
        logger->info("Largest Win:       {:.2f}", largest_win);
        logger->info("Largest Loss:      {:.2f}", largest_loss);
    }
    logger->info("Sharpe Ratio:      {:.2f}", sharpe_ratio);
    logger->info("Max Drawdown:      {:.2f}% ({:.2f})", max_drawdown, max_drawdown_value);
    logger->info("---------------------------");
}

std::vector<double> CostAdjustment::adjustedValues() const {
    std::vector<double> values;
    values.reserve(per_trade.size());
    for (const auto& cost : per_trade) {
        values.push_back(cost.adjusted_portfolio_value);
    }
    return values;
}

std::vector<TradePair> PerformanceAnalyzer::pairTrades(const core::TimeSeries<core::Trade>& ledger) const {
    std::map<std::string, std::deque<const core::Trade*>> open_buys;
    std::vector<TradePair> pairs;

    for (const auto& trade : ledger) {
        if (trade.action == core::TradeAction::Buy) {
            open_buys[trade.symbol].push_back(&trade);
            continue;
        }
        auto& queue = open_buys[trade.symbol];
        if (queue.empty()) {
            core::logging::getLogger()->warn("SELL of '{}' at {:.2f} has no matching BUY; excluded from trade statistics.",
                                             trade.symbol, trade.price);
            continue;
        }
        const core::Trade* buy = queue.front();
        queue.pop_front();

        TradePair pair;
        pair.symbol = trade.symbol;
        pair.entry_time = buy->timestamp;
        pair.exit_time = trade.timestamp;
        pair.entry_price = buy->price;
        pair.exit_price = trade.price;
        pair.quantity = buy->quantity;
        pair.profit = (trade.price - buy->price) * buy->quantity;
        pairs.push_back(pair);
    }
    return pairs;
}

TradeStats PerformanceAnalyzer::tradeStats(const std::vector<TradePair>& pairs) const {
    TradeStats stats;
    stats.num_pairs = pairs.size();
    if (pairs.empty()) {
        stats.profit_factor = 0.0;
        return stats;
    }

    double total = 0.0;
    for (const auto& pair : pairs) {
        total += pair.profit;
        if (pair.profit > 0.0) {
            ++stats.winning;
            stats.gross_profit += pair.profit;
            stats.largest_win = std::max(stats.largest_win, pair.profit);
        } else if (pair.profit < 0.0) {
            ++stats.losing;
            stats.gross_loss += -pair.profit;
            stats.largest_loss = std::min(stats.largest_loss, pair.profit);
        }
    }

    stats.win_rate = static_cast<double>(stats.winning) / stats.num_pairs * 100.0;
    stats.avg_trade = total / stats.num_pairs;
    stats.avg_win = stats.winning > 0 ? stats.gross_profit / stats.winning : 0.0;
    stats.avg_loss = stats.losing > 0 ? -stats.gross_loss / stats.losing : 0.0;
    if (stats.gross_loss > 0.0) {
        stats.profit_factor = stats.gross_profit / stats.gross_loss;
    }
    return stats;
}

PerformanceReport PerformanceAnalyzer::calculatePerformance(const SimulationResult& simulation, double initial_capital) const {
    PerformanceReport report;
    report.initial_capital = initial_capital;
    report.final_value = simulation.final_value;
    report.num_trades = simulation.ledger.size();

    if (simulation.ledger.empty()) {
        core::logging::getLogger()->warn("No trades executed");
        report.final_value = initial_capital;
        report.profit_factor = 0.0;
        return report;
    }

    report.total_return = simulation.final_value - initial_capital;
    report.total_return_pct = initial_capital > 0.0 ? report.total_return / initial_capital * 100.0 : 0.0;

    TradeStats stats = tradeStats(pairTrades(simulation.ledger));
    report.num_completed_trades = stats.num_pairs;
    report.win_rate = stats.win_rate;
    report.profit_factor = stats.profit_factor;
    report.avg_trade = stats.avg_trade;
    return report;
}

CostAdjustment PerformanceAnalyzer::applyTransactionCosts(const core::TimeSeries<core::Trade>& ledger, double final_value,
                                                          double commission, double slippage) const {
    CostAdjustment costs;
    costs.per_trade.reserve(ledger.size());

    for (const auto& trade : ledger) {
        TradeCost cost;
        cost.commission = std::fabs(trade.cash_flow) * commission;
        cost.slippage = std::fabs(trade.cash_flow) * slippage;
        costs.total_commission += cost.commission;
        costs.total_slippage += cost.slippage;
        // Every earlier cost has already left the account as well
        cost.adjusted_portfolio_value = trade.portfolio_value_after - costs.total_commission - costs.total_slippage;
        costs.per_trade.push_back(cost);
    }

    costs.total_costs = costs.total_commission + costs.total_slippage;
    costs.adjusted_final_value = final_value - costs.total_costs;

    if (!ledger.empty()) {
        core::logging::getLogger()->info("Transaction costs applied: {:.2f} (commission {:.2f}, slippage {:.2f})",
                                         costs.total_costs, costs.total_commission, costs.total_slippage);
    }
    return costs;
}

core::EquityCurve PerformanceAnalyzer::buildEquityCurve(const core::TimeSeries<core::Candle>& bars,
                                                        const core::TimeSeries<core::Trade>& ledger,
                                                        const std::vector<double>& trade_values,
                                                        double initial_capital) const {
    core::EquityCurve curve;
    curve.reserve(bars.size());

    const size_t num_steps = std::min(ledger.size(), trade_values.size());
    size_t next_trade = 0;
    double value = initial_capital;

    for (const auto& bar : bars) {
        while (next_trade < num_steps && ledger[next_trade].timestamp <= bar.timestamp) {
            value = trade_values[next_trade];
            ++next_trade;
        }
        curve.push_back(core::EquityPoint{bar.timestamp, value});
    }
    return curve;
}

core::EquityCurve PerformanceAnalyzer::buildEquityCurve(const core::TimeSeries<core::Candle>& bars,
                                                        const core::TimeSeries<core::Trade>& ledger,
                                                        double initial_capital) const {
    std::vector<double> values;
    values.reserve(ledger.size());
    for (const auto& trade : ledger) {
        values.push_back(trade.portfolio_value_after);
    }
    return buildEquityCurve(bars, ledger, values, initial_capital);
}

std::vector<double> PerformanceAnalyzer::calculateReturns(const core::EquityCurve& equity) const {
    std::vector<double> returns;
    if (equity.size() < 2) {
        return returns;
    }
    returns.reserve(equity.size() - 1);
    for (size_t i = 1; i < equity.size(); ++i) {
        const double previous = equity[i - 1].portfolio_value;
        returns.push_back(previous != 0.0 ? (equity[i].portfolio_value - previous) / previous : 0.0);
    }
    return returns;
}

double PerformanceAnalyzer::sharpeRatio(const std::vector<double>& returns) const {
    if (returns.size() < 2) {
        return 0.0;
    }
    const double n = static_cast<double>(returns.size());
    const double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / n;
    double sum_sq = 0.0;
    for (double r : returns) {
        sum_sq += (r - mean) * (r - mean);
    }
    const double stddev = std::sqrt(sum_sq / (n - 1.0));
    if (!(stddev > 0.0)) {
        return 0.0;
    }
    return mean / stddev * std::sqrt(252.0);
}

double PerformanceAnalyzer::maxDrawdown(const core::EquityCurve& equity) const {
    double peak = 0.0;
    double worst = 0.0;
    bool first = true;
    for (const auto& point : equity) {
        peak = first ? point.portfolio_value : std::max(peak, point.portfolio_value);
        first = false;
        if (peak > 0.0) {
            worst = std::min(worst, (point.portfolio_value - peak) / peak);
        }
    }
    return worst * 100.0;
}

double PerformanceAnalyzer::maxDrawdownValue(const core::EquityCurve& equity) const {
    double peak = 0.0;
    double worst = 0.0;
    bool first = true;
    for (const auto& point : equity) {
        peak = first ? point.portfolio_value : std::max(peak, point.portfolio_value);
        first = false;
        worst = std::min(worst, point.portfolio_value - peak);
    }
    return worst;
}

void PerformanceAnalyzer::addDetailedMetrics(PerformanceReport& report,
                                             const core::EquityCurve& equity,
                                             const core::TimeSeries<core::Trade>& ledger) const {
    if (ledger.empty()) {
        // Flat equity: every detailed metric stays 0
        return;
    }

    report.sharpe_ratio = sharpeRatio(calculateReturns(equity));
    report.max_drawdown = maxDrawdown(equity);
    report.max_drawdown_value = maxDrawdownValue(equity);

    TradeStats stats = tradeStats(pairTrades(ledger));
    report.profit_factor = stats.profit_factor;
    report.avg_win = stats.avg_win;
    report.avg_loss = stats.avg_loss;
    report.largest_win = stats.largest_win;
    report.largest_loss = stats.largest_loss;
}

} // namespace backtester
