#include "risk_calculator.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>

namespace risk {

double positionSizeFixed(double capital, double risk_pct) {
    double position_size = capital * risk_pct;
    core::logging::getLogger()->debug("Fixed position size: {:.2f} for capital: {:.2f}", position_size, capital);
    return position_size;
}

KellySizing positionSizeKelly(double capital, double win_rate, double avg_win, double avg_loss,
                              double max_kelly_fraction) {
    auto logger = core::logging::getLogger();
    KellySizing sizing;

    if (avg_loss == 0.0 || std::isnan(win_rate) || win_rate == 0.0) {
        logger->warn("Invalid parameters for Kelly Criterion (win_rate={}, avg_loss={}), using {}% fixed",
                     win_rate, avg_loss, kFallbackRiskPct * 100.0);
        sizing.kelly_fraction = kFallbackRiskPct;
        sizing.position_size = capital * kFallbackRiskPct;
        sizing.used_fallback = true;
        return sizing;
    }

    // Losses may be passed signed; the ratio uses magnitudes
    sizing.win_loss_ratio = std::fabs(avg_win) / std::fabs(avg_loss);
    double loss_rate = 1.0 - win_rate;
    double kelly = (win_rate * sizing.win_loss_ratio - loss_rate) / sizing.win_loss_ratio;

    sizing.kelly_fraction = std::max(0.0, std::min(kelly, max_kelly_fraction));
    sizing.position_size = capital * sizing.kelly_fraction;

    logger->debug("Kelly position size: {:.2f} (Kelly {:.2f}%, raw {:.4f})",
                  sizing.position_size, sizing.kelly_fraction * 100.0, kelly);
    return sizing;
}

AtrSizing positionSizeAtr(double capital, double risk_pct, double atr, double price, double multiplier) {
    AtrSizing sizing;
    sizing.stop_distance = atr * multiplier;
    if (!(sizing.stop_distance > 0.0)) {
        core::logging::getLogger()->warn("ATR stop distance is {} (atr={}, multiplier={}); sizing to zero units.",
                                         sizing.stop_distance, atr, multiplier);
        return sizing;
    }

    sizing.units = (capital * risk_pct) / sizing.stop_distance;
    sizing.position_value = sizing.units * price;

    core::logging::getLogger()->debug("ATR position sizing: Units: {:.6f} Value: {:.2f} Stop: {:.2f}",
                                      sizing.units, sizing.position_value, sizing.stop_distance);
    return sizing;
}

double stopLossPrice(double entry_price, double stop_pct, core::Direction direction) {
    double stop = direction == core::Direction::Long ? entry_price * (1.0 - stop_pct)
                                                     : entry_price * (1.0 + stop_pct);
    core::logging::getLogger()->debug("Stop-loss: {:.2f} for entry: {:.2f} {}", stop, entry_price, core::toString(direction));
    return stop;
}

double takeProfitPrice(double entry_price, double profit_pct, core::Direction direction) {
    double target = direction == core::Direction::Long ? entry_price * (1.0 + profit_pct)
                                                       : entry_price * (1.0 - profit_pct);
    core::logging::getLogger()->debug("Take-profit: {:.2f} for entry: {:.2f} {}", target, entry_price, core::toString(direction));
    return target;
}

std::optional<double> riskRewardRatio(double entry_price, double stop_loss, double take_profit) {
    double risk = std::fabs(entry_price - stop_loss);
    double reward = std::fabs(take_profit - entry_price);
    if (risk == 0.0) {
        core::logging::getLogger()->warn("Risk is zero, cannot calculate R:R ratio");
        return std::nullopt;
    }
    return reward / risk;
}

bool isStopLossHit(double current_price, double stop_loss, core::Direction direction) {
    bool hit = direction == core::Direction::Long ? current_price <= stop_loss : current_price >= stop_loss;
    if (hit) {
        core::logging::getLogger()->info("STOP-LOSS HIT: {:.2f} vs {:.2f}", current_price, stop_loss);
    }
    return hit;
}

bool isTakeProfitHit(double current_price, double take_profit, core::Direction direction) {
    bool hit = direction == core::Direction::Long ? current_price >= take_profit : current_price <= take_profit;
    if (hit) {
        core::logging::getLogger()->info("TAKE-PROFIT HIT: {:.2f} vs {:.2f}", current_price, take_profit);
    }
    return hit;
}

double trailingStop(double current_price, double current_stop, double trail_pct, core::Direction direction) {
    double new_stop = direction == core::Direction::Long
        ? std::max(current_price * (1.0 - trail_pct), current_stop)
        : std::min(current_price * (1.0 + trail_pct), current_stop);

    if (new_stop != current_stop) {
        core::logging::getLogger()->debug("Trailing stop updated: {:.2f} -> {:.2f}", current_stop, new_stop);
    }
    return new_stop;
}

PortfolioRisk portfolioRisk(const std::vector<core::Position>& positions, double total_capital) {
    PortfolioRisk metrics;
    if (positions.empty()) {
        return metrics;
    }
    if (!(total_capital > 0.0)) {
        core::logging::getLogger()->warn("Portfolio risk requested with non-positive capital ({}); reporting zeros.", total_capital);
        metrics.num_positions = positions.size();
        return metrics;
    }

    for (const auto& position : positions) {
        metrics.total_exposure += position.current_value > 0.0 ? position.current_value : position.entryValue();
        metrics.total_risk += position.risk_amount;
    }
    metrics.num_positions = positions.size();
    metrics.portfolio_risk_pct = metrics.total_risk / total_capital * 100.0;
    metrics.leverage = metrics.total_exposure / total_capital;

    core::logging::getLogger()->debug("Portfolio Risk: {:.2f}% Positions: {} Leverage: {:.2f}x",
                                      metrics.portfolio_risk_pct, metrics.num_positions, metrics.leverage);
    return metrics;
}

double maxPositionSize(double capital, double max_portfolio_risk, const std::vector<core::Position>& positions) {
    PortfolioRisk current = portfolioRisk(positions, capital);
    double remaining = std::max(0.0, max_portfolio_risk - current.portfolio_risk_pct / 100.0);
    double max_position = capital * remaining;
    core::logging::getLogger()->debug("Max position size: {:.2f} Remaining risk: {:.2f}%", max_position, remaining * 100.0);
    return max_position;
}

bool withinRiskLimits(const core::Position& proposed, const std::vector<core::Position>& positions,
                      double capital, double max_risk) {
    if (!(capital > 0.0)) {
        core::logging::getLogger()->warn("Risk limit check with non-positive capital ({}); rejecting position.", capital);
        return false;
    }
    std::vector<core::Position> all_positions = positions;
    all_positions.push_back(proposed);

    PortfolioRisk new_risk = portfolioRisk(all_positions, capital);
    bool within_limits = new_risk.portfolio_risk_pct <= max_risk * 100.0;
    if (!within_limits) {
        core::logging::getLogger()->warn("Risk limit exceeded: {:.2f}% > {:.2f}%",
                                         new_risk.portfolio_risk_pct, max_risk * 100.0);
    }
    return within_limits;
}

RiskReport buildRiskReport(const std::vector<core::Position>& positions, double capital, double max_risk) {
    RiskReport report;
    report.capital = capital;
    report.risk = portfolioRisk(positions, capital);
    report.max_risk_pct = max_risk * 100.0;
    report.utilization_pct = report.max_risk_pct > 0.0 ? report.risk.portfolio_risk_pct / report.max_risk_pct * 100.0 : 0.0;
    report.within_limits = report.risk.portfolio_risk_pct <= report.max_risk_pct;
    return report;
}

void logRiskReport(const RiskReport& report) {
    auto logger = core::logging::getLogger();
    logger->info("--- Risk Management Report ---");
    logger->info("Portfolio Capital:   {:.2f}", report.capital);
    logger->info("Number of Positions: {}", report.risk.num_positions);
    logger->info("Total Exposure:      {:.2f}", report.risk.total_exposure);
    logger->info("Total Risk Amount:   {:.2f}", report.risk.total_risk);
    logger->info("Portfolio Risk:      {:.2f}%", report.risk.portfolio_risk_pct);
    logger->info("Max Risk Allowed:    {:.2f}%", report.max_risk_pct);
    logger->info("Risk Utilization:    {:.1f}%", report.utilization_pct);
    logger->info("Leverage:            {:.2f}x", report.risk.leverage);
    if (report.within_limits) {
        logger->info("Portfolio risk within limits");
    } else {
        logger->warn("Portfolio risk exceeds maximum!");
    }
    logger->info("------------------------------");
}

RiskCalculator::RiskCalculator(core::config::RiskConfig config) : config_(config) {
    core::config::validate(config_);
}

double RiskCalculator::stopLoss(double entry_price, core::Direction direction) const {
    return stopLossPrice(entry_price, config_.stop_loss_pct, direction);
}

double RiskCalculator::takeProfit(double entry_price, core::Direction direction) const {
    return takeProfitPrice(entry_price, config_.take_profit_pct, direction);
}

KellySizing RiskCalculator::kellySize(double capital, double win_rate, double avg_win, double avg_loss) const {
    return positionSizeKelly(capital, win_rate, avg_win, avg_loss, config_.max_kelly_fraction);
}

AtrSizing RiskCalculator::atrSize(double capital, double atr, double price) const {
    return positionSizeAtr(capital, config_.default_risk_pct, atr, price, config_.atr_multiplier);
}

double RiskCalculator::trail(double current_price, double current_stop, core::Direction direction) const {
    return trailingStop(current_price, current_stop, config_.trailing_stop_pct, direction);
}

bool RiskCalculator::withinLimits(const core::Position& proposed, const std::vector<core::Position>& positions,
                                  double capital) const {
    return withinRiskLimits(proposed, positions, capital, config_.max_portfolio_risk);
}

} // namespace risk
