#include "risk_calculator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <cassert>
#include <cmath>
#include <limits>

namespace {
bool almost_equal(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

core::Position position(double quantity, double entry, double stop) {
    core::Position p;
    p.symbol = "BTC";
    p.quantity = quantity;
    p.entry_price = entry;
    p.stop_loss = stop;
    p.current_value = quantity * entry;
    p.risk_amount = quantity * std::abs(entry - stop);
    return p;
}
}

int main() {
    core::logging::LoggingOptions log_options;
    log_options.to_file = false;
    core::logging::initialize(log_options);

    // --- Fixed fraction ---
    assert(almost_equal(risk::positionSizeFixed(10000.0, 0.02), 200.0));

    // --- Kelly ---
    auto kelly = risk::positionSizeKelly(10000.0, 0.55, 500.0, 300.0, 0.5);
    assert(!kelly.used_fallback);
    assert(almost_equal(kelly.win_loss_ratio, 500.0 / 300.0));
    assert(almost_equal(kelly.kelly_fraction, 0.28, 1e-9));
    assert(almost_equal(kelly.position_size, 2800.0, 1e-6));

    // Signed average loss gives the same answer
    auto signed_loss = risk::positionSizeKelly(10000.0, 0.55, 500.0, -300.0, 0.5);
    assert(almost_equal(signed_loss.position_size, kelly.position_size, 1e-6));

    // Clamped to the cap and to zero
    assert(almost_equal(risk::positionSizeKelly(10000.0, 0.9, 1000.0, 100.0, 0.25).kelly_fraction, 0.25));
    assert(almost_equal(risk::positionSizeKelly(10000.0, 0.2, 100.0, 100.0, 0.5).kelly_fraction, 0.0));

    // Degenerate inputs fall back to the fixed 2%
    auto no_loss = risk::positionSizeKelly(10000.0, 0.6, 500.0, 0.0);
    assert(no_loss.used_fallback);
    assert(almost_equal(no_loss.position_size, 10000.0 * risk::kFallbackRiskPct));
    assert(risk::positionSizeKelly(10000.0, std::numeric_limits<double>::quiet_NaN(), 500.0, 300.0).used_fallback);
    assert(risk::positionSizeKelly(10000.0, 0.0, 500.0, 300.0).used_fallback);

    // --- ATR ---
    auto atr = risk::positionSizeAtr(10000.0, 0.02, 50.0, 1000.0, 2.0);
    assert(almost_equal(atr.stop_distance, 100.0));
    assert(almost_equal(atr.units, 2.0));
    assert(almost_equal(atr.position_value, 2000.0));
    assert(almost_equal(risk::positionSizeAtr(10000.0, 0.02, 0.0, 1000.0).units, 0.0));

    // --- Stops and targets ---
    assert(almost_equal(risk::stopLossPrice(90000.0, 0.02), 88200.0));
    assert(almost_equal(risk::stopLossPrice(100.0, 0.02, core::Direction::Short), 102.0));
    assert(almost_equal(risk::takeProfitPrice(100.0, 0.05), 105.0));
    assert(almost_equal(risk::takeProfitPrice(100.0, 0.05, core::Direction::Short), 95.0));

    auto rr = risk::riskRewardRatio(100.0, 98.0, 105.0);
    assert(rr && almost_equal(*rr, 2.5));
    assert(!risk::riskRewardRatio(100.0, 100.0, 105.0));

    assert(risk::isStopLossHit(97.0, 98.0));
    assert(!risk::isStopLossHit(99.0, 98.0));
    assert(risk::isStopLossHit(103.0, 102.0, core::Direction::Short));
    assert(risk::isTakeProfitHit(105.0, 105.0));
    assert(!risk::isTakeProfitHit(104.0, 105.0));

    // Trailing stop ratchets up with the price and never moves back down
    double stop = risk::stopLossPrice(100.0, 0.05);
    assert(almost_equal(stop, 95.0));
    stop = risk::trailingStop(110.0, stop, 0.05);
    assert(almost_equal(stop, 104.5));
    stop = risk::trailingStop(105.0, stop, 0.05);
    assert(almost_equal(stop, 104.5));
    stop = risk::trailingStop(120.0, stop, 0.05);
    assert(almost_equal(stop, 114.0));
    assert(almost_equal(risk::trailingStop(90.0, 105.0, 0.05, core::Direction::Short), 94.5));
    assert(almost_equal(risk::trailingStop(100.0, 94.5, 0.05, core::Direction::Short), 94.5));

    // --- Portfolio ---
    std::vector<core::Position> open{position(10.0, 100.0, 98.0), position(5.0, 200.0, 190.0)};
    auto metrics = risk::portfolioRisk(open, 10000.0);
    assert(metrics.num_positions == 2);
    assert(almost_equal(metrics.total_exposure, 2000.0));
    assert(almost_equal(metrics.total_risk, 70.0));
    assert(almost_equal(metrics.portfolio_risk_pct, 0.7));
    assert(almost_equal(metrics.leverage, 0.2));
    assert(risk::portfolioRisk({}, 10000.0).num_positions == 0);

    assert(almost_equal(risk::maxPositionSize(10000.0, 0.10, open), 10000.0 * (0.10 - 0.007)));

    assert(risk::withinRiskLimits(position(1.0, 100.0, 90.0), open, 10000.0, 0.10));
    assert(!risk::withinRiskLimits(position(100.0, 100.0, 90.0), open, 10000.0, 0.10));
    assert(!risk::withinRiskLimits(position(1.0, 100.0, 90.0), open, 0.0, 0.10));

    auto report = risk::buildRiskReport(open, 10000.0, 0.10);
    assert(report.within_limits);
    assert(almost_equal(report.max_risk_pct, 10.0));
    assert(almost_equal(report.utilization_pct, 7.0));
    risk::logRiskReport(report);

    // --- Calculator bound to a configuration ---
    core::config::RiskConfig config;
    config.trailing_stop_pct = 0.05;
    risk::RiskCalculator calculator(config);
    assert(calculator.trailingEnabled());
    assert(almost_equal(calculator.stopLoss(90000.0), 88200.0));
    assert(almost_equal(calculator.takeProfit(100.0), 105.0));
    assert(almost_equal(calculator.trail(110.0, 95.0), 104.5));
    assert(almost_equal(calculator.kellySize(10000.0, 0.55, 500.0, 300.0).position_size, 2800.0, 1e-6));
    assert(almost_equal(calculator.atrSize(10000.0, 50.0, 1000.0).units, 2.0));

    bool threw = false;
    config.max_portfolio_risk = 0.0;
    try {
        risk::RiskCalculator invalid(config);
    } catch (const core::ConfigException&) {
        threw = true;
    }
    assert(threw);

    return 0;
}
