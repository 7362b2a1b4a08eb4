#pragma once

#include "datatypes.hpp"
#include "config.hpp"
#include <optional>
#include <vector>

namespace risk {

    // Fixed-fraction size used whenever Kelly inputs are degenerate
    constexpr double kFallbackRiskPct = 0.02;

    struct KellySizing {
        double win_loss_ratio = 0.0;
        double kelly_fraction = 0.0; // Clamped to [0, max_kelly_fraction]
        double position_size = 0.0;  // capital * kelly_fraction
        bool used_fallback = false;
    };

    struct AtrSizing {
        double units = 0.0;
        double position_value = 0.0;
        double stop_distance = 0.0;
    };

    struct PortfolioRisk {
        double total_exposure = 0.0;
        double total_risk = 0.0;
        double portfolio_risk_pct = 0.0; // total_risk / capital * 100
        size_t num_positions = 0;
        double leverage = 0.0;
    };

    struct RiskReport {
        double capital = 0.0;
        PortfolioRisk risk;
        double max_risk_pct = 0.0;     // Cap, in percent
        double utilization_pct = 0.0;  // portfolio_risk_pct relative to the cap
        bool within_limits = true;
    };

    // --- Position sizing ---
    double positionSizeFixed(double capital, double risk_pct);

    // f = (p*b - q) / b with b = avg_win / avg_loss, clamped to [0, max_kelly_fraction].
    // Falls back to kFallbackRiskPct of capital when avg_loss is 0 or win_rate is NaN or 0.
    KellySizing positionSizeKelly(double capital, double win_rate, double avg_win, double avg_loss,
                                  double max_kelly_fraction = 0.5);

    // units = capital * risk_pct / (atr * multiplier); a zero stop distance yields 0 units
    AtrSizing positionSizeAtr(double capital, double risk_pct, double atr, double price, double multiplier = 2.0);

    // --- Stop-loss / take-profit ---
    double stopLossPrice(double entry_price, double stop_pct, core::Direction direction = core::Direction::Long);
    double takeProfitPrice(double entry_price, double profit_pct, core::Direction direction = core::Direction::Long);

    // reward / risk; nullopt when the stop equals the entry
    std::optional<double> riskRewardRatio(double entry_price, double stop_loss, double take_profit);

    bool isStopLossHit(double current_price, double stop_loss, core::Direction direction = core::Direction::Long);
    bool isTakeProfitHit(double current_price, double take_profit, core::Direction direction = core::Direction::Long);

    // Moves only in the protective direction: up for longs, down for shorts
    double trailingStop(double current_price, double current_stop, double trail_pct,
                        core::Direction direction = core::Direction::Long);

    // --- Portfolio level ---
    PortfolioRisk portfolioRisk(const std::vector<core::Position>& positions, double total_capital);

    // Capital that can still be put at risk under `max_portfolio_risk` (a fraction)
    double maxPositionSize(double capital, double max_portfolio_risk, const std::vector<core::Position>& positions);

    // False when adding `proposed` would push portfolio risk above max_risk * 100 percent
    bool withinRiskLimits(const core::Position& proposed, const std::vector<core::Position>& positions,
                          double capital, double max_risk);

    RiskReport buildRiskReport(const std::vector<core::Position>& positions, double capital, double max_risk);
    void logRiskReport(const RiskReport& report);

    // Binds the sizing functions to one risk configuration
    class RiskCalculator {
    public:
        explicit RiskCalculator(core::config::RiskConfig config);

        const core::config::RiskConfig& config() const { return config_; }

        double stopLoss(double entry_price, core::Direction direction = core::Direction::Long) const;
        double takeProfit(double entry_price, core::Direction direction = core::Direction::Long) const;
        KellySizing kellySize(double capital, double win_rate, double avg_win, double avg_loss) const;
        AtrSizing atrSize(double capital, double atr, double price) const;
        bool trailingEnabled() const { return config_.trailing_stop_pct > 0.0; }
        double trail(double current_price, double current_stop, core::Direction direction = core::Direction::Long) const;
        bool withinLimits(const core::Position& proposed, const std::vector<core::Position>& positions, double capital) const;

    private:
        core::config::RiskConfig config_;
    };

} // namespace risk
