#pragma once

#include "common/Types.h"
#include "risk/RiskManager.h"
#include <map>
#include <string>
#include <vector>

namespace kitbt {
namespace backtest {

struct EquityPoint {
    TimestampMs timestamp;
    double equity;              // cash + margin + unrealized pnl
    double drawdown;            // running peak - equity
    double drawdown_percent;

    EquityPoint() : timestamp(0), equity(0), drawdown(0), drawdown_percent(0) {}
    EquityPoint(TimestampMs t, double e, double dd, double dd_pct)
        : timestamp(t), equity(e), drawdown(dd), drawdown_percent(dd_pct) {}
};

// Percent fields are in percent units (12.5 == 12.5%), win_rate is a ratio.
struct PerformanceMetrics {
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;

    double total_pnl = 0.0;
    double total_pnl_percent = 0.0;
    double gross_profit = 0.0;
    double gross_loss = 0.0;
    double net_profit = 0.0;
    double profit_factor = 0.0;

    double avg_win = 0.0;
    double avg_loss = 0.0;
    double avg_trade = 0.0;
    double avg_win_percent = 0.0;
    double avg_loss_percent = 0.0;
    double avg_trade_percent = 0.0;

    double max_drawdown = 0.0;
    double max_drawdown_percent = 0.0;
    double max_drawdown_duration = 0.0;     // days
    double recovery_factor = 0.0;

    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    double calmar_ratio = 0.0;

    double avg_holding_period = 0.0;        // hours
    int max_consecutive_wins = 0;
    int max_consecutive_losses = 0;
    double largest_win = 0.0;
    double largest_loss = 0.0;              // magnitude
    double expectancy = 0.0;
    double expectancy_percent = 0.0;

    TimestampMs start_time = 0;
    TimestampMs end_time = 0;
    int trading_days = 0;
    double trades_per_day = 0.0;

    double initial_capital = 0.0;
    double final_capital = 0.0;
    double total_return = 0.0;
    double annualized_return = 0.0;
    double total_fees = 0.0;
};

// Pure function of (trades, equity curve, initial capital). Never throws;
// degenerate inputs resolve to 0 or +infinity.
class MetricsCalculator {
public:
    MetricsCalculator() = default;

    // Annual rate, 0.02 = 2%. Applied per period as rate / 252.
    void setRiskFreeRate(double rate) { risk_free_rate_ = rate; }
    double getRiskFreeRate() const { return risk_free_rate_; }

    PerformanceMetrics calculateMetrics(const std::vector<risk::Trade>& trades,
                                        const std::vector<EquityPoint>& equity_curve,
                                        double initial_capital) const;

    // Each strategy gets initial_capital / N and an equity curve rebuilt from
    // its own trades.
    std::map<std::string, PerformanceMetrics> calculateStrategyMetrics(
        const std::vector<risk::Trade>& trades,
        double initial_capital) const;

    // ===== Building blocks =====

    double calculateSharpeRatio(const std::vector<double>& returns) const;
    double calculateSortinoRatio(const std::vector<double>& returns) const;

    struct DrawdownStats {
        double max_drawdown = 0.0;
        double max_drawdown_percent = 0.0;
        double max_drawdown_duration = 0.0;  // days
    };
    // The running peak starts at max(initial_peak, first equity), so a curve
    // that opens below the starting capital is already in drawdown.
    static DrawdownStats calculateDrawdown(const std::vector<EquityPoint>& equity_curve,
                                           double initial_peak = 0.0);

    // Period-over-period relative changes; points after a non-positive equity are skipped.
    static std::vector<double> calculateReturns(const std::vector<EquityPoint>& equity_curve);

    // Population standard deviation, 0 for fewer than two values.
    static double standardDeviation(const std::vector<double>& values);

    static std::vector<EquityPoint> buildEquityCurve(const std::vector<risk::Trade>& trades,
                                                     double initial_capital);

private:
    double risk_free_rate_ = 0.02;
};

} // namespace backtest
} // namespace kitbt
