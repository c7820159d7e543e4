#include "backtest/MetricsCalculator.h"

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

using kitbt::MS_PER_DAY;
using kitbt::MS_PER_HOUR;
using kitbt::backtest::EquityPoint;
using kitbt::backtest::MetricsCalculator;
using kitbt::backtest::PerformanceMetrics;
using kitbt::risk::Trade;

namespace {
int g_failures = 0;

void check(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "[TEST] FAILED: " << message << "\n";
        ++g_failures;
    }
}

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

Trade makeTrade(double pnl, double pnl_percent, long long entry_time, long long exit_time,
                const std::string& strategy = "S1", double fees = 1.0) {
    Trade t;
    t.id = "T";
    t.symbol = "BTC/USDT";
    t.entry_price = 100.0;
    t.exit_price = 100.0;
    t.entry_time = entry_time;
    t.exit_time = exit_time;
    t.amount = 1.0;
    t.pnl = pnl;
    t.pnl_percent = pnl_percent;
    t.fees = fees;
    t.strategy_name = strategy;
    return t;
}

std::vector<EquityPoint> makeCurve(const std::vector<double>& equities, long long step_ms = MS_PER_DAY) {
    std::vector<EquityPoint> curve;
    double peak = equities.empty() ? 0.0 : equities.front();
    for (size_t i = 0; i < equities.size(); ++i) {
        peak = std::max(peak, equities[i]);
        const double dd = peak - equities[i];
        curve.emplace_back(static_cast<long long>(i) * step_ms, equities[i], dd, dd / peak * 100.0);
    }
    return curve;
}

bool allFinite(const PerformanceMetrics& m) {
    const double values[] = {
        m.win_rate, m.total_pnl, m.total_pnl_percent, m.gross_profit, m.gross_loss, m.net_profit,
        m.profit_factor, m.avg_win, m.avg_loss, m.avg_trade, m.avg_win_percent, m.avg_loss_percent,
        m.avg_trade_percent, m.max_drawdown, m.max_drawdown_percent, m.max_drawdown_duration,
        m.recovery_factor, m.sharpe_ratio, m.sortino_ratio, m.calmar_ratio, m.avg_holding_period,
        m.largest_win, m.largest_loss, m.expectancy, m.expectancy_percent, m.trades_per_day,
        m.initial_capital, m.final_capital, m.total_return, m.annualized_return, m.total_fees
    };
    for (double v : values) {
        if (!std::isfinite(v)) return false;
    }
    return true;
}
}

int main() {
    std::cout << "[TEST] Starting MetricsCalculator Test..." << std::endl;
    MetricsCalculator calc;

    // Empty ledger: complete record, defaults only
    {
        auto m = calc.calculateMetrics({}, {}, 10000.0);
        check(m.total_trades == 0, "empty: total_trades");
        check(allFinite(m), "empty: every field finite");
        check(m.profit_factor == 0.0, "empty: profit factor 0");
        check(m.sharpe_ratio == 0.0 && m.sortino_ratio == 0.0, "empty: ratios 0");
        check(m.initial_capital == 10000.0 && m.final_capital == 10000.0, "empty: capital");

        auto with_curve = calc.calculateMetrics({}, makeCurve({10000, 10000, 10000}), 10000.0);
        check(allFinite(with_curve), "empty with flat curve: finite");
        check(with_curve.final_capital == 10000.0, "empty with curve: final capital from curve");
    }

    // Equity curve [10000, 10000, 9000, 9500, 8500, 9000, 11000]: 15% from 10000 to 8500
    {
        const auto curve = makeCurve({10000, 10000, 9000, 9500, 8500, 9000, 11000});
        auto dd = MetricsCalculator::calculateDrawdown(curve);
        check(near(dd.max_drawdown, 1500.0), "drawdown: absolute");
        check(near(dd.max_drawdown_percent, 15.0), "drawdown: percent");
        // peak at day 1, recovered on day 6, deepest unrecovered span reaches day 5
        check(near(dd.max_drawdown_duration, 4.0), "drawdown: duration in days");

        std::vector<Trade> trades = {makeTrade(1000.0, 10.0, 0, 6 * MS_PER_DAY)};
        auto m = calc.calculateMetrics(trades, curve, 10000.0);
        check(near(m.max_drawdown_percent, 15.0), "metrics: maxDrawdownPercent");
        check(near(m.final_capital, 11000.0), "metrics: final capital from curve");
        check(near(m.total_return, 10.0), "metrics: total return");
        check(near(m.calmar_ratio, 10.0 / 15.0), "metrics: calmar");
        check(near(m.recovery_factor, 1000.0 / 1500.0), "metrics: recovery factor");
    }

    // maxDrawdown never decreases as the curve grows
    {
        const std::vector<double> equities = {100, 120, 90, 130, 80, 140, 150, 60, 200};
        double previous = 0.0;
        for (size_t n = 1; n <= equities.size(); ++n) {
            std::vector<double> prefix(equities.begin(), equities.begin() + n);
            auto dd = MetricsCalculator::calculateDrawdown(makeCurve(prefix));
            check(dd.max_drawdown >= previous, "drawdown monotone at n=" + std::to_string(n));
            previous = dd.max_drawdown;
        }
        check(near(previous, 90.0), "drawdown: 150 -> 60");
    }

    // A curve that opens below the starting capital is measured from that capital
    {
        const auto curve = makeCurve({9990, 9800, 9900});
        auto from_curve = MetricsCalculator::calculateDrawdown(curve);
        check(near(from_curve.max_drawdown, 190.0), "drawdown: peak from first point by default");

        auto from_capital = MetricsCalculator::calculateDrawdown(curve, 10000.0);
        check(near(from_capital.max_drawdown, 200.0), "drawdown: initial peak");
        check(near(from_capital.max_drawdown_percent, 2.0), "drawdown: initial peak percent");
        check(near(from_capital.max_drawdown_duration, 2.0), "drawdown: initial peak duration");

        std::vector<Trade> trades = {makeTrade(-100.0, -1.0, 0, 2 * MS_PER_DAY)};
        auto m = calc.calculateMetrics(trades, curve, 10000.0);
        check(near(m.max_drawdown, 200.0), "metrics: drawdown measured from initial capital");
        check(near(m.recovery_factor, -100.0 / 200.0), "metrics: recovery factor from initial capital");
    }

    // Profit/loss identities
    {
        std::vector<Trade> trades = {
            makeTrade(120.0, 6.0, 0, MS_PER_HOUR),
            makeTrade(-40.0, -2.0, MS_PER_HOUR, 2 * MS_PER_HOUR),
            makeTrade(0.0, 0.0, 2 * MS_PER_HOUR, 3 * MS_PER_HOUR),
            makeTrade(80.0, 4.0, 3 * MS_PER_HOUR, 5 * MS_PER_HOUR),
            makeTrade(-60.0, -3.0, 5 * MS_PER_HOUR, 6 * MS_PER_HOUR)
        };
        auto m = calc.calculateMetrics(trades, {}, 10000.0);
        check(m.total_trades == 5 && m.winning_trades == 2 && m.losing_trades == 2, "counts");
        check(near(m.gross_profit, 200.0) && near(m.gross_loss, 100.0), "gross");
        check(near(m.gross_profit - m.gross_loss, m.total_pnl), "grossProfit - grossLoss == totalPnL");
        check(near(m.net_profit, m.total_pnl), "net profit equals total pnl");
        check(near(m.profit_factor, 2.0), "profit factor");
        check(near(m.win_rate, 0.4), "win rate");
        check(near(m.avg_win, 100.0) && near(m.avg_loss, 50.0), "averages");
        check(near(m.expectancy, 0.4 * 100.0 - 0.6 * 50.0), "expectancy");
        check(near(m.expectancy_percent, 0.4 * 5.0 - 0.6 * 2.5), "expectancy percent");
        check(near(m.avg_holding_period, 1.2), "avg holding hours");
        check(near(m.largest_win, 120.0) && near(m.largest_loss, 60.0), "largest");
        check(near(m.total_fees, 5.0), "fees summed");
        check(near(m.final_capital, 10100.0), "no curve: final capital is initial plus net profit");
    }

    // profitFactor sentinels
    {
        std::vector<Trade> winners = {makeTrade(10.0, 1.0, 0, 1), makeTrade(5.0, 0.5, 1, 2)};
        auto m = calc.calculateMetrics(winners, {}, 1000.0);
        check(std::isinf(m.profit_factor) && m.profit_factor > 0, "profit factor +inf without losses");

        std::vector<Trade> losers = {makeTrade(-10.0, -1.0, 0, 1)};
        auto l = calc.calculateMetrics(losers, {}, 1000.0);
        check(l.profit_factor == 0.0, "profit factor 0 without winners");

        std::vector<Trade> flat = {makeTrade(0.0, 0.0, 0, 1)};
        auto f = calc.calculateMetrics(flat, {}, 1000.0);
        check(f.profit_factor == 0.0, "profit factor 0 for breakeven only");
    }

    // Streaks: breakeven does not reset
    {
        std::vector<Trade> trades = {
            makeTrade(1, 1, 0, 1), makeTrade(1, 1, 1, 2), makeTrade(0, 0, 2, 3),
            makeTrade(1, 1, 3, 4), makeTrade(-1, -1, 4, 5), makeTrade(-1, -1, 5, 6),
            makeTrade(1, 1, 6, 7)
        };
        auto m = calc.calculateMetrics(trades, {}, 1000.0);
        check(m.max_consecutive_wins == 3, "max consecutive wins");
        check(m.max_consecutive_losses == 2, "max consecutive losses");
    }

    // Sharpe / Sortino edge cases
    {
        check(calc.calculateSharpeRatio({}) == 0.0, "sharpe: no returns");
        check(calc.calculateSharpeRatio({0.01}) == 0.0, "sharpe: one return");
        check(calc.calculateSharpeRatio({0.01, 0.01, 0.01}) == 0.0, "sharpe: zero stddev");
        check(calc.calculateSortinoRatio({0.01}) == 0.0, "sortino: one return");
        const double sortino = calc.calculateSortinoRatio({0.01, 0.02, 0.03});
        check(std::isinf(sortino) && sortino > 0, "sortino: +inf without negative returns");
        check(std::isinf(calc.calculateSortinoRatio({0.01, -0.02, 0.03})), "sortino: single negative -> zero stddev");

        const std::vector<double> returns = {0.01, -0.02, 0.015, -0.005};
        const double mu = (0.01 - 0.02 + 0.015 - 0.005) / 4.0;
        const double sd = MetricsCalculator::standardDeviation(returns);
        const double expected = (mu - 0.02 / 252.0) / sd * std::sqrt(252.0);
        check(near(calc.calculateSharpeRatio(returns), expected, 1e-12), "sharpe formula");

        calc.setRiskFreeRate(0.0);
        check(near(calc.calculateSharpeRatio(returns), mu / sd * std::sqrt(252.0), 1e-12), "sharpe with rf 0");
        calc.setRiskFreeRate(0.02);
    }

    // Population standard deviation
    {
        check(MetricsCalculator::standardDeviation({5.0}) == 0.0, "stddev of one sample");
        check(near(MetricsCalculator::standardDeviation({2, 4, 4, 4, 5, 5, 7, 9}), 2.0), "stddev population");
    }

    // Returns skip non-positive previous equity
    {
        auto returns = MetricsCalculator::calculateReturns(makeCurve({100, 0, 50, 75}));
        check(returns.size() == 2, "returns: zero equity skipped");
        check(near(returns[0], -1.0) && near(returns[1], 0.5), "returns values");
    }

    // Per-strategy metrics split capital
    {
        std::vector<Trade> trades = {
            makeTrade(100.0, 5.0, 0, MS_PER_DAY, "Alpha"),
            makeTrade(-50.0, -2.0, 0, 2 * MS_PER_DAY, "Beta"),
            makeTrade(30.0, 1.0, MS_PER_DAY, 3 * MS_PER_DAY, "Alpha")
        };
        auto by = calc.calculateStrategyMetrics(trades, 10000.0);
        check(by.size() == 2, "two strategies");
        check(by.count("Alpha") == 1 && by.count("Beta") == 1, "strategy keys");
        check(near(by["Alpha"].initial_capital, 5000.0), "capital split");
        check(near(by["Alpha"].final_capital, 5130.0), "alpha final capital rebuilt from trades");
        check(by["Alpha"].total_trades == 2, "alpha trades");
        check(near(by["Beta"].final_capital, 4950.0), "beta final capital");
        check(near(by["Beta"].max_drawdown, 50.0), "beta drawdown");

        check(calc.calculateStrategyMetrics({}, 10000.0).empty(), "no trades -> no strategies");
    }

    // Annualized return
    {
        std::vector<Trade> trades = {makeTrade(1000.0, 10.0, 0, 365 * MS_PER_DAY)};
        auto curve = makeCurve({10000.0, 11000.0}, 365 * MS_PER_DAY);
        auto m = calc.calculateMetrics(trades, curve, 10000.0);
        check(m.trading_days == 365, "trading days");
        check(near(m.annualized_return, 10.0, 1e-9), "one year: annualized == total");
        check(near(m.trades_per_day, 1.0 / 365.0), "trades per day");

        std::vector<Trade> wipeout = {makeTrade(-10000.0, -100.0, 0, 10 * MS_PER_DAY)};
        auto w = calc.calculateMetrics(wipeout, makeCurve({10000.0, 0.0}, 10 * MS_PER_DAY), 10000.0);
        check(near(w.annualized_return, -100.0), "total loss annualizes to -100%");
        check(allFinite(w), "wipeout finite");
    }

    if (g_failures > 0) {
        std::cerr << "[TEST] MetricsCalculator Test FAILED (" << g_failures << ")" << std::endl;
        return 1;
    }
    std::cout << "[TEST] MetricsCalculator Test PASSED!" << std::endl;
    return 0;
}
