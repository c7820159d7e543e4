#include "backtest/MetricsCalculator.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace kitbt {
namespace backtest {

namespace {
constexpr double TRADING_DAYS_PER_YEAR = 252.0;
constexpr double DAYS_PER_YEAR = 365.0;
constexpr double MS_PER_DAY_D = static_cast<double>(MS_PER_DAY);
constexpr double MS_PER_HOUR_D = static_cast<double>(MS_PER_HOUR);

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

std::vector<risk::Trade> sortedByExit(const std::vector<risk::Trade>& trades) {
    std::vector<risk::Trade> sorted = trades;
    std::stable_sort(sorted.begin(), sorted.end(), [](const risk::Trade& a, const risk::Trade& b) {
        return a.exit_time < b.exit_time;
    });
    return sorted;
}
}

PerformanceMetrics MetricsCalculator::calculateMetrics(const std::vector<risk::Trade>& trades,
                                                       const std::vector<EquityPoint>& equity_curve,
                                                       double initial_capital) const {
    PerformanceMetrics m;
    m.initial_capital = initial_capital;
    m.final_capital = equity_curve.empty() ? initial_capital : equity_curve.back().equity;

    if (trades.empty()) {
        return m;
    }

    const auto sorted = sortedByExit(trades);

    // 1. Win/loss split. Breakeven trades count toward the total only.
    std::vector<double> win_pcts;
    std::vector<double> loss_pcts;
    double pnl_pct_sum = 0.0;
    double holding_hours_sum = 0.0;
    m.start_time = sorted.front().entry_time;
    m.end_time = sorted.front().exit_time;
    for (const auto& t : sorted) {
        if (t.pnl > 0) {
            ++m.winning_trades;
            m.gross_profit += t.pnl;
            m.largest_win = std::max(m.largest_win, t.pnl);
            win_pcts.push_back(t.pnl_percent);
        } else if (t.pnl < 0) {
            ++m.losing_trades;
            m.gross_loss += std::abs(t.pnl);
            m.largest_loss = std::max(m.largest_loss, std::abs(t.pnl));
            loss_pcts.push_back(std::abs(t.pnl_percent));
        }
        m.total_fees += t.fees;
        pnl_pct_sum += t.pnl_percent;
        holding_hours_sum += static_cast<double>(t.exit_time - t.entry_time) / MS_PER_HOUR_D;
        m.start_time = std::min(m.start_time, t.entry_time);
        m.end_time = std::max(m.end_time, t.exit_time);
    }

    m.total_trades = static_cast<int>(sorted.size());
    const double n = static_cast<double>(m.total_trades);
    m.win_rate = m.winning_trades / n;

    // Trade pnl is already net of fees
    m.total_pnl = m.gross_profit - m.gross_loss;
    m.net_profit = m.total_pnl;
    m.total_pnl_percent = initial_capital > 0 ? m.total_pnl / initial_capital * 100.0 : 0.0;

    if (m.winning_trades == 0) {
        m.profit_factor = 0.0;
    } else if (m.gross_loss == 0.0) {
        m.profit_factor = std::numeric_limits<double>::infinity();
    } else {
        m.profit_factor = m.gross_profit / m.gross_loss;
    }

    m.avg_win = m.winning_trades > 0 ? m.gross_profit / m.winning_trades : 0.0;
    m.avg_loss = m.losing_trades > 0 ? m.gross_loss / m.losing_trades : 0.0;
    m.avg_trade = m.total_pnl / n;
    m.avg_win_percent = mean(win_pcts);
    m.avg_loss_percent = mean(loss_pcts);
    m.avg_trade_percent = pnl_pct_sum / n;

    m.expectancy = m.win_rate * m.avg_win - (1.0 - m.win_rate) * m.avg_loss;
    m.expectancy_percent = m.win_rate * m.avg_win_percent - (1.0 - m.win_rate) * m.avg_loss_percent;
    m.avg_holding_period = holding_hours_sum / n;

    // 2. Streaks, in exit order
    int current_wins = 0;
    int current_losses = 0;
    for (const auto& t : sorted) {
        if (t.pnl > 0) {
            ++current_wins;
            current_losses = 0;
            m.max_consecutive_wins = std::max(m.max_consecutive_wins, current_wins);
        } else if (t.pnl < 0) {
            ++current_losses;
            current_wins = 0;
            m.max_consecutive_losses = std::max(m.max_consecutive_losses, current_losses);
        }
    }

    // 3. Curve-based metrics
    const auto dd = calculateDrawdown(equity_curve, initial_capital);
    m.max_drawdown = dd.max_drawdown;
    m.max_drawdown_percent = dd.max_drawdown_percent;
    m.max_drawdown_duration = dd.max_drawdown_duration;
    m.recovery_factor = m.max_drawdown > 0 ? m.net_profit / m.max_drawdown : 0.0;

    const auto returns = calculateReturns(equity_curve);
    m.sharpe_ratio = calculateSharpeRatio(returns);
    m.sortino_ratio = calculateSortinoRatio(returns);

    if (equity_curve.empty()) {
        m.final_capital = initial_capital + m.net_profit;
    }
    const double total_return = initial_capital > 0
        ? (m.final_capital - initial_capital) / initial_capital
        : 0.0;
    m.total_return = total_return * 100.0;
    m.calmar_ratio = m.max_drawdown_percent > 0 ? m.total_return / m.max_drawdown_percent : 0.0;

    // 4. Time span
    m.trading_days = static_cast<int>(std::ceil(
        static_cast<double>(m.end_time - m.start_time) / MS_PER_DAY_D));
    m.trades_per_day = m.trading_days > 0 ? n / m.trading_days : 0.0;

    const double years = m.trading_days / DAYS_PER_YEAR;
    if (years <= 0) {
        m.annualized_return = m.total_return;
    } else if (1.0 + total_return <= 0.0) {
        m.annualized_return = -100.0;
    } else {
        m.annualized_return = (std::pow(1.0 + total_return, 1.0 / years) - 1.0) * 100.0;
    }

    return m;
}

std::map<std::string, PerformanceMetrics> MetricsCalculator::calculateStrategyMetrics(
    const std::vector<risk::Trade>& trades,
    double initial_capital) const {
    std::map<std::string, std::vector<risk::Trade>> by_strategy;
    for (const auto& t : trades) {
        by_strategy[t.strategy_name].push_back(t);
    }

    std::map<std::string, PerformanceMetrics> result;
    if (by_strategy.empty()) {
        return result;
    }

    const double capital = initial_capital / static_cast<double>(by_strategy.size());
    for (const auto& entry : by_strategy) {
        const auto curve = buildEquityCurve(entry.second, capital);
        result[entry.first] = calculateMetrics(entry.second, curve, capital);
    }
    return result;
}

double MetricsCalculator::calculateSharpeRatio(const std::vector<double>& returns) const {
    if (returns.size() < 2) return 0.0;

    const double sd = standardDeviation(returns);
    if (sd == 0.0) return 0.0;

    const double excess = mean(returns) - risk_free_rate_ / TRADING_DAYS_PER_YEAR;
    return excess / sd * std::sqrt(TRADING_DAYS_PER_YEAR);
}

double MetricsCalculator::calculateSortinoRatio(const std::vector<double>& returns) const {
    if (returns.size() < 2) return 0.0;

    std::vector<double> negative;
    for (double r : returns) {
        if (r < 0) negative.push_back(r);
    }
    if (negative.empty()) return std::numeric_limits<double>::infinity();

    const double downside = standardDeviation(negative);
    if (downside == 0.0) return std::numeric_limits<double>::infinity();

    const double excess = mean(returns) - risk_free_rate_ / TRADING_DAYS_PER_YEAR;
    return excess / downside * std::sqrt(TRADING_DAYS_PER_YEAR);
}

MetricsCalculator::DrawdownStats MetricsCalculator::calculateDrawdown(
    const std::vector<EquityPoint>& equity_curve,
    double initial_peak) {
    DrawdownStats stats;
    if (equity_curve.empty()) return stats;

    double peak = std::max(initial_peak, equity_curve.front().equity);
    TimestampMs peak_time = equity_curve.front().timestamp;

    for (const auto& point : equity_curve) {
        if (point.equity >= peak) {
            peak = point.equity;
            peak_time = point.timestamp;
            continue;
        }

        const double drawdown = peak - point.equity;
        stats.max_drawdown = std::max(stats.max_drawdown, drawdown);
        if (peak > 0) {
            stats.max_drawdown_percent = std::max(stats.max_drawdown_percent, drawdown / peak * 100.0);
        }

        const double duration_days = static_cast<double>(point.timestamp - peak_time) / MS_PER_DAY_D;
        stats.max_drawdown_duration = std::max(stats.max_drawdown_duration, duration_days);
    }

    return stats;
}

std::vector<double> MetricsCalculator::calculateReturns(const std::vector<EquityPoint>& equity_curve) {
    std::vector<double> returns;
    if (equity_curve.size() < 2) return returns;

    returns.reserve(equity_curve.size() - 1);
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        const double prev = equity_curve[i - 1].equity;
        if (prev > 0) {
            returns.push_back((equity_curve[i].equity - prev) / prev);
        }
    }
    return returns;
}

double MetricsCalculator::standardDeviation(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;

    const double mu = mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mu) * (v - mu);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

std::vector<EquityPoint> MetricsCalculator::buildEquityCurve(const std::vector<risk::Trade>& trades,
                                                             double initial_capital) {
    std::vector<EquityPoint> curve;
    const auto sorted = sortedByExit(trades);

    double equity = initial_capital;
    double peak = initial_capital;
    curve.emplace_back(sorted.empty() ? 0 : sorted.front().entry_time, equity, 0.0, 0.0);

    for (const auto& t : sorted) {
        equity += t.pnl;
        peak = std::max(peak, equity);
        const double drawdown = peak - equity;
        curve.emplace_back(t.exit_time, equity, drawdown, peak > 0 ? drawdown / peak * 100.0 : 0.0);
    }
    return curve;
}

} // namespace backtest
} // namespace kitbt
