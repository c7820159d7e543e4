#include "backtest/ReportWriter.h"
#include "common/Logger.h"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace kitbt {
namespace backtest {

namespace {
nlohmann::json number(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
    return value;
}

std::string formatRatio(double value) {
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << value;
    return oss.str();
}

nlohmann::json signalToJson(const strategy::Signal& s) {
    return {
        {"symbol", s.symbol},
        {"side", orderSideToString(s.side)},
        {"amount", number(s.amount)},
        {"price", number(s.price)},
        {"strategy", s.strategy},
        {"confidence", number(s.confidence)},
        {"timestamp", s.timestamp}
    };
}
}

nlohmann::json ReportWriter::metricsToJson(const PerformanceMetrics& m) {
    nlohmann::json j;
    j["totalTrades"] = m.total_trades;
    j["winningTrades"] = m.winning_trades;
    j["losingTrades"] = m.losing_trades;
    j["winRate"] = number(m.win_rate);
    j["totalPnL"] = number(m.total_pnl);
    j["totalPnLPercent"] = number(m.total_pnl_percent);
    j["grossProfit"] = number(m.gross_profit);
    j["grossLoss"] = number(m.gross_loss);
    j["netProfit"] = number(m.net_profit);
    j["profitFactor"] = number(m.profit_factor);
    j["avgWin"] = number(m.avg_win);
    j["avgLoss"] = number(m.avg_loss);
    j["avgTrade"] = number(m.avg_trade);
    j["avgWinPercent"] = number(m.avg_win_percent);
    j["avgLossPercent"] = number(m.avg_loss_percent);
    j["avgTradePercent"] = number(m.avg_trade_percent);
    j["maxDrawdown"] = number(m.max_drawdown);
    j["maxDrawdownPercent"] = number(m.max_drawdown_percent);
    j["maxDrawdownDuration"] = number(m.max_drawdown_duration);
    j["recoveryFactor"] = number(m.recovery_factor);
    j["sharpeRatio"] = number(m.sharpe_ratio);
    j["sortinoRatio"] = number(m.sortino_ratio);
    j["calmarRatio"] = number(m.calmar_ratio);
    j["avgHoldingPeriod"] = number(m.avg_holding_period);
    j["maxConsecutiveWins"] = m.max_consecutive_wins;
    j["maxConsecutiveLosses"] = m.max_consecutive_losses;
    j["largestWin"] = number(m.largest_win);
    j["largestLoss"] = number(m.largest_loss);
    j["expectancy"] = number(m.expectancy);
    j["expectancyPercent"] = number(m.expectancy_percent);
    j["startTime"] = m.start_time;
    j["endTime"] = m.end_time;
    j["tradingDays"] = m.trading_days;
    j["tradesPerDay"] = number(m.trades_per_day);
    j["initialCapital"] = number(m.initial_capital);
    j["finalCapital"] = number(m.final_capital);
    j["totalReturn"] = number(m.total_return);
    j["annualizedReturn"] = number(m.annualized_return);
    j["totalFees"] = number(m.total_fees);
    return j;
}

nlohmann::json ReportWriter::toJson(const BacktestResult& result) {
    nlohmann::json j;

    j["data"] = {
        {"symbol", result.data.symbol},
        {"timeframe", result.data.timeframe},
        {"startTime", result.data.start_time},
        {"endTime", result.data.end_time},
        {"totalCandles", result.data.total_candles}
    };

    const auto& c = result.config;
    j["config"] = {
        {"initialCapital", number(c.initial_capital)},
        {"feeRate", number(c.fee_rate)},
        {"slippageRate", number(c.slippage_rate)},
        {"maxPositions", c.max_positions},
        {"positionSizing", positionSizingToString(c.position_sizing)},
        {"positionSize", number(c.position_size)},
        {"useStopLoss", c.use_stop_loss},
        {"stopLossPercent", number(c.stop_loss_percent)},
        {"useTakeProfit", c.use_take_profit},
        {"takeProfitPercent", number(c.take_profit_percent)},
        {"allowShorts", c.allow_shorts},
        {"leverage", number(c.leverage)},
        {"intrabarPolicy", intrabarPolicyToString(c.intrabar_policy)},
        {"minConfidence", number(c.min_confidence)},
        {"lookback", result.lookback}
    };

    j["trades"] = nlohmann::json::array();
    for (const auto& t : result.trades) {
        j["trades"].push_back({
            {"id", t.id},
            {"symbol", t.symbol},
            {"side", positionSideToString(t.side)},
            {"entryPrice", number(t.entry_price)},
            {"exitPrice", number(t.exit_price)},
            {"entryTime", t.entry_time},
            {"exitTime", t.exit_time},
            {"amount", number(t.amount)},
            {"pnl", number(t.pnl)},
            {"pnlPercent", number(t.pnl_percent)},
            {"fees", number(t.fees)},
            {"strategy", t.strategy_name},
            {"closeReason", risk::closeReasonToString(t.close_reason)}
        });
    }

    j["equityCurve"] = nlohmann::json::array();
    for (const auto& p : result.equity_curve) {
        j["equityCurve"].push_back({
            {"timestamp", p.timestamp},
            {"equity", number(p.equity)},
            {"drawdown", number(p.drawdown)},
            {"drawdownPercent", number(p.drawdown_percent)}
        });
    }

    j["metricsByStrategy"] = nlohmann::json::object();
    for (const auto& entry : result.metrics_by_strategy) {
        j["metricsByStrategy"][entry.first] = metricsToJson(entry.second);
    }
    j["overallMetrics"] = metricsToJson(result.overall_metrics);

    j["signals"] = nlohmann::json::array();
    for (const auto& s : result.signals) {
        j["signals"].push_back(signalToJson(s));
    }

    j["skippedSignals"] = nlohmann::json::array();
    for (const auto& s : result.skipped_signals) {
        j["skippedSignals"].push_back({
            {"signal", signalToJson(s.signal)},
            {"timestamp", s.timestamp},
            {"reason", risk::skipReasonToString(s.reason)}
        });
    }

    j["cancelled"] = result.cancelled;
    return j;
}

void ReportWriter::writeJson(const BacktestResult& result, const std::string& path) {
    const std::filesystem::path out_path(path);
    if (out_path.has_parent_path()) {
        std::filesystem::create_directories(out_path.parent_path());
    }

    std::ofstream file(out_path);
    if (!file.is_open()) {
        throw std::runtime_error("failed to open report file: " + path);
    }
    file << toJson(result).dump(2) << "\n";
    if (!file) {
        throw std::runtime_error("failed to write report file: " + path);
    }
    LOG_INFO("Report written: {}", path);
}

void ReportWriter::printSummary(const BacktestResult& result, std::ostream& out) {
    const auto& m = result.overall_metrics;
    const auto flags = out.flags();
    const auto precision = out.precision();

    out << "\nBacktest Results: " << result.data.symbol << " " << result.data.timeframe
        << " (" << result.data.total_candles << " candles)";
    if (result.cancelled) {
        out << " [cancelled]";
    }
    out << "\n";
    out << "---------------------------------------------\n";
    out << std::fixed << std::setprecision(2);
    out << "Initial capital:   " << m.initial_capital << "\n";
    out << "Final capital:     " << m.final_capital << "\n";
    out << "Total return:      " << m.total_return << "%\n";
    out << "Annualized return: " << m.annualized_return << "%\n";
    out << "Max drawdown:      " << m.max_drawdown << " (" << m.max_drawdown_percent << "%, "
        << m.max_drawdown_duration << " days)\n";
    out << "Total trades:      " << m.total_trades << " (" << m.winning_trades << " won, "
        << m.losing_trades << " lost)\n";
    out << "Win rate:          " << (m.win_rate * 100.0) << "%\n";
    out << "Profit factor:     " << formatRatio(m.profit_factor) << "\n";
    out << "Sharpe ratio:      " << formatRatio(m.sharpe_ratio) << "\n";
    out << "Sortino ratio:     " << formatRatio(m.sortino_ratio) << "\n";
    out << "Calmar ratio:      " << formatRatio(m.calmar_ratio) << "\n";
    out << "Expectancy:        " << m.expectancy << " per trade (" << m.expectancy_percent << "%)\n";
    out << "Avg holding:       " << m.avg_holding_period << " h\n";
    out << "Total fees:        " << m.total_fees << "\n";
    out << "Skipped signals:   " << result.skipped_signals.size() << "\n";

    if (!result.metrics_by_strategy.empty()) {
        out << "By strategy:\n";
        for (const auto& entry : result.metrics_by_strategy) {
            const auto& s = entry.second;
            out << "  - " << entry.first
                << " | trades=" << s.total_trades
                << " | win=" << std::setprecision(1) << (s.win_rate * 100.0) << "%"
                << " | pnl=" << std::setprecision(2) << s.total_pnl
                << " | pf=" << formatRatio(s.profit_factor) << "\n";
        }
    }
    out << "---------------------------------------------\n";

    out.flags(flags);
    out.precision(precision);
}

} // namespace backtest
} // namespace kitbt
