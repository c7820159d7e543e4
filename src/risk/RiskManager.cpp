#include "risk/RiskManager.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace kitbt {
namespace risk {

namespace {
constexpr size_t KELLY_LOOKBACK_TRADES = 50;
constexpr size_t KELLY_MIN_TRADES = 10;
constexpr double KELLY_DEFAULT_FRACTION = 0.02;
constexpr double KELLY_MIN_FRACTION = 0.01;
constexpr double KELLY_MAX_FRACTION = 0.25;
}

const char* closeReasonToString(CloseReason reason) {
    switch (reason) {
        case CloseReason::SIGNAL: return "signal";
        case CloseReason::STOP_LOSS: return "stop_loss";
        case CloseReason::TAKE_PROFIT: return "take_profit";
        case CloseReason::END_OF_DATA: return "end_of_data";
    }
    return "unknown";
}

const char* skipReasonToString(SkipReason reason) {
    switch (reason) {
        case SkipReason::NONE: return "none";
        case SkipReason::LOW_CONFIDENCE: return "low_confidence";
        case SkipReason::DUPLICATE_POSITION: return "duplicate_position";
        case SkipReason::MAX_POSITIONS: return "max_positions";
        case SkipReason::SHORTS_DISABLED: return "shorts_disabled";
        case SkipReason::INVALID_AMOUNT: return "invalid_amount";
        case SkipReason::INSUFFICIENT_CAPITAL: return "insufficient_capital";
    }
    return "unknown";
}

RiskManager::RiskManager(const backtest::BacktestConfig& config)
    : config_(config)
    , cash_(config.initial_capital)
    , total_fees_paid_(0.0)
    , next_id_(1)
{
}

// ===== Entry =====

EntryDecision RiskManager::evaluateEntry(const strategy::Signal& signal, double market_price) const {
    EntryDecision decision;
    const PositionSide side = positionSideFor(signal.side);

    if (!meetsMinConfidence(signal)) {
        decision.skip_reason = SkipReason::LOW_CONFIDENCE;
        return decision;
    }

    if (findPosition(signal.symbol, signal.strategy, side) != nullptr) {
        decision.skip_reason = SkipReason::DUPLICATE_POSITION;
        return decision;
    }

    if (positions_.size() >= static_cast<size_t>(config_.max_positions)) {
        decision.skip_reason = SkipReason::MAX_POSITIONS;
        return decision;
    }

    if (side == PositionSide::SHORT && !config_.allow_shorts) {
        decision.skip_reason = SkipReason::SHORTS_DISABLED;
        return decision;
    }

    decision.margin = calculatePositionMargin(signal.strategy);
    decision.fill_price = entryFillPrice(side, market_price);
    decision.notional = decision.margin * config_.leverage;
    decision.amount = decision.fill_price > 0.0 ? decision.notional / decision.fill_price : 0.0;
    decision.fee = calculateFee(decision.notional);

    if (!std::isfinite(decision.margin) || decision.margin <= 0.0 ||
        !std::isfinite(decision.amount) || decision.amount <= 0.0) {
        decision.skip_reason = SkipReason::INVALID_AMOUNT;
        return decision;
    }

    if (decision.margin + decision.fee > cash_) {
        decision.skip_reason = SkipReason::INSUFFICIENT_CAPITAL;
        return decision;
    }

    return decision;
}

const Position& RiskManager::enterPosition(const strategy::Signal& signal,
                                           const EntryDecision& decision,
                                           TimestampMs time,
                                           size_t step) {
    Position pos;
    pos.id = nextPositionId();
    pos.symbol = signal.symbol;
    pos.side = positionSideFor(signal.side);
    pos.entry_price = decision.fill_price;
    pos.amount = decision.amount;
    pos.notional = decision.notional;
    pos.margin = decision.margin;
    pos.entry_fee = decision.fee;
    pos.entry_time = time;
    pos.entry_step = step;
    pos.strategy_name = signal.strategy;
    pos.current_price = decision.fill_price;

    const bool is_long = pos.side == PositionSide::LONG;
    if (config_.use_stop_loss) {
        const double offset = pos.entry_price * config_.stop_loss_percent / 100.0;
        pos.stop_loss = is_long ? pos.entry_price - offset : pos.entry_price + offset;
    }
    if (config_.use_take_profit) {
        const double offset = pos.entry_price * config_.take_profit_percent / 100.0;
        pos.take_profit = is_long ? pos.entry_price + offset : pos.entry_price - offset;
    }

    // Margin and entry fee leave cash now; the fee is part of the trade's pnl at exit
    cash_ -= (pos.margin + pos.entry_fee);
    total_fees_paid_ += pos.entry_fee;

    positions_.push_back(pos);

    LOG_DEBUG("Position entered: {} {} {} | strategy={} | amount={:.6f} @ {:.4f} | margin={:.2f} | fee={:.4f} | cash={:.2f}",
              pos.id, pos.symbol, positionSideToString(pos.side), pos.strategy_name,
              pos.amount, pos.entry_price, pos.margin, pos.entry_fee, cash_);

    return positions_.back();
}

double RiskManager::calculatePositionMargin(const std::string& strategy_name) const {
    switch (config_.position_sizing) {
        case backtest::PositionSizing::FIXED:
            return config_.position_size;
        case backtest::PositionSizing::PERCENT:
            return getEquity() * config_.position_size / 100.0;
        case backtest::PositionSizing::KELLY:
            return getEquity() * calculateKellyFraction(strategy_name);
    }
    return 0.0;
}

double RiskManager::calculateKellyFraction(const std::string& strategy_name) const {
    std::vector<const Trade*> recent;
    for (auto it = trade_history_.rbegin();
         it != trade_history_.rend() && recent.size() < KELLY_LOOKBACK_TRADES; ++it) {
        if (it->strategy_name == strategy_name) {
            recent.push_back(&*it);
        }
    }

    if (recent.size() < KELLY_MIN_TRADES) {
        return KELLY_DEFAULT_FRACTION;
    }

    int wins = 0;
    int losses = 0;
    double win_pct_sum = 0.0;
    double loss_pct_sum = 0.0;
    for (const Trade* t : recent) {
        if (t->pnl > 0) {
            ++wins;
            win_pct_sum += t->pnl_percent;
        } else if (t->pnl < 0) {
            ++losses;
            loss_pct_sum += std::abs(t->pnl_percent);
        }
    }

    if (wins == 0 || losses == 0) {
        return KELLY_DEFAULT_FRACTION;
    }

    const double p = static_cast<double>(wins) / static_cast<double>(recent.size());
    const double avg_win = win_pct_sum / wins;
    const double avg_loss = loss_pct_sum / losses;
    if (avg_loss <= 0.0) {
        return KELLY_DEFAULT_FRACTION;
    }

    // Kelly Criterion: f = p - q / b, with b = avg win / avg loss
    const double b = avg_win / avg_loss;
    const double kelly = p - (1.0 - p) / b;

    return std::clamp(kelly * 0.5, KELLY_MIN_FRACTION, KELLY_MAX_FRACTION);
}

// ===== Marking and exits =====

void RiskManager::markToMarket(const std::string& symbol, double price) {
    for (auto& pos : positions_) {
        if (pos.symbol != symbol) continue;
        pos.current_price = price;
        pos.unrealized_pnl = grossPnl(pos, price);
    }
}

std::vector<Trade> RiskManager::evaluateStops(const std::string& symbol, const Candle& candle, size_t step) {
    struct Trigger {
        std::string id;
        double level;
        CloseReason reason;
    };
    std::vector<Trigger> triggers;

    for (const auto& pos : positions_) {
        if (pos.symbol != symbol || pos.entry_step >= step) continue;

        const bool is_long = pos.side == PositionSide::LONG;
        const bool stop_hit = pos.stop_loss > 0.0 &&
            (is_long ? candle.low <= pos.stop_loss : candle.high >= pos.stop_loss);
        const bool target_hit = pos.take_profit > 0.0 &&
            (is_long ? candle.high >= pos.take_profit : candle.low <= pos.take_profit);

        if (stop_hit && target_hit) {
            if (config_.intrabar_policy == backtest::IntrabarPolicy::TARGET_FIRST) {
                triggers.push_back({pos.id, pos.take_profit, CloseReason::TAKE_PROFIT});
            } else {
                triggers.push_back({pos.id, pos.stop_loss, CloseReason::STOP_LOSS});
            }
        } else if (stop_hit) {
            triggers.push_back({pos.id, pos.stop_loss, CloseReason::STOP_LOSS});
        } else if (target_hit) {
            triggers.push_back({pos.id, pos.take_profit, CloseReason::TAKE_PROFIT});
        }
    }

    std::vector<Trade> closed;
    closed.reserve(triggers.size());
    for (const auto& trigger : triggers) {
        closed.push_back(exitPosition(trigger.id, trigger.level, candle.timestamp, trigger.reason));
    }
    return closed;
}

Trade RiskManager::exitPosition(const std::string& position_id, double price,
                                TimestampMs time, CloseReason reason) {
    auto it = std::find_if(positions_.begin(), positions_.end(),
                           [&](const Position& p) { return p.id == position_id; });
    if (it == positions_.end()) {
        throw std::logic_error("exitPosition: unknown position " + position_id);
    }

    const Position pos = *it;
    const double exit_price = exitFillPrice(pos.side, price);
    const double gross = grossPnl(pos, exit_price);
    const double exit_fee = calculateFee(exit_price * pos.amount);

    Trade trade;
    trade.id = pos.id;
    trade.symbol = pos.symbol;
    trade.side = pos.side;
    trade.entry_price = pos.entry_price;
    trade.exit_price = exit_price;
    trade.entry_time = pos.entry_time;
    trade.exit_time = time;
    trade.amount = pos.amount;
    trade.pnl = gross - pos.entry_fee - exit_fee;
    trade.pnl_percent = pos.margin > 0.0 ? trade.pnl / pos.margin * 100.0 : 0.0;
    trade.fees = pos.entry_fee + exit_fee;
    trade.strategy_name = pos.strategy_name;
    trade.close_reason = reason;

    // Margin comes back with the gross result; the entry fee already left cash
    cash_ += pos.margin + gross - exit_fee;
    total_fees_paid_ += exit_fee;

    positions_.erase(it);
    trade_history_.push_back(trade);

    LOG_DEBUG("Position exited: {} {} | pnl {:.2f} ({:+.2f}%) | reason={} | cash {:.2f}",
              trade.id, trade.symbol, trade.pnl, trade.pnl_percent,
              closeReasonToString(reason), cash_);
    Logger::getInstance().logTrade(trade.id, trade.symbol, positionSideToString(trade.side),
                                   trade.entry_price, trade.exit_price, trade.amount,
                                   trade.pnl, closeReasonToString(reason));

    return trade;
}

std::vector<Trade> RiskManager::closeAll(const std::string& symbol, double price,
                                         TimestampMs time, CloseReason reason) {
    std::vector<std::string> ids;
    for (const auto& pos : positions_) {
        if (pos.symbol == symbol) {
            ids.push_back(pos.id);
        }
    }

    std::vector<Trade> closed;
    closed.reserve(ids.size());
    for (const auto& id : ids) {
        closed.push_back(exitPosition(id, price, time, reason));
    }
    return closed;
}

const Position* RiskManager::findPosition(const std::string& symbol,
                                          const std::string& strategy_name,
                                          PositionSide side) const {
    for (const auto& pos : positions_) {
        if (pos.symbol == symbol && pos.strategy_name == strategy_name && pos.side == side) {
            return &pos;
        }
    }
    return nullptr;
}

// ===== Accounting =====

double RiskManager::getEquity() const {
    double locked = 0.0;
    double unrealized = 0.0;
    for (const auto& pos : positions_) {
        locked += pos.margin;
        unrealized += pos.unrealized_pnl;
    }
    return cash_ + locked + unrealized;
}

// ===== Private helpers =====

double RiskManager::calculateFee(double notional) const {
    return notional * config_.fee_rate;
}

double RiskManager::entryFillPrice(PositionSide side, double price) const {
    return side == PositionSide::LONG
        ? price * (1.0 + config_.slippage_rate)
        : price * (1.0 - config_.slippage_rate);
}

double RiskManager::exitFillPrice(PositionSide side, double price) const {
    return side == PositionSide::LONG
        ? price * (1.0 - config_.slippage_rate)
        : price * (1.0 + config_.slippage_rate);
}

double RiskManager::grossPnl(const Position& pos, double exit_price) const {
    return pos.side == PositionSide::LONG
        ? (exit_price - pos.entry_price) * pos.amount
        : (pos.entry_price - exit_price) * pos.amount;
}

std::string RiskManager::nextPositionId() {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "BT-%06zu", next_id_++);
    return buffer;
}

} // namespace risk
} // namespace kitbt
