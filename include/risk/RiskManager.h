#pragma once

#include "common/Types.h"
#include "backtest/BacktestConfig.h"
#include "strategy/IStrategy.h"
#include <string>
#include <vector>

namespace kitbt {
namespace risk {

enum class CloseReason {
    SIGNAL,         // opposite-side signal from the owning strategy
    STOP_LOSS,
    TAKE_PROFIT,
    END_OF_DATA
};

enum class SkipReason {
    NONE,
    LOW_CONFIDENCE,
    DUPLICATE_POSITION,
    MAX_POSITIONS,
    SHORTS_DISABLED,
    INVALID_AMOUNT,
    INSUFFICIENT_CAPITAL
};

const char* closeReasonToString(CloseReason reason);
const char* skipReasonToString(SkipReason reason);

// Open position, owned by the RiskManager until it becomes a Trade.
struct Position {
    std::string id;
    std::string symbol;
    PositionSide side;
    double entry_price;         // fill price, slippage included
    double amount;              // base units
    double notional;            // entry_price * amount
    double margin;              // notional / leverage, the cash locked
    double entry_fee;
    double stop_loss;           // 0 = none
    double take_profit;         // 0 = none
    TimestampMs entry_time;
    size_t entry_step;          // candle index the position was opened on
    std::string strategy_name;

    double current_price;
    double unrealized_pnl;

    Position()
        : side(PositionSide::LONG)
        , entry_price(0), amount(0), notional(0), margin(0), entry_fee(0)
        , stop_loss(0), take_profit(0)
        , entry_time(0), entry_step(0)
        , current_price(0), unrealized_pnl(0)
    {}
};

// Closed position. pnl is net of both fees; pnl_percent is relative to margin.
struct Trade {
    std::string id;
    std::string symbol;
    PositionSide side;
    double entry_price;
    double exit_price;
    TimestampMs entry_time;
    TimestampMs exit_time;
    double amount;
    double pnl;
    double pnl_percent;
    double fees;
    std::string strategy_name;
    CloseReason close_reason;

    Trade()
        : side(PositionSide::LONG)
        , entry_price(0), exit_price(0)
        , entry_time(0), exit_time(0)
        , amount(0), pnl(0), pnl_percent(0), fees(0)
        , close_reason(CloseReason::SIGNAL)
    {}
};

// Outcome of the risk filters and sizing for one signal.
struct EntryDecision {
    SkipReason skip_reason = SkipReason::NONE;
    double margin = 0.0;
    double notional = 0.0;
    double fill_price = 0.0;
    double amount = 0.0;
    double fee = 0.0;

    bool accepted() const { return skip_reason == SkipReason::NONE; }
};

// Position book and cash ledger for one backtest run.
// Not thread-safe: the replay loop is its only caller.
class RiskManager {
public:
    explicit RiskManager(const backtest::BacktestConfig& config);

    // ===== Entry =====

    bool meetsMinConfidence(const strategy::Signal& signal) const {
        return signal.confidence >= config_.min_confidence;
    }

    // Filters in order: confidence, duplicate (symbol, strategy, side),
    // max positions, shorts, then sizing (invalid amount, capital).
    EntryDecision evaluateEntry(const strategy::Signal& signal, double market_price) const;

    const Position& enterPosition(const strategy::Signal& signal,
                                  const EntryDecision& decision,
                                  TimestampMs time,
                                  size_t step);

    // Margin to commit for a new position of this strategy, per sizing mode.
    double calculatePositionMargin(const std::string& strategy_name) const;

    // Half-Kelly fraction of equity from the strategy's trailing trades.
    double calculateKellyFraction(const std::string& strategy_name) const;

    // ===== Marking and exits =====

    void markToMarket(const std::string& symbol, double price);

    // Stop/target checks against the candle range for positions opened before
    // `step`. Triggered positions close at their level price.
    std::vector<Trade> evaluateStops(const std::string& symbol, const Candle& candle, size_t step);

    // Closes at `price` with exit slippage and fees applied.
    Trade exitPosition(const std::string& position_id, double price,
                       TimestampMs time, CloseReason reason);

    std::vector<Trade> closeAll(const std::string& symbol, double price,
                                TimestampMs time, CloseReason reason);

    // Open position of `strategy_name` on `symbol` with `side`, or nullptr.
    const Position* findPosition(const std::string& symbol,
                                 const std::string& strategy_name,
                                 PositionSide side) const;

    // ===== Accounting =====

    double getCash() const { return cash_; }
    // cash + locked margin + unrealized pnl
    double getEquity() const;
    double getTotalFeesPaid() const { return total_fees_paid_; }

    size_t getOpenPositionCount() const { return positions_.size(); }
    const std::vector<Position>& getAllPositions() const { return positions_; }
    const std::vector<Trade>& getTradeHistory() const { return trade_history_; }

private:
    double calculateFee(double notional) const;
    double entryFillPrice(PositionSide side, double price) const;
    double exitFillPrice(PositionSide side, double price) const;
    double grossPnl(const Position& pos, double exit_price) const;
    std::string nextPositionId();

    backtest::BacktestConfig config_;
    double cash_;
    double total_fees_paid_;
    size_t next_id_;

    std::vector<Position> positions_;       // open order
    std::vector<Trade> trade_history_;      // exit order
};

} // namespace risk
} // namespace kitbt
