#pragma once

#include "common/Types.h"
#include <string>
#include <vector>

namespace kitbt {
namespace strategy {

// Trading intent produced by a strategy for one step.
struct Signal {
    std::string symbol;
    OrderSide side;
    double amount;              // requested base amount, informational; sizing is the engine's
    double price;               // reference price (the close the strategy saw)
    std::string strategy;       // originating strategy name
    double confidence;          // 0.0 ~ 1.0
    TimestampMs timestamp;

    Signal()
        : side(OrderSide::BUY)
        , amount(0.0)
        , price(0.0)
        , confidence(0.0)
        , timestamp(0)
    {}
};

struct StrategyInfo {
    std::string name;
    std::string description;
    size_t min_candles;         // fewer candles in the window -> no signal

    StrategyInfo() : min_candles(0) {}
};

// Single-capability strategy interface. The engine calls analyze() once per
// step per strategy, in registration order, with a window ending at the
// current candle (oldest first).
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual StrategyInfo getInfo() const = 0;

    std::string getName() const { return getInfo().name; }

    virtual std::vector<Signal> analyze(const std::string& symbol,
                                        const std::vector<Candle>& window) = 0;
};

} // namespace strategy
} // namespace kitbt
