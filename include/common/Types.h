#pragma once

#include <string>

namespace kitbt {

using Price = double;
using Volume = double;
using Amount = double;

// Milliseconds since the Unix epoch.
using TimestampMs = long long;

constexpr TimestampMs MS_PER_HOUR = 60LL * 60LL * 1000LL;
constexpr TimestampMs MS_PER_DAY = 24LL * MS_PER_HOUR;

enum class OrderSide { BUY, SELL };
enum class PositionSide { LONG, SHORT };

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    TimestampMs timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, TimestampMs t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

inline const char* orderSideToString(OrderSide side) {
    return side == OrderSide::BUY ? "buy" : "sell";
}

inline const char* positionSideToString(PositionSide side) {
    return side == PositionSide::LONG ? "long" : "short";
}

inline PositionSide positionSideFor(OrderSide side) {
    return side == OrderSide::BUY ? PositionSide::LONG : PositionSide::SHORT;
}

} // namespace kitbt
