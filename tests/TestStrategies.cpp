#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "strategy/BreakoutStrategy.h"
#include "strategy/FunctionStrategy.h"
#include "strategy/MeanReversionStrategy.h"
#include "strategy/MomentumStrategy.h"
#include "strategy/StrategyFactory.h"
#include "strategy/TrendFollowerStrategy.h"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace kitbt;
using kitbt::analytics::TechnicalIndicators;
using namespace kitbt::strategy;

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

std::vector<Candle> fromCloses(const std::vector<double>& closes) {
    std::vector<Candle> candles;
    TimestampMs ts = 1700000000000LL;
    for (double c : closes) {
        candles.emplace_back(c, c + 1.0, c - 1.0, c, 100.0, ts);
        ts += MS_PER_HOUR;
    }
    return candles;
}
}

int main() {
    std::cout << "[TEST] Starting Strategies Test..." << std::endl;

    // Indicators
    {
        const std::vector<double> values = {2, 4, 4, 4, 5, 5, 7, 9};
        check(near(TechnicalIndicators::calculateMean(values), 5.0), "mean");
        check(near(TechnicalIndicators::calculateStdDev(values), 2.0), "population stddev");
        check(TechnicalIndicators::calculateStdDev({3.0}) == 0.0, "stddev of one value");
        check(near(TechnicalIndicators::calculateSMA(values, 2), 8.0), "sma of last two");
        check(TechnicalIndicators::calculateSMA(values, 20) == 0.0, "sma without enough data");

        check(TechnicalIndicators::calculateRSI(std::vector<double>(20, 100.0)) == 50.0, "rsi flat");
        check(TechnicalIndicators::calculateRSI({1.0, 2.0}) == 50.0, "rsi short series");
        std::vector<double> rising;
        for (int i = 0; i < 20; ++i) rising.push_back(100.0 + i);
        check(TechnicalIndicators::calculateRSI(rising) == 100.0, "rsi only gains");

        const auto bands = TechnicalIndicators::calculateBollingerBands(values, 5.0, 8, 2.0);
        check(near(bands.middle, 5.0) && near(bands.upper, 9.0) && near(bands.lower, 1.0), "bollinger");
        check(near(bands.percent_b, 0.5), "bollinger percent b");

        const auto candles = fromCloses({10, 20, 15});
        check(TechnicalIndicators::highestHigh(candles, 0, 2) == 21.0, "highest high");
        check(TechnicalIndicators::lowestLow(candles, 1, 3) == 14.0, "lowest low");
    }

    // TrendFollower: fast SMA crosses above slow on the last bar
    {
        TrendFollowerStrategy trend;
        check(trend.getName() == "TrendFollower", "trend name");
        check(trend.getInfo().min_candles == 21, "trend needs previous bar");

        std::vector<double> closes;
        for (int i = 0; i < 20; ++i) closes.push_back(100.0 - i * 0.5);
        closes.push_back(150.0);
        const auto up = trend.analyze("BTC/USDT", fromCloses(closes));
        check(up.size() == 1 && up[0].side == OrderSide::BUY, "trend: golden cross");
        if (up.size() == 1) {
            check(up[0].symbol == "BTC/USDT" && up[0].strategy == "TrendFollower", "trend: signal identity");
            check(near(up[0].confidence, 0.7) && up[0].price == 150.0, "trend: confidence and price");
        }

        // Already above: no new cross
        closes.push_back(151.0);
        check(trend.analyze("BTC/USDT", fromCloses(closes)).empty(), "trend: no repeat signal");

        std::vector<double> falling;
        for (int i = 0; i < 20; ++i) falling.push_back(100.0 + i * 0.5);
        falling.push_back(50.0);
        const auto down = trend.analyze("BTC/USDT", fromCloses(falling));
        check(down.size() == 1 && down[0].side == OrderSide::SELL, "trend: death cross");

        check(trend.analyze("BTC/USDT", fromCloses(std::vector<double>(20, 100.0))).empty(), "trend: short window");
    }

    // MeanReversion: close far below the lower band
    {
        MeanReversionStrategy reversion;
        std::vector<double> closes;
        for (int i = 0; i < 19; ++i) closes.push_back(i % 2 == 0 ? 100.0 : 101.0);
        closes.push_back(90.0);
        const auto signals = reversion.analyze("BTC/USDT", fromCloses(closes));
        check(signals.size() == 1 && signals[0].side == OrderSide::BUY, "reversion: below lower band");
        if (signals.size() == 1) {
            check(signals[0].confidence > 0.65 && signals[0].confidence <= 1.0, "reversion: confidence range");
        }

        closes.back() = 140.0;
        const auto extreme = reversion.analyze("BTC/USDT", fromCloses(closes));
        check(extreme.size() == 1 && extreme[0].side == OrderSide::SELL, "reversion: above upper band");
        check(extreme.size() == 1 && extreme[0].confidence <= 1.0, "reversion: confidence clamped");

        check(reversion.analyze("BTC/USDT", fromCloses(std::vector<double>(25, 100.0))).empty(),
              "reversion: flat market");
    }

    // Momentum: RSI extremes
    {
        MomentumStrategy momentum;
        std::vector<double> falling;
        std::vector<double> rising;
        for (int i = 0; i < 15; ++i) {
            falling.push_back(200.0 - i);
            rising.push_back(100.0 + i);
        }
        const auto buy = momentum.analyze("BTC/USDT", fromCloses(falling));
        check(buy.size() == 1 && buy[0].side == OrderSide::BUY, "momentum: oversold");
        check(buy.size() == 1 && near(buy[0].confidence, 0.9), "momentum: oversold confidence");

        const auto sell = momentum.analyze("BTC/USDT", fromCloses(rising));
        check(sell.size() == 1 && sell[0].side == OrderSide::SELL, "momentum: overbought");
        check(sell.size() == 1 && near(sell[0].confidence, 0.9), "momentum: overbought confidence");

        check(momentum.analyze("BTC/USDT", fromCloses(std::vector<double>(30, 100.0))).empty(),
              "momentum: neutral rsi");
        rising.pop_back();
        check(momentum.analyze("BTC/USDT", fromCloses(rising)).empty(), "momentum: short window");
    }

    // Breakout: close beyond the previous 20-candle range
    {
        BreakoutStrategy breakout;
        std::vector<Candle> candles = fromCloses(std::vector<double>(20, 100.0));
        candles.emplace_back(102.0, 103.5, 102.0, 103.0, 100.0, candles.back().timestamp + MS_PER_HOUR);
        const auto up = breakout.analyze("BTC/USDT", candles);
        check(up.size() == 1 && up[0].side == OrderSide::BUY, "breakout: above resistance");
        check(up.size() == 1 && near(up[0].confidence, 0.9), "breakout: confidence capped");

        candles.back() = Candle(99.0, 99.0, 98.0, 98.5, 100.0, candles.back().timestamp);
        const auto down = breakout.analyze("BTC/USDT", candles);
        check(down.size() == 1 && down[0].side == OrderSide::SELL, "breakout: below support");
        check(down.size() == 1 && near(down[0].confidence, 0.75), "breakout: confidence from range");

        candles.back() = Candle(100.0, 100.5, 99.5, 100.0, 100.0, candles.back().timestamp);
        check(breakout.analyze("BTC/USDT", candles).empty(), "breakout: inside range");
    }

    // FunctionStrategy
    {
        int calls = 0;
        FunctionStrategy fn("Custom", [&calls](const std::string& symbol, const std::vector<Candle>& window) {
            ++calls;
            Signal s;
            s.symbol = symbol;
            s.price = window.back().close;
            s.strategy = "Custom";
            s.confidence = 1.0;
            return std::vector<Signal>{s};
        });
        const auto signals = fn.analyze("SOL/USDT", fromCloses({5.0}));
        check(calls == 1 && signals.size() == 1 && signals[0].price == 5.0, "function strategy");
        check(fn.getName() == "Custom", "function strategy name");

        FunctionStrategy empty("Empty", FunctionStrategy::AnalyzeFn());
        check(empty.analyze("SOL/USDT", fromCloses({5.0})).empty(), "function strategy without callable");
    }

    // Factory
    {
        check(StrategyFactory::create("momentum")->getName() == "Momentum", "factory: case-insensitive");
        check(StrategyFactory::create("MeanReversion")->getName() == "MeanReversion", "factory: exact name");

        bool threw = false;
        try {
            StrategyFactory::create("martingale");
        } catch (const ConfigError&) {
            threw = true;
        }
        check(threw, "factory: unknown strategy");

        const auto all = StrategyFactory::createAll({"all", "Momentum"});
        check(all.size() == 4, "factory: all, deduplicated");
        if (all.size() == 4) {
            check(all[0]->getName() == "TrendFollower" && all[3]->getName() == "Breakout", "factory: order");
        }
        check(StrategyFactory::createAll({"breakout", "BREAKOUT"}).size() == 1, "factory: duplicate names");
    }

    if (g_failures > 0) {
        std::cerr << "[TEST] Strategies Test FAILED (" << g_failures << ")" << std::endl;
        return 1;
    }
    std::cout << "[TEST] Strategies Test PASSED!" << std::endl;
    return 0;
}
