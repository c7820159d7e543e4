#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "common/Types.h"

namespace kitbt {
namespace backtest {

struct HistoricalData {
    std::string symbol;
    std::string exchange;
    std::string timeframe;
    std::vector<Candle> candles;    // ascending by timestamp

    TimestampMs startTime() const { return candles.empty() ? 0 : candles.front().timestamp; }
    TimestampMs endTime() const { return candles.empty() ? 0 : candles.back().timestamp; }
};

struct SyntheticDataSpec {
    std::string symbol = "BTC/USDT";
    std::string timeframe = "1h";
    TimestampMs start_time = 0;
    size_t candle_count = 2000;
    double start_price = 50000.0;
    double volatility_pct = 2.0;    // max per-candle move, percent
    double trend_pct = 0.01;        // drift per candle, percent
    std::uint32_t seed = 42;
};

// Loads, orders and validates candle data before it reaches the engine.
// Every failure is reported as DataError.
class DataHistory {
public:
    // CSV with an optional header row. With a header, columns are matched by
    // name (timestamp/time/date, open, high, low, close, volume); otherwise
    // the order is timestamp,open,high,low,close,volume.
    static HistoricalData loadCSV(const std::string& file_path,
                                  const std::string& symbol,
                                  const std::string& timeframe);

    // JSON array of candles, or an object with "candles" and optional
    // "symbol"/"exchange"/"timeframe". Keys may be long (open) or short (o).
    static HistoricalData loadJSON(const std::string& file_path,
                                   const std::string& symbol,
                                   const std::string& timeframe);

    // Picks loadCSV or loadJSON by extension.
    static HistoricalData loadFile(const std::string& file_path,
                                   const std::string& symbol,
                                   const std::string& timeframe);

    // Deterministic random walk; identical parameters give identical candles.
    static HistoricalData generateSynthetic(const SyntheticDataSpec& spec);

    // Inclusive range; a bound of 0 is open.
    static std::vector<Candle> filterByDate(const std::vector<Candle>& candles,
                                            TimestampMs start_ms,
                                            TimestampMs end_ms);

    // Finite prices, low <= open/close <= high, non-negative volume, strictly
    // increasing timestamps.
    static void validate(const std::vector<Candle>& candles);

    // "1m", "15m", "1h", "4h", "1d", "1w"
    static TimestampMs timeframeToMs(const std::string& timeframe);

    // Second-resolution epochs are promoted to milliseconds.
    static TimestampMs toMsTimestamp(long long ts);
};

} // namespace backtest
} // namespace kitbt
