#pragma once

#include <vector>
#include "common/Types.h"

namespace kitbt {
namespace analytics {

// Indicators used by the built-in strategies. Inputs are ordered oldest first.
class TechnicalIndicators {
public:
    // RSI with Wilder's smoothing. 50 when there is not enough data.
    // Above 70: overbought, below 30: oversold
    static double calculateRSI(const std::vector<double>& prices, int period = 14);

    struct BollingerBands {
        double upper;
        double middle;      // SMA
        double lower;
        double std_dev;
        double width;
        double percent_b;   // where the price sits inside the band, 0..1

        BollingerBands() : upper(0), middle(0), lower(0), std_dev(0), width(0), percent_b(0) {}
    };
    static BollingerBands calculateBollingerBands(const std::vector<double>& prices,
                                                  double current_price,
                                                  int period = 20,
                                                  double std_dev_mult = 2.0);

    // SMA of the last `period` values; 0 when there are fewer.
    static double calculateSMA(const std::vector<double>& prices, int period);

    // Population standard deviation; 0 for fewer than two values.
    static double calculateStdDev(const std::vector<double>& values);

    static double calculateMean(const std::vector<double>& values);

    // Highest high / lowest low over candles[begin, end).
    static double highestHigh(const std::vector<Candle>& candles, size_t begin, size_t end);
    static double lowestLow(const std::vector<Candle>& candles, size_t begin, size_t end);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);
};

} // namespace analytics
} // namespace kitbt
