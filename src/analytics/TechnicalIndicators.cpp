#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <limits>
#include <numeric>

namespace kitbt {
namespace analytics {

double TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return 50.0;
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;

    // Seed with the plain average of the first `period` changes
    for (int i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i - 1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }

    avg_gain /= period;
    avg_loss /= period;

    // Wilder's smoothing through the rest of the series
    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i - 1];
        double current_gain = (change > 0) ? change : 0.0;
        double current_loss = (change < 0) ? std::abs(change) : 0.0;

        avg_gain = ((avg_gain * (period - 1)) + current_gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + current_loss) / period;
    }

    if (avg_loss < 0.0000001) {
        return avg_gain < 0.0000001 ? 50.0 : 100.0;
    }

    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

TechnicalIndicators::BollingerBands TechnicalIndicators::calculateBollingerBands(
    const std::vector<double>& prices,
    double current_price,
    int period,
    double std_dev_mult
) {
    BollingerBands result;

    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return result;
    }

    std::vector<double> recent_prices(prices.end() - period, prices.end());

    result.middle = calculateMean(recent_prices);
    result.std_dev = calculateStdDev(recent_prices);

    result.upper = result.middle + (result.std_dev * std_dev_mult);
    result.lower = result.middle - (result.std_dev * std_dev_mult);
    result.width = result.upper - result.lower;

    if (result.width > 0.0001) {
        result.percent_b = (current_price - result.lower) / result.width;
    } else {
        result.percent_b = 0.5;
    }

    return result;
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return 0.0;

    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }

    return sum / period;
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double TechnicalIndicators::calculateStdDev(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;

    const double mean = calculateMean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mean) * (v - mean);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

double TechnicalIndicators::highestHigh(const std::vector<Candle>& candles, size_t begin, size_t end) {
    end = std::min(end, candles.size());
    double result = -std::numeric_limits<double>::infinity();
    for (size_t i = begin; i < end; ++i) {
        result = std::max(result, candles[i].high);
    }
    return result;
}

double TechnicalIndicators::lowestLow(const std::vector<Candle>& candles, size_t begin, size_t end) {
    end = std::min(end, candles.size());
    double result = std::numeric_limits<double>::infinity();
    for (size_t i = begin; i < end; ++i) {
        result = std::min(result, candles[i].low);
    }
    return result;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());

    for (const auto& candle : candles) {
        prices.push_back(candle.close);
    }

    return prices;
}

} // namespace analytics
} // namespace kitbt
