#include "backtest/DataHistory.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <map>
#include <random>
#include <sstream>
#include <nlohmann/json.hpp>

namespace kitbt {
namespace backtest {

namespace {
std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

std::vector<std::string> splitRow(const std::string& line) {
    std::vector<std::string> row;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        row.push_back(normalizeCell(cell));
    }
    return row;
}

bool looksNumeric(const std::string& cell) {
    if (cell.empty()) return false;
    const unsigned char c = static_cast<unsigned char>(cell[0]);
    return std::isdigit(c) || c == '-' || c == '+' || c == '.';
}

double parseNumber(const std::string& cell, const std::string& file_path, size_t line_no) {
    try {
        size_t used = 0;
        const double value = std::stod(cell, &used);
        if (used != cell.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::exception&) {
        throw DataError(file_path + ":" + std::to_string(line_no) + ": not a number: '" + cell + "'");
    }
}

// Map of field -> column index, resolved from a header row.
std::map<std::string, size_t> resolveColumns(const std::vector<std::string>& header) {
    static const std::map<std::string, std::string> aliases = {
        {"timestamp", "timestamp"}, {"time", "timestamp"}, {"date", "timestamp"}, {"t", "timestamp"},
        {"open", "open"}, {"o", "open"},
        {"high", "high"}, {"h", "high"},
        {"low", "low"}, {"l", "low"},
        {"close", "close"}, {"c", "close"},
        {"volume", "volume"}, {"v", "volume"}, {"vol", "volume"}
    };

    std::map<std::string, size_t> columns;
    for (size_t i = 0; i < header.size(); ++i) {
        auto it = aliases.find(toLowerCopy(header[i]));
        if (it != aliases.end() && columns.count(it->second) == 0) {
            columns[it->second] = i;
        }
    }
    return columns;
}

void sortAscending(std::vector<Candle>& candles) {
    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });
}

double readField(const nlohmann::json& item, const char* long_key, const char* short_key,
                 bool required, size_t index) {
    const nlohmann::json* value = nullptr;
    if (item.contains(long_key)) {
        value = &item[long_key];
    } else if (item.contains(short_key)) {
        value = &item[short_key];
    }

    if (value == nullptr || value->is_null()) {
        if (!required) {
            return 0.0;
        }
        throw DataError("candle #" + std::to_string(index) + " is missing '" + long_key + "'");
    }
    if (!value->is_number()) {
        throw DataError("candle #" + std::to_string(index) + " field '" + long_key + "' is not numeric");
    }
    return value->get<double>();
}
}

TimestampMs DataHistory::toMsTimestamp(long long ts) {
    // Anything below ~Mar 1973 in ms is treated as seconds.
    if (ts > 0 && ts < 100000000000LL) {
        return ts * 1000LL;
    }
    return ts;
}

TimestampMs DataHistory::timeframeToMs(const std::string& timeframe) {
    if (timeframe.size() < 2) {
        throw DataError("invalid timeframe: '" + timeframe + "'");
    }
    const char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(timeframe.back())));
    long long count = 0;
    try {
        size_t used = 0;
        count = std::stoll(timeframe.substr(0, timeframe.size() - 1), &used);
        if (used != timeframe.size() - 1) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception&) {
        throw DataError("invalid timeframe: '" + timeframe + "'");
    }
    if (count <= 0) {
        throw DataError("invalid timeframe: '" + timeframe + "'");
    }

    switch (unit) {
        case 'm': return count * 60LL * 1000LL;
        case 'h': return count * MS_PER_HOUR;
        case 'd': return count * MS_PER_DAY;
        case 'w': return count * 7LL * MS_PER_DAY;
        default: break;
    }
    throw DataError("invalid timeframe: '" + timeframe + "'");
}

void DataHistory::validate(const std::vector<Candle>& candles) {
    if (candles.empty()) {
        throw DataError("no candles");
    }

    for (size_t i = 0; i < candles.size(); ++i) {
        const Candle& c = candles[i];
        if (!std::isfinite(c.open) || !std::isfinite(c.high) || !std::isfinite(c.low) ||
            !std::isfinite(c.close) || !std::isfinite(c.volume)) {
            throw DataError("candle #" + std::to_string(i) + " has a non-finite value");
        }
        if (c.low <= 0.0 || c.high < c.low) {
            throw DataError("candle #" + std::to_string(i) + " has an invalid high/low range");
        }
        if (c.open < c.low || c.open > c.high || c.close < c.low || c.close > c.high) {
            throw DataError("candle #" + std::to_string(i) + " has open/close outside high/low");
        }
        if (c.volume < 0.0) {
            throw DataError("candle #" + std::to_string(i) + " has negative volume");
        }
        if (i > 0 && c.timestamp <= candles[i - 1].timestamp) {
            throw DataError("candle #" + std::to_string(i) + " is out of order (timestamp " +
                            std::to_string(c.timestamp) + " <= " +
                            std::to_string(candles[i - 1].timestamp) + ")");
        }
    }
}

HistoricalData DataHistory::loadCSV(const std::string& file_path,
                                    const std::string& symbol,
                                    const std::string& timeframe) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw DataError("failed to open CSV file: " + file_path);
    }

    HistoricalData data;
    data.symbol = symbol.empty() ? std::filesystem::path(file_path).stem().string() : symbol;
    data.exchange = "file";
    data.timeframe = timeframe;

    std::map<std::string, size_t> columns = {
        {"timestamp", 0}, {"open", 1}, {"high", 2}, {"low", 3}, {"close", 4}, {"volume", 5}
    };

    std::string line;
    size_t line_no = 0;
    bool first_row = true;
    while (std::getline(file, line)) {
        ++line_no;
        if (trim(line).empty()) continue;

        const auto row = splitRow(line);
        if (first_row) {
            first_row = false;
            if (!row.empty() && !looksNumeric(row[0])) {
                columns = resolveColumns(row);
                for (const char* required : {"timestamp", "open", "high", "low", "close"}) {
                    if (columns.count(required) == 0) {
                        throw DataError(file_path + ": header is missing column '" + required + "'");
                    }
                }
                continue;
            }
        }

        auto cell = [&](const char* field) -> const std::string* {
            auto it = columns.find(field);
            if (it == columns.end() || it->second >= row.size()) {
                return nullptr;
            }
            return &row[it->second];
        };

        for (const char* required : {"timestamp", "open", "high", "low", "close"}) {
            const std::string* value = cell(required);
            if (value == nullptr || value->empty()) {
                throw DataError(file_path + ":" + std::to_string(line_no) + ": missing '" + required + "'");
            }
        }

        Candle candle;
        candle.timestamp = toMsTimestamp(static_cast<long long>(
            parseNumber(*cell("timestamp"), file_path, line_no)));
        candle.open = parseNumber(*cell("open"), file_path, line_no);
        candle.high = parseNumber(*cell("high"), file_path, line_no);
        candle.low = parseNumber(*cell("low"), file_path, line_no);
        candle.close = parseNumber(*cell("close"), file_path, line_no);
        const std::string* volume = cell("volume");
        candle.volume = (volume != nullptr && !volume->empty())
            ? parseNumber(*volume, file_path, line_no)
            : 0.0;
        data.candles.push_back(candle);
    }

    sortAscending(data.candles);
    validate(data.candles);

    LOG_INFO("Loaded {} candles from {}", data.candles.size(), file_path);
    return data;
}

HistoricalData DataHistory::loadJSON(const std::string& file_path,
                                     const std::string& symbol,
                                     const std::string& timeframe) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw DataError("failed to open JSON file: " + file_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw DataError("error parsing JSON file " + file_path + ": " + e.what());
    }

    HistoricalData data;
    data.symbol = symbol;
    data.exchange = "file";
    data.timeframe = timeframe;

    const nlohmann::json* items = nullptr;
    if (j.is_array()) {
        items = &j;
    } else if (j.is_object() && j.contains("candles") && j["candles"].is_array()) {
        items = &j["candles"];
        if (data.symbol.empty() && j.contains("symbol") && j["symbol"].is_string()) {
            data.symbol = j["symbol"].get<std::string>();
        }
        if (j.contains("exchange") && j["exchange"].is_string()) {
            data.exchange = j["exchange"].get<std::string>();
        }
        if (j.contains("timeframe") && j["timeframe"].is_string()) {
            data.timeframe = j["timeframe"].get<std::string>();
        }
    } else {
        throw DataError("unrecognized JSON candle format: " + file_path);
    }
    if (data.symbol.empty()) {
        data.symbol = std::filesystem::path(file_path).stem().string();
    }

    size_t index = 0;
    for (const auto& item : *items) {
        Candle candle;
        if (item.is_array()) {
            // [timestamp, open, high, low, close, volume]
            if (item.size() < 5) {
                throw DataError("candle #" + std::to_string(index) + " has fewer than 5 values");
            }
            for (size_t k = 0; k < std::min<size_t>(item.size(), 6); ++k) {
                if (!item[k].is_number()) {
                    throw DataError("candle #" + std::to_string(index) + " has a non-numeric value");
                }
            }
            candle.timestamp = toMsTimestamp(item[0].get<long long>());
            candle.open = item[1].get<double>();
            candle.high = item[2].get<double>();
            candle.low = item[3].get<double>();
            candle.close = item[4].get<double>();
            candle.volume = item.size() > 5 ? item[5].get<double>() : 0.0;
        } else if (item.is_object()) {
            candle.timestamp = toMsTimestamp(
                static_cast<long long>(readField(item, "timestamp", "t", true, index)));
            candle.open = readField(item, "open", "o", true, index);
            candle.high = readField(item, "high", "h", true, index);
            candle.low = readField(item, "low", "l", true, index);
            candle.close = readField(item, "close", "c", true, index);
            candle.volume = readField(item, "volume", "v", false, index);
        } else {
            throw DataError("candle #" + std::to_string(index) + " is neither an object nor an array");
        }
        data.candles.push_back(candle);
        ++index;
    }

    sortAscending(data.candles);
    validate(data.candles);

    LOG_INFO("Loaded {} candles from {}", data.candles.size(), file_path);
    return data;
}

HistoricalData DataHistory::loadFile(const std::string& file_path,
                                     const std::string& symbol,
                                     const std::string& timeframe) {
    const std::string ext = toLowerCopy(std::filesystem::path(file_path).extension().string());
    if (ext == ".json") {
        return loadJSON(file_path, symbol, timeframe);
    }
    if (ext == ".csv") {
        return loadCSV(file_path, symbol, timeframe);
    }
    throw DataError("unsupported file format '" + ext + "' (use .csv or .json)");
}

HistoricalData DataHistory::generateSynthetic(const SyntheticDataSpec& spec) {
    const TimestampMs interval_ms = timeframeToMs(spec.timeframe);

    HistoricalData data;
    data.symbol = spec.symbol;
    data.exchange = "synthetic";
    data.timeframe = spec.timeframe;
    data.candles.reserve(spec.candle_count);

    std::mt19937 rng(spec.seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    double price = spec.start_price;
    TimestampMs timestamp = spec.start_time;
    for (size_t i = 0; i < spec.candle_count; ++i) {
        const double change_pct = (unit(rng) - 0.5) * 2.0 * spec.volatility_pct + spec.trend_pct;
        const double open = price;
        const double close = std::max(0.01, open * (1.0 + change_pct / 100.0));

        const double range = std::abs(close - open) + unit(rng) * spec.volatility_pct / 100.0 * open;
        const double high = std::max(open, close) + range * unit(rng);
        const double low = std::max(0.01, std::min(open, close) - range * unit(rng));
        const double volume = unit(rng) * 1000000.0 + 100000.0;

        data.candles.emplace_back(open, high, low, close, volume, timestamp);

        price = close;
        timestamp += interval_ms;
    }

    LOG_INFO("Generated {} synthetic candles for {} (seed {})",
             data.candles.size(), spec.symbol, spec.seed);
    return data;
}

std::vector<Candle> DataHistory::filterByDate(const std::vector<Candle>& candles,
                                              TimestampMs start_ms,
                                              TimestampMs end_ms) {
    std::vector<Candle> filtered;
    filtered.reserve(candles.size());
    for (const auto& candle : candles) {
        if (start_ms > 0 && candle.timestamp < start_ms) continue;
        if (end_ms > 0 && candle.timestamp > end_ms) continue;
        filtered.push_back(candle);
    }
    return filtered;
}

} // namespace backtest
} // namespace kitbt
