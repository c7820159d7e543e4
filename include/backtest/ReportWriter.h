#pragma once

#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "backtest/BacktestResult.h"

namespace kitbt {
namespace backtest {

// Renders a BacktestResult. Non-finite numbers are written as the strings
// "Infinity" / "-Infinity" / "NaN" so the document stays valid JSON.
class ReportWriter {
public:
    static nlohmann::json toJson(const BacktestResult& result);
    static nlohmann::json metricsToJson(const PerformanceMetrics& metrics);

    // Throws std::runtime_error when the file cannot be written.
    static void writeJson(const BacktestResult& result, const std::string& path);

    static void printSummary(const BacktestResult& result, std::ostream& out);
};

} // namespace backtest
} // namespace kitbt
