#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace kitbt {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeStrategyName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return trimCopy(name);
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    backtest_config_ = backtest::BacktestConfig{};
    symbol_ = "BTC/USDT";
    timeframe_ = "1h";
    lookback_ = 50;
    progress_interval_ = 1000;
    risk_free_rate_ = 0.02;
    enabled_strategies_.clear();
    log_level_ = "info";
    log_dir_ = "logs";
    log_to_file_ = true;
}

bool Config::load(const std::string& path) {
    const std::filesystem::path config_path = utils::PathUtils::resolveRelativePath(path);

    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("Config file not found: {} (using defaults)", config_path.string());
        return false;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("cannot parse " + config_path.string() + ": " + e.what());
    }

    apply(j);
    LOG_INFO("Config loaded: {} (capital={:.2f}, fee={:.4f}, sizing={})",
             config_path.string(), backtest_config_.initial_capital, backtest_config_.fee_rate,
             backtest::positionSizingToString(backtest_config_.position_sizing));
    return true;
}

void Config::apply(const nlohmann::json& j) {
    try {
        if (j.contains("backtest")) {
            const auto& b = j["backtest"];
            auto& c = backtest_config_;

            c.initial_capital = b.value("initial_capital", c.initial_capital);
            c.fee_rate = b.value("fee_rate", c.fee_rate);
            c.slippage_rate = b.value("slippage_rate", c.slippage_rate);
            c.max_positions = b.value("max_positions", c.max_positions);
            if (b.contains("position_sizing")) {
                c.position_sizing = backtest::parsePositionSizing(b["position_sizing"].get<std::string>());
            }
            c.position_size = b.value("position_size", c.position_size);
            c.use_stop_loss = b.value("use_stop_loss", c.use_stop_loss);
            c.stop_loss_percent = b.value("stop_loss_percent", c.stop_loss_percent);
            c.use_take_profit = b.value("use_take_profit", c.use_take_profit);
            c.take_profit_percent = b.value("take_profit_percent", c.take_profit_percent);
            c.allow_shorts = b.value("allow_shorts", c.allow_shorts);
            c.leverage = b.value("leverage", c.leverage);
            if (b.contains("intrabar_policy")) {
                c.intrabar_policy = backtest::parseIntrabarPolicy(b["intrabar_policy"].get<std::string>());
            }
            c.min_confidence = b.value("min_confidence", c.min_confidence);

            lookback_ = b.value("lookback", lookback_);
            progress_interval_ = b.value("progress_interval", progress_interval_);
            risk_free_rate_ = b.value("risk_free_rate", risk_free_rate_);

            if (b.contains("strategies")) {
                enabled_strategies_ = b["strategies"].get<std::vector<std::string>>();
                for (auto& name : enabled_strategies_) {
                    name = normalizeStrategyName(name);
                }
            }
        }

        if (j.contains("data")) {
            const auto& d = j["data"];
            symbol_ = d.value("symbol", symbol_);
            timeframe_ = d.value("timeframe", timeframe_);
        }

        if (j.contains("logging")) {
            const auto& l = j["logging"];
            log_level_ = l.value("level", log_level_);
            log_dir_ = l.value("dir", log_dir_);
            log_to_file_ = l.value("file", log_to_file_);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }

    backtest_config_.validate();
}

} // namespace kitbt
