#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "backtest/ReportWriter.h"
#include "strategy/StrategyFactory.h"

#include <algorithm>
#include <cctype>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace kitbt;

namespace {

volatile std::sig_atomic_t g_cancel_requested = 0;

// Ctrl+C finishes the current step and reports the partial result.
void signalHandler(int signal) {
    if (signal == SIGINT) {
        g_cancel_requested = 1;
    }
}

struct CliOptions {
    std::string file;
    bool synthetic = false;
    size_t synthetic_candles = 2000;
    unsigned int seed = 42;
    std::string config_path = "config/config.json";
    std::string symbol;
    std::string timeframe;
    std::vector<std::string> strategies;
    long long lookback = -1;
    long long start_ms = 0;
    long long end_ms = 0;
    std::string output;
    std::string format = "console";
    bool verbose = false;
    bool help = false;

    // Overrides, applied after the config file
    double capital = -1.0;
    double fee_pct = -1.0;
    double slippage_pct = -1.0;
    int max_positions = -1;
    double position_size = -1.0;
    std::string position_sizing;
    double stop_loss_pct = -1.0;
    double take_profit_pct = -1.0;
    bool no_shorts = false;
    double leverage = -1.0;
    std::string intrabar;
};

void printHelp() {
    std::cout <<
        "Usage: kitbt_backtest [options]\n"
        "\n"
        "Data:\n"
        "  --file <path>              Candle data (.csv or .json)\n"
        "  --synthetic                Generate random-walk data instead of loading a file\n"
        "  --candles <n>              Synthetic candle count (default: 2000)\n"
        "  --seed <n>                 Synthetic data seed (default: 42)\n"
        "  --symbol <symbol>          Trading pair (default: BTC/USDT)\n"
        "  --timeframe <tf>           Candle timeframe (default: 1h)\n"
        "  --start <ms> / --end <ms>  Restrict the replay to a time range\n"
        "\n"
        "Configuration:\n"
        "  --config <path>            JSON config file (default: config/config.json)\n"
        "  -c, --capital <amount>     Initial capital (default: 10000)\n"
        "  --fee <percent>            Fee per side in percent (default: 0.1)\n"
        "  --slippage <percent>       Slippage in percent (default: 0.05)\n"
        "  --max-positions <n>        Max concurrent positions (default: 5)\n"
        "  --position-size <n>        Size parameter for the sizing mode (default: 2)\n"
        "  --position-sizing <mode>   fixed | percent | kelly (default: percent)\n"
        "  --stop-loss <percent>      Stop-loss percent, 0 disables (default: 2)\n"
        "  --take-profit <percent>    Take-profit percent, 0 disables (default: 4)\n"
        "  --no-shorts                Disable short selling\n"
        "  --leverage <n>             Leverage multiplier (default: 1)\n"
        "  --intrabar <policy>        stop-first | target-first (default: stop-first)\n"
        "  --strategy <name|all>      TrendFollower, MeanReversion, Momentum, Breakout or all;\n"
        "                             repeat or comma-separate for several (default: all)\n"
        "  --lookback <n>             Strategy window length (default: 50)\n"
        "\n"
        "Output:\n"
        "  -o, --output <path>        Write the JSON report to a file\n"
        "  --format <fmt>             console | json (default: console)\n"
        "  -v, --verbose              Debug logging\n"
        "  -h, --help                 Show this help\n";
}

std::vector<std::string> splitCsv(const std::string& csv) {
    std::vector<std::string> tokens;
    size_t start = 0;
    while (start <= csv.size()) {
        const size_t comma = csv.find(',', start);
        std::string token = (comma == std::string::npos)
            ? csv.substr(start)
            : csv.substr(start, comma - start);
        token.erase(std::remove_if(token.begin(), token.end(),
                                   [](unsigned char c) { return std::isspace(c); }),
                    token.end());
        if (!token.empty()) {
            tokens.push_back(token);
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return tokens;
}

double parseDouble(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        const double parsed = std::stod(value, &used);
        if (used == value.size()) {
            return parsed;
        }
    } catch (const std::exception&) {
    }
    throw ConfigError("invalid value for " + flag + ": '" + value + "'");
}

long long parseInteger(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        const long long parsed = std::stoll(value, &used);
        if (used == value.size()) {
            return parsed;
        }
    } catch (const std::exception&) {
    }
    throw ConfigError("invalid value for " + flag + ": '" + value + "'");
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError("missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--file") {
            opts.file = next();
        } else if (arg == "--synthetic") {
            opts.synthetic = true;
        } else if (arg == "--candles") {
            const long long n = parseInteger(arg, next());
            if (n <= 0) throw ConfigError("--candles must be positive");
            opts.synthetic_candles = static_cast<size_t>(n);
        } else if (arg == "--seed") {
            opts.seed = static_cast<unsigned int>(parseInteger(arg, next()));
        } else if (arg == "--symbol") {
            opts.symbol = next();
        } else if (arg == "--timeframe") {
            opts.timeframe = next();
        } else if (arg == "--start") {
            opts.start_ms = parseInteger(arg, next());
        } else if (arg == "--end") {
            opts.end_ms = parseInteger(arg, next());
        } else if (arg == "--config") {
            opts.config_path = next();
        } else if (arg == "-c" || arg == "--capital") {
            opts.capital = parseDouble(arg, next());
        } else if (arg == "--fee") {
            opts.fee_pct = parseDouble(arg, next());
        } else if (arg == "--slippage") {
            opts.slippage_pct = parseDouble(arg, next());
        } else if (arg == "--max-positions") {
            opts.max_positions = static_cast<int>(parseInteger(arg, next()));
        } else if (arg == "--position-size") {
            opts.position_size = parseDouble(arg, next());
        } else if (arg == "--position-sizing") {
            opts.position_sizing = next();
        } else if (arg == "--stop-loss") {
            opts.stop_loss_pct = parseDouble(arg, next());
        } else if (arg == "--take-profit") {
            opts.take_profit_pct = parseDouble(arg, next());
        } else if (arg == "--no-shorts") {
            opts.no_shorts = true;
        } else if (arg == "--leverage") {
            opts.leverage = parseDouble(arg, next());
        } else if (arg == "--intrabar") {
            opts.intrabar = next();
        } else if (arg == "--strategy" || arg == "--strategies") {
            for (const auto& name : splitCsv(next())) {
                opts.strategies.push_back(name);
            }
        } else if (arg == "--lookback") {
            opts.lookback = parseInteger(arg, next());
            if (opts.lookback < 0) throw ConfigError("--lookback must not be negative");
        } else if (arg == "-o" || arg == "--output") {
            opts.output = next();
        } else if (arg == "--format") {
            opts.format = next();
            if (opts.format != "console" && opts.format != "json") {
                throw ConfigError("--format must be console or json");
            }
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else {
            throw ConfigError("unknown option: " + arg);
        }
    }

    return opts;
}

// CLI flags win over the config file. Percent flags map onto rates.
void applyOverrides(const CliOptions& opts, Config& config) {
    auto& c = config.mutableBacktestConfig();

    if (opts.capital >= 0.0) c.initial_capital = opts.capital;
    if (opts.fee_pct >= 0.0) c.fee_rate = opts.fee_pct / 100.0;
    if (opts.slippage_pct >= 0.0) c.slippage_rate = opts.slippage_pct / 100.0;
    if (opts.max_positions >= 0) c.max_positions = opts.max_positions;
    if (!opts.position_sizing.empty()) c.position_sizing = backtest::parsePositionSizing(opts.position_sizing);
    if (opts.position_size >= 0.0) c.position_size = opts.position_size;
    if (opts.stop_loss_pct >= 0.0) {
        c.use_stop_loss = opts.stop_loss_pct > 0.0;
        c.stop_loss_percent = opts.stop_loss_pct;
    }
    if (opts.take_profit_pct >= 0.0) {
        c.use_take_profit = opts.take_profit_pct > 0.0;
        c.take_profit_percent = opts.take_profit_pct;
    }
    if (opts.no_shorts) c.allow_shorts = false;
    if (opts.leverage >= 0.0) c.leverage = opts.leverage;
    if (!opts.intrabar.empty()) c.intrabar_policy = backtest::parseIntrabarPolicy(opts.intrabar);

    if (!opts.symbol.empty()) config.setSymbol(opts.symbol);
    if (!opts.timeframe.empty()) config.setTimeframe(opts.timeframe);
    if (opts.lookback >= 0) config.setLookback(static_cast<size_t>(opts.lookback));
    if (!opts.strategies.empty()) config.setEnabledStrategies(opts.strategies);

    c.validate();
}

backtest::HistoricalData loadData(const CliOptions& opts, const Config& config) {
    backtest::HistoricalData data;
    if (!opts.file.empty()) {
        data = backtest::DataHistory::loadFile(opts.file, config.getSymbol(), config.getTimeframe());
    } else {
        backtest::SyntheticDataSpec spec;
        spec.symbol = config.getSymbol();
        spec.timeframe = config.getTimeframe();
        spec.candle_count = opts.synthetic_candles;
        spec.seed = opts.seed;
        // Anchored so that the same flags always give the same series
        spec.start_time = opts.start_ms > 0 ? opts.start_ms : 1704067200000LL;
        data = backtest::DataHistory::generateSynthetic(spec);
    }

    if (opts.start_ms > 0 || opts.end_ms > 0) {
        data.candles = backtest::DataHistory::filterByDate(data.candles, opts.start_ms, opts.end_ms);
        LOG_INFO("Date filter applied: {} candles remain", data.candles.size());
    }
    return data;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n\n";
        printHelp();
        return 1;
    }

    if (opts.help) {
        printHelp();
        return 0;
    }
    if (opts.file.empty() && !opts.synthetic) {
        std::cerr << "Either --file <path> or --synthetic is required.\n\n";
        printHelp();
        return 1;
    }

    const bool json_to_stdout = opts.format == "json" && opts.output.empty();

    try {
        auto& config = Config::getInstance();
        config.load(opts.config_path);
        applyOverrides(opts, config);

        Logger::getInstance().initialize(config.getLogDir(), config.getLogToFile());
        if (opts.verbose) {
            Logger::getInstance().setLevel("debug");
        } else if (json_to_stdout) {
            // stdout carries the report
            Logger::getInstance().setLevel("error");
        } else {
            Logger::getInstance().setLevel(config.getLogLevel());
        }

        auto data = loadData(opts, config);

        backtest::BacktestEngine engine(config.getBacktestConfig());
        engine.setRiskFreeRate(config.getRiskFreeRate());

        auto names = config.getEnabledStrategies();
        if (names.empty()) {
            names.push_back("all");
        }
        for (const auto& strategy : strategy::StrategyFactory::createAll(names)) {
            engine.addStrategy(strategy);
        }

        std::signal(SIGINT, signalHandler);

        backtest::RunHooks hooks;
        hooks.progress_interval = config.getProgressInterval();
        hooks.should_cancel = []() { return g_cancel_requested != 0; };
        if (!json_to_stdout) {
            hooks.progress_listeners.push_back([](const backtest::ProgressEvent& event) {
                std::cerr << "\rProgress: " << std::fixed << std::setprecision(0)
                          << event.percent << "%" << std::flush;
                if (event.index + 1 == event.total) {
                    std::cerr << "\n";
                }
            });
        }

        const auto result = engine.run(data, config.getLookback(), hooks);

        if (!opts.output.empty()) {
            backtest::ReportWriter::writeJson(result, opts.output);
        }
        if (json_to_stdout) {
            std::cout << backtest::ReportWriter::toJson(result).dump(2) << "\n";
        } else {
            backtest::ReportWriter::printSummary(result, std::cout);
        }
        return 0;
    } catch (const DataError& e) {
        std::cerr << e.what() << "\n";
        LOG_ERROR("{}", e.what());
        return 1;
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        LOG_ERROR("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        LOG_ERROR("Fatal error: {}", e.what());
        return 1;
    }
}
