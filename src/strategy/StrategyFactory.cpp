#include "strategy/StrategyFactory.h"
#include "strategy/TrendFollowerStrategy.h"
#include "strategy/MeanReversionStrategy.h"
#include "strategy/MomentumStrategy.h"
#include "strategy/BreakoutStrategy.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>

namespace kitbt {
namespace strategy {
namespace {
std::string toLowerCopy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}
}

std::vector<std::string> StrategyFactory::availableStrategies() {
    return {"TrendFollower", "MeanReversion", "Momentum", "Breakout"};
}

std::shared_ptr<IStrategy> StrategyFactory::create(const std::string& name) {
    const std::string key = toLowerCopy(name);
    if (key == "trendfollower") {
        return std::make_shared<TrendFollowerStrategy>();
    }
    if (key == "meanreversion") {
        return std::make_shared<MeanReversionStrategy>();
    }
    if (key == "momentum") {
        return std::make_shared<MomentumStrategy>();
    }
    if (key == "breakout") {
        return std::make_shared<BreakoutStrategy>();
    }
    throw ConfigError("unknown strategy '" + name + "'");
}

std::vector<std::shared_ptr<IStrategy>> StrategyFactory::createAll(const std::vector<std::string>& names) {
    std::vector<std::shared_ptr<IStrategy>> strategies;
    std::vector<std::string> seen;

    auto add = [&](const std::string& name) {
        auto strategy = create(name);
        const std::string key = toLowerCopy(strategy->getName());
        if (std::find(seen.begin(), seen.end(), key) != seen.end()) {
            return;
        }
        seen.push_back(key);
        strategies.push_back(strategy);
    };

    for (const auto& name : names) {
        if (toLowerCopy(name) == "all") {
            for (const auto& builtin : availableStrategies()) {
                add(builtin);
            }
        } else {
            add(name);
        }
    }

    LOG_INFO("Strategies selected: {}", strategies.size());
    return strategies;
}

} // namespace strategy
} // namespace kitbt
