#pragma once

#include "strategy/IStrategy.h"
#include <memory>
#include <string>
#include <vector>

namespace kitbt {
namespace strategy {

class StrategyFactory {
public:
    // Built-in strategy by name (case-insensitive). Throws ConfigError for
    // unknown names.
    static std::shared_ptr<IStrategy> create(const std::string& name);

    // "all" expands to every built-in strategy, in availableStrategies() order.
    static std::vector<std::shared_ptr<IStrategy>> createAll(const std::vector<std::string>& names);

    static std::vector<std::string> availableStrategies();
};

} // namespace strategy
} // namespace kitbt
