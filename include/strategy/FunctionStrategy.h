#pragma once

#include "strategy/IStrategy.h"
#include <functional>
#include <utility>

namespace kitbt {
namespace strategy {

// Adapts a callable into an IStrategy, for tests and ad-hoc strategies.
class FunctionStrategy : public IStrategy {
public:
    using AnalyzeFn = std::function<std::vector<Signal>(const std::string& symbol,
                                                        const std::vector<Candle>& window)>;

    FunctionStrategy(std::string name, AnalyzeFn fn)
        : fn_(std::move(fn))
    {
        info_.name = std::move(name);
        info_.description = "function strategy";
    }

    StrategyInfo getInfo() const override { return info_; }

    std::vector<Signal> analyze(const std::string& symbol,
                                const std::vector<Candle>& window) override {
        if (!fn_) {
            return {};
        }
        return fn_(symbol, window);
    }

private:
    StrategyInfo info_;
    AnalyzeFn fn_;
};

} // namespace strategy
} // namespace kitbt
