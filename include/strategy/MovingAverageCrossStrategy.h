#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"

namespace quantsim {
namespace strategy {

// Golden cross (fast SMA crosses above slow SMA) -> BUY,
// death cross (fast crosses below slow) -> SELL.
class MovingAverageCrossStrategy : public IStrategy {
public:
    // Throws ValidationError unless 0 < fast_period < slow_period
    explicit MovingAverageCrossStrategy(const MovingAverageCrossConfig& config = MovingAverageCrossConfig());

    StrategyInfo getInfo() const override;
    StrategyParams getParams() const override;
    ExitRules getExitRules() const override;
    std::vector<Signal> generateSignals(const BarSeries& bars) const override;

    const MovingAverageCrossConfig& config() const { return config_; }

private:
    MovingAverageCrossConfig config_;
};

} // namespace strategy
} // namespace quantsim
