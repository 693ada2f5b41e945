#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"

namespace quantsim {
namespace strategy {

// RSI leaving the oversold zone upward -> BUY,
// RSI leaving the overbought zone downward -> SELL.
class RsiThresholdStrategy : public IStrategy {
public:
    // Throws ValidationError unless 0 < oversold < overbought < 100 and period > 0
    explicit RsiThresholdStrategy(const RsiThresholdConfig& config = RsiThresholdConfig());

    StrategyInfo getInfo() const override;
    StrategyParams getParams() const override;
    ExitRules getExitRules() const override;
    std::vector<Signal> generateSignals(const BarSeries& bars) const override;

private:
    RsiThresholdConfig config_;
};

} // namespace strategy
} // namespace quantsim
