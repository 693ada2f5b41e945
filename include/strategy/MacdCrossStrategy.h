#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"

namespace quantsim {
namespace strategy {

// MACD line crossing its signal line. Strength is |histogram| at the cross.
class MacdCrossStrategy : public IStrategy {
public:
    explicit MacdCrossStrategy(const MacdCrossConfig& config = MacdCrossConfig());

    StrategyInfo getInfo() const override;
    StrategyParams getParams() const override;
    ExitRules getExitRules() const override;
    std::vector<Signal> generateSignals(const BarSeries& bars) const override;

private:
    MacdCrossConfig config_;
};

} // namespace strategy
} // namespace quantsim
