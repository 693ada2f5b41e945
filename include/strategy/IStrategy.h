#pragma once

#include "common/Types.h"
#include "strategy/Signal.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quantsim {
namespace strategy {

// Read-only parameter bag exposed by every strategy
using StrategyParams = std::map<std::string, double>;

// 전략 기본 정보
struct StrategyInfo {
    std::string name;
    std::string description;
    std::string timeframe;      // bar granularity the strategy expects (1d)
    int warmup_bars;            // bars consumed before the first possible signal

    StrategyInfo()
        : timeframe("1d")
        , warmup_bars(0)
    {}
};

// 보호 청산 기준 (fractions of average cost). An unset ratio disables that exit.
struct ExitRules {
    std::optional<double> stop_loss;
    std::optional<double> take_profit;
};

// 전략 인터페이스 (모든 전략이 구현해야 함)
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual StrategyInfo getInfo() const = 0;

    virtual std::string getName() const { return getInfo().name; }

    virtual StrategyParams getParams() const = 0;

    virtual ExitRules getExitRules() const { return ExitRules(); }

    // Map a full, ascending bar series to an ordered signal list.
    // Symbols are left empty; the caller stamps them.
    virtual std::vector<Signal> generateSignals(const BarSeries& bars) const = 0;

    std::vector<Signal> generateSignalsForSymbol(const std::string& symbol, const BarSeries& bars) const {
        auto signals = generateSignals(bars);
        for (auto& signal : signals) {
            signal.symbol = symbol;
        }
        return signals;
    }
};

} // namespace strategy
} // namespace quantsim
