#include "strategy/MovingAverageCrossStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"

#include <string>

namespace quantsim {
namespace strategy {

using analytics::TechnicalIndicators;

MovingAverageCrossStrategy::MovingAverageCrossStrategy(const MovingAverageCrossConfig& config)
    : config_(config) {
    if (config_.fast_period <= 0 || config_.slow_period <= 0) {
        throw ValidationError("moving average periods must be positive");
    }
    if (config_.fast_period >= config_.slow_period) {
        throw ValidationError("fast_period (" + std::to_string(config_.fast_period) +
                              ") must be less than slow_period (" +
                              std::to_string(config_.slow_period) + ")");
    }
    if (!(config_.stop_loss > 0.0) || config_.stop_loss > 1.0 || !(config_.take_profit > 0.0)) {
        throw ValidationError("stop_loss must be in (0, 1] and take_profit positive");
    }
}

StrategyInfo MovingAverageCrossStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "MA_Strategy";
    info.description = "Fast/slow simple moving average crossover";
    info.warmup_bars = config_.slow_period;
    return info;
}

StrategyParams MovingAverageCrossStrategy::getParams() const {
    return {
        {"fast_period", static_cast<double>(config_.fast_period)},
        {"slow_period", static_cast<double>(config_.slow_period)},
        {"stop_loss", config_.stop_loss},
        {"take_profit", config_.take_profit}
    };
}

ExitRules MovingAverageCrossStrategy::getExitRules() const {
    ExitRules rules;
    rules.stop_loss = config_.stop_loss;
    rules.take_profit = config_.take_profit;
    return rules;
}

std::vector<Signal> MovingAverageCrossStrategy::generateSignals(const BarSeries& bars) const {
    std::vector<Signal> signals;
    if (bars.empty()) {
        return signals;
    }

    const auto closes = TechnicalIndicators::extractClosePrices(bars);
    const auto fast = TechnicalIndicators::calculateSMASeries(closes, config_.fast_period);
    const auto slow = TechnicalIndicators::calculateSMASeries(closes, config_.slow_period);

    for (size_t i = 1; i < bars.size(); ++i) {
        if (!TechnicalIndicators::isValid(fast[i]) || !TechnicalIndicators::isValid(slow[i]) ||
            !TechnicalIndicators::isValid(fast[i - 1]) || !TechnicalIndicators::isValid(slow[i - 1])) {
            continue;
        }

        const bool golden_cross = fast[i] > slow[i] && fast[i - 1] <= slow[i - 1];
        const bool death_cross = fast[i] < slow[i] && fast[i - 1] >= slow[i - 1];
        if (!golden_cross && !death_cross) {
            continue;
        }

        Signal signal("", golden_cross ? SignalType::BUY : SignalType::SELL,
                      bars[i].close, bars[i].timestamp, 1.0);
        signal.metadata["ma_fast"] = fast[i];
        signal.metadata["ma_slow"] = slow[i];
        signal.metadata["reason"] = std::string(golden_cross ? "golden_cross" : "death_cross");
        signals.push_back(std::move(signal));
    }
    return signals;
}

} // namespace strategy
} // namespace quantsim
