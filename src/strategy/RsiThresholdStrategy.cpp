#include "strategy/RsiThresholdStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"

#include <string>

namespace quantsim {
namespace strategy {

using analytics::TechnicalIndicators;

RsiThresholdStrategy::RsiThresholdStrategy(const RsiThresholdConfig& config)
    : config_(config) {
    if (config_.period <= 0) {
        throw ValidationError("RSI period must be positive");
    }
    if (config_.oversold <= 0.0 || config_.overbought >= 100.0) {
        throw ValidationError("RSI thresholds must lie inside (0, 100)");
    }
    if (config_.oversold >= config_.overbought) {
        throw ValidationError("oversold threshold must be less than overbought threshold");
    }
    if (!(config_.stop_loss > 0.0) || config_.stop_loss > 1.0) {
        throw ValidationError("stop_loss must be in (0, 1]");
    }
}

StrategyInfo RsiThresholdStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "RSI_Strategy";
    info.description = "RSI oversold/overbought threshold exits";
    info.warmup_bars = config_.period + 1;
    return info;
}

StrategyParams RsiThresholdStrategy::getParams() const {
    return {
        {"period", static_cast<double>(config_.period)},
        {"oversold", config_.oversold},
        {"overbought", config_.overbought},
        {"stop_loss", config_.stop_loss}
    };
}

ExitRules RsiThresholdStrategy::getExitRules() const {
    ExitRules rules;
    rules.stop_loss = config_.stop_loss;
    return rules;
}

std::vector<Signal> RsiThresholdStrategy::generateSignals(const BarSeries& bars) const {
    std::vector<Signal> signals;
    if (bars.empty()) {
        return signals;
    }

    const auto closes = TechnicalIndicators::extractClosePrices(bars);
    const auto rsi = TechnicalIndicators::calculateRSISeries(closes, config_.period);

    for (size_t i = 1; i < bars.size(); ++i) {
        if (!TechnicalIndicators::isValid(rsi[i]) || !TechnicalIndicators::isValid(rsi[i - 1])) {
            continue;
        }

        const double prev = rsi[i - 1];
        const double cur = rsi[i];
        const bool rising_from_oversold = cur > config_.oversold && prev <= config_.oversold;
        const bool falling_from_overbought = cur < config_.overbought && prev >= config_.overbought;

        if (rising_from_oversold) {
            Signal signal("", SignalType::BUY, bars[i].close, bars[i].timestamp,
                          (config_.oversold - prev) / config_.oversold);
            signal.metadata["rsi"] = cur;
            signal.metadata["reason"] = std::string("rising_from_oversold");
            signals.push_back(std::move(signal));
        } else if (falling_from_overbought) {
            Signal signal("", SignalType::SELL, bars[i].close, bars[i].timestamp,
                          (prev - config_.overbought) / (100.0 - config_.overbought));
            signal.metadata["rsi"] = cur;
            signal.metadata["reason"] = std::string("falling_from_overbought");
            signals.push_back(std::move(signal));
        }
    }
    return signals;
}

} // namespace strategy
} // namespace quantsim
