#include "strategy/MacdCrossStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"

#include <cmath>
#include <string>

namespace quantsim {
namespace strategy {

using analytics::TechnicalIndicators;

MacdCrossStrategy::MacdCrossStrategy(const MacdCrossConfig& config)
    : config_(config) {
    if (config_.fast_period <= 0 || config_.slow_period <= 0 || config_.signal_period <= 0) {
        throw ValidationError("MACD periods must be positive");
    }
    if (config_.fast_period >= config_.slow_period) {
        throw ValidationError("MACD fast_period must be less than slow_period");
    }
    if (!(config_.stop_loss > 0.0) || config_.stop_loss > 1.0) {
        throw ValidationError("stop_loss must be in (0, 1]");
    }
}

StrategyInfo MacdCrossStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "MACD_Strategy";
    info.description = "MACD / signal line crossover";
    info.warmup_bars = 2;
    return info;
}

StrategyParams MacdCrossStrategy::getParams() const {
    return {
        {"fast_period", static_cast<double>(config_.fast_period)},
        {"slow_period", static_cast<double>(config_.slow_period)},
        {"signal_period", static_cast<double>(config_.signal_period)},
        {"stop_loss", config_.stop_loss}
    };
}

ExitRules MacdCrossStrategy::getExitRules() const {
    ExitRules rules;
    rules.stop_loss = config_.stop_loss;
    return rules;
}

std::vector<Signal> MacdCrossStrategy::generateSignals(const BarSeries& bars) const {
    std::vector<Signal> signals;
    if (bars.size() < 2) {
        return signals;
    }

    const auto closes = TechnicalIndicators::extractClosePrices(bars);
    const auto macd = TechnicalIndicators::calculateMACDSeries(
        closes, config_.fast_period, config_.slow_period, config_.signal_period);
    if (macd.macd.size() != bars.size()) {
        return signals;
    }

    for (size_t i = 1; i < bars.size(); ++i) {
        const double line = macd.macd[i];
        const double sig = macd.signal[i];
        const double prev_line = macd.macd[i - 1];
        const double prev_sig = macd.signal[i - 1];
        if (!TechnicalIndicators::isValid(line) || !TechnicalIndicators::isValid(sig)) {
            continue;
        }

        const bool golden_cross = line > sig && prev_line <= prev_sig;
        const bool death_cross = line < sig && prev_line >= prev_sig;
        if (!golden_cross && !death_cross) {
            continue;
        }

        Signal signal("", golden_cross ? SignalType::BUY : SignalType::SELL,
                      bars[i].close, bars[i].timestamp, std::fabs(macd.histogram[i]));
        signal.metadata["macd"] = line;
        signal.metadata["macd_signal"] = sig;
        signal.metadata["macd_hist"] = macd.histogram[i];
        signal.metadata["reason"] = std::string(golden_cross ? "macd_golden_cross" : "macd_death_cross");
        signals.push_back(std::move(signal));
    }
    return signals;
}

} // namespace strategy
} // namespace quantsim
