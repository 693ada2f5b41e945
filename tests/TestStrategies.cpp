#include "strategy/MovingAverageCrossStrategy.h"
#include "strategy/MacdCrossStrategy.h"
#include "strategy/RsiThresholdStrategy.h"
#include "strategy/StrategyManager.h"
#include "analytics/TechnicalIndicators.h"
#include "common/DateUtils.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <variant>

using namespace quantsim;
using namespace quantsim::strategy;
using quantsim::analytics::TechnicalIndicators;

namespace {

BarSeries makeBars(const std::vector<double>& closes) {
    BarSeries bars;
    const Timestamp start = utils::parseDate("2024-01-02");
    for (size_t i = 0; i < closes.size(); ++i) {
        const Timestamp ts = start + static_cast<Timestamp>(i) * utils::MS_PER_DAY;
        bars.emplace_back(ts, closes[i], closes[i], closes[i], closes[i], 1000.0);
    }
    return bars;
}

template <typename Fn>
bool throwsValidation(Fn fn) {
    try {
        fn();
    } catch (const ValidationError&) {
        return true;
    }
    return false;
}

std::string reasonOf(const Signal& signal) {
    return std::get<std::string>(signal.metadata.at("reason"));
}

} // namespace

int main() {
    // Indicator warm-up is NaN
    {
        const std::vector<double> prices = {1.0, 2.0, 3.0, 4.0};
        const auto sma = TechnicalIndicators::calculateSMASeries(prices, 3);
        assert(!TechnicalIndicators::isValid(sma[0]));
        assert(!TechnicalIndicators::isValid(sma[1]));
        assert(sma[2] == 2.0);
        assert(sma[3] == 3.0);
        assert(TechnicalIndicators::calculateEMAVector(prices, 3).front() == 1.0);
    }

    // Moving average cross
    {
        MovingAverageCrossConfig config;
        config.fast_period = 2;
        config.slow_period = 3;
        MovingAverageCrossStrategy ma(config);
        assert(ma.getName() == "MA_Strategy");
        assert(ma.getParams().at("slow_period") == 3.0);

        const auto bars = makeBars({10, 10, 10, 9, 8, 7, 8, 9, 10, 11, 12, 11, 10, 9, 8});
        const auto signals = ma.generateSignals(bars);
        assert(signals.size() == 3);
        assert(signals[0].type == SignalType::SELL);
        assert(signals[0].timestamp == bars[3].timestamp);
        assert(reasonOf(signals[0]) == "death_cross");
        assert(signals[1].type == SignalType::BUY);
        assert(signals[1].timestamp == bars[7].timestamp);
        assert(signals[1].price == 9.0);
        assert(reasonOf(signals[1]) == "golden_cross");
        assert(signals[2].type == SignalType::SELL);
        assert(signals[2].timestamp == bars[12].timestamp);
        for (const auto& s : signals) {
            assert(s.strength == 1.0);
            assert(s.symbol.empty());
        }

        const auto stamped = ma.generateSignalsForSymbol("600000", bars);
        assert(stamped.size() == 3);
        assert(stamped[0].symbol == "600000");

        // Too short for the slow window, or empty
        assert(ma.generateSignals(makeBars({10, 11})).empty());
        assert(ma.generateSignals(BarSeries{}).empty());

        MovingAverageCrossConfig bad;
        bad.fast_period = 20;
        bad.slow_period = 5;
        assert(throwsValidation([&] { MovingAverageCrossStrategy s(bad); }));
        bad.fast_period = 5;
        assert(throwsValidation([&] { MovingAverageCrossStrategy s(bad); }));
        bad.fast_period = 0;
        assert(throwsValidation([&] { MovingAverageCrossStrategy s(bad); }));
    }

    // RSI threshold
    {
        RsiThresholdConfig config;
        config.period = 3;
        RsiThresholdStrategy rsi(config);

        // RSI(3): 0, 0, 33.3, 66.7, 100, 100, 66.7, 33.3 from index 2
        const auto bars = makeBars({10, 9, 8, 7, 8, 9, 10, 11, 10, 9});
        const auto signals = rsi.generateSignals(bars);
        assert(signals.size() == 2);
        assert(signals[0].type == SignalType::BUY);
        assert(signals[0].timestamp == bars[4].timestamp);
        assert(std::fabs(signals[0].strength - 1.0) < 1e-9);
        assert(reasonOf(signals[0]) == "rising_from_oversold");
        assert(signals[1].type == SignalType::SELL);
        assert(signals[1].timestamp == bars[8].timestamp);
        assert(std::fabs(signals[1].strength - 1.0) < 1e-9);

        // Flat prices have no defined RSI and emit nothing
        assert(rsi.generateSignals(makeBars({10, 10, 10, 10, 10, 10})).empty());

        RsiThresholdConfig bad;
        bad.oversold = 80.0;
        bad.overbought = 70.0;
        assert(throwsValidation([&] { RsiThresholdStrategy s(bad); }));
        bad = RsiThresholdConfig();
        bad.period = 0;
        assert(throwsValidation([&] { RsiThresholdStrategy s(bad); }));
    }

    // MACD cross on a V-shaped series
    {
        MacdCrossStrategy macd;
        assert(macd.getName() == "MACD_Strategy");

        std::vector<double> closes;
        for (int i = 0; i < 30; ++i) {
            closes.push_back(100.0 - i);
        }
        for (int i = 0; i < 30; ++i) {
            closes.push_back(71.0 + i);
        }
        const auto bars = makeBars(closes);
        const auto signals = macd.generateSignals(bars);
        assert(signals.size() >= 2);
        assert(signals.front().type == SignalType::SELL);
        assert(signals.front().timestamp == bars[1].timestamp);

        bool bought_after_bottom = false;
        for (const auto& s : signals) {
            assert(s.strength >= 0.0);
            assert(s.metadata.count("macd_hist") == 1);
            if (s.type == SignalType::BUY && s.timestamp > bars[29].timestamp) {
                bought_after_bottom = true;
            }
        }
        assert(bought_after_bottom);

        assert(macd.generateSignals(makeBars({10})).empty());

        MacdCrossConfig bad;
        bad.fast_period = 26;
        bad.slow_period = 12;
        assert(throwsValidation([&] { MacdCrossStrategy s(bad); }));
    }

    // Protective exit ratios
    {
        const auto ma_rules = MovingAverageCrossStrategy(MovingAverageCrossConfig()).getExitRules();
        assert(ma_rules.stop_loss && std::fabs(*ma_rules.stop_loss - 0.08) < 1e-12);
        assert(ma_rules.take_profit && std::fabs(*ma_rules.take_profit - 0.15) < 1e-12);

        MacdCrossConfig macd_config;
        macd_config.stop_loss = 0.05;
        const auto macd_rules = MacdCrossStrategy(macd_config).getExitRules();
        assert(macd_rules.stop_loss && std::fabs(*macd_rules.stop_loss - 0.05) < 1e-12);
        assert(!macd_rules.take_profit);

        const auto rsi_rules = RsiThresholdStrategy(RsiThresholdConfig()).getExitRules();
        assert(rsi_rules.stop_loss && !rsi_rules.take_profit);

        MovingAverageCrossConfig bad_ma;
        bad_ma.stop_loss = 0.0;
        assert(throwsValidation([&] { MovingAverageCrossStrategy s(bad_ma); }));
        bad_ma.stop_loss = 1.5;
        assert(throwsValidation([&] { MovingAverageCrossStrategy s(bad_ma); }));
        bad_ma.stop_loss = 0.08;
        bad_ma.take_profit = 0.0;
        assert(throwsValidation([&] { MovingAverageCrossStrategy s(bad_ma); }));

        MacdCrossConfig bad_macd;
        bad_macd.stop_loss = -0.1;
        assert(throwsValidation([&] { MacdCrossStrategy s(bad_macd); }));
        RsiThresholdConfig bad_rsi;
        bad_rsi.stop_loss = 2.0;
        assert(throwsValidation([&] { RsiThresholdStrategy s(bad_rsi); }));
    }

    // Signal JSON
    {
        Signal signal("600000", SignalType::BUY, 10.5, utils::parseDate("2024-01-05"), 0.7);
        signal.quantity = 300;
        signal.metadata["reason"] = std::string("golden_cross");
        signal.metadata["confirmed"] = true;
        signal.metadata["bars"] = 20LL;
        const auto j = toJson(signal);
        assert(j["signal_type"] == "BUY");
        assert(j["date"] == "2024-01-05");

        const Signal back = signalFromJson(j);
        assert(back.type == SignalType::BUY);
        assert(back.symbol == "600000");
        assert(back.quantity && *back.quantity == 300);
        assert(back.metadata == signal.metadata);

        assert(Signal("X", SignalType::SELL, 1.0, 0, -2.0).strength == 0.0);
        assert(!signalTypeFromString("SHORT"));
    }

    // Strategy registry
    {
        StrategyConfigs configs;
        configs.ma_cross.fast_period = 3;
        configs.ma_cross.slow_period = 10;

        const auto ma = StrategyManager::createStrategy(" MA ", configs);
        assert(ma->getName() == "MA_Strategy");
        assert(ma->getParams().at("fast_period") == 3.0);
        assert(StrategyManager::createStrategy("macd_cross")->getName() == "MACD_Strategy");
        assert(throwsValidation([] { StrategyManager::createStrategy("grid"); }));

        configs.rsi_threshold.oversold = 90.0;
        assert(throwsValidation([&] { StrategyManager::createStrategy("rsi", configs); }));

        StrategyManager manager;
        manager.registerFromConfig({"ma_cross", "macd"}, StrategyConfigs());
        assert(manager.size() == 2);
        assert(manager.getStrategy("MACD_CROSS") != nullptr);
        assert(manager.getStrategy("rsi_threshold") == nullptr);
        assert(manager.getStrategyNames().front() == "ma_cross");
        assert(StrategyManager::availableStrategies().size() == 3);
    }

    std::cout << "[TEST] Strategies PASSED\n";
    return 0;
}
