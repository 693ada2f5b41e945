#pragma once

namespace quantsim {
namespace strategy {

struct MovingAverageCrossConfig {
    int fast_period = 5;
    int slow_period = 20;

    // Protective exits, applied through risk::ProtectiveExits
    double stop_loss = 0.08;
    double take_profit = 0.15;
};

struct MacdCrossConfig {
    int fast_period = 12;
    int slow_period = 26;
    int signal_period = 9;
    double stop_loss = 0.08;
};

struct RsiThresholdConfig {
    int period = 14;
    double oversold = 30.0;
    double overbought = 70.0;
    double stop_loss = 0.08;
};

// Parameter blocks of every built-in strategy, keyed the way config.json names them
struct StrategyConfigs {
    MovingAverageCrossConfig ma_cross;
    MacdCrossConfig macd_cross;
    RsiThresholdConfig rsi_threshold;
};

} // namespace strategy
} // namespace quantsim
