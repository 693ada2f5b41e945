#pragma once

#include <string>
#include "execution/FrictionModel.h"

namespace quantsim {
namespace engine {

// 백테스트 설정
struct BacktestConfig {
    double initial_capital;
    execution::FrictionParams friction;
    double risk_free_rate;      // annual
    std::string benchmark;      // benchmark symbol, informational
    bool protective_exits;      // apply the strategy's stop-loss / take-profit at each close

    BacktestConfig()
        : initial_capital(1000000.0)
        , risk_free_rate(0.03)
        , benchmark("000300")
        , protective_exits(false)
    {}
};

// 리스크 한도 (all ratios of total value unless noted)
struct RiskLimits {
    double max_position_ratio;       // total exposure
    double max_single_stock_ratio;
    double max_daily_loss_ratio;     // of daily start value
    double max_drawdown_ratio;       // of peak value
    double stop_loss_ratio;          // of average cost
    double take_profit_ratio;        // of average cost

    RiskLimits()
        : max_position_ratio(0.8)
        , max_single_stock_ratio(0.2)
        , max_daily_loss_ratio(0.05)
        , max_drawdown_ratio(0.15)
        , stop_loss_ratio(0.08)
        , take_profit_ratio(0.15)
    {}
};

} // namespace engine
} // namespace quantsim
