#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"
#include "execution/FrictionModel.h"
#include "strategy/StrategyConfig.h"

namespace quantsim {

class Config {
public:
    static Config& getInstance();

    // A missing file keeps the defaults. Malformed JSON or an invalid value
    // throws ValidationError and leaves the previous values in place.
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);
    void resetToDefaults();

    const execution::FrictionParams& getFrictionParams() const { return friction_; }
    double getInitialCapital() const { return initial_capital_; }
    void setInitialCapital(double v);
    double getRiskFreeRate() const { return risk_free_rate_; }
    std::string getBenchmark() const { return benchmark_; }
    bool getProtectiveExits() const { return protective_exits_; }
    const engine::RiskLimits& getRiskLimits() const { return risk_limits_; }

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    std::string getDefaultStrategy() const { return default_strategy_; }

    // Strategy Configs
    const strategy::StrategyConfigs& getStrategyConfigs() const { return strategy_configs_; }
    strategy::MovingAverageCrossConfig getMaCrossConfig() const { return strategy_configs_.ma_cross; }
    strategy::MacdCrossConfig getMacdCrossConfig() const { return strategy_configs_.macd_cross; }
    strategy::RsiThresholdConfig getRsiThresholdConfig() const { return strategy_configs_.rsi_threshold; }

    // 완성된 설정 구조체 반환
    engine::BacktestConfig toBacktestConfig() const;
    engine::RiskLimits toRiskLimits() const { return risk_limits_; }

private:
    Config() = default;

    // Throws ValidationError on the first invalid value
    static void validate(const execution::FrictionParams& friction,
                         double initial_capital,
                         const engine::RiskLimits& limits,
                         const std::string& log_level);

    execution::FrictionParams friction_;
    double initial_capital_ = 1000000.0;
    double risk_free_rate_ = 0.03;
    std::string benchmark_ = "000300";
    bool protective_exits_ = false;
    engine::RiskLimits risk_limits_;

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    std::string default_strategy_ = "ma_cross";

    strategy::StrategyConfigs strategy_configs_;
};

} // namespace quantsim
