#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"

#include <array>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace quantsim {

namespace {

void requireNonNegative(double value, const char* name) {
    if (!(value >= 0.0)) {
        throw ValidationError(std::string("config: ") + name + " must be non-negative");
    }
}

void requireRatio(double value, const char* name) {
    if (!(value > 0.0) || value > 1.0) {
        throw ValidationError(std::string("config: ") + name + " must be in (0, 1]");
    }
}

// Wraps json type errors ("initial_capital": "abc") into ValidationError
template <typename T>
T readValue(const nlohmann::json& section, const char* key, const T& fallback) {
    try {
        return section.value(key, fallback);
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("config: invalid value for ") + key + ": " + e.what());
    }
}

} // namespace

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::resetToDefaults() {
    friction_ = execution::FrictionParams();
    initial_capital_ = 1000000.0;
    risk_free_rate_ = 0.03;
    benchmark_ = "000300";
    protective_exits_ = false;
    risk_limits_ = engine::RiskLimits();
    log_level_ = "info";
    log_dir_ = "logs";
    default_strategy_ = "ma_cross";
    strategy_configs_ = strategy::StrategyConfigs();
}

void Config::setInitialCapital(double v) {
    if (!(v > 0.0)) {
        throw ValidationError("config: initial_capital must be positive");
    }
    initial_capital_ = v;
}

void Config::load(const std::string& path) {
    const std::filesystem::path config_path = utils::PathUtils::resolvePath(path);

    std::cout << "설정 파일 경로: " << config_path.string() << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "경고: 설정 파일을 찾을 수 없습니다. 기본값을 사용합니다." << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ValidationError("config: cannot open " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError("config: malformed JSON in " + config_path.string() + ": " + e.what());
    }

    loadFromJson(j);
    std::cout << "설정 파일 로드 완료" << std::endl;
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ValidationError("config: top level must be an object");
    }

    // Parse into locals first so a failure keeps the current values
    execution::FrictionParams friction = friction_;
    double initial_capital = initial_capital_;
    double risk_free_rate = risk_free_rate_;
    std::string benchmark = benchmark_;
    bool protective_exits = protective_exits_;
    engine::RiskLimits limits = risk_limits_;
    std::string log_level = log_level_;
    std::string log_dir = log_dir_;
    std::string default_strategy = default_strategy_;
    strategy::StrategyConfigs strategies = strategy_configs_;

    if (j.contains("trading")) {
        const auto& t = j["trading"];
        friction.commission_rate = readValue(t, "commission_rate", friction.commission_rate);
        friction.stamp_duty_rate = readValue(t, "stamp_duty_rate", friction.stamp_duty_rate);
        friction.slippage = readValue(t, "slippage", friction.slippage);
        friction.lot_size = readValue(t, "min_trade_unit", friction.lot_size);
        friction.min_commission = readValue(t, "min_commission", friction.min_commission);
    }

    if (j.contains("risk")) {
        const auto& r = j["risk"];
        limits.max_position_ratio = readValue(r, "max_position_ratio", limits.max_position_ratio);
        limits.max_single_stock_ratio = readValue(r, "max_single_stock_ratio", limits.max_single_stock_ratio);
        limits.max_daily_loss_ratio = readValue(r, "max_daily_loss_ratio", limits.max_daily_loss_ratio);
        limits.max_drawdown_ratio = readValue(r, "max_drawdown_ratio", limits.max_drawdown_ratio);
        limits.stop_loss_ratio = readValue(r, "stop_loss_ratio", limits.stop_loss_ratio);
        limits.take_profit_ratio = readValue(r, "take_profit_ratio", limits.take_profit_ratio);
    }

    if (j.contains("backtest")) {
        const auto& b = j["backtest"];
        initial_capital = readValue(b, "initial_capital", initial_capital);
        risk_free_rate = readValue(b, "risk_free_rate", risk_free_rate);
        benchmark = readValue(b, "benchmark", benchmark);
        default_strategy = readValue(b, "strategy", default_strategy);
        protective_exits = readValue(b, "protective_exits", protective_exits);
    }

    if (j.contains("strategies")) {
        const auto& s = j["strategies"];
        if (s.contains("ma_cross")) {
            const auto& m = s["ma_cross"];
            strategies.ma_cross.fast_period = readValue(m, "fast_period", strategies.ma_cross.fast_period);
            strategies.ma_cross.slow_period = readValue(m, "slow_period", strategies.ma_cross.slow_period);
            strategies.ma_cross.stop_loss = readValue(m, "stop_loss", strategies.ma_cross.stop_loss);
            strategies.ma_cross.take_profit = readValue(m, "take_profit", strategies.ma_cross.take_profit);
        }
        if (s.contains("macd_cross")) {
            const auto& m = s["macd_cross"];
            strategies.macd_cross.fast_period = readValue(m, "fast_period", strategies.macd_cross.fast_period);
            strategies.macd_cross.slow_period = readValue(m, "slow_period", strategies.macd_cross.slow_period);
            strategies.macd_cross.signal_period = readValue(m, "signal_period", strategies.macd_cross.signal_period);
            strategies.macd_cross.stop_loss = readValue(m, "stop_loss", strategies.macd_cross.stop_loss);
        }
        if (s.contains("rsi_threshold")) {
            const auto& m = s["rsi_threshold"];
            strategies.rsi_threshold.period = readValue(m, "period", strategies.rsi_threshold.period);
            strategies.rsi_threshold.oversold = readValue(m, "oversold", strategies.rsi_threshold.oversold);
            strategies.rsi_threshold.overbought = readValue(m, "overbought", strategies.rsi_threshold.overbought);
            strategies.rsi_threshold.stop_loss = readValue(m, "stop_loss", strategies.rsi_threshold.stop_loss);
        }
    }

    if (j.contains("log")) {
        const auto& l = j["log"];
        log_level = readValue(l, "level", log_level);
        log_dir = readValue(l, "dir", log_dir);
    }

    validate(friction, initial_capital, limits, log_level);

    friction_ = friction;
    initial_capital_ = initial_capital;
    risk_free_rate_ = risk_free_rate;
    benchmark_ = benchmark;
    protective_exits_ = protective_exits;
    risk_limits_ = limits;
    log_level_ = log_level;
    log_dir_ = log_dir;
    default_strategy_ = default_strategy;
    strategy_configs_ = strategies;
}

void Config::validate(const execution::FrictionParams& friction,
                      double initial_capital,
                      const engine::RiskLimits& limits,
                      const std::string& log_level) {
    requireNonNegative(friction.commission_rate, "trading.commission_rate");
    requireNonNegative(friction.stamp_duty_rate, "trading.stamp_duty_rate");
    requireNonNegative(friction.slippage, "trading.slippage");
    requireNonNegative(friction.min_commission, "trading.min_commission");
    if (friction.lot_size <= 0) {
        throw ValidationError("config: trading.min_trade_unit must be positive");
    }
    if (!(initial_capital > 0.0)) {
        throw ValidationError("config: backtest.initial_capital must be positive");
    }

    requireRatio(limits.max_position_ratio, "risk.max_position_ratio");
    requireRatio(limits.max_single_stock_ratio, "risk.max_single_stock_ratio");
    requireRatio(limits.max_daily_loss_ratio, "risk.max_daily_loss_ratio");
    requireRatio(limits.max_drawdown_ratio, "risk.max_drawdown_ratio");
    requireRatio(limits.stop_loss_ratio, "risk.stop_loss_ratio");
    if (!(limits.take_profit_ratio > 0.0)) {
        throw ValidationError("config: risk.take_profit_ratio must be positive");
    }

    static const std::array<const char*, 7> levels = {
        "trace", "debug", "info", "warn", "error", "critical", "off"
    };
    bool known = false;
    for (const char* level : levels) {
        known = known || log_level == level;
    }
    if (!known) {
        throw ValidationError("config: unknown log.level '" + log_level + "'");
    }
}

engine::BacktestConfig Config::toBacktestConfig() const {
    engine::BacktestConfig config;
    config.initial_capital = initial_capital_;
    config.friction = friction_;
    config.risk_free_rate = risk_free_rate_;
    config.benchmark = benchmark_;
    config.protective_exits = protective_exits_;
    return config;
}

} // namespace quantsim
