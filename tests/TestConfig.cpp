#include "common/Config.h"
#include "common/Errors.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>

// Simple manual test runner
int main() {
    using namespace quantsim;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();
    config.resetToDefaults();

    // 1. Defaults
    const auto& friction = config.getFrictionParams();
    assert(std::abs(friction.commission_rate - 0.0003) < 1e-12);
    assert(std::abs(friction.stamp_duty_rate - 0.001) < 1e-12);
    assert(std::abs(friction.slippage - 0.001) < 1e-12);
    assert(friction.lot_size == 100);
    assert(friction.min_commission == 5.0);
    assert(config.getInitialCapital() == 1000000.0);
    assert(config.getDefaultStrategy() == "ma_cross");
    assert(config.getLogLevel() == "info");
    assert(config.getMaCrossConfig().fast_period == 5);
    assert(config.getMaCrossConfig().slow_period == 20);
    assert(config.getRiskLimits().max_single_stock_ratio == 0.2);
    assert(!config.getProtectiveExits());

    // 2. Partial JSON overrides only the keys it names
    nlohmann::json j = {
        {"trading", {{"commission_rate", 0.00025}, {"min_trade_unit", 1}}},
        {"risk", {{"max_drawdown_ratio", 0.2}}},
        {"backtest", {{"initial_capital", 50000.0}, {"strategy", "rsi_threshold"}, {"protective_exits", true}}},
        {"strategies", {{"rsi_threshold", {{"period", 6}, {"oversold", 25.0}}}}},
        {"log", {{"level", "debug"}}}
    };
    config.loadFromJson(j);
    assert(config.getFrictionParams().commission_rate == 0.00025);
    assert(config.getFrictionParams().lot_size == 1);
    assert(config.getFrictionParams().min_commission == 5.0);
    assert(config.getRiskLimits().max_drawdown_ratio == 0.2);
    assert(config.getRiskLimits().stop_loss_ratio == 0.08);
    assert(config.getInitialCapital() == 50000.0);
    assert(config.getDefaultStrategy() == "rsi_threshold");
    assert(config.getRsiThresholdConfig().period == 6);
    assert(config.getRsiThresholdConfig().oversold == 25.0);
    assert(config.getRsiThresholdConfig().overbought == 70.0);
    assert(config.getLogLevel() == "debug");

    const auto backtest = config.toBacktestConfig();
    assert(backtest.initial_capital == 50000.0);
    assert(backtest.friction.lot_size == 1);
    assert(backtest.protective_exits);
    std::cout << "[TEST] Overrides applied" << std::endl;

    // 3. Invalid values are rejected and the previous values survive
    auto rejects = [&](const nlohmann::json& bad) {
        try {
            config.loadFromJson(bad);
        } catch (const ValidationError& e) {
            std::cout << "  rejected: " << e.what() << std::endl;
            return true;
        }
        return false;
    };
    assert(rejects({{"trading", {{"commission_rate", -0.1}}}}));
    assert(rejects({{"trading", {{"min_trade_unit", 0}}}}));
    assert(rejects({{"backtest", {{"initial_capital", 0.0}}}}));
    assert(rejects({{"backtest", {{"initial_capital", "lots"}}}}));
    assert(rejects({{"risk", {{"max_position_ratio", 1.5}}}}));
    assert(rejects({{"log", {{"level", "verbose"}}}}));
    assert(rejects(nlohmann::json::array({1, 2})));
    // A good key next to a bad one is not applied either
    assert(rejects({{"backtest", {{"initial_capital", 70000.0}}}, {"risk", {{"stop_loss_ratio", 0.0}}}}));
    assert(config.getInitialCapital() == 50000.0);
    assert(config.getFrictionParams().commission_rate == 0.00025);
    assert(config.getLogLevel() == "debug");

    bool threw = false;
    try {
        config.setInitialCapital(-1.0);
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);
    config.setInitialCapital(250000.0);
    assert(config.getInitialCapital() == 250000.0);

    // 4. File loading
    const auto dir = std::filesystem::temp_directory_path() / "quantsim_config_test";
    std::filesystem::create_directories(dir);

    config.resetToDefaults();
    const auto missing = dir / "does_not_exist.json";
    std::filesystem::remove(missing);
    config.load(missing.string());
    assert(config.getInitialCapital() == 1000000.0);

    const auto good = dir / "config.json";
    {
        std::ofstream out(good);
        out << R"({"backtest": {"initial_capital": 200000, "benchmark": "000905"},
                   "strategies": {"macd_cross": {"fast_period": 8, "slow_period": 21}}})";
    }
    config.load(good.string());
    assert(config.getInitialCapital() == 200000.0);
    assert(config.getBenchmark() == "000905");
    assert(config.getMacdCrossConfig().fast_period == 8);
    assert(config.getMacdCrossConfig().signal_period == 9);

    const auto broken = dir / "broken.json";
    {
        std::ofstream out(broken);
        out << "{\"backtest\": {";
    }
    threw = false;
    try {
        config.load(broken.string());
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);
    assert(config.getInitialCapital() == 200000.0);

    std::filesystem::remove_all(dir);
    config.resetToDefaults();

    std::cout << "[TEST] Config PASSED" << std::endl;
    return 0;
}
