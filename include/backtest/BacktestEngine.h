#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/Types.h"
#include "common/Logger.h"
#include "engine/EngineConfig.h"
#include "execution/FrictionModel.h"
#include "execution/Ledger.h"
#include "backtest/TradeRecord.h"
#include "backtest/PerformanceAnalyzer.h"
#include "strategy/IStrategy.h"

namespace quantsim {
namespace risk {
class ProtectiveExits;
} // namespace risk

namespace backtest {

struct BacktestResult {
    std::string strategy_name;
    double initial_capital = 0.0;
    double final_value = 0.0;
    std::vector<TradeRecord> trades;
    std::vector<DailySnapshot> daily_snapshots;
    PerformanceReport performance;
};

nlohmann::json toJson(const BacktestResult& result);

// Replays bars through a strategy's signals at bar close prices.
// Each run() starts from a fresh ledger, so results are reproducible.
class BacktestEngine {
public:
    // trade_logger receives one CSV line per executed trade; null disables it
    explicit BacktestEngine(const engine::BacktestConfig& config = engine::BacktestConfig(),
                            LoggerHandle logger = nullptr,
                            LoggerHandle trade_logger = nullptr);

    // Throws EmptyDataError on empty bars, ValidationError on unordered/duplicate dates
    BacktestResult run(const strategy::IStrategy& strategy,
                       const BarSeries& bars,
                       const std::string& symbol = "");

    // Signals execute per symbol at that symbol's close over the common dates
    BacktestResult runMultiple(const strategy::IStrategy& strategy,
                               const std::map<std::string, BarSeries>& data);

    // Optional benchmark used for beta/alpha/information ratio
    void setBenchmark(const BenchmarkReturns& benchmark) { benchmark_ = benchmark; }
    void clearBenchmark() { benchmark_.clear(); }

    void reset();

    std::vector<execution::LedgerPosition> getCurrentPositions() const { return ledger_.openPositions(); }
    size_t getTradeCount() const { return trades_.size(); }
    std::vector<TradeRecord> getProfitableTrades() const;
    std::vector<TradeRecord> getLosingTrades() const;

    const std::vector<TradeRecord>& getTrades() const { return trades_; }
    const std::vector<DailySnapshot>& getDailySnapshots() const { return snapshots_; }
    const execution::Ledger& ledger() const { return ledger_; }
    const engine::BacktestConfig& config() const { return config_; }

private:
    using SignalsByDay = std::map<long long, std::vector<strategy::Signal>>;

    static SignalsByDay indexByDay(const std::vector<strategy::Signal>& signals);

    void processSignals(const std::vector<strategy::Signal>& signals, const Bar& bar);
    // Full exits for holdings that crossed the strategy's stop-loss / take-profit at `prices`
    void applyProtectiveExits(const risk::ProtectiveExits& exits,
                              const std::map<std::string, double>& prices,
                              const Bar& bar);
    bool executeBuy(const strategy::Signal& signal, const Bar& bar);
    bool executeSell(const strategy::Signal& signal, const Bar& bar, bool close_all);
    void recordSnapshot(Timestamp timestamp, const std::map<std::string, double>& prices);
    void logTrade(const TradeRecord& trade) const;

    BacktestResult buildResult(const std::string& strategy_name) const;

    engine::BacktestConfig config_;
    LoggerHandle logger_;
    LoggerHandle trade_logger_;
    PerformanceAnalyzer analyzer_;
    BenchmarkReturns benchmark_;

    execution::Ledger ledger_;
    std::vector<TradeRecord> trades_;
    std::vector<DailySnapshot> snapshots_;
};

} // namespace backtest
} // namespace quantsim
