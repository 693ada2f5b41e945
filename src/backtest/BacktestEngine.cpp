#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "risk/ProtectiveExits.h"

#include <algorithm>
#include <iterator>
#include <optional>
#include <set>

namespace quantsim {
namespace backtest {

using execution::FillQuote;
using execution::FrictionModel;
using strategy::Signal;
using strategy::SignalType;

BacktestEngine::BacktestEngine(const engine::BacktestConfig& config,
                               LoggerHandle logger,
                               LoggerHandle trade_logger)
    : config_(config)
    , logger_(Logger::orDefault(std::move(logger)))
    , trade_logger_(std::move(trade_logger))
    , analyzer_(config.risk_free_rate)
    , ledger_(config.initial_capital)
{
    if (!(config_.initial_capital > 0.0)) {
        throw ValidationError("initial_capital must be positive");
    }
    if (config_.friction.lot_size <= 0) {
        throw ValidationError("lot_size must be positive");
    }
}

void BacktestEngine::reset() {
    ledger_.reset(config_.initial_capital);
    trades_.clear();
    snapshots_.clear();
}

BacktestEngine::SignalsByDay BacktestEngine::indexByDay(const std::vector<Signal>& signals) {
    SignalsByDay by_day;
    for (const auto& signal : signals) {
        by_day[utils::dayKey(signal.timestamp)].push_back(signal);
    }
    return by_day;
}

BacktestResult BacktestEngine::run(const strategy::IStrategy& strategy,
                                   const BarSeries& bars,
                                   const std::string& symbol) {
    reset();
    DataHistory::validateSeries(bars, symbol);

    const auto signals = symbol.empty()
        ? strategy.generateSignals(bars)
        : strategy.generateSignalsForSymbol(symbol, bars);
    const auto by_day = indexByDay(signals);

    logger_->info("[Backtest] {} on {}: {} bars, {} signals",
                  strategy.getName(), symbol.empty() ? "<unnamed>" : symbol,
                  bars.size(), signals.size());

    std::optional<risk::ProtectiveExits> exits;
    if (config_.protective_exits) {
        exits.emplace(strategy.getExitRules(), config_.friction.lot_size, logger_);
    }

    size_t consumed = 0;
    for (const auto& bar : bars) {
        if (exits) {
            std::map<std::string, double> marks;
            for (const auto& pos : ledger_.openPositions()) {
                marks[pos.symbol] = bar.close;
            }
            applyProtectiveExits(*exits, marks, bar);
        }

        auto it = by_day.find(utils::dayKey(bar.timestamp));
        if (it != by_day.end()) {
            processSignals(it->second, bar);
            consumed += it->second.size();
        }

        // Single-symbol run: every holding is valued at this bar's close
        std::map<std::string, double> prices;
        for (const auto& pos : ledger_.openPositions()) {
            prices[pos.symbol] = bar.close;
        }
        recordSnapshot(bar.timestamp, prices);
    }

    if (consumed < signals.size()) {
        logger_->debug("[Backtest] {} signals had no matching bar date", signals.size() - consumed);
    }

    return buildResult(strategy.getName());
}

BacktestResult BacktestEngine::runMultiple(const strategy::IStrategy& strategy,
                                           const std::map<std::string, BarSeries>& data) {
    reset();
    if (data.empty()) {
        throw EmptyDataError("no symbols supplied");
    }

    std::map<std::string, SignalsByDay> signals_by_symbol;
    std::map<std::string, std::map<long long, const Bar*>> bars_by_symbol;
    std::set<long long> common_days;
    bool first = true;

    for (const auto& [symbol, bars] : data) {
        DataHistory::validateSeries(bars, symbol);
        signals_by_symbol[symbol] = indexByDay(strategy.generateSignalsForSymbol(symbol, bars));

        auto& day_index = bars_by_symbol[symbol];
        std::set<long long> days;
        for (const auto& bar : bars) {
            const long long day = utils::dayKey(bar.timestamp);
            day_index[day] = &bar;
            days.insert(day);
        }

        if (first) {
            common_days = std::move(days);
            first = false;
        } else {
            std::set<long long> intersection;
            std::set_intersection(common_days.begin(), common_days.end(),
                                  days.begin(), days.end(),
                                  std::inserter(intersection, intersection.begin()));
            common_days = std::move(intersection);
        }
    }

    logger_->info("[Backtest] {} on {} symbols: {} common dates",
                  strategy.getName(), data.size(), common_days.size());
    if (common_days.empty()) {
        logger_->warn("[Backtest] symbols share no trading dates, nothing simulated");
    }

    std::optional<risk::ProtectiveExits> exits;
    if (config_.protective_exits) {
        exits.emplace(strategy.getExitRules(), config_.friction.lot_size, logger_);
    }

    for (long long day : common_days) {
        std::map<std::string, double> prices;
        Timestamp snapshot_ts = 0;

        for (const auto& [symbol, day_index] : bars_by_symbol) {
            const Bar& bar = *day_index.at(day);
            prices[symbol] = bar.close;
            snapshot_ts = std::max(snapshot_ts, bar.timestamp);

            if (exits) {
                const std::map<std::string, double> mark = {{symbol, bar.close}};
                applyProtectiveExits(*exits, mark, bar);
            }

            const auto& by_day = signals_by_symbol[symbol];
            auto it = by_day.find(day);
            if (it != by_day.end()) {
                processSignals(it->second, bar);
            }
        }

        recordSnapshot(snapshot_ts, prices);
    }

    return buildResult(strategy.getName());
}

void BacktestEngine::processSignals(const std::vector<Signal>& signals, const Bar& bar) {
    for (const auto& signal : signals) {
        switch (signal.type) {
            case SignalType::BUY:
                executeBuy(signal, bar);
                break;
            case SignalType::SELL:
                executeSell(signal, bar, false);
                break;
            case SignalType::CLOSE_LONG:
                executeSell(signal, bar, true);
                break;
            case SignalType::HOLD:
            case SignalType::CLOSE_SHORT:
                // No shorting: nothing to close
                break;
        }
    }
}

void BacktestEngine::applyProtectiveExits(const risk::ProtectiveExits& exits,
                                          const std::map<std::string, double>& prices,
                                          const Bar& bar) {
    for (const auto& signal : exits.evaluate(ledger_.openPositions(), prices, bar.timestamp)) {
        executeSell(signal, bar, true);
    }
}

bool BacktestEngine::executeBuy(const Signal& signal, const Bar& bar) {
    const auto& params = config_.friction;

    Quantity quantity = FrictionModel::maxAffordableQuantity(ledger_.cash(), bar.close, params);
    if (auto requested = signal.requestedQuantity()) {
        quantity = FrictionModel::roundToLot(std::min(quantity, *requested), params.lot_size);
    }
    if (quantity < params.lot_size) {
        logger_->debug("[Backtest] BUY {} dropped: affordable quantity below one lot", signal.symbol);
        return false;
    }

    const FillQuote fill = FrictionModel::quote(OrderSide::BUY, quantity, bar.close, params);
    if (fill.empty() || fill.totalCost() > ledger_.cash()) {
        logger_->debug("[Backtest] BUY {} dropped: cost {:.2f} exceeds cash {:.2f}",
                       signal.symbol, fill.totalCost(), ledger_.cash());
        return false;
    }

    ledger_.applyBuy(signal.symbol, fill.quantity, fill.gross_amount, fill.total_fees);

    TradeRecord trade;
    trade.timestamp = signal.timestamp;
    trade.symbol = signal.symbol;
    trade.direction = OrderSide::BUY;
    trade.price = fill.effective_price;
    trade.quantity = fill.quantity;
    trade.amount = fill.gross_amount;
    trade.commission = fill.commission;
    trade.stamp_duty = fill.stamp_duty;
    trade.fees = fill.total_fees;
    trade.cash_after = ledger_.cash();
    trades_.push_back(trade);
    logTrade(trade);
    return true;
}

bool BacktestEngine::executeSell(const Signal& signal, const Bar& bar, bool close_all) {
    const auto& params = config_.friction;

    const Quantity held = ledger_.quantityOf(signal.symbol);
    if (held <= 0) {
        logger_->debug("[Backtest] SELL {} dropped: no position", signal.symbol);
        return false;
    }

    Quantity quantity = held;
    if (!close_all) {
        if (auto requested = signal.requestedQuantity()) {
            quantity = FrictionModel::roundToLot(std::min(held, *requested), params.lot_size);
        }
    }
    if (quantity <= 0) {
        logger_->debug("[Backtest] SELL {} dropped: requested quantity below one lot", signal.symbol);
        return false;
    }

    // A full exit may sell an odd-lot remainder, so price it without re-rounding
    FillQuote fill;
    if (quantity == held) {
        execution::FrictionParams exit_params = params;
        exit_params.lot_size = 1;
        fill = FrictionModel::quote(OrderSide::SELL, quantity, bar.close, exit_params);
    } else {
        fill = FrictionModel::quote(OrderSide::SELL, quantity, bar.close, params);
    }
    if (fill.empty()) {
        return false;
    }

    const double cost_basis = ledger_.applySell(signal.symbol, fill.quantity, fill.gross_amount, fill.total_fees);

    TradeRecord trade;
    trade.timestamp = signal.timestamp;
    trade.symbol = signal.symbol;
    trade.direction = OrderSide::SELL;
    trade.price = fill.effective_price;
    trade.quantity = fill.quantity;
    trade.amount = fill.gross_amount;
    trade.commission = fill.commission;
    trade.stamp_duty = fill.stamp_duty;
    trade.fees = fill.total_fees;
    trade.cash_after = ledger_.cash();
    trade.profit = fill.gross_amount - cost_basis;
    trades_.push_back(trade);
    logTrade(trade);
    return true;
}

void BacktestEngine::recordSnapshot(Timestamp timestamp, const std::map<std::string, double>& prices) {
    DailySnapshot snapshot;
    snapshot.timestamp = timestamp;
    snapshot.cash = ledger_.cash();
    snapshot.position_value = ledger_.marketValue(prices);
    snapshot.total_value = snapshot.cash + snapshot.position_value;
    snapshots_.push_back(snapshot);
}

void BacktestEngine::logTrade(const TradeRecord& trade) const {
    logger_->debug("[Backtest] {} {} {} @ {:.4f} fees {:.2f} cash {:.2f}",
                   orderSideToString(trade.direction), trade.quantity, trade.symbol,
                   trade.price, trade.fees, trade.cash_after);
    Logger::logTrade(trade_logger_, utils::formatDate(trade.timestamp), trade.symbol,
                     orderSideToString(trade.direction), trade.price,
                     trade.quantity, trade.fees, trade.cash_after);
}

BacktestResult BacktestEngine::buildResult(const std::string& strategy_name) const {
    BacktestResult result;
    result.strategy_name = strategy_name;
    result.initial_capital = config_.initial_capital;
    result.final_value = snapshots_.empty() ? config_.initial_capital : snapshots_.back().total_value;
    result.trades = trades_;
    result.daily_snapshots = snapshots_;
    result.performance = analyzer_.generateReport(
        snapshots_, trades_, config_.initial_capital,
        benchmark_.empty() ? nullptr : &benchmark_);

    logger_->info("[Backtest] {} finished: final value {:.2f}, {} trades, return {:.4f}",
                  strategy_name, result.final_value, trades_.size(), result.performance.total_return);
    return result;
}

std::vector<TradeRecord> BacktestEngine::getProfitableTrades() const {
    std::vector<TradeRecord> out;
    for (const auto& trade : trades_) {
        if (trade.profit.value_or(0.0) > 0.0) {
            out.push_back(trade);
        }
    }
    return out;
}

std::vector<TradeRecord> BacktestEngine::getLosingTrades() const {
    std::vector<TradeRecord> out;
    for (const auto& trade : trades_) {
        if (trade.profit.value_or(0.0) < 0.0) {
            out.push_back(trade);
        }
    }
    return out;
}

nlohmann::json toJson(const BacktestResult& result) {
    nlohmann::json j;
    j["strategy_name"] = result.strategy_name;
    j["initial_capital"] = result.initial_capital;
    j["final_value"] = result.final_value;

    nlohmann::json trades = nlohmann::json::array();
    for (const auto& trade : result.trades) {
        trades.push_back(toJson(trade));
    }
    j["trades"] = std::move(trades);

    nlohmann::json snapshots = nlohmann::json::array();
    for (const auto& snapshot : result.daily_snapshots) {
        snapshots.push_back(toJson(snapshot));
    }
    j["daily_values"] = std::move(snapshots);

    j["performance"] = toJson(result.performance);
    return j;
}

} // namespace backtest
} // namespace quantsim
