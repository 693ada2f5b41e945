#include "risk/ProtectiveExits.h"
#include "risk/PositionManager.h"
#include "execution/FrictionModel.h"

#include <set>

namespace quantsim {
namespace risk {

namespace {

engine::RiskLimits limitsFor(const strategy::ExitRules& rules) {
    engine::RiskLimits limits;
    if (rules.stop_loss) {
        limits.stop_loss_ratio = *rules.stop_loss;
    }
    if (rules.take_profit) {
        limits.take_profit_ratio = *rules.take_profit;
    }
    return limits;
}

} // namespace

ProtectiveExits::ProtectiveExits(const strategy::ExitRules& rules, Quantity lot_size, LoggerHandle logger)
    : rules_(rules)
    , logger_(Logger::orDefault(std::move(logger)))
    , risk_(limitsFor(rules), lot_size, logger_)
{
}

strategy::Signal ProtectiveExits::exitSignal(const execution::LedgerPosition& position,
                                             double price,
                                             Timestamp timestamp,
                                             const char* reason,
                                             const char* ratio_key) const {
    strategy::Signal signal(position.symbol, strategy::SignalType::SELL, price, timestamp, 1.0);
    signal.quantity = position.quantity;
    signal.metadata["reason"] = std::string(reason);
    signal.metadata[ratio_key] = (price - position.average_cost) / position.average_cost;
    logger_->info("[Exit] {} {} x{} @ {:.4f} (avg cost {:.4f})",
                  reason, position.symbol, position.quantity, price, position.average_cost);
    return signal;
}

std::vector<strategy::Signal> ProtectiveExits::applyStopLoss(
    const std::vector<execution::LedgerPosition>& positions,
    const std::map<std::string, double>& prices,
    Timestamp timestamp) const {
    std::vector<strategy::Signal> signals;
    if (!rules_.stop_loss) {
        return signals;
    }
    for (const auto& position : positions) {
        auto it = prices.find(position.symbol);
        if (position.quantity <= 0 || it == prices.end()) {
            continue;
        }
        if (risk_.checkStopLoss(position.average_cost, it->second)) {
            signals.push_back(exitSignal(position, it->second, timestamp, "stop_loss", "loss_ratio"));
        }
    }
    return signals;
}

std::vector<strategy::Signal> ProtectiveExits::applyTakeProfit(
    const std::vector<execution::LedgerPosition>& positions,
    const std::map<std::string, double>& prices,
    Timestamp timestamp) const {
    std::vector<strategy::Signal> signals;
    if (!rules_.take_profit) {
        return signals;
    }
    for (const auto& position : positions) {
        auto it = prices.find(position.symbol);
        if (position.quantity <= 0 || it == prices.end()) {
            continue;
        }
        if (risk_.checkTakeProfit(position.average_cost, it->second)) {
            signals.push_back(exitSignal(position, it->second, timestamp, "take_profit", "profit_ratio"));
        }
    }
    return signals;
}

std::vector<strategy::Signal> ProtectiveExits::evaluate(
    const std::vector<execution::LedgerPosition>& positions,
    const std::map<std::string, double>& prices,
    Timestamp timestamp) const {
    auto signals = applyStopLoss(positions, prices, timestamp);

    std::set<std::string> exiting;
    for (const auto& signal : signals) {
        exiting.insert(signal.symbol);
    }
    for (auto& signal : applyTakeProfit(positions, prices, timestamp)) {
        if (exiting.insert(signal.symbol).second) {
            signals.push_back(std::move(signal));
        }
    }
    return signals;
}

std::vector<strategy::Signal> ProtectiveExits::evaluate(const PositionManager& positions,
                                                        Timestamp timestamp) const {
    const auto open = positions.ledger().openPositions();
    std::map<std::string, double> prices;
    for (const auto& position : open) {
        if (auto price = positions.getCurrentPrice(position.symbol)) {
            prices[position.symbol] = *price;
        }
    }
    return evaluate(open, prices, timestamp);
}

Quantity ProtectiveExits::calculatePositionSize(double price,
                                                double total_capital,
                                                double risk_ratio,
                                                Quantity lot_size) {
    if (!(price > 0.0) || !(total_capital > 0.0) || !(risk_ratio > 0.0) || lot_size <= 0) {
        return 0;
    }
    const Quantity quantity = execution::FrictionModel::roundToLot(total_capital * risk_ratio / price, lot_size);
    return quantity < lot_size ? lot_size : quantity;
}

} // namespace risk
} // namespace quantsim
