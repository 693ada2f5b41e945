#include "risk/PositionManager.h"

#include <algorithm>
#include <cmath>

namespace quantsim {
namespace risk {

using execution::FrictionModel;

PositionManager::PositionManager(double initial_capital,
                                 const execution::FrictionParams& friction,
                                 LoggerHandle logger)
    : initial_capital_(initial_capital)
    , friction_(friction)
    , logger_(Logger::orDefault(std::move(logger)))
    , ledger_(initial_capital)
{}

PositionView PositionManager::makeView(const execution::LedgerPosition& position) const {
    PositionView view;
    view.symbol = position.symbol;
    view.quantity = position.quantity;
    view.average_cost = position.average_cost;

    auto it = last_prices_.find(position.symbol);
    view.current_price = (it != last_prices_.end()) ? it->second : position.average_cost;
    view.market_value = static_cast<double>(view.quantity) * view.current_price;
    view.profit_loss = (view.current_price - view.average_cost) * static_cast<double>(view.quantity);
    view.profit_loss_ratio = (view.average_cost > 0.0)
        ? (view.current_price - view.average_cost) / view.average_cost
        : 0.0;
    return view;
}

std::optional<PositionView> PositionManager::getPosition(const std::string& symbol) const {
    const auto* position = ledger_.find(symbol);
    if (!position) {
        return std::nullopt;
    }
    return makeView(*position);
}

std::vector<PositionView> PositionManager::getAllPositions() const {
    std::vector<PositionView> views;
    for (const auto& position : ledger_.openPositions()) {
        views.push_back(makeView(position));
    }
    return views;
}

bool PositionManager::hasPosition(const std::string& symbol) const {
    return ledger_.find(symbol) != nullptr;
}

Quantity PositionManager::getPositionQuantity(const std::string& symbol) const {
    return ledger_.quantityOf(symbol);
}

double PositionManager::getPositionValue(const std::string& symbol) const {
    const auto view = getPosition(symbol);
    return view ? view->market_value : 0.0;
}

double PositionManager::getTotalPositionValue() const {
    double total = 0.0;
    for (const auto& view : getAllPositions()) {
        total += view.market_value;
    }
    return total;
}

double PositionManager::getTotalValue() const {
    return ledger_.cash() + getTotalPositionValue();
}

double PositionManager::getTotalProfitLoss() const {
    double total = 0.0;
    for (const auto& view : getAllPositions()) {
        total += view.profit_loss;
    }
    return total;
}

bool PositionManager::updatePosition(const std::string& symbol, Quantity quantity, double price,
                                     bool is_buy, double fees) {
    if (quantity <= 0 || price <= 0.0) {
        return false;
    }
    const double amount = static_cast<double>(quantity) * price;
    if (is_buy) {
        ledger_.applyBuy(symbol, quantity, amount, fees);
    } else {
        if (ledger_.quantityOf(symbol) < quantity) {
            logger_->warn("[Position] sell {} x{} refused: holding {}", symbol, quantity,
                          ledger_.quantityOf(symbol));
            return false;
        }
        ledger_.applySell(symbol, quantity, amount, fees);
    }
    last_prices_[symbol] = price;
    return true;
}

std::optional<double> PositionManager::applyFill(const std::string& symbol, const execution::FillQuote& fill) {
    if (fill.empty()) {
        return std::nullopt;
    }
    if (fill.side == OrderSide::BUY) {
        ledger_.applyBuy(symbol, fill.quantity, fill.gross_amount, fill.total_fees);
        return 0.0;
    }
    if (ledger_.quantityOf(symbol) < fill.quantity) {
        return std::nullopt;
    }
    const double cost_basis = ledger_.applySell(symbol, fill.quantity, fill.gross_amount, fill.total_fees);
    return fill.gross_amount - cost_basis;
}

void PositionManager::updateCurrentPrice(const std::string& symbol, double price) {
    if (price > 0.0 && std::isfinite(price)) {
        last_prices_[symbol] = price;
    }
}

void PositionManager::updateCurrentPrices(const std::map<std::string, double>& prices) {
    for (const auto& [symbol, price] : prices) {
        updateCurrentPrice(symbol, price);
    }
}

std::optional<double> PositionManager::getCurrentPrice(const std::string& symbol) const {
    auto it = last_prices_.find(symbol);
    if (it == last_prices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, double> PositionManager::getPositionWeights() const {
    std::map<std::string, double> weights;
    const double total_value = getTotalValue();
    if (total_value <= 0.0) {
        return weights;
    }
    for (const auto& view : getAllPositions()) {
        weights[view.symbol] = view.market_value / total_value;
    }
    return weights;
}

PositionSummary PositionManager::getPositionSummary() const {
    PositionSummary summary;
    summary.positions = getAllPositions();
    for (const auto& view : summary.positions) {
        summary.position_value += view.market_value;
        summary.total_profit_loss += view.profit_loss;
    }
    summary.cash = ledger_.cash();
    summary.total_value = summary.cash + summary.position_value;
    summary.position_count = summary.positions.size();
    return summary;
}

PositionConcentration PositionManager::calculatePositionConcentration() const {
    PositionConcentration result;
    const auto weights = getPositionWeights();
    if (weights.empty()) {
        return result;
    }
    double sum = 0.0;
    for (const auto& [symbol, weight] : weights) {
        result.max_weight = std::max(result.max_weight, weight);
        result.herfindahl += weight * weight;
        sum += weight;
    }
    result.avg_weight = sum / static_cast<double>(weights.size());
    return result;
}

std::map<std::string, Quantity> PositionManager::rebalancePositions(
    const std::map<std::string, double>& target_weights,
    const std::map<std::string, double>& prices) const {
    std::map<std::string, Quantity> adjustments;
    const double total_value = getTotalValue();

    for (const auto& [symbol, weight] : target_weights) {
        auto price_it = prices.find(symbol);
        if (price_it == prices.end() || price_it->second <= 0.0) {
            continue;
        }
        const double target_value = total_value * weight;
        const Quantity target_quantity =
            FrictionModel::roundToLot(target_value / price_it->second, friction_.lot_size);
        const Quantity adjustment = target_quantity - getPositionQuantity(symbol);
        if (adjustment != 0) {
            adjustments[symbol] = adjustment;
        }
    }

    for (const auto& position : ledger_.openPositions()) {
        if (target_weights.find(position.symbol) == target_weights.end()) {
            adjustments[position.symbol] = -position.quantity;
        }
    }
    return adjustments;
}

double PositionManager::clearPosition(const std::string& symbol, double price) {
    const Quantity quantity = ledger_.quantityOf(symbol);
    if (quantity <= 0) {
        return 0.0;
    }
    const double revenue = static_cast<double>(quantity) * price;
    ledger_.applySell(symbol, quantity, revenue, 0.0);
    last_prices_[symbol] = price;
    logger_->info("[Position] cleared {} x{} @ {:.4f}", symbol, quantity, price);
    return revenue;
}

double PositionManager::clearAllPositions(const std::map<std::string, double>& prices) {
    double total = 0.0;
    for (const auto& position : ledger_.openPositions()) {
        auto it = prices.find(position.symbol);
        if (it != prices.end()) {
            total += clearPosition(position.symbol, it->second);
        }
    }
    return total;
}

void PositionManager::reset() {
    ledger_.reset(initial_capital_);
    last_prices_.clear();
}

nlohmann::json toJson(const PositionView& position) {
    return {
        {"symbol", position.symbol},
        {"quantity", position.quantity},
        {"avg_cost", position.average_cost},
        {"current_price", position.current_price},
        {"market_value", position.market_value},
        {"profit_loss", position.profit_loss},
        {"profit_loss_ratio", position.profit_loss_ratio}
    };
}

nlohmann::json toJson(const PositionSummary& summary) {
    nlohmann::json positions = nlohmann::json::array();
    for (const auto& view : summary.positions) {
        positions.push_back(toJson(view));
    }
    return {
        {"total_value", summary.total_value},
        {"cash", summary.cash},
        {"position_value", summary.position_value},
        {"position_count", summary.position_count},
        {"total_profit_loss", summary.total_profit_loss},
        {"positions", positions}
    };
}

} // namespace risk
} // namespace quantsim
