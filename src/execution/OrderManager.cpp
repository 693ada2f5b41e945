#include "execution/OrderManager.h"
#include "core/execution/OrderLifecycleStateMachine.h"
#include "common/Errors.h"

#include <algorithm>
#include <chrono>
#include <cstdio>

namespace quantsim {
namespace execution {

using core::execution::OrderEvent;
using core::execution::OrderLifecycleStateMachine;

namespace {
long long getCurrentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}
} // namespace

OrderManager::OrderManager(LoggerHandle logger, Clock clock)
    : logger_(Logger::orDefault(std::move(logger)))
    , clock_(clock ? std::move(clock) : Clock(getCurrentTimeMs))
    , sequence_(0)
{}

std::string OrderManager::nextOrderId(const std::string& symbol, OrderSide side) {
    char seq[16];
    std::snprintf(seq, sizeof(seq), "%06lld", ++sequence_);
    return symbol + "_" + (side == OrderSide::BUY ? "buy" : "sell") + "_" + seq;
}

const Order& OrderManager::createOrder(const std::string& symbol, OrderSide side, Quantity quantity,
                                       OrderType type,
                                       std::optional<double> price,
                                       std::optional<double> stop_price,
                                       const std::string& strategy_id) {
    if (symbol.empty()) {
        throw ValidationError("order symbol must not be empty");
    }
    if (quantity <= 0) {
        throw ValidationError("order quantity must be positive");
    }
    const bool needs_price = (type == OrderType::LIMIT || type == OrderType::STOP_LIMIT);
    const bool needs_stop = (type == OrderType::STOP || type == OrderType::STOP_LIMIT);
    if (needs_price && (!price || *price <= 0.0)) {
        throw ValidationError(std::string(orderTypeToString(type)) + " order requires a positive price");
    }
    if (needs_stop && (!stop_price || *stop_price <= 0.0)) {
        throw ValidationError(std::string(orderTypeToString(type)) + " order requires a positive stop price");
    }

    Order order;
    order.order_id = nextOrderId(symbol, side);
    order.symbol = symbol;
    order.side = side;
    order.quantity = quantity;
    order.type = type;
    order.price = price;
    order.stop_price = stop_price;
    order.strategy_id = strategy_id;
    order.create_time = clock_();
    order.update_time = order.create_time;

    const std::string id = order.order_id;
    auto inserted = orders_.emplace(id, std::move(order));
    pending_ids_.push_back(id);

    logger_->debug("[Order] created {} {} {} x{}", id, orderTypeToString(type),
                   orderSideToString(side), quantity);
    return inserted.first->second;
}

const Order& OrderManager::createMarketOrder(const std::string& symbol, OrderSide side, Quantity quantity,
                                             const std::string& strategy_id) {
    return createOrder(symbol, side, quantity, OrderType::MARKET, std::nullopt, std::nullopt, strategy_id);
}

const Order& OrderManager::createLimitOrder(const std::string& symbol, OrderSide side, Quantity quantity,
                                            double price, const std::string& strategy_id) {
    return createOrder(symbol, side, quantity, OrderType::LIMIT, price, std::nullopt, strategy_id);
}

const Order& OrderManager::createStopOrder(const std::string& symbol, OrderSide side, Quantity quantity,
                                           double stop_price, const std::string& strategy_id) {
    return createOrder(symbol, side, quantity, OrderType::STOP, std::nullopt, stop_price, strategy_id);
}

const Order& OrderManager::createStopLimitOrder(const std::string& symbol, OrderSide side, Quantity quantity,
                                                double price, double stop_price,
                                                const std::string& strategy_id) {
    return createOrder(symbol, side, quantity, OrderType::STOP_LIMIT, price, stop_price, strategy_id);
}

Order* OrderManager::findOrder(const std::string& order_id) {
    auto it = orders_.find(order_id);
    return it == orders_.end() ? nullptr : &it->second;
}

const Order* OrderManager::getOrder(const std::string& order_id) const {
    auto it = orders_.find(order_id);
    return it == orders_.end() ? nullptr : &it->second;
}

std::vector<Order> OrderManager::collect(const std::vector<std::string>& ids) const {
    std::vector<Order> out;
    out.reserve(ids.size());
    for (const auto& id : ids) {
        auto it = orders_.find(id);
        if (it != orders_.end()) {
            out.push_back(it->second);
        }
    }
    return out;
}

std::vector<Order> OrderManager::getAllOrders() const {
    std::vector<Order> out;
    out.reserve(orders_.size());
    for (const auto& [id, order] : orders_) {
        out.push_back(order);
    }
    return out;
}

std::vector<Order> OrderManager::getPendingOrders() const { return collect(pending_ids_); }
std::vector<Order> OrderManager::getActiveOrders() const { return collect(active_ids_); }
std::vector<Order> OrderManager::getCompletedOrders() const { return collect(completed_ids_); }

std::vector<Order> OrderManager::getOrdersBySymbol(const std::string& symbol) const {
    std::vector<Order> out;
    for (const auto& [id, order] : orders_) {
        if (order.symbol == symbol) {
            out.push_back(order);
        }
    }
    return out;
}

std::vector<Order> OrderManager::getOrdersByStrategy(const std::string& strategy_id) const {
    std::vector<Order> out;
    for (const auto& [id, order] : orders_) {
        if (order.strategy_id == strategy_id) {
            out.push_back(order);
        }
    }
    return out;
}

std::vector<Order> OrderManager::getOrdersByStatus(OrderStatus status) const {
    std::vector<Order> out;
    for (const auto& [id, order] : orders_) {
        if (order.status == status) {
            out.push_back(order);
        }
    }
    return out;
}

void OrderManager::removeId(std::vector<std::string>& bucket, const std::string& order_id) {
    bucket.erase(std::remove(bucket.begin(), bucket.end(), order_id), bucket.end());
}

bool OrderManager::submitOrder(const std::string& order_id) {
    Order* order = findOrder(order_id);
    if (!order || !OrderLifecycleStateMachine::apply(*order, OrderEvent::SUBMIT, "", clock_())) {
        logger_->warn("[Order] submit refused: {}", order_id);
        return false;
    }
    removeId(pending_ids_, order_id);
    active_ids_.push_back(order_id);
    logger_->debug("[Order] submitted {}", order_id);
    return true;
}

bool OrderManager::fillOrder(const std::string& order_id, Quantity quantity, double price, double commission) {
    Order* order = findOrder(order_id);
    if (!order || !OrderLifecycleStateMachine::applyFill(*order, quantity, price, commission, clock_())) {
        logger_->warn("[Order] fill refused: {} x{} @ {}", order_id, quantity, price);
        return false;
    }
    if (order->isCompleted()) {
        removeId(active_ids_, order_id);
        completed_ids_.push_back(order_id);
    }
    logger_->debug("[Order] fill {} x{} @ {:.4f} -> {} ({}/{})", order_id, quantity, price,
                   orderStatusToString(order->status), order->filled_quantity, order->quantity);
    return true;
}

bool OrderManager::cancelOrder(const std::string& order_id, const std::string& reason) {
    Order* order = findOrder(order_id);
    if (!order || !OrderLifecycleStateMachine::apply(*order, OrderEvent::CANCEL, reason, clock_())) {
        logger_->warn("[Order] cancel refused: {}", order_id);
        return false;
    }
    removeId(pending_ids_, order_id);
    removeId(active_ids_, order_id);
    completed_ids_.push_back(order_id);
    logger_->info("[Order] cancelled {}: {}", order_id, reason);
    return true;
}

bool OrderManager::rejectOrder(const std::string& order_id, const std::string& reason) {
    Order* order = findOrder(order_id);
    if (!order || !OrderLifecycleStateMachine::apply(*order, OrderEvent::REJECT, reason, clock_())) {
        logger_->warn("[Order] reject refused: {}", order_id);
        return false;
    }
    removeId(pending_ids_, order_id);
    completed_ids_.push_back(order_id);
    logger_->info("[Order] rejected {}: {}", order_id, reason);
    return true;
}

size_t OrderManager::cancelAllOrders(const std::optional<std::string>& symbol) {
    std::vector<std::string> targets;
    for (const auto* bucket : {&pending_ids_, &active_ids_}) {
        for (const auto& id : *bucket) {
            const Order* order = getOrder(id);
            if (order && (!symbol || order->symbol == *symbol)) {
                targets.push_back(id);
            }
        }
    }

    size_t cancelled = 0;
    for (const auto& id : targets) {
        if (cancelOrder(id, "batch cancel")) {
            ++cancelled;
        }
    }
    return cancelled;
}

bool OrderManager::setMetadata(const std::string& order_id, const std::string& key,
                               const strategy::MetadataValue& value) {
    Order* order = findOrder(order_id);
    if (!order) {
        return false;
    }
    order->metadata[key] = value;
    return true;
}

OrderStatistics OrderManager::getStatistics() const {
    OrderStatistics stats;
    stats.total_orders = orders_.size();
    stats.pending_orders = pending_ids_.size();
    stats.active_orders = active_ids_.size();
    stats.completed_orders = completed_ids_.size();
    for (const auto& [id, order] : orders_) {
        switch (order.status) {
            case OrderStatus::FILLED: stats.filled_orders++; break;
            case OrderStatus::CANCELLED: stats.cancelled_orders++; break;
            case OrderStatus::REJECTED: stats.rejected_orders++; break;
            default: break;
        }
    }
    return stats;
}

void OrderManager::clearCompletedOrders() {
    for (const auto& id : completed_ids_) {
        orders_.erase(id);
    }
    completed_ids_.clear();
}

void OrderManager::reset() {
    orders_.clear();
    pending_ids_.clear();
    active_ids_.clear();
    completed_ids_.clear();
    sequence_ = 0;
}

} // namespace execution
} // namespace quantsim
