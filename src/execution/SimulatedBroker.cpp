#include "execution/SimulatedBroker.h"
#include "common/DateUtils.h"
#include "common/Errors.h"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <string>
#include <variant>

namespace quantsim {
namespace execution {

namespace {
constexpr const char* STOP_TRIGGERED_KEY = "stop_triggered";

long long getCurrentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string reasonMessage(const char* reason, const std::string& detail) {
    return std::string(reason) + ": " + detail;
}

bool isWorking(const Order& order) {
    return order.status == OrderStatus::SUBMITTED || order.status == OrderStatus::PARTIAL_FILLED;
}
} // namespace

SimulatedBroker::SimulatedBroker(double initial_capital,
                                 const FrictionParams& friction,
                                 LoggerHandle logger,
                                 OrderManager::Clock clock,
                                 LoggerHandle trade_logger)
    : initial_capital_(initial_capital)
    , friction_(friction)
    , logger_(Logger::orDefault(std::move(logger)))
    , trade_logger_(std::move(trade_logger))
    , clock_(clock ? std::move(clock) : OrderManager::Clock(getCurrentTimeMs))
    , connected_(false)
    , orders_(logger_, clock_)
    , positions_(initial_capital, friction, logger_)
{
    if (friction_.lot_size <= 0) {
        throw ValidationError("lot_size must be positive");
    }
}

bool SimulatedBroker::connect() {
    connected_ = true;
    logger_->info("[Broker] simulated broker connected (capital {:.2f})", initial_capital_);
    return true;
}

bool SimulatedBroker::disconnect() {
    connected_ = false;
    logger_->info("[Broker] simulated broker disconnected");
    return true;
}

std::optional<double> SimulatedBroker::referencePrice(const Order& order) const {
    switch (order.type) {
        case OrderType::LIMIT:
        case OrderType::STOP_LIMIT:
            return order.price;
        case OrderType::STOP:
            return order.stop_price;
        case OrderType::MARKET:
            return positions_.getCurrentPrice(order.symbol);
    }
    return std::nullopt;
}

bool SimulatedBroker::submitOrder(const std::string& order_id) {
    if (!connected_) {
        logger_->warn("[Broker] submit {} refused: {}", order_id, reject_reason::NOT_CONNECTED);
        return false;
    }
    const Order* order = orders_.getOrder(order_id);
    if (!order || order->status != OrderStatus::PENDING) {
        return false;
    }

    if (order->quantity < friction_.lot_size) {
        orders_.rejectOrder(order_id, reasonMessage(reject_reason::BELOW_LOT_SIZE,
            "quantity " + std::to_string(order->quantity) +
            " is below lot size " + std::to_string(friction_.lot_size)));
        return false;
    }
    if (order->quantity % friction_.lot_size != 0) {
        orders_.rejectOrder(order_id, reasonMessage(reject_reason::INVALID_ORDER,
            "quantity " + std::to_string(order->quantity) +
            " is not a multiple of lot size " + std::to_string(friction_.lot_size)));
        return false;
    }

    if (order->isSell()) {
        const Quantity held = positions_.getPositionQuantity(order->symbol);
        if (held < order->quantity) {
            orders_.rejectOrder(order_id, reasonMessage(reject_reason::INSUFFICIENT_POSITION,
                "holding " + std::to_string(held) + ", order " + std::to_string(order->quantity)));
            return false;
        }
    } else if (auto reference = referencePrice(*order)) {
        // Market and stop orders are estimated with slippage, limits at their price
        const bool slipped = (order->type == OrderType::MARKET || order->type == OrderType::STOP);
        const double price = slipped
            ? FrictionModel::effectivePrice(OrderSide::BUY, *reference, friction_)
            : *reference;
        const FillQuote estimate = FrictionModel::quoteAtPrice(OrderSide::BUY, order->quantity, price, friction_);
        if (estimate.totalCost() > positions_.getCash()) {
            char detail[96];
            std::snprintf(detail, sizeof(detail), "need %.2f, available %.2f",
                          estimate.totalCost(), positions_.getCash());
            orders_.rejectOrder(order_id, reasonMessage(reject_reason::INSUFFICIENT_FUNDS, detail));
            return false;
        }
    }

    return orders_.submitOrder(order_id);
}

bool SimulatedBroker::cancelOrder(const std::string& order_id) {
    return orders_.cancelOrder(order_id, "cancelled by user");
}

std::optional<OrderStatus> SimulatedBroker::getOrderStatus(const std::string& order_id) const {
    const Order* order = orders_.getOrder(order_id);
    if (!order) {
        return std::nullopt;
    }
    return order->status;
}

std::optional<double> SimulatedBroker::executionPrice(const Order& order, double market_price) {
    const bool buy = order.isBuy();
    const auto limitPrice = [&]() -> std::optional<double> {
        const double limit = order.price.value_or(0.0);
        const bool marketable = buy ? market_price <= limit : market_price >= limit;
        if (!marketable) {
            return std::nullopt;
        }
        return limit;
    };
    const auto stopCrossed = [&]() {
        const double stop = order.stop_price.value_or(0.0);
        return buy ? market_price >= stop : market_price <= stop;
    };

    switch (order.type) {
        case OrderType::MARKET:
            return FrictionModel::effectivePrice(order.side, market_price, friction_);
        case OrderType::LIMIT:
            return limitPrice();
        case OrderType::STOP:
            if (!stopCrossed()) {
                return std::nullopt;
            }
            return FrictionModel::effectivePrice(order.side, market_price, friction_);
        case OrderType::STOP_LIMIT: {
            auto it = order.metadata.find(STOP_TRIGGERED_KEY);
            const bool triggered = it != order.metadata.end() &&
                std::holds_alternative<bool>(it->second) && std::get<bool>(it->second);
            if (!triggered) {
                if (!stopCrossed()) {
                    return std::nullopt;
                }
                orders_.setMetadata(order.order_id, STOP_TRIGGERED_KEY, true);
                logger_->info("[Broker] stop-limit {} triggered at {:.4f}", order.order_id, market_price);
            }
            return limitPrice();
        }
    }
    return std::nullopt;
}

bool SimulatedBroker::executeOrder(const std::string& order_id, double market_price) {
    if (!connected_) {
        logger_->warn("[Broker] execute {} refused: {}", order_id, reject_reason::NOT_CONNECTED);
        return false;
    }
    if (!(market_price > 0.0) || !std::isfinite(market_price)) {
        return false;
    }
    const Order* order = orders_.getOrder(order_id);
    if (!order || !isWorking(*order)) {
        return false;
    }
    updateMarketPrice(order->symbol, market_price);

    const auto price = executionPrice(*order, market_price);
    if (!price) {
        return false;
    }

    const Quantity quantity = order->unfilledQuantity();
    const FillQuote fill = FrictionModel::quoteAtPrice(order->side, quantity, *price, friction_);
    if (fill.empty() || fill.quantity != quantity) {
        orders_.cancelOrder(order_id, reasonMessage(reject_reason::INVALID_ORDER,
            "unfilled quantity is not a whole number of lots"));
        return false;
    }

    if (order->isBuy() && fill.totalCost() > positions_.getCash()) {
        char detail[96];
        std::snprintf(detail, sizeof(detail), "need %.2f, available %.2f",
                      fill.totalCost(), positions_.getCash());
        orders_.cancelOrder(order_id, reasonMessage(reject_reason::INSUFFICIENT_FUNDS, detail));
        return false;
    }
    if (order->isSell() && positions_.getPositionQuantity(order->symbol) < quantity) {
        orders_.cancelOrder(order_id, reasonMessage(reject_reason::INSUFFICIENT_POSITION,
            "holding " + std::to_string(positions_.getPositionQuantity(order->symbol)) +
            ", order " + std::to_string(quantity)));
        return false;
    }

    // Both sides were validated above, so the order and the ledger move together
    if (!orders_.fillOrder(order_id, fill.quantity, fill.effective_price, fill.total_fees)) {
        return false;
    }
    const auto profit = positions_.applyFill(order->symbol, fill);
    if (!profit) {
        throw QuantSimError("ledger refused validated fill for " + order_id);
    }
    positions_.updateCurrentPrice(order->symbol, market_price);

    BrokerTrade trade;
    trade.order_id = order_id;
    trade.symbol = order->symbol;
    trade.side = order->side;
    trade.price = fill.effective_price;
    trade.quantity = fill.quantity;
    trade.amount = fill.gross_amount;
    trade.commission = fill.commission;
    trade.stamp_duty = fill.stamp_duty;
    trade.fees = fill.total_fees;
    if (order->isSell()) {
        trade.profit = *profit;
    }
    trade.timestamp = clock_();
    trades_.push_back(trade);

    logger_->info("[Broker] {} {} x{} @ {:.4f} (fees {:.2f}, cash {:.2f})",
                  order_id, orderSideToString(trade.side), trade.quantity, trade.price,
                  trade.fees, positions_.getCash());
    Logger::logTrade(trade_logger_, utils::formatDate(trade.timestamp), trade.symbol,
                     orderSideToString(trade.side), trade.price, trade.quantity,
                     trade.fees, positions_.getCash());
    return true;
}

void SimulatedBroker::updateMarketPrice(const std::string& symbol, double price) {
    positions_.updateCurrentPrice(symbol, price);
}

std::vector<LedgerPosition> SimulatedBroker::getPositions() const {
    return positions_.ledger().openPositions();
}

AccountInfo SimulatedBroker::getAccountInfo() const {
    AccountInfo info;
    info.cash = positions_.getCash();
    info.position_value = positions_.getTotalPositionValue();
    info.total_value = info.cash + info.position_value;
    info.initial_capital = initial_capital_;
    return info;
}

Balance SimulatedBroker::getBalance() const {
    Balance balance;
    balance.cash = positions_.getCash();
    balance.available = balance.cash;
    return balance;
}

std::vector<BrokerTrade> SimulatedBroker::getTodayTrades() const {
    const long long today = utils::dayKey(clock_());
    std::vector<BrokerTrade> out;
    for (const auto& trade : trades_) {
        if (utils::dayKey(trade.timestamp) == today) {
            out.push_back(trade);
        }
    }
    return out;
}

std::vector<BrokerTrade> SimulatedBroker::getAllTrades() const {
    return trades_;
}

std::vector<Order> SimulatedBroker::getTodayOrders() const {
    const long long today = utils::dayKey(clock_());
    std::vector<Order> out;
    for (const auto& order : orders_.getAllOrders()) {
        if (utils::dayKey(order.create_time) == today) {
            out.push_back(order);
        }
    }
    return out;
}

void SimulatedBroker::reset() {
    orders_.reset();
    positions_.reset();
    trades_.clear();
}

} // namespace execution
} // namespace quantsim
