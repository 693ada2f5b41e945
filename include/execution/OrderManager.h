#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"
#include "common/Logger.h"
#include "execution/Order.h"

namespace quantsim {
namespace execution {

struct OrderStatistics {
    size_t total_orders = 0;
    size_t pending_orders = 0;
    size_t active_orders = 0;
    size_t completed_orders = 0;
    size_t filled_orders = 0;
    size_t cancelled_orders = 0;
    size_t rejected_orders = 0;
};

// Owns every order and keeps the pending / active / completed id buckets in
// step with the lifecycle state machine. Single writer; not thread-safe.
class OrderManager {
public:
    using Clock = std::function<Timestamp()>;

    explicit OrderManager(LoggerHandle logger = nullptr, Clock clock = nullptr);

    // Throws ValidationError for a non-positive quantity or a missing
    // limit/stop price required by the order type
    const Order& createOrder(const std::string& symbol, OrderSide side, Quantity quantity,
                             OrderType type,
                             std::optional<double> price = std::nullopt,
                             std::optional<double> stop_price = std::nullopt,
                             const std::string& strategy_id = "");

    const Order& createMarketOrder(const std::string& symbol, OrderSide side, Quantity quantity,
                                   const std::string& strategy_id = "");
    const Order& createLimitOrder(const std::string& symbol, OrderSide side, Quantity quantity,
                                  double price, const std::string& strategy_id = "");
    const Order& createStopOrder(const std::string& symbol, OrderSide side, Quantity quantity,
                                 double stop_price, const std::string& strategy_id = "");
    const Order& createStopLimitOrder(const std::string& symbol, OrderSide side, Quantity quantity,
                                      double price, double stop_price,
                                      const std::string& strategy_id = "");

    const Order* getOrder(const std::string& order_id) const;

    std::vector<Order> getAllOrders() const;
    std::vector<Order> getPendingOrders() const;
    std::vector<Order> getActiveOrders() const;
    std::vector<Order> getCompletedOrders() const;
    std::vector<Order> getOrdersBySymbol(const std::string& symbol) const;
    std::vector<Order> getOrdersByStrategy(const std::string& strategy_id) const;
    std::vector<Order> getOrdersByStatus(OrderStatus status) const;

    // Each returns false and leaves the order untouched when the state
    // machine refuses the transition
    bool submitOrder(const std::string& order_id);
    bool fillOrder(const std::string& order_id, Quantity quantity, double price, double commission = 0.0);
    bool cancelOrder(const std::string& order_id, const std::string& reason = "");
    bool rejectOrder(const std::string& order_id, const std::string& reason = "");

    // Cancels every pending or active order (optionally one symbol only)
    size_t cancelAllOrders(const std::optional<std::string>& symbol = std::nullopt);

    // Metadata is the only part of an order callers may edit directly
    bool setMetadata(const std::string& order_id, const std::string& key,
                     const strategy::MetadataValue& value);

    OrderStatistics getStatistics() const;

    // Forget every completed (filled/cancelled/rejected) order
    void clearCompletedOrders();
    void reset();

private:
    Order* findOrder(const std::string& order_id);
    std::string nextOrderId(const std::string& symbol, OrderSide side);
    std::vector<Order> collect(const std::vector<std::string>& ids) const;
    static void removeId(std::vector<std::string>& bucket, const std::string& order_id);

    LoggerHandle logger_;
    Clock clock_;
    long long sequence_;

    std::map<std::string, Order> orders_;
    std::vector<std::string> pending_ids_;
    std::vector<std::string> active_ids_;
    std::vector<std::string> completed_ids_;
};

} // namespace execution
} // namespace quantsim
