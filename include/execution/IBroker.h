#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"
#include "execution/Ledger.h"
#include "execution/Order.h"

namespace quantsim {
namespace execution {

struct AccountInfo {
    double total_value = 0.0;
    double cash = 0.0;
    double position_value = 0.0;
    double initial_capital = 0.0;
};

struct Balance {
    double cash = 0.0;
    double available = 0.0;
};

// One executed fill as reported by a broker
struct BrokerTrade {
    std::string order_id;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double price = 0.0;
    Quantity quantity = 0;
    double amount = 0.0;
    double commission = 0.0;
    double stamp_duty = 0.0;
    double fees = 0.0;
    std::optional<double> profit;   // sells only
    Timestamp timestamp = 0;
};

// 브로커 인터페이스. Orders are identified by the ids the OrderManager issued.
class IBroker {
public:
    virtual ~IBroker() = default;

    virtual bool connect() = 0;
    virtual bool disconnect() = 0;
    virtual bool isConnected() const = 0;

    virtual bool submitOrder(const std::string& order_id) = 0;
    virtual bool cancelOrder(const std::string& order_id) = 0;
    virtual std::optional<OrderStatus> getOrderStatus(const std::string& order_id) const = 0;

    virtual std::vector<LedgerPosition> getPositions() const = 0;
    virtual AccountInfo getAccountInfo() const = 0;
    virtual Balance getBalance() const = 0;
    // "Today" is the calendar day (UTC) of the broker's clock
    virtual std::vector<BrokerTrade> getTodayTrades() const = 0;
    virtual std::vector<Order> getTodayOrders() const = 0;
};

} // namespace execution
} // namespace quantsim
