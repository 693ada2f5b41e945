#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/Logger.h"
#include "execution/FrictionModel.h"
#include "execution/IBroker.h"
#include "execution/OrderManager.h"
#include "risk/PositionManager.h"

namespace quantsim {
namespace execution {

// In-process broker. Validates orders on submission, prices fills through
// FrictionModel and books them into its PositionManager.
class SimulatedBroker : public IBroker {
public:
    explicit SimulatedBroker(double initial_capital = 1000000.0,
                             const FrictionParams& friction = FrictionParams(),
                             LoggerHandle logger = nullptr,
                             OrderManager::Clock clock = nullptr,
                             LoggerHandle trade_logger = nullptr);

    bool connect() override;
    bool disconnect() override;
    bool isConnected() const override { return connected_; }

    // Pre-trade validation while PENDING. Failing orders become REJECTED
    // with InsufficientFunds / InsufficientPosition / BelowLotSize / InvalidOrder.
    bool submitOrder(const std::string& order_id) override;
    bool cancelOrder(const std::string& order_id) override;
    std::optional<OrderStatus> getOrderStatus(const std::string& order_id) const override;

    std::vector<LedgerPosition> getPositions() const override;
    AccountInfo getAccountInfo() const override;
    Balance getBalance() const override;
    // Trades and orders whose calendar day matches the broker clock's
    std::vector<BrokerTrade> getTodayTrades() const override;
    std::vector<Order> getTodayOrders() const override;
    // Every trade since construction or the last reset()
    std::vector<BrokerTrade> getAllTrades() const;

    // Tries to fill the unfilled quantity of a submitted order at `market_price`.
    // Returns true when a fill was booked. A non-marketable limit or an
    // untriggered stop stays working; an infeasible fill cancels the order.
    bool executeOrder(const std::string& order_id, double market_price);

    // Last price per symbol, used for valuation and market-order validation
    void updateMarketPrice(const std::string& symbol, double price);

    OrderManager& orders() { return orders_; }
    const OrderManager& orders() const { return orders_; }
    const risk::PositionManager& positions() const { return positions_; }

    void reset();

private:
    // Price a fill at would execute now, or nullopt if not executable yet
    std::optional<double> executionPrice(const Order& order, double market_price);
    // Price used for submission checks
    std::optional<double> referencePrice(const Order& order) const;

    double initial_capital_;
    FrictionParams friction_;
    LoggerHandle logger_;
    LoggerHandle trade_logger_;
    OrderManager::Clock clock_;
    bool connected_;

    OrderManager orders_;
    risk::PositionManager positions_;
    std::vector<BrokerTrade> trades_;
};

} // namespace execution
} // namespace quantsim
