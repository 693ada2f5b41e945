#include "execution/OrderManager.h"
#include "common/Errors.h"

#include <cassert>
#include <iostream>
#include <string>

using namespace quantsim;
using quantsim::execution::Order;
using quantsim::execution::OrderManager;

namespace {
template <typename Fn>
bool throwsValidation(Fn fn) {
    try {
        fn();
    } catch (const ValidationError&) {
        return true;
    }
    return false;
}
}

int main() {
    Timestamp now = 1700000000000LL;
    OrderManager manager(nullptr, [&now]() { return now; });

    // Creation and id format
    {
        const Order& order = manager.createMarketOrder("600000", OrderSide::BUY, 500, "ma_cross");
        assert(order.order_id == "600000_buy_000001");
        assert(order.status == OrderStatus::PENDING);
        assert(order.create_time == now);
        assert(order.strategy_id == "ma_cross");

        const Order& limit = manager.createLimitOrder("600000", OrderSide::SELL, 200, 10.5);
        assert(limit.order_id == "600000_sell_000002");
        assert(limit.price && *limit.price == 10.5);

        assert(manager.getPendingOrders().size() == 2);
        assert(manager.getActiveOrders().empty());
    }

    // Invalid orders are refused at creation
    {
        assert(throwsValidation([&] { manager.createMarketOrder("600000", OrderSide::BUY, 0); }));
        assert(throwsValidation([&] { manager.createMarketOrder("", OrderSide::BUY, 100); }));
        assert(throwsValidation([&] {
            manager.createOrder("600000", OrderSide::BUY, 100, OrderType::LIMIT);
        }));
        assert(throwsValidation([&] {
            manager.createOrder("600000", OrderSide::BUY, 100, OrderType::STOP_LIMIT, 10.0);
        }));
        assert(manager.getStatistics().total_orders == 2);
    }

    // Submit, partial fill, fill
    {
        const std::string id = "600000_buy_000001";
        now += 1000;
        assert(manager.submitOrder(id));
        assert(!manager.submitOrder(id));
        assert(manager.getActiveOrders().size() == 1);
        assert(manager.getPendingOrders().size() == 1);

        assert(manager.fillOrder(id, 200, 10.0, 5.0));
        assert(manager.getOrder(id)->status == OrderStatus::PARTIAL_FILLED);
        assert(manager.getOrder(id)->unfilledQuantity() == 300);

        // Overfill is refused and changes nothing
        assert(!manager.fillOrder(id, 400, 10.0, 5.0));
        assert(manager.getOrder(id)->filled_quantity == 200);

        assert(manager.fillOrder(id, 300, 10.5, 5.0));
        const Order* filled = manager.getOrder(id);
        assert(filled->status == OrderStatus::FILLED);
        assert(filled->filled_price > 10.29 && filled->filled_price < 10.31);
        assert(filled->update_time == now);
        assert(manager.getCompletedOrders().size() == 1);
        assert(manager.getActiveOrders().empty());

        // Cancelling a filled order fails and leaves it unchanged
        assert(!manager.cancelOrder(id, "late"));
        assert(manager.getOrder(id)->status == OrderStatus::FILLED);
        assert(manager.getOrder(id)->message.empty());
    }

    // Reject only from PENDING
    {
        const Order& a = manager.createMarketOrder("000001", OrderSide::BUY, 100);
        const std::string a_id = a.order_id;
        assert(manager.submitOrder(a_id));
        assert(!manager.rejectOrder(a_id, "InsufficientFunds: need 1.00"));
        assert(manager.getOrder(a_id)->status == OrderStatus::SUBMITTED);

        const Order& b = manager.createMarketOrder("000001", OrderSide::BUY, 100);
        const std::string b_id = b.order_id;
        assert(manager.rejectOrder(b_id, "InsufficientFunds: need 1.00"));
        assert(manager.getOrder(b_id)->isRejected());
        assert(manager.getOrder(b_id)->message == "InsufficientFunds: need 1.00");
    }

    // Batch cancel by symbol covers pending and active orders
    {
        assert(manager.cancelAllOrders(std::string("000001")) == 1);
        assert(manager.getOrdersBySymbol("000001").size() == 2);
        assert(manager.getOrdersByStatus(OrderStatus::CANCELLED).size() == 1);

        // the pending 600000 sell remains
        assert(manager.getPendingOrders().size() == 1);
        assert(manager.cancelAllOrders() == 1);
        assert(manager.getPendingOrders().empty());
        assert(manager.getOrder("600000_sell_000002")->message == "batch cancel");
    }

    // Metadata, statistics, cleanup
    {
        assert(manager.setMetadata("600000_buy_000001", "note", std::string("first")));
        assert(!manager.setMetadata("missing", "note", std::string("x")));
        assert(manager.getOrdersByStrategy("ma_cross").size() == 1);

        auto stats = manager.getStatistics();
        assert(stats.total_orders == 4);
        assert(stats.filled_orders == 1);
        assert(stats.cancelled_orders == 2);
        assert(stats.rejected_orders == 1);
        assert(stats.pending_orders == 0);
        assert(stats.active_orders == 0);

        manager.clearCompletedOrders();
        assert(manager.getAllOrders().empty());

        manager.reset();
        const Order& fresh = manager.createMarketOrder("600000", OrderSide::BUY, 100);
        assert(fresh.order_id == "600000_buy_000001");
    }

    // JSON round trip of a single order
    {
        const Order& order = manager.createStopLimitOrder("600519", OrderSide::SELL, 100, 1500.0, 1490.0, "rsi");
        const auto j = execution::toJson(order);
        const Order back = execution::orderFromJson(j);
        assert(back.order_id == order.order_id);
        assert(back.type == OrderType::STOP_LIMIT);
        assert(back.price && *back.price == 1500.0);
        assert(back.stop_price && *back.stop_price == 1490.0);
        assert(back.strategy_id == "rsi");
        assert(throwsValidation([] { execution::orderFromJson(nlohmann::json::object()); }));
    }

    std::cout << "[TEST] OrderManager PASSED\n";
    return 0;
}
