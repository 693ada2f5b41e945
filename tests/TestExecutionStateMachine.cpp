#include "core/execution/OrderLifecycleStateMachine.h"

#include <cassert>
#include <iostream>

using quantsim::OrderStatus;
using quantsim::core::execution::OrderEvent;
using quantsim::core::execution::OrderLifecycleStateMachine;
using quantsim::execution::Order;

namespace {
Order makeOrder(long long quantity) {
    Order order;
    order.order_id = "600000_buy_000001";
    order.symbol = "600000";
    order.quantity = quantity;
    return order;
}
}

int main() {
    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::PENDING, OrderEvent::SUBMIT);
        assert(r.accepted);
        assert(r.status == OrderStatus::SUBMITTED);
        assert(!r.terminal);
    }

    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::SUBMITTED, OrderEvent::FILL, 100, 300);
        assert(r.accepted);
        assert(r.status == OrderStatus::PARTIAL_FILLED);
        assert(!r.terminal);
    }

    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::PARTIAL_FILLED, OrderEvent::FILL, 300, 300);
        assert(r.accepted);
        assert(r.status == OrderStatus::FILLED);
        assert(r.terminal);
    }

    {
        // Overfill and empty fills are refused
        auto over = OrderLifecycleStateMachine::transition(OrderStatus::SUBMITTED, OrderEvent::FILL, 400, 300);
        assert(!over.accepted);
        assert(over.status == OrderStatus::SUBMITTED);
        auto none = OrderLifecycleStateMachine::transition(OrderStatus::SUBMITTED, OrderEvent::FILL, 0, 300);
        assert(!none.accepted);
    }

    {
        // A pending order cannot fill before submission
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::PENDING, OrderEvent::FILL, 100, 100);
        assert(!r.accepted);
        assert(r.status == OrderStatus::PENDING);
    }

    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::PARTIAL_FILLED, OrderEvent::CANCEL);
        assert(r.accepted);
        assert(r.status == OrderStatus::CANCELLED);
        assert(r.terminal);
    }

    {
        // REJECTED only from PENDING
        auto ok = OrderLifecycleStateMachine::transition(OrderStatus::PENDING, OrderEvent::REJECT);
        assert(ok.accepted);
        assert(ok.status == OrderStatus::REJECTED);
        assert(ok.terminal);
        auto late = OrderLifecycleStateMachine::transition(OrderStatus::SUBMITTED, OrderEvent::REJECT);
        assert(!late.accepted);
        assert(late.status == OrderStatus::SUBMITTED);
    }

    {
        // Terminal states accept nothing
        const OrderStatus terminals[] = {OrderStatus::FILLED, OrderStatus::CANCELLED, OrderStatus::REJECTED};
        const OrderEvent events[] = {OrderEvent::SUBMIT, OrderEvent::FILL, OrderEvent::CANCEL, OrderEvent::REJECT};
        for (auto status : terminals) {
            assert(OrderLifecycleStateMachine::isTerminal(status));
            assert(!OrderLifecycleStateMachine::isActive(status));
            for (auto event : events) {
                auto r = OrderLifecycleStateMachine::transition(status, event, 1, 1);
                assert(!r.accepted);
                assert(r.status == status);
            }
        }
    }

    {
        // apply/applyFill drive an order and keep a running VWAP
        Order order = makeOrder(300);
        assert(OrderLifecycleStateMachine::apply(order, OrderEvent::SUBMIT, "", 1000));
        assert(order.status == OrderStatus::SUBMITTED);
        assert(order.update_time == 1000);

        assert(OrderLifecycleStateMachine::applyFill(order, 100, 10.0, 5.0, 2000));
        assert(order.status == OrderStatus::PARTIAL_FILLED);
        assert(OrderLifecycleStateMachine::applyFill(order, 200, 11.5, 6.9, 3000));
        assert(order.status == OrderStatus::FILLED);
        assert(order.filled_quantity == 300);
        assert(order.filled_price > 10.99 && order.filled_price < 11.01);
        assert(order.commission > 11.89 && order.commission < 11.91);

        // Cancelling a filled order fails and leaves it unchanged
        assert(!OrderLifecycleStateMachine::apply(order, OrderEvent::CANCEL, "too late", 4000));
        assert(order.status == OrderStatus::FILLED);
        assert(order.message.empty());
        assert(order.update_time == 3000);
    }

    {
        Order order = makeOrder(100);
        assert(!OrderLifecycleStateMachine::applyFill(order, 100, 10.0, 0.0, 1));
        assert(OrderLifecycleStateMachine::apply(order, OrderEvent::REJECT, "InsufficientFunds: need 1001.00", 5));
        assert(order.status == OrderStatus::REJECTED);
        assert(order.message == "InsufficientFunds: need 1001.00");
        assert(!OrderLifecycleStateMachine::apply(order, OrderEvent::SUBMIT, "", 6));
    }

    std::cout << "[TEST] ExecutionStateMachine PASSED\n";
    return 0;
}
