#pragma once

#include <string>

#include "common/Types.h"
#include "execution/Order.h"

namespace quantsim {
namespace core {
namespace execution {

enum class OrderEvent {
    SUBMIT,
    FILL,
    CANCEL,
    REJECT
};

const char* orderEventToString(OrderEvent event);

struct OrderLifecycleTransitionResult {
    bool accepted = false;
    OrderStatus status = OrderStatus::PENDING;
    bool terminal = false;
};

// PENDING -> SUBMITTED -> PARTIAL_FILLED -> FILLED, with CANCELLED reachable
// from any active state and REJECTED only from PENDING. Terminal states
// accept nothing. A refused transition never modifies the order.
class OrderLifecycleStateMachine {
public:
    static bool isTerminal(OrderStatus status);
    static bool isActive(OrderStatus status);
    static bool canTransition(OrderStatus from, OrderStatus to);

    // Status an event leads to. For FILL the caller passes the cumulative
    // filled quantity after the fill and the order quantity.
    static OrderLifecycleTransitionResult transition(
        OrderStatus current,
        OrderEvent event,
        Quantity filled_after = 0,
        Quantity order_quantity = 0
    );

    // SUBMIT / CANCEL / REJECT. `message` is stored on CANCEL and REJECT.
    static bool apply(quantsim::execution::Order& order, OrderEvent event,
                      const std::string& message, Timestamp now);

    // Adds a fill: quantity > 0, within the unfilled quantity, order in
    // SUBMITTED or PARTIAL_FILLED. Updates the running VWAP and fees.
    static bool applyFill(quantsim::execution::Order& order, Quantity quantity,
                          double price, double fees, Timestamp now);
};

} // namespace execution
} // namespace core
} // namespace quantsim
