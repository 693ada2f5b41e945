#include "core/execution/OrderLifecycleStateMachine.h"

namespace quantsim {
namespace core {
namespace execution {

const char* orderEventToString(OrderEvent event) {
    switch (event) {
        case OrderEvent::SUBMIT: return "SUBMIT";
        case OrderEvent::FILL: return "FILL";
        case OrderEvent::CANCEL: return "CANCEL";
        case OrderEvent::REJECT: return "REJECT";
    }
    return "UNKNOWN";
}

bool OrderLifecycleStateMachine::isTerminal(OrderStatus status) {
    return status == OrderStatus::FILLED ||
           status == OrderStatus::CANCELLED ||
           status == OrderStatus::REJECTED;
}

bool OrderLifecycleStateMachine::isActive(OrderStatus status) {
    return !isTerminal(status);
}

bool OrderLifecycleStateMachine::canTransition(OrderStatus from, OrderStatus to) {
    switch (from) {
        case OrderStatus::PENDING:
            return to == OrderStatus::SUBMITTED ||
                   to == OrderStatus::CANCELLED ||
                   to == OrderStatus::REJECTED;
        case OrderStatus::SUBMITTED:
        case OrderStatus::PARTIAL_FILLED:
            return to == OrderStatus::PARTIAL_FILLED ||
                   to == OrderStatus::FILLED ||
                   to == OrderStatus::CANCELLED;
        case OrderStatus::FILLED:
        case OrderStatus::CANCELLED:
        case OrderStatus::REJECTED:
            return false;
    }
    return false;
}

OrderLifecycleTransitionResult OrderLifecycleStateMachine::transition(
    OrderStatus current,
    OrderEvent event,
    Quantity filled_after,
    Quantity order_quantity
) {
    OrderLifecycleTransitionResult result;
    result.status = current;
    result.terminal = isTerminal(current);

    OrderStatus target = current;
    switch (event) {
        case OrderEvent::SUBMIT:
            target = OrderStatus::SUBMITTED;
            break;
        case OrderEvent::CANCEL:
            target = OrderStatus::CANCELLED;
            break;
        case OrderEvent::REJECT:
            target = OrderStatus::REJECTED;
            break;
        case OrderEvent::FILL:
            if (filled_after <= 0 || filled_after > order_quantity) {
                return result;
            }
            target = (filled_after == order_quantity)
                ? OrderStatus::FILLED
                : OrderStatus::PARTIAL_FILLED;
            break;
    }

    if (!canTransition(current, target)) {
        return result;
    }

    result.accepted = true;
    result.status = target;
    result.terminal = isTerminal(target);
    return result;
}

bool OrderLifecycleStateMachine::apply(quantsim::execution::Order& order, OrderEvent event,
                                       const std::string& message, Timestamp now) {
    if (event == OrderEvent::FILL) {
        return false;
    }
    const auto result = transition(order.status, event);
    if (!result.accepted) {
        return false;
    }
    order.status = result.status;
    order.update_time = now;
    if (event != OrderEvent::SUBMIT) {
        order.message = message;
    }
    return true;
}

bool OrderLifecycleStateMachine::applyFill(quantsim::execution::Order& order, Quantity quantity,
                                           double price, double fees, Timestamp now) {
    if (quantity <= 0 || quantity > order.unfilledQuantity() || price <= 0.0) {
        return false;
    }
    const Quantity filled_after = order.filled_quantity + quantity;
    const auto result = transition(order.status, OrderEvent::FILL, filled_after, order.quantity);
    if (!result.accepted) {
        return false;
    }

    const double prior_amount = static_cast<double>(order.filled_quantity) * order.filled_price;
    order.filled_quantity = filled_after;
    order.filled_price = (prior_amount + static_cast<double>(quantity) * price) /
                         static_cast<double>(filled_after);
    order.commission += fees;
    order.status = result.status;
    order.update_time = now;
    return true;
}

} // namespace execution
} // namespace core
} // namespace quantsim
