#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "common/Types.h"
#include "strategy/Signal.h"

namespace quantsim {
namespace execution {

using OrderMetadata = strategy::SignalMetadata;

// 주문 정보
struct Order {
    std::string order_id;
    std::string symbol;
    OrderSide side;
    Quantity quantity;
    OrderType type;
    std::optional<double> price;        // limit price (LIMIT, STOP_LIMIT)
    std::optional<double> stop_price;   // trigger (STOP, STOP_LIMIT)
    OrderStatus status;
    Quantity filled_quantity;
    double filled_price;                // volume-weighted over fills
    double commission;                  // total fees incl. stamp duty
    std::string strategy_id;
    Timestamp create_time;
    Timestamp update_time;
    std::string message;
    OrderMetadata metadata;

    Order()
        : side(OrderSide::BUY)
        , quantity(0)
        , type(OrderType::MARKET)
        , status(OrderStatus::PENDING)
        , filled_quantity(0)
        , filled_price(0.0)
        , commission(0.0)
        , create_time(0)
        , update_time(0)
    {}

    bool isBuy() const { return side == OrderSide::BUY; }
    bool isSell() const { return side == OrderSide::SELL; }
    bool isActive() const {
        return status == OrderStatus::PENDING ||
               status == OrderStatus::SUBMITTED ||
               status == OrderStatus::PARTIAL_FILLED;
    }
    bool isCompleted() const { return status == OrderStatus::FILLED; }
    bool isCancelled() const { return status == OrderStatus::CANCELLED; }
    bool isRejected() const { return status == OrderStatus::REJECTED; }

    Quantity unfilledQuantity() const { return quantity - filled_quantity; }
    double filledAmount() const { return static_cast<double>(filled_quantity) * filled_price; }
};

nlohmann::json toJson(const Order& order);

// Throws ValidationError on missing fields or unknown enum names
Order orderFromJson(const nlohmann::json& j);

} // namespace execution
} // namespace quantsim
