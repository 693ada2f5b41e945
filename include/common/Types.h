#pragma once

#include <string>
#include <vector>
#include <optional>

namespace quantsim {

// Epoch milliseconds (UTC)
using Timestamp = long long;
using Price = double;
using Quantity = long long;
using Amount = double;

enum class OrderSide { BUY, SELL };
enum class OrderType { MARKET, LIMIT, STOP, STOP_LIMIT };
enum class OrderStatus { PENDING, SUBMITTED, PARTIAL_FILLED, FILLED, CANCELLED, REJECTED };

// One OHLCV(+amount) record
struct Bar {
    Timestamp timestamp;
    double open;
    double high;
    double low;
    double close;
    double volume;
    double amount;

    Bar() : timestamp(0), open(0), high(0), low(0), close(0), volume(0), amount(0) {}

    Bar(Timestamp t, double o, double h, double l, double c, double v, double a = 0.0)
        : timestamp(t), open(o), high(h), low(l), close(c), volume(v), amount(a) {}
};

using BarSeries = std::vector<Bar>;

inline const char* orderSideToString(OrderSide side) {
    return (side == OrderSide::BUY) ? "BUY" : "SELL";
}

inline const char* orderTypeToString(OrderType type) {
    switch (type) {
        case OrderType::MARKET: return "MARKET";
        case OrderType::LIMIT: return "LIMIT";
        case OrderType::STOP: return "STOP";
        case OrderType::STOP_LIMIT: return "STOP_LIMIT";
    }
    return "MARKET";
}

inline const char* orderStatusToString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "PENDING";
        case OrderStatus::SUBMITTED: return "SUBMITTED";
        case OrderStatus::PARTIAL_FILLED: return "PARTIAL_FILLED";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::CANCELLED: return "CANCELLED";
        case OrderStatus::REJECTED: return "REJECTED";
    }
    return "UNKNOWN";
}

std::optional<OrderSide> orderSideFromString(const std::string& value);
std::optional<OrderType> orderTypeFromString(const std::string& value);
std::optional<OrderStatus> orderStatusFromString(const std::string& value);

} // namespace quantsim
