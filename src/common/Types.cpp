#include "common/Types.h"

#include <algorithm>
#include <cctype>

namespace quantsim {

namespace {
std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}
}

std::optional<OrderSide> orderSideFromString(const std::string& value) {
    const std::string v = toUpperCopy(value);
    if (v == "BUY") return OrderSide::BUY;
    if (v == "SELL") return OrderSide::SELL;
    return std::nullopt;
}

std::optional<OrderType> orderTypeFromString(const std::string& value) {
    const std::string v = toUpperCopy(value);
    if (v == "MARKET") return OrderType::MARKET;
    if (v == "LIMIT") return OrderType::LIMIT;
    if (v == "STOP") return OrderType::STOP;
    if (v == "STOP_LIMIT") return OrderType::STOP_LIMIT;
    return std::nullopt;
}

std::optional<OrderStatus> orderStatusFromString(const std::string& value) {
    const std::string v = toUpperCopy(value);
    if (v == "PENDING") return OrderStatus::PENDING;
    if (v == "SUBMITTED") return OrderStatus::SUBMITTED;
    if (v == "PARTIAL_FILLED") return OrderStatus::PARTIAL_FILLED;
    if (v == "FILLED") return OrderStatus::FILLED;
    if (v == "CANCELLED") return OrderStatus::CANCELLED;
    if (v == "REJECTED") return OrderStatus::REJECTED;
    return std::nullopt;
}

} // namespace quantsim
