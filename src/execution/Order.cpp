#include "execution/Order.h"
#include "common/Errors.h"

namespace quantsim {
namespace execution {

namespace {

nlohmann::json optionalToJson(const std::optional<double>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

std::optional<double> optionalFromJson(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j.at(key).is_number()) {
        return j.at(key).get<double>();
    }
    return std::nullopt;
}

const nlohmann::json& requireField(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        throw ValidationError(std::string("order JSON missing '") + key + "'");
    }
    return j.at(key);
}

} // namespace

nlohmann::json toJson(const Order& order) {
    nlohmann::json j;
    j["order_id"] = order.order_id;
    j["symbol"] = order.symbol;
    j["direction"] = orderSideToString(order.side);
    j["quantity"] = order.quantity;
    j["order_type"] = orderTypeToString(order.type);
    j["price"] = optionalToJson(order.price);
    j["stop_price"] = optionalToJson(order.stop_price);
    j["status"] = orderStatusToString(order.status);
    j["filled_quantity"] = order.filled_quantity;
    j["filled_price"] = order.filled_price;
    j["commission"] = order.commission;
    j["strategy_id"] = order.strategy_id;
    j["create_time"] = order.create_time;
    j["update_time"] = order.update_time;
    j["message"] = order.message;
    j["metadata"] = strategy::metadataToJson(order.metadata);
    return j;
}

Order orderFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ValidationError("order JSON must be an object");
    }

    Order order;
    order.order_id = j.value("order_id", std::string());
    order.symbol = requireField(j, "symbol").get<std::string>();

    const auto side = orderSideFromString(requireField(j, "direction").get<std::string>());
    if (!side) {
        throw ValidationError("unknown order direction");
    }
    order.side = *side;

    const auto type = orderTypeFromString(requireField(j, "order_type").get<std::string>());
    if (!type) {
        throw ValidationError("unknown order type");
    }
    order.type = *type;

    const auto status = orderStatusFromString(j.value("status", std::string("PENDING")));
    if (!status) {
        throw ValidationError("unknown order status");
    }
    order.status = *status;

    order.quantity = requireField(j, "quantity").get<long long>();
    order.price = optionalFromJson(j, "price");
    order.stop_price = optionalFromJson(j, "stop_price");
    order.filled_quantity = j.value("filled_quantity", 0LL);
    order.filled_price = j.value("filled_price", 0.0);
    order.commission = j.value("commission", 0.0);
    order.strategy_id = j.value("strategy_id", std::string());
    order.create_time = j.value("create_time", 0LL);
    order.update_time = j.value("update_time", order.create_time);
    order.message = j.value("message", std::string());
    if (j.contains("metadata")) {
        order.metadata = strategy::metadataFromJson(j.at("metadata"));
    }
    return order;
}

} // namespace execution
} // namespace quantsim
