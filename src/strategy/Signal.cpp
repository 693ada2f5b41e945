#include "strategy/Signal.h"
#include "common/DateUtils.h"

#include <algorithm>
#include <cctype>

namespace quantsim {
namespace strategy {

const char* signalTypeToString(SignalType type) {
    switch (type) {
        case SignalType::BUY: return "BUY";
        case SignalType::SELL: return "SELL";
        case SignalType::HOLD: return "HOLD";
        case SignalType::CLOSE_LONG: return "CLOSE_LONG";
        case SignalType::CLOSE_SHORT: return "CLOSE_SHORT";
    }
    return "HOLD";
}

std::optional<SignalType> signalTypeFromString(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (v == "BUY") return SignalType::BUY;
    if (v == "SELL") return SignalType::SELL;
    if (v == "HOLD") return SignalType::HOLD;
    if (v == "CLOSE_LONG") return SignalType::CLOSE_LONG;
    if (v == "CLOSE_SHORT") return SignalType::CLOSE_SHORT;
    return std::nullopt;
}

nlohmann::json metadataToJson(const SignalMetadata& metadata) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, value] : metadata) {
        std::visit([&out, &key](const auto& v) { out[key] = v; }, value);
    }
    return out;
}

SignalMetadata metadataFromJson(const nlohmann::json& j) {
    SignalMetadata out;
    if (!j.is_object()) {
        return out;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& v = it.value();
        if (v.is_boolean()) {
            out[it.key()] = v.get<bool>();
        } else if (v.is_number_integer()) {
            out[it.key()] = v.get<long long>();
        } else if (v.is_number()) {
            out[it.key()] = v.get<double>();
        } else if (v.is_string()) {
            out[it.key()] = v.get<std::string>();
        }
        // Nested values are outside the metadata contract and are dropped
    }
    return out;
}

nlohmann::json toJson(const Signal& signal) {
    nlohmann::json j;
    j["symbol"] = signal.symbol;
    j["signal_type"] = signalTypeToString(signal.type);
    j["price"] = signal.price;
    j["timestamp"] = signal.timestamp;
    j["date"] = utils::formatDate(signal.timestamp);
    j["strength"] = signal.strength;
    if (signal.quantity) {
        j["quantity"] = *signal.quantity;
    } else {
        j["quantity"] = nullptr;
    }
    j["metadata"] = metadataToJson(signal.metadata);
    return j;
}

Signal signalFromJson(const nlohmann::json& j) {
    Signal signal;
    signal.symbol = j.value("symbol", std::string());
    signal.type = signalTypeFromString(j.value("signal_type", std::string("HOLD"))).value_or(SignalType::HOLD);
    signal.price = j.value("price", 0.0);
    if (j.contains("timestamp") && j["timestamp"].is_number()) {
        signal.timestamp = j["timestamp"].get<long long>();
    } else if (j.contains("date") && j["date"].is_string()) {
        signal.timestamp = utils::parseTimestamp(j["date"].get<std::string>());
    }
    signal.strength = std::max(0.0, j.value("strength", 1.0));
    if (j.contains("quantity") && j["quantity"].is_number()) {
        signal.quantity = j["quantity"].get<long long>();
    }
    if (j.contains("metadata")) {
        signal.metadata = metadataFromJson(j["metadata"]);
    }
    return signal;
}

} // namespace strategy
} // namespace quantsim
