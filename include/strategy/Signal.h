#pragma once

#include "common/Types.h"
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace quantsim {
namespace strategy {

// 매매 신호 종류
enum class SignalType {
    BUY,
    SELL,
    HOLD,
    CLOSE_LONG,
    CLOSE_SHORT
};

// Metadata values are limited to scalar kinds so they serialize cleanly
using MetadataValue = std::variant<bool, long long, double, std::string>;
using SignalMetadata = std::map<std::string, MetadataValue>;

struct Signal {
    std::string symbol;
    SignalType type;
    double price;                        // reference price at emission
    Timestamp timestamp;                 // bar timestamp the signal belongs to
    double strength;                     // advisory, >= 0
    std::optional<Quantity> quantity;    // requested shares, if any
    SignalMetadata metadata;

    Signal()
        : type(SignalType::HOLD)
        , price(0.0)
        , timestamp(0)
        , strength(1.0)
    {}

    Signal(std::string sym, SignalType t, double p, Timestamp ts, double s = 1.0)
        : symbol(std::move(sym))
        , type(t)
        , price(p)
        , timestamp(ts)
        , strength(s < 0.0 ? 0.0 : s)
    {}

    bool isBuy() const { return type == SignalType::BUY; }
    bool isSell() const { return type == SignalType::SELL; }
    bool isHold() const { return type == SignalType::HOLD; }
    bool isClosePosition() const {
        return type == SignalType::CLOSE_LONG || type == SignalType::CLOSE_SHORT;
    }

    // Requested quantity if present and positive
    std::optional<Quantity> requestedQuantity() const {
        if (quantity && *quantity > 0) {
            return quantity;
        }
        return std::nullopt;
    }
};

const char* signalTypeToString(SignalType type);
std::optional<SignalType> signalTypeFromString(const std::string& value);

nlohmann::json metadataToJson(const SignalMetadata& metadata);
SignalMetadata metadataFromJson(const nlohmann::json& j);

nlohmann::json toJson(const Signal& signal);
Signal signalFromJson(const nlohmann::json& j);

} // namespace strategy
} // namespace quantsim
