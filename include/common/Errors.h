#pragma once

#include <stdexcept>
#include <string>

namespace quantsim {

class QuantSimError : public std::runtime_error {
public:
    explicit QuantSimError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed series, invalid parameters or config values
class ValidationError : public QuantSimError {
public:
    explicit ValidationError(const std::string& message) : QuantSimError(message) {}
};

class EmptyDataError : public ValidationError {
public:
    explicit EmptyDataError(const std::string& message) : ValidationError(message) {}
};

// Bar file missing or unreadable
class DataLoadError : public QuantSimError {
public:
    explicit DataLoadError(const std::string& message) : QuantSimError(message) {}
};

// Rejection reasons used by the order path
namespace reject_reason {
constexpr const char* INSUFFICIENT_FUNDS = "InsufficientFunds";
constexpr const char* INSUFFICIENT_POSITION = "InsufficientPosition";
constexpr const char* BELOW_LOT_SIZE = "BelowLotSize";
constexpr const char* INVALID_ORDER = "InvalidOrder";
constexpr const char* NOT_CONNECTED = "NotConnected";
}

} // namespace quantsim
