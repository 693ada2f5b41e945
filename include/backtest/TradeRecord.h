#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "common/Types.h"

namespace quantsim {
namespace backtest {

// One executed fill. Append-only.
struct TradeRecord {
    Timestamp timestamp = 0;
    std::string symbol;
    OrderSide direction = OrderSide::BUY;
    double price = 0.0;           // effective (slipped) price
    Quantity quantity = 0;
    double amount = 0.0;          // quantity * price
    double commission = 0.0;
    double stamp_duty = 0.0;
    double fees = 0.0;            // commission + stamp_duty
    double cash_after = 0.0;
    // Sell only: amount - quantity * average_cost (fees excluded)
    std::optional<double> profit;
};

// End-of-day valuation, one per simulated date
struct DailySnapshot {
    Timestamp timestamp = 0;
    double total_value = 0.0;
    double cash = 0.0;
    double position_value = 0.0;
};

nlohmann::json toJson(const TradeRecord& trade);
nlohmann::json toJson(const DailySnapshot& snapshot);

} // namespace backtest
} // namespace quantsim
