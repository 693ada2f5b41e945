#include "backtest/TradeRecord.h"
#include "common/DateUtils.h"

namespace quantsim {
namespace backtest {

nlohmann::json toJson(const TradeRecord& trade) {
    nlohmann::json j;
    j["timestamp"] = trade.timestamp;
    j["date"] = utils::formatDate(trade.timestamp);
    j["symbol"] = trade.symbol;
    j["direction"] = orderSideToString(trade.direction);
    j["price"] = trade.price;
    j["quantity"] = trade.quantity;
    j["amount"] = trade.amount;
    j["commission"] = trade.commission;
    j["stamp_duty"] = trade.stamp_duty;
    j["fees"] = trade.fees;
    j["cash_after"] = trade.cash_after;
    if (trade.profit) {
        j["profit"] = *trade.profit;
    } else {
        j["profit"] = nullptr;
    }
    return j;
}

nlohmann::json toJson(const DailySnapshot& snapshot) {
    return {
        {"timestamp", snapshot.timestamp},
        {"date", utils::formatDate(snapshot.timestamp)},
        {"total_value", snapshot.total_value},
        {"cash", snapshot.cash},
        {"position_value", snapshot.position_value}
    };
}

} // namespace backtest
} // namespace quantsim
