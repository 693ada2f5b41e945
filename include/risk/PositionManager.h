#pragma once

#include "common/Types.h"
#include "common/Logger.h"
#include "execution/FrictionModel.h"
#include "execution/Ledger.h"
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace quantsim {
namespace risk {

// 포지션 정보 (marked to the last known price)
struct PositionView {
    std::string symbol;
    Quantity quantity;
    double average_cost;
    double current_price;
    double market_value;
    double profit_loss;         // 미실현 손익
    double profit_loss_ratio;   // 미실현 손익률

    PositionView()
        : quantity(0), average_cost(0), current_price(0)
        , market_value(0), profit_loss(0), profit_loss_ratio(0)
    {}
};

struct PositionSummary {
    double total_value = 0.0;
    double cash = 0.0;
    double position_value = 0.0;
    size_t position_count = 0;
    double total_profit_loss = 0.0;
    std::vector<PositionView> positions;
};

struct PositionConcentration {
    double max_weight = 0.0;
    double avg_weight = 0.0;
    double herfindahl = 0.0;    // sum of squared weights
};

nlohmann::json toJson(const PositionView& position);
nlohmann::json toJson(const PositionSummary& summary);

// Interactive ledger: cash and weighted-average positions plus the last
// price seen for each symbol. Positions without a price are marked at cost.
class PositionManager {
public:
    explicit PositionManager(double initial_capital = 1000000.0,
                             const execution::FrictionParams& friction = execution::FrictionParams(),
                             LoggerHandle logger = nullptr);

    std::optional<PositionView> getPosition(const std::string& symbol) const;
    std::vector<PositionView> getAllPositions() const;
    bool hasPosition(const std::string& symbol) const;
    Quantity getPositionQuantity(const std::string& symbol) const;
    double getPositionValue(const std::string& symbol) const;
    double getTotalPositionValue() const;
    double getTotalValue() const;
    double getTotalProfitLoss() const;
    double getCash() const { return ledger_.cash(); }
    double getInitialCapital() const { return initial_capital_; }

    // Direct booking at `price`. A sell larger than the holding is refused.
    bool updatePosition(const std::string& symbol, Quantity quantity, double price,
                        bool is_buy, double fees = 0.0);

    // Books a priced fill. Returns the realized profit (amount - cost basis,
    // 0 for buys) or nullopt when a sell exceeds the holding.
    std::optional<double> applyFill(const std::string& symbol, const execution::FillQuote& fill);

    void updateCurrentPrice(const std::string& symbol, double price);
    void updateCurrentPrices(const std::map<std::string, double>& prices);
    std::optional<double> getCurrentPrice(const std::string& symbol) const;

    // Market value / total value per held symbol
    std::map<std::string, double> getPositionWeights() const;
    PositionSummary getPositionSummary() const;
    PositionConcentration calculatePositionConcentration() const;

    // Signed, lot-rounded share deltas that would reach the target weights.
    // Nothing is applied. Held symbols absent from targets get -quantity.
    std::map<std::string, Quantity> rebalancePositions(const std::map<std::string, double>& target_weights,
                                                       const std::map<std::string, double>& prices) const;

    // Forced liquidation at `price` without fees. Returns the revenue.
    double clearPosition(const std::string& symbol, double price);
    double clearAllPositions(const std::map<std::string, double>& prices);

    void reset();

    const execution::Ledger& ledger() const { return ledger_; }
    const execution::FrictionParams& friction() const { return friction_; }

private:
    PositionView makeView(const execution::LedgerPosition& position) const;

    double initial_capital_;
    execution::FrictionParams friction_;
    LoggerHandle logger_;
    execution::Ledger ledger_;
    std::map<std::string, double> last_prices_;
};

} // namespace risk
} // namespace quantsim
