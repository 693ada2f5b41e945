#pragma once

#include "common/Types.h"
#include "common/Logger.h"
#include "execution/Ledger.h"
#include "risk/RiskManager.h"
#include "strategy/IStrategy.h"
#include <map>
#include <string>
#include <vector>

namespace quantsim {
namespace risk {

class PositionManager;

// Turns a strategy's stop-loss / take-profit ratios into full-exit SELL
// signals for held positions. The threshold tests are RiskManager's.
class ProtectiveExits {
public:
    // Throws ValidationError when a set ratio is out of range
    explicit ProtectiveExits(const strategy::ExitRules& rules,
                             Quantity lot_size = 100,
                             LoggerHandle logger = nullptr);

    bool enabled() const { return rules_.stop_loss.has_value() || rules_.take_profit.has_value(); }
    const strategy::ExitRules& rules() const { return rules_; }

    // Positions without an entry in `prices` are skipped
    std::vector<strategy::Signal> applyStopLoss(const std::vector<execution::LedgerPosition>& positions,
                                                const std::map<std::string, double>& prices,
                                                Timestamp timestamp) const;
    std::vector<strategy::Signal> applyTakeProfit(const std::vector<execution::LedgerPosition>& positions,
                                                  const std::map<std::string, double>& prices,
                                                  Timestamp timestamp) const;

    // Stop-loss first; a symbol gets at most one exit
    std::vector<strategy::Signal> evaluate(const std::vector<execution::LedgerPosition>& positions,
                                           const std::map<std::string, double>& prices,
                                           Timestamp timestamp) const;

    // PositionManager's open positions at its last known prices
    std::vector<strategy::Signal> evaluate(const PositionManager& positions, Timestamp timestamp) const;

    // 리스크 금액 기준 수량: capital * risk_ratio / price, lot-rounded, at least one lot.
    // 0 for non-positive inputs.
    static Quantity calculatePositionSize(double price,
                                          double total_capital,
                                          double risk_ratio = 0.02,
                                          Quantity lot_size = 100);

private:
    strategy::Signal exitSignal(const execution::LedgerPosition& position,
                                double price,
                                Timestamp timestamp,
                                const char* reason,
                                const char* ratio_key) const;

    strategy::ExitRules rules_;
    LoggerHandle logger_;
    RiskManager risk_;
};

} // namespace risk
} // namespace quantsim
