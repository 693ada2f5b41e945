#pragma once

#include <map>
#include <string>
#include <vector>
#include "common/Types.h"

namespace quantsim {
namespace execution {

// Per-symbol holding at weighted-average cost
struct LedgerPosition {
    std::string symbol;
    Quantity quantity = 0;
    double average_cost = 0.0;
    double total_cost = 0.0;
};

// Cash + positions. Mutated only through applyBuy/applySell so the
// quantity/average-cost invariant is kept in one place.
class Ledger {
public:
    explicit Ledger(double initial_cash = 0.0);

    void reset(double initial_cash);

    double cash() const { return cash_; }

    // Holding for symbol, or nullptr when flat
    const LedgerPosition* find(const std::string& symbol) const;
    Quantity quantityOf(const std::string& symbol) const;

    // Open positions only, ordered by symbol
    std::vector<LedgerPosition> openPositions() const;

    // Adds quantity at `gross_amount` cost basis and debits amount + fees
    void applyBuy(const std::string& symbol, Quantity quantity, double gross_amount, double fees);

    // Removes quantity, credits amount - fees. Returns the cost basis removed
    // (quantity * average_cost). Caller guarantees quantity <= held.
    double applySell(const std::string& symbol, Quantity quantity, double gross_amount, double fees);

    // Sum of quantity * price using `prices`; symbols without a price are skipped
    double marketValue(const std::map<std::string, double>& prices) const;

    // Invariant check used by tests and debug paths
    bool isConsistent(double tolerance = 1e-6) const;

private:
    double cash_;
    std::map<std::string, LedgerPosition> positions_;
};

} // namespace execution
} // namespace quantsim
