#include "execution/Ledger.h"

#include <algorithm>
#include <cmath>

namespace quantsim {
namespace execution {

Ledger::Ledger(double initial_cash)
    : cash_(initial_cash) {}

void Ledger::reset(double initial_cash) {
    cash_ = initial_cash;
    positions_.clear();
}

const LedgerPosition* Ledger::find(const std::string& symbol) const {
    auto it = positions_.find(symbol);
    if (it == positions_.end() || it->second.quantity <= 0) {
        return nullptr;
    }
    return &it->second;
}

Quantity Ledger::quantityOf(const std::string& symbol) const {
    const auto* pos = find(symbol);
    return pos ? pos->quantity : 0;
}

std::vector<LedgerPosition> Ledger::openPositions() const {
    std::vector<LedgerPosition> out;
    for (const auto& [symbol, pos] : positions_) {
        if (pos.quantity > 0) {
            out.push_back(pos);
        }
    }
    return out;
}

void Ledger::applyBuy(const std::string& symbol, Quantity quantity, double gross_amount, double fees) {
    if (quantity <= 0) {
        return;
    }
    auto& pos = positions_[symbol];
    pos.symbol = symbol;
    pos.total_cost += gross_amount;
    pos.quantity += quantity;
    pos.average_cost = pos.total_cost / static_cast<double>(pos.quantity);
    cash_ -= (gross_amount + fees);
}

double Ledger::applySell(const std::string& symbol, Quantity quantity, double gross_amount, double fees) {
    auto it = positions_.find(symbol);
    if (it == positions_.end() || quantity <= 0) {
        return 0.0;
    }
    auto& pos = it->second;
    if (quantity > pos.quantity) {
        quantity = pos.quantity;
    }

    const double cost_basis = static_cast<double>(quantity) * pos.average_cost;
    cash_ += (gross_amount - fees);

    pos.quantity -= quantity;
    if (pos.quantity <= 0) {
        pos.quantity = 0;
        pos.total_cost = 0.0;
        pos.average_cost = 0.0;
    } else {
        pos.total_cost = static_cast<double>(pos.quantity) * pos.average_cost;
    }
    return cost_basis;
}

double Ledger::marketValue(const std::map<std::string, double>& prices) const {
    double value = 0.0;
    for (const auto& [symbol, pos] : positions_) {
        if (pos.quantity <= 0) {
            continue;
        }
        auto price_it = prices.find(symbol);
        if (price_it != prices.end()) {
            value += static_cast<double>(pos.quantity) * price_it->second;
        }
    }
    return value;
}

bool Ledger::isConsistent(double tolerance) const {
    for (const auto& [symbol, pos] : positions_) {
        if (pos.quantity < 0 || pos.average_cost < 0.0) {
            return false;
        }
        if (pos.quantity == 0 && (pos.average_cost != 0.0 || pos.total_cost != 0.0)) {
            return false;
        }
        const double expected = static_cast<double>(pos.quantity) * pos.average_cost;
        if (std::fabs(expected - pos.total_cost) > tolerance * std::max(1.0, std::fabs(expected))) {
            return false;
        }
    }
    return true;
}

} // namespace execution
} // namespace quantsim
