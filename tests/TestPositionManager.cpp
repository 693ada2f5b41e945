#include "risk/PositionManager.h"
#include "execution/FrictionModel.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace quantsim;
using quantsim::execution::FrictionModel;
using quantsim::risk::PositionManager;

namespace {
bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}
}

int main() {
    // Weighted-average cost and marking
    {
        PositionManager pm(100000.0);
        assert(pm.updatePosition("600000", 1000, 10.0, true, 5.0));
        assert(near(pm.getCash(), 100000.0 - 10005.0));
        assert(pm.updatePosition("600000", 1000, 12.0, true));

        auto view = pm.getPosition("600000");
        assert(view);
        assert(view->quantity == 2000);
        assert(near(view->average_cost, 11.0));
        // last booked price is the mark
        assert(near(view->current_price, 12.0));

        pm.updateCurrentPrice("600000", 13.0);
        view = pm.getPosition("600000");
        assert(near(view->market_value, 26000.0));
        assert(near(view->profit_loss, 4000.0));
        assert(near(view->profit_loss_ratio, 2.0 / 11.0));
        assert(near(pm.getTotalProfitLoss(), 4000.0));

        // Over-sell is refused without side effects
        const double cash_before = pm.getCash();
        assert(!pm.updatePosition("600000", 3000, 13.0, false));
        assert(pm.getPositionQuantity("600000") == 2000);
        assert(near(pm.getCash(), cash_before));

        assert(pm.updatePosition("600000", 500, 13.0, false));
        view = pm.getPosition("600000");
        assert(view->quantity == 1500);
        assert(near(view->average_cost, 11.0));
        assert(near(pm.getCash(), cash_before + 6500.0));
        assert(pm.ledger().isConsistent());

        assert(!pm.updatePosition("600000", 0, 13.0, true));
        assert(!pm.updatePosition("600000", 100, 0.0, true));
    }

    // Unpriced positions are marked at cost
    {
        PositionManager pm(50000.0);
        execution::FrictionParams params;
        const auto fill = FrictionModel::quoteAtPrice(OrderSide::BUY, 1000, 10.0, params);
        const auto profit = pm.applyFill("000001", fill);
        assert(profit && *profit == 0.0);
        assert(!pm.getCurrentPrice("000001"));
        assert(near(pm.getPositionValue("000001"), 10000.0));
        assert(near(pm.getTotalValue(), 50000.0 - fill.total_fees));

        const auto too_big = FrictionModel::quoteAtPrice(OrderSide::SELL, 2000, 11.0, params);
        assert(!pm.applyFill("000001", too_big));
        const auto sell = FrictionModel::quoteAtPrice(OrderSide::SELL, 400, 11.0, params);
        const auto realized = pm.applyFill("000001", sell);
        assert(realized && near(*realized, 400.0));
        assert(pm.getPositionQuantity("000001") == 600);
    }

    // Weights, concentration and summary
    {
        PositionManager pm(100000.0);
        pm.updatePosition("A", 1000, 20.0, true);
        pm.updatePosition("B", 1000, 20.0, true);
        // cash 60,000, two positions of 20,000
        const auto weights = pm.getPositionWeights();
        assert(weights.size() == 2);
        assert(near(weights.at("A"), 0.2));

        const auto concentration = pm.calculatePositionConcentration();
        assert(near(concentration.max_weight, 0.2));
        assert(near(concentration.avg_weight, 0.2));
        assert(near(concentration.herfindahl, 0.08));

        const auto summary = pm.getPositionSummary();
        assert(summary.position_count == 2);
        assert(near(summary.total_value, 100000.0));
        assert(near(summary.position_value, 40000.0));
        const auto j = risk::toJson(summary);
        assert(j["positions"].size() == 2);
        assert(j["positions"][0]["symbol"] == "A");
    }

    // Rebalance proposes lot-rounded deltas and applies nothing
    {
        PositionManager pm(100000.0);
        pm.updatePosition("A", 1000, 20.0, true);
        pm.updatePosition("C", 300, 10.0, true);

        const std::map<std::string, double> targets = {{"A", 0.1}, {"B", 0.25}};
        const std::map<std::string, double> prices = {{"A", 20.0}, {"B", 33.0}, {"C", 10.0}};
        const auto deltas = pm.rebalancePositions(targets, prices);

        // total 100,000: A target 500 shares, B 25,000 / 33 = 757 -> 700
        assert(deltas.at("A") == -500);
        assert(deltas.at("B") == 700);
        assert(deltas.at("C") == -300);
        assert(pm.getPositionQuantity("A") == 1000);
    }

    // Forced liquidation without fees
    {
        PositionManager pm(100000.0);
        pm.updatePosition("A", 1000, 20.0, true);
        pm.updatePosition("B", 500, 10.0, true);
        const double cash = pm.getCash();

        assert(near(pm.clearPosition("A", 22.0), 22000.0));
        assert(near(pm.getCash(), cash + 22000.0));
        assert(!pm.hasPosition("A"));
        assert(pm.clearPosition("A", 22.0) == 0.0);

        const double total = pm.clearAllPositions({{"B", 9.0}});
        assert(near(total, 4500.0));
        assert(pm.getAllPositions().empty());
        assert(near(pm.getCash(), cash + 26500.0));

        pm.reset();
        assert(near(pm.getCash(), 100000.0));
    }

    std::cout << "[TEST] PositionManager PASSED\n";
    return 0;
}
