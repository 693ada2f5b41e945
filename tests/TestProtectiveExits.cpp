#include "risk/ProtectiveExits.h"
#include "risk/PositionManager.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <variant>

using namespace quantsim;
using quantsim::execution::LedgerPosition;
using quantsim::risk::ProtectiveExits;
using quantsim::strategy::ExitRules;
using quantsim::strategy::Signal;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

LedgerPosition held(const std::string& symbol, Quantity quantity, double average_cost) {
    LedgerPosition position;
    position.symbol = symbol;
    position.quantity = quantity;
    position.average_cost = average_cost;
    position.total_cost = average_cost * static_cast<double>(quantity);
    return position;
}

std::string reasonOf(const Signal& signal) {
    auto it = signal.metadata.find("reason");
    assert(it != signal.metadata.end());
    return std::get<std::string>(it->second);
}

ExitRules rules(std::optional<double> stop_loss, std::optional<double> take_profit) {
    ExitRules r;
    r.stop_loss = stop_loss;
    r.take_profit = take_profit;
    return r;
}
}

int main() {
    const Timestamp ts = 1700000000000LL;

    // Stop-loss and take-profit each close the whole holding
    {
        ProtectiveExits exits(rules(0.08, 0.15));
        assert(exits.enabled());

        const std::vector<LedgerPosition> positions = {
            held("600000", 500, 10.0),   // -10%
            held("000001", 300, 20.0),   // +17.5%
            held("600519", 200, 5.0),    // +2%
            held("000002", 100, 8.0),    // no price
        };
        const std::map<std::string, double> prices = {
            {"600000", 9.0}, {"000001", 23.5}, {"600519", 5.1}};

        auto stops = exits.applyStopLoss(positions, prices, ts);
        assert(stops.size() == 1);
        assert(stops[0].symbol == "600000");
        assert(stops[0].isSell());
        assert(stops[0].quantity && *stops[0].quantity == 500);
        assert(stops[0].timestamp == ts);
        assert(near(stops[0].price, 9.0));
        assert(reasonOf(stops[0]) == "stop_loss");
        assert(near(std::get<double>(stops[0].metadata.at("loss_ratio")), -0.1));

        auto takes = exits.applyTakeProfit(positions, prices, ts);
        assert(takes.size() == 1);
        assert(takes[0].symbol == "000001");
        assert(takes[0].quantity && *takes[0].quantity == 300);
        assert(reasonOf(takes[0]) == "take_profit");
        assert(near(std::get<double>(takes[0].metadata.at("profit_ratio")), 0.175));

        auto all = exits.evaluate(positions, prices, ts);
        assert(all.size() == 2);
        assert(reasonOf(all[0]) == "stop_loss");
        assert(reasonOf(all[1]) == "take_profit");
        std::cout << "[TEST] ProtectiveExits thresholds PASSED" << std::endl;
    }

    // An unset ratio disables that exit
    {
        ProtectiveExits stop_only(rules(0.05, std::nullopt));
        const std::vector<LedgerPosition> positions = {held("600000", 100, 10.0)};
        assert(stop_only.applyTakeProfit(positions, {{"600000", 50.0}}, ts).empty());
        assert(stop_only.evaluate(positions, {{"600000", 50.0}}, ts).empty());
        assert(stop_only.evaluate(positions, {{"600000", 9.0}}, ts).size() == 1);

        ProtectiveExits none(ExitRules{});
        assert(!none.enabled());
        assert(none.evaluate(positions, {{"600000", 1.0}}, ts).empty());
        assert(none.evaluate(positions, {{"600000", 100.0}}, ts).empty());
        std::cout << "[TEST] ProtectiveExits unset rules PASSED" << std::endl;
    }

    // Empty and unpriced holdings never exit
    {
        ProtectiveExits exits(rules(0.08, 0.15));
        const std::vector<LedgerPosition> positions = {held("600000", 0, 10.0), held("000001", 100, 10.0)};
        assert(exits.evaluate(positions, {{"600000", 1.0}}, ts).empty());
        assert(exits.evaluate(positions, {}, ts).empty());
        std::cout << "[TEST] ProtectiveExits skipped holdings PASSED" << std::endl;
    }

    // Out-of-range ratios are refused
    {
        bool thrown = false;
        try {
            ProtectiveExits exits(rules(1.5, std::nullopt));
        } catch (const ValidationError&) {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        try {
            ProtectiveExits exits(rules(0.08, -0.1));
        } catch (const ValidationError&) {
            thrown = true;
        }
        assert(thrown);
        std::cout << "[TEST] ProtectiveExits validation PASSED" << std::endl;
    }

    // PositionManager holdings at their last known prices
    {
        risk::PositionManager pm(100000.0);
        assert(pm.updatePosition("600000", 1000, 10.0, true));
        assert(pm.updatePosition("000001", 500, 20.0, true));
        pm.updateCurrentPrice("600000", 9.0);
        pm.updateCurrentPrice("000001", 20.5);

        ProtectiveExits exits(rules(0.08, 0.15));
        auto signals = exits.evaluate(pm, ts);
        assert(signals.size() == 1);
        assert(signals[0].symbol == "600000");
        assert(*signals[0].quantity == 1000);
        assert(reasonOf(signals[0]) == "stop_loss");

        pm.updateCurrentPrice("000001", 23.0);
        signals = exits.evaluate(pm, ts);
        assert(signals.size() == 2);
        assert(signals[1].symbol == "000001");
        assert(reasonOf(signals[1]) == "take_profit");
        std::cout << "[TEST] ProtectiveExits PositionManager PASSED" << std::endl;
    }

    // 리스크 금액 기준 수량
    {
        assert(ProtectiveExits::calculatePositionSize(10.0, 1000000.0) == 2000);
        assert(ProtectiveExits::calculatePositionSize(10.0, 1000000.0, 0.0234) == 2300);
        assert(ProtectiveExits::calculatePositionSize(300.0, 1000000.0) == 100);
        assert(ProtectiveExits::calculatePositionSize(10.0, 1000000.0, 0.02, 10) == 2000);
        assert(ProtectiveExits::calculatePositionSize(0.0, 1000000.0) == 0);
        assert(ProtectiveExits::calculatePositionSize(10.0, 0.0) == 0);
        assert(ProtectiveExits::calculatePositionSize(10.0, 1000000.0, 0.0) == 0);
        std::cout << "[TEST] ProtectiveExits position size PASSED" << std::endl;
    }

    std::cout << "[TEST] ProtectiveExits ALL PASSED" << std::endl;
    return 0;
}
