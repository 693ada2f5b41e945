#pragma once

#include "common/Types.h"

namespace quantsim {
namespace execution {

// Trading costs shared by the backtest loop and the order path
struct FrictionParams {
    double slippage = 0.001;          // adverse price move per side
    double commission_rate = 0.0003;  // both sides
    double stamp_duty_rate = 0.001;   // sell side only
    Quantity lot_size = 100;
    double min_commission = 5.0;
};

struct FillQuote {
    OrderSide side = OrderSide::BUY;
    double effective_price = 0.0;
    Quantity quantity = 0;        // lot-rounded
    double gross_amount = 0.0;    // quantity * effective_price
    double commission = 0.0;
    double stamp_duty = 0.0;
    double total_fees = 0.0;
    // Signed cash change: -(amount + fees) for buys, amount - fees for sells
    double net_cash_flow = 0.0;

    bool empty() const { return quantity <= 0; }
    double totalCost() const { return gross_amount + total_fees; }
    double revenue() const { return gross_amount - total_fees; }
};

// Deterministic, side-effect-free pricing of a fill.
class FrictionModel {
public:
    static Quantity roundToLot(Quantity quantity, Quantity lot_size);
    static Quantity roundToLot(double quantity, Quantity lot_size);

    static double effectivePrice(OrderSide side, double reference_price, const FrictionParams& params);

    // max(amount * rate, minimum); zero amount pays nothing
    static double commissionFor(double amount, const FrictionParams& params);

    static double stampDutyFor(OrderSide side, double amount, const FrictionParams& params);

    // Largest lot-rounded buy quantity whose gross amount fits in cash
    static Quantity maxAffordableQuantity(double cash, double reference_price, const FrictionParams& params);

    // Price a fill of `requested_quantity` at `reference_price` (slippage applied)
    static FillQuote quote(OrderSide side, Quantity requested_quantity,
                           double reference_price, const FrictionParams& params);

    // Same as quote() but the execution price is taken as-is (limit fills)
    static FillQuote quoteAtPrice(OrderSide side, Quantity requested_quantity,
                                  double execution_price, const FrictionParams& params);
};

} // namespace execution
} // namespace quantsim
