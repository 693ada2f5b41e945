#include "execution/FrictionModel.h"

#include <algorithm>
#include <cmath>

namespace quantsim {
namespace execution {

Quantity FrictionModel::roundToLot(Quantity quantity, Quantity lot_size) {
    if (quantity <= 0) {
        return 0;
    }
    if (lot_size <= 1) {
        return quantity;
    }
    return (quantity / lot_size) * lot_size;
}

Quantity FrictionModel::roundToLot(double quantity, Quantity lot_size) {
    if (!(quantity > 0.0) || !std::isfinite(quantity)) {
        return 0;
    }
    return roundToLot(static_cast<Quantity>(std::floor(quantity)), lot_size);
}

double FrictionModel::effectivePrice(OrderSide side, double reference_price, const FrictionParams& params) {
    return (side == OrderSide::BUY)
        ? reference_price * (1.0 + params.slippage)
        : reference_price * (1.0 - params.slippage);
}

double FrictionModel::commissionFor(double amount, const FrictionParams& params) {
    if (amount <= 0.0) {
        return 0.0;
    }
    return std::max(amount * params.commission_rate, params.min_commission);
}

double FrictionModel::stampDutyFor(OrderSide side, double amount, const FrictionParams& params) {
    if (side != OrderSide::SELL || amount <= 0.0) {
        return 0.0;
    }
    return amount * params.stamp_duty_rate;
}

Quantity FrictionModel::maxAffordableQuantity(double cash, double reference_price, const FrictionParams& params) {
    const double price = effectivePrice(OrderSide::BUY, reference_price, params);
    if (cash <= 0.0 || price <= 0.0) {
        return 0;
    }
    return roundToLot(cash / price, params.lot_size);
}

FillQuote FrictionModel::quote(OrderSide side, Quantity requested_quantity,
                               double reference_price, const FrictionParams& params) {
    return quoteAtPrice(side, requested_quantity, effectivePrice(side, reference_price, params), params);
}

FillQuote FrictionModel::quoteAtPrice(OrderSide side, Quantity requested_quantity,
                                      double execution_price, const FrictionParams& params) {
    FillQuote fill;
    fill.side = side;
    fill.effective_price = execution_price;
    fill.quantity = (execution_price > 0.0) ? roundToLot(requested_quantity, params.lot_size) : 0;
    if (fill.quantity <= 0) {
        fill.quantity = 0;
        return fill;
    }

    fill.gross_amount = static_cast<double>(fill.quantity) * execution_price;
    fill.commission = commissionFor(fill.gross_amount, params);
    fill.stamp_duty = stampDutyFor(side, fill.gross_amount, params);
    fill.total_fees = fill.commission + fill.stamp_duty;
    fill.net_cash_flow = (side == OrderSide::BUY)
        ? -(fill.gross_amount + fill.total_fees)
        : (fill.gross_amount - fill.total_fees);
    return fill;
}

} // namespace execution
} // namespace quantsim
