#pragma once

#include <vector>
#include "common/Types.h"

namespace quantsim {
namespace analytics {

// Full-length indicator series over bar closes. Positions inside the warm-up
// window (or otherwise undefined) hold NaN; check with isValid().
class TechnicalIndicators {
public:
    static bool isValid(double value);

    // SMA (Simple Moving Average) - rolling window mean
    static std::vector<double> calculateSMASeries(const std::vector<double>& prices, int period);

    // EMA with span `period`, alpha = 2/(period+1), seeded with the first price
    static std::vector<double> calculateEMAVector(const std::vector<double>& prices, int period);

    // RSI from rolling-mean gains/losses over `period` price changes.
    // 100 when there were no losses, NaN when the window saw no movement at all.
    static std::vector<double> calculateRSISeries(const std::vector<double>& prices, int period = 14);

    struct MACDSeries {
        std::vector<double> macd;       // EMA(fast) - EMA(slow)
        std::vector<double> signal;     // EMA(macd, signal_period)
        std::vector<double> histogram;  // macd - signal
    };
    static MACDSeries calculateMACDSeries(const std::vector<double>& prices,
                                          int fast = 12, int slow = 26, int signal_period = 9);

    // Latest SMA value (NaN if not enough data)
    static double calculateSMA(const std::vector<double>& prices, int period);

    static std::vector<double> extractClosePrices(const BarSeries& bars);
};

} // namespace analytics
} // namespace quantsim
