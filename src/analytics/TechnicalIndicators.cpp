#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <limits>

namespace quantsim {
namespace analytics {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}

bool TechnicalIndicators::isValid(double value) {
    return !std::isnan(value);
}

std::vector<double> TechnicalIndicators::calculateSMASeries(const std::vector<double>& prices, int period) {
    std::vector<double> out(prices.size(), kNaN);
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return out;
    }

    double window_sum = 0.0;
    for (size_t i = 0; i < prices.size(); ++i) {
        window_sum += prices[i];
        if (i >= static_cast<size_t>(period)) {
            window_sum -= prices[i - period];
        }
        if (i + 1 >= static_cast<size_t>(period)) {
            out[i] = window_sum / period;
        }
    }
    return out;
}

std::vector<double> TechnicalIndicators::calculateEMAVector(const std::vector<double>& prices, int period) {
    std::vector<double> out;
    if (prices.empty() || period <= 0) {
        return out;
    }
    out.reserve(prices.size());

    const double alpha = 2.0 / (static_cast<double>(period) + 1.0);
    double ema = prices.front();
    out.push_back(ema);
    for (size_t i = 1; i < prices.size(); ++i) {
        ema = alpha * prices[i] + (1.0 - alpha) * ema;
        out.push_back(ema);
    }
    return out;
}

std::vector<double> TechnicalIndicators::calculateRSISeries(const std::vector<double>& prices, int period) {
    std::vector<double> out(prices.size(), kNaN);
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return out;
    }

    // Change at index 0 is treated as zero, matching a diff() with the first gap filled
    std::vector<double> gains(prices.size(), 0.0);
    std::vector<double> losses(prices.size(), 0.0);
    for (size_t i = 1; i < prices.size(); ++i) {
        const double change = prices[i] - prices[i - 1];
        if (change > 0) gains[i] = change;
        else losses[i] = -change;
    }

    const auto avg_gain = calculateSMASeries(gains, period);
    const auto avg_loss = calculateSMASeries(losses, period);

    for (size_t i = 0; i < prices.size(); ++i) {
        if (!isValid(avg_gain[i]) || !isValid(avg_loss[i])) {
            continue;
        }
        if (avg_loss[i] < 1e-12) {
            out[i] = (avg_gain[i] < 1e-12) ? kNaN : 100.0;
            continue;
        }
        const double rs = avg_gain[i] / avg_loss[i];
        out[i] = 100.0 - (100.0 / (1.0 + rs));
    }
    return out;
}

TechnicalIndicators::MACDSeries TechnicalIndicators::calculateMACDSeries(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    MACDSeries result;
    if (prices.empty()) {
        return result;
    }

    const auto fast_ema = calculateEMAVector(prices, fast);
    const auto slow_ema = calculateEMAVector(prices, slow);
    if (fast_ema.size() != prices.size() || slow_ema.size() != prices.size()) {
        return result;
    }

    result.macd.reserve(prices.size());
    for (size_t i = 0; i < prices.size(); ++i) {
        result.macd.push_back(fast_ema[i] - slow_ema[i]);
    }

    result.signal = calculateEMAVector(result.macd, signal_period);
    if (result.signal.size() != result.macd.size()) {
        result.signal.assign(result.macd.size(), kNaN);
    }

    result.histogram.reserve(prices.size());
    for (size_t i = 0; i < prices.size(); ++i) {
        result.histogram.push_back(result.macd[i] - result.signal[i]);
    }
    return result;
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    const auto series = calculateSMASeries(prices, period);
    return series.empty() ? kNaN : series.back();
}

std::vector<double> TechnicalIndicators::extractClosePrices(const BarSeries& bars) {
    std::vector<double> closes;
    closes.reserve(bars.size());
    for (const auto& bar : bars) {
        closes.push_back(bar.close);
    }
    return closes;
}

} // namespace analytics
} // namespace quantsim
