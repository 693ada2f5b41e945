#include "backtest/PerformanceAnalyzer.h"
#include "common/DateUtils.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace quantsim;
using quantsim::backtest::BenchmarkReturns;
using quantsim::backtest::DailySnapshot;
using quantsim::backtest::PerformanceAnalyzer;
using quantsim::backtest::TradeRecord;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

std::vector<DailySnapshot> makeSnapshots(const std::vector<double>& values) {
    std::vector<DailySnapshot> out;
    const Timestamp start = utils::parseDate("2024-01-02");
    for (size_t i = 0; i < values.size(); ++i) {
        DailySnapshot s;
        s.timestamp = start + static_cast<Timestamp>(i) * utils::MS_PER_DAY;
        s.total_value = values[i];
        s.cash = values[i];
        out.push_back(s);
    }
    return out;
}

TradeRecord sell(double profit) {
    TradeRecord t;
    t.direction = OrderSide::SELL;
    t.profit = profit;
    return t;
}

TradeRecord buy() {
    TradeRecord t;
    t.direction = OrderSide::BUY;
    return t;
}

} // namespace

int main() {
    const PerformanceAnalyzer analyzer(0.03);

    // Empty input: every metric is a sentinel
    {
        const std::vector<DailySnapshot> none;
        const auto report = analyzer.generateReport(none, {}, 100.0);
        assert(report.trading_days == 0);
        assert(report.total_return == 0.0);
        assert(report.max_drawdown == 0.0);
        assert(report.sharpe_ratio == 0.0);
        assert(PerformanceAnalyzer::dailyReturns(none).empty());
        assert(PerformanceAnalyzer::annualizedReturn(none, 100.0) == 0.0);
        assert(PerformanceAnalyzer::valueAtRisk(none) == 0.0);
        assert(PerformanceAnalyzer::conditionalValueAtRisk(none) == 0.0);
    }

    // Basic return and drawdown figures
    {
        const auto snaps = makeSnapshots({100.0, 110.0, 99.0, 120.0});
        const auto returns = PerformanceAnalyzer::dailyReturns(snaps);
        assert(returns.size() == 3);
        assert(near(returns[0], 0.1));
        assert(near(returns[1], -0.1));
        assert(near(returns[2], 120.0 / 99.0 - 1.0));

        const auto cumulative = PerformanceAnalyzer::cumulativeReturns(snaps, 100.0);
        assert(cumulative.size() == 4);
        assert(near(cumulative.back(), 0.2));

        assert(near(PerformanceAnalyzer::totalReturn(snaps, 100.0), 0.2));
        assert(near(PerformanceAnalyzer::annualizedReturn(snaps, 100.0),
                    std::pow(1.2, 252.0 / 4.0) - 1.0, 1e-6));
        assert(near(PerformanceAnalyzer::maxDrawdown(snaps), -0.1));
        assert(PerformanceAnalyzer::volatility(snaps) > 0.0);

        // sorted returns [-0.1, 0.1, 0.2121]; 5th percentile interpolates the first gap
        assert(near(PerformanceAnalyzer::valueAtRisk(snaps, 0.95), -0.1 + 0.1 * 0.2));
        assert(near(PerformanceAnalyzer::conditionalValueAtRisk(snaps, 0.95), -0.1));

        const auto report = analyzer.generateReport(snaps, {}, 100.0);
        assert(report.trading_days == 4);
        assert(report.start_date == "2024-01-02");
        assert(report.end_date == "2024-01-05");
        assert(report.max_drawdown <= 0.0);
        assert(!report.has_benchmark);
        assert(std::isfinite(report.sortino_ratio));
        assert(near(report.calmar_ratio, report.annualized_return / 0.1, 1e-6));
    }

    // Flat equity: zero volatility means a zero Sharpe ratio
    {
        const auto snaps = makeSnapshots({100.0, 100.0, 100.0});
        assert(PerformanceAnalyzer::volatility(snaps) == 0.0);
        assert(analyzer.sharpeRatio(snaps, 100.0) == 0.0);
        assert(PerformanceAnalyzer::maxDrawdown(snaps) == 0.0);
    }

    // Monotonic gains: no downside and no drawdown give infinite ratios
    {
        const auto snaps = makeSnapshots({100.0, 101.0, 103.0, 104.0});
        const double inf = std::numeric_limits<double>::infinity();
        assert(analyzer.sortinoRatio(snaps, 100.0) == inf);
        assert(PerformanceAnalyzer::calmarRatio(snaps, 100.0) == inf);

        const auto j = backtest::toJson(analyzer.generateReport(snaps, {}, 100.0));
        assert(j["sortino_ratio"] == "inf");
        assert(j["calmar_ratio"] == "inf");
    }

    // Wiped-out account annualizes to -100%
    {
        const auto snaps = makeSnapshots({100.0, 50.0, 0.0});
        assert(PerformanceAnalyzer::annualizedReturn(snaps, 100.0) == -1.0);
        assert(near(PerformanceAnalyzer::maxDrawdown(snaps), -1.0));
    }

    // Trade statistics count sells only
    {
        const std::vector<TradeRecord> trades = {
            buy(), sell(10.0), sell(20.0), buy(), sell(-5.0), sell(-6.0), sell(0.0)
        };
        const auto stats = PerformanceAnalyzer::analyzeTrades(trades);
        assert(stats.total_trades == 5);
        assert(stats.winning_trades == 2);
        assert(stats.losing_trades == 2);
        assert(near(stats.win_rate, 0.4));
        assert(near(stats.total_profit, 30.0));
        assert(near(stats.total_loss, 11.0));
        assert(near(stats.profit_factor, 30.0 / 11.0));
        assert(near(stats.avg_profit, 15.0));
        assert(near(stats.avg_loss, -5.5));
        assert(stats.max_consecutive_wins == 2);
        assert(stats.max_consecutive_losses == 2);
    }

    // Profit factor sentinels
    {
        assert(PerformanceAnalyzer::analyzeTrades({buy()}).profit_factor == 0.0);
        // Break-even sells have no losses, so the factor is unbounded
        const auto flat = PerformanceAnalyzer::analyzeTrades({sell(0.0), sell(0.0)});
        assert(flat.total_trades == 2);
        assert(flat.winning_trades == 0);
        assert(flat.losing_trades == 0);
        assert(flat.profit_factor == std::numeric_limits<double>::infinity());
        assert(PerformanceAnalyzer::analyzeTrades({sell(3.0)}).profit_factor ==
               std::numeric_limits<double>::infinity());
        assert(PerformanceAnalyzer::analyzeTrades({sell(-3.0)}).profit_factor == 0.0);
    }

    // Benchmark-relative metrics
    {
        const auto snaps = makeSnapshots({100.0, 102.0, 101.0, 104.0, 103.0});
        const auto returns = PerformanceAnalyzer::dailyReturns(snaps);

        BenchmarkReturns same;
        BenchmarkReturns doubled;
        for (size_t i = 0; i < returns.size(); ++i) {
            const long long day = utils::dayKey(snaps[i + 1].timestamp);
            same[day] = returns[i];
            doubled[day] = returns[i] * 2.0;
        }

        assert(near(PerformanceAnalyzer::beta(snaps, same), 1.0, 1e-9));
        assert(near(PerformanceAnalyzer::beta(snaps, doubled), 0.5, 1e-9));
        assert(PerformanceAnalyzer::informationRatio(snaps, same) == 0.0);

        double mean_return = 0.0;
        for (double r : returns) {
            mean_return += r;
        }
        mean_return /= static_cast<double>(returns.size());
        const double expected_alpha = PerformanceAnalyzer::annualizedReturn(snaps, 100.0) -
                                      (std::pow(1.0 + mean_return, 252.0) - 1.0);
        assert(near(analyzer.alpha(snaps, 100.0, same), expected_alpha, 1e-9));

        const auto report = analyzer.generateReport(snaps, {}, 100.0, &doubled);
        assert(report.has_benchmark);
        assert(near(report.beta, 0.5, 1e-9));
        const auto j = backtest::toJson(report);
        assert(j.contains("beta"));
        assert(j.contains("information_ratio"));

        // No overlapping dates
        BenchmarkReturns elsewhere;
        elsewhere[0] = 0.01;
        assert(PerformanceAnalyzer::beta(snaps, elsewhere) == 0.0);
        assert(analyzer.alpha(snaps, 100.0, elsewhere) == 0.0);
    }

    std::cout << "[TEST] PerformanceAnalyzer PASSED\n";
    return 0;
}
