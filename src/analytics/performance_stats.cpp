/**
 * @file performance_stats.cpp
 * @brief Implementation of PerformanceStats.
 */

#include "finperf/analytics/performance_stats.hpp"
#include "finperf/analytics/statistics.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace finperf
{
    namespace analytics
    {

        PerformanceStats PerformanceStats::compute(const Eigen::VectorXd &returns,
                                                   const Eigen::VectorXd &benchmark_returns,
                                                   double risk_free_rate,
                                                   double confidence_level,
                                                   const IntervalDays &interval)
        {
            if (returns.size() == 0)
            {
                throw std::invalid_argument("PerformanceStats: return series is empty");
            }
            if (returns.size() != benchmark_returns.size())
            {
                throw std::invalid_argument(
                    "PerformanceStats: returns (" + std::to_string(returns.size()) +
                    ") and benchmark (" + std::to_string(benchmark_returns.size()) +
                    ") differ in length");
            }
            if (!(interval.average > 0.0) || !(interval.mode > 0.0))
            {
                throw std::invalid_argument("PerformanceStats: interval days must be positive");
            }

            const double periods = 365.0 / interval.average;
            const double rf = risk_free_rate * 100.0;

            PerformanceStats stats;
            stats.cumulative_return = analytics::cumulative_return(returns);
            stats.daily_return = mean(returns) / interval.mode;
            stats.daily_volatility = population_std_dev(returns);
            stats.annualized_return = annualize(stats.daily_return, periods);
            stats.annualized_volatility = stats.daily_volatility * std::sqrt(periods);

            const RegressionResult regression = ols_regression(returns, benchmark_returns);
            stats.alpha = regression.alpha;
            stats.beta = regression.beta;

            stats.sharpe_ratio = (stats.annualized_return - rf) / stats.annualized_volatility;
            stats.sortino_ratio = (stats.annualized_return - rf) /
                                  (downside_deviation(returns) * std::sqrt(periods));

            const Eigen::VectorXd excess = returns - benchmark_returns;
            stats.active_return = annualize(mean(excess), periods);
            stats.active_risk = population_std_dev(excess) * std::sqrt(periods);
            stats.information_ratio = stats.active_return / stats.active_risk;

            stats.max_drawdown = maximum_drawdown(returns).max_drawdown;
            stats.calmar_ratio = stats.annualized_return / stats.max_drawdown;

            stats.value_at_risk = analytics::value_at_risk(returns, confidence_level);
            stats.expected_shortfall = analytics::expected_shortfall(returns, confidence_level);

            return stats;
        }

        double PerformanceStats::annualize(double period_return, double periods_per_year)
        {
            return (std::pow(1.0 + period_return / 100.0, periods_per_year) - 1.0) * 100.0;
        }

        nlohmann::json PerformanceStats::to_json() const
        {
            // NaN is not valid JSON; nlohmann writes it as null
            return nlohmann::json{
                {"daily_return", daily_return},
                {"daily_volatility", daily_volatility},
                {"cumulative_return", cumulative_return},
                {"annualized_return", annualized_return},
                {"annualized_volatility", annualized_volatility},
                {"alpha", alpha},
                {"beta", beta},
                {"sharpe_ratio", sharpe_ratio},
                {"sortino_ratio", sortino_ratio},
                {"active_return", active_return},
                {"active_risk", active_risk},
                {"information_ratio", information_ratio},
                {"calmar_ratio", calmar_ratio},
                {"max_drawdown", max_drawdown},
                {"value_at_risk", value_at_risk},
                {"expected_shortfall", expected_shortfall}};
        }

        std::string PerformanceStats::summary() const
        {
            std::ostringstream out;
            out << std::fixed << std::setprecision(4);

            auto row = [&out](const std::string &label, double value, const char *unit)
            {
                out << "  " << std::left << std::setw(24) << label << std::right
                    << std::setw(12) << value << unit << "\n";
            };

            out << "Returns\n";
            row("Daily Return", daily_return, "%");
            row("Cumulative Return", cumulative_return, "%");
            row("Annualized Return", annualized_return, "%");
            out << "Risk\n";
            row("Daily Volatility", daily_volatility, "%");
            row("Annualized Volatility", annualized_volatility, "%");
            row("Maximum Drawdown", max_drawdown, "%");
            row("Value at Risk", value_at_risk, "%");
            row("Expected Shortfall", expected_shortfall, "%");
            out << "Benchmark\n";
            row("Alpha", alpha, "");
            row("Beta", beta, "");
            row("Active Return", active_return, "%");
            row("Active Risk", active_risk, "%");
            out << "Ratios\n";
            row("Sharpe Ratio", sharpe_ratio, "");
            row("Sortino Ratio", sortino_ratio, "");
            row("Information Ratio", information_ratio, "");
            row("Calmar Ratio", calmar_ratio, "");
            return out.str();
        }

    } // namespace analytics
} // namespace finperf
