/**
 * @file performance_stats.hpp
 * @brief Risk/return record for one return series against a benchmark.
 *
 * All inputs are percentage-scaled period returns on a shared, aligned
 * timestamp axis. Periods are annualized with the interval metadata of
 * that axis: mode_days converts the mean period return to a daily return
 * and 365 / average_days gives the number of periods per year.
 *
 * Degenerate inputs (constant series, no drawdown, no tail values) produce
 * NaN or Inf in the affected fields instead of throwing.
 */

#ifndef FINPERF_ANALYTICS_PERFORMANCE_STATS_HPP
#define FINPERF_ANALYTICS_PERFORMANCE_STATS_HPP

#include "finperf/data/interval.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>

namespace finperf
{
    namespace analytics
    {

        /**
         * @struct PerformanceStats
         * @brief Flat record of return, risk and risk-adjusted metrics.
         *
         * Usage:
         * @code
         *   auto stats = PerformanceStats::compute(returns, benchmark, 0.02, 0.95,
         *                                          interval_days(timestamps));
         *   std::cout << stats.summary();
         * @endcode
         */
        struct PerformanceStats
        {
            double daily_return = 0.0;          ///< Mean period return / mode_days, percent
            double daily_volatility = 0.0;      ///< Population std-dev of period returns
            double cumulative_return = 0.0;     ///< Compounded return over the series, percent
            double annualized_return = 0.0;     ///< Compounded daily_return, percent
            double annualized_volatility = 0.0; ///< daily_volatility * sqrt(periods per year)
            double alpha = 0.0;                 ///< OLS intercept
            double beta = 0.0;                  ///< OLS slope
            double sharpe_ratio = 0.0;
            double sortino_ratio = 0.0;
            double active_return = 0.0;      ///< Annualized mean excess over benchmark, percent
            double active_risk = 0.0;        ///< Annualized tracking error
            double information_ratio = 0.0;  ///< active_return / active_risk
            double calmar_ratio = 0.0;       ///< annualized_return / max_drawdown
            double max_drawdown = 0.0;       ///< Largest drawdown of cumulative returns, positive
            double value_at_risk = 0.0;      ///< Historical VaR, percent (negative for a loss)
            double expected_shortfall = 0.0; ///< Mean of returns below VaR

            /**
             * @brief Compute every metric
             * @param returns Period returns, percent
             * @param benchmark_returns Benchmark returns on the same axis
             * @param risk_free_rate Annual risk-free rate as a fraction (0.02 = 2%)
             * @param confidence_level VaR/ES confidence in (0, 1)
             * @param interval Interval metadata of the shared axis
             * @throws std::invalid_argument if the series are empty, differ in
             *         length, or the interval is not positive
             */
            static PerformanceStats compute(const Eigen::VectorXd &returns,
                                            const Eigen::VectorXd &benchmark_returns,
                                            double risk_free_rate,
                                            double confidence_level,
                                            const IntervalDays &interval);

            /**
             * @brief ((1 + period_return / 100)^periods - 1) * 100
             */
            static double annualize(double period_return, double periods_per_year);

            nlohmann::json to_json() const;

            /**
             * @brief Multi-line human-readable table
             */
            std::string summary() const;
        };

    } // namespace analytics
} // namespace finperf

#endif // FINPERF_ANALYTICS_PERFORMANCE_STATS_HPP
