/**
 * @file statistics.hpp
 * @brief Statistical primitives over return series and return tables.
 *
 * All series are percentage-scaled period returns (1.23 means 1.23%).
 * A return table is a T x N matrix with one column per instrument.
 *
 * Functions are pure. Degenerate inputs (zero variance, no tail values)
 * yield NaN or Inf rather than throwing; structurally invalid inputs
 * (size mismatches, empty series where an index is required) throw
 * std::invalid_argument.
 */

#ifndef FINPERF_ANALYTICS_STATISTICS_HPP
#define FINPERF_ANALYTICS_STATISTICS_HPP

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <vector>

namespace finperf
{
    namespace analytics
    {

        /**
         * @struct RegressionResult
         * @brief Intercept and slope of a simple linear regression.
         */
        struct RegressionResult
        {
            double alpha; ///< Intercept
            double beta;  ///< Slope
        };

        /**
         * @struct DrawdownResult
         * @brief Underwater curve and maximum drawdown of a return series.
         */
        struct DrawdownResult
        {
            std::vector<double> rolling_drawdowns; ///< Negated drawdown at each period (<= 0)
            double max_drawdown;                   ///< Largest drawdown, non-negative
        };

        /**
         * @struct FrontierPoint
         * @brief A (return, risk) pair visited or traced by an optimizer.
         */
        struct FrontierPoint
        {
            double expected_return; ///< Portfolio return
            double volatility;      ///< Portfolio standard deviation

            bool operator==(const FrontierPoint &other) const
            {
                return expected_return == other.expected_return &&
                       volatility == other.volatility;
            }

            nlohmann::json to_json() const;
        };

        // ========================================================================
        // Univariate statistics
        // ========================================================================

        /**
         * @brief Arithmetic mean, NaN for an empty series
         */
        double mean(const Eigen::VectorXd &series);

        /**
         * @brief Population (divide by n) standard deviation, NaN if empty
         */
        double population_std_dev(const Eigen::VectorXd &series);

        /**
         * @brief Population standard deviation of the values <= 0
         *
         * NaN when no value is non-positive.
         */
        double downside_deviation(const Eigen::VectorXd &series);

        /**
         * @brief Simple least-squares regression of y on x
         *
         * beta = cov(x, y) / var(x), alpha = mean(y) - beta * mean(x).
         * A constant x gives NaN for both coefficients.
         *
         * @throws std::invalid_argument if the series differ in length or are empty
         */
        RegressionResult ols_regression(const Eigen::VectorXd &x, const Eigen::VectorXd &y);

        /**
         * @brief Running cumulative-sum drawdown
         *
         * cumulative_sum is the running sum of returns and running_max its
         * running maximum (seeded with the first cumulative value). The
         * drawdown at each period is running_max - cumulative_sum, stored
         * negated in rolling_drawdowns.
         */
        DrawdownResult maximum_drawdown(const Eigen::VectorXd &series);

        /**
         * @brief Historical Value-at-Risk (lower tail)
         *
         * Sorts ascending and returns the value at
         * floor((1 - confidence_level) * (n - 1)).
         *
         * @throws std::invalid_argument if series is empty or confidence_level is outside [0, 1]
         */
        double value_at_risk(const Eigen::VectorXd &series, double confidence_level);

        /**
         * @brief Mean of the values strictly below the VaR threshold
         *
         * NaN when no value lies below the threshold.
         */
        double expected_shortfall(const Eigen::VectorXd &series, double confidence_level);

        /**
         * @brief Compounded return in percent: (prod(1 + r/100) - 1) * 100
         */
        double cumulative_return(const Eigen::VectorXd &series);

        /**
         * @brief Running compounded return after each period, as a fraction
         */
        std::vector<double> cumulative_returns_list(const Eigen::VectorXd &series);

        /**
         * @brief Fill zero entries by interpolating between non-zero neighbours
         *
         * Entries are filled left to right. When only one side has a non-zero
         * neighbour that value is copied; an all-zero vector is unchanged.
         */
        std::vector<double> linear_interpolation(std::vector<double> values);

        // ========================================================================
        // Multivariate statistics
        // ========================================================================

        /**
         * @brief Population covariance between every pair of columns
         * @param table T x N return table
         * @return N x N symmetric matrix
         */
        Eigen::MatrixXd covariance_matrix(const Eigen::MatrixXd &table);

        /**
         * @brief Covariance normalized by population standard deviations
         *
         * Entries involving a zero-variance column are 0.
         */
        Eigen::MatrixXd correlation_matrix(const Eigen::MatrixXd &table);

        /**
         * @brief Per-column means of a return table
         */
        Eigen::VectorXd mean_returns(const Eigen::MatrixXd &table);

        // ========================================================================
        // Portfolio aggregation
        // ========================================================================

        /**
         * @brief Weighted per-period returns: table * weights
         * @throws std::invalid_argument if weights.size() != table.cols()
         */
        Eigen::VectorXd daily_portfolio_returns(const Eigen::VectorXd &weights,
                                                const Eigen::MatrixXd &table);

        /**
         * @brief sum_i w_i * mean_i
         */
        double mean_portfolio_return(const Eigen::VectorXd &weights,
                                     const Eigen::VectorXd &mean_returns);

        /**
         * @brief sqrt(w' * cov * w), with tiny negative variances clamped to 0
         */
        double portfolio_std_dev(const Eigen::VectorXd &weights,
                                 const Eigen::MatrixXd &covariance);

        /**
         * @brief Root-mean-square of the negative portfolio returns over all periods
         *
         * Positive periods contribute zero. Returns 0 for an empty table.
         */
        double portfolio_downside_dev(const Eigen::VectorXd &weights,
                                      const Eigen::MatrixXd &table);

        // ========================================================================
        // Frontier extraction
        // ========================================================================

        /**
         * @brief Sharpe-at-minimum-risk filter over a cloud of points
         *
         * Drops non-finite points, points with non-positive risk and exact
         * duplicates, then finds the minimum-risk point (first one on ties)
         * and keeps every point whose return/risk ratio is at least the
         * ratio of that point. Input order is preserved.
         *
         * This is a threshold filter, not a Pareto (non-dominated) filter:
         * the result can contain dominated points and is not sorted.
         */
        std::vector<FrontierPoint> efficient_frontier_points(const std::vector<FrontierPoint> &points);

    } // namespace analytics
} // namespace finperf

#endif // FINPERF_ANALYTICS_STATISTICS_HPP
