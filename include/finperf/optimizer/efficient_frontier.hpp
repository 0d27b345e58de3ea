/**
 * @file efficient_frontier.hpp
 * @brief Exact mean-variance frontier traced by a target-return sweep
 *
 * Complements the sampled frontier that PortfolioOptimizer extracts from the
 * points it visits. For each target return r_target:
 *
 *     Minimize:   w^T * Sigma * w
 *     Subject to: mu^T * w = r_target
 *                 sum(w) = 1
 *                 lower_i <= w_i <= upper_i
 *
 * Targets run from the lowest to the highest return reachable inside the
 * bounds. They are spaced quadratically so that the curved low-risk end of
 * the frontier gets more points than the nearly straight upper end.
 */

#pragma once

#include "finperf/optimizer/constraints.hpp"
#include "finperf/optimizer/osqp_solver.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace finperf
{
    namespace optimizer
    {

        /**
         * @struct FrontierPortfolio
         * @brief One solved portfolio on the traced frontier
         */
        struct FrontierPortfolio
        {
            double target_return;    ///< Requested return
            double expected_return;  ///< mu^T w at the solution
            double volatility;       ///< sqrt(w^T Sigma w)
            double sharpe_ratio;     ///< (expected_return - rf) / volatility
            Eigen::VectorXd weights;

            FrontierPortfolio();

            nlohmann::json to_json() const;
        };

        /**
         * @struct EfficientFrontierResult
         * @brief Traced frontier sorted by increasing volatility
         */
        struct EfficientFrontierResult
        {
            std::vector<FrontierPortfolio> points;
            FrontierPortfolio min_variance_portfolio;
            FrontierPortfolio max_sharpe_portfolio;
            int failed_targets;      ///< Targets OSQP could not solve
            bool success;
            std::string message;

            EfficientFrontierResult();

            nlohmann::json to_json() const;

            void print_summary() const;

            /**
             * @brief Write target,return,volatility,sharpe and one column per weight
             * @throws std::runtime_error if the file cannot be opened
             */
            void export_to_csv(const std::string &filepath,
                               const std::vector<std::string> &symbols = {}) const;
        };

        /**
         * @class EfficientFrontier
         * @brief Solves one minimum-variance QP per target return
         *
         * Usage Example:
         * @code
         * EfficientFrontier frontier;
         * frontier.set_num_points(25);
         * auto result = frontier.trace(inputs.mean_returns, inputs.covariance,
         *                              default_bounds(n), rf);
         * result.export_to_csv("frontier.csv", symbols);
         * @endcode
         */
        class EfficientFrontier
        {
        public:
            EfficientFrontier();

            ~EfficientFrontier() = default;

            /**
             * @brief Trace the frontier
             * @param risk_free_rate Same unit as mean_returns, used for Sharpe only
             * @throws std::invalid_argument on dimension mismatch
             * @throws InfeasibleConstraints if the bounds cannot sum to one
             */
            EfficientFrontierResult trace(const Eigen::VectorXd &mean_returns,
                                          const Eigen::MatrixXd &covariance,
                                          const std::vector<AssetBounds> &bounds,
                                          double risk_free_rate = 0.0) const;

            /**
             * @throws std::invalid_argument if num_points < 2
             */
            void set_num_points(int num_points);

            int get_num_points() const { return num_points_; }

            /**
             * @brief Smallest and largest mu^T w over the bounded simplex
             *
             * Greedy fill from the lower bounds: the remaining budget goes to
             * the cheapest (or richest) assets first, up to their upper bound.
             */
            static std::pair<double, double> return_range(const Eigen::VectorXd &mean_returns,
                                                          const std::vector<AssetBounds> &bounds);

            /**
             * @brief num_points targets from lo to hi with quadratic spacing
             */
            static std::vector<double> target_returns(double lo, double hi, int num_points);

        private:
            int num_points_;
            OSQPSolver solver_;
        };

    } // namespace optimizer
} // namespace finperf
