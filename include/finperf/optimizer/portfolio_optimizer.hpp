/**
 * @file portfolio_optimizer.hpp
 * @brief Weight search by numerical-gradient descent over a chosen objective
 *
 * Each objective evaluation projects the candidate onto the per-asset
 * bounds, records the resulting (return, risk) pair in a FrontierAccumulator
 * and returns the loss. After descent the final point is projected once more
 * and the recorded cloud is reduced with efficient_frontier_points().
 *
 * Lifecycle of a run:
 *   random weights -> iterate (gradient, line search, record) ->
 *   converged / stalled / max iterations -> project -> OptResult
 *
 * No exception is raised for numerical trouble: NaN losses stop the descent
 * and show up in OptResult::message. Input errors (dimension mismatch,
 * infeasible bounds) throw before the search starts.
 */

#pragma once

#include "finperf/analytics/statistics.hpp"
#include "finperf/optimizer/constraints.hpp"
#include "finperf/optimizer/gradient_descent.hpp"
#include "finperf/optimizer/objective.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace finperf
{
    namespace optimizer
    {

        /**
         * @class FrontierAccumulator
         * @brief Append-only, lock-protected buffer of visited (return, risk) points
         *
         * record() takes an exclusive lock; snapshot() and size() take a
         * shared lock, so the objective may be evaluated from several threads.
         */
        class FrontierAccumulator
        {
        public:
            FrontierAccumulator() = default;

            FrontierAccumulator(const FrontierAccumulator &) = delete;
            FrontierAccumulator &operator=(const FrontierAccumulator &) = delete;

            void record(const analytics::FrontierPoint &point);

            std::vector<analytics::FrontierPoint> snapshot() const;

            size_t size() const;

            void clear();

        private:
            mutable std::shared_mutex mutex_;
            std::vector<analytics::FrontierPoint> points_;
        };

        /**
         * @struct OptimizerOptions
         * @brief Descent settings plus the random initial-guess seed
         */
        struct OptimizerOptions
        {
            SolverOptions solver;              ///< Descent settings
            std::optional<unsigned int> seed;  ///< Fixed seed for reproducible runs

            nlohmann::json to_json() const;
            static OptimizerOptions from_json(const nlohmann::json &j);
        };

        /**
         * @struct OptResult
         * @brief Optimal weights and the frontier extracted from the search
         */
        struct OptResult
        {
            Eigen::VectorXd optimal_weights;                          ///< Feasible weights, sum to 1
            std::vector<analytics::FrontierPoint> efficient_frontier; ///< Filtered visited points
            double objective_value;                                   ///< Loss at optimal_weights
            int iterations;                                           ///< Descent iterations
            int evaluations;                                          ///< Objective evaluations
            size_t recorded_points;                                   ///< Points before filtering
            SolverStatus status;                                      ///< Descent terminal state
            std::string message;                                      ///< Status message

            OptResult();

            /**
             * @brief Weights are finite, sum to one and respect bounds
             */
            bool is_valid(const std::vector<AssetBounds> &bounds, double tolerance = 1e-6) const;

            nlohmann::json to_json() const;

            void print_summary() const;
        };

        /**
         * @class PortfolioOptimizer
         * @brief Minimizes an ObjectiveFunction over bounded, fully-invested weights
         *
         * Usage Example:
         * @code
         * auto inputs = ObjectiveInputs::from_returns(returns, 0.0, 0.95, 252.0);
         * PortfolioOptimizer optimizer(ObjectiveFunction::MIN_VOL);
         * OptResult result = optimizer.optimize(inputs, default_bounds(inputs.num_assets()));
         * result.print_summary();
         * @endcode
         *
         * Thread Safety: optimize() is const; concurrent runs share nothing.
         */
        class PortfolioOptimizer
        {
        public:
            explicit PortfolioOptimizer(ObjectiveFunction objective,
                                        const OptimizerOptions &options = OptimizerOptions());

            ~PortfolioOptimizer() = default;

            /**
             * @brief Run the search with a private accumulator
             * @param bounds Per-asset bounds; empty means [0, 1] for every asset
             * @throws std::invalid_argument on inconsistent inputs
             * @throws InfeasibleConstraints if the bounds cannot sum to one
             */
            OptResult optimize(const ObjectiveInputs &inputs,
                               const std::vector<AssetBounds> &bounds) const;

            /**
             * @brief Run the search, recording visited points into accumulator
             *
             * The frontier is extracted from everything the accumulator holds
             * when the search ends.
             */
            OptResult optimize(const ObjectiveInputs &inputs,
                               const std::vector<AssetBounds> &bounds,
                               FrontierAccumulator &accumulator) const;

            std::string get_name() const { return "Simple Gradient Descent"; }

            ObjectiveFunction get_objective() const { return objective_; }

            const OptimizerOptions &get_options() const { return options_; }

            nlohmann::json get_parameters() const;

        private:
            ObjectiveFunction objective_;
            OptimizerOptions options_;

            /**
             * @brief Uniform [0, 1) draws normalized to sum to one
             */
            Eigen::VectorXd random_weights(Eigen::Index n) const;
        };

    } // namespace optimizer
} // namespace finperf
