/**
 * @file objective.hpp
 * @brief Portfolio optimization targets and their minimized loss functions
 *
 * Strings are parsed into ObjectiveFunction once, when a configuration is
 * read. The optimizer loop only ever switches on the enum.
 *
 * Every objective is expressed as a loss to be minimized:
 *
 *   MAX_SHARPE    -(r_p - r_f) / sigma_p
 *   MAX_SORTINO   -(r_p - r_f) / (downside_deviation(R w) * sqrt(annualization))
 *   MIN_VOL       sigma_p
 *   MAX_RETURN    -r_p
 *   MIN_DRAWDOWN  maximum_drawdown(R w)
 *   MIN_VAR       -value_at_risk(R w, confidence_level)
 *   MIN_CVAR      -expected_shortfall(R w, confidence_level)
 *
 * with r_p = w' mu, sigma_p = sqrt(w' Sigma w) and R the return table.
 */

#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace finperf
{
    namespace optimizer
    {

        /**
         * @enum ObjectiveFunction
         * @brief Closed set of optimization targets
         */
        enum class ObjectiveFunction
        {
            MAX_SHARPE,
            MAX_SORTINO,
            MIN_VOL,
            MAX_RETURN,
            MIN_DRAWDOWN,
            MIN_VAR,
            MIN_CVAR
        };

        /**
         * @brief Parse "max_sharpe", "max_sortino", "min_vol", "max_return",
         *        "min_drawdown", "min_var" or "min_cvar"
         * @throws std::invalid_argument for anything else
         */
        ObjectiveFunction objective_from_string(const std::string &text);

        /**
         * @brief Inverse of objective_from_string
         */
        std::string objective_to_string(ObjectiveFunction objective);

        /**
         * @brief All objectives, in declaration order
         */
        const std::vector<ObjectiveFunction> &all_objectives();

        /**
         * @struct ObjectiveInputs
         * @brief Precomputed market statistics shared by every loss evaluation
         *
         * risk_free_rate must be in the same scale as the returns (percent per
         * period) so it can be subtracted from the portfolio return directly.
         */
        struct ObjectiveInputs
        {
            Eigen::VectorXd mean_returns; ///< Per-asset mean period return (N)
            Eigen::MatrixXd covariance;   ///< Population covariance (N x N)
            Eigen::MatrixXd returns;      ///< Aligned return table (T x N)
            double risk_free_rate = 0.0;  ///< Per-period risk-free return, percent
            double confidence_level = 0.95;
            double annualization = 1.0;   ///< Periods per year

            /**
             * @brief Build mean returns and covariance from a return table
             */
            static ObjectiveInputs from_returns(const Eigen::MatrixXd &returns,
                                                double risk_free_rate,
                                                double confidence_level,
                                                double annualization);

            size_t num_assets() const { return static_cast<size_t>(mean_returns.size()); }

            /**
             * @brief Check dimensions, finiteness and covariance symmetry / PSD
             * @throws std::invalid_argument if the inputs are inconsistent
             */
            void validate() const;
        };

        /**
         * @brief Loss of an already constraint-projected weight vector
         *
         * Degenerate inputs (zero volatility, empty tail) yield NaN or Inf.
         */
        double evaluate_objective(ObjectiveFunction objective,
                                  const Eigen::VectorXd &weights,
                                  const ObjectiveInputs &inputs);

    } // namespace optimizer
} // namespace finperf
