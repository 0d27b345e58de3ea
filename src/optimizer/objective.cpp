/**
 * @file objective.cpp
 * @brief Implementation of objective parsing and loss evaluation
 */

#include "finperf/optimizer/objective.hpp"
#include "finperf/analytics/statistics.hpp"
#include <cmath>
#include <stdexcept>

namespace finperf
{
    namespace optimizer
    {

        ObjectiveFunction objective_from_string(const std::string &text)
        {
            for (auto objective : all_objectives())
            {
                if (objective_to_string(objective) == text)
                {
                    return objective;
                }
            }
            throw std::invalid_argument("Unsupported objective function: '" + text +
                                        "'. Expected max_sharpe, max_sortino, min_vol, max_return, "
                                        "min_drawdown, min_var or min_cvar");
        }

        std::string objective_to_string(ObjectiveFunction objective)
        {
            switch (objective)
            {
            case ObjectiveFunction::MAX_SHARPE:
                return "max_sharpe";
            case ObjectiveFunction::MAX_SORTINO:
                return "max_sortino";
            case ObjectiveFunction::MIN_VOL:
                return "min_vol";
            case ObjectiveFunction::MAX_RETURN:
                return "max_return";
            case ObjectiveFunction::MIN_DRAWDOWN:
                return "min_drawdown";
            case ObjectiveFunction::MIN_VAR:
                return "min_var";
            case ObjectiveFunction::MIN_CVAR:
                return "min_cvar";
            }
            return "unknown";
        }

        const std::vector<ObjectiveFunction> &all_objectives()
        {
            static const std::vector<ObjectiveFunction> kObjectives = {
                ObjectiveFunction::MAX_SHARPE,
                ObjectiveFunction::MAX_SORTINO,
                ObjectiveFunction::MIN_VOL,
                ObjectiveFunction::MAX_RETURN,
                ObjectiveFunction::MIN_DRAWDOWN,
                ObjectiveFunction::MIN_VAR,
                ObjectiveFunction::MIN_CVAR};
            return kObjectives;
        }

        // ============================================================================
        // ObjectiveInputs
        // ============================================================================

        ObjectiveInputs ObjectiveInputs::from_returns(const Eigen::MatrixXd &returns,
                                                      double risk_free_rate,
                                                      double confidence_level,
                                                      double annualization)
        {
            ObjectiveInputs inputs;
            inputs.returns = returns;
            inputs.mean_returns = analytics::mean_returns(returns);
            inputs.covariance = analytics::covariance_matrix(returns);
            inputs.risk_free_rate = risk_free_rate;
            inputs.confidence_level = confidence_level;
            inputs.annualization = annualization;
            return inputs;
        }

        void ObjectiveInputs::validate() const
        {
            const Eigen::Index n = mean_returns.size();

            if (n == 0)
            {
                throw std::invalid_argument("Mean returns vector is empty");
            }

            if (covariance.rows() != n || covariance.cols() != n)
            {
                throw std::invalid_argument(
                    "Dimension mismatch: mean returns size (" + std::to_string(n) +
                    ") does not match covariance dimensions (" +
                    std::to_string(covariance.rows()) + "x" +
                    std::to_string(covariance.cols()) + ")");
            }

            if (returns.cols() != n || returns.rows() == 0)
            {
                throw std::invalid_argument(
                    "Return table must have " + std::to_string(n) + " columns and at least one row, got " +
                    std::to_string(returns.rows()) + "x" + std::to_string(returns.cols()));
            }

            if (!mean_returns.allFinite() || !covariance.allFinite() || !returns.allFinite())
            {
                throw std::invalid_argument("Objective inputs contain NaN or Inf values");
            }

            if (!(confidence_level > 0.0 && confidence_level < 1.0))
            {
                throw std::invalid_argument("Confidence level must be in (0, 1), got " +
                                            std::to_string(confidence_level));
            }

            double asymmetry = (covariance - covariance.transpose()).cwiseAbs().maxCoeff();
            if (asymmetry > 1e-8)
            {
                throw std::invalid_argument(
                    "Covariance matrix is not symmetric (max asymmetry: " +
                    std::to_string(asymmetry) + ")");
            }

            Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(covariance);
            double min_eigenvalue = solver.eigenvalues().minCoeff();
            if (min_eigenvalue < -1e-8)
            {
                throw std::invalid_argument(
                    "Covariance matrix is not positive semi-definite (min eigenvalue: " +
                    std::to_string(min_eigenvalue) + ")");
            }
        }

        // ============================================================================
        // Loss evaluation
        // ============================================================================

        double evaluate_objective(ObjectiveFunction objective,
                                  const Eigen::VectorXd &weights,
                                  const ObjectiveInputs &inputs)
        {
            switch (objective)
            {
            case ObjectiveFunction::MAX_SHARPE:
            {
                const double r = analytics::mean_portfolio_return(weights, inputs.mean_returns);
                const double sigma = analytics::portfolio_std_dev(weights, inputs.covariance);
                return -(r - inputs.risk_free_rate) / sigma;
            }
            case ObjectiveFunction::MAX_SORTINO:
            {
                const double r = analytics::mean_portfolio_return(weights, inputs.mean_returns);
                const Eigen::VectorXd series = analytics::daily_portfolio_returns(weights, inputs.returns);
                const double downside = analytics::downside_deviation(series) * std::sqrt(inputs.annualization);
                return -(r - inputs.risk_free_rate) / downside;
            }
            case ObjectiveFunction::MIN_VOL:
                return analytics::portfolio_std_dev(weights, inputs.covariance);
            case ObjectiveFunction::MAX_RETURN:
                return -analytics::mean_portfolio_return(weights, inputs.mean_returns);
            case ObjectiveFunction::MIN_DRAWDOWN:
            {
                const Eigen::VectorXd series = analytics::daily_portfolio_returns(weights, inputs.returns);
                return analytics::maximum_drawdown(series).max_drawdown;
            }
            case ObjectiveFunction::MIN_VAR:
            {
                const Eigen::VectorXd series = analytics::daily_portfolio_returns(weights, inputs.returns);
                return -analytics::value_at_risk(series, inputs.confidence_level);
            }
            case ObjectiveFunction::MIN_CVAR:
            {
                const Eigen::VectorXd series = analytics::daily_portfolio_returns(weights, inputs.returns);
                return -analytics::expected_shortfall(series, inputs.confidence_level);
            }
            }
            throw std::invalid_argument("Unhandled objective function");
        }

    } // namespace optimizer
} // namespace finperf
