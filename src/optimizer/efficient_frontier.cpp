/**
 * @file efficient_frontier.cpp
 * @brief Implementation of the target-return frontier sweep
 */

#include "finperf/optimizer/efficient_frontier.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <numeric>

namespace finperf
{
    namespace optimizer
    {

        // ============================================================================
        // FrontierPortfolio Implementation
        // ============================================================================

        FrontierPortfolio::FrontierPortfolio()
            : target_return(0.0),
              expected_return(0.0),
              volatility(0.0),
              sharpe_ratio(0.0)
        {
        }

        nlohmann::json FrontierPortfolio::to_json() const
        {
            return nlohmann::json{
                {"target_return", target_return},
                {"expected_return", expected_return},
                {"volatility", volatility},
                {"sharpe_ratio", sharpe_ratio},
                {"weights", std::vector<double>(weights.data(), weights.data() + weights.size())}};
        }

        // ============================================================================
        // EfficientFrontierResult Implementation
        // ============================================================================

        EfficientFrontierResult::EfficientFrontierResult()
            : failed_targets(0), success(false)
        {
        }

        nlohmann::json EfficientFrontierResult::to_json() const
        {
            nlohmann::json j;
            j["success"] = success;
            j["message"] = message;
            j["failed_targets"] = failed_targets;
            j["points"] = nlohmann::json::array();
            for (const auto &point : points)
            {
                j["points"].push_back(point.to_json());
            }
            if (success)
            {
                j["min_variance_portfolio"] = min_variance_portfolio.to_json();
                j["max_sharpe_portfolio"] = max_sharpe_portfolio.to_json();
            }
            return j;
        }

        void EfficientFrontierResult::print_summary() const
        {
            std::cout << "\n=== Efficient Frontier Summary ===\n";
            std::cout << "Status: " << (success ? "SUCCESS" : "FAILED") << "\n";
            std::cout << "Message: " << message << "\n";
            std::cout << "Points: " << points.size() << " (" << failed_targets << " targets failed)\n";
            std::cout << std::string(60, '-') << "\n";

            if (success)
            {
                std::cout << "\nMinimum Variance Portfolio:\n";
                std::cout << "  Expected Return:  " << std::fixed << std::setprecision(4)
                          << min_variance_portfolio.expected_return << "%\n";
                std::cout << "  Volatility:       " << min_variance_portfolio.volatility << "%\n";

                std::cout << "\nMaximum Sharpe Ratio Portfolio:\n";
                std::cout << "  Expected Return:  " << max_sharpe_portfolio.expected_return << "%\n";
                std::cout << "  Volatility:       " << max_sharpe_portfolio.volatility << "%\n";
                std::cout << "  Sharpe Ratio:     " << std::setprecision(3)
                          << max_sharpe_portfolio.sharpe_ratio << "\n";
            }

            std::cout << "================================\n"
                      << std::endl;
        }

        void EfficientFrontierResult::export_to_csv(const std::string &filepath,
                                                    const std::vector<std::string> &symbols) const
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            file << "target_return,expected_return,volatility,sharpe_ratio";
            const Eigen::Index n = points.empty() ? 0 : points.front().weights.size();
            for (Eigen::Index i = 0; i < n; ++i)
            {
                file << ",";
                if (static_cast<size_t>(i) < symbols.size())
                {
                    file << symbols[static_cast<size_t>(i)];
                }
                else
                {
                    file << "w" << i;
                }
            }
            file << "\n";

            for (const auto &point : points)
            {
                file << std::fixed << std::setprecision(8)
                     << point.target_return << ","
                     << point.expected_return << ","
                     << point.volatility << ","
                     << point.sharpe_ratio;
                for (Eigen::Index i = 0; i < point.weights.size(); ++i)
                {
                    file << "," << point.weights(i);
                }
                file << "\n";
            }
        }

        // ============================================================================
        // EfficientFrontier Implementation
        // ============================================================================

        EfficientFrontier::EfficientFrontier()
            : num_points_(20)
        {
            SolverOptions options;
            options.max_iterations = 10000;
            options.tolerance = 1e-8;
            solver_.set_options(options);
        }

        void EfficientFrontier::set_num_points(int num_points)
        {
            if (num_points < 2)
            {
                throw std::invalid_argument(
                    "Number of points must be at least 2, got: " +
                    std::to_string(num_points));
            }
            num_points_ = num_points;
        }

        std::pair<double, double> EfficientFrontier::return_range(
            const Eigen::VectorXd &mean_returns,
            const std::vector<AssetBounds> &bounds)
        {
            const size_t n = static_cast<size_t>(mean_returns.size());
            validate_bounds(bounds, n);

            std::vector<size_t> order(n);
            std::iota(order.begin(), order.end(), 0);
            std::sort(order.begin(), order.end(), [&mean_returns](size_t a, size_t b)
                      { return mean_returns(static_cast<Eigen::Index>(a)) <
                               mean_returns(static_cast<Eigen::Index>(b)); });

            double base = 0.0;
            double budget = 1.0;
            for (size_t i = 0; i < n; ++i)
            {
                base += bounds[i].lower * mean_returns(static_cast<Eigen::Index>(i));
                budget -= bounds[i].lower;
            }

            auto fill = [&](auto first, auto last)
            {
                double value = base;
                double remaining = budget;
                for (auto it = first; it != last && remaining > 0.0; ++it)
                {
                    const size_t i = *it;
                    const double room = std::min(remaining, bounds[i].upper - bounds[i].lower);
                    value += room * mean_returns(static_cast<Eigen::Index>(i));
                    remaining -= room;
                }
                return value;
            };

            return {fill(order.begin(), order.end()), fill(order.rbegin(), order.rend())};
        }

        std::vector<double> EfficientFrontier::target_returns(double lo, double hi, int num_points)
        {
            std::vector<double> targets;
            targets.reserve(static_cast<size_t>(num_points));
            for (int i = 0; i < num_points; ++i)
            {
                const double t = static_cast<double>(i) / static_cast<double>(num_points - 1);
                targets.push_back(lo + (hi - lo) * t * t);
            }
            return targets;
        }

        EfficientFrontierResult EfficientFrontier::trace(const Eigen::VectorXd &mean_returns,
                                                         const Eigen::MatrixXd &covariance,
                                                         const std::vector<AssetBounds> &bounds,
                                                         double risk_free_rate) const
        {
            const Eigen::Index n = mean_returns.size();
            if (n == 0)
            {
                throw std::invalid_argument("Mean returns vector is empty");
            }
            if (covariance.rows() != n || covariance.cols() != n)
            {
                throw std::invalid_argument(
                    "Covariance matrix dimensions (" + std::to_string(covariance.rows()) + "x" +
                    std::to_string(covariance.cols()) + ") do not match number of assets (" +
                    std::to_string(n) + ")");
            }

            const std::vector<AssetBounds> active_bounds =
                bounds.empty() ? default_bounds(static_cast<size_t>(n)) : bounds;
            const std::pair<double, double> range = return_range(mean_returns, active_bounds);

            QuadraticProblem problem;
            problem.P = 2.0 * covariance;
            problem.q = Eigen::VectorXd::Zero(n);
            problem.A_eq = Eigen::MatrixXd(2, n);
            problem.A_eq.row(0) = Eigen::RowVectorXd::Ones(n);
            problem.A_eq.row(1) = mean_returns.transpose();
            problem.b_eq = Eigen::VectorXd(2);
            problem.b_eq(0) = 1.0;
            problem.lower_bounds = Eigen::VectorXd(n);
            problem.upper_bounds = Eigen::VectorXd(n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                problem.lower_bounds(i) = active_bounds[static_cast<size_t>(i)].lower;
                problem.upper_bounds(i) = active_bounds[static_cast<size_t>(i)].upper;
            }

            EfficientFrontierResult result;
            for (double target : target_returns(range.first, range.second, num_points_))
            {
                problem.b_eq(1) = target;
                const SolverResult solved = solver_.solve(problem);
                if (!solved.success || !solved.solution.allFinite())
                {
                    ++result.failed_targets;
                    continue;
                }

                FrontierPortfolio point;
                point.target_return = target;
                point.weights = solved.solution;
                point.expected_return = mean_returns.dot(solved.solution);
                point.volatility = std::sqrt(std::max(0.0, solved.solution.dot(covariance * solved.solution)));
                point.sharpe_ratio = point.volatility > 0.0
                                         ? (point.expected_return - risk_free_rate) / point.volatility
                                         : 0.0;
                result.points.push_back(point);
            }

            std::stable_sort(result.points.begin(), result.points.end(),
                             [](const FrontierPortfolio &a, const FrontierPortfolio &b)
                             { return a.volatility < b.volatility; });

            result.success = !result.points.empty();
            if (result.success)
            {
                result.min_variance_portfolio = result.points.front();
                result.max_sharpe_portfolio = *std::max_element(
                    result.points.begin(), result.points.end(),
                    [](const FrontierPortfolio &a, const FrontierPortfolio &b)
                    { return a.sharpe_ratio < b.sharpe_ratio; });
                result.message = "Efficient frontier traced with " +
                                 std::to_string(result.points.size()) + " points";
            }
            else
            {
                result.message = "No target return could be solved";
            }

            return result;
        }

    } // namespace optimizer
} // namespace finperf
