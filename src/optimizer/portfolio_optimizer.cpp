/**
 * @file portfolio_optimizer.cpp
 * @brief Implementation of the gradient-descent portfolio optimizer
 */

#include "finperf/optimizer/portfolio_optimizer.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <random>

namespace finperf
{
    namespace optimizer
    {

        // ============================================================================
        // FrontierAccumulator
        // ============================================================================

        void FrontierAccumulator::record(const analytics::FrontierPoint &point)
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            points_.push_back(point);
        }

        std::vector<analytics::FrontierPoint> FrontierAccumulator::snapshot() const
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return points_;
        }

        size_t FrontierAccumulator::size() const
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return points_.size();
        }

        void FrontierAccumulator::clear()
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            points_.clear();
        }

        // ============================================================================
        // OptimizerOptions
        // ============================================================================

        nlohmann::json OptimizerOptions::to_json() const
        {
            nlohmann::json j = solver.to_json();
            if (seed.has_value())
            {
                j["seed"] = *seed;
            }
            else
            {
                j["seed"] = nullptr;
            }
            return j;
        }

        OptimizerOptions OptimizerOptions::from_json(const nlohmann::json &j)
        {
            OptimizerOptions options;
            options.solver = SolverOptions::from_json(j);
            if (j.contains("seed") && !j["seed"].is_null())
            {
                options.seed = j["seed"].get<unsigned int>();
            }
            return options;
        }

        // ============================================================================
        // OptResult
        // ============================================================================

        OptResult::OptResult()
            : objective_value(0.0),
              iterations(0),
              evaluations(0),
              recorded_points(0),
              status(SolverStatus::FAILED)
        {
        }

        bool OptResult::is_valid(const std::vector<AssetBounds> &bounds, double tolerance) const
        {
            return optimal_weights.size() > 0 &&
                   optimal_weights.allFinite() &&
                   satisfies_bounds(optimal_weights, bounds, tolerance);
        }

        nlohmann::json OptResult::to_json() const
        {
            nlohmann::json frontier = nlohmann::json::array();
            for (const auto &point : efficient_frontier)
            {
                frontier.push_back(point.to_json());
            }

            return nlohmann::json{
                {"optimal_weights", std::vector<double>(optimal_weights.data(),
                                                        optimal_weights.data() + optimal_weights.size())},
                {"efficient_frontier", frontier},
                {"objective_value", objective_value},
                {"iterations", iterations},
                {"evaluations", evaluations},
                {"recorded_points", recorded_points},
                {"status", status_to_string(status)},
                {"message", message}};
        }

        void OptResult::print_summary() const
        {
            std::cout << "\n=== Optimization Result ===\n";
            std::cout << "Status: " << status_to_string(status) << " (" << message << ")\n";
            std::cout << "Iterations: " << iterations << ", evaluations: " << evaluations << "\n";
            std::cout << "Objective value: " << std::fixed << std::setprecision(6) << objective_value << "\n";
            std::cout << "Frontier points: " << efficient_frontier.size() << " of " << recorded_points << " recorded\n";
            std::cout << "Weights:";
            for (Eigen::Index i = 0; i < optimal_weights.size(); ++i)
            {
                std::cout << " " << std::setprecision(4) << optimal_weights(i);
            }
            std::cout << "\n===========================\n";
        }

        // ============================================================================
        // PortfolioOptimizer
        // ============================================================================

        PortfolioOptimizer::PortfolioOptimizer(ObjectiveFunction objective, const OptimizerOptions &options)
            : objective_(objective), options_(options)
        {
            options_.solver.validate();
        }

        OptResult PortfolioOptimizer::optimize(const ObjectiveInputs &inputs,
                                               const std::vector<AssetBounds> &bounds) const
        {
            FrontierAccumulator accumulator;
            return optimize(inputs, bounds, accumulator);
        }

        OptResult PortfolioOptimizer::optimize(const ObjectiveInputs &inputs,
                                               const std::vector<AssetBounds> &bounds,
                                               FrontierAccumulator &accumulator) const
        {
            inputs.validate();

            const Eigen::Index n = inputs.mean_returns.size();
            const std::vector<AssetBounds> active_bounds =
                bounds.empty() ? default_bounds(static_cast<size_t>(n)) : bounds;
            validate_bounds(active_bounds, static_cast<size_t>(n));

            const ObjectiveFunction objective = objective_;
            auto loss = [&inputs, &active_bounds, &accumulator, objective](const Eigen::VectorXd &raw)
            {
                const Eigen::VectorXd weights = enforce_constraints(raw, active_bounds);
                accumulator.record({analytics::mean_portfolio_return(weights, inputs.mean_returns),
                                    analytics::portfolio_std_dev(weights, inputs.covariance)});
                return evaluate_objective(objective, weights, inputs);
            };

            GradientDescent solver(options_.solver);
            SolverResult descent = solver.minimize(loss, random_weights(n));

            OptResult result;
            result.optimal_weights = enforce_constraints(descent.solution, active_bounds);
            result.objective_value = evaluate_objective(objective_, result.optimal_weights, inputs);
            result.iterations = descent.iterations;
            result.evaluations = descent.evaluations;
            result.status = descent.status;
            result.message = descent.message;

            const std::vector<analytics::FrontierPoint> recorded = accumulator.snapshot();
            result.recorded_points = recorded.size();
            result.efficient_frontier = analytics::efficient_frontier_points(recorded);

            if (options_.solver.verbose)
            {
                result.print_summary();
            }

            return result;
        }

        nlohmann::json PortfolioOptimizer::get_parameters() const
        {
            nlohmann::json params = options_.to_json();
            params["method"] = get_name();
            params["objective"] = objective_to_string(objective_);
            return params;
        }

        Eigen::VectorXd PortfolioOptimizer::random_weights(Eigen::Index n) const
        {
            std::mt19937 engine(options_.seed.has_value() ? *options_.seed : std::random_device{}());
            std::uniform_real_distribution<double> uniform(0.0, 1.0);

            Eigen::VectorXd weights(n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                weights(i) = uniform(engine);
            }

            const double total = weights.sum();
            if (total <= 0.0)
            {
                return Eigen::VectorXd::Constant(n, 1.0 / static_cast<double>(n));
            }
            return weights / total;
        }

    } // namespace optimizer
} // namespace finperf
