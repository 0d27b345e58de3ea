/**
 * @file portfolio_performance.cpp
 * @brief Implementation of PortfolioPerformanceStats.
 */

#include "finperf/analytics/portfolio_performance.hpp"
#include "finperf/analytics/statistics.hpp"
#include <cmath>
#include <future>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace finperf
{
    namespace analytics
    {

        namespace
        {
            std::vector<double> to_std_vector(const Eigen::VectorXd &v)
            {
                return std::vector<double>(v.data(), v.data() + v.size());
            }
        } // namespace

        void PortfolioPerformanceStats::warn(const std::string &message)
        {
            std::cerr << "Warning: " << message << std::endl;
            warnings_.push_back(message);
        }

        PortfolioPerformanceStats PortfolioPerformanceStats::compute(const PortfolioConfig &config,
                                                                     const MarketDataProvider &provider)
        {
            config.validate();

            PortfolioPerformanceStats result;
            result.benchmark_symbol_ = config.benchmark;
            result.start_date_ = config.start_date;
            result.end_date_ = config.end_date;
            result.interval_ = config.interval;
            result.confidence_level_ = config.confidence_level;
            result.risk_free_rate_ = config.risk_free_rate;
            result.objective_ = config.objective;

            // ================================================================
            // Fetch: one task per symbol plus the benchmark
            // ================================================================

            auto fetch = [&provider, &config](const std::string &symbol)
            {
                return provider.fetch_return_series(symbol, config.start_date,
                                                    config.end_date, config.interval);
            };

            std::future<ReturnSeries> benchmark_task =
                std::async(std::launch::async, fetch, config.benchmark);

            std::vector<std::future<ReturnSeries>> symbol_tasks;
            symbol_tasks.reserve(config.symbols.size());
            for (const auto &symbol : config.symbols)
            {
                symbol_tasks.push_back(std::async(std::launch::async, fetch, symbol));
            }

            std::vector<ReturnSeries> fetched;
            std::vector<size_t> positions;
            for (size_t i = 0; i < symbol_tasks.size(); ++i)
            {
                try
                {
                    fetched.push_back(symbol_tasks[i].get());
                    positions.push_back(i);
                }
                catch (const FetchError &e)
                {
                    result.dropped_symbols_.push_back(config.symbols[i]);
                    result.warn("No returns data for " + config.symbols[i] + ": " + e.what());
                }
            }

            ReturnSeries benchmark;
            try
            {
                benchmark = benchmark_task.get();
            }
            catch (const FetchError &e)
            {
                throw std::invalid_argument("Benchmark " + config.benchmark +
                                            " could not be fetched: " + e.what());
            }

            if (fetched.empty())
            {
                throw std::invalid_argument("No returns data for any of the requested symbols");
            }

            // ================================================================
            // Align
            // ================================================================

            result.returns_ = align_returns(fetched);
            result.benchmark_returns_ = align_to(benchmark, result.returns_.get_timestamps());
            result.interval_days_ = result.returns_.interval_days();

            const Eigen::MatrixXd &table = result.returns_.get_values();
            const Eigen::Index n = table.cols();

            // ================================================================
            // Restrict constraints to the surviving symbols
            // ================================================================

            if (config.bounds.empty())
            {
                result.bounds_ = optimizer::default_bounds(static_cast<size_t>(n));
            }
            else
            {
                for (size_t pos : positions)
                {
                    result.bounds_.push_back(config.bounds[pos]);
                }
            }
            optimizer::validate_bounds(result.bounds_, static_cast<size_t>(n));

            for (const auto &constraint : config.categorical_constraints)
            {
                optimizer::CategoricalConstraint selected = constraint.select(positions);
                selected.validate(static_cast<size_t>(n));
                result.categorical_constraints_.push_back(selected);
            }

            // ================================================================
            // Weights
            // ================================================================

            const double periods_per_year = 365.0 / result.interval_days_.average;
            const optimizer::ObjectiveInputs inputs = optimizer::ObjectiveInputs::from_returns(
                table, config.risk_free_rate * 100.0 / periods_per_year,
                config.confidence_level, periods_per_year);

            if (config.weights.has_value())
            {
                Eigen::VectorXd weights(n);
                for (Eigen::Index i = 0; i < n; ++i)
                {
                    weights(i) = (*config.weights)[positions[static_cast<size_t>(i)]];
                }

                const double total = weights.sum();
                if (!std::isfinite(total) || total == 0.0)
                {
                    throw std::invalid_argument("Weight override sums to " + std::to_string(total) +
                                                " over the available symbols");
                }
                weights /= total;

                if (!optimizer::satisfies_bounds(weights, result.bounds_, 1e-9))
                {
                    result.warn("User defined weights lie outside the configured bounds");
                }

                optimizer::OptResult &opt = result.optimization_result_;
                opt.optimal_weights = weights;
                opt.objective_value = optimizer::evaluate_objective(config.objective, weights, inputs);
                opt.status = optimizer::SolverStatus::CONVERGED;
                opt.message = "Weights supplied by the caller";
                result.optimization_method_ = "User Defined Weights";
            }
            else
            {
                optimizer::PortfolioOptimizer engine(config.objective, config.optimizer);
                result.optimization_result_ = engine.optimize(inputs, result.bounds_);
                result.optimization_method_ = engine.get_name();
            }

            // ================================================================
            // Categorical constraints
            // ================================================================

            if (!result.categorical_constraints_.empty())
            {
                result.category_allocations_ = optimizer::evaluate_categories(
                    result.optimization_result_.optimal_weights, result.categorical_constraints_);

                if (!optimizer::categories_satisfied(result.category_allocations_))
                {
                    if (config.repair_categories)
                    {
                        result.warn("Categorical constraints violated; projecting weights onto them");
                        optimizer::OptResult &opt = result.optimization_result_;
                        opt.optimal_weights = optimizer::project_onto_categories(
                            opt.optimal_weights, result.bounds_, result.categorical_constraints_);
                        opt.objective_value = optimizer::evaluate_objective(
                            config.objective, opt.optimal_weights, inputs);
                        result.categories_repaired_ = true;
                        result.category_allocations_ = optimizer::evaluate_categories(
                            opt.optimal_weights, result.categorical_constraints_);
                    }
                    else
                    {
                        result.warn("Categorical constraints violated by the final weights");
                    }
                }
            }

            // ================================================================
            // Frontier
            // ================================================================

            if (config.frontier_points > 0)
            {
                optimizer::EfficientFrontier frontier;
                frontier.set_num_points(config.frontier_points);
                result.traced_frontier_ = frontier.trace(inputs.mean_returns, inputs.covariance,
                                                         result.bounds_, inputs.risk_free_rate);
                if (!result.traced_frontier_->success)
                {
                    result.warn(result.traced_frontier_->message);
                }
            }

            // ================================================================
            // Performance
            // ================================================================

            result.portfolio_returns_.symbol = "Portfolio";
            result.portfolio_returns_.timestamps = result.returns_.get_timestamps();
            result.portfolio_returns_.values = daily_portfolio_returns(
                result.optimization_result_.optimal_weights, table);

            result.performance_stats_ = PerformanceStats::compute(
                result.portfolio_returns_.values, result.benchmark_returns_.values,
                config.risk_free_rate, config.confidence_level, result.interval_days_);

            return result;
        }

        nlohmann::json PortfolioPerformanceStats::to_json() const
        {
            nlohmann::json j;
            j["symbols"] = get_symbols();
            j["dropped_symbols"] = dropped_symbols_;
            j["benchmark"] = benchmark_symbol_;
            j["start_date"] = start_date_;
            j["end_date"] = end_date_;
            j["interval"] = interval_to_string(interval_);
            j["interval_days"] = interval_days_.to_json();
            j["confidence_level"] = confidence_level_;
            j["risk_free_rate"] = risk_free_rate_;
            j["objective"] = optimizer::objective_to_string(objective_);
            j["optimization_method"] = optimization_method_;
            j["optimization"] = optimization_result_.to_json();

            nlohmann::json weights = nlohmann::json::object();
            const auto &symbols = get_symbols();
            for (size_t i = 0; i < symbols.size(); ++i)
            {
                weights[symbols[i]] = optimization_result_.optimal_weights(static_cast<Eigen::Index>(i));
            }
            j["weights"] = weights;

            j["category_allocations"] = nlohmann::json::array();
            for (const auto &allocation : category_allocations_)
            {
                j["category_allocations"].push_back(allocation.to_json());
            }
            j["categories_repaired"] = categories_repaired_;

            if (traced_frontier_.has_value())
            {
                j["traced_frontier"] = traced_frontier_->to_json();
            }

            j["portfolio_returns"] = to_std_vector(portfolio_returns_.values);
            j["performance_stats"] = performance_stats_.to_json();
            j["warnings"] = warnings_;
            return j;
        }

        void PortfolioPerformanceStats::print_summary() const
        {
            std::cout << "\n=== Portfolio Performance ===\n";
            std::cout << "Period: " << start_date_ << " to " << end_date_
                      << " (" << interval_to_string(interval_) << ", "
                      << get_returns().num_periods() << " periods)\n";
            std::cout << "Benchmark: " << benchmark_symbol_ << "\n";
            std::cout << "Objective: " << optimizer::objective_to_string(objective_)
                      << " via " << optimization_method_ << "\n";
            if (!dropped_symbols_.empty())
            {
                std::cout << "Dropped:";
                for (const auto &symbol : dropped_symbols_)
                {
                    std::cout << " " << symbol;
                }
                std::cout << "\n";
            }
            std::cout << std::string(40, '-') << "\n";

            std::cout << "Weights:\n";
            const auto &symbols = get_symbols();
            for (size_t i = 0; i < symbols.size(); ++i)
            {
                std::cout << "  " << std::left << std::setw(10) << symbols[i] << std::right
                          << std::fixed << std::setprecision(2) << std::setw(8)
                          << optimization_result_.optimal_weights(static_cast<Eigen::Index>(i)) * 100.0
                          << "%\n";
            }

            for (const auto &allocation : category_allocations_)
            {
                std::cout << "  [" << allocation.constraint << "] " << allocation.label << ": "
                          << std::setprecision(2) << allocation.weight * 100.0 << "% in ["
                          << allocation.lower * 100.0 << "%, " << allocation.upper * 100.0 << "%]"
                          << (allocation.satisfied ? "" : " VIOLATED") << "\n";
            }

            std::cout << std::string(40, '-') << "\n";
            std::cout << performance_stats_.summary();
            std::cout << "=============================\n"
                      << std::endl;
        }

    } // namespace analytics
} // namespace finperf
