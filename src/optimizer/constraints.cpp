/**
 * @file constraints.cpp
 * @brief Implementation of bound enforcement and categorical constraints
 */

#include "finperf/optimizer/constraints.hpp"
#include "finperf/optimizer/osqp_solver.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

namespace finperf
{
    namespace optimizer
    {

        namespace
        {
            constexpr double kSumTolerance = 1e-12;

            Eigen::VectorXd clamp(const Eigen::VectorXd &weights, const std::vector<AssetBounds> &bounds)
            {
                Eigen::VectorXd clamped = weights;
                for (Eigen::Index i = 0; i < clamped.size(); ++i)
                {
                    clamped(i) = std::max(bounds[i].lower, std::min(bounds[i].upper, clamped(i)));
                }
                return clamped;
            }

            /**
             * Exact projection for the cases proportional rescaling cannot finish,
             * such as short positions. Finds the shift lambda with
             * sum(clamp(w + lambda)) == 1 by bisection; the sum is monotone in lambda.
             */
            Eigen::VectorXd shift_to_unit_sum(const Eigen::VectorXd &weights,
                                              const std::vector<AssetBounds> &bounds)
            {
                double low = 0.0;
                double high = 0.0;
                for (Eigen::Index i = 0; i < weights.size(); ++i)
                {
                    low = std::min(low, bounds[i].lower - weights(i));
                    high = std::max(high, bounds[i].upper - weights(i));
                }
                if (!std::isfinite(low) || !std::isfinite(high))
                {
                    return weights;
                }

                auto shifted = [&](double lambda)
                {
                    return clamp((weights.array() + lambda).matrix(), bounds);
                };

                for (int iter = 0; iter < 200; ++iter)
                {
                    const double mid = 0.5 * (low + high);
                    if (mid <= low || mid >= high)
                    {
                        break;
                    }
                    if (shifted(mid).sum() < 1.0)
                    {
                        low = mid;
                    }
                    else
                    {
                        high = mid;
                    }
                }

                const Eigen::VectorXd below = shifted(low);
                const Eigen::VectorXd above = shifted(high);
                return std::abs(below.sum() - 1.0) <= std::abs(above.sum() - 1.0) ? below : above;
            }
        } // namespace

        // ============================================================================
        // AssetBounds
        // ============================================================================

        nlohmann::json AssetBounds::to_json() const
        {
            return nlohmann::json::array({lower, upper});
        }

        AssetBounds AssetBounds::from_json(const nlohmann::json &j)
        {
            AssetBounds bounds;
            if (j.is_array())
            {
                if (j.size() != 2)
                {
                    throw std::invalid_argument("Asset bounds must be [lower, upper], got " + j.dump());
                }
                bounds.lower = j.at(0).get<double>();
                bounds.upper = j.at(1).get<double>();
            }
            else
            {
                bounds.lower = j.value("lower", 0.0);
                bounds.upper = j.value("upper", 1.0);
            }
            return bounds;
        }

        std::vector<AssetBounds> default_bounds(size_t n)
        {
            return std::vector<AssetBounds>(n, AssetBounds{});
        }

        void validate_bounds(const std::vector<AssetBounds> &bounds, size_t n)
        {
            if (bounds.size() != n)
            {
                throw std::invalid_argument("Expected " + std::to_string(n) + " asset bounds, got " +
                                            std::to_string(bounds.size()));
            }

            double lower_sum = 0.0;
            double upper_sum = 0.0;
            for (size_t i = 0; i < bounds.size(); ++i)
            {
                if (std::isnan(bounds[i].lower) || std::isnan(bounds[i].upper))
                {
                    throw std::invalid_argument("Asset bounds at index " + std::to_string(i) + " contain NaN");
                }
                if (bounds[i].lower > bounds[i].upper)
                {
                    throw InfeasibleConstraints("Asset bounds at index " + std::to_string(i) +
                                                " have lower " + std::to_string(bounds[i].lower) +
                                                " > upper " + std::to_string(bounds[i].upper));
                }
                lower_sum += bounds[i].lower;
                upper_sum += bounds[i].upper;
            }

            if (lower_sum > 1.0 + 1e-9 || upper_sum < 1.0 - 1e-9)
            {
                throw InfeasibleConstraints("Asset bounds cannot sum to 1: lower bounds sum to " +
                                            std::to_string(lower_sum) + ", upper bounds sum to " +
                                            std::to_string(upper_sum));
            }
        }

        Eigen::VectorXd enforce_constraints(const Eigen::VectorXd &raw_weights,
                                            const std::vector<AssetBounds> &bounds)
        {
            if (static_cast<size_t>(raw_weights.size()) != bounds.size())
            {
                throw std::invalid_argument("enforce_constraints: " + std::to_string(raw_weights.size()) +
                                            " weights for " + std::to_string(bounds.size()) + " bounds");
            }

            Eigen::VectorXd weights = clamp(raw_weights, bounds);
            const Eigen::Index n = weights.size();

            // Proportional passes settle long-only bounds; anything left is shifted exactly
            for (Eigen::Index pass = 0; pass <= n + 1; ++pass)
            {
                const double total = weights.sum();
                if (std::abs(total - 1.0) <= kSumTolerance || std::isnan(total))
                {
                    break;
                }

                const bool increase = total < 1.0;
                std::vector<Eigen::Index> free;
                double free_sum = 0.0;
                for (Eigen::Index i = 0; i < n; ++i)
                {
                    const bool pinned = increase ? weights(i) >= bounds[i].upper
                                                 : weights(i) <= bounds[i].lower;
                    if (!pinned)
                    {
                        free.push_back(i);
                        free_sum += weights(i);
                    }
                }

                if (free.empty())
                {
                    break;
                }

                const bool long_only = std::all_of(free.begin(), free.end(),
                                                   [&weights](Eigen::Index i) { return weights(i) >= 0.0; });
                const double residual = 1.0 - total;
                if (long_only && free_sum > 0.0 && free_sum + residual > 0.0)
                {
                    const double scale = (free_sum + residual) / free_sum;
                    for (auto i : free)
                    {
                        weights(i) *= scale;
                    }
                }
                else
                {
                    const double share = residual / static_cast<double>(free.size());
                    for (auto i : free)
                    {
                        weights(i) += share;
                    }
                }

                weights = clamp(weights, bounds);
            }

            const double total = weights.sum();
            if (std::isfinite(total) && std::abs(total - 1.0) > kSumTolerance)
            {
                weights = shift_to_unit_sum(weights, bounds);
            }

            return weights;
        }

        bool satisfies_bounds(const Eigen::VectorXd &weights,
                              const std::vector<AssetBounds> &bounds,
                              double tolerance)
        {
            if (static_cast<size_t>(weights.size()) != bounds.size())
            {
                return false;
            }
            if (std::abs(weights.sum() - 1.0) > tolerance)
            {
                return false;
            }
            for (Eigen::Index i = 0; i < weights.size(); ++i)
            {
                if (weights(i) < bounds[i].lower - tolerance || weights(i) > bounds[i].upper + tolerance)
                {
                    return false;
                }
            }
            return true;
        }

        // ============================================================================
        // CategoricalConstraint
        // ============================================================================

        void CategoricalConstraint::validate(size_t n) const
        {
            if (category_per_symbol.size() != n)
            {
                throw std::invalid_argument("Categorical constraint '" + name + "' labels " +
                                            std::to_string(category_per_symbol.size()) + " assets, expected " +
                                            std::to_string(n));
            }

            std::set<std::string> labels(category_per_symbol.begin(), category_per_symbol.end());
            std::set<std::string> bounded;
            for (const auto &bound : weight_per_category)
            {
                if (labels.count(bound.label) == 0)
                {
                    throw std::invalid_argument("Categorical constraint '" + name + "' bounds unknown label '" +
                                                bound.label + "'");
                }
                if (!bounded.insert(bound.label).second)
                {
                    throw std::invalid_argument("Categorical constraint '" + name + "' bounds label '" +
                                                bound.label + "' twice");
                }
                if (std::isnan(bound.lower) || std::isnan(bound.upper) || bound.lower > bound.upper)
                {
                    throw std::invalid_argument("Categorical constraint '" + name + "' has invalid range for '" +
                                                bound.label + "'");
                }
            }
        }

        CategoricalConstraint CategoricalConstraint::select(const std::vector<size_t> &positions) const
        {
            CategoricalConstraint selected;
            selected.name = name;
            for (auto pos : positions)
            {
                selected.category_per_symbol.push_back(category_per_symbol.at(pos));
            }

            // Labels with no remaining asset cannot be bounded any more
            std::set<std::string> labels(selected.category_per_symbol.begin(), selected.category_per_symbol.end());
            for (const auto &bound : weight_per_category)
            {
                if (labels.count(bound.label) > 0)
                {
                    selected.weight_per_category.push_back(bound);
                }
            }
            return selected;
        }

        nlohmann::json CategoricalConstraint::to_json() const
        {
            nlohmann::json bounds = nlohmann::json::array();
            for (const auto &bound : weight_per_category)
            {
                bounds.push_back(nlohmann::json::array({bound.label, bound.lower, bound.upper}));
            }
            return nlohmann::json{
                {"name", name},
                {"categories", category_per_symbol},
                {"bounds", bounds}};
        }

        CategoricalConstraint CategoricalConstraint::from_json(const nlohmann::json &j)
        {
            CategoricalConstraint constraint;
            nlohmann::json bounds;

            if (j.is_array())
            {
                // [name, [label, ...], [[label, lower, upper], ...]]
                if (j.size() != 3)
                {
                    throw std::invalid_argument("Categorical constraint array must have 3 elements");
                }
                constraint.name = j.at(0).get<std::string>();
                constraint.category_per_symbol = j.at(1).get<std::vector<std::string>>();
                bounds = j.at(2);
            }
            else
            {
                constraint.name = j.value("name", "");
                constraint.category_per_symbol = j.value("categories", std::vector<std::string>{});
                bounds = j.value("bounds", nlohmann::json::array());
            }

            for (const auto &b : bounds)
            {
                CategoryBound bound;
                if (b.is_array())
                {
                    bound.label = b.at(0).get<std::string>();
                    bound.lower = b.at(1).get<double>();
                    bound.upper = b.at(2).get<double>();
                }
                else
                {
                    bound.label = b.at("label").get<std::string>();
                    bound.lower = b.value("lower", 0.0);
                    bound.upper = b.value("upper", 1.0);
                }
                constraint.weight_per_category.push_back(bound);
            }

            return constraint;
        }

        nlohmann::json CategoryAllocation::to_json() const
        {
            return nlohmann::json{
                {"constraint", constraint},
                {"label", label},
                {"weight", weight},
                {"lower", lower},
                {"upper", upper},
                {"satisfied", satisfied}};
        }

        std::vector<CategoryAllocation> evaluate_categories(
            const Eigen::VectorXd &weights,
            const std::vector<CategoricalConstraint> &constraints,
            double tolerance)
        {
            std::vector<CategoryAllocation> allocations;

            for (const auto &constraint : constraints)
            {
                constraint.validate(static_cast<size_t>(weights.size()));

                for (const auto &bound : constraint.weight_per_category)
                {
                    double total = 0.0;
                    for (size_t i = 0; i < constraint.category_per_symbol.size(); ++i)
                    {
                        if (constraint.category_per_symbol[i] == bound.label)
                        {
                            total += weights(static_cast<Eigen::Index>(i));
                        }
                    }

                    CategoryAllocation allocation;
                    allocation.constraint = constraint.name;
                    allocation.label = bound.label;
                    allocation.weight = total;
                    allocation.lower = bound.lower;
                    allocation.upper = bound.upper;
                    allocation.satisfied = total >= bound.lower - tolerance &&
                                           total <= bound.upper + tolerance;
                    allocations.push_back(allocation);
                }
            }

            return allocations;
        }

        bool categories_satisfied(const std::vector<CategoryAllocation> &allocations)
        {
            return std::all_of(allocations.begin(), allocations.end(),
                               [](const CategoryAllocation &a)
                               { return a.satisfied; });
        }

        Eigen::VectorXd project_onto_categories(
            const Eigen::VectorXd &weights,
            const std::vector<AssetBounds> &bounds,
            const std::vector<CategoricalConstraint> &constraints)
        {
            const Eigen::Index n = weights.size();
            validate_bounds(bounds, static_cast<size_t>(n));

            size_t rows = 0;
            for (const auto &constraint : constraints)
            {
                constraint.validate(static_cast<size_t>(n));
                rows += constraint.weight_per_category.size();
            }

            QuadraticProblem problem;
            problem.P = 2.0 * Eigen::MatrixXd::Identity(n, n);
            problem.q = -2.0 * weights;
            problem.A_eq = Eigen::MatrixXd::Ones(1, n);
            problem.b_eq = Eigen::VectorXd::Ones(1);

            problem.A_ineq = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(rows), n);
            problem.b_ineq_lower.resize(static_cast<Eigen::Index>(rows));
            problem.b_ineq_upper.resize(static_cast<Eigen::Index>(rows));

            Eigen::Index row = 0;
            for (const auto &constraint : constraints)
            {
                for (const auto &bound : constraint.weight_per_category)
                {
                    for (size_t i = 0; i < constraint.category_per_symbol.size(); ++i)
                    {
                        if (constraint.category_per_symbol[i] == bound.label)
                        {
                            problem.A_ineq(row, static_cast<Eigen::Index>(i)) = 1.0;
                        }
                    }
                    problem.b_ineq_lower(row) = bound.lower;
                    problem.b_ineq_upper(row) = bound.upper;
                    ++row;
                }
            }

            problem.lower_bounds.resize(n);
            problem.upper_bounds.resize(n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                problem.lower_bounds(i) = bounds[i].lower;
                problem.upper_bounds(i) = bounds[i].upper;
            }

            OSQPSolver solver;
            SolverResult result = solver.solve(problem);
            if (!result.success || !result.solution.allFinite())
            {
                std::ostringstream oss;
                oss << "Categorical constraints cannot be satisfied together with asset bounds (OSQP: "
                    << result.message << ")";
                throw InfeasibleConstraints(oss.str());
            }

            // Remove solver round-off outside the box
            return enforce_constraints(result.solution, bounds);
        }

    } // namespace optimizer
} // namespace finperf
