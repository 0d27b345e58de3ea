/**
 * @file constraints.hpp
 * @brief Per-asset bounds, categorical constraints and their enforcement
 *
 * Per-asset bounds are enforced on every objective evaluation by
 * enforce_constraints(). Categorical constraints bound the total weight of
 * each category label; they are checked after optimization and, when
 * violated, repaired by a single QP projection.
 */

#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace finperf
{
    namespace optimizer
    {

        /**
         * @class InfeasibleConstraints
         * @brief No weight vector summing to one satisfies the constraints
         */
        class InfeasibleConstraints : public std::invalid_argument
        {
        public:
            explicit InfeasibleConstraints(const std::string &message)
                : std::invalid_argument(message)
            {
            }
        };

        /**
         * @struct AssetBounds
         * @brief Inclusive [lower, upper] weight range for one asset
         */
        struct AssetBounds
        {
            double lower = 0.0; ///< Minimum weight (negative allows shorting)
            double upper = 1.0; ///< Maximum weight

            nlohmann::json to_json() const;

            /**
             * @brief Accepts [lower, upper] or {"lower": .., "upper": ..}
             */
            static AssetBounds from_json(const nlohmann::json &j);
        };

        /**
         * @brief [0, 1] for each of n assets
         */
        std::vector<AssetBounds> default_bounds(size_t n);

        /**
         * @brief Check that some weight vector in the box sums to one
         *
         * Requires lower <= upper for every asset and
         * sum(lower) <= 1 <= sum(upper).
         *
         * @throws InfeasibleConstraints when no feasible vector exists
         * @throws std::invalid_argument if bounds.size() != n or a bound is NaN
         */
        void validate_bounds(const std::vector<AssetBounds> &bounds, size_t n);

        /**
         * @brief Clamp to bounds, then renormalize to sum to one
         *
         * When the clamped weights already sum to one this is exactly
         * clamp-then-divide-by-sum. Otherwise the shortfall or excess is
         * spread over the weights not pinned at the bound it would push
         * against (proportionally when their sum is positive, evenly when
         * it is not), re-clamping until the vector is stable. A clamped sum
         * of zero is therefore handled without dividing by zero. When short
         * positions keep those passes from settling, the weights are shifted
         * by a common offset found by bisection so the clamped sum is one.
         *
         * Bounds must already have passed validate_bounds().
         *
         * @throws std::invalid_argument if raw_weights.size() != bounds.size()
         */
        Eigen::VectorXd enforce_constraints(const Eigen::VectorXd &raw_weights,
                                            const std::vector<AssetBounds> &bounds);

        /**
         * @brief True when weights sum to one and lie inside their bounds
         */
        bool satisfies_bounds(const Eigen::VectorXd &weights,
                              const std::vector<AssetBounds> &bounds,
                              double tolerance = 1e-9);

        // ============================================================================
        // Categorical constraints
        // ============================================================================

        /**
         * @struct CategoryBound
         * @brief Allowed total weight for one category label
         */
        struct CategoryBound
        {
            std::string label;
            double lower = 0.0;
            double upper = 1.0;
        };

        /**
         * @struct CategoricalConstraint
         * @brief Groups assets by a label and bounds each label's total weight
         *
         * Example: {"Sector", {"Tech", "Tech", "Energy"},
         *           {{"Tech", 0.2, 0.6}, {"Energy", 0.1, 0.5}}}
         * Labels without a CategoryBound are unconstrained.
         */
        struct CategoricalConstraint
        {
            std::string name;                             ///< e.g. "Sector"
            std::vector<std::string> category_per_symbol; ///< One label per asset, positional
            std::vector<CategoryBound> weight_per_category;

            /**
             * @throws std::invalid_argument if the label list does not have n
             *         entries, a bound names an unknown label or has lower > upper
             */
            void validate(size_t n) const;

            /**
             * @brief Keep the labels of the assets at the given positions
             */
            CategoricalConstraint select(const std::vector<size_t> &positions) const;

            nlohmann::json to_json() const;

            /**
             * @brief Accepts {"name", "categories", "bounds": [[label, lo, hi], ...]}
             */
            static CategoricalConstraint from_json(const nlohmann::json &j);
        };

        /**
         * @struct CategoryAllocation
         * @brief Total weight assigned to one constrained label
         */
        struct CategoryAllocation
        {
            std::string constraint; ///< CategoricalConstraint::name
            std::string label;
            double weight;
            double lower;
            double upper;
            bool satisfied;

            nlohmann::json to_json() const;
        };

        /**
         * @brief Total weight per constrained label, in constraint order
         */
        std::vector<CategoryAllocation> evaluate_categories(
            const Eigen::VectorXd &weights,
            const std::vector<CategoricalConstraint> &constraints,
            double tolerance = 1e-6);

        /**
         * @brief True when every allocation is satisfied
         */
        bool categories_satisfied(const std::vector<CategoryAllocation> &allocations);

        /**
         * @brief Nearest weights (Euclidean) satisfying bounds, sum-to-one and
         *        every categorical constraint
         *
         * Solves min ||w - weights||^2 with OSQP.
         *
         * @throws InfeasibleConstraints if OSQP finds no feasible point
         */
        Eigen::VectorXd project_onto_categories(
            const Eigen::VectorXd &weights,
            const std::vector<AssetBounds> &bounds,
            const std::vector<CategoricalConstraint> &constraints);

    } // namespace optimizer
} // namespace finperf
