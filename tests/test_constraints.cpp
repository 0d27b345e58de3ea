/**
 * @file test_constraints.cpp
 * @brief Unit tests for bound enforcement and categorical constraints
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "finperf/optimizer/constraints.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <random>

using namespace finperf::optimizer;
using Catch::Matchers::WithinAbs;

TEST_CASE("Bound validation", "[Constraints]") {
    SECTION("Default bounds are feasible") {
        REQUIRE_NOTHROW(validate_bounds(default_bounds(4), 4));
    }

    SECTION("Upper bounds summing below one are infeasible") {
        std::vector<AssetBounds> bounds = {{0.0, 0.3}, {0.0, 0.3}};
        REQUIRE_THROWS_AS(validate_bounds(bounds, 2), InfeasibleConstraints);
    }

    SECTION("Lower bounds summing above one are infeasible") {
        std::vector<AssetBounds> bounds = {{0.6, 1.0}, {0.6, 1.0}};
        REQUIRE_THROWS_AS(validate_bounds(bounds, 2), InfeasibleConstraints);
    }

    SECTION("Inverted range is infeasible") {
        std::vector<AssetBounds> bounds = {{0.8, 0.2}, {0.0, 1.0}};
        REQUIRE_THROWS_AS(validate_bounds(bounds, 2), InfeasibleConstraints);
    }

    SECTION("Size mismatch is an input error") {
        REQUIRE_THROWS_AS(validate_bounds(default_bounds(2), 3), std::invalid_argument);
    }

    SECTION("JSON accepts pairs and objects") {
        const auto pair = AssetBounds::from_json(nlohmann::json::array({0.1, 0.4}));
        REQUIRE(pair.lower == 0.1);
        REQUIRE(pair.upper == 0.4);

        const auto object = AssetBounds::from_json(nlohmann::json{{"upper", 0.7}});
        REQUIRE(object.lower == 0.0);
        REQUIRE(object.upper == 0.7);
    }
}

TEST_CASE("Constraint enforcement", "[Constraints][Enforce]") {
    SECTION("Clamped weights already summing to one are kept") {
        Eigen::VectorXd raw(2);
        raw << 0.9, 0.9;
        std::vector<AssetBounds> bounds = {{0.0, 0.5}, {0.0, 0.5}};

        const Eigen::VectorXd w = enforce_constraints(raw, bounds);
        REQUIRE_THAT(w(0), WithinAbs(0.5, 1e-12));
        REQUIRE_THAT(w(1), WithinAbs(0.5, 1e-12));
    }

    SECTION("Within-bound weights are renormalized proportionally") {
        Eigen::VectorXd raw(3);
        raw << 0.2, 0.2, 0.4;
        const Eigen::VectorXd w = enforce_constraints(raw, default_bounds(3));
        REQUIRE_THAT(w(0), WithinAbs(0.25, 1e-12));
        REQUIRE_THAT(w(1), WithinAbs(0.25, 1e-12));
        REQUIRE_THAT(w(2), WithinAbs(0.5, 1e-12));
    }

    SECTION("All-zero weights do not divide by zero") {
        const Eigen::VectorXd w = enforce_constraints(Eigen::VectorXd::Zero(4), default_bounds(4));
        for (Eigen::Index i = 0; i < 4; ++i) {
            REQUIRE_THAT(w(i), WithinAbs(0.25, 1e-12));
        }
    }

    SECTION("Negative weights clamp to zero then spread evenly") {
        Eigen::VectorXd raw(2);
        raw << -1.0, -2.0;
        const Eigen::VectorXd w = enforce_constraints(raw, default_bounds(2));
        REQUIRE_THAT(w(0), WithinAbs(0.5, 1e-12));
        REQUIRE_THAT(w(1), WithinAbs(0.5, 1e-12));
    }

    SECTION("Single asset always gets the full weight") {
        Eigen::VectorXd raw(1);
        raw << 0.3;
        const Eigen::VectorXd w = enforce_constraints(raw, default_bounds(1));
        REQUIRE_THAT(w(0), WithinAbs(1.0, 1e-12));
    }

    SECTION("Randomized weights always land inside the bounds and sum to one") {
        std::vector<AssetBounds> bounds = {{0.1, 0.6}, {0.0, 0.3}, {0.2, 0.9}, {0.0, 0.15}};
        std::mt19937 engine(42);
        std::uniform_real_distribution<double> draw(-1.0, 2.0);

        for (int trial = 0; trial < 500; ++trial) {
            Eigen::VectorXd raw(4);
            for (Eigen::Index i = 0; i < 4; ++i) {
                raw(i) = draw(engine);
            }
            const Eigen::VectorXd w = enforce_constraints(raw, bounds);
            REQUIRE(satisfies_bounds(w, bounds, 1e-9));
        }
    }

    SECTION("Short positions allowed by the bounds still sum to one") {
        std::vector<AssetBounds> bounds = {{0.52, 0.79}, {-0.80, -0.29}, {0.32, 0.61},
                                           {0.51, 0.56}, {-0.43, -0.34}, {-0.24, 0.24}};
        Eigen::VectorXd raw(6);
        raw << -1.85, 0.28, 1.33, 1.13, 1.82, -1.52;

        const Eigen::VectorXd w = enforce_constraints(raw, bounds);
        REQUIRE_THAT(w.sum(), WithinAbs(1.0, 1e-9));
        REQUIRE(satisfies_bounds(w, bounds, 1e-9));
    }

    SECTION("Randomized mixed-sign bounds always yield feasible weights") {
        std::mt19937 engine(2024);
        std::uniform_real_distribution<double> edge(-1.0, 1.0);
        std::uniform_real_distribution<double> draw(-2.0, 2.0);
        std::uniform_int_distribution<int> size(2, 8);

        int checked = 0;
        for (int trial = 0; trial < 2000; ++trial) {
            const int n = size(engine);
            std::vector<AssetBounds> bounds;
            for (int i = 0; i < n; ++i) {
                double a = edge(engine);
                double b = edge(engine);
                bounds.push_back({std::min(a, b), std::max(a, b)});
            }
            try {
                validate_bounds(bounds, static_cast<size_t>(n));
            } catch (const InfeasibleConstraints &) {
                continue;
            }

            Eigen::VectorXd raw(n);
            for (int i = 0; i < n; ++i) {
                raw(i) = draw(engine);
            }
            const Eigen::VectorXd w = enforce_constraints(raw, bounds);
            REQUIRE(satisfies_bounds(w, bounds, 1e-9));
            ++checked;
        }
        REQUIRE(checked > 100);
    }

    SECTION("Size mismatch throws") {
        REQUIRE_THROWS_AS(enforce_constraints(Eigen::VectorXd::Ones(3), default_bounds(2)),
                          std::invalid_argument);
    }
}

TEST_CASE("Categorical constraints", "[Constraints][Categorical]") {
    CategoricalConstraint sector;
    sector.name = "Sector";
    sector.category_per_symbol = {"Tech", "Tech", "Energy", "Health"};
    sector.weight_per_category = {{"Tech", 0.2, 0.5}, {"Energy", 0.1, 0.4}};

    SECTION("Validation") {
        REQUIRE_NOTHROW(sector.validate(4));
        REQUIRE_THROWS_AS(sector.validate(3), std::invalid_argument);

        CategoricalConstraint unknown = sector;
        unknown.weight_per_category.push_back({"Utilities", 0.0, 0.2});
        REQUIRE_THROWS_AS(unknown.validate(4), std::invalid_argument);

        CategoricalConstraint duplicate = sector;
        duplicate.weight_per_category.push_back({"Tech", 0.0, 0.2});
        REQUIRE_THROWS_AS(duplicate.validate(4), std::invalid_argument);
    }

    SECTION("Evaluation reports per-label totals") {
        Eigen::VectorXd w(4);
        w << 0.4, 0.3, 0.2, 0.1;
        const auto allocations = evaluate_categories(w, {sector});
        REQUIRE(allocations.size() == 2);
        REQUIRE(allocations[0].label == "Tech");
        REQUIRE_THAT(allocations[0].weight, WithinAbs(0.7, 1e-12));
        REQUIRE_FALSE(allocations[0].satisfied);
        REQUIRE(allocations[1].label == "Energy");
        REQUIRE_THAT(allocations[1].weight, WithinAbs(0.2, 1e-12));
        REQUIRE(allocations[1].satisfied);
        REQUIRE_FALSE(categories_satisfied(allocations));
    }

    SECTION("Selecting positions drops labels without assets") {
        const auto selected = sector.select({0, 1, 3});
        REQUIRE(selected.category_per_symbol == std::vector<std::string>{"Tech", "Tech", "Health"});
        REQUIRE(selected.weight_per_category.size() == 1);
        REQUIRE(selected.weight_per_category[0].label == "Tech");
        REQUIRE_NOTHROW(selected.validate(3));
    }

    SECTION("JSON array and object forms agree") {
        const auto from_array = CategoricalConstraint::from_json(nlohmann::json::parse(
            R"(["Sector", ["Tech", "Tech", "Energy", "Health"], [["Tech", 0.2, 0.5], ["Energy", 0.1, 0.4]]])"));
        const auto from_object = CategoricalConstraint::from_json(sector.to_json());
        REQUIRE(from_array.to_json() == from_object.to_json());
    }
}

TEST_CASE("Categorical projection", "[Constraints][Categorical][OSQP]") {
    CategoricalConstraint sector;
    sector.name = "Sector";
    sector.category_per_symbol = {"Tech", "Tech", "Energy", "Health"};
    sector.weight_per_category = {{"Tech", 0.2, 0.5}, {"Energy", 0.1, 0.4}};

    SECTION("Violating weights move to the nearest feasible point") {
        Eigen::VectorXd w(4);
        w << 0.4, 0.3, 0.2, 0.1;
        const Eigen::VectorXd projected = project_onto_categories(w, default_bounds(4), {sector});

        REQUIRE(satisfies_bounds(projected, default_bounds(4), 1e-6));
        REQUIRE(categories_satisfied(evaluate_categories(projected, {sector}, 1e-4)));
        // Tech excess of 0.2 is removed evenly from both Tech names
        REQUIRE_THAT(projected(0) - projected(1), WithinAbs(0.1, 1e-4));
    }

    SECTION("Feasible weights are left in place") {
        Eigen::VectorXd w(4);
        w << 0.25, 0.2, 0.3, 0.25;
        const Eigen::VectorXd projected = project_onto_categories(w, default_bounds(4), {sector});
        REQUIRE((projected - w).cwiseAbs().maxCoeff() < 1e-4);
    }

    SECTION("Infeasible categories throw") {
        CategoricalConstraint impossible = sector;
        impossible.weight_per_category = {{"Tech", 0.0, 0.1}, {"Energy", 0.0, 0.1}};
        std::vector<AssetBounds> bounds = {{0.0, 1.0}, {0.0, 1.0}, {0.0, 1.0}, {0.0, 0.2}};
        Eigen::VectorXd w = Eigen::VectorXd::Constant(4, 0.25);
        REQUIRE_THROWS_AS(project_onto_categories(w, bounds, {impossible}), InfeasibleConstraints);
    }
}
