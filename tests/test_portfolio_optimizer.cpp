/**
 * @file test_portfolio_optimizer.cpp
 * @brief Tests for the gradient-descent portfolio optimizer and its frontier accumulator
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "finperf/optimizer/portfolio_optimizer.hpp"
#include <Eigen/Dense>
#include <thread>
#include <vector>

using namespace finperf;
using namespace finperf::optimizer;
using Catch::Matchers::WithinAbs;

namespace {

// Two assets with equal mean and variance and correlation -1
Eigen::MatrixXd anti_correlated_returns() {
    Eigen::MatrixXd returns(8, 2);
    for (Eigen::Index t = 0; t < 8; ++t) {
        const double base = (t % 2 == 0) ? 1.5 : -0.5;
        returns(t, 0) = base;
        returns(t, 1) = 1.0 - base;
    }
    return returns;
}

Eigen::MatrixXd three_asset_returns() {
    Eigen::MatrixXd returns(10, 3);
    returns <<  1.2,  0.3,  0.8,
               -0.8,  0.4, -0.2,
                2.1, -0.1,  1.1,
               -1.4,  0.2, -0.9,
                0.9,  0.5,  0.6,
                1.6, -0.3,  0.4,
               -0.6,  0.1,  0.2,
                0.4,  0.6, -0.5,
                1.1, -0.2,  0.9,
               -0.2,  0.3,  0.1;
    return returns;
}

OptimizerOptions seeded(unsigned int seed) {
    OptimizerOptions options;
    options.seed = seed;
    return options;
}

} // namespace

TEST_CASE("Frontier accumulator", "[Optimizer][Accumulator]") {
    FrontierAccumulator accumulator;

    SECTION("Record and snapshot") {
        accumulator.record({1.0, 2.0});
        accumulator.record({0.5, 1.0});
        REQUIRE(accumulator.size() == 2);
        const auto snapshot = accumulator.snapshot();
        REQUIRE(snapshot[1] == analytics::FrontierPoint{0.5, 1.0});
        accumulator.clear();
        REQUIRE(accumulator.size() == 0);
    }

    SECTION("Concurrent writers lose nothing") {
        std::vector<std::thread> writers;
        for (int t = 0; t < 4; ++t) {
            writers.emplace_back([&accumulator, t]() {
                for (int i = 0; i < 1000; ++i) {
                    accumulator.record({static_cast<double>(t), static_cast<double>(i)});
                }
            });
        }
        for (auto &writer : writers) {
            writer.join();
        }
        REQUIRE(accumulator.size() == 4000);
    }
}

TEST_CASE("Minimum volatility of an anti-correlated pair", "[Optimizer][Integration]") {
    const auto inputs = ObjectiveInputs::from_returns(anti_correlated_returns(), 0.0, 0.95, 252.0);
    PortfolioOptimizer optimizer(ObjectiveFunction::MIN_VOL, seeded(7));

    const OptResult result = optimizer.optimize(inputs, default_bounds(2));

    REQUIRE(result.is_valid(default_bounds(2)));
    REQUIRE_THAT(result.optimal_weights(0), WithinAbs(0.5, 0.02));
    REQUIRE_THAT(result.optimal_weights(1), WithinAbs(0.5, 0.02));
    REQUIRE(result.recorded_points > 0);
    REQUIRE_FALSE(result.efficient_frontier.empty());
}

TEST_CASE("Single asset gets the whole portfolio under every objective", "[Optimizer]") {
    Eigen::MatrixXd returns(5, 1);
    returns << 1.0, -2.0, 0.5, 3.0, -1.0;
    const auto inputs = ObjectiveInputs::from_returns(returns, 0.0, 0.95, 252.0);

    for (auto objective : all_objectives()) {
        PortfolioOptimizer optimizer(objective, seeded(1));
        const OptResult result = optimizer.optimize(inputs, default_bounds(1));
        REQUIRE(result.optimal_weights.size() == 1);
        REQUIRE_THAT(result.optimal_weights(0), WithinAbs(1.0, 1e-12));
    }
}

TEST_CASE("Every objective yields feasible weights", "[Optimizer]") {
    const auto inputs = ObjectiveInputs::from_returns(three_asset_returns(), 0.001, 0.9, 252.0);
    std::vector<AssetBounds> bounds = {{0.1, 0.6}, {0.1, 0.6}, {0.0, 0.5}};

    for (auto objective : all_objectives()) {
        PortfolioOptimizer optimizer(objective, seeded(11));
        const OptResult result = optimizer.optimize(inputs, bounds);
        INFO(objective_to_string(objective));
        REQUIRE(result.is_valid(bounds, 1e-9));
    }
}

TEST_CASE("Maximum return concentrates in the best asset", "[Optimizer]") {
    const auto inputs = ObjectiveInputs::from_returns(three_asset_returns(), 0.0, 0.95, 252.0);
    std::vector<AssetBounds> bounds = {{0.0, 0.7}, {0.0, 1.0}, {0.0, 1.0}};

    PortfolioOptimizer optimizer(ObjectiveFunction::MAX_RETURN, seeded(3));
    const OptResult result = optimizer.optimize(inputs, bounds);

    // Asset 0 has the highest mean and is capped at 0.7
    REQUIRE_THAT(result.optimal_weights(0), WithinAbs(0.7, 0.02));
}

TEST_CASE("Seeded runs are reproducible", "[Optimizer]") {
    const auto inputs = ObjectiveInputs::from_returns(three_asset_returns(), 0.0, 0.95, 252.0);
    PortfolioOptimizer optimizer(ObjectiveFunction::MAX_SHARPE, seeded(99));

    const OptResult first = optimizer.optimize(inputs, default_bounds(3));
    const OptResult second = optimizer.optimize(inputs, default_bounds(3));
    REQUIRE(first.optimal_weights == second.optimal_weights);
    REQUIRE(first.efficient_frontier == second.efficient_frontier);
}

TEST_CASE("External accumulator receives every evaluation", "[Optimizer][Accumulator]") {
    const auto inputs = ObjectiveInputs::from_returns(three_asset_returns(), 0.0, 0.95, 252.0);
    PortfolioOptimizer optimizer(ObjectiveFunction::MIN_VOL, seeded(5));
    FrontierAccumulator accumulator;

    const OptResult result = optimizer.optimize(inputs, default_bounds(3), accumulator);
    REQUIRE(accumulator.size() == static_cast<size_t>(result.evaluations));
    REQUIRE(result.recorded_points == accumulator.size());
}

TEST_CASE("Optimizer input errors", "[Optimizer]") {
    const auto inputs = ObjectiveInputs::from_returns(three_asset_returns(), 0.0, 0.95, 252.0);
    PortfolioOptimizer optimizer(ObjectiveFunction::MIN_VOL);

    SECTION("Infeasible bounds fail before the search") {
        std::vector<AssetBounds> bounds = {{0.0, 0.2}, {0.0, 0.2}, {0.0, 0.2}};
        REQUIRE_THROWS_AS(optimizer.optimize(inputs, bounds), InfeasibleConstraints);
    }

    SECTION("Bounds for the wrong number of assets") {
        REQUIRE_THROWS_AS(optimizer.optimize(inputs, default_bounds(2)), std::invalid_argument);
    }

    SECTION("Empty bounds mean [0, 1] each") {
        const OptResult result = optimizer.optimize(inputs, {});
        REQUIRE(result.is_valid(default_bounds(3)));
    }
}

TEST_CASE("Optimizer reporting", "[Optimizer]") {
    PortfolioOptimizer optimizer(ObjectiveFunction::MIN_CVAR, seeded(2));
    REQUIRE(optimizer.get_name() == "Simple Gradient Descent");

    const auto params = optimizer.get_parameters();
    REQUIRE(params["objective"] == "min_cvar");
    REQUIRE(params["seed"] == 2);
    REQUIRE(params["max_iterations"] == 1000);
}
