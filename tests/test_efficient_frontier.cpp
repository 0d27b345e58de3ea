/**
 * @file test_efficient_frontier.cpp
 * @brief Tests for the target-return frontier sweep
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "finperf/optimizer/efficient_frontier.hpp"
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using namespace finperf::optimizer;
using Catch::Matchers::WithinAbs;

namespace {

Eigen::VectorXd three_means() {
    Eigen::VectorXd mu(3);
    mu << 0.10, 0.05, 0.15;
    return mu;
}

Eigen::MatrixXd three_covariance() {
    Eigen::MatrixXd cov(3, 3);
    cov << 0.040, 0.006, 0.010,
           0.006, 0.010, 0.004,
           0.010, 0.004, 0.090;
    return cov;
}

} // namespace

TEST_CASE("Reachable return range", "[EfficientFrontier]") {
    const Eigen::VectorXd mu = three_means();

    SECTION("Unconstrained range spans the asset means") {
        const auto range = EfficientFrontier::return_range(mu, default_bounds(3));
        REQUIRE_THAT(range.first, WithinAbs(0.05, 1e-12));
        REQUIRE_THAT(range.second, WithinAbs(0.15, 1e-12));
    }

    SECTION("Caps push the extremes inward") {
        std::vector<AssetBounds> bounds = {{0.0, 1.0}, {0.0, 0.5}, {0.0, 0.4}};
        const auto range = EfficientFrontier::return_range(mu, bounds);
        // Low end: 0.5 in asset 1, rest in asset 0. High end: 0.4 in asset 2, rest in asset 0
        REQUIRE_THAT(range.first, WithinAbs(0.5 * 0.05 + 0.5 * 0.10, 1e-12));
        REQUIRE_THAT(range.second, WithinAbs(0.4 * 0.15 + 0.6 * 0.10, 1e-12));
    }
}

TEST_CASE("Quadratically spaced targets", "[EfficientFrontier]") {
    const auto targets = EfficientFrontier::target_returns(0.0, 1.0, 5);
    REQUIRE(targets.size() == 5);
    REQUIRE_THAT(targets[0], WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(targets[2], WithinAbs(0.25, 1e-12));
    REQUIRE_THAT(targets[4], WithinAbs(1.0, 1e-12));
    // Gaps widen towards the high-return end
    REQUIRE(targets[1] - targets[0] < targets[4] - targets[3]);
}

TEST_CASE("Number of points", "[EfficientFrontier]") {
    EfficientFrontier frontier;
    REQUIRE(frontier.get_num_points() == 20);
    frontier.set_num_points(5);
    REQUIRE(frontier.get_num_points() == 5);
    REQUIRE_THROWS_AS(frontier.set_num_points(1), std::invalid_argument);
}

TEST_CASE("Frontier trace", "[EfficientFrontier][OSQP][Integration]") {
    EfficientFrontier frontier;
    frontier.set_num_points(10);
    const auto result = frontier.trace(three_means(), three_covariance(), default_bounds(3), 0.02);

    REQUIRE(result.success);
    REQUIRE(result.points.size() + static_cast<size_t>(result.failed_targets) == 10);

    SECTION("Points are feasible and hit their target") {
        for (const auto &point : result.points) {
            REQUIRE(satisfies_bounds(point.weights, default_bounds(3), 1e-4));
            REQUIRE_THAT(point.expected_return, WithinAbs(point.target_return, 1e-4));
        }
    }

    SECTION("Sorted by volatility with the minimum-variance point first") {
        for (size_t i = 1; i < result.points.size(); ++i) {
            REQUIRE(result.points[i - 1].volatility <= result.points[i].volatility);
        }
        REQUIRE(result.min_variance_portfolio.volatility == result.points.front().volatility);
    }

    SECTION("Maximum Sharpe dominates every point") {
        for (const auto &point : result.points) {
            REQUIRE(result.max_sharpe_portfolio.sharpe_ratio >= point.sharpe_ratio);
        }
    }

    SECTION("JSON carries both highlighted portfolios") {
        const auto j = result.to_json();
        REQUIRE(j["success"] == true);
        REQUIRE(j.contains("min_variance_portfolio"));
        REQUIRE(j["points"].size() == result.points.size());
    }
}

TEST_CASE("Frontier input errors", "[EfficientFrontier]") {
    EfficientFrontier frontier;

    SECTION("Covariance of the wrong size") {
        REQUIRE_THROWS_AS(frontier.trace(three_means(), Eigen::MatrixXd::Identity(2, 2), {}),
                          std::invalid_argument);
    }

    SECTION("Infeasible bounds") {
        std::vector<AssetBounds> bounds = {{0.0, 0.1}, {0.0, 0.1}, {0.0, 0.1}};
        REQUIRE_THROWS_AS(frontier.trace(three_means(), three_covariance(), bounds), InfeasibleConstraints);
    }
}

TEST_CASE("Frontier CSV export", "[EfficientFrontier][Export]") {
    EfficientFrontier frontier;
    frontier.set_num_points(4);
    const auto result = frontier.trace(three_means(), three_covariance(), default_bounds(3));

    const std::string path = (std::filesystem::temp_directory_path() / "finperf_frontier_test.csv").string();
    result.export_to_csv(path, {"AAA", "BBB", "CCC"});

    std::ifstream file(path);
    REQUIRE(file.is_open());
    std::string header;
    std::getline(file, header);
    REQUIRE(header == "target_return,expected_return,volatility,sharpe_ratio,AAA,BBB,CCC");

    size_t rows = 0;
    std::string line;
    while (std::getline(file, line)) {
        ++rows;
    }
    REQUIRE(rows == result.points.size());

    file.close();
    std::remove(path.c_str());
}
