/**
 * @file test_objective.cpp
 * @brief Unit tests for objective parsing and loss evaluation
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "finperf/analytics/statistics.hpp"
#include "finperf/optimizer/objective.hpp"
#include <Eigen/Dense>
#include <cmath>

using namespace finperf;
using namespace finperf::optimizer;
using Catch::Matchers::WithinAbs;

namespace {

Eigen::MatrixXd two_asset_returns() {
    Eigen::MatrixXd returns(6, 2);
    returns <<  1.0,  0.2,
               -0.5,  0.4,
                2.0, -0.1,
               -1.5,  0.3,
                0.5,  0.1,
                1.0, -0.2;
    return returns;
}

} // namespace

TEST_CASE("Objective names", "[Objective]") {
    SECTION("Every objective round-trips through its name") {
        for (auto objective : all_objectives()) {
            REQUIRE(objective_from_string(objective_to_string(objective)) == objective);
        }
        REQUIRE(all_objectives().size() == 7);
    }

    SECTION("Known names") {
        REQUIRE(objective_from_string("max_sharpe") == ObjectiveFunction::MAX_SHARPE);
        REQUIRE(objective_from_string("min_cvar") == ObjectiveFunction::MIN_CVAR);
    }

    SECTION("Unknown name throws") {
        REQUIRE_THROWS_AS(objective_from_string("max_alpha"), std::invalid_argument);
    }
}

TEST_CASE("Objective inputs", "[Objective]") {
    const auto inputs = ObjectiveInputs::from_returns(two_asset_returns(), 0.01, 0.9, 252.0);

    SECTION("Derived statistics") {
        REQUIRE(inputs.num_assets() == 2);
        REQUIRE_THAT(inputs.mean_returns(0), WithinAbs(2.5 / 6.0, 1e-12));
        REQUIRE_NOTHROW(inputs.validate());
    }

    SECTION("Dimension mismatch is rejected") {
        ObjectiveInputs broken = inputs;
        broken.covariance = Eigen::MatrixXd::Identity(3, 3);
        REQUIRE_THROWS_AS(broken.validate(), std::invalid_argument);
    }

    SECTION("Non-PSD covariance is rejected") {
        ObjectiveInputs broken = inputs;
        broken.covariance << 1.0, 2.0,
                             2.0, 1.0;
        REQUIRE_THROWS_AS(broken.validate(), std::invalid_argument);
    }

    SECTION("Confidence level must be a probability") {
        ObjectiveInputs broken = inputs;
        broken.confidence_level = 1.0;
        REQUIRE_THROWS_AS(broken.validate(), std::invalid_argument);
    }
}

TEST_CASE("Objective losses", "[Objective]") {
    const Eigen::MatrixXd returns = two_asset_returns();
    const auto inputs = ObjectiveInputs::from_returns(returns, 0.01, 0.9, 252.0);
    Eigen::VectorXd w(2);
    w << 0.6, 0.4;

    const double r = analytics::mean_portfolio_return(w, inputs.mean_returns);
    const double sigma = analytics::portfolio_std_dev(w, inputs.covariance);
    const Eigen::VectorXd series = analytics::daily_portfolio_returns(w, returns);

    SECTION("Maximizing objectives are negated") {
        REQUIRE_THAT(evaluate_objective(ObjectiveFunction::MAX_SHARPE, w, inputs),
                     WithinAbs(-(r - 0.01) / sigma, 1e-12));
        REQUIRE_THAT(evaluate_objective(ObjectiveFunction::MAX_RETURN, w, inputs), WithinAbs(-r, 1e-12));
        REQUIRE_THAT(evaluate_objective(ObjectiveFunction::MAX_SORTINO, w, inputs),
                     WithinAbs(-(r - 0.01) / (analytics::downside_deviation(series) * std::sqrt(252.0)), 1e-12));
    }

    SECTION("Risk objectives") {
        REQUIRE_THAT(evaluate_objective(ObjectiveFunction::MIN_VOL, w, inputs), WithinAbs(sigma, 1e-12));
        REQUIRE_THAT(evaluate_objective(ObjectiveFunction::MIN_DRAWDOWN, w, inputs),
                     WithinAbs(analytics::maximum_drawdown(series).max_drawdown, 1e-12));
        REQUIRE_THAT(evaluate_objective(ObjectiveFunction::MIN_VAR, w, inputs),
                     WithinAbs(-analytics::value_at_risk(series, 0.9), 1e-12));
    }

    SECTION("Degenerate tail yields NaN, not an exception") {
        // With six periods and 0.9 confidence the VaR is the minimum, so nothing lies below it
        REQUIRE(std::isnan(evaluate_objective(ObjectiveFunction::MIN_CVAR, w, inputs)));
    }

    SECTION("Zero volatility gives a non-finite Sharpe loss") {
        Eigen::MatrixXd flat = Eigen::MatrixXd::Constant(4, 2, 0.5);
        const auto flat_inputs = ObjectiveInputs::from_returns(flat, 0.0, 0.95, 252.0);
        REQUIRE_FALSE(std::isfinite(evaluate_objective(ObjectiveFunction::MAX_SHARPE, w, flat_inputs)));
    }
}
