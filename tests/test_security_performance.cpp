/**
 * @file test_security_performance.cpp
 * @brief Tests for the single-security performance record
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "finperf/analytics/security_performance.hpp"
#include <cmath>
#include <functional>
#include <map>

using namespace finperf;
using namespace finperf::analytics;
using Catch::Matchers::WithinAbs;

namespace {

constexpr std::int64_t kDay = 86400;

PriceSeries price_path(const std::string &symbol, int periods, const std::function<double(int)> &rate,
                       int skipped_day = -1) {
    PriceSeries prices;
    prices.symbol = symbol;
    double close = 100.0;
    const std::int64_t start = parse_date("2024-01-01");
    for (int t = 0; t <= periods; ++t) {
        if (t > 0) {
            close *= 1.0 + rate(t) / 100.0;
        }
        if (t != skipped_day) {
            prices.bars.push_back({start + t * kDay, close, close, close, close, 1e6});
        }
    }
    return prices;
}

class InMemoryProvider : public MarketDataProvider {
public:
    InMemoryProvider() {
        add(price_path("AAA", 30, [](int t) { return std::sin(t * 0.7) + 0.10; }));
        add(price_path("SPY", 30, [](int t) { return 0.6 * std::sin(t * 0.7 + 0.2) + 0.04; }));
        // Day 10 is missing from this benchmark
        add(price_path("GAP", 30, [](int t) { return 0.3 * std::cos(t * 0.5) + 0.02; }, 10));
        add(price_path("ONE", 0, [](int) { return 0.0; }));
        add(price_path("TWO", 1, [](int) { return 1.0; }));
    }

    PriceSeries fetch_price_series(const std::string &symbol,
                                   const std::string &,
                                   const std::string &,
                                   Interval) const override {
        auto it = prices_.find(symbol);
        if (it == prices_.end()) {
            throw FetchError(FetchError::Kind::NOT_FOUND, symbol, "unknown symbol " + symbol);
        }
        return it->second;
    }

    std::string get_name() const override { return "InMemoryProvider"; }

private:
    std::map<std::string, PriceSeries> prices_;

    void add(const PriceSeries &series) { prices_[series.symbol] = series; }
};

SecurityPerformanceStats run(const std::string &symbol, const std::string &benchmark,
                             const InMemoryProvider &provider) {
    return SecurityPerformanceStats::compute(symbol, benchmark, "2024-01-01", "2024-01-31",
                                             Interval::ONE_DAY, 0.95, 0.02, provider);
}

} // namespace

TEST_CASE("Security record against a benchmark", "[SecurityPerformance][Integration]") {
    InMemoryProvider provider;
    const SecurityPerformanceStats stats = run("AAA", "SPY", provider);

    SECTION("Series share the security's date axis") {
        REQUIRE(stats.get_prices().bars.size() == 31);
        REQUIRE(stats.get_returns().size() == 30);
        REQUIRE(stats.get_benchmark_returns().timestamps == stats.get_returns().timestamps);
        REQUIRE(stats.get_dates().size() == 30);
        REQUIRE(stats.get_dates().front() == "2024-01-02");
        REQUIRE(stats.get_dates().back() == "2024-01-31");
    }

    SECTION("Daily interval is inferred") {
        REQUIRE_THAT(stats.get_interval_days().mode, WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(stats.get_interval_days().average, WithinAbs(1.0, 1e-12));
    }

    SECTION("Record matches a direct computation") {
        const PerformanceStats direct = PerformanceStats::compute(
            stats.get_returns().values, stats.get_benchmark_returns().values,
            0.02, 0.95, stats.get_interval_days());
        REQUIRE(direct.to_json().dump() == stats.get_performance_stats().to_json().dump());
    }

    SECTION("JSON report") {
        const auto j = stats.to_json();
        REQUIRE(j["symbol"] == "AAA");
        REQUIRE(j["benchmark"] == "SPY");
        REQUIRE(j["interval"] == "1d");
        REQUIRE(j["prices"].size() == 31);
        REQUIRE(j["returns"].size() == 30);
        REQUIRE(j["dates"].size() == 30);
        REQUIRE(j.contains("performance_stats"));
    }
}

TEST_CASE("Security measured against itself", "[SecurityPerformance]") {
    InMemoryProvider provider;
    const SecurityPerformanceStats stats = run("AAA", "AAA", provider);

    REQUIRE_THAT(stats.get_performance_stats().beta, WithinAbs(1.0, 1e-9));
    REQUIRE_THAT(stats.get_performance_stats().alpha, WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(stats.get_performance_stats().active_return, WithinAbs(0.0, 1e-12));
}

TEST_CASE("Benchmark gaps are filled on the security's axis", "[SecurityPerformance]") {
    InMemoryProvider provider;
    const SecurityPerformanceStats stats = run("AAA", "GAP", provider);

    const ReturnSeries &benchmark = stats.get_benchmark_returns();
    REQUIRE(benchmark.size() == 30);
    // Index 9 is day 10, which the benchmark lacks; it carries day 9 forward
    REQUIRE(benchmark.values(9) == benchmark.values(8));
    REQUIRE(benchmark.values.allFinite());
}

TEST_CASE("Security record input errors", "[SecurityPerformance]") {
    InMemoryProvider provider;

    SECTION("Unknown security") {
        REQUIRE_THROWS_AS(run("ZZZ", "SPY", provider), std::invalid_argument);
    }

    SECTION("Unknown benchmark") {
        REQUIRE_THROWS_AS(run("AAA", "ZZZ", provider), std::invalid_argument);
    }

    SECTION("A single price yields no returns") {
        REQUIRE_THROWS_AS(run("ONE", "SPY", provider), std::invalid_argument);
    }

    SECTION("One return period is not enough") {
        REQUIRE_THROWS_AS(run("TWO", "SPY", provider), std::invalid_argument);
    }

    SECTION("Malformed or reversed dates") {
        REQUIRE_THROWS_AS(SecurityPerformanceStats::compute("AAA", "SPY", "2024/01/01", "2024-01-31",
                                                            Interval::ONE_DAY, 0.95, 0.02, provider),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(SecurityPerformanceStats::compute("AAA", "SPY", "2024-02-01", "2024-01-31",
                                                            Interval::ONE_DAY, 0.95, 0.02, provider),
                          std::invalid_argument);
    }

    SECTION("Confidence level outside (0, 1)") {
        REQUIRE_THROWS_AS(SecurityPerformanceStats::compute("AAA", "SPY", "2024-01-01", "2024-01-31",
                                                            Interval::ONE_DAY, 1.0, 0.02, provider),
                          std::invalid_argument);
    }
}
