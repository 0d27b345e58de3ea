/**
 * @file test_data_loader.cpp
 * @brief Unit tests for configuration loading, price CSV parsing and the CSV provider
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "finperf/data/csv_data_provider.hpp"
#include "finperf/data/data_loader.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using namespace finperf;
using Catch::Matchers::WithinAbs;

namespace {

// Scratch directory removed when the fixture goes out of scope
class ScratchDir {
public:
    explicit ScratchDir(const std::string &name)
        : path_(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string write(const std::string &file, const std::string &content) const {
        const auto full = path_ / file;
        std::ofstream out(full);
        out << content;
        return full.string();
    }

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

const char *kOhlcv =
    "Date,Open,High,Low,Close,Volume\n"
    "2024-01-03,101,103,100,102,1200\n"
    "2024-01-02,99,101,98,100,1000\n"
    "not-a-date,1,1,1,1,1\n"
    "2024-01-04,102,104,101,,1300\n"
    "2024-01-05,102,106,101,105,1500\n"
    "\n"
    "2024-02-01,110,111,109,110,900\n";

nlohmann::json minimal_config() {
    return nlohmann::json{
        {"symbols", nlohmann::json::array({"AAA", "BBB"})},
        {"benchmark", "SPY"},
        {"start_date", "2024-01-01"},
        {"end_date", "2024-06-30"}};
}

} // namespace

TEST_CASE("Price CSV parsing", "[DataLoader][CSV]") {
    ScratchDir dir("finperf_test_csv");

    SECTION("OHLCV with header, bad rows skipped, sorted by date") {
        const auto series = DataLoader::load_price_csv(dir.write("AAA.csv", kOhlcv), "AAA");
        REQUIRE(series.symbol == "AAA");
        REQUIRE(series.bars.size() == 4);
        REQUIRE(series.bars[0].timestamp == parse_date("2024-01-02"));
        REQUIRE(series.bars[0].close == 100.0);
        REQUIRE(series.bars[0].volume == 1000.0);
        REQUIRE(series.bars[2].close == 105.0);
    }

    SECTION("Date range is inclusive of both ends") {
        const auto series = DataLoader::load_price_csv(dir.write("AAA.csv", kOhlcv), "AAA",
                                                       "2024-01-03", "2024-01-05");
        REQUIRE(series.bars.size() == 2);
        REQUIRE(series.bars.front().close == 102.0);
        REQUIRE(series.bars.back().close == 105.0);
    }

    SECTION("Two-column file uses its second column as close") {
        const auto path = dir.write("BBB.csv", "timestamp,price\n2024-01-02 15:30:00,50.5\n2024-01-03 15:30:00,51\n");
        const auto series = DataLoader::load_price_csv(path, "BBB");
        REQUIRE(series.bars.size() == 2);
        REQUIRE(series.bars[1].close == 51.0);
        REQUIRE(series.bars[1].open == 51.0);
    }

    SECTION("Missing columns or file") {
        const auto path = dir.write("CCC.csv", "when,open,close\n2024-01-02,1,1\n");
        REQUIRE_THROWS_AS(DataLoader::load_price_csv(path, "CCC"), std::runtime_error);
        REQUIRE_THROWS_AS(DataLoader::load_price_csv(dir.path() + "/missing.csv", "X"), std::runtime_error);
    }
}

TEST_CASE("CSV data provider", "[DataLoader][Provider]") {
    ScratchDir dir("finperf_test_provider");
    dir.write("AAA.csv", kOhlcv);
    dir.write("ONE.csv", "date,close\n2024-01-02,10\n");
    dir.write("BAD.csv", "foo,bar,baz\n1,2,3\n");
    CsvDataProvider provider(dir.path());

    SECTION("Returns derived from closes") {
        const auto returns = provider.fetch_return_series("AAA", "2024-01-01", "2024-01-31", Interval::ONE_DAY);
        REQUIRE(returns.size() == 2);
        REQUIRE_THAT(returns.values(0), WithinAbs(2.0, 1e-12));
    }

    SECTION("Error kinds") {
        try {
            provider.fetch_price_series("ZZZ", "2024-01-01", "2024-01-31", Interval::ONE_DAY);
            FAIL("expected FetchError");
        } catch (const FetchError &e) {
            REQUIRE(e.kind() == FetchError::Kind::NOT_FOUND);
            REQUIRE(e.symbol() == "ZZZ");
        }

        try {
            provider.fetch_price_series("AAA", "2023-01-01", "2023-12-31", Interval::ONE_DAY);
            FAIL("expected FetchError");
        } catch (const FetchError &e) {
            REQUIRE(e.kind() == FetchError::Kind::NO_DATA);
        }

        try {
            provider.fetch_price_series("BAD", "2024-01-01", "2024-01-31", Interval::ONE_DAY);
            FAIL("expected FetchError");
        } catch (const FetchError &e) {
            REQUIRE(e.kind() == FetchError::Kind::MALFORMED);
        }

        // One price is not enough for a return
        try {
            provider.fetch_return_series("ONE", "2024-01-01", "2024-01-31", Interval::ONE_DAY);
            FAIL("expected FetchError");
        } catch (const FetchError &e) {
            REQUIRE(e.kind() == FetchError::Kind::NO_DATA);
        }
    }

    SECTION("Naming") {
        REQUIRE(provider.get_name() == "CsvDataProvider(" + dir.path() + ")");
        REQUIRE_THROWS_AS(CsvDataProvider(""), std::invalid_argument);
    }
}

TEST_CASE("Portfolio configuration", "[DataLoader][Config]") {
    SECTION("Defaults for absent keys") {
        const auto config = PortfolioConfig::from_json(minimal_config());
        REQUIRE(config.interval == Interval::ONE_DAY);
        REQUIRE(config.confidence_level == 0.95);
        REQUIRE(config.risk_free_rate == 0.02);
        REQUIRE(config.objective == optimizer::ObjectiveFunction::MAX_SHARPE);
        REQUIRE(config.bounds.empty());
        REQUIRE_FALSE(config.weights.has_value());
        REQUIRE_FALSE(config.optimizer.seed.has_value());
        REQUIRE(config.frontier_points == 0);
        REQUIRE(config.repair_categories);
        REQUIRE_NOTHROW(config.validate());
    }

    SECTION("Every key is read") {
        auto j = minimal_config();
        j["interval"] = "1wk";
        j["objective"] = "min_drawdown";
        j["bounds"] = nlohmann::json::parse(R"([[0.0, 0.7], {"lower": 0.3, "upper": 1.0}])");
        j["weights"] = nlohmann::json::array({0.6, 0.4});
        j["optimizer"] = {{"max_iterations", 50}, {"seed", 7}};
        j["frontier_points"] = 10;

        const auto config = PortfolioConfig::from_json(j);
        REQUIRE(config.interval == Interval::ONE_WEEK);
        REQUIRE(config.objective == optimizer::ObjectiveFunction::MIN_DRAWDOWN);
        REQUIRE(config.bounds[1].lower == 0.3);
        REQUIRE(config.weights == std::vector<double>{0.6, 0.4});
        REQUIRE(config.optimizer.solver.max_iterations == 50);
        REQUIRE(config.optimizer.seed == 7u);
        REQUIRE(PortfolioConfig::from_json(config.to_json()).to_json() == config.to_json());
    }

    SECTION("Validation failures") {
        auto config = PortfolioConfig::from_json(minimal_config());

        auto broken = config;
        broken.symbols = {"AAA", "AAA"};
        REQUIRE_THROWS_AS(broken.validate(), std::invalid_argument);

        broken = config;
        broken.start_date = "2024-07-01";
        REQUIRE_THROWS_AS(broken.validate(), std::invalid_argument);

        broken = config;
        broken.confidence_level = 0.0;
        REQUIRE_THROWS_AS(broken.validate(), std::invalid_argument);

        broken = config;
        broken.weights = std::vector<double>{1.0};
        REQUIRE_THROWS_AS(broken.validate(), std::invalid_argument);

        broken = config;
        broken.bounds = {{0.0, 0.2}, {0.0, 0.2}};
        REQUIRE_THROWS_AS(broken.validate(), optimizer::InfeasibleConstraints);

        broken = config;
        broken.frontier_points = 1;
        REQUIRE_THROWS_AS(broken.validate(), std::invalid_argument);
    }

    SECTION("Unknown enum names are input errors") {
        auto j = minimal_config();
        j["interval"] = "1y";
        REQUIRE_THROWS_AS(PortfolioConfig::from_json(j), std::invalid_argument);
    }
}

TEST_CASE("Configuration files", "[DataLoader][Config]") {
    ScratchDir dir("finperf_test_config");

    SECTION("Valid file") {
        const auto path = dir.write("portfolio.json", minimal_config().dump());
        const auto config = DataLoader::load_config(path);
        REQUIRE(config.symbols.size() == 2);
        REQUIRE(config.benchmark == "SPY");
    }

    SECTION("Unparseable JSON") {
        const auto path = dir.write("broken.json", "{ \"symbols\": [");
        REQUIRE_THROWS_AS(DataLoader::load_json(path), std::runtime_error);
    }

    SECTION("Wrong value type") {
        auto j = minimal_config();
        j["confidence_level"] = "high";
        const auto path = dir.write("typed.json", j.dump());
        REQUIRE_THROWS_AS(DataLoader::load_config(path), std::invalid_argument);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(DataLoader::load_config(dir.path() + "/absent.json"), std::runtime_error);
    }
}
