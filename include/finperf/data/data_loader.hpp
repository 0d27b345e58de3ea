/**
 * @file data_loader.hpp
 * @brief Configuration and CSV loading utilities
 *
 * Provides the PortfolioConfig consumed by the performance engine and the
 * per-symbol price CSV reader used by CsvDataProvider.
 */

#ifndef FINPERF_DATA_DATA_LOADER_HPP
#define FINPERF_DATA_DATA_LOADER_HPP

#include "finperf/data/interval.hpp"
#include "finperf/data/return_series.hpp"
#include "finperf/optimizer/constraints.hpp"
#include "finperf/optimizer/objective.hpp"
#include "finperf/optimizer/portfolio_optimizer.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace finperf
{

    /**
     * @struct PortfolioConfig
     * @brief Everything needed to build a PortfolioPerformanceStats record
     *
     * Defaults:
     *   interval            1d
     *   confidence_level    0.95
     *   risk_free_rate      0.02 (annual, as a fraction)
     *   objective           max_sharpe
     *   bounds              [0, 1] per symbol
     *   categorical         none
     *   weights             none (optimize)
     *   optimizer           1000 iterations, tolerance 1e-6, random seed
     *   frontier_points     0 (no traced frontier)
     *   repair_categories   true
     */
    struct PortfolioConfig
    {
        std::vector<std::string> symbols;  ///< Instruments, positional
        std::string benchmark;             ///< Benchmark symbol
        std::string start_date;            ///< YYYY-MM-DD
        std::string end_date;              ///< YYYY-MM-DD
        Interval interval = Interval::ONE_DAY;
        double confidence_level = 0.95;
        double risk_free_rate = 0.02;
        optimizer::ObjectiveFunction objective = optimizer::ObjectiveFunction::MAX_SHARPE;

        std::vector<optimizer::AssetBounds> bounds;  ///< Empty means [0, 1] each
        std::vector<optimizer::CategoricalConstraint> categorical_constraints;
        std::optional<std::vector<double>> weights;  ///< Skips optimization when set

        optimizer::OptimizerOptions optimizer;
        int frontier_points = 0;       ///< Traced frontier size, 0 disables
        bool repair_categories = true; ///< Project onto violated categorical bounds

        /**
         * @brief Build from JSON; missing keys take the defaults above
         * @throws std::invalid_argument on unknown interval or objective strings
         */
        static PortfolioConfig from_json(const nlohmann::json &j);

        nlohmann::json to_json() const;

        /**
         * @brief Fail fast on malformed input
         * @throws std::invalid_argument on bad dates, empty or duplicate symbols,
         *         out-of-range confidence level or mismatched sizes
         * @throws optimizer::InfeasibleConstraints if the bounds cannot sum to one
         */
        void validate() const;
    };

    /**
     * @class DataLoader
     * @brief Loads configuration and price files
     */
    class DataLoader
    {
    public:
        DataLoader() = default;
        ~DataLoader() = default;

        /**
         * @brief Load JSON file
         * @throws std::runtime_error if the file cannot be opened or parsed
         */
        static nlohmann::json load_json(const std::string &filepath);

        /**
         * @brief Load and validate a PortfolioConfig
         */
        static PortfolioConfig load_config(const std::string &config_path);

        /**
         * @brief Load one symbol's price CSV
         *
         * Expected formats (header required, column order free):
         *   date,open,high,low,close,volume
         *   date,close
         * A two-column file without a "close" header uses its second column.
         * Rows with an unparseable date or price are skipped. Bars outside
         * [start_date, end_date] are dropped when the dates are non-empty.
         *
         * @throws std::runtime_error if the file cannot be opened or has no
         *         date/close columns
         */
        static PriceSeries load_price_csv(const std::string &filepath,
                                          const std::string &symbol,
                                          const std::string &start_date = "",
                                          const std::string &end_date = "");

    private:
        static std::vector<std::string> parse_csv_line(const std::string &line);

        static std::string trim(const std::string &str);

        static std::string to_lower(const std::string &str);

        /**
         * @brief Convert string to double, NaN if conversion fails
         */
        static double safe_stod(const std::string &str);
    };

} // namespace finperf

#endif // FINPERF_DATA_DATA_LOADER_HPP
