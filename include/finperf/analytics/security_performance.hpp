/**
 * @file security_performance.hpp
 * @brief Performance record for a single security against a benchmark.
 *
 * The security's returns define the date axis; the benchmark is left-joined
 * onto it with forward then backward fill before PerformanceStats is
 * computed.
 */

#ifndef FINPERF_ANALYTICS_SECURITY_PERFORMANCE_HPP
#define FINPERF_ANALYTICS_SECURITY_PERFORMANCE_HPP

#include "finperf/analytics/performance_stats.hpp"
#include "finperf/data/interval.hpp"
#include "finperf/data/market_data_provider.hpp"
#include "finperf/data/return_series.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace finperf
{
    namespace analytics
    {

        /**
         * @class SecurityPerformanceStats
         * @brief One instrument's prices, returns and performance record
         *
         * Usage:
         * @code
         *   CsvDataProvider provider("data/market");
         *   auto stats = SecurityPerformanceStats::compute(
         *       "AAPL", "SPY", "2023-01-01", "2023-12-31", Interval::ONE_DAY,
         *       0.95, 0.02, provider);
         *   stats.print_summary();
         * @endcode
         */
        class SecurityPerformanceStats
        {
        public:
            /**
             * @brief Fetch the security and benchmark and compute the record
             *
             * @param risk_free_rate Annual rate as a fraction (0.02 = 2%)
             * @throws std::invalid_argument on empty symbols, malformed or
             *         reversed dates, a confidence level outside (0, 1), a
             *         failed fetch or fewer than two return periods
             */
            static SecurityPerformanceStats compute(const std::string &symbol,
                                                    const std::string &benchmark,
                                                    const std::string &start_date,
                                                    const std::string &end_date,
                                                    Interval interval,
                                                    double confidence_level,
                                                    double risk_free_rate,
                                                    const MarketDataProvider &provider);

            // ===== Accessors =====

            const std::string &get_symbol() const { return symbol_; }
            const std::string &get_benchmark_symbol() const { return benchmark_symbol_; }
            const std::string &get_start_date() const { return start_date_; }
            const std::string &get_end_date() const { return end_date_; }
            Interval get_interval() const { return interval_; }
            const IntervalDays &get_interval_days() const { return interval_days_; }
            double get_confidence_level() const { return confidence_level_; }
            double get_risk_free_rate() const { return risk_free_rate_; }

            /// YYYY-MM-DD for every return period
            const std::vector<std::string> &get_dates() const { return dates_; }
            const PriceSeries &get_prices() const { return prices_; }
            const ReturnSeries &get_returns() const { return returns_; }
            const ReturnSeries &get_benchmark_returns() const { return benchmark_returns_; }
            const PerformanceStats &get_performance_stats() const { return performance_stats_; }

            nlohmann::json to_json() const;

            void print_summary() const;

        private:
            SecurityPerformanceStats() = default;

            std::string symbol_;
            std::string benchmark_symbol_;
            std::string start_date_;
            std::string end_date_;
            Interval interval_ = Interval::ONE_DAY;
            IntervalDays interval_days_{};
            double confidence_level_ = 0.95;
            double risk_free_rate_ = 0.02;

            std::vector<std::string> dates_;
            PriceSeries prices_;
            ReturnSeries returns_;
            ReturnSeries benchmark_returns_;
            PerformanceStats performance_stats_;
        };

    } // namespace analytics
} // namespace finperf

#endif // FINPERF_ANALYTICS_SECURITY_PERFORMANCE_HPP
