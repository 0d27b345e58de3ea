/**
 * @file security_performance.cpp
 * @brief Implementation of SecurityPerformanceStats.
 */

#include "finperf/analytics/security_performance.hpp"
#include <future>
#include <iostream>
#include <stdexcept>

namespace finperf
{
    namespace analytics
    {

        SecurityPerformanceStats SecurityPerformanceStats::compute(const std::string &symbol,
                                                                   const std::string &benchmark,
                                                                   const std::string &start_date,
                                                                   const std::string &end_date,
                                                                   Interval interval,
                                                                   double confidence_level,
                                                                   double risk_free_rate,
                                                                   const MarketDataProvider &provider)
        {
            if (symbol.empty() || benchmark.empty())
            {
                throw std::invalid_argument("Security and benchmark symbols are required");
            }
            if (!is_valid_date_format(start_date) || !is_valid_date_format(end_date))
            {
                throw std::invalid_argument("Dates must be YYYY-MM-DD, got '" + start_date +
                                            "' and '" + end_date + "'");
            }
            if (parse_date(start_date) > parse_date(end_date))
            {
                throw std::invalid_argument("start_date " + start_date + " is after end_date " + end_date);
            }
            if (!(confidence_level > 0.0 && confidence_level < 1.0))
            {
                throw std::invalid_argument("Confidence level must be in (0, 1), got: " +
                                            std::to_string(confidence_level));
            }

            SecurityPerformanceStats result;
            result.symbol_ = symbol;
            result.benchmark_symbol_ = benchmark;
            result.start_date_ = start_date;
            result.end_date_ = end_date;
            result.interval_ = interval;
            result.confidence_level_ = confidence_level;
            result.risk_free_rate_ = risk_free_rate;

            std::future<PriceSeries> price_task = std::async(
                std::launch::async, [&]()
                { return provider.fetch_price_series(symbol, start_date, end_date, interval); });
            std::future<ReturnSeries> return_task = std::async(
                std::launch::async, [&]()
                { return provider.fetch_return_series(symbol, start_date, end_date, interval); });
            std::future<ReturnSeries> benchmark_task = std::async(
                std::launch::async, [&]()
                { return provider.fetch_return_series(benchmark, start_date, end_date, interval); });

            ReturnSeries benchmark_returns;
            std::string benchmark_error;
            try
            {
                benchmark_returns = benchmark_task.get();
            }
            catch (const FetchError &e)
            {
                benchmark_error = e.what();
            }

            try
            {
                result.prices_ = price_task.get();
                result.returns_ = return_task.get();
            }
            catch (const FetchError &e)
            {
                throw std::invalid_argument("Security " + symbol + " could not be fetched: " + e.what());
            }

            if (!benchmark_error.empty())
            {
                throw std::invalid_argument("Benchmark " + benchmark + " could not be fetched: " +
                                            benchmark_error);
            }

            if (result.returns_.size() < 2)
            {
                throw std::invalid_argument("Security " + symbol + " has " +
                                            std::to_string(result.returns_.size()) +
                                            " return periods; at least two are required");
            }

            result.benchmark_returns_ = align_to(benchmark_returns, result.returns_.timestamps);
            result.interval_days_ = interval_days(result.returns_.timestamps);

            result.dates_.reserve(result.returns_.size());
            for (auto ts : result.returns_.timestamps)
            {
                result.dates_.push_back(format_date(ts));
            }

            result.performance_stats_ = PerformanceStats::compute(
                result.returns_.values, result.benchmark_returns_.values,
                risk_free_rate, confidence_level, result.interval_days_);

            return result;
        }

        nlohmann::json SecurityPerformanceStats::to_json() const
        {
            nlohmann::json j;
            j["symbol"] = symbol_;
            j["benchmark"] = benchmark_symbol_;
            j["start_date"] = start_date_;
            j["end_date"] = end_date_;
            j["interval"] = interval_to_string(interval_);
            j["interval_days"] = interval_days_.to_json();
            j["confidence_level"] = confidence_level_;
            j["risk_free_rate"] = risk_free_rate_;
            j["dates"] = dates_;

            std::vector<double> closes;
            closes.reserve(prices_.bars.size());
            for (const auto &bar : prices_.bars)
            {
                closes.push_back(bar.close);
            }
            j["prices"] = closes;
            j["returns"] = std::vector<double>(returns_.values.data(),
                                               returns_.values.data() + returns_.values.size());
            j["benchmark_returns"] = std::vector<double>(
                benchmark_returns_.values.data(),
                benchmark_returns_.values.data() + benchmark_returns_.values.size());
            j["performance_stats"] = performance_stats_.to_json();
            return j;
        }

        void SecurityPerformanceStats::print_summary() const
        {
            std::cout << "\n=== Security Performance ===\n";
            std::cout << "Security: " << symbol_ << " vs " << benchmark_symbol_ << "\n";
            std::cout << "Period: " << start_date_ << " to " << end_date_
                      << " (" << interval_to_string(interval_) << ", "
                      << returns_.size() << " periods)\n";
            std::cout << std::string(40, '-') << "\n";
            std::cout << performance_stats_.summary();
            std::cout << "============================\n"
                      << std::endl;
        }

    } // namespace analytics
} // namespace finperf
