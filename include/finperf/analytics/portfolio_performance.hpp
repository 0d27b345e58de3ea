/**
 * @file portfolio_performance.hpp
 * @brief End-to-end portfolio analysis: fetch, align, optimize, evaluate.
 *
 * PortfolioPerformanceStats::compute() is the single entry point:
 *
 *   1. Fetch every symbol and the benchmark concurrently through the
 *      MarketDataProvider. Symbols whose fetch fails are dropped with a
 *      warning; a failed benchmark is fatal.
 *   2. Align the surviving series on the union of their timestamps and
 *      left-join the benchmark onto that axis.
 *   3. Restrict bounds, categorical labels and any weight override to the
 *      surviving symbols.
 *   4. Optimize (or apply the override), check categorical constraints and
 *      repair them by projection when configured to.
 *   5. Optionally trace the exact frontier.
 *   6. Compute the portfolio return series and its PerformanceStats.
 *
 * The record is immutable once built and cheap to copy.
 */

#ifndef FINPERF_ANALYTICS_PORTFOLIO_PERFORMANCE_HPP
#define FINPERF_ANALYTICS_PORTFOLIO_PERFORMANCE_HPP

#include "finperf/analytics/performance_stats.hpp"
#include "finperf/data/data_loader.hpp"
#include "finperf/data/market_data_provider.hpp"
#include "finperf/data/return_series.hpp"
#include "finperf/optimizer/constraints.hpp"
#include "finperf/optimizer/efficient_frontier.hpp"
#include "finperf/optimizer/portfolio_optimizer.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace finperf
{
    namespace analytics
    {

        /**
         * @class PortfolioPerformanceStats
         * @brief Optimized (or user-weighted) portfolio and its performance record
         *
         * Usage:
         * @code
         *   PortfolioConfig config = DataLoader::load_config("portfolio.json");
         *   CsvDataProvider provider("data/market");
         *   auto result = PortfolioPerformanceStats::compute(config, provider);
         *   result.print_summary();
         * @endcode
         */
        class PortfolioPerformanceStats
        {
        public:
            /**
             * @brief Run the full pipeline
             * @throws std::invalid_argument on invalid configuration, a failed
             *         benchmark fetch, no surviving symbol, fewer than two
             *         aligned periods or an all-zero weight override
             * @throws optimizer::InfeasibleConstraints if the surviving bounds or
             *         categorical constraints cannot be satisfied
             */
            static PortfolioPerformanceStats compute(const PortfolioConfig &config,
                                                     const MarketDataProvider &provider);

            // ===== Accessors =====

            const std::vector<std::string> &get_symbols() const { return returns_.get_symbols(); }
            const std::vector<std::string> &get_dropped_symbols() const { return dropped_symbols_; }
            const std::vector<std::string> &get_warnings() const { return warnings_; }
            const std::string &get_benchmark_symbol() const { return benchmark_symbol_; }
            const std::string &get_start_date() const { return start_date_; }
            const std::string &get_end_date() const { return end_date_; }
            Interval get_interval() const { return interval_; }
            const IntervalDays &get_interval_days() const { return interval_days_; }
            double get_confidence_level() const { return confidence_level_; }
            double get_risk_free_rate() const { return risk_free_rate_; }
            optimizer::ObjectiveFunction get_objective() const { return objective_; }
            const std::string &get_optimization_method() const { return optimization_method_; }

            const ReturnTable &get_returns() const { return returns_; }
            const ReturnSeries &get_benchmark_returns() const { return benchmark_returns_; }
            const std::vector<optimizer::AssetBounds> &get_bounds() const { return bounds_; }
            const std::vector<optimizer::CategoricalConstraint> &get_categorical_constraints() const
            {
                return categorical_constraints_;
            }

            const optimizer::OptResult &get_optimization_result() const { return optimization_result_; }
            const Eigen::VectorXd &get_optimal_weights() const { return optimization_result_.optimal_weights; }
            const std::vector<optimizer::CategoryAllocation> &get_category_allocations() const
            {
                return category_allocations_;
            }
            bool categories_repaired() const { return categories_repaired_; }
            const std::optional<optimizer::EfficientFrontierResult> &get_traced_frontier() const
            {
                return traced_frontier_;
            }

            const ReturnSeries &get_portfolio_returns() const { return portfolio_returns_; }
            const PerformanceStats &get_performance_stats() const { return performance_stats_; }

            nlohmann::json to_json() const;

            void print_summary() const;

        private:
            PortfolioPerformanceStats() = default;

            std::vector<std::string> dropped_symbols_;
            std::vector<std::string> warnings_;
            std::string benchmark_symbol_;
            std::string start_date_;
            std::string end_date_;
            Interval interval_ = Interval::ONE_DAY;
            IntervalDays interval_days_{};
            double confidence_level_ = 0.95;
            double risk_free_rate_ = 0.02;
            optimizer::ObjectiveFunction objective_ = optimizer::ObjectiveFunction::MAX_SHARPE;
            std::string optimization_method_;

            ReturnTable returns_;
            ReturnSeries benchmark_returns_;
            std::vector<optimizer::AssetBounds> bounds_;
            std::vector<optimizer::CategoricalConstraint> categorical_constraints_;

            optimizer::OptResult optimization_result_;
            std::vector<optimizer::CategoryAllocation> category_allocations_;
            bool categories_repaired_ = false;
            std::optional<optimizer::EfficientFrontierResult> traced_frontier_;

            ReturnSeries portfolio_returns_;
            PerformanceStats performance_stats_;

            void warn(const std::string &message);
        };

    } // namespace analytics
} // namespace finperf

#endif // FINPERF_ANALYTICS_PORTFOLIO_PERFORMANCE_HPP
