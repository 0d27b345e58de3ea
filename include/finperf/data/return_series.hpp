/**
 * @file return_series.hpp
 * @brief Price series, return series and the aligned multi-asset return table
 *
 * Returns are percentage-scaled (1.23 means 1.23%). A ReturnTable stores
 * returns as a T x N Eigen matrix: rows are timestamps, columns are
 * instruments in caller-supplied order.
 */

#ifndef FINPERF_DATA_RETURN_SERIES_HPP
#define FINPERF_DATA_RETURN_SERIES_HPP

#include "finperf/data/interval.hpp"
#include <Eigen/Dense>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace finperf
{

    /**
     * @struct PriceBar
     * @brief One OHLCV observation
     */
    struct PriceBar
    {
        std::int64_t timestamp; ///< UTC epoch seconds
        double open;
        double high;
        double low;
        double close;
        double volume;
    };

    /**
     * @struct PriceSeries
     * @brief Raw bars for one instrument, ordered by timestamp
     */
    struct PriceSeries
    {
        std::string symbol;
        std::vector<PriceBar> bars;
    };

    /**
     * @struct ReturnSeries
     * @brief Percentage returns for one instrument
     *
     * Timestamps are strictly increasing and one-to-one with values.
     */
    struct ReturnSeries
    {
        std::string symbol;
        std::vector<std::int64_t> timestamps;
        Eigen::VectorXd values;

        size_t size() const { return timestamps.size(); }
        bool empty() const { return timestamps.empty(); }

        /**
         * @brief Check ordering and sizes
         * @throws std::invalid_argument if timestamps are not strictly increasing
         *         or do not match the number of values
         */
        void validate() const;
    };

    /**
     * @brief Close-to-close rate of change in percent
     *
     * Bars with a non-finite or non-positive close are skipped, leaving a
     * gap for alignment to fill.
     *
     * @throws std::invalid_argument if fewer than two usable bars remain
     */
    ReturnSeries returns_from_prices(const PriceSeries &prices);

    /**
     * @brief Forward fill then backward fill missing values
     *
     * A vector with no present value at all becomes all zeros.
     */
    std::vector<double> fill_gaps(const std::vector<std::optional<double>> &values);

    /**
     * @class ReturnTable
     * @brief Aligned returns for several instruments on a shared timestamp axis
     *
     * Invariants: every column has one value per timestamp and no gaps;
     * column order matches symbol order.
     */
    class ReturnTable
    {
    public:
        ReturnTable() = default;

        /**
         * @throws std::invalid_argument on dimension mismatch, non-increasing
         *         timestamps or non-finite values
         */
        ReturnTable(const std::vector<std::string> &symbols,
                    const std::vector<std::int64_t> &timestamps,
                    const Eigen::MatrixXd &values);

        size_t num_periods() const { return timestamps_.size(); }
        size_t num_assets() const { return symbols_.size(); }
        bool empty() const { return symbols_.empty() || timestamps_.empty(); }

        const std::vector<std::string> &get_symbols() const { return symbols_; }
        const std::vector<std::int64_t> &get_timestamps() const { return timestamps_; }
        const Eigen::MatrixXd &get_values() const { return values_; }

        /**
         * @brief Column index of symbol, or -1 when absent
         */
        int find_symbol_index(const std::string &symbol) const;

        /**
         * @throws std::invalid_argument if the symbol is not in the table
         */
        ReturnSeries column(const std::string &symbol) const;

        /**
         * @brief Per-column mean returns
         */
        Eigen::VectorXd mean_returns() const;

        /**
         * @brief Interval metadata inferred from the table timestamps
         */
        IntervalDays interval_days() const;

        /**
         * @brief Sub-table with the given columns, in the given order
         */
        ReturnTable select(const std::vector<std::string> &symbols) const;

        std::string start_date() const;
        std::string end_date() const;

    private:
        std::vector<std::string> symbols_;
        std::vector<std::int64_t> timestamps_;
        Eigen::MatrixXd values_;
    };

    /**
     * @brief Outer-join several return series on timestamp
     *
     * The result uses the sorted union of all timestamps; each column is
     * filled forward then backward where it has no observation.
     *
     * @throws std::invalid_argument if series is empty or any series is invalid
     */
    ReturnTable align_returns(const std::vector<ReturnSeries> &series);

    /**
     * @brief Left-join a series onto a timestamp axis, filling gaps
     */
    ReturnSeries align_to(const ReturnSeries &series, const std::vector<std::int64_t> &timestamps);

} // namespace finperf

#endif // FINPERF_DATA_RETURN_SERIES_HPP
