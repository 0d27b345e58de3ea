/**
 * @file market_data_provider.hpp
 * @brief Abstract source of price and return series
 *
 * The analytics core never talks to a data vendor directly. Callers pass
 * in a MarketDataProvider whose lifetime they own; the portfolio engine
 * calls it from several threads at once, so implementations must be
 * safe for concurrent const use.
 */

#ifndef FINPERF_DATA_MARKET_DATA_PROVIDER_HPP
#define FINPERF_DATA_MARKET_DATA_PROVIDER_HPP

#include "finperf/data/interval.hpp"
#include "finperf/data/return_series.hpp"
#include <stdexcept>
#include <string>

namespace finperf
{

    /**
     * @class FetchError
     * @brief A symbol could not be fetched
     */
    class FetchError : public std::runtime_error
    {
    public:
        enum class Kind
        {
            NOT_FOUND, ///< Unknown symbol
            NO_DATA,   ///< Symbol exists but the range holds no usable data
            MALFORMED  ///< Source returned data that could not be parsed
        };

        FetchError(Kind kind, const std::string &symbol, const std::string &message)
            : std::runtime_error(message), kind_(kind), symbol_(symbol)
        {
        }

        Kind kind() const { return kind_; }
        const std::string &symbol() const { return symbol_; }

    private:
        Kind kind_;
        std::string symbol_;
    };

    /**
     * @class MarketDataProvider
     * @brief Interface for fetching per-instrument series
     */
    class MarketDataProvider
    {
    public:
        virtual ~MarketDataProvider() = default;

        /**
         * @brief Fetch OHLCV bars for [start_date, end_date]
         * @param start_date YYYY-MM-DD
         * @param end_date YYYY-MM-DD
         * @throws FetchError if the symbol is unknown or has no data in range
         */
        virtual PriceSeries fetch_price_series(const std::string &symbol,
                                               const std::string &start_date,
                                               const std::string &end_date,
                                               Interval interval) const = 0;

        /**
         * @brief Fetch percentage returns for [start_date, end_date]
         *
         * The default derives close-to-close returns from fetch_price_series.
         *
         * @throws FetchError if no returns can be produced
         */
        virtual ReturnSeries fetch_return_series(const std::string &symbol,
                                                 const std::string &start_date,
                                                 const std::string &end_date,
                                                 Interval interval) const;

        /**
         * @brief Provider name for diagnostics
         */
        virtual std::string get_name() const = 0;
    };

} // namespace finperf

#endif // FINPERF_DATA_MARKET_DATA_PROVIDER_HPP
