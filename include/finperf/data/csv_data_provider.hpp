/**
 * @file csv_data_provider.hpp
 * @brief MarketDataProvider reading one CSV file per symbol
 */

#ifndef FINPERF_DATA_CSV_DATA_PROVIDER_HPP
#define FINPERF_DATA_CSV_DATA_PROVIDER_HPP

#include "finperf/data/market_data_provider.hpp"
#include <string>

namespace finperf
{

    /**
     * @class CsvDataProvider
     * @brief Reads <directory>/<SYMBOL>.csv
     *
     * Files are read at their native frequency; the requested interval is
     * not resampled. Every fetch opens its own stream, so concurrent calls
     * are safe.
     *
     * Usage Example:
     * @code
     * CsvDataProvider provider("data/market");
     * ReturnSeries spy = provider.fetch_return_series("SPY", "2020-01-01",
     *                                                 "2020-12-31", Interval::ONE_DAY);
     * @endcode
     */
    class CsvDataProvider : public MarketDataProvider
    {
    public:
        explicit CsvDataProvider(const std::string &directory);

        /**
         * @throws FetchError NOT_FOUND if the file does not exist,
         *         MALFORMED if it cannot be parsed, NO_DATA if no bar is in range
         */
        PriceSeries fetch_price_series(const std::string &symbol,
                                       const std::string &start_date,
                                       const std::string &end_date,
                                       Interval interval) const override;

        std::string get_name() const override { return "CsvDataProvider(" + directory_ + ")"; }

        const std::string &get_directory() const { return directory_; }

        /**
         * @brief Path of the file backing symbol
         */
        std::string path_for(const std::string &symbol) const;

    private:
        std::string directory_;
    };

} // namespace finperf

#endif // FINPERF_DATA_CSV_DATA_PROVIDER_HPP
