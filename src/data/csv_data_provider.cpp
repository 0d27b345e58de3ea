/**
 * @file csv_data_provider.cpp
 * @brief Implementation of CsvDataProvider
 */

#include "finperf/data/csv_data_provider.hpp"
#include "finperf/data/data_loader.hpp"
#include <filesystem>
#include <stdexcept>

namespace finperf
{

    CsvDataProvider::CsvDataProvider(const std::string &directory)
        : directory_(directory)
    {
        if (directory_.empty())
        {
            throw std::invalid_argument("Data directory must not be empty");
        }
    }

    std::string CsvDataProvider::path_for(const std::string &symbol) const
    {
        return (std::filesystem::path(directory_) / (symbol + ".csv")).string();
    }

    PriceSeries CsvDataProvider::fetch_price_series(const std::string &symbol,
                                                    const std::string &start_date,
                                                    const std::string &end_date,
                                                    Interval interval) const
    {
        const std::string path = path_for(symbol);
        if (!std::filesystem::is_regular_file(path))
        {
            throw FetchError(FetchError::Kind::NOT_FOUND, symbol,
                             "No data file for " + symbol + " at " + path);
        }

        PriceSeries series;
        try
        {
            series = DataLoader::load_price_csv(path, symbol, start_date, end_date);
        }
        catch (const std::runtime_error &e)
        {
            throw FetchError(FetchError::Kind::MALFORMED, symbol, e.what());
        }

        if (series.bars.empty())
        {
            throw FetchError(FetchError::Kind::NO_DATA, symbol,
                             "No " + interval_to_string(interval) + " bars for " + symbol +
                                 " between " + start_date + " and " + end_date);
        }

        return series;
    }

} // namespace finperf
