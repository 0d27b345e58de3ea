/**
 * @file market_data_provider.cpp
 * @brief Default return-series derivation for MarketDataProvider
 */

#include "finperf/data/market_data_provider.hpp"

namespace finperf
{

    ReturnSeries MarketDataProvider::fetch_return_series(const std::string &symbol,
                                                         const std::string &start_date,
                                                         const std::string &end_date,
                                                         Interval interval) const
    {
        PriceSeries prices = fetch_price_series(symbol, start_date, end_date, interval);
        if (prices.symbol.empty())
        {
            prices.symbol = symbol;
        }

        try
        {
            return returns_from_prices(prices);
        }
        catch (const std::invalid_argument &e)
        {
            throw FetchError(FetchError::Kind::NO_DATA, symbol, e.what());
        }
    }

} // namespace finperf
