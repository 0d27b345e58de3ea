/**
 * @file return_series.cpp
 * @brief Implementation of return series construction and alignment
 */

#include "finperf/data/return_series.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

namespace finperf
{

    // ==========================
    // ReturnSeries
    // ==========================

    void ReturnSeries::validate() const
    {
        if (static_cast<Eigen::Index>(timestamps.size()) != values.size())
        {
            throw std::invalid_argument("Return series '" + symbol + "' has " +
                                        std::to_string(timestamps.size()) + " timestamps but " +
                                        std::to_string(values.size()) + " values");
        }
        for (size_t i = 1; i < timestamps.size(); ++i)
        {
            if (timestamps[i] <= timestamps[i - 1])
            {
                throw std::invalid_argument("Return series '" + symbol +
                                            "' timestamps are not strictly increasing at index " +
                                            std::to_string(i));
            }
        }
    }

    ReturnSeries returns_from_prices(const PriceSeries &prices)
    {
        std::vector<PriceBar> bars;
        bars.reserve(prices.bars.size());
        for (const auto &bar : prices.bars)
        {
            if (std::isfinite(bar.close) && bar.close > 0.0)
            {
                bars.push_back(bar);
            }
        }

        std::sort(bars.begin(), bars.end(),
                  [](const PriceBar &a, const PriceBar &b)
                  { return a.timestamp < b.timestamp; });

        if (bars.size() < 2)
        {
            throw std::invalid_argument("Not enough prices to compute returns for '" + prices.symbol +
                                        "': " + std::to_string(bars.size()) + " usable bars");
        }

        ReturnSeries series;
        series.symbol = prices.symbol;
        series.timestamps.reserve(bars.size() - 1);
        series.values.resize(static_cast<Eigen::Index>(bars.size() - 1));

        for (size_t i = 1; i < bars.size(); ++i)
        {
            series.timestamps.push_back(bars[i].timestamp);
            series.values(static_cast<Eigen::Index>(i - 1)) = (bars[i].close / bars[i - 1].close - 1.0) * 100.0;
        }

        series.validate();
        return series;
    }

    std::vector<double> fill_gaps(const std::vector<std::optional<double>> &values)
    {
        std::vector<double> filled(values.size(), 0.0);

        // Forward pass
        std::optional<double> last;
        std::vector<bool> present(values.size(), false);
        for (size_t i = 0; i < values.size(); ++i)
        {
            if (values[i].has_value())
            {
                last = values[i];
            }
            if (last.has_value())
            {
                filled[i] = *last;
                present[i] = true;
            }
        }

        // Backward pass covers the leading gap
        std::optional<double> next;
        for (size_t i = values.size(); i-- > 0;)
        {
            if (present[i])
            {
                next = filled[i];
            }
            else if (next.has_value())
            {
                filled[i] = *next;
            }
        }

        return filled;
    }

    // ==========================
    // ReturnTable
    // ==========================

    ReturnTable::ReturnTable(const std::vector<std::string> &symbols,
                             const std::vector<std::int64_t> &timestamps,
                             const Eigen::MatrixXd &values)
        : symbols_(symbols), timestamps_(timestamps), values_(values)
    {
        if (values_.rows() != static_cast<Eigen::Index>(timestamps_.size()) ||
            values_.cols() != static_cast<Eigen::Index>(symbols_.size()))
        {
            throw std::invalid_argument("Return table is " + std::to_string(values_.rows()) + "x" +
                                        std::to_string(values_.cols()) + " but has " +
                                        std::to_string(timestamps_.size()) + " timestamps and " +
                                        std::to_string(symbols_.size()) + " symbols");
        }
        for (size_t i = 1; i < timestamps_.size(); ++i)
        {
            if (timestamps_[i] <= timestamps_[i - 1])
            {
                throw std::invalid_argument("Return table timestamps must be strictly increasing");
            }
        }
        if (!values_.allFinite())
        {
            throw std::invalid_argument("Return table contains NaN or Inf values");
        }
    }

    int ReturnTable::find_symbol_index(const std::string &symbol) const
    {
        auto it = std::find(symbols_.begin(), symbols_.end(), symbol);
        if (it == symbols_.end())
        {
            return -1;
        }
        return static_cast<int>(std::distance(symbols_.begin(), it));
    }

    ReturnSeries ReturnTable::column(const std::string &symbol) const
    {
        int idx = find_symbol_index(symbol);
        if (idx < 0)
        {
            throw std::invalid_argument("Symbol not found: " + symbol);
        }

        ReturnSeries series;
        series.symbol = symbol;
        series.timestamps = timestamps_;
        series.values = values_.col(idx);
        return series;
    }

    Eigen::VectorXd ReturnTable::mean_returns() const
    {
        if (empty())
        {
            throw std::invalid_argument("Cannot compute mean returns of an empty table");
        }
        return values_.colwise().mean().transpose();
    }

    IntervalDays ReturnTable::interval_days() const
    {
        return finperf::interval_days(timestamps_);
    }

    ReturnTable ReturnTable::select(const std::vector<std::string> &symbols) const
    {
        Eigen::MatrixXd selected(values_.rows(), static_cast<Eigen::Index>(symbols.size()));
        for (size_t i = 0; i < symbols.size(); ++i)
        {
            int idx = find_symbol_index(symbols[i]);
            if (idx < 0)
            {
                throw std::invalid_argument("Symbol not found: " + symbols[i]);
            }
            selected.col(static_cast<Eigen::Index>(i)) = values_.col(idx);
        }
        return ReturnTable(symbols, timestamps_, selected);
    }

    std::string ReturnTable::start_date() const
    {
        return timestamps_.empty() ? std::string() : format_date(timestamps_.front());
    }

    std::string ReturnTable::end_date() const
    {
        return timestamps_.empty() ? std::string() : format_date(timestamps_.back());
    }

    // ==========================
    // Alignment
    // ==========================

    ReturnSeries align_to(const ReturnSeries &series, const std::vector<std::int64_t> &timestamps)
    {
        series.validate();

        std::map<std::int64_t, double> lookup;
        for (size_t i = 0; i < series.timestamps.size(); ++i)
        {
            lookup.emplace(series.timestamps[i], series.values(static_cast<Eigen::Index>(i)));
        }

        std::vector<std::optional<double>> joined;
        joined.reserve(timestamps.size());
        for (auto ts : timestamps)
        {
            auto it = lookup.find(ts);
            joined.push_back(it == lookup.end() ? std::nullopt : std::optional<double>(it->second));
        }

        const std::vector<double> filled = fill_gaps(joined);

        ReturnSeries aligned;
        aligned.symbol = series.symbol;
        aligned.timestamps = timestamps;
        aligned.values = Eigen::Map<const Eigen::VectorXd>(filled.data(), static_cast<Eigen::Index>(filled.size()));
        return aligned;
    }

    ReturnTable align_returns(const std::vector<ReturnSeries> &series)
    {
        if (series.empty())
        {
            throw std::invalid_argument("Cannot align an empty set of return series");
        }

        std::vector<std::int64_t> timestamps;
        for (const auto &s : series)
        {
            s.validate();
            timestamps.insert(timestamps.end(), s.timestamps.begin(), s.timestamps.end());
        }
        std::sort(timestamps.begin(), timestamps.end());
        timestamps.erase(std::unique(timestamps.begin(), timestamps.end()), timestamps.end());

        std::vector<std::string> symbols;
        Eigen::MatrixXd values(static_cast<Eigen::Index>(timestamps.size()),
                               static_cast<Eigen::Index>(series.size()));

        for (size_t j = 0; j < series.size(); ++j)
        {
            symbols.push_back(series[j].symbol);
            values.col(static_cast<Eigen::Index>(j)) = align_to(series[j], timestamps).values;
        }

        return ReturnTable(symbols, timestamps, values);
    }

} // namespace finperf
