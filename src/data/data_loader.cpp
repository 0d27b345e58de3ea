/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader and PortfolioConfig
 */

#include "finperf/data/data_loader.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <set>
#include <stdexcept>

namespace finperf
{

    // =============================================
    // PortfolioConfig
    // =============================================

    PortfolioConfig PortfolioConfig::from_json(const nlohmann::json &j)
    {
        PortfolioConfig config;
        config.symbols = j.value("symbols", std::vector<std::string>{});
        config.benchmark = j.value("benchmark", "");
        config.start_date = j.value("start_date", "");
        config.end_date = j.value("end_date", "");
        config.interval = interval_from_string(j.value("interval", "1d"));
        config.confidence_level = j.value("confidence_level", 0.95);
        config.risk_free_rate = j.value("risk_free_rate", 0.02);
        config.objective = optimizer::objective_from_string(j.value("objective", "max_sharpe"));

        if (j.contains("bounds") && !j["bounds"].is_null())
        {
            for (const auto &b : j["bounds"])
            {
                config.bounds.push_back(optimizer::AssetBounds::from_json(b));
            }
        }

        if (j.contains("categorical_constraints"))
        {
            for (const auto &c : j["categorical_constraints"])
            {
                config.categorical_constraints.push_back(optimizer::CategoricalConstraint::from_json(c));
            }
        }

        if (j.contains("weights") && !j["weights"].is_null())
        {
            config.weights = j["weights"].get<std::vector<double>>();
        }

        if (j.contains("optimizer"))
        {
            config.optimizer = optimizer::OptimizerOptions::from_json(j["optimizer"]);
        }

        config.frontier_points = j.value("frontier_points", 0);
        config.repair_categories = j.value("repair_categories", true);
        return config;
    }

    nlohmann::json PortfolioConfig::to_json() const
    {
        nlohmann::json j;
        j["symbols"] = symbols;
        j["benchmark"] = benchmark;
        j["start_date"] = start_date;
        j["end_date"] = end_date;
        j["interval"] = interval_to_string(interval);
        j["confidence_level"] = confidence_level;
        j["risk_free_rate"] = risk_free_rate;
        j["objective"] = optimizer::objective_to_string(objective);

        j["bounds"] = nlohmann::json::array();
        for (const auto &b : bounds)
        {
            j["bounds"].push_back(b.to_json());
        }

        j["categorical_constraints"] = nlohmann::json::array();
        for (const auto &c : categorical_constraints)
        {
            j["categorical_constraints"].push_back(c.to_json());
        }

        if (weights.has_value())
        {
            j["weights"] = *weights;
        }
        else
        {
            j["weights"] = nullptr;
        }

        j["optimizer"] = optimizer.to_json();
        j["frontier_points"] = frontier_points;
        j["repair_categories"] = repair_categories;
        return j;
    }

    void PortfolioConfig::validate() const
    {
        if (symbols.empty())
        {
            throw std::invalid_argument("At least one symbol is required");
        }

        std::set<std::string> seen;
        for (const auto &symbol : symbols)
        {
            if (symbol.empty())
            {
                throw std::invalid_argument("Symbols must not be empty strings");
            }
            if (!seen.insert(symbol).second)
            {
                throw std::invalid_argument("Duplicate symbol: " + symbol);
            }
        }

        if (benchmark.empty())
        {
            throw std::invalid_argument("Benchmark symbol is required");
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

        if (!bounds.empty())
        {
            optimizer::validate_bounds(bounds, symbols.size());
        }

        for (const auto &constraint : categorical_constraints)
        {
            constraint.validate(symbols.size());
        }

        if (weights.has_value() && weights->size() != symbols.size())
        {
            throw std::invalid_argument("Expected " + std::to_string(symbols.size()) +
                                        " weights, got " + std::to_string(weights->size()));
        }

        if (frontier_points != 0 && frontier_points < 2)
        {
            throw std::invalid_argument("frontier_points must be 0 or at least 2, got: " +
                                        std::to_string(frontier_points));
        }
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        return j;
    }

    PortfolioConfig DataLoader::load_config(const std::string &config_path)
    {
        PortfolioConfig config;
        try
        {
            config = PortfolioConfig::from_json(load_json(config_path));
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::invalid_argument("Invalid configuration in " + config_path + ": " + e.what());
        }
        config.validate();
        return config;
    }

    // ================
    // CSV Loading
    // ================

    PriceSeries DataLoader::load_price_csv(const std::string &filepath,
                                           const std::string &symbol,
                                           const std::string &start_date,
                                           const std::string &end_date)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        const auto header = parse_csv_line(line);
        int date_col = -1;
        int open_col = -1;
        int high_col = -1;
        int low_col = -1;
        int close_col = -1;
        int volume_col = -1;
        for (size_t i = 0; i < header.size(); ++i)
        {
            const std::string name = to_lower(trim(header[i]));
            const int col = static_cast<int>(i);
            if (name == "date" || name == "timestamp" || name == "datetime")
                date_col = col;
            else if (name == "open")
                open_col = col;
            else if (name == "high")
                high_col = col;
            else if (name == "low")
                low_col = col;
            else if (name == "close")
                close_col = col;
            else if (name == "volume")
                volume_col = col;
        }

        if (close_col < 0 && header.size() == 2)
        {
            close_col = 1;
        }
        if (date_col < 0 || close_col < 0)
        {
            throw std::runtime_error("CSV must have 'date' and 'close' columns: " + filepath);
        }

        const std::int64_t lower = start_date.empty() ? std::numeric_limits<std::int64_t>::min()
                                                      : parse_date(start_date);
        const std::int64_t upper = end_date.empty() ? std::numeric_limits<std::int64_t>::max()
                                                    : parse_date(end_date) + 86399;

        auto field = [](const std::vector<std::string> &fields, int col, double fallback)
        {
            if (col < 0 || static_cast<size_t>(col) >= fields.size())
                return fallback;
            return safe_stod(fields[static_cast<size_t>(col)]);
        };

        PriceSeries series;
        series.symbol = symbol;

        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            const auto fields = parse_csv_line(line);
            if (static_cast<size_t>(std::max(date_col, close_col)) >= fields.size())
                continue;

            std::int64_t timestamp = 0;
            try
            {
                timestamp = parse_timestamp(trim(fields[static_cast<size_t>(date_col)]));
            }
            catch (const std::invalid_argument &)
            {
                continue; // Skip invalid dates
            }

            if (timestamp < lower || timestamp > upper)
                continue;

            PriceBar bar;
            bar.timestamp = timestamp;
            bar.close = field(fields, close_col, std::numeric_limits<double>::quiet_NaN());
            if (std::isnan(bar.close))
                continue;
            bar.open = field(fields, open_col, bar.close);
            bar.high = field(fields, high_col, bar.close);
            bar.low = field(fields, low_col, bar.close);
            bar.volume = field(fields, volume_col, 0.0);
            series.bars.push_back(bar);
        }

        std::sort(series.bars.begin(), series.bars.end(),
                  [](const PriceBar &a, const PriceBar &b)
                  { return a.timestamp < b.timestamp; });

        return series;
    }

    // ========================
    // Private Helper Methods
    // ========================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    std::string DataLoader::to_lower(const std::string &str)
    {
        std::string out = str;
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    double DataLoader::safe_stod(const std::string &str)
    {
        const std::string trimmed = trim(str);
        if (trimmed.empty() || to_lower(trimmed) == "nan" || trimmed == "null")
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        try
        {
            size_t consumed = 0;
            const double value = std::stod(trimmed, &consumed);
            return consumed == trimmed.size() ? value : std::numeric_limits<double>::quiet_NaN();
        }
        catch (const std::invalid_argument &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        catch (const std::out_of_range &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }

} // namespace finperf
