/**
 * @file interval.cpp
 * @brief Implementation of interval parsing, interval inference and date helpers
 */

#include "finperf/data/interval.hpp"
#include <cctype>
#include <cstdio>
#include <map>
#include <stdexcept>

namespace finperf
{

    namespace
    {
        constexpr double kSecondsPerDay = 86400.0;

        // Days since 1970-01-01 for a proleptic Gregorian date
        std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d)
        {
            y -= m <= 2 ? 1 : 0;
            const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
            const unsigned yoe = static_cast<unsigned>(y - era * 400);
            const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
        }

        void civil_from_days(std::int64_t z, int &year, unsigned &month, unsigned &day)
        {
            z += 719468;
            const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
            const unsigned doe = static_cast<unsigned>(z - era * 146097);
            const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const unsigned mp = (5 * doy + 2) / 153;
            day = doy - (153 * mp + 2) / 5 + 1;
            month = mp < 10 ? mp + 3 : mp - 9;
            year = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0));
        }

        bool is_leap_year(int year)
        {
            return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        }

        unsigned days_in_month(int year, unsigned month)
        {
            static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (month == 2 && is_leap_year(year))
            {
                return 29;
            }
            return kDays[month - 1];
        }

        int parse_digits(const std::string &text, std::size_t pos, std::size_t count)
        {
            int value = 0;
            for (std::size_t i = pos; i < pos + count; ++i)
            {
                if (i >= text.size() || !std::isdigit(static_cast<unsigned char>(text[i])))
                {
                    throw std::invalid_argument("Invalid date/time: '" + text + "'");
                }
                value = value * 10 + (text[i] - '0');
            }
            return value;
        }
    } // namespace

    // ============================================================================
    // Interval
    // ============================================================================

    Interval interval_from_string(const std::string &text)
    {
        static const std::map<std::string, Interval> kIntervals = {
            {"2m", Interval::TWO_MINUTES},
            {"5m", Interval::FIVE_MINUTES},
            {"15m", Interval::FIFTEEN_MINUTES},
            {"30m", Interval::THIRTY_MINUTES},
            {"60m", Interval::SIXTY_MINUTES},
            {"90m", Interval::NINETY_MINUTES},
            {"1h", Interval::ONE_HOUR},
            {"1d", Interval::ONE_DAY},
            {"5d", Interval::FIVE_DAYS},
            {"1wk", Interval::ONE_WEEK},
            {"1mo", Interval::ONE_MONTH},
            {"3mo", Interval::THREE_MONTHS}};

        auto it = kIntervals.find(text);
        if (it == kIntervals.end())
        {
            throw std::invalid_argument("Unknown interval: '" + text +
                                        "'. Expected one of 2m, 5m, 15m, 30m, 60m, 90m, 1h, 1d, 5d, 1wk, 1mo, 3mo");
        }
        return it->second;
    }

    std::string interval_to_string(Interval interval)
    {
        switch (interval)
        {
        case Interval::TWO_MINUTES:
            return "2m";
        case Interval::FIVE_MINUTES:
            return "5m";
        case Interval::FIFTEEN_MINUTES:
            return "15m";
        case Interval::THIRTY_MINUTES:
            return "30m";
        case Interval::SIXTY_MINUTES:
            return "60m";
        case Interval::NINETY_MINUTES:
            return "90m";
        case Interval::ONE_HOUR:
            return "1h";
        case Interval::ONE_DAY:
            return "1d";
        case Interval::FIVE_DAYS:
            return "5d";
        case Interval::ONE_WEEK:
            return "1wk";
        case Interval::ONE_MONTH:
            return "1mo";
        case Interval::THREE_MONTHS:
            return "3mo";
        }
        return "1d";
    }

    double nominal_days(Interval interval)
    {
        constexpr double kMinute = 1.0 / 1440.0;
        switch (interval)
        {
        case Interval::TWO_MINUTES:
            return 2 * kMinute;
        case Interval::FIVE_MINUTES:
            return 5 * kMinute;
        case Interval::FIFTEEN_MINUTES:
            return 15 * kMinute;
        case Interval::THIRTY_MINUTES:
            return 30 * kMinute;
        case Interval::SIXTY_MINUTES:
        case Interval::ONE_HOUR:
            return 60 * kMinute;
        case Interval::NINETY_MINUTES:
            return 90 * kMinute;
        case Interval::ONE_DAY:
            return 1.0;
        case Interval::FIVE_DAYS:
            return 5.0;
        case Interval::ONE_WEEK:
            return 7.0;
        case Interval::ONE_MONTH:
            return 30.0;
        case Interval::THREE_MONTHS:
            return 90.0;
        }
        return 1.0;
    }

    nlohmann::json IntervalDays::to_json() const
    {
        return nlohmann::json{{"average", average}, {"mode", mode}};
    }

    IntervalDays interval_days(const std::vector<std::int64_t> &timestamps)
    {
        if (timestamps.size() < 2)
        {
            throw std::invalid_argument("At least two observations are required to infer the interval, got " +
                                        std::to_string(timestamps.size()));
        }

        double total_seconds = 0.0;
        std::map<std::int64_t, int> gap_counts;

        for (std::size_t i = 1; i < timestamps.size(); ++i)
        {
            const double diff = static_cast<double>(timestamps[i] - timestamps[i - 1]);
            total_seconds += diff;
            const auto key = static_cast<std::int64_t>(diff / kSecondsPerDay * 10000.0);
            ++gap_counts[key];
        }

        const double gaps = static_cast<double>(timestamps.size() - 1);

        // Ascending key order with a strict comparison keeps the smaller gap on ties
        std::int64_t mode_key = gap_counts.begin()->first;
        int max_count = 0;
        for (const auto &[key, count] : gap_counts)
        {
            if (count > max_count)
            {
                max_count = count;
                mode_key = key;
            }
        }

        IntervalDays result;
        result.average = total_seconds / (gaps * kSecondsPerDay);
        result.mode = static_cast<double>(mode_key) / 10000.0;
        return result;
    }

    // ============================================================================
    // Date helpers
    // ============================================================================

    bool is_valid_date_format(const std::string &date)
    {
        if (date.length() != 10)
            return false;
        if (date[4] != '-' || date[7] != '-')
            return false;

        for (size_t i = 0; i < date.length(); ++i)
        {
            if (i == 4 || i == 7)
                continue;
            if (!std::isdigit(static_cast<unsigned char>(date[i])))
                return false;
        }

        return true;
    }

    std::int64_t parse_date(const std::string &date)
    {
        if (!is_valid_date_format(date))
        {
            throw std::invalid_argument("Invalid date format: '" + date + "' (expected YYYY-MM-DD)");
        }

        const int year = parse_digits(date, 0, 4);
        const int month = parse_digits(date, 5, 2);
        const int day = parse_digits(date, 8, 2);

        if (month < 1 || month > 12 || day < 1 ||
            static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month)))
        {
            throw std::invalid_argument("Date out of range: '" + date + "'");
        }

        return days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) *
               static_cast<std::int64_t>(kSecondsPerDay);
    }

    std::int64_t parse_timestamp(const std::string &text)
    {
        if (text.size() < 10)
        {
            throw std::invalid_argument("Invalid timestamp: '" + text + "'");
        }

        std::int64_t seconds = parse_date(text.substr(0, 10));
        if (text.size() == 10)
        {
            return seconds;
        }

        // "YYYY-MM-DD HH:MM" or "YYYY-MM-DD HH:MM:SS"
        if ((text[10] != ' ' && text[10] != 'T') || text.size() < 16 || text[13] != ':')
        {
            throw std::invalid_argument("Invalid timestamp: '" + text + "'");
        }

        const int hour = parse_digits(text, 11, 2);
        const int minute = parse_digits(text, 14, 2);
        int second = 0;
        if (text.size() >= 19 && text[16] == ':')
        {
            second = parse_digits(text, 17, 2);
        }

        if (hour > 23 || minute > 59 || second > 60)
        {
            throw std::invalid_argument("Time out of range: '" + text + "'");
        }

        seconds += hour * 3600 + minute * 60 + second;
        return seconds;
    }

    std::string format_date(std::int64_t timestamp)
    {
        std::int64_t days = timestamp / static_cast<std::int64_t>(kSecondsPerDay);
        if (timestamp < 0 && timestamp % static_cast<std::int64_t>(kSecondsPerDay) != 0)
        {
            --days;
        }

        int year = 0;
        unsigned month = 0;
        unsigned day = 0;
        civil_from_days(days, year, month, day);

        char buffer[11];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", year, month, day);
        return std::string(buffer);
    }

} // namespace finperf
