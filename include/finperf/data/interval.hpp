/**
 * @file interval.hpp
 * @brief Sampling intervals, inferred interval metadata and date helpers
 *
 * Timestamps throughout finperf are UTC epoch seconds. Dates at the
 * configuration boundary are "YYYY-MM-DD" strings, optionally followed
 * by " HH:MM:SS" for intraday data.
 */

#ifndef FINPERF_DATA_INTERVAL_HPP
#define FINPERF_DATA_INTERVAL_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace finperf
{

    /**
     * @enum Interval
     * @brief Bar size requested from a data provider
     */
    enum class Interval
    {
        TWO_MINUTES,
        FIVE_MINUTES,
        FIFTEEN_MINUTES,
        THIRTY_MINUTES,
        SIXTY_MINUTES,
        NINETY_MINUTES,
        ONE_HOUR,
        ONE_DAY,
        FIVE_DAYS,
        ONE_WEEK,
        ONE_MONTH,
        THREE_MONTHS
    };

    /**
     * @brief Parse "2m", "5m", "15m", "30m", "60m", "90m", "1h", "1d", "5d",
     *        "1wk", "1mo" or "3mo"
     * @throws std::invalid_argument for any other text
     */
    Interval interval_from_string(const std::string &text);

    /**
     * @brief Inverse of interval_from_string
     */
    std::string interval_to_string(Interval interval);

    /**
     * @brief Nominal bar length in days (a month counts as 30 days)
     */
    double nominal_days(Interval interval);

    /**
     * @struct IntervalDays
     * @brief Period length inferred from the gaps between observations
     */
    struct IntervalDays
    {
        double average; ///< Mean gap in days; 365 / average is the annualization factor
        double mode;    ///< Most frequent gap in days (ties to the smaller gap)

        nlohmann::json to_json() const;
    };

    /**
     * @brief Infer interval metadata from strictly increasing timestamps
     *
     * Gaps are bucketed at 1e-4 day precision when finding the mode.
     *
     * @throws std::invalid_argument if fewer than two timestamps are given
     */
    IntervalDays interval_days(const std::vector<std::int64_t> &timestamps);

    // ========================================================================
    // Date helpers
    // ========================================================================

    /**
     * @brief Check for YYYY-MM-DD
     */
    bool is_valid_date_format(const std::string &date);

    /**
     * @brief Parse YYYY-MM-DD as midnight UTC
     * @throws std::invalid_argument on malformed or out-of-range dates
     */
    std::int64_t parse_date(const std::string &date);

    /**
     * @brief Parse "YYYY-MM-DD" or "YYYY-MM-DD HH:MM:SS" (also accepts 'T')
     * @throws std::invalid_argument on malformed input
     */
    std::int64_t parse_timestamp(const std::string &text);

    /**
     * @brief Format epoch seconds as YYYY-MM-DD
     */
    std::string format_date(std::int64_t timestamp);

} // namespace finperf

#endif // FINPERF_DATA_INTERVAL_HPP
