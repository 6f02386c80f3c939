/**
 * @file dates.hpp
 * @brief Calendar helpers for ISO (YYYY-MM-DD) subperiod boundaries.
 *
 * Dates travel through the library as strings, the way they arrive from
 * the performance provider. These helpers validate them and do the little
 * calendar arithmetic the engines need (day counts, month ends).
 */

#ifndef PERFATTR_CORE_DATES_HPP
#define PERFATTR_CORE_DATES_HPP

#include <string>

namespace perfattr
{
    namespace core
    {

        /**
         * @struct CalendarDate
         * @brief Proleptic Gregorian calendar date.
         */
        struct CalendarDate
        {
            int year;
            int month; ///< 1-12
            int day;   ///< 1-31
        };

        /**
         * @brief Parse a YYYY-MM-DD string.
         * @param text Date string.
         * @return Parsed date.
         * @throws PerfAttrError (MalformedDateString) if the text is not a valid date.
         */
        CalendarDate parse_date(const std::string &text);

        /**
         * @brief Format a date as YYYY-MM-DD.
         */
        std::string format_date(const CalendarDate &date);

        /**
         * @brief Days since 1970-01-01 (negative before).
         */
        long days_from_epoch(const CalendarDate &date);

        /**
         * @brief Number of days from beginning to ending (ending - beginning).
         * @throws PerfAttrError (MalformedDateString) if either string is invalid.
         */
        long days_between(const std::string &beginning, const std::string &ending);

        /** @brief Number of days in the given month. */
        int days_in_month(int year, int month);

        /** @brief True if the date is the last calendar day of its month. */
        bool is_calendar_month_end(const CalendarDate &date);

    } // namespace core
} // namespace perfattr

#endif // PERFATTR_CORE_DATES_HPP
