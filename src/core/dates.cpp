/**
 * @file dates.cpp
 * @brief Implementation of the ISO date helpers.
 */

#include "core/dates.hpp"
#include "core/errors.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace perfattr
{
    namespace core
    {

        namespace
        {

            bool is_leap_year(int year)
            {
                return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
            }

            [[noreturn]] void throw_malformed(const std::string &text)
            {
                throw PerfAttrError(ErrorCode::MALFORMED_DATE_STRING,
                                    "'" + text + "', must be in the format yyyy-mm-dd");
            }

        } // anonymous namespace

        CalendarDate parse_date(const std::string &text)
        {
            if (text.size() != 10 || text[4] != '-' || text[7] != '-')
            {
                throw_malformed(text);
            }
            for (size_t i = 0; i < text.size(); ++i)
            {
                if (i == 4 || i == 7)
                {
                    continue;
                }
                if (!std::isdigit(static_cast<unsigned char>(text[i])))
                {
                    throw_malformed(text);
                }
            }

            CalendarDate date;
            date.year = std::stoi(text.substr(0, 4));
            date.month = std::stoi(text.substr(5, 2));
            date.day = std::stoi(text.substr(8, 2));

            if (date.month < 1 || date.month > 12 || date.day < 1 ||
                date.day > days_in_month(date.year, date.month))
            {
                throw_malformed(text);
            }
            return date;
        }

        std::string format_date(const CalendarDate &date)
        {
            std::ostringstream oss;
            oss << std::setfill('0') << std::setw(4) << date.year << "-"
                << std::setw(2) << date.month << "-"
                << std::setw(2) << date.day;
            return oss.str();
        }

        long days_from_epoch(const CalendarDate &date)
        {
            // Howard Hinnant's days_from_civil.
            long y = date.year - (date.month <= 2 ? 1 : 0);
            long era = (y >= 0 ? y : y - 399) / 400;
            long yoe = y - era * 400;
            long mp = (date.month + 9) % 12;
            long doy = (153 * mp + 2) / 5 + date.day - 1;
            long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + doe - 719468;
        }

        long days_between(const std::string &beginning, const std::string &ending)
        {
            return days_from_epoch(parse_date(ending)) - days_from_epoch(parse_date(beginning));
        }

        int days_in_month(int year, int month)
        {
            static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (month == 2 && is_leap_year(year))
            {
                return 29;
            }
            return DAYS[month - 1];
        }

        bool is_calendar_month_end(const CalendarDate &date)
        {
            if (date.day < 28)
            {
                return false;
            }
            return date.day == days_in_month(date.year, date.month);
        }

    } // namespace core
} // namespace perfattr
