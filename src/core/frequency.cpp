/**
 * @file frequency.cpp
 * @brief Implementation of the Frequency helpers.
 */

#include "core/frequency.hpp"
#include "core/errors.hpp"
#include "core/text.hpp"

namespace perfattr
{
    namespace core
    {

        const char *frequency_name(Frequency frequency)
        {
            switch (frequency)
            {
            case Frequency::AS_OFTEN_AS_POSSIBLE:
                return "Periodic";
            case Frequency::MONTHLY:
                return "Monthly";
            case Frequency::QUARTERLY:
                return "Quarterly";
            case Frequency::YEARLY:
                return "Yearly";
            }
            return "Unknown";
        }

        Frequency frequency_from_string(const std::string &text)
        {
            std::string lower = to_lower(trim(text));

            if (lower == "periodic" || lower == "as_often_as_possible")
            {
                return Frequency::AS_OFTEN_AS_POSSIBLE;
            }
            if (lower == "monthly")
            {
                return Frequency::MONTHLY;
            }
            if (lower == "quarterly")
            {
                return Frequency::QUARTERLY;
            }
            if (lower == "yearly")
            {
                return Frequency::YEARLY;
            }
            throw PerfAttrError(ErrorCode::MALFORMED_CONFIG, "Unknown frequency '" + text + "'");
        }

        int periods_per_year(Frequency frequency)
        {
            switch (frequency)
            {
            case Frequency::MONTHLY:
                return 12;
            case Frequency::QUARTERLY:
                return 4;
            case Frequency::YEARLY:
                return 1;
            case Frequency::AS_OFTEN_AS_POSSIBLE:
                break;
            }
            throw PerfAttrError(ErrorCode::INVALID_FREQUENCY_FOR_RISK_STATISTICS,
                                std::string("Frequency ") + frequency_name(frequency) +
                                    " has no defined periods per year");
        }

        bool date_matches_frequency(const CalendarDate &date, Frequency frequency)
        {
            switch (frequency)
            {
            case Frequency::AS_OFTEN_AS_POSSIBLE:
                return true;
            case Frequency::MONTHLY:
                return is_calendar_month_end(date);
            case Frequency::QUARTERLY:
                return date.month % 3 == 0 && is_calendar_month_end(date);
            case Frequency::YEARLY:
                return date.month == 12 && is_calendar_month_end(date);
            }
            return false;
        }

    } // namespace core
} // namespace perfattr
