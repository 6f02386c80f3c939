/**
 * @file frequency.hpp
 * @brief Reporting frequencies of consolidated subperiods.
 */

#ifndef PERFATTR_CORE_FREQUENCY_HPP
#define PERFATTR_CORE_FREQUENCY_HPP

#include "core/dates.hpp"

#include <string>

namespace perfattr
{
    namespace core
    {

        /**
         * @enum Frequency
         * @brief Time-period frequency of a return series.
         */
        enum class Frequency
        {
            AS_OFTEN_AS_POSSIBLE, ///< Whatever the data provides; not annualizable
            MONTHLY,              ///< Calendar month ends
            QUARTERLY,            ///< Calendar quarter ends
            YEARLY                ///< Calendar year ends
        };

        /**
         * @brief Display name ("Periodic", "Monthly", "Quarterly", "Yearly").
         */
        const char *frequency_name(Frequency frequency);

        /**
         * @brief Parse a frequency from its config spelling.
         * @param text "periodic", "monthly", "quarterly" or "yearly" (case-insensitive).
         * @throws PerfAttrError (MalformedConfig) for any other text.
         */
        Frequency frequency_from_string(const std::string &text);

        /**
         * @brief Periods per year of the frequency.
         * @return 12, 4 or 1.
         * @throws PerfAttrError (InvalidFrequencyForRiskStatistics) for AS_OFTEN_AS_POSSIBLE.
         */
        int periods_per_year(Frequency frequency);

        /**
         * @brief True if the date is a boundary of the frequency.
         *
         * AS_OFTEN_AS_POSSIBLE matches every date.
         */
        bool date_matches_frequency(const CalendarDate &date, Frequency frequency);

    } // namespace core
} // namespace perfattr

#endif // PERFATTR_CORE_FREQUENCY_HPP
