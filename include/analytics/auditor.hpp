/**
 * @file auditor.hpp
 * @brief Arithmetic self-checks of attribution results.
 *
 * The attribution tables carry redundant columns that must tie out:
 * returns equal summed contributions, smoothed values foot to the overall
 * row, and cumulative columns end at the overall values. The auditor
 * verifies those identities and raises instead of letting a report go out
 * with numbers that do not reconcile.
 */

#ifndef PERFATTR_ANALYTICS_AUDITOR_HPP
#define PERFATTR_ANALYTICS_AUDITOR_HPP

#include "analytics/attribution.hpp"
#include "analytics/table.hpp"

#include <cstddef>
#include <functional>
#include <vector>

namespace perfattr
{
    namespace analytics
    {

        /**
         * @class Auditor
         * @brief Static identity checks over Attribution instances.
         *
         * Every check throws PerfAttrError (ArithmeticIdentityViolation) on the
         * first identity that does not hold.
         */
        class Auditor
        {
        public:
            /**
             * @brief Audit the subperiod table, overall row and per-item panels.
             * @throws PerfAttrError (MismatchedSubperiods) if the sides' subperiods differ.
             * @throws PerfAttrError (ArithmeticIdentityViolation) on any broken identity.
             */
            static void audit(const Attribution &attribution);

            /**
             * @brief Audit one materialized view.
             *
             * For each side whose subperiods were not consolidated,
             * weight x return must equal contribution on every row carrying
             * those columns. The view's total row, when it has one, plays the
             * overall role. Item-level subperiod rows do not tie to returns,
             * so simple pairs are not checked for SUBPERIOD_ATTRIBUTION.
             *
             * @throws PerfAttrError (ArithmeticIdentityViolation) on any broken identity.
             */
            static void audit_view(const Attribution &attribution, View view);

            /**
             * @brief Audit each instance, then require they were built from the same data.
             *
             * Dates, day counts and total returns (rounded to 11 decimals) of
             * each side must match across all instances.
             *
             * @throws PerfAttrError (CrossInstanceInconsistency) if they differ.
             */
            static void audit_attributions(
                const std::vector<std::reference_wrapper<const Attribution>> &attributions);

            /**
             * @brief Column identities of a table.
             * @param table Table holding detail rows and, optionally, an overall row.
             * @param detail_rows Number of leading detail rows.
             * @param overall_table Table holding the overall row, or nullptr for none.
             * @param overall_row Index of the overall row in overall_table.
             * @param check_simple_pairs Check return == simple contribution pairs on detail rows.
             */
            static void audit_columns(const Table &table,
                                      std::size_t detail_rows,
                                      const Table *overall_table,
                                      std::size_t overall_row,
                                      bool check_simple_pairs);
        };

    } // namespace analytics
} // namespace perfattr

#endif // PERFATTR_ANALYTICS_AUDITOR_HPP
