/**
 * @file columns.hpp
 * @brief Column vocabulary of attribution tables.
 *
 * Simple columns hold single-subperiod arithmetic values. Smoothed columns
 * hold the same values scaled by linking coefficients so that they add up
 * across subperiods. Cumulative columns are running totals of the
 * subperiod table.
 */

#ifndef PERFATTR_ANALYTICS_COLUMNS_HPP
#define PERFATTR_ANALYTICS_COLUMNS_HPP

#include <vector>

namespace perfattr
{
    namespace analytics
    {

        /**
         * @enum Column
         * @brief Every column an attribution table can carry.
         */
        enum class Column
        {
            BEGINNING_DATE,
            ENDING_DATE,
            CLASSIFICATION_IDENTIFIER,
            CLASSIFICATION_NAME,

            PORTFOLIO_RETURN,
            BENCHMARK_RETURN,
            ACTIVE_RETURN,

            PORTFOLIO_WEIGHT,
            BENCHMARK_WEIGHT,
            ACTIVE_WEIGHT,

            PORTFOLIO_CONTRIB_SIMPLE,
            BENCHMARK_CONTRIB_SIMPLE,
            ACTIVE_CONTRIB_SIMPLE,

            PORTFOLIO_CONTRIB_SMOOTHED,
            BENCHMARK_CONTRIB_SMOOTHED,
            ACTIVE_CONTRIB_SMOOTHED,

            ALLOCATION_EFFECT_SIMPLE,
            SELECTION_EFFECT_SIMPLE,
            TOTAL_EFFECT_SIMPLE,

            ALLOCATION_EFFECT_SMOOTHED,
            SELECTION_EFFECT_SMOOTHED,
            TOTAL_EFFECT_SMOOTHED,

            CUMULATIVE_PORTFOLIO_RETURN,
            CUMULATIVE_BENCHMARK_RETURN,
            CUMULATIVE_ACTIVE_RETURN,

            CUMULATIVE_PORTFOLIO_CONTRIB,
            CUMULATIVE_BENCHMARK_CONTRIB,
            CUMULATIVE_ACTIVE_CONTRIB,

            CUMULATIVE_ALLOCATION_EFFECT,
            CUMULATIVE_SELECTION_EFFECT,
            CUMULATIVE_TOTAL_EFFECT
        };

        /** @brief Display header, e.g. "Portfolio Smoothed Contribution". */
        const char *column_name(Column column);

        /** @brief True for simple (single-subperiod) contributions and effects. */
        bool is_simple_column(Column column);

        /** @brief True for smoothed contributions and effects. */
        bool is_smoothed_column(Column column);

        /** @brief True for running-total columns. */
        bool is_cumulative_column(Column column);

        /** @brief True for text columns (dates and classification). */
        bool is_text_column(Column column);

        /** @brief The six smoothed columns, in display order. */
        const std::vector<Column> &smoothed_columns();

        /** @brief The nine cumulative columns, in display order. */
        const std::vector<Column> &cumulative_columns();

    } // namespace analytics
} // namespace perfattr

#endif // PERFATTR_ANALYTICS_COLUMNS_HPP
