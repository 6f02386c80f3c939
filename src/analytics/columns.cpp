/**
 * @file columns.cpp
 * @brief Column names and classification.
 */

#include "analytics/columns.hpp"

namespace perfattr
{
    namespace analytics
    {

        const char *column_name(Column column)
        {
            switch (column)
            {
            case Column::BEGINNING_DATE:
                return "Beginning Date";
            case Column::ENDING_DATE:
                return "Ending Date";
            case Column::CLASSIFICATION_IDENTIFIER:
                return "Identifier";
            case Column::CLASSIFICATION_NAME:
                return "Name";
            case Column::PORTFOLIO_RETURN:
                return "Portfolio Return";
            case Column::BENCHMARK_RETURN:
                return "Benchmark Return";
            case Column::ACTIVE_RETURN:
                return "Active Return";
            case Column::PORTFOLIO_WEIGHT:
                return "Portfolio Weight";
            case Column::BENCHMARK_WEIGHT:
                return "Benchmark Weight";
            case Column::ACTIVE_WEIGHT:
                return "Active Weight";
            case Column::PORTFOLIO_CONTRIB_SIMPLE:
                return "Portfolio Contribution";
            case Column::BENCHMARK_CONTRIB_SIMPLE:
                return "Benchmark Contribution";
            case Column::ACTIVE_CONTRIB_SIMPLE:
                return "Active Contribution";
            case Column::PORTFOLIO_CONTRIB_SMOOTHED:
                return "Portfolio Smoothed Contribution";
            case Column::BENCHMARK_CONTRIB_SMOOTHED:
                return "Benchmark Smoothed Contribution";
            case Column::ACTIVE_CONTRIB_SMOOTHED:
                return "Active Smoothed Contribution";
            case Column::ALLOCATION_EFFECT_SIMPLE:
                return "Allocation Effect";
            case Column::SELECTION_EFFECT_SIMPLE:
                return "Selection Effect";
            case Column::TOTAL_EFFECT_SIMPLE:
                return "Total Effect";
            case Column::ALLOCATION_EFFECT_SMOOTHED:
                return "Smoothed Allocation Effect";
            case Column::SELECTION_EFFECT_SMOOTHED:
                return "Smoothed Selection Effect";
            case Column::TOTAL_EFFECT_SMOOTHED:
                return "Smoothed Total Effect";
            case Column::CUMULATIVE_PORTFOLIO_RETURN:
                return "Cumulative Portfolio Return";
            case Column::CUMULATIVE_BENCHMARK_RETURN:
                return "Cumulative Benchmark Return";
            case Column::CUMULATIVE_ACTIVE_RETURN:
                return "Cumulative Active Return";
            case Column::CUMULATIVE_PORTFOLIO_CONTRIB:
                return "Cumulative Portfolio Contribution";
            case Column::CUMULATIVE_BENCHMARK_CONTRIB:
                return "Cumulative Benchmark Contribution";
            case Column::CUMULATIVE_ACTIVE_CONTRIB:
                return "Cumulative Active Contribution";
            case Column::CUMULATIVE_ALLOCATION_EFFECT:
                return "Cumulative Allocation Effect";
            case Column::CUMULATIVE_SELECTION_EFFECT:
                return "Cumulative Selection Effect";
            case Column::CUMULATIVE_TOTAL_EFFECT:
                return "Cumulative Total Effect";
            }
            return "Unknown";
        }

        bool is_simple_column(Column column)
        {
            switch (column)
            {
            case Column::PORTFOLIO_CONTRIB_SIMPLE:
            case Column::BENCHMARK_CONTRIB_SIMPLE:
            case Column::ACTIVE_CONTRIB_SIMPLE:
            case Column::ALLOCATION_EFFECT_SIMPLE:
            case Column::SELECTION_EFFECT_SIMPLE:
            case Column::TOTAL_EFFECT_SIMPLE:
                return true;
            default:
                return false;
            }
        }

        bool is_smoothed_column(Column column)
        {
            switch (column)
            {
            case Column::PORTFOLIO_CONTRIB_SMOOTHED:
            case Column::BENCHMARK_CONTRIB_SMOOTHED:
            case Column::ACTIVE_CONTRIB_SMOOTHED:
            case Column::ALLOCATION_EFFECT_SMOOTHED:
            case Column::SELECTION_EFFECT_SMOOTHED:
            case Column::TOTAL_EFFECT_SMOOTHED:
                return true;
            default:
                return false;
            }
        }

        bool is_cumulative_column(Column column)
        {
            switch (column)
            {
            case Column::CUMULATIVE_PORTFOLIO_RETURN:
            case Column::CUMULATIVE_BENCHMARK_RETURN:
            case Column::CUMULATIVE_ACTIVE_RETURN:
            case Column::CUMULATIVE_PORTFOLIO_CONTRIB:
            case Column::CUMULATIVE_BENCHMARK_CONTRIB:
            case Column::CUMULATIVE_ACTIVE_CONTRIB:
            case Column::CUMULATIVE_ALLOCATION_EFFECT:
            case Column::CUMULATIVE_SELECTION_EFFECT:
            case Column::CUMULATIVE_TOTAL_EFFECT:
                return true;
            default:
                return false;
            }
        }

        bool is_text_column(Column column)
        {
            return column == Column::BEGINNING_DATE || column == Column::ENDING_DATE ||
                   column == Column::CLASSIFICATION_IDENTIFIER || column == Column::CLASSIFICATION_NAME;
        }

        const std::vector<Column> &smoothed_columns()
        {
            static const std::vector<Column> COLUMNS = {
                Column::PORTFOLIO_CONTRIB_SMOOTHED,
                Column::BENCHMARK_CONTRIB_SMOOTHED,
                Column::ACTIVE_CONTRIB_SMOOTHED,
                Column::ALLOCATION_EFFECT_SMOOTHED,
                Column::SELECTION_EFFECT_SMOOTHED,
                Column::TOTAL_EFFECT_SMOOTHED};
            return COLUMNS;
        }

        const std::vector<Column> &cumulative_columns()
        {
            static const std::vector<Column> COLUMNS = {
                Column::CUMULATIVE_PORTFOLIO_RETURN,
                Column::CUMULATIVE_BENCHMARK_RETURN,
                Column::CUMULATIVE_ACTIVE_RETURN,
                Column::CUMULATIVE_PORTFOLIO_CONTRIB,
                Column::CUMULATIVE_BENCHMARK_CONTRIB,
                Column::CUMULATIVE_ACTIVE_CONTRIB,
                Column::CUMULATIVE_ALLOCATION_EFFECT,
                Column::CUMULATIVE_SELECTION_EFFECT,
                Column::CUMULATIVE_TOTAL_EFFECT};
            return COLUMNS;
        }

    } // namespace analytics
} // namespace perfattr
