/**
 * @file auditor.cpp
 * @brief Implementation of the Auditor.
 */

#include "analytics/auditor.hpp"
#include "core/errors.hpp"
#include "core/numeric.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace perfattr
{
    namespace analytics
    {

        namespace
        {

            using ColumnPair = std::pair<Column, Column>;

            /// Pairs that tie on every subperiod row.
            const std::vector<ColumnPair> SIMPLE_PAIRS = {
                {Column::PORTFOLIO_RETURN, Column::PORTFOLIO_CONTRIB_SIMPLE},
                {Column::BENCHMARK_RETURN, Column::BENCHMARK_CONTRIB_SIMPLE},
                {Column::ACTIVE_RETURN, Column::ACTIVE_CONTRIB_SIMPLE},
                {Column::ACTIVE_RETURN, Column::TOTAL_EFFECT_SIMPLE}};

            /// Pairs that tie on the overall row.
            const std::vector<ColumnPair> OVERALL_PAIRS = {
                // Smoothed contributions
                {Column::PORTFOLIO_RETURN, Column::PORTFOLIO_CONTRIB_SMOOTHED},
                {Column::BENCHMARK_RETURN, Column::BENCHMARK_CONTRIB_SMOOTHED},
                {Column::ACTIVE_RETURN, Column::ACTIVE_CONTRIB_SMOOTHED},
                // Cumulative returns
                {Column::PORTFOLIO_RETURN, Column::CUMULATIVE_PORTFOLIO_RETURN},
                {Column::BENCHMARK_RETURN, Column::CUMULATIVE_BENCHMARK_RETURN},
                {Column::ACTIVE_RETURN, Column::CUMULATIVE_ACTIVE_RETURN},
                // Cumulative contributions
                {Column::PORTFOLIO_RETURN, Column::CUMULATIVE_PORTFOLIO_CONTRIB},
                {Column::BENCHMARK_RETURN, Column::CUMULATIVE_BENCHMARK_CONTRIB},
                {Column::ACTIVE_RETURN, Column::CUMULATIVE_ACTIVE_CONTRIB},
                // Attribution effects
                {Column::ALLOCATION_EFFECT_SMOOTHED, Column::CUMULATIVE_ALLOCATION_EFFECT},
                {Column::SELECTION_EFFECT_SMOOTHED, Column::CUMULATIVE_SELECTION_EFFECT},
                {Column::TOTAL_EFFECT_SMOOTHED, Column::CUMULATIVE_TOTAL_EFFECT},
                {Column::ACTIVE_RETURN, Column::TOTAL_EFFECT_SMOOTHED},
                {Column::ACTIVE_RETURN, Column::CUMULATIVE_TOTAL_EFFECT}};

            /// weight x return == contribution tolerance.
            const double CONTRIBUTION_TOLERANCE = 5e-12;

            [[noreturn]] void violation(const std::string &detail)
            {
                throw core::PerfAttrError(core::ErrorCode::ARITHMETIC_IDENTITY_VIOLATION, detail);
            }

            std::string describe(Column a, Column b, double x, double y)
            {
                std::ostringstream oss;
                oss.precision(12);
                oss << column_name(a) << " (" << x << ") <> " << column_name(b) << " (" << y << ")";
                return oss.str();
            }

            double round_to(double value, int decimals)
            {
                double scale = std::pow(10.0, decimals);
                return std::round(value * scale) / scale;
            }

            void check_weight_times_return(const Table &table, Column weight, Column ret, Column contribution)
            {
                if (!table.has_column(weight) || !table.has_column(ret) || !table.has_column(contribution))
                {
                    return;
                }
                for (size_t r = 0; r < table.num_rows(); ++r)
                {
                    double w = table.number(r, weight);
                    double x = table.number(r, ret);
                    double c = table.number(r, contribution);
                    if (std::isnan(w) || std::isnan(x) || std::isnan(c))
                        continue;

                    if (std::abs(w * x - c) >= CONTRIBUTION_TOLERANCE)
                    {
                        std::ostringstream oss;
                        oss.precision(15);
                        oss << "Row " << r << ": " << column_name(weight) << " x " << column_name(ret)
                            << " = " << w * x << " <> " << column_name(contribution) << " = " << c;
                        violation(oss.str());
                    }
                }
            }

            bool same_days(const std::vector<long> &a, const std::vector<long> &b)
            {
                return a == b;
            }

            bool same_total_returns(const Eigen::VectorXd &a, const Eigen::VectorXd &b)
            {
                if (a.size() != b.size())
                {
                    return false;
                }
                for (Eigen::Index t = 0; t < a.size(); ++t)
                {
                    if (round_to(a(t), 11) != round_to(b(t), 11))
                    {
                        return false;
                    }
                }
                return true;
            }

            void require_equivalent(const data::Performance &base, const data::Performance &other,
                                    size_t instance, const char *side)
            {
                if (base.subperiods() != other.subperiods() ||
                    !same_days(base.quantity_of_days(), other.quantity_of_days()) ||
                    !same_total_returns(base.total_returns(), other.total_returns()))
                {
                    throw core::PerfAttrError(core::ErrorCode::CROSS_INSTANCE_INCONSISTENCY,
                                              std::string("Attribution ") + std::to_string(instance) + ": " +
                                                  side + " '" + other.name() + "' differs from '" +
                                                  base.name() + "' of attribution 0");
                }
            }

        } // anonymous namespace

        // ===================================================================
        // Column identities
        // ===================================================================

        void Auditor::audit_columns(const Table &table,
                                    std::size_t detail_rows,
                                    const Table *overall_table,
                                    std::size_t overall_row,
                                    bool check_simple_pairs)
        {
            if (check_simple_pairs)
            {
                for (const auto &[a, b] : SIMPLE_PAIRS)
                {
                    if (!table.has_column(a) || !table.has_column(b))
                        continue;
                    for (size_t r = 0; r < detail_rows; ++r)
                    {
                        double x = table.number(r, a);
                        double y = table.number(r, b);
                        if (!core::are_near(x, y, core::Tolerance::LOW))
                        {
                            violation("Row " + std::to_string(r) + ": " + describe(a, b, x, y));
                        }
                    }
                }
            }

            if (overall_table == nullptr)
            {
                return;
            }

            for (const auto &[a, b] : OVERALL_PAIRS)
            {
                if (!overall_table->has_column(a) || !overall_table->has_column(b))
                    continue;
                double x = overall_table->number(overall_row, a);
                double y = overall_table->number(overall_row, b);
                if (!core::are_near(x, y, core::Tolerance::LOW))
                {
                    violation("Overall: " + describe(a, b, x, y));
                }
            }

            // Smoothed columns foot to the overall row.
            for (Column column : smoothed_columns())
            {
                if (!table.has_column(column) || !overall_table->has_column(column))
                    continue;
                double sum = 0.0;
                for (size_t r = 0; r < detail_rows; ++r)
                {
                    sum += table.number(r, column);
                }
                double overall = overall_table->number(overall_row, column);
                if (!core::are_near(sum, overall, core::Tolerance::MEDIUM))
                {
                    std::ostringstream oss;
                    oss.precision(15);
                    oss << column_name(column) << " sums to " << sum << ", overall is " << overall;
                    violation(oss.str());
                }
            }
        }

        // ===================================================================
        // Attribution
        // ===================================================================

        void Auditor::audit(const Attribution &attribution)
        {
            const auto &portfolio = attribution.portfolio();
            const auto &benchmark = attribution.benchmark();

            if (portfolio.subperiods() != benchmark.subperiods())
            {
                throw core::PerfAttrError(core::ErrorCode::MISMATCHED_SUBPERIODS,
                                          "Portfolio '" + portfolio.name() + "' and benchmark '" +
                                              benchmark.name() + "' cover different subperiods");
            }

            const Table &detail = attribution.subperiod_table();
            const Table &overall = attribution.overall_table();
            if (detail.columns() != overall.columns())
            {
                violation("Subperiod table and overall row have different columns");
            }

            audit_columns(detail, detail.num_rows(), &overall, 0, true);

            // Per-item smoothed panels foot to the per-item overall values.
            for (Column column : smoothed_columns())
            {
                Eigen::VectorXd sums = attribution.asset_panel(column).colwise().sum().transpose();
                const Eigen::VectorXd &overall_values = attribution.overall_asset_values(column);
                for (Eigen::Index i = 0; i < sums.size(); ++i)
                {
                    if (!core::are_near(sums(i), overall_values(i), core::Tolerance::MEDIUM))
                    {
                        violation(std::string(column_name(column)) + " of '" +
                                  attribution.identifiers()[static_cast<size_t>(i)] +
                                  "' does not foot when summed");
                    }
                }
            }
        }

        void Auditor::audit_view(const Attribution &attribution, View view)
        {
            const Table &table = attribution.view(view);

            if (!attribution.portfolio().subperiods_consolidated())
            {
                check_weight_times_return(table, Column::PORTFOLIO_WEIGHT, Column::PORTFOLIO_RETURN,
                                          Column::PORTFOLIO_CONTRIB_SIMPLE);
            }
            if (!attribution.benchmark().subperiods_consolidated())
            {
                check_weight_times_return(table, Column::BENCHMARK_WEIGHT, Column::BENCHMARK_RETURN,
                                          Column::BENCHMARK_CONTRIB_SIMPLE);
            }

            switch (view)
            {
            case View::SUBPERIOD_ATTRIBUTION:
                audit_columns(table, table.num_rows(), nullptr, 0, false);
                break;
            case View::SUBPERIOD_SUMMARY:
                audit_columns(table, table.num_rows(), nullptr, 0, true);
                break;
            case View::CUMULATIVE_ATTRIBUTION:
            case View::OVERALL_ATTRIBUTION:
                if (table.empty())
                {
                    violation(std::string(view_name(view)) + " has no total row");
                }
                audit_columns(table, table.num_rows() - 1, &table, table.num_rows() - 1, true);
                break;
            }
        }

        void Auditor::audit_attributions(
            const std::vector<std::reference_wrapper<const Attribution>> &attributions)
        {
            for (size_t i = 0; i < attributions.size(); ++i)
            {
                const Attribution &attribution = attributions[i].get();
                audit(attribution);

                if (i == 0)
                    continue;

                const Attribution &base = attributions[0].get();
                require_equivalent(base.portfolio(), attribution.portfolio(), i, "portfolio");
                require_equivalent(base.benchmark(), attribution.benchmark(), i, "benchmark");
            }
        }

    } // namespace analytics
} // namespace perfattr
