/**
 * @file attribution.cpp
 * @brief Implementation of the Attribution class.
 *
 * The per-item data of both sides is equalized onto the sorted union of
 * identifiers and held as subperiod x item Eigen panels, one per column.
 * Portfolio-level series are row sums of those panels. Smoothed
 * contributions use each side's own logarithmic linking coefficients;
 * smoothed effects use the Carino attribution coefficients k_t.
 */

#include "analytics/attribution.hpp"
#include "analytics/linking.hpp"
#include "core/errors.hpp"
#include "core/text.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <set>
#include <stdexcept>

namespace perfattr
{
    namespace analytics
    {

        namespace
        {

            const double NOT_APPLICABLE = std::numeric_limits<double>::quiet_NaN();

            /// Columns of the portfolio-level subperiod table and overall row.
            const std::vector<Column> &subperiod_table_columns()
            {
                static const std::vector<Column> COLUMNS = {
                    Column::BEGINNING_DATE,
                    Column::ENDING_DATE,
                    Column::PORTFOLIO_RETURN,
                    Column::BENCHMARK_RETURN,
                    Column::ACTIVE_RETURN,
                    Column::PORTFOLIO_CONTRIB_SIMPLE,
                    Column::BENCHMARK_CONTRIB_SIMPLE,
                    Column::ACTIVE_CONTRIB_SIMPLE,
                    Column::PORTFOLIO_CONTRIB_SMOOTHED,
                    Column::BENCHMARK_CONTRIB_SMOOTHED,
                    Column::ACTIVE_CONTRIB_SMOOTHED,
                    Column::ALLOCATION_EFFECT_SIMPLE,
                    Column::SELECTION_EFFECT_SIMPLE,
                    Column::TOTAL_EFFECT_SIMPLE,
                    Column::ALLOCATION_EFFECT_SMOOTHED,
                    Column::SELECTION_EFFECT_SMOOTHED,
                    Column::TOTAL_EFFECT_SMOOTHED,
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

            /// Columns held per item.
            const std::vector<Column> &asset_panel_columns()
            {
                static const std::vector<Column> COLUMNS = {
                    Column::PORTFOLIO_RETURN,
                    Column::BENCHMARK_RETURN,
                    Column::ACTIVE_RETURN,
                    Column::PORTFOLIO_WEIGHT,
                    Column::BENCHMARK_WEIGHT,
                    Column::ACTIVE_WEIGHT,
                    Column::PORTFOLIO_CONTRIB_SIMPLE,
                    Column::BENCHMARK_CONTRIB_SIMPLE,
                    Column::ACTIVE_CONTRIB_SIMPLE,
                    Column::PORTFOLIO_CONTRIB_SMOOTHED,
                    Column::BENCHMARK_CONTRIB_SMOOTHED,
                    Column::ACTIVE_CONTRIB_SMOOTHED,
                    Column::ALLOCATION_EFFECT_SIMPLE,
                    Column::SELECTION_EFFECT_SIMPLE,
                    Column::TOTAL_EFFECT_SIMPLE,
                    Column::ALLOCATION_EFFECT_SMOOTHED,
                    Column::SELECTION_EFFECT_SMOOTHED,
                    Column::TOTAL_EFFECT_SMOOTHED};
                return COLUMNS;
            }

            Eigen::VectorXd cumulative_sum(const Eigen::VectorXd &values)
            {
                Eigen::VectorXd result(values.size());
                double running = 0.0;
                for (Eigen::Index t = 0; t < values.size(); ++t)
                {
                    running += values(t);
                    result(t) = running;
                }
                return result;
            }

            Eigen::VectorXd cumulative_return(const Eigen::VectorXd &returns)
            {
                Eigen::VectorXd result(returns.size());
                double growth = 1.0;
                for (Eigen::Index t = 0; t < returns.size(); ++t)
                {
                    growth *= (1.0 + returns(t));
                    result(t) = growth - 1.0;
                }
                return result;
            }

            /// Copy the named columns of one row of a table.
            std::vector<Cell> project_row(const Table &table, size_t row, const std::vector<Column> &columns)
            {
                std::vector<Cell> cells;
                cells.reserve(columns.size());
                for (Column column : columns)
                {
                    cells.push_back(table.at(row, column));
                }
                return cells;
            }

        } // anonymous namespace

        const char *view_name(View view)
        {
            switch (view)
            {
            case View::CUMULATIVE_ATTRIBUTION:
                return "Cumulative Attribution";
            case View::OVERALL_ATTRIBUTION:
                return "Overall Attribution";
            case View::SUBPERIOD_ATTRIBUTION:
                return "Sub-Period Attribution";
            case View::SUBPERIOD_SUMMARY:
                return "Sub-Period Summary";
            }
            return "Unknown";
        }

        // ===================================================================
        // Equalization
        // ===================================================================

        std::vector<std::string> identifier_union(const data::Performance &portfolio,
                                                  const data::Performance &benchmark)
        {
            std::set<std::string> ids(portfolio.identifiers().begin(), portfolio.identifiers().end());
            ids.insert(benchmark.identifiers().begin(), benchmark.identifiers().end());
            return std::vector<std::string>(ids.begin(), ids.end());
        }

        EqualizedPanels equalize(const data::Performance &performance,
                                 const std::vector<std::string> &identifiers)
        {
            const Eigen::Index rows = static_cast<Eigen::Index>(performance.num_subperiods());
            const Eigen::Index cols = static_cast<Eigen::Index>(identifiers.size());

            EqualizedPanels panels;
            panels.returns = Eigen::MatrixXd::Zero(rows, cols);
            panels.weights = Eigen::MatrixXd::Zero(rows, cols);
            panels.contributions = Eigen::MatrixXd::Zero(rows, cols);
            panels.consolidated_returns = Eigen::MatrixXd::Zero(rows, cols);
            panels.overall_returns = Eigen::VectorXd::Zero(cols);
            panels.overall_weights = Eigen::VectorXd::Zero(cols);

            for (Eigen::Index j = 0; j < cols; ++j)
            {
                int source = performance.asset_index(identifiers[static_cast<size_t>(j)]);
                if (source < 0)
                    continue;

                panels.returns.col(j) = performance.returns().col(source);
                panels.weights.col(j) = performance.weights().col(source);
                panels.contributions.col(j) = performance.contributions().col(source);
                panels.consolidated_returns.col(j) = performance.consolidated_returns().col(source);
                panels.overall_returns(j) = performance.overall_asset_returns()(source);
                panels.overall_weights(j) = performance.overall_asset_weights()(source);
            }
            return panels;
        }

        // ===================================================================
        // Constructors
        // ===================================================================

        Attribution::Attribution(data::Performance portfolio,
                                 data::Performance benchmark,
                                 data::Classification classification)
            : portfolio_(std::move(portfolio)), benchmark_(std::move(benchmark)), classification_(std::move(classification))
        {
            check_subperiods();

            identifiers_ = identifier_union(portfolio_, benchmark_);

            warn_unnamed_items();

            const EqualizedPanels p = equalize(portfolio_, identifiers_);
            const EqualizedPanels b = equalize(benchmark_, identifiers_);
            calculate_attribution(p, b);
            calculate_overall(p, b);
        }

        Attribution::Attribution(data::Performance portfolio, data::Performance benchmark)
            : Attribution(portfolio, benchmark, data::Classification::infer(portfolio, benchmark))
        {
        }

        // ===================================================================
        // Accessors
        // ===================================================================

        std::vector<Column> Attribution::asset_columns() const
        {
            return asset_panel_columns();
        }

        const Eigen::MatrixXd &Attribution::asset_panel(Column column) const
        {
            auto it = panels_.find(column);
            if (it == panels_.end())
            {
                throw std::out_of_range(std::string("Attribution: no per-item panel for '") +
                                        column_name(column) + "'");
            }
            return it->second;
        }

        const Eigen::VectorXd &Attribution::overall_asset_values(Column column) const
        {
            auto it = overall_assets_.find(column);
            if (it == overall_assets_.end())
            {
                throw std::out_of_range(std::string("Attribution: no per-item overall values for '") +
                                        column_name(column) + "'");
            }
            return it->second;
        }

        // ===================================================================
        // Views
        // ===================================================================

        const Table &Attribution::view(View view) const
        {
            {
                std::lock_guard<std::mutex> lock(views_mutex_);
                auto it = views_.find(view);
                if (it != views_.end())
                {
                    return it->second;
                }
            }

            Table built = build_view(view);

            std::lock_guard<std::mutex> lock(views_mutex_);
            return views_.emplace(view, std::move(built)).first->second;
        }

        const Table &Attribution::view_for_rendering(View view, std::size_t max_rows) const
        {
            const Table &table = this->view(view);
            if (table.num_rows() >= max_rows)
            {
                throw core::PerfAttrError(core::ErrorCode::TOO_MANY_ROWS_FOR_RENDER,
                                          std::string(view_name(view)) + ", Rows = " +
                                              std::to_string(table.num_rows()) + ", limit " +
                                              std::to_string(max_rows));
            }
            return table;
        }

        std::pair<std::string, std::string> Attribution::title_lines(View view) const
        {
            std::string line1 = portfolio_.name() + " vs " + benchmark_.name();
            std::string line2 = std::string(view_name(view)) + " by " + classification_.name() + ": " +
                                core::frequency_name(frequency()) + " from " + beginning_date() +
                                " to " + ending_date();
            return {line1, line2};
        }

        // ===================================================================
        // Private Helpers
        // ===================================================================

        void Attribution::check_subperiods() const
        {
            if (portfolio_.num_subperiods() != benchmark_.num_subperiods())
            {
                throw core::PerfAttrError(core::ErrorCode::RETURN_SERIES_LENGTH_MISMATCH,
                                          "Portfolio has " + std::to_string(portfolio_.num_subperiods()) +
                                              " subperiods, benchmark has " +
                                              std::to_string(benchmark_.num_subperiods()));
            }
            for (size_t t = 0; t < portfolio_.num_subperiods(); ++t)
            {
                const auto &p = portfolio_.subperiods()[t];
                const auto &b = benchmark_.subperiods()[t];
                if (p != b)
                {
                    throw core::PerfAttrError(core::ErrorCode::MISMATCHED_SUBPERIODS,
                                              "Portfolio " + p.beginning_date + " to " + p.ending_date +
                                                  ", benchmark " + b.beginning_date + " to " + b.ending_date);
                }
            }
            if (portfolio_.frequency() != benchmark_.frequency())
            {
                std::cerr << "Warning: portfolio is " << core::frequency_name(portfolio_.frequency())
                          << " and benchmark is " << core::frequency_name(benchmark_.frequency())
                          << "; reporting as " << core::frequency_name(portfolio_.frequency()) << "\n";
            }
        }

        void Attribution::warn_unnamed_items() const
        {
            if (classification_.empty())
            {
                return;
            }
            for (const auto &id : identifiers_)
            {
                if (!classification_.contains(id))
                {
                    std::cerr << "Warning: '" << id << "' is not an item of classification '"
                              << classification_.name() << "'\n";
                }
            }
        }

        void Attribution::calculate_attribution(const EqualizedPanels &p, const EqualizedPanels &b)
        {
            const Eigen::VectorXd &p_total = portfolio_.total_returns();
            const Eigen::VectorXd &b_total = benchmark_.total_returns();

            k_ = analytics::attribution_linking_coefficients(p_total, b_total,
                                                             portfolio_.overall_return(),
                                                             benchmark_.overall_return());

            // Per-item panels
            panels_[Column::PORTFOLIO_RETURN] = p.returns;
            panels_[Column::BENCHMARK_RETURN] = b.returns;
            panels_[Column::ACTIVE_RETURN] = p.returns - b.returns;

            panels_[Column::PORTFOLIO_WEIGHT] = p.weights;
            panels_[Column::BENCHMARK_WEIGHT] = b.weights;
            panels_[Column::ACTIVE_WEIGHT] = p.weights - b.weights;

            panels_[Column::PORTFOLIO_CONTRIB_SIMPLE] = p.contributions;
            panels_[Column::BENCHMARK_CONTRIB_SIMPLE] = b.contributions;
            panels_[Column::ACTIVE_CONTRIB_SIMPLE] = p.contributions - b.contributions;

            panels_[Column::PORTFOLIO_CONTRIB_SMOOTHED] = portfolio_.linking_coefficients().asDiagonal() * p.contributions;
            panels_[Column::BENCHMARK_CONTRIB_SMOOTHED] = benchmark_.linking_coefficients().asDiagonal() * b.contributions;
            panels_[Column::ACTIVE_CONTRIB_SMOOTHED] =
                panels_[Column::PORTFOLIO_CONTRIB_SMOOTHED] - panels_[Column::BENCHMARK_CONTRIB_SMOOTHED];

            // Brinson-Fachler on consolidated returns
            Eigen::MatrixXd excess_b = b.consolidated_returns.colwise() - b_total;
            Eigen::MatrixXd allocation = excess_b.cwiseProduct(p.weights - b.weights);
            Eigen::MatrixXd selection = p.weights.cwiseProduct(p.consolidated_returns - b.consolidated_returns);

            panels_[Column::ALLOCATION_EFFECT_SIMPLE] = allocation;
            panels_[Column::SELECTION_EFFECT_SIMPLE] = selection;
            panels_[Column::TOTAL_EFFECT_SIMPLE] = allocation + selection;

            panels_[Column::ALLOCATION_EFFECT_SMOOTHED] = k_.asDiagonal() * allocation;
            panels_[Column::SELECTION_EFFECT_SMOOTHED] = k_.asDiagonal() * selection;
            panels_[Column::TOTAL_EFFECT_SMOOTHED] =
                panels_[Column::ALLOCATION_EFFECT_SMOOTHED] + panels_[Column::SELECTION_EFFECT_SMOOTHED];

            // Portfolio-level series
            std::map<Column, Eigen::VectorXd> series;
            series[Column::PORTFOLIO_RETURN] = p_total;
            series[Column::BENCHMARK_RETURN] = b_total;
            series[Column::ACTIVE_RETURN] = p_total - b_total;

            for (Column column : {Column::PORTFOLIO_CONTRIB_SIMPLE, Column::BENCHMARK_CONTRIB_SIMPLE,
                                  Column::ACTIVE_CONTRIB_SIMPLE, Column::PORTFOLIO_CONTRIB_SMOOTHED,
                                  Column::BENCHMARK_CONTRIB_SMOOTHED, Column::ACTIVE_CONTRIB_SMOOTHED,
                                  Column::ALLOCATION_EFFECT_SIMPLE, Column::SELECTION_EFFECT_SIMPLE,
                                  Column::TOTAL_EFFECT_SIMPLE, Column::ALLOCATION_EFFECT_SMOOTHED,
                                  Column::SELECTION_EFFECT_SMOOTHED, Column::TOTAL_EFFECT_SMOOTHED})
            {
                series[column] = panels_[column].rowwise().sum();
            }

            series[Column::CUMULATIVE_PORTFOLIO_RETURN] = cumulative_return(p_total);
            series[Column::CUMULATIVE_BENCHMARK_RETURN] = cumulative_return(b_total);
            series[Column::CUMULATIVE_ACTIVE_RETURN] =
                series[Column::CUMULATIVE_PORTFOLIO_RETURN] - series[Column::CUMULATIVE_BENCHMARK_RETURN];

            series[Column::CUMULATIVE_PORTFOLIO_CONTRIB] = cumulative_sum(series[Column::PORTFOLIO_CONTRIB_SMOOTHED]);
            series[Column::CUMULATIVE_BENCHMARK_CONTRIB] = cumulative_sum(series[Column::BENCHMARK_CONTRIB_SMOOTHED]);
            series[Column::CUMULATIVE_ACTIVE_CONTRIB] = cumulative_sum(series[Column::ACTIVE_CONTRIB_SMOOTHED]);

            series[Column::CUMULATIVE_ALLOCATION_EFFECT] = cumulative_sum(series[Column::ALLOCATION_EFFECT_SMOOTHED]);
            series[Column::CUMULATIVE_SELECTION_EFFECT] = cumulative_sum(series[Column::SELECTION_EFFECT_SMOOTHED]);
            series[Column::CUMULATIVE_TOTAL_EFFECT] = cumulative_sum(series[Column::TOTAL_EFFECT_SMOOTHED]);

            subperiod_table_ = Table(subperiod_table_columns());
            for (size_t t = 0; t < portfolio_.num_subperiods(); ++t)
            {
                const auto &sp = subperiods()[t];
                std::vector<Cell> row;
                row.reserve(subperiod_table_columns().size());
                row.emplace_back(sp.beginning_date);
                row.emplace_back(sp.ending_date);
                for (size_t c = 2; c < subperiod_table_columns().size(); ++c)
                {
                    row.emplace_back(series[subperiod_table_columns()[c]](static_cast<Eigen::Index>(t)));
                }
                subperiod_table_.add_row(std::move(row));
            }
        }

        void Attribution::calculate_overall(const EqualizedPanels &p, const EqualizedPanels &b)
        {
            const double p_overall = portfolio_.overall_return();
            const double b_overall = benchmark_.overall_return();
            const size_t last = subperiod_table_.num_rows() - 1;

            // Overall row: sum of the subperiod table with overrides.
            std::vector<Cell> row;
            for (Column column : subperiod_table_columns())
            {
                switch (column)
                {
                case Column::BEGINNING_DATE:
                    row.emplace_back(beginning_date());
                    break;
                case Column::ENDING_DATE:
                    row.emplace_back(ending_date());
                    break;
                case Column::PORTFOLIO_RETURN:
                    row.emplace_back(p_overall);
                    break;
                case Column::BENCHMARK_RETURN:
                    row.emplace_back(b_overall);
                    break;
                case Column::ACTIVE_RETURN:
                    row.emplace_back(p_overall - b_overall);
                    break;
                default:
                    if (is_simple_column(column))
                    {
                        row.emplace_back(NOT_APPLICABLE);
                    }
                    else if (is_cumulative_column(column))
                    {
                        row.emplace_back(subperiod_table_.number(last, column));
                    }
                    else
                    {
                        row.emplace_back(subperiod_table_.numeric_column(column).sum());
                    }
                    break;
                }
            }
            overall_table_ = Table(subperiod_table_columns());
            overall_table_.add_row(std::move(row));

            // Per-item overall values
            overall_assets_[Column::PORTFOLIO_RETURN] = p.overall_returns;
            overall_assets_[Column::BENCHMARK_RETURN] = b.overall_returns;
            overall_assets_[Column::ACTIVE_RETURN] = p.overall_returns - b.overall_returns;
            overall_assets_[Column::PORTFOLIO_WEIGHT] = p.overall_weights;
            overall_assets_[Column::BENCHMARK_WEIGHT] = b.overall_weights;
            overall_assets_[Column::ACTIVE_WEIGHT] = p.overall_weights - b.overall_weights;

            const Eigen::Index num_items = static_cast<Eigen::Index>(identifiers_.size());
            for (Column column : asset_panel_columns())
            {
                if (is_simple_column(column))
                {
                    overall_assets_[column] = Eigen::VectorXd::Constant(num_items, NOT_APPLICABLE);
                }
                else if (is_smoothed_column(column))
                {
                    overall_assets_[column] = panels_[column].colwise().sum().transpose();
                }
            }
        }

        // ===================================================================
        // View Materializer
        // ===================================================================

        Table Attribution::build_view(View view) const
        {
            switch (view)
            {
            case View::CUMULATIVE_ATTRIBUTION:
                return cumulative_attribution_view();
            case View::OVERALL_ATTRIBUTION:
                return overall_attribution_view();
            case View::SUBPERIOD_ATTRIBUTION:
                return subperiod_attribution_view();
            case View::SUBPERIOD_SUMMARY:
                return subperiod_summary_view();
            }
            throw std::invalid_argument("Attribution: unknown view");
        }

        Cell Attribution::identifier_cell(std::size_t asset) const
        {
            return Cell(core::to_upper(identifiers_[asset]));
        }

        Cell Attribution::name_cell(std::size_t asset) const
        {
            std::string item_name = classification_.name_for(identifiers_[asset]);
            return item_name.empty() ? Cell() : Cell(item_name);
        }

        Table Attribution::subperiod_attribution_view() const
        {
            static const std::vector<Column> VALUE_COLUMNS = {
                Column::PORTFOLIO_RETURN, Column::PORTFOLIO_WEIGHT, Column::PORTFOLIO_CONTRIB_SIMPLE,
                Column::BENCHMARK_RETURN, Column::BENCHMARK_WEIGHT, Column::BENCHMARK_CONTRIB_SIMPLE,
                Column::ACTIVE_RETURN, Column::ACTIVE_WEIGHT, Column::ACTIVE_CONTRIB_SIMPLE,
                Column::ALLOCATION_EFFECT_SIMPLE, Column::SELECTION_EFFECT_SIMPLE, Column::TOTAL_EFFECT_SIMPLE};

            std::vector<Column> columns = {Column::BEGINNING_DATE, Column::ENDING_DATE,
                                           Column::CLASSIFICATION_IDENTIFIER, Column::CLASSIFICATION_NAME};
            columns.insert(columns.end(), VALUE_COLUMNS.begin(), VALUE_COLUMNS.end());

            Table table(columns);
            for (size_t t = 0; t < portfolio_.num_subperiods(); ++t)
            {
                const auto &sp = subperiods()[t];
                for (size_t asset = 0; asset < identifiers_.size(); ++asset)
                {
                    std::vector<Cell> row = {Cell(sp.beginning_date), Cell(sp.ending_date),
                                             identifier_cell(asset), name_cell(asset)};
                    for (Column column : VALUE_COLUMNS)
                    {
                        row.emplace_back(asset_panel(column)(static_cast<Eigen::Index>(t),
                                                             static_cast<Eigen::Index>(asset)));
                    }
                    table.add_row(std::move(row));
                }
            }
            return table;
        }

        Table Attribution::overall_attribution_view() const
        {
            static const std::vector<Column> VALUE_COLUMNS = {
                Column::PORTFOLIO_RETURN, Column::PORTFOLIO_WEIGHT, Column::PORTFOLIO_CONTRIB_SMOOTHED,
                Column::BENCHMARK_RETURN, Column::BENCHMARK_WEIGHT, Column::BENCHMARK_CONTRIB_SMOOTHED,
                Column::ACTIVE_RETURN, Column::ACTIVE_WEIGHT, Column::ACTIVE_CONTRIB_SMOOTHED,
                Column::ALLOCATION_EFFECT_SMOOTHED, Column::SELECTION_EFFECT_SMOOTHED, Column::TOTAL_EFFECT_SMOOTHED};

            std::vector<Column> columns = {Column::CLASSIFICATION_IDENTIFIER, Column::CLASSIFICATION_NAME};
            columns.insert(columns.end(), VALUE_COLUMNS.begin(), VALUE_COLUMNS.end());

            Table table(columns);
            for (size_t asset = 0; asset < identifiers_.size(); ++asset)
            {
                std::vector<Cell> row = {identifier_cell(asset), name_cell(asset)};
                for (Column column : VALUE_COLUMNS)
                {
                    row.emplace_back(overall_asset_values(column)(static_cast<Eigen::Index>(asset)));
                }
                table.add_row(std::move(row));
            }

            // Total row
            std::vector<Cell> total = {Cell(), Cell(std::string("Total"))};
            for (Column column : VALUE_COLUMNS)
            {
                switch (column)
                {
                case Column::PORTFOLIO_RETURN:
                    total.emplace_back(portfolio_.overall_return());
                    break;
                case Column::BENCHMARK_RETURN:
                    total.emplace_back(benchmark_.overall_return());
                    break;
                case Column::ACTIVE_RETURN:
                    total.emplace_back(portfolio_.overall_return() - benchmark_.overall_return());
                    break;
                default:
                    total.emplace_back(overall_asset_values(column).sum());
                    break;
                }
            }
            table.add_row(std::move(total));
            return table;
        }

        Table Attribution::cumulative_attribution_view() const
        {
            const std::vector<Column> columns = {
                Column::BEGINNING_DATE, Column::ENDING_DATE,
                Column::PORTFOLIO_RETURN, Column::BENCHMARK_RETURN, Column::ACTIVE_RETURN,
                Column::CUMULATIVE_PORTFOLIO_RETURN, Column::CUMULATIVE_BENCHMARK_RETURN, Column::CUMULATIVE_ACTIVE_RETURN,
                Column::PORTFOLIO_CONTRIB_SMOOTHED, Column::BENCHMARK_CONTRIB_SMOOTHED, Column::ACTIVE_CONTRIB_SMOOTHED,
                Column::CUMULATIVE_PORTFOLIO_CONTRIB, Column::CUMULATIVE_BENCHMARK_CONTRIB, Column::CUMULATIVE_ACTIVE_CONTRIB,
                Column::ALLOCATION_EFFECT_SMOOTHED, Column::SELECTION_EFFECT_SMOOTHED, Column::TOTAL_EFFECT_SMOOTHED,
                Column::CUMULATIVE_ALLOCATION_EFFECT, Column::CUMULATIVE_SELECTION_EFFECT, Column::CUMULATIVE_TOTAL_EFFECT};

            Table table(columns);
            for (size_t t = 0; t < subperiod_table_.num_rows(); ++t)
            {
                table.add_row(project_row(subperiod_table_, t, columns));
            }

            // Total row: the overall row with date labels.
            std::vector<Cell> total = project_row(overall_table_, 0, columns);
            total[0] = Cell();
            total[1] = Cell(std::string("Total"));
            table.add_row(std::move(total));
            return table;
        }

        Table Attribution::subperiod_summary_view() const
        {
            const std::vector<Column> columns = {
                Column::BEGINNING_DATE, Column::ENDING_DATE,
                Column::PORTFOLIO_RETURN, Column::BENCHMARK_RETURN, Column::ACTIVE_RETURN,
                Column::PORTFOLIO_CONTRIB_SIMPLE, Column::BENCHMARK_CONTRIB_SIMPLE, Column::ACTIVE_CONTRIB_SIMPLE,
                Column::ALLOCATION_EFFECT_SIMPLE, Column::SELECTION_EFFECT_SIMPLE, Column::TOTAL_EFFECT_SIMPLE};

            Table table(columns);
            for (size_t t = 0; t < subperiod_table_.num_rows(); ++t)
            {
                table.add_row(project_row(subperiod_table_, t, columns));
            }
            return table;
        }

    } // namespace analytics
} // namespace perfattr
