/**
 * @file attribution.hpp
 * @brief Brinson-Fachler performance attribution with Carino linking.
 *
 * Decomposes the difference between portfolio and benchmark returns into
 * allocation and selection effects per classification item, for every
 * subperiod and for the overall period. Multi-period linking uses the
 * Carino coefficients so that smoothed subperiod effects add up to the
 * compounded active return.
 *
 * Attribution model, per subperiod t and item i:
 *   Allocation = (rc_b,i - R_b) * (w_p,i - w_b,i)
 *   Selection  = w_p,i * (rc_p,i - rc_b,i)
 *   Total      = Allocation + Selection
 *
 * where rc are consolidated item returns, w beginning weights and R_b the
 * benchmark total return. Smoothed effects are simple effects times k_t.
 */

#ifndef PERFATTR_ANALYTICS_ATTRIBUTION_HPP
#define PERFATTR_ANALYTICS_ATTRIBUTION_HPP

#include "analytics/columns.hpp"
#include "analytics/table.hpp"
#include "data/classification.hpp"
#include "data/performance.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace perfattr
{
    namespace analytics
    {

        /**
         * @enum View
         * @brief Named projections of an attribution.
         */
        enum class View
        {
            CUMULATIVE_ATTRIBUTION, ///< Portfolio-level subperiods with running totals, plus a total row
            OVERALL_ATTRIBUTION,    ///< One row per item for the whole period, plus a total row
            SUBPERIOD_ATTRIBUTION,  ///< One row per (subperiod, item)
            SUBPERIOD_SUMMARY       ///< Portfolio-level simple values per subperiod
        };

        /** @brief Display title, e.g. "Sub-Period Attribution". */
        const char *view_name(View view);

        /**
         * @struct EqualizedPanels
         * @brief One side's per-asset panels re-laid onto a shared identifier set.
         */
        struct EqualizedPanels
        {
            Eigen::MatrixXd returns;
            Eigen::MatrixXd weights;
            Eigen::MatrixXd contributions;
            Eigen::MatrixXd consolidated_returns;
            Eigen::VectorXd overall_returns; ///< Compounded consolidated return per identifier
            Eigen::VectorXd overall_weights; ///< Mean weight per identifier
        };

        /**
         * @brief Sorted union of both sides' identifiers.
         */
        std::vector<std::string> identifier_union(const data::Performance &portfolio,
                                                  const data::Performance &benchmark);

        /**
         * @brief Re-lay a performance onto the given identifiers.
         *
         * Identifiers the performance lacks get zero return, weight,
         * contribution and consolidated return (and zero overall values).
         */
        EqualizedPanels equalize(const data::Performance &performance,
                                 const std::vector<std::string> &identifiers);

        /**
         * @class Attribution
         * @brief Portfolio versus benchmark attribution over shared subperiods.
         *
         * Construction computes the full subperiod table, the per-item panels
         * and the overall row. Views are materialized on first request and
         * cached.
         *
         * Usage:
         * @code
         *   Attribution attribution(portfolio, benchmark,
         *                           Classification::from_csv("Gics Sector", "sectors.csv"));
         *   const Table &overall = attribution.view(View::OVERALL_ATTRIBUTION);
         *   Auditor::audit(attribution);
         * @endcode
         *
         * Thread safety: read-only after construction apart from the view cache.
         * Concurrent first requests for a view may each build it; the first
         * insert wins and every caller gets the cached table.
         */
        class Attribution
        {
        public:
            // ---------------------------------------------------------------
            // Constructors
            // ---------------------------------------------------------------

            /**
             * @brief Attribute by the given classification.
             * @throws PerfAttrError (ReturnSeriesLengthMismatch) if the sides have
             *         different numbers of subperiods.
             * @throws PerfAttrError (MismatchedSubperiods) if subperiod bounds differ.
             * @throws PerfAttrError (UndefinedReturn) if a return is <= -100%.
             */
            Attribution(data::Performance portfolio,
                        data::Performance benchmark,
                        data::Classification classification);

            /**
             * @brief Attribute by the classification the performances carry.
             * @throws PerfAttrError (MissingClassificationName) if the sides disagree.
             */
            Attribution(data::Performance portfolio, data::Performance benchmark);

            // ---------------------------------------------------------------
            // Inputs
            // ---------------------------------------------------------------

            const data::Performance &portfolio() const { return portfolio_; }
            const data::Performance &benchmark() const { return benchmark_; }
            const data::Classification &classification() const { return classification_; }

            /** @brief Equalized identifiers, sorted. */
            const std::vector<std::string> &identifiers() const { return identifiers_; }

            const std::vector<data::Subperiod> &subperiods() const { return portfolio_.subperiods(); }
            const std::string &beginning_date() const { return portfolio_.beginning_date(); }
            const std::string &ending_date() const { return portfolio_.ending_date(); }
            core::Frequency frequency() const { return portfolio_.frequency(); }

            // ---------------------------------------------------------------
            // Computed tables
            // ---------------------------------------------------------------

            /** @brief Carino coefficient k_t of each subperiod. */
            const Eigen::VectorXd &attribution_linking_coefficients() const { return k_; }

            /**
             * @brief Portfolio-level table, one row per subperiod.
             *
             * Columns: dates, returns, simple and smoothed contributions,
             * simple and smoothed effects, cumulative columns.
             */
            const Table &subperiod_table() const { return subperiod_table_; }

            /**
             * @brief Overall row with the same columns as subperiod_table().
             *
             * Simple columns are NaN; cumulative columns hold the last subperiod.
             */
            const Table &overall_table() const { return overall_table_; }

            /** @brief Columns held per item, see asset_panel(). */
            std::vector<Column> asset_columns() const;

            /**
             * @brief Per-item panel (subperiods x identifiers) of a column.
             * @throws std::out_of_range if the column is not held per item.
             */
            const Eigen::MatrixXd &asset_panel(Column column) const;

            /**
             * @brief Per-item overall values of a column.
             *
             * Returns are compounded consolidated returns, weights are mean
             * weights, smoothed columns are vertical sums and simple columns NaN.
             *
             * @throws std::out_of_range if the column is not held per item.
             */
            const Eigen::VectorXd &overall_asset_values(Column column) const;

            // ---------------------------------------------------------------
            // Views
            // ---------------------------------------------------------------

            /**
             * @brief Materialize (once) and return a view.
             */
            const Table &view(View view) const;

            /**
             * @brief View checked against a renderer's row limit.
             * @throws PerfAttrError (TooManyRowsForRender) if the view has max_rows rows or more.
             */
            const Table &view_for_rendering(View view, std::size_t max_rows = 500) const;

            /**
             * @brief Title and subtitle for a renderer.
             * @return ("<portfolio> vs <benchmark>",
             *          "<view> by <classification>: <frequency> from <begin> to <end>")
             */
            std::pair<std::string, std::string> title_lines(View view) const;

        private:
            // ---------------------------------------------------------------
            // Private helpers
            // ---------------------------------------------------------------

            void check_subperiods() const;
            void warn_unnamed_items() const;
            void calculate_attribution(const EqualizedPanels &p, const EqualizedPanels &b);
            void calculate_overall(const EqualizedPanels &p, const EqualizedPanels &b);

            Table build_view(View view) const;
            Table subperiod_attribution_view() const;
            Table overall_attribution_view() const;
            Table cumulative_attribution_view() const;
            Table subperiod_summary_view() const;

            Cell identifier_cell(std::size_t asset) const;
            Cell name_cell(std::size_t asset) const;

            // ---------------------------------------------------------------
            // Member variables
            // ---------------------------------------------------------------

            data::Performance portfolio_;
            data::Performance benchmark_;
            data::Classification classification_;

            std::vector<std::string> identifiers_;

            Eigen::VectorXd k_;
            std::map<Column, Eigen::MatrixXd> panels_;
            std::map<Column, Eigen::VectorXd> overall_assets_;

            Table subperiod_table_;
            Table overall_table_;

            mutable std::mutex views_mutex_;
            mutable std::map<View, Table> views_;
        };

    } // namespace analytics
} // namespace perfattr

#endif // PERFATTR_ANALYTICS_ATTRIBUTION_HPP
