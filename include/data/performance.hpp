/**
 * @file performance.hpp
 * @brief Consolidated per-asset returns and weights of one portfolio or benchmark.
 *
 * A Performance is the input contract of the attribution and risk engines.
 * It holds, for a run of contiguous reporting subperiods, per-asset panels
 * (subperiods x assets) of returns, beginning weights, contributions and
 * consolidated returns, together with the total return of each subperiod.
 * Consolidation of raw daily data into those subperiods happens upstream.
 */

#ifndef PERFATTR_DATA_PERFORMANCE_HPP
#define PERFATTR_DATA_PERFORMANCE_HPP

#include "core/frequency.hpp"

#include <Eigen/Dense>

#include <map>
#include <string>
#include <vector>

namespace perfattr
{
    namespace data
    {

        /**
         * @struct Subperiod
         * @brief Reporting subperiod bounded by two ISO dates.
         */
        struct Subperiod
        {
            std::string beginning_date; ///< YYYY-MM-DD
            std::string ending_date;    ///< YYYY-MM-DD

            bool operator==(const Subperiod &other) const
            {
                return beginning_date == other.beginning_date && ending_date == other.ending_date;
            }
            bool operator!=(const Subperiod &other) const { return !(*this == other); }
        };

        /**
         * @struct PerformanceData
         * @brief Raw fields supplied by the performance provider.
         *
         * Every panel is subperiods x assets, with columns in the order of
         * identifiers.
         */
        struct PerformanceData
        {
            std::string name;                ///< Display name, e.g. "Growth Fund"
            std::string classification_name; ///< Classification of the identifiers; may be empty
            core::Frequency frequency = core::Frequency::MONTHLY;

            std::vector<Subperiod> subperiods;
            std::vector<std::string> identifiers;

            Eigen::MatrixXd returns;              ///< Asset returns
            Eigen::MatrixXd weights;              ///< Beginning-of-subperiod weights
            Eigen::MatrixXd contributions;        ///< Asset contributions to the total return
            Eigen::MatrixXd consolidated_returns; ///< Returns re-based across the consolidated subperiod
            Eigen::VectorXd total_returns;        ///< Total return per subperiod

            bool subperiods_consolidated = false; ///< True if subperiods were built from finer data

            std::map<std::string, std::string> classification_items; ///< identifier -> display name
        };

        /**
         * @class Performance
         * @brief Validated, read-only performance of one side of an attribution.
         *
         * Identifiers are normalized to lower case. Overall quantities are
         * derived once at construction.
         *
         * Usage:
         * @code
         *   auto perf = Performance::from_weights_and_returns(
         *       "Growth Fund", Frequency::MONTHLY, subperiods, {"AAPL", "MSFT"},
         *       weights, returns);
         *   double r = perf.overall_return();
         * @endcode
         *
         * Thread safety: immutable after construction.
         */
        class Performance
        {
        public:
            /**
             * @brief Validate and take ownership of the provider data.
             * @throws PerfAttrError (NoReportableDates) if there are no subperiods.
             * @throws PerfAttrError (MalformedDateString) for unparsable dates.
             * @throws PerfAttrError (DiscontinuousSubperiods) for gaps, overlaps or inverted bounds.
             * @throws std::invalid_argument if panel shapes disagree or identifiers repeat.
             * @throws PerfAttrError (NaNInReturnSeries) if any value is NaN.
             * @throws PerfAttrError (WeightsDoNotSumToOne) if a subperiod's weights do not sum to 1.
             * @throws PerfAttrError (UndefinedReturn) if a total return is <= -100%.
             */
            explicit Performance(PerformanceData data);

            /**
             * @brief Build an unconsolidated performance from weights and returns alone.
             *
             * Contribution = weight x return, total return = sum of contributions,
             * consolidated return = return.
             */
            static Performance from_weights_and_returns(
                const std::string &name,
                core::Frequency frequency,
                const std::vector<Subperiod> &subperiods,
                const std::vector<std::string> &identifiers,
                const Eigen::MatrixXd &weights,
                const Eigen::MatrixXd &returns,
                const std::string &classification_name = "",
                const std::map<std::string, std::string> &classification_items = {});

            // ---------------------------------------------------------------
            // Provider fields
            // ---------------------------------------------------------------

            const std::string &name() const { return data_.name; }
            const std::string &classification_name() const { return data_.classification_name; }
            core::Frequency frequency() const { return data_.frequency; }
            const std::vector<Subperiod> &subperiods() const { return data_.subperiods; }
            const std::vector<std::string> &identifiers() const { return data_.identifiers; }
            const Eigen::MatrixXd &returns() const { return data_.returns; }
            const Eigen::MatrixXd &weights() const { return data_.weights; }
            const Eigen::MatrixXd &contributions() const { return data_.contributions; }
            const Eigen::MatrixXd &consolidated_returns() const { return data_.consolidated_returns; }
            const Eigen::VectorXd &total_returns() const { return data_.total_returns; }
            bool subperiods_consolidated() const { return data_.subperiods_consolidated; }
            const std::map<std::string, std::string> &classification_items() const
            {
                return data_.classification_items;
            }

            size_t num_subperiods() const { return data_.subperiods.size(); }
            size_t num_assets() const { return data_.identifiers.size(); }

            const std::string &beginning_date() const { return data_.subperiods.front().beginning_date; }
            const std::string &ending_date() const { return data_.subperiods.back().ending_date; }

            /**
             * @brief Column index of an identifier (case-insensitive).
             * @return Index, or -1 if the identifier is not present.
             */
            int asset_index(const std::string &identifier) const;

            // ---------------------------------------------------------------
            // Derived quantities
            // ---------------------------------------------------------------

            /** @brief Compounded total return over all subperiods. */
            double overall_return() const { return overall_return_; }

            /** @brief Logarithmic linking coefficient of each subperiod's total return. */
            const Eigen::VectorXd &linking_coefficients() const { return linking_coefficients_; }

            /** @brief Calendar days in each subperiod. */
            const std::vector<long> &quantity_of_days() const { return quantity_of_days_; }

            /** @brief Compounded consolidated return of each asset. */
            const Eigen::VectorXd &overall_asset_returns() const { return overall_asset_returns_; }

            /** @brief Mean subperiod weight of each asset. */
            const Eigen::VectorXd &overall_asset_weights() const { return overall_asset_weights_; }

        private:
            void validate_subperiods() const;
            void validate_shapes() const;
            void validate_values() const;
            void normalize_identifiers();
            void compute_derived();

            PerformanceData data_;
            std::map<std::string, int> identifier_index_;

            double overall_return_ = 0.0;
            Eigen::VectorXd linking_coefficients_;
            std::vector<long> quantity_of_days_;
            Eigen::VectorXd overall_asset_returns_;
            Eigen::VectorXd overall_asset_weights_;
        };

    } // namespace data
} // namespace perfattr

#endif // PERFATTR_DATA_PERFORMANCE_HPP
