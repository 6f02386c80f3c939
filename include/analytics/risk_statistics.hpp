/**
 * @file risk_statistics.hpp
 * @brief Ex-post risk statistics of a portfolio return series against a benchmark.
 *
 * Computes 24 statistics grouped into five categories. Rates given as
 * annual values (minimum acceptable return, risk-free rate) are converted
 * to the series' frequency by geometric de-annualization:
 *
 *   r_periodic = (1 + r_annual)^(1 / periods_per_year) - 1
 *
 * Annualized statistics multiply the periodic value by sqrt(periods_per_year),
 * and are NaN when the series is shorter than one year.
 *
 * Moments are population moments (divide by n) except for the covariance
 * in beta, which is the sample covariance (divide by n - 1).
 */

#ifndef PERFATTR_ANALYTICS_RISK_STATISTICS_HPP
#define PERFATTR_ANALYTICS_RISK_STATISTICS_HPP

#include "core/config.hpp"
#include "core/frequency.hpp"
#include "data/performance.hpp"

#include <Eigen/Dense>

#include <string>
#include <vector>

namespace perfattr
{
    namespace analytics
    {

        /**
         * @enum Statistic
         * @brief Statistics in display order.
         */
        enum class Statistic
        {
            // Absolute Risk
            RANGE,
            STANDARD_DEVIATION,
            ANNUALIZED_STANDARD_DEVIATION,
            // Downside Risk
            DOWNSIDE_PROBABILITY,
            EXPECTED_DOWNSIDE_VALUE,
            DOWNSIDE_DEVIATION,
            ANNUALIZED_DOWNSIDE_DEVIATION,
            VALUE_AT_RISK,
            // Benchmark-Relative Risk
            CORRELATION,
            R_SQUARED,
            TRACKING_ERROR,
            ANNUALIZED_TRACKING_ERROR,
            // Risk-Adjusted Performance
            SHARPE_RATIO,
            ANNUALIZED_SHARPE_RATIO,
            SORTINO_RATIO,
            ANNUALIZED_SORTINO_RATIO,
            INFORMATION_RATIO,
            M_SQUARED,
            TREYNOR_RATIO,
            // Regression
            BETA,
            ALPHA,
            ANNUALIZED_ALPHA,
            JENSENS_ALPHA,
            ANNUALIZED_JENSENS_ALPHA
        };

        /** @brief Display name, e.g. "Annualized Tracking Error". */
        const char *statistic_name(Statistic statistic);

        /** @brief Category, e.g. "Downside Risk". */
        const char *statistic_category(Statistic statistic);

        /** @brief All statistics in display order. */
        const std::vector<Statistic> &all_statistics();

        /**
         * @struct StatisticRow
         * @brief One row of the statistics table.
         */
        struct StatisticRow
        {
            Statistic statistic;
            std::string name;
            double portfolio;  ///< Value for the portfolio series
            double benchmark;  ///< Value for the benchmark series, NaN for portfolio-only statistics
            double difference; ///< portfolio - benchmark
            std::string category;
        };

        /**
         * @class RiskStatistics
         * @brief Computes the statistics table for a pair of return series.
         *
         * Usage:
         * @code
         *   RiskStatistics stats(portfolio_returns, benchmark_returns,
         *                        core::Frequency::MONTHLY, core::RiskParameters{});
         *   double te = stats.portfolio_value(Statistic::ANNUALIZED_TRACKING_ERROR);
         * @endcode
         */
        class RiskStatistics
        {
        public:
            // ---------------------------------------------------------------
            // Constructors
            // ---------------------------------------------------------------

            /**
             * @brief Construct from two periodic return series.
             * @param portfolio_returns Portfolio return per period.
             * @param benchmark_returns Benchmark return per period.
             * @param frequency Frequency of both series.
             * @param parameters Annual MAR, risk-free rate and VaR settings.
             * @param portfolio_name Display name of the portfolio.
             * @param benchmark_name Display name of the benchmark.
             * @throws PerfAttrError (InvalidFrequencyForRiskStatistics) if frequency is periodic.
             * @throws PerfAttrError (ReturnSeriesLengthMismatch) if the lengths differ.
             * @throws PerfAttrError (InsufficientQuantityOfReturns) if fewer than 2 returns.
             * @throws PerfAttrError (NaNInReturnSeries) if either series holds NaN.
             * @throws std::invalid_argument if the confidence level is not in (0, 1).
             */
            RiskStatistics(const Eigen::VectorXd &portfolio_returns,
                           const Eigen::VectorXd &benchmark_returns,
                           core::Frequency frequency,
                           const core::RiskParameters &parameters = core::RiskParameters(),
                           std::string portfolio_name = "Portfolio",
                           std::string benchmark_name = "Benchmark");

            /**
             * @brief Construct from the total returns of two performances.
             *
             * Uses the portfolio's frequency and both performances' names.
             */
            RiskStatistics(const data::Performance &portfolio,
                           const data::Performance &benchmark,
                           const core::RiskParameters &parameters = core::RiskParameters());

            // ---------------------------------------------------------------
            // Results
            // ---------------------------------------------------------------

            /** @brief All rows in display order. */
            const std::vector<StatisticRow> &rows() const { return rows_; }

            /** @brief Row of a statistic. */
            const StatisticRow &row(Statistic statistic) const;

            double portfolio_value(Statistic statistic) const { return row(statistic).portfolio; }
            double benchmark_value(Statistic statistic) const { return row(statistic).benchmark; }
            double difference(Statistic statistic) const { return row(statistic).difference; }

            // ---------------------------------------------------------------
            // Inputs
            // ---------------------------------------------------------------

            const std::string &portfolio_name() const { return portfolio_name_; }
            const std::string &benchmark_name() const { return benchmark_name_; }
            core::Frequency frequency() const { return frequency_; }
            int num_returns() const { return static_cast<int>(portfolio_.size()); }

            /** @brief Minimum acceptable return per period. */
            double periodic_minimum_acceptable_return() const { return mar_; }

            /** @brief Risk-free rate per period. */
            double periodic_risk_free_rate() const { return rfr_; }

            /** @brief sqrt(periods per year), or NaN for series shorter than a year. */
            double annualization_coefficient() const { return annualizer_; }

        private:
            void validate() const;
            void calculate();
            void add_row(Statistic statistic, double portfolio, double benchmark);

            // Single-series statistics
            double downside_deviation(const Eigen::VectorXd &r) const;
            double downside_probability(const Eigen::VectorXd &r) const;
            double expected_downside_value(const Eigen::VectorXd &r) const;
            double value_at_risk(const Eigen::VectorXd &r) const;
            double sharpe_ratio(const Eigen::VectorXd &r) const;
            double sortino_ratio(const Eigen::VectorXd &r) const;

            Eigen::VectorXd portfolio_;
            Eigen::VectorXd benchmark_;
            core::Frequency frequency_;
            core::RiskParameters parameters_;
            std::string portfolio_name_;
            std::string benchmark_name_;

            double mar_;
            double rfr_;
            double annualizer_;

            std::vector<StatisticRow> rows_;
        };

    } // namespace analytics
} // namespace perfattr

#endif // PERFATTR_ANALYTICS_RISK_STATISTICS_HPP
