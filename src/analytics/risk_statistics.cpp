/**
 * @file risk_statistics.cpp
 * @brief Implementation of RiskStatistics.
 */

#include "analytics/risk_statistics.hpp"
#include "core/errors.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace perfattr
{
    namespace analytics
    {

        // ===================================================================
        // Anonymous namespace: math helpers
        // ===================================================================

        namespace
        {

            const double NaN = std::numeric_limits<double>::quiet_NaN();
            const double INF = std::numeric_limits<double>::infinity();

            /**
             * @brief Rational approximation of the inverse normal CDF (probit).
             *
             * Acklam's coefficients with a tail branch below 0.02425, accurate
             * to about 1e-9 for p in [1e-8, 1 - 1e-8].
             */
            double inverse_normal_cdf(double p)
            {
                static const double a[] = {
                    -3.969683028665376e+01, 2.209460984245205e+02,
                    -2.759285104469687e+02, 1.383577518672690e+02,
                    -3.066479806614716e+01, 2.506628277459239e+00};
                static const double b[] = {
                    -5.447609879822406e+01, 1.615858368580409e+02,
                    -1.556989798598866e+02, 6.680131188771972e+01,
                    -1.328068155288572e+01};
                static const double c[] = {
                    -7.784894002430293e-03, -3.223964580411365e-01,
                    -2.400758277161838e+00, -2.549732539343734e+00,
                    4.374664141464968e+00, 2.938163982698783e+00};
                static const double d[] = {
                    7.784695709041462e-03, 3.224671290700398e-01,
                    2.445134137142996e+00, 3.754408661907416e+00};

                static const double P_LOW = 0.02425;
                static const double P_HIGH = 1.0 - P_LOW;

                if (p < P_LOW)
                {
                    double q = std::sqrt(-2.0 * std::log(p));
                    return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
                           ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
                }
                if (p > P_HIGH)
                {
                    double q = std::sqrt(-2.0 * std::log(1.0 - p));
                    return -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
                           ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
                }

                double q = p - 0.5;
                double r = q * q;
                return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
                       (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
            }

            double deannualize(double annual, int periods)
            {
                return std::pow(1.0 + annual, 1.0 / static_cast<double>(periods)) - 1.0;
            }

            /// Population standard deviation.
            double std_dev(const Eigen::VectorXd &x)
            {
                if (x.size() == 0)
                {
                    return NaN;
                }
                Eigen::VectorXd centered = x.array() - x.mean();
                return std::sqrt(centered.squaredNorm() / static_cast<double>(x.size()));
            }

            double correlation(const Eigen::VectorXd &x, const Eigen::VectorXd &y)
            {
                Eigen::VectorXd dx = x.array() - x.mean();
                Eigen::VectorXd dy = y.array() - y.mean();
                return dx.dot(dy) / std::sqrt(dx.squaredNorm() * dy.squaredNorm());
            }

            /// Sample covariance over population variance of the benchmark.
            double beta(const Eigen::VectorXd &p, const Eigen::VectorXd &b)
            {
                double n = static_cast<double>(p.size());
                Eigen::VectorXd dp = p.array() - p.mean();
                Eigen::VectorXd db = b.array() - b.mean();
                double covariance = dp.dot(db) / (n - 1.0);
                double variance = db.squaredNorm() / n;
                return covariance / variance;
            }

        } // anonymous namespace

        // ===================================================================
        // Statistic names
        // ===================================================================

        const char *statistic_name(Statistic statistic)
        {
            switch (statistic)
            {
            case Statistic::RANGE:
                return "Range";
            case Statistic::STANDARD_DEVIATION:
                return "Standard Deviation";
            case Statistic::ANNUALIZED_STANDARD_DEVIATION:
                return "Annualized Standard Deviation";
            case Statistic::DOWNSIDE_PROBABILITY:
                return "Downside Probability";
            case Statistic::EXPECTED_DOWNSIDE_VALUE:
                return "Expected Downside Value";
            case Statistic::DOWNSIDE_DEVIATION:
                return "Downside Deviation";
            case Statistic::ANNUALIZED_DOWNSIDE_DEVIATION:
                return "Annualized Downside Deviation";
            case Statistic::VALUE_AT_RISK:
                return "Value At Risk";
            case Statistic::CORRELATION:
                return "Correlation";
            case Statistic::R_SQUARED:
                return "R-Squared";
            case Statistic::TRACKING_ERROR:
                return "Tracking Error";
            case Statistic::ANNUALIZED_TRACKING_ERROR:
                return "Annualized Tracking Error";
            case Statistic::SHARPE_RATIO:
                return "Sharpe Ratio";
            case Statistic::ANNUALIZED_SHARPE_RATIO:
                return "Annualized Sharpe Ratio";
            case Statistic::SORTINO_RATIO:
                return "Sortino Ratio";
            case Statistic::ANNUALIZED_SORTINO_RATIO:
                return "Annualized Sortino Ratio";
            case Statistic::INFORMATION_RATIO:
                return "Information Ratio";
            case Statistic::M_SQUARED:
                return "M-Squared";
            case Statistic::TREYNOR_RATIO:
                return "Treynor Ratio";
            case Statistic::BETA:
                return "Beta";
            case Statistic::ALPHA:
                return "Alpha";
            case Statistic::ANNUALIZED_ALPHA:
                return "Annualized Alpha";
            case Statistic::JENSENS_ALPHA:
                return "Jensen's Alpha";
            case Statistic::ANNUALIZED_JENSENS_ALPHA:
                return "Annualized Jensen's Alpha";
            }
            return "Unknown";
        }

        const char *statistic_category(Statistic statistic)
        {
            switch (statistic)
            {
            case Statistic::RANGE:
            case Statistic::STANDARD_DEVIATION:
            case Statistic::ANNUALIZED_STANDARD_DEVIATION:
                return "Absolute Risk";
            case Statistic::DOWNSIDE_PROBABILITY:
            case Statistic::EXPECTED_DOWNSIDE_VALUE:
            case Statistic::DOWNSIDE_DEVIATION:
            case Statistic::ANNUALIZED_DOWNSIDE_DEVIATION:
            case Statistic::VALUE_AT_RISK:
                return "Downside Risk";
            case Statistic::CORRELATION:
            case Statistic::R_SQUARED:
            case Statistic::TRACKING_ERROR:
            case Statistic::ANNUALIZED_TRACKING_ERROR:
                return "Benchmark-Relative Risk";
            case Statistic::SHARPE_RATIO:
            case Statistic::ANNUALIZED_SHARPE_RATIO:
            case Statistic::SORTINO_RATIO:
            case Statistic::ANNUALIZED_SORTINO_RATIO:
            case Statistic::INFORMATION_RATIO:
            case Statistic::M_SQUARED:
            case Statistic::TREYNOR_RATIO:
                return "Risk-Adjusted Performance";
            case Statistic::BETA:
            case Statistic::ALPHA:
            case Statistic::ANNUALIZED_ALPHA:
            case Statistic::JENSENS_ALPHA:
            case Statistic::ANNUALIZED_JENSENS_ALPHA:
                return "Regression";
            }
            return "Unknown";
        }

        const std::vector<Statistic> &all_statistics()
        {
            static const std::vector<Statistic> statistics = {
                Statistic::RANGE,
                Statistic::STANDARD_DEVIATION,
                Statistic::ANNUALIZED_STANDARD_DEVIATION,
                Statistic::DOWNSIDE_PROBABILITY,
                Statistic::EXPECTED_DOWNSIDE_VALUE,
                Statistic::DOWNSIDE_DEVIATION,
                Statistic::ANNUALIZED_DOWNSIDE_DEVIATION,
                Statistic::VALUE_AT_RISK,
                Statistic::CORRELATION,
                Statistic::R_SQUARED,
                Statistic::TRACKING_ERROR,
                Statistic::ANNUALIZED_TRACKING_ERROR,
                Statistic::SHARPE_RATIO,
                Statistic::ANNUALIZED_SHARPE_RATIO,
                Statistic::SORTINO_RATIO,
                Statistic::ANNUALIZED_SORTINO_RATIO,
                Statistic::INFORMATION_RATIO,
                Statistic::M_SQUARED,
                Statistic::TREYNOR_RATIO,
                Statistic::BETA,
                Statistic::ALPHA,
                Statistic::ANNUALIZED_ALPHA,
                Statistic::JENSENS_ALPHA,
                Statistic::ANNUALIZED_JENSENS_ALPHA};
            return statistics;
        }

        // ===================================================================
        // Constructors
        // ===================================================================

        RiskStatistics::RiskStatistics(const Eigen::VectorXd &portfolio_returns,
                                       const Eigen::VectorXd &benchmark_returns,
                                       core::Frequency frequency,
                                       const core::RiskParameters &parameters,
                                       std::string portfolio_name,
                                       std::string benchmark_name)
            : portfolio_(portfolio_returns), benchmark_(benchmark_returns), frequency_(frequency), parameters_(parameters), portfolio_name_(std::move(portfolio_name)), benchmark_name_(std::move(benchmark_name)), mar_(NaN), rfr_(NaN), annualizer_(NaN)
        {
            validate();
            calculate();
        }

        RiskStatistics::RiskStatistics(const data::Performance &portfolio,
                                       const data::Performance &benchmark,
                                       const core::RiskParameters &parameters)
            : RiskStatistics(portfolio.total_returns(), benchmark.total_returns(),
                             portfolio.frequency(), parameters, portfolio.name(), benchmark.name())
        {
        }

        // ===================================================================
        // Results
        // ===================================================================

        const StatisticRow &RiskStatistics::row(Statistic statistic) const
        {
            for (const auto &r : rows_)
            {
                if (r.statistic == statistic)
                {
                    return r;
                }
            }
            throw std::out_of_range(std::string("RiskStatistics: no row for '") +
                                    statistic_name(statistic) + "'");
        }

        // ===================================================================
        // Private helpers
        // ===================================================================

        void RiskStatistics::validate() const
        {
            // Throws for the periodic frequency.
            core::periods_per_year(frequency_);

            if (portfolio_.size() != benchmark_.size())
            {
                std::ostringstream oss;
                oss << "Portfolio '" << portfolio_name_ << "' has " << portfolio_.size()
                    << " returns, benchmark '" << benchmark_name_ << "' has " << benchmark_.size();
                throw core::PerfAttrError(core::ErrorCode::RETURN_SERIES_LENGTH_MISMATCH, oss.str());
            }

            if (portfolio_.size() < 2)
            {
                throw core::PerfAttrError(core::ErrorCode::INSUFFICIENT_QUANTITY_OF_RETURNS,
                                          "At least 2 returns are required, got " +
                                              std::to_string(portfolio_.size()));
            }

            if (portfolio_.hasNaN() || benchmark_.hasNaN())
            {
                throw core::PerfAttrError(core::ErrorCode::NAN_IN_RETURN_SERIES,
                                          "Return series of '" +
                                              (portfolio_.hasNaN() ? portfolio_name_ : benchmark_name_) +
                                              "' contains NaN");
            }

            if (parameters_.confidence_level <= 0.0 || parameters_.confidence_level >= 1.0)
            {
                throw std::invalid_argument("Confidence level must be in (0, 1), got: " +
                                            std::to_string(parameters_.confidence_level));
            }
        }

        void RiskStatistics::calculate()
        {
            const int periods = core::periods_per_year(frequency_);
            const Eigen::Index n = portfolio_.size();

            mar_ = deannualize(parameters_.annual_minimum_acceptable_return, periods);
            rfr_ = deannualize(parameters_.annual_risk_free_rate, periods);
            annualizer_ = n < periods ? NaN : std::sqrt(static_cast<double>(periods));

            // Absolute Risk
            double p_std = std_dev(portfolio_);
            double b_std = std_dev(benchmark_);
            add_row(Statistic::RANGE,
                    portfolio_.maxCoeff() - portfolio_.minCoeff(),
                    benchmark_.maxCoeff() - benchmark_.minCoeff());
            add_row(Statistic::STANDARD_DEVIATION, p_std, b_std);
            add_row(Statistic::ANNUALIZED_STANDARD_DEVIATION, annualizer_ * p_std, annualizer_ * b_std);

            // Downside Risk
            double p_dd = downside_deviation(portfolio_);
            double b_dd = downside_deviation(benchmark_);
            add_row(Statistic::DOWNSIDE_PROBABILITY,
                    downside_probability(portfolio_), downside_probability(benchmark_));
            add_row(Statistic::EXPECTED_DOWNSIDE_VALUE,
                    expected_downside_value(portfolio_), expected_downside_value(benchmark_));
            add_row(Statistic::DOWNSIDE_DEVIATION, p_dd, b_dd);
            add_row(Statistic::ANNUALIZED_DOWNSIDE_DEVIATION, annualizer_ * p_dd, annualizer_ * b_dd);
            add_row(Statistic::VALUE_AT_RISK, value_at_risk(portfolio_), value_at_risk(benchmark_));

            // Benchmark-Relative Risk
            Eigen::VectorXd active = portfolio_ - benchmark_;
            double corr = correlation(portfolio_, benchmark_);
            double tracking_error = std_dev(active);
            add_row(Statistic::CORRELATION, corr, NaN);
            add_row(Statistic::R_SQUARED, corr * corr, NaN);
            add_row(Statistic::TRACKING_ERROR, tracking_error, NaN);
            add_row(Statistic::ANNUALIZED_TRACKING_ERROR, annualizer_ * tracking_error, NaN);

            // Risk-Adjusted Performance
            double b_beta = beta(portfolio_, benchmark_);
            double p_excess_mean = portfolio_.mean() - rfr_;
            double p_sharpe = sharpe_ratio(portfolio_);
            double b_sharpe = sharpe_ratio(benchmark_);
            double p_sortino = sortino_ratio(portfolio_);
            double b_sortino = sortino_ratio(benchmark_);
            double information_ratio = tracking_error == 0.0 ? INF : active.mean() / tracking_error;
            add_row(Statistic::SHARPE_RATIO, p_sharpe, b_sharpe);
            add_row(Statistic::ANNUALIZED_SHARPE_RATIO, annualizer_ * p_sharpe, annualizer_ * b_sharpe);
            add_row(Statistic::SORTINO_RATIO, p_sortino, b_sortino);
            add_row(Statistic::ANNUALIZED_SORTINO_RATIO, annualizer_ * p_sortino, annualizer_ * b_sortino);
            add_row(Statistic::INFORMATION_RATIO, information_ratio, NaN);
            add_row(Statistic::M_SQUARED, p_sharpe * b_std + rfr_, NaN);
            add_row(Statistic::TREYNOR_RATIO, p_excess_mean / b_beta, NaN);

            // Regression
            double alpha = portfolio_.mean() - b_beta * benchmark_.mean();
            double jensens_alpha = p_excess_mean - b_beta * (benchmark_.mean() - rfr_);
            add_row(Statistic::BETA, b_beta, NaN);
            add_row(Statistic::ALPHA, alpha, NaN);
            add_row(Statistic::ANNUALIZED_ALPHA, annualizer_ * alpha, NaN);
            add_row(Statistic::JENSENS_ALPHA, jensens_alpha, NaN);
            add_row(Statistic::ANNUALIZED_JENSENS_ALPHA, annualizer_ * jensens_alpha, NaN);
        }

        void RiskStatistics::add_row(Statistic statistic, double portfolio, double benchmark)
        {
            rows_.push_back(StatisticRow{statistic, statistic_name(statistic), portfolio, benchmark,
                                         portfolio - benchmark, statistic_category(statistic)});
        }

        // ===================================================================
        // Single-series statistics
        // ===================================================================

        double RiskStatistics::downside_deviation(const Eigen::VectorXd &r) const
        {
            Eigen::ArrayXd shortfall = (r.array() - mar_).min(0.0);
            return std::sqrt(shortfall.square().mean());
        }

        double RiskStatistics::downside_probability(const Eigen::VectorXd &r) const
        {
            return static_cast<double>((r.array() < mar_).count()) / static_cast<double>(r.size());
        }

        double RiskStatistics::expected_downside_value(const Eigen::VectorXd &r) const
        {
            double sum = 0.0;
            for (Eigen::Index t = 0; t < r.size(); ++t)
            {
                if (r(t) < mar_)
                    sum += r(t) - mar_;
            }
            return sum / static_cast<double>(r.size());
        }

        double RiskStatistics::value_at_risk(const Eigen::VectorXd &r) const
        {
            double z = inverse_normal_cdf(1.0 - parameters_.confidence_level);
            return std::abs(parameters_.portfolio_value * (r.mean() - z * std_dev(r)));
        }

        double RiskStatistics::sharpe_ratio(const Eigen::VectorXd &r) const
        {
            Eigen::VectorXd excess = r.array() - rfr_;
            return excess.mean() / std_dev(excess);
        }

        double RiskStatistics::sortino_ratio(const Eigen::VectorXd &r) const
        {
            Eigen::VectorXd excess = r.array() - rfr_;

            std::vector<double> negatives;
            for (Eigen::Index t = 0; t < excess.size(); ++t)
            {
                if (excess(t) < 0.0)
                    negatives.push_back(excess(t));
            }
            if (negatives.empty())
            {
                return INF;
            }

            Eigen::Map<const Eigen::VectorXd> downside(negatives.data(),
                                                       static_cast<Eigen::Index>(negatives.size()));
            double downside_std = std_dev(downside);
            return downside_std == 0.0 ? INF : excess.mean() / downside_std;
        }

    } // namespace analytics
} // namespace perfattr
