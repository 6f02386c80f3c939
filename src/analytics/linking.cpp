/**
 * @file linking.cpp
 * @brief Implementation of the smoothing and linking coefficients.
 */

#include "analytics/linking.hpp"
#include "core/errors.hpp"
#include "core/numeric.hpp"

#include <cmath>
#include <sstream>

namespace perfattr
{
    namespace analytics
    {

        namespace
        {

            void require_defined(double r, const char *what)
            {
                if (!(r > -1.0))
                {
                    std::ostringstream oss;
                    oss << "The " << what << " has a return of " << r;
                    throw core::PerfAttrError(core::ErrorCode::UNDEFINED_RETURN, oss.str());
                }
            }

            void require_same_length(Eigen::Index a, Eigen::Index b)
            {
                if (a != b)
                {
                    throw core::PerfAttrError(core::ErrorCode::RETURN_SERIES_LENGTH_MISMATCH,
                                              "Series of " + std::to_string(a) + " and " +
                                                  std::to_string(b) + " returns");
                }
            }

        } // anonymous namespace

        // ===================================================================
        // Logarithmic smoothing
        // ===================================================================

        double log_smoothing_coefficient(double r)
        {
            require_defined(r, "subperiod");
            if (r == 0.0)
            {
                return 1.0;
            }
            return std::log1p(r) / r;
        }

        Eigen::VectorXd log_smoothing_coefficients(const Eigen::VectorXd &returns)
        {
            Eigen::VectorXd coefficients(returns.size());
            for (Eigen::Index t = 0; t < returns.size(); ++t)
            {
                coefficients(t) = log_smoothing_coefficient(returns(t));
            }
            return coefficients;
        }

        Eigen::VectorXd log_linking_coefficients(double overall_return,
                                                 const Eigen::VectorXd &returns)
        {
            require_defined(overall_return, "overall period");
            double denominator = (overall_return != 0.0)
                                     ? std::log1p(overall_return) / overall_return
                                     : 1.0;
            return log_smoothing_coefficients(returns) / denominator;
        }

        Eigen::VectorXd log_linking_coefficient_series(const Eigen::VectorXd &overall_returns,
                                                       const Eigen::VectorXd &returns)
        {
            require_same_length(overall_returns.size(), returns.size());
            return log_smoothing_coefficients(returns).cwiseQuotient(
                log_smoothing_coefficients(overall_returns));
        }

        // ===================================================================
        // Carino
        // ===================================================================

        double carino_linking_coefficient(double portfolio_return, double benchmark_return)
        {
            require_defined(portfolio_return, "portfolio");
            require_defined(benchmark_return, "benchmark");

            double difference = portfolio_return - benchmark_return;

            // Limit of the log ratio as b -> p.
            if (core::near_zero(difference))
            {
                return 1.0 / (1.0 + portfolio_return);
            }
            // ln(1+p) - ln(1+b) == ln(1 + (p-b)/(1+b)), without cancellation.
            return std::log1p(difference / (1.0 + benchmark_return)) / difference;
        }

        Eigen::VectorXd attribution_linking_coefficients(const Eigen::VectorXd &portfolio_returns,
                                                         const Eigen::VectorXd &benchmark_returns,
                                                         double portfolio_overall_return,
                                                         double benchmark_overall_return)
        {
            require_same_length(portfolio_returns.size(), benchmark_returns.size());

            double overall = carino_linking_coefficient(portfolio_overall_return,
                                                        benchmark_overall_return);

            Eigen::VectorXd k(portfolio_returns.size());
            for (Eigen::Index t = 0; t < portfolio_returns.size(); ++t)
            {
                k(t) = carino_linking_coefficient(portfolio_returns(t), benchmark_returns(t)) / overall;
            }
            return k;
        }

    } // namespace analytics
} // namespace perfattr
