/**
 * @file linking.hpp
 * @brief Logarithmic smoothing and Carino linking coefficients.
 *
 * Single-period arithmetic contributions and effects do not add up to the
 * compounded multi-period return. Scaling each subperiod by a logarithmic
 * linking coefficient makes them add up exactly:
 *
 *   smoothing(r)  = ln(1 + r) / r            (1 when r == 0)
 *   linking(r_t)  = smoothing(r_t) / smoothing(R)
 *   carino(p, b)  = (ln(1 + p) - ln(1 + b)) / (p - b)   (1 / (1 + p) when p ~ b)
 *   k_t           = carino(p_t, b_t) / carino(P, B)
 *
 * where R, P and B are compounded overall returns.
 */

#ifndef PERFATTR_ANALYTICS_LINKING_HPP
#define PERFATTR_ANALYTICS_LINKING_HPP

#include <Eigen/Dense>

namespace perfattr
{
    namespace analytics
    {

        /**
         * @brief Logarithmic smoothing coefficient of a single return.
         * @param r Return, must be > -1.
         * @return ln(1 + r) / r, or 1.0 when r is exactly 0.
         * @throws PerfAttrError (UndefinedReturn) if r <= -1.
         */
        double log_smoothing_coefficient(double r);

        /**
         * @brief Elementwise log_smoothing_coefficient().
         * @throws PerfAttrError (UndefinedReturn) if any return is <= -1.
         */
        Eigen::VectorXd log_smoothing_coefficients(const Eigen::VectorXd &returns);

        /**
         * @brief Linking coefficients of subperiod returns against one overall return.
         * @param overall_return Compounded return of the whole period.
         * @param returns Subperiod returns.
         * @return smoothing(r_t) / smoothing(overall_return) per subperiod.
         * @throws PerfAttrError (UndefinedReturn) if any return is <= -1.
         */
        Eigen::VectorXd log_linking_coefficients(double overall_return,
                                                 const Eigen::VectorXd &returns);

        /**
         * @brief Linking coefficients against a per-subperiod series of overall returns.
         * @throws PerfAttrError (ReturnSeriesLengthMismatch) if the lengths differ.
         * @throws PerfAttrError (UndefinedReturn) if any return is <= -1.
         */
        Eigen::VectorXd log_linking_coefficient_series(const Eigen::VectorXd &overall_returns,
                                                       const Eigen::VectorXd &returns);

        /**
         * @brief Carino coefficient of a portfolio/benchmark return pair.
         * @param portfolio_return Portfolio return, must be > -1.
         * @param benchmark_return Benchmark return, must be > -1.
         * @return Strictly positive coefficient.
         * @throws PerfAttrError (UndefinedReturn) if either return is <= -1.
         */
        double carino_linking_coefficient(double portfolio_return, double benchmark_return);

        /**
         * @brief Attribution linking coefficients k_t for every subperiod.
         * @param portfolio_returns Portfolio subperiod returns p_t.
         * @param benchmark_returns Benchmark subperiod returns b_t.
         * @param portfolio_overall_return Compounded portfolio return P.
         * @param benchmark_overall_return Compounded benchmark return B.
         * @return carino(p_t, b_t) / carino(P, B).
         * @throws PerfAttrError (ReturnSeriesLengthMismatch) if the series lengths differ.
         * @throws PerfAttrError (UndefinedReturn) if any return is <= -1.
         */
        Eigen::VectorXd attribution_linking_coefficients(const Eigen::VectorXd &portfolio_returns,
                                                         const Eigen::VectorXd &benchmark_returns,
                                                         double portfolio_overall_return,
                                                         double benchmark_overall_return);

    } // namespace analytics
} // namespace perfattr

#endif // PERFATTR_ANALYTICS_LINKING_HPP
