/**
 * @file test_linking.cpp
 * @brief Unit tests for logarithmic smoothing and Carino linking
 */

#include <catch2/catch_message.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "analytics/linking.hpp"
#include "test_fixtures.hpp"

#include <cmath>
#include <limits>

using namespace perfattr;
using namespace perfattr::analytics;
using Catch::Matchers::WithinAbs;
using perfattr_test::has_code;

TEST_CASE("Logarithmic smoothing coefficient", "[Linking][Smoothing]")
{
    SECTION("Positive return")
    {
        REQUIRE_THAT(log_smoothing_coefficient(0.1), WithinAbs(0.9531017980432486, 1e-15));
    }

    SECTION("Zero return is the limit 1")
    {
        REQUIRE(log_smoothing_coefficient(0.0) == 1.0);
    }

    SECTION("Undefined returns")
    {
        REQUIRE_THROWS_MATCHES(log_smoothing_coefficient(-1.0), core::PerfAttrError,
                               has_code(core::ErrorCode::UNDEFINED_RETURN));
        REQUIRE_THROWS_MATCHES(log_smoothing_coefficient(-1.5), core::PerfAttrError,
                               has_code(core::ErrorCode::UNDEFINED_RETURN));
        REQUIRE_THROWS_AS(log_smoothing_coefficient(std::numeric_limits<double>::quiet_NaN()),
                          core::PerfAttrError);
    }
}

TEST_CASE("Logarithmic linking coefficients", "[Linking][Log]")
{
    Eigen::VectorXd returns(3);
    returns << 0.1, 0.2, -0.05;
    double overall = 1.1 * 1.2 * 0.95 - 1.0;

    SECTION("Linked returns add up to the overall return")
    {
        Eigen::VectorXd k = log_linking_coefficients(overall, returns);
        REQUIRE_THAT(k.dot(returns), WithinAbs(overall, 1e-14));
    }

    SECTION("Zero overall return uses a unit denominator")
    {
        Eigen::VectorXd k = log_linking_coefficients(0.0, returns);
        REQUIRE_THAT(k(0), WithinAbs(log_smoothing_coefficient(0.1), 1e-15));
    }

    SECTION("Series version divides elementwise")
    {
        Eigen::VectorXd overall_series = Eigen::VectorXd::Constant(3, overall);
        Eigen::VectorXd series = log_linking_coefficient_series(overall_series, returns);
        Eigen::VectorXd scalar = log_linking_coefficients(overall, returns);
        REQUIRE(series.isApprox(scalar, 1e-14));
    }

    SECTION("Series of different lengths")
    {
        Eigen::VectorXd overall_series = Eigen::VectorXd::Constant(2, overall);
        REQUIRE_THROWS_MATCHES(log_linking_coefficient_series(overall_series, returns), core::PerfAttrError,
                               has_code(core::ErrorCode::RETURN_SERIES_LENGTH_MISMATCH));
    }
}

TEST_CASE("Carino linking coefficients", "[Linking][Carino]")
{
    SECTION("Distinct returns")
    {
        REQUIRE_THAT(carino_linking_coefficient(0.1, 0.05), WithinAbs(0.9304003126978572, 1e-14));
    }

    SECTION("Equal returns take the limit")
    {
        REQUIRE_THAT(carino_linking_coefficient(0.05, 0.05), WithinAbs(1.0 / 1.05, 1e-15));
        REQUIRE_THAT(carino_linking_coefficient(0.05, 0.05 + 1e-14), WithinAbs(1.0 / 1.05, 1e-15));
    }

    SECTION("Positive and continuous across the near-equal branch")
    {
        double distinct = carino_linking_coefficient(0.05, 0.03);
        REQUIRE(std::isfinite(distinct));
        REQUIRE(distinct > 0.0);
        REQUIRE_THAT(carino_linking_coefficient(0.05, 0.05 - 1e-9), WithinAbs(1.0 / 1.05, 1e-9));
    }

    SECTION("No jump at the branch switch")
    {
        const double limit = 1.0 / 1.05;
        for (double d : {1e-9, 1e-11, 6e-13, 5.1e-13, 4.9e-13, -4.9e-13, -5.1e-13, -6e-13})
        {
            CAPTURE(d);
            REQUIRE_THAT(carino_linking_coefficient(0.05, 0.05 + d), WithinAbs(limit, 1e-9));
        }
        for (double d : {6e-13, 5.1e-13, -5.1e-13, -6e-13})
        {
            CAPTURE(d);
            REQUIRE_THAT(carino_linking_coefficient(0.05, 0.05 + d), WithinAbs(limit, 1e-12));
        }
    }

    SECTION("Undefined portfolio return")
    {
        REQUIRE_THROWS_MATCHES(carino_linking_coefficient(-1.0, 0.03), core::PerfAttrError,
                               has_code(core::ErrorCode::UNDEFINED_RETURN));
    }

    SECTION("Undefined benchmark return")
    {
        REQUIRE_THROWS_MATCHES(carino_linking_coefficient(0.05, -1.0), core::PerfAttrError,
                               has_code(core::ErrorCode::UNDEFINED_RETURN));
    }

    SECTION("Linked active returns add up to the overall active return")
    {
        Eigen::VectorXd p(3);
        p << 0.03, -0.01, 0.02;
        Eigen::VectorXd b(3);
        b << 0.02, 0.01, 0.015;
        double p_overall = 1.03 * 0.99 * 1.02 - 1.0;
        double b_overall = 1.02 * 1.01 * 1.015 - 1.0;

        Eigen::VectorXd k = attribution_linking_coefficients(p, b, p_overall, b_overall);
        REQUIRE(k.size() == 3);
        REQUIRE_THAT(k.dot(p - b), WithinAbs(p_overall - b_overall, 1e-14));
    }
}
