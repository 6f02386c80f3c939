/**
 * @file test_risk_statistics.cpp
 * @brief Unit tests for the ex-post risk statistics
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "analytics/risk_statistics.hpp"
#include "test_fixtures.hpp"

#include <cmath>
#include <limits>

using namespace perfattr;
using namespace perfattr::analytics;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;
using perfattr_test::has_code;

namespace
{

    Eigen::VectorXd portfolio_returns()
    {
        Eigen::VectorXd r(6);
        r << 0.02, -0.01, 0.03, 0.01, -0.02, 0.015;
        return r;
    }

    Eigen::VectorXd benchmark_returns()
    {
        Eigen::VectorXd r(6);
        r << 0.015, -0.005, 0.02, 0.012, -0.01, 0.01;
        return r;
    }

} // namespace

TEST_CASE("Risk statistics table layout", "[RiskStatistics]")
{
    RiskStatistics stats(portfolio_returns(), benchmark_returns(), core::Frequency::MONTHLY);

    REQUIRE(stats.rows().size() == 24);
    REQUIRE(stats.rows().front().name == "Range");
    REQUIRE(stats.rows().front().category == "Absolute Risk");
    REQUIRE(stats.rows().back().statistic == Statistic::ANNUALIZED_JENSENS_ALPHA);
    REQUIRE(stats.rows().back().category == "Regression");
    REQUIRE(std::string(statistic_category(Statistic::M_SQUARED)) == "Risk-Adjusted Performance");

    for (size_t i = 0; i < stats.rows().size(); ++i)
    {
        REQUIRE(stats.rows()[i].statistic == all_statistics()[i]);
    }
}

TEST_CASE("Risk statistics values", "[RiskStatistics][Values]")
{
    RiskStatistics stats(portfolio_returns(), benchmark_returns(), core::Frequency::MONTHLY);

    SECTION("De-annualized rates")
    {
        REQUIRE_THAT(stats.periodic_risk_free_rate(), WithinAbs(0.00246626977230369, 1e-15));
        REQUIRE(stats.periodic_minimum_acceptable_return() == 0.0);
        REQUIRE(std::isnan(stats.annualization_coefficient()));
    }

    SECTION("Absolute risk")
    {
        REQUIRE_THAT(stats.portfolio_value(Statistic::RANGE), WithinAbs(0.05, 1e-15));
        REQUIRE_THAT(stats.benchmark_value(Statistic::RANGE), WithinAbs(0.03, 1e-15));
        REQUIRE_THAT(stats.difference(Statistic::RANGE), WithinAbs(0.02, 1e-15));
        REQUIRE_THAT(stats.portfolio_value(Statistic::STANDARD_DEVIATION), WithinAbs(0.0172602626476733, 1e-14));
        REQUIRE_THAT(stats.benchmark_value(Statistic::STANDARD_DEVIATION), WithinAbs(0.0108012344973464, 1e-14));
    }

    SECTION("Downside risk")
    {
        REQUIRE_THAT(stats.portfolio_value(Statistic::DOWNSIDE_PROBABILITY), WithinAbs(1.0 / 3.0, 1e-15));
        REQUIRE_THAT(stats.portfolio_value(Statistic::EXPECTED_DOWNSIDE_VALUE), WithinAbs(-0.005, 1e-15));
        REQUIRE_THAT(stats.benchmark_value(Statistic::EXPECTED_DOWNSIDE_VALUE), WithinAbs(-0.0025, 1e-15));
        REQUIRE_THAT(stats.portfolio_value(Statistic::DOWNSIDE_DEVIATION), WithinAbs(0.00912870929175277, 1e-14));
        REQUIRE_THAT(stats.portfolio_value(Statistic::VALUE_AT_RISK), WithinRel(3589.060562, 1e-6));
        REQUIRE_THAT(stats.benchmark_value(Statistic::VALUE_AT_RISK), WithinRel(2476.644974, 1e-6));
    }

    SECTION("Benchmark-relative risk")
    {
        REQUIRE_THAT(stats.portfolio_value(Statistic::CORRELATION), WithinAbs(0.98784824535156, 1e-12));
        REQUIRE_THAT(stats.portfolio_value(Statistic::R_SQUARED), WithinAbs(0.98784824535156 * 0.98784824535156, 1e-12));
        REQUIRE_THAT(stats.portfolio_value(Statistic::TRACKING_ERROR), WithinAbs(0.00680073525436772, 1e-14));
        REQUIRE(std::isnan(stats.benchmark_value(Statistic::TRACKING_ERROR)));
        REQUIRE(std::isnan(stats.difference(Statistic::CORRELATION)));
    }

    SECTION("Risk-adjusted performance")
    {
        REQUIRE_THAT(stats.portfolio_value(Statistic::SHARPE_RATIO), WithinAbs(0.291636942638, 1e-11));
        REQUIRE_THAT(stats.benchmark_value(Statistic::SHARPE_RATIO), WithinAbs(0.419741857174763, 1e-11));
        REQUIRE_THAT(stats.portfolio_value(Statistic::SORTINO_RATIO), WithinAbs(1.00674604553926, 1e-11));
        REQUIRE_THAT(stats.benchmark_value(Statistic::SORTINO_RATIO), WithinAbs(1.81349209107853, 1e-11));
        REQUIRE_THAT(stats.portfolio_value(Statistic::INFORMATION_RATIO), WithinAbs(0.0735214622093807, 1e-12));
        REQUIRE_THAT(stats.portfolio_value(Statistic::M_SQUARED), WithinAbs(0.00561630877782589, 1e-14));
        REQUIRE_THAT(stats.portfolio_value(Statistic::TREYNOR_RATIO), WithinAbs(0.00265732364961344, 1e-14));
    }

    SECTION("Regression")
    {
        REQUIRE_THAT(stats.portfolio_value(Statistic::BETA), WithinAbs(1.89428571428571, 1e-12));
        REQUIRE_THAT(stats.portfolio_value(Statistic::ALPHA), WithinAbs(-0.00576, 1e-14));
        REQUIRE_THAT(stats.portfolio_value(Statistic::JENSENS_ALPHA), WithinAbs(-0.00355445017505413, 1e-14));
        REQUIRE(std::isnan(stats.benchmark_value(Statistic::BETA)));
    }

    SECTION("Annualized statistics need a full year")
    {
        REQUIRE(std::isnan(stats.portfolio_value(Statistic::ANNUALIZED_STANDARD_DEVIATION)));
        REQUIRE(std::isnan(stats.portfolio_value(Statistic::ANNUALIZED_SHARPE_RATIO)));
    }
}

TEST_CASE("Risk statistics annualization", "[RiskStatistics][Annualized]")
{
    SECTION("Quarterly series shorter than a year")
    {
        Eigen::VectorXd p(3);
        p << 0.02, -0.01, 0.03;
        Eigen::VectorXd b(3);
        b << 0.01, 0.0, 0.02;
        RiskStatistics stats(p, b, core::Frequency::QUARTERLY);

        REQUIRE(std::isnan(stats.portfolio_value(Statistic::ANNUALIZED_TRACKING_ERROR)));
        REQUIRE(std::isnan(stats.portfolio_value(Statistic::ANNUALIZED_ALPHA)));
        REQUIRE_FALSE(std::isnan(stats.portfolio_value(Statistic::TRACKING_ERROR)));
    }

    SECTION("Yearly series")
    {
        Eigen::VectorXd p(2);
        p << 0.10, -0.05;
        Eigen::VectorXd b(2);
        b << 0.08, -0.02;
        RiskStatistics stats(p, b, core::Frequency::YEARLY);

        REQUIRE(stats.annualization_coefficient() == 1.0);
        REQUIRE_THAT(stats.portfolio_value(Statistic::ANNUALIZED_STANDARD_DEVIATION),
                     WithinAbs(stats.portfolio_value(Statistic::STANDARD_DEVIATION), 1e-15));
        REQUIRE_THAT(stats.periodic_risk_free_rate(), WithinAbs(0.03, 1e-15));
    }

    SECTION("Monthly series of a full year")
    {
        Eigen::VectorXd p = Eigen::VectorXd::LinSpaced(12, -0.02, 0.03);
        Eigen::VectorXd b = Eigen::VectorXd::LinSpaced(12, -0.01, 0.02);
        RiskStatistics stats(p, b, core::Frequency::MONTHLY);

        REQUIRE_THAT(stats.annualization_coefficient(), WithinAbs(std::sqrt(12.0), 1e-15));
        REQUIRE_THAT(stats.portfolio_value(Statistic::ANNUALIZED_STANDARD_DEVIATION),
                     WithinAbs(std::sqrt(12.0) * stats.portfolio_value(Statistic::STANDARD_DEVIATION), 1e-15));
    }
}

TEST_CASE("Risk statistics infinite ratios", "[RiskStatistics][Edge]")
{
    Eigen::VectorXd b(4);
    b << 0.25, 0.5, 0.125, 0.375;

    SECTION("Constant active return")
    {
        Eigen::VectorXd p = b.array() + 0.0625;
        RiskStatistics stats(p, b, core::Frequency::MONTHLY);
        REQUIRE(std::isinf(stats.portfolio_value(Statistic::INFORMATION_RATIO)));
    }

    SECTION("No returns below the risk-free rate")
    {
        RiskStatistics stats(b, b, core::Frequency::MONTHLY);
        REQUIRE(std::isinf(stats.portfolio_value(Statistic::SORTINO_RATIO)));
        REQUIRE(stats.portfolio_value(Statistic::DOWNSIDE_PROBABILITY) == 0.0);
    }
}

TEST_CASE("Risk statistics validation", "[RiskStatistics][Validation]")
{
    SECTION("Periodic frequency")
    {
        REQUIRE_THROWS_MATCHES(RiskStatistics(portfolio_returns(), benchmark_returns(),
                                              core::Frequency::AS_OFTEN_AS_POSSIBLE),
                               core::PerfAttrError,
                               has_code(core::ErrorCode::INVALID_FREQUENCY_FOR_RISK_STATISTICS));
    }

    SECTION("Frequency is checked before length")
    {
        Eigen::VectorXd short_series(2);
        short_series << 0.01, 0.02;
        REQUIRE_THROWS_MATCHES(RiskStatistics(portfolio_returns(), short_series,
                                              core::Frequency::AS_OFTEN_AS_POSSIBLE),
                               core::PerfAttrError,
                               has_code(core::ErrorCode::INVALID_FREQUENCY_FOR_RISK_STATISTICS));
    }

    SECTION("Length mismatch")
    {
        Eigen::VectorXd short_series(2);
        short_series << 0.01, 0.02;
        REQUIRE_THROWS_MATCHES(RiskStatistics(portfolio_returns(), short_series, core::Frequency::MONTHLY),
                               core::PerfAttrError,
                               has_code(core::ErrorCode::RETURN_SERIES_LENGTH_MISMATCH));
    }

    SECTION("Too few returns")
    {
        Eigen::VectorXd one(1);
        one << 0.01;
        REQUIRE_THROWS_MATCHES(RiskStatistics(one, one, core::Frequency::MONTHLY),
                               core::PerfAttrError,
                               has_code(core::ErrorCode::INSUFFICIENT_QUANTITY_OF_RETURNS));
    }

    SECTION("NaN return")
    {
        Eigen::VectorXd p = portfolio_returns();
        p(3) = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_MATCHES(RiskStatistics(p, benchmark_returns(), core::Frequency::MONTHLY),
                               core::PerfAttrError,
                               has_code(core::ErrorCode::NAN_IN_RETURN_SERIES));
    }

    SECTION("Confidence level out of range")
    {
        core::RiskParameters parameters;
        parameters.confidence_level = 1.0;
        REQUIRE_THROWS_AS(RiskStatistics(portfolio_returns(), benchmark_returns(),
                                         core::Frequency::MONTHLY, parameters),
                          std::invalid_argument);
    }
}

TEST_CASE("Risk statistics from performances", "[RiskStatistics][Performance]")
{
    RiskStatistics stats(perfattr_test::make_portfolio(), perfattr_test::make_benchmark());

    REQUIRE(stats.portfolio_name() == "Growth Fund");
    REQUIRE(stats.benchmark_name() == "Broad Index");
    REQUIRE(stats.frequency() == core::Frequency::MONTHLY);
    REQUIRE(stats.num_returns() == 3);
    // 0.013, 0.008, 0.007
    REQUIRE_THAT(stats.portfolio_value(Statistic::RANGE), WithinAbs(0.006, 1e-15));
}
