/**
 * @file test_performance.cpp
 * @brief Unit tests for Performance validation and derived quantities
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "data/performance.hpp"
#include "test_fixtures.hpp"

#include <limits>
#include <utility>

using namespace perfattr;
using namespace perfattr::data;
using Catch::Matchers::WithinAbs;
using perfattr_test::has_code;

namespace
{

    PerformanceData single_asset(std::vector<Subperiod> subperiods, double r = 0.01)
    {
        const Eigen::Index n = static_cast<Eigen::Index>(subperiods.size());
        PerformanceData data;
        data.name = "Single";
        data.subperiods = std::move(subperiods);
        data.identifiers = {"AAA"};
        data.weights = Eigen::MatrixXd::Ones(n, 1);
        data.returns = Eigen::MatrixXd::Constant(n, 1, r);
        data.contributions = data.returns;
        data.consolidated_returns = data.returns;
        data.total_returns = Eigen::VectorXd::Constant(n, r);
        return data;
    }

} // namespace

TEST_CASE("Performance derived quantities", "[Performance]")
{
    Performance portfolio = perfattr_test::make_portfolio();

    SECTION("Shape and identifiers")
    {
        REQUIRE(portfolio.num_subperiods() == 3);
        REQUIRE(portfolio.num_assets() == 3);
        REQUIRE(portfolio.identifiers() == std::vector<std::string>{"aaa", "bbb", "ccc"});
        REQUIRE(portfolio.asset_index("BBB") == 1);
        REQUIRE(portfolio.asset_index("zzz") == -1);
        REQUIRE(portfolio.beginning_date() == "2023-12-31");
        REQUIRE(portfolio.ending_date() == "2024-03-31");
        REQUIRE_FALSE(portfolio.subperiods_consolidated());
    }

    SECTION("Returns")
    {
        REQUIRE_THAT(portfolio.total_returns()(0), WithinAbs(0.013, 1e-15));
        REQUIRE_THAT(portfolio.overall_return(), WithinAbs(perfattr_test::PORTFOLIO_OVERALL, 1e-14));
        REQUIRE_THAT(portfolio.contributions()(0, 0), WithinAbs(0.01, 1e-15));
    }

    SECTION("Linking coefficients link the total returns")
    {
        REQUIRE_THAT(portfolio.linking_coefficients().dot(portfolio.total_returns()),
                     WithinAbs(portfolio.overall_return(), 1e-14));
    }

    SECTION("Days per subperiod")
    {
        REQUIRE(portfolio.quantity_of_days() == std::vector<long>{31, 29, 31});
    }

    SECTION("Per-asset overall values")
    {
        REQUIRE_THAT(portfolio.overall_asset_returns()(0), WithinAbs(1.02 * 1.01 * 0.97 - 1.0, 1e-15));
        REQUIRE_THAT(portfolio.overall_asset_weights()(2), WithinAbs(0.8 / 3.0, 1e-15));
    }

    SECTION("Classification items are keyed in lower case")
    {
        REQUIRE(portfolio.classification_items().at("aaa") == "Energy");
    }
}

TEST_CASE("Performance validation", "[Performance][Validation]")
{
    SECTION("No subperiods")
    {
        REQUIRE_THROWS_MATCHES(Performance(single_asset({})), core::PerfAttrError,
                               has_code(core::ErrorCode::NO_REPORTABLE_DATES));
    }

    SECTION("Malformed date")
    {
        REQUIRE_THROWS_MATCHES(Performance(single_asset({{"2024-01-31", "2024-02-30"}})), core::PerfAttrError,
                               has_code(core::ErrorCode::MALFORMED_DATE_STRING));
    }

    SECTION("Gap between subperiods")
    {
        REQUIRE_THROWS_MATCHES(Performance(single_asset({{"2023-12-31", "2024-01-31"},
                                                         {"2024-02-01", "2024-02-29"}})),
                               core::PerfAttrError,
                               has_code(core::ErrorCode::DISCONTINUOUS_SUBPERIODS));
    }

    SECTION("Inverted subperiod")
    {
        REQUIRE_THROWS_MATCHES(Performance(single_asset({{"2024-01-31", "2023-12-31"}})), core::PerfAttrError,
                               has_code(core::ErrorCode::DISCONTINUOUS_SUBPERIODS));
    }

    SECTION("NaN in the data")
    {
        PerformanceData data = single_asset({{"2023-12-31", "2024-01-31"}});
        data.returns(0, 0) = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_MATCHES(Performance(data), core::PerfAttrError,
                               has_code(core::ErrorCode::NAN_IN_RETURN_SERIES));
    }

    SECTION("Weights do not sum to one")
    {
        PerformanceData data = single_asset({{"2023-12-31", "2024-01-31"}});
        data.weights(0, 0) = 0.9;
        REQUIRE_THROWS_MATCHES(Performance(data), core::PerfAttrError,
                               has_code(core::ErrorCode::WEIGHTS_DO_NOT_SUM_TO_ONE));
    }

    SECTION("Total loss")
    {
        REQUIRE_THROWS_MATCHES(Performance(single_asset({{"2023-12-31", "2024-01-31"}}, -1.0)),
                               core::PerfAttrError,
                               has_code(core::ErrorCode::UNDEFINED_RETURN));
    }

    SECTION("Panel shape mismatch")
    {
        PerformanceData data = single_asset({{"2023-12-31", "2024-01-31"}});
        data.total_returns = Eigen::VectorXd::Zero(2);
        REQUIRE_THROWS_AS(Performance(data), std::invalid_argument);
    }

    SECTION("Duplicate identifiers")
    {
        Eigen::MatrixXd w(1, 2);
        w << 0.5, 0.5;
        Eigen::MatrixXd r(1, 2);
        r << 0.01, 0.02;
        REQUIRE_THROWS_AS(Performance::from_weights_and_returns("Dup", core::Frequency::MONTHLY,
                                                                {{"2023-12-31", "2024-01-31"}},
                                                                {"AAA", "aaa"}, w, r),
                          std::invalid_argument);
    }
}
