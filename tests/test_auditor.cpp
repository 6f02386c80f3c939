/**
 * @file test_auditor.cpp
 * @brief Unit tests for the attribution Auditor
 */

#include <catch2/catch_test_macros.hpp>

#include "analytics/auditor.hpp"
#include "test_fixtures.hpp"

#include <limits>

using namespace perfattr;
using namespace perfattr::analytics;
using perfattr_test::has_code;

TEST_CASE("Auditor accepts a consistent attribution", "[Auditor]")
{
    Attribution attribution(perfattr_test::make_portfolio(), perfattr_test::make_benchmark());

    SECTION("Tables and panels")
    {
        REQUIRE_NOTHROW(Auditor::audit(attribution));
    }

    SECTION("Every view")
    {
        for (View view : {View::CUMULATIVE_ATTRIBUTION, View::OVERALL_ATTRIBUTION,
                          View::SUBPERIOD_ATTRIBUTION, View::SUBPERIOD_SUMMARY})
        {
            REQUIRE_NOTHROW(Auditor::audit_view(attribution, view));
        }
    }

    SECTION("Two instances over the same data")
    {
        Attribution by_region(perfattr_test::make_portfolio(), perfattr_test::make_benchmark(),
                              data::Classification::from_map("Region", {{"aaa", "Europe"}}));
        REQUIRE_NOTHROW(Auditor::audit_attributions({attribution, by_region}));
    }
}

TEST_CASE("Auditor detects broken identities", "[Auditor][Violation]")
{
    const double nan = std::numeric_limits<double>::quiet_NaN();

    SECTION("Return differs from simple contribution")
    {
        Table table({Column::PORTFOLIO_RETURN, Column::PORTFOLIO_CONTRIB_SIMPLE});
        table.add_row({Cell(0.01), Cell(0.011)});

        REQUIRE_THROWS_MATCHES(Auditor::audit_columns(table, 1, nullptr, 0, true),
                               core::PerfAttrError,
                               has_code(core::ErrorCode::ARITHMETIC_IDENTITY_VIOLATION));
        REQUIRE_NOTHROW(Auditor::audit_columns(table, 1, nullptr, 0, false));
    }

    SECTION("Smoothed column does not foot")
    {
        Table table({Column::PORTFOLIO_RETURN, Column::PORTFOLIO_CONTRIB_SMOOTHED});
        table.add_row({Cell(0.01), Cell(0.004)});
        table.add_row({Cell(0.02), Cell(0.004)});
        table.add_row({Cell(0.01), Cell(0.01)});

        REQUIRE_THROWS_MATCHES(Auditor::audit_columns(table, 2, &table, 2, false),
                               core::PerfAttrError,
                               has_code(core::ErrorCode::ARITHMETIC_IDENTITY_VIOLATION));
    }

    SECTION("Footing within tolerance")
    {
        Table table({Column::PORTFOLIO_RETURN, Column::PORTFOLIO_CONTRIB_SMOOTHED,
                     Column::PORTFOLIO_CONTRIB_SIMPLE});
        table.add_row({Cell(0.004), Cell(0.004), Cell(0.004)});
        table.add_row({Cell(0.006), Cell(0.006), Cell(0.006)});
        table.add_row({Cell(0.01), Cell(0.01), Cell(nan)});

        REQUIRE_NOTHROW(Auditor::audit_columns(table, 2, &table, 2, true));
    }

    SECTION("Overall pair mismatch")
    {
        Table overall({Column::ACTIVE_RETURN, Column::CUMULATIVE_TOTAL_EFFECT});
        overall.add_row({Cell(0.01), Cell(0.0101)});

        REQUIRE_THROWS_MATCHES(Auditor::audit_columns(overall, 0, &overall, 0, true),
                               core::PerfAttrError,
                               has_code(core::ErrorCode::ARITHMETIC_IDENTITY_VIOLATION));
    }
}

TEST_CASE("Auditor detects instances built from different data", "[Auditor][CrossInstance]")
{
    Attribution attribution(perfattr_test::make_portfolio(), perfattr_test::make_benchmark());

    Eigen::MatrixXd weights(3, 3);
    weights << 0.5, 0.3, 0.2,
        0.4, 0.4, 0.2,
        0.3, 0.3, 0.4;
    Eigen::MatrixXd returns(3, 3);
    returns << 0.02, -0.01, 0.03,
        0.01, 0.02, -0.02,
        -0.03, 0.04, 0.02;
    auto revised = data::Performance::from_weights_and_returns(
        "Growth Fund", core::Frequency::MONTHLY, perfattr_test::q1_2024(),
        {"AAA", "BBB", "CCC"}, weights, returns, "GICS Sector", perfattr_test::sector_names());

    Attribution restated(revised, perfattr_test::make_benchmark());

    REQUIRE_NOTHROW(Auditor::audit(restated));
    REQUIRE_THROWS_MATCHES(Auditor::audit_attributions({attribution, restated}),
                           core::PerfAttrError,
                           has_code(core::ErrorCode::CROSS_INSTANCE_INCONSISTENCY));
}
