/**
 * @file test_classification_mapping.cpp
 * @brief Unit tests for Classification and Mapping lookup tables
 */

#include <catch2/catch_test_macros.hpp>

#include "data/classification.hpp"
#include "data/mapping.hpp"
#include "test_fixtures.hpp"

#include <filesystem>
#include <fstream>

using namespace perfattr;
using namespace perfattr::data;
using perfattr_test::has_code;

namespace
{

    std::string write_temp_file(const std::string &name, const std::string &contents)
    {
        std::filesystem::path path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path);
        out << contents;
        return path.string();
    }

} // namespace

TEST_CASE("Classification construction", "[Classification]")
{
    SECTION("Rows")
    {
        Classification sectors("GICS Sector", {{"XOM", "Energy"}, {"jpm", "Financials"}});
        REQUIRE(sectors.name() == "GICS Sector");
        REQUIRE(sectors.size() == 2);
        REQUIRE(sectors.contains("xom"));
        REQUIRE(sectors.contains("JPM"));
        REQUIRE(sectors.name_for("Xom") == "Energy");
        REQUIRE(sectors.name_for("msft").empty());
    }

    SECTION("Rows with the wrong column count")
    {
        REQUIRE_THROWS_MATCHES(Classification("Sector", {{"XOM", "Energy", "extra"}}),
                               core::PerfAttrError,
                               has_code(core::ErrorCode::CLASSIFICATION_OR_MAPPING_COLUMN_COUNT_INVALID));
        REQUIRE_THROWS_MATCHES(Classification("Sector", {{"XOM"}}),
                               core::PerfAttrError,
                               has_code(core::ErrorCode::CLASSIFICATION_OR_MAPPING_COLUMN_COUNT_INVALID));
    }

    SECTION("JSON arrays")
    {
        nlohmann::json j = {{"identifiers", {"XOM", "JPM"}}, {"names", {"Energy", "Financials"}}};
        Classification sectors = Classification::from_json("Sector", j);
        REQUIRE(sectors.name_for("jpm") == "Financials");

        nlohmann::json uneven = {{"identifiers", {"XOM", "JPM"}}, {"names", {"Energy"}}};
        REQUIRE_THROWS_MATCHES(Classification::from_json("Sector", uneven), core::PerfAttrError,
                               has_code(core::ErrorCode::CLASSIFICATION_OR_MAPPING_COLUMN_COUNT_INVALID));
        REQUIRE_THROWS_AS(Classification::from_json("Sector", nlohmann::json::object()), core::PerfAttrError);
    }

    SECTION("CSV file without header")
    {
        std::string path = write_temp_file("perfattr_test_sectors.csv",
                                           "XOM, Energy\r\n\nJPM,Financials\n");
        Classification sectors = Classification::from_csv("Sector", path);
        std::filesystem::remove(path);

        REQUIRE(sectors.size() == 2);
        REQUIRE(sectors.name_for("xom") == "Energy");
        REQUIRE(sectors.name_for("jpm") == "Financials");
    }

    SECTION("Missing CSV file")
    {
        REQUIRE_THROWS_MATCHES(Classification::from_csv("Sector", "nonexistent_sectors.csv"),
                               core::PerfAttrError,
                               has_code(core::ErrorCode::DATA_SOURCE_UNAVAILABLE));
    }
}

TEST_CASE("Classification inferred from performances", "[Classification][Infer]")
{
    SECTION("Both sides agree")
    {
        Classification inferred = Classification::infer(perfattr_test::make_portfolio(),
                                                        perfattr_test::make_benchmark());
        REQUIRE(inferred.name() == "GICS Sector");
        REQUIRE(inferred.name_for("DDD") == "Utilities");
    }

    SECTION("One side unnamed")
    {
        Classification inferred = Classification::infer(perfattr_test::make_portfolio(""),
                                                        perfattr_test::make_benchmark("Region"));
        REQUIRE(inferred.name() == "Region");
    }

    SECTION("Sides disagree")
    {
        REQUIRE_THROWS_MATCHES(Classification::infer(perfattr_test::make_portfolio("GICS Sector"),
                                                     perfattr_test::make_benchmark("Region")),
                               core::PerfAttrError,
                               has_code(core::ErrorCode::MISSING_CLASSIFICATION_NAME));
    }
}

TEST_CASE("Mapping", "[Mapping]")
{
    const std::vector<std::string> holdings = {"XOM", "JPM", "CASH"};

    SECTION("Only needed mappings are kept")
    {
        Mapping mapping(holdings, {{"xom", "energy"}, {"JPM", "financials"}, {"msft", "it"}});
        REQUIRE(mapping.size() == 3);
        REQUIRE(mapping.map("XOM") == "energy");
        REQUIRE(mapping.map("jpm") == "financials");
        REQUIRE(mapping.mappings().count("msft") == 0);
    }

    SECTION("Unmapped items map to themselves")
    {
        Mapping mapping(holdings, {{"xom", "energy"}});
        REQUIRE(mapping.map("CASH") == "cash");
        REQUIRE(mapping.map_all(holdings) == std::vector<std::string>{"energy", "jpm", "cash"});
    }

    SECTION("Repeated key keeps the first value")
    {
        Mapping mapping(holdings, {{"xom", "energy"}, {"XOM", "materials"}});
        REQUIRE(mapping.map("xom") == "energy");
    }

    SECTION("JSON arrays")
    {
        nlohmann::json j = {{"from", {"XOM", "JPM"}}, {"to", {"energy", "financials"}}};
        Mapping mapping = Mapping::from_json(holdings, j);
        REQUIRE(mapping.map("jpm") == "financials");

        nlohmann::json uneven = {{"from", {"XOM"}}, {"to", {"energy", "financials"}}};
        REQUIRE_THROWS_MATCHES(Mapping::from_json(holdings, uneven), core::PerfAttrError,
                               has_code(core::ErrorCode::CLASSIFICATION_OR_MAPPING_COLUMN_COUNT_INVALID));
    }

    SECTION("CSV file with a bad row")
    {
        std::string path = write_temp_file("perfattr_test_mapping.csv", "XOM,energy\nJPM\n");
        REQUIRE_THROWS_MATCHES(Mapping::from_csv(holdings, path), core::PerfAttrError,
                               has_code(core::ErrorCode::CLASSIFICATION_OR_MAPPING_COLUMN_COUNT_INVALID));
        std::filesystem::remove(path);
    }
}
