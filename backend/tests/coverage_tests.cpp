#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "site_planner/coverage.hpp"
#include "test_helpers.hpp"

using namespace site_planner;

namespace
{

std::vector<Cell> meridian_pool(const std::vector<double> &miles)
{
    std::vector<Cell> pool;
    for (double offset : miles)
    {
        pool.push_back(test::make_cell("m" + std::to_string(static_cast<int>(offset)),
                                       test::kBaseLat + test::lat_offset(offset), test::kBaseLon, 500, 1000.0));
    }
    return pool;
}

} // namespace

TEST_CASE("Without depots the whole pool is kept")
{
    const auto pool = meridian_pool({0.0, 1.0, 2.0});
    const auto coverage = filter_by_depot_coverage({}, pool);

    CHECK(coverage.fallback_applied);
    CHECK(coverage.cells.size() == pool.size());
    CHECK(coverage.serving_depot.empty());
    CHECK(coverage.reserved_cell_ids.empty());
}

TEST_CASE("Depots that reach no cell fall back to the whole pool")
{
    const auto pool = meridian_pool({0.0, 1.0, 2.0});
    const Facility depot = test::make_facility("depot-far", Tier::Depot, test::kBaseLat + test::lat_offset(20.0),
                                               test::kBaseLon, 1.0, 100000.0, 10000.0, 12);

    const auto coverage = filter_by_depot_coverage({depot}, pool);

    CHECK(coverage.fallback_applied);
    CHECK(coverage.cells.size() == pool.size());
    CHECK(coverage.reserved_cell_ids.count("depot-far") == 1);
}

TEST_CASE("Only cells inside a depot radius remain candidates")
{
    const auto pool = meridian_pool({0.0, 1.0, 2.0, 10.0});
    Facility depot = test::make_facility("depot-m0", Tier::Depot, test::kBaseLat, test::kBaseLon, 2.5,
                                         100000.0, 10000.0, 12);
    depot.anchor_cell_id = "m0";

    const auto coverage = filter_by_depot_coverage({depot}, pool);

    CHECK_FALSE(coverage.fallback_applied);
    REQUIRE(coverage.cells.size() == 3);
    for (const auto &cell : coverage.cells)
    {
        CHECK(cell.id != "m10");
        CHECK(coverage.serving_depot.at(cell.id) == "depot-m0");
    }
    CHECK(coverage.reserved_cell_ids.count("m0") == 1);
}

TEST_CASE("The serving depot is chosen by impact, then distance, then id")
{
    Facility big = test::make_facility("depot-big", Tier::Depot, test::kBaseLat + test::lat_offset(1.0),
                                       test::kBaseLon, 5.0, 1.0, 1.0, 12);
    big.expected_impact = 200.0;
    Facility small = test::make_facility("depot-small", Tier::Depot, test::kBaseLat + test::lat_offset(0.1),
                                         test::kBaseLon, 5.0, 1.0, 1.0, 12);
    small.expected_impact = 100.0;

    const Facility *chosen = select_serving_depot({&small, &big}, test::kBaseLat, test::kBaseLon);
    REQUIRE(chosen != nullptr);
    CHECK(chosen->id == "depot-big");

    big.expected_impact = 100.0;
    chosen = select_serving_depot({&big, &small}, test::kBaseLat, test::kBaseLon);
    REQUIRE(chosen != nullptr);
    CHECK(chosen->id == "depot-small");

    Facility twin = small;
    twin.id = "depot-a-twin";
    chosen = select_serving_depot({&small, &twin}, test::kBaseLat, test::kBaseLon);
    REQUIRE(chosen != nullptr);
    CHECK(chosen->id == "depot-a-twin");

    CHECK(select_serving_depot({&big, &small}, test::kBaseLat + test::lat_offset(30.0), test::kBaseLon) == nullptr);
}

TEST_CASE("Distribution points are linked to the depot that serves them")
{
    const double north = test::kBaseLat + test::lat_offset(20.0);
    std::vector<Facility> depots = {
        test::make_facility("depot-south", Tier::Depot, test::kBaseLat, test::kBaseLon, 5.0, 1.0, 1.0, 12),
        test::make_facility("depot-north", Tier::Depot, north, test::kBaseLon, 5.0, 1.0, 1.0, 12),
    };

    std::vector<Facility> distribution = {
        test::make_facility("site-s", Tier::Distribution, test::kBaseLat + test::lat_offset(1.0), test::kBaseLon,
                            1.5, 1.0, 1.0, 12),
        test::make_facility("site-n", Tier::Distribution, north + test::lat_offset(1.0), test::kBaseLon, 1.5, 1.0,
                            1.0, 12),
        test::make_facility("site-lost", Tier::Distribution, test::kBaseLat + test::lat_offset(10.0),
                            test::kBaseLon, 1.5, 1.0, 1.0, 12),
    };

    CoverageResult coverage;
    coverage.serving_depot["site-s"] = "depot-south";

    link_served_facilities(depots, distribution, coverage);

    CHECK(distribution[0].depot_id == "depot-south");
    CHECK(distribution[1].depot_id == "depot-north");
    CHECK(distribution[2].depot_id.empty());
    CHECK(depots[0].served_facility_ids == std::vector<std::string>{"site-s"});
    CHECK(depots[1].served_facility_ids == std::vector<std::string>{"site-n"});
}
