#include <doctest/doctest.h>

#include <algorithm>
#include <unordered_map>

#include "site_planner/zone_grid.hpp"

using namespace site_planner;

TEST_CASE("ZoneGrid numbers zones row-major and clamps the far edge")
{
    const ZoneGrid grid({40.0, -75.0, 40.6, -74.4}, 6);

    CHECK(grid.zone_of(40.0, -75.0) == 0);
    CHECK(grid.zone_of(40.05, -74.85) == 1);
    CHECK(grid.zone_of(40.15, -75.0) == 6);
    CHECK(grid.zone_of(40.6, -74.4) == 35);
}

TEST_CASE("ZoneGrid with a degenerate box maps everything to one row")
{
    const ZoneGrid grid({40.0, -75.0, 40.0, -74.0}, 4);
    CHECK(grid.zone_of(40.0, -75.0) == 0);
    CHECK(grid.zone_of(40.0, -74.0) == 3);
}

TEST_CASE("ZoneGrid neighbours at corners and in the interior")
{
    const ZoneGrid grid({0.0, 0.0, 1.0, 1.0}, 3);

    auto corner = grid.neighbours(0);
    std::sort(corner.begin(), corner.end());
    CHECK(corner == std::vector<int>{1, 3, 4});

    CHECK(grid.neighbours(4).size() == 8);
}

TEST_CASE("zone_capacity follows the schedule")
{
    DeclusteringPolicy policy;
    CHECK(zone_capacity(policy, 0) == 1);
    CHECK(zone_capacity(policy, 11) == 1);
    CHECK(zone_capacity(policy, 12) == 2);
    CHECK(zone_capacity(policy, 19) == 2);
    CHECK(zone_capacity(policy, 20) == 3);
    CHECK(zone_capacity(policy, 500) == 3);
}

TEST_CASE("zone_admits relaxes a saturated zone once its neighbours are occupied")
{
    DeclusteringPolicy policy;
    policy.enabled = true;
    const ZoneGrid grid({0.0, 0.0, 1.0, 1.0}, 3);

    std::unordered_map<int, int> occupancy;
    CHECK(zone_admits(grid, occupancy, 4, 0, policy));

    occupancy[4] = 1;
    CHECK_FALSE(zone_admits(grid, occupancy, 4, 1, policy));

    // 5 of 8 neighbours occupied is below the 0.7 ratio.
    for (int zone : {0, 1, 2, 3, 5})
    {
        occupancy[zone] = 1;
    }
    CHECK_FALSE(zone_admits(grid, occupancy, 4, 6, policy));

    occupancy[6] = 1;
    CHECK(zone_admits(grid, occupancy, 4, 7, policy));

    // Only one over capacity is allowed.
    occupancy[4] = 2;
    CHECK_FALSE(zone_admits(grid, occupancy, 4, 8, policy));
}
