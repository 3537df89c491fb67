#include <doctest/doctest.h>

#include <vector>

#include "site_planner/geometry.hpp"
#include "site_planner/kdtree.hpp"
#include "test_helpers.hpp"

using namespace site_planner;

namespace
{

std::vector<std::size_t> brute_force(const std::vector<Cell> &cells, double lat, double lon, double radius)
{
    std::vector<std::size_t> found;
    for (std::size_t i = 0; i < cells.size(); i++)
    {
        if (haversine_miles(lat, lon, cells[i].lat, cells[i].lon) <= radius)
        {
            found.push_back(i);
        }
    }
    return found;
}

} // namespace

TEST_CASE("CellIndex radius queries match a linear scan")
{
    const auto cells = test::grid_cells(12, 12, 0.75);
    const CellIndex index(cells);
    REQUIRE(index.size() == cells.size());

    const double probe_lats[] = {test::kBaseLat, test::kBaseLat + test::lat_offset(4.1), test::kBaseLat - 0.2};
    const double radii[] = {0.5, 1.6, 3.0, 20.0};

    for (double lat : probe_lats)
    {
        for (double radius : radii)
        {
            const double lon = test::kBaseLon + 0.04;
            CHECK(index.within_radius(lat, lon, radius) == brute_force(cells, lat, lon, radius));
            CHECK(index.any_within_radius(lat, lon, radius) == !brute_force(cells, lat, lon, radius).empty());
        }
    }
}

TEST_CASE("CellIndex finds nothing far away and skips malformed cells")
{
    std::vector<Cell> cells = {
        test::make_cell("a", 40.0, -75.0, 10, 10.0),
        test::make_cell("bad", 120.0, -75.0, 10, 10.0)};
    const CellIndex index(cells);

    CHECK(index.within_radius(40.0, -75.0, 0.1) == std::vector<std::size_t>{0});
    CHECK_FALSE(index.any_within_radius(45.0, -75.0, 50.0));
    CHECK(index.within_radius(120.0, -75.0, 1.0).empty());
}

TEST_CASE("CellIndex handles cells on both sides of the antimeridian")
{
    std::vector<Cell> cells = {
        test::make_cell("east", 0.0, 179.99, 10, 10.0),
        test::make_cell("west", 0.0, -179.99, 10, 10.0),
        test::make_cell("mid", 0.0, 0.0, 10, 10.0)};
    const CellIndex index(cells);

    CHECK(index.within_radius(0.0, 179.995, 5.0) == std::vector<std::size_t>{0, 1});
}
