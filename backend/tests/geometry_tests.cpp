#include <doctest/doctest.h>

#include <cmath>
#include <limits>

#include "site_planner/geometry.hpp"
#include "test_helpers.hpp"

using namespace site_planner;

TEST_CASE("haversine: one degree of latitude")
{
    CHECK(haversine(0.0, 0.0, 1.0, 0.0) == doctest::Approx(111194.93).epsilon(1e-6));
    CHECK(haversine_miles(0.0, 0.0, 1.0, 0.0) == doctest::Approx(69.093).epsilon(1e-4));
}

TEST_CASE("haversine: identical points and symmetry")
{
    CHECK(haversine(40.7, -74.0, 40.7, -74.0) == doctest::Approx(0.0));
    CHECK(haversine_miles(40.7, -74.0, 34.05, -118.24) ==
          doctest::Approx(haversine_miles(34.05, -118.24, 40.7, -74.0)));
    // New York to Los Angeles, roughly 2450 miles on a sphere.
    CHECK(haversine_miles(40.7, -74.0, 34.05, -118.24) == doctest::Approx(2445.0).epsilon(0.01));
}

TEST_CASE("lat_offset helper spans the requested miles")
{
    const double lat = test::kBaseLat + test::lat_offset(2.5);
    CHECK(haversine_miles(test::kBaseLat, test::kBaseLon, lat, test::kBaseLon) == doctest::Approx(2.5));
}

TEST_CASE("is_valid_coordinate rejects out-of-range and non-finite values")
{
    CHECK(is_valid_coordinate(0.0, 0.0));
    CHECK(is_valid_coordinate(-90.0, 180.0));
    CHECK_FALSE(is_valid_coordinate(91.0, 0.0));
    CHECK_FALSE(is_valid_coordinate(0.0, -180.5));
    CHECK_FALSE(is_valid_coordinate(std::numeric_limits<double>::quiet_NaN(), 0.0));
    CHECK_FALSE(is_valid_coordinate(0.0, std::numeric_limits<double>::infinity()));
}

TEST_CASE("bounding_box ignores malformed centroids")
{
    std::vector<Cell> cells = {
        test::make_cell("a", 40.0, -75.0, 10, 10.0),
        test::make_cell("b", 40.5, -74.2, 10, 10.0),
        test::make_cell("bad", 95.0, 10.0, 10, 10.0),
        test::make_cell("c", 39.8, -74.6, 10, 10.0)};

    const BoundingBox box = bounding_box(cells);
    CHECK(box.min_lat == doctest::Approx(39.8));
    CHECK(box.max_lat == doctest::Approx(40.5));
    CHECK(box.min_lon == doctest::Approx(-75.0));
    CHECK(box.max_lon == doctest::Approx(-74.2));
}
