#pragma once

#include <vector>

#include "types.hpp"

namespace site_planner
{

constexpr double kEarthRadiusMetres = 6371000.0;
constexpr double kMetresPerMile = 1609.344;

struct BoundingBox
{
    double min_lat{};
    double min_lon{};
    double max_lat{};
    double max_lon{};
};

double haversine(double lat1, double lon1, double lat2, double lon2);
double haversine_miles(double lat1, double lon1, double lat2, double lon2);
bool is_valid_coordinate(double lat, double lon);
BoundingBox bounding_box(const std::vector<Cell> &cells);

} // namespace site_planner
