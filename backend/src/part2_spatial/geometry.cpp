#include "site_planner/geometry.hpp"

#include <algorithm>
#include <cmath>

//for building with x64 mingw
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace site_planner
{

double haversine(double lat1, double lon1, double lat2, double lon2)
{
    double phi1 = lat1 * M_PI / 180.0;
    double phi2 = lat2 * M_PI / 180.0;
    double delta_phi = (lat2 - lat1) * M_PI / 180.0;
    double delta_lambda = (lon2 - lon1) * M_PI / 180.0;

    double a = std::sin(delta_phi / 2.0) * std::sin(delta_phi / 2.0) +
               std::cos(phi1) * std::cos(phi2) * std::sin(delta_lambda / 2.0) * std::sin(delta_lambda / 2.0);
    double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));

    return kEarthRadiusMetres * c;
}

double haversine_miles(double lat1, double lon1, double lat2, double lon2)
{
    return haversine(lat1, lon1, lat2, lon2) / kMetresPerMile;
}

bool is_valid_coordinate(double lat, double lon)
{
    return std::isfinite(lat) && std::isfinite(lon) &&
           lat >= -90.0 && lat <= 90.0 &&
           lon >= -180.0 && lon <= 180.0;
}

BoundingBox bounding_box(const std::vector<Cell> &cells)
{
    BoundingBox box;
    bool first = true;

    for (const auto &cell : cells)
    {
        if (!is_valid_coordinate(cell.lat, cell.lon))
        {
            continue;
        }

        if (first)
        {
            box = {cell.lat, cell.lon, cell.lat, cell.lon};
            first = false;
            continue;
        }

        box.min_lat = std::min(box.min_lat, cell.lat);
        box.min_lon = std::min(box.min_lon, cell.lon);
        box.max_lat = std::max(box.max_lat, cell.lat);
        box.max_lon = std::max(box.max_lon, cell.lon);
    }

    return box;
}

} // namespace site_planner
