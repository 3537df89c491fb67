#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>

#include "config.hpp"
#include "geometry.hpp"

namespace site_planner
{

// Fixed N x N partition of a bounding box. Zones are numbered row-major.
class ZoneGrid
{
public:
    ZoneGrid(const BoundingBox &bounds, int divisions);

    int zone_of(double lat, double lon) const;
    std::vector<int> neighbours(int zone) const;

private:
    BoundingBox bounds_;
    int divisions_;
};

int zone_capacity(const DeclusteringPolicy &policy, std::size_t selected_count);
bool zone_admits(const ZoneGrid &grid, const std::unordered_map<int, int> &occupancy, int zone,
                 std::size_t selected_count, const DeclusteringPolicy &policy);

} // namespace site_planner
