#include "site_planner/zone_grid.hpp"

#include <algorithm>
#include <cmath>

namespace site_planner
{
namespace
{

int clamp_index(double fraction, int divisions)
{
    if (!std::isfinite(fraction) || fraction < 0.0)
    {
        return 0;
    }

    const int index = static_cast<int>(fraction * divisions);
    return std::min(index, divisions - 1);
}

} // namespace

ZoneGrid::ZoneGrid(const BoundingBox &bounds, int divisions)
    : bounds_(bounds), divisions_(std::max(1, divisions))
{
}

int ZoneGrid::zone_of(double lat, double lon) const
{
    const double lat_span = bounds_.max_lat - bounds_.min_lat;
    const double lon_span = bounds_.max_lon - bounds_.min_lon;

    const int row = lat_span > 0.0 ? clamp_index((lat - bounds_.min_lat) / lat_span, divisions_) : 0;
    const int col = lon_span > 0.0 ? clamp_index((lon - bounds_.min_lon) / lon_span, divisions_) : 0;

    return row * divisions_ + col;
}

std::vector<int> ZoneGrid::neighbours(int zone) const
{
    std::vector<int> result;
    const int row = zone / divisions_;
    const int col = zone % divisions_;

    for (int dr = -1; dr <= 1; dr++)
    {
        for (int dc = -1; dc <= 1; dc++)
        {
            if (dr == 0 && dc == 0)
            {
                continue;
            }

            const int nr = row + dr;
            const int nc = col + dc;
            if (nr < 0 || nr >= divisions_ || nc < 0 || nc >= divisions_)
            {
                continue;
            }

            result.push_back(nr * divisions_ + nc);
        }
    }

    return result;
}

int zone_capacity(const DeclusteringPolicy &policy, std::size_t selected_count)
{
    for (const auto &[upper_bound, capacity] : policy.capacity_schedule)
    {
        if (selected_count < static_cast<std::size_t>(std::max(0, upper_bound)))
        {
            return capacity;
        }
    }
    return policy.saturated_capacity;
}

bool zone_admits(const ZoneGrid &grid, const std::unordered_map<int, int> &occupancy, int zone,
                 std::size_t selected_count, const DeclusteringPolicy &policy)
{
    const auto it = occupancy.find(zone);
    const int occupied = it == occupancy.end() ? 0 : it->second;
    const int capacity = zone_capacity(policy, selected_count);

    if (occupied < capacity)
    {
        return true;
    }

    // A saturated zone may take one more once its surroundings have filled in.
    if (occupied > capacity)
    {
        return false;
    }

    const auto neighbour_zones = grid.neighbours(zone);
    if (neighbour_zones.empty())
    {
        return false;
    }

    int occupied_neighbours = 0;
    for (int neighbour : neighbour_zones)
    {
        const auto nit = occupancy.find(neighbour);
        if (nit != occupancy.end() && nit->second > 0)
        {
            occupied_neighbours++;
        }
    }

    const double ratio = static_cast<double>(occupied_neighbours) / neighbour_zones.size();
    return ratio >= policy.neighbor_occupancy_ratio;
}

} // namespace site_planner
