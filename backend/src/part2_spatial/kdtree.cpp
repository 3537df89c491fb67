#include "site_planner/kdtree.hpp"

#include <algorithm>
#include <cmath>

#include "site_planner/geometry.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace site_planner
{
namespace
{

constexpr double kDegToRad = M_PI / 180.0;

} // namespace

CellIndex::CellIndex(const std::vector<Cell> &cells)
    : cells_(cells)
{
    std::vector<std::size_t> indices;
    indices.reserve(cells_.size());

    for (std::size_t i = 0; i < cells_.size(); i++)
    {
        if (!is_valid_coordinate(cells_[i].lat, cells_[i].lon))
        {
            continue;
        }
        indices.push_back(i);
        max_abs_lat_ = std::max(max_abs_lat_, std::abs(cells_[i].lat));
    }

    nodes_.reserve(indices.size());
    root_ = build(indices, 0, indices.size(), 0);
}

int CellIndex::build(std::vector<std::size_t> &indices, std::size_t begin, std::size_t end, int depth)
{
    if (begin >= end)
    {
        return -1;
    }

    const int axis = depth % 2;

    std::sort(indices.begin() + begin, indices.begin() + end,
              [this, axis](std::size_t a, std::size_t b)
              {
                  return (axis == 0) ? cells_[a].lat < cells_[b].lat : cells_[a].lon < cells_[b].lon;
              });

    const std::size_t median_idx = begin + (end - begin) / 2;
    const Cell &median = cells_[indices[median_idx]];

    const int node_id = static_cast<int>(nodes_.size());
    nodes_.push_back({indices[median_idx], median.lat, median.lon, axis, -1, -1});

    const int left = build(indices, begin, median_idx, depth + 1);
    const int right = build(indices, median_idx + 1, end, depth + 1);
    nodes_[node_id].left = left;
    nodes_[node_id].right = right;

    return node_id;
}

bool CellIndex::search(int node_id, double lat, double lon, double radius_metres, bool stop_at_first,
                       std::vector<std::size_t> *out) const
{
    if (node_id < 0)
    {
        return false;
    }

    const KDTreeNode &node = nodes_[node_id];

    if (haversine(lat, lon, node.lat, node.lon) <= radius_metres)
    {
        if (out)
        {
            out->push_back(node.cell_index);
        }
        if (stop_at_first)
        {
            return true;
        }
    }

    const double diff = (node.axis == 0) ? (lat - node.lat) : (lon - node.lon);
    const int near_side = (diff < 0) ? node.left : node.right;
    const int far_side = (diff < 0) ? node.right : node.left;

    if (search(near_side, lat, lon, radius_metres, stop_at_first, out) && stop_at_first)
    {
        return true;
    }

    // Lower bound on the great-circle distance to anything across the split.
    double axis_dist = 0.0;
    if (node.axis == 0)
    {
        axis_dist = kEarthRadiusMetres * std::abs(diff) * kDegToRad;
    }
    else
    {
        // Cells across the split may still be close through the antimeridian.
        const double wrap = (diff < 0) ? 180.0 + lon : 180.0 - lon;
        const double lambda = std::max(0.0, std::min(std::abs(diff), wrap));
        const double lat_bound = std::max(max_abs_lat_, std::abs(lat));
        const double half_lambda = std::min(M_PI, lambda * kDegToRad) / 2.0;
        const double s = std::min(1.0, std::cos(lat_bound * kDegToRad) * std::sin(half_lambda));
        axis_dist = 2.0 * kEarthRadiusMetres * std::asin(s);
    }

    if (axis_dist <= radius_metres)
    {
        return search(far_side, lat, lon, radius_metres, stop_at_first, out);
    }

    return false;
}

std::vector<std::size_t> CellIndex::within_radius(double lat, double lon, double radius_miles) const
{
    std::vector<std::size_t> found;
    if (!is_valid_coordinate(lat, lon) || radius_miles < 0.0)
    {
        return found;
    }

    search(root_, lat, lon, radius_miles * kMetresPerMile, false, &found);
    std::sort(found.begin(), found.end());
    return found;
}

bool CellIndex::any_within_radius(double lat, double lon, double radius_miles) const
{
    if (!is_valid_coordinate(lat, lon) || radius_miles < 0.0)
    {
        return false;
    }

    return search(root_, lat, lon, radius_miles * kMetresPerMile, true, nullptr);
}

} // namespace site_planner
