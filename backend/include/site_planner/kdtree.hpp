#pragma once

#include <cstddef>
#include <vector>

#include "types.hpp"

namespace site_planner
{

struct KDTreeNode
{
    std::size_t cell_index{};
    double lat{};
    double lon{};
    int axis{};
    int left{-1};
    int right{-1};
};

// Static 2-d tree over cell centroids. Holds a reference to the cell vector,
// which must outlive the index.
class CellIndex
{
public:
    explicit CellIndex(const std::vector<Cell> &cells);

    std::vector<std::size_t> within_radius(double lat, double lon, double radius_miles) const;
    bool any_within_radius(double lat, double lon, double radius_miles) const;
    std::size_t size() const { return cells_.size(); }

private:
    int build(std::vector<std::size_t> &indices, std::size_t begin, std::size_t end, int depth);
    bool search(int node, double lat, double lon, double radius_metres, bool stop_at_first,
                std::vector<std::size_t> *out) const;

    const std::vector<Cell> &cells_;
    std::vector<KDTreeNode> nodes_;
    int root_{-1};
    double max_abs_lat_{0.0};
};

} // namespace site_planner
