#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "types.hpp"

namespace site_planner
{

struct CoverageResult
{
    std::vector<Cell> cells;
    // cell id -> id of the depot that serves it
    std::unordered_map<std::string, std::string> serving_depot;
    std::unordered_set<std::string> reserved_cell_ids;
    bool fallback_applied{false};
};

const Facility *select_serving_depot(const std::vector<const Facility *> &depots, double lat, double lon);

CoverageResult filter_by_depot_coverage(const std::vector<Facility> &depots, const std::vector<Cell> &pool);

void link_served_facilities(std::vector<Facility> &depots, std::vector<Facility> &distribution,
                            const CoverageResult &coverage);

} // namespace site_planner
