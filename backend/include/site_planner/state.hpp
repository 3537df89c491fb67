#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "types.hpp"

namespace site_planner
{

// Owned by a single allocator run; never shared between threads.
struct SelectionState
{
    double original_budget{};
    double remaining_budget{};
    std::unordered_set<std::string> used_cell_ids;
    std::unordered_map<int, int> zone_occupancy;
    std::vector<Facility> selected;

    explicit SelectionState(double budget)
        : original_budget(budget), remaining_budget(budget) {}

    void commit(Facility facility, int zone);
};

} // namespace site_planner
