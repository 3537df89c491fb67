#include "site_planner/state.hpp"

#include <cmath>
#include <utility>

namespace site_planner
{

void SelectionState::commit(Facility facility, int zone)
{
    const double remaining = remaining_budget - facility.committed_cost;
    if (!std::isfinite(remaining))
    {
        throw InvariantViolation("Non-finite budget after committing " + facility.id);
    }

    remaining_budget = remaining;
    used_cell_ids.insert(facility.anchor_cell_id);
    zone_occupancy[zone]++;
    selected.push_back(std::move(facility));
}

} // namespace site_planner
