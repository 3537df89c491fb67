#include "site_planner/coverage.hpp"

#include <iostream>

#include "site_planner/geometry.hpp"
#include "site_planner/kdtree.hpp"

namespace site_planner
{

// Among depots whose radius reaches the point, prefer the one with more
// capacity, then the nearer one, then the lower id.
const Facility *select_serving_depot(const std::vector<const Facility *> &depots, double lat, double lon)
{
    const Facility *best = nullptr;
    double best_distance = 0.0;

    for (const Facility *depot : depots)
    {
        const double distance = haversine_miles(lat, lon, depot->lat, depot->lon);
        if (distance > depot->service_radius)
        {
            continue;
        }

        if (!best ||
            depot->expected_impact > best->expected_impact ||
            (depot->expected_impact == best->expected_impact &&
             (distance < best_distance || (distance == best_distance && depot->id < best->id))))
        {
            best = depot;
            best_distance = distance;
        }
    }

    return best;
}

CoverageResult filter_by_depot_coverage(const std::vector<Facility> &depots, const std::vector<Cell> &pool)
{
    CoverageResult result;

    for (const auto &depot : depots)
    {
        result.reserved_cell_ids.insert(depot.anchor_cell_id);
    }

    if (depots.empty())
    {
        std::cout << "No depots selected; distribution tier runs without a coverage constraint." << std::endl;
        result.cells = pool;
        result.fallback_applied = true;
        return result;
    }

    const CellIndex index(pool);
    std::vector<std::vector<const Facility *>> covering(pool.size());

    for (const auto &depot : depots)
    {
        for (std::size_t cell_index : index.within_radius(depot.lat, depot.lon, depot.service_radius))
        {
            covering[cell_index].push_back(&depot);
        }
    }

    for (std::size_t i = 0; i < pool.size(); i++)
    {
        if (covering[i].empty())
        {
            continue;
        }

        const Facility *depot = select_serving_depot(covering[i], pool[i].lat, pool[i].lon);
        if (!depot)
        {
            continue;
        }

        result.cells.push_back(pool[i]);
        result.serving_depot[pool[i].id] = depot->id;
    }

    if (result.cells.empty())
    {
        std::cout << "No cells fall inside any depot radius; using the unfiltered pool." << std::endl;
        result.cells = pool;
        result.fallback_applied = true;
        return result;
    }

    std::cout << "Depot coverage keeps " << result.cells.size() << " of " << pool.size() << " cells." << std::endl;
    return result;
}

void link_served_facilities(std::vector<Facility> &depots, std::vector<Facility> &distribution,
                            const CoverageResult &coverage)
{
    std::vector<const Facility *> depot_refs;
    depot_refs.reserve(depots.size());
    for (const auto &depot : depots)
    {
        depot_refs.push_back(&depot);
    }

    for (auto &facility : distribution)
    {
        std::string depot_id;

        const auto it = coverage.serving_depot.find(facility.anchor_cell_id);
        if (it != coverage.serving_depot.end())
        {
            depot_id = it->second;
        }
        else if (const Facility *depot = select_serving_depot(depot_refs, facility.lat, facility.lon))
        {
            depot_id = depot->id;
        }

        facility.depot_id = depot_id;
        if (depot_id.empty())
        {
            continue;
        }

        for (auto &depot : depots)
        {
            if (depot.id == depot_id)
            {
                depot.served_facility_ids.push_back(facility.id);
                break;
            }
        }
    }
}

} // namespace site_planner
