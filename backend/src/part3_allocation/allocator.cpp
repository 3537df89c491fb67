#include "site_planner/allocator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <string>
#include <utility>

#include "site_planner/geometry.hpp"
#include "site_planner/scorer.hpp"
#include "site_planner/state.hpp"
#include "site_planner/zone_grid.hpp"

namespace site_planner
{
namespace
{

std::string facility_id(Tier tier, const std::string &cell_id)
{
    return (tier == Tier::Depot ? "depot-" : "site-") + cell_id;
}

void check_candidate(const ScoredCandidate &candidate)
{
    if (!candidate.cell)
    {
        throw InvariantViolation("Scored candidate without an anchor cell");
    }
    if (!std::isfinite(candidate.efficiency_score) || !std::isfinite(candidate.expected_impact) ||
        !std::isfinite(candidate.setup_cost) || !std::isfinite(candidate.recurring_cost) ||
        candidate.setup_cost < 0.0 || candidate.recurring_cost < 0.0)
    {
        throw InvariantViolation("Candidate " + candidate.cell->id + " carries a non-finite or negative value");
    }
}

bool too_close(const ScoredCandidate &candidate, const std::vector<Facility> &selected, double min_distance_miles)
{
    for (const auto &facility : selected)
    {
        if (haversine_miles(candidate.cell->lat, candidate.cell->lon, facility.lat, facility.lon) < min_distance_miles)
        {
            return true;
        }
    }
    return false;
}

Facility make_facility(const ScoredCandidate &candidate, const TierParameters &params, const Commitment &commitment)
{
    Facility facility;
    facility.id = facility_id(params.tier, candidate.cell->id);
    facility.anchor_cell_id = candidate.cell->id;
    facility.lat = candidate.cell->lat;
    facility.lon = candidate.cell->lon;
    facility.tier = params.tier;
    facility.service_radius = params.service_radius_miles;
    facility.setup_cost = candidate.setup_cost;
    facility.recurring_cost = candidate.recurring_cost;
    facility.amortization_months = commitment.months;
    facility.committed_cost = commitment.cost;
    facility.efficiency_score = candidate.efficiency_score;
    facility.expected_impact = candidate.expected_impact;
    return facility;
}

Cell aggregate_region(const std::vector<const Cell *> &members, const Cell &representative)
{
    Cell aggregate;
    aggregate.id = representative.id;
    aggregate.lat = representative.lat;
    aggregate.lon = representative.lon;

    double poverty = 0.0;
    double benefit = 0.0;
    double vehicle = 0.0;
    double risk = 0.0;

    for (const Cell *cell : members)
    {
        aggregate.population += cell->population;
        aggregate.need_index += cell->need_index;
        poverty += cell->poverty_rate * cell->population;
        benefit += cell->benefit_rate * cell->population;
        vehicle += cell->vehicle_access_rate * cell->population;
        risk += cell->risk_score * cell->population;
    }

    const double population = static_cast<double>(aggregate.population);
    aggregate.poverty_rate = poverty / population;
    aggregate.benefit_rate = benefit / population;
    aggregate.vehicle_access_rate = vehicle / population;
    aggregate.risk_score = risk / population;

    return aggregate;
}

const Cell *pick_representative(const std::vector<const Cell *> &members, int pool_size)
{
    double weight_sum = 0.0;
    double lat_sum = 0.0;
    double lon_sum = 0.0;
    double need_total = 0.0;

    for (const Cell *cell : members)
    {
        need_total += cell->need_index;
    }

    for (const Cell *cell : members)
    {
        const double weight = need_total > 0.0 ? cell->need_index : static_cast<double>(cell->population);
        weight_sum += weight;
        lat_sum += cell->lat * weight;
        lon_sum += cell->lon * weight;
    }

    const double centre_lat = weight_sum > 0.0 ? lat_sum / weight_sum : members.front()->lat;
    const double centre_lon = weight_sum > 0.0 ? lon_sum / weight_sum : members.front()->lon;

    std::vector<std::pair<double, const Cell *>> by_distance;
    by_distance.reserve(members.size());
    for (const Cell *cell : members)
    {
        by_distance.push_back({haversine(centre_lat, centre_lon, cell->lat, cell->lon), cell});
    }

    std::sort(by_distance.begin(), by_distance.end(),
              [](const auto &a, const auto &b)
              {
                  if (a.first != b.first)
                  {
                      return a.first < b.first;
                  }
                  return a.second->id < b.second->id;
              });

    // Among the cells nearest the region's need centre, anchor on the one with the
    // least individual need so prime distribution sites stay available.
    const std::size_t limit = std::min(by_distance.size(), static_cast<std::size_t>(std::max(1, pool_size)));
    const Cell *representative = by_distance.front().second;
    for (std::size_t i = 1; i < limit; i++)
    {
        if (by_distance[i].second->need_index < representative->need_index)
        {
            representative = by_distance[i].second;
        }
    }

    return representative;
}

} // namespace

std::optional<Commitment> plan_commitment(double setup_cost, double recurring_cost, double remaining_budget,
                                          double original_budget, const AmortizationPolicy &policy)
{
    if (!std::isfinite(setup_cost) || !std::isfinite(recurring_cost) || !std::isfinite(remaining_budget) ||
        setup_cost < 0.0 || recurring_cost < 0.0)
    {
        throw InvariantViolation("Non-finite cost reached budget planning");
    }

    const double primary = setup_cost + static_cast<double>(policy.primary_months) * recurring_cost;
    if (primary <= remaining_budget)
    {
        return Commitment{policy.primary_months, primary};
    }

    if (remaining_budget > policy.fallback_setup_multiple * setup_cost &&
        remaining_budget > policy.fallback_budget_fraction * original_budget)
    {
        const double fallback = setup_cost + static_cast<double>(policy.fallback_months) * recurring_cost;
        if (fallback <= remaining_budget)
        {
            return Commitment{policy.fallback_months, fallback};
        }
    }

    return std::nullopt;
}

std::vector<ScoredCandidate> build_regional_candidates(const std::vector<Cell> &pool, const TierParameters &params)
{
    std::vector<const Cell *> usable;
    usable.reserve(pool.size());
    for (const auto &cell : pool)
    {
        if (is_scorable(cell))
        {
            usable.push_back(&cell);
        }
    }

    std::vector<ScoredCandidate> candidates;
    if (usable.empty())
    {
        return candidates;
    }

    const ZoneGrid regions(bounding_box(pool), params.regional.region_divisions);
    std::map<int, std::vector<const Cell *>> members_by_region;
    for (const Cell *cell : usable)
    {
        members_by_region[regions.zone_of(cell->lat, cell->lon)].push_back(cell);
    }

    for (const auto &[region, members] : members_by_region)
    {
        const Cell *representative = pick_representative(members, params.regional.representative_pool_size);
        const Cell aggregate = aggregate_region(members, *representative);

        if (auto candidate = score_cell(aggregate, params.scoring))
        {
            candidate->cell = representative;
            candidates.push_back(*candidate);
        }
        else
        {
            std::cerr << "Region " << region << " produced no depot candidate." << std::endl;
        }
    }

    return candidates;
}

AllocationResult allocate_facilities(const std::vector<Cell> &pool, const TierParameters &params, double budget,
                                     const std::unordered_set<std::string> &reserved_cell_ids,
                                     Clock::time_point deadline)
{
    const auto start_time = Clock::now();

    AllocationResult result;
    result.report.budget = budget;
    result.report.budget_remaining = budget;

    if (!std::isfinite(budget))
    {
        throw InvariantViolation("Non-finite budget handed to allocator");
    }

    std::vector<ScoredCandidate> candidates =
        params.placement == PlacementStrategy::RegionalRepresentatives
            ? build_regional_candidates(pool, params)
            : score_cells(pool, params.scoring, params.scoring_chunk_size, params.max_scoring_workers);
    rank_candidates(candidates);
    result.report.candidates_scored = candidates.size();

    std::cout << "Allocating " << tier_name(params.tier) << " tier: " << candidates.size()
              << " candidates, budget " << budget << std::endl;

    if (candidates.empty() || budget <= 0.0 || params.max_facilities <= 0)
    {
        return result;
    }

    for (const auto &candidate : candidates)
    {
        check_candidate(candidate);
    }

    SelectionState state(budget);
    state.used_cell_ids.insert(reserved_cell_ids.begin(), reserved_cell_ids.end());

    const ZoneGrid grid(bounding_box(pool), params.declustering.grid_size);
    const double budget_floor = budget * params.budget_floor_fraction;
    const std::size_t max_facilities = static_cast<std::size_t>(params.max_facilities);

    while (result.report.rounds < params.max_rounds)
    {
        if (Clock::now() >= deadline)
        {
            result.report.timed_out = true;
            std::cout << "Time limit reached before round " << result.report.rounds + 1 << "." << std::endl;
            break;
        }

        result.report.rounds++;
        int added = 0;

        for (const auto &candidate : candidates)
        {
            if (state.selected.size() >= max_facilities)
            {
                break;
            }

            const Cell &cell = *candidate.cell;
            if (state.used_cell_ids.count(cell.id))
            {
                continue;
            }

            const int zone = grid.zone_of(cell.lat, cell.lon);
            if (params.declustering.enabled &&
                !zone_admits(grid, state.zone_occupancy, zone, state.selected.size(), params.declustering))
            {
                continue;
            }

            if (too_close(candidate, state.selected, params.min_distance_miles))
            {
                continue;
            }

            const auto commitment = plan_commitment(candidate.setup_cost, candidate.recurring_cost,
                                                    state.remaining_budget, state.original_budget,
                                                    params.amortization);
            if (!commitment)
            {
                continue;
            }

            state.commit(make_facility(candidate, params, *commitment), zone);
            added++;
        }

        std::cout << "Round " << result.report.rounds << ": added " << added << ", "
                  << state.selected.size() << " selected, remaining budget "
                  << state.remaining_budget << std::endl;

        if (added == 0 || state.remaining_budget < budget_floor || state.selected.size() >= max_facilities)
        {
            break;
        }
    }

    double efficiency_sum = 0.0;
    for (const auto &facility : state.selected)
    {
        efficiency_sum += facility.efficiency_score;
    }

    result.report.average_efficiency = state.selected.empty() ? 0.0 : efficiency_sum / state.selected.size();
    result.report.budget_remaining = state.remaining_budget;
    result.report.elapsed_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_time).count();
    result.facilities = std::move(state.selected);

    std::cout << "Selected " << result.facilities.size() << " " << tier_name(params.tier)
              << " facilities in " << result.report.rounds << " rounds ("
              << result.report.elapsed_ms << " ms)." << std::endl;

    return result;
}

} // namespace site_planner
