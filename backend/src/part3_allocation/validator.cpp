#include "site_planner/validator.hpp"

#include <iostream>
#include <string>
#include <unordered_map>
#include <utility>

#include "site_planner/allocator.hpp"
#include "site_planner/coverage.hpp"
#include "site_planner/kdtree.hpp"

namespace site_planner
{
namespace
{

// Remaining budget is reduced cost by cost, in the same order and the same way
// SelectionState::commit reduces it, so an exact fit during allocation is an
// exact fit here too.
struct BudgetLedger
{
    double budget{};
    double remaining{};
    double used{};

    explicit BudgetLedger(double amount)
        : budget(amount), remaining(amount) {}

    void charge(double cost)
    {
        remaining = remaining - cost;
        used += cost;
    }
};

// The two tier shares are derived from the total separately, so the overall
// check allows for rounding between them.
constexpr double kTotalBudgetTolerance = 1e-9;

// Re-derives the amortized cost against the tier's remaining share and the
// overall budget. Returns false when the facility no longer fits.
bool recommit(Facility &facility, BudgetLedger &tier, BudgetLedger &total, const AmortizationPolicy &policy,
              int &adjustments)
{
    const auto commitment = plan_commitment(facility.setup_cost, facility.recurring_cost,
                                            tier.remaining, tier.budget, policy);
    if (!commitment || commitment->cost > total.remaining + kTotalBudgetTolerance * total.budget)
    {
        return false;
    }

    if (commitment->months != facility.amortization_months)
    {
        std::cout << "Re-amortized " << facility.id << " over " << commitment->months << " months." << std::endl;
        adjustments++;
    }

    facility.amortization_months = commitment->months;
    facility.committed_cost = commitment->cost;
    tier.charge(commitment->cost);
    total.charge(commitment->cost);
    return true;
}

} // namespace

ValidationOutcome validate_facilities(const std::vector<Facility> &facilities, const std::vector<Cell> &cells,
                                      const OptimizerConfig &config)
{
    ValidationOutcome outcome;
    const CellIndex index(cells);

    BudgetLedger depot_ledger(depot_budget(config));
    BudgetLedger distribution_ledger(distribution_budget(config));
    BudgetLedger total_ledger(config.total_budget);
    const AmortizationPolicy &depot_policy = tier_parameters(config, Tier::Depot).amortization;
    const AmortizationPolicy &distribution_policy = tier_parameters(config, Tier::Distribution).amortization;

    std::vector<Facility> depots;
    for (const auto &proposed : facilities)
    {
        if (proposed.tier != Tier::Depot)
        {
            continue;
        }

        Facility depot = proposed;
        depot.served_facility_ids.clear();

        if (!index.any_within_radius(depot.lat, depot.lon, depot.service_radius))
        {
            std::cout << "Dropping " << depot.id << ": serves no cells." << std::endl;
            outcome.adjustments_made++;
            continue;
        }

        if (!recommit(depot, depot_ledger, total_ledger, depot_policy, outcome.adjustments_made))
        {
            std::cout << "Dropping " << depot.id << ": exceeds depot budget." << std::endl;
            outcome.adjustments_made++;
            continue;
        }

        depots.push_back(std::move(depot));
    }

    std::vector<const Facility *> depot_refs;
    for (const auto &depot : depots)
    {
        depot_refs.push_back(&depot);
    }

    std::vector<Facility> distribution;
    for (const auto &proposed : facilities)
    {
        if (proposed.tier != Tier::Distribution)
        {
            continue;
        }

        Facility facility = proposed;

        if (!index.any_within_radius(facility.lat, facility.lon, facility.service_radius))
        {
            std::cout << "Dropping " << facility.id << ": serves no cells." << std::endl;
            outcome.adjustments_made++;
            continue;
        }

        const Facility *serving = select_serving_depot(depot_refs, facility.lat, facility.lon);
        if (!depot_refs.empty() && !serving)
        {
            std::cout << "Dropping " << facility.id << ": outside every depot radius." << std::endl;
            outcome.adjustments_made++;
            continue;
        }

        if (!recommit(facility, distribution_ledger, total_ledger, distribution_policy,
                      outcome.adjustments_made))
        {
            std::cout << "Dropping " << facility.id << ": exceeds distribution budget." << std::endl;
            outcome.adjustments_made++;
            continue;
        }

        facility.depot_id = serving ? serving->id : std::string();
        distribution.push_back(std::move(facility));
    }

    std::unordered_map<std::string, Facility *> depot_by_id;
    for (auto &depot : depots)
    {
        depot_by_id[depot.id] = &depot;
    }
    for (const auto &facility : distribution)
    {
        const auto it = depot_by_id.find(facility.depot_id);
        if (it != depot_by_id.end())
        {
            it->second->served_facility_ids.push_back(facility.id);
        }
    }

    outcome.facilities = std::move(depots);
    outcome.facilities.insert(outcome.facilities.end(), distribution.begin(), distribution.end());

    std::vector<char> covered(cells.size(), 0);
    for (const auto &facility : outcome.facilities)
    {
        outcome.total_expected_impact += facility.expected_impact;
        for (std::size_t cell_index : index.within_radius(facility.lat, facility.lon, facility.service_radius))
        {
            covered[cell_index] = 1;
        }
    }

    for (char flag : covered)
    {
        if (flag)
        {
            outcome.cells_covered++;
        }
    }

    outcome.depot_budget_used = depot_ledger.used;
    outcome.distribution_budget_used = distribution_ledger.used;
    outcome.budget_used = total_ledger.used;
    outcome.coverage_percentage =
        cells.empty() ? 0.0 : 100.0 * static_cast<double>(outcome.cells_covered) / static_cast<double>(cells.size());

    std::cout << "Validation complete: " << outcome.facilities.size() << " facilities kept, "
              << outcome.adjustments_made << " adjustments made." << std::endl;

    return outcome;
}

} // namespace site_planner
