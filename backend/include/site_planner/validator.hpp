#pragma once

#include <cstddef>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace site_planner
{

struct ValidationOutcome
{
    std::vector<Facility> facilities;
    double total_expected_impact{};
    double depot_budget_used{};
    double distribution_budget_used{};
    double budget_used{};
    int adjustments_made{0};
    std::size_t cells_covered{0};
    double coverage_percentage{};
};

ValidationOutcome validate_facilities(const std::vector<Facility> &facilities, const std::vector<Cell> &cells,
                                      const OptimizerConfig &config);

} // namespace site_planner
