#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace site_planner
{

using Clock = std::chrono::steady_clock;

struct Commitment
{
    int months{0};
    double cost{};
};

struct AllocationResult
{
    std::vector<Facility> facilities;
    TierReport report;
};

std::optional<Commitment> plan_commitment(double setup_cost, double recurring_cost, double remaining_budget,
                                          double original_budget, const AmortizationPolicy &policy);

std::vector<ScoredCandidate> build_regional_candidates(const std::vector<Cell> &pool, const TierParameters &params);

AllocationResult allocate_facilities(const std::vector<Cell> &pool, const TierParameters &params, double budget,
                                     const std::unordered_set<std::string> &reserved_cell_ids = {},
                                     Clock::time_point deadline = Clock::time_point::max());

} // namespace site_planner
