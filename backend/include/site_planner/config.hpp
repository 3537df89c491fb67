#pragma once

#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace site_planner
{

struct ScoringWeights
{
    double need{0.5};
    double access_barrier{0.3};
    double poverty{0.2};
    double benefit_participation{0.0};
};

struct CostModel
{
    double setup_base{100000.0};
    double setup_per_unit{60.0};
    double setup_cap{200000.0};
    double recurring_base{10000.0};
    double recurring_per_unit{12.0};
    double recurring_cap{20000.0};
};

struct ScoringModel
{
    ScoringWeights weights;
    double need_normalization{1000.0};
    double impact_need_fraction{0.4};
    double impact_population_fraction{0.3};
    CostModel costs;
};

// Months of recurring cost charged on top of setup. The fallback horizon is
// tried only while plenty of budget remains.
struct AmortizationPolicy
{
    int primary_months{12};
    int fallback_months{6};
    double fallback_setup_multiple{2.0};
    double fallback_budget_fraction{0.1};
};

struct DeclusteringPolicy
{
    bool enabled{false};
    int grid_size{6};
    // {selected count upper bound, zone capacity}, ascending.
    std::vector<std::pair<int, int>> capacity_schedule{{12, 1}, {20, 2}};
    int saturated_capacity{3};
    double neighbor_occupancy_ratio{0.7};
};

enum class PlacementStrategy
{
    RankedCells,
    RegionalRepresentatives
};

struct RegionalPlacement
{
    int region_divisions{2};
    int representative_pool_size{5};
};

struct TierParameters
{
    Tier tier{Tier::Distribution};
    double service_radius_miles{1.5};
    double min_distance_miles{0.5};
    int max_facilities{10};
    ScoringModel scoring;
    AmortizationPolicy amortization;
    DeclusteringPolicy declustering;
    PlacementStrategy placement{PlacementStrategy::RankedCells};
    RegionalPlacement regional;
    double budget_floor_fraction{0.1};
    int max_rounds{50};
    int scoring_chunk_size{256};
    int max_scoring_workers{8};
};

struct OptimizerConfig
{
    double total_budget{0.0};
    double depot_budget_fraction{0.25};
    TierParameters depot;
    TierParameters distribution;
    long long time_limit_ms{0};
    double high_need_risk_threshold{4.0};
};

OptimizerConfig default_config();
OptimizerConfig parse_config(const nlohmann::json &body, const OptimizerConfig &base);
OptimizerConfig load_config_file(const std::string &path, const OptimizerConfig &base);
void validate_config(const OptimizerConfig &config);

double depot_budget(const OptimizerConfig &config);
double distribution_budget(const OptimizerConfig &config);
const TierParameters &tier_parameters(const OptimizerConfig &config, Tier tier);

} // namespace site_planner
