#include "site_planner/config.hpp"

#include <cmath>
#include <fstream>
#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace site_planner
{
namespace
{

using json = nlohmann::json;

template <typename T>
T first_value(const json &body, std::initializer_list<const char *> keys, T fallback)
{
    for (const char *key : keys)
    {
        const auto it = body.find(key);
        if (it != body.end() && !it->is_null())
        {
            return it->get<T>();
        }
    }
    return fallback;
}

void apply_costs(const json &body, CostModel &costs)
{
    costs.setup_base = body.value("setupBase", costs.setup_base);
    costs.setup_per_unit = body.value("setupPerUnit", costs.setup_per_unit);
    costs.setup_cap = body.value("setupCap", costs.setup_cap);
    costs.recurring_base = body.value("recurringBase", costs.recurring_base);
    costs.recurring_per_unit = body.value("recurringPerUnit", costs.recurring_per_unit);
    costs.recurring_cap = body.value("recurringCap", costs.recurring_cap);
}

void apply_amortization(const json &body, AmortizationPolicy &policy)
{
    policy.primary_months = body.value("primaryMonths", policy.primary_months);
    policy.fallback_months = body.value("fallbackMonths", policy.fallback_months);
    policy.fallback_setup_multiple = body.value("fallbackSetupMultiple", policy.fallback_setup_multiple);
    policy.fallback_budget_fraction = body.value("fallbackBudgetFraction", policy.fallback_budget_fraction);
}

void apply_declustering(const json &body, DeclusteringPolicy &policy)
{
    policy.enabled = body.value("enabled", policy.enabled);
    policy.grid_size = body.value("gridSize", policy.grid_size);
    policy.saturated_capacity = body.value("saturatedCapacity", policy.saturated_capacity);
    policy.neighbor_occupancy_ratio = body.value("neighborOccupancyRatio", policy.neighbor_occupancy_ratio);

    if (body.contains("capacitySchedule") && body["capacitySchedule"].is_array())
    {
        policy.capacity_schedule.clear();
        for (const auto &step : body["capacitySchedule"])
        {
            if (!step.is_array() || step.size() != 2)
            {
                throw ConfigError("capacitySchedule entries must be [selectedBelow, capacity] pairs");
            }
            policy.capacity_schedule.emplace_back(step[0].get<int>(), step[1].get<int>());
        }
    }
}

void apply_tier(const json &body, TierParameters &tier)
{
    tier.service_radius_miles = body.value("serviceRadius", tier.service_radius_miles);
    tier.min_distance_miles = body.value("minDistance", tier.min_distance_miles);
    tier.max_facilities = body.value("maxFacilities", tier.max_facilities);
    tier.budget_floor_fraction = body.value("budgetFloorFraction", tier.budget_floor_fraction);
    tier.max_rounds = body.value("maxRounds", tier.max_rounds);
    tier.regional.region_divisions = body.value("regionDivisions", tier.regional.region_divisions);
    tier.regional.representative_pool_size = body.value("representativePoolSize", tier.regional.representative_pool_size);

    if (body.contains("costs") && body["costs"].is_object())
    {
        apply_costs(body["costs"], tier.scoring.costs);
    }
    if (body.contains("amortization") && body["amortization"].is_object())
    {
        apply_amortization(body["amortization"], tier.amortization);
    }
    if (body.contains("declustering") && body["declustering"].is_object())
    {
        apply_declustering(body["declustering"], tier.declustering);
    }
}

void apply_shared(const json &body, TierParameters &tier)
{
    if (body.contains("scoringWeights") && body["scoringWeights"].is_object())
    {
        const auto &weights = body["scoringWeights"];
        tier.scoring.weights.need = weights.value("need", tier.scoring.weights.need);
        tier.scoring.weights.access_barrier = weights.value("accessBarrier", tier.scoring.weights.access_barrier);
        tier.scoring.weights.poverty = weights.value("poverty", tier.scoring.weights.poverty);
        tier.scoring.weights.benefit_participation =
            weights.value("benefitParticipation", tier.scoring.weights.benefit_participation);
    }

    tier.scoring.need_normalization = body.value("needNormalization", tier.scoring.need_normalization);
    tier.scoring.impact_need_fraction = body.value("impactNeedFraction", tier.scoring.impact_need_fraction);
    tier.scoring.impact_population_fraction =
        body.value("impactPopulationFraction", tier.scoring.impact_population_fraction);
    tier.budget_floor_fraction = body.value("budgetFloorFraction", tier.budget_floor_fraction);
    tier.max_rounds = body.value("maxRounds", tier.max_rounds);
    tier.scoring_chunk_size = body.value("scoringChunkSize", tier.scoring_chunk_size);
    tier.max_scoring_workers = body.value("maxScoringWorkers", tier.max_scoring_workers);
}

bool finite_non_negative(double value)
{
    return std::isfinite(value) && value >= 0.0;
}

void require(bool condition, const std::string &message)
{
    if (!condition)
    {
        throw ConfigError(message);
    }
}

void validate_tier(const TierParameters &tier)
{
    const std::string name = tier_name(tier.tier);
    const auto &weights = tier.scoring.weights;
    const auto &costs = tier.scoring.costs;

    require(finite_non_negative(weights.need) && finite_non_negative(weights.access_barrier) &&
                finite_non_negative(weights.poverty) && finite_non_negative(weights.benefit_participation),
            "Scoring weights must be non-negative");

    const double total_weight = weights.need + weights.access_barrier + weights.poverty + weights.benefit_participation;
    if (std::abs(total_weight - 1.0) > 0.01)
    {
        std::ostringstream message;
        message << "Weights must sum to 1.0 (current sum: " << std::fixed << std::setprecision(2) << total_weight << ")";
        throw ConfigError(message.str());
    }

    require(std::isfinite(tier.service_radius_miles) && tier.service_radius_miles > 0.0,
            name + " service radius must be positive");
    require(finite_non_negative(tier.min_distance_miles), name + " minimum distance must be non-negative");
    require(tier.max_facilities >= 0, name + " facility cap must be non-negative");
    require(std::isfinite(tier.scoring.need_normalization) && tier.scoring.need_normalization > 0.0,
            "needNormalization must be positive");
    require(finite_non_negative(tier.scoring.impact_need_fraction) &&
                finite_non_negative(tier.scoring.impact_population_fraction),
            "Impact fractions must be non-negative");
    require(finite_non_negative(costs.setup_base) && finite_non_negative(costs.setup_per_unit) &&
                finite_non_negative(costs.setup_cap) && finite_non_negative(costs.recurring_base) &&
                finite_non_negative(costs.recurring_per_unit) && finite_non_negative(costs.recurring_cap),
            name + " cost model values must be non-negative");
    require(tier.amortization.primary_months > 0 && tier.amortization.fallback_months > 0,
            name + " amortization horizons must be positive");
    require(tier.amortization.fallback_months <= tier.amortization.primary_months,
            name + " fallback horizon must not exceed the primary horizon");
    require(finite_non_negative(tier.amortization.fallback_setup_multiple) &&
                finite_non_negative(tier.amortization.fallback_budget_fraction),
            name + " amortization thresholds must be non-negative");
    require(tier.budget_floor_fraction >= 0.0 && tier.budget_floor_fraction <= 1.0,
            "budgetFloorFraction must lie in [0, 1]");
    require(tier.max_rounds > 0, "maxRounds must be positive");
    require(tier.declustering.grid_size > 0, "Declustering grid size must be positive");
    require(tier.declustering.neighbor_occupancy_ratio >= 0.0 && tier.declustering.neighbor_occupancy_ratio <= 1.0,
            "neighborOccupancyRatio must lie in [0, 1]");
    require(tier.regional.region_divisions > 0 && tier.regional.representative_pool_size > 0,
            "Regional placement parameters must be positive");
    require(tier.scoring_chunk_size > 0 && tier.max_scoring_workers > 0,
            "Scoring chunk size and worker count must be positive");
}

} // namespace

OptimizerConfig default_config()
{
    OptimizerConfig config;

    config.distribution.tier = Tier::Distribution;
    config.distribution.declustering.enabled = true;

    config.depot.tier = Tier::Depot;
    config.depot.service_radius_miles = 7.0;
    config.depot.min_distance_miles = 3.0;
    config.depot.max_facilities = 4;
    config.depot.placement = PlacementStrategy::RegionalRepresentatives;
    config.depot.scoring.costs = {150000.0, 10.0, 250000.0, 8000.0, 1.0, 12000.0};
    config.depot.amortization.primary_months = 6;
    config.depot.amortization.fallback_months = 3;

    return config;
}

OptimizerConfig parse_config(const json &body, const OptimizerConfig &base)
{
    OptimizerConfig config = base;

    if (!body.is_object())
    {
        return config;
    }

    try
    {
        config.total_budget = first_value(body, {"totalBudget", "total_budget", "budget"}, config.total_budget);
        config.depot_budget_fraction =
            first_value(body, {"depotBudgetFraction", "depot_budget_fraction"}, config.depot_budget_fraction);
        config.time_limit_ms = first_value(body, {"timeLimitMs", "time_limit_ms"}, config.time_limit_ms);
        config.high_need_risk_threshold = body.value("highNeedRiskThreshold", config.high_need_risk_threshold);

        config.distribution.max_facilities =
            first_value(body, {"maxFacilities", "maxLocations", "max_locations"}, config.distribution.max_facilities);
        config.depot.max_facilities = first_value(body, {"maxDepots", "max_depots"}, config.depot.max_facilities);
        config.distribution.min_distance_miles =
            first_value(body, {"minDistanceBetweenDistributionPoints", "minDistance", "min_distance"},
                        config.distribution.min_distance_miles);
        config.depot.min_distance_miles = body.value("minDistanceBetweenDepots", config.depot.min_distance_miles);
        config.depot.service_radius_miles = body.value("depotServiceRadius", config.depot.service_radius_miles);
        config.distribution.service_radius_miles =
            body.value("distributionServiceRadius", config.distribution.service_radius_miles);

        apply_shared(body, config.depot);
        apply_shared(body, config.distribution);

        if (body.contains("depot") && body["depot"].is_object())
        {
            apply_tier(body["depot"], config.depot);
        }
        if (body.contains("distribution") && body["distribution"].is_object())
        {
            apply_tier(body["distribution"], config.distribution);
        }
    }
    catch (const json::exception &ex)
    {
        throw ConfigError(std::string("Malformed configuration: ") + ex.what());
    }

    return config;
}

OptimizerConfig load_config_file(const std::string &path, const OptimizerConfig &base)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        throw ConfigError("Unable to open " + path);
    }

    json body;
    try
    {
        in >> body;
    }
    catch (const json::exception &ex)
    {
        throw ConfigError("Unable to parse " + path + ": " + ex.what());
    }

    std::cout << "Loaded configuration defaults from " << path << std::endl;
    return parse_config(body, base);
}

void validate_config(const OptimizerConfig &config)
{
    require(finite_non_negative(config.total_budget), "Budget must be a non-negative number");
    require(config.depot_budget_fraction >= 0.0 && config.depot_budget_fraction <= 1.0,
            "depotBudgetFraction must lie in [0, 1]");
    require(config.time_limit_ms >= 0, "timeLimitMs must be non-negative");

    validate_tier(config.depot);
    validate_tier(config.distribution);
}

double depot_budget(const OptimizerConfig &config)
{
    return config.total_budget * config.depot_budget_fraction;
}

double distribution_budget(const OptimizerConfig &config)
{
    return config.total_budget - depot_budget(config);
}

const TierParameters &tier_parameters(const OptimizerConfig &config, Tier tier)
{
    return tier == Tier::Depot ? config.depot : config.distribution;
}

} // namespace site_planner
