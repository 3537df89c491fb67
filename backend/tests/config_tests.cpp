#include <doctest/doctest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "site_planner/config.hpp"

using namespace site_planner;
using json = nlohmann::json;

TEST_CASE("Defaults describe a regional depot tier and a local distribution tier")
{
    const auto config = default_config();
    CHECK_NOTHROW(validate_config(config));

    CHECK(config.depot.tier == Tier::Depot);
    CHECK(config.depot.placement == PlacementStrategy::RegionalRepresentatives);
    CHECK(config.depot.service_radius_miles > config.distribution.service_radius_miles);
    CHECK(config.distribution.tier == Tier::Distribution);
    CHECK(config.distribution.declustering.enabled);
    CHECK(config.distribution.service_radius_miles == doctest::Approx(1.5));
    CHECK(config.distribution.min_distance_miles == doctest::Approx(0.5));
    CHECK(config.distribution.max_facilities == 10);
    CHECK(&tier_parameters(config, Tier::Depot) == &config.depot);
}

TEST_CASE("The budget splits between the tiers")
{
    auto config = default_config();
    config.total_budget = 1000000.0;

    CHECK(depot_budget(config) == doctest::Approx(250000.0));
    CHECK(distribution_budget(config) == doctest::Approx(750000.0));
}

TEST_CASE("parse_config applies request fields over the base")
{
    const json body = {
        {"budget", 2000000},
        {"max_locations", 6},
        {"min_distance", 0.8},
        {"maxDepots", 2},
        {"timeLimitMs", 1500},
        {"scoringWeights", {{"need", 0.6}, {"accessBarrier", 0.2}, {"poverty", 0.2}}},
        {"distribution",
         {{"serviceRadius", 2.0},
          {"amortization", {{"primaryMonths", 9}, {"fallbackMonths", 4}}},
          {"declustering", {{"gridSize", 4}, {"capacitySchedule", {{5, 1}, {9, 2}}}}}}},
        {"depot", {{"costs", {{"setupBase", 90000}}}, {"regionDivisions", 3}}}};

    const auto config = parse_config(body, default_config());

    CHECK(config.total_budget == doctest::Approx(2000000.0));
    CHECK(config.distribution.max_facilities == 6);
    CHECK(config.distribution.min_distance_miles == doctest::Approx(0.8));
    CHECK(config.depot.max_facilities == 2);
    CHECK(config.time_limit_ms == 1500);
    CHECK(config.depot.scoring.weights.need == doctest::Approx(0.6));
    CHECK(config.distribution.scoring.weights.access_barrier == doctest::Approx(0.2));
    CHECK(config.distribution.service_radius_miles == doctest::Approx(2.0));
    CHECK(config.distribution.amortization.primary_months == 9);
    CHECK(config.distribution.amortization.fallback_months == 4);
    CHECK(config.distribution.declustering.grid_size == 4);
    REQUIRE(config.distribution.declustering.capacity_schedule.size() == 2);
    CHECK(config.distribution.declustering.capacity_schedule[1].first == 9);
    CHECK(config.distribution.declustering.capacity_schedule[1].second == 2);
    CHECK(config.depot.scoring.costs.setup_base == doctest::Approx(90000.0));
    CHECK(config.depot.regional.region_divisions == 3);
    CHECK_NOTHROW(validate_config(config));
}

TEST_CASE("parse_config reports malformed values as configuration errors")
{
    CHECK_THROWS_AS(parse_config(json{{"totalBudget", "lots"}}, default_config()), ConfigError);
    CHECK_THROWS_AS(
        parse_config(json{{"distribution", {{"declustering", {{"capacitySchedule", {1, 2}}}}}}}, default_config()),
        ConfigError);
}

TEST_CASE("validate_config rejects weights that do not sum to one")
{
    auto config = default_config();
    config.total_budget = 100000.0;
    config.distribution.scoring.weights = {0.5, 0.5, 0.5, 0.0};

    CHECK_THROWS_WITH_AS(validate_config(config), "Weights must sum to 1.0 (current sum: 1.50)", ConfigError);

    config.distribution.scoring.weights = {0.5, 0.3, 0.195, 0.0};
    CHECK_NOTHROW(validate_config(config));
}

TEST_CASE("validate_config rejects unusable parameters")
{
    auto config = default_config();
    config.total_budget = -1.0;
    CHECK_THROWS_AS(validate_config(config), ConfigError);

    config = default_config();
    config.depot_budget_fraction = 1.5;
    CHECK_THROWS_AS(validate_config(config), ConfigError);

    config = default_config();
    config.distribution.service_radius_miles = 0.0;
    CHECK_THROWS_AS(validate_config(config), ConfigError);

    config = default_config();
    config.depot.amortization.fallback_months = 12;
    CHECK_THROWS_AS(validate_config(config), ConfigError);
}

TEST_CASE("load_config_file layers a file over the base")
{
    const std::string path = "site_planner_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"totalBudget": 750000, "depotBudgetFraction": 0.4})";
    }

    const auto config = load_config_file(path, default_config());
    CHECK(config.total_budget == doctest::Approx(750000.0));
    CHECK(config.depot_budget_fraction == doctest::Approx(0.4));
    std::remove(path.c_str());

    CHECK_THROWS_AS(load_config_file("does_not_exist.json", default_config()), ConfigError);
}
