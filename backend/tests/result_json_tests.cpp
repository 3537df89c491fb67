#include <doctest/doctest.h>

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "site_planner/result_json.hpp"
#include "test_helpers.hpp"

using namespace site_planner;
using json = nlohmann::json;

TEST_CASE("Depots list the points they serve and distribution points name their depot")
{
    Facility depot = test::make_facility("depot-a", Tier::Depot, 40.0, -75.0, 7.0, 150000.0, 8000.0, 6);
    depot.served_facility_ids = {"site-b", "site-c"};

    const json depot_json = facility_to_json(depot);
    CHECK(depot_json["tier"] == "depot");
    CHECK(depot_json["servedFacilityIds"].size() == 2);
    CHECK(depot_json["amortizationMonths"] == 6);
    CHECK(depot_json["committedCost"].get<double>() == doctest::Approx(198000.0));
    CHECK_FALSE(depot_json.contains("depotId"));

    Facility linked = test::make_facility("site-b", Tier::Distribution, 40.01, -75.0, 1.5, 100000.0, 10000.0, 12);
    linked.depot_id = "depot-a";
    CHECK(facility_to_json(linked)["depotId"] == "depot-a");

    Facility orphan = linked;
    orphan.depot_id.clear();
    const json orphan_json = facility_to_json(orphan);
    CHECK(orphan_json["depotId"].is_null());
    CHECK_FALSE(orphan_json.contains("servedFacilityIds"));
}

TEST_CASE("Facilities submitted for validation are read back")
{
    const json body = {
        {"facilities",
         {{{"id", "depot-x"}, {"tier", "depot"}, {"lat", 40.0}, {"lon", -75.0}, {"serviceRadius", 7.0},
           {"setupCost", 150000}, {"recurringCost", 8000}, {"amortizationMonths", 6}},
          {{"id", "site-y"}, {"lat", 40.02}, {"lon", -75.0}, {"serviceRadius", 1.5}, {"setupCost", 100000},
           {"recurringCost", 10000}, {"depotId", "depot-x"}}}}};

    const auto facilities = facilities_from_json(body);

    REQUIRE(facilities.size() == 2);
    CHECK(facilities[0].tier == Tier::Depot);
    CHECK(facilities[0].anchor_cell_id == "depot-x");
    CHECK(facilities[0].amortization_months == 6);
    CHECK(facilities[1].tier == Tier::Distribution);
    CHECK(facilities[1].depot_id == "depot-x");
    CHECK(facilities[1].setup_cost == doctest::Approx(100000.0));
}

TEST_CASE("Malformed facility submissions are rejected")
{
    CHECK_THROWS_AS(facilities_from_json(json{{"facilities", "none"}}), std::invalid_argument);
    CHECK_THROWS_AS(facility_from_json(json::array()), std::invalid_argument);
    CHECK_THROWS_AS(facility_from_json(json{{"id", "a"}, {"tier", "warehouse"}, {"lat", 1.0}}),
                    std::invalid_argument);
    CHECK_THROWS_AS(facility_from_json(json{{"id", "a"}, {"lat", 1.0}}), json::exception);
}

TEST_CASE("Results carry status, totals, tier reports and steps")
{
    OptimizationResult result;
    result.success = true;
    result.facilities.push_back(test::make_facility("site-a", Tier::Distribution, 40.0, -75.0, 1.5, 1.0, 1.0, 12));
    result.budget_used = 13.0;
    result.budget_remaining = 87.0;
    result.coverage_percentage = 42.5;
    result.iterations = 3;
    result.depot_report.rounds = 1;
    result.distribution_report.rounds = 2;
    result.distribution_report.timed_out = true;
    result.statistics.total_cells = 9;
    result.events.push_back({"Validation", "feasibility_validation", "completed", "ok"});
    result.timestamp = "2024-01-01T00:00:00Z";

    const json body = result_to_json(result);

    CHECK(body["status"] == "success");
    CHECK_FALSE(body.contains("message"));
    CHECK(body["facilities"].size() == 1);
    CHECK(body["budgetUsed"].get<double>() == doctest::Approx(13.0));
    CHECK(body["coveragePercentage"].get<double>() == doctest::Approx(42.5));
    CHECK(body["iterations"] == 3);
    CHECK(body["tiers"]["distribution"]["rounds"] == 2);
    CHECK(body["tiers"]["distribution"]["timedOut"] == true);
    CHECK(body["statistics"]["totalCells"] == 9);
    CHECK(body["steps"][0]["step"] == "feasibility_validation");
    CHECK(body["timestamp"] == "2024-01-01T00:00:00Z");

    OptimizationResult failed;
    failed.message = "Budget must be a non-negative number";
    const json error = result_to_json(failed);
    CHECK(error["status"] == "error");
    CHECK(error["message"] == "Budget must be a non-negative number");
    CHECK(error["facilities"].empty());
}
