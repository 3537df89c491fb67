#include "site_planner/result_json.hpp"

#include <stdexcept>
#include <string>

namespace site_planner
{
namespace
{

using json = nlohmann::json;

json tier_report_to_json(const TierReport &report)
{
    return {
        {"rounds", report.rounds},
        {"candidatesScored", report.candidates_scored},
        {"averageEfficiency", report.average_efficiency},
        {"budget", report.budget},
        {"budgetRemaining", report.budget_remaining},
        {"convergenceTimeMs", report.elapsed_ms},
        {"timedOut", report.timed_out}};
}

Tier parse_tier(const std::string &name)
{
    if (name == "depot")
    {
        return Tier::Depot;
    }
    if (name == "distribution")
    {
        return Tier::Distribution;
    }
    throw std::invalid_argument("Unknown facility tier '" + name + "'");
}

} // namespace

json facility_to_json(const Facility &facility)
{
    json body;
    body["id"] = facility.id;
    body["anchorCellId"] = facility.anchor_cell_id;
    body["tier"] = tier_name(facility.tier);
    body["lat"] = facility.lat;
    body["lon"] = facility.lon;
    body["serviceRadius"] = facility.service_radius;
    body["setupCost"] = facility.setup_cost;
    body["recurringCost"] = facility.recurring_cost;
    body["amortizationMonths"] = facility.amortization_months;
    body["committedCost"] = facility.committed_cost;
    body["efficiencyScore"] = facility.efficiency_score;
    body["expectedImpact"] = facility.expected_impact;

    if (facility.tier == Tier::Depot)
    {
        body["servedFacilityIds"] = facility.served_facility_ids;
    }
    else
    {
        body["depotId"] = facility.depot_id.empty() ? json() : json(facility.depot_id);
    }

    return body;
}

Facility facility_from_json(const json &body)
{
    if (!body.is_object())
    {
        throw std::invalid_argument("Facility entry must be an object");
    }

    Facility facility;
    facility.id = body.at("id").get<std::string>();
    facility.anchor_cell_id = body.value("anchorCellId", facility.id);
    facility.tier = parse_tier(body.value("tier", "distribution"));
    facility.lat = body.at("lat").get<double>();
    facility.lon = body.at("lon").get<double>();
    facility.service_radius = body.at("serviceRadius").get<double>();
    facility.setup_cost = body.at("setupCost").get<double>();
    facility.recurring_cost = body.at("recurringCost").get<double>();
    facility.amortization_months = body.value("amortizationMonths", 0);
    facility.committed_cost = body.value("committedCost", 0.0);
    facility.efficiency_score = body.value("efficiencyScore", 0.0);
    facility.expected_impact = body.value("expectedImpact", 0.0);

    if (body.contains("depotId") && body["depotId"].is_string())
    {
        facility.depot_id = body["depotId"].get<std::string>();
    }

    return facility;
}

std::vector<Facility> facilities_from_json(const json &body)
{
    const json &list = (body.is_object() && body.contains("facilities")) ? body["facilities"] : body;
    if (!list.is_array())
    {
        throw std::invalid_argument("Expected an array of facilities");
    }

    std::vector<Facility> facilities;
    facilities.reserve(list.size());
    for (const auto &entry : list)
    {
        facilities.push_back(facility_from_json(entry));
    }
    return facilities;
}

json statistics_to_json(const DomainStatistics &statistics)
{
    return {
        {"totalCells", statistics.total_cells},
        {"totalPopulation", statistics.total_population},
        {"totalNeed", statistics.total_need},
        {"averageRiskScore", statistics.average_risk_score},
        {"highNeedCells", statistics.high_need_cells},
        {"skippedRecords", statistics.skipped_records}};
}

json result_to_json(const OptimizationResult &result)
{
    json body;
    body["status"] = result.success ? "success" : "error";
    if (!result.message.empty())
    {
        body["message"] = result.message;
    }

    json facilities = json::array();
    for (const auto &facility : result.facilities)
    {
        facilities.push_back(facility_to_json(facility));
    }
    body["facilities"] = facilities;

    body["totalExpectedImpact"] = result.total_expected_impact;
    body["budgetUsed"] = result.budget_used;
    body["budgetRemaining"] = result.budget_remaining;
    body["coveragePercentage"] = result.coverage_percentage;
    body["cellsCovered"] = result.cells_covered;
    body["iterations"] = result.iterations;
    body["adjustmentsMade"] = result.adjustments_made;
    body["tiers"] = {
        {"depot", tier_report_to_json(result.depot_report)},
        {"distribution", tier_report_to_json(result.distribution_report)}};
    body["statistics"] = statistics_to_json(result.statistics);

    json steps = json::array();
    for (const auto &event : result.events)
    {
        steps.push_back({
            {"agent", event.agent},
            {"step", event.step},
            {"status", event.status},
            {"message", event.message}});
    }
    body["steps"] = steps;

    body["timing"] = {{"total_ms", result.total_ms}};
    body["timestamp"] = result.timestamp;

    return body;
}

} // namespace site_planner
