#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace site_planner
{

nlohmann::json facility_to_json(const Facility &facility);
Facility facility_from_json(const nlohmann::json &body);
std::vector<Facility> facilities_from_json(const nlohmann::json &body);
nlohmann::json statistics_to_json(const DomainStatistics &statistics);
nlohmann::json result_to_json(const OptimizationResult &result);

} // namespace site_planner
