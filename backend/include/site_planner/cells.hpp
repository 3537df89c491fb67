#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace site_planner
{

struct CellDataset
{
    std::vector<Cell> cells;
    std::size_t skipped_records{0};
    std::size_t unpopulated_cells{0};
};

std::optional<Cell> parse_cell(const nlohmann::json &record);
CellDataset parse_cells(const nlohmann::json &records);
DomainStatistics compute_statistics(const std::vector<Cell> &cells, double high_need_threshold);

} // namespace site_planner
