#pragma once

#include <optional>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace site_planner
{

bool is_scorable(const Cell &cell);
std::optional<ScoredCandidate> score_cell(const Cell &cell, const ScoringModel &model);
std::vector<ScoredCandidate> score_cells(const std::vector<Cell> &cells, const ScoringModel &model,
                                         int chunk_size = 256, int max_workers = 8);
void rank_candidates(std::vector<ScoredCandidate> &candidates);

} // namespace site_planner
