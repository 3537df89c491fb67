#include "site_planner/scorer.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>
#include <thread>

#include "site_planner/geometry.hpp"

namespace site_planner
{
namespace
{

bool is_ratio(double value)
{
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

std::vector<ScoredCandidate> score_chunk(const std::vector<Cell> &cells, std::size_t begin, std::size_t end,
                                         const ScoringModel &model)
{
    std::vector<ScoredCandidate> scored;
    scored.reserve(end - begin);

    for (std::size_t i = begin; i < end; i++)
    {
        if (auto candidate = score_cell(cells[i], model))
        {
            scored.push_back(*candidate);
        }
    }

    return scored;
}

} // namespace

bool is_scorable(const Cell &cell)
{
    return !cell.id.empty() &&
           is_valid_coordinate(cell.lat, cell.lon) &&
           cell.population > 0 &&
           std::isfinite(cell.need_index) && cell.need_index >= 0.0 &&
           std::isfinite(cell.risk_score) &&
           is_ratio(cell.poverty_rate) &&
           is_ratio(cell.benefit_rate) &&
           is_ratio(cell.vehicle_access_rate);
}

std::optional<ScoredCandidate> score_cell(const Cell &cell, const ScoringModel &model)
{
    if (!is_scorable(cell))
    {
        return std::nullopt;
    }

    const auto &weights = model.weights;
    const auto &costs = model.costs;

    const double need_factor = cell.need_index / model.need_normalization;
    const double access_barrier = 1.0 - cell.vehicle_access_rate;

    ScoredCandidate candidate;
    candidate.cell = &cell;
    candidate.efficiency_score = weights.need * need_factor +
                                 weights.access_barrier * access_barrier +
                                 weights.poverty * cell.poverty_rate +
                                 weights.benefit_participation * cell.benefit_rate;

    candidate.expected_impact = std::min(cell.need_index * model.impact_need_fraction,
                                         cell.population * model.impact_population_fraction);

    candidate.setup_cost = costs.setup_base + std::min(costs.setup_cap, candidate.expected_impact * costs.setup_per_unit);
    candidate.recurring_cost =
        costs.recurring_base + std::min(costs.recurring_cap, candidate.expected_impact * costs.recurring_per_unit);

    return candidate;
}

std::vector<ScoredCandidate> score_cells(const std::vector<Cell> &cells, const ScoringModel &model,
                                         int chunk_size, int max_workers)
{
    const std::size_t chunk = static_cast<std::size_t>(std::max(1, chunk_size));

    if (cells.size() <= chunk)
    {
        return score_chunk(cells, 0, cells.size(), model);
    }

    const std::size_t chunk_count = (cells.size() + chunk - 1) / chunk;
    const std::size_t hardware = std::max(1u, std::thread::hardware_concurrency());
    const std::size_t workers = std::min({static_cast<std::size_t>(std::max(1, max_workers)), hardware, chunk_count});

    std::cout << "Scoring " << cells.size() << " cells in " << chunk_count << " chunks on "
              << workers << " workers..." << std::endl;

    std::vector<ScoredCandidate> scored;
    scored.reserve(cells.size());
    std::size_t dropped_chunks = 0;

    for (std::size_t wave_start = 0; wave_start < chunk_count; wave_start += workers)
    {
        const std::size_t wave_end = std::min(chunk_count, wave_start + workers);

        std::vector<std::future<std::vector<ScoredCandidate>>> futures;
        futures.reserve(wave_end - wave_start);

        for (std::size_t c = wave_start; c < wave_end; c++)
        {
            const std::size_t begin = c * chunk;
            const std::size_t end = std::min(cells.size(), begin + chunk);
            futures.push_back(std::async(std::launch::async, score_chunk, std::cref(cells), begin, end, std::cref(model)));
        }

        for (auto &future : futures)
        {
            try
            {
                auto part = future.get();
                scored.insert(scored.end(), part.begin(), part.end());
            }
            catch (const InvariantViolation &)
            {
                throw;
            }
            catch (const std::exception &ex)
            {
                dropped_chunks++;
                std::cerr << "Dropping scoring chunk: " << ex.what() << std::endl;
            }
        }
    }

    if (dropped_chunks > 0)
    {
        std::cerr << dropped_chunks << " scoring chunk(s) failed." << std::endl;
    }

    return scored;
}

void rank_candidates(std::vector<ScoredCandidate> &candidates)
{
    std::sort(candidates.begin(), candidates.end(),
              [](const ScoredCandidate &a, const ScoredCandidate &b)
              {
                  if (a.efficiency_score != b.efficiency_score)
                  {
                      return a.efficiency_score > b.efficiency_score;
                  }
                  return a.cell->id < b.cell->id;
              });
}

} // namespace site_planner
