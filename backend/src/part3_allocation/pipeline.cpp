#include "site_planner/pipeline.hpp"

#include <chrono>
#include <ctime>
#include <iostream>
#include <string>
#include <utility>

#include "site_planner/allocator.hpp"
#include "site_planner/cells.hpp"
#include "site_planner/coverage.hpp"
#include "site_planner/scorer.hpp"
#include "site_planner/validator.hpp"

namespace site_planner
{
namespace
{

std::string iso_timestamp()
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
    char timestamp[64];
    std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%dT%H:%M:%SZ", std::gmtime(&now_time));
    return timestamp;
}

class ProgressLog
{
public:
    ProgressLog(OptimizationResult &result, const ProgressCallback &callback)
        : result_(result), callback_(callback) {}

    void emit(const std::string &agent, const std::string &step, const std::string &status, const std::string &message)
    {
        ProgressEvent event{agent, step, status, message};
        std::cout << "[" << agent << "] " << message << std::endl;
        if (callback_)
        {
            callback_(event);
        }
        result_.events.push_back(std::move(event));
    }

private:
    OptimizationResult &result_;
    const ProgressCallback &callback_;
};

std::vector<Cell> usable_cells(const std::vector<Cell> &cells, std::size_t &rejected)
{
    std::vector<Cell> usable;
    usable.reserve(cells.size());
    rejected = 0;

    for (const auto &cell : cells)
    {
        if (cell.population <= 0)
        {
            continue;
        }
        if (!is_scorable(cell))
        {
            rejected++;
            std::cerr << "Skipping malformed cell " << cell.id << std::endl;
            continue;
        }
        usable.push_back(cell);
    }

    return usable;
}

void apply_validation(OptimizationResult &result, ValidationOutcome &&outcome, const OptimizerConfig &config)
{
    result.facilities = std::move(outcome.facilities);
    result.total_expected_impact = outcome.total_expected_impact;
    result.budget_used = outcome.budget_used;
    result.budget_remaining = config.total_budget - outcome.budget_used;
    result.coverage_percentage = outcome.coverage_percentage;
    result.cells_covered = outcome.cells_covered;
    result.adjustments_made = outcome.adjustments_made;
}

void mark_failed(OptimizationResult &result, const std::string &message)
{
    result.success = false;
    result.message = message;
    result.facilities.clear();
    result.total_expected_impact = 0.0;
    result.budget_used = 0.0;
    result.budget_remaining = 0.0;
    result.coverage_percentage = 0.0;
    result.cells_covered = 0;
    std::cerr << "Optimization failed: " << message << std::endl;
}

} // namespace

OptimizationResult run_optimization(const std::vector<Cell> &cells, const OptimizerConfig &config,
                                    const ProgressCallback &on_progress)
{
    const auto start_time = std::chrono::steady_clock::now();

    OptimizationResult result;
    result.timestamp = iso_timestamp();
    ProgressLog progress(result, on_progress);

    try
    {
        validate_config(config);

        std::size_t rejected = 0;
        const std::vector<Cell> pool = usable_cells(cells, rejected);
        result.statistics = compute_statistics(pool, config.high_need_risk_threshold);
        result.statistics.skipped_records = rejected;
        result.budget_remaining = config.total_budget;

        progress.emit("Data Analysis", "data_analysis", "completed",
                      "Analyzed " + std::to_string(pool.size()) + " populated cells");

        if (pool.empty())
        {
            result.success = true;
            result.message = "No populated cells to place facilities in";
            progress.emit("Orchestrator", "finalization", "completed", result.message);
            return result;
        }

        const Clock::time_point deadline = config.time_limit_ms > 0
                                               ? Clock::now() + std::chrono::milliseconds(config.time_limit_ms)
                                               : Clock::time_point::max();

        progress.emit("Depot Optimization", "depot_optimization", "in_progress",
                      "Placing regional depots with " + std::to_string(depot_budget(config)) + " budget");
        AllocationResult depots = allocate_facilities(pool, config.depot, depot_budget(config), {}, deadline);
        result.depot_report = depots.report;
        progress.emit("Depot Optimization", "depot_optimization", "completed",
                      "Selected " + std::to_string(depots.facilities.size()) + " depots");

        const CoverageResult coverage = filter_by_depot_coverage(depots.facilities, pool);

        progress.emit("Distribution Optimization", "distribution_optimization", "in_progress",
                      "Placing distribution points among " + std::to_string(coverage.cells.size()) + " cells" +
                          (coverage.fallback_applied ? " (no depot constraint)" : " within depot coverage"));
        AllocationResult distribution = allocate_facilities(coverage.cells, config.distribution,
                                                            distribution_budget(config),
                                                            coverage.reserved_cell_ids, deadline);
        result.distribution_report = distribution.report;
        progress.emit("Distribution Optimization", "distribution_optimization", "completed",
                      "Selected " + std::to_string(distribution.facilities.size()) + " distribution points");

        link_served_facilities(depots.facilities, distribution.facilities, coverage);

        std::vector<Facility> proposed = std::move(depots.facilities);
        proposed.insert(proposed.end(), distribution.facilities.begin(), distribution.facilities.end());

        progress.emit("Validation", "feasibility_validation", "in_progress",
                      "Validating " + std::to_string(proposed.size()) + " proposed facilities");
        apply_validation(result, validate_facilities(proposed, pool, config), config);
        progress.emit("Validation", "feasibility_validation", "completed",
                      std::to_string(result.facilities.size()) + " facilities approved, " +
                          std::to_string(result.adjustments_made) + " adjustments");

        result.iterations = result.depot_report.rounds + result.distribution_report.rounds;
        result.success = true;
        if (result.depot_report.timed_out || result.distribution_report.timed_out)
        {
            result.message = "Time limit reached; selection stopped between rounds";
        }

        progress.emit("Orchestrator", "finalization", "completed", "Optimization complete");
    }
    catch (const ConfigError &ex)
    {
        mark_failed(result, ex.what());
        progress.emit("Orchestrator", "error_handling", "error", result.message);
    }
    catch (const InvariantViolation &ex)
    {
        mark_failed(result, std::string("Invariant violated: ") + ex.what());
        progress.emit("Orchestrator", "error_handling", "error", result.message);
    }
    catch (const std::exception &ex)
    {
        mark_failed(result, ex.what());
        progress.emit("Orchestrator", "error_handling", "error", result.message);
    }

    result.total_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time).count();
    return result;
}

OptimizationResult revalidate(const std::vector<Facility> &facilities, const std::vector<Cell> &cells,
                              const OptimizerConfig &config)
{
    const auto start_time = std::chrono::steady_clock::now();

    OptimizationResult result;
    result.timestamp = iso_timestamp();

    try
    {
        validate_config(config);

        std::size_t rejected = 0;
        const std::vector<Cell> pool = usable_cells(cells, rejected);
        result.statistics = compute_statistics(pool, config.high_need_risk_threshold);
        result.statistics.skipped_records = rejected;

        apply_validation(result, validate_facilities(facilities, pool, config), config);
        result.success = true;
    }
    catch (const ConfigError &ex)
    {
        mark_failed(result, ex.what());
    }
    catch (const InvariantViolation &ex)
    {
        mark_failed(result, std::string("Invariant violated: ") + ex.what());
    }
    catch (const std::exception &ex)
    {
        mark_failed(result, ex.what());
    }

    result.total_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time).count();
    return result;
}

} // namespace site_planner
