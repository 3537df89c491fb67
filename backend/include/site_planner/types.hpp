#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace site_planner
{

enum class Tier
{
    Depot,
    Distribution
};

struct Cell
{
    std::string id;
    double lat{};
    double lon{};
    long population{0};
    double need_index{};
    double risk_score{};
    double poverty_rate{};
    double benefit_rate{};
    double vehicle_access_rate{1.0};
};

// Produced and discarded within one allocator run. `cell` points into the
// pool the allocator was given.
struct ScoredCandidate
{
    const Cell *cell{nullptr};
    double efficiency_score{};
    double setup_cost{};
    double recurring_cost{};
    double expected_impact{};
};

struct Facility
{
    std::string id;
    std::string anchor_cell_id;
    double lat{};
    double lon{};
    Tier tier{Tier::Distribution};
    double service_radius{};
    double setup_cost{};
    double recurring_cost{};
    int amortization_months{0};
    double committed_cost{};
    double efficiency_score{};
    double expected_impact{};
    std::vector<std::string> served_facility_ids;
    std::string depot_id;
};

struct TierReport
{
    int rounds{0};
    std::size_t candidates_scored{0};
    double average_efficiency{};
    double budget{};
    double budget_remaining{};
    long long elapsed_ms{0};
    bool timed_out{false};
};

struct DomainStatistics
{
    std::size_t total_cells{0};
    long long total_population{0};
    double total_need{};
    double average_risk_score{};
    std::size_t high_need_cells{0};
    std::size_t skipped_records{0};
};

struct ProgressEvent
{
    std::string agent;
    std::string step;
    std::string status;
    std::string message;
};

struct OptimizationResult
{
    bool success{false};
    std::string message;
    std::vector<Facility> facilities;
    double total_expected_impact{};
    double budget_used{};
    double budget_remaining{};
    double coverage_percentage{};
    std::size_t cells_covered{0};
    int iterations{0};
    int adjustments_made{0};
    TierReport depot_report;
    TierReport distribution_report;
    DomainStatistics statistics;
    std::vector<ProgressEvent> events;
    long long total_ms{0};
    std::string timestamp;
};

// Raised when a caller-supplied configuration cannot be used.
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Raised when a value that the scorer guarantees (finite, non-negative)
// arrives broken further down the pipeline. Never recovered inside the core.
class InvariantViolation : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

inline const char *tier_name(Tier tier)
{
    return tier == Tier::Depot ? "depot" : "distribution";
}

} // namespace site_planner
