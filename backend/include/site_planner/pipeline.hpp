#pragma once

#include <functional>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace site_planner
{

using ProgressCallback = std::function<void(const ProgressEvent &)>;

OptimizationResult run_optimization(const std::vector<Cell> &cells, const OptimizerConfig &config,
                                    const ProgressCallback &on_progress = {});

OptimizationResult revalidate(const std::vector<Facility> &facilities, const std::vector<Cell> &cells,
                              const OptimizerConfig &config);

} // namespace site_planner
