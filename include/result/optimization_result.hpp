#pragma once

#include "core/errors.hpp"
#include "optimizer/facility_optimizer.hpp"
#include "risk/risk_classifier.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace gho {

/**
 * @brief How well one hub covers the risk intersections nearest to it
 *
 * Distances are great-circle meters even though clustering is planar.
 */
struct HubCoverage {
    int hub_index = 0;
    size_t assigned_nodes = 0;
    double mean_distance_m = 0.0;
    double max_distance_m = 0.0;

    nlohmann::json to_json() const;
};

/**
 * @brief Output of one optimization run, consumed by renderers
 */
struct OptimizationResult {
    RiskSubset subset;
    std::vector<Hub> hubs;

    // Summary counts
    size_t network_size = 0;
    size_t risk_subset_size = 0;
    size_t hub_count = 0;

    std::vector<HubCoverage> coverage;
    std::vector<DegenerateClusterWarning> warnings;

    std::string snapshot_id;
    std::string place_name;

    /**
     * @brief One "Unit {index}: {lat}, {lon}" line per hub, six decimals
     */
    std::string format_unit_lines() const;

    /**
     * @brief Console form: "  Hub {index}: {lat}, {lon}" per line
     */
    std::string format_hub_lines() const;

    nlohmann::json to_json() const;
    void save_to_json(const std::string& path) const;
};

/**
 * @brief Pairs hubs with summary counts
 *
 * Pure composition. Hub order is kept as produced by the optimizer.
 */
class ResultAssembler {
public:
    static OptimizationResult assemble(
        const RiskSubset& subset,
        const std::vector<Hub>& hubs,
        size_t network_size
    );
};

// Nearest-hub coverage of each hub over the subset members
std::vector<HubCoverage> compute_hub_coverage(
    const RiskSubset& subset,
    const std::vector<Hub>& hubs
);

} // namespace gho
