#pragma once

#include "core/errors.hpp"
#include "risk/risk_classifier.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace gho {

/**
 * @brief Recommended standby location
 *
 * Synthesized centroid of one cluster; not necessarily a real intersection.
 */
struct Hub {
    int index = 0;          // 1..N, in cluster order
    double lat = 0.0;
    double lon = 0.0;

    nlohmann::json to_json() const;
    static Hub from_json(const nlohmann::json& j);
};

/**
 * @brief Tuning knobs for the clustering step
 */
struct OptimizerConfig {
    int n_init = 10;                        ///< Independent restarts; best inertia wins
    int max_iter = 300;                     ///< Iteration cap per restart
    bool parallel_restarts = false;         ///< Run restarts on worker threads
    double duplicate_tolerance_deg = 1e-9;  ///< Centroids closer than this count as duplicates

    bool validate(std::string& error_message) const;
};

/**
 * @brief Full output of one clustering call
 */
struct ClusteringOutcome {
    std::vector<Hub> hubs;
    std::vector<int> labels;                ///< Cluster index (0-based) per sample
    double inertia = 0.0;                   ///< Sum of squared planar distances to assigned centroid
    int iterations = 0;                     ///< Iterations used by the winning restart
    int best_restart = 0;
    bool converged = false;                 ///< Winning restart stopped before max_iter
    std::vector<double> restart_inertia;    ///< Final inertia of every restart
    std::vector<double> inertia_history;    ///< Inertia after each iteration of the winning restart
    std::vector<DegenerateClusterWarning> warnings;
};

/**
 * @brief Places N hubs over coordinate samples with seeded multi-restart k-means
 *
 * Latitude and longitude are treated as a flat 2-D plane. This is adequate
 * at neighborhood to corridor scale (up to roughly 10 km) and is not meant
 * for regional extents.
 *
 * Each restart draws its seed up front from a master generator, so the
 * result is bit-identical for a fixed seed and input order whether restarts
 * run serially or in parallel.
 */
class FacilityOptimizer {
public:
    explicit FacilityOptimizer(const OptimizerConfig& config = OptimizerConfig{});

    /**
     * @brief Compute exactly n_facilities hubs
     *
     * @throws std::invalid_argument if n_facilities < 1 or a sample is not finite
     * @throws InsufficientSamplesError if samples.size() < n_facilities
     */
    std::vector<Hub> optimize(
        const std::vector<CoordinateSample>& samples,
        int n_facilities,
        uint64_t seed
    ) const;

    /**
     * @brief Same as optimize() but returns labels, inertia and diagnostics
     */
    ClusteringOutcome cluster(
        const std::vector<CoordinateSample>& samples,
        int n_facilities,
        uint64_t seed
    ) const;

    const OptimizerConfig& get_config() const { return config_; }

private:
    OptimizerConfig config_;
};

/**
 * @brief Sum of squared planar distances from each sample to its labelled hub
 */
double compute_inertia(
    const std::vector<CoordinateSample>& samples,
    const std::vector<int>& labels,
    const std::vector<Hub>& hubs
);

} // namespace gho
