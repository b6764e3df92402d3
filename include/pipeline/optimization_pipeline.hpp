#pragma once

#include "network/network_provider.hpp"
#include "network/road_network.hpp"
#include "optimizer/facility_optimizer.hpp"
#include "result/optimization_result.hpp"
#include "risk/risk_classifier.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <nlohmann/json.hpp>

namespace gho {

// ============================================================================
// Run Configuration
// ============================================================================

/**
 * @brief Configuration for one optimization run
 */
struct RunConfig {
    // Network acquisition
    std::string mode = "city";                  ///< "city" or "highway"
    std::string place_name = "Koramangala, Bengaluru";
    double center_lat = 28.2378;                ///< Highway preset: Delhi-Mumbai Expressway near Sohna
    double center_lon = 77.0697;
    int search_radius_m = 2000;                 ///< Point radius and place fallback radius
    std::string network_file;                   ///< Snapshot JSON, used by the "file" provider
    std::string provider = "overpass";          ///< "overpass" or "file"
    std::string overpass_url = "https://overpass-api.de/api/interpreter";
    std::string nominatim_url = "https://nominatim.openstreetmap.org/search";
    int timeout_seconds = 180;

    // Optimization
    int n_facilities = 5;                       ///< Number of units to place
    int min_degree = 4;                         ///< Risk threshold (street count)
    uint64_t seed = 42;
    int n_init = 10;
    int max_iter = 300;
    bool parallel_restarts = false;

    // Output
    std::string output_directory = "output";
    bool export_html = true;
    bool export_svg = true;
    bool export_json = true;
    bool verbose = true;

    /**
     * @brief Switch to the highway preset (point query, wider radius, lower threshold)
     */
    void apply_mode_defaults();

    bool is_highway() const { return mode == "highway"; }

    /**
     * @brief Load configuration from JSON file
     */
    static RunConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Load from GHO_* environment variables over the defaults
     */
    static RunConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    /**
     * @brief Advisory notes for values outside recommended ranges
     */
    std::vector<std::string> range_notes() const;

    NetworkQuery to_query() const;
    ProviderConfig to_provider_config() const;
    OptimizerConfig to_optimizer_config() const;

    nlohmann::json to_json() const;
    static RunConfig from_json(const nlohmann::json& j);
};

// ============================================================================
// Result Cache
// ============================================================================

/**
 * @brief Identity of an optimization run for memoization
 */
struct RunKey {
    std::string snapshot_id;
    int min_degree = 0;
    int n_facilities = 0;
    uint64_t seed = 0;

    bool operator<(const RunKey& other) const {
        return std::tie(snapshot_id, min_degree, n_facilities, seed) <
               std::tie(other.snapshot_id, other.min_degree, other.n_facilities, other.seed);
    }
};

/**
 * @brief Memoizes results per configuration tuple
 *
 * Owned by the calling layer. Results are shared immutably.
 */
class ResultCache {
public:
    std::shared_ptr<const OptimizationResult> find(const RunKey& key);
    void store(const RunKey& key, std::shared_ptr<const OptimizationResult> result);

    size_t size() const { return entries_.size(); }
    void clear();

    size_t hits() const { return hits_; }
    size_t misses() const { return misses_; }

private:
    std::map<RunKey, std::shared_ptr<const OptimizationResult>> entries_;
    size_t hits_ = 0;
    size_t misses_ = 0;
};

// ============================================================================
// Run Statistics
// ============================================================================

struct RunStatistics {
    int runs = 0;
    int cache_hits = 0;
    int failures = 0;

    size_t last_network_size = 0;
    size_t last_risk_subset_size = 0;
    size_t last_hub_count = 0;
    double last_inertia = 0.0;
    int last_iterations = 0;

    double fetch_time_seconds = 0.0;
    double classify_time_seconds = 0.0;
    double optimize_time_seconds = 0.0;
    double assemble_time_seconds = 0.0;

    /**
     * @brief Print summary to stdout
     */
    void print_summary() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Progress callback function type
 */
using ProgressCallback = std::function<void(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
)>;

// ============================================================================
// Optimization Pipeline
// ============================================================================

/**
 * @brief Orchestrates acquisition and the optimization core
 *
 * Network → Risk Classifier → Facility Optimizer → Result Assembler,
 * with results memoized per (snapshot, min_degree, n_facilities, seed).
 */
class OptimizationPipeline {
public:
    /**
     * @throws std::invalid_argument if the configuration does not validate
     */
    explicit OptimizationPipeline(const RunConfig& config);

    /**
     * @brief Acquire the network through the configured provider
     */
    RoadNetwork load_network();

    /**
     * @brief Run the core on an already materialized network
     *
     * @throws InsufficientSamplesError when the fallback ladder still yields
     *         fewer nodes than requested units; nothing is cached then
     */
    std::shared_ptr<const OptimizationResult> run(const RoadNetwork& network);

    /**
     * @brief Run with explicit parameters instead of the configured ones
     */
    std::shared_ptr<const OptimizationResult> run(
        const RoadNetwork& network,
        int min_degree,
        int n_facilities,
        uint64_t seed
    );

    /**
     * @brief load_network() followed by run(network)
     */
    std::shared_ptr<const OptimizationResult> run();

    void set_provider(std::unique_ptr<NetworkProvider> provider);
    void set_progress_callback(ProgressCallback callback);

    const RunStatistics& get_statistics() const { return stats_; }
    void reset_statistics();

    const RunConfig& get_config() const { return config_; }
    ResultCache& cache() { return cache_; }

private:
    RunConfig config_;
    RunStatistics stats_;
    ResultCache cache_;
    ProgressCallback progress_callback_;

    std::unique_ptr<NetworkProvider> provider_;
    RiskClassifier classifier_;
    FacilityOptimizer optimizer_;

    void report_progress(
        const std::string& stage,
        int current,
        int total,
        const std::string& message = ""
    );
};

} // namespace gho
