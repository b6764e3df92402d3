#include "pipeline/optimization_pipeline.hpp"
#include "network/geo.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace gho {

namespace {

const char* const kHighwayPlaceName = "Delhi-Mumbai Expressway (Sohna Segment)";

int env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value) return fallback;
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Invalid integer in ") + name + ": " + value);
    }
}

const RunConfig& validated(const RunConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
    return config;
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // anonymous namespace

// ============================================================================
// RunConfig
// ============================================================================

void RunConfig::apply_mode_defaults() {
    if (mode == "highway") {
        place_name = kHighwayPlaceName;
        center_lat = 28.2378;
        center_lon = 77.0697;
        search_radius_m = 5000;
        min_degree = 3;
    } else {
        search_radius_m = 2000;
        min_degree = 4;
    }
}

json RunConfig::to_json() const {
    json j;

    j["mode"] = mode;
    j["place_name"] = place_name;
    j["center_lat"] = center_lat;
    j["center_lon"] = center_lon;
    j["search_radius_m"] = search_radius_m;
    j["network_file"] = network_file;
    j["provider"] = provider;
    j["overpass_url"] = overpass_url;
    j["nominatim_url"] = nominatim_url;
    j["timeout_seconds"] = timeout_seconds;

    j["n_facilities"] = n_facilities;
    j["min_degree"] = min_degree;
    j["seed"] = seed;
    j["n_init"] = n_init;
    j["max_iter"] = max_iter;
    j["parallel_restarts"] = parallel_restarts;

    j["output_directory"] = output_directory;
    j["export_html"] = export_html;
    j["export_svg"] = export_svg;
    j["export_json"] = export_json;
    j["verbose"] = verbose;

    return j;
}

RunConfig RunConfig::from_json(const json& j) {
    RunConfig config;

    // Mode first so its presets can be overridden below
    if (j.contains("mode")) {
        config.mode = j["mode"].get<std::string>();
        if (config.mode == "highway") config.apply_mode_defaults();
    }

    // Network acquisition
    if (j.contains("place_name")) config.place_name = j["place_name"].get<std::string>();
    if (j.contains("center_lat")) config.center_lat = j["center_lat"];
    if (j.contains("center_lon")) config.center_lon = j["center_lon"];
    if (j.contains("search_radius_m")) config.search_radius_m = j["search_radius_m"];
    if (j.contains("network_file")) config.network_file = j["network_file"].get<std::string>();
    if (j.contains("provider")) config.provider = j["provider"].get<std::string>();
    if (j.contains("overpass_url")) config.overpass_url = j["overpass_url"].get<std::string>();
    if (j.contains("nominatim_url")) config.nominatim_url = j["nominatim_url"].get<std::string>();
    if (j.contains("timeout_seconds")) config.timeout_seconds = j["timeout_seconds"];

    // Optimization - n_ambulances and risk_threshold are accepted as aliases
    if (j.contains("n_facilities")) {
        config.n_facilities = j["n_facilities"];
    } else if (j.contains("n_ambulances")) {
        config.n_facilities = j["n_ambulances"];
    }
    if (j.contains("min_degree")) {
        config.min_degree = j["min_degree"];
    } else if (j.contains("risk_threshold")) {
        config.min_degree = j["risk_threshold"];
    }
    if (j.contains("seed")) {
        if (!j["seed"].is_number_unsigned()) {
            throw std::invalid_argument("seed must be a non-negative integer");
        }
        config.seed = j["seed"].get<uint64_t>();
    }
    if (j.contains("n_init")) config.n_init = j["n_init"];
    if (j.contains("max_iter")) config.max_iter = j["max_iter"];
    if (j.contains("parallel_restarts")) config.parallel_restarts = j["parallel_restarts"];

    // Output config
    if (j.contains("output_directory")) config.output_directory = j["output_directory"].get<std::string>();
    if (j.contains("export_html")) config.export_html = j["export_html"];
    if (j.contains("export_svg")) config.export_svg = j["export_svg"];
    if (j.contains("export_json")) config.export_json = j["export_json"];
    if (j.contains("verbose")) config.verbose = j["verbose"];

    return config;
}

RunConfig RunConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }

    try {
        return from_json(j);
    } catch (const json::type_error& e) {
        throw std::invalid_argument("Config file " + path + " has a field of the wrong type: " + e.what());
    }
}

void RunConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    file << to_json().dump(2);
}

RunConfig RunConfig::from_environment() {
    RunConfig config;

    const char* mode = std::getenv("GHO_MODE");
    if (mode) {
        config.mode = mode;
        if (config.mode == "highway") config.apply_mode_defaults();
    }

    const char* place = std::getenv("GHO_PLACE");
    if (place) config.place_name = place;

    config.n_facilities = env_int("GHO_UNITS", config.n_facilities);
    config.min_degree = env_int("GHO_MIN_DEGREE", config.min_degree);

    const char* seed = std::getenv("GHO_SEED");
    if (seed) {
        try {
            size_t pos = 0;
            std::string text = seed;
            if (text.find('-') != std::string::npos) throw std::invalid_argument(text);
            config.seed = std::stoull(text, &pos);
            if (pos != text.size()) throw std::invalid_argument(text);
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string("Invalid integer in GHO_SEED: ") + seed);
        }
    }

    const char* overpass = std::getenv("GHO_OVERPASS_URL");
    if (overpass) config.overpass_url = overpass;

    const char* output_dir = std::getenv("GHO_OUTPUT_DIR");
    if (output_dir) config.output_directory = output_dir;

    return config;
}

bool RunConfig::validate(std::string& error_message) const {
    if (mode != "city" && mode != "highway") {
        error_message = "Mode must be 'city' or 'highway'";
        return false;
    }

    if (provider != "overpass" && provider != "file") {
        error_message = "Provider must be 'overpass' or 'file'";
        return false;
    }

    if (provider == "file" && network_file.empty()) {
        error_message = "The file provider requires network_file";
        return false;
    }

    if (provider == "overpass" && mode == "city" && place_name.empty()) {
        error_message = "City mode requires a place name";
        return false;
    }

    if (!geo::is_valid_coordinate(center_lat, center_lon)) {
        error_message = "Center coordinates out of range";
        return false;
    }

    if (search_radius_m <= 0) {
        error_message = "Search radius must be positive";
        return false;
    }

    if (timeout_seconds <= 0) {
        error_message = "Timeout must be positive";
        return false;
    }

    if (n_facilities < 1) {
        error_message = "Number of units must be at least 1";
        return false;
    }

    std::string optimizer_error;
    if (!to_optimizer_config().validate(optimizer_error)) {
        error_message = optimizer_error;
        return false;
    }

    return true;
}

std::vector<std::string> RunConfig::range_notes() const {
    std::vector<std::string> notes;
    if (n_facilities > 20) {
        notes.push_back("Unit count " + std::to_string(n_facilities) +
                        " is above the recommended range 1-20");
    }
    if (min_degree < 2 || min_degree > 6) {
        notes.push_back("Risk threshold " + std::to_string(min_degree) +
                        " is outside the recommended range 2-6");
    }
    if (search_radius_m > 10000) {
        notes.push_back("Search radius above 10 km: planar clustering loses accuracy at this scale");
    }
    return notes;
}

NetworkQuery RunConfig::to_query() const {
    NetworkQuery query;
    query.mode = is_highway() ? NetworkQuery::Mode::Point : NetworkQuery::Mode::Place;
    query.place_name = place_name;
    query.center_lat = center_lat;
    query.center_lon = center_lon;
    query.radius_m = search_radius_m;
    return query;
}

ProviderConfig RunConfig::to_provider_config() const {
    ProviderConfig pc;
    pc.overpass_url = overpass_url;
    pc.nominatim_url = nominatim_url;
    pc.network_file = network_file;
    pc.timeout_seconds = timeout_seconds;
    pc.verbose = verbose;
    return pc;
}

OptimizerConfig RunConfig::to_optimizer_config() const {
    OptimizerConfig oc;
    oc.n_init = n_init;
    oc.max_iter = max_iter;
    oc.parallel_restarts = parallel_restarts;
    return oc;
}

// ============================================================================
// ResultCache
// ============================================================================

std::shared_ptr<const OptimizationResult> ResultCache::find(const RunKey& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        misses_++;
        return nullptr;
    }
    hits_++;
    return it->second;
}

void ResultCache::store(const RunKey& key, std::shared_ptr<const OptimizationResult> result) {
    entries_[key] = std::move(result);
}

void ResultCache::clear() {
    entries_.clear();
    hits_ = 0;
    misses_ = 0;
}

// ============================================================================
// RunStatistics
// ============================================================================

void RunStatistics::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Optimization Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Runs:\n";
    std::cout << "  Completed: " << runs << "\n";
    std::cout << "  Served from cache: " << cache_hits << "\n";
    std::cout << "  Failed: " << failures << "\n\n";

    std::cout << "Last Run:\n";
    std::cout << "  Network size: " << last_network_size << "\n";
    std::cout << "  High risk zones: " << last_risk_subset_size << "\n";
    std::cout << "  Units deployed: " << last_hub_count << "\n";
    std::cout << "  Inertia: " << last_inertia << "\n";
    std::cout << "  Iterations: " << last_iterations << "\n\n";

    std::cout << "Timing:\n";
    std::cout << "  Network acquisition: " << fetch_time_seconds << " seconds\n";
    std::cout << "  Classification: " << classify_time_seconds << " seconds\n";
    std::cout << "  Clustering: " << optimize_time_seconds << " seconds\n";
    std::cout << "  Assembly: " << assemble_time_seconds << " seconds\n";

    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

json RunStatistics::to_json() const {
    json j;

    j["runs"] = runs;
    j["cache_hits"] = cache_hits;
    j["failures"] = failures;

    j["last_network_size"] = last_network_size;
    j["last_risk_subset_size"] = last_risk_subset_size;
    j["last_hub_count"] = last_hub_count;
    j["last_inertia"] = last_inertia;
    j["last_iterations"] = last_iterations;

    j["fetch_time_seconds"] = fetch_time_seconds;
    j["classify_time_seconds"] = classify_time_seconds;
    j["optimize_time_seconds"] = optimize_time_seconds;
    j["assemble_time_seconds"] = assemble_time_seconds;

    return j;
}

// ============================================================================
// OptimizationPipeline
// ============================================================================

OptimizationPipeline::OptimizationPipeline(const RunConfig& config)
    : config_(validated(config)),
      classifier_(kRelaxedMinDegree),
      optimizer_(config_.to_optimizer_config()) {
    provider_ = NetworkProviderFactory::create(config_.provider, config_.to_provider_config());
}

void OptimizationPipeline::set_provider(std::unique_ptr<NetworkProvider> provider) {
    if (!provider) {
        throw std::invalid_argument("Network provider must not be null");
    }
    provider_ = std::move(provider);
}

void OptimizationPipeline::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

void OptimizationPipeline::reset_statistics() {
    stats_ = RunStatistics{};
}

void OptimizationPipeline::report_progress(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
) {
    if (progress_callback_) {
        progress_callback_(stage, current, total, message);
    }
}

RoadNetwork OptimizationPipeline::load_network() {
    NetworkQuery query = config_.to_query();
    report_progress("Downloading", 0, 1, query.describe());

    auto start = std::chrono::steady_clock::now();
    RoadNetwork network = provider_->fetch(query);
    stats_.fetch_time_seconds += seconds_since(start);

    if (network.place_name.empty()) {
        network.place_name = config_.place_name;
    }

    report_progress("Downloading", 1, 1, std::to_string(network.num_nodes()) + " nodes");
    return network;
}

std::shared_ptr<const OptimizationResult> OptimizationPipeline::run() {
    RoadNetwork network = load_network();
    return run(network);
}

std::shared_ptr<const OptimizationResult> OptimizationPipeline::run(const RoadNetwork& network) {
    return run(network, config_.min_degree, config_.n_facilities, config_.seed);
}

std::shared_ptr<const OptimizationResult> OptimizationPipeline::run(
    const RoadNetwork& network,
    int min_degree,
    int n_facilities,
    uint64_t seed
) {
    if (n_facilities < 1) {
        throw std::invalid_argument("Number of units must be at least 1");
    }

    RunKey key;
    key.snapshot_id = network.fingerprint();
    key.min_degree = min_degree;
    key.n_facilities = n_facilities;
    key.seed = seed;

    if (auto cached = cache_.find(key)) {
        stats_.cache_hits++;
        report_progress("Cache", 1, 1, "reusing result for " + key.snapshot_id);
        return cached;
    }

    // Classify
    report_progress("Classifying", 0, 3, std::to_string(network.num_nodes()) + " nodes");
    auto classify_start = std::chrono::steady_clock::now();
    RiskSubset subset = classifier_.classify(
        network.nodes(), min_degree, static_cast<size_t>(n_facilities));
    stats_.classify_time_seconds += seconds_since(classify_start);

    // Optimize
    report_progress("Optimizing", 1, 3, std::to_string(subset.size()) + " risk nodes");
    auto optimize_start = std::chrono::steady_clock::now();
    ClusteringOutcome outcome;
    try {
        outcome = optimizer_.cluster(subset.samples(), n_facilities, seed);
    } catch (const InsufficientSamplesError&) {
        stats_.failures++;
        throw;
    }
    stats_.optimize_time_seconds += seconds_since(optimize_start);

    // Assemble
    report_progress("Assembling", 2, 3, std::to_string(outcome.hubs.size()) + " hubs");
    auto assemble_start = std::chrono::steady_clock::now();
    OptimizationResult result = ResultAssembler::assemble(subset, outcome.hubs, network.num_nodes());
    result.coverage = compute_hub_coverage(subset, outcome.hubs);
    result.warnings.insert(result.warnings.end(), outcome.warnings.begin(), outcome.warnings.end());
    result.snapshot_id = key.snapshot_id;
    result.place_name = network.place_name;
    stats_.assemble_time_seconds += seconds_since(assemble_start);

    stats_.runs++;
    stats_.last_network_size = result.network_size;
    stats_.last_risk_subset_size = result.risk_subset_size;
    stats_.last_hub_count = result.hub_count;
    stats_.last_inertia = outcome.inertia;
    stats_.last_iterations = outcome.iterations;

    auto shared = std::make_shared<const OptimizationResult>(std::move(result));
    cache_.store(key, shared);

    report_progress("Assembling", 3, 3, "done");
    return shared;
}

} // namespace gho
