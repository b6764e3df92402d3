#include "cli/cli.hpp"
#include "core/errors.hpp"
#include "network/network_provider.hpp"
#include "network/road_network.hpp"
#include "pipeline/optimization_pipeline.hpp"
#include "render/map_renderer.hpp"
#include "risk/risk_classifier.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

using namespace gho;

// ============== Helper Functions ==============

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    std::stringstream ss;
    if (ms >= 1000) {
        ss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    } else {
        ss << ms << "ms";
    }
    return ss.str();
}

// Layer config sources: file (or environment), then mode preset, then flags
RunConfig build_config(const Args& args) {
    RunConfig config;
    if (args.has("config")) {
        config = RunConfig::from_json_file(args.get("config").value);
    } else {
        config = RunConfig::from_environment();
    }

    if (args.has("mode")) {
        config.mode = args.get("mode").value;
        config.apply_mode_defaults();
    }

    if (args.has("place")) {
        config.place_name = args.get("place").value;
    } else if (!args.positional.empty()) {
        config.place_name = args.joined_positional();
    }

    if (args.has("center")) {
        auto coords = args.get("center").as_double_list();
        if (coords.size() != 2) {
            throw std::invalid_argument("--center expects 'lat,lon'");
        }
        config.center_lat = coords[0];
        config.center_lon = coords[1];
    }

    if (args.has("radius")) config.search_radius_m = args.get("radius").as_int();

    if (args.has("network")) {
        config.provider = "file";
        config.network_file = args.get("network").value;
    }

    if (args.has("units")) config.n_facilities = args.get("units").as_int();
    if (args.has("min-degree")) config.min_degree = args.get("min-degree").as_int();
    if (args.has("seed")) config.seed = args.get("seed").as_uint64();
    if (args.has("restarts")) config.n_init = args.get("restarts").as_int();
    if (args.has("max-iter")) config.max_iter = args.get("max-iter").as_int();
    if (args.has("parallel")) config.parallel_restarts = true;
    if (args.has("output")) config.output_directory = args.get("output").value;
    if (args.has("quiet")) config.verbose = false;

    return config;
}

std::string default_title(const RunConfig& config) {
    if (config.is_highway()) return "Highway Trauma Response Plan";
    return config.place_name;
}

void print_warnings(const std::vector<DegenerateClusterWarning>& warnings) {
    for (const auto& w : warnings) {
        std::cerr << "Warning: " << w.message << "\n";
    }
}

void print_network_stats(const NetworkStatistics& stats) {
    std::cout << "\nNetwork Statistics:\n";
    std::cout << "  Nodes: " << stats.num_nodes << "\n";
    std::cout << "  Street segments: " << stats.num_edges << "\n";
    std::cout << "  Avg street count: " << std::fixed << std::setprecision(2)
              << stats.avg_degree << "\n";
    std::cout << "  Min/Max street count: " << stats.min_degree << " / " << stats.max_degree << "\n";
    std::cout << "  Total length: " << stats.total_length_km << " km\n";
    std::cout << std::setprecision(6);
    std::cout << "  Bounds: (" << stats.bounds.min_lat << ", " << stats.bounds.min_lon << ") - ("
              << stats.bounds.max_lat << ", " << stats.bounds.max_lon << ")\n";
    std::cout << std::defaultfloat;
}

// ============== gho optimize ==============
int cmd_optimize(const Args& args) {
    RunConfig config = build_config(args);
    std::string title = args.get("title", default_title(config)).value;

    for (const auto& note : config.range_notes()) {
        std::cerr << "Warning: " << note << "\n";
    }

    OptimizationPipeline pipeline(config);
    if (config.verbose) {
        pipeline.set_progress_callback([](const std::string& stage, int current, int total,
                                          const std::string& message) {
            std::cout << "  [" << stage << "] " << current << "/" << total;
            if (!message.empty()) std::cout << " " << message;
            std::cout << "\n";
        });
    }

    auto start = std::chrono::steady_clock::now();

    if (config.verbose) {
        std::cout << "Downloading road network for "
                  << (config.provider == "file" ? config.network_file : config.to_query().describe())
                  << "...\n";
    }
    RoadNetwork network = pipeline.load_network();
    if (config.verbose) {
        std::cout << "Loaded " << network.num_nodes() << " intersections and "
                  << network.num_edges() << " street segments\n";
    }

    std::shared_ptr<const OptimizationResult> result;
    try {
        result = pipeline.run(network);
    } catch (const InsufficientSamplesError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Try fewer units (--units) or a wider area (--radius / --place).\n";
        return 1;
    }

    print_warnings(result->warnings);

    std::cout << "\nRisk zones identified: " << result->risk_subset_size
              << " (tier: " << risk_tier_to_string(result->subset.tier) << ")\n";
    std::cout << "\nOptimal Standby Points:\n";
    std::cout << result->format_hub_lines();

    fs::create_directories(config.output_directory);
    std::string out_base = config.output_directory;
    if (out_base.back() != '/') out_base += "/";

    std::vector<std::string> written;

    if (config.export_json) {
        result->save_to_json(out_base + "result.json");
        written.push_back("result.json");
    }

    if (config.export_html) {
        HtmlMapRenderer::Options options;
        options.zoom = config.is_highway() ? 13 : 14;
        HtmlMapRenderer html(options);
        html.export_html(out_base + "map.html", title, *result, &network);
        written.push_back("map.html");
    }

    if (config.export_svg) {
        SvgPlotRenderer svg;
        svg.export_svg(out_base + "map.svg", title, *result, &network);
        written.push_back("map.svg");
    }

    std::ofstream readme(out_base + "README.txt");
    readme << "Golden Hour Optimizer Run\n";
    readme << std::string(50, '=') << "\n\n";
    readme << "Title: " << title << "\n";
    readme << "Snapshot: " << result->snapshot_id << "\n";
    readme << "Units: " << result->hub_count << "\n";
    readme << "Risk threshold: " << config.min_degree << "\n";
    readme << "Seed: " << config.seed << "\n\n";
    readme << "Artifacts:\n";
    readme << "  result.json - Hubs, coverage, warnings and the risk subset\n";
    readme << "  map.html    - Interactive map (needs network access for tiles)\n";
    readme << "  map.svg     - Static plot of streets, risk zones and hubs\n\n";
    readme << "Deployment coordinates:\n";
    readme << result->format_unit_lines() << "\n";
    readme.close();
    written.push_back("README.txt");

    if (config.verbose) {
        pipeline.get_statistics().print_summary();
    }

    std::cout << "\n";
    std::cout << "======================================================================\n";
    std::cout << "  Optimization Complete!\n";
    std::cout << "======================================================================\n";
    std::cout << "\n";
    std::cout << "Output:       " << out_base << "\n";
    for (const auto& name : written) {
        std::cout << "  Saved: " << name << "\n";
    }
    std::cout << "Network size: " << result->network_size << "\n";
    std::cout << "Risk zones:   " << result->risk_subset_size << "\n";
    std::cout << "Units:        " << result->hub_count << "\n";
    std::cout << "Time:         " << format_duration(std::chrono::steady_clock::now() - start) << "\n";
    std::cout << "\n";

    return 0;
}

// ============== gho fetch ==============
int cmd_fetch(const Args& args) {
    RunConfig config = build_config(args);
    std::string output_path = args.require("output");

    if (config.provider == "file") {
        std::cerr << "Error: fetch downloads from Overpass; --network is not accepted here\n";
        return 1;
    }

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Error: Invalid configuration: " << error << "\n";
        return 1;
    }

    auto provider = NetworkProviderFactory::create(config.provider, config.to_provider_config());
    NetworkQuery query = config.to_query();

    std::cout << "Downloading road network for " << query.describe() << "...\n";
    auto start = std::chrono::steady_clock::now();
    RoadNetwork network = provider->fetch(query);
    if (network.place_name.empty()) network.place_name = config.place_name;

    fs::path out_path(output_path);
    if (out_path.has_parent_path()) {
        fs::create_directories(out_path.parent_path());
    }

    network.save_to_json(output_path);
    std::cout << "Saved " << network.num_nodes() << " intersections and "
              << network.num_edges() << " street segments to: " << output_path << "\n";
    std::cout << "Snapshot: " << network.fingerprint() << "\n";
    std::cout << "Time: " << format_duration(std::chrono::steady_clock::now() - start) << "\n";
    return 0;
}

// ============== gho classify ==============
int cmd_classify(const Args& args) {
    std::string input_path = args.require("input");
    int min_degree = args.get("min-degree", "4").as_int();
    int units = args.get("units", "5").as_int();
    if (units < 1) {
        throw std::invalid_argument("Number of units must be at least 1");
    }

    std::cout << "Loading network from: " << input_path << "\n";
    RoadNetwork network = RoadNetwork::load_from_json(input_path);
    auto stats = network.compute_statistics();

    std::cout << "\nStreet count histogram:\n";
    for (const auto& [degree, count] : stats.degree_histogram) {
        std::cout << "  " << std::setw(3) << degree << ": " << count << "\n";
    }

    RiskClassifier classifier;
    RiskSubset subset = classifier.classify(network.nodes(), min_degree, static_cast<size_t>(units));

    std::cout << "\nRequested threshold: " << subset.requested_min_degree << "\n";
    std::cout << "Candidates at threshold: " << subset.primary_count << "\n";
    std::cout << "Tier used: " << risk_tier_to_string(subset.tier) << "\n";
    if (subset.tier != RiskTier::FullNetwork) {
        std::cout << "Threshold applied: " << subset.applied_min_degree << "\n";
    }
    std::cout << "Risk subset size: " << subset.size() << "\n";
    print_warnings(subset.warnings);

    if (subset.size() < static_cast<size_t>(units)) {
        std::cerr << "Error: only " << subset.size() << " intersections available for "
                  << units << " units\n";
        return 1;
    }
    return 0;
}

// ============== gho stats ==============
int cmd_stats(const Args& args) {
    std::string input_path = args.require("input");

    std::cout << "Loading network from: " << input_path << "\n";
    RoadNetwork network = RoadNetwork::load_from_json(input_path);

    auto stats = network.compute_statistics();
    print_network_stats(stats);

    std::cout << "\nHigh risk candidates:\n";
    for (int threshold = 2; threshold <= 6; ++threshold) {
        std::cout << "  street count >= " << threshold << ": "
                  << stats.count_at_least(threshold) << "\n";
    }

    std::cout << "\nSnapshot: " << network.fingerprint() << "\n";
    return 0;
}

// ============== Main ==============

int main(int argc, char** argv) {
    CLI cli("gho", "1.0.0");

    // gho optimize
    cli.register_command({
        "optimize",
        "Place ambulance standby points over high-risk intersections",
        {
            {"place", "p", "Place name to download (city mode)", "", false, false},
            {"mode", "m", "Scenario: city or highway", "", false, false},
            {"center", "", "Query center as lat,lon (highway mode)", "", false, false},
            {"radius", "r", "Search radius in meters", "", false, false},
            {"network", "n", "Load a saved network snapshot instead of downloading", "", false, false},
            {"config", "c", "Path to JSON config file", "", false, false},
            {"units", "u", "Number of ambulances to deploy", "", false, false},
            {"min-degree", "d", "Risk threshold (minimum street count)", "", false, false},
            {"seed", "s", "Random seed", "", false, false},
            {"restarts", "", "k-means restarts", "", false, false},
            {"max-iter", "", "Maximum iterations per restart", "", false, false},
            {"parallel", "", "Run restarts on worker threads", "", false, true},
            {"output", "o", "Output directory", "", false, false},
            {"title", "t", "Title for the map and plot", "", false, false},
            {"quiet", "q", "Only print results and warnings", "", false, true}
        },
        cmd_optimize,
        "place"
    });

    // gho fetch
    cli.register_command({
        "fetch",
        "Download a road network and save it as a snapshot JSON",
        {
            {"place", "p", "Place name to download (city mode)", "", false, false},
            {"mode", "m", "Scenario: city or highway", "", false, false},
            {"center", "", "Query center as lat,lon (highway mode)", "", false, false},
            {"radius", "r", "Search radius in meters", "", false, false},
            {"config", "c", "Path to JSON config file", "", false, false},
            {"output", "o", "Output snapshot path", "", true, false}
        },
        cmd_fetch,
        "place"
    });

    // gho classify
    cli.register_command({
        "classify",
        "Show the risk tier chosen for a snapshot and threshold",
        {
            {"input", "i", "Network snapshot JSON file", "", true, false},
            {"min-degree", "d", "Risk threshold (minimum street count)", "4", false, false},
            {"units", "u", "Number of ambulances to deploy", "5", false, false}
        },
        cmd_classify
    });

    // gho stats
    cli.register_command({
        "stats",
        "Print statistics about a network snapshot",
        {
            {"input", "i", "Network snapshot JSON file", "", true, false}
        },
        cmd_stats
    });

    return cli.run(argc, argv);
}
