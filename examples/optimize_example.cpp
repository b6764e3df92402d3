#include "core/errors.hpp"
#include "network/geo.hpp"
#include "pipeline/optimization_pipeline.hpp"
#include "render/map_renderer.hpp"
#include <filesystem>
#include <iostream>
#include <iomanip>

using namespace gho;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

void progress_handler(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
) {
    std::cout << "[" << stage << "] ";
    if (total > 0) {
        std::cout << current << "/" << total << " ";
        int percent = (current * 100) / total;
        std::cout << "(" << percent << "%) ";
    }
    if (!message.empty()) {
        std::cout << "- " << message;
    }
    std::cout << std::endl;
}

// Street grid of rows x cols intersections spaced ~110 m apart. Interior
// nodes get four streets, edges three, corners two.
RoadNetwork build_grid_network(int rows, int cols, double origin_lat, double origin_lon) {
    const double step = 0.001;
    RoadNetwork network;
    network.place_name = "Synthetic grid";

    auto node_id = [cols](int r, int c) { return std::to_string(r * cols + c); };
    auto length_of = [&network](const NetworkEdge& e) {
        const NetworkNode* a = network.get_node(e.source);
        const NetworkNode* b = network.get_node(e.target);
        return geo::haversine_m(a->lat, a->lon, b->lat, b->lon);
    };

    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            NetworkNode node;
            node.id = node_id(r, c);
            node.lat = origin_lat + r * step;
            node.lon = origin_lon + c * step;
            network.add_node(node);
        }
    }

    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            if (c + 1 < cols) {
                NetworkEdge edge;
                edge.source = node_id(r, c);
                edge.target = node_id(r, c + 1);
                edge.name = "Cross Road " + std::to_string(r + 1);
                edge.highway = "residential";
                edge.length_m = length_of(edge);
                network.add_edge(edge);
            }
            if (r + 1 < rows) {
                NetworkEdge edge;
                edge.source = node_id(r, c);
                edge.target = node_id(r + 1, c);
                edge.name = "Main Road " + std::to_string(c + 1);
                edge.highway = "secondary";
                edge.length_m = length_of(edge);
                network.add_edge(edge);
            }
        }
    }

    network.compute_degrees_from_edges();
    return network;
}

int main() {
    print_separator("Golden Hour Optimizer - Synthetic Grid Example");

    // =========================================================================
    // Network
    // =========================================================================

    print_separator("Step 1: Build and save a network snapshot");

    RoadNetwork network = build_grid_network(12, 12, 12.9300, 77.6200);
    auto stats = network.compute_statistics();
    std::cout << "Intersections: " << stats.num_nodes << "\n";
    std::cout << "Street segments: " << stats.num_edges << "\n";
    std::cout << "Nodes with 4+ streets: " << stats.count_at_least(4) << "\n";

    std::filesystem::create_directories("output/example");
    const std::string snapshot_path = "output/example/grid_network.json";
    network.save_to_json(snapshot_path);
    std::cout << "Saved snapshot to: " << snapshot_path << "\n";

    // =========================================================================
    // Pipeline
    // =========================================================================

    print_separator("Step 2: Run the pipeline from the snapshot");

    RunConfig config;
    config.provider = "file";
    config.network_file = snapshot_path;
    config.n_facilities = 4;
    config.min_degree = 4;
    config.output_directory = "output/example";

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Configuration error: " << error << "\n";
        return 1;
    }

    OptimizationPipeline pipeline(config);
    pipeline.set_progress_callback(progress_handler);

    RoadNetwork loaded = pipeline.load_network();
    auto result = pipeline.run(loaded);

    std::cout << "\nOptimal Standby Points:\n";
    std::cout << result->format_hub_lines();

    std::cout << "\nCoverage:\n";
    for (const auto& c : result->coverage) {
        std::cout << "  Hub " << c.hub_index << ": " << c.assigned_nodes << " risk points, mean "
                  << std::fixed << std::setprecision(0) << c.mean_distance_m << " m, max "
                  << c.max_distance_m << " m\n";
    }
    std::cout << std::defaultfloat;

    // Same key again: served from the cache
    auto again = pipeline.run(loaded);
    std::cout << "\nSecond run served from cache: " << (again == result ? "yes" : "no") << "\n";

    // A threshold no node reaches: the fallback ladder relaxes it
    auto relaxed = pipeline.run(loaded, 5, 4, 42);
    std::cout << "Threshold 5 fell back to tier: " << risk_tier_to_string(relaxed->subset.tier) << "\n";
    for (const auto& w : relaxed->warnings) {
        std::cout << "  Warning: " << w.message << "\n";
    }

    // =========================================================================
    // Outputs
    // =========================================================================

    print_separator("Step 3: Export");

    result->save_to_json("output/example/result.json");
    HtmlMapRenderer().export_html("output/example/map.html", "Synthetic grid", *result, &loaded);
    SvgPlotRenderer().export_svg("output/example/map.svg", "Synthetic grid", *result, &loaded);
    std::cout << "Saved result.json, map.html and map.svg to output/example/\n";

    // =========================================================================
    // Failure
    // =========================================================================

    print_separator("Step 4: More units than intersections");

    try {
        pipeline.run(loaded, 4, 500, 42);
    } catch (const InsufficientSamplesError& e) {
        std::cout << "Expected failure: " << e.what() << "\n";
        std::cout << "  available = " << e.available() << ", required = " << e.required() << "\n";
    }

    pipeline.get_statistics().print_summary();
    return 0;
}
