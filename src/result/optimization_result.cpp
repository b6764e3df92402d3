#include "result/optimization_result.hpp"
#include "network/geo.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace gho {

namespace {

std::string format_line(const std::string& prefix, const Hub& hub) {
    std::ostringstream ss;
    ss << prefix << hub.index << ": "
       << std::fixed << std::setprecision(6) << hub.lat << ", " << hub.lon;
    return ss.str();
}

} // anonymous namespace

nlohmann::json HubCoverage::to_json() const {
    nlohmann::json j;
    j["hub_index"] = hub_index;
    j["assigned_nodes"] = assigned_nodes;
    j["mean_distance_m"] = mean_distance_m;
    j["max_distance_m"] = max_distance_m;
    return j;
}

std::string OptimizationResult::format_unit_lines() const {
    std::ostringstream ss;
    for (size_t i = 0; i < hubs.size(); ++i) {
        if (i > 0) ss << "\n";
        ss << format_line("Unit ", hubs[i]);
    }
    return ss.str();
}

std::string OptimizationResult::format_hub_lines() const {
    std::ostringstream ss;
    for (const auto& hub : hubs) {
        ss << format_line("  Hub ", hub) << "\n";
    }
    return ss.str();
}

nlohmann::json OptimizationResult::to_json() const {
    nlohmann::json j;
    j["snapshot_id"] = snapshot_id;
    j["place_name"] = place_name;
    j["summary"] = {
        {"network_size", network_size},
        {"risk_subset_size", risk_subset_size},
        {"hub_count", hub_count}
    };

    nlohmann::json hubs_json = nlohmann::json::array();
    for (const auto& hub : hubs) {
        hubs_json.push_back(hub.to_json());
    }
    j["hubs"] = hubs_json;

    nlohmann::json coverage_json = nlohmann::json::array();
    for (const auto& c : coverage) {
        coverage_json.push_back(c.to_json());
    }
    j["coverage"] = coverage_json;

    nlohmann::json warnings_json = nlohmann::json::array();
    for (const auto& w : warnings) {
        warnings_json.push_back(w.to_json());
    }
    j["warnings"] = warnings_json;

    j["risk_subset"] = subset.to_json();
    return j;
}

void OptimizationResult::save_to_json(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    file << to_json().dump(2);
}

OptimizationResult ResultAssembler::assemble(
    const RiskSubset& subset,
    const std::vector<Hub>& hubs,
    size_t network_size
) {
    OptimizationResult result;
    result.subset = subset;
    result.hubs = hubs;
    result.network_size = network_size;
    result.risk_subset_size = subset.size();
    result.hub_count = hubs.size();
    result.warnings = subset.warnings;
    return result;
}

std::vector<HubCoverage> compute_hub_coverage(
    const RiskSubset& subset,
    const std::vector<Hub>& hubs
) {
    std::vector<HubCoverage> coverage(hubs.size());
    for (size_t h = 0; h < hubs.size(); ++h) {
        coverage[h].hub_index = hubs[h].index;
    }
    if (hubs.empty()) return coverage;

    std::vector<double> total(hubs.size(), 0.0);
    for (const auto& node : subset.members) {
        // Nearest in the same planar sense the optimizer used
        size_t best = 0;
        double best_d = 0.0;
        for (size_t h = 0; h < hubs.size(); ++h) {
            double dlat = node.lat - hubs[h].lat;
            double dlon = node.lon - hubs[h].lon;
            double d = dlat * dlat + dlon * dlon;
            if (h == 0 || d < best_d) {
                best_d = d;
                best = h;
            }
        }

        double meters = geo::haversine_m(node.lat, node.lon, hubs[best].lat, hubs[best].lon);
        coverage[best].assigned_nodes++;
        total[best] += meters;
        coverage[best].max_distance_m = std::max(coverage[best].max_distance_m, meters);
    }

    for (size_t h = 0; h < hubs.size(); ++h) {
        if (coverage[h].assigned_nodes > 0) {
            coverage[h].mean_distance_m = total[h] / coverage[h].assigned_nodes;
        }
    }
    return coverage;
}

} // namespace gho
