#include "network/road_network.hpp"
#include "network/geo.hpp"
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace gho {

// ==========================================
// NetworkNode Implementation
// ==========================================

nlohmann::json NetworkNode::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["lat"] = lat;
    j["lon"] = lon;
    j["street_count"] = degree;
    return j;
}

NetworkNode NetworkNode::from_json(const nlohmann::json& j) {
    NetworkNode node;
    const auto& id = j.at("id");
    node.id = id.is_string() ? id.get<std::string>() : id.dump();
    node.lat = j.at("lat").get<double>();
    node.lon = j.at("lon").get<double>();

    if (j.contains("street_count")) {
        node.degree = j["street_count"].get<int>();
    } else if (j.contains("degree")) {
        node.degree = j["degree"].get<int>();
    } else {
        node.degree = -1;
    }

    return node;
}

// ==========================================
// NetworkEdge Implementation
// ==========================================

nlohmann::json NetworkEdge::to_json() const {
    nlohmann::json j;
    j["source"] = source;
    j["target"] = target;
    if (!name.empty()) {
        j["name"] = name;
    }
    if (!highway.empty()) {
        j["highway"] = highway;
    }
    j["length_m"] = length_m;
    return j;
}

NetworkEdge NetworkEdge::from_json(const nlohmann::json& j) {
    NetworkEdge edge;
    const auto& src = j.at("source");
    const auto& tgt = j.at("target");
    edge.source = src.is_string() ? src.get<std::string>() : src.dump();
    edge.target = tgt.is_string() ? tgt.get<std::string>() : tgt.dump();
    edge.name = j.value("name", "");
    edge.highway = j.value("highway", "");
    edge.length_m = j.value("length_m", 0.0);
    return edge;
}

// ==========================================
// BoundingBox / NetworkStatistics
// ==========================================

double BoundingBox::diagonal_m() const {
    return geo::haversine_m(min_lat, min_lon, max_lat, max_lon);
}

nlohmann::json BoundingBox::to_json() const {
    nlohmann::json j;
    j["min_lat"] = min_lat;
    j["min_lon"] = min_lon;
    j["max_lat"] = max_lat;
    j["max_lon"] = max_lon;
    return j;
}

size_t NetworkStatistics::count_at_least(int min_degree) const {
    size_t count = 0;
    for (const auto& [degree, n] : degree_histogram) {
        if (degree >= min_degree) count += n;
    }
    return count;
}

nlohmann::json NetworkStatistics::to_json() const {
    nlohmann::json j;
    j["num_nodes"] = num_nodes;
    j["num_edges"] = num_edges;
    j["avg_degree"] = avg_degree;
    j["max_degree"] = max_degree;
    j["min_degree"] = min_degree;
    j["total_length_km"] = total_length_km;
    j["bounds"] = bounds.to_json();

    nlohmann::json hist = nlohmann::json::object();
    for (const auto& [degree, n] : degree_histogram) {
        hist[std::to_string(degree)] = n;
    }
    j["degree_histogram"] = hist;
    return j;
}

// ==========================================
// RoadNetwork Implementation
// ==========================================

void RoadNetwork::add_node(const NetworkNode& node) {
    if (node.id.empty()) {
        throw std::invalid_argument("Network node requires an id");
    }
    if (node_index_.count(node.id)) {
        throw std::invalid_argument("Duplicate network node id: " + node.id);
    }
    if (!geo::is_valid_coordinate(node.lat, node.lon)) {
        throw std::invalid_argument("Invalid coordinates for node " + node.id);
    }

    node_index_[node.id] = nodes_.size();
    nodes_.push_back(node);
}

void RoadNetwork::add_edge(const NetworkEdge& edge) {
    if (!has_node(edge.source) || !has_node(edge.target)) {
        throw std::invalid_argument(
            "Edge references unknown node: " + edge.source + " -> " + edge.target);
    }
    edges_.push_back(edge);
}

const NetworkNode* RoadNetwork::get_node(const std::string& node_id) const {
    auto it = node_index_.find(node_id);
    if (it == node_index_.end()) return nullptr;
    return &nodes_[it->second];
}

bool RoadNetwork::has_node(const std::string& node_id) const {
    return node_index_.count(node_id) > 0;
}

size_t RoadNetwork::compute_degrees_from_edges(bool only_missing) {
    std::vector<int> counts(nodes_.size(), 0);
    for (const auto& edge : edges_) {
        size_t u = node_index_.at(edge.source);
        counts[u]++;
        // A self-loop is one street, not two
        if (!edge.is_self_loop()) {
            counts[node_index_.at(edge.target)]++;
        }
    }

    size_t updated = 0;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (only_missing && nodes_[i].degree >= 0) continue;
        nodes_[i].degree = counts[i];
        updated++;
    }
    return updated;
}

BoundingBox RoadNetwork::bounding_box() const {
    BoundingBox box;
    if (nodes_.empty()) return box;

    box.min_lat = box.max_lat = nodes_[0].lat;
    box.min_lon = box.max_lon = nodes_[0].lon;
    for (const auto& node : nodes_) {
        box.min_lat = std::min(box.min_lat, node.lat);
        box.max_lat = std::max(box.max_lat, node.lat);
        box.min_lon = std::min(box.min_lon, node.lon);
        box.max_lon = std::max(box.max_lon, node.lon);
    }
    return box;
}

NetworkStatistics RoadNetwork::compute_statistics() const {
    NetworkStatistics stats;
    stats.num_nodes = nodes_.size();
    stats.num_edges = edges_.size();
    stats.bounds = bounding_box();

    if (nodes_.empty()) return stats;

    long long total_degree = 0;
    stats.min_degree = std::numeric_limits<int>::max();
    for (const auto& node : nodes_) {
        total_degree += node.degree;
        stats.max_degree = std::max(stats.max_degree, node.degree);
        stats.min_degree = std::min(stats.min_degree, node.degree);
        stats.degree_histogram[node.degree]++;
    }
    stats.avg_degree = static_cast<double>(total_degree) / nodes_.size();

    double total_length = 0.0;
    for (const auto& edge : edges_) {
        total_length += edge.length_m;
    }
    stats.total_length_km = total_length / 1000.0;

    return stats;
}

std::string RoadNetwork::fingerprint() const {
    if (snapshot_id.empty()) return content_hash();
    return snapshot_id + ":" + content_hash();
}

std::string RoadNetwork::content_hash() const {
    uint64_t hash = 1469598103934665603ULL;
    auto mix = [&hash](const void* data, size_t len) {
        const unsigned char* bytes = static_cast<const unsigned char*>(data);
        for (size_t i = 0; i < len; ++i) {
            hash ^= bytes[i];
            hash *= 1099511628211ULL;
        }
    };

    for (const auto& node : nodes_) {
        mix(node.id.data(), node.id.size());
        mix(&node.lat, sizeof(node.lat));
        mix(&node.lon, sizeof(node.lon));
        mix(&node.degree, sizeof(node.degree));
    }

    std::stringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << hash;
    return ss.str();
}

nlohmann::json RoadNetwork::to_json() const {
    nlohmann::json j;
    j["snapshot_id"] = snapshot_id;
    j["place_name"] = place_name;

    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& node : nodes_) {
        nodes_json.push_back(node.to_json());
    }
    j["nodes"] = nodes_json;

    nlohmann::json edges_json = nlohmann::json::array();
    for (const auto& edge : edges_) {
        edges_json.push_back(edge.to_json());
    }
    j["edges"] = edges_json;

    return j;
}

RoadNetwork RoadNetwork::from_json(const nlohmann::json& j) {
    RoadNetwork network;
    network.snapshot_id = j.value("snapshot_id", "");
    network.place_name = j.value("place_name", "");

    bool missing_degree = false;
    for (const auto& node_json : j.at("nodes")) {
        NetworkNode node = NetworkNode::from_json(node_json);
        if (node.degree < 0) missing_degree = true;
        network.add_node(node);
    }

    if (j.contains("edges")) {
        for (const auto& edge_json : j["edges"]) {
            network.add_edge(NetworkEdge::from_json(edge_json));
        }
    }

    if (missing_degree) {
        network.compute_degrees_from_edges(true);
    }

    return network;
}

void RoadNetwork::save_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }
    file << to_json().dump(2);
}

RoadNetwork RoadNetwork::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open network file: " + filename);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed network file " + filename + ": " + e.what());
    }

    return from_json(j);
}

} // namespace gho
