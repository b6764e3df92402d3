#ifndef GHO_ROAD_NETWORK_HPP
#define GHO_ROAD_NETWORK_HPP

#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace gho {

/**
 * @brief Represents an intersection (or dead end) in the street network
 *
 * Nodes are immutable once ingested. The degree is the number of distinct
 * street segments meeting at the node and serves as the risk proxy.
 */
struct NetworkNode {
    std::string id;                                    // Unique within a snapshot
    double lat = 0.0;                                  // Latitude in degrees
    double lon = 0.0;                                  // Longitude in degrees
    int degree = 0;                                    // Street count

    /**
     * @brief Convert node to JSON representation
     */
    nlohmann::json to_json() const;

    /**
     * @brief Create node from JSON
     *
     * Reads "street_count" (or "degree"). A node without either is given a
     * degree of -1 so that RoadNetwork can fill it in from the edge list.
     */
    static NetworkNode from_json(const nlohmann::json& j);
};

/**
 * @brief Undirected street segment between two network nodes
 */
struct NetworkEdge {
    std::string source;
    std::string target;
    std::string name;                                  // Street name, if tagged
    std::string highway;                               // OSM highway class
    double length_m = 0.0;                             // Length along the geometry

    bool is_self_loop() const { return source == target; }

    nlohmann::json to_json() const;
    static NetworkEdge from_json(const nlohmann::json& j);
};

/**
 * @brief Geographic extent of a network
 */
struct BoundingBox {
    double min_lat = 0.0;
    double min_lon = 0.0;
    double max_lat = 0.0;
    double max_lon = 0.0;

    double center_lat() const { return (min_lat + max_lat) / 2.0; }
    double center_lon() const { return (min_lon + max_lon) / 2.0; }

    // Diagonal length in meters
    double diagonal_m() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Statistics about the network structure
 */
struct NetworkStatistics {
    size_t num_nodes = 0;
    size_t num_edges = 0;

    double avg_degree = 0.0;
    int max_degree = 0;
    int min_degree = 0;

    double total_length_km = 0.0;
    BoundingBox bounds;

    // degree -> number of nodes with that degree
    std::map<int, size_t> degree_histogram;

    /**
     * @brief Number of nodes whose degree is at least the given threshold
     */
    size_t count_at_least(int min_degree) const;

    nlohmann::json to_json() const;
};

/**
 * @brief In-memory snapshot of a drivable street network
 *
 * Holds the node sequence in ingestion order together with the street
 * segments connecting them. Node order is preserved everywhere, since the
 * risk classifier selects in ingestion order.
 */
class RoadNetwork {
public:
    RoadNetwork() = default;

    std::string snapshot_id;                           // Provider-assigned identity
    std::string place_name;                            // Human-readable area name

    // ==========================================
    // Node and Edge Management
    // ==========================================

    /**
     * @brief Add a node
     * @throws std::invalid_argument on duplicate id or invalid coordinates
     */
    void add_node(const NetworkNode& node);

    /**
     * @brief Add a street segment between two existing nodes
     * @throws std::invalid_argument if either endpoint is unknown
     */
    void add_edge(const NetworkEdge& edge);

    const NetworkNode* get_node(const std::string& node_id) const;
    bool has_node(const std::string& node_id) const;

    const std::vector<NetworkNode>& nodes() const { return nodes_; }
    const std::vector<NetworkEdge>& edges() const { return edges_; }

    size_t num_nodes() const { return nodes_.size(); }
    size_t num_edges() const { return edges_.size(); }
    bool empty() const { return nodes_.empty(); }

    /**
     * @brief Recompute the degree of every node from the edge list
     *
     * @param only_missing If true, only nodes with a negative degree are updated
     * @return Number of nodes updated
     */
    size_t compute_degrees_from_edges(bool only_missing = false);

    // ==========================================
    // Analysis
    // ==========================================

    NetworkStatistics compute_statistics() const;

    BoundingBox bounding_box() const;

    /**
     * @brief Stable identity of this snapshot
     *
     * content_hash(), prefixed with "snapshot_id:" when snapshot_id is set.
     * Two networks sharing a snapshot_id but differing in content never
     * share a fingerprint.
     */
    std::string fingerprint() const;

    // 64-bit FNV-1a hash of node ids, coordinates and degrees as 16 hex digits
    std::string content_hash() const;

    // ==========================================
    // Serialization
    // ==========================================

    nlohmann::json to_json() const;
    static RoadNetwork from_json(const nlohmann::json& j);

    void save_to_json(const std::string& filename) const;
    static RoadNetwork load_from_json(const std::string& filename);

private:
    std::vector<NetworkNode> nodes_;
    std::vector<NetworkEdge> edges_;
    std::unordered_map<std::string, size_t> node_index_;   // id -> position in nodes_
};

} // namespace gho

#endif // GHO_ROAD_NETWORK_HPP
