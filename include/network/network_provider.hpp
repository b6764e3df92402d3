#pragma once

#include "network/road_network.hpp"
#include <string>
#include <vector>
#include <memory>
#include <utility>

namespace gho {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief What area to acquire
 */
struct NetworkQuery {
    enum class Mode {
        Place,      ///< Named area, geocoded if the area lookup fails
        Point       ///< Circle around a coordinate
    };

    Mode mode = Mode::Place;
    std::string place_name;                 ///< Used in Place mode
    double center_lat = 0.0;                ///< Used in Point mode
    double center_lon = 0.0;
    int radius_m = 2000;                    ///< Point radius, also the Place fallback radius

    /**
     * @brief Stable textual identity for caching and snapshot ids
     */
    std::string describe() const;
};

/**
 * @brief Configuration for network providers
 */
struct ProviderConfig {
    std::string overpass_url = "https://overpass-api.de/api/interpreter";
    std::string nominatim_url = "https://nominatim.openstreetmap.org/search";
    std::string user_agent = "golden-hour-optimizer/1.0";
    std::string network_file;               ///< For the file provider
    int timeout_seconds = 180;              ///< Request timeout
    int max_retries = 2;                    ///< Retry attempts on transport failure
    bool verbose = false;
};

// ============================================================================
// Network Provider Interface
// ============================================================================

/**
 * @brief Abstract source of road network snapshots
 *
 * Everything that performs I/O to obtain a network lives behind this
 * interface; the optimization core only ever sees the materialized
 * RoadNetwork.
 */
class NetworkProvider {
public:
    virtual ~NetworkProvider() = default;

    /**
     * @brief Materialize the drivable street network for a query
     *
     * @throws std::runtime_error on transport or parse failure
     */
    virtual RoadNetwork fetch(const NetworkQuery& query) = 0;

    virtual std::string get_provider_name() const = 0;
};

// ============================================================================
// Overpass Provider
// ============================================================================

/**
 * @brief Downloads OpenStreetMap ways from an Overpass API endpoint
 */
class OverpassProvider : public NetworkProvider {
public:
    explicit OverpassProvider(const ProviderConfig& config = ProviderConfig{});

    RoadNetwork fetch(const NetworkQuery& query) override;
    std::string get_provider_name() const override { return "overpass"; }

    /**
     * @brief Resolve a place name to (lat, lon) through Nominatim
     */
    std::pair<double, double> geocode(const std::string& place_name);

private:
    ProviderConfig config_;

    RoadNetwork fetch_place(const NetworkQuery& query);
    RoadNetwork fetch_point(const NetworkQuery& query, const std::string& snapshot_id);
    std::string post_query(const std::string& overpass_ql);
};

// ============================================================================
// JSON File Provider
// ============================================================================

/**
 * @brief Loads a previously saved snapshot; the query is ignored
 */
class JsonFileProvider : public NetworkProvider {
public:
    explicit JsonFileProvider(const std::string& path);

    RoadNetwork fetch(const NetworkQuery& query) override;
    std::string get_provider_name() const override { return "file"; }

private:
    std::string path_;
};

// ============================================================================
// Provider Factory
// ============================================================================

class NetworkProviderFactory {
public:
    /**
     * @brief Create provider from string name
     *
     * @param provider_name "overpass" or "file"
     * @throws std::invalid_argument for unknown names
     */
    static std::unique_ptr<NetworkProvider> create(
        const std::string& provider_name,
        const ProviderConfig& config
    );
};

// ============================================================================
// Query Building and Response Parsing
// ============================================================================

/**
 * @brief Overpass QL selecting drivable ways inside a named area
 */
std::string build_place_query(const std::string& area_name, int timeout_seconds = 180);

/**
 * @brief Overpass QL selecting drivable ways within radius_m of a point
 */
std::string build_point_query(double lat, double lon, int radius_m, int timeout_seconds = 180);

/**
 * @brief Build an intersection-level network from an Overpass JSON response
 *
 * An OSM node becomes a network node when it ends a way or is shared by
 * more than one way (or repeats within one). Ways are split into segments
 * between such nodes; the street count of a node is its number of incident
 * segments, a self-loop counting once.
 *
 * @throws std::runtime_error on malformed JSON
 */
RoadNetwork parse_overpass_response(const std::string& body, const std::string& snapshot_id = "");

/**
 * @brief First (lat, lon) hit of a Nominatim search response
 *
 * @throws std::runtime_error when the response is malformed or empty
 */
std::pair<double, double> parse_geocode_response(const std::string& body);

} // namespace gho
