#include "network/network_provider.hpp"
#include "network/geo.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <unordered_set>

using json = nlohmann::json;

namespace gho {

// ============================================================================
// Helper Functions for HTTP Requests
// ============================================================================

namespace {

// Approximates a drivable street network
const char* const kDriveFilter =
    "[\"highway\"]"
    "[\"area\"!~\"yes\"]"
    "[\"highway\"!~\"abandoned|bridleway|bus_guideway|construction|corridor|cycleway|"
    "elevator|escalator|footway|no|path|pedestrian|planned|platform|proposed|raceway|"
    "razed|service|steps|track\"]"
    "[\"motor_vehicle\"!~\"no\"]"
    "[\"motorcar\"!~\"no\"]"
    "[\"access\"!~\"private\"]";

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

std::string url_encode(CURL* curl, const std::string& value) {
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        throw std::runtime_error("Failed to URL-encode request parameter");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

// Perform a GET (post_body empty) or form POST and return the body
std::string http_request(
    const std::string& url,
    const std::string& post_field_name,
    const std::string& post_body,
    const std::string& user_agent,
    int timeout_seconds
) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    std::string response;
    std::string form;
    if (!post_field_name.empty()) {
        form = post_field_name + "=" + url_encode(curl, post_body);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, form.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));

    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw std::runtime_error("CURL request failed: " + error);
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (http_code < 200 || http_code >= 300) {
        throw std::runtime_error(
            "HTTP request failed with code " + std::to_string(http_code) +
            ": " + response.substr(0, 200)
        );
    }

    return response;
}

std::string with_retries(int max_retries, bool verbose, const std::string& operation,
                         const std::function<std::string()>& call) {
    int attempts = 0;
    while (true) {
        try {
            return call();
        } catch (const std::runtime_error& e) {
            attempts++;
            if (attempts > max_retries) {
                throw std::runtime_error(operation + " failed after " +
                                         std::to_string(attempts) + " attempts: " + e.what());
            }
            if (verbose) {
                std::cerr << operation << " attempt " << attempts << " failed: "
                          << e.what() << ". Retrying...\n";
            }
            std::this_thread::sleep_for(std::chrono::seconds(1 << std::min(attempts, 4)));
        }
    }
}

std::string escape_ql_string(const std::string& value) {
    std::string out;
    for (char c : value) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

std::string first_component(const std::string& place_name) {
    std::string name = place_name.substr(0, place_name.find(','));
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    name.erase(name.begin(), std::find_if(name.begin(), name.end(), not_space));
    name.erase(std::find_if(name.rbegin(), name.rend(), not_space).base(), name.end());
    return name;
}

std::string element_id(const json& el) {
    return std::to_string(el.at("id").get<long long>());
}

} // anonymous namespace

// ============================================================================
// NetworkQuery
// ============================================================================

std::string NetworkQuery::describe() const {
    std::stringstream ss;
    if (mode == Mode::Place) {
        ss << "place:" << place_name;
    } else {
        ss << "point:" << std::fixed << std::setprecision(6) << center_lat << ","
           << center_lon << "@" << radius_m;
    }
    return ss.str();
}

// ============================================================================
// Query Building and Response Parsing
// ============================================================================

std::string build_place_query(const std::string& area_name, int timeout_seconds) {
    std::stringstream ss;
    ss << "[out:json][timeout:" << timeout_seconds << "];"
       << "area[\"name\"=\"" << escape_ql_string(area_name) << "\"]->.searchArea;"
       << "(way" << kDriveFilter << "(area.searchArea););"
       << "(._;>;);out body;";
    return ss.str();
}

std::string build_point_query(double lat, double lon, int radius_m, int timeout_seconds) {
    std::stringstream ss;
    ss << "[out:json][timeout:" << timeout_seconds << "];"
       << "(way" << kDriveFilter << "(around:" << radius_m << ","
       << std::fixed << std::setprecision(7) << lat << "," << lon << "););"
       << "(._;>;);out body;";
    return ss.str();
}

RoadNetwork parse_overpass_response(const std::string& body, const std::string& snapshot_id) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed Overpass response: ") + e.what());
    }
    if (!j.contains("elements") || !j["elements"].is_array()) {
        throw std::runtime_error("Overpass response has no elements array");
    }

    struct Way {
        std::vector<std::string> refs;
        std::string name;
        std::string highway;
    };

    std::vector<std::string> node_order;
    std::unordered_map<std::string, std::pair<double, double>> coords;
    std::vector<Way> ways;

    for (const auto& el : j["elements"]) {
        std::string type = el.value("type", "");
        if (type == "node") {
            std::string id = element_id(el);
            if (!coords.count(id)) node_order.push_back(id);
            coords[id] = {el.at("lat").get<double>(), el.at("lon").get<double>()};
        } else if (type == "way") {
            Way way;
            for (const auto& ref : el.value("nodes", json::array())) {
                way.refs.push_back(std::to_string(ref.get<long long>()));
            }
            if (el.contains("tags")) {
                way.name = el["tags"].value("name", "");
                way.highway = el["tags"].value("highway", "");
            }
            ways.push_back(std::move(way));
        }
    }

    // Drop references to nodes the response did not include
    std::unordered_map<std::string, int> uses;
    std::unordered_set<std::string> endpoints;
    for (auto& way : ways) {
        way.refs.erase(std::remove_if(way.refs.begin(), way.refs.end(),
                                      [&](const std::string& r) { return !coords.count(r); }),
                       way.refs.end());
        if (way.refs.size() < 2) continue;
        endpoints.insert(way.refs.front());
        endpoints.insert(way.refs.back());
        for (const auto& ref : way.refs) {
            uses[ref]++;
        }
    }

    auto is_intersection = [&](const std::string& id) {
        auto it = uses.find(id);
        return endpoints.count(id) > 0 || (it != uses.end() && it->second > 1);
    };

    RoadNetwork network;
    network.snapshot_id = snapshot_id;

    for (const auto& id : node_order) {
        if (!uses.count(id) || !is_intersection(id)) continue;
        NetworkNode node;
        node.id = id;
        node.lat = coords[id].first;
        node.lon = coords[id].second;
        network.add_node(node);
    }

    for (const auto& way : ways) {
        if (way.refs.size() < 2) continue;

        std::string start = way.refs.front();
        double length = 0.0;
        for (size_t i = 1; i < way.refs.size(); ++i) {
            const auto& prev = coords[way.refs[i - 1]];
            const auto& cur = coords[way.refs[i]];
            length += geo::haversine_m(prev.first, prev.second, cur.first, cur.second);

            if (is_intersection(way.refs[i])) {
                NetworkEdge edge;
                edge.source = start;
                edge.target = way.refs[i];
                edge.name = way.name;
                edge.highway = way.highway;
                edge.length_m = length;
                network.add_edge(edge);

                start = way.refs[i];
                length = 0.0;
            }
        }
    }

    network.compute_degrees_from_edges();
    return network;
}

std::pair<double, double> parse_geocode_response(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed geocoder response: ") + e.what());
    }

    if (!j.is_array() || j.empty()) {
        throw std::runtime_error("Geocoder returned no results");
    }

    const auto& hit = j[0];
    auto read = [&hit](const char* key) {
        try {
            const auto& v = hit.at(key);
            if (!v.is_string()) return v.get<double>();
            const std::string text = v.get<std::string>();
            size_t pos = 0;
            double value = std::stod(text, &pos);
            if (pos != text.size()) {
                throw std::runtime_error(std::string("Geocoder returned a malformed ") + key + ": " + text);
            }
            return value;
        } catch (const json::exception& e) {
            throw std::runtime_error(std::string("Geocoder result lacks a numeric ") + key + ": " + e.what());
        } catch (const std::logic_error&) {
            throw std::runtime_error(std::string("Geocoder returned a malformed ") + key);
        }
    };

    double lat = read("lat");
    double lon = read("lon");
    if (!geo::is_valid_coordinate(lat, lon)) {
        throw std::runtime_error("Geocoder returned invalid coordinates");
    }
    return {lat, lon};
}

// ============================================================================
// OverpassProvider
// ============================================================================

OverpassProvider::OverpassProvider(const ProviderConfig& config)
    : config_(config) {}

RoadNetwork OverpassProvider::fetch(const NetworkQuery& query) {
    if (query.mode == NetworkQuery::Mode::Place) {
        return fetch_place(query);
    }
    return fetch_point(query, "overpass:" + query.describe());
}

RoadNetwork OverpassProvider::fetch_place(const NetworkQuery& query) {
    const std::string snapshot_id = "overpass:" + query.describe();
    std::string area = first_component(query.place_name);

    if (!area.empty()) {
        try {
            if (config_.verbose) {
                std::cout << "Querying area '" << area << "' from Overpass...\n";
            }
            RoadNetwork network = parse_overpass_response(
                post_query(build_place_query(area, config_.timeout_seconds)), snapshot_id);
            if (!network.empty()) {
                network.place_name = query.place_name;
                return network;
            }
            if (config_.verbose) {
                std::cerr << "Warning: area query for '" << area << "' returned no streets.\n";
            }
        } catch (const std::runtime_error& e) {
            if (config_.verbose) {
                std::cerr << "Warning: area query failed (" << e.what() << ").\n";
            }
        }
    }

    if (config_.verbose) {
        std::cout << "Geocoding '" << query.place_name << "' and querying "
                  << query.radius_m << " m around it...\n";
    }
    auto [lat, lon] = geocode(query.place_name);

    NetworkQuery point = query;
    point.mode = NetworkQuery::Mode::Point;
    point.center_lat = lat;
    point.center_lon = lon;

    RoadNetwork network = fetch_point(point, snapshot_id);
    network.place_name = query.place_name;
    return network;
}

RoadNetwork OverpassProvider::fetch_point(const NetworkQuery& query, const std::string& snapshot_id) {
    if (!geo::is_valid_coordinate(query.center_lat, query.center_lon)) {
        throw std::invalid_argument("Invalid query center coordinates");
    }
    if (query.radius_m <= 0) {
        throw std::invalid_argument("Query radius must be positive");
    }

    std::string body = post_query(build_point_query(
        query.center_lat, query.center_lon, query.radius_m, config_.timeout_seconds));
    RoadNetwork network = parse_overpass_response(body, snapshot_id);
    if (network.place_name.empty()) {
        network.place_name = query.place_name;
    }
    return network;
}

std::string OverpassProvider::post_query(const std::string& overpass_ql) {
    return with_retries(config_.max_retries, config_.verbose, "Overpass query", [&]() {
        return http_request(config_.overpass_url, "data", overpass_ql,
                            config_.user_agent, config_.timeout_seconds);
    });
}

std::pair<double, double> OverpassProvider::geocode(const std::string& place_name) {
    std::string body = with_retries(config_.max_retries, config_.verbose, "Geocoding", [&]() {
        CURL* curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to initialize CURL");
        }
        std::string encoded = url_encode(curl, place_name);
        curl_easy_cleanup(curl);

        std::string url = config_.nominatim_url + "?format=json&limit=1&q=" + encoded;
        return http_request(url, "", "", config_.user_agent, config_.timeout_seconds);
    });
    return parse_geocode_response(body);
}

// ============================================================================
// JsonFileProvider
// ============================================================================

JsonFileProvider::JsonFileProvider(const std::string& path)
    : path_(path) {
    if (path_.empty()) {
        throw std::invalid_argument("JsonFileProvider requires a file path");
    }
}

RoadNetwork JsonFileProvider::fetch(const NetworkQuery& /*query*/) {
    RoadNetwork network = RoadNetwork::load_from_json(path_);
    if (network.snapshot_id.empty()) {
        network.snapshot_id = "file:" + path_;
    }
    return network;
}

// ============================================================================
// NetworkProviderFactory
// ============================================================================

std::unique_ptr<NetworkProvider> NetworkProviderFactory::create(
    const std::string& provider_name,
    const ProviderConfig& config
) {
    std::string name_lower = provider_name;
    std::transform(name_lower.begin(), name_lower.end(), name_lower.begin(), ::tolower);

    if (name_lower == "overpass") {
        return std::make_unique<OverpassProvider>(config);
    } else if (name_lower == "file") {
        return std::make_unique<JsonFileProvider>(config.network_file);
    } else {
        throw std::invalid_argument("Unknown provider name: " + provider_name);
    }
}

} // namespace gho
