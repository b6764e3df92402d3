#include "render/map_renderer.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

namespace gho {

std::string escape_markup(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

namespace {

// JSON that is safe to place inside a <script> element
std::string script_json(const nlohmann::json& j) {
    std::string dumped = j.dump();
    std::string out;
    out.reserve(dumped.size());
    for (size_t i = 0; i < dumped.size(); ++i) {
        if (dumped[i] == '<' && i + 1 < dumped.size() && dumped[i + 1] == '/') {
            out += "<\\/";
            ++i;
        } else {
            out += dumped[i];
        }
    }
    return out;
}

} // anonymous namespace

void HtmlMapRenderer::export_html(
    const std::string& filename,
    const std::string& title,
    const OptimizationResult& result,
    const RoadNetwork* network) const {

    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }

    // Map center: first hub, else middle of the risk nodes
    double center_lat = 0.0;
    double center_lon = 0.0;
    if (!result.hubs.empty()) {
        center_lat = result.hubs[0].lat;
        center_lon = result.hubs[0].lon;
    } else if (!result.subset.empty()) {
        for (const auto& node : result.subset.members) {
            center_lat += node.lat;
            center_lon += node.lon;
        }
        center_lat /= result.subset.size();
        center_lon /= result.subset.size();
    }

    nlohmann::json data;
    data["center"] = {center_lat, center_lon};
    data["zoom"] = options_.zoom;

    nlohmann::json risk_json = nlohmann::json::array();
    if (options_.show_risk_nodes) {
        for (const auto& node : result.subset.members) {
            risk_json.push_back({node.lat, node.lon, node.degree});
        }
    }
    data["risk"] = risk_json;

    nlohmann::json hubs_json = nlohmann::json::array();
    for (const auto& hub : result.hubs) {
        nlohmann::json h = hub.to_json();
        for (const auto& c : result.coverage) {
            if (c.hub_index == hub.index) {
                h["assigned_nodes"] = c.assigned_nodes;
                h["mean_distance_m"] = c.mean_distance_m;
                h["max_distance_m"] = c.max_distance_m;
            }
        }
        hubs_json.push_back(h);
    }
    data["hubs"] = hubs_json;

    nlohmann::json streets_json = nlohmann::json::array();
    if (options_.show_streets && network) {
        for (const auto& edge : network->edges()) {
            const NetworkNode* a = network->get_node(edge.source);
            const NetworkNode* b = network->get_node(edge.target);
            if (!a || !b) continue;
            streets_json.push_back({{a->lat, a->lon}, {b->lat, b->lon}});
        }
    }
    data["streets"] = streets_json;

    std::string safe_title = escape_markup(title);

    file << R"(<!DOCTYPE html>
<html lang="en">
<head>
    <meta charset="UTF-8">
    <meta name="viewport" content="width=device-width, initial-scale=1.0">
    <title>)" << safe_title << R"(</title>
    <link rel="stylesheet" href="https://unpkg.com/leaflet@1.9.4/dist/leaflet.css">
    <script src="https://unpkg.com/leaflet@1.9.4/dist/leaflet.js"></script>
    <style>
        * { margin: 0; padding: 0; box-sizing: border-box; }
        body { font-family: 'Segoe UI', Tahoma, Geneva, Verdana, sans-serif; color: #222; }
        #header { padding: 14px 24px; background: #fafafa; border-bottom: 1px solid #ddd; }
        #header h1 { font-size: 1.4em; font-weight: 500; }
        #metrics { display: flex; gap: 40px; padding: 12px 24px; }
        .metric .label { font-size: 0.8em; color: #666; }
        .metric .value { font-size: 1.6em; font-weight: 600; }
        #map { width: 100%; height: 600px; }
        #coords { padding: 12px 24px; }
        #coords pre { background: #f4f4f4; padding: 10px; border-radius: 4px; }
        .warning { color: #a15c00; padding: 4px 24px; }
    </style>
</head>
<body>
    <div id="header"><h1>)" << safe_title << R"(</h1></div>
    <div id="metrics">
        <div class="metric"><div class="label">Network Size (Nodes)</div><div class="value">)"
         << result.network_size << R"(</div></div>
        <div class="metric"><div class="label">High Risk Zones</div><div class="value">)"
         << result.risk_subset_size << R"(</div></div>
        <div class="metric"><div class="label">Ambulances Deployed</div><div class="value">)"
         << result.hub_count << R"(</div></div>
    </div>
)";

    for (const auto& w : result.warnings) {
        file << "    <div class=\"warning\">" << escape_markup(w.message) << "</div>\n";
    }

    file << R"(    <div id="map"></div>
    <div id="coords">
        <p>Copy optimal coordinates for deployment:</p>
        <pre>)" << escape_markup(result.format_unit_lines()) << R"(</pre>
    </div>
    <script>
        const DATA = )" << script_json(data) << R"(;
        const map = L.map('map').setView(DATA.center, DATA.zoom);
        L.tileLayer('https://{s}.basemaps.cartocdn.com/light_all/{z}/{x}/{y}{r}.png', {
            attribution: '&copy; OpenStreetMap contributors &copy; CARTO',
            subdomains: 'abcd',
            maxZoom: 19
        }).addTo(map);

        DATA.streets.forEach(s => {
            L.polyline(s, { color: '#999999', weight: 1 }).addTo(map);
        });

        DATA.risk.forEach(r => {
            L.circleMarker([r[0], r[1]], {
                radius: 3, color: 'blue', fill: true, fillOpacity: 0.5
            }).bindPopup('High Risk Point (' + r[2] + ' streets)').addTo(map);
        });

        const hubIcon = L.divIcon({
            className: '',
            html: '<div style="background:#d33;color:#fff;border-radius:50%;width:26px;height:26px;' +
                  'line-height:26px;text-align:center;font-weight:bold;border:2px solid #fff;">+</div>',
            iconSize: [26, 26],
            iconAnchor: [13, 13]
        });

        DATA.hubs.forEach(h => {
            let popup = 'Hub #' + h.index;
            if (h.assigned_nodes !== undefined) {
                popup += '<br>' + h.assigned_nodes + ' risk points, mean ' +
                         Math.round(h.mean_distance_m) + ' m';
            }
            L.marker([h.lat, h.lon], { icon: hubIcon }).bindPopup(popup).addTo(map);
        });
    </script>
</body>
</html>
)";
}

} // namespace gho
