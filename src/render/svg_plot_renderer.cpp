#include "render/map_renderer.hpp"
#include "network/geo.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace gho {

namespace {

struct Projection {
    double min_lat = 0.0;
    double min_lon = 0.0;
    double scale = 1.0;          // pixels per projected degree
    double lon_factor = 1.0;     // cos(mid latitude)
    double offset_x = 0.0;
    double offset_y = 0.0;
    double plot_height = 0.0;

    double x(double lon) const { return offset_x + (lon - min_lon) * lon_factor * scale; }
    double y(double lat) const { return offset_y + plot_height - (lat - min_lat) * scale; }
};

BoundingBox extent_of(const OptimizationResult& result, const RoadNetwork* network) {
    if (network && !network->empty()) {
        return network->bounding_box();
    }

    BoundingBox box;
    bool first = true;
    auto include = [&](double lat, double lon) {
        if (first) {
            box.min_lat = box.max_lat = lat;
            box.min_lon = box.max_lon = lon;
            first = false;
            return;
        }
        box.min_lat = std::min(box.min_lat, lat);
        box.max_lat = std::max(box.max_lat, lat);
        box.min_lon = std::min(box.min_lon, lon);
        box.max_lon = std::max(box.max_lon, lon);
    };
    for (const auto& node : result.subset.members) include(node.lat, node.lon);
    for (const auto& hub : result.hubs) include(hub.lat, hub.lon);
    return box;
}

std::string star_points(double cx, double cy, double outer, double inner) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    for (int i = 0; i < 10; ++i) {
        double r = (i % 2 == 0) ? outer : inner;
        double angle = -geo::kPi / 2 + i * geo::kPi / 5;
        if (i > 0) ss << " ";
        ss << cx + r * std::cos(angle) << "," << cy + r * std::sin(angle);
    }
    return ss.str();
}

} // anonymous namespace

void SvgPlotRenderer::export_svg(
    const std::string& filename,
    const std::string& title,
    const OptimizationResult& result,
    const RoadNetwork* network) const {

    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }

    const int width = options_.width;
    const int height = options_.height;
    const int margin = options_.margin;
    const double title_band = 60.0;

    BoundingBox box = extent_of(result, network);
    Projection proj;
    proj.min_lat = box.min_lat;
    proj.min_lon = box.min_lon;
    proj.lon_factor = std::cos(geo::to_radians(box.center_lat()));

    double span_x = std::max((box.max_lon - box.min_lon) * proj.lon_factor, 1e-9);
    double span_y = std::max(box.max_lat - box.min_lat, 1e-9);
    double avail_w = width - 2.0 * margin;
    double avail_h = height - 2.0 * margin - title_band;
    proj.scale = std::min(avail_w / span_x, avail_h / span_y);
    proj.plot_height = span_y * proj.scale;
    proj.offset_x = margin + (avail_w - span_x * proj.scale) / 2.0;
    proj.offset_y = margin + title_band + (avail_h - proj.plot_height) / 2.0;

    file << std::fixed << std::setprecision(2);
    file << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    file << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << width
         << "\" height=\"" << height << "\" viewBox=\"0 0 " << width << " " << height << "\">\n";
    file << "  <rect width=\"100%\" height=\"100%\" fill=\"#ffffff\"/>\n";

    // Title
    file << "  <text x=\"" << width / 2.0 << "\" y=\"" << margin << "\" text-anchor=\"middle\" "
         << "font-family=\"sans-serif\" font-size=\"22\">Golden Hour Optimizer: "
         << escape_markup(title) << "</text>\n";
    file << "  <text x=\"" << width / 2.0 << "\" y=\"" << margin + 28 << "\" text-anchor=\"middle\" "
         << "font-family=\"sans-serif\" font-size=\"18\">Optimal Ambulance Standby Points</text>\n";

    if (network) {
        file << "  <g stroke=\"#999999\" stroke-width=\"0.5\" fill=\"none\">\n";
        for (const auto& edge : network->edges()) {
            const NetworkNode* a = network->get_node(edge.source);
            const NetworkNode* b = network->get_node(edge.target);
            if (!a || !b) continue;
            file << "    <line x1=\"" << proj.x(a->lon) << "\" y1=\"" << proj.y(a->lat)
                 << "\" x2=\"" << proj.x(b->lon) << "\" y2=\"" << proj.y(b->lat) << "\"/>\n";
        }
        file << "  </g>\n";
    }

    file << "  <g fill=\"blue\" fill-opacity=\"0.5\">\n";
    for (const auto& node : result.subset.members) {
        file << "    <circle cx=\"" << proj.x(node.lon) << "\" cy=\"" << proj.y(node.lat)
             << "\" r=\"2.5\"/>\n";
    }
    file << "  </g>\n";

    file << "  <g fill=\"red\" stroke=\"#600\" stroke-width=\"0.8\">\n";
    for (const auto& hub : result.hubs) {
        file << "    <polygon points=\"" << star_points(proj.x(hub.lon), proj.y(hub.lat), 12.0, 5.0)
             << "\"><title>Hub " << hub.index << "</title></polygon>\n";
    }
    file << "  </g>\n";

    // Legend
    double lx = width - margin - 240.0;
    double ly = height - margin - 50.0;
    file << "  <g font-family=\"sans-serif\" font-size=\"14\">\n";
    file << "    <rect x=\"" << lx - 10 << "\" y=\"" << ly - 20 << "\" width=\"250\" height=\"62\" "
         << "fill=\"#ffffff\" stroke=\"#cccccc\"/>\n";
    file << "    <circle cx=\"" << lx << "\" cy=\"" << ly - 4 << "\" r=\"4\" fill=\"blue\" fill-opacity=\"0.5\"/>\n";
    file << "    <text x=\"" << lx + 14 << "\" y=\"" << ly << "\">High Risk Intersections</text>\n";
    file << "    <polygon points=\"" << star_points(lx, ly + 20, 8.0, 3.5) << "\" fill=\"red\"/>\n";
    file << "    <text x=\"" << lx + 14 << "\" y=\"" << ly + 25 << "\">Optimized Ambulance Hubs</text>\n";
    file << "  </g>\n";

    file << "</svg>\n";
}

} // namespace gho
