#pragma once

#include "network/road_network.hpp"
#include "result/optimization_result.hpp"
#include <string>

namespace gho {

// Escape text for inclusion in HTML or SVG markup
std::string escape_markup(const std::string& text);

/**
 * @brief Interactive Leaflet map of risk intersections and hubs
 *
 * Produces a single self-contained HTML file. Tiles and the Leaflet library
 * are loaded from public CDNs when the page is opened.
 */
class HtmlMapRenderer {
public:
    struct Options {
        int zoom = 14;                      ///< 13 is a better fit for highway corridors
        bool show_risk_nodes = true;
        bool show_streets = false;          ///< Draw street segments (heavy for large networks)
    };

    HtmlMapRenderer() = default;
    explicit HtmlMapRenderer(const Options& options) : options_(options) {}

    /**
     * @brief Write the map page
     *
     * @param network Optional; needed only when show_streets is set
     * @throws std::runtime_error if the file cannot be opened
     */
    void export_html(const std::string& filename,
                     const std::string& title,
                     const OptimizationResult& result,
                     const RoadNetwork* network = nullptr) const;

private:
    Options options_;
};

/**
 * @brief Static SVG plot: streets in grey, risk nodes in blue, hubs as red stars
 */
class SvgPlotRenderer {
public:
    struct Options {
        int width = 1200;
        int height = 1000;
        int margin = 60;
    };

    SvgPlotRenderer() = default;
    explicit SvgPlotRenderer(const Options& options) : options_(options) {}

    /**
     * @throws std::runtime_error if the file cannot be opened
     */
    void export_svg(const std::string& filename,
                    const std::string& title,
                    const OptimizationResult& result,
                    const RoadNetwork* network = nullptr) const;

private:
    Options options_;
};

} // namespace gho
