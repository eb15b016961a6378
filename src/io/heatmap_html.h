/**
 * @file heatmap_html.h
 * @brief Render survey records as a self-contained Leaflet heatmap page
 *
 * The page pulls Leaflet and Leaflet.heat from a CDN and embeds the
 * points as [lat, lon, weight] with weight being the level normalized to
 * 0..1 across the plotted records. Records without a position are not
 * plotted.
 */

#ifndef KERMIT_HEATMAP_HTML_H
#define KERMIT_HEATMAP_HTML_H

#include "api/kermit_types.h"
#include "common/constants.h"

#include <string>
#include <vector>

namespace kermit {

struct HeatPoint {
    double latitude;
    double longitude;
    double weight;      // 0..1
};

struct HeatmapOptions {
    int radius = HEATMAP_RADIUS;
    int zoom = HEATMAP_ZOOM;
    std::string title = "KERMIT RF survey";
};

/**
 * Positioned records as heat points, in input order.
 * A set where every level is equal gets weight 1 throughout.
 */
std::vector<HeatPoint> heat_points(const api::SurveyRecords& records);

/**
 * Build the page. INVALID_FILE_FORMAT if no record carries a position.
 */
api::Result<std::string> render_heatmap(const api::SurveyRecords& records,
                                        const HeatmapOptions& options = HeatmapOptions());

/// render_heatmap() written to path
api::Result<void> write_heatmap(const std::string& path,
                                const api::SurveyRecords& records,
                                const HeatmapOptions& options = HeatmapOptions());

/// Hand the file to the desktop opener (xdg-open / open) without waiting
bool open_in_browser(const std::string& path);

} // namespace kermit

#endif
