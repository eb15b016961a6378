// src/io/heatmap_html.cpp
#include "heatmap_html.h"
#include "common/log.h"
#include "common/spawn.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace kermit {

using api::Error;
using api::ErrorCode;
using api::Result;

namespace {

const char* HEATMAP_HEAD = R"HTML(<!DOCTYPE html>
<html>
<head>
    <meta charset="utf-8">
    <title>%TITLE%</title>
    <meta name="viewport" content="width=device-width, initial-scale=1.0">
    <link rel="stylesheet" href="https://unpkg.com/leaflet@1.9.4/dist/leaflet.css">
    <script src="https://unpkg.com/leaflet@1.9.4/dist/leaflet.js"></script>
    <script src="https://unpkg.com/leaflet.heat@0.2.0/dist/leaflet-heat.js"></script>
    <style>
        html, body { margin: 0; height: 100%; }
        #map { height: 100%; }
        .legend { background: rgba(255,255,255,0.85); padding: 6px 10px; font: 12px monospace; border-radius: 4px; }
    </style>
</head>
<body>
<div id="map"></div>
<script>
)HTML";

const char* HEATMAP_TAIL = R"HTML(
var map = L.map('map').setView(center, zoom);
L.tileLayer('https://{s}.tile.openstreetmap.org/{z}/{x}/{y}.png', {
    maxZoom: 19,
    attribution: '&copy; OpenStreetMap contributors'
}).addTo(map);
L.heatLayer(points, { radius: radius, max: 1.0 }).addTo(map);

var legend = L.control({ position: 'bottomright' });
legend.onAdd = function () {
    var div = L.DomUtil.create('div', 'legend');
    div.innerHTML = points.length + ' points<br>' +
        levelRange[0].toFixed(2) + ' .. ' + levelRange[1].toFixed(2) + ' dB';
    return div;
};
legend.addTo(map);
</script>
</body>
</html>
)HTML";

std::string html_escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c;
        }
    }
    return out;
}

// Level span over positioned records; false if there are none
bool level_range(const api::SurveyRecords& records, double& lo, double& hi) {
    bool found = false;
    for (const auto& r : records) {
        if (!r.position) continue;
        lo = found ? std::min(lo, r.level_db) : r.level_db;
        hi = found ? std::max(hi, r.level_db) : r.level_db;
        found = true;
    }
    return found;
}

} // namespace

std::vector<HeatPoint> heat_points(const api::SurveyRecords& records) {
    std::vector<HeatPoint> points;
    double lo = 0.0, hi = 0.0;
    if (!level_range(records, lo, hi)) return points;

    double span = hi - lo;
    for (const auto& r : records) {
        if (!r.position) continue;
        double w = span > 0.0 ? (r.level_db - lo) / span : 1.0;
        points.push_back({r.position->latitude, r.position->longitude, w});
    }
    return points;
}

Result<std::string> render_heatmap(const api::SurveyRecords& records,
                                   const HeatmapOptions& options) {
    auto points = heat_points(records);
    if (points.empty()) {
        return Error(ErrorCode::INVALID_FILE_FORMAT, "no positioned records to plot");
    }

    double lo = 0.0, hi = 0.0;
    level_range(records, lo, hi);

    std::string head = HEATMAP_HEAD;
    head.replace(head.find("%TITLE%"), 7, html_escape(options.title));

    std::ostringstream page;
    page << head;
    page << std::fixed << std::setprecision(7);
    page << "var center = [" << points.front().latitude << ", "
         << points.front().longitude << "];\n";
    page << "var zoom = " << options.zoom << ";\n";
    page << "var radius = " << options.radius << ";\n";
    page << std::setprecision(2) << "var levelRange = [" << lo << ", " << hi << "];\n";
    page << "var points = [\n";
    for (size_t i = 0; i < points.size(); i++) {
        const auto& p = points[i];
        page << std::setprecision(7) << "    [" << p.latitude << ", " << p.longitude << ", "
             << std::setprecision(4) << p.weight << "]";
        page << (i + 1 < points.size() ? ",\n" : "\n");
    }
    page << "];\n";
    page << HEATMAP_TAIL;
    return page.str();
}

Result<void> write_heatmap(const std::string& path,
                           const api::SurveyRecords& records,
                           const HeatmapOptions& options) {
    auto page = render_heatmap(records, options);
    if (!page.ok()) return page.error();

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return Error(ErrorCode::FILE_WRITE_ERROR, "Cannot create file: " + path);
    }
    out << page.value();
    if (!out.good()) {
        return Error(ErrorCode::FILE_WRITE_ERROR, "Write to " + path + " failed");
    }
    log::info("MAP", "Wrote heatmap to " + path);
    return Result<void>();
}

bool open_in_browser(const std::string& path) {
#ifdef __APPLE__
    const char* opener = "open";
#else
    const char* opener = "xdg-open";
#endif
    std::error_code ec;
    std::string absolute = std::filesystem::absolute(path, ec).string();
    if (ec) absolute = path;

    if (!spawn_detached({opener, absolute})) {
        log::warn("MAP", std::string("Could not run ") + opener + " for " + absolute);
        return false;
    }
    log::debug("MAP", std::string("Opened ") + absolute + " with " + opener);
    return true;
}

} // namespace kermit
