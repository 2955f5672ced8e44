#include "geojson.hpp"
#include "error.hpp"
#include <fstream>

using json = nlohmann::json;

json ringToJson(const Ring& ring) {
    json coords = json::array();
    for (const auto& p : ring) coords.push_back({p.x, p.y});
    if (!ring.empty()) coords.push_back({ring.front().x, ring.front().y}); // GeoJSON rings are closed
    return coords;
}

json polygonToJson(const LabeledPolygon& poly) {
    json rings = json::array();
    rings.push_back(ringToJson(poly.outer));
    for (const auto& h : poly.holes) rings.push_back(ringToJson(h));
    return rings;
}

static json collectionHeader(const std::string& name, const std::string& frame) {
    json fc;
    fc["type"] = "FeatureCollection";
    fc["name"] = name;
    fc["properties"] = {{"frame", frame}};
    fc["features"] = json::array();
    return fc;
}

json polygonsToFeatureCollection(const std::vector<LabeledPolygon>& polygons,
    const std::string& name, const std::string& frame) {
    json fc = collectionHeader(name, frame);
    for (const auto& poly : polygons) {
        json feat;
        feat["type"] = "Feature";
        feat["properties"] = {{"label", poly.label}, {"area", polygonArea(poly)}};
        feat["geometry"] = {{"type", "Polygon"}, {"coordinates", polygonToJson(poly)}};
        fc["features"].push_back(feat);
    }
    return fc;
}

json polygonsToMultiPolygon(const std::vector<LabeledPolygon>& polygons,
    const std::string& name, const std::string& frame) {
    json fc = collectionHeader(name, frame);
    json coords = json::array();
    double area = 0;
    for (const auto& poly : polygons) {
        coords.push_back(polygonToJson(poly));
        area += polygonArea(poly);
    }
    json feat;
    feat["type"] = "Feature";
    feat["properties"] = {{"name", name}, {"n_polygons", polygons.size()}, {"area", area}};
    feat["geometry"] = {{"type", "MultiPolygon"}, {"coordinates", coords}};
    fc["features"].push_back(feat);
    return fc;
}

json tissueBoundaryToJson(const PolygonSet<FullresPixelSpace>& boundary) {
    return polygonsToMultiPolygon(boundary.polygons, "tissueBoundary", FullresPixelSpace::name);
}

void writeJson(const std::string& outFile, const json& j) {
    std::ofstream out(outFile);
    if (!out.is_open()) {
        error("%s: Cannot open output file %s", __func__, outFile.c_str());
    }
    out << j.dump() << "\n";
    if (!out.good()) {
        error("%s: Error writing %s", __func__, outFile.c_str());
    }
    notice("%s: Wrote %s", __func__, outFile.c_str());
}
