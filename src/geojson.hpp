#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "coordframes.hpp"

nlohmann::json ringToJson(const Ring& ring);
nlohmann::json polygonToJson(const LabeledPolygon& poly);

// One Polygon feature per labeled polygon
nlohmann::json polygonsToFeatureCollection(const std::vector<LabeledPolygon>& polygons,
    const std::string& name, const std::string& frame);
// All polygons dissolved into a single MultiPolygon feature
nlohmann::json polygonsToMultiPolygon(const std::vector<LabeledPolygon>& polygons,
    const std::string& name, const std::string& frame);

template<typename Frame>
nlohmann::json toFeatureCollection(const PolygonSet<Frame>& set, const std::string& name) {
    return polygonsToFeatureCollection(set.polygons, name, Frame::name);
}

// The tissue boundary is one named annotation geometry in full resolution pixels
nlohmann::json tissueBoundaryToJson(const PolygonSet<FullresPixelSpace>& boundary);

void writeJson(const std::string& outFile, const nlohmann::json& j);
