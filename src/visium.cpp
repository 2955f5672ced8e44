#include "visium.hpp"
#include "error.hpp"
#include "utils.h"
#include <cmath>
#include <fstream>

using json = nlohmann::json;

std::vector<uint8_t> SpotTable::inTissueFlags() const {
    std::vector<uint8_t> flags(spots.size(), 0);
    for (size_t i = 0; i < spots.size(); ++i) flags[i] = spots[i].inTissue ? 1 : 0;
    return flags;
}

Rectangle<double> SpotTable::bounds() const {
    Rectangle<double> box;
    for (const auto& s : spots) box.extendToInclude(s.x, s.y);
    return box;
}

ScaleFactors parseScaleFactors(const json& j) {
    if (!j.is_object()) {
        error("%s: Scale factors must be a JSON object", __func__);
    }
    auto get = [&](const char* key) -> double {
        auto it = j.find(key);
        if (it == j.end()) {
            error("%s: Missing key %s in scale factors", __func__, key);
        }
        if (!it->is_number()) {
            error("%s: Key %s must be a number", __func__, key);
        }
        double v = it->get<double>();
        if (!(v > 0) || !std::isfinite(v)) {
            error("%s: Key %s must be positive, got %g", __func__, key, v);
        }
        return v;
    };
    ScaleFactors sf;
    sf.tissue_hires_scalef = get("tissue_hires_scalef");
    sf.tissue_lowres_scalef = get("tissue_lowres_scalef");
    sf.fiducial_diameter_fullres = get("fiducial_diameter_fullres");
    sf.spot_diameter_fullres = get("spot_diameter_fullres");
    if (sf.tissue_hires_scalef > 1.0) {
        warning("%s: tissue_hires_scalef=%g is larger than 1, the hi-res image is expected to be smaller than full resolution",
            __func__, sf.tissue_hires_scalef);
    }
    return sf;
}

ScaleFactors loadScaleFactors(const std::string& jsonFile) {
    std::ifstream in(jsonFile);
    if (!in.is_open()) {
        error("%s: Cannot open scale factor file %s", __func__, jsonFile.c_str());
    }
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& ex) {
        error("%s: Cannot parse %s: %s", __func__, jsonFile.c_str(), ex.what());
    }
    ScaleFactors sf = parseScaleFactors(j);
    notice("%s: hires=%g lowres=%g spot diameter=%.2f fiducial diameter=%.2f",
        __func__, sf.tissue_hires_scalef, sf.tissue_lowres_scalef,
        sf.spot_diameter_fullres, sf.fiducial_diameter_fullres);
    return sf;
}

SpotTable readSpotTable(std::istream& in, const std::string& source) {
    SpotTable table;
    std::string line;
    std::vector<std::string> tokens;
    size_t nline = 0;
    while (std::getline(in, line)) {
        nline++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        split(tokens, ",", line);
        if (nline == 1 && !tokens.empty() && trim(tokens[0]) == "barcode") continue;
        if (tokens.size() < 6) {
            error("%s: %s line %zu has %zu fields, expected 6", __func__, source.c_str(), nline, tokens.size());
        }
        Spot s;
        s.barcode = trim(tokens[0]);
        int32_t flag = 0;
        double prow = 0, pcol = 0;
        if (!str2int32(trim(tokens[1]), flag) || (flag != 0 && flag != 1) ||
            !str2int32(trim(tokens[2]), s.arrayRow) ||
            !str2int32(trim(tokens[3]), s.arrayCol) ||
            !str2double(trim(tokens[4]), prow) ||
            !str2double(trim(tokens[5]), pcol)) {
            error("%s: %s line %zu is malformed: %s", __func__, source.c_str(), nline, line.c_str());
        }
        s.inTissue = (flag == 1);
        s.x = pcol;
        s.y = prow;
        table.spots.push_back(std::move(s));
    }
    return table;
}

SpotTable loadSpotTable(const std::string& csvFile) {
    std::ifstream in(csvFile);
    if (!in.is_open()) {
        error("%s: Cannot open spot table %s", __func__, csvFile.c_str());
    }
    SpotTable table = readSpotTable(in, csvFile);
    if (table.empty()) {
        error("%s: No spots in %s", __func__, csvFile.c_str());
    }
    size_t nIn = 0;
    for (const auto& s : table.spots) nIn += s.inTissue ? 1 : 0;
    notice("%s: Loaded %zu spots (%zu flagged in tissue) from %s", __func__, table.size(), nIn, csvFile.c_str());
    return table;
}

Ring spotFootprint(const Spot& spot, double diameter, int32_t nVertices) {
    if (nVertices < 3) {
        error("%s: A footprint needs at least 3 vertices, got %d", __func__, nVertices);
    }
    if (!(diameter > 0)) {
        error("%s: Spot diameter must be positive, got %g", __func__, diameter);
    }
    const double r = 0.5 * diameter;
    Ring ring;
    ring.reserve(static_cast<size_t>(nVertices));
    for (int32_t k = 0; k < nVertices; ++k) {
        const double t = 2.0 * M_PI * k / nVertices;
        ring.emplace_back(spot.x + r * std::cos(t), spot.y + r * std::sin(t));
    }
    return ring;
}

PolygonSet<FullresPixelSpace> spotFootprints(const SpotTable& table, double diameter, int32_t nVertices) {
    PolygonSet<FullresPixelSpace> out;
    out.polygons.reserve(table.size());
    for (size_t i = 0; i < table.size(); ++i) {
        LabeledPolygon poly;
        poly.label = static_cast<int32_t>(i + 1);
        poly.outer = spotFootprint(table.spots[i], diameter, nVertices);
        out.polygons.push_back(std::move(poly));
    }
    return out;
}
