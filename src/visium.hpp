#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "coordframes.hpp"

struct Spot {
    std::string barcode;
    bool inTissue = false;     // vendor flag
    int32_t arrayRow = 0, arrayCol = 0;
    double x = 0, y = 0;       // pxl_col_in_fullres, pxl_row_in_fullres
};

struct SpotTable {
    std::vector<Spot> spots;

    size_t size() const { return spots.size(); }
    bool empty() const { return spots.empty(); }
    std::vector<uint8_t> inTissueFlags() const;
    Rectangle<double> bounds() const;
};

// All four keys are required and must be positive
ScaleFactors parseScaleFactors(const nlohmann::json& j);
ScaleFactors loadScaleFactors(const std::string& jsonFile);

// tissue_positions.csv (with header) or tissue_positions_list.csv (without)
SpotTable readSpotTable(std::istream& in, const std::string& source = "<stream>");
SpotTable loadSpotTable(const std::string& csvFile);

// Regular polygon with nVertices approximating the circular capture area
Ring spotFootprint(const Spot& spot, double diameter, int32_t nVertices);
// Labels are 1-based spot indices
PolygonSet<FullresPixelSpace> spotFootprints(const SpotTable& table, double diameter, int32_t nVertices);
