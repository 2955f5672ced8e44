#include <gtest/gtest.h>

#include "visium.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

nlohmann::json sampleScaleFactors() {
    return nlohmann::json{
        {"spot_diameter_fullres", 89.47},
        {"tissue_hires_scalef", 0.0738},
        {"fiducial_diameter_fullres", 144.54},
        {"tissue_lowres_scalef", 0.0221},
    };
}

} // namespace

TEST(ScaleFactorTest, ParsesAllKeys) {
    ScaleFactors sf = parseScaleFactors(sampleScaleFactors());
    EXPECT_DOUBLE_EQ(sf.tissue_hires_scalef, 0.0738);
    EXPECT_DOUBLE_EQ(sf.tissue_lowres_scalef, 0.0221);
    EXPECT_DOUBLE_EQ(sf.spot_diameter_fullres, 89.47);
    EXPECT_DOUBLE_EQ(sf.fiducial_diameter_fullres, 144.54);
}

TEST(ScaleFactorTest, RejectsMissingOrInvalidValues) {
    for (const char* key : {"tissue_hires_scalef", "tissue_lowres_scalef",
                            "fiducial_diameter_fullres", "spot_diameter_fullres"}) {
        nlohmann::json j = sampleScaleFactors();
        j.erase(key);
        EXPECT_THROW(parseScaleFactors(j), std::runtime_error) << key;
    }
    nlohmann::json neg = sampleScaleFactors();
    neg["tissue_hires_scalef"] = -0.1;
    EXPECT_THROW(parseScaleFactors(neg), std::runtime_error);
    nlohmann::json str = sampleScaleFactors();
    str["spot_diameter_fullres"] = "89.47";
    EXPECT_THROW(parseScaleFactors(str), std::runtime_error);
    EXPECT_THROW(parseScaleFactors(nlohmann::json::array()), std::runtime_error);
}

TEST(ScaleFactorTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "tissueseg_scalefactors.json";
    {
        std::ofstream out(path);
        out << sampleScaleFactors().dump(2);
    }
    ScaleFactors sf = loadScaleFactors(path);
    EXPECT_DOUBLE_EQ(sf.tissue_hires_scalef, 0.0738);
    std::remove(path.c_str());

    EXPECT_THROW(loadScaleFactors(path), std::runtime_error);
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(loadScaleFactors(path), std::runtime_error);
    std::remove(path.c_str());
}

TEST(SpotTableTest, ReadsWithHeader) {
    std::istringstream in(
        "barcode,in_tissue,array_row,array_col,pxl_row_in_fullres,pxl_col_in_fullres\n"
        "ACGCCTGACACGCGCT-1,0,0,0,2515,2184\n"
        "TACCGATCCAACACTT-1,1,1,1,2634,2253\r\n");
    SpotTable t = readSpotTable(in);
    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t.spots[0].barcode, "ACGCCTGACACGCGCT-1");
    EXPECT_FALSE(t.spots[0].inTissue);
    EXPECT_TRUE(t.spots[1].inTissue);
    EXPECT_EQ(t.spots[1].arrayRow, 1);
    // x is the column, y the row
    EXPECT_DOUBLE_EQ(t.spots[1].x, 2253);
    EXPECT_DOUBLE_EQ(t.spots[1].y, 2634);
    EXPECT_EQ(t.inTissueFlags(), (std::vector<uint8_t>{0, 1}));
}

TEST(SpotTableTest, ReadsWithoutHeader) {
    std::istringstream in(
        "AAACAACGAATAGTTC-1,0,0,16,1522,4563\n"
        "AAACAAGTATCTCCCA-1,1,50,102,7506,8290\n"
        "\n"
        "AAACAATCTACTAGCA-1,1,3,43,1856,5978\n");
    SpotTable t = readSpotTable(in);
    ASSERT_EQ(t.size(), 3u);
    EXPECT_EQ(t.spots[2].arrayCol, 43);
    Rectangle<double> box = t.bounds();
    EXPECT_DOUBLE_EQ(box.xmin, 4563);
    EXPECT_DOUBLE_EQ(box.ymax, 7506);
}

TEST(SpotTableTest, RejectsMalformedRows) {
    std::istringstream shortRow("AAAC-1,1,0,16,1522\n");
    EXPECT_THROW(readSpotTable(shortRow), std::runtime_error);
    std::istringstream badFlag("AAAC-1,2,0,16,1522,4563\n");
    EXPECT_THROW(readSpotTable(badFlag), std::runtime_error);
    std::istringstream badNumber("AAAC-1,1,0,16,abc,4563\n");
    EXPECT_THROW(readSpotTable(badNumber), std::runtime_error);
    std::istringstream hugeRow("AAAC-1,1,3000000000,16,1522,4563\n");
    EXPECT_THROW(readSpotTable(hugeRow), std::runtime_error);
    std::istringstream wrappedFlag("AAAC-1,4294967297,0,16,1522,4563\n");
    EXPECT_THROW(readSpotTable(wrappedFlag), std::runtime_error);
    EXPECT_THROW(loadSpotTable("/nonexistent/tissue_positions.csv"), std::runtime_error);
}

TEST(SpotFootprintTest, RegularPolygon) {
    Spot s;
    s.x = 100;
    s.y = 200;
    Ring ring = spotFootprint(s, 50, 64);
    ASSERT_EQ(ring.size(), 64u);
    for (const auto& p : ring) {
        EXPECT_NEAR(std::hypot(p.x - 100, p.y - 200), 25.0, 1e-9);
    }
    const double expected = 0.5 * 64 * 25.0 * 25.0 * std::sin(2 * M_PI / 64);
    EXPECT_NEAR(ringArea(ring), expected, 1e-6);
    EXPECT_EQ(pointInRing({100, 200}, ring), 1);

    EXPECT_THROW(spotFootprint(s, 50, 2), std::runtime_error);
    EXPECT_THROW(spotFootprint(s, 0, 64), std::runtime_error);
}

TEST(SpotFootprintTest, LabelsFollowTableOrder) {
    SpotTable t;
    for (int i = 0; i < 5; ++i) {
        Spot s;
        s.barcode = "S" + std::to_string(i);
        s.x = 10.0 * i;
        t.spots.push_back(s);
    }
    PolygonSet<FullresPixelSpace> fp = spotFootprints(t, 4, 16);
    ASSERT_EQ(fp.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(fp.polygons[i].label, i + 1);
        EXPECT_EQ(fp.polygons[i].outer.size(), 16u);
    }
}
