#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "Eigen/Dense"
#include "coordframes.hpp"
#include "visium.hpp"

enum class SpotCategory : uint8_t { Same = 0, ExternalOnly = 1, SegmentationOnly = 2 };

const char* categoryName(SpotCategory c);
// Only intersects takes part in the classification
SpotCategory classifySpot(bool external, bool intersects);

struct SpotComparison {
    std::vector<uint8_t> intersects;
    std::vector<uint8_t> covered;
    std::vector<SpotCategory> category;
    // rows: external flag 0/1, cols: intersects 0/1
    Eigen::Matrix<int64_t, 2, 2> agreement = Eigen::Matrix<int64_t, 2, 2>::Zero();

    size_t size() const { return category.size(); }
    int64_t count(SpotCategory c) const;
};

SpotComparison compareSpots(const PolygonSet<FullresPixelSpace>& tissue,
    const PolygonSet<FullresPixelSpace>& footprints,
    const std::vector<uint8_t>& external, int32_t threads = 1);

// Returns false and warns when the rescaled tissue cannot share a frame with the spots
bool checkScaleConsistency(const PolygonSet<FullresPixelSpace>& tissue,
    const SpotTable& spots, const cv::Size& hiresSize, const ScaleFactors& sf);

void writeSpotTable(const std::string& outFile, const SpotTable& spots, const SpotComparison& cmp);
