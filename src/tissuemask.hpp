#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

enum class ThresholdDirection : uint8_t { Below, Above };

struct MaskParams {
    int32_t channel = 0;      // RGB order
    double threshold = 0.85;  // in [0,1]
    ThresholdDirection direction = ThresholdDirection::Below;
    int32_t radius = 5;       // structuring element radius, 0 disables cleanup
    int32_t connectivity = 8;

    void validate() const;
};

struct RegionStats {
    int32_t label = 0;
    int64_t area = 0;
    cv::Rect box;
    cv::Point2d centroid;
};

struct LabeledMask {
    cv::Mat1i labels;                 // 0 is background
    std::vector<RegionStats> regions; // sorted by label

    size_t nRegions() const { return regions.size(); }
    const RegionStats* find(int32_t label) const;
};

// Label-independent way to name a region of one image
struct RegionDescriptor {
    double cx = 0, cy = 0;
    double maxDist = 10;
    double area = -1;     // ignored when negative
    double areaTol = 0.2; // relative

    bool matches(const RegionStats& r) const;
};

struct RegionFilterParams {
    int64_t minArea = 0;
    std::set<int32_t> excludeLabels; // only valid for one labeling run
    std::vector<RegionDescriptor> excludeRegions;
    bool fillHoles = true;
    int32_t connectivity = 8; // foreground connectivity the regions were labeled with

    bool survives(const RegionStats& r) const;
};

// Decode an image into CV_32FC(n) with intensities in [0,1], channels in RGB(A) order
cv::Mat loadImage(const std::string& path);
cv::Mat toUnitFloat(const cv::Mat& img);

cv::Mat1f selectChannel(const cv::Mat& img, int32_t channel);
cv::Mat1b thresholdChannel(const cv::Mat1f& channel, double threshold, ThresholdDirection direction);
cv::Mat1b buildMask(const cv::Mat& img, const MaskParams& params);

cv::Mat1b openMask(const cv::Mat1b& mask, int32_t radius);
cv::Mat1b closeMask(const cv::Mat1b& mask, int32_t radius);
// Opening followed by closing
cv::Mat1b cleanMask(const cv::Mat1b& mask, int32_t radius);
int64_t countForeground(const cv::Mat1b& mask);

LabeledMask labelComponents(const cv::Mat1b& mask, int32_t connectivity = 8);
std::vector<RegionStats> computeRegionStats(const cv::Mat1i& labels);

// Zero out rejected regions, then fill enclosed holes
LabeledMask filterRegions(const LabeledMask& in, const RegionFilterParams& params);
// Relabel background components that do not touch the border and are enclosed by one label.
// Background is traced with the complement of the foreground connectivity (8 -> 4, 4 -> 8).
cv::Mat1i fillHoles(const cv::Mat1i& labels, int32_t connectivity = 8);

bool parseRegionDescriptor(const std::string& text, RegionDescriptor& desc);
void writeRegionTable(const std::string& outFile, const LabeledMask& all, const LabeledMask* kept);
