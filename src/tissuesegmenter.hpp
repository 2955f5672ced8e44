#pragma once

#include <string>
#include <opencv2/core.hpp>
#include "tissuemask.hpp"
#include "polygonize.hpp"
#include "spotcompare.hpp"
#include "visium.hpp"

struct SegmenterParams {
    MaskParams mask;
    RegionFilterParams filter;
    PolygonizeParams polygon;
    int32_t spotVertices = 64;
    double spotDiameter = -1; // <= 0 uses spot_diameter_fullres
    int32_t threads = 1;

    void validate() const;
};

/*
    Runs the segmentation stages over one hi-res image and compares the
    resulting tissue boundary with the vendor in-tissue flags:
      segment(): threshold -> open/close -> label -> filter -> polygonize
      compare(): rescale to full resolution -> per spot intersects/covered -> category
*/
class TissueSegmenter {
public:
    explicit TissueSegmenter(const SegmenterParams& params);
    TissueSegmenter(const TissueSegmenter&) = delete;
    TissueSegmenter& operator=(const TissueSegmenter&) = delete;

    void segment(const cv::Mat& image);
    void compare(const SpotTable& spots, const ScaleFactors& sf);
    void writeOutputs(const std::string& outPrefix, bool writeMasks = false) const;

    bool segmented() const { return segmented_; }
    bool compared() const { return compared_; }
    const cv::Mat1b& thresholdMask() const { return thresholdMask_; }
    const cv::Mat1b& cleanedMask() const { return cleanMask_; }
    const LabeledMask& labeled() const { return labeled_; }
    const LabeledMask& filtered() const { return filtered_; }
    const PolygonizeResult& polygons() const { return polygons_; }
    const PolygonSet<FullresPixelSpace>& tissueBoundary() const { return boundary_; }
    const SpotComparison& comparison() const { return comparison_; }
    bool scaleConsistent() const { return scaleOk_; }

private:
    SegmenterParams params_;
    cv::Size imageSize_;
    cv::Mat1b thresholdMask_, cleanMask_;
    LabeledMask labeled_, filtered_;
    PolygonizeResult polygons_;
    PolygonSet<FullresPixelSpace> boundary_;
    SpotTable spots_;
    SpotComparison comparison_;
    bool segmented_ = false;
    bool compared_ = false;
    bool scaleOk_ = true;
};

void writeMaskImage(const std::string& outFile, const cv::Mat& mask);
