#include "tissuesegmenter.hpp"
#include "error.hpp"
#include "geojson.hpp"
#include <chrono>
#include <opencv2/imgcodecs.hpp>

void SegmenterParams::validate() const {
    mask.validate();
    polygon.validate();
    if (filter.minArea < 0) {
        error("Minimum region area must be non-negative, got %lld", static_cast<long long>(filter.minArea));
    }
    if (spotVertices < 3) {
        error("Spot footprints need at least 3 vertices, got %d", spotVertices);
    }
    if (threads < 1) {
        error("Number of threads must be positive, got %d", threads);
    }
}

TissueSegmenter::TissueSegmenter(const SegmenterParams& params) : params_(params) {
    params_.validate();
}

void TissueSegmenter::segment(const cv::Mat& image) {
    if (image.empty()) {
        error("%s: Empty input image", __func__);
    }
    const auto t0 = std::chrono::steady_clock::now();
    imageSize_ = image.size();
    thresholdMask_ = buildMask(image, params_.mask);
    cleanMask_ = cleanMask(thresholdMask_, params_.mask.radius);
    notice("%s: Foreground %lld -> %lld pixels after opening/closing (radius %d)", __func__,
        static_cast<long long>(countForeground(thresholdMask_)),
        static_cast<long long>(countForeground(cleanMask_)), params_.mask.radius);
    labeled_ = labelComponents(cleanMask_, params_.mask.connectivity);
    RegionFilterParams filter = params_.filter;
    filter.connectivity = params_.mask.connectivity;
    filtered_ = filterRegions(labeled_, filter);
    polygons_ = polygonize(filtered_.labels, params_.polygon);
    segmented_ = true;
    compared_ = false;
    const auto t1 = std::chrono::steady_clock::now();
    notice("%s: Segmentation finished in %lld ms", __func__,
        static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count()));
}

void TissueSegmenter::compare(const SpotTable& spots, const ScaleFactors& sf) {
    if (!segmented_) {
        error("%s: segment() must run before compare()", __func__);
    }
    if (spots.empty()) {
        error("%s: Spot table is empty", __func__);
    }
    boundary_ = hiresToFullres(polygons_.simplified, sf);
    scaleOk_ = checkScaleConsistency(boundary_, spots, imageSize_, sf);
    const double diameter = params_.spotDiameter > 0 ? params_.spotDiameter : sf.spot_diameter_fullres;
    PolygonSet<FullresPixelSpace> footprints = spotFootprints(spots, diameter, params_.spotVertices);
    spots_ = spots;
    comparison_ = compareSpots(boundary_, footprints, spots.inTissueFlags(), params_.threads);
    compared_ = true;
}

void writeMaskImage(const std::string& outFile, const cv::Mat& mask) {
    cv::Mat out;
    if (mask.type() == CV_8UC1) {
        out = mask;
    } else {
        cv::Mat1b nz = (mask > 0);
        out = nz;
    }
    if (!cv::imwrite(outFile, out)) {
        error("%s: Error writing %s", __func__, outFile.c_str());
    }
    notice("%s: Wrote %s", __func__, outFile.c_str());
}

void TissueSegmenter::writeOutputs(const std::string& outPrefix, bool writeMasks) const {
    if (!segmented_) {
        error("%s: Nothing to write, segment() has not run", __func__);
    }
    writeRegionTable(outPrefix + ".regions.tsv", labeled_, &filtered_);
    writeJson(outPrefix + ".polygons_full.geojson", toFeatureCollection(polygons_.full, "tissuePolygonsFull"));
    writeJson(outPrefix + ".polygons_simplified.geojson", toFeatureCollection(polygons_.simplified, "tissuePolygonsSimplified"));
    if (compared_) {
        writeJson(outPrefix + ".tissue_boundary.geojson", tissueBoundaryToJson(boundary_));
        writeSpotTable(outPrefix + ".spots.tsv", spots_, comparison_);
    }
    if (writeMasks) {
        writeMaskImage(outPrefix + ".mask_threshold.png", thresholdMask_);
        writeMaskImage(outPrefix + ".mask_clean.png", cleanMask_);
        writeMaskImage(outPrefix + ".mask_filtered.png", filtered_.labels);
    }
}
