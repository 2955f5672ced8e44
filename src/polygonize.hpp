#pragma once

#include <cstdint>
#include <opencv2/core.hpp>
#include "coordframes.hpp"

struct PolygonizeParams {
    double keep = 0.05;      // fraction of vertices retained by simplification, (0,1]
    int32_t minRingVertices = 3;
    YAxis yaxis = YAxis::Down;

    void validate() const;
};

struct PolygonizeStats {
    size_t labels = 0;
    size_t polygons = 0;
    size_t holes = 0;
    size_t degenerate = 0;
};

// Trace every positive label into polygons with holes; background is never vectorized.
// Rings follow pixel edges, pixel (c, r) covering [c, c+1] x [r, r+1], so a polygon's
// area equals its pixel count. Zero-area pieces are dropped and counted in stats->degenerate.
PolygonSet<RasterSpace> vectorizeLabels(const cv::Mat1i& labels, PolygonizeStats* stats = nullptr);

// Visvalingam-Whyatt elimination keeping ceil(keep * n) vertices per ring (at least minRingVertices).
// Removals that would make a segment cross another segment of the same polygon, or
// swallow one of its vertices, are skipped.
Ring simplifyRing(const Ring& ring, double keep, int32_t minRingVertices = 3);
LabeledPolygon simplifyPolygon(const LabeledPolygon& poly, double keep, int32_t minRingVertices = 3);

template<typename Frame>
PolygonSet<Frame> simplifyPolygons(const PolygonSet<Frame>& in, double keep, int32_t minRingVertices = 3) {
    PolygonSet<Frame> out;
    out.polygons.reserve(in.polygons.size());
    for (const auto& poly : in.polygons) {
        out.polygons.push_back(simplifyPolygon(poly, keep, minRingVertices));
    }
    return out;
}

struct PolygonizeResult {
    PolygonSet<HiresPixelSpace> full;
    PolygonSet<HiresPixelSpace> simplified;
    PolygonizeStats stats;
};

PolygonizeResult polygonize(const cv::Mat1i& labels, const PolygonizeParams& params);
