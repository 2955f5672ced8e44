#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>
#include <opencv2/core.hpp>

// Closed ring, first vertex not repeated at the end
using Ring = std::vector<cv::Point2d>;

struct LabeledPolygon {
    int32_t label = 0;
    Ring outer;
    std::vector<Ring> holes;

    size_t nVertices() const {
        size_t n = outer.size();
        for (const auto& h : holes) n += h.size();
        return n;
    }
};

template<typename T>
struct Rectangle {
    T xmin, ymin, xmax, ymax;
    Rectangle() : xmin(std::numeric_limits<T>::max()), ymin(std::numeric_limits<T>::max()),
        xmax(std::numeric_limits<T>::lowest()), ymax(std::numeric_limits<T>::lowest()) {}
    Rectangle(T _xmin, T _ymin, T _xmax, T _ymax) :
        xmin(_xmin), ymin(_ymin), xmax(_xmax), ymax(_ymax) {}
    bool proper() const { return xmin <= xmax && ymin <= ymax; }
    void extendToInclude(T x, T y) {
        xmin = std::min(xmin, x); xmax = std::max(xmax, x);
        ymin = std::min(ymin, y); ymax = std::max(ymax, y);
    }
    void extendToInclude(const Rectangle<T>& other) {
        if (!other.proper()) return;
        extendToInclude(other.xmin, other.ymin);
        extendToInclude(other.xmax, other.ymax);
    }
    // Closed rectangles, touching counts
    bool intersects(const Rectangle<T>& other) const {
        return xmin <= other.xmax && other.xmin <= xmax &&
               ymin <= other.ymax && other.ymin <= ymax;
    }
    bool contains(T x, T y) const {
        return x >= xmin && x <= xmax && y >= ymin && y <= ymax;
    }
    bool contains(const Rectangle<T>& other) const {
        return other.xmin >= xmin && other.xmax <= xmax &&
               other.ymin >= ymin && other.ymax <= ymax;
    }
};

// Shoelace area, positive when vertices run counterclockwise in x-right/y-up axes
double signedRingArea(const Ring& ring);
inline double ringArea(const Ring& ring) { return std::fabs(signedRingArea(ring)); }
double polygonArea(const LabeledPolygon& poly);
Rectangle<double> ringBounds(const Ring& ring);

// Sign of the cross product (b-a) x (c-a), 0 when collinear within tolerance
int orientation(const cv::Point2d& a, const cv::Point2d& b, const cv::Point2d& c);
bool onSegment(const cv::Point2d& p, const cv::Point2d& a, const cv::Point2d& b);

// Closed segments share at least one point
bool segmentsIntersect(const cv::Point2d& p1, const cv::Point2d& p2,
                       const cv::Point2d& q1, const cv::Point2d& q2);
// Interiors cross at a single point, no touching or collinear overlap
bool segmentsCross(const cv::Point2d& p1, const cv::Point2d& p2,
                   const cv::Point2d& q1, const cv::Point2d& q2);

// 1 inside, 0 on the boundary, -1 outside; cv::pointPolygonTest on single precision vertices
int pointInRing(const cv::Point2d& p, const Ring& ring);
int pointInPolygon(const cv::Point2d& p, const LabeledPolygon& poly);

// Does the ring share any point with the polygon (boundary contact included)
bool ringIntersectsPolygon(const Ring& ring, const LabeledPolygon& poly);
// Is the ring entirely inside the closed polygon
bool polygonCoversRing(const LabeledPolygon& poly, const Ring& ring);
