#include "geometry.hpp"
#include <opencv2/imgproc.hpp>

double signedRingArea(const Ring& ring) {
    const size_t n = ring.size();
    if (n < 3) return 0.0;
    double s = 0.0;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        s += ring[j].x * ring[i].y - ring[i].x * ring[j].y;
    }
    return 0.5 * s;
}

double polygonArea(const LabeledPolygon& poly) {
    double a = ringArea(poly.outer);
    for (const auto& h : poly.holes) a -= ringArea(h);
    return a;
}

Rectangle<double> ringBounds(const Ring& ring) {
    Rectangle<double> box;
    for (const auto& p : ring) box.extendToInclude(p.x, p.y);
    return box;
}

int orientation(const cv::Point2d& a, const cv::Point2d& b, const cv::Point2d& c) {
    const double abx = b.x - a.x, aby = b.y - a.y;
    const double acx = c.x - a.x, acy = c.y - a.y;
    const double cross = abx * acy - aby * acx;
    const double eps = 1e-12 * (std::fabs(abx * acy) + std::fabs(aby * acx));
    if (cross > eps) return 1;
    if (cross < -eps) return -1;
    return 0;
}

bool onSegment(const cv::Point2d& p, const cv::Point2d& a, const cv::Point2d& b) {
    if (orientation(a, b, p) != 0) return false;
    return p.x >= std::min(a.x, b.x) && p.x <= std::max(a.x, b.x) &&
           p.y >= std::min(a.y, b.y) && p.y <= std::max(a.y, b.y);
}

bool segmentsIntersect(const cv::Point2d& p1, const cv::Point2d& p2,
                       const cv::Point2d& q1, const cv::Point2d& q2) {
    if (std::max(p1.x, p2.x) < std::min(q1.x, q2.x) ||
        std::max(q1.x, q2.x) < std::min(p1.x, p2.x) ||
        std::max(p1.y, p2.y) < std::min(q1.y, q2.y) ||
        std::max(q1.y, q2.y) < std::min(p1.y, p2.y)) {
        return false;
    }
    const int o1 = orientation(p1, p2, q1);
    const int o2 = orientation(p1, p2, q2);
    const int o3 = orientation(q1, q2, p1);
    const int o4 = orientation(q1, q2, p2);
    if (o1 != o2 && o3 != o4) return true;
    if (o1 == 0 && onSegment(q1, p1, p2)) return true;
    if (o2 == 0 && onSegment(q2, p1, p2)) return true;
    if (o3 == 0 && onSegment(p1, q1, q2)) return true;
    if (o4 == 0 && onSegment(p2, q1, q2)) return true;
    return false;
}

bool segmentsCross(const cv::Point2d& p1, const cv::Point2d& p2,
                   const cv::Point2d& q1, const cv::Point2d& q2) {
    const int o1 = orientation(p1, p2, q1);
    const int o2 = orientation(p1, p2, q2);
    const int o3 = orientation(q1, q2, p1);
    const int o4 = orientation(q1, q2, p2);
    if (o1 == 0 || o2 == 0 || o3 == 0 || o4 == 0) return false;
    return o1 != o2 && o3 != o4;
}

int pointInRing(const cv::Point2d& p, const Ring& ring) {
    if (ring.size() < 3) return -1;
    // cv::pointPolygonTest takes 32-bit integer or float contours only
    std::vector<cv::Point2f> contour;
    contour.reserve(ring.size());
    for (const auto& q : ring) contour.emplace_back(static_cast<float>(q.x), static_cast<float>(q.y));
    const double r = cv::pointPolygonTest(contour, cv::Point2f(static_cast<float>(p.x), static_cast<float>(p.y)), false);
    if (r > 0) return 1;
    if (r < 0) return -1;
    return 0;
}

int pointInPolygon(const cv::Point2d& p, const LabeledPolygon& poly) {
    int r = pointInRing(p, poly.outer);
    if (r <= 0) return r;
    for (const auto& h : poly.holes) {
        int rh = pointInRing(p, h);
        if (rh == 0) return 0;
        if (rh > 0) return -1;
    }
    return 1;
}

static bool ringEdgesIntersect(const Ring& a, const Ring& b) {
    const size_t na = a.size(), nb = b.size();
    if (na < 2 || nb < 2) return false;
    for (size_t i = 0, pi = na - 1; i < na; pi = i++) {
        for (size_t j = 0, pj = nb - 1; j < nb; pj = j++) {
            if (segmentsIntersect(a[pi], a[i], b[pj], b[j])) return true;
        }
    }
    return false;
}

static bool ringEdgesCross(const Ring& a, const Ring& b) {
    const size_t na = a.size(), nb = b.size();
    if (na < 2 || nb < 2) return false;
    for (size_t i = 0, pi = na - 1; i < na; pi = i++) {
        for (size_t j = 0, pj = nb - 1; j < nb; pj = j++) {
            if (segmentsCross(a[pi], a[i], b[pj], b[j])) return true;
        }
    }
    return false;
}

bool ringIntersectsPolygon(const Ring& ring, const LabeledPolygon& poly) {
    if (ring.empty() || poly.outer.size() < 3) return false;
    const Rectangle<double> rbox = ringBounds(ring);
    if (!rbox.intersects(ringBounds(poly.outer))) return false;
    if (ringEdgesIntersect(ring, poly.outer)) return true;
    for (const auto& h : poly.holes) {
        if (ringBounds(h).intersects(rbox) && ringEdgesIntersect(ring, h)) return true;
    }
    // No boundary contact: either one contains the other or they are disjoint
    if (pointInPolygon(ring[0], poly) >= 0) return true;
    if (ring.size() >= 3 && pointInRing(poly.outer[0], ring) >= 0) return true;
    return false;
}

bool polygonCoversRing(const LabeledPolygon& poly, const Ring& ring) {
    if (ring.empty() || poly.outer.size() < 3) return false;
    const Rectangle<double> rbox = ringBounds(ring);
    if (!ringBounds(poly.outer).contains(rbox)) return false;
    for (const auto& p : ring) {
        if (pointInPolygon(p, poly) < 0) return false;
    }
    if (ringEdgesCross(ring, poly.outer)) return false;
    for (const auto& h : poly.holes) {
        if (ringBounds(h).intersects(rbox) && ringEdgesCross(ring, h)) return false;
    }
    // Edges may leave the polygon between two boundary vertices
    const size_t n = ring.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        cv::Point2d mid = 0.5 * (ring[i] + ring[j]);
        if (pointInPolygon(mid, poly) < 0) return false;
    }
    // A hole strictly inside the ring is not covered
    for (const auto& h : poly.holes) {
        for (const auto& hp : h) {
            if (pointInRing(hp, ring) > 0) return false;
        }
    }
    return true;
}
