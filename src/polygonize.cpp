#include "polygonize.hpp"
#include "error.hpp"
#include "tissuemask.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <queue>
#include <tuple>
#include <opencv2/imgproc.hpp>

void PolygonizeParams::validate() const {
    if (!(keep > 0.0 && keep <= 1.0)) {
        error("Simplification keep fraction must be in (0, 1], got %g", keep);
    }
    if (minRingVertices < 3) {
        error("Minimum ring size must be at least 3, got %d", minRingVertices);
    }
}

namespace {

// Contours are traced on a 2x nearest-neighbour upsampling, where the four
// samples around a pixel corner all map to that corner. Pixel (c, r) then
// spans [c, c+1] x [r, r+1] relative to origin.
Ring toCornerRing(const std::vector<cv::Point>& contour, const cv::Point& origin) {
    Ring ring;
    ring.reserve(contour.size());
    for (const auto& p : contour) {
        cv::Point2d q(origin.x + (p.x + 1) / 2, origin.y + (p.y + 1) / 2);
        if (ring.empty() || ring.back() != q) ring.push_back(q);
    }
    while (ring.size() > 1 && ring.front() == ring.back()) ring.pop_back();
    // Runs along one cell edge leave collinear vertices behind
    bool changed = true;
    while (changed && ring.size() >= 3) {
        changed = false;
        Ring kept;
        kept.reserve(ring.size());
        const size_t n = ring.size();
        for (size_t i = 0; i < n; ++i) {
            const cv::Point2d& a = kept.empty() ? ring[n - 1] : kept.back();
            if (orientation(a, ring[i], ring[(i + 1) % n]) == 0) {
                changed = true;
                continue;
            }
            kept.push_back(ring[i]);
        }
        ring.swap(kept);
    }
    return ring;
}

bool isDegenerate(const Ring& ring) {
    return ring.size() < 3 || ringArea(ring) <= 0.0;
}

// Doubly linked view of one polygon's rings used during vertex elimination
class PolygonSimplifier {
public:
    explicit PolygonSimplifier(const LabeledPolygon& poly) {
        add(poly.outer);
        for (const auto& h : poly.holes) add(h);
    }

    size_t nRings() const { return rings_.size(); }

    void simplify(size_t r, double keep, int32_t minVertices) {
        WorkRing& w = rings_[r];
        const int32_t n = static_cast<int32_t>(w.pts->size());
        const int32_t target = std::max(minVertices,
            static_cast<int32_t>(std::ceil(keep * static_cast<double>(n))));
        if (w.nAlive <= target) return;

        using Entry = std::tuple<double, uint32_t, int32_t>;
        std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> pq;
        std::vector<uint32_t> version(static_cast<size_t>(n), 0);
        for (int32_t v = 0; v < n; ++v) {
            pq.emplace(effectiveArea(w, v), 0u, v);
        }
        double lastArea = 0.0;
        while (w.nAlive > target && !pq.empty()) {
            const Entry top = pq.top();
            pq.pop();
            const int32_t v = std::get<2>(top);
            if (!w.alive[v] || std::get<1>(top) != version[v]) continue;
            // blocked vertices come back when a neighbour is removed
            if (!removable(r, v)) continue;
            const int32_t a = w.prev[v], b = w.next[v];
            w.alive[v] = 0;
            w.next[a] = b;
            w.prev[b] = a;
            w.nAlive--;
            if (w.head == v) w.head = a;
            lastArea = std::max(lastArea, std::get<0>(top));
            for (int32_t u : {a, b}) {
                version[u]++;
                pq.emplace(std::max(effectiveArea(w, u), lastArea), version[u], u);
            }
        }
    }

    Ring extract(size_t r) const {
        const WorkRing& w = rings_[r];
        Ring out;
        out.reserve(static_cast<size_t>(w.nAlive));
        int32_t v = w.head;
        for (int32_t k = 0; k < w.nAlive; ++k) {
            out.push_back((*w.pts)[v]);
            v = w.next[v];
        }
        return out;
    }

private:
    struct WorkRing {
        const Ring* pts = nullptr;
        std::vector<int32_t> prev, next;
        std::vector<uint8_t> alive;
        int32_t nAlive = 0;
        int32_t head = 0;
    };
    std::vector<WorkRing> rings_;

    void add(const Ring& ring) {
        WorkRing w;
        w.pts = &ring;
        const int32_t n = static_cast<int32_t>(ring.size());
        w.prev.resize(n);
        w.next.resize(n);
        w.alive.assign(static_cast<size_t>(n), 1);
        for (int32_t i = 0; i < n; ++i) {
            w.prev[i] = (i + n - 1) % n;
            w.next[i] = (i + 1) % n;
        }
        w.nAlive = n;
        rings_.push_back(std::move(w));
    }

    static double effectiveArea(const WorkRing& w, int32_t v) {
        const cv::Point2d& a = (*w.pts)[w.prev[v]];
        const cv::Point2d& p = (*w.pts)[v];
        const cv::Point2d& b = (*w.pts)[w.next[v]];
        return 0.5 * std::fabs((p.x - a.x) * (b.y - a.y) - (b.x - a.x) * (p.y - a.y));
    }

    // Replacing a-v-b by a-b must not cross or swallow anything
    bool removable(size_t r, int32_t v) const {
        const WorkRing& w = rings_[r];
        const int32_t ia = w.prev[v], ib = w.next[v];
        const cv::Point2d& A = (*w.pts)[ia];
        const cv::Point2d& V = (*w.pts)[v];
        const cv::Point2d& B = (*w.pts)[ib];
        const Ring tri = {A, V, B};
        const Rectangle<double> triBox = ringBounds(tri);
        for (size_t s = 0; s < rings_.size(); ++s) {
            const WorkRing& o = rings_[s];
            int32_t i = o.head;
            for (int32_t k = 0; k < o.nAlive; ++k, i = o.next[i]) {
                const int32_t j = o.next[i];
                const cv::Point2d& P = (*o.pts)[i];
                const bool own = (s == r);
                if ((!own || (i != ia && i != v && i != ib)) && pointInRing(P, tri) > 0) return false;
                if (own && (i == ia || i == v || i == ib || j == ia)) continue;
                const cv::Point2d& Q = (*o.pts)[j];
                Rectangle<double> segBox(std::min(P.x, Q.x), std::min(P.y, Q.y),
                                         std::max(P.x, Q.x), std::max(P.y, Q.y));
                if (!segBox.intersects(triBox)) continue;
                if (segmentsIntersect(A, B, P, Q)) return false;
            }
        }
        return true;
    }
};

} // namespace

PolygonSet<RasterSpace> vectorizeLabels(const cv::Mat1i& labels, PolygonizeStats* stats) {
    PolygonizeStats local;
    PolygonSet<RasterSpace> out;
    const std::vector<RegionStats> regions = computeRegionStats(labels);
    for (const auto& reg : regions) {
        cv::Mat1b roi = (labels(reg.box) == reg.label);
        cv::Mat1b padded, up;
        cv::copyMakeBorder(roi, padded, 1, 1, 1, 1, cv::BORDER_CONSTANT, cv::Scalar(0));
        cv::resize(padded, up, cv::Size(), 2, 2, cv::INTER_NEAREST);
        std::vector<std::vector<cv::Point>> contours;
        std::vector<cv::Vec4i> hierarchy;
        cv::findContours(up, contours, hierarchy, cv::RETR_CCOMP, cv::CHAIN_APPROX_SIMPLE);
        const cv::Point origin(reg.box.x - 1, reg.box.y - 1);
        local.labels++;
        for (size_t i = 0; i < contours.size(); ++i) {
            if (hierarchy[i][3] >= 0) continue; // holes are collected from their parent
            LabeledPolygon poly;
            poly.label = reg.label;
            poly.outer = toCornerRing(contours[i], origin);
            if (isDegenerate(poly.outer)) {
                debug("%s: Dropped degenerate outline of region %d (%zu vertices)",
                    __func__, reg.label, poly.outer.size());
                local.degenerate++;
                continue;
            }
            if (signedRingArea(poly.outer) < 0) std::reverse(poly.outer.begin(), poly.outer.end());
            for (int32_t c = hierarchy[i][2]; c >= 0; c = hierarchy[c][0]) {
                Ring hole = toCornerRing(contours[static_cast<size_t>(c)], origin);
                if (isDegenerate(hole)) {
                    local.degenerate++;
                    continue;
                }
                if (signedRingArea(hole) > 0) std::reverse(hole.begin(), hole.end());
                poly.holes.push_back(std::move(hole));
            }
            local.holes += poly.holes.size();
            out.polygons.push_back(std::move(poly));
        }
    }
    local.polygons = out.polygons.size();
    if (stats) *stats = local;
    return out;
}

LabeledPolygon simplifyPolygon(const LabeledPolygon& poly, double keep, int32_t minRingVertices) {
    if (keep >= 1.0) return poly;
    PolygonSimplifier simp(poly);
    for (size_t r = 0; r < simp.nRings(); ++r) {
        simp.simplify(r, keep, minRingVertices);
    }
    LabeledPolygon out;
    out.label = poly.label;
    out.outer = simp.extract(0);
    for (size_t r = 1; r < simp.nRings(); ++r) {
        out.holes.push_back(simp.extract(r));
    }
    return out;
}

Ring simplifyRing(const Ring& ring, double keep, int32_t minRingVertices) {
    LabeledPolygon poly;
    poly.outer = ring;
    return simplifyPolygon(poly, keep, minRingVertices).outer;
}

PolygonizeResult polygonize(const cv::Mat1i& labels, const PolygonizeParams& params) {
    params.validate();
    PolygonizeResult res;
    PolygonSet<RasterSpace> raster = vectorizeLabels(labels, &res.stats);
    res.full = rasterToHires(raster, labels.rows, params.yaxis);
    res.simplified = simplifyPolygons(res.full, params.keep, params.minRingVertices);
    notice("%s: %zu polygons (%zu holes) from %zu regions, %zu degenerate pieces dropped",
        __func__, res.stats.polygons, res.stats.holes, res.stats.labels, res.stats.degenerate);
    notice("%s: Simplified from %zu to %zu vertices (keep=%.3f)",
        __func__, res.full.nVertices(), res.simplified.nVertices(), params.keep);
    return res;
}
