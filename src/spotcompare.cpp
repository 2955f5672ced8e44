#include "spotcompare.hpp"
#include "error.hpp"
#include <cstdio>
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>

const char* categoryName(SpotCategory c) {
    switch (c) {
        case SpotCategory::Same:             return "same";
        case SpotCategory::ExternalOnly:     return "external-only";
        case SpotCategory::SegmentationOnly: return "segmentation-only";
    }
    return "unknown";
}

SpotCategory classifySpot(bool external, bool intersects) {
    if (external == intersects) return SpotCategory::Same;
    return external ? SpotCategory::ExternalOnly : SpotCategory::SegmentationOnly;
}

int64_t SpotComparison::count(SpotCategory c) const {
    int64_t n = 0;
    for (auto x : category) n += (x == c) ? 1 : 0;
    return n;
}

SpotComparison compareSpots(const PolygonSet<FullresPixelSpace>& tissue,
    const PolygonSet<FullresPixelSpace>& footprints,
    const std::vector<uint8_t>& external, int32_t threads) {
    const size_t N = footprints.size();
    if (external.size() != N) {
        error("%s: %zu footprints but %zu in-tissue flags", __func__, N, external.size());
    }
    SpotComparison cmp;
    cmp.intersects.assign(N, 0);
    cmp.covered.assign(N, 0);
    cmp.category.assign(N, SpotCategory::Same);

    std::vector<Rectangle<double>> tissueBoxes;
    tissueBoxes.reserve(tissue.size());
    for (const auto& poly : tissue.polygons) tissueBoxes.push_back(ringBounds(poly.outer));

    auto processRange = [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            const Ring& ring = footprints.polygons[i].outer;
            const Rectangle<double> box = ringBounds(ring);
            bool hit = false, inside = false;
            for (size_t p = 0; p < tissue.size() && !inside; ++p) {
                if (!tissueBoxes[p].intersects(box)) continue;
                const LabeledPolygon& poly = tissue.polygons[p];
                if (!hit && ringIntersectsPolygon(ring, poly)) hit = true;
                if (hit && polygonCoversRing(poly, ring)) inside = true;
            }
            cmp.intersects[i] = hit ? 1 : 0;
            cmp.covered[i] = inside ? 1 : 0;
            cmp.category[i] = classifySpot(external[i] != 0, hit);
        }
    };
    if (threads > 1 && N > 1) {
        tbb::global_control global_limit(tbb::global_control::max_allowed_parallelism, static_cast<size_t>(threads));
        tbb::parallel_for(tbb::blocked_range<size_t>(0, N),
            [&](const tbb::blocked_range<size_t>& range) {
                processRange(range.begin(), range.end());
            });
    } else {
        processRange(0, N);
    }

    for (size_t i = 0; i < N; ++i) {
        cmp.agreement(external[i] ? 1 : 0, cmp.intersects[i] ? 1 : 0) += 1;
    }
    notice("%s: %zu spots: same=%lld external-only=%lld segmentation-only=%lld",
        __func__, N,
        static_cast<long long>(cmp.count(SpotCategory::Same)),
        static_cast<long long>(cmp.count(SpotCategory::ExternalOnly)),
        static_cast<long long>(cmp.count(SpotCategory::SegmentationOnly)));
    notice("%s: agreement (external x intersects): [[%lld, %lld], [%lld, %lld]]",
        __func__,
        static_cast<long long>(cmp.agreement(0, 0)), static_cast<long long>(cmp.agreement(0, 1)),
        static_cast<long long>(cmp.agreement(1, 0)), static_cast<long long>(cmp.agreement(1, 1)));
    return cmp;
}

bool checkScaleConsistency(const PolygonSet<FullresPixelSpace>& tissue,
    const SpotTable& spots, const cv::Size& hiresSize, const ScaleFactors& sf) {
    if (tissue.empty() || spots.empty()) return true;
    bool ok = true;
    const Rectangle<double> tbox = tissue.bounds();
    Rectangle<double> sbox = spots.bounds();
    const double r = 0.5 * sf.spot_diameter_fullres;
    sbox = Rectangle<double>(sbox.xmin - r, sbox.ymin - r, sbox.xmax + r, sbox.ymax + r);
    if (!tbox.intersects(sbox)) {
        warning("%s: Tissue extent [%.1f, %.1f] x [%.1f, %.1f] does not overlap the spot extent [%.1f, %.1f] x [%.1f, %.1f]",
            __func__, tbox.xmin, tbox.xmax, tbox.ymin, tbox.ymax, sbox.xmin, sbox.xmax, sbox.ymin, sbox.ymax);
        ok = false;
    }
    if (hiresSize.width > 0 && hiresSize.height > 0 && sf.tissue_hires_scalef > 0) {
        const double W = hiresSize.width / sf.tissue_hires_scalef + sf.spot_diameter_fullres;
        const double H = hiresSize.height / sf.tissue_hires_scalef + sf.spot_diameter_fullres;
        const double d = sf.spot_diameter_fullres;
        if (tbox.xmin < -d || tbox.ymin < -d || tbox.xmax > W || tbox.ymax > H) {
            warning("%s: Tissue extent [%.1f, %.1f] x [%.1f, %.1f] exceeds the full resolution frame %.1f x %.1f",
                __func__, tbox.xmin, tbox.xmax, tbox.ymin, tbox.ymax, W, H);
            ok = false;
        }
    }
    return ok;
}

void writeSpotTable(const std::string& outFile, const SpotTable& spots, const SpotComparison& cmp) {
    if (spots.size() != cmp.size()) {
        error("%s: %zu spots but %zu comparison results", __func__, spots.size(), cmp.size());
    }
    FILE* fp = fopen(outFile.c_str(), "w");
    if (!fp) {
        error("%s: Cannot open output file %s", __func__, outFile.c_str());
    }
    fprintf(fp, "#barcode\tin_tissue\tarray_row\tarray_col\tx\ty\tintersects\tcovered\tcategory\n");
    for (size_t i = 0; i < spots.size(); ++i) {
        const Spot& s = spots.spots[i];
        fprintf(fp, "%s\t%d\t%d\t%d\t%.2f\t%.2f\t%d\t%d\t%s\n",
            s.barcode.c_str(), s.inTissue ? 1 : 0, s.arrayRow, s.arrayCol, s.x, s.y,
            cmp.intersects[i], cmp.covered[i], categoryName(cmp.category[i]));
    }
    fclose(fp);
    notice("%s: Wrote %zu spots to %s", __func__, spots.size(), outFile.c_str());
}
