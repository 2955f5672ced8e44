#include "tissuemask.hpp"
#include "error.hpp"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

void MaskParams::validate() const {
    if (channel < 0) {
        error("Channel index must be non-negative, got %d", channel);
    }
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        error("Threshold must be in [0, 1], got %g", threshold);
    }
    if (radius < 0) {
        error("Structuring element radius must be non-negative, got %d", radius);
    }
    if (connectivity != 4 && connectivity != 8) {
        error("Connectivity must be 4 or 8, got %d", connectivity);
    }
}

const RegionStats* LabeledMask::find(int32_t label) const {
    auto it = std::lower_bound(regions.begin(), regions.end(), label,
        [](const RegionStats& r, int32_t l) { return r.label < l; });
    if (it == regions.end() || it->label != label) return nullptr;
    return &(*it);
}

bool RegionDescriptor::matches(const RegionStats& r) const {
    const double dx = r.centroid.x - cx;
    const double dy = r.centroid.y - cy;
    if (std::sqrt(dx * dx + dy * dy) > maxDist) return false;
    if (area >= 0) {
        const double denom = std::max(area, 1.0);
        if (std::fabs(static_cast<double>(r.area) - area) / denom > areaTol) return false;
    }
    return true;
}

bool RegionFilterParams::survives(const RegionStats& r) const {
    if (r.area < minArea) return false;
    if (excludeLabels.count(r.label) > 0) return false;
    for (const auto& d : excludeRegions) {
        if (d.matches(r)) return false;
    }
    return true;
}

cv::Mat toUnitFloat(const cv::Mat& img) {
    double scale = 1.0;
    switch (img.depth()) {
        case CV_8U:  scale = 1.0 / 255.0; break;
        case CV_16U: scale = 1.0 / 65535.0; break;
        case CV_32F:
        case CV_64F: scale = 1.0; break;
        default:
            error("%s: Unsupported pixel depth %d", __func__, img.depth());
    }
    cv::Mat out;
    img.convertTo(out, CV_MAKETYPE(CV_32F, img.channels()), scale);
    return out;
}

cv::Mat loadImage(const std::string& path) {
    cv::Mat raw = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (raw.empty()) {
        error("%s: Cannot read image %s", __func__, path.c_str());
    }
    cv::Mat ordered;
    if (raw.channels() == 3) {
        cv::cvtColor(raw, ordered, cv::COLOR_BGR2RGB);
    } else if (raw.channels() == 4) {
        cv::cvtColor(raw, ordered, cv::COLOR_BGRA2RGBA);
    } else {
        ordered = raw;
    }
    cv::Mat img = toUnitFloat(ordered);
    notice("%s: Loaded %s (%dx%d, %d channels)", __func__, path.c_str(), img.cols, img.rows, img.channels());
    return img;
}

cv::Mat1f selectChannel(const cv::Mat& img, int32_t channel) {
    if (img.empty()) {
        error("%s: Empty image", __func__);
    }
    if (channel < 0 || channel >= img.channels()) {
        error("%s: Channel %d requested but the image has %d channel(s)", __func__, channel, img.channels());
    }
    cv::Mat plane;
    if (img.channels() == 1) {
        plane = img;
    } else {
        cv::extractChannel(img, plane, channel);
    }
    cv::Mat1f out;
    if (plane.depth() == CV_32F) {
        out = plane.clone();
    } else {
        toUnitFloat(plane).copyTo(out);
    }
    return out;
}

cv::Mat1b thresholdChannel(const cv::Mat1f& channel, double threshold, ThresholdDirection direction) {
    cv::Mat1b mask;
    cv::compare(channel, threshold, mask,
        direction == ThresholdDirection::Below ? cv::CMP_LT : cv::CMP_GT);
    return mask;
}

cv::Mat1b buildMask(const cv::Mat& img, const MaskParams& params) {
    params.validate();
    cv::Mat1f ch = selectChannel(img, params.channel);
    cv::Mat1b mask = thresholdChannel(ch, params.threshold, params.direction);
    notice("%s: %lld of %d pixels pass the threshold %.3f on channel %d",
        __func__, static_cast<long long>(countForeground(mask)), ch.rows * ch.cols,
        params.threshold, params.channel);
    return mask;
}

static cv::Mat discElement(int32_t radius) {
    return cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(2 * radius + 1, 2 * radius + 1));
}

cv::Mat1b openMask(const cv::Mat1b& mask, int32_t radius) {
    if (radius <= 0) return mask.clone();
    cv::Mat1b out;
    cv::morphologyEx(mask, out, cv::MORPH_OPEN, discElement(radius));
    return out;
}

cv::Mat1b closeMask(const cv::Mat1b& mask, int32_t radius) {
    if (radius <= 0) return mask.clone();
    cv::Mat1b out;
    cv::morphologyEx(mask, out, cv::MORPH_CLOSE, discElement(radius));
    return out;
}

cv::Mat1b cleanMask(const cv::Mat1b& mask, int32_t radius) {
    if (radius < 0) {
        error("%s: Radius must be non-negative, got %d", __func__, radius);
    }
    return closeMask(openMask(mask, radius), radius);
}

int64_t countForeground(const cv::Mat1b& mask) {
    return static_cast<int64_t>(cv::countNonZero(mask));
}

LabeledMask labelComponents(const cv::Mat1b& mask, int32_t connectivity) {
    if (connectivity != 4 && connectivity != 8) {
        error("%s: Connectivity must be 4 or 8, got %d", __func__, connectivity);
    }
    LabeledMask out;
    cv::Mat stats, centroids;
    int32_t n = cv::connectedComponentsWithStats(mask, out.labels, stats, centroids, connectivity, CV_32S);
    out.regions.reserve(static_cast<size_t>(std::max(0, n - 1)));
    for (int32_t l = 1; l < n; ++l) {
        RegionStats r;
        r.label = l;
        r.area = stats.at<int32_t>(l, cv::CC_STAT_AREA);
        r.box = cv::Rect(stats.at<int32_t>(l, cv::CC_STAT_LEFT), stats.at<int32_t>(l, cv::CC_STAT_TOP),
                         stats.at<int32_t>(l, cv::CC_STAT_WIDTH), stats.at<int32_t>(l, cv::CC_STAT_HEIGHT));
        r.centroid = cv::Point2d(centroids.at<double>(l, 0), centroids.at<double>(l, 1));
        out.regions.push_back(r);
    }
    notice("%s: Found %zu connected components (%d-connectivity)", __func__, out.regions.size(), connectivity);
    return out;
}

std::vector<RegionStats> computeRegionStats(const cv::Mat1i& labels) {
    struct Accum {
        int64_t n = 0;
        double sumX = 0, sumY = 0;
        int32_t xmin = 0, ymin = 0, xmax = -1, ymax = -1;
    };
    std::vector<Accum> acc;
    for (int32_t y = 0; y < labels.rows; ++y) {
        const int32_t* row = labels[y];
        for (int32_t x = 0; x < labels.cols; ++x) {
            const int32_t l = row[x];
            if (l <= 0) continue;
            if (static_cast<size_t>(l) >= acc.size()) acc.resize(static_cast<size_t>(l) + 1);
            Accum& a = acc[static_cast<size_t>(l)];
            if (a.n == 0) {
                a.xmin = a.xmax = x;
                a.ymin = a.ymax = y;
            } else {
                a.xmin = std::min(a.xmin, x); a.xmax = std::max(a.xmax, x);
                a.ymin = std::min(a.ymin, y); a.ymax = std::max(a.ymax, y);
            }
            a.n++;
            a.sumX += x;
            a.sumY += y;
        }
    }
    std::vector<RegionStats> regions;
    for (size_t l = 1; l < acc.size(); ++l) {
        const Accum& a = acc[l];
        if (a.n == 0) continue;
        RegionStats r;
        r.label = static_cast<int32_t>(l);
        r.area = a.n;
        r.box = cv::Rect(a.xmin, a.ymin, a.xmax - a.xmin + 1, a.ymax - a.ymin + 1);
        r.centroid = cv::Point2d(a.sumX / a.n, a.sumY / a.n);
        regions.push_back(r);
    }
    return regions;
}

cv::Mat1i fillHoles(const cv::Mat1i& labels, int32_t connectivity) {
    if (connectivity != 4 && connectivity != 8) {
        error("%s: Connectivity must be 4 or 8, got %d", __func__, connectivity);
    }
    // background uses the complementary connectivity of the foreground
    const int32_t bgConnectivity = 12 - connectivity;
    cv::Mat1b background = (labels == 0);
    cv::Mat1i bgLabels;
    const int32_t nb = cv::connectedComponents(background, bgLabels, bgConnectivity, CV_32S);
    if (nb <= 1) return labels.clone();

    const int32_t CONFLICT = -1;
    std::vector<int32_t> owner(static_cast<size_t>(nb), 0);
    std::vector<uint8_t> touchesBorder(static_cast<size_t>(nb), 0);
    const int32_t H = labels.rows, W = labels.cols;
    auto claim = [&](int32_t b, int32_t l) {
        int32_t& o = owner[static_cast<size_t>(b)];
        if (o == 0) o = l;
        else if (o != l) o = CONFLICT;
    };
    static const int32_t dx[8] = {-1, 1, 0, 0, -1, 1, -1, 1};
    static const int32_t dy[8] = {0, 0, -1, 1, -1, -1, 1, 1};
    const int32_t nNeighbours = bgConnectivity;
    for (int32_t y = 0; y < H; ++y) {
        const int32_t* bg = bgLabels[y];
        for (int32_t x = 0; x < W; ++x) {
            const int32_t b = bg[x];
            if (b == 0) continue;
            if (x == 0 || y == 0 || x == W - 1 || y == H - 1) {
                touchesBorder[static_cast<size_t>(b)] = 1;
            }
            for (int32_t k = 0; k < nNeighbours; ++k) {
                const int32_t nx = x + dx[k], ny = y + dy[k];
                if (nx < 0 || ny < 0 || nx >= W || ny >= H) continue;
                const int32_t l = labels(ny, nx);
                if (l > 0) claim(b, l);
            }
        }
    }
    cv::Mat1i out = labels.clone();
    int64_t nFilled = 0;
    for (int32_t y = 0; y < H; ++y) {
        const int32_t* bg = bgLabels[y];
        int32_t* dst = out[y];
        for (int32_t x = 0; x < W; ++x) {
            const int32_t b = bg[x];
            if (b == 0 || touchesBorder[static_cast<size_t>(b)]) continue;
            const int32_t o = owner[static_cast<size_t>(b)];
            if (o > 0) {
                dst[x] = o;
                nFilled++;
            }
        }
    }
    debug("%s: Filled %lld hole pixels", __func__, static_cast<long long>(nFilled));
    return out;
}

LabeledMask filterRegions(const LabeledMask& in, const RegionFilterParams& params) {
    if (params.minArea < 0) {
        error("%s: Minimum area must be non-negative, got %lld", __func__, static_cast<long long>(params.minArea));
    }
    int32_t maxLabel = 0;
    for (const auto& r : in.regions) maxLabel = std::max(maxLabel, r.label);
    std::vector<uint8_t> keep(static_cast<size_t>(maxLabel) + 1, 0);
    size_t nKept = 0;
    for (const auto& r : in.regions) {
        if (params.survives(r)) {
            keep[static_cast<size_t>(r.label)] = 1;
            nKept++;
        } else {
            debug("%s: Removed region %d (area %lld)", __func__, r.label, static_cast<long long>(r.area));
        }
    }
    for (int32_t l : params.excludeLabels) {
        if (in.find(l) == nullptr) {
            warning("%s: Excluded label %d does not exist in this labeling", __func__, l);
        }
    }

    cv::Mat1i filtered(in.labels.size(), 0);
    for (int32_t y = 0; y < in.labels.rows; ++y) {
        const int32_t* src = in.labels[y];
        int32_t* dst = filtered[y];
        for (int32_t x = 0; x < in.labels.cols; ++x) {
            const int32_t l = src[x];
            if (l > 0 && l <= maxLabel && keep[static_cast<size_t>(l)]) dst[x] = l;
        }
    }

    LabeledMask out;
    out.labels = params.fillHoles ? fillHoles(filtered, params.connectivity) : filtered;
    out.regions = computeRegionStats(out.labels);
    notice("%s: Kept %zu of %zu regions (min area %lld, %zu excluded labels, %zu excluded descriptors)",
        __func__, nKept, in.regions.size(), static_cast<long long>(params.minArea),
        params.excludeLabels.size(), params.excludeRegions.size());
    if (out.regions.empty()) {
        warning("%s: All regions were removed, the tissue mask is empty", __func__);
    }
    return out;
}

bool parseRegionDescriptor(const std::string& text, RegionDescriptor& desc) {
    std::vector<std::string> tokens;
    split(tokens, ",:", text);
    if (tokens.size() < 2 || tokens.size() > 5) return false;
    double v[5] = {0, 0, desc.maxDist, desc.area, desc.areaTol};
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (!str2double(trim(tokens[i]), v[i])) return false;
    }
    if (v[2] < 0 || v[4] < 0) return false;
    desc.cx = v[0];
    desc.cy = v[1];
    desc.maxDist = v[2];
    desc.area = v[3];
    desc.areaTol = v[4];
    return true;
}

void writeRegionTable(const std::string& outFile, const LabeledMask& all, const LabeledMask* kept) {
    FILE* fp = fopen(outFile.c_str(), "w");
    if (!fp) {
        error("%s: Cannot open output file %s", __func__, outFile.c_str());
    }
    fprintf(fp, "#label\tarea\tcentroid_x\tcentroid_y\txmin\txmax\tymin\tymax");
    if (kept) fprintf(fp, "\tkept\tfinal_area");
    fprintf(fp, "\n");
    for (const auto& r : all.regions) {
        fprintf(fp, "%d\t%lld\t%.3f\t%.3f\t%d\t%d\t%d\t%d",
            r.label, static_cast<long long>(r.area), r.centroid.x, r.centroid.y,
            r.box.x, r.box.x + r.box.width - 1, r.box.y, r.box.y + r.box.height - 1);
        if (kept) {
            const RegionStats* k = kept->find(r.label);
            fprintf(fp, "\t%d\t%lld", k ? 1 : 0, k ? static_cast<long long>(k->area) : 0LL);
        }
        fprintf(fp, "\n");
    }
    fclose(fp);
    notice("%s: Wrote %zu regions to %s", __func__, all.regions.size(), outFile.c_str());
}
