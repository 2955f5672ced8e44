#include <gtest/gtest.h>

#include "tissuemask.hpp"

#include <set>
#include <stdexcept>

namespace {

cv::Mat1b randomMask(int rows, int cols, uint64_t seed) {
    cv::Mat1b bits(rows, cols);
    cv::RNG rng(seed);
    rng.fill(bits, cv::RNG::UNIFORM, 0, 2);
    cv::Mat1b mask = (bits > 0);
    return mask;
}

bool sameMask(const cv::Mat& a, const cv::Mat& b) {
    return a.size() == b.size() && cv::countNonZero(a != b) == 0;
}

// every pixel set in a is also set in b
bool subsetOf(const cv::Mat1b& a, const cv::Mat1b& b) {
    cv::Mat1b outside = a & ~b;
    return cv::countNonZero(outside) == 0;
}

} // namespace

TEST(TissueMaskTest, ThresholdDirection) {
    cv::Mat1f ch = (cv::Mat1f(1, 4) << 0.1f, 0.5f, 0.85f, 0.95f);
    cv::Mat1b below = thresholdChannel(ch, 0.85, ThresholdDirection::Below);
    EXPECT_EQ(below(0, 0), 255);
    EXPECT_EQ(below(0, 1), 255);
    EXPECT_EQ(below(0, 2), 0); // strict comparison
    EXPECT_EQ(below(0, 3), 0);
    cv::Mat1b above = thresholdChannel(ch, 0.5, ThresholdDirection::Above);
    EXPECT_EQ(above(0, 1), 0);
    EXPECT_EQ(above(0, 2), 255);
}

TEST(TissueMaskTest, ChannelSelectionAndScaling) {
    cv::Mat3b img(2, 2, cv::Vec3b(255, 0, 51));
    cv::Mat f = toUnitFloat(img);
    EXPECT_EQ(f.type(), CV_32FC3);
    cv::Mat1f c0 = selectChannel(f, 0);
    cv::Mat1f c2 = selectChannel(f, 2);
    EXPECT_FLOAT_EQ(c0(1, 1), 1.0f);
    EXPECT_FLOAT_EQ(c2(0, 0), 0.2f);
    EXPECT_THROW(selectChannel(f, 3), std::runtime_error);

    MaskParams mp;
    mp.channel = 1;
    mp.threshold = 0.5;
    cv::Mat1b mask = buildMask(f, mp);
    EXPECT_EQ(countForeground(mask), 4);
}

TEST(TissueMaskTest, InvalidParametersAreRejected) {
    MaskParams mp;
    mp.threshold = 1.5;
    EXPECT_THROW(mp.validate(), std::runtime_error);
    mp.threshold = 0.5;
    mp.connectivity = 6;
    EXPECT_THROW(mp.validate(), std::runtime_error);
    mp.connectivity = 4;
    mp.radius = -1;
    EXPECT_THROW(mp.validate(), std::runtime_error);
    EXPECT_THROW(cleanMask(cv::Mat1b(4, 4, uchar(0)), -1), std::runtime_error);
}

TEST(TissueMaskTest, OpeningRemovesSpecks) {
    cv::Mat1b mask(50, 50, uchar(0));
    mask(cv::Rect(10, 10, 20, 20)).setTo(255);
    mask(40, 40) = 255;
    cv::Mat1b opened = openMask(mask, 2);
    EXPECT_EQ(opened(40, 40), 0);
    EXPECT_EQ(opened(20, 20), 255);
    EXPECT_TRUE(subsetOf(opened, mask));
    EXPECT_TRUE(sameMask(openMask(mask, 0), mask));
}

TEST(TissueMaskTest, CleanupIsIdempotent) {
    for (uint64_t seed : {1u, 7u, 12345u}) {
        cv::Mat1b mask = randomMask(64, 64, seed);
        for (int32_t r : {1, 2, 3}) {
            cv::Mat1b once = cleanMask(mask, r);
            cv::Mat1b twice = cleanMask(once, r);
            EXPECT_TRUE(sameMask(once, twice)) << "seed " << seed << " radius " << r;
        }
    }
}

TEST(TissueMaskTest, OpeningShrinksClosingGrows) {
    cv::Mat1b mask = randomMask(48, 48, 99);
    for (int32_t r : {1, 2, 4}) {
        cv::Mat1b opened = openMask(mask, r);
        cv::Mat1b closed = closeMask(mask, r);
        EXPECT_TRUE(subsetOf(opened, mask));
        EXPECT_TRUE(subsetOf(mask, closed));
        EXPECT_TRUE(subsetOf(opened, cleanMask(mask, r)));
        EXPECT_LE(countForeground(opened), countForeground(mask));
        EXPECT_GE(countForeground(closed), countForeground(mask));
    }
}

TEST(TissueMaskTest, LabelsCoverForegroundExactly) {
    cv::Mat1b mask = cleanMask(randomMask(80, 80, 4242), 1);
    LabeledMask lm = labelComponents(mask, 8);
    std::set<int32_t> seen;
    for (int y = 0; y < mask.rows; ++y) {
        for (int x = 0; x < mask.cols; ++x) {
            const int32_t l = lm.labels(y, x);
            EXPECT_EQ(l > 0, mask(y, x) > 0);
            if (l > 0) seen.insert(l);
        }
    }
    EXPECT_EQ(seen.size(), lm.nRegions());
    int64_t total = 0;
    for (const auto& r : lm.regions) total += r.area;
    EXPECT_EQ(total, countForeground(mask));
}

TEST(TissueMaskTest, ConnectivityMatters) {
    cv::Mat1b mask(4, 4, uchar(0));
    mask(0, 0) = 255;
    mask(1, 1) = 255;
    EXPECT_EQ(labelComponents(mask, 8).nRegions(), 1u);
    EXPECT_EQ(labelComponents(mask, 4).nRegions(), 2u);
    EXPECT_THROW(labelComponents(mask, 5), std::runtime_error);
}

TEST(TissueMaskTest, SmallImageBelowMinimumAreaIsEmpty) {
    cv::Mat1b mask(10, 10, uchar(0));
    mask(cv::Rect(2, 2, 5, 5)).setTo(255);
    LabeledMask lm = labelComponents(mask, 8);
    ASSERT_EQ(lm.nRegions(), 1u);
    EXPECT_EQ(lm.regions[0].area, 25);

    RegionFilterParams fp;
    fp.minArea = 100;
    LabeledMask out = filterRegions(lm, fp);
    EXPECT_TRUE(out.regions.empty());
    EXPECT_EQ(cv::countNonZero(out.labels), 0);
}

TEST(TissueMaskTest, SmallBlobIsRemoved) {
    cv::Mat1b mask(20, 20, uchar(0));
    mask(cv::Rect(1, 1, 10, 5)).setTo(255);  // 50 pixels
    mask(cv::Rect(2, 15, 5, 1)).setTo(255);  // 5 pixels
    LabeledMask lm = labelComponents(mask, 8);
    ASSERT_EQ(lm.nRegions(), 2u);

    RegionFilterParams fp;
    fp.minArea = 10;
    LabeledMask out = filterRegions(lm, fp);
    ASSERT_EQ(out.nRegions(), 1u);
    EXPECT_EQ(out.regions[0].label, lm.labels(1, 1));
    EXPECT_EQ(out.regions[0].area, 50);
    EXPECT_EQ(out.labels(15, 3), 0);
}

TEST(TissueMaskTest, FilterKeepsExactlyTheSurvivors) {
    cv::Mat1b mask(40, 40, uchar(0));
    mask(cv::Rect(1, 1, 6, 6)).setTo(255);    // 36
    mask(cv::Rect(20, 1, 3, 3)).setTo(255);   // 9
    mask(cv::Rect(1, 20, 8, 8)).setTo(255);   // 64
    mask(cv::Rect(25, 25, 10, 10)).setTo(255); // 100
    LabeledMask lm = labelComponents(mask, 8);
    ASSERT_EQ(lm.nRegions(), 4u);

    RegionFilterParams fp;
    fp.minArea = 20;
    fp.excludeLabels.insert(lm.labels(21, 2));
    RegionDescriptor d;
    d.cx = 29.5;
    d.cy = 29.5;
    d.maxDist = 2;
    fp.excludeRegions.push_back(d);
    fp.excludeLabels.insert(77); // unknown label only warns

    LabeledMask out = filterRegions(lm, fp);
    for (const auto& r : lm.regions) {
        const bool expected = r.area >= 20 && r.label != lm.labels(21, 2) &&
                              !d.matches(r);
        EXPECT_EQ(out.find(r.label) != nullptr, expected) << "label " << r.label;
    }
    ASSERT_EQ(out.nRegions(), 1u);
    EXPECT_EQ(out.regions[0].area, 36);
}

TEST(TissueMaskTest, RegionDescriptorArea) {
    RegionStats r;
    r.area = 100;
    r.centroid = cv::Point2d(10, 10);
    RegionDescriptor d;
    d.cx = 11;
    d.cy = 10;
    EXPECT_TRUE(d.matches(r));
    d.area = 150;
    EXPECT_FALSE(d.matches(r));
    d.area = 110;
    EXPECT_TRUE(d.matches(r));
    d.maxDist = 0.5;
    EXPECT_FALSE(d.matches(r));
}

TEST(TissueMaskTest, ParseRegionDescriptor) {
    RegionDescriptor d;
    ASSERT_TRUE(parseRegionDescriptor("120.5,88", d));
    EXPECT_DOUBLE_EQ(d.cx, 120.5);
    EXPECT_DOUBLE_EQ(d.cy, 88);
    EXPECT_DOUBLE_EQ(d.maxDist, 10);
    EXPECT_LT(d.area, 0);

    RegionDescriptor e;
    ASSERT_TRUE(parseRegionDescriptor("1,2,3,400,0.1", e));
    EXPECT_DOUBLE_EQ(e.maxDist, 3);
    EXPECT_DOUBLE_EQ(e.area, 400);
    EXPECT_DOUBLE_EQ(e.areaTol, 0.1);

    RegionDescriptor f;
    EXPECT_FALSE(parseRegionDescriptor("1", f));
    EXPECT_FALSE(parseRegionDescriptor("a,b", f));
    EXPECT_FALSE(parseRegionDescriptor("1,2,-3", f));
    EXPECT_FALSE(parseRegionDescriptor("1,2,3,4,5,6", f));
}

TEST(HoleFillTest, EnclosedHoleIsFilled) {
    cv::Mat1i labels(12, 12, 0);
    labels(cv::Rect(1, 1, 10, 10)).setTo(3);
    labels(cv::Rect(2, 2, 8, 8)).setTo(0);
    cv::Mat1i filled = fillHoles(labels);
    EXPECT_EQ(filled(5, 5), 3);
    EXPECT_EQ(filled(0, 0), 0);
    EXPECT_EQ(cv::countNonZero(filled), 100);
}

TEST(HoleFillTest, OpenOrSharedHolesStay) {
    // the frame touches the image border on the left, so its inside is not a hole
    cv::Mat1i open(12, 12, 0);
    open(cv::Rect(0, 1, 10, 10)).setTo(1);
    open(cv::Rect(1, 2, 8, 8)).setTo(0);
    open(cv::Rect(0, 4, 1, 3)).setTo(0);
    EXPECT_EQ(fillHoles(open)(5, 5), 0);

    // background bordered by two labels
    cv::Mat1i shared(12, 12, 0);
    shared(cv::Rect(1, 1, 10, 10)).setTo(1);
    shared(cv::Rect(2, 2, 8, 8)).setTo(0);
    shared(5, 5) = 2;
    cv::Mat1i filled = fillHoles(shared);
    EXPECT_EQ(filled(3, 3), 0);
    EXPECT_EQ(filled(5, 5), 2);
}

TEST(HoleFillTest, BackgroundConnectivityComplementsForeground) {
    // frame with its top-left corner pixel missing: the inside reaches the
    // outside only through a diagonal step
    cv::Mat1i labels(12, 12, 0);
    labels(cv::Rect(1, 1, 10, 10)).setTo(1);
    labels(cv::Rect(2, 2, 8, 8)).setTo(0);
    labels(1, 1) = 0;
    EXPECT_EQ(fillHoles(labels, 8)(5, 5), 1);
    EXPECT_EQ(fillHoles(labels, 4)(5, 5), 0);
    EXPECT_EQ(fillHoles(labels, 4)(1, 1), 0);
    EXPECT_THROW(fillHoles(labels, 6), std::runtime_error);

    cv::Mat1b mask = (labels > 0);
    RegionFilterParams fp;
    fp.connectivity = 4;
    LabeledMask four = filterRegions(labelComponents(mask, 4), fp);
    ASSERT_EQ(four.nRegions(), 1u);
    EXPECT_EQ(four.labels(5, 5), 0);
    fp.connectivity = 8;
    LabeledMask eight = filterRegions(labelComponents(mask, 8), fp);
    EXPECT_EQ(eight.labels(5, 5), eight.regions[0].label);
}

TEST(HoleFillTest, DiagonalOwnersCountWithFourConnectedForeground) {
    // one background pixel, label 1 on its four sides and label 2 on a diagonal
    cv::Mat1i labels(7, 7, 1);
    labels(3, 3) = 0;
    labels(2, 2) = 2;
    EXPECT_EQ(fillHoles(labels, 8)(3, 3), 1);
    EXPECT_EQ(fillHoles(labels, 4)(3, 3), 0);
}

TEST(HoleFillTest, RemovedIslandLeavesFilledHole) {
    cv::Mat1b mask(14, 14, uchar(0));
    mask(cv::Rect(1, 1, 12, 12)).setTo(255);
    mask(cv::Rect(3, 3, 8, 8)).setTo(0);
    mask(6, 6) = 255;
    LabeledMask lm = labelComponents(mask, 8);
    ASSERT_EQ(lm.nRegions(), 2u);

    RegionFilterParams fp;
    fp.minArea = 5;
    LabeledMask out = filterRegions(lm, fp);
    ASSERT_EQ(out.nRegions(), 1u);
    EXPECT_EQ(out.labels(6, 6), out.regions[0].label);
    EXPECT_EQ(out.regions[0].area, 144);

    fp.fillHoles = false;
    LabeledMask unfilled = filterRegions(lm, fp);
    EXPECT_EQ(unfilled.labels(6, 6), 0);
}
