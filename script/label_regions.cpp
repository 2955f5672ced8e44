#include "tissueseg.h"
#include "tissuesegmenter.hpp"
#include <opencv2/imgcodecs.hpp>

// Stages up to connected-component labeling; the region table and the label
// image are used to pick --exclude-regions for segment-tissue
int32_t cmdLabelRegions(int32_t argc, char** argv) {
    std::string inImage, outPrefix;
    int32_t channel = 0;
    double threshold = 0.85;
    bool above = false;
    int32_t radius = 5;
    int32_t connectivity = 8;
    int32_t debug_ = 0;

    ParamList pl;
    pl.add_option("in-image", "Hi-res tissue image", inImage, true)
      .add_option("channel", "Channel used for thresholding, 0-based in RGB order", channel)
      .add_option("threshold", "Intensity threshold in [0,1]", threshold)
      .add_option("above", "Tissue is brighter than the threshold (default: darker)", above)
      .add_option("radius", "Radius of the disc used for opening and closing (0 to disable)", radius)
      .add_option("connectivity", "Pixel connectivity for labeling (4 or 8)", connectivity);
    pl.add_option("out", "Output prefix", outPrefix, true)
      .add_option("debug", "Debug", debug_);

    try {
        pl.readArgs(argc, argv);
        if (pl.help_requested()) return 0;
        pl.print_options();
    } catch (const std::exception &ex) {
        std::cerr << "Error parsing options: " << ex.what() << "\n";
        pl.print_help();
        return 1;
    }
    if (debug_ > 0) {
        logger::Logger::getInstance().setLevel(logger::LogLevel::DEBUG);
    }

    MaskParams mp;
    mp.channel = channel;
    mp.threshold = threshold;
    mp.direction = above ? ThresholdDirection::Above : ThresholdDirection::Below;
    mp.radius = radius;
    mp.connectivity = connectivity;
    mp.validate();

    cv::Mat image = loadImage(inImage);
    cv::Mat1b mask = cleanMask(buildMask(image, mp), mp.radius);
    LabeledMask labeled = labelComponents(mask, mp.connectivity);
    writeRegionTable(outPrefix + ".regions.tsv", labeled, nullptr);

    if (labeled.nRegions() > 65535) {
        warning("%s: %zu regions, labels above 65535 are clipped in the label image", __func__, labeled.nRegions());
    }
    cv::Mat labels16;
    labeled.labels.convertTo(labels16, CV_16U);
    std::string outLabels = outPrefix + ".labels.png";
    if (!cv::imwrite(outLabels, labels16)) {
        error("%s: Error writing %s", __func__, outLabels.c_str());
    }
    writeMaskImage(outPrefix + ".mask_clean.png", mask);
    notice("%s: Wrote label image to %s", __func__, outLabels.c_str());
    return 0;
}
