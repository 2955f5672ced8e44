#include "tissueseg.h"
#include "tissuesegmenter.hpp"
#include <thread>

/*
    Input:
        --in-image       hi-res tissue image (tissue_hires_image.png)
        --scalefactors   scalefactors_json.json
        --spots          tissue_positions.csv or tissue_positions_list.csv
    Output (prefix --out):
        .regions.tsv, .polygons_full.geojson, .polygons_simplified.geojson,
        .tissue_boundary.geojson, .spots.tsv, and the masks with --write-masks
*/

int32_t cmdSegmentTissue(int32_t argc, char** argv) {
    std::string inImage, scaleFile, spotFile, outPrefix;
    int32_t channel = 0;
    double threshold = 0.85;
    bool above = false;
    int32_t radius = 5;
    int32_t connectivity = 8;
    int64_t minArea = 0;
    std::vector<int32_t> excludeLabels;
    std::vector<std::string> excludeRegions;
    bool noFillHoles = false;
    double keep = 0.05;
    bool yUp = false;
    int32_t spotVertices = 64;
    double spotDiameter = -1;
    int32_t threads = 1;
    bool writeMasks = false;
    int32_t debug_ = 0;

    ParamList pl;
    // Input options
    pl.add_option("in-image", "Hi-res tissue image", inImage, true)
      .add_option("scalefactors", "Scale factor JSON (tissue_hires_scalef, tissue_lowres_scalef, fiducial_diameter_fullres, spot_diameter_fullres)", scaleFile, true)
      .add_option("spots", "Spot positions CSV (barcode,in_tissue,array_row,array_col,pxl_row_in_fullres,pxl_col_in_fullres)", spotFile, true);
    // Mask options
    pl.add_option("channel", "Channel used for thresholding, 0-based in RGB order", channel)
      .add_option("threshold", "Intensity threshold in [0,1]", threshold)
      .add_option("above", "Tissue is brighter than the threshold (default: darker)", above)
      .add_option("radius", "Radius of the disc used for opening and closing (0 to disable)", radius)
      .add_option("connectivity", "Pixel connectivity for labeling (4 or 8)", connectivity);
    // Region filter options
    pl.add_option("min-area", "Remove regions with fewer pixels", minArea)
      .add_option("exclude-labels", "Region labels to remove (valid only for this image and these parameters)", excludeLabels)
      .add_option("exclude-regions", "Regions to remove given as cx,cy[,max_dist[,area[,area_tol]]] in hi-res pixels", excludeRegions)
      .add_option("no-fill-holes", "Do not fill holes enclosed by a single region", noFillHoles);
    // Polygon options
    pl.add_option("keep", "Fraction of polygon vertices kept by simplification, (0,1]", keep)
      .add_option("y-up", "Flip rows so polygon y grows upward (spot positions must use the same convention)", yUp);
    // Spot options
    pl.add_option("spot-vertices", "Number of vertices of each spot footprint polygon", spotVertices)
      .add_option("spot-diameter", "Spot diameter in full resolution pixels (default: spot_diameter_fullres)", spotDiameter)
      .add_option("threads", "Number of threads to use", threads);
    // Output
    pl.add_option("out", "Output prefix", outPrefix, true)
      .add_option("write-masks", "Write the threshold, cleaned and filtered masks as PNG", writeMasks)
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
    if (!checkOutputWritable(outPrefix + ".regions.tsv"))
        error("Output prefix is not writable: %s", outPrefix.c_str());

    int32_t nThreads = static_cast<int32_t>(std::thread::hardware_concurrency());
    if (nThreads <= 0 || nThreads >= threads) {
        nThreads = threads;
    }

    SegmenterParams params;
    params.mask.channel = channel;
    params.mask.threshold = threshold;
    params.mask.direction = above ? ThresholdDirection::Above : ThresholdDirection::Below;
    params.mask.radius = radius;
    params.mask.connectivity = connectivity;
    params.filter.minArea = minArea;
    params.filter.excludeLabels.insert(excludeLabels.begin(), excludeLabels.end());
    for (const auto& s : excludeRegions) {
        RegionDescriptor d;
        if (!parseRegionDescriptor(s, d)) {
            error("Invalid --exclude-regions entry: %s", s.c_str());
        }
        params.filter.excludeRegions.push_back(d);
    }
    params.filter.fillHoles = !noFillHoles;
    params.polygon.keep = keep;
    params.polygon.yaxis = yUp ? YAxis::Up : YAxis::Down;
    params.spotVertices = spotVertices;
    params.spotDiameter = spotDiameter;
    params.threads = nThreads;
    if (!excludeLabels.empty()) {
        warning("--exclude-labels refers to labels of this run only; prefer --exclude-regions for reusable settings");
    }

    // Everything is validated before the pipeline starts
    TissueSegmenter segmenter(params);
    ScaleFactors sf = loadScaleFactors(scaleFile);
    SpotTable spots = loadSpotTable(spotFile);
    cv::Mat image = loadImage(inImage);

    segmenter.segment(image);
    segmenter.compare(spots, sf);
    segmenter.writeOutputs(outPrefix, writeMasks);
    if (!segmenter.scaleConsistent()) {
        warning("Tissue boundary and spot positions may not share a coordinate frame, check --scalefactors and --y-up");
    }
    return 0;
}
