#include "coordframes.hpp"
#include "error.hpp"

PolygonSet<HiresPixelSpace> rasterToHires(const PolygonSet<RasterSpace>& in,
    int32_t height, YAxis yaxis) {
    if (yaxis == YAxis::Down) {
        return mapVertices<HiresPixelSpace>(in, [](const cv::Point2d& p) { return p; });
    }
    if (height <= 0) {
        error("%s: Raster height must be positive to flip the y axis, got %d", __func__, height);
    }
    const double top = static_cast<double>(height);
    return mapVertices<HiresPixelSpace>(in, [top](const cv::Point2d& p) {
        return cv::Point2d(p.x, top - p.y);
    });
}

PolygonSet<FullresPixelSpace> hiresToFullres(const PolygonSet<HiresPixelSpace>& in, const ScaleFactors& sf) {
    if (!(sf.tissue_hires_scalef > 0)) {
        error("%s: tissue_hires_scalef must be positive, got %g", __func__, sf.tissue_hires_scalef);
    }
    const double s = sf.tissue_hires_scalef;
    return mapVertices<FullresPixelSpace>(in, [s](const cv::Point2d& p) {
        return cv::Point2d(p.x / s, p.y / s);
    });
}

PolygonSet<HiresPixelSpace> fullresToHires(const PolygonSet<FullresPixelSpace>& in, const ScaleFactors& sf) {
    if (!(sf.tissue_hires_scalef > 0)) {
        error("%s: tissue_hires_scalef must be positive, got %g", __func__, sf.tissue_hires_scalef);
    }
    const double s = sf.tissue_hires_scalef;
    return mapVertices<HiresPixelSpace>(in, [s](const cv::Point2d& p) {
        return cv::Point2d(p.x * s, p.y * s);
    });
}
