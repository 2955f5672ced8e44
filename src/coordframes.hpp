#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "geometry.hpp"

/*
    Coordinate frames. A PolygonSet is tagged with the frame its vertices live in,
    and the functions below are the only way to move a set between frames.
      RasterSpace       pixel corners of the labeled mask, cell (col, row) spans [col, col+1] x [row, row+1]
      HiresPixelSpace   pixels of the hi-res image (Visium convention, y grows downward)
      FullresPixelSpace pixels of the full resolution image, hires = fullres * tissue_hires_scalef
*/
struct RasterSpace       { static constexpr const char* name = "raster"; };
struct HiresPixelSpace   { static constexpr const char* name = "hires_pixel"; };
struct FullresPixelSpace { static constexpr const char* name = "fullres_pixel"; };

template<typename Frame>
struct PolygonSet {
    using frame_type = Frame;
    std::vector<LabeledPolygon> polygons;

    size_t size() const { return polygons.size(); }
    bool empty() const { return polygons.empty(); }
    size_t nVertices() const {
        size_t n = 0;
        for (const auto& p : polygons) n += p.nVertices();
        return n;
    }
    Rectangle<double> bounds() const {
        Rectangle<double> box;
        for (const auto& p : polygons) box.extendToInclude(ringBounds(p.outer));
        return box;
    }
};

// Values from the Visium scalefactors_json.json
struct ScaleFactors {
    double tissue_hires_scalef = 0;
    double tissue_lowres_scalef = 0;
    double fiducial_diameter_fullres = 0;
    double spot_diameter_fullres = 0;
};

enum class YAxis : uint8_t { Down, Up };

template<typename To, typename From, typename F>
PolygonSet<To> mapVertices(const PolygonSet<From>& in, F f) {
    PolygonSet<To> out;
    out.polygons.reserve(in.polygons.size());
    for (const auto& poly : in.polygons) {
        LabeledPolygon q;
        q.label = poly.label;
        q.outer.reserve(poly.outer.size());
        for (const auto& p : poly.outer) q.outer.push_back(f(p));
        q.holes.reserve(poly.holes.size());
        for (const auto& h : poly.holes) {
            Ring r;
            r.reserve(h.size());
            for (const auto& p : h) r.push_back(f(p));
            q.holes.push_back(std::move(r));
        }
        out.polygons.push_back(std::move(q));
    }
    return out;
}

// YAxis::Down keeps the image convention; YAxis::Up flips the pixel-corner lattice so y = height - y
PolygonSet<HiresPixelSpace> rasterToHires(const PolygonSet<RasterSpace>& in,
    int32_t height, YAxis yaxis = YAxis::Down);

PolygonSet<FullresPixelSpace> hiresToFullres(const PolygonSet<HiresPixelSpace>& in, const ScaleFactors& sf);
PolygonSet<HiresPixelSpace> fullresToHires(const PolygonSet<FullresPixelSpace>& in, const ScaleFactors& sf);
