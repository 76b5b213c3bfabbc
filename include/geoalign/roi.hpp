#pragma once

#include <optional>
#include <vector>

#include <ogr_geometry.h>

#include "geoalign/geo_transform.hpp"

namespace geoalign {

// Corners are normalised: top_left holds the minimum x/y, bottom_right the maximum.
struct BoundingBox {
    Coord top_left;
    Coord bottom_right;
};

// Envelope of the geometry. Empty geometries throw GeometryError.
BoundingBox compute_bbox(const OGRGeometry& geometry);
// Box of half-widths (offsets[0], offsets[1]) centred on the geometry centroid.
// Throws InvalidOffsetError unless exactly two offsets are given.
BoundingBox compute_bbox(const OGRGeometry& geometry, const std::vector<double>& offsets);

struct CropSpec {
    std::optional<double> buffer;           // grow the geometry by this distance first
    std::optional<int> target_pixel_crop;   // fixed crop size, in pixels
    std::optional<double> target_real_crop; // fixed crop size, in geometry units
};

struct CropWindow {
    OGRPolygon roi;      // vertices in (tl, tr, br, bl) order
    Coord top_left;
    Coord bottom_right;
    int width;
    int height;
};

// Pixel-aligned crop window around a geometry. The pixel grid has a zero origin
// with the given resolution and skew, so only relative placement matters.
// Throws GeometryError when the (buffered) geometry is empty or the window
// does not fit int pixel indices.
CropWindow compute_crop_window(const OGRGeometry& geometry, const Coord& pixel_size, const Coord& skew,
                               const CropSpec& spec = {});

} // namespace geoalign
