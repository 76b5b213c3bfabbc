#include "geoalign/roi.hpp"
#include "geoalign/errors.hpp"
#include "geoalign/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace geoalign {

namespace {
BoundingBox normalized(const Coord& a, const Coord& b) {
    return {{std::min(a.first, b.first), std::min(a.second, b.second)},
            {std::max(a.first, b.first), std::max(a.second, b.second)}};
}

void require_non_empty(const OGRGeometry& geometry) {
    if (geometry.IsEmpty()) {
        throw GeometryError(std::string("cannot bound an empty ") + geometry.getGeometryName());
    }
}

double checked_pixel(double value, const char* what) {
    if (!std::isfinite(value) || std::fabs(value) > std::numeric_limits<int>::max()) {
        throw GeometryError(std::string("crop window ") + what + " is out of the pixel range: " +
                            std::to_string(value));
    }
    return value;
}

int pixel_span(double from, double to, const char* what) {
    return std::max(static_cast<int>(checked_pixel(to - from, what)), 1);
}

void validate(const CropSpec& spec) {
    if (spec.target_pixel_crop && spec.target_real_crop) {
        throw AmbiguousCropSpecError("should provide at most one type of crop resolution");
    }
    if (spec.target_pixel_crop && *spec.target_pixel_crop <= 0) {
        throw InvalidCropSizeError("pixel crop size must be positive, got " + std::to_string(*spec.target_pixel_crop));
    }
    if (spec.target_real_crop && !(*spec.target_real_crop > 0.0 && std::isfinite(*spec.target_real_crop))) {
        throw InvalidCropSizeError("real crop size must be positive, got " + std::to_string(*spec.target_real_crop));
    }
}
}

BoundingBox compute_bbox(const OGRGeometry& geometry) {
    require_non_empty(geometry);
    OGREnvelope envelope = bounds(geometry);
    return normalized({envelope.MinX, envelope.MaxY}, {envelope.MaxX, envelope.MinY});
}

BoundingBox compute_bbox(const OGRGeometry& geometry, const std::vector<double>& offsets) {
    if (offsets.size() != 2) {
        throw InvalidOffsetError("offsets must be 2d, got " + std::to_string(offsets.size()) + " values");
    }
    require_non_empty(geometry);
    auto [cx, cy] = centroid(geometry);
    return normalized({cx - offsets[0], cy + offsets[1]}, {cx + offsets[0], cy - offsets[1]});
}

CropWindow compute_crop_window(const OGRGeometry& geometry, const Coord& pixel_size, const Coord& skew,
                               const CropSpec& spec) {
    validate(spec);

    GeometryPtr buffered;
    const OGRGeometry* shape = &geometry;
    if (spec.buffer) {
        buffered = buffer(geometry, *spec.buffer);
        shape = buffered.get();
    }
    require_non_empty(*shape);

    GeoTransform local = GeoTransform::from_parts(0.0, pixel_size.first, skew.first,
                                                  0.0, skew.second, pixel_size.second);

    BoundingBox box;
    if (spec.target_pixel_crop) {
        auto [x_extent, y_extent] = local.geo_of_pixel(*spec.target_pixel_crop, *spec.target_pixel_crop);
        box = compute_bbox(*shape, {std::abs(x_extent / 2), std::abs(y_extent / 2)});
    } else if (spec.target_real_crop) {
        double half = *spec.target_real_crop / 2;
        box = compute_bbox(*shape, {half, half});
    } else {
        box = compute_bbox(*shape);
    }

    // Pixel indices are inclusive from the top-left corner.
    auto [tl_col_real, tl_row_real] = local.pixel_of_geo(box.top_left.first, box.top_left.second);
    double tl_col = checked_pixel(std::floor(tl_col_real), "left column");
    double tl_row = checked_pixel(std::floor(tl_row_real), "top row");

    double br_col, br_row;
    int width, height;
    if (spec.target_pixel_crop) {
        width = height = *spec.target_pixel_crop;
        br_col = tl_col + width;
        br_row = tl_row + height;
    } else {
        auto [br_col_real, br_row_real] = local.pixel_of_geo(box.bottom_right.first, box.bottom_right.second);
        br_col = checked_pixel(std::ceil(br_col_real), "right column");
        br_row = checked_pixel(std::ceil(br_row_real), "bottom row");
        // Deltas go negative when a resolution is negative; clamp rather than reject.
        width = pixel_span(tl_col, br_col, "width");
        height = pixel_span(tl_row, br_row, "height");
    }

    Coord top_left = local.geo_of_pixel(tl_col, tl_row);
    Coord bottom_right = local.geo_of_pixel(br_col, br_row);
    OGRPolygon roi = make_polygon(std::vector<Coord>{
        top_left,
        {bottom_right.first, top_left.second},
        bottom_right,
        {top_left.first, bottom_right.second}
    });
    return CropWindow{roi, top_left, bottom_right, width, height};
}

} // namespace geoalign
