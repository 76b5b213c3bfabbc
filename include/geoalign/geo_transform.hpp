#pragma once

#include <array>
#include <utility>

namespace geoalign {

// (x, y) in geo space or (col, row) in pixel space.
using Coord = std::pair<double, double>;

// GDAL-ordered affine map from pixel (col, row) to geo (x, y):
//   x = origin_x + col * res_x + row * skew_x
//   y = origin_y + col * skew_y + row * res_y
class GeoTransform {
public:
    // Throws DegenerateTransformError if either resolution is zero.
    static GeoTransform from_gdal(const std::array<double, 6>& coefficients);
    static GeoTransform from_parts(double origin_x, double res_x, double skew_x,
                                   double origin_y, double skew_y, double res_y);

    Coord geo_of_pixel(double col, double row) const;
    // Throws DegenerateTransformError when the map is not invertible.
    Coord pixel_of_geo(double x, double y) const;

    // Corners of a pixel window, always in [top_left, bottom_left, bottom_right, top_right] order.
    std::array<Coord, 4> extent_of_window(double col, double row, double width, double height) const;

    // Same resolution and skew, origin moved to (0, 0).
    GeoTransform with_zero_origin() const;

    std::array<double, 6> coefficients() const;
    double determinant() const { return res_x_ * res_y_ - skew_x_ * skew_y_; }

    double origin_x() const { return origin_x_; }
    double origin_y() const { return origin_y_; }
    double res_x() const { return res_x_; }
    double res_y() const { return res_y_; }
    double skew_x() const { return skew_x_; }
    double skew_y() const { return skew_y_; }

private:
    GeoTransform(const std::array<double, 6>& coefficients);

    double origin_x_;
    double res_x_;
    double skew_x_;
    double origin_y_;
    double skew_y_;
    double res_y_;
};

// Free-function forms used throughout the parsers.
inline Coord geo_of_pixel(const GeoTransform& gt, double col, double row) {
    return gt.geo_of_pixel(col, row);
}

inline Coord pixel_of_geo(const GeoTransform& gt, double x, double y) {
    return gt.pixel_of_geo(x, y);
}

inline std::array<Coord, 4> extent_of_window(const GeoTransform& gt, double col, double row,
                                             double width, double height) {
    return gt.extent_of_window(col, row, width, height);
}

} // namespace geoalign
