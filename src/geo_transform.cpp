#include "geoalign/geo_transform.hpp"
#include "geoalign/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace geoalign {

namespace {
constexpr double DETERMINANT_EPS = 1e-12;

std::string describe(const std::array<double, 6>& c) {
    std::ostringstream oss;
    oss << "(" << c[0] << ", " << c[1] << ", " << c[2] << ", "
        << c[3] << ", " << c[4] << ", " << c[5] << ")";
    return oss.str();
}
}

GeoTransform::GeoTransform(const std::array<double, 6>& c)
    : origin_x_(c[0])
    , res_x_(c[1])
    , skew_x_(c[2])
    , origin_y_(c[3])
    , skew_y_(c[4])
    , res_y_(c[5]) {}

GeoTransform GeoTransform::from_gdal(const std::array<double, 6>& coefficients) {
    if (coefficients[1] == 0.0 || coefficients[5] == 0.0) {
        throw DegenerateTransformError("geotransform has zero pixel resolution: " + describe(coefficients));
    }
    for (double c : coefficients) {
        if (!std::isfinite(c)) {
            throw DegenerateTransformError("geotransform has non-finite coefficient: " + describe(coefficients));
        }
    }
    return GeoTransform(coefficients);
}

GeoTransform GeoTransform::from_parts(double origin_x, double res_x, double skew_x,
                                      double origin_y, double skew_y, double res_y) {
    return from_gdal({origin_x, res_x, skew_x, origin_y, skew_y, res_y});
}

Coord GeoTransform::geo_of_pixel(double col, double row) const {
    return {origin_x_ + col * res_x_ + row * skew_x_,
            origin_y_ + col * skew_y_ + row * res_y_};
}

Coord GeoTransform::pixel_of_geo(double x, double y) const {
    double det = determinant();
    // Relative to the magnitude of the linear part so tiny-degree grids still invert.
    double scale = std::max({std::abs(res_x_ * res_y_), std::abs(skew_x_ * skew_y_), 1e-300});
    if (std::abs(det) <= DETERMINANT_EPS * scale) {
        throw DegenerateTransformError("geotransform is not invertible: " + describe(coefficients()));
    }
    double dx = x - origin_x_;
    double dy = y - origin_y_;
    double col = (res_y_ * dx - skew_x_ * dy) / det;
    double row = (-skew_y_ * dx + res_x_ * dy) / det;
    return {col, row};
}

std::array<Coord, 4> GeoTransform::extent_of_window(double col, double row, double width, double height) const {
    return {
        geo_of_pixel(col, row),
        geo_of_pixel(col, row + height),
        geo_of_pixel(col + width, row + height),
        geo_of_pixel(col + width, row)
    };
}

GeoTransform GeoTransform::with_zero_origin() const {
    return GeoTransform({0.0, res_x_, skew_x_, 0.0, skew_y_, res_y_});
}

std::array<double, 6> GeoTransform::coefficients() const {
    return {origin_x_, res_x_, skew_x_, origin_y_, skew_y_, res_y_};
}

} // namespace geoalign
