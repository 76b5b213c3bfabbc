#include <gtest/gtest.h>
#include "geoalign/roi.hpp"
#include "geoalign/errors.hpp"
#include "geoalign/geometry.hpp"

class CropWindowTest : public ::testing::Test {
protected:
    geoalign::Coord unit_pixels{1.0, 1.0};
    geoalign::Coord no_skew{0.0, 0.0};

    static OGRPolygon rectangle(double min_x, double min_y, double max_x, double max_y) {
        return geoalign::make_polygon(std::vector<geoalign::Coord>{
            {min_x, max_y}, {min_x, min_y}, {max_x, min_y}, {max_x, max_y}});
    }

    static geoalign::CropSpec pixel_crop(int size) {
        geoalign::CropSpec spec;
        spec.target_pixel_crop = size;
        return spec;
    }
};

TEST_F(CropWindowTest, NaturalBoundingBox) {
    auto box = geoalign::compute_bbox(rectangle(2, 3, 12, 8));

    EXPECT_EQ(box.top_left, geoalign::Coord(2, 3));
    EXPECT_EQ(box.bottom_right, geoalign::Coord(12, 8));
}

TEST_F(CropWindowTest, CentroidOffsets) {
    auto box = geoalign::compute_bbox(rectangle(0, 0, 10, 10), {2.0, 3.0});

    EXPECT_EQ(box.top_left, geoalign::Coord(3, 2));
    EXPECT_EQ(box.bottom_right, geoalign::Coord(7, 8));
}

TEST_F(CropWindowTest, OffsetsMustBeTwoDimensional) {
    auto polygon = rectangle(0, 0, 10, 10);

    EXPECT_THROW(geoalign::compute_bbox(polygon, {1.0, 2.0, 3.0}), geoalign::InvalidOffsetError);
    EXPECT_THROW(geoalign::compute_bbox(polygon, std::vector<double>{}), geoalign::InvalidOffsetError);
    EXPECT_THROW(geoalign::compute_bbox(polygon, {1.0}), geoalign::InvalidOffsetError);
}

TEST_F(CropWindowTest, NaturalWindowSnapsOutward) {
    auto window = geoalign::compute_crop_window(rectangle(0.5, 1.5, 9.2, 4.7), unit_pixels, no_skew);

    EXPECT_EQ(window.width, 10);
    EXPECT_EQ(window.height, 4);
    EXPECT_EQ(window.top_left, geoalign::Coord(0, 1));
    EXPECT_EQ(window.bottom_right, geoalign::Coord(10, 5));
}

TEST_F(CropWindowTest, RoiVerticesRunTopLeftClockwise) {
    auto window = geoalign::compute_crop_window(rectangle(0.5, 1.5, 9.2, 4.7), unit_pixels, no_skew);
    auto ring = geoalign::exterior_ring(window.roi);

    ASSERT_EQ(ring.size(), 5u);
    EXPECT_EQ(ring[0], window.top_left);
    EXPECT_EQ(ring[1], geoalign::Coord(window.bottom_right.first, window.top_left.second));
    EXPECT_EQ(ring[2], window.bottom_right);
    EXPECT_EQ(ring[3], geoalign::Coord(window.top_left.first, window.bottom_right.second));
}

TEST_F(CropWindowTest, FixedPixelCropIgnoresShape) {
    std::vector<OGRPolygon> shapes = {
        rectangle(500000, 3999000, 500001, 3999001),
        rectangle(500123.4, 3999456.7, 502000.1, 3999460.2),
        rectangle(-17.3, -4.2, 33.9, 80.1),
    };
    std::vector<geoalign::Coord> resolutions = {{10.0, -10.0}, {0.3378, -0.4073}, {2.5, 2.5}};

    for (const auto& shape : shapes) {
        for (const auto& resolution : resolutions) {
            auto window = geoalign::compute_crop_window(shape, resolution, no_skew, pixel_crop(64));

            EXPECT_EQ(window.width, 64);
            EXPECT_EQ(window.height, 64);
            EXPECT_NEAR(window.bottom_right.first - window.top_left.first, 64 * resolution.first, 1e-6);
            EXPECT_NEAR(window.bottom_right.second - window.top_left.second, 64 * resolution.second, 1e-6);
        }
    }
}

TEST_F(CropWindowTest, RealCropCentredOnGeometry) {
    geoalign::CropSpec spec;
    spec.target_real_crop = 20.0;

    auto window = geoalign::compute_crop_window(rectangle(0, 0, 10, 10), unit_pixels, no_skew, spec);

    EXPECT_EQ(window.width, 20);
    EXPECT_EQ(window.height, 20);
    EXPECT_EQ(window.top_left, geoalign::Coord(-5, -5));
}

TEST_F(CropWindowTest, ZeroAreaGeometryClampedToOnePixel) {
    OGRPoint point(3.0, 4.0);

    auto window = geoalign::compute_crop_window(point, unit_pixels, no_skew);

    EXPECT_GE(window.width, 1);
    EXPECT_GE(window.height, 1);
}

TEST_F(CropWindowTest, NorthUpNaturalWindowKeepsPositiveSize) {
    auto window = geoalign::compute_crop_window(rectangle(0, 0, 10, 10), {1.0, -1.0}, no_skew);

    EXPECT_EQ(window.width, 10);
    EXPECT_GE(window.height, 1);
}

TEST_F(CropWindowTest, BufferWidensWindow) {
    auto polygon = rectangle(0, 0, 10, 10);
    geoalign::CropSpec spec;
    spec.buffer = 2.0;

    auto plain = geoalign::compute_crop_window(polygon, unit_pixels, no_skew);
    auto buffered = geoalign::compute_crop_window(polygon, unit_pixels, no_skew, spec);

    EXPECT_GT(buffered.width, plain.width);
    EXPECT_GT(buffered.height, plain.height);
    EXPECT_LE(buffered.top_left.first, -2.0);
}

TEST_F(CropWindowTest, EmptyGeometryRejected) {
    OGRPolygon empty;

    EXPECT_THROW(geoalign::compute_bbox(empty), geoalign::GeometryError);
    EXPECT_THROW(geoalign::compute_bbox(empty, {1.0, 1.0}), geoalign::GeometryError);
    EXPECT_THROW(geoalign::compute_crop_window(empty, unit_pixels, no_skew), geoalign::GeometryError);
    EXPECT_THROW(geoalign::compute_crop_window(empty, unit_pixels, no_skew, pixel_crop(64)), geoalign::GeometryError);
}

TEST_F(CropWindowTest, NegativeBufferErasingGeometryRejected) {
    geoalign::CropSpec spec;
    spec.buffer = -5.0;

    EXPECT_THROW(geoalign::compute_crop_window(rectangle(0, 0, 1, 1), unit_pixels, no_skew, spec),
                 geoalign::GeometryError);
}

TEST_F(CropWindowTest, WindowBeyondPixelRangeRejected) {
    // 1e12 map units at 1e-3 per pixel is far past the int range.
    EXPECT_THROW(geoalign::compute_crop_window(rectangle(0, 0, 1e12, 1), {1e-3, 1e-3}, no_skew),
                 geoalign::GeometryError);
}

TEST_F(CropWindowTest, AmbiguousCropRejected) {
    geoalign::CropSpec spec;
    spec.target_pixel_crop = 64;
    spec.target_real_crop = 100.0;

    EXPECT_THROW(geoalign::compute_crop_window(rectangle(0, 0, 1, 1), unit_pixels, no_skew, spec),
                 geoalign::AmbiguousCropSpecError);
}

TEST_F(CropWindowTest, NonPositiveCropRejected) {
    auto polygon = rectangle(0, 0, 1, 1);
    geoalign::CropSpec real;
    real.target_real_crop = -5.0;

    EXPECT_THROW(geoalign::compute_crop_window(polygon, unit_pixels, no_skew, pixel_crop(0)),
                 geoalign::InvalidCropSizeError);
    EXPECT_THROW(geoalign::compute_crop_window(polygon, unit_pixels, no_skew, real),
                 geoalign::InvalidCropSizeError);
}
