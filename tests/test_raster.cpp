#include <gtest/gtest.h>
#include "geoalign/raster.hpp"
#include "geoalign/errors.hpp"
#include "geoalign/path_lock.hpp"

#include <cstdio>
#include <fstream>

#include <gdal_priv.h>
#include <ogr_spatialref.h>

class RasterParserTest : public ::testing::Test {
protected:
    std::string base;
    std::vector<std::string> created;

    void SetUp() override {
        GDALAllRegister();
        base = std::string("/tmp/geoalign_") + ::testing::UnitTest::GetInstance()->current_test_info()->name();
    }

    void TearDown() override {
        for (const auto& path : created) {
            std::remove(path.c_str());
            std::remove((path + ".aux.xml").c_str());
            std::remove(geoalign::reprojected_path_for(path).c_str());
        }
    }

    std::string write_raster(const std::string& name, std::array<double, 6> transform, int epsg,
                             int bands = 1, GDALDataType type = GDT_Byte, int cols = 100, int rows = 100) {
        std::string path = base + "_" + name + ".tif";
        GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
        GDALDataset* dataset = driver->Create(path.c_str(), cols, rows, bands, type, nullptr);
        EXPECT_NE(dataset, nullptr);
        dataset->SetGeoTransform(transform.data());
        if (epsg) {
            OGRSpatialReference srs;
            srs.importFromEPSG(epsg);
            dataset->SetSpatialRef(&srs);
        }
        GDALClose(dataset);
        created.push_back(path);
        return path;
    }

    std::string write_mixed_band_vrt() {
        std::string path = base + "_mixed.vrt";
        std::ofstream vrt(path);
        vrt << R"(<VRTDataset rasterXSize="10" rasterYSize="10">
  <SRS>EPSG:32618</SRS>
  <GeoTransform>500000, 10, 0, 4000000, 0, -10</GeoTransform>
  <VRTRasterBand dataType="Byte" band="1"/>
  <VRTRasterBand dataType="Float32" band="2"/>
</VRTDataset>)";
        vrt.close();
        created.push_back(path);
        return path;
    }

    static std::array<double, 6> utm(double origin_x, double origin_y) {
        return {origin_x, 10.0, 0.0, origin_y, 0.0, -10.0};
    }
};

TEST_F(RasterParserTest, ExtractsMetadata) {
    auto path = write_raster("a", utm(500000, 4000000), 32618, 3);

    auto batch = geoalign::parse_rasters({path});

    ASSERT_EQ(batch.records.size(), 1u);
    const auto& record = batch.records[0];
    EXPECT_EQ(record.file_path, path);
    EXPECT_EQ(record.cols, 100);
    EXPECT_EQ(record.rows, 100);
    EXPECT_EQ(record.band_count, 3);
    EXPECT_EQ(record.data_type, GDT_Byte);
    EXPECT_EQ(record.dtype(), "uint8");
    EXPECT_EQ(record.pixel_size(), 1u);
    EXPECT_EQ(record.resolution, geoalign::Coord(10.0, -10.0));
    EXPECT_EQ(record.skew, geoalign::Coord(0.0, 0.0));
    EXPECT_EQ(record.srs.epsg_code(), 32618);
    EXPECT_FALSE(record.reprojected_path.has_value());

    EXPECT_EQ(record.extent[0], geoalign::Coord(500000.0, 4000000.0));
    EXPECT_EQ(record.extent[1], geoalign::Coord(500000.0, 3999000.0));
    EXPECT_EQ(record.extent[2], geoalign::Coord(501000.0, 3999000.0));
    EXPECT_EQ(record.extent[3], geoalign::Coord(501000.0, 4000000.0));

    EXPECT_DOUBLE_EQ(record.offset_geotransform.origin_x(), 0.0);
    EXPECT_DOUBLE_EQ(record.offset_geotransform.res_y(), -10.0);

    EXPECT_TRUE(record.local_roi.Equals(&record.target_roi));
    EXPECT_NEAR(geoalign::area(*batch.coverage), 1e6, 1e-3);
}

TEST_F(RasterParserTest, LocalRoiFollowsExtentOrder) {
    auto path = write_raster("a", utm(500000, 4000000), 32618);

    auto batch = geoalign::parse_rasters({path});
    auto ring = geoalign::exterior_ring(batch.records[0].local_roi);

    ASSERT_EQ(ring.size(), 5u);
    for (size_t i = 0; i < 4; i++) EXPECT_EQ(ring[i], batch.records[0].extent[i]);
}

TEST_F(RasterParserTest, SkipsPriorReprojectionOutputs) {
    auto path = write_raster("a", utm(500000, 4000000), 32618);

    auto batch = geoalign::parse_rasters({path, geoalign::reprojected_path_for(path)});

    EXPECT_EQ(batch.records.size(), 1u);
}

TEST_F(RasterParserTest, UnreadableFileAbortsBatch) {
    auto path = write_raster("a", utm(500000, 4000000), 32618);

    EXPECT_THROW(geoalign::parse_rasters({path, base + "_missing.tif"}), geoalign::RasterOpenError);
}

TEST_F(RasterParserTest, MixedBandTypesRejected) {
    auto path = write_mixed_band_vrt();

    EXPECT_THROW(geoalign::parse_rasters({path}), geoalign::MixedBandTypeError);
}

TEST_F(RasterParserTest, MissingSrsNeedsTarget) {
    auto path = write_raster("nosrs", utm(500000, 4000000), 0);

    EXPECT_THROW(geoalign::parse_rasters({path}), geoalign::MissingSRSError);

    auto target = geoalign::Srs::from_epsg(32618);
    auto batch = geoalign::parse_rasters({path}, target, false);
    ASSERT_EQ(batch.records.size(), 1u);
    EXPECT_TRUE(batch.records[0].srs.is_same(target));
    EXPECT_TRUE(batch.records[0].local_roi.Equals(&batch.records[0].target_roi));
}

TEST_F(RasterParserTest, CoverageMergesAdjacentRasters) {
    auto a = write_raster("a", utm(500000, 4000000), 32618);
    auto b = write_raster("b", utm(501000, 4000000), 32618);

    auto batch = geoalign::parse_rasters({a, b});

    EXPECT_EQ(wkbFlatten(batch.coverage->getGeometryType()), wkbPolygon);
    EXPECT_NEAR(geoalign::area(*batch.coverage), 2e6, 1e-3);
}

TEST_F(RasterParserTest, CoverageKeepsDisjointRastersApart) {
    auto a = write_raster("a", utm(500000, 4000000), 32618);
    auto b = write_raster("b", utm(600000, 4000000), 32618);

    auto batch = geoalign::parse_rasters({a, b});

    EXPECT_EQ(wkbFlatten(batch.coverage->getGeometryType()), wkbMultiPolygon);
    EXPECT_NEAR(geoalign::area(*batch.coverage), 2e6, 1e-3);
}

TEST_F(RasterParserTest, CoverageNeverShrinks) {
    auto a = write_raster("a", utm(500000, 4000000), 32618);
    auto b = write_raster("b", utm(500500, 3999500), 32618);
    auto c = write_raster("c", utm(500200, 3999800), 32618);

    double one = geoalign::area(*geoalign::parse_rasters({a}).coverage);
    double two = geoalign::area(*geoalign::parse_rasters({a, b}).coverage);
    double three = geoalign::area(*geoalign::parse_rasters({a, b, c}).coverage);

    EXPECT_GE(two, one);
    EXPECT_GE(three, two);
    EXPECT_NEAR(two, 1e6 + 1e6 - 500.0 * 500.0, 1e-3);
}

TEST_F(RasterParserTest, TargetSrsReprojectsRoiOnly) {
    auto path = write_raster("a", utm(500000, 4000000), 32618);

    auto batch = geoalign::parse_rasters({path}, geoalign::Srs::from_epsg(4326), false);

    const auto& record = batch.records[0];
    EXPECT_EQ(record.srs.epsg_code(), 32618);
    EXPECT_FALSE(record.reprojected_path.has_value());
    auto local = geoalign::bounds(record.local_roi);
    EXPECT_DOUBLE_EQ(local.MinX, 500000.0);
    // Easting 500000 sits on the zone 18 central meridian.
    auto target = geoalign::bounds(record.target_roi);
    EXPECT_NEAR(target.MinX, -75.0, 1e-6);
    EXPECT_GT(target.MaxY, 36.0);
    EXPECT_LT(target.MaxY, 36.2);
}

TEST_F(RasterParserTest, ReprojectionIsWrittenOnceAndReused) {
    auto path = write_raster("a", utm(500000, 4000000), 32618, 1, GDT_Float32, 20, 20);
    auto target = geoalign::Srs::from_epsg(32617);
    geoalign::PathLockRegistry locks;
    geoalign::RasterParseOptions options;
    options.target_srs = target;
    options.reproject = true;
    options.locks = &locks;

    auto batch = geoalign::parse_rasters({path}, options);

    ASSERT_TRUE(batch.records[0].reprojected_path.has_value());
    std::string output = *batch.records[0].reprojected_path;
    EXPECT_EQ(output, path + ".reproj.tif");
    EXPECT_EQ(locks.size(), 1u);
    {
        GDALDatasetUniquePtr warped(GDALDataset::Open(output.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
        ASSERT_NE(warped, nullptr);
        EXPECT_EQ(warped->GetRasterBand(1)->GetRasterDataType(), GDT_Float32);
        const OGRSpatialReference* srs = warped->GetSpatialRef();
        ASSERT_NE(srs, nullptr);
        EXPECT_TRUE(srs->IsSame(target.get()));
        double gt[6];
        ASSERT_EQ(warped->GetGeoTransform(gt), CE_None);
        EXPECT_NEAR(gt[1], 10.0, 1e-9);
        EXPECT_NEAR(gt[5], -10.0, 1e-9);
    }

    // Replace the output with a stand-in; an existing file must not be rewritten.
    std::remove(output.c_str());
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    GDALClose(driver->Create(output.c_str(), 1, 1, 1, GDT_Byte, nullptr));

    geoalign::parse_rasters({path}, options);

    GDALDatasetUniquePtr reused(GDALDataset::Open(output.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
    ASSERT_NE(reused, nullptr);
    EXPECT_EQ(reused->GetRasterXSize(), 1);
}

TEST(DtypeNameTest, NumpyNames) {
    EXPECT_EQ(geoalign::dtype_name(GDT_Byte), "uint8");
    EXPECT_EQ(geoalign::dtype_name(GDT_Int16), "int16");
    EXPECT_EQ(geoalign::dtype_name(GDT_Float32), "float32");
    EXPECT_EQ(geoalign::dtype_name(GDT_Float64), "float64");
    EXPECT_EQ(geoalign::dtype_name(GDT_CInt16), "complex64");
    EXPECT_EQ(geoalign::dtype_name(GDT_CFloat64), "complex128");
    EXPECT_EQ(geoalign::dtype_name(GDT_Unknown), "unknown");
}

TEST(ReprojectedPathTest, SuffixConvention) {
    EXPECT_EQ(geoalign::reprojected_path_for("/data/scene.tif"), "/data/scene.tif.reproj.tif");
    EXPECT_TRUE(geoalign::is_reprojected_path("/data/scene.tif.reproj.tif"));
    EXPECT_FALSE(geoalign::is_reprojected_path("/data/scene.tif"));
    EXPECT_FALSE(geoalign::is_reprojected_path(".tif"));
}
