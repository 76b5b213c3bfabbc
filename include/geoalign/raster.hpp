#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include <gdal.h>
#include <ogr_geometry.h>

#include "geoalign/geo_transform.hpp"
#include "geoalign/geometry.hpp"
#include "geoalign/srs.hpp"

namespace geoalign {

class PathLockRegistry;

// Suffix marking a raster written by a previous reprojection pass.
constexpr const char* REPROJECTED_SUFFIX = ".reproj.tif";

std::string reprojected_path_for(const std::string& raster_path);
bool is_reprojected_path(const std::string& path);

// numpy-style name of a GDAL band type ("uint8", "float32", ...); "unknown" otherwise.
std::string dtype_name(GDALDataType type);

struct RasterRecord {
    Srs srs;                        // native SRS, or the target SRS when the file has none
    GeoTransform geotransform;
    GeoTransform offset_geotransform;  // geotransform with a (0, 0) origin
    std::array<Coord, 4> extent;    // tl, bl, br, tr
    Coord skew;
    Coord resolution;               // (px_w, px_h); px_h is usually negative
    int band_count;
    int cols;
    int rows;
    GDALDataType data_type;
    OGRPolygon local_roi;           // extent in the native SRS
    OGRPolygon target_roi;          // extent in the target SRS
    std::string file_path;
    std::optional<std::string> reprojected_path;

    std::string dtype() const { return dtype_name(data_type); }
    size_t pixel_size() const;
};

struct RasterBatch {
    std::vector<RasterRecord> records;
    GeometryPtr coverage;           // union of all target_roi polygons
};

struct RasterParseOptions {
    std::optional<Srs> target_srs;
    bool reproject = false;                 // write <path>.reproj.tif when the SRS differs
    std::string warp_threads = "ALL_CPUS";  // forwarded as the NUM_THREADS warp option
    PathLockRegistry* locks = nullptr;      // serialises reprojection writes per output path
};

// Fails fast: the first unreadable or inconsistent raster aborts the whole batch.
RasterBatch parse_rasters(const std::vector<std::string>& paths, const RasterParseOptions& options = {});
RasterBatch parse_rasters(const std::vector<std::string>& paths, const std::optional<Srs>& target_srs,
                          bool do_reproject);

} // namespace geoalign
