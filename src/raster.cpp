#include "geoalign/raster.hpp"
#include "geoalign/errors.hpp"
#include "geoalign/logging.hpp"
#include "geoalign/path_lock.hpp"

#include <cmath>
#include <memory>
#include <mutex>

#include <cpl_conv.h>
#include <cpl_error.h>
#include <cpl_string.h>
#include <cpl_vsi.h>
#include <gdal_priv.h>
#include <gdal_utils.h>

namespace geoalign {

namespace {
constexpr const char* UNKNOWN_SRS_MARKER = "unknown";
constexpr int PROGRESS_STEP_PCT = 10;

void ensure_gdal_registered() {
    static std::once_flag once;
    std::call_once(once, [] { GDALAllRegister(); });
}

std::string last_gdal_error() {
    const char* msg = CPLGetLastErrorMsg();
    return (msg && *msg) ? msg : "unknown GDAL error";
}

bool path_exists(const std::string& path) {
    VSIStatBufL stat;
    return VSIStatL(path.c_str(), &stat) == 0;
}

struct WarpProgress {
    std::string path;
    int last_reported = -PROGRESS_STEP_PCT;
};

int CPL_STDCALL report_warp_progress(double complete, const char*, void* data) {
    auto* progress = static_cast<WarpProgress*>(data);
    int pct = static_cast<int>(complete * 100);
    if (pct >= progress->last_reported + PROGRESS_STEP_PCT || (pct == 100 && progress->last_reported != 100)) {
        GEOALIGN_LOG_DEBUG("reprojection of '{}' @ {} %", progress->path, pct);
        progress->last_reported = pct;
    }
    return TRUE;
}

void warp_raster(GDALDataset& source, const std::string& dst_path, const Srs& target,
                 GDALDataType data_type, const Coord& resolution, const std::string& threads) {
    CPLStringList args;
    args.AddString("-of");
    args.AddString("GTiff");
    args.AddString("-t_srs");
    args.AddString(target.to_wkt().c_str());
    if (data_type != GDT_Unknown) {
        args.AddString("-ot");
        args.AddString(GDALGetDataTypeName(data_type));
    }
    args.AddString("-tr");
    args.AddString(CPLSPrintf("%.17g", std::fabs(resolution.first)));
    args.AddString(CPLSPrintf("%.17g", std::fabs(resolution.second)));
    args.AddString("-wo");
    args.AddString(("NUM_THREADS=" + threads).c_str());

    std::unique_ptr<GDALWarpAppOptions, decltype(&GDALWarpAppOptionsFree)> options(
        GDALWarpAppOptionsNew(args.List(), nullptr), &GDALWarpAppOptionsFree);
    if (!options) {
        throw ReprojectionError("invalid warp options for '" + dst_path + "': " + last_gdal_error());
    }
    WarpProgress progress{dst_path};
    GDALWarpAppOptionsSetProgress(options.get(), report_warp_progress, &progress);

    GDALDatasetH source_handle = GDALDataset::ToHandle(&source);
    int usage_error = FALSE;
    GDALDatasetUniquePtr output(GDALDataset::FromHandle(
        GDALWarp(dst_path.c_str(), nullptr, 1, &source_handle, options.get(), &usage_error)));
    if (!output) {
        std::string reason = last_gdal_error();
        // A leftover partial file would be mistaken for a finished reprojection next run.
        VSIUnlink(dst_path.c_str());
        throw ReprojectionError("could not reproject raster to '" + dst_path + "': " + reason);
    }
    output.reset();
}

Srs native_srs(GDALDataset& dataset, const std::string& path, const std::optional<Srs>& target_srs) {
    const char* wkt = dataset.GetProjectionRef();
    std::string projection = wkt ? wkt : "";
    if (!projection.empty() && projection.find(UNKNOWN_SRS_MARKER) == std::string::npos) {
        return Srs::from_wkt(projection);
    }
    if (!target_srs) {
        throw MissingSRSError("raster '" + path + "' does not provide an SRS, and no target SRS was given");
    }
    GEOALIGN_LOG_DEBUG("raster '{}' has no SRS, assuming the target SRS", path);
    return *target_srs;
}

GDALDataType common_band_type(GDALDataset& dataset, const std::string& path) {
    GDALDataType data_type = GDT_Unknown;
    for (int band_idx = 1; band_idx <= dataset.GetRasterCount(); band_idx++) {
        GDALRasterBand* band = dataset.GetRasterBand(band_idx);
        if (!band) {
            throw RasterOpenError("found invalid raster band " + std::to_string(band_idx) + " in '" + path + "'");
        }
        GDALDataType band_type = band->GetRasterDataType();
        if (data_type == GDT_Unknown) {
            data_type = band_type;
        } else if (band_type != data_type) {
            throw MixedBandTypeError("expected identical data types in all bands of '" + path + "', found " +
                                     GDALGetDataTypeName(data_type) + " and " + GDALGetDataTypeName(band_type));
        }
    }
    return data_type;
}

RasterRecord parse_raster(const std::string& path, const RasterParseOptions& options) {
    GDALDatasetUniquePtr dataset(GDALDataset::Open(path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
    if (!dataset) {
        throw RasterOpenError("could not open raster data file at '" + path + "': " + last_gdal_error());
    }
    GEOALIGN_LOG_DEBUG("raster '{}' driver: {}", path, dataset->GetDriverName());
    GEOALIGN_LOG_DEBUG("band count: {}", dataset->GetRasterCount());

    std::array<double, 6> coefficients{};
    if (dataset->GetGeoTransform(coefficients.data()) != CE_None) {
        throw RasterOpenError("raster '" + path + "' has no geotransform");
    }
    GeoTransform geotransform = GeoTransform::from_gdal(coefficients);
    Coord resolution{geotransform.res_x(), geotransform.res_y()};
    Coord skew{geotransform.skew_x(), geotransform.skew_y()};
    GEOALIGN_LOG_DEBUG("pixel WxH resolution: {} x {}", resolution.first, resolution.second);
    GEOALIGN_LOG_DEBUG("grid X/Y skew: {} / {}", skew.first, skew.second);

    int cols = dataset->GetRasterXSize();
    int rows = dataset->GetRasterYSize();
    int band_count = dataset->GetRasterCount();
    auto extent = geotransform.extent_of_window(0, 0, cols, rows);
    GEOALIGN_LOG_DEBUG("extent: tl=({}, {}) br=({}, {})", extent[0].first, extent[0].second,
                       extent[2].first, extent[2].second);

    Srs srs = native_srs(*dataset, path, options.target_srs);
    GDALDataType data_type = common_band_type(*dataset, path);

    OGRPolygon local_roi = make_polygon(extent);
    OGRPolygon target_roi = local_roi;
    std::optional<std::string> reprojected_path;

    if (options.target_srs) {
        if (auto transform = build_transform(srs, *options.target_srs)) {
            transform->apply(target_roi);
            if (options.reproject) {
                reprojected_path = reprojected_path_for(path);
                std::unique_lock<std::mutex> guard;
                if (options.locks) guard = options.locks->lock(*reprojected_path);
                if (!path_exists(*reprojected_path)) {
                    GEOALIGN_LOG_INFO("reprojecting raster to '{}'...", *reprojected_path);
                    warp_raster(*dataset, *reprojected_path, *options.target_srs, data_type, resolution,
                                options.warp_threads);
                } else {
                    GEOALIGN_LOG_DEBUG("reusing existing reprojection '{}'", *reprojected_path);
                }
            }
        }
    }

    // Release the file handle before the next raster; no pixel data is kept.
    dataset.reset();

    return RasterRecord{
        srs,
        geotransform,
        geotransform.with_zero_origin(),
        extent,
        skew,
        resolution,
        band_count,
        cols,
        rows,
        data_type,
        local_roi,
        target_roi,
        path,
        reprojected_path
    };
}
}

std::string reprojected_path_for(const std::string& raster_path) {
    return raster_path + REPROJECTED_SUFFIX;
}

bool is_reprojected_path(const std::string& path) {
    const std::string suffix = REPROJECTED_SUFFIX;
    return path.size() >= suffix.size() && path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string dtype_name(GDALDataType type) {
    switch (type) {
    case GDT_Byte: return "uint8";
    case GDT_UInt16: return "uint16";
    case GDT_Int16: return "int16";
    case GDT_UInt32: return "uint32";
    case GDT_Int32: return "int32";
    case GDT_Float32: return "float32";
    case GDT_Float64: return "float64";
    case GDT_CInt16:
    case GDT_CInt32:
    case GDT_CFloat32: return "complex64";
    case GDT_CFloat64: return "complex128";
    default: return "unknown";
    }
}

size_t RasterRecord::pixel_size() const {
    return static_cast<size_t>(GDALGetDataTypeSizeBytes(data_type));
}

RasterBatch parse_rasters(const std::vector<std::string>& paths, const RasterParseOptions& options) {
    ensure_gdal_registered();

    RasterBatch batch;
    for (const auto& path : paths) {
        if (is_reprojected_path(path)) {
            GEOALIGN_LOG_DEBUG("skipping prior reprojection output '{}'", path);
            continue;
        }
        batch.records.push_back(parse_raster(path, options));
    }

    std::vector<const OGRGeometry*> rois;
    rois.reserve(batch.records.size());
    for (const auto& record : batch.records) rois.push_back(&record.target_roi);
    batch.coverage = union_all(rois);

    GEOALIGN_LOG_DEBUG("parsed {} rasters, coverage area {}", batch.records.size(), area(*batch.coverage));
    return batch;
}

RasterBatch parse_rasters(const std::vector<std::string>& paths, const std::optional<Srs>& target_srs,
                          bool do_reproject) {
    RasterParseOptions options;
    options.target_srs = target_srs;
    options.reproject = do_reproject;
    return parse_rasters(paths, options);
}

} // namespace geoalign
