#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "geoalign/geoalign.hpp"

namespace py = pybind11;

namespace {

// Round-trips through the stdlib json module so key order survives.
geoalign::Json to_json(const py::object& obj) {
    auto dumps = py::module_::import("json").attr("dumps");
    return geoalign::Json::parse(dumps(obj).cast<std::string>());
}

py::object from_json(const geoalign::Json& value) {
    auto loads = py::module_::import("json").attr("loads");
    return loads(value.dump());
}

std::optional<geoalign::Srs> to_target_srs(const py::object& obj) {
    if (obj.is_none()) return std::nullopt;
    if (py::isinstance<geoalign::Srs>(obj)) return obj.cast<geoalign::Srs>();
    if (py::isinstance<py::int_>(obj)) return geoalign::resolve_target_srs(obj.cast<int>());
    if (py::isinstance<py::str>(obj)) return geoalign::resolve_target_srs(obj.cast<std::string>());
    throw geoalign::InvalidSRSSpecError("target SRS must be given as Srs, int or str");
}

py::dict feature_to_dict(const geoalign::Feature& feature) {
    py::dict out(from_json(feature.members));
    out["geometry"] = geoalign::to_wkt(*feature.geometry);
    return out;
}

} // namespace

PYBIND11_MODULE(_geoalign_cpp, m) {
    m.doc() = "GeoAlign C++ backend for raster/vector alignment and crop windows";
    m.attr("__version__") = geoalign::VERSION;

    // Translators run newest first, so each kind is registered after the base.
    auto& base_error = py::register_exception<geoalign::Error>(m, "GeoAlignError", PyExc_RuntimeError);
    py::register_exception<geoalign::DegenerateTransformError>(m, "DegenerateTransformError", base_error.ptr());
    py::register_exception<geoalign::UnsupportedCRSError>(m, "UnsupportedCRSError", base_error.ptr());
    py::register_exception<geoalign::InvalidSRSSpecError>(m, "InvalidSRSSpecError", base_error.ptr());
    py::register_exception<geoalign::TransformError>(m, "TransformError", base_error.ptr());
    py::register_exception<geoalign::RasterOpenError>(m, "RasterOpenError", base_error.ptr());
    py::register_exception<geoalign::MixedBandTypeError>(m, "MixedBandTypeError", base_error.ptr());
    py::register_exception<geoalign::MissingSRSError>(m, "MissingSRSError", base_error.ptr());
    py::register_exception<geoalign::ReprojectionError>(m, "ReprojectionError", base_error.ptr());
    py::register_exception<geoalign::InvalidFeatureCollectionError>(m, "InvalidFeatureCollectionError", base_error.ptr());
    py::register_exception<geoalign::UnsupportedGeometryError>(m, "UnsupportedGeometryError", base_error.ptr());
    py::register_exception<geoalign::MalformedGeometryError>(m, "MalformedGeometryError", base_error.ptr());
    py::register_exception<geoalign::InvalidGeometryError>(m, "InvalidGeometryError", base_error.ptr());
    py::register_exception<geoalign::UnexpectedClipResultError>(m, "UnexpectedClipResultError", base_error.ptr());
    py::register_exception<geoalign::GeometryError>(m, "GeometryError", base_error.ptr());
    py::register_exception<geoalign::AmbiguousCropSpecError>(m, "AmbiguousCropSpecError", base_error.ptr());
    py::register_exception<geoalign::InvalidOffsetError>(m, "InvalidOffsetError", base_error.ptr());
    py::register_exception<geoalign::InvalidCropSizeError>(m, "InvalidCropSizeError", base_error.ptr());

    m.def("set_log_level", &geoalign::set_log_level, py::arg("level"));

    py::class_<geoalign::GeoTransform>(m, "GeoTransform")
        .def(py::init(&geoalign::GeoTransform::from_gdal), py::arg("transform"))
        .def_property_readonly("coefficients", &geoalign::GeoTransform::coefficients)
        .def_property_readonly("res_x", &geoalign::GeoTransform::res_x)
        .def_property_readonly("res_y", &geoalign::GeoTransform::res_y)
        .def_property_readonly("skew_x", &geoalign::GeoTransform::skew_x)
        .def_property_readonly("skew_y", &geoalign::GeoTransform::skew_y)
        .def("geo_of_pixel", &geoalign::GeoTransform::geo_of_pixel, py::arg("col"), py::arg("row"))
        .def("pixel_of_geo", &geoalign::GeoTransform::pixel_of_geo, py::arg("x"), py::arg("y"))
        .def("extent_of_window", &geoalign::GeoTransform::extent_of_window,
             py::arg("col"), py::arg("row"), py::arg("width"), py::arg("height"))
        .def("with_zero_origin", &geoalign::GeoTransform::with_zero_origin);

    py::class_<geoalign::Srs>(m, "Srs")
        .def_static("from_epsg", &geoalign::Srs::from_epsg, py::arg("code"))
        .def_static("from_wkt", &geoalign::Srs::from_wkt, py::arg("wkt"))
        .def("is_same", &geoalign::Srs::is_same, py::arg("other"))
        .def("to_wkt", &geoalign::Srs::to_wkt)
        .def_property_readonly("epsg_code", &geoalign::Srs::epsg_code);

    m.def("parse_crs", [](const py::dict& descriptor) {
        return geoalign::parse_crs(to_json(descriptor));
    }, py::arg("descriptor"));

    m.def("resolve_target_srs", [](const py::object& value) {
        auto srs = to_target_srs(value);
        if (!srs) throw geoalign::InvalidSRSSpecError("target SRS must not be None");
        return *srs;
    }, py::arg("value"));

    py::class_<geoalign::RasterRecord>(m, "RasterRecord")
        .def_readonly("srs", &geoalign::RasterRecord::srs)
        .def_readonly("geotransform", &geoalign::RasterRecord::geotransform)
        .def_readonly("offset_geotransform", &geoalign::RasterRecord::offset_geotransform)
        .def_readonly("extent", &geoalign::RasterRecord::extent)
        .def_readonly("skew", &geoalign::RasterRecord::skew)
        .def_readonly("resolution", &geoalign::RasterRecord::resolution)
        .def_readonly("band_count", &geoalign::RasterRecord::band_count)
        .def_readonly("cols", &geoalign::RasterRecord::cols)
        .def_readonly("rows", &geoalign::RasterRecord::rows)
        .def_readonly("file_path", &geoalign::RasterRecord::file_path)
        .def_readonly("reprojected_path", &geoalign::RasterRecord::reprojected_path)
        .def_property_readonly("dtype", &geoalign::RasterRecord::dtype)
        .def_property_readonly("local_roi", [](const geoalign::RasterRecord& r) {
            return geoalign::to_wkt(r.local_roi);
        })
        .def_property_readonly("target_roi", [](const geoalign::RasterRecord& r) {
            return geoalign::to_wkt(r.target_roi);
        });

    m.def("parse_rasters", [](const std::vector<std::string>& paths, const py::object& target_srs, bool reproject) {
        geoalign::RasterParseOptions options;
        options.target_srs = to_target_srs(target_srs);
        options.reproject = reproject;
        geoalign::RasterBatch batch;
        {
            py::gil_scoped_release release;
            batch = geoalign::parse_rasters(paths, options);
        }
        return py::make_tuple(batch.records, geoalign::to_wkt(*batch.coverage));
    }, py::arg("paths"), py::arg("target_srs") = py::none(), py::arg("reproject") = false);

    m.def("parse_features", [](const py::dict& collection, const py::object& target_srs,
                               const std::optional<std::string>& roi_wkt, bool allow_outlying, bool clip_outlying) {
        geoalign::GeometryPtr roi;
        if (roi_wkt) roi = geoalign::from_wkt(*roi_wkt);
        geoalign::FeatureParseOptions options;
        options.target_srs = to_target_srs(target_srs);
        options.roi = roi.get();
        options.allow_outlying = allow_outlying;
        options.clip_outlying = clip_outlying;
        py::list out;
        for (const auto& feature : geoalign::parse_features(to_json(collection), options)) {
            out.append(feature_to_dict(feature));
        }
        return out;
    }, py::arg("collection"), py::arg("target_srs") = py::none(), py::arg("roi") = py::none(),
       py::arg("allow_outlying") = false, py::arg("clip_outlying") = false);

    m.def("compute_bbox", [](const std::string& wkt, const std::optional<std::vector<double>>& offsets) {
        auto geometry = geoalign::from_wkt(wkt);
        auto box = offsets ? geoalign::compute_bbox(*geometry, *offsets) : geoalign::compute_bbox(*geometry);
        return py::make_tuple(box.top_left, box.bottom_right);
    }, py::arg("geometry"), py::arg("offsets") = py::none());

    m.def("compute_crop_window", [](const std::string& wkt, const geoalign::Coord& pixel_size,
                                    const geoalign::Coord& skew, std::optional<double> buffer,
                                    std::optional<int> target_pixel_crop, std::optional<double> target_real_crop) {
        auto geometry = geoalign::from_wkt(wkt);
        geoalign::CropSpec spec{buffer, target_pixel_crop, target_real_crop};
        auto window = geoalign::compute_crop_window(*geometry, pixel_size, skew, spec);
        return py::make_tuple(geoalign::to_wkt(window.roi), window.top_left, window.bottom_right,
                              window.width, window.height);
    }, py::arg("geometry"), py::arg("pixel_size"), py::arg("skew") = geoalign::Coord{0.0, 0.0},
       py::arg("buffer") = py::none(), py::arg("target_pixel_crop") = py::none(),
       py::arg("target_real_crop") = py::none());
}
