#include "geoalign/srs.hpp"
#include "geoalign/errors.hpp"
#include "geoalign/logging.hpp"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <cstdlib>

#include <cpl_conv.h>
#include <cpl_error.h>
#include <cpl_string.h>
#include <ogr_geometry.h>
#include <ogr_spatialref.h>

namespace geoalign {

namespace {
constexpr const char* EPSG_PREFIX = "EPSG:";
constexpr const char* NAME_EPSG_TOKEN = ":EPSG:";
constexpr size_t USGS_PARAM_COUNT = 15;
constexpr size_t PCI_PARAM_COUNT = 17;

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::unique_ptr<OGRSpatialReference> make_reference() {
    auto srs = std::make_unique<OGRSpatialReference>();
    srs->SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return srs;
}

// Parses an EPSG code out of "4326" / "EPSG:4326"; nullopt if not an integer.
std::optional<int> parse_epsg_string(std::string spec) {
    auto first = spec.find_first_not_of(" \t");
    auto last = spec.find_last_not_of(" \t");
    if (first == std::string::npos) return std::nullopt;
    spec = spec.substr(first, last - first + 1);
    if (upper(spec.substr(0, 5)) == EPSG_PREFIX) spec = spec.substr(5);
    if (spec.empty() || !std::all_of(spec.begin(), spec.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return std::stoi(spec);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

// Integer JSON value within [lo, hi]; nullopt for anything else, never a truncated value.
std::optional<int> int_in_range(const Json& v, int lo, int hi) {
    std::int64_t value;
    if (v.is_number_unsigned()) {
        auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(INT64_MAX)) return std::nullopt;
        value = static_cast<std::int64_t>(u);
    } else if (v.is_number_integer()) {
        value = v.get<std::int64_t>();
    } else {
        return std::nullopt;
    }
    if (value < lo || value > hi) return std::nullopt;
    return static_cast<int>(value);
}

[[noreturn]] void unsupported(const CrsDescriptor& d, const std::string& why) {
    throw UnsupportedCRSError("could not import CRS of type " + std::string(crs_type_name(d.type)) +
                              " (" + why + "): " + d.raw.dump());
}

const Json& param(const CrsDescriptor& d, size_t index, const char* name) {
    if (index >= d.params.size()) unsupported(d, std::string("missing parameter '") + name + "'");
    return d.params[index];
}

int int_param(const CrsDescriptor& d, size_t index, const char* name, int lo = INT_MIN, int hi = INT_MAX) {
    const Json& v = param(d, index, name);
    std::optional<int> value;
    if (v.is_string()) {
        value = parse_epsg_string(v.get<std::string>());
        if (value && (*value < lo || *value > hi)) value.reset();
    } else {
        value = int_in_range(v, lo, hi);
    }
    if (!value) {
        unsupported(d, std::string("parameter '") + name + "' is not an integer in [" + std::to_string(lo) +
                       ", " + std::to_string(hi) + "]");
    }
    return *value;
}

std::string string_param(const CrsDescriptor& d, size_t index, const char* name) {
    const Json& v = param(d, index, name);
    if (!v.is_string()) unsupported(d, std::string("parameter '") + name + "' is not a string");
    return v.get<std::string>();
}

std::vector<double> double_array_param(const CrsDescriptor& d, size_t index, const char* name, size_t size) {
    std::vector<double> values(size, 0.0);
    if (index >= d.params.size()) return values;
    const Json& v = d.params[index];
    if (!v.is_array() || v.size() > size) {
        unsupported(d, std::string("parameter '") + name + "' must be an array of at most " +
                       std::to_string(size) + " numbers");
    }
    for (size_t i = 0; i < v.size(); i++) {
        if (!v[i].is_number()) unsupported(d, std::string("parameter '") + name + "' holds a non-number");
        values[i] = v[i].get<double>();
    }
    return values;
}

OGRErr import_descriptor(OGRSpatialReference& srs, const CrsDescriptor& d) {
    switch (d.type) {
    case CrsType::Epsg:
        return srs.importFromEPSG(int_param(d, 0, "code", 1));
    case CrsType::EpsgA:
        return srs.importFromEPSGA(int_param(d, 0, "code", 1));
    case CrsType::Erm: {
        std::string proj = string_param(d, 0, "proj");
        std::string datum = string_param(d, 1, "datum");
        std::string units = string_param(d, 2, "units");
        return srs.importFromERM(proj.c_str(), datum.c_str(), units.c_str());
    }
    case CrsType::Esri: {
        const Json& v = param(d, 0, "prj");
        CPLStringList lines;
        if (v.is_string()) {
            lines.AddString(v.get<std::string>().c_str());
        } else if (v.is_array()) {
            for (const auto& line : v) {
                if (!line.is_string()) unsupported(d, "ESRI .prj lines must be strings");
                lines.AddString(line.get<std::string>().c_str());
            }
        } else {
            unsupported(d, "ESRI .prj content must be a string or a list of strings");
        }
        return srs.importFromESRI(lines.List());
    }
    case CrsType::Usgs: {
        long projsys = int_param(d, 0, "projsys");
        long zone = int_param(d, 1, "zone");
        std::vector<double> params = double_array_param(d, 2, "params", USGS_PARAM_COUNT);
        long datum = d.params.size() > 3 ? int_param(d, 3, "datum") : 0;
        return srs.importFromUSGS(projsys, zone, params.data(), datum);
    }
    case CrsType::Pci: {
        std::string proj = string_param(d, 0, "proj");
        std::string units = d.params.size() > 1 ? string_param(d, 1, "units") : std::string();
        std::vector<double> params = double_array_param(d, 2, "params", PCI_PARAM_COUNT);
        return srs.importFromPCI(proj.c_str(), units.empty() ? nullptr : units.c_str(),
                                 d.params.size() > 2 ? params.data() : nullptr);
    }
    case CrsType::NameEpsg: {
        std::string name = string_param(d, 0, "name");
        auto code = parse_epsg_string(name.substr(name.rfind(':') + 1));
        if (!code) unsupported(d, "no EPSG code after the last ':' in '" + name + "'");
        return srs.importFromEPSG(*code);
    }
    case CrsType::Unsupported:
        break;
    }
    unsupported(d, "unrecognized type");
}
}

Srs::Srs(std::shared_ptr<const OGRSpatialReference> srs) : srs_(std::move(srs)) {}

Srs Srs::from_epsg(int code) {
    auto srs = make_reference();
    if (srs->importFromEPSG(code) != OGRERR_NONE) {
        throw InvalidSRSSpecError("could not import EPSG:" + std::to_string(code) + ": " + CPLGetLastErrorMsg());
    }
    return Srs(std::move(srs));
}

Srs Srs::from_wkt(const std::string& wkt) {
    auto srs = make_reference();
    if (srs->importFromWkt(wkt.c_str()) != OGRERR_NONE) {
        throw InvalidSRSSpecError("could not import SRS from WKT: " + wkt);
    }
    return Srs(std::move(srs));
}

Srs Srs::adopt(std::unique_ptr<OGRSpatialReference> srs) {
    if (!srs) throw InvalidSRSSpecError("null spatial reference");
    srs->SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return Srs(std::move(srs));
}

bool Srs::is_same(const Srs& other) const {
    if (srs_ == other.srs_) return true;
    return srs_->IsSame(other.srs_.get()) != 0;
}

std::string Srs::to_wkt() const {
    char* wkt = nullptr;
    if (srs_->exportToWkt(&wkt) != OGRERR_NONE) {
        CPLFree(wkt);
        throw InvalidSRSSpecError("could not export SRS to WKT");
    }
    std::string result(wkt);
    CPLFree(wkt);
    return result;
}

std::optional<int> Srs::epsg_code() const {
    const char* authority = srs_->GetAuthorityName(nullptr);
    const char* code = srs_->GetAuthorityCode(nullptr);
    if (!authority || !code || upper(authority) != "EPSG") return std::nullopt;
    return std::atoi(code);
}

const char* crs_type_name(CrsType type) {
    switch (type) {
    case CrsType::Epsg: return "EPSG";
    case CrsType::EpsgA: return "EPSGA";
    case CrsType::Erm: return "ERM";
    case CrsType::Esri: return "ESRI";
    case CrsType::Usgs: return "USGS";
    case CrsType::Pci: return "PCI";
    case CrsType::NameEpsg: return "NAME";
    case CrsType::Unsupported: return "UNSUPPORTED";
    }
    return "UNSUPPORTED";
}

CrsDescriptor parse_crs_descriptor(const Json& descriptor) {
    CrsDescriptor d;
    d.raw = descriptor;
    if (!descriptor.is_object()) return d;

    auto props = descriptor.find("properties");
    if (props != descriptor.end() && props->is_object()) {
        for (const auto& item : props->items()) d.params.push_back(item.value());
    }

    auto type_it = descriptor.find("type");
    if (type_it == descriptor.end() || !type_it->is_string()) return d;
    std::string type = upper(type_it->get<std::string>());

    if (type == "EPSG") d.type = CrsType::Epsg;
    else if (type == "EPSGA") d.type = CrsType::EpsgA;
    else if (type == "ERM") d.type = CrsType::Erm;
    else if (type == "ESRI") d.type = CrsType::Esri;
    else if (type == "USGS") d.type = CrsType::Usgs;
    else if (type == "PCI") d.type = CrsType::Pci;
    else if (type == "NAME" && d.params.size() == 1 && d.params[0].is_string() &&
             d.params[0].get<std::string>().find(NAME_EPSG_TOKEN) != std::string::npos) {
        d.type = CrsType::NameEpsg;
    }
    return d;
}

Srs parse_crs(const Json& descriptor) {
    return parse_crs(parse_crs_descriptor(descriptor));
}

Srs parse_crs(const CrsDescriptor& descriptor) {
    if (descriptor.type == CrsType::Unsupported) unsupported(descriptor, "unrecognized or missing type");
    auto srs = make_reference();
    OGRErr err = import_descriptor(*srs, descriptor);
    if (err != OGRERR_NONE) {
        unsupported(descriptor, "importer error " + std::to_string(err));
    }
    GEOALIGN_LOG_DEBUG("parsed {} CRS descriptor", crs_type_name(descriptor.type));
    return Srs::adopt(std::move(srs));
}

Srs resolve_target_srs(const Srs& srs) {
    return srs;
}

Srs resolve_target_srs(int epsg_code) {
    if (epsg_code <= 0) throw InvalidSRSSpecError("invalid EPSG code: " + std::to_string(epsg_code));
    return Srs::from_epsg(epsg_code);
}

Srs resolve_target_srs(const std::string& spec) {
    auto code = parse_epsg_string(spec);
    if (!code) throw InvalidSRSSpecError("target SRS must be an EPSG code, got '" + spec + "'");
    return resolve_target_srs(*code);
}

Srs resolve_target_srs(const Json& spec) {
    if (spec.is_number_integer()) {
        auto code = int_in_range(spec, 1, INT_MAX);
        if (!code) throw InvalidSRSSpecError("EPSG code out of range: " + spec.dump());
        return resolve_target_srs(*code);
    }
    if (spec.is_string()) return resolve_target_srs(spec.get<std::string>());
    throw InvalidSRSSpecError("target SRS must be given as int or string, got " + spec.dump());
}

CoordTransform::CoordTransform(const Srs& src, const Srs& dst)
    : src_(src)
    , dst_(dst)
    , transform_(OGRCreateCoordinateTransformation(src.get(), dst.get())) {
    if (!transform_) {
        throw TransformError(std::string("could not build coordinate transformation: ") + CPLGetLastErrorMsg());
    }
}

CoordTransform::~CoordTransform() = default;
CoordTransform::CoordTransform(CoordTransform&&) noexcept = default;
CoordTransform& CoordTransform::operator=(CoordTransform&&) noexcept = default;

std::vector<Coord> CoordTransform::apply(const std::vector<Coord>& points) const {
    std::vector<double> xs, ys;
    xs.reserve(points.size());
    ys.reserve(points.size());
    for (const auto& [x, y] : points) {
        xs.push_back(x);
        ys.push_back(y);
    }
    std::vector<int> success(points.size(), FALSE);
    if (!points.empty() &&
        !transform_->Transform(xs.size(), xs.data(), ys.data(), nullptr, success.data())) {
        throw TransformError(std::string("coordinate transformation failed: ") + CPLGetLastErrorMsg());
    }
    std::vector<Coord> result;
    result.reserve(points.size());
    for (size_t i = 0; i < points.size(); i++) {
        if (!success[i]) {
            throw TransformError("could not transform point (" + std::to_string(points[i].first) + ", " +
                                 std::to_string(points[i].second) + ")");
        }
        result.emplace_back(xs[i], ys[i]);
    }
    return result;
}

void CoordTransform::apply(OGRGeometry& geometry) const {
    if (geometry.transform(transform_.get()) != OGRERR_NONE) {
        throw TransformError(std::string("geometry reprojection failed: ") + CPLGetLastErrorMsg());
    }
}

std::optional<CoordTransform> build_transform(const Srs& src, const Srs& dst) {
    if (src.is_same(dst)) return std::nullopt;
    return std::optional<CoordTransform>(std::in_place, src, dst);
}

std::vector<Coord> reproject_coords(const std::vector<Coord>& points, const Srs& src, const Srs& dst) {
    auto transform = build_transform(src, dst);
    if (!transform) return points;
    return transform->apply(points);
}

} // namespace geoalign
