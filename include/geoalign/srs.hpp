#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "geoalign/geo_transform.hpp"

class OGRSpatialReference;
class OGRCoordinateTransformation;
class OGRGeometry;

namespace geoalign {

// Key order matters: CRS properties are passed positionally, and feature
// properties come back out in the order they went in.
using Json = nlohmann::ordered_json;

// Immutable, shareable spatial reference system. Always uses the traditional
// GIS axis order (x = easting/longitude, y = northing/latitude).
class Srs {
public:
    static Srs from_epsg(int code);
    static Srs from_wkt(const std::string& wkt);
    // Takes ownership of an already-imported reference.
    static Srs adopt(std::unique_ptr<OGRSpatialReference> srs);

    // Delegates to OSR IsSame: EPSG:4326 and its WKT compare equal.
    bool is_same(const Srs& other) const;

    std::string to_wkt() const;
    // Authority code of the root node, if any (e.g. 4326).
    std::optional<int> epsg_code() const;

    const OGRSpatialReference* get() const { return srs_.get(); }

private:
    explicit Srs(std::shared_ptr<const OGRSpatialReference> srs);

    std::shared_ptr<const OGRSpatialReference> srs_;
};

// One tag per supported OSR importer. NameEpsg is the narrow "NAME" variant
// whose only property embeds an ":EPSG:<code>" token.
enum class CrsType {
    Epsg,
    EpsgA,
    Erm,
    Esri,
    Usgs,
    Pci,
    NameEpsg,
    Unsupported
};

struct CrsDescriptor {
    CrsType type = CrsType::Unsupported;
    std::vector<Json> params;  // property values, in document order
    Json raw;                  // the descriptor as given, for diagnostics
};

const char* crs_type_name(CrsType type);

// Classifies a {"type": ..., "properties": {...}} mapping. Never throws for an
// unknown type; that is reported as CrsType::Unsupported.
CrsDescriptor parse_crs_descriptor(const Json& descriptor);

// Throws UnsupportedCRSError if the type is unknown or the importer rejects
// the parameters.
Srs parse_crs(const Json& descriptor);
Srs parse_crs(const CrsDescriptor& descriptor);

// Throw InvalidSRSSpecError on malformed input.
Srs resolve_target_srs(const Srs& srs);
Srs resolve_target_srs(int epsg_code);
Srs resolve_target_srs(const std::string& spec);  // "4326" or "EPSG:4326"
Srs resolve_target_srs(const Json& spec);         // integer or string

class CoordTransform {
public:
    CoordTransform(const Srs& src, const Srs& dst);
    ~CoordTransform();

    CoordTransform(CoordTransform&&) noexcept;
    CoordTransform& operator=(CoordTransform&&) noexcept;
    CoordTransform(const CoordTransform&) = delete;
    CoordTransform& operator=(const CoordTransform&) = delete;

    // Each point is mapped independently; output order matches input.
    std::vector<Coord> apply(const std::vector<Coord>& points) const;
    // Reprojects the geometry in place and assigns it the destination SRS.
    void apply(OGRGeometry& geometry) const;

    const Srs& source() const { return src_; }
    const Srs& target() const { return dst_; }

private:
    Srs src_;
    Srs dst_;
    std::unique_ptr<OGRCoordinateTransformation> transform_;
};

// Empty when src and dst describe the same system.
std::optional<CoordTransform> build_transform(const Srs& src, const Srs& dst);

std::vector<Coord> reproject_coords(const std::vector<Coord>& points, const Srs& src, const Srs& dst);

} // namespace geoalign
