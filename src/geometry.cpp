#include "geoalign/geometry.hpp"
#include "geoalign/errors.hpp"

#include <cpl_conv.h>
#include <cpl_error.h>

namespace geoalign {

namespace {
std::string last_gdal_error() {
    const char* msg = CPLGetLastErrorMsg();
    return (msg && *msg) ? std::string(": ") + msg : std::string();
}

void add_polygonal(OGRMultiPolygon& target, const OGRGeometry& geometry) {
    switch (wkbFlatten(geometry.getGeometryType())) {
    case wkbPolygon:
        target.addGeometry(&geometry);
        break;
    case wkbMultiPolygon:
        for (const auto* part : *geometry.toMultiPolygon()) target.addGeometry(part);
        break;
    default:
        throw GeometryError(std::string("cannot union non-polygonal geometry of type ") +
                            geometry.getGeometryName());
    }
}
}

OGRPolygon make_polygon(const std::vector<Coord>& ring) {
    auto* linear_ring = new OGRLinearRing();
    for (const auto& [x, y] : ring) linear_ring->addPoint(x, y);
    linear_ring->closeRings();
    OGRPolygon polygon;
    polygon.addRingDirectly(linear_ring);
    return polygon;
}

OGRPolygon make_polygon(const std::array<Coord, 4>& corners) {
    return make_polygon(std::vector<Coord>(corners.begin(), corners.end()));
}

GeometryPtr clone(const OGRGeometry& geometry) {
    return GeometryPtr(geometry.clone());
}

GeometryPtr from_wkt(const std::string& wkt) {
    OGRGeometry* geometry = nullptr;
    if (OGRGeometryFactory::createFromWkt(wkt.c_str(), nullptr, &geometry) != OGRERR_NONE || !geometry) {
        delete geometry;
        throw GeometryError("could not parse WKT geometry '" + wkt + "'" + last_gdal_error());
    }
    return GeometryPtr(geometry);
}

std::string to_wkt(const OGRGeometry& geometry) {
    char* wkt = nullptr;
    if (geometry.exportToWkt(&wkt) != OGRERR_NONE) {
        CPLFree(wkt);
        throw GeometryError("could not export geometry to WKT" + last_gdal_error());
    }
    std::string result(wkt);
    CPLFree(wkt);
    return result;
}

GeometryPtr from_wkb(const std::vector<unsigned char>& wkb) {
    OGRGeometry* geometry = nullptr;
    if (OGRGeometryFactory::createFromWkb(wkb.data(), nullptr, &geometry, wkb.size()) != OGRERR_NONE || !geometry) {
        delete geometry;
        throw GeometryError("could not parse WKB geometry" + last_gdal_error());
    }
    return GeometryPtr(geometry);
}

std::vector<unsigned char> to_wkb(const OGRGeometry& geometry) {
    std::vector<unsigned char> wkb(static_cast<size_t>(geometry.WkbSize()));
    if (geometry.exportToWkb(wkbNDR, wkb.data()) != OGRERR_NONE) {
        throw GeometryError("could not export geometry to WKB" + last_gdal_error());
    }
    return wkb;
}

bool is_polygonal(const OGRGeometry& geometry) {
    auto type = wkbFlatten(geometry.getGeometryType());
    return type == wkbPolygon || type == wkbMultiPolygon;
}

double area(const OGRGeometry& geometry) {
    switch (wkbFlatten(geometry.getGeometryType())) {
    case wkbPolygon:
        return geometry.toPolygon()->get_Area();
    case wkbMultiPolygon:
        return geometry.toMultiPolygon()->get_Area();
    default:
        return 0.0;
    }
}

OGREnvelope bounds(const OGRGeometry& geometry) {
    OGREnvelope envelope;
    geometry.getEnvelope(&envelope);
    return envelope;
}

Coord centroid(const OGRGeometry& geometry) {
    OGRPoint point;
    if (geometry.Centroid(&point) != OGRERR_NONE || point.IsEmpty()) {
        throw GeometryError("could not compute centroid of " + std::string(geometry.getGeometryName()) +
                            last_gdal_error());
    }
    return {point.getX(), point.getY()};
}

std::vector<Coord> exterior_ring(const OGRPolygon& polygon) {
    std::vector<Coord> coords;
    const OGRLinearRing* ring = polygon.getExteriorRing();
    if (!ring) return coords;
    coords.reserve(ring->getNumPoints());
    for (int i = 0; i < ring->getNumPoints(); i++) {
        coords.emplace_back(ring->getX(i), ring->getY(i));
    }
    return coords;
}

GeometryPtr buffer(const OGRGeometry& geometry, double distance) {
    GeometryPtr result(geometry.Buffer(distance));
    if (!result) throw GeometryError("geometry buffer failed" + last_gdal_error());
    return result;
}

GeometryPtr intersection(const OGRGeometry& a, const OGRGeometry& b) {
    GeometryPtr result(a.Intersection(&b));
    if (!result) throw GeometryError("geometry intersection failed" + last_gdal_error());
    return result;
}

GeometryPtr union_all(const std::vector<const OGRGeometry*>& geometries) {
    if (geometries.empty()) return GeometryPtr(new OGRPolygon());
    OGRMultiPolygon parts;
    for (const auto* geometry : geometries) add_polygonal(parts, *geometry);
    GeometryPtr result(parts.UnionCascaded());
    if (!result) throw GeometryError("geometry union failed" + last_gdal_error());
    return result;
}

} // namespace geoalign
