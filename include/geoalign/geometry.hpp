#pragma once

#include <array>
#include <string>
#include <vector>

#include <ogr_geometry.h>

#include "geoalign/geo_transform.hpp"

namespace geoalign {

using GeometryPtr = OGRGeometryUniquePtr;

// Closed polygon from an open or closed ring, vertices kept in the given order.
OGRPolygon make_polygon(const std::vector<Coord>& ring);
OGRPolygon make_polygon(const std::array<Coord, 4>& corners);

// Deep copy as an owning pointer.
GeometryPtr clone(const OGRGeometry& geometry);

GeometryPtr from_wkt(const std::string& wkt);
std::string to_wkt(const OGRGeometry& geometry);
GeometryPtr from_wkb(const std::vector<unsigned char>& wkb);
std::vector<unsigned char> to_wkb(const OGRGeometry& geometry);

// True for Polygon and MultiPolygon (any dimension flavour).
bool is_polygonal(const OGRGeometry& geometry);
// Area of polygonal geometries; 0 for everything else.
double area(const OGRGeometry& geometry);
OGREnvelope bounds(const OGRGeometry& geometry);
Coord centroid(const OGRGeometry& geometry);

// Exterior ring vertices of a polygon, closing vertex included.
std::vector<Coord> exterior_ring(const OGRPolygon& polygon);

// Thin wrappers over the OGR/GEOS boolean ops that turn a null result into GeometryError.
GeometryPtr buffer(const OGRGeometry& geometry, double distance);
GeometryPtr intersection(const OGRGeometry& a, const OGRGeometry& b);
// Cascaded union; an empty input gives an empty polygon.
GeometryPtr union_all(const std::vector<const OGRGeometry*>& geometries);

} // namespace geoalign
