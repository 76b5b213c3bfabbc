#pragma once

#include <optional>
#include <string>
#include <vector>

#include "geoalign/geometry.hpp"
#include "geoalign/srs.hpp"

namespace geoalign {

struct Feature {
    GeometryPtr geometry;   // Polygon or MultiPolygon, in the target SRS
    std::string type;       // "Polygon" or "MultiPolygon", tracks the current geometry
    Json properties;        // untouched "properties" member of the input feature
    std::optional<Json> id; // "id" member, if the input had one
    // The input feature mapping in its original key order, foreign members
    // (bbox, ...) included; "geometry" is null and "type" matches `type`.
    Json members;
};

struct FeatureParseOptions {
    std::optional<Srs> target_srs;
    const OGRGeometry* roi = nullptr;  // not owned; must outlive the call
    bool allow_outlying = false;       // keep features that only intersect the roi
    bool clip_outlying = false;        // replace kept geometries by their intersection with the roi
};

// Keeps input order. Any unexpected geometry aborts the whole call.
std::vector<Feature> parse_features(const Json& collection, const FeatureParseOptions& options = {});
std::vector<Feature> parse_features(const Json& collection, const std::optional<Srs>& target_srs,
                                    const OGRGeometry* roi, bool allow_outlying, bool clip_outlying);

// Reads a GeoJSON document from disk, preserving key order.
Json load_feature_collection(const std::string& path);

} // namespace geoalign
