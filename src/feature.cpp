#include "geoalign/feature.hpp"
#include "geoalign/errors.hpp"
#include "geoalign/logging.hpp"

#include <fstream>

#include <ogr_api.h>

namespace geoalign {

namespace {
constexpr size_t MIN_RING_VERTICES = 4;

std::string where(size_t index) {
    return "feature #" + std::to_string(index);
}

const Json& declared_crs(const Json& collection) {
    for (const char* key : {"crs", "srs"}) {
        auto it = collection.find(key);
        if (it != collection.end() && !it->is_null()) return *it;
    }
    throw UnsupportedCRSError("feature collection does not declare a crs/srs");
}

GeometryPtr build_polygon(const Json& geometry, size_t index) {
    auto coords = geometry.find("coordinates");
    if (coords == geometry.end() || !coords->is_array()) {
        throw MalformedGeometryError(where(index) + ": polygon coordinates must be a list");
    }
    if (coords->size() != 1) {
        throw MalformedGeometryError(where(index) + ": polygon must hold exactly one ring, found " +
                                     std::to_string(coords->size()));
    }
    const Json& ring = (*coords)[0];
    if (!ring.is_array() || ring.size() < MIN_RING_VERTICES) {
        throw MalformedGeometryError(where(index) + ": polygon ring needs at least " +
                                     std::to_string(MIN_RING_VERTICES) + " vertices");
    }
    std::vector<Coord> vertices;
    vertices.reserve(ring.size());
    for (const auto& vertex : ring) {
        if (!vertex.is_array() || vertex.size() != 2 || !vertex[0].is_number() || !vertex[1].is_number()) {
            throw MalformedGeometryError(where(index) + ": unexpected polygon vertex " + vertex.dump());
        }
        vertices.emplace_back(vertex[0].get<double>(), vertex[1].get<double>());
    }
    return GeometryPtr(new OGRPolygon(make_polygon(vertices)));
}

GeometryPtr build_multipolygon(const Json& geometry, size_t index) {
    std::string text = geometry.dump();
    GeometryPtr multipolygon(OGRGeometry::FromHandle(OGR_G_CreateGeometryFromJson(text.c_str())));
    if (!multipolygon || wkbFlatten(multipolygon->getGeometryType()) != wkbMultiPolygon) {
        throw MalformedGeometryError(where(index) + ": could not parse multipolygon " + text);
    }
    if (!multipolygon->IsValid()) {
        throw InvalidGeometryError(where(index) + ": found invalid input multipolygon");
    }
    return multipolygon;
}

bool keep_in_roi(const OGRGeometry& roi, const OGRGeometry& geometry, bool allow_outlying) {
    return allow_outlying ? roi.Intersects(&geometry) : roi.Contains(&geometry);
}
}

std::vector<Feature> parse_features(const Json& collection, const FeatureParseOptions& options) {
    if (!collection.is_object()) {
        throw InvalidFeatureCollectionError("feature collection must be a mapping");
    }
    auto features = collection.find("features");
    if (features == collection.end() || !features->is_array()) {
        throw InvalidFeatureCollectionError("feature collection must hold a 'features' list");
    }
    GEOALIGN_LOG_DEBUG("parsing {} features...", features->size());

    Srs source_srs = parse_crs(declared_crs(collection));
    std::optional<CoordTransform> transform;
    if (options.target_srs) transform = build_transform(source_srs, *options.target_srs);

    std::vector<Feature> kept;
    for (size_t index = 0; index < features->size(); index++) {
        const Json& feature = (*features)[index];
        if (!feature.is_object()) {
            throw InvalidFeatureCollectionError(where(index) + " is not a mapping");
        }
        auto geometry_it = feature.find("geometry");
        if (geometry_it == feature.end() || !geometry_it->is_object()) {
            throw InvalidFeatureCollectionError(where(index) + " has no geometry");
        }
        const Json& geometry = *geometry_it;
        auto type_it = geometry.find("type");
        std::string type = (type_it != geometry.end() && type_it->is_string()) ? type_it->get<std::string>() : "";

        GeometryPtr shape;
        if (type == "Polygon") {
            shape = build_polygon(geometry, index);
        } else if (type == "MultiPolygon") {
            shape = build_multipolygon(geometry, index);
        } else {
            throw UnsupportedGeometryError(where(index) + ": unhandled geometry type '" + type + "'");
        }

        if (transform) transform->apply(*shape);

        if (options.roi) {
            if (!keep_in_roi(*options.roi, *shape, options.allow_outlying)) continue;
            if (options.clip_outlying) {
                shape = intersection(*options.roi, *shape);
                if (!is_polygonal(*shape)) {
                    throw UnexpectedClipResultError(where(index) + ": clipping produced a " +
                                                    shape->getGeometryName());
                }
                type = wkbFlatten(shape->getGeometryType()) == wkbPolygon ? "Polygon" : "MultiPolygon";
            }
        }

        Feature parsed{std::move(shape), type, feature.value("properties", Json::object()), std::nullopt, feature};
        if (feature.contains("id")) parsed.id = feature["id"];
        parsed.members["geometry"] = nullptr;
        parsed.members["type"] = type;
        kept.push_back(std::move(parsed));
    }
    GEOALIGN_LOG_DEBUG("kept {} features after roi validation", kept.size());
    return kept;
}

std::vector<Feature> parse_features(const Json& collection, const std::optional<Srs>& target_srs,
                                    const OGRGeometry* roi, bool allow_outlying, bool clip_outlying) {
    FeatureParseOptions options;
    options.target_srs = target_srs;
    options.roi = roi;
    options.allow_outlying = allow_outlying;
    options.clip_outlying = clip_outlying;
    return parse_features(collection, options);
}

Json load_feature_collection(const std::string& path) {
    std::ifstream file(path);
    if (!file) throw InvalidFeatureCollectionError("Cannot open " + path);
    try {
        return Json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidFeatureCollectionError("could not parse '" + path + "': " + e.what());
    }
}

} // namespace geoalign
