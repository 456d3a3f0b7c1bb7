#include "geoscan/geojson.hpp"
#include "geoscan/error.hpp"

#include <boost/json.hpp>

namespace geoscan {

namespace {

constexpr const char* CLUSTER_PROPERTY = "cluster";

[[noreturn]] void corrupt(const std::string& message) {
    throw CorruptDataError("Invalid GeoJSON: " + message, "from_geojson");
}

const boost::json::object& require_object(const boost::json::value& v, const std::string& what) {
    if (!v.is_object()) corrupt(what + " is not an object");
    return v.as_object();
}

const boost::json::array& require_array(const boost::json::object& obj, const char* key,
                                        const std::string& what) {
    const boost::json::value* v = obj.if_contains(key);
    if (!v || !v->is_array()) corrupt(what + " has no '" + key + "' array");
    return v->as_array();
}

void require_type(const boost::json::object& obj, const char* expected, const std::string& what) {
    const boost::json::value* t = obj.if_contains("type");
    if (!t || !t->is_string() || t->as_string() != expected) {
        corrupt(what + " must have type " + expected);
    }
}

double require_number(const boost::json::value& v, const std::string& what) {
    if (!v.is_number()) corrupt(what + " is not a number");
    return v.to_number<double>();
}

std::string cluster_id(const boost::json::object& feature, const std::string& what) {
    const boost::json::value* id = nullptr;
    if (const boost::json::value* props = feature.if_contains("properties"); props && props->is_object()) {
        id = props->as_object().if_contains(CLUSTER_PROPERTY);
    }
    if (!id) {
        id = feature.if_contains("id");
    }
    if (!id) corrupt(what + " has no cluster id");

    if (id->is_string()) return std::string(id->as_string());
    if (id->is_int64()) return std::to_string(id->as_int64());
    if (id->is_uint64()) return std::to_string(id->as_uint64());
    corrupt(what + " cluster id must be a string or an integer");
}

Cluster parse_feature(const boost::json::value& value, size_t n) {
    const std::string what = "feature " + std::to_string(n);
    const auto& feature = require_object(value, what);
    require_type(feature, "Feature", what);

    const boost::json::value* geometry = feature.if_contains("geometry");
    if (!geometry) corrupt(what + " has no geometry");
    const auto& geom = require_object(*geometry, what + " geometry");
    require_type(geom, "Polygon", what + " geometry");

    const auto& rings = require_array(geom, "coordinates", what + " geometry");
    if (rings.empty() || !rings[0].is_array()) corrupt(what + " polygon has no outer ring");

    Cluster cluster;
    cluster.id = cluster_id(feature, what);
    for (const auto& position : rings[0].as_array()) {
        if (!position.is_array() || position.as_array().size() < 2) {
            corrupt(what + " has a malformed position");
        }
        const auto& pos = position.as_array();
        double lng = require_number(pos[0], what + " longitude");
        double lat = require_number(pos[1], what + " latitude");
        cluster.points.emplace_back(lat, lng);
    }
    return cluster;
}

} // anonymous namespace

std::string to_geojson(const Shape& shape) {
    boost::json::array features;
    features.reserve(shape.size());

    for (const auto& cluster : shape.clusters()) {
        boost::json::array ring;
        ring.reserve(cluster.points.size());
        for (const auto& p : cluster.points) {
            boost::json::array position;
            position.push_back(p.lng);
            position.push_back(p.lat);
            ring.push_back(std::move(position));
        }

        boost::json::array rings;
        rings.push_back(std::move(ring));

        boost::json::object geometry;
        geometry["type"] = "Polygon";
        geometry["coordinates"] = std::move(rings);

        boost::json::object properties;
        properties[CLUSTER_PROPERTY] = cluster.id;

        boost::json::object feature;
        feature["type"] = "Feature";
        feature["properties"] = std::move(properties);
        feature["geometry"] = std::move(geometry);
        features.push_back(std::move(feature));
    }

    boost::json::object root;
    root["type"] = "FeatureCollection";
    root["features"] = std::move(features);
    return boost::json::serialize(root);
}

Shape from_geojson(const std::string& text) {
    boost::json::parse_options options;
    options.numbers = boost::json::number_precision::precise;

    boost::system::error_code ec;
    boost::json::value root = boost::json::parse(text, ec, {}, options);
    if (ec) {
        corrupt(ec.message());
    }

    const auto& collection = require_object(root, "document");
    require_type(collection, "FeatureCollection", "document");
    const auto& features = require_array(collection, "features", "document");

    std::vector<Cluster> clusters;
    clusters.reserve(features.size());
    for (size_t i = 0; i < features.size(); ++i) {
        clusters.push_back(parse_feature(features[i], i));
    }

    try {
        return Shape(std::move(clusters));
    } catch (const InvalidArgumentError& e) {
        throw CorruptDataError("Invalid GeoJSON: " + e.message(), __func__);
    }
}

} // namespace geoscan
