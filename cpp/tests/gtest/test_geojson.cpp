// =============================================================================
// GeoJSON Codec Tests
// =============================================================================

#include <gtest/gtest.h>
#include "geoscan/error.hpp"
#include "geoscan/geojson.hpp"

#include <boost/json.hpp>

using namespace geoscan;

class GeoJsonTest : public ::testing::Test {
protected:
    Shape sample() const {
        return Shape({
            Cluster("A", {{40.0, -73.0}, {40.0, -72.9}, {40.1, -72.9}}),
            Cluster("B", {{0.1 + 0.2, 1e-9}, {-89.999999999, 179.123456789012}, {12.3456789, -45.6789012}, {0.0, 0.0}}),
        });
    }
};

TEST_F(GeoJsonTest, EncodesFeatureCollection) {
    boost::json::value doc = boost::json::parse(to_geojson(sample()));
    const auto& root = doc.as_object();
    EXPECT_EQ(root.at("type").as_string(), "FeatureCollection");

    const auto& features = root.at("features").as_array();
    ASSERT_EQ(features.size(), 2u);

    const auto& first = features[0].as_object();
    EXPECT_EQ(first.at("type").as_string(), "Feature");
    EXPECT_EQ(first.at("properties").as_object().at("cluster").as_string(), "A");

    const auto& geometry = first.at("geometry").as_object();
    EXPECT_EQ(geometry.at("type").as_string(), "Polygon");
    const auto& ring = geometry.at("coordinates").as_array()[0].as_array();
    // Ring written as given, without a closing point
    ASSERT_EQ(ring.size(), 3u);
    EXPECT_DOUBLE_EQ(ring[0].as_array()[0].to_number<double>(), -73.0);
    EXPECT_DOUBLE_EQ(ring[0].as_array()[1].to_number<double>(), 40.0);
}

TEST_F(GeoJsonTest, SingleLine) {
    EXPECT_EQ(to_geojson(sample()).find('\n'), std::string::npos);
}

TEST_F(GeoJsonTest, DecodeRestoresExactCoordinates) {
    Shape shape = sample();
    Shape decoded = from_geojson(to_geojson(shape));
    EXPECT_EQ(decoded, shape);
}

TEST_F(GeoJsonTest, EmptyShape) {
    Shape decoded = from_geojson(to_geojson(Shape()));
    EXPECT_TRUE(decoded.empty());
}

TEST_F(GeoJsonTest, AcceptsIntegerAndFeatureIds) {
    const std::string text = R"({"type":"FeatureCollection","features":[
        {"type":"Feature","properties":{"cluster":7},
         "geometry":{"type":"Polygon","coordinates":[[[1,2],[3,4],[5,6],[1,2]]]}},
        {"type":"Feature","id":"fid","properties":{},
         "geometry":{"type":"Polygon","coordinates":[[[0,0],[0,1],[1,1]]]}}]})";

    Shape shape = from_geojson(text);
    ASSERT_EQ(shape.size(), 2u);
    EXPECT_EQ(shape.clusters()[0].id, "7");
    EXPECT_EQ(shape.clusters()[0].points.size(), 4u);
    EXPECT_EQ(shape.clusters()[0].points[1], LatLng(4.0, 3.0));
    EXPECT_EQ(shape.clusters()[1].id, "fid");
}

TEST_F(GeoJsonTest, RejectsMalformedDocuments) {
    EXPECT_THROW(from_geojson("not json"), CorruptDataError);
    EXPECT_THROW(from_geojson("[]"), CorruptDataError);
    EXPECT_THROW(from_geojson(R"({"type":"Feature"})"), CorruptDataError);
    EXPECT_THROW(from_geojson(R"({"type":"FeatureCollection"})"), CorruptDataError);

    // Point geometry
    EXPECT_THROW(from_geojson(R"({"type":"FeatureCollection","features":[
        {"type":"Feature","properties":{"cluster":"A"},
         "geometry":{"type":"Point","coordinates":[1,2]}}]})"), CorruptDataError);

    // No cluster id
    EXPECT_THROW(from_geojson(R"({"type":"FeatureCollection","features":[
        {"type":"Feature","properties":{},
         "geometry":{"type":"Polygon","coordinates":[[[0,0],[0,1],[1,1]]]}}]})"), CorruptDataError);

    // Non-numeric coordinate
    EXPECT_THROW(from_geojson(R"({"type":"FeatureCollection","features":[
        {"type":"Feature","properties":{"cluster":"A"},
         "geometry":{"type":"Polygon","coordinates":[[["x",0],[0,1],[1,1]]]}}]})"), CorruptDataError);
}

TEST_F(GeoJsonTest, InvalidClustersBecomeCorruptData) {
    // Too few points
    EXPECT_THROW(from_geojson(R"({"type":"FeatureCollection","features":[
        {"type":"Feature","properties":{"cluster":"A"},
         "geometry":{"type":"Polygon","coordinates":[[[0,0],[0,1]]]}}]})"), CorruptDataError);

    // Duplicate ids
    EXPECT_THROW(from_geojson(R"({"type":"FeatureCollection","features":[
        {"type":"Feature","properties":{"cluster":"A"},
         "geometry":{"type":"Polygon","coordinates":[[[0,0],[0,1],[1,1]]]}},
        {"type":"Feature","properties":{"cluster":"A"},
         "geometry":{"type":"Polygon","coordinates":[[[2,2],[2,3],[3,3]]]}}]})"), CorruptDataError);
}
