//
// Created by liuliwu on 2026-10-19.
//

#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <string>
#include <vector>

#include "common.h"
#include "error.h"
#include "payload.h"
#include "test_util.h"

namespace geoLocate::test {

class PayloadTest : public ::testing::Test {
protected:
    std::string countriesJson() {
        return featureCollectionJson({
                polygonFeatureJson({rectRing(0, 0, 10, 10)},
                                   R"({"ADMIN":"Testland","POP_EST":12.5,"ACTIVE":true,"NOTE":null,"TAGS":["a"]})"),
                R"({"type":"Feature","properties":{"ADMIN":"Islands"},"geometry":{"type":"MultiPolygon","coordinates":[[[[20,20],[22,20],[22,22],[20,22],[20,20]]],[[[30,30,5],[32,30,5],[32,32,5],[30,32,5],[30,30,5]]]]}})"
        });
    }
};

TEST_F(PayloadTest, DecodeFeatureCollection) {
    std::vector<Feature> features;
    Error err;
    ASSERT_EQ(Payload::decode(countriesJson(), &features, &err), C_OK);
    ASSERT_EQ(features.size(), 2u);

    const Feature &first = features[0];
    EXPECT_EQ(first.geometry.type, GEOMETRY_TYPE_POLYGON);
    ASSERT_EQ(first.geometry.polygons.size(), 1u);
    ASSERT_EQ(first.geometry.polygons[0].size(), 1u);
    EXPECT_EQ(first.geometry.polygons[0][0].size(), 5u);
    EXPECT_EQ(first.geometry.polygons[0][0][1], Point(10, 0));

    EXPECT_EQ(first.properties.at("ADMIN").type, PROPERTY_TYPE_STRING);
    EXPECT_EQ(first.properties.at("ADMIN").str, "Testland");
    EXPECT_EQ(first.properties.at("POP_EST").type, PROPERTY_TYPE_NUMBER);
    EXPECT_DOUBLE_EQ(first.properties.at("POP_EST").number, 12.5);
    EXPECT_EQ(first.properties.at("ACTIVE").type, PROPERTY_TYPE_BOOL);
    EXPECT_TRUE(first.properties.at("ACTIVE").boolean);
    EXPECT_EQ(first.properties.at("NOTE").type, PROPERTY_TYPE_NULL);
    EXPECT_EQ(first.properties.count("TAGS"), 0u);

    const Feature &second = features[1];
    EXPECT_EQ(second.geometry.type, GEOMETRY_TYPE_MULTI_POLYGON);
    ASSERT_EQ(second.geometry.polygons.size(), 2u);
    EXPECT_EQ(second.geometry.polygons[1][0][0], Point(30, 30));
}

TEST_F(PayloadTest, DecodeGzip) {
    std::string data = gzipString(countriesJson());
    ASSERT_TRUE(Payload::isGzip(data));
    EXPECT_FALSE(Payload::isGzip(countriesJson()));

    std::vector<Feature> features;
    Error err;
    ASSERT_EQ(Payload::decode(data, &features, &err), C_OK);
    EXPECT_EQ(features.size(), 2u);
}

TEST_F(PayloadTest, EmptyPayload) {
    std::vector<Feature> features;
    Error err;
    EXPECT_EQ(Payload::decode("", &features, &err), C_ERR);
    EXPECT_EQ(err.getErrorNo(), ERRNO_EMPTY_PAYLOAD);
}

TEST_F(PayloadTest, BrokenGzip) {
    std::string data = gzipString(countriesJson());
    data.resize(data.size() / 2);
    std::vector<Feature> features;
    Error err;
    EXPECT_EQ(Payload::decode(data, &features, &err), C_ERR);
    EXPECT_EQ(err.getErrorNo(), ERRNO_DECOMPRESSION_FAILURE);

    std::string garbage = "\x1f\x8bnot really gzip";
    err.reset();
    EXPECT_EQ(Payload::decode(garbage, &features, &err), C_ERR);
    EXPECT_EQ(err.getErrorNo(), ERRNO_DECOMPRESSION_FAILURE);
}

TEST_F(PayloadTest, DecodeFailures) {
    const char *cases[] = {
            "{not json",
            R"({"type":"Feature"})",
            R"({"type":"FeatureCollection"})",
            R"({"type":"FeatureCollection","features":[1]})",
            R"({"type":"FeatureCollection","features":[{"type":"Feature","geometry":{"type":"Polygon","coordinates":[[["a",1]]]}}]})",
            R"({"type":"FeatureCollection","features":[{"type":"Feature","geometry":{"type":"Polygon"}}]})",
    };
    for (const char *json : cases) {
        std::vector<Feature> features;
        Error err;
        EXPECT_EQ(Payload::decode(json, &features, &err), C_ERR) << json;
        EXPECT_EQ(err.getErrorNo(), ERRNO_DECODE_FAILURE) << json;
    }
}

TEST_F(PayloadTest, OtherGeometryKindsAreLeftToNormalizer) {
    std::string json = featureCollectionJson({
            R"({"type":"Feature","properties":{},"geometry":{"type":"Point","coordinates":[1,2]}})",
            R"({"type":"Feature","properties":{},"geometry":null})",
            R"({"type":"Feature","properties":{"ADMIN":"Nowhere"}})"
    });
    std::vector<Feature> features;
    Error err;
    ASSERT_EQ(Payload::decode(json, &features, &err), C_OK);
    ASSERT_EQ(features.size(), 3u);
    EXPECT_EQ(features[0].geometry.type, GEOMETRY_TYPE_UNKNOWN);
    EXPECT_EQ(features[1].geometry.type, GEOMETRY_TYPE_UNKNOWN);
    EXPECT_EQ(features[2].geometry.type, GEOMETRY_TYPE_UNKNOWN);
    EXPECT_TRUE(features[2].geometry.polygons.empty());
    EXPECT_EQ(features[2].properties.at("ADMIN").str, "Nowhere");
}

TEST_F(PayloadTest, EncodeGeometry) {
    Geometry geometry;
    geometry.type = GEOMETRY_TYPE_MULTI_POLYGON;
    geometry.polygons.push_back({rectRing(0, 0, 1, 1)});
    geometry.polygons.push_back({rectRing(5, 5, 6, 6)});

    rapidjson::Document doc;
    rapidjson::Value obj;
    Payload::encodeGeometry(geometry, &obj, doc.GetAllocator());
    ASSERT_TRUE(obj.IsObject());
    EXPECT_STREQ(obj["type"].GetString(), "MultiPolygon");
    const rapidjson::Value &coordinates = obj["coordinates"];
    ASSERT_EQ(coordinates.Size(), 2u);
    EXPECT_EQ(coordinates[1][0].Size(), 5u);
    EXPECT_DOUBLE_EQ(coordinates[1][0][0][0].GetDouble(), 5.0);
    EXPECT_DOUBLE_EQ(coordinates[1][0][0][1].GetDouble(), 5.0);
}

}  // namespace geoLocate::test
