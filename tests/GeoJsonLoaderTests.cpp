#include <GeoJsonLoader.hpp>
#include <gtest/gtest.h>

namespace
{
    const AttributeValue* attr(const GeoFeature& f, const char* key)
    {
        return geo::findAttribute(f.attributes.get(), key);
    }

    const char* kCollection = R"({
      "type": "FeatureCollection",
      "features": [
        {
          "type": "Feature",
          "properties": { "id": "P-1", "address": "1 Main St", "height_m": 12, "corner": true, "note": null },
          "geometry": {
            "type": "Polygon",
            "coordinates": [
              [[-114.07, 51.04], [-114.069, 51.04], [-114.069, 51.041], [-114.07, 51.041], [-114.07, 51.04]],
              [[-114.0698, 51.0402], [-114.0698, 51.0404], [-114.0696, 51.0404], [-114.0696, 51.0402], [-114.0698, 51.0402]]
            ]
          }
        },
        {
          "type": "Feature",
          "properties": { "id": 2040, "tags": ["a", "b"], "meta": { "k": 1 } },
          "geometry": {
            "type": "MultiPolygon",
            "coordinates": [
              [[[-114.0, 51.0, 1045.0], [-113.99, 51.0], [-113.99, 51.01], [-114.0, 51.0]]],
              [[[-113.9, 51.0], [-113.89, 51.0], [-113.89, 51.01], [-113.9, 51.0]]]
            ]
          }
        },
        {
          "type": "Feature",
          "id": "from-feature",
          "properties": { "zoning": "R-C2" },
          "geometry": { "type": "Point", "coordinates": [-114.0, 51.0] }
        },
        {
          "type": "Feature",
          "properties": { "id": "no-shape" },
          "geometry": null
        }
      ]
    })";
} // namespace

TEST(GeoJsonLoader, ReadsFeatureCollection)
{
    GeoJsonLoader loader;
    ASSERT_TRUE(loader.parse(kCollection));
    EXPECT_TRUE(loader.errorString().isEmpty());
    EXPECT_EQ(loader.skipped(), 0);

    const auto& features = loader.features();
    ASSERT_EQ(features.size(), 4u);

    EXPECT_EQ(features[0].id(), "P-1");
    EXPECT_EQ(features[1].id(), "2040");
    EXPECT_EQ(features[2].id(), "from-feature");
    EXPECT_EQ(features[3].id(), "no-shape");
}

TEST(GeoJsonLoader, PolygonKeepsRingsInOrder)
{
    GeoJsonLoader loader;
    ASSERT_TRUE(loader.parse(kCollection));

    const GeoGeometry& g = loader.features()[0].geometry;
    EXPECT_EQ(g.type, GeoGeometryType::Polygon);
    ASSERT_EQ(g.polygons.size(), 1u);
    ASSERT_EQ(g.polygons[0].rings.size(), 2u);
    ASSERT_EQ(g.polygons[0].rings[0].size(), 5u);

    EXPECT_DOUBLE_EQ(g.polygons[0].rings[0][1].x, -114.069);
    EXPECT_DOUBLE_EQ(g.polygons[0].rings[0][1].y, 51.04);
}

TEST(GeoJsonLoader, MultiPolygonIgnoresAltitude)
{
    GeoJsonLoader loader;
    ASSERT_TRUE(loader.parse(kCollection));

    const GeoGeometry& g = loader.features()[1].geometry;
    EXPECT_EQ(g.type, GeoGeometryType::MultiPolygon);
    ASSERT_EQ(g.polygons.size(), 2u);

    ASSERT_NE(g.primary(), nullptr);
    EXPECT_DOUBLE_EQ(g.primary()->outer()->front().x, -114.0);
    EXPECT_DOUBLE_EQ(g.primary()->outer()->front().y, 51.0);
}

TEST(GeoJsonLoader, OtherGeometriesHaveNoShape)
{
    GeoJsonLoader loader;
    ASSERT_TRUE(loader.parse(kCollection));

    EXPECT_EQ(loader.features()[2].geometry.type, GeoGeometryType::None);
    EXPECT_EQ(loader.features()[2].geometry.primary(), nullptr);
    EXPECT_EQ(loader.features()[3].geometry.type, GeoGeometryType::None);
}

TEST(GeoJsonLoader, PropertyTypes)
{
    GeoJsonLoader loader;
    ASSERT_TRUE(loader.parse(kCollection));

    const GeoFeature& a = loader.features()[0];
    ASSERT_NE(attr(a, "height_m"), nullptr);
    EXPECT_EQ(std::get<double>(*attr(a, "height_m")), 12.0);
    EXPECT_EQ(std::get<bool>(*attr(a, "corner")), true);
    EXPECT_EQ(std::get<std::string>(*attr(a, "address")), "1 Main St");

    ASSERT_NE(attr(a, "note"), nullptr);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(*attr(a, "note")));

    const GeoFeature& b = loader.features()[1];
    EXPECT_EQ(std::get<double>(*attr(b, "id")), 2040.0);
    EXPECT_EQ(std::get<std::string>(*attr(b, "tags")), R"(["a","b"])");
    EXPECT_EQ(std::get<std::string>(*attr(b, "meta")), R"({"k":1})");
}

TEST(GeoJsonLoader, PropertyIdWinsOverFeatureId)
{
    GeoJsonLoader loader;
    ASSERT_TRUE(loader.parse(R"({"type":"Feature","id":"outer","properties":{"id":"inner"},"geometry":null})"));

    ASSERT_EQ(loader.features().size(), 1u);
    EXPECT_EQ(loader.features()[0].id(), "inner");
}

TEST(GeoJsonLoader, MalformedFeaturesAreSkipped)
{
    const char* doc = R"({
      "type": "FeatureCollection",
      "features": [
        { "type": "Feature", "properties": { "id": "bad-pos" },
          "geometry": { "type": "Polygon", "coordinates": [[[-114.0], [-113.9, 51.0], [-113.9, 51.1]]] } },
        { "type": "Feature", "properties": { "id": "bad-text" },
          "geometry": { "type": "Polygon", "coordinates": [[["x", "y"], [-113.9, 51.0], [-113.9, 51.1]]] } },
        { "type": "Feature", "properties": { "id": "no-coords" },
          "geometry": { "type": "MultiPolygon" } },
        42,
        { "type": "Feature", "properties": { "id": "good" },
          "geometry": { "type": "Polygon", "coordinates": [[[-114.0, 51.0], [-113.9, 51.0], [-113.9, 51.1], [-114.0, 51.0]]] } }
      ]
    })";

    GeoJsonLoader loader;
    ASSERT_TRUE(loader.parse(doc));

    EXPECT_EQ(loader.skipped(), 4);
    ASSERT_EQ(loader.features().size(), 1u);
    EXPECT_EQ(loader.features()[0].id(), "good");
}

TEST(GeoJsonLoader, RejectsInvalidDocuments)
{
    GeoJsonLoader loader;

    EXPECT_FALSE(loader.parse("{ not json"));
    EXPECT_FALSE(loader.errorString().isEmpty());

    EXPECT_FALSE(loader.parse("[1, 2, 3]"));
    EXPECT_FALSE(loader.errorString().isEmpty());

    EXPECT_FALSE(loader.parse(R"({"type":"GeometryCollection","geometries":[]})"));
    EXPECT_FALSE(loader.errorString().isEmpty());

    EXPECT_FALSE(loader.parse(R"({"type":"FeatureCollection","features":{}})"));
    EXPECT_TRUE(loader.features().empty());
}

TEST(GeoJsonLoader, ParseResetsPreviousState)
{
    GeoJsonLoader loader;
    ASSERT_FALSE(loader.parse("nope"));

    ASSERT_TRUE(loader.parse(R"({"type":"FeatureCollection","features":[]})"));
    EXPECT_TRUE(loader.errorString().isEmpty());
    EXPECT_TRUE(loader.features().empty());
    EXPECT_EQ(loader.skipped(), 0);
}

TEST(GeoJsonLoader, MissingFileFails)
{
    GeoJsonLoader loader;
    EXPECT_FALSE(loader.loadFile(QStringLiteral("/nonexistent/parcels.geojson")));
    EXPECT_FALSE(loader.errorString().isEmpty());
}

TEST(GeoJsonLoader, TakeFeaturesEmptiesLoader)
{
    GeoJsonLoader loader;
    ASSERT_TRUE(loader.parse(kCollection));

    const std::vector<GeoFeature> taken = loader.takeFeatures();
    EXPECT_EQ(taken.size(), 4u);
    EXPECT_TRUE(loader.features().empty());
}
