#include <Extruder.hpp>
#include <Projector.hpp>
#include <Solid.hpp>
#include <algorithm>
#include <gtest/gtest.h>

#include "TestHelpers.hpp"

namespace
{
    constexpr double kLon = -114.07;
    constexpr double kLat = 51.04;

    glm::dvec2 originOf(const GeoFeature& f)
    {
        return geo::projectionOrigin({f});
    }

    std::unique_ptr<Solid> extrude(const GeoFeature& f, const HighlightSet& hl = {})
    {
        return Extruder().extrude(f, originOf(f), hl);
    }

    GeoRing reversed(GeoRing r)
    {
        std::reverse(r.begin(), r.end());
        return r;
    }
} // namespace

TEST(Extruder, RectangleIsAClosedPrism)
{
    GeoFeature f = testutil::rectFeature("r1", kLon, kLat, 0.0, 0.0, 20.0, 10.0, 10.0);

    auto solid = extrude(f);
    ASSERT_NE(solid, nullptr);

    // Two caps of two triangles, four walls of two triangles.
    EXPECT_EQ(solid->mesh().triangleCount(), 12u);
    EXPECT_EQ(solid->holeCount(), 0);
    EXPECT_TRUE(solid->windingConsistent());
    EXPECT_NEAR(solid->footprintArea(), 200.0, 1e-3);

    // Caps plus walls: 2 * 200 + 60 * 10.
    EXPECT_NEAR(solid->mesh().surfaceArea(), 1000.0, 1e-2);

    EXPECT_EQ(solid->featureId(), "r1");
    EXPECT_EQ(solid->attributes(), f.attributes);
}

TEST(Extruder, SpansGroundToDepth)
{
    GeoFeature f     = testutil::rectFeature("r1", kLon, kLat, 0.0, 0.0, 20.0, 10.0, 35.0);
    auto       solid = extrude(f);
    ASSERT_NE(solid, nullptr);

    const SolidBounds& b = solid->bounds();
    EXPECT_FALSE(b.empty);
    EXPECT_FLOAT_EQ(b.min.y, 0.0f);
    EXPECT_FLOAT_EQ(b.max.y, 35.0f);
    EXPECT_DOUBLE_EQ(solid->depth(), 35.0);

    EXPECT_NEAR(b.max.x - b.min.x, 20.0f, 1e-2f);
    EXPECT_NEAR(b.max.z - b.min.z, 10.0f, 1e-2f);
}

TEST(Extruder, NorthMapsToNegativeZ)
{
    GeoFeature anchor = testutil::rectFeature("a", kLon, kLat, -5.0, -5.0, 10.0, 10.0);
    GeoFeature north  = testutil::rectFeature("n", kLon, kLat, -5.0, 100.0, 10.0, 10.0);

    const glm::dvec2 origin = originOf(anchor);
    auto             solid  = Extruder().extrude(north, origin, {});
    ASSERT_NE(solid, nullptr);

    EXPECT_LT(solid->bounds().max.z, -90.0f);
    EXPECT_LT(solid->bounds().min.z, solid->bounds().max.z);
}

TEST(Extruder, HoleIsCutFromBothCaps)
{
    const GeoRing outer = testutil::rectRing(kLon, kLat, 0.0, 0.0, 20.0, 20.0);
    const GeoRing hole  = reversed(testutil::rectRing(kLon, kLat, 5.0, 5.0, 15.0, 15.0));

    GeoFeature f     = testutil::polygonFeature({outer, hole}, {{"id", std::string("h")}});
    auto       solid = extrude(f);
    ASSERT_NE(solid, nullptr);

    EXPECT_EQ(solid->holeCount(), 1);
    EXPECT_TRUE(solid->windingConsistent());
    EXPECT_NEAR(solid->footprintArea(), 300.0, 1e-2);

    // Caps 2 * 300, outer walls 80 * 10, inner walls 40 * 10.
    EXPECT_NEAR(solid->mesh().surfaceArea(), 1800.0, 1e-1);
}

TEST(Extruder, HoleWoundLikeOuterRingIsKeptAsIs)
{
    const GeoRing outer = testutil::rectRing(kLon, kLat, 0.0, 0.0, 20.0, 20.0);
    const GeoRing hole  = testutil::rectRing(kLon, kLat, 5.0, 5.0, 15.0, 15.0);

    auto solid = extrude(testutil::polygonFeature({outer, hole}, {}));
    ASSERT_NE(solid, nullptr);

    EXPECT_FALSE(solid->windingConsistent());
    EXPECT_EQ(solid->holeCount(), 1);
}

TEST(Extruder, DegenerateHoleIsIgnored)
{
    const GeoRing outer = testutil::rectRing(kLon, kLat, 0.0, 0.0, 20.0, 20.0);
    const GeoRing hole  = {{kLon, kLat}, {kLon, kLat}};

    auto solid = extrude(testutil::polygonFeature({outer, hole}, {}));
    ASSERT_NE(solid, nullptr);
    EXPECT_EQ(solid->holeCount(), 0);
    EXPECT_NEAR(solid->footprintArea(), 400.0, 1e-2);
}

TEST(Extruder, HeightRules)
{
    struct Case
    {
        AttributeValue height;
        double         expected;
    };

    const std::vector<Case> cases = {
        {std::monostate{}, 10.0},
        {0.0, 10.0},
        {std::string("abc"), 10.0},
        {true, 10.0},
        {std::string("25"), 25.0},
        {42.0, 42.0},
        {0.5, 1.0},
        {-5.0, 1.0},
    };

    for (const Case& c : cases)
    {
        GeoFeature f     = testutil::rectFeature("h", kLon, kLat, 0.0, 0.0, 10.0, 10.0, c.height);
        auto       solid = extrude(f);
        ASSERT_NE(solid, nullptr);
        EXPECT_DOUBLE_EQ(solid->depth(), c.expected) << "height " << geo::attributeText(c.height);
        EXPECT_DOUBLE_EQ(geo::extrusionHeight(f), c.expected);
    }
}

TEST(Extruder, HighlightSelectsMaterial)
{
    const Extruder ex(0x112233, 0xaabbcc);
    GeoFeature     f      = testutil::rectFeature("p7", kLon, kLat, 0.0, 0.0, 10.0, 10.0);
    const auto     origin = originOf(f);

    auto plain = ex.extrude(f, origin, {"other"});
    auto lit   = ex.extrude(f, origin, {"p7"});
    ASSERT_NE(plain, nullptr);
    ASSERT_NE(lit, nullptr);

    EXPECT_FALSE(plain->material().highlighted);
    EXPECT_EQ(plain->material().color, 0x112233u);
    EXPECT_TRUE(lit->material().highlighted);
    EXPECT_EQ(lit->material().color, 0xaabbccu);
}

TEST(Extruder, NumericIdMatchesHighlight)
{
    GeoFeature f = testutil::polygonFeature({testutil::rectRing(kLon, kLat, 0.0, 0.0, 10.0, 10.0)},
                                            {{"id", 1234.0}});

    auto solid = extrude(f, {"1234"});
    ASSERT_NE(solid, nullptr);
    EXPECT_EQ(solid->featureId(), "1234");
    EXPECT_TRUE(solid->material().highlighted);
}

TEST(Extruder, IsDeterministic)
{
    GeoFeature f = testutil::rectFeature("d", kLon, kLat, 3.0, 4.0, 17.0, 9.0, 12.0);

    auto a = extrude(f);
    auto b = extrude(f);
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);

    EXPECT_EQ(a->mesh().positions(), b->mesh().positions());
    EXPECT_EQ(a->mesh().normals(), b->mesh().normals());
}

TEST(Extruder, RejectsUnusableGeometry)
{
    const Extruder   ex;
    const glm::dvec2 origin = geo::project(kLon, kLat);

    GeoFeature none;
    EXPECT_EQ(ex.extrude(none, origin, {}), nullptr);

    GeoFeature noRings;
    noRings.geometry.type = GeoGeometryType::Polygon;
    noRings.geometry.polygons.emplace_back();
    EXPECT_EQ(ex.extrude(noRings, origin, {}), nullptr);

    GeoFeature twoPoints = testutil::polygonFeature({GeoRing{{kLon, kLat}, {kLon + 0.001, kLat}, {kLon, kLat}}}, {});
    EXPECT_EQ(ex.extrude(twoPoints, origin, {}), nullptr);

    GeoFeature repeated = testutil::polygonFeature({GeoRing{{kLon, kLat}, {kLon, kLat}, {kLon, kLat}, {kLon, kLat}}}, {});
    EXPECT_EQ(ex.extrude(repeated, origin, {}), nullptr);
}

TEST(Extruder, MultiPolygonUsesFirstMemberOnly)
{
    GeoFeature f;
    f.geometry.type = GeoGeometryType::MultiPolygon;
    f.geometry.polygons.push_back(GeoPolygon{{testutil::rectRing(kLon, kLat, 0.0, 0.0, 10.0, 10.0)}});
    f.geometry.polygons.push_back(GeoPolygon{{testutil::rectRing(kLon, kLat, 500.0, 0.0, 600.0, 100.0)}});
    f.attributes = geo::makeAttributes({{"id", std::string("m")}});

    auto solid = extrude(f);
    ASSERT_NE(solid, nullptr);
    EXPECT_NEAR(solid->footprintArea(), 100.0, 1e-2);
}

TEST(Extruder, EmptyFirstMemberRejectsMultiPolygon)
{
    GeoFeature f;
    f.geometry.type = GeoGeometryType::MultiPolygon;
    f.geometry.polygons.emplace_back();
    f.geometry.polygons.push_back(GeoPolygon{{testutil::rectRing(kLon, kLat, 0.0, 0.0, 10.0, 10.0)}});

    EXPECT_EQ(extrude(f), nullptr);
}
