#include <Projector.hpp>
#include <cmath>
#include <gtest/gtest.h>

#include "TestHelpers.hpp"

TEST(Projector, ScalesLongitudeByReferenceLatitude)
{
    const glm::dvec2 atEquator = geo::project(1.0, 1.0, 0.0);
    EXPECT_NEAR(atEquator.x, 111320.0, 1e-6);
    EXPECT_NEAR(atEquator.y, 111320.0, 1e-6);

    const glm::dvec2 at60 = geo::project(1.0, 0.0, 60.0);
    EXPECT_NEAR(at60.x, 55660.0, 1e-6);
    EXPECT_DOUBLE_EQ(at60.y, 0.0);
}

TEST(Projector, DefaultReferenceLatitude)
{
    const glm::dvec2 p = geo::project(-114.0, 51.0);
    const double     k = 111320.0 * std::cos(51.05 * glm::pi<double>() / 180.0);

    EXPECT_NEAR(p.x, -114.0 * k, 1e-6);
    EXPECT_NEAR(p.y, 51.0 * 111320.0, 1e-6);
}

TEST(Projector, CenterOfEmptySetIsFallback)
{
    const glm::dvec2 c = geo::geoCenter({});
    EXPECT_DOUBLE_EQ(c.x, -114.0719);
    EXPECT_DOUBLE_EQ(c.y, 51.0447);
}

TEST(Projector, CenterIsMeanOfFirstOuterRing)
{
    GeoFeature first  = testutil::polygonFeature({GeoRing{{0.0, 0.0}, {2.0, 0.0}, {2.0, 2.0}, {0.0, 2.0}}}, {});
    GeoFeature second = testutil::polygonFeature({GeoRing{{50.0, 50.0}, {51.0, 50.0}, {51.0, 51.0}}}, {});

    const glm::dvec2 c = geo::geoCenter({first, second});
    EXPECT_DOUBLE_EQ(c.x, 1.0);
    EXPECT_DOUBLE_EQ(c.y, 1.0);
}

TEST(Projector, CenterFallsBackWhenFirstFeatureHasNoGeometry)
{
    GeoFeature empty;
    GeoFeature rect = testutil::rectFeature("a", 10.0, 10.0, 0.0, 0.0, 10.0, 10.0);

    const glm::dvec2 c = geo::geoCenter({empty, rect});
    EXPECT_DOUBLE_EQ(c.x, geo::kFallbackCenter.x);
    EXPECT_DOUBLE_EQ(c.y, geo::kFallbackCenter.y);
}

TEST(Projector, CenterUsesFirstPolygonOfMultiPolygon)
{
    GeoFeature f;
    f.geometry.type = GeoGeometryType::MultiPolygon;
    f.geometry.polygons.push_back(GeoPolygon{{GeoRing{{4.0, 4.0}, {6.0, 4.0}, {6.0, 6.0}, {4.0, 6.0}}}});
    f.geometry.polygons.push_back(GeoPolygon{{GeoRing{{90.0, 0.0}, {91.0, 0.0}, {91.0, 1.0}}}});

    const glm::dvec2 c = geo::geoCenter({f});
    EXPECT_DOUBLE_EQ(c.x, 5.0);
    EXPECT_DOUBLE_EQ(c.y, 5.0);
}

TEST(Projector, OriginIsProjectedCenter)
{
    GeoFeature f = testutil::polygonFeature({GeoRing{{-114.0, 51.0}, {-113.0, 51.0}, {-113.0, 52.0}, {-114.0, 52.0}}}, {});

    const glm::dvec2 origin   = geo::projectionOrigin({f});
    const glm::dvec2 expected = geo::project(-113.5, 51.5);

    EXPECT_NEAR(origin.x, expected.x, 1e-6);
    EXPECT_NEAR(origin.y, expected.y, 1e-6);
}
