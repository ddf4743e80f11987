#pragma once

#include <GeoFeature.hpp>
#include <Projector.hpp>
#include <SceneQuery.hpp>
#include <cmath>
#include <glm/ext/scalar_constants.hpp>
#include <string>
#include <vector>

namespace testutil
{
    inline double metersToLon(double meters, double refLat = geo::kDefaultRefLat)
    {
        return meters / (geo::kMetersPerDegree * std::cos(refLat * glm::pi<double>() / 180.0));
    }

    inline double metersToLat(double meters)
    {
        return meters / geo::kMetersPerDegree;
    }

    /// Closed axis-aligned ring, counter-clockwise, corners offset in meters from (lon, lat).
    inline GeoRing rectRing(double lon, double lat, double x0, double y0, double x1, double y1)
    {
        const double ax = lon + metersToLon(x0);
        const double bx = lon + metersToLon(x1);
        const double ay = lat + metersToLat(y0);
        const double by = lat + metersToLat(y1);

        return {{ax, ay}, {bx, ay}, {bx, by}, {ax, by}, {ax, ay}};
    }

    inline GeoFeature polygonFeature(std::vector<GeoRing> rings, FeatureAttributes attrs)
    {
        GeoFeature f;
        f.geometry.type = GeoGeometryType::Polygon;
        f.geometry.polygons.push_back(GeoPolygon{std::move(rings)});
        f.attributes = geo::makeAttributes(std::move(attrs));
        return f;
    }

    /// Rectangle of w x d meters with its south-west corner east/north of (lon, lat) by (x, y) meters.
    inline GeoFeature rectFeature(const std::string& id,
                                  double             lon,
                                  double             lat,
                                  double             x,
                                  double             y,
                                  double             w,
                                  double             d,
                                  AttributeValue     height = std::monostate{})
    {
        FeatureAttributes attrs{{geo::kIdKey, id}};
        if (!std::holds_alternative<std::monostate>(height))
            attrs.emplace(geo::kHeightKey, height);

        return polygonFeature({rectRing(lon, lat, x, y, x + w, y + d)}, std::move(attrs));
    }

    /// Counts rebuild() and queryNearest() calls; never hits anything.
    class CountingQuery final : public SceneQuery
    {
    public:
        explicit CountingQuery(int* rebuilds, int* queries) : m_rebuilds(rebuilds), m_queries(queries)
        {
        }

        void rebuild(const SceneGraph*) override
        {
            ++*m_rebuilds;
        }

        SolidHit queryNearest(const SceneGraph*, const un::ray&) const override
        {
            ++*m_queries;
            return {};
        }

    private:
        int* m_rebuilds = nullptr;
        int* m_queries  = nullptr;
    };

} // namespace testutil
