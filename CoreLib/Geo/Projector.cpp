#include "Projector.hpp"

#include <cmath>
#include <glm/ext/scalar_constants.hpp>

namespace geo
{
    glm::dvec2 project(double lon, double lat, double refLatDeg) noexcept
    {
        const double refRad     = refLatDeg * glm::pi<double>() / 180.0;
        const double mPerDegLon = kMetersPerDegree * std::cos(refRad);

        return {lon * mPerDegLon, lat * kMetersPerDegree};
    }

    glm::dvec2 geoCenter(const std::vector<GeoFeature>& features) noexcept
    {
        if (features.empty())
            return kFallbackCenter;

        const GeoPolygon* poly = features.front().geometry.primary();
        const GeoRing*    ring = poly ? poly->outer() : nullptr;

        if (!ring || ring->empty())
            return kFallbackCenter;

        glm::dvec2 sum{0.0};
        for (const glm::dvec2& pt : *ring)
            sum += pt;

        return sum / static_cast<double>(ring->size());
    }

    glm::dvec2 projectionOrigin(const std::vector<GeoFeature>& features) noexcept
    {
        return project(geoCenter(features));
    }

} // namespace geo
