//=============================================================================
// Projector.hpp
//=============================================================================
#pragma once

#include <glm/vec2.hpp>
#include <vector>

#include "GeoFeature.hpp"

/**
 * @brief Local equirectangular projection (degrees -> meters).
 *
 * A local tangent-plane approximation for city-scale extents. x grows east,
 * y grows north. All math is double precision; callers subtract the
 * projection origin before narrowing to float.
 */
namespace geo
{
    inline constexpr double kMetersPerDegree = 111320.0;

    /// Reference latitude used when a feature does not carry "__refLat".
    inline constexpr double kDefaultRefLat = 51.05;

    /// Center used when the feature set gives nothing to average (lon, lat).
    inline const glm::dvec2 kFallbackCenter{-114.0719, 51.0447};

    /**
     * @brief Projects (lon, lat) to planar meters.
     *
     * x = lon * 111320 * cos(refLat), y = lat * 111320.
     */
    [[nodiscard]] glm::dvec2 project(double lon, double lat, double refLatDeg = kDefaultRefLat) noexcept;

    [[nodiscard]] inline glm::dvec2 project(const glm::dvec2& lonLat, double refLatDeg = kDefaultRefLat) noexcept
    {
        return project(lonLat.x, lonLat.y, refLatDeg);
    }

    /**
     * @brief Mean (lon, lat) of the first feature's outer ring.
     *
     * For a MultiPolygon the outer ring of its first polygon is used. Returns
     * kFallbackCenter for an empty set, missing geometry or an empty ring.
     */
    [[nodiscard]] glm::dvec2 geoCenter(const std::vector<GeoFeature>& features) noexcept;

    /**
     * @brief Planar origin all solids are positioned relative to.
     */
    [[nodiscard]] glm::dvec2 projectionOrigin(const std::vector<GeoFeature>& features) noexcept;

} // namespace geo
