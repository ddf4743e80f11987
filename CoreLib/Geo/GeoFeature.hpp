//=============================================================================
// GeoFeature.hpp
//=============================================================================
#pragma once

#include <glm/vec2.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

/**
 * @brief One attribute value as delivered by the feature source (JSON scalar).
 */
using AttributeValue = std::variant<std::monostate, bool, double, std::string>;

/**
 * @brief Attribute mapping of one feature.
 *
 * Shared read-only between the feature, the scene graph bindings and the pick
 * state so a hovered/selected reference stays valid after the feature set has
 * been replaced.
 */
using FeatureAttributes    = std::map<std::string, AttributeValue>;
using FeatureAttributesPtr = std::shared_ptr<const FeatureAttributes>;

/// Closed ring of (longitude, latitude) pairs in degrees.
using GeoRing = std::vector<glm::dvec2>;

/**
 * @brief Polygon: rings[0] is the outer boundary, rings[1..] are holes.
 */
struct GeoPolygon
{
    std::vector<GeoRing> rings = {};

    [[nodiscard]] const GeoRing* outer() const noexcept
    {
        return rings.empty() ? nullptr : &rings.front();
    }
};

enum class GeoGeometryType
{
    None,
    Polygon,
    MultiPolygon
};

/**
 * @brief Polygon or multi-polygon geometry.
 *
 * A Polygon stores exactly one entry in `polygons`; a MultiPolygon stores one
 * entry per member polygon.
 */
struct GeoGeometry
{
    GeoGeometryType         type     = GeoGeometryType::None;
    std::vector<GeoPolygon> polygons = {};

    /**
     * @brief The polygon used for extrusion and centering (the first one).
     */
    [[nodiscard]] const GeoPolygon* primary() const noexcept;
};

/**
 * @brief Externally supplied, immutable parcel record.
 */
struct GeoFeature
{
    GeoGeometry          geometry   = {};
    FeatureAttributesPtr attributes = {};

    /**
     * @brief Identifier taken from the "id" attribute. Numbers are rendered
     *        without a fractional part when integral. Empty when absent.
     */
    [[nodiscard]] std::string id() const;

    /**
     * @brief Raw "height_m" attribute as a number, if it is one (or a numeric string).
     */
    [[nodiscard]] std::optional<double> heightAttribute() const;

    /**
     * @brief Reference latitude for projection: "__refLat" or the dataset default.
     */
    [[nodiscard]] double referenceLatitude() const;
};

/// Feature identifiers rendered with the highlight material.
using HighlightSet = std::unordered_set<std::string>;

namespace geo
{
    /// Attribute key conventions of the parcel source.
    inline constexpr const char* kIdKey        = "id";
    inline constexpr const char* kHeightKey    = "height_m";
    inline constexpr const char* kRefLatKey    = "__refLat";
    inline constexpr double      kDefaultHeight = 10.0;
    inline constexpr double      kMinHeight     = 1.0;

    /**
     * @brief Looks up an attribute; null when the map or key is missing.
     */
    [[nodiscard]] const AttributeValue* findAttribute(const FeatureAttributes* attrs, const std::string& key) noexcept;

    /**
     * @brief Numeric view of a value: numbers, numeric strings and booleans.
     */
    [[nodiscard]] std::optional<double> attributeNumber(const AttributeValue& value);

    /**
     * @brief Display text of a value. Null becomes an empty string.
     */
    [[nodiscard]] std::string attributeText(const AttributeValue& value);

    /**
     * @brief Extrusion depth for a feature: height_m, or the default when it is
     *        missing/zero/not numeric, clamped to at least one meter.
     */
    [[nodiscard]] double extrusionHeight(const GeoFeature& feature);

    /**
     * @brief Convenience builder used by loaders and tests.
     */
    [[nodiscard]] FeatureAttributesPtr makeAttributes(FeatureAttributes attrs);

} // namespace geo
