//============================================================
// Extruder.hpp
//============================================================
#pragma once

#include <cstdint>
#include <glm/vec2.hpp>
#include <memory>

#include "GeoFeature.hpp"

class Solid;

/**
 * @brief Turns one parcel polygon into a closed prism.
 *
 * The outer ring (and any holes) of the feature's first polygon is projected
 * to planar meters, shifted by the projection origin and swept from world
 * Y = 0 up to the extrusion depth. Caps are ear-clipped, walls are one quad
 * per ring edge. The planar frame maps to world as (x, y) -> (x, -y) in XZ,
 * so north points along -Z.
 *
 * extrude() is pure: the same feature, origin and highlight membership
 * always produce the same mesh.
 */
class Extruder
{
public:
    Extruder() = default;
    Extruder(uint32_t defaultColor, uint32_t highlightColor) noexcept;

    /**
     * @brief Builds the solid, or returns null when the geometry is unusable
     *        (no polygon, or an outer ring with fewer than three distinct points).
     */
    [[nodiscard]] std::unique_ptr<Solid> extrude(const GeoFeature&   feature,
                                                 const glm::dvec2&   origin,
                                                 const HighlightSet& highlightSet) const;

    [[nodiscard]] uint32_t defaultColor() const noexcept
    {
        return m_defaultColor;
    }

    [[nodiscard]] uint32_t highlightColor() const noexcept
    {
        return m_highlightColor;
    }

private:
    uint32_t m_defaultColor   = 0x8aa1c1;
    uint32_t m_highlightColor = 0xff5533;
};
