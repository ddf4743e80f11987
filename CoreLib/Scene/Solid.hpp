//============================================================
// Solid.hpp
//============================================================
#pragma once

#include <SolidMesh.hpp>
#include <cstdint>
#include <memory>
#include <string>

#include "GeoFeature.hpp"
#include "GpuResources.hpp"

/**
 * @brief Surface appearance of a solid, fixed at construction.
 */
struct SolidMaterial
{
    uint32_t color       = 0x8aa1c1; ///< 0xRRGGBB, sRGB
    bool     highlighted = false;
};

/**
 * @brief One extruded parcel: mesh, material and the identity of its feature.
 *
 * Solids are immutable after the Extruder has produced them and are owned by
 * the SceneGraph. GPU resources are attached lazily by the renderer.
 */
class Solid
{
public:
    Solid(std::string featureId, FeatureAttributesPtr attributes);
    ~Solid() noexcept;

    Solid(const Solid&)            = delete;
    Solid& operator=(const Solid&) = delete;

    /// @name Construction (Extruder only)
    /// @{
    [[nodiscard]] SolidMesh& mesh() noexcept
    {
        return m_mesh;
    }

    void setMaterial(const SolidMaterial& material) noexcept
    {
        m_material = material;
    }

    void setShapeInfo(double depth, int holeCount, double footprintArea, bool windingConsistent) noexcept;
    /// @}

    [[nodiscard]] const SolidMesh& mesh() const noexcept
    {
        return m_mesh;
    }

    [[nodiscard]] const SolidMaterial& material() const noexcept
    {
        return m_material;
    }

    [[nodiscard]] const SolidBounds& bounds() const noexcept
    {
        return m_mesh.bounds();
    }

    /// Extrusion depth in meters (world Y of the top cap).
    [[nodiscard]] double depth() const noexcept
    {
        return m_depth;
    }

    /// Number of hole rings that made it into the caps.
    [[nodiscard]] int holeCount() const noexcept
    {
        return m_holeCount;
    }

    /// Planar area of one cap in square meters.
    [[nodiscard]] double footprintArea() const noexcept
    {
        return m_footprintArea;
    }

    /// False when a hole ring has the same orientation as the outer ring.
    [[nodiscard]] bool windingConsistent() const noexcept
    {
        return m_windingConsistent;
    }

    [[nodiscard]] const std::string& featureId() const noexcept
    {
        return m_featureId;
    }

    [[nodiscard]] const FeatureAttributesPtr& attributes() const noexcept
    {
        return m_attributes;
    }

    // ------------------------------------------------------------
    // GPU
    // ------------------------------------------------------------

    [[nodiscard]] GpuResources* gpu() const noexcept
    {
        return m_gpu.get();
    }

    void setGpu(std::unique_ptr<GpuResources> gpu) noexcept;

private:
    SolidMesh            m_mesh              = {};
    SolidMaterial        m_material          = {};
    double               m_depth             = 0.0;
    int                  m_holeCount         = 0;
    double               m_footprintArea     = 0.0;
    bool                 m_windingConsistent = true;
    std::string          m_featureId         = {};
    FeatureAttributesPtr m_attributes        = {};

    std::unique_ptr<GpuResources> m_gpu = {};
};
