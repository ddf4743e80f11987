//============================================================
// SolidGpuResources.hpp
//============================================================
#pragma once

#include <cstdint>

#include "GpuBuffer.hpp"
#include "GpuResources.hpp"
#include "VulkanContext.hpp"

class SolidMesh;

/**
 * @brief Device-local vertex buffers of one extruded solid.
 *
 * Solids are immutable once built, so the buffers are uploaded exactly once
 * (on the first update after creation) through a staging buffer that is
 * released via the frame's deferred deletion queue.
 *
 * Layout is a corner-expanded triangle list, no indices:
 *  - binding 0: vec3 position
 *  - binding 1: vec3 normal
 */
class SolidGpuResources final : public GpuResources
{
public:
    SolidGpuResources(const VulkanContext* ctx, const SolidMesh* mesh);
    ~SolidGpuResources() noexcept override;

    SolidGpuResources(const SolidGpuResources&)            = delete;
    SolidGpuResources& operator=(const SolidGpuResources&) = delete;
    SolidGpuResources(SolidGpuResources&&)                 = delete;
    SolidGpuResources& operator=(SolidGpuResources&&)      = delete;

    void destroy() noexcept;

    void update(const RenderFrameContext& fc) override;

    [[nodiscard]] bool ready() const noexcept override
    {
        return m_uploaded && m_positionBuffer.valid() && m_normalBuffer.valid();
    }

    [[nodiscard]] const GpuBuffer& positionBuffer() const noexcept
    {
        return m_positionBuffer;
    }

    [[nodiscard]] const GpuBuffer& normalBuffer() const noexcept
    {
        return m_normalBuffer;
    }

    [[nodiscard]] uint32_t vertexCount() const noexcept
    {
        return m_vertexCount;
    }

private:
    bool uploadBuffer(const RenderFrameContext& fc, GpuBuffer& dst, const void* data, VkDeviceSize bytes);

private:
    const VulkanContext* m_ctx  = nullptr;
    const SolidMesh*     m_mesh = nullptr;

    GpuBuffer m_positionBuffer = {};
    GpuBuffer m_normalBuffer   = {};
    uint32_t  m_vertexCount    = 0;
    bool      m_uploaded       = false;
    bool      m_failed         = false;
};
