//============================================================
// GraphicsPipelines.hpp
//============================================================
#pragma once

#include <vulkan/vulkan.h>

#include "VulkanContext.hpp"

/**
 * @brief Simple wrapper for a graphics pipeline handle.
 *
 * Lifetime:
 *  - Call destroy() before overwriting or at shutdown.
 *  - Does NOT own the pipeline layout (Renderer owns that).
 */
struct GraphicsPipeline
{
    VkDevice   m_device   = VK_NULL_HANDLE;
    VkPipeline m_pipeline = VK_NULL_HANDLE;

    void destroy() noexcept;

    [[nodiscard]] bool valid() const noexcept
    {
        return m_pipeline != VK_NULL_HANDLE;
    }

    [[nodiscard]] VkPipeline handle() const noexcept
    {
        return m_pipeline;
    }
};

/// Constant/slope depth bias applied by a pipeline (both zero = disabled).
struct DepthBias
{
    float constantFactor = 0.0f;
    float slopeFactor    = 0.0f;

    [[nodiscard]] bool enabled() const noexcept
    {
        return constantFactor != 0.0f || slopeFactor != 0.0f;
    }
};

namespace vkutil
{
    /**
     * @brief Lit, two-sided triangle pipeline used for the extruded solids.
     *
     * Shaders:
     *  - ParcelSolid.vert.spv
     *  - ParcelSolid.frag.spv
     *
     * Depth test/write ON (LESS_OR_EQUAL), no culling, opaque.
     */
    bool createSolidPipeline(const VulkanContext&                        ctx,
                             VkRenderPass                                renderPass,
                             VkPipelineLayout                            layout,
                             VkSampleCountFlagBits                       sampleCount,
                             const VkPipelineVertexInputStateCreateInfo& vi,
                             GraphicsPipeline&                           out);

    /**
     * @brief Same shading as the solids, with depth bias pushing the ground
     *        plane away from the camera so coplanar footprints never fight it.
     */
    bool createGroundPipeline(const VulkanContext&                        ctx,
                              VkRenderPass                                renderPass,
                              VkPipelineLayout                            layout,
                              VkSampleCountFlagBits                       sampleCount,
                              const VkPipelineVertexInputStateCreateInfo& vi,
                              const DepthBias&                            bias,
                              GraphicsPipeline&                           out);

} // namespace vkutil
