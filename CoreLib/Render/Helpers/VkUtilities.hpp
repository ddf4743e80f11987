//============================================================
// VkUtilities.hpp
//============================================================
#pragma once

#include <cstdint>
#include <filesystem>
#include <vulkan/vulkan.h>

#include "VulkanContext.hpp"

class GpuBuffer;
class ShaderStage;

namespace vkutil
{
    // ============================================================================
    // Common helpers
    // ============================================================================

    uint32_t findMemoryType(VkPhysicalDevice phys, uint32_t typeBits, VkMemoryPropertyFlags props) noexcept;

    /// Load "<dir>/<filename>" as a SPIR-V stage.
    ShaderStage loadStage(VkDevice                     device,
                          const std::filesystem::path& dir,
                          const char*                  filename,
                          VkShaderStageFlagBits        stage);

    // ============================================================================
    // Common fixed-function state helpers
    // ============================================================================

    VkPipelineInputAssemblyStateCreateInfo makeInputAssembly(VkPrimitiveTopology topology);

    VkPipelineViewportStateCreateInfo makeViewportState();

    VkPipelineRasterizationStateCreateInfo makeRasterState(VkCullModeFlags cullMode,
                                                           VkPolygonMode   mode      = VK_POLYGON_MODE_FILL,
                                                           VkFrontFace     frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE,
                                                           float           lineWidth = 1.0f);

    VkPipelineMultisampleStateCreateInfo makeMultisampleState(VkSampleCountFlagBits samples);

    VkPipelineDepthStencilStateCreateInfo makeDepthStencilState(bool depthWriteEnable);

    VkPipelineColorBlendAttachmentState makeColorBlendAttachment(bool enableBlend);

    VkPipelineColorBlendStateCreateInfo makeColorBlendState(const VkPipelineColorBlendAttachmentState* attachment);

    VkPipelineDynamicStateCreateInfo makeDynamicState(const VkDynamicState* states, uint32_t count);

    void setViewportAndScissor(VkCommandBuffer cmd, uint32_t width, uint32_t height);

    /**
     * @brief Vertex input of a solid: binding 0 = vec3 position, binding 1 = vec3 normal.
     *
     * The arrays are referenced by @p vi and must outlive pipeline creation.
     */
    void makeSolidVertexInput(VkPipelineVertexInputStateCreateInfo& vi,
                              VkVertexInputBindingDescription (&bindings)[2],
                              VkVertexInputAttributeDescription (&attrs)[2]);

    VkPipelineLayout createPipelineLayout(VkDevice                     device,
                                          const VkDescriptorSetLayout* setLayouts,
                                          uint32_t                     setLayoutCount,
                                          const VkPushConstantRange*   pushConstants     = nullptr,
                                          uint32_t                     pushConstantCount = 0);

    // ============================================================================
    // Device-local buffers (frame-cmd path)
    // ============================================================================

    /**
     * @brief Create an empty device-local buffer that can receive transfer writes.
     *
     * VK_BUFFER_USAGE_TRANSFER_DST_BIT is added to @p usage. Contents are
     * undefined until a copy has been recorded into it.
     *
     * @return GpuBuffer handle. `valid()==false` on failure.
     */
    GpuBuffer createDeviceLocalBufferEmpty(const VulkanContext& ctx,
                                           VkDeviceSize         capacity,
                                           VkBufferUsageFlags   usage);

    /// Make transfer writes visible to vertex attribute fetch.
    void barrierTransferToVertexAttributeRead(VkCommandBuffer cmd);

    // ============================================================================
    // Pipeline helper
    // ============================================================================

    /// Lightweight descriptor for a single graphics pipeline.
    /// All pointers are non-owning; they must live at least until
    /// vkCreateGraphicsPipelines returns.
    struct GraphicsPipelineDesc
    {
        VkRenderPass     renderPass = VK_NULL_HANDLE;
        uint32_t         subpass    = 0;
        VkPipelineLayout layout     = VK_NULL_HANDLE;

        const VkPipelineShaderStageCreateInfo*        stages        = nullptr;
        uint32_t                                      stageCount    = 0;
        const VkPipelineVertexInputStateCreateInfo*   vertexInput   = nullptr;
        const VkPipelineInputAssemblyStateCreateInfo* inputAssembly = nullptr;
        const VkPipelineViewportStateCreateInfo*      viewport      = nullptr;
        const VkPipelineRasterizationStateCreateInfo* rasterization = nullptr;
        const VkPipelineMultisampleStateCreateInfo*   multisample   = nullptr;
        const VkPipelineDepthStencilStateCreateInfo*  depthStencil  = nullptr;
        const VkPipelineColorBlendStateCreateInfo*    colorBlend    = nullptr;
        const VkPipelineDynamicStateCreateInfo*       dynamicState  = nullptr;
    };

    /// Create a graphics pipeline from the descriptor.
    /// Returns VK_NULL_HANDLE on failure.
    VkPipeline createGraphicsPipeline(VkDevice device, const GraphicsPipelineDesc& desc);

} // namespace vkutil
