//============================================================
// VkUtilities.cpp
//============================================================
#include "VkUtilities.hpp"

#include <glm/vec3.hpp>
#include <iostream>

#include "GpuBuffer.hpp"
#include "ShaderStage.hpp"

namespace vkutil
{
    uint32_t findMemoryType(VkPhysicalDevice      phys,
                            uint32_t              typeBits,
                            VkMemoryPropertyFlags props) noexcept
    {
        VkPhysicalDeviceMemoryProperties mp = {};
        vkGetPhysicalDeviceMemoryProperties(phys, &mp);

        for (uint32_t i = 0; i < mp.memoryTypeCount; ++i)
        {
            const bool supported = (typeBits & (1u << i)) != 0u;
            const bool matches   = (mp.memoryTypes[i].propertyFlags & props) == props;

            if (supported && matches)
                return i;
        }

        return UINT32_MAX;
    }

    ShaderStage loadStage(VkDevice                     device,
                          const std::filesystem::path& dir,
                          const char*                  filename,
                          VkShaderStageFlagBits        stage)
    {
        return ShaderStage::fromSpirvFile(device, dir / filename, stage);
    }

    // ============================================================================
    // Fixed function helpers
    // ============================================================================

    VkPipelineInputAssemblyStateCreateInfo makeInputAssembly(VkPrimitiveTopology topology)
    {
        VkPipelineInputAssemblyStateCreateInfo ia = {};
        ia.sType                                  = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
        ia.topology                               = topology;
        ia.primitiveRestartEnable                 = VK_FALSE;
        return ia;
    }

    VkPipelineViewportStateCreateInfo makeViewportState()
    {
        VkPipelineViewportStateCreateInfo vp = {};
        vp.sType                             = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
        vp.viewportCount                     = 1;
        vp.scissorCount                      = 1;
        return vp;
    }

    VkPipelineRasterizationStateCreateInfo makeRasterState(VkCullModeFlags cullMode,
                                                           VkPolygonMode   mode,
                                                           VkFrontFace     frontFace,
                                                           float           lineWidth)
    {
        VkPipelineRasterizationStateCreateInfo rs = {};
        rs.sType                                  = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
        rs.depthClampEnable                       = VK_FALSE;
        rs.rasterizerDiscardEnable                = VK_FALSE;
        rs.polygonMode                            = mode;
        rs.cullMode                               = cullMode;
        rs.frontFace                              = frontFace;
        rs.depthBiasEnable                        = VK_FALSE;
        rs.lineWidth                              = lineWidth;
        return rs;
    }

    VkPipelineMultisampleStateCreateInfo makeMultisampleState(VkSampleCountFlagBits samples)
    {
        VkPipelineMultisampleStateCreateInfo ms = {};
        ms.sType                                = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
        ms.rasterizationSamples                 = samples;
        ms.sampleShadingEnable                  = VK_FALSE;
        return ms;
    }

    VkPipelineDepthStencilStateCreateInfo makeDepthStencilState(bool depthWriteEnable)
    {
        VkPipelineDepthStencilStateCreateInfo ds = {};
        ds.sType                                 = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
        ds.depthTestEnable                       = VK_TRUE;
        ds.depthWriteEnable                      = depthWriteEnable ? VK_TRUE : VK_FALSE;
        ds.depthCompareOp                        = VK_COMPARE_OP_LESS_OR_EQUAL;
        ds.depthBoundsTestEnable                 = VK_FALSE;
        ds.stencilTestEnable                     = VK_FALSE;
        return ds;
    }

    VkPipelineColorBlendAttachmentState makeColorBlendAttachment(bool enableBlend)
    {
        VkPipelineColorBlendAttachmentState att = {};
        att.colorWriteMask                      = VK_COLOR_COMPONENT_R_BIT |
                             VK_COLOR_COMPONENT_G_BIT |
                             VK_COLOR_COMPONENT_B_BIT |
                             VK_COLOR_COMPONENT_A_BIT;

        att.blendEnable = enableBlend ? VK_TRUE : VK_FALSE;

        if (enableBlend)
        {
            att.srcColorBlendFactor = VK_BLEND_FACTOR_SRC_ALPHA;
            att.dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
            att.colorBlendOp        = VK_BLEND_OP_ADD;
            att.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
            att.dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
            att.alphaBlendOp        = VK_BLEND_OP_ADD;
        }

        return att;
    }

    VkPipelineColorBlendStateCreateInfo makeColorBlendState(const VkPipelineColorBlendAttachmentState* attachment)
    {
        VkPipelineColorBlendStateCreateInfo cb = {};
        cb.sType                               = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
        cb.logicOpEnable                       = VK_FALSE;
        cb.attachmentCount                     = 1;
        cb.pAttachments                        = attachment;
        return cb;
    }

    VkPipelineDynamicStateCreateInfo makeDynamicState(const VkDynamicState* states, uint32_t count)
    {
        VkPipelineDynamicStateCreateInfo dyn = {};
        dyn.sType                            = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
        dyn.dynamicStateCount                = count;
        dyn.pDynamicStates                   = states;
        return dyn;
    }

    void setViewportAndScissor(VkCommandBuffer cmd, uint32_t width, uint32_t height)
    {
        VkViewport vp = {};
        vp.x          = 0.0f;
        vp.y          = 0.0f;
        vp.width      = static_cast<float>(width);
        vp.height     = static_cast<float>(height);
        vp.minDepth   = 0.0f;
        vp.maxDepth   = 1.0f;

        VkRect2D sc = {};
        sc.offset   = {0, 0};
        sc.extent   = {width, height};

        vkCmdSetViewport(cmd, 0, 1, &vp);
        vkCmdSetScissor(cmd, 0, 1, &sc);
    }

    void makeSolidVertexInput(VkPipelineVertexInputStateCreateInfo& vi,
                              VkVertexInputBindingDescription (&bindings)[2],
                              VkVertexInputAttributeDescription (&attrs)[2])
    {
        // Binding 0: position
        bindings[0].binding   = 0;
        bindings[0].stride    = sizeof(glm::vec3);
        bindings[0].inputRate = VK_VERTEX_INPUT_RATE_VERTEX;

        // Binding 1: normal
        bindings[1].binding   = 1;
        bindings[1].stride    = sizeof(glm::vec3);
        bindings[1].inputRate = VK_VERTEX_INPUT_RATE_VERTEX;

        attrs[0].location = 0;
        attrs[0].binding  = 0;
        attrs[0].format   = VK_FORMAT_R32G32B32_SFLOAT;
        attrs[0].offset   = 0;

        attrs[1].location = 1;
        attrs[1].binding  = 1;
        attrs[1].format   = VK_FORMAT_R32G32B32_SFLOAT;
        attrs[1].offset   = 0;

        vi                                 = {};
        vi.sType                           = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
        vi.vertexBindingDescriptionCount   = 2;
        vi.pVertexBindingDescriptions      = bindings;
        vi.vertexAttributeDescriptionCount = 2;
        vi.pVertexAttributeDescriptions    = attrs;
    }

    VkPipelineLayout createPipelineLayout(VkDevice                     device,
                                          const VkDescriptorSetLayout* setLayouts,
                                          uint32_t                     setLayoutCount,
                                          const VkPushConstantRange*   pushConstants,
                                          uint32_t                     pushConstantCount)
    {
        VkPipelineLayoutCreateInfo pl{};
        pl.sType                  = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
        pl.setLayoutCount         = setLayoutCount;
        pl.pSetLayouts            = setLayouts;
        pl.pushConstantRangeCount = pushConstantCount;
        pl.pPushConstantRanges    = pushConstants;

        VkPipelineLayout layout = VK_NULL_HANDLE;
        if (vkCreatePipelineLayout(device, &pl, nullptr, &layout) != VK_SUCCESS)
        {
            std::cerr << "vkutil::createPipelineLayout: vkCreatePipelineLayout failed.\n";
            return VK_NULL_HANDLE;
        }
        return layout;
    }

    // ============================================================================
    // Device-local buffers
    // ============================================================================

    GpuBuffer createDeviceLocalBufferEmpty(const VulkanContext& ctx,
                                           VkDeviceSize         capacity,
                                           VkBufferUsageFlags   usage)
    {
        GpuBuffer buffer = {};

        if (!ctx.device || !ctx.physicalDevice || capacity == 0)
            return buffer;

        if (!buffer.create(ctx.device,
                           ctx.physicalDevice,
                           capacity,
                           usage | VK_BUFFER_USAGE_TRANSFER_DST_BIT,
                           VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT))
            std::cerr << "vkutil: device-local buffer of " << capacity << " bytes failed.\n";

        return buffer;
    }

    void barrierTransferToVertexAttributeRead(VkCommandBuffer cmd)
    {
        VkMemoryBarrier mb = {};
        mb.sType           = VK_STRUCTURE_TYPE_MEMORY_BARRIER;
        mb.srcAccessMask   = VK_ACCESS_TRANSFER_WRITE_BIT;
        mb.dstAccessMask   = VK_ACCESS_VERTEX_ATTRIBUTE_READ_BIT;

        vkCmdPipelineBarrier(cmd,
                             VK_PIPELINE_STAGE_TRANSFER_BIT,
                             VK_PIPELINE_STAGE_VERTEX_INPUT_BIT,
                             0,
                             1,
                             &mb,
                             0,
                             nullptr,
                             0,
                             nullptr);
    }

    // ============================================================================
    // Pipeline helper
    // ============================================================================

    VkPipeline createGraphicsPipeline(VkDevice device, const GraphicsPipelineDesc& d)
    {
        VkGraphicsPipelineCreateInfo ci = {};
        ci.sType                        = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
        ci.stageCount                   = d.stageCount;
        ci.pStages                      = d.stages;
        ci.pVertexInputState            = d.vertexInput;
        ci.pInputAssemblyState          = d.inputAssembly;
        ci.pViewportState               = d.viewport;
        ci.pRasterizationState          = d.rasterization;
        ci.pMultisampleState            = d.multisample;
        ci.pDepthStencilState           = d.depthStencil;
        ci.pColorBlendState             = d.colorBlend;
        ci.pDynamicState                = d.dynamicState;
        ci.layout                       = d.layout;
        ci.renderPass                   = d.renderPass;
        ci.subpass                      = d.subpass;
        ci.basePipelineHandle           = VK_NULL_HANDLE;
        ci.basePipelineIndex            = -1;

        VkPipeline pipeline = VK_NULL_HANDLE;
        if (vkCreateGraphicsPipelines(device,
                                      VK_NULL_HANDLE,
                                      1,
                                      &ci,
                                      nullptr,
                                      &pipeline) != VK_SUCCESS)
        {
            return VK_NULL_HANDLE;
        }

        return pipeline;
    }

} // namespace vkutil
