//============================================================
// GraphicsPipelines.cpp
//============================================================
#include "GraphicsPipelines.hpp"

#include <filesystem>
#include <iostream>
#include <iterator>

#include "ShaderStage.hpp"
#include "VkUtilities.hpp"

// ---------------------------------------------------------
// GraphicsPipeline destroy
// ---------------------------------------------------------
void GraphicsPipeline::destroy() noexcept
{
    if (!m_device)
        return;

    if (m_pipeline != VK_NULL_HANDLE)
    {
        vkDestroyPipeline(m_device, m_pipeline, nullptr);
        m_pipeline = VK_NULL_HANDLE;
    }

    m_device = VK_NULL_HANDLE;
}

namespace
{
    inline bool checkCommonInputs(const VulkanContext& ctx, VkRenderPass renderPass, VkPipelineLayout layout) noexcept
    {
        return ctx.device != VK_NULL_HANDLE &&
               renderPass != VK_NULL_HANDLE &&
               layout != VK_NULL_HANDLE;
    }

    bool createLitPipeline(const char*                                 label,
                           const VulkanContext&                        ctx,
                           VkRenderPass                                renderPass,
                           VkPipelineLayout                            layout,
                           VkSampleCountFlagBits                       sampleCount,
                           const VkPipelineVertexInputStateCreateInfo& vi,
                           const DepthBias&                            bias,
                           GraphicsPipeline&                           out)
    {
        out.destroy();

        if (!checkCommonInputs(ctx, renderPass, layout))
            return false;

        out.m_device = ctx.device;

        const std::filesystem::path shaderDir = std::filesystem::path(SHADER_BIN_DIR);

        ShaderStage vs =
            vkutil::loadStage(ctx.device, shaderDir, "ParcelSolid.vert.spv", VK_SHADER_STAGE_VERTEX_BIT);
        ShaderStage fs =
            vkutil::loadStage(ctx.device, shaderDir, "ParcelSolid.frag.spv", VK_SHADER_STAGE_FRAGMENT_BIT);

        if (!vs.isValid() || !fs.isValid())
        {
            std::cerr << "GraphicsPipelines: Failed to load ParcelSolid shaders.\n";
            out.destroy();
            return false;
        }

        VkPipelineShaderStageCreateInfo stages[2] = {
            vs.stageInfo(),
            fs.stageInfo(),
        };

        VkPipelineInputAssemblyStateCreateInfo ia = vkutil::makeInputAssembly(VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST);
        VkPipelineViewportStateCreateInfo      vp = vkutil::makeViewportState();
        VkPipelineRasterizationStateCreateInfo rs = vkutil::makeRasterState(VK_CULL_MODE_NONE);
        VkPipelineMultisampleStateCreateInfo   ms = vkutil::makeMultisampleState(sampleCount);
        VkPipelineDepthStencilStateCreateInfo  ds = vkutil::makeDepthStencilState(true);

        if (bias.enabled())
        {
            rs.depthBiasEnable         = VK_TRUE;
            rs.depthBiasConstantFactor = bias.constantFactor;
            rs.depthBiasSlopeFactor    = bias.slopeFactor;
        }

        VkPipelineColorBlendAttachmentState att = vkutil::makeColorBlendAttachment(false);
        VkPipelineColorBlendStateCreateInfo cb  = vkutil::makeColorBlendState(&att);

        VkDynamicState dynStates[] = {
            VK_DYNAMIC_STATE_VIEWPORT,
            VK_DYNAMIC_STATE_SCISSOR,
        };
        VkPipelineDynamicStateCreateInfo dyn =
            vkutil::makeDynamicState(dynStates, static_cast<uint32_t>(std::size(dynStates)));

        vkutil::GraphicsPipelineDesc desc = {};
        desc.renderPass                   = renderPass;
        desc.layout                       = layout;
        desc.stages                       = stages;
        desc.stageCount                   = 2;
        desc.vertexInput                  = &vi;
        desc.inputAssembly                = &ia;
        desc.viewport                     = &vp;
        desc.rasterization                = &rs;
        desc.multisample                  = &ms;
        desc.depthStencil                 = &ds;
        desc.colorBlend                   = &cb;
        desc.dynamicState                 = &dyn;

        out.m_pipeline = vkutil::createGraphicsPipeline(ctx.device, desc);
        if (!out.valid())
        {
            std::cerr << "GraphicsPipelines: vkCreateGraphicsPipelines(" << label << ") failed.\n";
            out.destroy();
            return false;
        }

        return true;
    }

} // namespace

namespace vkutil
{
    bool createSolidPipeline(const VulkanContext&                        ctx,
                             VkRenderPass                                renderPass,
                             VkPipelineLayout                            layout,
                             VkSampleCountFlagBits                       sampleCount,
                             const VkPipelineVertexInputStateCreateInfo& vi,
                             GraphicsPipeline&                           out)
    {
        return createLitPipeline("Solid", ctx, renderPass, layout, sampleCount, vi, DepthBias{}, out);
    }

    bool createGroundPipeline(const VulkanContext&                        ctx,
                              VkRenderPass                                renderPass,
                              VkPipelineLayout                            layout,
                              VkSampleCountFlagBits                       sampleCount,
                              const VkPipelineVertexInputStateCreateInfo& vi,
                              const DepthBias&                            bias,
                              GraphicsPipeline&                           out)
    {
        return createLitPipeline("Ground", ctx, renderPass, layout, sampleCount, vi, bias, out);
    }

} // namespace vkutil
