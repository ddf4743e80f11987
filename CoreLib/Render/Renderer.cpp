#include "Renderer.hpp"

#include <algorithm>
#include <array>
#include <glm/glm.hpp>
#include <iostream>
#include <memory>
#include <utility>
#include <vector>

#include "GpuResources/SolidGpuResources.hpp"
#include "SceneGraph.hpp"
#include "Solid.hpp"
#include "Viewport.hpp"
#include "VkUtilities.hpp"

//==================================================================
// Init / Lifetime
//==================================================================

Renderer::Renderer(const ViewSettings& settings) noexcept : m_settings(settings)
{
}

Renderer::~Renderer() noexcept
{
    shutdown(nullptr);
}

bool Renderer::initDevice(const VulkanContext& ctx)
{
    m_ctx            = ctx;
    m_framesInFlight = std::clamp(m_ctx.framesInFlight, 1u, vkcfg::kMaxFramesInFlight);

    m_viewportUbos.clear();

    if (!createDescriptors())
        return false;

    if (!createPipelineLayout())
        return false;

    if (!createGroundBuffers())
        return false;

    return true;
}

bool Renderer::initSwapchain(VkRenderPass renderPass)
{
    if (!m_ctx.device || renderPass == VK_NULL_HANDLE)
    {
        std::cerr << "Renderer: Pipelines need a device and a render pass.\n";
        return false;
    }

    destroyPipelines();

    return createPipelines(renderPass);
}

void Renderer::destroySwapchainResources() noexcept
{
    destroyPipelines();
}

void Renderer::shutdown(SceneGraph* graph) noexcept
{
    if (!m_ctx.device)
        return;

    vkDeviceWaitIdle(m_ctx.device);

    destroySwapchainResources();

    if (graph)
    {
        // Device is idle: retired solids and live GPU resources can go now.
        graph->takeRetired().clear();

        for (const auto& solid : graph->solids())
            solid->setGpu(nullptr);
    }

    for (auto& [vp, state] : m_viewportUbos)
    {
        for (GpuBuffer& buf : state.buffers)
            buf.destroy();
    }
    m_viewportUbos.clear();

    m_groundPositions.destroy();
    m_groundNormals.destroy();

    m_descriptorPool.destroy();
    m_frameSetLayout.destroy();

    if (m_pipelineLayout != VK_NULL_HANDLE)
    {
        vkDestroyPipelineLayout(m_ctx.device, m_pipelineLayout, nullptr);
        m_pipelineLayout = VK_NULL_HANDLE;
    }

    m_framesInFlight = 1;
    m_ctx            = {};
}

void Renderer::releaseViewport(const Viewport* vp) noexcept
{
    auto it = m_viewportUbos.find(vp);
    if (it == m_viewportUbos.end())
        return;

    if (m_ctx.device)
        vkDeviceWaitIdle(m_ctx.device);

    for (uint32_t i = 0; i < vkcfg::kMaxFramesInFlight; ++i)
    {
        m_descriptorPool.free(it->second.sets[i]);
        it->second.buffers[i].destroy();
    }

    m_viewportUbos.erase(it);
}

//==================================================================
// Pipelines (swapchain-level)
//==================================================================

bool Renderer::createPipelines(VkRenderPass renderPass)
{
    VkPipelineVertexInputStateCreateInfo vi{};
    VkVertexInputBindingDescription      bindings[2]{};
    VkVertexInputAttributeDescription    attrs[2]{};
    vkutil::makeSolidVertexInput(vi, bindings, attrs);

    if (!vkutil::createSolidPipeline(m_ctx, renderPass, m_pipelineLayout, m_ctx.sampleCount, vi, m_solidPipeline))
    {
        std::cerr << "Renderer: Failed to create solid pipeline.\n";
        return false;
    }

    const DepthBias bias{m_settings.groundBiasConst, m_settings.groundBiasSlope};

    if (!vkutil::createGroundPipeline(m_ctx, renderPass, m_pipelineLayout, m_ctx.sampleCount, vi, bias, m_groundPipeline))
    {
        std::cerr << "Renderer: Failed to create ground pipeline.\n";
        return false;
    }

    return true;
}

void Renderer::destroyPipelines() noexcept
{
    if (!m_ctx.device)
        return;

    vkDeviceWaitIdle(m_ctx.device);

    m_solidPipeline.destroy();
    m_groundPipeline.destroy();
}

//==================================================================
// Descriptors + pipeline layout (device-level)
//==================================================================

bool Renderer::createDescriptors()
{
    VkDevice device = m_ctx.device;
    if (!device)
        return false;

    m_descriptorPool.destroy();
    m_frameSetLayout.destroy();

    // ------------------------------------------------------------
    // set = 0 : Frame globals (per-viewport)
    //   binding 0 = FrameUBO (camera + lights)
    // ------------------------------------------------------------
    DescriptorBindingInfo uboBinding{};
    uboBinding.binding = 0;
    uboBinding.type    = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    uboBinding.stages  = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT;
    uboBinding.count   = 1;

    if (!m_frameSetLayout.create(device, std::span{&uboBinding, 1}))
    {
        std::cerr << "Renderer: Failed to create frame globals DescriptorSetLayout.\n";
        return false;
    }

    const uint32_t maxSets = vkcfg::kMaxFramesInFlight * kMaxViewports;

    const std::array<VkDescriptorPoolSize, 1> poolSizes{
        VkDescriptorPoolSize{VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, maxSets},
    };

    if (!m_descriptorPool.create(device, poolSizes, maxSets))
    {
        std::cerr << "Renderer: Failed to create DescriptorPool.\n";
        return false;
    }

    return true;
}

bool Renderer::createPipelineLayout() noexcept
{
    if (!m_ctx.device)
        return false;

    if (m_pipelineLayout != VK_NULL_HANDLE)
        return true;

    VkDescriptorSetLayout setLayout = m_frameSetLayout.layout();

    VkPushConstantRange pcRange{};
    pcRange.stageFlags = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT;
    pcRange.offset     = 0;
    pcRange.size       = sizeof(PushConstants);

    m_pipelineLayout = vkutil::createPipelineLayout(m_ctx.device, &setLayout, 1, &pcRange, 1);
    return m_pipelineLayout != VK_NULL_HANDLE;
}

//==================================================================
// Ground plane (device-level, HOST_VISIBLE, written once)
//==================================================================

bool Renderer::createGroundBuffers()
{
    const float h = 0.5f * m_settings.groundSize;
    const float y = m_settings.groundElevation;

    const std::array<glm::vec3, 6> positions = {
        glm::vec3{-h, y, -h},
        glm::vec3{-h, y, h},
        glm::vec3{h, y, h},
        glm::vec3{-h, y, -h},
        glm::vec3{h, y, h},
        glm::vec3{h, y, -h},
    };

    std::array<glm::vec3, 6> normals;
    normals.fill(glm::vec3{0.0f, 1.0f, 0.0f});

    constexpr VkMemoryPropertyFlags hostFlags =
        VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;

    const bool created =
        m_groundPositions.create(m_ctx.device, m_ctx.physicalDevice, sizeof(positions), VK_BUFFER_USAGE_VERTEX_BUFFER_BIT, hostFlags) &&
        m_groundNormals.create(m_ctx.device, m_ctx.physicalDevice, sizeof(normals), VK_BUFFER_USAGE_VERTEX_BUFFER_BIT, hostFlags);

    if (!created || !m_groundPositions.upload(positions.data(), sizeof(positions)) ||
        !m_groundNormals.upload(normals.data(), sizeof(normals)))
    {
        std::cerr << "Renderer: Failed to create ground plane buffers.\n";
        return false;
    }

    return true;
}

//==================================================================
// Per-viewport UBO (lazy allocation)
//==================================================================

Renderer::ViewportUboState* Renderer::ensureViewportUboState(const Viewport* vp, uint32_t frameIndex)
{
    if (frameIndex >= m_framesInFlight)
        return nullptr;

    ViewportUboState& s = m_viewportUbos[vp];

    bool needWrite = false;

    if (s.sets[frameIndex] == VK_NULL_HANDLE)
    {
        s.sets[frameIndex] = m_descriptorPool.allocate(m_frameSetLayout.layout());
        if (s.sets[frameIndex] == VK_NULL_HANDLE)
        {
            std::cerr << "Renderer: Failed to allocate frame UBO set for viewport frame " << frameIndex << ".\n";
            return nullptr;
        }
        needWrite = true;
    }

    if (!s.buffers[frameIndex].valid())
    {
        if (!s.buffers[frameIndex].create(m_ctx.device,
                                          m_ctx.physicalDevice,
                                          sizeof(FrameUBO),
                                          VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT,
                                          VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
                                          true))
        {
            std::cerr << "Renderer: Failed to create frame UBO for viewport frame " << frameIndex << ".\n";
            return nullptr;
        }
        needWrite = true;
    }

    if (needWrite)
        vkutil::writeUniformBuffer(m_ctx.device, s.sets[frameIndex], 0, s.buffers[frameIndex].buffer(), sizeof(FrameUBO));

    return &s;
}

//==================================================================
// renderPrePass (all transfer work happens here)
//==================================================================

void Renderer::renderPrePass(Viewport* vp, SceneGraph* graph, const RenderFrameContext& fc)
{
    if (!vp || !graph || fc.cmd == VK_NULL_HANDLE || !m_ctx.device)
        return;

    if (fc.frameIndex >= m_framesInFlight)
        return;

    // ------------------------------------------------------------
    // 1) Retired solids wait for this frame slot to come around again
    // ------------------------------------------------------------
    std::vector<std::unique_ptr<Solid>> retired = graph->takeRetired();
    if (!retired.empty())
    {
        if (fc.deferred)
        {
            fc.deferred->enqueue(fc.frameIndex, [solids = std::move(retired)]() mutable {
                solids.clear();
            });
        }
        else
        {
            vkDeviceWaitIdle(m_ctx.device);
            retired.clear();
        }
    }

    // ------------------------------------------------------------
    // 2) Create and upload GPU resources of new solids
    // ------------------------------------------------------------
    for (const auto& solid : graph->solids())
    {
        if (!solid->gpu())
            solid->setGpu(std::make_unique<SolidGpuResources>(&m_ctx, &solid->mesh()));

        // Records transfer + barrier commands; must be outside the render pass.
        solid->gpu()->update(fc);
    }
}

//==================================================================
// Render
//==================================================================

void Renderer::render(Viewport* vp, const SceneGraph* graph, const RenderFrameContext& fc)
{
    if (!vp || fc.cmd == VK_NULL_HANDLE)
        return;

    if (fc.frameIndex >= m_framesInFlight || m_pipelineLayout == VK_NULL_HANDLE)
        return;

    if (!m_solidPipeline.valid() || !m_groundPipeline.valid())
        return;

    const VkCommandBuffer cmd = fc.cmd;

    ViewportUboState* ubo = ensureViewportUboState(vp, fc.frameIndex);
    if (!ubo)
        return;

    // ------------------------------------------------------------
    // Frame globals
    // ------------------------------------------------------------
    {
        FrameUBO frame{};
        frame.proj     = vp->projection();
        frame.view     = vp->view();
        frame.lightDir = glm::vec4(glm::normalize(m_settings.sunPosition), m_settings.sunIntensity);
        frame.ambient  = glm::vec4(m_settings.ambientIntensity, 0.0f, 0.0f, 0.0f);

        if (!ubo->buffers[fc.frameIndex].upload(&frame, sizeof(frame)))
            return;

        VkDescriptorSet set0 = ubo->sets[fc.frameIndex];
        vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, m_pipelineLayout, 0, 1, &set0, 0, nullptr);
    }

    vkutil::setViewportAndScissor(cmd, static_cast<uint32_t>(vp->width()), static_cast<uint32_t>(vp->height()));

    if (m_settings.showGround)
        drawGround(cmd);

    if (!graph)
        return;

    vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, m_solidPipeline.handle());

    for (const auto& solid : graph->solids())
        drawSolid(cmd, *solid);
}

void Renderer::drawGround(VkCommandBuffer cmd)
{
    if (!m_groundPositions.valid() || !m_groundNormals.valid())
        return;

    vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, m_groundPipeline.handle());

    PushConstants pc{};
    pc.model = glm::mat4(1.0f);
    pc.color = settings::linearColor(m_settings.groundColor);

    vkCmdPushConstants(cmd,
                       m_pipelineLayout,
                       VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT,
                       0,
                       sizeof(PushConstants),
                       &pc);

    const VkBuffer     bufs[2] = {m_groundPositions.buffer(), m_groundNormals.buffer()};
    const VkDeviceSize offs[2] = {0, 0};
    vkCmdBindVertexBuffers(cmd, 0, 2, bufs, offs);

    vkCmdDraw(cmd, 6, 1, 0, 0);
}

void Renderer::drawSolid(VkCommandBuffer cmd, const Solid& solid)
{
    const auto* gpu = dynamic_cast<const SolidGpuResources*>(solid.gpu());
    if (!gpu || !gpu->ready() || gpu->vertexCount() == 0)
        return;

    PushConstants pc{};
    pc.model = glm::mat4(1.0f);
    pc.color = settings::linearColor(solid.material().color);

    vkCmdPushConstants(cmd,
                       m_pipelineLayout,
                       VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT,
                       0,
                       sizeof(PushConstants),
                       &pc);

    const VkBuffer     bufs[2] = {gpu->positionBuffer().buffer(), gpu->normalBuffer().buffer()};
    const VkDeviceSize offs[2] = {0, 0};
    vkCmdBindVertexBuffers(cmd, 0, 2, bufs, offs);

    vkCmdDraw(cmd, gpu->vertexCount(), 1, 0, 0);
}
