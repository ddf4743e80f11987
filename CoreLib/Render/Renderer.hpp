//============================================================
// Renderer.hpp
//============================================================
#pragma once

#include <array>
#include <cstdint>
#include <glm/mat4x4.hpp>
#include <glm/vec4.hpp>
#include <unordered_map>
#include <vulkan/vulkan.h>

#include "Descriptors.hpp"
#include "GpuBuffer.hpp"
#include "GraphicsPipelines.hpp"
#include "ViewSettings.hpp"
#include "VulkanContext.hpp"

class SceneGraph;
class Solid;
class Viewport;

/**
 * @brief Vulkan renderer of the parcel view.
 *
 * Lifetime overview:
 *
 *  - Device lifetime (initDevice() -> shutdown()):
 *      * Frame-globals descriptor set layout and pool.
 *      * Pipeline layout (set 0 + push constants).
 *      * Ground plane vertex buffers.
 *
 *  - Swapchain lifetime (initSwapchain() -> destroySwapchainResources()):
 *      * Solid and ground pipelines (depend on the VkRenderPass).
 *
 *  - Per-viewport + frame:
 *      * FrameUBO buffer and its descriptor set.
 *
 *  - Per-solid:
 *      * SolidGpuResources, created lazily in renderPrePass() and released
 *        through the frame's deferred deletion queue when the SceneGraph
 *        retires the solid.
 */
class Renderer
{
public:
    explicit Renderer(const ViewSettings& settings = {}) noexcept;
    ~Renderer() noexcept;

    Renderer(const Renderer&)            = delete;
    Renderer(Renderer&&)                 = delete;
    Renderer& operator=(const Renderer&) = delete;
    Renderer& operator=(Renderer&&)      = delete;

    // ============================================================
    // Lifetime
    // ============================================================

    /// Device lifetime: call once after VkDevice is ready.
    bool initDevice(const VulkanContext& ctx);

    /// Swapchain lifetime: call whenever swapchain/render pass changes.
    bool initSwapchain(VkRenderPass renderPass);

    /// Swapchain teardown: call on resize / swapchain destruction.
    void destroySwapchainResources() noexcept;

    /**
     * @brief Device teardown.
     *
     * Waits for the device, then releases pipelines, descriptors, per-viewport
     * buffers and the GPU resources of every solid in @p graph.
     */
    void shutdown(SceneGraph* graph) noexcept;

    /// Drops the per-viewport buffers of a viewport that is going away.
    void releaseViewport(const Viewport* vp) noexcept;

    [[nodiscard]] bool deviceReady() const noexcept
    {
        return m_ctx.device != VK_NULL_HANDLE;
    }

    // ============================================================
    // Rendering entry points
    // ============================================================

    /**
     * @brief Work that must occur OUTSIDE a render pass.
     *
     * - Retired solids are moved into the deferred deletion queue.
     * - Solids without GPU resources get them; pending uploads are recorded.
     */
    void renderPrePass(Viewport* vp, SceneGraph* graph, const RenderFrameContext& fc);

    /**
     * @brief Main pass: ground plane, then all solids.
     *
     * Called per-viewport, per-frame, inside the active render pass.
     */
    void render(Viewport* vp, const SceneGraph* graph, const RenderFrameContext& fc);

public:
    // ============================================================
    // Shader-visible structs (must match GLSL std140)
    // ============================================================

    // set=0 binding=0 - per-viewport, per-frame UBO
    struct FrameUBO
    {
        glm::mat4 proj     = {};
        glm::mat4 view     = {};
        glm::vec4 lightDir = {}; ///< xyz = direction towards the light (world), w = intensity
        glm::vec4 ambient  = {}; ///< x = ambient intensity
    };
    static_assert(sizeof(FrameUBO) % 16 == 0, "FrameUBO must be std140-aligned");

    struct PushConstants
    {
        glm::mat4 model = {};
        glm::vec4 color = {}; ///< linear RGBA
    };
    static_assert(sizeof(PushConstants) == 80);

private:
    /**
     * @brief Per-viewport frame-global UBO state (set = 0).
     *
     * Only indices [0..m_framesInFlight-1] are valid for the current device.
     */
    struct ViewportUboState
    {
        std::array<GpuBuffer, vkcfg::kMaxFramesInFlight>       buffers = {};
        std::array<VkDescriptorSet, vkcfg::kMaxFramesInFlight> sets    = {};
    };

    bool createDescriptors();
    bool createPipelineLayout() noexcept;
    bool createPipelines(VkRenderPass renderPass);
    void destroyPipelines() noexcept;
    bool createGroundBuffers();

    ViewportUboState* ensureViewportUboState(const Viewport* vp, uint32_t frameIndex);

    void drawGround(VkCommandBuffer cmd);
    void drawSolid(VkCommandBuffer cmd, const Solid& solid);

private:
    ViewSettings  m_settings       = {};
    VulkanContext m_ctx            = {};
    uint32_t      m_framesInFlight = 1;

    /// Upper bound for how many Viewports get per-frame descriptor sets.
    static constexpr uint32_t kMaxViewports = 4;

    DescriptorSetLayout m_frameSetLayout = {};
    DescriptorPool      m_descriptorPool = {};

    std::unordered_map<const Viewport*, ViewportUboState> m_viewportUbos = {};

    VkPipelineLayout m_pipelineLayout = VK_NULL_HANDLE;
    GraphicsPipeline m_solidPipeline  = {};
    GraphicsPipeline m_groundPipeline = {};

    GpuBuffer m_groundPositions = {};
    GpuBuffer m_groundNormals   = {};
};
