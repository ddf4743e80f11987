//=============================================================================
// Core.hpp
//=============================================================================
#pragma once

#include <cstdint>
#include <glm/glm.hpp>
#include <memory>
#include <string>
#include <vector>

#include "Config.hpp"
#include "CoreTypes.hpp"
#include "GeoFeature.hpp"
#include "ItemFactory.hpp"
#include "ViewSettings.hpp"
#include "VulkanContext.hpp"

class Viewport;
class Renderer;
class SceneGraph;
class SceneQuery;
class Picker;

/**
 * @brief Central application controller.
 *
 * Core is the coordination layer between the UI, the parcel scene (feature set,
 * highlight set, SceneGraph), picking and rendering.
 *
 * Core is UI-agnostic; UI layers call into Core in response to user
 * interaction and from the per-frame render loop.
 */
class Core
{
public:
    /**
     * @brief Constructs Core with an empty feature set.
     * @param settings   Look and camera defaults.
     * @param sceneQuery Registered SceneQuery backend used for picking.
     * @throws std::runtime_error if @p sceneQuery is not registered.
     */
    explicit Core(const ViewSettings& settings   = {},
                  const std::string&  sceneQuery = config::kDefaultSceneQuery);

    /** @brief Destroys Core and all owned subsystems. */
    ~Core();

    Core(const Core&)            = delete;
    Core& operator=(const Core&) = delete;

    // ------------------------------------------------------------
    // Device / swapchain lifetime
    // ------------------------------------------------------------

    /**
     * @brief Initialize device-level Vulkan resources.
     * @return False if the renderer could not create its resources.
     */
    bool initializeDevice(const VulkanContext& ctx);

    /**
     * @brief Initialize swapchain-dependent resources.
     * @param renderPass Active render pass used for rendering
     * @return False when the solid and ground pipelines could not be created
     */
    bool initializeSwapchain(VkRenderPass renderPass);

    /** @brief Destroy swapchain-dependent resources. */
    void destroySwapchainResources();

    /** @brief Release all GPU resources (solid buffers, pipelines, descriptors). */
    void destroy();

    // ------------------------------------------------------------
    // Viewports
    // ------------------------------------------------------------

    /**
     * @brief Create a new viewport (camera + orbit controller).
     * @return Pointer to the newly created viewport, owned by Core.
     */
    Viewport* createViewport();

    /** @brief Destroy a viewport created by createViewport(). */
    void destroyViewport(Viewport* vp) noexcept;

    /**
     * @brief Resize a viewport. Forces a re-pick.
     */
    void resizeViewport(Viewport* vp, int width, int height) noexcept;

    // ------------------------------------------------------------
    // Scene content
    // ------------------------------------------------------------

    /**
     * @brief Replaces the feature set.
     *
     * The projection origin is recomputed from the new set, then the
     * SceneGraph is rebuilt.
     */
    void setFeatures(std::vector<GeoFeature> features);

    /**
     * @brief Replaces the highlight set and rebuilds the SceneGraph.
     */
    void setHighlightIds(HighlightSet ids);

    [[nodiscard]] const std::vector<GeoFeature>& features() const noexcept
    {
        return m_features;
    }

    [[nodiscard]] const HighlightSet& highlightIds() const noexcept
    {
        return m_highlightIds;
    }

    [[nodiscard]] const glm::dvec2& projectionOrigin() const noexcept
    {
        return m_origin;
    }

    [[nodiscard]] const SceneGraph& sceneGraph() const;

    /**
     * @brief Retrieve scene statistics.
     */
    [[nodiscard]] SceneStats sceneStats() const noexcept;

    /** @brief Scene change stamp for UI polling (monotonic). */
    [[nodiscard]] uint64_t sceneStamp() const noexcept;

    // ------------------------------------------------------------
    // Picking
    // ------------------------------------------------------------

    /**
     * @brief Selects the SceneQuery backend by its registered name.
     * @throws std::runtime_error if @p name is not registered.
     */
    void setSceneQuery(const std::string& name);

    [[nodiscard]] const std::string& sceneQueryName() const noexcept
    {
        return m_sceneQueryName;
    }

    /// Attributes of the solid under the pointer, or null.
    [[nodiscard]] FeatureAttributesPtr hovered() const noexcept;

    /// Attributes of the clicked solid, or null.
    [[nodiscard]] FeatureAttributesPtr selected() const noexcept;

    void clearSelected() noexcept;

    /** @brief Hover/selection change stamp for UI polling (monotonic). */
    [[nodiscard]] uint64_t pickStamp() const noexcept;

    // ------------------------------------------------------------
    // Per-frame steps (called by the render loop, in this order)
    // ------------------------------------------------------------

    /**
     * @brief One damping step of the viewport's orbit controller.
     * @return True if the camera moved.
     */
    bool advanceCamera(Viewport* vp) noexcept;

    /**
     * @brief Performs the pending pick, if any.
     * @return True if a pick was performed.
     */
    bool resolvePick(Viewport* vp);

    /**
     * @brief Work that must happen outside the render pass (uploads, retired solids).
     */
    void renderPrePass(Viewport* vp, const RenderFrameContext& fc);

    /**
     * @brief Render the scene for a viewport.
     */
    void render(Viewport* vp, const RenderFrameContext& fc);

    // ------------------------------------------------------------
    // Input dispatch
    // ------------------------------------------------------------

    /** @brief Handle mouse press event. */
    void mousePressEvent(Viewport* vp, CoreEvent event) noexcept;

    /** @brief Handle mouse move event (hover and drag). */
    void mouseMoveEvent(Viewport* vp, CoreEvent event) noexcept;

    /**
     * @brief Handle mouse release event.
     *
     * A left release within the click slop of its press selects the solid
     * under the pointer.
     */
    void mouseReleaseEvent(Viewport* vp, CoreEvent event);

    /** @brief Handle mouse wheel event (deltaY in notches, positive = away from user). */
    void mouseWheelEvent(Viewport* vp, CoreEvent event) noexcept;

    [[nodiscard]] const ViewSettings& settings() const noexcept
    {
        return m_settings;
    }

private:
    void rebuildScene();

    /// Pointer drag bookkeeping between press and release.
    struct DragState
    {
        Viewport* vp     = nullptr;
        int       button = 0;
        glm::vec2 press  = glm::vec2(0.0f);
        glm::vec2 last   = glm::vec2(0.0f);
        float     travel = 0.0f; ///< Max distance from press, pixels
    };

private:
    ViewSettings m_settings = {};

    /** @brief All active viewports. */
    std::vector<std::unique_ptr<Viewport>> m_viewports;

    std::vector<GeoFeature> m_features     = {};
    HighlightSet            m_highlightIds = {};
    glm::dvec2              m_origin       = glm::dvec2(0.0);

    std::unique_ptr<SceneGraph> m_sceneGraph;
    std::unique_ptr<Renderer>   m_renderer;
    std::unique_ptr<Picker>     m_picker;

    /** @brief Scene query factory. */
    ItemFactory<SceneQuery> m_sceneQueryFactory;
    std::string             m_sceneQueryName;

    DragState m_drag = {};
};
