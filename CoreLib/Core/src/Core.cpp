//=============================================================================
// Core.cpp
//=============================================================================
#include "Core.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "Extruder.hpp"
#include "Picker.hpp"
#include "Renderer.hpp"
#include "SceneGraph.hpp"
#include "SceneQuery.hpp"
#include "Solid.hpp"
#include "Viewport.hpp"

Core::Core(const ViewSettings& settings, const std::string& sceneQuery) :
    m_settings{settings},
    m_sceneGraph{std::make_unique<SceneGraph>(Extruder(settings.solidColor, settings.highlightColor))},
    m_renderer{std::make_unique<Renderer>(settings)}
{
    config::registerSceneQueries(m_sceneQueryFactory);

    std::unique_ptr<SceneQuery> query = m_sceneQueryFactory.createItem(sceneQuery);
    if (!query)
        throw std::runtime_error("Core::Core(): unknown scene query \"" + sceneQuery + "\"");

    m_sceneQueryName = sceneQuery;
    m_picker         = std::make_unique<Picker>(m_sceneGraph.get(), std::move(query));
}

Core::~Core()
{
    destroy();
}

// ------------------------------------------------------------
// Device / swapchain lifetime
// ------------------------------------------------------------

bool Core::initializeDevice(const VulkanContext& ctx)
{
    return m_renderer && m_renderer->initDevice(ctx);
}

bool Core::initializeSwapchain(VkRenderPass renderPass)
{
    return m_renderer && m_renderer->initSwapchain(renderPass);
}

void Core::destroySwapchainResources()
{
    if (m_renderer)
        m_renderer->destroySwapchainResources();
}

void Core::destroy()
{
    if (m_renderer)
        m_renderer->shutdown(m_sceneGraph.get());
}

// ------------------------------------------------------------
// Viewports
// ------------------------------------------------------------

Viewport* Core::createViewport()
{
    m_viewports.emplace_back(std::make_unique<Viewport>(m_settings));
    return m_viewports.back().get();
}

void Core::destroyViewport(Viewport* vp) noexcept
{
    if (!vp)
        return;

    if (m_renderer)
        m_renderer->releaseViewport(vp);

    if (m_drag.vp == vp)
        m_drag = {};

    std::erase_if(m_viewports, [vp](const std::unique_ptr<Viewport>& p) { return p.get() == vp; });
}

void Core::resizeViewport(Viewport* vp, int w, int h) noexcept
{
    if (!vp)
        return;

    vp->resize(w, h);

    if (m_picker)
        m_picker->forcePick();
}

// ------------------------------------------------------------
// Scene content
// ------------------------------------------------------------

void Core::setFeatures(std::vector<GeoFeature> features)
{
    m_features = std::move(features);
    m_origin   = geo::projectionOrigin(m_features);

    rebuildScene();
}

void Core::setHighlightIds(HighlightSet ids)
{
    m_highlightIds = std::move(ids);

    rebuildScene();
}

void Core::rebuildScene()
{
    if (!m_sceneGraph)
        throw std::runtime_error("Core::rebuildScene(): scene graph does not exist");

    m_sceneGraph->rebuild(m_features, m_highlightIds, m_origin);
}

const SceneGraph& Core::sceneGraph() const
{
    if (!m_sceneGraph)
        throw std::runtime_error("Core::sceneGraph(): scene graph does not exist");

    return *m_sceneGraph;
}

SceneStats Core::sceneStats() const noexcept
{
    SceneStats stats{};
    stats.features = static_cast<unsigned int>(m_features.size());

    if (!m_sceneGraph)
        return stats;

    for (const auto& solid : m_sceneGraph->solids())
    {
        ++stats.solids;
        stats.triangles += static_cast<unsigned int>(solid->mesh().triangleCount());

        if (solid->material().highlighted)
            ++stats.highlighted;
    }

    return stats;
}

uint64_t Core::sceneStamp() const noexcept
{
    return m_sceneGraph ? m_sceneGraph->changeCounter()->value() : 0;
}

// ------------------------------------------------------------
// Picking
// ------------------------------------------------------------

void Core::setSceneQuery(const std::string& name)
{
    std::unique_ptr<SceneQuery> query = m_sceneQueryFactory.createItem(name);
    if (!query)
        throw std::runtime_error("Core::setSceneQuery(): unknown scene query \"" + name + "\"");

    m_picker->setQuery(std::move(query));
    m_sceneQueryName = name;
}

FeatureAttributesPtr Core::hovered() const noexcept
{
    return m_picker ? m_picker->hovered() : FeatureAttributesPtr{};
}

FeatureAttributesPtr Core::selected() const noexcept
{
    return m_picker ? m_picker->selected() : FeatureAttributesPtr{};
}

void Core::clearSelected() noexcept
{
    if (m_picker)
        m_picker->clearSelected();
}

uint64_t Core::pickStamp() const noexcept
{
    return m_picker ? m_picker->changeCounter()->value() : 0;
}

// ------------------------------------------------------------
// Per-frame steps
// ------------------------------------------------------------

bool Core::advanceCamera(Viewport* vp) noexcept
{
    return vp && vp->advance();
}

bool Core::resolvePick(Viewport* vp)
{
    if (!vp || !m_picker)
        return false;

    return m_picker->resolvePending(*vp);
}

void Core::renderPrePass(Viewport* vp, const RenderFrameContext& fc)
{
    if (!vp || !fc.cmd || !m_renderer)
        return;

    m_renderer->renderPrePass(vp, m_sceneGraph.get(), fc);
}

void Core::render(Viewport* vp, const RenderFrameContext& fc)
{
    if (!vp || !m_renderer)
        return;

    vp->apply();
    m_renderer->render(vp, m_sceneGraph.get(), fc);
}

// ------------------------------------------------------------
// Input dispatch
// ------------------------------------------------------------

void Core::mousePressEvent(Viewport* vp, CoreEvent event) noexcept
{
    if (!vp)
        return;

    m_drag        = {};
    m_drag.vp     = vp;
    m_drag.button = event.button;
    m_drag.press  = glm::vec2(event.x, event.y);
    m_drag.last   = m_drag.press;
}

void Core::mouseMoveEvent(Viewport* vp, CoreEvent event) noexcept
{
    if (!vp)
        return;

    const glm::vec2 pos(event.x, event.y);

    if (m_picker)
        m_picker->pointerMove(vp->toNdc(pos.x, pos.y));

    if (m_drag.vp != vp || m_drag.button == 0)
        return;

    const glm::vec2 delta = pos - m_drag.last;
    m_drag.last           = pos;
    m_drag.travel         = std::max(m_drag.travel, glm::length(pos - m_drag.press));

    if (m_drag.button & kButtonLeft)
        vp->rotate(delta.x, delta.y);
    else if (m_drag.button & (kButtonRight | kButtonMiddle))
        vp->pan(delta.x, delta.y);
}

void Core::mouseReleaseEvent(Viewport* vp, CoreEvent event)
{
    if (!vp)
        return;

    const DragState drag = m_drag;
    m_drag               = {};

    if (drag.vp != vp || !(drag.button & kButtonLeft))
        return;

    const glm::vec2 pos(event.x, event.y);
    const float     travel = std::max(drag.travel, glm::length(pos - drag.press));

    if (travel >= m_settings.clickSlopPixels || !m_picker)
        return;

    m_picker->pointerMove(vp->toNdc(pos.x, pos.y));
    (void)m_picker->click(*vp);
}

void Core::mouseWheelEvent(Viewport* vp, CoreEvent event) noexcept
{
    if (!vp)
        return;

    // Wheel forward moves towards the target.
    vp->dolly(event.deltaY);
}
