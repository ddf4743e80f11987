//============================================================
// SceneGraph.cpp
//============================================================
#include "SceneGraph.hpp"

#include <utility>

#include "Solid.hpp"

SceneGraph::SceneGraph() : m_changeCounter{std::make_shared<SysCounter>()}
{
}

SceneGraph::SceneGraph(const Extruder& extruder) :
    m_extruder{extruder},
    m_changeCounter{std::make_shared<SysCounter>()}
{
}

SceneGraph::~SceneGraph() noexcept = default;

void SceneGraph::disposeAll()
{
    for (std::unique_ptr<Solid>& s : m_solids)
    {
        if (s && s->gpu())
            m_retired.push_back(std::move(s));
    }

    m_solids.clear();
    m_bindings.clear();
}

void SceneGraph::rebuild(std::span<const GeoFeature> features,
                         const HighlightSet&         highlightSet,
                         const glm::dvec2&           origin)
{
    disposeAll();

    m_solids.reserve(features.size());
    m_bindings.reserve(features.size());

    for (const GeoFeature& feature : features)
    {
        std::unique_ptr<Solid> solid = m_extruder.extrude(feature, origin, highlightSet);
        if (!solid)
            continue;

        m_bindings.push_back(SolidBinding{solid->featureId(), solid->attributes()});
        m_solids.push_back(std::move(solid));
    }

    ++m_generation;
    m_changeCounter->change();
}

void SceneGraph::clear()
{
    disposeAll();

    ++m_generation;
    m_changeCounter->change();
}

SolidHandle SceneGraph::handleAt(std::size_t index) const noexcept
{
    if (index >= m_solids.size())
        return {};

    return SolidHandle{static_cast<uint32_t>(index), m_generation};
}

bool SceneGraph::isCurrent(const SolidHandle& handle) const noexcept
{
    return handle.valid() &&
           handle.generation == m_generation &&
           handle.index < m_solids.size();
}

const Solid* SceneGraph::solid(const SolidHandle& handle) const noexcept
{
    return isCurrent(handle) ? m_solids[handle.index].get() : nullptr;
}

const SolidBinding* SceneGraph::binding(const SolidHandle& handle) const noexcept
{
    return isCurrent(handle) ? &m_bindings[handle.index] : nullptr;
}

std::vector<std::unique_ptr<Solid>> SceneGraph::takeRetired()
{
    return std::exchange(m_retired, {});
}
