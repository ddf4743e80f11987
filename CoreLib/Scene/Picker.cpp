#include "Picker.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "CoreUtilities.hpp"
#include "Viewport.hpp"

Picker::Picker(const SceneGraph* graph, std::unique_ptr<SceneQuery> query) :
    m_graph(graph),
    m_query(std::move(query)),
    m_changeCounter(std::make_shared<SysCounter>())
{
    if (!m_graph)
        throw std::runtime_error("Picker::Picker(): scene graph is null");

    if (!m_query)
        throw std::runtime_error("Picker::Picker(): scene query is null");

    // Only rebuilds after construction make a pick pending.
    m_graphMonitor = SysMonitor(m_graph->changeCounter(), false);
}

void Picker::pointerMove(const glm::vec2& ndc) noexcept
{
    m_pointer = ndc;
    m_phase   = PickPhase::PickPending;
}

void Picker::forcePick() noexcept
{
    m_phase = PickPhase::PickPending;
}

bool Picker::pickPending() const noexcept
{
    return m_phase == PickPhase::PickPending || m_graphMonitor.peek();
}

void Picker::setQuery(std::unique_ptr<SceneQuery> query)
{
    if (!query)
        throw std::runtime_error("Picker::setQuery(): scene query is null");

    m_query      = std::move(query);
    m_queryBuilt = false;
    m_phase      = PickPhase::PickPending;
}

void Picker::syncQuery()
{
    if (m_queryBuilt && m_queryGeneration == m_graph->generation())
        return;

    m_query->rebuild(m_graph);
    m_queryGeneration = m_graph->generation();
    m_queryBuilt      = true;
}

SolidHit Picker::castAtPointer(const Viewport& viewport)
{
    syncQuery();

    if (viewport.width() <= 0 || viewport.height() <= 0)
        return {};

    const un::ray r = viewport.rayNdc(m_pointer);
    return m_query->queryNearest(m_graph, r);
}

bool Picker::resolvePending(const Viewport& viewport)
{
    if (!pickPending())
        return false;

    m_graphMonitor.sync();

    const SolidHit hit = castAtPointer(viewport);

    FeatureAttributesPtr attrs = {};
    if (hit.valid())
    {
        if (const SolidBinding* b = m_graph->binding(hit.handle))
            attrs = b->attributes;
        else
            std::cerr << "Picker: query returned a stale solid handle.\n";
    }

    m_phase = attrs ? PickPhase::Resolved : PickPhase::Idle;

    if (attrs != m_hovered)
    {
        m_hovered = std::move(attrs);
        m_changeCounter->change();
    }

    return true;
}

bool Picker::click(const Viewport& viewport)
{
    const SolidHit hit = castAtPointer(viewport);
    if (!hit.valid())
        return false;

    const SolidBinding* b = m_graph->binding(hit.handle);
    if (!b)
        return false;

    if (b->attributes != m_selected)
    {
        m_selected = b->attributes;
        m_changeCounter->change();
    }

    return true;
}

void Picker::clearSelected() noexcept
{
    if (!m_selected)
        return;

    m_selected.reset();
    m_changeCounter->change();
}
