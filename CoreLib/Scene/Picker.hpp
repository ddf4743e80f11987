//============================================================
// Picker.hpp
//============================================================
#pragma once

#include <SysCounter.hpp>
#include <glm/vec2.hpp>
#include <memory>

#include "GeoFeature.hpp"
#include "SceneGraph.hpp"
#include "SceneQuery.hpp"

class Viewport;

enum class PickPhase
{
    Idle,        ///< Nothing under the pointer after the last pick
    PickPending, ///< A pick is due on the next frame
    Resolved,    ///< Last pick hit a solid
};

/**
 * @brief Hover/select state machine over a SceneGraph.
 *
 * Pointer moves only record the position; the actual ray cast happens at most
 * once per frame in resolvePending(). Graph rebuilds are observed through the
 * graph's change counter and also make a pick pending.
 */
class Picker
{
public:
    Picker(const SceneGraph* graph, std::unique_ptr<SceneQuery> query);

    Picker(const Picker&)            = delete;
    Picker& operator=(const Picker&) = delete;

    /**
     * @brief Records the pointer in NDC (x right, y up, [-1, 1]).
     */
    void pointerMove(const glm::vec2& ndc) noexcept;

    /**
     * @brief Requests a pick without pointer movement (viewport resize).
     */
    void forcePick() noexcept;

    /**
     * @brief True when a pick is due: pointer moved, graph rebuilt or forced.
     */
    [[nodiscard]] bool pickPending() const noexcept;

    /**
     * @brief Performs the pending pick, if any.
     *
     * Rebuilds the query structure first if the graph generation changed.
     * hovered() becomes the attributes of the nearest solid under the
     * pointer, or null on a miss.
     *
     * @return True if a pick was performed.
     */
    bool resolvePending(const Viewport& viewport);

    /**
     * @brief Casts a ray at the current pointer and selects the hit.
     *
     * A miss leaves the selection unchanged.
     *
     * @return True if something was selected.
     */
    bool click(const Viewport& viewport);

    void clearSelected() noexcept;

    /**
     * @brief Swaps the acceleration backend; the next pick rebuilds it.
     */
    void setQuery(std::unique_ptr<SceneQuery> query);

    [[nodiscard]] PickPhase phase() const noexcept
    {
        return m_phase;
    }

    [[nodiscard]] const glm::vec2& pointer() const noexcept
    {
        return m_pointer;
    }

    [[nodiscard]] const FeatureAttributesPtr& hovered() const noexcept
    {
        return m_hovered;
    }

    [[nodiscard]] const FeatureAttributesPtr& selected() const noexcept
    {
        return m_selected;
    }

    /// Bumped whenever hovered or selected changes.
    [[nodiscard]] SysCounterPtr changeCounter() const noexcept
    {
        return m_changeCounter;
    }

private:
    SolidHit castAtPointer(const Viewport& viewport);
    void     syncQuery();

private:
    const SceneGraph*           m_graph = nullptr;
    std::unique_ptr<SceneQuery> m_query;
    uint64_t                    m_queryGeneration = 0;
    bool                        m_queryBuilt      = false;

    SysMonitor m_graphMonitor;

    PickPhase            m_phase   = PickPhase::Idle;
    glm::vec2            m_pointer = glm::vec2(0.0f);
    FeatureAttributesPtr m_hovered  = {};
    FeatureAttributesPtr m_selected = {};

    SysCounterPtr m_changeCounter = {};
};
