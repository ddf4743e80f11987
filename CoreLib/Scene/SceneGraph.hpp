//============================================================
// SceneGraph.hpp
//============================================================
#pragma once

#include <SysCounter.hpp>
#include <cstddef>
#include <cstdint>
#include <glm/vec2.hpp>
#include <limits>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "Extruder.hpp"
#include "GeoFeature.hpp"

class Solid;

/**
 * @brief Generation-checked reference to a solid in the SceneGraph.
 *
 * A handle only resolves while its generation equals the graph's current
 * generation; every rebuild invalidates all handles issued before it.
 */
struct SolidHandle
{
    uint32_t index      = std::numeric_limits<uint32_t>::max();
    uint64_t generation = 0;

    [[nodiscard]] bool valid() const noexcept
    {
        return index != std::numeric_limits<uint32_t>::max();
    }

    bool operator==(const SolidHandle&) const = default;
};

/**
 * @brief Feature identity a solid was built from.
 */
struct SolidBinding
{
    std::string          featureId  = {};
    FeatureAttributesPtr attributes = {};
};

/**
 * @brief Owns the solids of the current feature set.
 *
 * Content always mirrors exactly one (features, highlight set, origin)
 * triple: rebuild() disposes every solid before extruding the new set, so no
 * solid of a previous feature set survives.
 *
 * Solids that own GPU resources are not destroyed in place. They move to a
 * retired list which the renderer drains into the frame's deferred deletion
 * queue.
 */
class SceneGraph
{
public:
    SceneGraph();
    explicit SceneGraph(const Extruder& extruder);
    ~SceneGraph() noexcept;

    SceneGraph(const SceneGraph&)            = delete;
    SceneGraph& operator=(const SceneGraph&) = delete;

    /**
     * @brief Replaces all solids with the extrusions of @p features.
     *
     * Features the Extruder rejects are skipped. Bumps the generation and the
     * change counter even when the result is identical.
     */
    void rebuild(std::span<const GeoFeature> features,
                 const HighlightSet&         highlightSet,
                 const glm::dvec2&           origin);

    /// Disposes every solid (generation and change counter advance).
    void clear();

    [[nodiscard]] std::size_t solidCount() const noexcept
    {
        return m_solids.size();
    }

    [[nodiscard]] uint64_t generation() const noexcept
    {
        return m_generation;
    }

    /// Handle of the solid at @p index in traversal order; invalid when out of range.
    [[nodiscard]] SolidHandle handleAt(std::size_t index) const noexcept;

    [[nodiscard]] bool isCurrent(const SolidHandle& handle) const noexcept;

    /// Null for stale or invalid handles.
    [[nodiscard]] const Solid* solid(const SolidHandle& handle) const noexcept;

    /// Null for stale or invalid handles.
    [[nodiscard]] const SolidBinding* binding(const SolidHandle& handle) const noexcept;

    /// All solids in traversal order (= feature order, rejected features omitted).
    [[nodiscard]] const std::vector<std::unique_ptr<Solid>>& solids() const noexcept
    {
        return m_solids;
    }

    /// Hands out solids disposed since the last call that still own GPU resources.
    [[nodiscard]] std::vector<std::unique_ptr<Solid>> takeRetired();

    [[nodiscard]] const Extruder& extruder() const noexcept
    {
        return m_extruder;
    }

    [[nodiscard]] SysCounterPtr changeCounter() const noexcept
    {
        return m_changeCounter;
    }

private:
    void disposeAll();

private:
    Extruder                            m_extruder      = {};
    std::vector<std::unique_ptr<Solid>> m_solids        = {};
    std::vector<SolidBinding>           m_bindings      = {};
    std::vector<std::unique_ptr<Solid>> m_retired       = {};
    uint64_t                            m_generation    = 0;
    SysCounterPtr                       m_changeCounter = {};
};
