//============================================================
// SceneQuery.hpp
//============================================================
#pragma once

#include <limits>

#include "SceneGraph.hpp"

namespace un
{
    struct ray;
} // namespace un

/**
 * @brief Nearest solid hit along a ray.
 */
struct SolidHit
{
    SolidHandle handle = {};                                ///< Solid that was hit
    float       dist   = std::numeric_limits<float>::max(); ///< Distance from ray origin

    [[nodiscard]] bool valid() const noexcept
    {
        return handle.valid();
    }
};

/**
 * @brief Abstract base class for hit-testing the solids of a SceneGraph.
 *
 * Implementations can use plain CPU traversal or Embree. The Picker only
 * talks to this interface.
 *
 * Ties: when two solids are hit at the same distance, the one earlier in the
 * graph's traversal order wins.
 */
class SceneQuery
{
public:
    virtual ~SceneQuery() = default;

    /// Rebuild any acceleration structures for the whole graph.
    virtual void rebuild(const SceneGraph* graph) = 0;

    /// Closest solid under the ray, or an invalid hit.
    [[nodiscard]] virtual SolidHit queryNearest(const SceneGraph* graph, const un::ray& ray) const = 0;

protected:
    SceneQuery() = default;
};
