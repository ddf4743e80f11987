//============================================================
// SceneQueryCpu.hpp
//============================================================
#pragma once

#include "SceneQuery.hpp"

/**
 * @brief CPU implementation of SceneQuery.
 *
 * Walks the solids in traversal order, rejects them with a bounds slab test
 * and intersects the remaining triangles. No acceleration structure is kept,
 * so rebuild() has nothing to do.
 */
class SceneQueryCpu final : public SceneQuery
{
public:
    SceneQueryCpu()           = default;
    ~SceneQueryCpu() override = default;

    void rebuild(const SceneGraph* graph) override;

    [[nodiscard]] SolidHit queryNearest(const SceneGraph* graph, const un::ray& ray) const override;
};
