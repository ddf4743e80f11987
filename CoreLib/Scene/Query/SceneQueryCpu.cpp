//============================================================
// SceneQueryCpu.cpp
//============================================================
#include "SceneQueryCpu.hpp"

#include "CoreUtilities.hpp"
#include "SceneGraph.hpp"
#include "Solid.hpp"

void SceneQueryCpu::rebuild(const SceneGraph* /*graph*/)
{
}

SolidHit SceneQueryCpu::queryNearest(const SceneGraph* graph, const un::ray& ray) const
{
    SolidHit best = {};
    if (!graph)
        return best;

    const auto& solids = graph->solids();

    for (std::size_t i = 0; i < solids.size(); ++i)
    {
        const Solid*       solid  = solids[i].get();
        const SolidBounds& bounds = solid->bounds();
        if (bounds.empty)
            continue;

        float tBox = 0.0f;
        if (!un::ray_aabb_intersect(ray, bounds.min, bounds.max, tBox) || tBox > best.dist)
            continue;

        const SolidMesh& mesh = solid->mesh();
        for (std::size_t t = 0, n = mesh.triangleCount(); t < n; ++t)
        {
            float dist = 0.0f;
            if (!un::ray_triangle_intersect(ray, mesh.corner(t, 0), mesh.corner(t, 1), mesh.corner(t, 2), dist))
                continue;

            // Strictly closer only: an equal distance keeps the earlier solid.
            if (dist < best.dist)
            {
                best.dist   = dist;
                best.handle = graph->handleAt(i);
            }
        }
    }

    return best;
}
