//============================================================
// SceneQueryEmbree.hpp
//============================================================
#pragma once

#include <embree4/rtcore.h>

#include "SceneQuery.hpp"

/**
 * @brief Embree 4 implementation of SceneQuery.
 *
 * One triangle geometry per solid, attached with the solid's traversal index
 * as geometry id. An argument filter keeps the lowest geometry id among
 * equal-distance hits, matching the traversal-order rule of SceneQueryCpu.
 */
class SceneQueryEmbree final : public SceneQuery
{
public:
    SceneQueryEmbree();
    ~SceneQueryEmbree() override;

    SceneQueryEmbree(const SceneQueryEmbree&)            = delete;
    SceneQueryEmbree& operator=(const SceneQueryEmbree&) = delete;

    void rebuild(const SceneGraph* graph) override;

    [[nodiscard]] SolidHit queryNearest(const SceneGraph* graph, const un::ray& ray) const override;

private:
    void releaseScene() noexcept;

private:
    RTCDevice m_device     = nullptr;
    RTCScene  m_rtcScene   = nullptr;
    uint64_t  m_generation = 0; ///< graph generation m_rtcScene was built from
};
