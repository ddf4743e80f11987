//============================================================
// SceneQueryEmbree.cpp
//============================================================
#include "SceneQueryEmbree.hpp"

#include <embree4/rtcore_ray.h>
#include <iostream>
#include <limits>

#include "CoreUtilities.hpp"
#include "SceneGraph.hpp"
#include "Solid.hpp"

namespace
{
    struct RTCFloat3
    {
        float x, y, z;
    };

    struct RTCTri
    {
        unsigned int v0, v1, v2;
    };

    // Nearest hit seen so far; the RTCRayQueryContext must stay the first member.
    struct NearestQueryContext
    {
        RTCRayQueryContext context;
        float              bestT    = std::numeric_limits<float>::infinity();
        unsigned int       bestGeom = RTC_INVALID_GEOMETRY_ID;
    };

    // Embree accepts hits at t == tfar, so an equal-distance candidate from a
    // later solid reaches this filter and is rejected here.
    void keepFirstOnTies(const RTCFilterFunctionNArguments* args)
    {
        auto* ctx = reinterpret_cast<NearestQueryContext*>(args->context);

        for (unsigned int k = 0; k < args->N; ++k)
        {
            if (args->valid[k] == 0)
                continue;

            const float        t    = RTCRayN_tfar(args->ray, args->N, k);
            const unsigned int geom = RTCHitN_geomID(args->hit, args->N, k);

            if (t == ctx->bestT && geom > ctx->bestGeom)
            {
                args->valid[k] = 0;
                continue;
            }

            ctx->bestT    = t;
            ctx->bestGeom = geom;
        }
    }

    RTCRayHit fromRay(const un::ray& ray)
    {
        RTCRayHit rh{};
        rh.ray.org_x = ray.org.x;
        rh.ray.org_y = ray.org.y;
        rh.ray.org_z = ray.org.z;

        rh.ray.dir_x = ray.dir.x;
        rh.ray.dir_y = ray.dir.y;
        rh.ray.dir_z = ray.dir.z;

        rh.ray.tnear = 0.0f;
        rh.ray.tfar  = std::numeric_limits<float>::max();
        rh.ray.mask  = 0xFFFFFFFFu;
        rh.ray.flags = 0;

        rh.hit.geomID = RTC_INVALID_GEOMETRY_ID;
        rh.hit.primID = RTC_INVALID_GEOMETRY_ID;
        return rh;
    }

    void embreeError(void* /*userPtr*/, RTCError code, const char* str)
    {
        std::cerr << "SceneQueryEmbree: error " << int(code) << ": " << (str ? str : "") << "\n";
    }

} // namespace

SceneQueryEmbree::SceneQueryEmbree()
{
    m_device = rtcNewDevice(nullptr); // nullptr = default config

    if (!m_device)
    {
        std::cerr << "SceneQueryEmbree: rtcNewDevice failed.\n";
        return;
    }

    rtcSetDeviceErrorFunction(m_device, embreeError, nullptr);

    const auto tasking = rtcGetDeviceProperty(m_device, RTC_DEVICE_PROPERTY_TASKING_SYSTEM);

    if (tasking == 1)
        std::cerr << "Embree tasking system: TBB\n";
    else if (tasking == 0)
        std::cerr << "Embree tasking system: internal\n";
    else if (tasking == 2)
        std::cerr << "Embree tasking system: PPL\n";
}

SceneQueryEmbree::~SceneQueryEmbree()
{
    releaseScene();

    if (m_device)
        rtcReleaseDevice(m_device);
}

void SceneQueryEmbree::releaseScene() noexcept
{
    if (m_rtcScene)
    {
        rtcReleaseScene(m_rtcScene);
        m_rtcScene = nullptr;
    }
}

void SceneQueryEmbree::rebuild(const SceneGraph* graph)
{
    releaseScene();

    if (!graph || !m_device)
        return;

    m_rtcScene = rtcNewScene(m_device);
    rtcSetSceneFlags(m_rtcScene,
                     static_cast<RTCSceneFlags>(RTC_SCENE_FLAG_ROBUST | RTC_SCENE_FLAG_FILTER_FUNCTION_IN_ARGUMENTS));
    rtcSetSceneBuildQuality(m_rtcScene, RTC_BUILD_QUALITY_MEDIUM);

    const auto& solids = graph->solids();

    for (std::size_t i = 0; i < solids.size(); ++i)
    {
        const SolidMesh&  mesh     = solids[i]->mesh();
        const std::size_t triCount = mesh.triangleCount();
        if (triCount == 0)
            continue;

        RTCGeometry geom = rtcNewGeometry(m_device, RTC_GEOMETRY_TYPE_TRIANGLE);
        rtcSetGeometryBuildQuality(geom, RTC_BUILD_QUALITY_MEDIUM);

        // Corner-expanded: vertex 3t+c is corner c of triangle t.
        auto* vbuf = static_cast<RTCFloat3*>(
            rtcSetNewGeometryBuffer(geom,
                                    RTC_BUFFER_TYPE_VERTEX,
                                    0,
                                    RTC_FORMAT_FLOAT3,
                                    sizeof(RTCFloat3),
                                    triCount * 3));

        auto* ibuf = static_cast<RTCTri*>(
            rtcSetNewGeometryBuffer(geom,
                                    RTC_BUFFER_TYPE_INDEX,
                                    0,
                                    RTC_FORMAT_UINT3,
                                    sizeof(RTCTri),
                                    triCount));

        if (!vbuf || !ibuf)
        {
            rtcReleaseGeometry(geom);
            continue;
        }

        const auto& positions = mesh.positions();
        for (std::size_t v = 0; v < positions.size(); ++v)
            vbuf[v] = RTCFloat3{positions[v].x, positions[v].y, positions[v].z};

        for (std::size_t t = 0; t < triCount; ++t)
        {
            const auto base = static_cast<unsigned int>(t * 3);
            ibuf[t]         = RTCTri{base, base + 1, base + 2};
        }

        rtcSetGeometryEnableFilterFunctionFromArguments(geom, true);
        rtcCommitGeometry(geom);
        rtcAttachGeometryByID(m_rtcScene, geom, static_cast<unsigned int>(i));
        rtcReleaseGeometry(geom);
    }

    rtcCommitScene(m_rtcScene);
    m_generation = graph->generation();
}

SolidHit SceneQueryEmbree::queryNearest(const SceneGraph* graph, const un::ray& ray) const
{
    SolidHit hit = {};

    if (!graph || !m_rtcScene)
        return hit;

    if (m_generation != graph->generation())
    {
        std::cerr << "SceneQueryEmbree: query against a stale acceleration structure.\n";
        return hit;
    }

    RTCRayHit rh = fromRay(ray);

    NearestQueryContext ctx;
    rtcInitRayQueryContext(&ctx.context);

    RTCIntersectArguments args;
    rtcInitIntersectArguments(&args);
    args.context = &ctx.context;
    args.flags   = RTC_RAY_QUERY_FLAG_INVOKE_ARGUMENT_FILTER;
    args.filter  = &keepFirstOnTies;

    rtcIntersect1(m_rtcScene, &rh, &args);

    if (rh.hit.geomID == RTC_INVALID_GEOMETRY_ID)
        return hit;

    hit.handle = graph->handleAt(rh.hit.geomID);
    hit.dist   = rh.ray.tfar;
    return hit;
}
