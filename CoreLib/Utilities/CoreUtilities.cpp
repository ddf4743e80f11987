//============================================================
// CoreUtilities.cpp
//============================================================
#include "CoreUtilities.hpp"

#include <algorithm>
#include <limits>

namespace un
{
    bool ray_aabb_intersect(const ray&       r,
                            const glm::vec3& bmin,
                            const glm::vec3& bmax,
                            float&           out_t) noexcept
    {
        float tmin = 0.0f;
        float tmax = std::numeric_limits<float>::max();

        for (int axis = 0; axis < 3; ++axis)
        {
            // inv may be +/-inf for axis-parallel rays; a NaN from 0 * inf means
            // the origin lies on the slab plane and the axis does not constrain t.
            float t0 = (bmin[axis] - r.org[axis]) * r.inv[axis];
            float t1 = (bmax[axis] - r.org[axis]) * r.inv[axis];

            if (std::isnan(t0) || std::isnan(t1))
                continue;

            if (t0 > t1)
                std::swap(t0, t1);

            tmin = std::max(tmin, t0);
            tmax = std::min(tmax, t1);

            if (tmax < tmin)
                return false;
        }

        out_t = tmin;
        return true;
    }

    bool ray_triangle_intersect(const ray&       r,
                                const glm::vec3& a,
                                const glm::vec3& b,
                                const glm::vec3& c,
                                float&           out_t) noexcept
    {
        constexpr float EPS = 1e-6f;

        const glm::vec3 e1  = b - a;
        const glm::vec3 e2  = c - a;
        const glm::vec3 p   = glm::cross(r.dir, e2);
        const float     det = glm::dot(e1, p);

        if (std::fabs(det) < EPS)
            return false;

        const float     invDet = 1.0f / det;
        const glm::vec3 tvec   = r.org - a;
        const float     u      = glm::dot(tvec, p) * invDet;
        if (u < 0.0f || u > 1.0f)
            return false;

        const glm::vec3 q = glm::cross(tvec, e1);
        const float     v = glm::dot(r.dir, q) * invDet;
        if (v < 0.0f || u + v > 1.0f)
            return false;

        const float t = glm::dot(e2, q) * invDet;
        if (t < 0.0f)
            return false;

        out_t = t;
        return true;
    }

} // namespace un
