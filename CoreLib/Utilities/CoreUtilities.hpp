//============================================================
// CoreUtilities.hpp
//============================================================
#pragma once

#include <cmath>
#include <concepts>
#include <glm/ext/scalar_constants.hpp>
#include <glm/glm.hpp>

/**
 * @defgroup MathUtils Math / Geometry Utilities
 * @brief Small helpers for rays, bounds and robust float handling used by picking
 *        and the camera.
 */
namespace un
{
    /**
     * @brief Simple ray type used for picking and intersections.
     * @ingroup MathUtils
     *
     * @note `dir` should be normalized. `inv` is the component-wise inverse of `dir`
     * (i.e., `1.0f / dir`) and is cached for faster AABB tests.
     */
    struct ray
    {
        glm::vec3 org; ///< Origin of the ray in 3D space.
        glm::vec3 dir; ///< Direction vector (should be normalized).
        glm::vec3 inv; ///< 1.0f / dir (component-wise); used for fast AABB tests.
    };

    /**
     * @brief Generic floating-point zero check.
     * @ingroup MathUtils
     */
    template<std::floating_point T>
    constexpr bool is_zero(T val)
    {
        return glm::abs(val) <= glm::epsilon<T>();
    }

    /**
     * @brief Normalize a vector safely (avoids NaNs for tiny/invalid inputs).
     *
     * Returns @p fallback if the vector length is near zero or non-finite.
     * @ingroup MathUtils
     */
    inline glm::vec3 safe_normalize(const glm::vec3& v,
                                    const glm::vec3& fallback = glm::vec3(0.0f),
                                    float            eps      = 1e-8f)
    {
        float len2 = glm::dot(v, v);
        if (len2 > eps * eps && std::isfinite(len2))
            return v / std::sqrt(len2);
        return fallback;
    }

    /**
     * @brief Build a ray from an origin and a (not necessarily unit) direction.
     *
     * The direction is normalized and its inverse cached. Zero components
     * produce +/-inf in `inv`, which the slab test handles.
     * @ingroup MathUtils
     */
    inline ray make_ray(const glm::vec3& org, const glm::vec3& dir)
    {
        ray r{};
        r.org = org;
        r.dir = safe_normalize(dir, glm::vec3(0.0f, 0.0f, -1.0f));
        r.inv = 1.0f / r.dir;
        return r;
    }

    /**
     * @brief Slab test of a ray against an axis-aligned box.
     *
     * @param r     Ray (uses `org` and `inv`).
     * @param bmin  Box minimum corner.
     * @param bmax  Box maximum corner.
     * @param out_t Entry distance (0 if the origin is inside).
     * @return True if the box is hit in front of the origin.
     * @ingroup MathUtils
     */
    bool ray_aabb_intersect(const ray&       r,
                            const glm::vec3& bmin,
                            const glm::vec3& bmax,
                            float&           out_t) noexcept;

    /**
     * @brief Intersect a ray with a triangle (Moller-Trumbore).
     *
     * Both faces are hit. Hits behind the origin are rejected.
     *
     * @param r     Input ray (org/dir).
     * @param a     Triangle vertex A.
     * @param b     Triangle vertex B.
     * @param c     Triangle vertex C.
     * @param out_t Distance along the ray to the hit point (if any).
     * @return True if the ray intersects the triangle.
     * @ingroup MathUtils
     */
    bool ray_triangle_intersect(const ray&       r,
                                const glm::vec3& a,
                                const glm::vec3& b,
                                const glm::vec3& c,
                                float&           out_t) noexcept;

} // namespace un
