// ============================================================================
// Viewport.hpp  (Vulkan conventions: RH + ZO + projection Y-flip)
// ============================================================================

#pragma once

#include <SysCounter.hpp>
#include <cstdint>
#include <glm/glm.hpp>

#include "CoreUtilities.hpp"
#include "ViewSettings.hpp"

/**
 * @brief Perspective camera with a damped orbit controller (Vulkan conventions).
 *
 * The camera orbits a target point on spherical coordinates: azimuth around
 * world +Y, polar angle measured from +Y, and distance. Input (rotate, pan,
 * dolly) only accumulates deltas; advance() applies a damped fraction of them
 * once per frame and decays the rest.
 *
 * Conventions:
 *  - Right-handed view/projection.
 *  - Clip/NDC Z range is [0, 1] (ZO).
 *  - Projection matrix is Y-flipped so screen space is top-left origin, Y down.
 *
 * Screen space for project/unproject/ray:
 *  - x/y are pixels, origin top-left, y down.
 *  - z is depth in [0,1] (Vulkan depth semantics).
 *
 * Pointer NDC (rayNdc) follows the usual math convention instead: x right,
 * y up, both in [-1, 1].
 */
class Viewport
{
public:
    explicit Viewport(const ViewSettings& settings = {});

    /**
     * @brief Resizes the viewport in pixels.
     * @param width  New width in pixels (clamped to >= 0).
     * @param height New height in pixels (clamped to >= 0).
     */
    void resize(int32_t width, int32_t height) noexcept;

    void clearColor(const glm::vec4& color) noexcept;

    [[nodiscard]] glm::vec4 clearColor() const noexcept;

    // ------------------------------------------------------------
    // Orbit input (pixel deltas)
    // ------------------------------------------------------------

    /**
     * @brief Orbits around the target. A drag across the full viewport height
     *        turns by one full revolution.
     */
    void rotate(float deltaX, float deltaY) noexcept;

    /**
     * @brief Pans the target in the ground plane.
     *
     * Horizontal drag moves along the camera right vector, vertical drag along
     * the camera forward vector flattened onto the ground. The target never
     * leaves its elevation.
     */
    void pan(float deltaX, float deltaY) noexcept;

    /**
     * @brief Dollies toward (steps > 0) or away from (steps < 0) the target.
     *
     * Each step scales the distance by the zoom step factor.
     */
    void dolly(float steps) noexcept;

    /**
     * @brief Applies one damping step of the pending orbit input.
     * @return True if the camera moved.
     */
    bool advance() noexcept;

    // ------------------------------------------------------------
    // Projection helpers
    // ------------------------------------------------------------

    /**
     * @brief Projects a world-space point to screen space.
     * @return (x,y) in pixels (top-left origin, y down), z in [0,1].
     */
    [[nodiscard]] glm::vec3 project(const glm::vec3& world) const noexcept;

    /**
     * @brief Unprojects a screen-space point to world space.
     * @param screen (x,y) in pixels (top-left origin), z in [0,1].
     * @return World-space point. Returns (0,0,0) if viewport is invalid.
     */
    [[nodiscard]] glm::vec3 unproject(const glm::vec3& screen) const noexcept;

    /**
     * @brief Pixel position (top-left origin) to pointer NDC (y up).
     */
    [[nodiscard]] glm::vec2 toNdc(float x, float y) const noexcept;

    /**
     * @brief Constructs a world-space ray from screen coordinates.
     * @param x Pixel x coordinate (top-left origin).
     * @param y Pixel y coordinate (top-left origin).
     */
    [[nodiscard]] un::ray ray(float x, float y) const;

    /**
     * @brief Constructs a world-space ray from pointer NDC (x right, y up).
     *
     * The ray starts on the near plane.
     */
    [[nodiscard]] un::ray rayNdc(const glm::vec2& ndc) const;

    // ------------------------------------------------------------
    // State
    // ------------------------------------------------------------

    [[nodiscard]] glm::vec3 cameraPosition() const noexcept;

    [[nodiscard]] const glm::vec3& target() const noexcept
    {
        return m_target;
    }

    [[nodiscard]] float distance() const noexcept
    {
        return m_radius;
    }

    /// Angle from world +Y in radians.
    [[nodiscard]] float polarAngle() const noexcept
    {
        return m_phi;
    }

    /// Angle around world +Y in radians; 0 looks from +Z.
    [[nodiscard]] float azimuthAngle() const noexcept
    {
        return m_theta;
    }

    [[nodiscard]] int32_t width() const noexcept
    {
        return m_width;
    }

    [[nodiscard]] int32_t height() const noexcept
    {
        return m_height;
    }

    /**
     * @brief Returns width/height, or 1 if height is 0.
     */
    [[nodiscard]] float aspect() const noexcept;

    [[nodiscard]] const glm::mat4& projection() const noexcept
    {
        return m_matProj;
    }

    [[nodiscard]] const glm::mat4& view() const noexcept
    {
        return m_matView;
    }

    [[nodiscard]] const ViewSettings& settings() const noexcept
    {
        return m_settings;
    }

    /**
     * @brief Bumped on resize and on every camera move.
     */
    [[nodiscard]] SysCounterPtr changeCounter() const noexcept
    {
        return m_changeCounter;
    }

    /**
     * @brief Recomputes view/projection and cached derived matrices.
     *
     * Called by resize() and advance(); call it after changing the state by
     * other means if project/unproject/ray are used.
     */
    void apply() noexcept;

private:
    void clampOrbit() noexcept;

private:
    ViewSettings m_settings = {};

    int32_t m_width  = 0;
    int32_t m_height = 0;

    // Orbit state
    glm::vec3 m_target = glm::vec3(0.0f);
    float     m_radius = 1.0f;
    float     m_theta  = 0.0f;
    float     m_phi    = 0.0f;

    // Pending input, consumed by advance()
    float     m_deltaTheta = 0.0f;
    float     m_deltaPhi   = 0.0f;
    glm::vec3 m_panOffset  = glm::vec3(0.0f);
    float     m_scale      = 1.0f;

    glm::mat4 m_matProj        = glm::mat4(1.0f);
    glm::mat4 m_matView        = glm::mat4(1.0f);
    glm::mat4 m_matViewProj    = glm::mat4(1.0f);
    glm::mat4 m_matInvViewProj = glm::mat4(1.0f);

    SysCounterPtr m_changeCounter = {};

    glm::vec4 m_clearColor{1.0f};
};
