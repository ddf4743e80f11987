#include "Viewport.hpp"

#include <algorithm>
#include <cmath>
#include <glm/ext/scalar_constants.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace
{
    // Below this, advance() treats the camera as settled.
    constexpr float kMoveEps = 1e-6f;
} // namespace

Viewport::Viewport(const ViewSettings& settings) :
    m_settings(settings),
    m_target(settings.cameraTarget),
    m_changeCounter(std::make_shared<SysCounter>()),
    m_clearColor(settings::linearColor(settings.backgroundColor))
{
    const glm::vec3 offset = m_settings.cameraPosition - m_target;

    m_radius = glm::length(offset);
    m_theta  = std::atan2(offset.x, offset.z);
    m_phi    = (m_radius > 0.0f) ? std::acos(std::clamp(offset.y / m_radius, -1.0f, 1.0f)) : 0.0f;

    clampOrbit();
    apply();
}

void Viewport::resize(int32_t width, int32_t height) noexcept
{
    width  = std::max<int32_t>(0, width);
    height = std::max<int32_t>(0, height);

    if (m_width == width && m_height == height)
        return;

    m_width  = width;
    m_height = height;

    apply();
    m_changeCounter->change();
}

void Viewport::clearColor(const glm::vec4& color) noexcept
{
    if (m_clearColor != color)
    {
        m_clearColor = color;
        m_changeCounter->change();
    }
}

glm::vec4 Viewport::clearColor() const noexcept
{
    return m_clearColor;
}

// -----------------------------------------------------------------------------
// Orbit input
// -----------------------------------------------------------------------------

void Viewport::rotate(float deltaX, float deltaY) noexcept
{
    const float h = static_cast<float>(std::max<int32_t>(1, m_height));
    const float k = 2.0f * glm::pi<float>() * m_settings.rotateSpeed / h;

    // Dragging right swings the camera to the left around the target.
    m_deltaTheta -= deltaX * k;
    m_deltaPhi -= deltaY * k;
}

void Viewport::pan(float deltaX, float deltaY) noexcept
{
    const float h = static_cast<float>(std::max<int32_t>(1, m_height));

    // World units per pixel at the target distance.
    const float unitsPerPx = 2.0f * m_radius * std::tan(0.5f * glm::radians(m_settings.fovDeg)) / h;

    // Camera basis flattened onto the ground.
    const glm::vec3 right   = glm::vec3(std::cos(m_theta), 0.0f, -std::sin(m_theta));
    const glm::vec3 forward = glm::vec3(-std::sin(m_theta), 0.0f, -std::cos(m_theta));

    // Content follows the pointer: drag right moves the target left.
    m_panOffset += right * (-deltaX * unitsPerPx);
    m_panOffset += forward * (deltaY * unitsPerPx);
}

void Viewport::dolly(float steps) noexcept
{
    if (steps == 0.0f)
        return;

    m_scale *= std::pow(m_settings.zoomStep, steps);
}

bool Viewport::advance() noexcept
{
    const float damping = std::clamp(m_settings.dampingFactor, 0.0f, 1.0f);

    const glm::vec3 before = cameraPosition();
    const glm::vec3 target = m_target;

    m_theta += m_deltaTheta * damping;
    m_phi += m_deltaPhi * damping;
    m_radius *= m_scale;
    m_target += m_panOffset * damping;

    clampOrbit();

    m_deltaTheta *= (1.0f - damping);
    m_deltaPhi *= (1.0f - damping);
    m_panOffset *= (1.0f - damping);
    m_scale = 1.0f;

    const glm::vec3 after = cameraPosition();

    const bool moved = glm::length(after - before) > kMoveEps || glm::length(m_target - target) > kMoveEps;

    if (moved)
    {
        apply();
        m_changeCounter->change();
    }

    return moved;
}

void Viewport::clampOrbit() noexcept
{
    m_phi    = std::clamp(m_phi, m_settings.minPolarAngle, m_settings.maxPolarAngle);
    m_radius = std::clamp(m_radius, m_settings.minDistance, m_settings.maxDistance);

    // Keep the azimuth bounded so long sessions do not lose precision.
    constexpr float twoPi = 2.0f * glm::pi<float>();
    if (m_theta > glm::pi<float>())
        m_theta -= twoPi;
    else if (m_theta < -glm::pi<float>())
        m_theta += twoPi;
}

// -----------------------------------------------------------------------------
// Projection helpers
// -----------------------------------------------------------------------------

glm::vec3 Viewport::project(const glm::vec3& world) const noexcept
{
    if (m_width <= 0 || m_height <= 0)
        return glm::vec3(0.0f);

    const glm::vec4 clip = m_matViewProj * glm::vec4(world, 1.0f);

    if (clip.w == 0.0f)
        return glm::vec3(0.0f);

    const glm::vec3 ndc = glm::vec3(clip) / clip.w;

    const float w = static_cast<float>(m_width);
    const float h = static_cast<float>(m_height);

    // The Y flip in the projection already yields y-down screen coordinates.
    return glm::vec3((ndc.x * 0.5f + 0.5f) * w, (ndc.y * 0.5f + 0.5f) * h, ndc.z);
}

glm::vec3 Viewport::unproject(const glm::vec3& screen) const noexcept
{
    if (m_width <= 0 || m_height <= 0)
        return glm::vec3(0.0f);

    const float w = static_cast<float>(m_width);
    const float h = static_cast<float>(m_height);

    const glm::vec4 clip((screen.x / w) * 2.0f - 1.0f, (screen.y / h) * 2.0f - 1.0f, screen.z, 1.0f);
    const glm::vec4 worldH = m_matInvViewProj * clip;

    if (worldH.w == 0.0f)
        return glm::vec3(0.0f);

    return glm::vec3(worldH) / worldH.w;
}

glm::vec2 Viewport::toNdc(float x, float y) const noexcept
{
    if (m_width <= 0 || m_height <= 0)
        return glm::vec2(0.0f);

    const float w = static_cast<float>(m_width);
    const float h = static_cast<float>(m_height);

    return glm::vec2((x / w) * 2.0f - 1.0f, 1.0f - (y / h) * 2.0f);
}

un::ray Viewport::ray(float x, float y) const
{
    const glm::vec3 nearPt = unproject(glm::vec3(x, y, 0.0f));
    const glm::vec3 farPt  = unproject(glm::vec3(x, y, 1.0f));

    return un::make_ray(nearPt, farPt - nearPt);
}

un::ray Viewport::rayNdc(const glm::vec2& ndc) const
{
    const float w = static_cast<float>(m_width);
    const float h = static_cast<float>(m_height);

    return ray((ndc.x + 1.0f) * 0.5f * w, (1.0f - ndc.y) * 0.5f * h);
}

// -----------------------------------------------------------------------------
// State
// -----------------------------------------------------------------------------

glm::vec3 Viewport::cameraPosition() const noexcept
{
    const float s = std::sin(m_phi);

    return m_target + m_radius * glm::vec3(s * std::sin(m_theta), std::cos(m_phi), s * std::cos(m_theta));
}

float Viewport::aspect() const noexcept
{
    const float h = static_cast<float>(m_height);
    return (h > 0.0f) ? (static_cast<float>(m_width) / h) : 1.0f;
}

// -----------------------------------------------------------------------------
// apply()
// -----------------------------------------------------------------------------

void Viewport::apply() noexcept
{
    m_matView = glm::lookAtRH(cameraPosition(), m_target, glm::vec3(0.0f, 1.0f, 0.0f));

    m_matProj = glm::perspectiveRH_ZO(glm::radians(m_settings.fovDeg), aspect(), m_settings.nearPlane, m_settings.farPlane);

    // Flips Y so NDC maps to screen y-down coordinates in project/unproject.
    m_matProj[1][1] *= -1.0f;

    m_matViewProj    = m_matProj * m_matView;
    m_matInvViewProj = glm::inverse(m_matViewProj);
}
