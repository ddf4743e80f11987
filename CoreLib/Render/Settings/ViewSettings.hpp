//============================================================
// ViewSettings.hpp
//============================================================
#pragma once

#include <cmath>
#include <cstdint>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

/**
 * @brief Look and camera defaults of the parcel view.
 *
 * Colors are 0xRRGGBB in sRGB; the renderer converts them to linear since the
 * swapchain is an sRGB format.
 */
struct ViewSettings
{
    // --------------------------------------------------------
    // Colors
    // --------------------------------------------------------
    uint32_t backgroundColor = 0xf8fafc;
    uint32_t groundColor     = 0xe2e8f0;
    uint32_t solidColor      = 0x8aa1c1;
    uint32_t highlightColor  = 0xff5533;

    // --------------------------------------------------------
    // Ground plane (square, centered on the origin)
    // --------------------------------------------------------
    bool  showGround      = true;
    float groundSize      = 50000.0f;
    float groundElevation = -2.0f;
    float groundBiasConst = 1.0f; // depth bias, like polygon offset (1, 1)
    float groundBiasSlope = 1.0f;

    // --------------------------------------------------------
    // Lighting
    // --------------------------------------------------------
    float     ambientIntensity = 0.85f;
    float     sunIntensity     = 0.90f;
    glm::vec3 sunPosition      = {300.0f, 800.0f, 500.0f}; // direction = normalize(position)

    // --------------------------------------------------------
    // Camera
    // --------------------------------------------------------
    float     fovDeg         = 55.0f;
    float     nearPlane      = 1.0f;
    float     farPlane       = 50000.0f;
    glm::vec3 cameraPosition = {800.0f, 900.0f, 800.0f};
    glm::vec3 cameraTarget   = {0.0f, 0.0f, 0.0f};

    // --------------------------------------------------------
    // Orbit controller
    // --------------------------------------------------------
    float dampingFactor   = 0.05f;
    float minPolarAngle   = 0.05f;                // radians from +Y
    float maxPolarAngle   = 0.49f * 3.14159265f;  // just above the horizon
    float rotateSpeed     = 1.0f;
    float zoomStep        = 0.95f; // distance scale per wheel notch
    float minDistance     = 5.0f;
    float maxDistance     = 40000.0f;
    float clickSlopPixels = 4.0f;
};

namespace settings
{
    [[nodiscard]] inline float srgbToLinear(float c) noexcept
    {
        return (c <= 0.04045f) ? c / 12.92f : std::pow((c + 0.055f) / 1.055f, 2.4f);
    }

    /**
     * @brief 0xRRGGBB (sRGB) to an opaque linear color.
     */
    [[nodiscard]] inline glm::vec4 linearColor(uint32_t rgb) noexcept
    {
        const float r = static_cast<float>((rgb >> 16) & 0xffu) / 255.0f;
        const float g = static_cast<float>((rgb >> 8) & 0xffu) / 255.0f;
        const float b = static_cast<float>(rgb & 0xffu) / 255.0f;

        return {srgbToLinear(r), srgbToLinear(g), srgbToLinear(b), 1.0f};
    }
} // namespace settings
