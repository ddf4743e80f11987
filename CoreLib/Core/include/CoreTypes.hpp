//============================================================
// CoreTypes.hpp
//============================================================
// Public types that are visible to both Core and the UI Application

#pragma once

/**
 * @brief Pointer event forwarded from the UI to Core.
 *
 * x/y are pixels relative to the viewport (top-left origin). deltaX/deltaY
 * carry wheel steps for wheel events.
 */
struct CoreEvent
{
    int   button    = 0; // Qt::MouseButton bits
    float x         = 0.0f;
    float y         = 0.0f;
    float deltaX    = 0.0f;
    float deltaY    = 0.0f;
    bool  shift_key = false;
    bool  ctrl_key  = false;
    bool  alt_key   = false;
};

/**
 * @brief Buttons as seen by Core (values match Qt::MouseButton).
 */
enum CoreButton : int
{
    kButtonLeft   = 0x1,
    kButtonRight  = 0x2,
    kButtonMiddle = 0x4,
};

/**
 * @brief Solid counts shown in the UI.
 */
struct SceneStats
{
    unsigned int features    = 0; ///< Features handed to the scene
    unsigned int solids      = 0; ///< Solids that were built
    unsigned int highlighted = 0; ///< Solids drawn with the highlight color
    unsigned int triangles   = 0;
};
