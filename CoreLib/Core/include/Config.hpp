//============================================================
// Config.hpp
//============================================================
#pragma once

#include "ItemFactory.hpp"

class SceneQuery;

namespace config
{
    /// Backend used when no scene query is requested by name.
    inline constexpr const char* kDefaultSceneQuery = "cpu";

    /**
     * @brief Register all available SceneQuery backends into the given factory.
     *
     * Registered keys: "cpu" (plain traversal) and "embree".
     */
    void registerSceneQueries(ItemFactory<SceneQuery>& factory);

} // namespace config
