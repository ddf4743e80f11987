#include "Config.hpp"

#include "SceneQueryCpu.hpp"
#include "SceneQueryEmbree.hpp"

namespace config
{

    void registerSceneQueries(ItemFactory<SceneQuery>& factory)
    {
        factory.registerItem("cpu", factory.createItemType<SceneQueryCpu>);
        factory.registerItem("embree", factory.createItemType<SceneQueryEmbree>);
    }

} // namespace config
