#include <GpuResources.hpp>
#include <SceneGraph.hpp>
#include <Solid.hpp>
#include <gtest/gtest.h>

#include "TestHelpers.hpp"

namespace
{
    constexpr double kLon = -114.07;
    constexpr double kLat = 51.04;

    class FakeGpu final : public GpuResources
    {
    public:
        explicit FakeGpu(int* destroyed) : m_destroyed(destroyed)
        {
        }

        ~FakeGpu() noexcept override
        {
            ++*m_destroyed;
        }

        void update(const RenderFrameContext&) override
        {
        }

        bool ready() const noexcept override
        {
            return true;
        }

    private:
        int* m_destroyed = nullptr;
    };

    std::vector<GeoFeature> threeParcels()
    {
        return {
            testutil::rectFeature("a", kLon, kLat, 0.0, 0.0, 10.0, 10.0),
            testutil::rectFeature("b", kLon, kLat, 20.0, 0.0, 10.0, 10.0, 30.0),
            testutil::rectFeature("c", kLon, kLat, 40.0, 0.0, 10.0, 10.0),
        };
    }

    glm::dvec2 originOf(const std::vector<GeoFeature>& features)
    {
        return geo::projectionOrigin(features);
    }
} // namespace

TEST(SceneGraph, RebuildMirrorsFeatureOrder)
{
    SceneGraph graph;
    const auto features = threeParcels();

    graph.rebuild(features, {"b"}, originOf(features));

    ASSERT_EQ(graph.solidCount(), 3u);
    EXPECT_EQ(graph.solids()[0]->featureId(), "a");
    EXPECT_EQ(graph.solids()[1]->featureId(), "b");
    EXPECT_EQ(graph.solids()[2]->featureId(), "c");

    EXPECT_FALSE(graph.solids()[0]->material().highlighted);
    EXPECT_TRUE(graph.solids()[1]->material().highlighted);

    const SolidBinding* b = graph.binding(graph.handleAt(1));
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->featureId, "b");
    EXPECT_EQ(b->attributes, features[1].attributes);
}

TEST(SceneGraph, RejectedFeaturesAreSkipped)
{
    SceneGraph graph;

    std::vector<GeoFeature> features = threeParcels();
    features.insert(features.begin() + 1, GeoFeature{});

    graph.rebuild(features, {}, originOf(features));

    ASSERT_EQ(graph.solidCount(), 3u);
    EXPECT_EQ(graph.solids()[1]->featureId(), "b");
}

TEST(SceneGraph, RebuildReplacesEverySolid)
{
    SceneGraph graph;
    const auto first = threeParcels();
    graph.rebuild(first, {}, originOf(first));

    const std::vector<GeoFeature> second = {testutil::rectFeature("z", kLon, kLat, 0.0, 0.0, 5.0, 5.0)};
    graph.rebuild(second, {}, originOf(second));

    ASSERT_EQ(graph.solidCount(), 1u);
    EXPECT_EQ(graph.solids()[0]->featureId(), "z");
}

TEST(SceneGraph, HandlesGoStaleOnRebuild)
{
    SceneGraph graph;
    const auto features = threeParcels();
    graph.rebuild(features, {}, originOf(features));

    const SolidHandle h = graph.handleAt(0);
    ASSERT_TRUE(graph.isCurrent(h));
    ASSERT_NE(graph.solid(h), nullptr);

    // Same content still invalidates.
    graph.rebuild(features, {}, originOf(features));

    EXPECT_FALSE(graph.isCurrent(h));
    EXPECT_EQ(graph.solid(h), nullptr);
    EXPECT_EQ(graph.binding(h), nullptr);
    EXPECT_TRUE(graph.isCurrent(graph.handleAt(0)));
}

TEST(SceneGraph, InvalidHandles)
{
    SceneGraph graph;
    const auto features = threeParcels();
    graph.rebuild(features, {}, originOf(features));

    EXPECT_FALSE(graph.handleAt(3).valid());
    EXPECT_EQ(graph.solid(SolidHandle{}), nullptr);
    EXPECT_EQ(graph.solid(SolidHandle{7, graph.generation()}), nullptr);
}

TEST(SceneGraph, GenerationAndCounterAdvance)
{
    SceneGraph graph;
    const uint64_t gen0   = graph.generation();
    const uint64_t stamp0 = graph.changeCounter()->value();

    const auto features = threeParcels();
    graph.rebuild(features, {}, originOf(features));
    EXPECT_EQ(graph.generation(), gen0 + 1);
    EXPECT_GT(graph.changeCounter()->value(), stamp0);

    graph.clear();
    EXPECT_EQ(graph.generation(), gen0 + 2);
    EXPECT_EQ(graph.solidCount(), 0u);
}

TEST(SceneGraph, SolidsWithGpuResourcesAreRetired)
{
    int destroyed = 0;

    SceneGraph graph;
    const auto features = threeParcels();
    graph.rebuild(features, {}, originOf(features));

    graph.solids()[0]->setGpu(std::make_unique<FakeGpu>(&destroyed));
    graph.solids()[2]->setGpu(std::make_unique<FakeGpu>(&destroyed));

    graph.rebuild({}, {}, originOf({}));

    EXPECT_EQ(graph.solidCount(), 0u);
    EXPECT_EQ(destroyed, 0);

    auto retired = graph.takeRetired();
    ASSERT_EQ(retired.size(), 2u);
    EXPECT_EQ(retired[0]->featureId(), "a");
    EXPECT_EQ(retired[1]->featureId(), "c");
    EXPECT_TRUE(graph.takeRetired().empty());

    retired.clear();
    EXPECT_EQ(destroyed, 2);
}

TEST(SceneGraph, ExtruderColorsAreUsed)
{
    SceneGraph graph(Extruder(0x010203, 0x040506));
    const auto features = threeParcels();
    graph.rebuild(features, {"c"}, originOf(features));

    EXPECT_EQ(graph.solids()[0]->material().color, 0x010203u);
    EXPECT_EQ(graph.solids()[2]->material().color, 0x040506u);
}
