#include <Picker.hpp>
#include <SceneQueryCpu.hpp>
#include <SceneQueryEmbree.hpp>
#include <Solid.hpp>
#include <Viewport.hpp>
#include <gtest/gtest.h>
#include <stdexcept>

#include "TestHelpers.hpp"

namespace
{
    constexpr double kLon = -114.07;
    constexpr double kLat = 51.04;

    // A 100 m parcel around the projection origin and a tall one far east.
    std::vector<GeoFeature> parcels()
    {
        return {
            testutil::rectFeature("center", kLon, kLat, -50.0, -50.0, 100.0, 100.0, 10.0),
            testutil::rectFeature("east", kLon, kLat, 450.0, -50.0, 100.0, 100.0, 50.0),
        };
    }

    class PickerTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            m_viewport.resize(800, 600);
        }

        void build(const std::vector<GeoFeature>& features, const HighlightSet& hl = {})
        {
            m_graph.rebuild(features, hl, geo::projectionOrigin(features));
        }

        // Pointer NDC over the top-cap center of the solid at @p index.
        glm::vec2 ndcOverSolid(std::size_t index) const
        {
            const Solid*    s   = m_graph.solids()[index].get();
            glm::vec3       top = s->bounds().center();
            top.y               = s->bounds().max.y;
            const glm::vec3 px  = m_viewport.project(top);
            return m_viewport.toNdc(px.x, px.y);
        }

        // Two parcels on the same footprint with the same height.
        std::vector<GeoFeature> stacked() const
        {
            return {
                testutil::rectFeature("first", kLon, kLat, -50.0, -50.0, 100.0, 100.0, 10.0),
                testutil::rectFeature("second", kLon, kLat, -50.0, -50.0, 100.0, 100.0, 10.0),
            };
        }

        void expectFirstOnTie(std::unique_ptr<SceneQuery> query)
        {
            const auto features = stacked();
            build(features);
            Picker picker(&m_graph, std::move(query));

            picker.pointerMove(glm::vec2(0.0f));
            ASSERT_TRUE(picker.resolvePending(m_viewport));
            ASSERT_NE(picker.hovered(), nullptr);
            EXPECT_EQ(picker.hovered(), features[0].attributes);
        }

        Viewport   m_viewport;
        SceneGraph m_graph;
    };
} // namespace

TEST(Picker, RequiresGraphAndQuery)
{
    SceneGraph graph;
    EXPECT_THROW(Picker(nullptr, std::make_unique<SceneQueryCpu>()), std::runtime_error);
    EXPECT_THROW(Picker(&graph, nullptr), std::runtime_error);
}

TEST_F(PickerTest, StartsIdleAtViewportCenter)
{
    build(parcels());
    Picker picker(&m_graph, std::make_unique<SceneQueryCpu>());

    EXPECT_EQ(picker.phase(), PickPhase::Idle);
    EXPECT_FALSE(picker.pickPending());
    EXPECT_EQ(picker.pointer(), glm::vec2(0.0f));
    EXPECT_FALSE(picker.resolvePending(m_viewport));
    EXPECT_EQ(picker.hovered(), nullptr);
}

TEST_F(PickerTest, PointerMoveHoversNearestSolid)
{
    const auto features = parcels();
    build(features);
    Picker picker(&m_graph, std::make_unique<SceneQueryCpu>());

    const uint64_t stamp = picker.changeCounter()->value();

    picker.pointerMove(glm::vec2(0.0f));
    EXPECT_EQ(picker.phase(), PickPhase::PickPending);
    EXPECT_TRUE(picker.resolvePending(m_viewport));

    EXPECT_EQ(picker.phase(), PickPhase::Resolved);
    ASSERT_NE(picker.hovered(), nullptr);
    EXPECT_EQ(picker.hovered(), features[0].attributes);
    EXPECT_GT(picker.changeCounter()->value(), stamp);

    picker.pointerMove(ndcOverSolid(1));
    EXPECT_TRUE(picker.resolvePending(m_viewport));
    EXPECT_EQ(picker.hovered(), features[1].attributes);
}

TEST_F(PickerTest, EqualDistanceKeepsFirstInTraversalOrder)
{
    expectFirstOnTie(std::make_unique<SceneQueryCpu>());
}

TEST_F(PickerTest, EqualDistanceKeepsFirstInTraversalOrderEmbree)
{
    expectFirstOnTie(std::make_unique<SceneQueryEmbree>());
}

TEST_F(PickerTest, MissClearsHover)
{
    build(parcels());
    Picker picker(&m_graph, std::make_unique<SceneQueryCpu>());

    picker.pointerMove(glm::vec2(0.0f));
    ASSERT_TRUE(picker.resolvePending(m_viewport));
    ASSERT_NE(picker.hovered(), nullptr);

    // Top-left corner looks past both parcels.
    picker.pointerMove(glm::vec2(-0.98f, 0.98f));
    EXPECT_TRUE(picker.resolvePending(m_viewport));
    EXPECT_EQ(picker.hovered(), nullptr);
    EXPECT_EQ(picker.phase(), PickPhase::Idle);
}

TEST_F(PickerTest, AtMostOnePickPerResolve)
{
    build(parcels());

    int    rebuilds = 0;
    int    queries  = 0;
    Picker picker(&m_graph, std::make_unique<testutil::CountingQuery>(&rebuilds, &queries));

    picker.pointerMove(glm::vec2(0.1f, 0.1f));
    picker.pointerMove(glm::vec2(0.2f, 0.2f));
    picker.pointerMove(glm::vec2(0.3f, 0.3f));

    EXPECT_TRUE(picker.resolvePending(m_viewport));
    EXPECT_FALSE(picker.resolvePending(m_viewport));

    EXPECT_EQ(queries, 1);
    EXPECT_EQ(picker.pointer(), glm::vec2(0.3f, 0.3f));
}

TEST_F(PickerTest, QueryIsRebuiltOncePerGeneration)
{
    build(parcels());

    int    rebuilds = 0;
    int    queries  = 0;
    Picker picker(&m_graph, std::make_unique<testutil::CountingQuery>(&rebuilds, &queries));

    picker.pointerMove(glm::vec2(0.0f));
    picker.resolvePending(m_viewport);
    picker.pointerMove(glm::vec2(0.5f));
    picker.resolvePending(m_viewport);
    EXPECT_EQ(rebuilds, 1);

    build(parcels());
    picker.resolvePending(m_viewport);
    EXPECT_EQ(rebuilds, 2);
}

TEST_F(PickerTest, RebuildMakesPickPending)
{
    build(parcels());
    Picker picker(&m_graph, std::make_unique<SceneQueryCpu>());

    picker.pointerMove(glm::vec2(0.0f));
    ASSERT_TRUE(picker.resolvePending(m_viewport));
    const FeatureAttributesPtr before = picker.hovered();
    ASSERT_NE(before, nullptr);

    // Same geometry, new feature records.
    const auto replacement = parcels();
    build(replacement);

    EXPECT_TRUE(picker.pickPending());
    EXPECT_TRUE(picker.resolvePending(m_viewport));
    EXPECT_EQ(picker.hovered(), replacement[0].attributes);
    EXPECT_NE(picker.hovered(), before);

    // The old record stays readable through the previous reference.
    EXPECT_EQ(geo::attributeText(*geo::findAttribute(before.get(), "id")), "center");
}

TEST_F(PickerTest, RebuildToEmptySceneClearsHover)
{
    build(parcels());
    Picker picker(&m_graph, std::make_unique<SceneQueryCpu>());

    picker.pointerMove(glm::vec2(0.0f));
    ASSERT_TRUE(picker.resolvePending(m_viewport));
    ASSERT_NE(picker.hovered(), nullptr);

    build({});
    EXPECT_TRUE(picker.resolvePending(m_viewport));
    EXPECT_EQ(picker.hovered(), nullptr);
}

TEST_F(PickerTest, ForcePickWithoutMovement)
{
    build(parcels());
    Picker picker(&m_graph, std::make_unique<SceneQueryCpu>());

    picker.forcePick();
    EXPECT_TRUE(picker.pickPending());
    EXPECT_TRUE(picker.resolvePending(m_viewport));
    EXPECT_NE(picker.hovered(), nullptr);
}

TEST_F(PickerTest, ClickSelectsAndMissKeepsSelection)
{
    const auto features = parcels();
    build(features);
    Picker picker(&m_graph, std::make_unique<SceneQueryCpu>());

    picker.pointerMove(ndcOverSolid(1));
    EXPECT_TRUE(picker.click(m_viewport));
    EXPECT_EQ(picker.selected(), features[1].attributes);

    const uint64_t stamp = picker.changeCounter()->value();

    picker.pointerMove(glm::vec2(-0.98f, 0.98f));
    EXPECT_FALSE(picker.click(m_viewport));
    EXPECT_EQ(picker.selected(), features[1].attributes);
    EXPECT_EQ(picker.changeCounter()->value(), stamp);
}

TEST_F(PickerTest, SelectionSurvivesRebuild)
{
    const auto features = parcels();
    build(features);
    Picker picker(&m_graph, std::make_unique<SceneQueryCpu>());

    picker.pointerMove(glm::vec2(0.0f));
    ASSERT_TRUE(picker.click(m_viewport));

    build({});
    picker.resolvePending(m_viewport);

    EXPECT_EQ(picker.selected(), features[0].attributes);
}

TEST_F(PickerTest, ClearSelected)
{
    build(parcels());
    Picker picker(&m_graph, std::make_unique<SceneQueryCpu>());

    const uint64_t idle = picker.changeCounter()->value();
    picker.clearSelected();
    EXPECT_EQ(picker.changeCounter()->value(), idle);

    picker.pointerMove(glm::vec2(0.0f));
    ASSERT_TRUE(picker.click(m_viewport));

    const uint64_t stamp = picker.changeCounter()->value();
    picker.clearSelected();
    EXPECT_EQ(picker.selected(), nullptr);
    EXPECT_GT(picker.changeCounter()->value(), stamp);
}

TEST_F(PickerTest, ZeroSizedViewportNeverHits)
{
    build(parcels());
    Picker picker(&m_graph, std::make_unique<SceneQueryCpu>());

    Viewport collapsed;
    picker.pointerMove(glm::vec2(0.0f));
    EXPECT_TRUE(picker.resolvePending(collapsed));
    EXPECT_EQ(picker.hovered(), nullptr);
    EXPECT_FALSE(picker.click(collapsed));
}
