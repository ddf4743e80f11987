#include <Core.hpp>
#include <SceneGraph.hpp>
#include <Solid.hpp>
#include <Viewport.hpp>
#include <gtest/gtest.h>
#include <stdexcept>

#include "TestHelpers.hpp"

namespace
{
    constexpr double kLon = -114.07;
    constexpr double kLat = 51.04;

    CoreEvent pointer(float x, float y, int button = 0)
    {
        CoreEvent ev;
        ev.button = button;
        ev.x      = x;
        ev.y      = y;
        return ev;
    }

    std::string idOf(const FeatureAttributesPtr& attrs)
    {
        const AttributeValue* v = geo::findAttribute(attrs.get(), geo::kIdKey);
        return v ? geo::attributeText(*v) : std::string{};
    }

    // Two 100 m lots 200 m apart; lot-2 is taller and highlighted.
    class TwoLotsTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            m_features = {
                testutil::rectFeature("lot-1", kLon, kLat, -50.0, -50.0, 100.0, 100.0, 10.0),
                testutil::rectFeature("lot-2", kLon, kLat, 150.0, -50.0, 100.0, 100.0, 50.0),
            };

            m_core.setFeatures(m_features);
            m_core.setHighlightIds({"lot-2"});

            m_vp = m_core.createViewport();
            m_core.resizeViewport(m_vp, 800, 600);
        }

        void TearDown() override
        {
            m_core.destroyViewport(m_vp);
        }

        // Screen position of the top-cap center of solid @p index.
        glm::vec2 pixelOverSolid(std::size_t index) const
        {
            const Solid*    s   = m_core.sceneGraph().solids()[index].get();
            glm::vec3       top = s->bounds().center();
            top.y               = s->bounds().max.y;
            const glm::vec3 px  = m_vp->project(top);
            return {px.x, px.y};
        }

        void click(const glm::vec2& px)
        {
            m_core.mousePressEvent(m_vp, pointer(px.x, px.y, kButtonLeft));
            m_core.mouseReleaseEvent(m_vp, pointer(px.x, px.y, kButtonLeft));
        }

        Core                    m_core;
        Viewport*               m_vp = nullptr;
        std::vector<GeoFeature> m_features;
    };
} // namespace

TEST(Core, UnknownSceneQueryThrows)
{
    EXPECT_THROW(Core(ViewSettings{}, "octree"), std::runtime_error);

    Core core;
    EXPECT_EQ(core.sceneQueryName(), "cpu");
    EXPECT_THROW(core.setSceneQuery("octree"), std::runtime_error);
    EXPECT_EQ(core.sceneQueryName(), "cpu");
}

TEST(Core, SwapchainInitFailsWithoutDevice)
{
    Core core;
    EXPECT_FALSE(core.initializeSwapchain(VK_NULL_HANDLE));
}

TEST(Core, EmptySceneUsesFallbackOrigin)
{
    Core core;
    core.setFeatures({});

    EXPECT_EQ(core.sceneStats().solids, 0u);

    const glm::dvec2 expected = geo::project(geo::kFallbackCenter);
    EXPECT_DOUBLE_EQ(core.projectionOrigin().x, expected.x);
    EXPECT_DOUBLE_EQ(core.projectionOrigin().y, expected.y);
}

TEST_F(TwoLotsTest, BuildsBothSolids)
{
    const SceneStats stats = m_core.sceneStats();
    EXPECT_EQ(stats.features, 2u);
    EXPECT_EQ(stats.solids, 2u);
    EXPECT_EQ(stats.highlighted, 1u);
    EXPECT_EQ(stats.triangles, 24u);

    const auto& solids = m_core.sceneGraph().solids();
    ASSERT_EQ(solids.size(), 2u);

    EXPECT_EQ(solids[0]->featureId(), "lot-1");
    EXPECT_DOUBLE_EQ(solids[0]->depth(), 10.0);
    EXPECT_FALSE(solids[0]->material().highlighted);
    EXPECT_EQ(solids[0]->material().color, m_core.settings().solidColor);

    EXPECT_EQ(solids[1]->featureId(), "lot-2");
    EXPECT_DOUBLE_EQ(solids[1]->depth(), 50.0);
    EXPECT_TRUE(solids[1]->material().highlighted);
    EXPECT_EQ(solids[1]->material().color, m_core.settings().highlightColor);

    // lot-2 lies east of lot-1.
    EXPECT_GT(solids[1]->bounds().min.x, solids[0]->bounds().max.x);

    const glm::dvec2 origin = geo::projectionOrigin(m_features);
    EXPECT_DOUBLE_EQ(m_core.projectionOrigin().x, origin.x);
    EXPECT_DOUBLE_EQ(m_core.projectionOrigin().y, origin.y);
}

TEST_F(TwoLotsTest, HoverFollowsPointer)
{
    // Scene was rebuilt after nothing was picked: first frame resolves at the center.
    EXPECT_TRUE(m_core.resolvePick(m_vp));
    EXPECT_EQ(idOf(m_core.hovered()), "lot-1");

    const uint64_t  stamp = m_core.pickStamp();
    const glm::vec2 px    = pixelOverSolid(1);

    m_core.mouseMoveEvent(m_vp, pointer(px.x, px.y));
    EXPECT_TRUE(m_core.resolvePick(m_vp));
    EXPECT_EQ(idOf(m_core.hovered()), "lot-2");
    EXPECT_GT(m_core.pickStamp(), stamp);

    // Nothing pending until the next move, rebuild or resize.
    EXPECT_FALSE(m_core.resolvePick(m_vp));
}

TEST_F(TwoLotsTest, ClickSelectsAndMissKeepsSelection)
{
    click(pixelOverSolid(1));
    EXPECT_EQ(idOf(m_core.selected()), "lot-2");

    click(glm::vec2(2.0f, 2.0f));
    EXPECT_EQ(idOf(m_core.selected()), "lot-2");

    click(pixelOverSolid(0));
    EXPECT_EQ(idOf(m_core.selected()), "lot-1");

    m_core.clearSelected();
    EXPECT_EQ(m_core.selected(), nullptr);
}

TEST_F(TwoLotsTest, DragIsNotAClick)
{
    const glm::vec2 px = pixelOverSolid(1);

    m_core.mousePressEvent(m_vp, pointer(px.x, px.y, kButtonLeft));
    m_core.mouseMoveEvent(m_vp, pointer(px.x + 10.0f, px.y, kButtonLeft));
    m_core.mouseReleaseEvent(m_vp, pointer(px.x, px.y, kButtonLeft));

    EXPECT_EQ(m_core.selected(), nullptr);
    EXPECT_TRUE(m_core.advanceCamera(m_vp));
}

TEST_F(TwoLotsTest, SmallJitterStillClicks)
{
    const glm::vec2 px = pixelOverSolid(1);

    m_core.mousePressEvent(m_vp, pointer(px.x, px.y, kButtonLeft));
    m_core.mouseMoveEvent(m_vp, pointer(px.x + 2.0f, px.y + 1.0f, kButtonLeft));
    m_core.mouseReleaseEvent(m_vp, pointer(px.x + 2.0f, px.y + 1.0f, kButtonLeft));

    EXPECT_EQ(idOf(m_core.selected()), "lot-2");
}

TEST_F(TwoLotsTest, RightClickDoesNotSelect)
{
    const glm::vec2 px = pixelOverSolid(1);

    m_core.mousePressEvent(m_vp, pointer(px.x, px.y, kButtonRight));
    m_core.mouseReleaseEvent(m_vp, pointer(px.x, px.y, kButtonRight));

    EXPECT_EQ(m_core.selected(), nullptr);
}

TEST_F(TwoLotsTest, CameraMotionAloneDoesNotPick)
{
    ASSERT_TRUE(m_core.resolvePick(m_vp));

    CoreEvent wheel;
    wheel.deltaY = 2.0f;
    m_core.mouseWheelEvent(m_vp, wheel);

    EXPECT_TRUE(m_core.advanceCamera(m_vp));
    EXPECT_FALSE(m_core.resolvePick(m_vp));
}

TEST_F(TwoLotsTest, ResizeForcesPick)
{
    ASSERT_TRUE(m_core.resolvePick(m_vp));
    ASSERT_FALSE(m_core.resolvePick(m_vp));

    m_core.resizeViewport(m_vp, 1024, 768);
    EXPECT_EQ(m_vp->width(), 1024);
    EXPECT_TRUE(m_core.resolvePick(m_vp));
}

TEST_F(TwoLotsTest, HighlightChangeRebuildsAndRepicks)
{
    ASSERT_TRUE(m_core.resolvePick(m_vp));

    const uint64_t stamp = m_core.sceneStamp();
    m_core.setHighlightIds({"lot-1"});

    EXPECT_GT(m_core.sceneStamp(), stamp);
    EXPECT_TRUE(m_core.sceneGraph().solids()[0]->material().highlighted);
    EXPECT_FALSE(m_core.sceneGraph().solids()[1]->material().highlighted);
    EXPECT_EQ(m_core.sceneStats().highlighted, 1u);

    EXPECT_TRUE(m_core.resolvePick(m_vp));
}

TEST_F(TwoLotsTest, ReplacingFeaturesDropsOldSolids)
{
    click(pixelOverSolid(1));
    ASSERT_NE(m_core.selected(), nullptr);

    m_core.setFeatures({m_features[1]});

    ASSERT_EQ(m_core.sceneStats().solids, 1u);
    EXPECT_EQ(m_core.sceneGraph().solids()[0]->featureId(), "lot-2");

    // Origin follows the new first feature.
    const glm::dvec2 origin = geo::projectionOrigin({m_features[1]});
    EXPECT_DOUBLE_EQ(m_core.projectionOrigin().x, origin.x);

    // Selection holds the feature record, not the solid.
    EXPECT_EQ(idOf(m_core.selected()), "lot-2");

    m_core.setFeatures({});
    EXPECT_EQ(m_core.sceneStats().solids, 0u);
    EXPECT_TRUE(m_core.resolvePick(m_vp));
    EXPECT_EQ(m_core.hovered(), nullptr);
}

TEST_F(TwoLotsTest, EmbreeBackendPicksTheSameSolid)
{
    m_core.setSceneQuery("embree");
    EXPECT_EQ(m_core.sceneQueryName(), "embree");

    const glm::vec2 px = pixelOverSolid(1);
    m_core.mouseMoveEvent(m_vp, pointer(px.x, px.y));
    ASSERT_TRUE(m_core.resolvePick(m_vp));
    EXPECT_EQ(idOf(m_core.hovered()), "lot-2");

    click(pixelOverSolid(0));
    EXPECT_EQ(idOf(m_core.selected()), "lot-1");

    // lot-3 duplicates lot-1 after it in traversal order.
    m_core.setFeatures({m_features[0],
                        testutil::rectFeature("lot-3", kLon, kLat, -50.0, -50.0, 100.0, 100.0, 10.0)});
    const glm::vec2 tie = pixelOverSolid(0);
    m_core.mouseMoveEvent(m_vp, pointer(tie.x, tie.y));
    ASSERT_TRUE(m_core.resolvePick(m_vp));
    EXPECT_EQ(idOf(m_core.hovered()), "lot-1");
}
