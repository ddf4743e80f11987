#include <Viewport.hpp>
#include <gtest/gtest.h>

namespace
{
    void settle(Viewport& vp)
    {
        for (int i = 0; i < 2000 && vp.advance(); ++i)
        {
        }
    }
} // namespace

TEST(Viewport, StartsAtConfiguredCamera)
{
    Viewport vp;
    const glm::vec3 pos = vp.cameraPosition();

    EXPECT_NEAR(pos.x, 800.0f, 1e-2f);
    EXPECT_NEAR(pos.y, 900.0f, 1e-2f);
    EXPECT_NEAR(pos.z, 800.0f, 1e-2f);
    EXPECT_EQ(vp.target(), glm::vec3(0.0f));
}

TEST(Viewport, CenterRayLooksAtTarget)
{
    Viewport vp;
    vp.resize(800, 600);

    const un::ray   r        = vp.rayNdc(glm::vec2(0.0f));
    const glm::vec3 expected = glm::normalize(vp.target() - vp.cameraPosition());

    EXPECT_NEAR(glm::dot(r.dir, expected), 1.0f, 1e-4f);

    // Ray starts on the near plane, one unit in front of the camera.
    EXPECT_NEAR(glm::length(r.org - vp.cameraPosition()), 1.0f, 1e-2f);
}

TEST(Viewport, ProjectedTargetIsScreenCenter)
{
    Viewport vp;
    vp.resize(640, 480);

    const glm::vec3 px = vp.project(vp.target());
    EXPECT_NEAR(px.x, 320.0f, 1e-2f);
    EXPECT_NEAR(px.y, 240.0f, 1e-2f);

    const glm::vec2 ndc = vp.toNdc(px.x, px.y);
    EXPECT_NEAR(ndc.x, 0.0f, 1e-4f);
    EXPECT_NEAR(ndc.y, 0.0f, 1e-4f);
}

TEST(Viewport, NdcIsYUp)
{
    Viewport vp;
    vp.resize(200, 100);

    EXPECT_EQ(vp.toNdc(0.0f, 0.0f), glm::vec2(-1.0f, 1.0f));
    EXPECT_EQ(vp.toNdc(200.0f, 100.0f), glm::vec2(1.0f, -1.0f));
}

TEST(Viewport, RotationIsDamped)
{
    Viewport vp;
    vp.resize(800, 600);

    const float theta0 = vp.azimuthAngle();

    // A 60 px drag on a 600 px viewport is a tenth of a revolution.
    vp.rotate(60.0f, 0.0f);
    ASSERT_TRUE(vp.advance());

    const float full = -0.1f * 2.0f * glm::pi<float>();
    EXPECT_NEAR(vp.azimuthAngle() - theta0, full * 0.05f, 1e-4f);

    settle(vp);
    EXPECT_NEAR(vp.azimuthAngle() - theta0, full, 1e-3f);
    EXPECT_FALSE(vp.advance());
}

TEST(Viewport, PolarAngleIsClamped)
{
    ViewSettings s;
    Viewport     vp(s);
    vp.resize(800, 600);

    vp.rotate(0.0f, -100000.0f);
    settle(vp);
    EXPECT_NEAR(vp.polarAngle(), s.maxPolarAngle, 1e-5f);
    EXPECT_GT(vp.cameraPosition().y, 0.0f);

    vp.rotate(0.0f, 100000.0f);
    settle(vp);
    EXPECT_NEAR(vp.polarAngle(), s.minPolarAngle, 1e-5f);
}

TEST(Viewport, DollyScalesDistanceWithinLimits)
{
    ViewSettings s;
    Viewport     vp(s);
    vp.resize(800, 600);

    const float d0 = vp.distance();
    vp.dolly(1.0f);
    ASSERT_TRUE(vp.advance());
    EXPECT_NEAR(vp.distance(), d0 * s.zoomStep, 1e-2f);

    vp.dolly(-1000.0f);
    vp.advance();
    EXPECT_FLOAT_EQ(vp.distance(), s.maxDistance);

    vp.dolly(1000.0f);
    vp.advance();
    EXPECT_FLOAT_EQ(vp.distance(), s.minDistance);
}

TEST(Viewport, PanStaysOnGround)
{
    Viewport vp;
    vp.resize(800, 600);

    vp.pan(120.0f, -80.0f);
    settle(vp);

    EXPECT_FLOAT_EQ(vp.target().y, 0.0f);
    EXPECT_GT(glm::length(vp.target()), 1.0f);
}

TEST(Viewport, ResizeBumpsChangeCounter)
{
    Viewport       vp;
    const uint64_t stamp = vp.changeCounter()->value();

    vp.resize(100, 100);
    EXPECT_GT(vp.changeCounter()->value(), stamp);

    const uint64_t same = vp.changeCounter()->value();
    vp.resize(100, 100);
    EXPECT_EQ(vp.changeCounter()->value(), same);
}

TEST(Viewport, DegenerateSizes)
{
    Viewport vp;
    vp.resize(-5, 0);

    EXPECT_EQ(vp.width(), 0);
    EXPECT_EQ(vp.height(), 0);
    EXPECT_FLOAT_EQ(vp.aspect(), 1.0f);
    EXPECT_EQ(vp.project(glm::vec3(1.0f)), glm::vec3(0.0f));
}
