#include <RenderLoop.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace
{
    class RecordingScheduler final : public FrameScheduler
    {
    public:
        void scheduleFrame() override
        {
            ++scheduled;
        }

        int scheduled = 0;
    };

    struct Trace
    {
        std::vector<std::string> calls;

        RenderLoop::StepFn step()
        {
            return [this]() { calls.push_back("step"); };
        }

        RenderLoop::PickFn pick(bool performed = false)
        {
            return [this, performed]() {
                calls.push_back("pick");
                return performed;
            };
        }

        RenderLoop::RenderFn render()
        {
            return [this]() { calls.push_back("render"); };
        }
    };
} // namespace

TEST(RenderLoop, DoesNothingBeforeStart)
{
    RecordingScheduler sched;
    RenderLoop         loop(sched);
    Trace              t;

    EXPECT_FALSE(loop.running());
    EXPECT_FALSE(loop.tick(t.step(), t.pick(), t.render()));
    EXPECT_TRUE(t.calls.empty());
    EXPECT_EQ(sched.scheduled, 0);
}

TEST(RenderLoop, StartSchedulesFirstFrame)
{
    RecordingScheduler sched;
    RenderLoop         loop(sched);

    EXPECT_TRUE(loop.start());
    EXPECT_TRUE(loop.running());
    EXPECT_EQ(sched.scheduled, 1);

    // Already running.
    EXPECT_FALSE(loop.start());
    EXPECT_EQ(sched.scheduled, 1);
}

TEST(RenderLoop, TickRunsStepPickRenderThenReschedules)
{
    RecordingScheduler sched;
    RenderLoop         loop(sched);
    Trace              t;

    ASSERT_TRUE(loop.start());
    EXPECT_TRUE(loop.tick(t.step(), t.pick(true), t.render()));

    const std::vector<std::string> expected = {"step", "pick", "render"};
    EXPECT_EQ(t.calls, expected);
    EXPECT_EQ(sched.scheduled, 2);
    EXPECT_EQ(loop.frameCount(), 1u);
}

TEST(RenderLoop, RendersWhetherOrNotAPickWasDue)
{
    RecordingScheduler sched;
    RenderLoop         loop(sched);
    Trace              t;

    ASSERT_TRUE(loop.start());
    loop.tick(t.step(), t.pick(false), t.render());
    loop.tick(t.step(), t.pick(true), t.render());

    EXPECT_EQ(t.calls.size(), 6u);
    EXPECT_EQ(t.calls[2], "render");
    EXPECT_EQ(t.calls[5], "render");
    EXPECT_EQ(loop.frameCount(), 2u);
}

TEST(RenderLoop, StopIsFinal)
{
    RecordingScheduler sched;
    RenderLoop         loop(sched);
    Trace              t;

    ASSERT_TRUE(loop.start());
    loop.stop();

    EXPECT_TRUE(loop.tornDown());
    EXPECT_FALSE(loop.running());
    EXPECT_FALSE(loop.tick(t.step(), t.pick(), t.render()));
    EXPECT_TRUE(t.calls.empty());

    EXPECT_FALSE(loop.start());
    EXPECT_EQ(sched.scheduled, 1);
}

TEST(RenderLoop, StopBeforeStartPreventsStart)
{
    RecordingScheduler sched;
    RenderLoop         loop(sched);

    loop.stop();
    EXPECT_FALSE(loop.start());
    EXPECT_EQ(sched.scheduled, 0);
}

TEST(RenderLoop, StopDuringPickSkipsRenderAndReschedule)
{
    RecordingScheduler sched;
    RenderLoop         loop(sched);
    Trace              t;

    ASSERT_TRUE(loop.start());

    auto stoppingPick = [&]() {
        t.calls.push_back("pick");
        loop.stop();
        return true;
    };

    EXPECT_FALSE(loop.tick(t.step(), stoppingPick, t.render()));

    const std::vector<std::string> expected = {"step", "pick"};
    EXPECT_EQ(t.calls, expected);
    EXPECT_EQ(sched.scheduled, 1);
    EXPECT_EQ(loop.frameCount(), 0u);
}

TEST(RenderLoop, StopDuringRenderSkipsReschedule)
{
    RecordingScheduler sched;
    RenderLoop         loop(sched);
    Trace              t;

    ASSERT_TRUE(loop.start());

    auto stoppingRender = [&]() {
        t.calls.push_back("render");
        loop.stop();
    };

    EXPECT_TRUE(loop.tick(t.step(), t.pick(), stoppingRender));
    EXPECT_EQ(sched.scheduled, 1);
    EXPECT_FALSE(loop.running());
}

TEST(RenderLoop, MissingCallbacksAreSkipped)
{
    RecordingScheduler sched;
    RenderLoop         loop(sched);

    ASSERT_TRUE(loop.start());
    EXPECT_TRUE(loop.tick({}, {}, {}));
    EXPECT_EQ(sched.scheduled, 2);
}
