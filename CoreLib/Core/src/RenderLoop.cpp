#include "RenderLoop.hpp"

RenderLoop::RenderLoop(FrameScheduler& scheduler) noexcept :
    m_scheduler(scheduler)
{
}

bool RenderLoop::start()
{
    if (m_tornDown || m_running)
        return false;

    m_running = true;
    m_scheduler.scheduleFrame();
    return true;
}

void RenderLoop::stop() noexcept
{
    m_tornDown = true;
    m_running  = false;
}

bool RenderLoop::tick(const StepFn& step, const PickFn& pick, const RenderFn& render)
{
    if (m_tornDown || !m_running)
        return false;

    if (step)
        step();

    if (pick)
        (void)pick();

    // A callback may have torn the viewport down.
    if (m_tornDown)
        return false;

    if (render)
        render();

    ++m_frames;

    if (!m_tornDown)
        m_scheduler.scheduleFrame();

    return true;
}
