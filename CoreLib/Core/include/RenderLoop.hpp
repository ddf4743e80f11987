//============================================================
// RenderLoop.hpp
//============================================================
#pragma once

#include <functional>

/**
 * @brief Host hook that schedules the next frame.
 *
 * The Qt render window implements this with QWindow::requestUpdate(), which
 * delivers an UpdateRequest event synchronised to the display.
 */
class FrameScheduler
{
public:
    virtual ~FrameScheduler() = default;

    virtual void scheduleFrame() = 0;
};

/**
 * @brief Per-frame driver: damping step, at most one pick, render, reschedule.
 *
 * A loop lives for exactly one viewport lifetime. stop() is final: it sets a
 * torn-down flag that every iteration checks first, and a stopped loop
 * cannot be started again.
 */
class RenderLoop
{
public:
    using StepFn   = std::function<void()>;
    using PickFn   = std::function<bool()>; ///< Returns true if a pick was due (and was performed)
    using RenderFn = std::function<void()>;

    explicit RenderLoop(FrameScheduler& scheduler) noexcept;

    RenderLoop(const RenderLoop&)            = delete;
    RenderLoop& operator=(const RenderLoop&) = delete;

    /**
     * @brief Starts the loop and schedules the first frame.
     * @return False if the loop was already stopped (or is already running).
     */
    bool start();

    /**
     * @brief Stops the loop for good. No iteration and no reschedule happens afterwards.
     */
    void stop() noexcept;

    /**
     * @brief Runs one iteration.
     *
     * Order: @p step (camera damping), @p pick (only consumes a pending pick),
     * @p render, then reschedules. Returns immediately when not running.
     *
     * @return True if the iteration ran.
     */
    bool tick(const StepFn& step, const PickFn& pick, const RenderFn& render);

    [[nodiscard]] bool running() const noexcept
    {
        return m_running && !m_tornDown;
    }

    [[nodiscard]] bool tornDown() const noexcept
    {
        return m_tornDown;
    }

    [[nodiscard]] unsigned long long frameCount() const noexcept
    {
        return m_frames;
    }

private:
    FrameScheduler&    m_scheduler;
    bool               m_running  = false;
    bool               m_tornDown = false;
    unsigned long long m_frames   = 0;
};
