//============================================================
// ViewportRenderWindow.hpp
//============================================================
#pragma once

#include <QPointF>
#include <QWindow>
#include <memory>

#include "CoreTypes.hpp"
#include "RenderLoop.hpp"

class Core;
class Viewport;
class VulkanBackend;
struct ViewportSwapchain;

/**
 * @brief Vulkan surface window of one viewport.
 *
 * Owns the viewport's swapchain and its RenderLoop. Each UpdateRequest runs
 * one loop iteration (camera damping, pending pick, render) and the loop
 * schedules the next one through requestUpdate().
 */
class ViewportRenderWindow final : public QWindow, private FrameScheduler
{
    Q_OBJECT
public:
    explicit ViewportRenderWindow(Core* core, Viewport* vp, VulkanBackend* backend);
    ~ViewportRenderWindow() override;

    [[nodiscard]] Viewport* viewport() const noexcept
    {
        return m_viewport;
    }

    [[nodiscard]] ViewportSwapchain* swapchain() const noexcept
    {
        return m_swapchain;
    }

    [[nodiscard]] const RenderLoop& renderLoop() const noexcept
    {
        return *m_loop;
    }

    /**
     * @brief Stops the loop, drops input and destroys the swapchain.
     *
     * Idempotent. After teardown the window never touches Core again.
     */
    void teardown() noexcept;

    [[nodiscard]] bool isTornDown() const noexcept
    {
        return m_tornDown;
    }

protected:
    bool event(QEvent* e) override;

    void exposeEvent(QExposeEvent* e) override;
    void resizeEvent(QResizeEvent* e) override;

    void mousePressEvent(QMouseEvent* e) override;
    void mouseMoveEvent(QMouseEvent* e) override;
    void mouseReleaseEvent(QMouseEvent* e) override;
    void wheelEvent(QWheelEvent* e) override;

private:
    void scheduleFrame() override;

    void requestUpdateOnce() noexcept;
    void runFrame() noexcept;

    void ensureSwapchain();
    void destroySwapchain() noexcept;
    void renderOnce();

    [[nodiscard]] bool acceptsInput() const noexcept;

    [[nodiscard]] CoreEvent createCoreEvent(const QMouseEvent* e) const noexcept;

private:
    Core*              m_core      = nullptr;
    Viewport*          m_viewport  = nullptr;
    VulkanBackend*     m_backend   = nullptr;
    ViewportSwapchain* m_swapchain = nullptr;

    std::unique_ptr<RenderLoop> m_loop;

    bool m_exposed             = false;
    bool m_updateQueued        = false;
    bool m_coreSwapchainInited = false;
    bool m_tornDown            = false;
};
