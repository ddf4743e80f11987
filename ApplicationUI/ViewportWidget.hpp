#ifndef VIEWPORTWIDGET_HPP
#define VIEWPORTWIDGET_HPP

#include <QWidget>

class Core;
class Viewport;

class VulkanBackend;
class ViewportRenderWindow;

/**
 * @brief Embeds one Vulkan viewport in the widget tree and owns its lifetime.
 *
 * Construction acquires the Core viewport, the render window (swapchain and
 * render loop) and the window container. shutdownVulkan() releases them in
 * reverse order and is safe to call more than once.
 */
class ViewportWidget : public QWidget
{
    Q_OBJECT
public:
    explicit ViewportWidget(QWidget* parent = nullptr, Core* core = nullptr, VulkanBackend* backend = nullptr);
    ~ViewportWidget() override;

    [[nodiscard]] Viewport* coreViewport() const noexcept
    {
        return m_viewport;
    }

    [[nodiscard]] ViewportRenderWindow* renderWindow() const noexcept
    {
        return m_window;
    }

    /**
     * @brief Tears the viewport down.
     *
     * Order: render loop stopped, pointer input dropped, swapchain destroyed
     * (before the native surface), the viewport's GPU resources released,
     * then the window container deleted.
     */
    void shutdownVulkan() noexcept;

private:
    Core*     m_core     = nullptr;
    Viewport* m_viewport = nullptr;

    VulkanBackend*        m_backend   = nullptr;
    ViewportRenderWindow* m_window    = nullptr;
    QWidget*              m_container = nullptr;
};

#endif // VIEWPORTWIDGET_HPP
