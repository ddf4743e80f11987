#ifndef VIEWPORTMANAGER_HPP
#define VIEWPORTMANAGER_HPP

#include <QWidget>
#include <memory>

#include "VulkanBackend.hpp"

class Core;
class QVulkanInstance;
class ViewportWidget;

/**
 * @brief Hosts the 3D viewport and the Vulkan device it renders with.
 *
 * ViewportManager owns the VulkanBackend and the ViewportWidget. It is
 * responsible for:
 *
 * - Initializing the device and Core's device resources (fatal on failure)
 * - Shutting down viewport, Core GPU resources and device in a safe order
 *
 * Core is not owned and must outlive the manager's shutdownVulkan().
 */
class ViewportManager : public QWidget
{
    Q_OBJECT

public:
    /**
     * @brief Initializes Vulkan and creates the viewport.
     *
     * A device that cannot be created, or a renderer that cannot create
     * its resources, ends the process after a critical message box.
     */
    explicit ViewportManager(QWidget* parent, Core* core, QVulkanInstance* vkInstance);

    ~ViewportManager() override;

    [[nodiscard]] ViewportWidget* viewport() const noexcept
    {
        return m_viewport;
    }

    [[nodiscard]] VulkanBackend* backend() const noexcept
    {
        return m_backend.get();
    }

    /**
     * @brief Shuts Vulkan down. Idempotent.
     *
     * Order:
     *  - viewport teardown (loop, input, swapchain, per-viewport resources)
     *  - Core device resources (solid buffers, pipelines, descriptor pool)
     *  - the VkDevice
     */
    void shutdownVulkan() noexcept;

private:
    std::unique_ptr<VulkanBackend> m_backend;

    ViewportWidget* m_viewport = nullptr;

    /// Application core (not owned)
    Core* m_core = nullptr;
};

#endif // VIEWPORTMANAGER_HPP
