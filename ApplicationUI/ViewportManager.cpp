#include "ViewportManager.hpp"

#include <Core.hpp>
#include <QVBoxLayout>
#include <stdexcept>

#include "MainUtilities.hpp"
#include "ViewportWidget.hpp"

ViewportManager::ViewportManager(QWidget* parent, Core* core, QVulkanInstance* vkInstance) :
    QWidget(parent),
    m_backend(std::make_unique<VulkanBackend>()),
    m_core(core)
{
    if (!m_core || !vkInstance)
        throw std::runtime_error("ViewportManager::ViewportManager(): core and Vulkan instance are required");

    if (!m_backend->init(vkInstance, vkcfg::kMaxFramesInFlight))
    {
        fatalGpuError(this,
                      tr("Vulkan device not supported"),
                      QString::fromStdString(m_backend->lastError()));
    }

    if (!m_core->initializeDevice(m_backend->context()))
    {
        m_backend->shutdown();
        fatalGpuError(this,
                      tr("Vulkan Error"),
                      tr("The renderer could not create its GPU resources."));
    }

    m_viewport = new ViewportWidget(this, m_core, m_backend.get());

    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);
    layout->addWidget(m_viewport);
}

ViewportManager::~ViewportManager()
{
    shutdownVulkan();
}

void ViewportManager::shutdownVulkan() noexcept
{
    if (!m_backend)
        return;

    setUpdatesEnabled(false);

    if (m_viewport)
        m_viewport->shutdownVulkan();

    // Every Core device object goes before the VkDevice.
    if (m_core)
    {
        m_core->destroySwapchainResources();
        m_core->destroy();
    }

    m_backend->shutdown();
    m_backend.reset();
}
