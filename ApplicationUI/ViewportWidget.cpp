#include "ViewportWidget.hpp"

#include <Core.hpp>
#include <QVBoxLayout>

#include "ViewportRenderWindow.hpp"

ViewportWidget::ViewportWidget(QWidget* parent, Core* core, VulkanBackend* backend) :
    QWidget(parent),
    m_core{core},
    m_backend{backend}
{
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    if (!m_core || !m_backend)
        return;

    m_viewport = m_core->createViewport();

    m_window = new ViewportRenderWindow(m_core, m_viewport, m_backend);

    // The container takes ownership of the window.
    m_container = QWidget::createWindowContainer(m_window, this);
    m_container->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
    m_container->setAttribute(Qt::WA_OpaquePaintEvent, true);
    m_container->setMinimumSize(64, 64);

    layout->addWidget(m_container);
}

ViewportWidget::~ViewportWidget()
{
    shutdownVulkan();
}

void ViewportWidget::shutdownVulkan() noexcept
{
    if (!m_container && !m_viewport)
        return;

    setUpdatesEnabled(false);

    // Loop, input and swapchain, while the native surface still exists.
    if (m_window)
        m_window->teardown();

    // Per-viewport uniform buffers and descriptor sets.
    if (m_core && m_viewport)
        m_core->destroyViewport(m_viewport);
    m_viewport = nullptr;

    // Destroys the QWindow as well.
    delete m_container;
    m_container = nullptr;

    m_window  = nullptr;
    m_backend = nullptr;
}
