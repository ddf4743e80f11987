//============================================================
// ViewportRenderWindow.cpp
//============================================================
#include "ViewportRenderWindow.hpp"

#include <Core.hpp>
#include <QDebug>
#include <QEvent>
#include <QExposeEvent>
#include <QMouseEvent>
#include <QPlatformSurfaceEvent>
#include <QResizeEvent>
#include <QVulkanDeviceFunctions>
#include <QWheelEvent>
#include <Viewport.hpp>
#include <cmath>
#include <exception>
#include <stdexcept>

#include "MainUtilities.hpp"
#include "VulkanBackend.hpp"

namespace
{
    QSize currentPixelSize(const QWindow* w)
    {
        const qreal dpr = w->devicePixelRatio();
        return QSize(int(std::lround(double(w->width()) * double(dpr))),
                     int(std::lround(double(w->height()) * double(dpr))));
    }
} // namespace

ViewportRenderWindow::ViewportRenderWindow(Core* core, Viewport* vp, VulkanBackend* backend) :
    m_core(core),
    m_viewport(vp),
    m_backend(backend),
    m_loop(std::make_unique<RenderLoop>(*this))
{
    if (!m_core || !m_viewport || !m_backend)
        throw std::runtime_error("ViewportRenderWindow::ViewportRenderWindow(): core, viewport and backend are required");

    setSurfaceType(QSurface::VulkanSurface);
    setFlag(Qt::FramelessWindowHint, true);
}

ViewportRenderWindow::~ViewportRenderWindow()
{
    teardown();
}

void ViewportRenderWindow::teardown() noexcept
{
    if (m_tornDown)
        return;

    // No iteration, reschedule or input reaches Core past this point.
    m_loop->stop();
    m_tornDown     = true;
    m_exposed      = false;
    m_updateQueued = false;

    destroySwapchain();

    m_core     = nullptr;
    m_viewport = nullptr;
}

// ------------------------------------------------------------
// Frame scheduling
// ------------------------------------------------------------

void ViewportRenderWindow::scheduleFrame()
{
    requestUpdateOnce();
}

void ViewportRenderWindow::requestUpdateOnce() noexcept
{
    // At most one UpdateRequest in the queue.
    if (m_updateQueued || m_tornDown)
        return;

    m_updateQueued = true;
    requestUpdate();
}

void ViewportRenderWindow::runFrame() noexcept
{
    if (m_tornDown || !m_exposed)
        return;

    try
    {
        m_loop->tick([this]() { m_core->advanceCamera(m_viewport); },
                     [this]() { return m_core->resolvePick(m_viewport); },
                     [this]() { renderOnce(); });
    }
    catch (const std::exception& ex)
    {
        qWarning() << "ViewportRenderWindow: frame failed:" << ex.what();

        // Keep the loop alive; the next frame retries.
        if (m_loop->running())
            requestUpdateOnce();
    }
}

// ------------------------------------------------------------
// Qt events
// ------------------------------------------------------------

bool ViewportRenderWindow::event(QEvent* e)
{
    if (e->type() == QEvent::PlatformSurface)
    {
        auto* pe = static_cast<QPlatformSurfaceEvent*>(e);

        // The swapchain must go before Qt destroys the native surface.
        if (pe->surfaceEventType() == QPlatformSurfaceEvent::SurfaceAboutToBeDestroyed)
            teardown();
    }

    if (e->type() == QEvent::UpdateRequest)
    {
        m_updateQueued = false;
        runFrame();
        return true;
    }

    return QWindow::event(e);
}

void ViewportRenderWindow::exposeEvent(QExposeEvent* e)
{
    QWindow::exposeEvent(e);

    if (m_tornDown)
        return;

    m_exposed = isExposed();
    if (!m_exposed)
        return;

    try
    {
        ensureSwapchain();
    }
    catch (const std::exception& ex)
    {
        qWarning() << "ViewportRenderWindow: swapchain setup failed:" << ex.what();
        return;
    }

    // The loop is created once per viewport lifetime; a hidden/re-shown window only needs a frame.
    if (!m_loop->running())
        m_loop->start();
    else
        requestUpdateOnce();
}

void ViewportRenderWindow::resizeEvent(QResizeEvent* e)
{
    QWindow::resizeEvent(e);

    if (m_tornDown)
        return;

    const QSize px = currentPixelSize(this);

    // Camera aspect plus a forced re-pick.
    m_core->resizeViewport(m_viewport, px.width(), px.height());

    // Recreated lazily in beginFrame().
    if (m_swapchain)
        m_backend->resizeViewportSwapchain(m_swapchain, px);

    if (m_exposed)
        requestUpdateOnce();
}

// ------------------------------------------------------------
// Swapchain
// ------------------------------------------------------------

void ViewportRenderWindow::ensureSwapchain()
{
    if (m_swapchain)
        return;

    QVulkanInstance* qvk = m_backend->qvk();
    if (!qvk)
        return;

    // surfaceForWindow() needs the instance set and the native handle created.
    if (vulkanInstance() != qvk)
        setVulkanInstance(qvk);

    if (!handle())
        create();

    const QSize px = currentPixelSize(this);
    if (px.width() <= 0 || px.height() <= 0)
        return;

    m_core->resizeViewport(m_viewport, px.width(), px.height());

    m_swapchain = m_backend->createViewportSwapchain(this);
    if (!m_swapchain)
    {
        qWarning() << "ViewportRenderWindow: could not create a swapchain.";
        return;
    }

    // Pipelines are compatible with every swapchain of this backend, so this runs once.
    if (!m_coreSwapchainInited)
    {
        m_coreSwapchainInited = m_core->initializeSwapchain(m_swapchain->renderPass);
        if (!m_coreSwapchainInited)
        {
            m_loop->stop();
            fatalGpuError(nullptr,
                          tr("Vulkan Error"),
                          tr("The renderer pipelines could not be created. Check that the shaders were built."));
        }
    }
}

void ViewportRenderWindow::destroySwapchain() noexcept
{
    if (!m_swapchain)
        return;

    if (m_backend)
        m_backend->destroyViewportSwapchain(m_swapchain);

    m_swapchain = nullptr;
}

void ViewportRenderWindow::renderOnce()
{
    if (!m_exposed || m_tornDown)
        return;

    ensureSwapchain();
    if (!m_swapchain || !m_coreSwapchainInited)
        return;

    const glm::vec4 clear = m_viewport->clearColor();

    QVulkanDeviceFunctions* df = m_backend->deviceFunctions();
    if (!df)
        return;

    ViewportFrameContext fc = {};
    if (!m_backend->beginFrame(m_swapchain, fc))
        return;

    RenderFrameContext rfc = {};
    rfc.cmd                = fc.frame->cmd;
    rfc.frameIndex         = fc.frameIndex;
    rfc.deferred           = &m_swapchain->deferred;

    // Uploads and retired solids, outside the render pass.
    m_core->renderPrePass(m_viewport, rfc);

    VkClearValue clears[3] = {};
    clears[0].color        = {{clear.r, clear.g, clear.b, clear.a}};
    clears[1].depthStencil = {1.0f, 0};

    VkRenderPassBeginInfo rp = {};
    rp.sType                 = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    rp.renderPass            = m_swapchain->renderPass;
    rp.framebuffer           = m_swapchain->framebuffers[fc.imageIndex];
    rp.renderArea.extent     = m_swapchain->extent;
    rp.clearValueCount       = 3;
    rp.pClearValues          = clears;

    df->vkCmdBeginRenderPass(fc.frame->cmd, &rp, VK_SUBPASS_CONTENTS_INLINE);
    m_core->render(m_viewport, rfc);
    df->vkCmdEndRenderPass(fc.frame->cmd);

    m_backend->endFrame(m_swapchain, fc);
}

// ------------------------------------------------------------
// Pointer input
// ------------------------------------------------------------

bool ViewportRenderWindow::acceptsInput() const noexcept
{
    return !m_tornDown && m_core && m_viewport;
}

CoreEvent ViewportRenderWindow::createCoreEvent(const QMouseEvent* e) const noexcept
{
    CoreEvent ev = {};

    const float dpr = static_cast<float>(devicePixelRatio());

    ev.button    = static_cast<int>(e->button());
    ev.x         = static_cast<float>(e->position().x()) * dpr;
    ev.y         = static_cast<float>(e->position().y()) * dpr;
    ev.shift_key = (e->modifiers() & Qt::ShiftModifier) != 0;
    ev.ctrl_key  = (e->modifiers() & Qt::ControlModifier) != 0;
    ev.alt_key   = (e->modifiers() & Qt::AltModifier) != 0;

    return ev;
}

void ViewportRenderWindow::mousePressEvent(QMouseEvent* e)
{
    if (!acceptsInput())
        return;

    m_core->mousePressEvent(m_viewport, createCoreEvent(e));
    e->accept();
}

void ViewportRenderWindow::mouseMoveEvent(QMouseEvent* e)
{
    if (!acceptsInput())
        return;

    // Only records the pointer; the pick runs in the next frame.
    m_core->mouseMoveEvent(m_viewport, createCoreEvent(e));
    e->accept();
}

void ViewportRenderWindow::mouseReleaseEvent(QMouseEvent* e)
{
    if (!acceptsInput())
        return;

    try
    {
        m_core->mouseReleaseEvent(m_viewport, createCoreEvent(e));
    }
    catch (const std::exception& ex)
    {
        qWarning() << "ViewportRenderWindow: click pick failed:" << ex.what();
    }
    e->accept();
}

void ViewportRenderWindow::wheelEvent(QWheelEvent* e)
{
    if (!acceptsInput())
        return;

    CoreEvent ev = {};
    ev.x         = static_cast<float>(e->position().x() * devicePixelRatio());
    ev.y         = static_cast<float>(e->position().y() * devicePixelRatio());
    ev.deltaY    = static_cast<float>(e->angleDelta().y()) / 120.0f;

    m_core->mouseWheelEvent(m_viewport, ev);
    e->accept();
}
