// ============================================================
// VulkanBackend.cpp
// ============================================================

#include "VulkanBackend.hpp"

#include <QDebug>
#include <QVulkanDeviceFunctions>
#include <QVulkanFunctions>
#include <QWindow>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <iterator>
#include <sstream>
#include <string>

#include "VkDebugNames.hpp"

namespace
{
    constexpr VkFormat kDepthFormat      = VK_FORMAT_D32_SFLOAT;
    constexpr uint32_t kInvalidFamily    = 0xFFFFFFFFu;
    constexpr uint64_t kFenceTimeoutNs   = 1000000000ull;
    constexpr int      kMaxMsaaSamples   = 4;

    QSize currentPixelSize(const QWindow* w)
    {
        if (!w)
            return {};

        const qreal dpr = w->devicePixelRatio();
        return QSize(int(std::lround(double(w->width()) * double(dpr))),
                     int(std::lround(double(w->height()) * double(dpr))));
    }

    QVulkanFunctions* instFns(QVulkanInstance* qvk) noexcept
    {
        return qvk ? qvk->functions() : nullptr;
    }

    QVulkanDeviceFunctions* devFns(QVulkanInstance* qvk, VkDevice dev) noexcept
    {
        return (qvk && dev) ? qvk->deviceFunctions(dev) : nullptr;
    }

    std::string versionStr(uint32_t v)
    {
        return std::to_string(VK_VERSION_MAJOR(v)) + "." +
               std::to_string(VK_VERSION_MINOR(v)) + "." +
               std::to_string(VK_VERSION_PATCH(v));
    }

    struct DeviceTypeInfo
    {
        VkPhysicalDeviceType type;
        const char*          name;
        int                  rank;
    };

    constexpr DeviceTypeInfo kDeviceTypes[] = {
        {VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU, "Discrete", 1000},
        {VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU, "Integrated", 300},
        {VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU, "Virtual", 150},
        {VK_PHYSICAL_DEVICE_TYPE_CPU, "CPU", 10},
    };

    const DeviceTypeInfo& deviceTypeInfo(VkPhysicalDeviceType t) noexcept
    {
        static constexpr DeviceTypeInfo kOther = {VK_PHYSICAL_DEVICE_TYPE_OTHER, "Other", 50};

        for (const DeviceTypeInfo& info : kDeviceTypes)
        {
            if (info.type == t)
                return info;
        }
        return kOther;
    }

    template<typename Fn>
    void resolve(Fn& slot, PFN_vkVoidFunction fp) noexcept
    {
        slot = reinterpret_cast<Fn>(fp);
    }

    /// Two-call Vulkan enumeration: @p query(count, data) is called for the size, then the items.
    template<typename T, typename Query>
    std::vector<T> enumerateAll(Query&& query)
    {
        uint32_t count = 0;
        query(&count, static_cast<T*>(nullptr));

        std::vector<T> items(count);
        if (count)
            query(&count, items.data());
        items.resize(count);
        return items;
    }

    /// Highest sample count usable for both color and depth, capped at kMaxMsaaSamples.
    VkSampleCountFlagBits pickSampleCount(const VkPhysicalDeviceProperties& props) noexcept
    {
        const VkSampleCountFlags counts =
            props.limits.framebufferColorSampleCounts &
            props.limits.framebufferDepthSampleCounts;

        for (int s = kMaxMsaaSamples; s > 1; s /= 2)
        {
            if (counts & VkSampleCountFlags(s))
                return VkSampleCountFlagBits(s);
        }
        return VK_SAMPLE_COUNT_1_BIT;
    }

    bool hasExtension(const std::vector<VkExtensionProperties>& exts, const char* name) noexcept
    {
        return std::any_of(exts.begin(), exts.end(), [name](const VkExtensionProperties& e) {
            return std::strcmp(e.extensionName, name) == 0;
        });
    }

    /// What createDevice needs to know about one physical device.
    struct DeviceCandidate
    {
        VkPhysicalDevice                   pd = VK_NULL_HANDLE;
        VkPhysicalDeviceProperties         props{};
        std::vector<VkExtensionProperties> exts;
        uint32_t                           graphicsFamily = kInvalidFamily;
        int                                score          = -1; ///< Negative when unusable
    };

    DeviceCandidate inspectDevice(QVulkanFunctions* f, VkPhysicalDevice pd)
    {
        DeviceCandidate c{};
        c.pd = pd;

        f->vkGetPhysicalDeviceProperties(pd, &c.props);

        c.exts = enumerateAll<VkExtensionProperties>([&](uint32_t* n, VkExtensionProperties* out) {
            f->vkEnumerateDeviceExtensionProperties(pd, nullptr, n, out);
        });

        const auto families = enumerateAll<VkQueueFamilyProperties>([&](uint32_t* n, VkQueueFamilyProperties* out) {
            f->vkGetPhysicalDeviceQueueFamilyProperties(pd, n, out);
        });

        for (uint32_t i = 0; i < static_cast<uint32_t>(families.size()); ++i)
        {
            if (families[i].queueFlags & VK_QUEUE_GRAPHICS_BIT)
            {
                c.graphicsFamily = i;
                break;
            }
        }

        // Hard requirements: a graphics queue and the swapchain extension.
        if (c.graphicsFamily == kInvalidFamily || !hasExtension(c.exts, VK_KHR_SWAPCHAIN_EXTENSION_NAME))
            return c;

        int score = deviceTypeInfo(c.props.deviceType).rank;

        score += int(VK_VERSION_MAJOR(c.props.apiVersion)) * 100;
        score += int(VK_VERSION_MINOR(c.props.apiVersion)) * 10;
        score += int(pickSampleCount(c.props)) * 5;

        c.score = score;
        return c;
    }

} // namespace

// ------------------------------------------------------------
// Init / shutdown
// ------------------------------------------------------------

bool VulkanBackend::init(QVulkanInstance* qvk, uint32_t framesInFlight)
{
    m_lastError.clear();

    if (!qvk || !instFns(qvk))
    {
        m_lastError = "Parcel3D could not access the Vulkan instance.";
        return false;
    }

    m_qvk            = qvk;
    m_instance       = qvk->vkInstance();
    m_framesInFlight = std::clamp(framesInFlight, 1u, vkcfg::kMaxFramesInFlight);

    if (!selectPhysicalDevice())
        return false;

    if (!createLogicalDevice())
    {
        m_lastError = std::string("Parcel3D could not create a Vulkan device on ") + m_deviceProps.deviceName + ".";
        return false;
    }

    if (!loadKhrEntryPoints())
    {
        m_lastError = "The Vulkan driver does not expose the surface and swapchain functions.";
        return false;
    }

    ensureContext();
    return true;
}

void VulkanBackend::shutdown() noexcept
{
    if (m_device && m_qvk)
    {
        QVulkanDeviceFunctions* df = devFns(m_qvk, m_device);
        if (df)
            df->vkDeviceWaitIdle(m_device);

        // Windows normally destroy their own swapchains; this catches the ones that did not.
        const std::vector<ViewportSwapchain*> remaining = m_swapchains;
        for (ViewportSwapchain* sc : remaining)
            destroyViewportSwapchain(sc);

        if (df)
            df->vkDestroyDevice(m_device, nullptr);
    }

    m_swapchains.clear();

    m_device         = VK_NULL_HANDLE;
    m_physicalDevice = VK_NULL_HANDLE;
    m_graphicsQueue  = VK_NULL_HANDLE;

    m_vkGetDeviceProcAddr = nullptr;
    m_wsi                 = {};

    m_qvk      = nullptr;
    m_instance = VK_NULL_HANDLE;
    m_ctx      = {};

    vkutil::shutdown();
}

// ------------------------------------------------------------
// Device
// ------------------------------------------------------------

bool VulkanBackend::selectPhysicalDevice()
{
    QVulkanFunctions* f = instFns(m_qvk);
    if (!f)
        return false;

    const auto devices = enumerateAll<VkPhysicalDevice>([&](uint32_t* n, VkPhysicalDevice* out) {
        f->vkEnumeratePhysicalDevices(m_instance, n, out);
    });

    std::vector<DeviceCandidate> candidates;
    candidates.reserve(devices.size());

    const DeviceCandidate* best = nullptr;
    for (VkPhysicalDevice pd : devices)
        candidates.push_back(inspectDevice(f, pd));

    for (const DeviceCandidate& c : candidates)
    {
        if (c.score >= 0 && (!best || c.score > best->score))
            best = &c;
    }

    if (!best)
    {
        std::ostringstream oss;
        oss << "Parcel3D could not find a Vulkan device suitable for rendering.\n\n";
        if (candidates.empty())
            oss << "No Vulkan capable GPU was detected.\n";
        else
            oss << "Detected GPUs:\n";

        for (const DeviceCandidate& c : candidates)
        {
            oss << "  - " << c.props.deviceName
                << " (" << deviceTypeInfo(c.props.deviceType).name << ")"
                << " Vulkan " << versionStr(c.props.apiVersion)
                << " Swapchain=" << (hasExtension(c.exts, VK_KHR_SWAPCHAIN_EXTENSION_NAME) ? "YES" : "no")
                << " GraphicsQueue=" << (c.graphicsFamily != kInvalidFamily ? "YES" : "no")
                << "\n";
        }

        m_lastError = oss.str();
        return false;
    }

    m_physicalDevice = best->pd;
    m_deviceProps    = best->props;
    m_graphicsFamily = best->graphicsFamily;
    m_sampleCount    = pickSampleCount(m_deviceProps);

    qDebug().noquote() << "VulkanBackend: selected device" << m_deviceProps.deviceName
                       << "(" << deviceTypeInfo(m_deviceProps.deviceType).name << "), Vulkan"
                       << QString::fromStdString(versionStr(m_deviceProps.apiVersion))
                       << ", MSAA x" << int(m_sampleCount);
    return true;
}

bool VulkanBackend::createLogicalDevice()
{
    QVulkanFunctions* f = instFns(m_qvk);
    if (!f || !m_physicalDevice)
        return false;

    const float prio = 1.0f;

    VkDeviceQueueCreateInfo qci = {};
    qci.sType                   = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
    qci.queueFamilyIndex        = m_graphicsFamily;
    qci.queueCount              = 1;
    qci.pQueuePriorities        = &prio;

    const char* extensions[] = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};

    // Solids and the ground use core features only.
    VkPhysicalDeviceFeatures features = {};

    VkDeviceCreateInfo dci      = {};
    dci.sType                   = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    dci.queueCreateInfoCount    = 1;
    dci.pQueueCreateInfos       = &qci;
    dci.enabledExtensionCount   = uint32_t(std::size(extensions));
    dci.ppEnabledExtensionNames = extensions;
    dci.pEnabledFeatures        = &features;

    if (f->vkCreateDevice(m_physicalDevice, &dci, nullptr, &m_device) != VK_SUCCESS)
    {
        qWarning() << "VulkanBackend: vkCreateDevice failed.";
        m_device = VK_NULL_HANDLE;
        return false;
    }

    QVulkanDeviceFunctions* df = devFns(m_qvk, m_device);
    if (!df)
        return false;

    // Present goes through the graphics queue; each surface is checked in createViewportSwapchain().
    df->vkGetDeviceQueue(m_device, m_graphicsFamily, 0, &m_graphicsQueue);
    return m_graphicsQueue != VK_NULL_HANDLE;
}

bool VulkanBackend::loadKhrEntryPoints() noexcept
{
    if (!m_qvk || !m_device)
        return false;

    auto inst = [this](const char* name) noexcept -> PFN_vkVoidFunction {
        return reinterpret_cast<PFN_vkVoidFunction>(m_qvk->getInstanceProcAddr(name));
    };

    m_vkGetDeviceProcAddr = reinterpret_cast<PFN_vkGetDeviceProcAddr>(inst("vkGetDeviceProcAddr"));
    if (!m_vkGetDeviceProcAddr)
        return false;

    vkutil::init(m_vkGetDeviceProcAddr, m_device);

    auto dev = [this](const char* name) noexcept -> PFN_vkVoidFunction {
        return m_vkGetDeviceProcAddr(m_device, name);
    };

    resolve(m_wsi.surfaceSupport, inst("vkGetPhysicalDeviceSurfaceSupportKHR"));
    resolve(m_wsi.surfaceCapabilities, inst("vkGetPhysicalDeviceSurfaceCapabilitiesKHR"));
    resolve(m_wsi.surfaceFormats, inst("vkGetPhysicalDeviceSurfaceFormatsKHR"));
    resolve(m_wsi.presentModes, inst("vkGetPhysicalDeviceSurfacePresentModesKHR"));

    resolve(m_wsi.createSwapchain, dev("vkCreateSwapchainKHR"));
    resolve(m_wsi.destroySwapchain, dev("vkDestroySwapchainKHR"));
    resolve(m_wsi.swapchainImages, dev("vkGetSwapchainImagesKHR"));
    resolve(m_wsi.acquireNextImage, dev("vkAcquireNextImageKHR"));
    resolve(m_wsi.queuePresent, dev("vkQueuePresentKHR"));

    return m_wsi.complete();
}

void VulkanBackend::ensureContext() noexcept
{
    m_ctx                          = {};
    m_ctx.instance                 = m_instance;
    m_ctx.physicalDevice           = m_physicalDevice;
    m_ctx.device                   = m_device;
    m_ctx.graphicsQueue            = m_graphicsQueue;
    m_ctx.graphicsQueueFamilyIndex = m_graphicsFamily;
    m_ctx.framesInFlight           = m_framesInFlight;
    m_ctx.sampleCount              = m_sampleCount;
    m_ctx.deviceProps              = m_deviceProps;
}

// ------------------------------------------------------------
// Viewport swapchains
// ------------------------------------------------------------

ViewportSwapchain* VulkanBackend::createViewportSwapchain(QWindow* window)
{
    if (!m_qvk || !m_device || !window)
        return nullptr;

    auto* sc    = new ViewportSwapchain;
    sc->window  = window;
    sc->surface = m_qvk->surfaceForWindow(window);

    if (!sc->surface)
    {
        qWarning() << "VulkanBackend: window has no Vulkan surface.";
        delete sc;
        return nullptr;
    }

    VkBool32 presentOk = VK_FALSE;
    m_wsi.surfaceSupport(m_physicalDevice, m_graphicsFamily, sc->surface, &presentOk);
    if (!presentOk)
    {
        qWarning() << "VulkanBackend: graphics queue cannot present to this surface.";
        delete sc;
        return nullptr;
    }

    if (!createSwapchain(sc, currentPixelSize(window)))
    {
        destroySwapchainObjects(sc);
        delete sc;
        return nullptr;
    }

    m_swapchains.push_back(sc);
    return sc;
}

void VulkanBackend::destroyViewportSwapchain(ViewportSwapchain* sc) noexcept
{
    if (!sc)
        return;

    std::erase(m_swapchains, sc);

    if (m_qvk && m_device)
    {
        if (QVulkanDeviceFunctions* df = devFns(m_qvk, m_device))
            df->vkDeviceWaitIdle(m_device);

        sc->deferred.flushAll();

        destroySwapchainObjects(sc);
    }

    delete sc;
}

void VulkanBackend::resizeViewportSwapchain(ViewportSwapchain* sc, const QSize& newPixelSize) noexcept
{
    if (!sc || newPixelSize.width() <= 0 || newPixelSize.height() <= 0)
        return;

    sc->pendingPixelSize = newPixelSize;
    sc->needsRecreate    = true;
}

VkSurfaceFormatKHR VulkanBackend::chooseSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& formats) const noexcept
{
    for (const auto& f : formats)
    {
        if (f.format == VK_FORMAT_B8G8R8A8_SRGB && f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR)
            return f;
    }

    if (!formats.empty())
        return formats.front();

    return {VK_FORMAT_B8G8R8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR};
}

VkPresentModeKHR VulkanBackend::choosePresentMode(const std::vector<VkPresentModeKHR>& modes) const noexcept
{
    if (std::find(modes.begin(), modes.end(), VK_PRESENT_MODE_MAILBOX_KHR) != modes.end())
        return VK_PRESENT_MODE_MAILBOX_KHR;

    return VK_PRESENT_MODE_FIFO_KHR;
}

VkExtent2D VulkanBackend::chooseExtent(const VkSurfaceCapabilitiesKHR& caps, const QSize& pixelSize) const noexcept
{
    if (caps.currentExtent.width != 0xFFFFFFFFu)
        return caps.currentExtent;

    VkExtent2D e = {};
    e.width      = std::clamp<uint32_t>(uint32_t(std::max(pixelSize.width(), 0)), caps.minImageExtent.width, caps.maxImageExtent.width);
    e.height     = std::clamp<uint32_t>(uint32_t(std::max(pixelSize.height(), 0)), caps.minImageExtent.height, caps.maxImageExtent.height);
    return e;
}

uint32_t VulkanBackend::findMemoryType(uint32_t typeBits, VkMemoryPropertyFlags flags) const noexcept
{
    QVulkanFunctions* f = instFns(m_qvk);
    if (!f)
        return UINT32_MAX;

    VkPhysicalDeviceMemoryProperties mp = {};
    f->vkGetPhysicalDeviceMemoryProperties(m_physicalDevice, &mp);

    for (uint32_t i = 0; i < mp.memoryTypeCount; ++i)
    {
        if ((typeBits & (1u << i)) && (mp.memoryTypes[i].propertyFlags & flags) == flags)
            return i;
    }
    return UINT32_MAX;
}

bool VulkanBackend::createImage2D(VkFormat              format,
                                  VkImageUsageFlags     usage,
                                  VkImageAspectFlags    aspect,
                                  VkSampleCountFlagBits samples,
                                  VkExtent2D            extent,
                                  VkImage&              outImage,
                                  VkDeviceMemory&       outMem,
                                  VkImageView&          outView)
{
    QVulkanDeviceFunctions* df = devFns(m_qvk, m_device);
    if (!df)
        return false;

    VkImageCreateInfo ici = {};
    ici.sType             = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    ici.imageType         = VK_IMAGE_TYPE_2D;
    ici.format            = format;
    ici.extent            = {extent.width, extent.height, 1};
    ici.mipLevels         = 1;
    ici.arrayLayers       = 1;
    ici.samples           = samples;
    ici.tiling            = VK_IMAGE_TILING_OPTIMAL;
    ici.usage             = usage;
    ici.sharingMode       = VK_SHARING_MODE_EXCLUSIVE;
    ici.initialLayout     = VK_IMAGE_LAYOUT_UNDEFINED;

    if (df->vkCreateImage(m_device, &ici, nullptr, &outImage) != VK_SUCCESS)
        return false;

    VkMemoryRequirements mr = {};
    df->vkGetImageMemoryRequirements(m_device, outImage, &mr);

    const uint32_t memType = findMemoryType(mr.memoryTypeBits, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT);
    if (memType == UINT32_MAX)
    {
        qWarning() << "VulkanBackend: no device-local memory type for an attachment.";
        return false;
    }

    VkMemoryAllocateInfo mai = {};
    mai.sType                = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    mai.allocationSize       = mr.size;
    mai.memoryTypeIndex      = memType;

    if (df->vkAllocateMemory(m_device, &mai, nullptr, &outMem) != VK_SUCCESS)
        return false;

    if (df->vkBindImageMemory(m_device, outImage, outMem, 0) != VK_SUCCESS)
        return false;

    VkImageViewCreateInfo vci = {};
    vci.sType                 = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    vci.image                 = outImage;
    vci.viewType              = VK_IMAGE_VIEW_TYPE_2D;
    vci.format                = format;
    vci.subresourceRange      = {aspect, 0, 1, 0, 1};

    return df->vkCreateImageView(m_device, &vci, nullptr, &outView) == VK_SUCCESS;
}

bool VulkanBackend::createSwapchain(ViewportSwapchain* sc, const QSize& pixelSize)
{
    QVulkanDeviceFunctions* df = devFns(m_qvk, m_device);
    if (!sc || !df)
        return false;

    VkSurfaceCapabilitiesKHR caps = {};
    m_wsi.surfaceCapabilities(m_physicalDevice, sc->surface, &caps);

    const auto formats = enumerateAll<VkSurfaceFormatKHR>([&](uint32_t* n, VkSurfaceFormatKHR* out) {
        m_wsi.surfaceFormats(m_physicalDevice, sc->surface, n, out);
    });

    const auto modes = enumerateAll<VkPresentModeKHR>([&](uint32_t* n, VkPresentModeKHR* out) {
        m_wsi.presentModes(m_physicalDevice, sc->surface, n, out);
    });

    const VkSurfaceFormatKHR sf = chooseSurfaceFormat(formats);
    const VkExtent2D         ex = chooseExtent(caps, pixelSize);

    // Minimized or not laid out yet.
    if (ex.width == 0 || ex.height == 0)
        return false;

    uint32_t imageCount = std::max(caps.minImageCount + 1u, 2u);
    if (caps.maxImageCount > 0)
        imageCount = std::min(imageCount, caps.maxImageCount);

    VkSwapchainCreateInfoKHR ci = {};
    ci.sType                    = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    ci.surface                  = sc->surface;
    ci.minImageCount            = imageCount;
    ci.imageFormat              = sf.format;
    ci.imageColorSpace          = sf.colorSpace;
    ci.imageExtent              = ex;
    ci.imageArrayLayers         = 1;
    ci.imageUsage               = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    ci.imageSharingMode         = VK_SHARING_MODE_EXCLUSIVE;
    ci.preTransform             = caps.currentTransform;
    ci.compositeAlpha           = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    ci.presentMode              = choosePresentMode(modes);
    ci.clipped                  = VK_TRUE;

    if (m_wsi.createSwapchain(m_device, &ci, nullptr, &sc->swapchain) != VK_SUCCESS)
        return false;

    vkutil::name(m_device, sc->swapchain, "Viewport.Swapchain");

    sc->colorFormat = sf.format;
    sc->extent      = ex;
    sc->sampleCount = m_sampleCount;

    sc->images = enumerateAll<VkImage>([&](uint32_t* n, VkImage* out) {
        m_wsi.swapchainImages(m_device, sc->swapchain, n, out);
    });
    if (sc->images.empty())
        return false;

    const auto imgCount = static_cast<uint32_t>(sc->images.size());

    sc->views.assign(imgCount, VK_NULL_HANDLE);
    for (uint32_t i = 0; i < imgCount; ++i)
    {
        VkImageViewCreateInfo vci = {};
        vci.sType                 = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        vci.image                 = sc->images[i];
        vci.viewType              = VK_IMAGE_VIEW_TYPE_2D;
        vci.format                = sc->colorFormat;
        vci.subresourceRange      = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};

        if (df->vkCreateImageView(m_device, &vci, nullptr, &sc->views[i]) != VK_SUCCESS)
            return false;

        vkutil::name(m_device, sc->views[i], "Viewport.SwapchainView", int32_t(i));
    }

    if (!createRenderPass(sc) || !createAttachments(sc) || !createFrames(sc) || !createFramebuffers(sc))
        return false;

    sc->needsRecreate    = false;
    sc->pendingPixelSize = QSize();
    return true;
}

bool VulkanBackend::createRenderPass(ViewportSwapchain* sc)
{
    QVulkanDeviceFunctions* df = devFns(m_qvk, m_device);
    if (!df)
        return false;

    VkAttachmentDescription attachments[3] = {};

    // 0: MSAA color
    attachments[0].format         = sc->colorFormat;
    attachments[0].samples        = sc->sampleCount;
    attachments[0].loadOp         = VK_ATTACHMENT_LOAD_OP_CLEAR;
    attachments[0].storeOp        = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    attachments[0].stencilLoadOp  = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    attachments[0].stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    attachments[0].initialLayout  = VK_IMAGE_LAYOUT_UNDEFINED;
    attachments[0].finalLayout    = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;

    // 1: MSAA depth
    attachments[1].format         = kDepthFormat;
    attachments[1].samples        = sc->sampleCount;
    attachments[1].loadOp         = VK_ATTACHMENT_LOAD_OP_CLEAR;
    attachments[1].storeOp        = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    attachments[1].stencilLoadOp  = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    attachments[1].stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    attachments[1].initialLayout  = VK_IMAGE_LAYOUT_UNDEFINED;
    attachments[1].finalLayout    = VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL;

    // 2: resolve target (swapchain image)
    attachments[2].format         = sc->colorFormat;
    attachments[2].samples        = VK_SAMPLE_COUNT_1_BIT;
    attachments[2].loadOp         = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    attachments[2].storeOp        = VK_ATTACHMENT_STORE_OP_STORE;
    attachments[2].stencilLoadOp  = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    attachments[2].stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    attachments[2].initialLayout  = VK_IMAGE_LAYOUT_UNDEFINED;
    attachments[2].finalLayout    = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

    const VkAttachmentReference colorRef   = {0, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL};
    const VkAttachmentReference depthRef   = {1, VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL};
    const VkAttachmentReference resolveRef = {2, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL};

    VkSubpassDescription sub    = {};
    sub.pipelineBindPoint       = VK_PIPELINE_BIND_POINT_GRAPHICS;
    sub.colorAttachmentCount    = 1;
    sub.pColorAttachments       = &colorRef;
    sub.pResolveAttachments     = &resolveRef;
    sub.pDepthStencilAttachment = &depthRef;

    // The previous frame slot may still be writing the shared attachments.
    VkSubpassDependency dep = {};
    dep.srcSubpass          = VK_SUBPASS_EXTERNAL;
    dep.dstSubpass          = 0;
    dep.srcStageMask        = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT | VK_PIPELINE_STAGE_LATE_FRAGMENT_TESTS_BIT;
    dep.dstStageMask        = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT | VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT;
    dep.srcAccessMask       = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT | VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;
    dep.dstAccessMask       = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT | VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;

    VkRenderPassCreateInfo rpci = {};
    rpci.sType                  = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
    rpci.attachmentCount        = 3;
    rpci.pAttachments           = attachments;
    rpci.subpassCount           = 1;
    rpci.pSubpasses             = &sub;
    rpci.dependencyCount        = 1;
    rpci.pDependencies          = &dep;

    if (df->vkCreateRenderPass(m_device, &rpci, nullptr, &sc->renderPass) != VK_SUCCESS)
        return false;

    vkutil::name(m_device, sc->renderPass, "Viewport.RenderPass");
    return true;
}

bool VulkanBackend::createAttachments(ViewportSwapchain* sc)
{
    const size_t count = sc->images.size();

    sc->msaaColorImages.assign(count, VK_NULL_HANDLE);
    sc->msaaColorMems.assign(count, VK_NULL_HANDLE);
    sc->msaaColorViews.assign(count, VK_NULL_HANDLE);

    sc->depthImages.assign(count, VK_NULL_HANDLE);
    sc->depthMems.assign(count, VK_NULL_HANDLE);
    sc->depthViews.assign(count, VK_NULL_HANDLE);

    for (size_t i = 0; i < count; ++i)
    {
        if (!createImage2D(sc->colorFormat,
                           VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSIENT_ATTACHMENT_BIT,
                           VK_IMAGE_ASPECT_COLOR_BIT,
                           sc->sampleCount,
                           sc->extent,
                           sc->msaaColorImages[i],
                           sc->msaaColorMems[i],
                           sc->msaaColorViews[i]))
        {
            return false;
        }

        if (!createImage2D(kDepthFormat,
                           VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT,
                           VK_IMAGE_ASPECT_DEPTH_BIT,
                           sc->sampleCount,
                           sc->extent,
                           sc->depthImages[i],
                           sc->depthMems[i],
                           sc->depthViews[i]))
        {
            return false;
        }

        vkutil::name(m_device, sc->msaaColorImages[i], "Viewport.MsaaColor", int32_t(i));
        vkutil::name(m_device, sc->depthImages[i], "Viewport.Depth", int32_t(i));
    }

    return true;
}

bool VulkanBackend::createFrames(ViewportSwapchain* sc)
{
    QVulkanDeviceFunctions* df = devFns(m_qvk, m_device);
    if (!df)
        return false;

    VkCommandPoolCreateInfo cpci = {};
    cpci.sType                   = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    cpci.queueFamilyIndex        = m_graphicsFamily;
    cpci.flags                   = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;

    if (df->vkCreateCommandPool(m_device, &cpci, nullptr, &sc->cmdPool) != VK_SUCCESS)
        return false;

    sc->frames.assign(m_framesInFlight, ViewportFrame{});

    // A recreated swapchain keeps its queue; anything still queued must survive.
    if (sc->deferred.perFrame.size() != m_framesInFlight)
        sc->deferred.init(m_framesInFlight);

    std::vector<VkCommandBuffer> cmds(m_framesInFlight, VK_NULL_HANDLE);

    VkCommandBufferAllocateInfo cbai = {};
    cbai.sType                       = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    cbai.commandPool                 = sc->cmdPool;
    cbai.level                       = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    cbai.commandBufferCount          = m_framesInFlight;

    if (df->vkAllocateCommandBuffers(m_device, &cbai, cmds.data()) != VK_SUCCESS)
        return false;

    VkFenceCreateInfo fci = {};
    fci.sType             = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fci.flags             = VK_FENCE_CREATE_SIGNALED_BIT;

    VkSemaphoreCreateInfo sci = {};
    sci.sType                 = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    for (uint32_t i = 0; i < m_framesInFlight; ++i)
    {
        ViewportFrame& fr = sc->frames[i];
        fr.cmd            = cmds[i];

        if (df->vkCreateFence(m_device, &fci, nullptr, &fr.fence) != VK_SUCCESS ||
            df->vkCreateSemaphore(m_device, &sci, nullptr, &fr.imageAvailable) != VK_SUCCESS ||
            df->vkCreateSemaphore(m_device, &sci, nullptr, &fr.renderFinished) != VK_SUCCESS)
        {
            return false;
        }

        vkutil::name(m_device, fr.cmd, "Viewport.Cmd", int32_t(i));
        vkutil::name(m_device, fr.fence, "Viewport.Fence", int32_t(i));
    }

    return true;
}

bool VulkanBackend::createFramebuffers(ViewportSwapchain* sc)
{
    QVulkanDeviceFunctions* df = devFns(m_qvk, m_device);
    if (!df)
        return false;

    sc->framebuffers.assign(sc->images.size(), VK_NULL_HANDLE);

    for (size_t i = 0; i < sc->images.size(); ++i)
    {
        const VkImageView atts[3] = {sc->msaaColorViews[i], sc->depthViews[i], sc->views[i]};

        VkFramebufferCreateInfo fci = {};
        fci.sType                   = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
        fci.renderPass              = sc->renderPass;
        fci.attachmentCount         = 3;
        fci.pAttachments            = atts;
        fci.width                   = sc->extent.width;
        fci.height                  = sc->extent.height;
        fci.layers                  = 1;

        if (df->vkCreateFramebuffer(m_device, &fci, nullptr, &sc->framebuffers[i]) != VK_SUCCESS)
            return false;

        vkutil::name(m_device, sc->framebuffers[i], "Viewport.Framebuffer", int32_t(i));
    }

    return true;
}

void VulkanBackend::destroySwapchainObjects(ViewportSwapchain* sc) noexcept
{
    if (!sc)
        return;

    QVulkanDeviceFunctions* df = devFns(m_qvk, m_device);
    if (!df)
        return;

    auto destroyViews = [&](std::vector<VkImageView>& views) {
        for (VkImageView v : views)
            if (v)
                df->vkDestroyImageView(m_device, v, nullptr);
        views.clear();
    };

    auto destroyImages = [&](std::vector<VkImage>& images, std::vector<VkDeviceMemory>& mems) {
        for (VkImage img : images)
            if (img)
                df->vkDestroyImage(m_device, img, nullptr);
        for (VkDeviceMemory mem : mems)
            if (mem)
                df->vkFreeMemory(m_device, mem, nullptr);
        images.clear();
        mems.clear();
    };

    for (VkFramebuffer fb : sc->framebuffers)
        if (fb)
            df->vkDestroyFramebuffer(m_device, fb, nullptr);
    sc->framebuffers.clear();

    // Frees the command buffers as well.
    if (sc->cmdPool)
        df->vkDestroyCommandPool(m_device, sc->cmdPool, nullptr);
    sc->cmdPool = VK_NULL_HANDLE;

    for (ViewportFrame& fr : sc->frames)
    {
        if (fr.fence)
            df->vkDestroyFence(m_device, fr.fence, nullptr);
        if (fr.imageAvailable)
            df->vkDestroySemaphore(m_device, fr.imageAvailable, nullptr);
        if (fr.renderFinished)
            df->vkDestroySemaphore(m_device, fr.renderFinished, nullptr);
    }
    sc->frames.clear();

    destroyViews(sc->msaaColorViews);
    destroyImages(sc->msaaColorImages, sc->msaaColorMems);

    destroyViews(sc->depthViews);
    destroyImages(sc->depthImages, sc->depthMems);

    if (sc->renderPass)
        df->vkDestroyRenderPass(m_device, sc->renderPass, nullptr);
    sc->renderPass = VK_NULL_HANDLE;

    destroyViews(sc->views);
    sc->images.clear();

    if (sc->swapchain && m_wsi.destroySwapchain)
        m_wsi.destroySwapchain(m_device, sc->swapchain, nullptr);
    sc->swapchain = VK_NULL_HANDLE;

    sc->frameIndex  = 0;
    sc->extent      = {};
    sc->colorFormat = VK_FORMAT_UNDEFINED;
}

// ------------------------------------------------------------
// Frames
// ------------------------------------------------------------

bool VulkanBackend::beginFrame(ViewportSwapchain* sc, ViewportFrameContext& out) noexcept
{
    QVulkanDeviceFunctions* df = devFns(m_qvk, m_device);
    if (!sc || !df)
        return false;

    if (sc->needsRecreate)
    {
        const QSize px = sc->pendingPixelSize.isValid()
                             ? sc->pendingPixelSize
                             : QSize(int(sc->extent.width), int(sc->extent.height));

        df->vkDeviceWaitIdle(m_device);
        destroySwapchainObjects(sc);

        if (!createSwapchain(sc, px))
        {
            // Retried next frame (e.g. window minimized to zero size).
            destroySwapchainObjects(sc);
            sc->needsRecreate    = true;
            sc->pendingPixelSize = px;
            return false;
        }
    }

    if (!sc->swapchain || sc->frames.empty())
        return false;

    const uint32_t fi = sc->frameIndex % m_framesInFlight;
    ViewportFrame& fr = sc->frames[fi];

    if (df->vkWaitForFences(m_device, 1, &fr.fence, VK_TRUE, kFenceTimeoutNs) == VK_TIMEOUT)
    {
        qWarning() << "VulkanBackend: frame fence timeout, recreating swapchain.";
        df->vkDeviceWaitIdle(m_device);
        sc->needsRecreate = true;
        return false;
    }

    // Work submitted from this slot has finished; release what it retired.
    sc->deferred.flush(fi);

    uint32_t       imageIndex = 0;
    const VkResult acq        = m_wsi.acquireNextImage(m_device, sc->swapchain, UINT64_MAX, fr.imageAvailable, VK_NULL_HANDLE, &imageIndex);

    switch (acq)
    {
        case VK_SUCCESS:
            break;
        case VK_SUBOPTIMAL_KHR:
            // Still presentable; rebuild after this frame.
            sc->needsRecreate = true;
            break;
        case VK_ERROR_OUT_OF_DATE_KHR:
            sc->needsRecreate = true;
            return false;
        default:
            qWarning() << "VulkanBackend: vkAcquireNextImageKHR failed (" << int(acq) << ").";
            return false;
    }

    df->vkResetCommandBuffer(fr.cmd, 0);

    VkCommandBufferBeginInfo bi = {};
    bi.sType                    = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    bi.flags                    = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;

    if (df->vkBeginCommandBuffer(fr.cmd, &bi) != VK_SUCCESS)
        return false;

    out.frame      = &fr;
    out.imageIndex = imageIndex;
    out.frameIndex = fi;
    return true;
}

void VulkanBackend::endFrame(ViewportSwapchain* sc, const ViewportFrameContext& fc) noexcept
{
    QVulkanDeviceFunctions* df = devFns(m_qvk, m_device);
    if (!sc || !df || !sc->swapchain || !fc.frame)
        return;

    if (df->vkEndCommandBuffer(fc.frame->cmd) != VK_SUCCESS)
        return;

    // Only reset when a submit that signals the fence follows.
    df->vkResetFences(m_device, 1, &fc.frame->fence);

    const VkPipelineStageFlags waitStage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;

    VkSubmitInfo si         = {};
    si.sType                = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    si.waitSemaphoreCount   = 1;
    si.pWaitSemaphores      = &fc.frame->imageAvailable;
    si.pWaitDstStageMask    = &waitStage;
    si.commandBufferCount   = 1;
    si.pCommandBuffers      = &fc.frame->cmd;
    si.signalSemaphoreCount = 1;
    si.pSignalSemaphores    = &fc.frame->renderFinished;

    if (df->vkQueueSubmit(m_graphicsQueue, 1, &si, fc.frame->fence) != VK_SUCCESS)
    {
        qWarning() << "VulkanBackend: vkQueueSubmit failed.";
        return;
    }

    VkPresentInfoKHR pi   = {};
    pi.sType              = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    pi.waitSemaphoreCount = 1;
    pi.pWaitSemaphores    = &fc.frame->renderFinished;
    pi.swapchainCount     = 1;
    pi.pSwapchains        = &sc->swapchain;
    pi.pImageIndices      = &fc.imageIndex;

    const VkResult pres = m_wsi.queuePresent(m_graphicsQueue, &pi);
    if (pres == VK_ERROR_OUT_OF_DATE_KHR || pres == VK_SUBOPTIMAL_KHR)
        sc->needsRecreate = true;

    sc->frameIndex = (sc->frameIndex + 1) % m_framesInFlight;
}
