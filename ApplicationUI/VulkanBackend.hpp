//============================================================
// VulkanBackend.hpp
//============================================================
#pragma once

#include <QSize>
#include <QVulkanInstance>
#include <VulkanContext.hpp>
#include <string>
#include <vector>
#include <vulkan/vulkan.h>

class QWindow;

/**
 * @brief Command buffer and sync objects of one frame-in-flight slot.
 */
struct ViewportFrame
{
    VkCommandBuffer cmd            = VK_NULL_HANDLE;
    VkFence         fence          = VK_NULL_HANDLE;
    VkSemaphore     imageAvailable = VK_NULL_HANDLE;
    VkSemaphore     renderFinished = VK_NULL_HANDLE;
};

/**
 * @brief Presentation state of one viewport window.
 *
 * The render pass has three attachments: MSAA color, MSAA depth and the
 * single-sample swapchain image the color is resolved into.
 */
struct ViewportSwapchain
{
    QWindow*     window  = nullptr;
    VkSurfaceKHR surface = VK_NULL_HANDLE; ///< Owned by Qt (surfaceForWindow)

    VkSwapchainKHR swapchain   = VK_NULL_HANDLE;
    VkFormat       colorFormat = VK_FORMAT_UNDEFINED;
    VkExtent2D     extent      = {};

    VkSampleCountFlagBits sampleCount = VK_SAMPLE_COUNT_1_BIT;

    std::vector<VkImage>     images = {};
    std::vector<VkImageView> views  = {};

    VkRenderPass renderPass = VK_NULL_HANDLE;

    // One MSAA color and one depth target per swapchain image
    std::vector<VkImage>        msaaColorImages = {};
    std::vector<VkDeviceMemory> msaaColorMems   = {};
    std::vector<VkImageView>    msaaColorViews  = {};

    std::vector<VkImage>        depthImages = {};
    std::vector<VkDeviceMemory> depthMems   = {};
    std::vector<VkImageView>    depthViews  = {};

    std::vector<VkFramebuffer> framebuffers = {};

    VkCommandPool cmdPool = VK_NULL_HANDLE;

    std::vector<ViewportFrame> frames     = {};
    uint32_t                   frameIndex = 0;

    bool  needsRecreate    = false;
    QSize pendingPixelSize = {};

    /// Resources retired while recording for this viewport (e.g. solids of a replaced scene).
    DeferredDeletion deferred = {};
};

/**
 * @brief Result of beginFrame(): the open command buffer and the acquired image.
 */
struct ViewportFrameContext
{
    ViewportFrame* frame      = nullptr; ///< Points into sc->frames[frameIndex]
    uint32_t       imageIndex = 0;
    uint32_t       frameIndex = 0;
};

/**
 * @brief Owns the Vulkan device and every viewport swapchain.
 *
 * Instance-level work goes through the QVulkanInstance, device-level work
 * through QVulkanDeviceFunctions. KHR surface/swapchain entry points are
 * loaded by hand since Qt does not expose them.
 */
class VulkanBackend final
{
public:
    VulkanBackend() noexcept  = default;
    ~VulkanBackend() noexcept = default;

    VulkanBackend(const VulkanBackend&)            = delete;
    VulkanBackend(VulkanBackend&&)                 = delete;
    VulkanBackend& operator=(const VulkanBackend&) = delete;
    VulkanBackend& operator=(VulkanBackend&&)      = delete;

    /**
     * @brief Picks a physical device and creates the logical device.
     *
     * @return False on any failure; lastError() then holds a message for the
     *         user (listing the detected GPUs when none was usable). The
     *         caller treats the failure as fatal.
     */
    bool init(QVulkanInstance* qvk, uint32_t framesInFlight = vkcfg::kMaxFramesInFlight);

    /**
     * @brief Destroys remaining swapchains, then the device.
     *
     * Must run while the QVulkanInstance is still alive.
     */
    void shutdown() noexcept;

    [[nodiscard]] ViewportSwapchain* createViewportSwapchain(QWindow* window);

    /// Waits for the device, runs the swapchain's pending deferred deletions and destroys it.
    void destroyViewportSwapchain(ViewportSwapchain* sc) noexcept;

    /// Marks the swapchain for lazy recreation at the next beginFrame().
    void resizeViewportSwapchain(ViewportSwapchain* sc, const QSize& newPixelSize) noexcept;

    /**
     * @brief Waits for the frame slot, flushes its deferred queue, acquires an
     *        image and begins the command buffer.
     * @return False when nothing should be recorded this frame.
     */
    bool beginFrame(ViewportSwapchain* sc, ViewportFrameContext& out) noexcept;

    /// Ends, submits and presents the frame opened by beginFrame().
    void endFrame(ViewportSwapchain* sc, const ViewportFrameContext& fc) noexcept;

    [[nodiscard]] const std::string& lastError() const noexcept
    {
        return m_lastError;
    }

    [[nodiscard]] QVulkanInstance* qvk() const noexcept
    {
        return m_qvk;
    }

    [[nodiscard]] VkDevice device() const noexcept
    {
        return m_device;
    }

    /// Device handles handed to CoreLib.
    [[nodiscard]] const VulkanContext& context() const noexcept
    {
        return m_ctx;
    }

    [[nodiscard]] QVulkanDeviceFunctions* deviceFunctions() const noexcept
    {
        return (m_qvk && m_device) ? m_qvk->deviceFunctions(m_device) : nullptr;
    }

private:
    bool selectPhysicalDevice();
    bool createLogicalDevice();
    void ensureContext() noexcept;
    bool loadKhrEntryPoints() noexcept;

    bool createSwapchain(ViewportSwapchain* sc, const QSize& pixelSize);
    bool createRenderPass(ViewportSwapchain* sc);
    bool createAttachments(ViewportSwapchain* sc);
    bool createFrames(ViewportSwapchain* sc);
    bool createFramebuffers(ViewportSwapchain* sc);
    void destroySwapchainObjects(ViewportSwapchain* sc) noexcept;

    bool createImage2D(VkFormat               format,
                       VkImageUsageFlags      usage,
                       VkImageAspectFlags     aspect,
                       VkSampleCountFlagBits  samples,
                       VkExtent2D             extent,
                       VkImage&               outImage,
                       VkDeviceMemory&        outMem,
                       VkImageView&           outView);

    [[nodiscard]] VkSurfaceFormatKHR chooseSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& formats) const noexcept;
    [[nodiscard]] VkPresentModeKHR   choosePresentMode(const std::vector<VkPresentModeKHR>& modes) const noexcept;
    [[nodiscard]] VkExtent2D         chooseExtent(const VkSurfaceCapabilitiesKHR& caps, const QSize& pixelSize) const noexcept;

    /// Returns UINT32_MAX when no memory type matches.
    [[nodiscard]] uint32_t findMemoryType(uint32_t typeBits, VkMemoryPropertyFlags flags) const noexcept;

private:
    QVulkanInstance* m_qvk = nullptr;

    VkInstance       m_instance       = VK_NULL_HANDLE;
    VkPhysicalDevice m_physicalDevice = VK_NULL_HANDLE;
    VkDevice         m_device         = VK_NULL_HANDLE;

    uint32_t m_graphicsFamily = 0;
    VkQueue  m_graphicsQueue  = VK_NULL_HANDLE;

    uint32_t              m_framesInFlight = vkcfg::kMaxFramesInFlight;
    VkSampleCountFlagBits m_sampleCount    = VK_SAMPLE_COUNT_1_BIT;

    VkPhysicalDeviceProperties m_deviceProps = {};

    std::vector<ViewportSwapchain*> m_swapchains = {};

    VulkanContext m_ctx = {};

    std::string m_lastError = {};

private:
    PFN_vkGetDeviceProcAddr m_vkGetDeviceProcAddr = nullptr;

    /// Surface and swapchain entry points, resolved once the device exists.
    struct WsiFunctions
    {
        PFN_vkGetPhysicalDeviceSurfaceSupportKHR      surfaceSupport      = nullptr;
        PFN_vkGetPhysicalDeviceSurfaceCapabilitiesKHR surfaceCapabilities = nullptr;
        PFN_vkGetPhysicalDeviceSurfaceFormatsKHR      surfaceFormats      = nullptr;
        PFN_vkGetPhysicalDeviceSurfacePresentModesKHR presentModes        = nullptr;

        PFN_vkCreateSwapchainKHR    createSwapchain  = nullptr;
        PFN_vkDestroySwapchainKHR   destroySwapchain = nullptr;
        PFN_vkGetSwapchainImagesKHR swapchainImages  = nullptr;
        PFN_vkAcquireNextImageKHR   acquireNextImage = nullptr;
        PFN_vkQueuePresentKHR       queuePresent     = nullptr;

        [[nodiscard]] bool complete() const noexcept
        {
            return surfaceSupport && surfaceCapabilities && surfaceFormats && presentModes &&
                   createSwapchain && destroySwapchain && swapchainImages && acquireNextImage && queuePresent;
        }
    };

    WsiFunctions m_wsi = {};
};
