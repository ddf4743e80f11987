//============================================================
// VulkanContext.hpp
//============================================================
#pragma once

#include <cstdint>
#include <functional>
#include <vector>
#include <vulkan/vulkan.h>

namespace vkcfg
{
    /// Upper bound for frames in flight; per-frame arrays in CoreLib use this size.
    static constexpr std::uint32_t kMaxFramesInFlight = 2;

} // namespace vkcfg

/**
 * @brief Destruction work parked per frame slot.
 *
 * Parcel rebuilds retire solids whose vertex buffers may still be read by a
 * frame in flight. Their release is queued on the slot that recorded the
 * frame and runs once the backend has waited on that slot's fence again.
 *
 * Slots are frames-in-flight indices, not swapchain image indices. Not
 * thread-safe.
 */
struct DeferredDeletion
{
    std::vector<std::vector<std::move_only_function<void()>>> perFrame;

    void init(uint32_t framesInFlight)
    {
        perFrame.clear();
        perFrame.resize(framesInFlight);
    }

    /// Queued work for an unknown slot is dropped.
    void enqueue(uint32_t frameIndex, std::move_only_function<void()>&& fn)
    {
        if (frameIndex < perFrame.size())
            perFrame[frameIndex].push_back(std::move(fn));
    }

    /// Runs and forgets everything queued on @p frameIndex.
    void flush(uint32_t frameIndex)
    {
        if (frameIndex >= perFrame.size())
            return;

        std::vector<std::move_only_function<void()>> work = std::move(perFrame[frameIndex]);
        perFrame[frameIndex].clear();

        for (auto& fn : work)
            fn();
    }

    /// Runs every slot; only valid after a device idle wait.
    void flushAll()
    {
        for (uint32_t fi = 0; fi < static_cast<uint32_t>(perFrame.size()); ++fi)
            flush(fi);
    }
};

/**
 * @brief What CoreLib needs to record one viewport frame.
 *
 * @c cmd is only valid while the frame is being recorded. @c deferred is the
 * queue of the viewport swapchain that owns the frame.
 */
struct RenderFrameContext
{
    VkCommandBuffer   cmd        = VK_NULL_HANDLE;
    uint32_t          frameIndex = 0;
    DeferredDeletion* deferred   = nullptr;
};

/**
 * @brief Device handles handed from the Qt backend to the renderer.
 *
 * The backend keeps surfaces, swapchains and presentation; the renderer
 * creates solid buffers, the pipeline and descriptors on @c device.
 */
struct VulkanContext
{
    VkInstance       instance       = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice = VK_NULL_HANDLE;
    VkDevice         device         = VK_NULL_HANDLE;

    VkQueue  graphicsQueue            = VK_NULL_HANDLE;
    uint32_t graphicsQueueFamilyIndex = 0;

    VkSampleCountFlagBits sampleCount = VK_SAMPLE_COUNT_1_BIT; ///< MSAA samples of the viewport render pass

    uint32_t framesInFlight = vkcfg::kMaxFramesInFlight; ///< Clamped to [1, kMaxFramesInFlight] by the renderer

    VkPhysicalDeviceProperties deviceProps{};
};
