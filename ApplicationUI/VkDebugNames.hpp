//============================================================
// VkDebugNames.hpp
//============================================================
// Debug-build Vulkan object names for validation messages and capture
// tools. Everything compiles to nothing in Release.

#pragma once

#include <cstdint>
#include <cstdio>
#include <vulkan/vulkan.h>

#if !defined(NDEBUG)
#define PARCEL3D_DEBUG_NAMES 1
#else
#define PARCEL3D_DEBUG_NAMES 0
#endif

namespace vkutil
{
#if PARCEL3D_DEBUG_NAMES

    /// Loaded once per device; null when VK_EXT_debug_utils is not enabled.
    inline PFN_vkSetDebugUtilsObjectNameEXT g_setName = nullptr;

    inline void init(PFN_vkGetDeviceProcAddr getDeviceProcAddr, VkDevice device) noexcept
    {
        g_setName = (getDeviceProcAddr && device)
                        ? reinterpret_cast<PFN_vkSetDebugUtilsObjectNameEXT>(
                              getDeviceProcAddr(device, "vkSetDebugUtilsObjectNameEXT"))
                        : nullptr;
    }

    inline void shutdown() noexcept
    {
        g_setName = nullptr;
    }

    inline void setObjectName(VkDevice     device,
                              VkObjectType type,
                              uint64_t     handle,
                              const char*  baseName,
                              int32_t      index) noexcept
    {
        if (!device || !g_setName || !handle || !baseName)
            return;

        char buf[128] = {};
        if (index >= 0)
            std::snprintf(buf, sizeof(buf), "%s [%d]", baseName, index);
        else
            std::snprintf(buf, sizeof(buf), "%s", baseName);

        VkDebugUtilsObjectNameInfoEXT info{};
        info.sType        = VK_STRUCTURE_TYPE_DEBUG_UTILS_OBJECT_NAME_INFO_EXT;
        info.objectType   = type;
        info.objectHandle = handle;
        info.pObjectName  = buf;

        g_setName(device, &info);
    }

#else

    inline void init(PFN_vkGetDeviceProcAddr, VkDevice) noexcept
    {
    }

    inline void shutdown() noexcept
    {
    }

    inline void setObjectName(VkDevice, VkObjectType, uint64_t, const char*, int32_t) noexcept
    {
    }

#endif

    /// Maps a handle type to its VkObjectType.
    template<typename Handle>
    struct ObjectType;

    template<>
    struct ObjectType<VkSwapchainKHR>
    {
        static constexpr VkObjectType value = VK_OBJECT_TYPE_SWAPCHAIN_KHR;
    };

    template<>
    struct ObjectType<VkImage>
    {
        static constexpr VkObjectType value = VK_OBJECT_TYPE_IMAGE;
    };

    template<>
    struct ObjectType<VkImageView>
    {
        static constexpr VkObjectType value = VK_OBJECT_TYPE_IMAGE_VIEW;
    };

    template<>
    struct ObjectType<VkRenderPass>
    {
        static constexpr VkObjectType value = VK_OBJECT_TYPE_RENDER_PASS;
    };

    template<>
    struct ObjectType<VkFramebuffer>
    {
        static constexpr VkObjectType value = VK_OBJECT_TYPE_FRAMEBUFFER;
    };

    template<>
    struct ObjectType<VkCommandBuffer>
    {
        static constexpr VkObjectType value = VK_OBJECT_TYPE_COMMAND_BUFFER;
    };

    template<>
    struct ObjectType<VkFence>
    {
        static constexpr VkObjectType value = VK_OBJECT_TYPE_FENCE;
    };

    template<typename Handle>
    inline void name(VkDevice device, Handle obj, const char* baseName, int32_t index = -1) noexcept
    {
        setObjectName(device, ObjectType<Handle>::value, uint64_t(obj), baseName, index);
    }

} // namespace vkutil
