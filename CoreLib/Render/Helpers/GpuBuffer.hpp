//============================================================
// GpuBuffer.hpp
//============================================================
#pragma once

#include <cstdint>
#include <vulkan/vulkan.h>

/**
 * @brief Move-only owner of a VkBuffer and the memory bound to it.
 *
 * Sizes are fixed at create(): solid vertex buffers, the ground quad,
 * per-frame uniform buffers and staging buffers never grow. A buffer
 * created with @c persistentMap stays mapped until destroy().
 */
class GpuBuffer
{
public:
    GpuBuffer() = default;
    ~GpuBuffer();

    GpuBuffer(const GpuBuffer&)            = delete;
    GpuBuffer& operator=(const GpuBuffer&) = delete;
    GpuBuffer(GpuBuffer&& other) noexcept;
    GpuBuffer& operator=(GpuBuffer&& other) noexcept;

    /**
     * @brief Allocates the buffer, releasing any previous one.
     * @return False (and an empty buffer) on any Vulkan failure.
     */
    bool create(VkDevice              device,
                VkPhysicalDevice      physicalDevice,
                VkDeviceSize          size,
                VkBufferUsageFlags    usage,
                VkMemoryPropertyFlags memoryFlags,
                bool                  persistentMap = false);

    void destroy() noexcept;

    /**
     * @brief Copies into a HOST_VISIBLE buffer.
     * @return False when the buffer is device-local or the range does not fit.
     */
    bool upload(const void* data, VkDeviceSize size, VkDeviceSize offset = 0);

    [[nodiscard]] bool valid() const noexcept
    {
        return m_buffer != VK_NULL_HANDLE;
    }

    [[nodiscard]] VkBuffer buffer() const noexcept
    {
        return m_buffer;
    }

    [[nodiscard]] VkDeviceSize size() const noexcept
    {
        return m_size;
    }

private:
    VkDevice       m_device     = VK_NULL_HANDLE;
    VkBuffer       m_buffer     = VK_NULL_HANDLE;
    VkDeviceMemory m_memory     = VK_NULL_HANDLE;
    void*          m_mapped     = nullptr;
    VkDeviceSize   m_size       = 0;
    bool           m_hostWrites = false;
};
