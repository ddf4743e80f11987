//============================================================
// GpuBuffer.cpp
//============================================================
#include "GpuBuffer.hpp"

#include <cstring>
#include <iostream>
#include <utility>

#include "VkUtilities.hpp"

GpuBuffer::~GpuBuffer()
{
    destroy();
}

GpuBuffer::GpuBuffer(GpuBuffer&& other) noexcept :
    m_device(std::exchange(other.m_device, VK_NULL_HANDLE)),
    m_buffer(std::exchange(other.m_buffer, VK_NULL_HANDLE)),
    m_memory(std::exchange(other.m_memory, VK_NULL_HANDLE)),
    m_mapped(std::exchange(other.m_mapped, nullptr)),
    m_size(std::exchange(other.m_size, 0)),
    m_hostWrites(std::exchange(other.m_hostWrites, false))
{
}

GpuBuffer& GpuBuffer::operator=(GpuBuffer&& other) noexcept
{
    if (this != &other)
    {
        destroy();

        m_device     = std::exchange(other.m_device, VK_NULL_HANDLE);
        m_buffer     = std::exchange(other.m_buffer, VK_NULL_HANDLE);
        m_memory     = std::exchange(other.m_memory, VK_NULL_HANDLE);
        m_mapped     = std::exchange(other.m_mapped, nullptr);
        m_size       = std::exchange(other.m_size, 0);
        m_hostWrites = std::exchange(other.m_hostWrites, false);
    }
    return *this;
}

bool GpuBuffer::create(VkDevice              device,
                       VkPhysicalDevice      physicalDevice,
                       VkDeviceSize          size,
                       VkBufferUsageFlags    usage,
                       VkMemoryPropertyFlags memoryFlags,
                       bool                  persistentMap)
{
    destroy();

    if (device == VK_NULL_HANDLE || physicalDevice == VK_NULL_HANDLE || size == 0)
        return false;

    m_device = device;

    VkBufferCreateInfo bi{};
    bi.sType       = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bi.size        = size;
    bi.usage       = usage;
    bi.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    if (vkCreateBuffer(m_device, &bi, nullptr, &m_buffer) != VK_SUCCESS)
    {
        std::cerr << "GpuBuffer: vkCreateBuffer failed (" << size << " bytes).\n";
        destroy();
        return false;
    }

    VkMemoryRequirements req{};
    vkGetBufferMemoryRequirements(m_device, m_buffer, &req);

    const uint32_t memType = vkutil::findMemoryType(physicalDevice, req.memoryTypeBits, memoryFlags);
    if (memType == UINT32_MAX)
    {
        std::cerr << "GpuBuffer: no memory type with the requested properties.\n";
        destroy();
        return false;
    }

    VkMemoryAllocateInfo ai{};
    ai.sType           = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    ai.allocationSize  = req.size;
    ai.memoryTypeIndex = memType;

    if (vkAllocateMemory(m_device, &ai, nullptr, &m_memory) != VK_SUCCESS ||
        vkBindBufferMemory(m_device, m_buffer, m_memory, 0) != VK_SUCCESS)
    {
        std::cerr << "GpuBuffer: memory allocation failed (" << req.size << " bytes).\n";
        destroy();
        return false;
    }

    m_size       = size;
    m_hostWrites = (memoryFlags & VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT) != 0;

    if (persistentMap && m_hostWrites && vkMapMemory(m_device, m_memory, 0, VK_WHOLE_SIZE, 0, &m_mapped) != VK_SUCCESS)
    {
        std::cerr << "GpuBuffer: vkMapMemory failed.\n";
        destroy();
        return false;
    }

    return true;
}

void GpuBuffer::destroy() noexcept
{
    if (m_device == VK_NULL_HANDLE)
        return;

    if (m_mapped)
        vkUnmapMemory(m_device, m_memory);

    if (m_buffer != VK_NULL_HANDLE)
        vkDestroyBuffer(m_device, m_buffer, nullptr);

    if (m_memory != VK_NULL_HANDLE)
        vkFreeMemory(m_device, m_memory, nullptr);

    m_device     = VK_NULL_HANDLE;
    m_buffer     = VK_NULL_HANDLE;
    m_memory     = VK_NULL_HANDLE;
    m_mapped     = nullptr;
    m_size       = 0;
    m_hostWrites = false;
}

bool GpuBuffer::upload(const void* data, VkDeviceSize size, VkDeviceSize offset)
{
    if (!data || size == 0)
        return true;

    if (!valid() || !m_hostWrites)
    {
        std::cerr << "GpuBuffer::upload(): buffer is not host visible.\n";
        return false;
    }

    if (offset + size > m_size)
    {
        std::cerr << "GpuBuffer::upload(): " << size << " bytes at " << offset << " exceed " << m_size << ".\n";
        return false;
    }

    if (m_mapped)
    {
        std::memcpy(static_cast<char*>(m_mapped) + offset, data, static_cast<size_t>(size));
        return true;
    }

    void* ptr = nullptr;
    if (vkMapMemory(m_device, m_memory, offset, size, 0, &ptr) != VK_SUCCESS || !ptr)
    {
        std::cerr << "GpuBuffer::upload(): vkMapMemory failed.\n";
        return false;
    }

    std::memcpy(ptr, data, static_cast<size_t>(size));
    vkUnmapMemory(m_device, m_memory);
    return true;
}
