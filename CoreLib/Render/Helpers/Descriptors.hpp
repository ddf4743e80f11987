//============================================================
// Descriptors.hpp
//============================================================
#pragma once

#include <cstdint>
#include <span>
#include <vulkan/vulkan.h>

struct DescriptorBindingInfo
{
    uint32_t           binding = 0;
    VkDescriptorType   type    = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    VkShaderStageFlags stages  = VK_SHADER_STAGE_VERTEX_BIT;
    uint32_t           count   = 1;
};

/**
 * @brief Owning wrapper of a VkDescriptorSetLayout.
 */
class DescriptorSetLayout
{
public:
    DescriptorSetLayout() = default;
    ~DescriptorSetLayout();

    DescriptorSetLayout(const DescriptorSetLayout&)            = delete;
    DescriptorSetLayout& operator=(const DescriptorSetLayout&) = delete;

    bool create(VkDevice device, std::span<const DescriptorBindingInfo> bindings);
    void destroy() noexcept;

    [[nodiscard]] VkDescriptorSetLayout layout() const noexcept
    {
        return m_layout;
    }

private:
    VkDevice              m_device = VK_NULL_HANDLE;
    VkDescriptorSetLayout m_layout = VK_NULL_HANDLE;
};

/**
 * @brief Owning wrapper of a VkDescriptorPool. Sets allocated from it are
 *        released together with the pool.
 */
class DescriptorPool
{
public:
    DescriptorPool() = default;
    ~DescriptorPool();

    DescriptorPool(const DescriptorPool&)            = delete;
    DescriptorPool& operator=(const DescriptorPool&) = delete;

    /// The pool is created with FREE_DESCRIPTOR_SET so single sets can be returned.
    bool create(VkDevice device, std::span<const VkDescriptorPoolSize> poolSizes, uint32_t maxSets);
    void destroy() noexcept;

    /// Allocate one set; VK_NULL_HANDLE on failure.
    [[nodiscard]] VkDescriptorSet allocate(VkDescriptorSetLayout layout) const;

    /// Return one set to the pool. The set must not be in use by pending work.
    void free(VkDescriptorSet set) const noexcept;

    [[nodiscard]] VkDescriptorPool pool() const noexcept
    {
        return m_pool;
    }

private:
    VkDevice         m_device = VK_NULL_HANDLE;
    VkDescriptorPool m_pool   = VK_NULL_HANDLE;
};

namespace vkutil
{
    void writeUniformBuffer(VkDevice        device,
                            VkDescriptorSet set,
                            uint32_t        binding,
                            VkBuffer        buffer,
                            VkDeviceSize    range,
                            VkDeviceSize    offset = 0);
} // namespace vkutil
