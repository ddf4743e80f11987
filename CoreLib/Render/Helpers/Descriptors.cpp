//============================================================
// Descriptors.cpp
//============================================================
#include "Descriptors.hpp"

#include <iostream>
#include <vector>

// --------------------------------------------------------
// DescriptorSetLayout
// --------------------------------------------------------
DescriptorSetLayout::~DescriptorSetLayout()
{
    destroy();
}

bool DescriptorSetLayout::create(VkDevice device, std::span<const DescriptorBindingInfo> bindings)
{
    destroy();

    std::vector<VkDescriptorSetLayoutBinding> vkBindings;
    vkBindings.reserve(bindings.size());

    for (const DescriptorBindingInfo& b : bindings)
    {
        VkDescriptorSetLayoutBinding lb{};
        lb.binding         = b.binding;
        lb.descriptorType  = b.type;
        lb.descriptorCount = b.count;
        lb.stageFlags      = b.stages;
        vkBindings.push_back(lb);
    }

    VkDescriptorSetLayoutCreateInfo ci{};
    ci.sType        = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    ci.bindingCount = static_cast<uint32_t>(vkBindings.size());
    ci.pBindings    = vkBindings.data();

    if (vkCreateDescriptorSetLayout(device, &ci, nullptr, &m_layout) != VK_SUCCESS)
    {
        std::cerr << "DescriptorSetLayout: vkCreateDescriptorSetLayout failed.\n";
        m_layout = VK_NULL_HANDLE;
        return false;
    }

    m_device = device;
    return true;
}

void DescriptorSetLayout::destroy() noexcept
{
    if (m_layout != VK_NULL_HANDLE)
        vkDestroyDescriptorSetLayout(m_device, m_layout, nullptr);

    m_layout = VK_NULL_HANDLE;
    m_device = VK_NULL_HANDLE;
}

// --------------------------------------------------------
// DescriptorPool
// --------------------------------------------------------
DescriptorPool::~DescriptorPool()
{
    destroy();
}

bool DescriptorPool::create(VkDevice device, std::span<const VkDescriptorPoolSize> poolSizes, uint32_t maxSets)
{
    destroy();

    VkDescriptorPoolCreateInfo ci{};
    ci.sType         = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    ci.poolSizeCount = static_cast<uint32_t>(poolSizes.size());
    ci.pPoolSizes    = poolSizes.data();
    ci.maxSets       = maxSets;
    ci.flags         = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;

    if (vkCreateDescriptorPool(device, &ci, nullptr, &m_pool) != VK_SUCCESS)
    {
        std::cerr << "DescriptorPool: vkCreateDescriptorPool failed.\n";
        m_pool = VK_NULL_HANDLE;
        return false;
    }

    m_device = device;
    return true;
}

void DescriptorPool::destroy() noexcept
{
    if (m_pool != VK_NULL_HANDLE)
        vkDestroyDescriptorPool(m_device, m_pool, nullptr);

    m_pool   = VK_NULL_HANDLE;
    m_device = VK_NULL_HANDLE;
}

VkDescriptorSet DescriptorPool::allocate(VkDescriptorSetLayout layout) const
{
    if (!m_pool || !layout)
        return VK_NULL_HANDLE;

    VkDescriptorSetAllocateInfo ai{};
    ai.sType              = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    ai.descriptorPool     = m_pool;
    ai.descriptorSetCount = 1;
    ai.pSetLayouts        = &layout;

    VkDescriptorSet set = VK_NULL_HANDLE;
    if (vkAllocateDescriptorSets(m_device, &ai, &set) != VK_SUCCESS)
        return VK_NULL_HANDLE;

    return set;
}

void DescriptorPool::free(VkDescriptorSet set) const noexcept
{
    if (!m_pool || set == VK_NULL_HANDLE)
        return;

    vkFreeDescriptorSets(m_device, m_pool, 1, &set);
}

// --------------------------------------------------------
// Writes
// --------------------------------------------------------
namespace vkutil
{
    void writeUniformBuffer(VkDevice        device,
                            VkDescriptorSet set,
                            uint32_t        binding,
                            VkBuffer        buffer,
                            VkDeviceSize    range,
                            VkDeviceSize    offset)
    {
        VkDescriptorBufferInfo bi{};
        bi.buffer = buffer;
        bi.offset = offset;
        bi.range  = range;

        VkWriteDescriptorSet w{};
        w.sType           = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        w.dstSet          = set;
        w.dstBinding      = binding;
        w.descriptorType  = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
        w.descriptorCount = 1;
        w.pBufferInfo     = &bi;

        vkUpdateDescriptorSets(device, 1, &w, 0, nullptr);
    }
} // namespace vkutil
