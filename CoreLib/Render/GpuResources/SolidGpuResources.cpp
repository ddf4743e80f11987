//============================================================
// SolidGpuResources.cpp
//============================================================
#include "SolidGpuResources.hpp"

#include <iostream>

#include "SolidMesh.hpp"
#include "VkUtilities.hpp"

SolidGpuResources::SolidGpuResources(const VulkanContext* ctx, const SolidMesh* mesh) :
    m_ctx{ctx},
    m_mesh{mesh}
{
}

SolidGpuResources::~SolidGpuResources() noexcept
{
    destroy();
}

void SolidGpuResources::destroy() noexcept
{
    m_positionBuffer.destroy();
    m_normalBuffer.destroy();
    m_vertexCount = 0;
    m_uploaded    = false;
}

bool SolidGpuResources::uploadBuffer(const RenderFrameContext& fc,
                                     GpuBuffer&                dst,
                                     const void*               data,
                                     VkDeviceSize              bytes)
{
    dst = vkutil::createDeviceLocalBufferEmpty(*m_ctx, bytes, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
    if (!dst.valid())
        return false;

    GpuBuffer staging;
    const bool staged = staging.create(m_ctx->device,
                                       m_ctx->physicalDevice,
                                       bytes,
                                       VK_BUFFER_USAGE_TRANSFER_SRC_BIT,
                                       VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT) &&
                        staging.upload(data, bytes);
    if (!staged)
        return false;

    VkBufferCopy cpy = {};
    cpy.srcOffset    = 0;
    cpy.dstOffset    = 0;
    cpy.size         = bytes;

    vkCmdCopyBuffer(fc.cmd, staging.buffer(), dst.buffer(), 1, &cpy);

    // Staging lives until this frame slot's fence has been waited again.
    fc.deferred->enqueue(fc.frameIndex, [st = std::move(staging)]() mutable {
    });

    return true;
}

void SolidGpuResources::update(const RenderFrameContext& fc)
{
    if (m_uploaded || m_failed || !m_ctx || !m_mesh || !fc.cmd || !fc.deferred)
        return;

    if (m_mesh->empty())
        return;

    const auto& positions = m_mesh->positions();
    const auto& normals   = m_mesh->normals();

    const VkDeviceSize bytes = VkDeviceSize(sizeof(glm::vec3)) * VkDeviceSize(positions.size());

    if (!uploadBuffer(fc, m_positionBuffer, positions.data(), bytes) ||
        !uploadBuffer(fc, m_normalBuffer, normals.data(), bytes))
    {
        std::cerr << "SolidGpuResources: buffer upload failed.\n";
        destroy();
        m_failed = true;
        return;
    }

    vkutil::barrierTransferToVertexAttributeRead(fc.cmd);

    m_vertexCount = static_cast<uint32_t>(positions.size());
    m_uploaded    = true;
}
