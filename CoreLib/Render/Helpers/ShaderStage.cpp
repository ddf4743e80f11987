//============================================================
// ShaderStage.cpp
//============================================================
#include "ShaderStage.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <utility>
#include <vector>

namespace
{
    // Read into uint32_t storage so pCode is suitably aligned.
    std::vector<uint32_t> readSpirv(const std::filesystem::path& path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            std::cerr << "ShaderStage: cannot open " << path.string() << ".\n";
            return {};
        }

        std::error_code       ec;
        const std::uintmax_t bytes = std::filesystem::file_size(path, ec);
        if (ec || bytes == 0 || bytes % sizeof(uint32_t) != 0)
        {
            std::cerr << "ShaderStage: " << path.string() << " is not a SPIR-V binary.\n";
            return {};
        }

        std::vector<uint32_t> words(static_cast<size_t>(bytes / sizeof(uint32_t)));
        if (!in.read(reinterpret_cast<char*>(words.data()), static_cast<std::streamsize>(bytes)))
        {
            std::cerr << "ShaderStage: short read on " << path.string() << ".\n";
            return {};
        }

        return words;
    }
} // namespace

ShaderStage ShaderStage::fromSpirvFile(VkDevice                     device,
                                       const std::filesystem::path& path,
                                       VkShaderStageFlagBits        stage,
                                       const char*                  entryPoint)
{
    ShaderStage out;

    const std::vector<uint32_t> words = readSpirv(path);
    if (words.empty() || device == VK_NULL_HANDLE)
        return out;

    VkShaderModuleCreateInfo ci{};
    ci.sType    = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    ci.codeSize = words.size() * sizeof(uint32_t);
    ci.pCode    = words.data();

    if (vkCreateShaderModule(device, &ci, nullptr, &out.m_module) != VK_SUCCESS)
    {
        std::cerr << "ShaderStage: vkCreateShaderModule failed for " << path.string() << ".\n";
        out.m_module = VK_NULL_HANDLE;
        return out;
    }

    out.m_device     = device;
    out.m_stage      = stage;
    out.m_entryPoint = entryPoint ? entryPoint : "main";
    return out;
}

ShaderStage::~ShaderStage()
{
    release();
}

ShaderStage::ShaderStage(ShaderStage&& other) noexcept :
    m_device(std::exchange(other.m_device, VK_NULL_HANDLE)),
    m_module(std::exchange(other.m_module, VK_NULL_HANDLE)),
    m_stage(other.m_stage),
    m_entryPoint(std::move(other.m_entryPoint))
{
}

ShaderStage& ShaderStage::operator=(ShaderStage&& other) noexcept
{
    if (this != &other)
    {
        release();

        m_device     = std::exchange(other.m_device, VK_NULL_HANDLE);
        m_module     = std::exchange(other.m_module, VK_NULL_HANDLE);
        m_stage      = other.m_stage;
        m_entryPoint = std::move(other.m_entryPoint);
    }
    return *this;
}

VkPipelineShaderStageCreateInfo ShaderStage::stageInfo() const noexcept
{
    VkPipelineShaderStageCreateInfo info{};
    info.sType  = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    info.stage  = m_stage;
    info.module = m_module;
    info.pName  = m_entryPoint.c_str();
    return info;
}

void ShaderStage::release() noexcept
{
    if (m_module != VK_NULL_HANDLE && m_device != VK_NULL_HANDLE)
        vkDestroyShaderModule(m_device, m_module, nullptr);

    m_module = VK_NULL_HANDLE;
}
