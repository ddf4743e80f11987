//============================================================
// ShaderStage.hpp
//============================================================
#pragma once

#include <filesystem>
#include <string>
#include <vulkan/vulkan.h>

/**
 * @brief Owns one VkShaderModule together with the stage it is bound to.
 *
 * A default constructed stage is empty; fromSpirvFile() returns an empty
 * stage when the binary cannot be read or the module cannot be created.
 */
class ShaderStage
{
public:
    ShaderStage() = default;
    ~ShaderStage();

    [[nodiscard]] static ShaderStage fromSpirvFile(VkDevice                     device,
                                                   const std::filesystem::path& path,
                                                   VkShaderStageFlagBits        stage,
                                                   const char*                  entryPoint = "main");

    ShaderStage(const ShaderStage&)            = delete;
    ShaderStage& operator=(const ShaderStage&) = delete;

    ShaderStage(ShaderStage&& other) noexcept;
    ShaderStage& operator=(ShaderStage&& other) noexcept;

    [[nodiscard]] bool isValid() const noexcept
    {
        return m_module != VK_NULL_HANDLE;
    }

    /// Create info for VkGraphicsPipelineCreateInfo::pStages; valid while this stage lives.
    [[nodiscard]] VkPipelineShaderStageCreateInfo stageInfo() const noexcept;

    [[nodiscard]] VkShaderModule handle() const noexcept
    {
        return m_module;
    }

private:
    void release() noexcept;

    VkDevice              m_device     = VK_NULL_HANDLE;
    VkShaderModule        m_module     = VK_NULL_HANDLE;
    VkShaderStageFlagBits m_stage      = VK_SHADER_STAGE_VERTEX_BIT;
    std::string           m_entryPoint = "main";
};
