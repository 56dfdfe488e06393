#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vulkan/vulkan.h>

/**
 * @brief Owned VkShaderModule plus the stage/entry point it is used with.
 *
 * Modules are only needed until the pipeline is created; renderables keep
 * them as locals inside initialize().
 */
class ShaderStage
{
public:
    ShaderStage() = default;
    ~ShaderStage();

    // Factory: load a SPIR-V file produced by the build (FLUX3D_SHADER_DIR)
    static ShaderStage fromSpirvFile(VkDevice                     device,
                                     const std::filesystem::path& path,
                                     VkShaderStageFlagBits        stage,
                                     const char*                  entryPoint = "main");

    static ShaderStage fromSpirvCode(VkDevice                  device,
                                     std::span<const uint32_t> code,
                                     VkShaderStageFlagBits     stage,
                                     const char*               entryPoint = "main");

    // non-copyable, move-only
    ShaderStage(const ShaderStage&)            = delete;
    ShaderStage& operator=(const ShaderStage&) = delete;

    ShaderStage(ShaderStage&& other) noexcept;
    ShaderStage& operator=(ShaderStage&& other) noexcept;

    [[nodiscard]] bool isValid() const noexcept
    {
        return m_module != VK_NULL_HANDLE;
    }

    [[nodiscard]] VkPipelineShaderStageCreateInfo stageInfo() const noexcept
    {
        VkPipelineShaderStageCreateInfo info{};
        info.sType  = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        info.stage  = m_stage;
        info.module = m_module;
        info.pName  = m_entryPoint.c_str();
        return info;
    }

private:
    ShaderStage(VkDevice device, VkShaderModule module, VkShaderStageFlagBits stage, std::string entryPoint);

    void destroy() noexcept;

    VkDevice              m_device     = VK_NULL_HANDLE;
    VkShaderModule        m_module     = VK_NULL_HANDLE;
    VkShaderStageFlagBits m_stage      = VK_SHADER_STAGE_FLAG_BITS_MAX_ENUM;
    std::string           m_entryPoint = "main";
};
