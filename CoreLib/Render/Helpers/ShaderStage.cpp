#include "ShaderStage.hpp"

#include <cstdio>
#include <fstream>
#include <utility>
#include <vector>

static std::vector<uint32_t> loadSpirvFile(const std::filesystem::path& path)
{
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file)
    {
        std::fprintf(stderr, "ShaderStage: failed to open %s\n", path.string().c_str());
        return {};
    }

    const std::streamsize size = file.tellg();
    if (size <= 0 || (size % 4) != 0)
    {
        std::fprintf(stderr, "ShaderStage: %s is not a SPIR-V binary (%lld bytes)\n",
                     path.string().c_str(), static_cast<long long>(size));
        return {};
    }

    std::vector<uint32_t> code(static_cast<size_t>(size) / 4);

    file.seekg(0, std::ios::beg);
    file.read(reinterpret_cast<char*>(code.data()), size);
    if (!file)
    {
        std::fprintf(stderr, "ShaderStage: short read on %s\n", path.string().c_str());
        return {};
    }

    return code;
}

ShaderStage::ShaderStage(VkDevice              device,
                         VkShaderModule        module,
                         VkShaderStageFlagBits stage,
                         std::string           entryPoint) : m_device(device),
                                                   m_module(module),
                                                   m_stage(stage),
                                                   m_entryPoint(std::move(entryPoint))
{
}

ShaderStage::~ShaderStage()
{
    destroy();
}

void ShaderStage::destroy() noexcept
{
    if (m_module != VK_NULL_HANDLE && m_device != VK_NULL_HANDLE)
        vkDestroyShaderModule(m_device, m_module, nullptr);

    m_module = VK_NULL_HANDLE;
    m_device = VK_NULL_HANDLE;
}

ShaderStage ShaderStage::fromSpirvFile(VkDevice                     device,
                                       const std::filesystem::path& path,
                                       VkShaderStageFlagBits        stage,
                                       const char*                  entryPoint)
{
    const std::vector<uint32_t> code = loadSpirvFile(path);
    if (code.empty())
        return {}; // invalid, caller checks isValid()

    ShaderStage s = fromSpirvCode(device, code, stage, entryPoint);
    if (!s.isValid())
        std::fprintf(stderr, "ShaderStage: vkCreateShaderModule failed for %s\n", path.string().c_str());

    return s;
}

ShaderStage ShaderStage::fromSpirvCode(VkDevice                  device,
                                       std::span<const uint32_t> code,
                                       VkShaderStageFlagBits     stage,
                                       const char*               entryPoint)
{
    if (!device || code.empty())
        return {};

    VkShaderModuleCreateInfo ci{};
    ci.sType    = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    ci.codeSize = code.size_bytes();
    ci.pCode    = code.data();

    VkShaderModule module = VK_NULL_HANDLE;
    if (vkCreateShaderModule(device, &ci, nullptr, &module) != VK_SUCCESS)
        return {};

    return ShaderStage(device, module, stage, entryPoint ? entryPoint : "main");
}

ShaderStage::ShaderStage(ShaderStage&& other) noexcept
{
    m_device     = std::exchange(other.m_device, VK_NULL_HANDLE);
    m_module     = std::exchange(other.m_module, VK_NULL_HANDLE);
    m_stage      = other.m_stage;
    m_entryPoint = std::move(other.m_entryPoint);
}

ShaderStage& ShaderStage::operator=(ShaderStage&& other) noexcept
{
    if (this != &other)
    {
        destroy();

        m_device     = std::exchange(other.m_device, VK_NULL_HANDLE);
        m_module     = std::exchange(other.m_module, VK_NULL_HANDLE);
        m_stage      = other.m_stage;
        m_entryPoint = std::move(other.m_entryPoint);
    }
    return *this;
}
