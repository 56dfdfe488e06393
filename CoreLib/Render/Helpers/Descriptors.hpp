#pragma once

#include <cstdint>
#include <span>
#include <vulkan/vulkan.h>

struct DescriptorBindingInfo
{
    uint32_t           binding = 0;
    VkDescriptorType   type    = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    VkShaderStageFlags stages  = VK_SHADER_STAGE_VERTEX_BIT;
    uint32_t           count   = 1; // array size, usually 1
};

class DescriptorSetLayout
{
public:
    DescriptorSetLayout() = default;
    ~DescriptorSetLayout();

    DescriptorSetLayout(const DescriptorSetLayout&)            = delete;
    DescriptorSetLayout& operator=(const DescriptorSetLayout&) = delete;
    DescriptorSetLayout(DescriptorSetLayout&&)                 = delete;
    DescriptorSetLayout& operator=(DescriptorSetLayout&&)      = delete;

    bool create(VkDevice device, std::span<const DescriptorBindingInfo> bindings);
    void destroy() noexcept;

    /// Drops the handle without destroying it (its device is gone).
    void forget() noexcept
    {
        m_layout = VK_NULL_HANDLE;
        m_device = VK_NULL_HANDLE;
    }

    [[nodiscard]] VkDescriptorSetLayout layout() const noexcept
    {
        return m_layout;
    }

private:
    VkDevice              m_device{VK_NULL_HANDLE};
    VkDescriptorSetLayout m_layout{VK_NULL_HANDLE};
};

/**
 * @brief Descriptor pool; sets allocated from it die with it.
 */
class DescriptorPool
{
public:
    DescriptorPool() = default;
    ~DescriptorPool();

    DescriptorPool(const DescriptorPool&)            = delete;
    DescriptorPool& operator=(const DescriptorPool&) = delete;
    DescriptorPool(DescriptorPool&&)                 = delete;
    DescriptorPool& operator=(DescriptorPool&&)      = delete;

    bool create(VkDevice device, std::span<const VkDescriptorPoolSize> poolSizes, uint32_t maxSets);
    void destroy() noexcept;

    void forget() noexcept
    {
        m_pool   = VK_NULL_HANDLE;
        m_device = VK_NULL_HANDLE;
    }

    /// Returns VK_NULL_HANDLE on failure.
    [[nodiscard]] VkDescriptorSet allocate(VkDescriptorSetLayout layout) const;

    [[nodiscard]] VkDescriptorPool pool() const noexcept
    {
        return m_pool;
    }

private:
    VkDevice         m_device{VK_NULL_HANDLE};
    VkDescriptorPool m_pool{VK_NULL_HANDLE};
};

namespace vkutil
{
    void writeUniformBuffer(VkDevice        device,
                            VkDescriptorSet set,
                            uint32_t        binding,
                            VkBuffer        buffer,
                            VkDeviceSize    range,
                            VkDeviceSize    offset = 0);

    /// The single camera block (binding 0) every scene pipeline uses at set 0.
    [[nodiscard]] DescriptorBindingInfo cameraBlockBinding() noexcept;

} // namespace vkutil
