#pragma once

#include <cstdint>
#include <vulkan/vulkan.h>

/**
 * @brief Vulkan configuration constants shared across UI + CoreLib.
 */
namespace vkcfg
{
    /**
     * @brief Number of frames the renderer records ahead of the GPU.
     *
     * Kept at one: beginFrame() waits on the single frame fence, which is
     * what makes host writes into persistently mapped uniform buffers safe
     * while a FrameSession is open.
     */
    static constexpr std::uint32_t kFramesInFlight = 1;

    /// Frame fence wait used by beginFrame() before treating the GPU as hung.
    static constexpr std::uint64_t kFenceTimeoutNs = 1000000000ull;

} // namespace vkcfg

/**
 * @brief Long-lived device handles handed to resource creation code.
 *
 * Produced by DeviceContext after a successful requestDevice(). CoreLib objects
 * (buffers, pipelines, descriptor sets) are created against it and must be
 * destroyed before the DeviceContext that issued it.
 */
struct VulkanContext
{
    VkInstance       instance       = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice = VK_NULL_HANDLE;
    VkDevice         device         = VK_NULL_HANDLE;

    VkQueue  graphicsQueue            = VK_NULL_HANDLE;
    uint32_t graphicsQueueFamilyIndex = 0;

    // Effective (already resolved) sample count of the render targets.
    VkSampleCountFlagBits sampleCount = VK_SAMPLE_COUNT_1_BIT;

    VkFormat colorFormat = VK_FORMAT_UNDEFINED;
    VkFormat depthFormat = VK_FORMAT_D32_SFLOAT;

    VkPhysicalDeviceProperties deviceProps{};

    // Incremented every time a device is acquired, so dependents can detect
    // that they were created against an older device.
    uint64_t generation = 0;
};

[[nodiscard]] inline bool contextReady(const VulkanContext& ctx) noexcept
{
    return ctx.device != VK_NULL_HANDLE && ctx.physicalDevice != VK_NULL_HANDLE && ctx.graphicsQueue != VK_NULL_HANDLE;
}
