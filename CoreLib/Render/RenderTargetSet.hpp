#pragma once

#include <cstdint>
#include <span>
#include <variant>
#include <vector>
#include <vulkan/vulkan.h>

struct VulkanContext;

enum class TargetState : uint8_t
{
    Uninitialized,
    Valid,
    Stale
};

struct Unallocated
{
};

struct AllocatedTexture
{
    VkImage               image   = VK_NULL_HANDLE;
    VkDeviceMemory        memory  = VK_NULL_HANDLE;
    VkImageView           view    = VK_NULL_HANDLE;
    VkExtent2D            extent  = {};
    VkFormat              format  = VK_FORMAT_UNDEFINED;
    VkSampleCountFlagBits samples = VK_SAMPLE_COUNT_1_BIT;
};

using TextureSlot = std::variant<Unallocated, AllocatedTexture>;

/// Color attachment pair for one frame: render into view, resolve into resolveView (if any).
struct ColorAttachment
{
    VkImageView view        = VK_NULL_HANDLE;
    VkImageView resolveView = VK_NULL_HANDLE;
};

/**
 * @brief Depth + optional MSAA color targets, render pass and framebuffers.
 *
 * Sized to the surface's physical size. Single frame in flight, so one depth
 * and one MSAA image are shared by every swapchain image.
 */
class RenderTargetSet
{
public:
    RenderTargetSet() = default;
    ~RenderTargetSet();

    RenderTargetSet(const RenderTargetSet&)            = delete;
    RenderTargetSet& operator=(const RenderTargetSet&) = delete;

    /// {1,2,4,8} are kept, everything else becomes 1.
    [[nodiscard]] static VkSampleCountFlagBits resolveSampleCount(uint32_t requested) noexcept;

    /**
     * @brief Resolve requested against what the device supports for color + depth.
     *
     * Unsupported counts drop to 1 with an advisory. A changed count marks
     * the set stale.
     */
    VkSampleCountFlagBits applySampleCount(uint32_t requested, VkSampleCountFlags supported);

    /// Valid -> Stale. Uninitialized stays Uninitialized.
    void markStale() noexcept;

    /// True when the set must be rebuilt before it can be used for extent/device.
    [[nodiscard]] bool needsRebuild(VkExtent2D extent, uint64_t deviceGeneration) const noexcept;

    /**
     * @brief Destroy everything, then allocate for the given surface.
     *
     * On failure the set is left Uninitialized and false is returned.
     */
    bool invalidate(const VulkanContext&         ctx,
                    VkExtent2D                   extent,
                    VkFormat                     colorFormat,
                    std::span<const VkImageView> swapchainViews);

    void destroy() noexcept;

    [[nodiscard]] ColorAttachment colorAttachment(VkImageView resolveTarget) const noexcept;

    [[nodiscard]] TargetState state() const noexcept
    {
        return m_state;
    }

    [[nodiscard]] VkSampleCountFlagBits sampleCount() const noexcept
    {
        return m_samples;
    }

    [[nodiscard]] bool isMultisampled() const noexcept
    {
        return m_samples != VK_SAMPLE_COUNT_1_BIT;
    }

    [[nodiscard]] VkExtent2D extent() const noexcept
    {
        return m_extent;
    }

    [[nodiscard]] VkRenderPass renderPass() const noexcept
    {
        return m_renderPass;
    }

    [[nodiscard]] VkFramebuffer framebuffer(uint32_t imageIndex) const noexcept
    {
        return imageIndex < m_framebuffers.size() ? m_framebuffers[imageIndex] : VK_NULL_HANDLE;
    }

    [[nodiscard]] const TextureSlot& depth() const noexcept
    {
        return m_depth;
    }

    [[nodiscard]] const TextureSlot& msaaColor() const noexcept
    {
        return m_msaaColor;
    }

private:
    bool allocateTexture(const VulkanContext&  ctx,
                         TextureSlot&          slot,
                         VkFormat              format,
                         VkImageUsageFlags     usage,
                         VkImageAspectFlags    aspect,
                         const char*           debugName);
    void releaseTexture(TextureSlot& slot) noexcept;

private:
    TargetState           m_state   = TargetState::Uninitialized;
    VkSampleCountFlagBits m_samples = VK_SAMPLE_COUNT_1_BIT;

    VkDevice   m_device     = VK_NULL_HANDLE;
    uint64_t   m_generation = 0;
    VkExtent2D m_extent     = {};

    TextureSlot m_depth     = Unallocated{};
    TextureSlot m_msaaColor = Unallocated{};

    VkRenderPass               m_renderPass = VK_NULL_HANDLE;
    std::vector<VkFramebuffer> m_framebuffers;
};

namespace vkutil
{
    /**
     * @brief Render pass matching RenderTargetSet's layout.
     *
     * samples > 1: [msaa color, depth, resolve]; otherwise [color, depth].
     * Color and depth are cleared on load. Pipelines built against it are
     * compatible with the frame's real pass.
     */
    VkRenderPass createCompatibleRenderPass(VkDevice              device,
                                            VkFormat              colorFormat,
                                            VkFormat              depthFormat,
                                            VkSampleCountFlagBits samples);
} // namespace vkutil
