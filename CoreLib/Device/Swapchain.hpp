#pragma once

#include <cstdint>
#include <span>
#include <vector>
#include <vulkan/vulkan.h>

#include "RendererSettings.hpp"

struct VulkanContext;

/// Requested presentation parameters; the swapchain falls back where the surface disagrees.
struct SurfaceConfig
{
    VkFormat          colorFormat = VK_FORMAT_UNDEFINED; // UNDEFINED = surface preferred
    VkColorSpaceKHR   colorSpace  = VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
    AlphaMode         alphaMode   = AlphaMode::Opaque;
    VkImageUsageFlags usage       = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    VkPresentModeKHR  presentMode = VK_PRESENT_MODE_MAX_ENUM_KHR; // MAX_ENUM = mailbox, else fifo
    VkExtent2D        extent      = {1, 1};                        // physical size from SurfaceManager
};

/**
 * @brief VkSwapchainKHR + its images/views for one presentable surface.
 *
 * The swapchain does not own the VkSurfaceKHR (the window layer does).
 * Recreation hands the previous swapchain to the driver as oldSwapchain.
 */
class Swapchain
{
public:
    Swapchain() = default;
    ~Swapchain();

    Swapchain(const Swapchain&)            = delete;
    Swapchain& operator=(const Swapchain&) = delete;

    /// Creates or recreates. Returns false on failure (zero-sized surface included).
    bool create(const VulkanContext& ctx, VkSurfaceKHR surface, const SurfaceConfig& config);
    bool recreate(const VulkanContext& ctx, VkExtent2D extent);
    void destroy() noexcept;

    /// Raw result; OUT_OF_DATE/SUBOPTIMAL also set outOfDate().
    VkResult acquire(VkSemaphore signal, uint32_t& outIndex) noexcept;
    VkResult present(VkQueue queue, VkSemaphore wait, uint32_t imageIndex) noexcept;

    [[nodiscard]] bool valid() const noexcept
    {
        return m_swapchain != VK_NULL_HANDLE;
    }

    [[nodiscard]] bool outOfDate() const noexcept
    {
        return m_outOfDate;
    }

    void markOutOfDate() noexcept
    {
        m_outOfDate = true;
    }

    [[nodiscard]] VkSurfaceKHR surface() const noexcept
    {
        return m_surface;
    }

    [[nodiscard]] VkFormat format() const noexcept
    {
        return m_format.format;
    }

    [[nodiscard]] VkColorSpaceKHR colorSpace() const noexcept
    {
        return m_format.colorSpace;
    }

    [[nodiscard]] VkExtent2D extent() const noexcept
    {
        return m_extent;
    }

    [[nodiscard]] const std::vector<VkImageView>& views() const noexcept
    {
        return m_views;
    }

    [[nodiscard]] uint32_t imageCount() const noexcept
    {
        return uint32_t(m_images.size());
    }

    // ------------------------------------------------------------
    // Selection policy (pure)
    // ------------------------------------------------------------
    [[nodiscard]] static VkSurfaceFormatKHR chooseSurfaceFormat(std::span<const VkSurfaceFormatKHR> formats,
                                                                VkFormat                            requested,
                                                                VkColorSpaceKHR                     requestedSpace) noexcept;

    [[nodiscard]] static VkPresentModeKHR choosePresentMode(std::span<const VkPresentModeKHR> modes,
                                                            VkPresentModeKHR requested = VK_PRESENT_MODE_MAX_ENUM_KHR) noexcept;

    [[nodiscard]] static VkExtent2D chooseExtent(const VkSurfaceCapabilitiesKHR& caps, VkExtent2D requested) noexcept;

    /// A minimized window reports a 0x0 current extent; no swapchain can be built for it.
    [[nodiscard]] static bool hasArea(VkExtent2D extent) noexcept
    {
        return extent.width > 0 && extent.height > 0;
    }

    /// The extent create() would use right now. False when the surface query fails.
    [[nodiscard]] static bool queryExtent(VkPhysicalDevice physicalDevice,
                                          VkSurfaceKHR     surface,
                                          VkExtent2D       requested,
                                          VkExtent2D&      outExtent) noexcept;

    [[nodiscard]] static VkCompositeAlphaFlagBitsKHR chooseCompositeAlpha(VkCompositeAlphaFlagsKHR supported,
                                                                          AlphaMode                mode) noexcept;

private:
    void destroyViews() noexcept;

private:
    VkDevice         m_device         = VK_NULL_HANDLE;
    VkPhysicalDevice m_physicalDevice = VK_NULL_HANDLE;
    VkSurfaceKHR     m_surface        = VK_NULL_HANDLE;
    VkSwapchainKHR   m_swapchain      = VK_NULL_HANDLE;

    SurfaceConfig      m_config = {};
    VkSurfaceFormatKHR m_format = {};
    VkExtent2D         m_extent = {};

    std::vector<VkImage>     m_images = {};
    std::vector<VkImageView> m_views  = {};

    bool m_outOfDate = false;
};
