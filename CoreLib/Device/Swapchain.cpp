//============================================================
// Swapchain.cpp
//============================================================
#include "Swapchain.hpp"

#include <algorithm>
#include <string>

#include "Diagnostics.hpp"
#include "VkDebugNames.hpp"
#include "VkUtilities.hpp"
#include "VulkanContext.hpp"

Swapchain::~Swapchain()
{
    destroy();
}

VkSurfaceFormatKHR Swapchain::chooseSurfaceFormat(std::span<const VkSurfaceFormatKHR> formats,
                                                  VkFormat                            requested,
                                                  VkColorSpaceKHR                     requestedSpace) noexcept
{
    if (requested != VK_FORMAT_UNDEFINED)
    {
        for (const auto& f : formats)
        {
            if (f.format == requested && f.colorSpace == requestedSpace)
                return f;
        }
        for (const auto& f : formats)
        {
            if (f.format == requested)
                return f;
        }
    }

    for (const auto& f : formats)
    {
        if (f.format == VK_FORMAT_B8G8R8A8_SRGB && f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR)
            return f;
    }

    if (!formats.empty())
        return formats[0];

    VkSurfaceFormatKHR fallback = {};
    fallback.format             = VK_FORMAT_B8G8R8A8_UNORM;
    fallback.colorSpace         = VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
    return fallback;
}

VkPresentModeKHR Swapchain::choosePresentMode(std::span<const VkPresentModeKHR> modes,
                                              VkPresentModeKHR                  requested) noexcept
{
    if (requested != VK_PRESENT_MODE_MAX_ENUM_KHR)
    {
        for (auto m : modes)
        {
            if (m == requested)
                return m;
        }
    }

    for (auto m : modes)
    {
        if (m == VK_PRESENT_MODE_MAILBOX_KHR)
            return m;
    }
    return VK_PRESENT_MODE_FIFO_KHR; // always available
}

VkExtent2D Swapchain::chooseExtent(const VkSurfaceCapabilitiesKHR& caps, VkExtent2D requested) noexcept
{
    if (caps.currentExtent.width != 0xFFFFFFFFu)
        return caps.currentExtent;

    VkExtent2D e = {};
    e.width      = std::clamp<uint32_t>(requested.width, caps.minImageExtent.width, caps.maxImageExtent.width);
    e.height     = std::clamp<uint32_t>(requested.height, caps.minImageExtent.height, caps.maxImageExtent.height);
    return e;
}

VkCompositeAlphaFlagBitsKHR Swapchain::chooseCompositeAlpha(VkCompositeAlphaFlagsKHR supported, AlphaMode mode) noexcept
{
    VkCompositeAlphaFlagBitsKHR wanted = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    switch (mode)
    {
        case AlphaMode::Opaque:
            wanted = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
            break;
        case AlphaMode::PreMultiplied:
            wanted = VK_COMPOSITE_ALPHA_PRE_MULTIPLIED_BIT_KHR;
            break;
        case AlphaMode::PostMultiplied:
            wanted = VK_COMPOSITE_ALPHA_POST_MULTIPLIED_BIT_KHR;
            break;
        case AlphaMode::Inherit:
            wanted = VK_COMPOSITE_ALPHA_INHERIT_BIT_KHR;
            break;
    }

    if (supported & wanted)
        return wanted;

    constexpr VkCompositeAlphaFlagBitsKHR order[] = {
        VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR,
        VK_COMPOSITE_ALPHA_INHERIT_BIT_KHR,
        VK_COMPOSITE_ALPHA_PRE_MULTIPLIED_BIT_KHR,
        VK_COMPOSITE_ALPHA_POST_MULTIPLIED_BIT_KHR,
    };

    for (auto bit : order)
    {
        if (supported & bit)
            return bit;
    }
    return VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
}

bool Swapchain::queryExtent(VkPhysicalDevice physicalDevice, VkSurfaceKHR surface, VkExtent2D requested, VkExtent2D& outExtent) noexcept
{
    outExtent = {};

    VkSurfaceCapabilitiesKHR caps = {};
    if (!physicalDevice || !surface ||
        vkGetPhysicalDeviceSurfaceCapabilitiesKHR(physicalDevice, surface, &caps) != VK_SUCCESS)
    {
        return false;
    }

    outExtent = chooseExtent(caps, requested);
    return true;
}

bool Swapchain::create(const VulkanContext& ctx, VkSurfaceKHR surface, const SurfaceConfig& config)
{
    if (!ctx.device || !ctx.physicalDevice || !surface)
        return false;

    // A different surface cannot inherit the old swapchain.
    if (m_swapchain && surface != m_surface)
        destroy();

    m_device         = ctx.device;
    m_physicalDevice = ctx.physicalDevice;
    m_surface        = surface;
    m_config         = config;

    VkSurfaceCapabilitiesKHR caps = {};
    if (vkGetPhysicalDeviceSurfaceCapabilitiesKHR(m_physicalDevice, surface, &caps) != VK_SUCCESS)
        return false;

    uint32_t fmtCount = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(m_physicalDevice, surface, &fmtCount, nullptr);
    std::vector<VkSurfaceFormatKHR> formats(fmtCount);
    if (fmtCount)
        vkGetPhysicalDeviceSurfaceFormatsKHR(m_physicalDevice, surface, &fmtCount, formats.data());

    uint32_t pmCount = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(m_physicalDevice, surface, &pmCount, nullptr);
    std::vector<VkPresentModeKHR> modes(pmCount);
    if (pmCount)
        vkGetPhysicalDeviceSurfacePresentModesKHR(m_physicalDevice, surface, &pmCount, modes.data());

    const VkSurfaceFormatKHR sf = chooseSurfaceFormat(formats, config.colorFormat, config.colorSpace);
    const VkPresentModeKHR   pm = choosePresentMode(modes, config.presentMode);
    const VkExtent2D         ex = chooseExtent(caps, config.extent);

    if (!hasArea(ex))
        return false;

    if (config.colorFormat != VK_FORMAT_UNDEFINED && sf.format != config.colorFormat)
    {
        diag::warn("Swapchain: Requested color format is not supported by the surface.",
                   {"Requested: " + std::to_string(int(config.colorFormat)),
                    "Using: " + std::to_string(int(sf.format))},
                   DiagCode::SurfaceConfigFallback);
    }

    const VkCompositeAlphaFlagBitsKHR alpha = chooseCompositeAlpha(caps.supportedCompositeAlpha, config.alphaMode);

    VkImageUsageFlags usage = config.usage | VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    if ((caps.supportedUsageFlags & usage) != usage)
    {
        diag::warn("Swapchain: Some requested usage flags are not supported, dropping them.",
                   {},
                   DiagCode::SurfaceConfigFallback);
        usage &= caps.supportedUsageFlags;
        usage |= VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    }

    uint32_t imageCount = std::max(caps.minImageCount + 1u, 2u);
    if (caps.maxImageCount > 0)
        imageCount = std::min(imageCount, caps.maxImageCount);

    VkSwapchainKHR oldSwapchain = m_swapchain;

    VkSwapchainCreateInfoKHR ci = {};
    ci.sType                    = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    ci.surface                  = surface;
    ci.minImageCount            = imageCount;
    ci.imageFormat              = sf.format;
    ci.imageColorSpace          = sf.colorSpace;
    ci.imageExtent              = ex;
    ci.imageArrayLayers         = 1;
    ci.imageUsage               = usage;
    ci.imageSharingMode         = VK_SHARING_MODE_EXCLUSIVE;
    ci.preTransform             = caps.currentTransform;
    ci.compositeAlpha           = alpha;
    ci.presentMode              = pm;
    ci.clipped                  = VK_TRUE;
    ci.oldSwapchain             = oldSwapchain;

    VkSwapchainKHR newSwapchain = VK_NULL_HANDLE;
    const VkResult res          = vkCreateSwapchainKHR(m_device, &ci, nullptr, &newSwapchain);

    // The retired swapchain is unusable either way.
    destroyViews();
    if (oldSwapchain)
        vkDestroySwapchainKHR(m_device, oldSwapchain, nullptr);
    m_swapchain = VK_NULL_HANDLE;
    m_images.clear();

    if (res != VK_SUCCESS)
    {
        vkutil::printVkResult(res, "vkCreateSwapchainKHR");
        return false;
    }

    m_swapchain = newSwapchain;
    m_format    = sf;
    m_extent    = ex;
    m_outOfDate = false;

    vkutil::name(m_device, m_swapchain, "Surface.Swapchain");

    uint32_t imgCount = 0;
    vkGetSwapchainImagesKHR(m_device, m_swapchain, &imgCount, nullptr);
    if (imgCount == 0)
    {
        destroy();
        return false;
    }

    m_images.resize(imgCount);
    vkGetSwapchainImagesKHR(m_device, m_swapchain, &imgCount, m_images.data());

    m_views.resize(imgCount, VK_NULL_HANDLE);
    for (uint32_t i = 0; i < imgCount; ++i)
    {
        VkImageViewCreateInfo vci           = {};
        vci.sType                           = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        vci.image                           = m_images[i];
        vci.viewType                        = VK_IMAGE_VIEW_TYPE_2D;
        vci.format                          = m_format.format;
        vci.subresourceRange.aspectMask     = VK_IMAGE_ASPECT_COLOR_BIT;
        vci.subresourceRange.baseMipLevel   = 0;
        vci.subresourceRange.levelCount     = 1;
        vci.subresourceRange.baseArrayLayer = 0;
        vci.subresourceRange.layerCount     = 1;

        if (vkCreateImageView(m_device, &vci, nullptr, &m_views[i]) != VK_SUCCESS)
        {
            destroy();
            return false;
        }

        // Swapchain images are not ours; naming the views is enough.
        vkutil::name(m_device, m_views[i], "Surface.SwapchainView", int32_t(i));
    }

    return true;
}

bool Swapchain::recreate(const VulkanContext& ctx, VkExtent2D extent)
{
    if (!m_surface)
        return false;

    SurfaceConfig cfg = m_config;
    cfg.extent        = extent;
    return create(ctx, m_surface, cfg);
}

void Swapchain::destroyViews() noexcept
{
    if (!m_device)
        return;

    for (VkImageView v : m_views)
    {
        if (v)
            vkDestroyImageView(m_device, v, nullptr);
    }
    m_views.clear();
}

void Swapchain::destroy() noexcept
{
    destroyViews();

    if (m_device && m_swapchain)
        vkDestroySwapchainKHR(m_device, m_swapchain, nullptr);

    m_swapchain = VK_NULL_HANDLE;
    m_images.clear();
    m_extent    = {};
    m_outOfDate = false;
}

VkResult Swapchain::acquire(VkSemaphore signal, uint32_t& outIndex) noexcept
{
    if (!m_swapchain)
        return VK_ERROR_OUT_OF_DATE_KHR;

    const VkResult res =
        vkAcquireNextImageKHR(m_device, m_swapchain, vkcfg::kFenceTimeoutNs, signal, VK_NULL_HANDLE, &outIndex);

    if (res == VK_ERROR_OUT_OF_DATE_KHR || res == VK_SUBOPTIMAL_KHR)
        m_outOfDate = true;

    return res;
}

VkResult Swapchain::present(VkQueue queue, VkSemaphore wait, uint32_t imageIndex) noexcept
{
    if (!m_swapchain)
        return VK_ERROR_OUT_OF_DATE_KHR;

    VkPresentInfoKHR pi   = {};
    pi.sType              = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    pi.waitSemaphoreCount = wait ? 1u : 0u;
    pi.pWaitSemaphores    = wait ? &wait : nullptr;
    pi.swapchainCount     = 1;
    pi.pSwapchains        = &m_swapchain;
    pi.pImageIndices      = &imageIndex;

    const VkResult res = vkQueuePresentKHR(queue, &pi);

    if (res == VK_ERROR_OUT_OF_DATE_KHR || res == VK_SUBOPTIMAL_KHR)
        m_outOfDate = true;

    return res;
}
