#include <gtest/gtest.h>
#include <vector>

#include "Swapchain.hpp"

namespace
{
    VkSurfaceFormatKHR fmt(VkFormat f, VkColorSpaceKHR cs = VK_COLOR_SPACE_SRGB_NONLINEAR_KHR)
    {
        return VkSurfaceFormatKHR{f, cs};
    }
} // namespace

TEST(Swapchain, RequestedFormatWins)
{
    const std::vector<VkSurfaceFormatKHR> formats = {
        fmt(VK_FORMAT_B8G8R8A8_SRGB),
        fmt(VK_FORMAT_R8G8B8A8_UNORM),
    };

    const auto chosen = Swapchain::chooseSurfaceFormat(formats, VK_FORMAT_R8G8B8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR);
    EXPECT_EQ(chosen.format, VK_FORMAT_R8G8B8A8_UNORM);
}

TEST(Swapchain, UnsupportedFormatFallsBackToSrgb)
{
    const std::vector<VkSurfaceFormatKHR> formats = {
        fmt(VK_FORMAT_R8G8B8A8_UNORM),
        fmt(VK_FORMAT_B8G8R8A8_SRGB),
    };

    const auto chosen = Swapchain::chooseSurfaceFormat(formats, VK_FORMAT_R16G16B16A16_SFLOAT, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR);
    EXPECT_EQ(chosen.format, VK_FORMAT_B8G8R8A8_SRGB);

    const auto preferred = Swapchain::chooseSurfaceFormat(formats, VK_FORMAT_UNDEFINED, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR);
    EXPECT_EQ(preferred.format, VK_FORMAT_B8G8R8A8_SRGB);
}

TEST(Swapchain, NoSrgbFallsBackToFirst)
{
    const std::vector<VkSurfaceFormatKHR> formats = {
        fmt(VK_FORMAT_A2B10G10R10_UNORM_PACK32),
        fmt(VK_FORMAT_R8G8B8A8_UNORM),
    };

    EXPECT_EQ(Swapchain::chooseSurfaceFormat(formats, VK_FORMAT_UNDEFINED, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR).format,
              VK_FORMAT_A2B10G10R10_UNORM_PACK32);
}

TEST(Swapchain, PresentModePrefersMailbox)
{
    const std::vector<VkPresentModeKHR> withMailbox = {VK_PRESENT_MODE_FIFO_KHR, VK_PRESENT_MODE_MAILBOX_KHR};
    const std::vector<VkPresentModeKHR> fifoOnly    = {VK_PRESENT_MODE_FIFO_KHR, VK_PRESENT_MODE_IMMEDIATE_KHR};

    EXPECT_EQ(Swapchain::choosePresentMode(withMailbox), VK_PRESENT_MODE_MAILBOX_KHR);
    EXPECT_EQ(Swapchain::choosePresentMode(fifoOnly), VK_PRESENT_MODE_FIFO_KHR);
    EXPECT_EQ(Swapchain::choosePresentMode(fifoOnly, VK_PRESENT_MODE_IMMEDIATE_KHR), VK_PRESENT_MODE_IMMEDIATE_KHR);
}

TEST(Swapchain, FixedSurfaceExtentIsUsed)
{
    VkSurfaceCapabilitiesKHR caps = {};
    caps.currentExtent            = {1280, 720};

    const VkExtent2D e = Swapchain::chooseExtent(caps, {640, 480});
    EXPECT_EQ(e.width, 1280u);
    EXPECT_EQ(e.height, 720u);
}

TEST(Swapchain, FreeExtentIsClampedToCapabilities)
{
    VkSurfaceCapabilitiesKHR caps = {};
    caps.currentExtent            = {0xFFFFFFFFu, 0xFFFFFFFFu};
    caps.minImageExtent           = {16, 16};
    caps.maxImageExtent           = {4096, 2048};

    const VkExtent2D big = Swapchain::chooseExtent(caps, {8000, 3000});
    EXPECT_EQ(big.width, 4096u);
    EXPECT_EQ(big.height, 2048u);

    const VkExtent2D small = Swapchain::chooseExtent(caps, {1, 1});
    EXPECT_EQ(small.width, 16u);
    EXPECT_EQ(small.height, 16u);
}

TEST(Swapchain, MinimizedSurfaceHasNoArea)
{
    // Minimized windows report a fixed 0x0 extent, whatever was requested.
    VkSurfaceCapabilitiesKHR caps = {};
    caps.currentExtent            = {0, 0};
    caps.maxImageExtent           = {0, 0};

    const VkExtent2D e = Swapchain::chooseExtent(caps, {800, 600});
    EXPECT_FALSE(Swapchain::hasArea(e));
    EXPECT_FALSE(Swapchain::hasArea({800, 0}));
    EXPECT_TRUE(Swapchain::hasArea({1, 1}));
}

TEST(Swapchain, ExtentQueryNeedsASurface)
{
    VkExtent2D e = {7, 7};
    EXPECT_FALSE(Swapchain::queryExtent(VK_NULL_HANDLE, VK_NULL_HANDLE, {800, 600}, e));
    EXPECT_FALSE(Swapchain::hasArea(e));
}

TEST(Swapchain, CompositeAlphaFallsBack)
{
    EXPECT_EQ(Swapchain::chooseCompositeAlpha(VK_COMPOSITE_ALPHA_PRE_MULTIPLIED_BIT_KHR | VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR,
                                              AlphaMode::PreMultiplied),
              VK_COMPOSITE_ALPHA_PRE_MULTIPLIED_BIT_KHR);

    EXPECT_EQ(Swapchain::chooseCompositeAlpha(VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR, AlphaMode::PostMultiplied),
              VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR);

    EXPECT_EQ(Swapchain::chooseCompositeAlpha(VK_COMPOSITE_ALPHA_INHERIT_BIT_KHR, AlphaMode::Opaque),
              VK_COMPOSITE_ALPHA_INHERIT_BIT_KHR);
}

TEST(Swapchain, EmptyByDefault)
{
    Swapchain swapchain;

    EXPECT_FALSE(swapchain.valid());
    EXPECT_EQ(swapchain.imageCount(), 0u);

    swapchain.destroy();
    EXPECT_FALSE(swapchain.valid());
}
