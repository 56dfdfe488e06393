#include <algorithm>
#include <gtest/gtest.h>

#include "RendererSettings.hpp"

TEST(RendererSettings, Defaults)
{
    const RendererSettings s;

    EXPECT_EQ(s.canvasWidth, 800u);
    EXPECT_EQ(s.canvasHeight, 600u);
    EXPECT_TRUE(s.antialiasing);
    EXPECT_EQ(s.msaaSampleCount, 4u);
    EXPECT_EQ(s.powerPreference, PowerPreference::HighPerformance);
    EXPECT_EQ(s.alphaMode, AlphaMode::Opaque);
    EXPECT_EQ(s.colorFormat, VK_FORMAT_UNDEFINED);
    EXPECT_EQ(s.depthFormat, VK_FORMAT_D32_SFLOAT);
    EXPECT_EQ(s.colorSpace, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR);
    EXPECT_DOUBLE_EQ(s.devicePixelRatio, 1.0);
    EXPECT_TRUE(s.requiredFeatures.empty());
    EXPECT_FALSE(s.requiredLimits.maxImageDimension2D.has_value());
}

TEST(RendererSettings, ResolveSanitizesValues)
{
    RendererSettings in;
    in.canvasWidth      = 0;
    in.canvasHeight     = 0;
    in.devicePixelRatio = 0.0;
    in.usageFlags       = VK_IMAGE_USAGE_TRANSFER_SRC_BIT;
    in.depthFormat      = VK_FORMAT_UNDEFINED;

    const RendererSettings out = resolveSettings(in);

    EXPECT_EQ(out.canvasWidth, 1u);
    EXPECT_EQ(out.canvasHeight, 1u);
    EXPECT_DOUBLE_EQ(out.devicePixelRatio, 1.0);
    EXPECT_TRUE(out.usageFlags & VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT);
    EXPECT_TRUE(out.usageFlags & VK_IMAGE_USAGE_TRANSFER_SRC_BIT);
    EXPECT_EQ(out.depthFormat, VK_FORMAT_D32_SFLOAT);
}

TEST(RendererSettings, AntialiasingOffForcesSingleSample)
{
    RendererSettings in;
    in.antialiasing    = false;
    in.msaaSampleCount = 8;

    EXPECT_EQ(resolveSettings(in).msaaSampleCount, 1u);
}

TEST(RendererSettings, ResolveKeepsValidValues)
{
    RendererSettings in;
    in.canvasWidth      = 1920;
    in.canvasHeight     = 1080;
    in.devicePixelRatio = 1.25;
    in.msaaSampleCount  = 8;

    const RendererSettings out = resolveSettings(in);

    EXPECT_EQ(out.canvasWidth, 1920u);
    EXPECT_EQ(out.canvasHeight, 1080u);
    EXPECT_DOUBLE_EQ(out.devicePixelRatio, 1.25);
    EXPECT_EQ(out.msaaSampleCount, 8u);
}

TEST(RendererSettings, DescribeListsOptions)
{
    RendererSettings s;
    s.requiredFeatures = {DeviceFeature::WideLines, DeviceFeature::DepthClamp};

    const std::vector<std::string> lines = describeSettings(s);

    auto contains = [&](const std::string& text) {
        return std::any_of(lines.begin(), lines.end(), [&](const std::string& l) { return l.find(text) != std::string::npos; });
    };

    EXPECT_TRUE(contains("canvas: 800x600"));
    EXPECT_TRUE(contains("high-performance"));
    EXPECT_TRUE(contains("wideLines depthClamp"));
}
