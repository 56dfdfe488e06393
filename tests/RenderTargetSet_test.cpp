#include <gtest/gtest.h>

#include "RenderTargetSet.hpp"
#include "TestSupport.hpp"

namespace
{
    constexpr VkSampleCountFlags kAllCounts =
        VK_SAMPLE_COUNT_1_BIT | VK_SAMPLE_COUNT_2_BIT | VK_SAMPLE_COUNT_4_BIT | VK_SAMPLE_COUNT_8_BIT;

    VkImageView fakeView(uintptr_t v)
    {
        return reinterpret_cast<VkImageView>(v);
    }
} // namespace

TEST(RenderTargetSet, SupportedSampleCountsArePreserved)
{
    EXPECT_EQ(RenderTargetSet::resolveSampleCount(1), VK_SAMPLE_COUNT_1_BIT);
    EXPECT_EQ(RenderTargetSet::resolveSampleCount(2), VK_SAMPLE_COUNT_2_BIT);
    EXPECT_EQ(RenderTargetSet::resolveSampleCount(4), VK_SAMPLE_COUNT_4_BIT);
    EXPECT_EQ(RenderTargetSet::resolveSampleCount(8), VK_SAMPLE_COUNT_8_BIT);
}

TEST(RenderTargetSet, OtherSampleCountsBecomeOne)
{
    for (uint32_t n : {0u, 3u, 5u, 6u, 16u, 32u, 64u, 1000u})
        EXPECT_EQ(RenderTargetSet::resolveSampleCount(n), VK_SAMPLE_COUNT_1_BIT) << "requested " << n;
}

TEST(RenderTargetSet, UnsupportedCountIsDowngradedWithAdvisory)
{
    DiagCapture     diag;
    RenderTargetSet targets;

    const VkSampleCountFlagBits got = targets.applySampleCount(8, VK_SAMPLE_COUNT_1_BIT | VK_SAMPLE_COUNT_4_BIT);

    EXPECT_EQ(got, VK_SAMPLE_COUNT_1_BIT);
    EXPECT_EQ(targets.sampleCount(), VK_SAMPLE_COUNT_1_BIT);
    EXPECT_EQ(diag.count(DiagCode::TargetsSampleDowngraded), 1u);
}

TEST(RenderTargetSet, SupportedCountIsApplied)
{
    DiagCapture     diag;
    RenderTargetSet targets;

    EXPECT_EQ(targets.applySampleCount(4, kAllCounts), VK_SAMPLE_COUNT_4_BIT);
    EXPECT_TRUE(targets.isMultisampled());
    EXPECT_TRUE(diag.records().empty());
}

TEST(RenderTargetSet, StartsUninitializedAndStaysSoWhenMarkedStale)
{
    RenderTargetSet targets;
    EXPECT_EQ(targets.state(), TargetState::Uninitialized);

    targets.markStale();
    EXPECT_EQ(targets.state(), TargetState::Uninitialized);
    EXPECT_TRUE(targets.needsRebuild({800, 600}, 1));
}

TEST(RenderTargetSet, NothingAllocatedBeforeInvalidate)
{
    RenderTargetSet targets;

    EXPECT_TRUE(std::holds_alternative<Unallocated>(targets.depth()));
    EXPECT_TRUE(std::holds_alternative<Unallocated>(targets.msaaColor()));
    EXPECT_EQ(targets.renderPass(), VK_NULL_HANDLE);
    EXPECT_EQ(targets.framebuffer(0), VK_NULL_HANDLE);

    // Idempotent on an empty set.
    targets.destroy();
    targets.destroy();
    EXPECT_EQ(targets.state(), TargetState::Uninitialized);
}

TEST(RenderTargetSet, SingleSampleRendersDirectlyIntoTarget)
{
    RenderTargetSet targets;
    targets.applySampleCount(1, kAllCounts);

    const ColorAttachment a = targets.colorAttachment(fakeView(0x1234));
    EXPECT_EQ(a.view, fakeView(0x1234));
    EXPECT_EQ(a.resolveView, VK_NULL_HANDLE);
}

TEST(RenderTargetSet, ColorAndDepthUseRealDevice)
{
    auto device = acquireHeadlessDevice();
    if (!device)
        GTEST_SKIP() << "No Vulkan device available";

    DiagCapture     diag;
    RenderTargetSet targets;

    const VkSampleCountFlagBits samples = targets.applySampleCount(4, device->supportedSampleCounts());

    VulkanContext ctx = device->context();
    ctx.sampleCount   = samples;

    // No swapchain headless: zero framebuffers, but images and pass are real.
    ASSERT_TRUE(targets.invalidate(ctx, {64, 32}, VK_FORMAT_B8G8R8A8_UNORM, {}));
    EXPECT_EQ(targets.state(), TargetState::Valid);
    EXPECT_NE(targets.renderPass(), VK_NULL_HANDLE);
    EXPECT_FALSE(targets.needsRebuild({64, 32}, ctx.generation));

    const auto* depth = std::get_if<AllocatedTexture>(&targets.depth());
    ASSERT_NE(depth, nullptr);
    EXPECT_EQ(depth->extent.width, 64u);
    EXPECT_EQ(depth->extent.height, 32u);
    EXPECT_EQ(depth->samples, samples);

    if (samples != VK_SAMPLE_COUNT_1_BIT)
    {
        const auto* msaa = std::get_if<AllocatedTexture>(&targets.msaaColor());
        ASSERT_NE(msaa, nullptr);

        const ColorAttachment a = targets.colorAttachment(fakeView(0x42));
        EXPECT_EQ(a.view, msaa->view);
        EXPECT_EQ(a.resolveView, fakeView(0x42));
    }
    else
    {
        EXPECT_TRUE(std::holds_alternative<Unallocated>(targets.msaaColor()));
    }

    // Resize goes stale; a rebuild is required.
    targets.markStale();
    EXPECT_EQ(targets.state(), TargetState::Stale);
    EXPECT_TRUE(targets.needsRebuild({64, 32}, ctx.generation));
    EXPECT_TRUE(targets.needsRebuild({128, 32}, ctx.generation));

    targets.destroy();
    EXPECT_TRUE(std::holds_alternative<Unallocated>(targets.depth()));
}
