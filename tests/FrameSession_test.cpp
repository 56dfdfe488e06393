#include <gtest/gtest.h>

#include "FrameSession.hpp"
#include "Renderer.hpp"
#include "TestSupport.hpp"

TEST(FrameSessionGuard, OpenThenClose)
{
    FrameSessionGuard guard;

    EXPECT_EQ(guard.open(), RenderStatus::Ok);
    EXPECT_TRUE(guard.isOpen());
    EXPECT_EQ(guard.close(), RenderStatus::Ok);
    EXPECT_FALSE(guard.isOpen());
}

TEST(FrameSessionGuard, SecondOpenIsUsageErrorAndKeepsFirstSession)
{
    FrameSessionGuard guard;

    ASSERT_EQ(guard.open(), RenderStatus::Ok);
    EXPECT_EQ(guard.open(), RenderStatus::UsageError);
    EXPECT_TRUE(guard.isOpen());

    EXPECT_EQ(guard.close(), RenderStatus::Ok);
}

TEST(FrameSessionGuard, CloseWithoutOpenIsUsageError)
{
    FrameSessionGuard guard;
    EXPECT_EQ(guard.close(), RenderStatus::UsageError);
}

TEST(FrameSessionGuard, DeviceLossBlocksEveryLaterOpen)
{
    FrameSessionGuard guard;

    ASSERT_EQ(guard.open(), RenderStatus::Ok);
    guard.markDeviceLost();

    EXPECT_FALSE(guard.isOpen());
    EXPECT_TRUE(guard.deviceLost());
    EXPECT_EQ(guard.open(), RenderStatus::DeviceLost);
    EXPECT_EQ(guard.open(), RenderStatus::DeviceLost);

    guard.reset();
    EXPECT_EQ(guard.open(), RenderStatus::Ok);
}

TEST(Renderer, BeginFrameBeforeInitializeIsUsageError)
{
    DiagCapture diag;
    Renderer    renderer;

    FrameSession session;
    EXPECT_EQ(renderer.beginFrame(session), RenderStatus::UsageError);
    EXPECT_FALSE(renderer.isFrameOpen());
    EXPECT_EQ(diag.count(DiagCode::RendererNotInitialized), 1u);
}

TEST(Renderer, EndFrameWithoutSessionIsUsageError)
{
    DiagCapture diag;
    Renderer    renderer;

    FrameSession session;
    EXPECT_EQ(renderer.endFrame(session), RenderStatus::UsageError);
    EXPECT_GE(diag.count(DiagSeverity::Error), 1u);
}

TEST(Renderer, InitializeWithoutSurfaceIsUsageError)
{
    DiagCapture diag;
    Renderer    renderer;

    EXPECT_EQ(renderer.initialize(VK_NULL_HANDLE, VK_NULL_HANDLE), RenderStatus::UsageError);
    EXPECT_FALSE(renderer.hasInitialized());
    EXPECT_EQ(renderer.device(), nullptr);
}

TEST(Renderer, SettingsAreResolvedOnConstruction)
{
    RendererSettings s;
    s.canvasWidth      = 0;
    s.antialiasing     = false;
    s.msaaSampleCount  = 8;
    s.devicePixelRatio = -1.0;

    Renderer renderer(s);

    EXPECT_EQ(renderer.settings().canvasWidth, 1u);
    EXPECT_EQ(renderer.settings().msaaSampleCount, 1u);
    EXPECT_DOUBLE_EQ(renderer.settings().devicePixelRatio, 1.0);
    EXPECT_FALSE(renderer.id().isNull());
}

TEST(Renderer, SurfaceCallsForwardToSurfaceManager)
{
    DiagCapture diag;
    Renderer    renderer;

    renderer.setSize(300, 200);
    ASSERT_TRUE(renderer.setDevicePixelRatio(2.0));
    EXPECT_EQ(renderer.surface().physicalSize(), (SurfaceSize{600, 400}));

    renderer.containerResized(1000, 500);
    ASSERT_TRUE(renderer.trackContainerSize(10, true));
    EXPECT_EQ(renderer.surface().logicalSize(), (SurfaceSize{990, 490}));
}

TEST(FrameSessionGuard, OwnsOnlyTheSessionOfTheOpenFrame)
{
    FrameSessionGuard guard;

    ASSERT_EQ(guard.open(), RenderStatus::Ok);
    FrameSession first = {};
    first.serial       = guard.serial();

    EXPECT_TRUE(guard.owns(first));
    EXPECT_FALSE(guard.owns(FrameSession{}));

    ASSERT_EQ(guard.close(), RenderStatus::Ok);
    EXPECT_FALSE(guard.owns(first));

    // A session kept from an earlier frame does not match the next one.
    ASSERT_EQ(guard.open(), RenderStatus::Ok);
    EXPECT_NE(guard.serial(), first.serial);
    EXPECT_FALSE(guard.owns(first));
}

TEST(Renderer, ReportedDeviceLossFailsEveryFrameCallUntilShutdown)
{
    DiagCapture diag;
    Renderer    renderer;

    renderer.reportDeviceLost("lost in test");

    EXPECT_TRUE(renderer.isDeviceLost());
    EXPECT_EQ(diag.count(DiagCode::DeviceLost), 1u);

    FrameSession session;
    EXPECT_EQ(renderer.beginFrame(session), RenderStatus::DeviceLost);
    EXPECT_EQ(renderer.endFrame(session), RenderStatus::DeviceLost);
    EXPECT_EQ(renderer.beginFrame(session), RenderStatus::DeviceLost);
    EXPECT_FALSE(renderer.isFrameOpen());

    // Loss itself is reported once; the frame calls stay quiet.
    EXPECT_EQ(diag.count(DiagSeverity::Error), 1u);

    renderer.shutdown();
    EXPECT_FALSE(renderer.isDeviceLost());
    EXPECT_EQ(renderer.beginFrame(session), RenderStatus::UsageError);
    EXPECT_EQ(diag.count(DiagCode::RendererNotInitialized), 1u);
}

TEST(Renderer, SurfaceChangeIsReportedOnlyWhenTheSizeChanges)
{
    Renderer renderer;
    renderer.setSize(300, 200);

    DiagCapture diag;

    renderer.setSize(300, 200);
    EXPECT_EQ(diag.count(DiagCode::SurfaceResized), 0u);

    renderer.setSize(640, 480);
    EXPECT_EQ(diag.count(DiagCode::SurfaceResized), 1u);

    ASSERT_TRUE(renderer.setDevicePixelRatio(1.5));
    EXPECT_EQ(diag.count(DiagCode::SurfaceResized), 2u);

    // Nothing was built yet, so there is nothing to mark stale.
    EXPECT_EQ(renderer.targets().state(), TargetState::Uninitialized);
}

TEST(Renderer, ReleaseListenersNeedADevice)
{
    Renderer renderer;
    int      released = 0;

    const int id = renderer.addDeviceReleaseListener([&released](const VulkanContext&) { ++released; });
    EXPECT_GT(id, 0);
    EXPECT_EQ(renderer.addDeviceReleaseListener({}), 0);

    renderer.shutdown();
    EXPECT_EQ(released, 0);

    renderer.removeDeviceReleaseListener(id);
    renderer.shutdown();
    EXPECT_EQ(released, 0);
}
