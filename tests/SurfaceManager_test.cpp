#include <gtest/gtest.h>
#include <limits>

#include "SurfaceManager.hpp"
#include "TestSupport.hpp"

TEST(SurfaceManager, PhysicalSizeIsFloorOfLogicalTimesRatio)
{
    EXPECT_EQ(SurfaceManager::computePhysicalSize(800, 600, 1.0), (SurfaceSize{800, 600}));
    EXPECT_EQ(SurfaceManager::computePhysicalSize(800, 600, 1.5), (SurfaceSize{1200, 900}));
    EXPECT_EQ(SurfaceManager::computePhysicalSize(333, 101, 1.25), (SurfaceSize{416, 126}));
}

TEST(SurfaceManager, PhysicalSizeIsNeverZero)
{
    EXPECT_EQ(SurfaceManager::computePhysicalSize(0, 0, 2.0), (SurfaceSize{1, 1}));

    SurfaceManager surface;
    surface.setSize(-10, 0);

    EXPECT_EQ(surface.logicalSize(), (SurfaceSize{0, 0}));
    EXPECT_EQ(surface.physicalSize(), (SurfaceSize{1, 1}));
}

TEST(SurfaceManager, PhysicalSizeSaturatesInsteadOfWrapping)
{
    constexpr uint32_t kMax = std::numeric_limits<uint32_t>::max();

    EXPECT_EQ(SurfaceManager::computePhysicalSize(kMax, 10, 3.0), (SurfaceSize{kMax, 30}));
    EXPECT_EQ(SurfaceManager::computePhysicalSize(10, kMax / 2, 4.0), (SurfaceSize{40, kMax}));

    DiagCapture    diag;
    SurfaceManager sm(100, 100, 1.0);
    ASSERT_TRUE(sm.setDevicePixelRatio(3.0));
    sm.setSize(std::numeric_limits<int>::max(), 1);
    EXPECT_EQ(sm.physicalSize(), (SurfaceSize{kMax, 3}));
}

TEST(SurfaceManager, ValidRatioRecomputesPhysicalSize)
{
    DiagCapture    diag;
    SurfaceManager surface(400, 300);

    EXPECT_TRUE(surface.setDevicePixelRatio(1.5));
    EXPECT_DOUBLE_EQ(surface.devicePixelRatio(), 1.5);
    EXPECT_EQ(surface.physicalSize(), (SurfaceSize{600, 450}));
    EXPECT_EQ(diag.count(DiagSeverity::Warning), 0u);
}

TEST(SurfaceManager, NonPositiveRatioFallsBackToDefault)
{
    DiagCapture    diag;
    SurfaceManager surface(400, 300, 1.0);

    ASSERT_TRUE(surface.setDevicePixelRatio(1.5));
    EXPECT_FALSE(surface.setDevicePixelRatio(0.0));

    EXPECT_DOUBLE_EQ(surface.devicePixelRatio(), 1.0);
    EXPECT_EQ(surface.physicalSize(), (SurfaceSize{400, 300}));
    EXPECT_EQ(diag.count(DiagCode::SurfaceInvalidPixelRatio), 1u);

    EXPECT_FALSE(surface.setDevicePixelRatio(-3.0));
    EXPECT_EQ(diag.count(DiagCode::SurfaceInvalidPixelRatio), 2u);
}

TEST(SurfaceManager, HighRatiosRaiseAdvisories)
{
    DiagCapture    diag;
    SurfaceManager surface(10, 10);

    EXPECT_TRUE(surface.setDevicePixelRatio(2.0));
    EXPECT_EQ(diag.count(DiagCode::SurfaceHighPixelRatio), 1u);

    diag.clear();
    EXPECT_TRUE(surface.setDevicePixelRatio(12.0));
    EXPECT_EQ(diag.count(DiagCode::SurfaceHighPixelRatio), 2u);
    EXPECT_EQ(surface.physicalSize(), (SurfaceSize{120, 120}));
}

TEST(SurfaceManager, RatioIsClampedToSupportedRange)
{
    DiagCapture diag;

    EXPECT_DOUBLE_EQ(SurfaceManager::clampPixelRatio(0.5), 1.0);
    EXPECT_DOUBLE_EQ(SurfaceManager::clampPixelRatio(250.0), 100.0);
    EXPECT_DOUBLE_EQ(SurfaceManager::clampPixelRatio(3.0), 3.0);
}

TEST(SurfaceManager, ListenersFireOnlyWhenSomethingChanged)
{
    SurfaceManager surface(100, 100);

    int calls = 0;
    surface.addChangeListener([&](const SurfaceManager&) { ++calls; });

    surface.setSize(100, 100);
    EXPECT_EQ(calls, 0);

    surface.setSize(200, 100);
    EXPECT_EQ(calls, 1);

    EXPECT_TRUE(surface.setDevicePixelRatio(1.5));
    EXPECT_EQ(calls, 2);
}

TEST(SurfaceManager, RemovedListenerIsNotCalled)
{
    SurfaceManager surface(100, 100);

    int       calls = 0;
    const int id    = surface.addChangeListener([&](const SurfaceManager&) { ++calls; });
    surface.removeChangeListener(id);

    surface.setSize(50, 50);
    EXPECT_EQ(calls, 0);
}

TEST(SurfaceManager, TrackingBeforeContainerIsKnownFails)
{
    DiagCapture    diag;
    SurfaceManager surface;

    EXPECT_FALSE(surface.trackContainerSize(0, true));
    EXPECT_EQ(diag.count(DiagCode::SurfaceContainerUnknown), 1u);
    EXPECT_FALSE(surface.isTrackingContainer());
}

TEST(SurfaceManager, TracksContainerMinusMargin)
{
    SurfaceManager surface;
    surface.containerResized(1024, 768);

    ASSERT_TRUE(surface.trackContainerSize(24, true));
    EXPECT_EQ(surface.logicalSize(), (SurfaceSize{1000, 744}));

    surface.containerResized(500, 400);
    EXPECT_EQ(surface.logicalSize(), (SurfaceSize{476, 376}));

    surface.stopTrackingContainer();
    surface.containerResized(900, 900);
    EXPECT_EQ(surface.logicalSize(), (SurfaceSize{476, 376}));
}

TEST(SurfaceManager, OneShotContainerSizing)
{
    SurfaceManager surface;
    surface.containerResized(640, 480);

    ASSERT_TRUE(surface.trackContainerSize(0, false));
    EXPECT_EQ(surface.logicalSize(), (SurfaceSize{640, 480}));

    surface.containerResized(320, 240);
    EXPECT_EQ(surface.logicalSize(), (SurfaceSize{640, 480}));
}
