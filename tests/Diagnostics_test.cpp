#include <gtest/gtest.h>
#include <sstream>

#include "Diagnostics.hpp"
#include "TestSupport.hpp"

TEST(Diagnostics, SinkReceivesRecords)
{
    DiagCapture diag;

    diag::log("hello");
    diag::warn("careful", {"a", "b"}, DiagCode::SurfaceHighPixelRatio);
    diag::error("broken", {}, DiagCode::DeviceLost);

    ASSERT_EQ(diag.records().size(), 3u);
    EXPECT_EQ(diag.records()[0].severity, DiagSeverity::Info);
    EXPECT_EQ(diag.records()[0].code, DiagCode::None);
    EXPECT_EQ(diag.records()[1].details.size(), 2u);
    EXPECT_EQ(diag.records()[2].severity, DiagSeverity::Error);
    EXPECT_EQ(diag.count(DiagCode::DeviceLost), 1u);
}

TEST(Diagnostics, DefaultFormat)
{
    DiagRecord r = {};
    r.severity   = DiagSeverity::Warning;
    r.code       = DiagCode::TargetsSampleDowngraded;
    r.message    = "Falling back";
    r.details    = {"Requested: 16"};

    std::ostringstream os;
    diag::writeRecord(os, r);

    EXPECT_EQ(os.str(), "[WARNING](304): Falling back\n  > Requested: 16\n");
}

TEST(Diagnostics, CodesAreStable)
{
    EXPECT_EQ(uint16_t(DiagCode::SurfaceInvalidPixelRatio), 101);
    EXPECT_EQ(uint16_t(DiagCode::DeviceLost), 204);
    EXPECT_EQ(uint16_t(DiagCode::FrameUsage), 301);
    EXPECT_EQ(uint16_t(DiagCode::SceneNotPrepared), 403);
    EXPECT_EQ(uint16_t(DiagCode::SceneStaleDevice), 409);
    EXPECT_EQ(uint16_t(DiagCode::ThreadInvalidMaxDelta), 504);
}

TEST(RenderStatus, Names)
{
    EXPECT_STREQ(toString(RenderStatus::Ok), "Ok");
    EXPECT_STREQ(toString(RenderStatus::DeviceLost), "DeviceLost");
    EXPECT_TRUE(succeeded(RenderStatus::Ok));
    EXPECT_FALSE(succeeded(RenderStatus::UsageError));
}

TEST(RenderStatus, SkippedFrameIsNotSuccess)
{
    EXPECT_STREQ(toString(RenderStatus::FrameSkipped), "FrameSkipped");
    EXPECT_FALSE(succeeded(RenderStatus::FrameSkipped));
}
