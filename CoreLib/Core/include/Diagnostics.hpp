#pragma once

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

/**
 * @brief Severity of a diagnostic record.
 */
enum class DiagSeverity : uint8_t
{
    Info    = 0,
    Warning = 1,
    Error   = 2
};

/**
 * @brief Numeric diagnostic codes, grouped by component.
 *
 * 1xx surface, 2xx device, 3xx frame/targets, 4xx scene/camera/renderables,
 * 5xx scheduler. Values are stable; never renumber.
 */
enum class DiagCode : uint16_t
{
    None = 0,

    // Surface
    SurfaceInvalidPixelRatio = 101,
    SurfaceHighPixelRatio    = 102,
    SurfaceContainerUnknown  = 103,
    SurfaceResized           = 104,

    // Device
    DeviceCapabilityMissing = 201,
    DeviceNoAdapter         = 202,
    DeviceRequestRejected   = 203,
    DeviceLost              = 204,
    DeviceUncapturedError   = 205,
    DeviceUsage             = 206,
    DeviceSelected          = 207,
    SurfaceConfigFallback   = 208,

    // Frame + render targets
    FrameUsage               = 301,
    FrameAcquireFailed       = 302,
    TargetsAllocationFailed  = 303,
    TargetsSampleDowngraded  = 304,
    FrameSubmitFailed        = 305,
    RendererInitialized      = 306,
    RendererNotInitialized   = 307,

    // Scene / camera / renderables
    SceneRendererNotInitialized = 401,
    SceneRenderableInitFailed   = 402,
    SceneNotPrepared            = 403,
    ScenePrepared               = 404,
    CameraUniformBufferMissing  = 405,
    CameraBindingFailed         = 406,
    RenderableNotInitialized    = 407,
    RenderablePipelineFailed    = 408,
    SceneStaleDevice            = 409,

    // Scheduler
    ThreadAlreadyActive         = 501,
    ThreadAlreadyInactive       = 502,
    ThreadInvalidSimulationRate = 503,
    ThreadInvalidMaxDelta       = 504,
    ThreadInvalidInterval       = 505
};

struct DiagRecord
{
    DiagSeverity             severity = DiagSeverity::Info;
    DiagCode                 code     = DiagCode::None;
    std::string              message  = {};
    std::vector<std::string> details  = {};
};

/**
 * @brief Process-wide diagnostics output.
 *
 * Everything in the renderer reports through here instead of writing to
 * std::cerr directly, so the viewer and the tests can intercept records.
 * Records are pure output: nothing in the renderer inspects what it emitted.
 *
 * Not thread-safe (the renderer runs on one timeline).
 */
namespace diag
{
    using Sink = std::function<void(const DiagRecord&)>;

    /// Replace the active sink. An empty function restores the default.
    void setSink(Sink sink);
    void resetSink();

    void emit(const DiagRecord& record);

    void log(std::string message, std::vector<std::string> details = {}, DiagCode code = DiagCode::None);
    void warn(std::string message, std::vector<std::string> details = {}, DiagCode code = DiagCode::None);
    void error(std::string message, std::vector<std::string> details = {}, DiagCode code = DiagCode::None);

    [[nodiscard]] const char* severityTag(DiagSeverity severity) noexcept;

    /// Default formatting: "[WARNING]: message" followed by "  > detail" lines.
    void writeRecord(std::ostream& os, const DiagRecord& record);

} // namespace diag
