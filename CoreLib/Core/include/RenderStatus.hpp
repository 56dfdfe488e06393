#pragma once

#include <cstdint>

/**
 * @brief Outcome of a renderer-level operation.
 *
 * Expected failures are returned, never thrown. Every value other than Ok and
 * FrameSkipped is paired with an error diagnostic carrying the specific
 * DiagCode. FrameSkipped is quiet: the surface has no area (minimized window)
 * and the caller simply tries again on the next tick.
 *
 * DeviceLost is terminal for the device generation that produced it: the
 * owner must build a fresh DeviceContext and re-initialize every dependent.
 */
enum class RenderStatus : uint8_t
{
    Ok = 0,
    CapabilityError,    ///< no usable Vulkan loader/instance on this machine
    AdapterUnavailable, ///< no physical device satisfies the hard requirements
    DeviceRequestError, ///< adapter rejected features/limits or device creation failed
    DeviceLost,         ///< VK_ERROR_DEVICE_LOST was observed
    UsageError,         ///< call made in the wrong state; the call was a no-op
    FrameSkipped        ///< zero-sized surface; nothing was recorded
};

[[nodiscard]] constexpr const char* toString(RenderStatus s) noexcept
{
    switch (s)
    {
        case RenderStatus::Ok:
            return "Ok";
        case RenderStatus::CapabilityError:
            return "CapabilityError";
        case RenderStatus::AdapterUnavailable:
            return "AdapterUnavailable";
        case RenderStatus::DeviceRequestError:
            return "DeviceRequestError";
        case RenderStatus::DeviceLost:
            return "DeviceLost";
        case RenderStatus::UsageError:
            return "UsageError";
        case RenderStatus::FrameSkipped:
            return "FrameSkipped";
    }
    return "Unknown";
}

[[nodiscard]] constexpr bool succeeded(RenderStatus s) noexcept
{
    return s == RenderStatus::Ok;
}
