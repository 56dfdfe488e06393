//============================================================
// RendererSettings.hpp
//============================================================
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <vulkan/vulkan.h>

#include "Color.hpp"

enum class PowerPreference : uint8_t
{
    LowPower        = 0,
    HighPerformance = 1
};

/// How the presented image is composited with whatever is behind the window.
enum class AlphaMode : uint8_t
{
    Opaque         = 0,
    PreMultiplied  = 1,
    PostMultiplied = 2,
    Inherit        = 3
};

/// Optional core features a caller can insist on. Anything missing on the
/// chosen adapter fails device acquisition.
enum class DeviceFeature : uint8_t
{
    SamplerAnisotropy,
    FillModeNonSolid,
    WideLines,
    GeometryShader,
    SampleRateShading,
    DepthClamp,
    IndependentBlend,
    MultiDrawIndirect,
    TextureCompressionBC
};

[[nodiscard]] const char* toString(DeviceFeature f) noexcept;

/// Minimum limits required from the adapter. Unset fields are not checked.
struct DeviceLimits
{
    std::optional<uint32_t> maxImageDimension2D      = {};
    std::optional<uint32_t> maxBoundDescriptorSets   = {};
    std::optional<uint32_t> maxPushConstantsSize     = {};
    std::optional<uint32_t> maxUniformBufferRange    = {};
    std::optional<uint32_t> maxVertexInputBindings   = {};
    std::optional<uint32_t> maxVertexInputAttributes = {};
    std::optional<uint32_t> maxColorAttachments      = {};
};

struct RendererSettings
{
    // --------------------------------------------------------
    // Surface (logical size, CSS-like pixels)
    // --------------------------------------------------------
    uint32_t canvasWidth  = 800;
    uint32_t canvasHeight = 600;

    // Explicit platform pixel ratio. Resolved by the caller (the viewer asks
    // the window once); core code never reads it from the environment.
    double devicePixelRatio = 1.0;

    // --------------------------------------------------------
    // Device request
    // --------------------------------------------------------
    PowerPreference            powerPreference  = PowerPreference::HighPerformance;
    std::vector<DeviceFeature> requiredFeatures = {};
    DeviceLimits               requiredLimits   = {};
    bool                       enableValidation = false;

    // --------------------------------------------------------
    // Presentation
    // --------------------------------------------------------
    AlphaMode         alphaMode   = AlphaMode::Opaque;
    VkFormat          colorFormat = VK_FORMAT_UNDEFINED; // surface preferred
    VkColorSpaceKHR   colorSpace  = VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
    VkImageUsageFlags usageFlags  = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;

    // --------------------------------------------------------
    // Targets
    // --------------------------------------------------------
    bool     antialiasing    = true;
    uint32_t msaaSampleCount = 4; // only 1, 2, 4 and 8 survive resolution
    VkFormat depthFormat     = VK_FORMAT_D32_SFLOAT;
    Color    clearColor      = {0.0f, 0.0f, 0.0f, 1.0f};
};

/**
 * @brief Sanitize settings once at the call boundary.
 *
 * - canvas sizes are at least 1
 * - antialiasing == false forces msaaSampleCount = 1
 * - non-positive or non-finite devicePixelRatio becomes 1
 * - usageFlags always include COLOR_ATTACHMENT
 *
 * The sample count itself is resolved later against the device
 * (see RenderTargetSet::applySampleCount).
 */
[[nodiscard]] RendererSettings resolveSettings(const RendererSettings& in);

/// Human-readable option dump used in the renderer's initialization log.
[[nodiscard]] std::vector<std::string> describeSettings(const RendererSettings& s);
