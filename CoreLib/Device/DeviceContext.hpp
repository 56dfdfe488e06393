#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include <vulkan/vulkan.h>

#include "RenderStatus.hpp"
#include "RendererSettings.hpp"
#include "Swapchain.hpp"
#include "VulkanContext.hpp"

/// What the caller asks from the adapter/device.
struct DeviceRequest
{
    PowerPreference            powerPreference  = PowerPreference::HighPerformance;
    std::vector<DeviceFeature> requiredFeatures = {};
    DeviceLimits               requiredLimits   = {};

    // When set, the adapter must be able to present to it (queue + swapchain ext).
    VkSurfaceKHR surface = VK_NULL_HANDLE;

    // Installs the debug messenger. For a caller-provided instance, the caller
    // must have enabled VK_EXT_debug_utils itself.
    bool enableValidation = false;
};

enum class DeviceState : uint8_t
{
    Idle,  ///< nothing requested yet
    Ready, ///< device acquired
    Lost,  ///< VK_ERROR_DEVICE_LOST seen; terminal for this context
    Failed ///< acquisition failed; terminal for this context
};

[[nodiscard]] const char* toString(DeviceState s) noexcept;

/**
 * @brief Adapter selection, logical device and queue for one renderer.
 *
 * requestDevice() is synchronous and only valid while Idle. On success the
 * context is Ready and context() describes the device. A DeviceLost result
 * anywhere moves it to Lost and fires the device-lost listeners once.
 *
 * The presentable surface is configured through configureSurface() and the
 * resulting swapchain is owned here so it is torn down before the device.
 */
class DeviceContext
{
public:
    using DeviceLostListener = std::function<void(const std::string& reason)>;

    DeviceContext() = default;
    ~DeviceContext();

    DeviceContext(const DeviceContext&)            = delete;
    DeviceContext& operator=(const DeviceContext&) = delete;

    /**
     * @brief Select an adapter and create the logical device.
     *
     * @param instance Caller-owned instance (e.g. from QVulkanInstance). When
     *                 VK_NULL_HANDLE a headless instance is created and owned.
     */
    [[nodiscard]] RenderStatus requestDevice(VkInstance instance, const DeviceRequest& request);

    /// Creates or reconfigures the swapchain for surface. Requires Ready.
    /// FrameSkipped (no diagnostic) while the surface has no area.
    [[nodiscard]] RenderStatus configureSurface(VkSurfaceKHR surface, const SurfaceConfig& config);

    void waitIdle() noexcept;

    /// Waits idle, then releases swapchain, device and any owned instance.
    void destroy() noexcept;

    /**
     * @brief Central VkResult check for device-level calls.
     *
     * VK_ERROR_DEVICE_LOST marks the context Lost (listeners fire once) and
     * returns DeviceLost. Any other failure returns DeviceRequestError.
     */
    RenderStatus checkResult(VkResult result, const char* where);

    /// Marks the context Lost and notifies listeners if it was not already.
    void reportDeviceLost(const std::string& reason);

    int  addDeviceLostListener(DeviceLostListener fn);
    void removeDeviceLostListener(int id) noexcept;

    /// Records the resolved render-target parameters for dependents.
    void setTargetFormats(VkFormat color, VkFormat depth, VkSampleCountFlagBits samples) noexcept;

    [[nodiscard]] DeviceState state() const noexcept
    {
        return m_state;
    }

    [[nodiscard]] bool isReady() const noexcept
    {
        return m_state == DeviceState::Ready;
    }

    [[nodiscard]] bool isLost() const noexcept
    {
        return m_state == DeviceState::Lost;
    }

    [[nodiscard]] const VulkanContext& context() const noexcept
    {
        return m_ctx;
    }

    [[nodiscard]] Swapchain& swapchain() noexcept
    {
        return m_swapchain;
    }

    [[nodiscard]] const Swapchain& swapchain() const noexcept
    {
        return m_swapchain;
    }

    [[nodiscard]] const VkPhysicalDeviceFeatures& enabledFeatures() const noexcept
    {
        return m_enabledFeatures;
    }

    /// Sample counts usable for both color and depth targets.
    [[nodiscard]] VkSampleCountFlags supportedSampleCounts() const noexcept;

    [[nodiscard]] const std::string& lostReason() const noexcept
    {
        return m_lostReason;
    }

private:
    RenderStatus fail(RenderStatus status);
    bool         createHeadlessInstance(bool enableValidation);
    void         installDebugMessenger();

private:
    DeviceState m_state = DeviceState::Idle;

    VulkanContext            m_ctx             = {};
    VkPhysicalDeviceFeatures m_enabledFeatures = {};
    Swapchain                m_swapchain;

    bool                     m_ownsInstance = false;
    VkDebugUtilsMessengerEXT m_messenger    = VK_NULL_HANDLE;

    std::string m_lostReason;

    struct Listener
    {
        int                id = 0;
        DeviceLostListener fn;
    };
    std::vector<Listener> m_lostListeners;
    int                   m_nextListenerId = 1;
};

namespace vkutil
{
    // ------------------------------------------------------------
    // Adapter selection policy (pure)
    // ------------------------------------------------------------

    /// Heuristic score, higher wins. LowPower swaps the discrete/integrated weights.
    [[nodiscard]] int scoreAdapter(const VkPhysicalDeviceProperties& props, PowerPreference preference) noexcept;

    [[nodiscard]] bool featureSupported(const VkPhysicalDeviceFeatures& feats, DeviceFeature f) noexcept;
    void               enableFeature(VkPhysicalDeviceFeatures& feats, DeviceFeature f) noexcept;

    [[nodiscard]] std::vector<DeviceFeature> missingFeatures(const VkPhysicalDeviceFeatures&   feats,
                                                             const std::vector<DeviceFeature>& required);

    /// One line per unmet limit ("maxPushConstantsSize: required 256, supported 128").
    [[nodiscard]] std::vector<std::string> unmetLimits(const VkPhysicalDeviceLimits& limits,
                                                       const DeviceLimits&           required);

    [[nodiscard]] const char* deviceTypeName(VkPhysicalDeviceType t) noexcept;
    [[nodiscard]] std::string versionString(uint32_t v);
} // namespace vkutil
