//============================================================
// Renderer.hpp
//============================================================
#pragma once

#include <QUuid>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <vulkan/vulkan.h>

#include "DeviceContext.hpp"
#include "Diagnostics.hpp"
#include "FrameSession.hpp"
#include "RenderStatus.hpp"
#include "RenderTargetSet.hpp"
#include "RendererSettings.hpp"
#include "SurfaceManager.hpp"
#include "VulkanContext.hpp"

/**
 * @brief Vulkan renderer facade for one presentable surface.
 *
 * Lifetime overview:
 *
 *  - Construction: settings are resolved, the surface size is known, nothing
 *    touches Vulkan yet.
 *
 *  - initialize() → shutdown():
 *      * DeviceContext (adapter, device, queue, swapchain).
 *      * RenderTargetSet (depth, MSAA color, render pass, framebuffers).
 *      * Frame slot (command pool + buffer, fence, semaphores).
 *
 *  - beginFrame() → endFrame():
 *      * One open FrameSession at a time, one frame in flight. The fence
 *        wait in beginFrame() makes host writes to uniform buffers safe
 *        while a session is open.
 *
 * Surface changes (size, pixel ratio) only mark the targets stale; the
 * rebuild happens at the next beginFrame().
 *
 * After device loss every frame call returns DeviceLost. Recovery means
 * shutdown() and initialize() again (a fresh DeviceContext). Anything that
 * created Vulkan objects on the device registers a release listener; those
 * run inside shutdown() while the device still exists.
 */
class Renderer
{
public:
    using DeviceReleaseListener = std::function<void(const VulkanContext& ctx)>;

    explicit Renderer(const RendererSettings& settings = {});
    ~Renderer() noexcept;

    Renderer(const Renderer&)            = delete;
    Renderer(Renderer&&)                 = delete;
    Renderer& operator=(const Renderer&) = delete;
    Renderer& operator=(Renderer&&)      = delete;

public:
    // ============================================================
    // Lifetime
    // ============================================================

    /**
     * @brief Acquire a device for surface and build every render resource.
     *
     * @param instance Instance the surface belongs to (VK_NULL_HANDLE is not
     *                 valid here: a surface always comes with its instance).
     */
    [[nodiscard]] RenderStatus initialize(VkInstance instance, VkSurfaceKHR surface);

    [[nodiscard]] bool hasInitialized() const noexcept
    {
        return m_initialized;
    }

    /// Releases everything created by initialize(). The surface itself is not ours.
    /// Release listeners run first, after the device went idle.
    void shutdown() noexcept;

    int  addDeviceReleaseListener(DeviceReleaseListener fn);
    void removeDeviceReleaseListener(int id) noexcept;

    /// Treats the device as lost. Without a device only the frame guard is marked.
    void reportDeviceLost(const std::string& reason);

    // ============================================================
    // Surface (forwarded to SurfaceManager)
    // ============================================================
    void setSize(int width, int height);
    bool setDevicePixelRatio(double ratio);
    bool trackContainerSize(int margin, bool autoTrack);
    void containerResized(int width, int height);

    // ============================================================
    // Frame protocol
    // ============================================================
    [[nodiscard]] RenderStatus beginFrame(FrameSession& out);
    RenderStatus               endFrame(FrameSession& session);

    [[nodiscard]] bool isFrameOpen() const noexcept
    {
        return m_guard.isOpen();
    }

    // ============================================================
    // Accessors
    // ============================================================
    [[nodiscard]] const QUuid& id() const noexcept
    {
        return m_id;
    }

    [[nodiscard]] const RendererSettings& settings() const noexcept
    {
        return m_settings;
    }

    /// Empty context before initialize().
    [[nodiscard]] const VulkanContext& context() const noexcept;

    [[nodiscard]] VkSampleCountFlagBits sampleCount() const noexcept
    {
        return m_targets.sampleCount();
    }

    [[nodiscard]] VkFormat colorFormat() const noexcept;

    [[nodiscard]] SurfaceManager& surface() noexcept
    {
        return m_surface;
    }

    [[nodiscard]] const SurfaceManager& surface() const noexcept
    {
        return m_surface;
    }

    /// nullptr before initialize().
    [[nodiscard]] DeviceContext* device() noexcept
    {
        return m_device.get();
    }

    [[nodiscard]] const RenderTargetSet& targets() const noexcept
    {
        return m_targets;
    }

    [[nodiscard]] bool isDeviceLost() const noexcept
    {
        return m_guard.deviceLost();
    }

private:
    bool          createFrameSlot();
    void          destroyFrameSlot() noexcept;
    bool          createSyncObjects();
    void          destroySyncObjects() noexcept;
    void          abandonFrame() noexcept;
    VkFormat      chooseDepthFormat(VkFormat preferred) const noexcept;
    SurfaceConfig surfaceConfig() const noexcept;
    RenderStatus  ensureTargets();
    RenderStatus  recreateSwapchain();
    RenderStatus  acquireImage(uint32_t& outIndex);
    RenderStatus  failFrame(RenderStatus status, const char* message, DiagCode code);

private:
    QUuid            m_id;
    RendererSettings m_settings;
    SurfaceManager   m_surface;
    RenderTargetSet  m_targets;

    // Recreated by every initialize(); a lost context is never reused.
    std::unique_ptr<DeviceContext> m_device;

    FrameSessionGuard m_guard;

    VkSurfaceKHR m_vkSurface       = VK_NULL_HANDLE;
    VkExtent2D   m_requestedExtent = {};

    // Single frame slot
    VkCommandPool   m_cmdPool        = VK_NULL_HANDLE;
    VkCommandBuffer m_cmd            = VK_NULL_HANDLE;
    VkFence         m_fence          = VK_NULL_HANDLE;
    VkSemaphore     m_imageAvailable = VK_NULL_HANDLE;
    VkSemaphore     m_renderFinished = VK_NULL_HANDLE;
    uint32_t        m_imageIndex     = 0;

    struct ReleaseListener
    {
        int                   id = 0;
        DeviceReleaseListener fn;
    };
    std::vector<ReleaseListener> m_releaseListeners;
    int                          m_nextReleaseId = 1;

    int  m_surfaceListener = 0;
    bool m_initialized     = false;
};
