#pragma once

#include <cstdint>
#include <vulkan/vulkan.h>

#include "RenderStatus.hpp"

/**
 * @brief Everything a renderable needs to record into the current frame.
 *
 * Valid between Renderer::beginFrame() and Renderer::endFrame() only; the
 * handles are owned by the renderer.
 */
struct FrameSession
{
    VkCommandBuffer cmd         = VK_NULL_HANDLE;
    VkRenderPass    renderPass  = VK_NULL_HANDLE;
    VkFramebuffer   framebuffer = VK_NULL_HANDLE;
    VkImageView     colorView   = VK_NULL_HANDLE; // presented image
    VkExtent2D      extent      = {};
    uint32_t        imageIndex  = 0;

    uint64_t serial     = 0; // FrameSessionGuard::serial() at beginFrame()
    uint64_t generation = 0; // device generation the frame records against
};

/**
 * @brief Open/close bookkeeping of the frame protocol.
 *
 * No Vulkan involved, so the begin/end rules can be tested without a device.
 * A rejected open() leaves the current session untouched. Every accepted
 * open() gets a new serial, so a stale or default FrameSession is told apart
 * from the one that is currently open.
 */
class FrameSessionGuard
{
public:
    [[nodiscard]] RenderStatus open() noexcept;
    [[nodiscard]] RenderStatus close() noexcept;

    /// Drops any open session; every later open() returns DeviceLost.
    void markDeviceLost() noexcept;

    /// Forgets loss and any open session (fresh device).
    void reset() noexcept;

    [[nodiscard]] bool isOpen() const noexcept
    {
        return m_open;
    }

    /// Serial of the current (or last) session.
    [[nodiscard]] uint64_t serial() const noexcept
    {
        return m_serial;
    }

    /// True when session is the one opened last and it is still open.
    [[nodiscard]] bool owns(const FrameSession& session) const noexcept
    {
        return m_open && session.serial == m_serial;
    }

    [[nodiscard]] bool deviceLost() const noexcept
    {
        return m_lost;
    }

private:
    uint64_t m_serial = 0;
    bool     m_open   = false;
    bool     m_lost   = false;
};
