#include "Renderer.hpp"

#include <array>
#include <chrono>
#include <string>
#include <vector>

#include "VkDebugNames.hpp"
#include "VkUtilities.hpp"

namespace
{
    const VulkanContext kEmptyContext = {};
} // namespace

//==================================================================
// Init / Lifetime
//==================================================================

Renderer::Renderer(const RendererSettings& settings) :
    m_id{QUuid::createUuid()},
    m_settings{resolveSettings(settings)},
    m_surface{m_settings.canvasWidth, m_settings.canvasHeight, m_settings.devicePixelRatio}
{
    m_surface.setColorFormat(m_settings.colorFormat);

    // Size or ratio changes only mark the targets; beginFrame() rebuilds.
    m_surfaceListener = m_surface.addChangeListener([this](const SurfaceManager& sm) {
        m_targets.markStale();

        const SurfaceSize px = sm.physicalSize();
        diag::log("Renderer: Surface changed.",
                  {"Physical size: " + std::to_string(px.width) + "x" + std::to_string(px.height),
                   "Pixel ratio: " + std::to_string(sm.devicePixelRatio())},
                  DiagCode::SurfaceResized);
    });
}

Renderer::~Renderer() noexcept
{
    m_surface.removeChangeListener(m_surfaceListener);
    shutdown();
}

const VulkanContext& Renderer::context() const noexcept
{
    return m_device ? m_device->context() : kEmptyContext;
}

VkFormat Renderer::colorFormat() const noexcept
{
    return m_device ? m_device->swapchain().format() : VK_FORMAT_UNDEFINED;
}

RenderStatus Renderer::initialize(VkInstance instance, VkSurfaceKHR surface)
{
    if (m_initialized || m_device)
    {
        diag::error("Renderer: initialize() called on an initialized renderer.",
                    {"Call shutdown() first."},
                    DiagCode::DeviceUsage);
        return RenderStatus::UsageError;
    }

    if (!instance || !surface)
    {
        diag::error("Renderer: initialize() needs a Vulkan instance and a surface.",
                    {},
                    DiagCode::DeviceUsage);
        return RenderStatus::UsageError;
    }

    const auto t0 = std::chrono::steady_clock::now();

    m_guard.reset();
    m_device    = std::make_unique<DeviceContext>();
    m_vkSurface = surface;

    // ------------------------------------------------------------
    // Device
    // ------------------------------------------------------------
    DeviceRequest req    = {};
    req.powerPreference  = m_settings.powerPreference;
    req.requiredFeatures = m_settings.requiredFeatures;
    req.requiredLimits   = m_settings.requiredLimits;
    req.surface          = surface;
    req.enableValidation = m_settings.enableValidation;

    RenderStatus status = m_device->requestDevice(instance, req);
    if (!succeeded(status))
    {
        m_device.reset();
        m_vkSurface = VK_NULL_HANDLE;
        return status;
    }

    m_device->addDeviceLostListener([this](const std::string&) {
        m_guard.markDeviceLost();
    });

    const uint32_t              requested = m_settings.antialiasing ? m_settings.msaaSampleCount : 1u;
    const VkSampleCountFlagBits samples   = m_targets.applySampleCount(requested, m_device->supportedSampleCounts());
    const VkFormat              depth     = chooseDepthFormat(m_settings.depthFormat);

    // ------------------------------------------------------------
    // Surface + targets
    // ------------------------------------------------------------
    const SurfaceSize px = m_surface.physicalSize();
    m_requestedExtent    = {px.width, px.height};

    status = m_device->configureSurface(surface, surfaceConfig());
    if (status == RenderStatus::FrameSkipped)
    {
        diag::error("Renderer: The surface has no area.",
                    {"Initialize once the window is shown."},
                    DiagCode::DeviceUsage);
        status = RenderStatus::UsageError;
    }
    if (!succeeded(status))
    {
        shutdown();
        return status;
    }

    m_surface.setColorFormat(m_device->swapchain().format());
    m_device->setTargetFormats(m_device->swapchain().format(), depth, samples);

    if (!createFrameSlot())
    {
        diag::error("Renderer: Could not create the frame command buffer and sync objects.",
                    {},
                    DiagCode::TargetsAllocationFailed);
        shutdown();
        return RenderStatus::DeviceRequestError;
    }

    if (!m_targets.invalidate(m_device->context(),
                              m_device->swapchain().extent(),
                              m_device->swapchain().format(),
                              m_device->swapchain().views()))
    {
        shutdown();
        return RenderStatus::DeviceRequestError;
    }

    m_initialized = true;

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();

    std::vector<std::string> details = describeSettings(m_settings);
    details.push_back("Renderer id: " + m_id.toString(QUuid::WithoutBraces).toStdString());
    details.push_back("Effective samples: " + std::to_string(int(samples)));
    details.push_back("Swapchain images: " + std::to_string(m_device->swapchain().imageCount()));
    details.push_back("Initialized in " + std::to_string(ms) + " ms");

    diag::log("Renderer: Initialized.", details, DiagCode::RendererInitialized);
    return RenderStatus::Ok;
}

void Renderer::shutdown() noexcept
{
    if (m_device)
    {
        m_device->waitIdle();

        // Dependents free their objects while the device is still alive.
        const VulkanContext& ctx = m_device->context();
        if (ctx.device)
        {
            const std::vector<ReleaseListener> listeners = m_releaseListeners;
            for (const ReleaseListener& l : listeners)
                l.fn(ctx);
        }
    }

    m_targets.destroy();
    destroyFrameSlot();

    if (m_device)
    {
        m_device->destroy();
        m_device.reset();
    }

    m_vkSurface   = VK_NULL_HANDLE;
    m_initialized = false;
    m_guard.reset();
}

int Renderer::addDeviceReleaseListener(DeviceReleaseListener fn)
{
    if (!fn)
        return 0;

    const int id = m_nextReleaseId++;
    m_releaseListeners.push_back({id, std::move(fn)});
    return id;
}

void Renderer::removeDeviceReleaseListener(int id) noexcept
{
    std::erase_if(m_releaseListeners, [id](const ReleaseListener& l) { return l.id == id; });
}

void Renderer::reportDeviceLost(const std::string& reason)
{
    if (m_device)
        m_device->reportDeviceLost(reason);
    else
        diag::error("Renderer: The Vulkan device was lost.", {reason}, DiagCode::DeviceLost);

    m_guard.markDeviceLost();
}

VkFormat Renderer::chooseDepthFormat(VkFormat preferred) const noexcept
{
    const VkPhysicalDevice phys = m_device ? m_device->context().physicalDevice : VK_NULL_HANDLE;
    if (!phys)
        return preferred;

    const std::array<VkFormat, 4> candidates = {
        preferred,
        VK_FORMAT_D32_SFLOAT,
        VK_FORMAT_D24_UNORM_S8_UINT,
        VK_FORMAT_D16_UNORM,
    };

    for (VkFormat f : candidates)
    {
        VkFormatProperties props = {};
        vkGetPhysicalDeviceFormatProperties(phys, f, &props);
        if (props.optimalTilingFeatures & VK_FORMAT_FEATURE_DEPTH_STENCIL_ATTACHMENT_BIT)
            return f;
    }
    return preferred;
}

SurfaceConfig Renderer::surfaceConfig() const noexcept
{
    SurfaceConfig cfg = {};
    cfg.colorFormat   = m_settings.colorFormat;
    cfg.colorSpace    = m_settings.colorSpace;
    cfg.alphaMode     = m_settings.alphaMode;
    cfg.usage         = m_settings.usageFlags;
    cfg.extent        = m_requestedExtent;
    return cfg;
}

bool Renderer::createFrameSlot()
{
    const VulkanContext& ctx = m_device->context();

    VkCommandPoolCreateInfo cpci = {};
    cpci.sType                   = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    cpci.queueFamilyIndex        = ctx.graphicsQueueFamilyIndex;
    cpci.flags                   = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;

    if (vkCreateCommandPool(ctx.device, &cpci, nullptr, &m_cmdPool) != VK_SUCCESS)
        return false;

    vkutil::name(ctx.device, m_cmdPool, "Frame.CmdPool");

    VkCommandBufferAllocateInfo cbai = {};
    cbai.sType                       = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    cbai.commandPool                 = m_cmdPool;
    cbai.level                       = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    cbai.commandBufferCount          = 1;

    if (vkAllocateCommandBuffers(ctx.device, &cbai, &m_cmd) != VK_SUCCESS)
        return false;

    vkutil::name(ctx.device, m_cmd, "Frame.Cmd");

    return createSyncObjects();
}

bool Renderer::createSyncObjects()
{
    const VulkanContext& ctx = m_device->context();

    VkFenceCreateInfo fci = {};
    fci.sType             = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fci.flags             = VK_FENCE_CREATE_SIGNALED_BIT;

    if (vkCreateFence(ctx.device, &fci, nullptr, &m_fence) != VK_SUCCESS)
        return false;

    vkutil::name(ctx.device, m_fence, "Frame.Fence");

    VkSemaphoreCreateInfo sci = {};
    sci.sType                 = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    if (vkCreateSemaphore(ctx.device, &sci, nullptr, &m_imageAvailable) != VK_SUCCESS)
        return false;

    vkutil::name(ctx.device, m_imageAvailable, "Frame.SemImageAvailable");

    if (vkCreateSemaphore(ctx.device, &sci, nullptr, &m_renderFinished) != VK_SUCCESS)
        return false;

    vkutil::name(ctx.device, m_renderFinished, "Frame.SemRenderFinished");

    return true;
}

void Renderer::destroySyncObjects() noexcept
{
    const VkDevice device = m_device ? m_device->context().device : VK_NULL_HANDLE;

    if (device)
    {
        if (m_renderFinished)
            vkDestroySemaphore(device, m_renderFinished, nullptr);
        if (m_imageAvailable)
            vkDestroySemaphore(device, m_imageAvailable, nullptr);
        if (m_fence)
            vkDestroyFence(device, m_fence, nullptr);
    }

    m_renderFinished = VK_NULL_HANDLE;
    m_imageAvailable = VK_NULL_HANDLE;
    m_fence          = VK_NULL_HANDLE;
}

void Renderer::destroyFrameSlot() noexcept
{
    destroySyncObjects();

    const VkDevice device = m_device ? m_device->context().device : VK_NULL_HANDLE;
    if (device && m_cmdPool)
        vkDestroyCommandPool(device, m_cmdPool, nullptr); // frees m_cmd

    m_cmd     = VK_NULL_HANDLE;
    m_cmdPool = VK_NULL_HANDLE;
}

//==================================================================
// Surface forwarding
//==================================================================

void Renderer::setSize(int width, int height)
{
    m_surface.setSize(width, height);
}

bool Renderer::setDevicePixelRatio(double ratio)
{
    return m_surface.setDevicePixelRatio(ratio);
}

bool Renderer::trackContainerSize(int margin, bool autoTrack)
{
    return m_surface.trackContainerSize(margin, autoTrack);
}

void Renderer::containerResized(int width, int height)
{
    m_surface.containerResized(width, height);
}

//==================================================================
// Frame protocol
//==================================================================

RenderStatus Renderer::failFrame(RenderStatus status, const char* message, DiagCode code)
{
    if (status != RenderStatus::DeviceLost && status != RenderStatus::FrameSkipped)
        diag::error(message, {}, code);

    (void)m_guard.close();
    return status;
}

void Renderer::abandonFrame() noexcept
{
    const VulkanContext& ctx = m_device->context();

    // The acquire signalled m_imageAvailable and beginFrame() waits on m_fence:
    // an empty batch consumes the one and signals the other.
    const VkPipelineStageFlags stage = VK_PIPELINE_STAGE_ALL_COMMANDS_BIT;

    VkSubmitInfo si       = {};
    si.sType              = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    si.waitSemaphoreCount = 1;
    si.pWaitSemaphores    = &m_imageAvailable;
    si.pWaitDstStageMask  = &stage;

    bool drained = vkResetFences(ctx.device, 1, &m_fence) == VK_SUCCESS &&
                   vkQueueSubmit(ctx.graphicsQueue, 1, &si, m_fence) == VK_SUCCESS;

    if (!drained)
    {
        (void)vkDeviceWaitIdle(ctx.device);
        destroySyncObjects();
        drained = createSyncObjects();
    }

    if (!drained)
    {
        destroySyncObjects();
        m_initialized = false;
        diag::error("Renderer: Could not recreate the frame sync objects.",
                    {"Call shutdown() and initialize() again."},
                    DiagCode::TargetsAllocationFailed);
    }

    // The acquired image was never presented; a new swapchain gives it back.
    m_device->swapchain().markOutOfDate();
}

RenderStatus Renderer::recreateSwapchain()
{
    const SurfaceSize px = m_surface.physicalSize();
    m_requestedExtent    = {px.width, px.height};

    // Images may still be in use by the previous frame.
    const VkResult idle = vkDeviceWaitIdle(m_device->context().device);
    if (idle == VK_ERROR_DEVICE_LOST)
        return m_device->checkResult(idle, "vkDeviceWaitIdle");

    const RenderStatus status = m_device->configureSurface(m_vkSurface, surfaceConfig());
    if (status == RenderStatus::FrameSkipped)
    {
        // Retry every frame until the window has an area again.
        m_device->swapchain().markOutOfDate();
        return status;
    }
    if (!succeeded(status))
        return status;

    m_targets.markStale();
    return RenderStatus::Ok;
}

RenderStatus Renderer::ensureTargets()
{
    Swapchain& sc = m_device->swapchain();

    const SurfaceSize px      = m_surface.physicalSize();
    const bool        resized = px.width != m_requestedExtent.width || px.height != m_requestedExtent.height;

    if (!sc.valid() || sc.outOfDate() || resized)
    {
        const RenderStatus status = recreateSwapchain();
        if (!succeeded(status))
            return status;
    }

    if (!m_targets.needsRebuild(sc.extent(), m_device->context().generation))
        return RenderStatus::Ok;

    // The frame fence was waited on already; nothing references the old targets.
    if (!m_targets.invalidate(m_device->context(), sc.extent(), sc.format(), sc.views()))
        return RenderStatus::DeviceRequestError;

    return RenderStatus::Ok;
}

RenderStatus Renderer::acquireImage(uint32_t& outIndex)
{
    for (int attempt = 0; attempt < 2; ++attempt)
    {
        const VkResult res = m_device->swapchain().acquire(m_imageAvailable, outIndex);

        if (res == VK_SUCCESS || res == VK_SUBOPTIMAL_KHR)
            return RenderStatus::Ok;

        if (res == VK_ERROR_DEVICE_LOST)
            return m_device->checkResult(res, "vkAcquireNextImageKHR");

        if (res != VK_ERROR_OUT_OF_DATE_KHR || attempt == 1)
            break;

        const RenderStatus status = ensureTargets();
        if (!succeeded(status))
            return status;
    }

    return RenderStatus::UsageError;
}

RenderStatus Renderer::beginFrame(FrameSession& out)
{
    if (m_guard.deviceLost())
        return RenderStatus::DeviceLost;

    if (!m_initialized)
    {
        diag::error("Renderer: beginFrame() called before initialize().",
                    {},
                    DiagCode::RendererNotInitialized);
        return RenderStatus::UsageError;
    }

    const RenderStatus opened = m_guard.open();
    if (opened == RenderStatus::UsageError)
    {
        diag::error("Renderer: beginFrame() called while a frame is already open.",
                    {"Call endFrame() first."},
                    DiagCode::FrameUsage);
        return opened;
    }
    if (!succeeded(opened))
        return opened;

    const VkDevice device = m_device->context().device;

    // ------------------------------------------------------------
    // Previous frame done (also makes uniform writes safe)
    // ------------------------------------------------------------
    const VkResult waited = vkWaitForFences(device, 1, &m_fence, VK_TRUE, vkcfg::kFenceTimeoutNs);
    if (waited != VK_SUCCESS)
    {
        if (waited == VK_ERROR_DEVICE_LOST)
            return failFrame(m_device->checkResult(waited, "vkWaitForFences"), "", DiagCode::FrameAcquireFailed);

        return failFrame(RenderStatus::UsageError,
                         "Renderer: Timed out waiting for the previous frame.",
                         DiagCode::FrameAcquireFailed);
    }

    // ------------------------------------------------------------
    // Stale targets / swapchain
    // ------------------------------------------------------------
    RenderStatus status = ensureTargets();
    if (!succeeded(status))
        return failFrame(status, "Renderer: Could not rebuild the render targets.", DiagCode::TargetsAllocationFailed);

    uint32_t imageIndex = 0;
    status              = acquireImage(imageIndex);
    if (!succeeded(status))
        return failFrame(status, "Renderer: Could not acquire a swapchain image.", DiagCode::FrameAcquireFailed);

    // The fence stays signalled until endFrame() submits.
    vkResetCommandBuffer(m_cmd, 0);

    VkCommandBufferBeginInfo bi = {};
    bi.sType                    = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    bi.flags                    = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;

    status = m_device->checkResult(vkBeginCommandBuffer(m_cmd, &bi), "vkBeginCommandBuffer");
    if (!succeeded(status))
    {
        if (status != RenderStatus::DeviceLost)
            abandonFrame();
        return failFrame(status, "Renderer: vkBeginCommandBuffer failed.", DiagCode::FrameSubmitFailed);
    }

    m_imageIndex = imageIndex;

    const Swapchain&  sc     = m_device->swapchain();
    const VkExtent2D  extent = sc.extent();
    const VkImageView view   = sc.views()[imageIndex];

    // Matches attachment order: [color, depth, resolve?]
    std::array<VkClearValue, 3> clears = {};
    clears[0].color                    = vkutil::toVkClearColor(m_settings.clearColor.toVec4());
    clears[1].depthStencil             = {1.0f, 0};
    clears[2].color                    = clears[0].color;

    VkRenderPassBeginInfo rpbi = {};
    rpbi.sType                 = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    rpbi.renderPass            = m_targets.renderPass();
    rpbi.framebuffer           = m_targets.framebuffer(imageIndex);
    rpbi.renderArea.offset     = {0, 0};
    rpbi.renderArea.extent     = extent;
    rpbi.clearValueCount       = m_targets.isMultisampled() ? 3u : 2u;
    rpbi.pClearValues          = clears.data();

    vkCmdBeginRenderPass(m_cmd, &rpbi, VK_SUBPASS_CONTENTS_INLINE);
    vkutil::setViewportAndScissor(m_cmd, extent.width, extent.height);

    out             = {};
    out.cmd         = m_cmd;
    out.renderPass  = m_targets.renderPass();
    out.framebuffer = rpbi.framebuffer;
    out.colorView   = view;
    out.extent      = extent;
    out.imageIndex  = imageIndex;
    out.serial      = m_guard.serial();
    out.generation  = m_device->context().generation;

    return RenderStatus::Ok;
}

RenderStatus Renderer::endFrame(FrameSession& session)
{
    if (m_guard.deviceLost())
        return RenderStatus::DeviceLost;

    if (!m_guard.isOpen())
    {
        diag::error("Renderer: endFrame() called without an open frame.",
                    {"Call beginFrame() first."},
                    DiagCode::FrameUsage);
        return RenderStatus::UsageError;
    }

    // The open frame stays open; the caller may still end it with the right session.
    if (!m_guard.owns(session) || session.cmd != m_cmd)
    {
        diag::error("Renderer: endFrame() was given a session beginFrame() did not return.",
                    {"Session serial: " + std::to_string(session.serial),
                     "Open frame serial: " + std::to_string(m_guard.serial())},
                    DiagCode::FrameUsage);
        return RenderStatus::UsageError;
    }

    (void)m_guard.close();

    const VulkanContext& ctx = m_device->context();

    vkCmdEndRenderPass(m_cmd);

    RenderStatus status = m_device->checkResult(vkEndCommandBuffer(m_cmd), "vkEndCommandBuffer");
    if (!succeeded(status))
    {
        if (status != RenderStatus::DeviceLost)
        {
            diag::error("Renderer: vkEndCommandBuffer failed.", {}, DiagCode::FrameSubmitFailed);
            abandonFrame();
        }
        return status;
    }

    // Reset only now: every earlier exit leaves the fence signalled.
    status = m_device->checkResult(vkResetFences(ctx.device, 1, &m_fence), "vkResetFences");
    if (!succeeded(status))
    {
        if (status != RenderStatus::DeviceLost)
        {
            diag::error("Renderer: vkResetFences failed.", {}, DiagCode::FrameSubmitFailed);
            abandonFrame();
        }
        return status;
    }

    const VkPipelineStageFlags waitStage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;

    VkSubmitInfo si         = {};
    si.sType                = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    si.waitSemaphoreCount   = 1;
    si.pWaitSemaphores      = &m_imageAvailable;
    si.pWaitDstStageMask    = &waitStage;
    si.commandBufferCount   = 1;
    si.pCommandBuffers      = &m_cmd;
    si.signalSemaphoreCount = 1;
    si.pSignalSemaphores    = &m_renderFinished;

    status = m_device->checkResult(vkQueueSubmit(ctx.graphicsQueue, 1, &si, m_fence), "vkQueueSubmit");
    if (!succeeded(status))
    {
        if (status != RenderStatus::DeviceLost)
        {
            diag::error("Renderer: vkQueueSubmit failed.", {}, DiagCode::FrameSubmitFailed);
            abandonFrame();
        }
        return status;
    }

    const VkResult presented = m_device->swapchain().present(ctx.graphicsQueue, m_renderFinished, m_imageIndex);

    // Out-of-date/suboptimal only flag the swapchain; the next beginFrame() recreates it.
    if (presented != VK_SUCCESS && presented != VK_SUBOPTIMAL_KHR && presented != VK_ERROR_OUT_OF_DATE_KHR)
    {
        status = m_device->checkResult(presented, "vkQueuePresentKHR");
        if (status != RenderStatus::DeviceLost)
            diag::error("Renderer: vkQueuePresentKHR failed.", {}, DiagCode::FrameSubmitFailed);
        return status;
    }

    session = {};
    return RenderStatus::Ok;
}
