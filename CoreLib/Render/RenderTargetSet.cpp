//============================================================
// RenderTargetSet.cpp
//============================================================
#include "RenderTargetSet.hpp"

#include <string>
#include <type_traits>

#include "Diagnostics.hpp"
#include "VkDebugNames.hpp"
#include "VkUtilities.hpp"
#include "VulkanContext.hpp"

namespace vkutil
{
    VkRenderPass createCompatibleRenderPass(VkDevice              device,
                                            VkFormat              colorFormat,
                                            VkFormat              depthFormat,
                                            VkSampleCountFlagBits samples)
    {
        if (!device || colorFormat == VK_FORMAT_UNDEFINED)
            return VK_NULL_HANDLE;

        const bool msaa = samples != VK_SAMPLE_COUNT_1_BIT;

        VkAttachmentDescription attachments[3] = {};

        // 0) Color (MSAA or the presented image itself)
        attachments[0].format         = colorFormat;
        attachments[0].samples        = samples;
        attachments[0].loadOp         = VK_ATTACHMENT_LOAD_OP_CLEAR;
        attachments[0].storeOp        = msaa ? VK_ATTACHMENT_STORE_OP_DONT_CARE : VK_ATTACHMENT_STORE_OP_STORE;
        attachments[0].stencilLoadOp  = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
        attachments[0].stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
        attachments[0].initialLayout  = VK_IMAGE_LAYOUT_UNDEFINED;
        attachments[0].finalLayout    = msaa ? VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL : VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

        // 1) Depth
        attachments[1].format         = depthFormat;
        attachments[1].samples        = samples;
        attachments[1].loadOp         = VK_ATTACHMENT_LOAD_OP_CLEAR;
        attachments[1].storeOp        = VK_ATTACHMENT_STORE_OP_DONT_CARE;
        attachments[1].stencilLoadOp  = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
        attachments[1].stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
        attachments[1].initialLayout  = VK_IMAGE_LAYOUT_UNDEFINED;
        attachments[1].finalLayout    = VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL;

        // 2) Resolve (presented image)
        attachments[2].format         = colorFormat;
        attachments[2].samples        = VK_SAMPLE_COUNT_1_BIT;
        attachments[2].loadOp         = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
        attachments[2].storeOp        = VK_ATTACHMENT_STORE_OP_STORE;
        attachments[2].stencilLoadOp  = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
        attachments[2].stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
        attachments[2].initialLayout  = VK_IMAGE_LAYOUT_UNDEFINED;
        attachments[2].finalLayout    = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

        VkAttachmentReference colorRef = {};
        colorRef.attachment            = 0;
        colorRef.layout                = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;

        VkAttachmentReference depthRef = {};
        depthRef.attachment            = 1;
        depthRef.layout                = VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL;

        VkAttachmentReference resolveRef = {};
        resolveRef.attachment            = 2;
        resolveRef.layout                = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;

        VkSubpassDescription sub    = {};
        sub.pipelineBindPoint       = VK_PIPELINE_BIND_POINT_GRAPHICS;
        sub.colorAttachmentCount    = 1;
        sub.pColorAttachments       = &colorRef;
        sub.pResolveAttachments     = msaa ? &resolveRef : nullptr;
        sub.pDepthStencilAttachment = &depthRef;

        // Acquire semaphore waits at color output; make the layout transition wait too.
        VkSubpassDependency dep = {};
        dep.srcSubpass          = VK_SUBPASS_EXTERNAL;
        dep.dstSubpass          = 0;
        dep.srcStageMask        = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT |
                           VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT |
                           VK_PIPELINE_STAGE_LATE_FRAGMENT_TESTS_BIT;
        dep.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT |
                           VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT;
        dep.srcAccessMask = VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;
        dep.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT |
                            VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;

        VkRenderPassCreateInfo rpci = {};
        rpci.sType                  = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
        rpci.attachmentCount        = msaa ? 3u : 2u;
        rpci.pAttachments           = attachments;
        rpci.subpassCount           = 1;
        rpci.pSubpasses             = &sub;
        rpci.dependencyCount        = 1;
        rpci.pDependencies          = &dep;

        VkRenderPass rp = VK_NULL_HANDLE;
        if (vkCreateRenderPass(device, &rpci, nullptr, &rp) != VK_SUCCESS)
            return VK_NULL_HANDLE;

        return rp;
    }
} // namespace vkutil

RenderTargetSet::~RenderTargetSet()
{
    destroy();
}

VkSampleCountFlagBits RenderTargetSet::resolveSampleCount(uint32_t requested) noexcept
{
    switch (requested)
    {
        case 1:
            return VK_SAMPLE_COUNT_1_BIT;
        case 2:
            return VK_SAMPLE_COUNT_2_BIT;
        case 4:
            return VK_SAMPLE_COUNT_4_BIT;
        case 8:
            return VK_SAMPLE_COUNT_8_BIT;
        default:
            return VK_SAMPLE_COUNT_1_BIT;
    }
}

VkSampleCountFlagBits RenderTargetSet::applySampleCount(uint32_t requested, VkSampleCountFlags supported)
{
    VkSampleCountFlagBits samples = resolveSampleCount(requested);

    if (!(supported & samples))
    {
        diag::warn("RenderTargetSet: Requested sample count is not supported by the device, falling back to 1.",
                   {"Requested: " + std::to_string(requested)},
                   DiagCode::TargetsSampleDowngraded);
        samples = VK_SAMPLE_COUNT_1_BIT;
    }

    if (samples != m_samples)
    {
        m_samples = samples;
        markStale();
    }

    return m_samples;
}

void RenderTargetSet::markStale() noexcept
{
    if (m_state == TargetState::Valid)
        m_state = TargetState::Stale;
}

bool RenderTargetSet::needsRebuild(VkExtent2D extent, uint64_t deviceGeneration) const noexcept
{
    if (m_state != TargetState::Valid)
        return true;

    return extent.width != m_extent.width ||
           extent.height != m_extent.height ||
           deviceGeneration != m_generation;
}

bool RenderTargetSet::allocateTexture(const VulkanContext& ctx,
                                      TextureSlot&         slot,
                                      VkFormat             format,
                                      VkImageUsageFlags    usage,
                                      VkImageAspectFlags   aspect,
                                      const char*          debugName)
{
    AllocatedTexture tex = {};
    tex.extent           = m_extent;
    tex.format           = format;
    tex.samples          = m_samples;

    if (!vkutil::createImage2D(ctx, m_extent, format, usage, aspect, m_samples, tex.image, tex.memory, tex.view))
        return false;

    vkutil::name(ctx.device, tex.image, debugName);
    vkutil::name(ctx.device, tex.view, debugName);
    vkutil::name(ctx.device, tex.memory, debugName);

    slot = tex;
    return true;
}

void RenderTargetSet::releaseTexture(TextureSlot& slot) noexcept
{
    std::visit(
        [this](auto& t) {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, AllocatedTexture>)
                vkutil::destroyImage2D(m_device, t.image, t.memory, t.view);
        },
        slot);

    slot = Unallocated{};
}

bool RenderTargetSet::invalidate(const VulkanContext&         ctx,
                                 VkExtent2D                   extent,
                                 VkFormat                     colorFormat,
                                 std::span<const VkImageView> swapchainViews)
{
    destroy();

    if (!ctx.device || extent.width == 0 || extent.height == 0 || swapchainViews.empty())
        return false;

    m_device     = ctx.device;
    m_generation = ctx.generation;
    m_extent     = extent;

    auto failed = [&](const char* what) {
        diag::error("RenderTargetSet: Could not allocate render targets.",
                    {what,
                     "Size: " + std::to_string(extent.width) + "x" + std::to_string(extent.height),
                     "Samples: " + std::to_string(int(m_samples))},
                    DiagCode::TargetsAllocationFailed);
        destroy();
        return false;
    };

    if (!allocateTexture(ctx,
                         m_depth,
                         ctx.depthFormat,
                         VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSIENT_ATTACHMENT_BIT,
                         VK_IMAGE_ASPECT_DEPTH_BIT,
                         "Targets.Depth"))
    {
        return failed("Depth image");
    }

    if (isMultisampled() &&
        !allocateTexture(ctx,
                         m_msaaColor,
                         colorFormat,
                         VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSIENT_ATTACHMENT_BIT,
                         VK_IMAGE_ASPECT_COLOR_BIT,
                         "Targets.MsaaColor"))
    {
        return failed("Multisampled color image");
    }

    m_renderPass = vkutil::createCompatibleRenderPass(m_device, colorFormat, ctx.depthFormat, m_samples);
    if (!m_renderPass)
        return failed("Render pass");

    vkutil::name(m_device, m_renderPass, "Targets.RenderPass");

    const VkImageView depthView = std::get<AllocatedTexture>(m_depth).view;

    m_framebuffers.resize(swapchainViews.size(), VK_NULL_HANDLE);
    for (size_t i = 0; i < swapchainViews.size(); ++i)
    {
        const ColorAttachment color = colorAttachment(swapchainViews[i]);

        // Attachments: [color, depth, resolve?]
        VkImageView    atts[3] = {color.view, depthView, color.resolveView};
        const uint32_t nAtts   = color.resolveView ? 3u : 2u;

        VkFramebufferCreateInfo fci = {};
        fci.sType                   = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
        fci.renderPass              = m_renderPass;
        fci.attachmentCount         = nAtts;
        fci.pAttachments            = atts;
        fci.width                   = extent.width;
        fci.height                  = extent.height;
        fci.layers                  = 1;

        if (vkCreateFramebuffer(m_device, &fci, nullptr, &m_framebuffers[i]) != VK_SUCCESS)
            return failed("Framebuffer");

        vkutil::name(m_device, m_framebuffers[i], "Targets.Framebuffer", int32_t(i));
    }

    m_state = TargetState::Valid;
    return true;
}

void RenderTargetSet::destroy() noexcept
{
    if (m_device)
    {
        for (VkFramebuffer fb : m_framebuffers)
        {
            if (fb)
                vkDestroyFramebuffer(m_device, fb, nullptr);
        }

        if (m_renderPass)
            vkDestroyRenderPass(m_device, m_renderPass, nullptr);
    }

    m_framebuffers.clear();
    m_renderPass = VK_NULL_HANDLE;

    releaseTexture(m_msaaColor);
    releaseTexture(m_depth);

    m_extent = {};
    m_state  = TargetState::Uninitialized;
}

ColorAttachment RenderTargetSet::colorAttachment(VkImageView resolveTarget) const noexcept
{
    if (isMultisampled())
    {
        if (const auto* msaa = std::get_if<AllocatedTexture>(&m_msaaColor))
            return {msaa->view, resolveTarget};
    }

    return {resolveTarget, VK_NULL_HANDLE};
}
