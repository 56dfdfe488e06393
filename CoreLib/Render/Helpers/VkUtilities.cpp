//============================================================
// VkUtilities.cpp
//============================================================
#include "VkUtilities.hpp"

#include <string>

#include "Diagnostics.hpp"
#include "GpuBuffer.hpp"
#include "VulkanContext.hpp"

namespace vkutil
{
    VkClearColorValue toVkClearColor(const glm::vec4& color) noexcept
    {
        VkClearColorValue v = {};
        v.float32[0]        = color.r;
        v.float32[1]        = color.g;
        v.float32[2]        = color.b;
        v.float32[3]        = color.a;
        return v;
    }

    const char* resultName(VkResult r) noexcept
    {
        switch (r)
        {
            case VK_SUCCESS:
                return "VK_SUCCESS";
            case VK_NOT_READY:
                return "VK_NOT_READY";
            case VK_TIMEOUT:
                return "VK_TIMEOUT";
            case VK_ERROR_DEVICE_LOST:
                return "VK_ERROR_DEVICE_LOST";
            case VK_ERROR_OUT_OF_DEVICE_MEMORY:
                return "VK_ERROR_OUT_OF_DEVICE_MEMORY";
            case VK_ERROR_OUT_OF_HOST_MEMORY:
                return "VK_ERROR_OUT_OF_HOST_MEMORY";
            case VK_ERROR_INITIALIZATION_FAILED:
                return "VK_ERROR_INITIALIZATION_FAILED";
            case VK_ERROR_INCOMPATIBLE_DRIVER:
                return "VK_ERROR_INCOMPATIBLE_DRIVER";
            case VK_ERROR_LAYER_NOT_PRESENT:
                return "VK_ERROR_LAYER_NOT_PRESENT";
            case VK_ERROR_EXTENSION_NOT_PRESENT:
                return "VK_ERROR_EXTENSION_NOT_PRESENT";
            case VK_ERROR_FEATURE_NOT_PRESENT:
                return "VK_ERROR_FEATURE_NOT_PRESENT";
            case VK_ERROR_SURFACE_LOST_KHR:
                return "VK_ERROR_SURFACE_LOST_KHR";
            case VK_ERROR_OUT_OF_DATE_KHR:
                return "VK_ERROR_OUT_OF_DATE_KHR";
            case VK_SUBOPTIMAL_KHR:
                return "VK_SUBOPTIMAL_KHR";
            default:
                return "VK_UNDEFINED";
        }
    }

    void printVkResult(VkResult r, const char* where)
    {
        diag::error(std::string("Vulkan: ") + (where ? where : "?") + " failed.",
                    {std::string(resultName(r)) + " (" + std::to_string(int(r)) + ")"});
    }

    uint32_t findMemoryType(VkPhysicalDevice      phys,
                            uint32_t              typeBits,
                            VkMemoryPropertyFlags props) noexcept
    {
        VkPhysicalDeviceMemoryProperties mp = {};
        vkGetPhysicalDeviceMemoryProperties(phys, &mp);

        for (uint32_t i = 0; i < mp.memoryTypeCount; ++i)
        {
            const bool supported = (typeBits & (1u << i)) != 0u;
            const bool matches   = (mp.memoryTypes[i].propertyFlags & props) == props;

            if (supported && matches)
                return i;
        }

        return UINT32_MAX;
    }

    void setViewportAndScissor(VkCommandBuffer cmd, uint32_t width, uint32_t height)
    {
        VkViewport vp = {};
        vp.x          = 0.0f;
        vp.y          = 0.0f;
        vp.width      = static_cast<float>(width);
        vp.height     = static_cast<float>(height);
        vp.minDepth   = 0.0f;
        vp.maxDepth   = 1.0f;

        VkRect2D sc = {};
        sc.offset   = {0, 0};
        sc.extent   = {width, height};

        vkCmdSetViewport(cmd, 0, 1, &vp);
        vkCmdSetScissor(cmd, 0, 1, &sc);
    }

    // ============================================================================
    // Images
    // ============================================================================

    bool createImage2D(const VulkanContext&  ctx,
                       VkExtent2D            extent,
                       VkFormat              format,
                       VkImageUsageFlags     usage,
                       VkImageAspectFlags    aspect,
                       VkSampleCountFlagBits samples,
                       VkImage&              outImage,
                       VkDeviceMemory&       outMem,
                       VkImageView&          outView)
    {
        outImage = VK_NULL_HANDLE;
        outMem   = VK_NULL_HANDLE;
        outView  = VK_NULL_HANDLE;

        if (!ctx.device || extent.width == 0 || extent.height == 0)
            return false;

        VkImageCreateInfo ici = {};
        ici.sType             = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
        ici.imageType         = VK_IMAGE_TYPE_2D;
        ici.format            = format;
        ici.extent            = {extent.width, extent.height, 1};
        ici.mipLevels         = 1;
        ici.arrayLayers       = 1;
        ici.samples           = samples;
        ici.tiling            = VK_IMAGE_TILING_OPTIMAL;
        ici.usage             = usage;
        ici.sharingMode       = VK_SHARING_MODE_EXCLUSIVE;
        ici.initialLayout     = VK_IMAGE_LAYOUT_UNDEFINED;

        if (vkCreateImage(ctx.device, &ici, nullptr, &outImage) != VK_SUCCESS)
        {
            outImage = VK_NULL_HANDLE;
            return false;
        }

        VkMemoryRequirements mr = {};
        vkGetImageMemoryRequirements(ctx.device, outImage, &mr);

        // Transient attachments prefer lazily allocated memory where available.
        uint32_t memType = UINT32_MAX;
        if (usage & VK_IMAGE_USAGE_TRANSIENT_ATTACHMENT_BIT)
            memType = findMemoryType(ctx.physicalDevice,
                                     mr.memoryTypeBits,
                                     VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT | VK_MEMORY_PROPERTY_LAZILY_ALLOCATED_BIT);
        if (memType == UINT32_MAX)
            memType = findMemoryType(ctx.physicalDevice, mr.memoryTypeBits, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT);

        if (memType == UINT32_MAX)
        {
            destroyImage2D(ctx.device, outImage, outMem, outView);
            return false;
        }

        VkMemoryAllocateInfo mai = {};
        mai.sType                = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
        mai.allocationSize       = mr.size;
        mai.memoryTypeIndex      = memType;

        if (vkAllocateMemory(ctx.device, &mai, nullptr, &outMem) != VK_SUCCESS)
        {
            outMem = VK_NULL_HANDLE;
            destroyImage2D(ctx.device, outImage, outMem, outView);
            return false;
        }

        if (vkBindImageMemory(ctx.device, outImage, outMem, 0) != VK_SUCCESS)
        {
            destroyImage2D(ctx.device, outImage, outMem, outView);
            return false;
        }

        VkImageViewCreateInfo vci           = {};
        vci.sType                           = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        vci.image                           = outImage;
        vci.viewType                        = VK_IMAGE_VIEW_TYPE_2D;
        vci.format                          = format;
        vci.subresourceRange.aspectMask     = aspect;
        vci.subresourceRange.baseMipLevel   = 0;
        vci.subresourceRange.levelCount     = 1;
        vci.subresourceRange.baseArrayLayer = 0;
        vci.subresourceRange.layerCount     = 1;

        if (vkCreateImageView(ctx.device, &vci, nullptr, &outView) != VK_SUCCESS)
        {
            outView = VK_NULL_HANDLE;
            destroyImage2D(ctx.device, outImage, outMem, outView);
            return false;
        }

        return true;
    }

    void destroyImage2D(VkDevice device, VkImage& image, VkDeviceMemory& mem, VkImageView& view) noexcept
    {
        if (!device)
            return;

        if (view)
            vkDestroyImageView(device, view, nullptr);
        if (image)
            vkDestroyImage(device, image, nullptr);
        if (mem)
            vkFreeMemory(device, mem, nullptr);

        view  = VK_NULL_HANDLE;
        image = VK_NULL_HANDLE;
        mem   = VK_NULL_HANDLE;
    }

    // ============================================================================
    // One-time command buffer helpers
    // ============================================================================

    OneTimeCmd beginTransientCmd(const VulkanContext& ctx)
    {
        OneTimeCmd otc = {};
        otc.device     = ctx.device;
        otc.queue      = ctx.graphicsQueue;

        VkCommandPoolCreateInfo poolInfo = {};
        poolInfo.sType                   = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        poolInfo.flags                   = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
        poolInfo.queueFamilyIndex        = ctx.graphicsQueueFamilyIndex;

        if (vkCreateCommandPool(otc.device, &poolInfo, nullptr, &otc.pool) != VK_SUCCESS)
        {
            otc.pool = VK_NULL_HANDLE;
            return otc;
        }

        VkCommandBufferAllocateInfo allocInfo = {};
        allocInfo.sType                       = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        allocInfo.commandPool                 = otc.pool;
        allocInfo.level                       = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        allocInfo.commandBufferCount          = 1;

        VkCommandBufferBeginInfo beginInfo = {};
        beginInfo.sType                    = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        beginInfo.flags                    = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;

        if (vkAllocateCommandBuffers(otc.device, &allocInfo, &otc.cmd) != VK_SUCCESS ||
            vkBeginCommandBuffer(otc.cmd, &beginInfo) != VK_SUCCESS)
        {
            // Destroying the pool frees the command buffer with it.
            vkDestroyCommandPool(otc.device, otc.pool, nullptr);
            otc.cmd  = VK_NULL_HANDLE;
            otc.pool = VK_NULL_HANDLE;
        }

        return otc;
    }

    bool submitTransientCmd(const OneTimeCmd& otc) noexcept
    {
        if (!otc.device || !otc.pool || !otc.cmd || !otc.queue)
            return false;

        bool     ok    = false;
        VkFence  fence = VK_NULL_HANDLE;
        VkResult r     = vkEndCommandBuffer(otc.cmd);

        if (r == VK_SUCCESS)
        {
            VkFenceCreateInfo fci = {};
            fci.sType             = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
            r                     = vkCreateFence(otc.device, &fci, nullptr, &fence);
        }

        if (r == VK_SUCCESS)
        {
            VkSubmitInfo submitInfo       = {};
            submitInfo.sType              = VK_STRUCTURE_TYPE_SUBMIT_INFO;
            submitInfo.commandBufferCount = 1;
            submitInfo.pCommandBuffers    = &otc.cmd;

            r = vkQueueSubmit(otc.queue, 1, &submitInfo, fence);
            if (r == VK_SUCCESS)
                r = vkWaitForFences(otc.device, 1, &fence, VK_TRUE, UINT64_MAX);
        }

        if (r == VK_SUCCESS)
            ok = true;
        else
            printVkResult(r, "TransientCmd");

        if (fence)
            vkDestroyFence(otc.device, fence, nullptr);

        vkDestroyCommandPool(otc.device, otc.pool, nullptr);
        return ok;
    }

    bool TransientCmd(const VulkanContext& ctx, const std::function<void(VkCommandBuffer)>& record)
    {
        OneTimeCmd otc = beginTransientCmd(ctx);
        if (!otc.cmd)
            return false;

        record(otc.cmd);
        return submitTransientCmd(otc);
    }

    // ============================================================================
    // Device-local buffers
    // ============================================================================

    GpuBuffer createDeviceLocalBuffer(const VulkanContext& ctx,
                                      VkDeviceSize         size,
                                      VkBufferUsageFlags   usage,
                                      const void*          data)
    {
        GpuBuffer dst;
        if (!data || size == 0)
            return dst;

        if (!dst.create(ctx.device,
                        ctx.physicalDevice,
                        size,
                        usage | VK_BUFFER_USAGE_TRANSFER_DST_BIT,
                        VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT))
        {
            diag::error("vkutil::createDeviceLocalBuffer: Could not create the destination buffer.");
            return dst;
        }

        GpuBuffer staging;
        if (!staging.create(ctx.device,
                            ctx.physicalDevice,
                            size,
                            VK_BUFFER_USAGE_TRANSFER_SRC_BIT,
                            VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
                            /*persistentMap*/ true) ||
            !staging.upload(data, size))
        {
            diag::error("vkutil::createDeviceLocalBuffer: Staging upload failed.");
            dst.destroy();
            return dst;
        }

        const bool ok = TransientCmd(ctx, [&](VkCommandBuffer cmd) {
            VkBufferCopy copy = {};
            copy.size         = size;
            vkCmdCopyBuffer(cmd, staging.buffer(), dst.buffer(), 1, &copy);
        });

        if (!ok)
        {
            diag::error("vkutil::createDeviceLocalBuffer: Copy submit failed.");
            dst.destroy();
        }

        return dst;
    }

    // ============================================================================
    // Pipeline helper
    // ============================================================================

    VkPipeline createGraphicsPipeline(VkDevice device, const GraphicsPipelineDesc& d)
    {
        VkGraphicsPipelineCreateInfo ci = {};
        ci.sType                        = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
        ci.stageCount                   = d.stageCount;
        ci.pStages                      = d.stages;
        ci.pVertexInputState            = d.vertexInput;
        ci.pInputAssemblyState          = d.inputAssembly;
        ci.pViewportState               = d.viewport;
        ci.pRasterizationState          = d.rasterization;
        ci.pMultisampleState            = d.multisample;
        ci.pDepthStencilState           = d.depthStencil;
        ci.pColorBlendState             = d.colorBlend;
        ci.pDynamicState                = d.dynamicState;
        ci.layout                       = d.layout;
        ci.renderPass                   = d.renderPass;
        ci.subpass                      = d.subpass;
        ci.basePipelineHandle           = VK_NULL_HANDLE;
        ci.basePipelineIndex            = -1;

        VkPipeline     pipeline = VK_NULL_HANDLE;
        const VkResult r        = vkCreateGraphicsPipelines(device, VK_NULL_HANDLE, 1, &ci, nullptr, &pipeline);
        if (r != VK_SUCCESS)
        {
            printVkResult(r, "vkCreateGraphicsPipelines");
            return VK_NULL_HANDLE;
        }

        return pipeline;
    }

} // namespace vkutil
