#pragma once

#include <cstdint>
#include <functional>
#include <glm/vec4.hpp>
#include <vulkan/vulkan.h>

struct VulkanContext;
class GpuBuffer;

namespace vkutil
{
    // ============================================================================
    // Common helpers
    // ============================================================================

    VkClearColorValue toVkClearColor(const glm::vec4& color) noexcept;

    [[nodiscard]] const char* resultName(VkResult r) noexcept;

    void printVkResult(VkResult r, const char* where);

    /// UINT32_MAX when no memory type satisfies typeBits + props.
    uint32_t findMemoryType(VkPhysicalDevice phys, uint32_t typeBits, VkMemoryPropertyFlags props) noexcept;

    void setViewportAndScissor(VkCommandBuffer cmd, uint32_t width, uint32_t height);

    // ============================================================================
    // Images
    // ============================================================================

    /**
     * @brief Device-local 2D image with bound memory and a full-resource view.
     *
     * On failure everything that was created is destroyed again and the
     * out-handles are VK_NULL_HANDLE.
     */
    bool createImage2D(const VulkanContext&  ctx,
                       VkExtent2D            extent,
                       VkFormat              format,
                       VkImageUsageFlags     usage,
                       VkImageAspectFlags    aspect,
                       VkSampleCountFlagBits samples,
                       VkImage&              outImage,
                       VkDeviceMemory&       outMem,
                       VkImageView&          outView);

    void destroyImage2D(VkDevice device, VkImage& image, VkDeviceMemory& mem, VkImageView& view) noexcept;

    // ============================================================================
    // One-time Command Buffer Utilities
    // ============================================================================

    /**
     * @brief Resources for a single one-shot command recording.
     */
    struct OneTimeCmd
    {
        VkDevice        device = VK_NULL_HANDLE;
        VkCommandPool   pool   = VK_NULL_HANDLE; ///< Transient pool for this command buffer.
        VkCommandBuffer cmd    = VK_NULL_HANDLE;
        VkQueue         queue  = VK_NULL_HANDLE;
    };

    /**
     * @brief Allocate & begin a transient, one-time submit command buffer.
     *
     * @warning Must be finished with `submitTransientCmd()` to submit & clean up.
     */
    OneTimeCmd beginTransientCmd(const VulkanContext& ctx);

    /**
     * @brief End recording, submit, wait for completion, then free the pool.
     *
     * The pool is released on every path, including failures.
     */
    bool submitTransientCmd(const OneTimeCmd& otc) noexcept;

    /**
     * @brief One-call wrapper: begin → record(cmd) → submit + wait.
     *
     * @code
     * TransientCmd(ctx, [&](VkCommandBuffer cmd) {
     *     vkCmdCopyBuffer(cmd, src, dst, 1, &region);
     * });
     * @endcode
     */
    bool TransientCmd(const VulkanContext& ctx, const std::function<void(VkCommandBuffer)>& record);

    // ============================================================================
    // Device-local buffer upload (staged copy)
    // ============================================================================

    /**
     * @brief Create a device-local buffer and fill it through a staging copy.
     *
     * `VK_BUFFER_USAGE_TRANSFER_DST_BIT` is added to @p usage.
     * Returns an invalid GpuBuffer on failure.
     */
    GpuBuffer createDeviceLocalBuffer(const VulkanContext& ctx,
                                      VkDeviceSize         size,
                                      VkBufferUsageFlags   usage,
                                      const void*          data);

    // ============================================================================
    // Graphics pipeline
    // ============================================================================

    /// Lightweight descriptor for a single graphics pipeline.
    /// All pointers are non-owning; they must live at least until
    /// vkCreateGraphicsPipelines returns.
    struct GraphicsPipelineDesc
    {
        VkRenderPass     renderPass = VK_NULL_HANDLE;
        uint32_t         subpass    = 0;
        VkPipelineLayout layout     = VK_NULL_HANDLE;

        const VkPipelineShaderStageCreateInfo*        stages        = nullptr;
        uint32_t                                      stageCount    = 0;
        const VkPipelineVertexInputStateCreateInfo*   vertexInput   = nullptr;
        const VkPipelineInputAssemblyStateCreateInfo* inputAssembly = nullptr;
        const VkPipelineViewportStateCreateInfo*      viewport      = nullptr;
        const VkPipelineRasterizationStateCreateInfo* rasterization = nullptr;
        const VkPipelineMultisampleStateCreateInfo*   multisample   = nullptr;
        const VkPipelineDepthStencilStateCreateInfo*  depthStencil  = nullptr;
        const VkPipelineColorBlendStateCreateInfo*    colorBlend    = nullptr;
        const VkPipelineDynamicStateCreateInfo*       dynamicState  = nullptr;
    };

    /// Returns VK_NULL_HANDLE on failure.
    VkPipeline createGraphicsPipeline(VkDevice device, const GraphicsPipelineDesc& desc);

} // namespace vkutil
