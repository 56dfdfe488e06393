#pragma once

#include <filesystem>
#include <span>
#include <vulkan/vulkan.h>

#include "VkUtilities.hpp"

class ShaderStage;

namespace vkutil
{
    // ---------------------------------------------------------
    // Shader loading
    // ---------------------------------------------------------

    /// Directory the build wrote the compiled SPIR-V into (FLUX3D_SHADER_DIR).
    [[nodiscard]] std::filesystem::path shaderDir();

    ShaderStage loadStage(VkDevice                     device,
                          const std::filesystem::path& dir,
                          const char*                  filename,
                          VkShaderStageFlagBits        stage);

    // ---------------------------------------------------------
    // Vertex input
    // ---------------------------------------------------------

    /// Single interleaved binding (binding 0, per-vertex).
    struct VertexLayout
    {
        VkVertexInputBindingDescription                binding    = {};
        std::span<const VkVertexInputAttributeDescription> attributes = {};
    };

    /// @p layout must outlive the returned create info.
    [[nodiscard]] VkPipelineVertexInputStateCreateInfo makeVertexInput(const VertexLayout& layout) noexcept;

    // ---------------------------------------------------------
    // Pipeline layout helper
    // ---------------------------------------------------------
    VkPipelineLayout createPipelineLayout(VkDevice                     device,
                                          const VkDescriptorSetLayout* setLayouts,
                                          uint32_t                     setLayoutCount,
                                          const VkPushConstantRange*   pushConstants     = nullptr,
                                          uint32_t                     pushConstantCount = 0);

    // ---------------------------------------------------------
    // Mesh pipeline preset + creator
    // ---------------------------------------------------------

    struct MeshPipelinePreset
    {
        VkPrimitiveTopology topology    = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
        VkPolygonMode       polygonMode = VK_POLYGON_MODE_FILL;
        VkCullModeFlags     cullMode    = VK_CULL_MODE_NONE;
        VkFrontFace         frontFace   = VK_FRONT_FACE_COUNTER_CLOCKWISE;

        bool        depthTest      = true;
        bool        depthWrite     = true;
        VkCompareOp depthCompareOp = VK_COMPARE_OP_LESS;

        bool enableBlend = false;
    };

    /// Viewport and scissor are dynamic; set them per frame.
    VkPipeline createMeshPipeline(VkDevice                                    device,
                                  VkRenderPass                                rp,
                                  VkPipelineLayout                            layout,
                                  const VkPipelineShaderStageCreateInfo*      stages,
                                  uint32_t                                    stageCount,
                                  const VkPipelineVertexInputStateCreateInfo* vertexInput,
                                  VkSampleCountFlagBits                       samples,
                                  const MeshPipelinePreset&                   preset);

} // namespace vkutil
