#include "VkPipelineHelpers.hpp"

#include <string>

#include "Diagnostics.hpp"
#include "ShaderStage.hpp"

#ifndef FLUX3D_SHADER_DIR
#define FLUX3D_SHADER_DIR "shaders"
#endif

namespace vkutil
{
    std::filesystem::path shaderDir()
    {
        return std::filesystem::path(FLUX3D_SHADER_DIR);
    }

    ShaderStage loadStage(VkDevice                     device,
                          const std::filesystem::path& dir,
                          const char*                  filename,
                          VkShaderStageFlagBits        stage)
    {
        return ShaderStage::fromSpirvFile(device, dir / filename, stage);
    }

    VkPipelineVertexInputStateCreateInfo makeVertexInput(const VertexLayout& layout) noexcept
    {
        VkPipelineVertexInputStateCreateInfo vi = {};
        vi.sType                                = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
        vi.vertexBindingDescriptionCount        = 1;
        vi.pVertexBindingDescriptions           = &layout.binding;
        vi.vertexAttributeDescriptionCount      = static_cast<uint32_t>(layout.attributes.size());
        vi.pVertexAttributeDescriptions         = layout.attributes.data();
        return vi;
    }

    VkPipelineLayout createPipelineLayout(VkDevice                     device,
                                          const VkDescriptorSetLayout* setLayouts,
                                          uint32_t                     setLayoutCount,
                                          const VkPushConstantRange*   pushConstants,
                                          uint32_t                     pushConstantCount)
    {
        VkPipelineLayoutCreateInfo pl{};
        pl.sType                  = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
        pl.setLayoutCount         = setLayoutCount;
        pl.pSetLayouts            = setLayouts;
        pl.pushConstantRangeCount = pushConstantCount;
        pl.pPushConstantRanges    = pushConstants;

        VkPipelineLayout layout = VK_NULL_HANDLE;
        if (vkCreatePipelineLayout(device, &pl, nullptr, &layout) != VK_SUCCESS)
        {
            diag::error("vkutil::createPipelineLayout: vkCreatePipelineLayout failed.");
            return VK_NULL_HANDLE;
        }
        return layout;
    }

    VkPipeline createMeshPipeline(VkDevice                                    device,
                                  VkRenderPass                                rp,
                                  VkPipelineLayout                            layout,
                                  const VkPipelineShaderStageCreateInfo*      stages,
                                  uint32_t                                    stageCount,
                                  const VkPipelineVertexInputStateCreateInfo* vertexInput,
                                  VkSampleCountFlagBits                       samples,
                                  const MeshPipelinePreset&                   preset)
    {
        VkPipelineInputAssemblyStateCreateInfo ia = {};
        ia.sType                                  = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
        ia.topology                               = preset.topology;
        ia.primitiveRestartEnable                 = VK_FALSE;

        // Viewport/scissor (dynamic)
        VkPipelineViewportStateCreateInfo vp{};
        vp.sType         = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
        vp.viewportCount = 1;
        vp.scissorCount  = 1;

        VkPipelineRasterizationStateCreateInfo rs{};
        rs.sType                   = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
        rs.depthClampEnable        = VK_FALSE;
        rs.rasterizerDiscardEnable = VK_FALSE;
        rs.polygonMode             = preset.polygonMode;
        rs.cullMode                = preset.cullMode;
        rs.frontFace               = preset.frontFace;
        rs.depthBiasEnable         = VK_FALSE;
        rs.lineWidth               = 1.0f;

        // Must match the render pass attachments exactly.
        VkPipelineMultisampleStateCreateInfo ms{};
        ms.sType                = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
        ms.rasterizationSamples = samples;
        ms.sampleShadingEnable  = VK_FALSE;
        ms.minSampleShading     = 1.0f;

        VkPipelineDepthStencilStateCreateInfo ds{};
        ds.sType                 = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
        ds.depthTestEnable       = preset.depthTest ? VK_TRUE : VK_FALSE;
        ds.depthWriteEnable      = preset.depthWrite ? VK_TRUE : VK_FALSE;
        ds.depthCompareOp        = preset.depthCompareOp;
        ds.depthBoundsTestEnable = VK_FALSE;
        ds.stencilTestEnable     = VK_FALSE;

        VkPipelineColorBlendAttachmentState att = {};
        att.colorWriteMask                      = VK_COLOR_COMPONENT_R_BIT |
                             VK_COLOR_COMPONENT_G_BIT |
                             VK_COLOR_COMPONENT_B_BIT |
                             VK_COLOR_COMPONENT_A_BIT;

        att.blendEnable = preset.enableBlend ? VK_TRUE : VK_FALSE;
        if (preset.enableBlend)
        {
            att.srcColorBlendFactor = VK_BLEND_FACTOR_SRC_ALPHA;
            att.dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
            att.colorBlendOp        = VK_BLEND_OP_ADD;
            att.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
            att.dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
            att.alphaBlendOp        = VK_BLEND_OP_ADD;
        }

        VkPipelineColorBlendStateCreateInfo cb = {};
        cb.sType                               = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
        cb.logicOpEnable                       = VK_FALSE;
        cb.attachmentCount                     = 1;
        cb.pAttachments                        = &att;

        const VkDynamicState dynStates[] = {
            VK_DYNAMIC_STATE_VIEWPORT,
            VK_DYNAMIC_STATE_SCISSOR,
        };

        VkPipelineDynamicStateCreateInfo dyn{};
        dyn.sType             = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
        dyn.dynamicStateCount = 2;
        dyn.pDynamicStates    = dynStates;

        vkutil::GraphicsPipelineDesc desc{};
        desc.renderPass    = rp;
        desc.subpass       = 0;
        desc.layout        = layout;
        desc.stages        = stages;
        desc.stageCount    = stageCount;
        desc.vertexInput   = vertexInput;
        desc.inputAssembly = &ia;
        desc.viewport      = &vp;
        desc.rasterization = &rs;
        desc.multisample   = &ms;
        desc.depthStencil  = &ds;
        desc.colorBlend    = &cb;
        desc.dynamicState  = &dyn;

        return vkutil::createGraphicsPipeline(device, desc);
    }

} // namespace vkutil
