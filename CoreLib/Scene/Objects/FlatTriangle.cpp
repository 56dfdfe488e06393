#include "FlatTriangle.hpp"

#include <glm/vec4.hpp>
#include <utility>

#include "ShaderStage.hpp"
#include "VkDebugNames.hpp"
#include "VkPipelineHelpers.hpp"
#include "VkUtilities.hpp"
#include "VulkanContext.hpp"

FlatTriangle::FlatTriangle(std::string name) : Renderable(std::move(name))
{
}

FlatTriangle::~FlatTriangle() noexcept
{
    dispose();
}

bool FlatTriangle::createResources(const VulkanContext& ctx, VkRenderPass renderPass, VkSampleCountFlagBits samples)
{
    m_vertexBuffer = vkutil::createDeviceLocalBuffer(ctx,
                                                     sizeof(kVertices),
                                                     VK_BUFFER_USAGE_VERTEX_BUFFER_BIT,
                                                     kVertices.data());
    if (!m_vertexBuffer.valid())
        return false;

    vkutil::name(ctx.device, m_vertexBuffer.buffer(), "FlatTriangle.Vertices");

    // Color only
    VkPushConstantRange pcr = {};
    pcr.stageFlags          = VK_SHADER_STAGE_FRAGMENT_BIT;
    pcr.offset              = 0;
    pcr.size                = sizeof(glm::vec4);

    m_pipelineLayout = vkutil::createPipelineLayout(ctx.device, nullptr, 0, &pcr, 1);
    if (!m_pipelineLayout)
        return false;

    const std::filesystem::path dir  = vkutil::shaderDir();
    ShaderStage                 vert = vkutil::loadStage(ctx.device, dir, "FlatTriangle.vert.spv", VK_SHADER_STAGE_VERTEX_BIT);
    ShaderStage                 frag = vkutil::loadStage(ctx.device, dir, "FlatTriangle.frag.spv", VK_SHADER_STAGE_FRAGMENT_BIT);

    if (!vert.isValid() || !frag.isValid())
        return false;

    const VkPipelineShaderStageCreateInfo stages[2] = {vert.stageInfo(), frag.stageInfo()};

    static constexpr VkVertexInputAttributeDescription attrs[] = {
        {0, 0, VK_FORMAT_R32G32_SFLOAT, 0},
    };

    vkutil::VertexLayout layout = {};
    layout.binding              = {0, sizeof(float) * 2, VK_VERTEX_INPUT_RATE_VERTEX};
    layout.attributes           = attrs;

    const VkPipelineVertexInputStateCreateInfo vi = vkutil::makeVertexInput(layout);

    vkutil::MeshPipelinePreset preset = {};
    preset.cullMode                   = VK_CULL_MODE_NONE;
    preset.depthTest                  = true;
    preset.depthWrite                 = true;
    preset.depthCompareOp             = VK_COMPARE_OP_LESS;

    m_pipeline = vkutil::createMeshPipeline(ctx.device, renderPass, m_pipelineLayout, stages, 2, &vi, samples, preset);
    if (!m_pipeline)
        return false;

    vkutil::name(ctx.device, m_pipeline, "FlatTriangle.Pipeline");
    return true;
}

void FlatTriangle::record(VkCommandBuffer cmd, const Camera&)
{
    const glm::vec4 color = m_color.toVec4();
    vkCmdPushConstants(cmd, m_pipelineLayout, VK_SHADER_STAGE_FRAGMENT_BIT, 0, sizeof(color), &color);

    const VkBuffer     vb     = m_vertexBuffer.buffer();
    const VkDeviceSize offset = 0;
    vkCmdBindVertexBuffers(cmd, 0, 1, &vb, &offset);

    vkCmdDraw(cmd, 3, 1, 0, 0);
}
