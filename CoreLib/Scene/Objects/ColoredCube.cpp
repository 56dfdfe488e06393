#include "ColoredCube.hpp"

#include <utility>

#include "Camera.hpp"
#include "Diagnostics.hpp"
#include "ShaderStage.hpp"
#include "VkDebugNames.hpp"
#include "VkPipelineHelpers.hpp"
#include "VkUtilities.hpp"
#include "VulkanContext.hpp"

ColoredCube::ColoredCube(std::string name) : Renderable(std::move(name))
{
}

ColoredCube::~ColoredCube() noexcept
{
    dispose();
}

bool ColoredCube::createResources(const VulkanContext& ctx, VkRenderPass renderPass, VkSampleCountFlagBits samples)
{
    m_vertexBuffer = vkutil::createDeviceLocalBuffer(ctx,
                                                     sizeof(kVertices),
                                                     VK_BUFFER_USAGE_VERTEX_BUFFER_BIT,
                                                     kVertices.data());
    if (!m_vertexBuffer.valid())
        return false;

    m_indexBuffer = vkutil::createDeviceLocalBuffer(ctx,
                                                    sizeof(kIndices),
                                                    VK_BUFFER_USAGE_INDEX_BUFFER_BIT,
                                                    kIndices.data());
    if (!m_indexBuffer.valid())
        return false;

    vkutil::name(ctx.device, m_vertexBuffer.buffer(), "ColoredCube.Vertices");
    vkutil::name(ctx.device, m_indexBuffer.buffer(), "ColoredCube.Indices");

    const DescriptorBindingInfo camera = vkutil::cameraBlockBinding();
    if (!m_cameraLayout.create(ctx.device, std::span<const DescriptorBindingInfo>(&camera, 1)))
        return false;

    VkPushConstantRange pcr = {};
    pcr.stageFlags          = VK_SHADER_STAGE_VERTEX_BIT;
    pcr.offset              = 0;
    pcr.size                = sizeof(glm::mat4);

    const VkDescriptorSetLayout setLayout = m_cameraLayout.layout();

    m_pipelineLayout = vkutil::createPipelineLayout(ctx.device, &setLayout, 1, &pcr, 1);
    if (!m_pipelineLayout)
        return false;

    const std::filesystem::path dir  = vkutil::shaderDir();
    ShaderStage                 vert = vkutil::loadStage(ctx.device, dir, "ColoredCube.vert.spv", VK_SHADER_STAGE_VERTEX_BIT);
    ShaderStage                 frag = vkutil::loadStage(ctx.device, dir, "ColoredCube.frag.spv", VK_SHADER_STAGE_FRAGMENT_BIT);

    if (!vert.isValid() || !frag.isValid())
        return false;

    const VkPipelineShaderStageCreateInfo stages[2] = {vert.stageInfo(), frag.stageInfo()};

    static constexpr VkVertexInputAttributeDescription attrs[] = {
        {0, 0, VK_FORMAT_R32G32B32_SFLOAT, 0},                 // position
        {1, 0, VK_FORMAT_R32G32B32_SFLOAT, sizeof(float) * 3}, // color
    };

    vkutil::VertexLayout layout = {};
    layout.binding              = {0, kVertexStride, VK_VERTEX_INPUT_RATE_VERTEX};
    layout.attributes           = attrs;

    const VkPipelineVertexInputStateCreateInfo vi = vkutil::makeVertexInput(layout);

    vkutil::MeshPipelinePreset preset = {};
    preset.cullMode                   = VK_CULL_MODE_BACK_BIT;
    preset.frontFace                  = VK_FRONT_FACE_COUNTER_CLOCKWISE;
    preset.depthTest                  = true;
    preset.depthWrite                 = true;
    preset.depthCompareOp             = VK_COMPARE_OP_LESS;

    m_pipeline = vkutil::createMeshPipeline(ctx.device, renderPass, m_pipelineLayout, stages, 2, &vi, samples, preset);
    if (!m_pipeline)
        return false;

    vkutil::name(ctx.device, m_pipeline, "ColoredCube.Pipeline");
    return true;
}

void ColoredCube::record(VkCommandBuffer cmd, const Camera& camera)
{
    const VkDescriptorSet set = camera.descriptorSet();
    if (!set)
    {
        diag::error("ColoredCube: The camera has no GPU binding.",
                    {"Renderable: " + name()},
                    DiagCode::CameraUniformBufferMissing);
        return;
    }

    vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, m_pipelineLayout, 0, 1, &set, 0, nullptr);
    vkCmdPushConstants(cmd, m_pipelineLayout, VK_SHADER_STAGE_VERTEX_BIT, 0, sizeof(glm::mat4), &m_model);

    const VkBuffer     vb     = m_vertexBuffer.buffer();
    const VkDeviceSize offset = 0;
    vkCmdBindVertexBuffers(cmd, 0, 1, &vb, &offset);
    vkCmdBindIndexBuffer(cmd, m_indexBuffer.buffer(), 0, VK_INDEX_TYPE_UINT16);

    vkCmdDrawIndexed(cmd, uint32_t(kIndices.size()), 1, 0, 0, 0);
}

void ColoredCube::releaseResources() noexcept
{
    m_cameraLayout.destroy();
}

void ColoredCube::forgetResources() noexcept
{
    m_cameraLayout.forget();
}
