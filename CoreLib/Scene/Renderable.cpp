#include "Renderable.hpp"

#include <utility>

#include "Diagnostics.hpp"
#include "RenderTargetSet.hpp"
#include "VulkanContext.hpp"

Renderable::Renderable(std::string name) : m_id{QUuid::createUuid()}, m_name{std::move(name)}
{
}

Renderable::~Renderable() noexcept
{
    dispose();
}

bool Renderable::initialize(const VulkanContext& ctx, VkFormat colorFormat, VkSampleCountFlagBits samples)
{
    if (m_initialized)
    {
        if (m_generation == ctx.generation)
            dispose();
        else
            abandon();
    }

    if (!contextReady(ctx))
    {
        diag::error("Renderable: Cannot initialize without a device.",
                    {"Renderable: " + m_name},
                    DiagCode::RenderableNotInitialized);
        return false;
    }

    m_device = ctx.device;

    if (!build(ctx, colorFormat, samples))
    {
        diag::error("Renderable: Could not create GPU resources.",
                    {"Renderable: " + m_name},
                    DiagCode::RenderablePipelineFailed);

        // Release whatever was built before the failure.
        m_initialized = true;
        dispose();
        return false;
    }

    m_generation  = ctx.generation;
    m_initialized = true;
    return true;
}

bool Renderable::build(const VulkanContext& ctx, VkFormat colorFormat, VkSampleCountFlagBits samples)
{
    // Pipelines only need a compatible pass; the frame's real pass is built by RenderTargetSet.
    VkRenderPass rp = vkutil::createCompatibleRenderPass(ctx.device, colorFormat, ctx.depthFormat, samples);
    if (!rp)
    {
        diag::error("Renderable: Could not create a compatible render pass.",
                    {"Renderable: " + m_name},
                    DiagCode::RenderablePipelineFailed);
        return false;
    }

    const bool ok = createResources(ctx, rp, samples);
    vkDestroyRenderPass(ctx.device, rp, nullptr);
    return ok;
}

void Renderable::render(VkCommandBuffer cmd, const Camera& camera)
{
    if (!m_initialized)
    {
        diag::error("Renderable: render() called before initialize().",
                    {"Renderable: " + m_name},
                    DiagCode::RenderableNotInitialized);
        return;
    }

    if (m_pipeline)
        vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, m_pipeline);

    record(cmd, camera);
}

void Renderable::dispose() noexcept
{
    if (!m_initialized)
        return;

    m_initialized = false;

    releaseResources();

    m_indexBuffer.destroy();
    m_vertexBuffer.destroy();

    if (m_device)
    {
        if (m_pipeline)
            vkDestroyPipeline(m_device, m_pipeline, nullptr);
        if (m_pipelineLayout)
            vkDestroyPipelineLayout(m_device, m_pipelineLayout, nullptr);
    }

    m_pipeline       = VK_NULL_HANDLE;
    m_pipelineLayout = VK_NULL_HANDLE;
    m_device         = VK_NULL_HANDLE;
    m_generation     = 0;
}

void Renderable::abandon() noexcept
{
    m_initialized = false;

    forgetResources();

    m_indexBuffer.forget();
    m_vertexBuffer.forget();

    m_pipeline       = VK_NULL_HANDLE;
    m_pipelineLayout = VK_NULL_HANDLE;
    m_device         = VK_NULL_HANDLE;
    m_generation     = 0;
}
