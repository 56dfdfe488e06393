#pragma once

#include <QUuid>
#include <cstdint>
#include <string>
#include <vulkan/vulkan.h>

#include "GpuBuffer.hpp"

struct VulkanContext;
class Camera;

/**
 * @brief Something a Scene can draw: owns its pipeline and geometry buffers.
 *
 * initialize() builds everything against a render pass compatible with the
 * renderer's targets (color format + sample count). Calling it again
 * disposes the previous resources first. When the context comes from a newer
 * device generation the old handles are dropped instead: their device is
 * already destroyed and must not be called.
 *
 * dispose() releases GPU resources once; later calls do nothing. Derived
 * classes that own extra resources call dispose() from their destructor.
 */
class Renderable
{
public:
    explicit Renderable(std::string name);
    virtual ~Renderable() noexcept;

    Renderable(const Renderable&)            = delete;
    Renderable& operator=(const Renderable&) = delete;

    bool initialize(const VulkanContext& ctx, VkFormat colorFormat, VkSampleCountFlagBits samples);

    /// Records draw commands into an open render pass. No-op before initialize().
    void render(VkCommandBuffer cmd, const Camera& camera);

    void dispose() noexcept;

    [[nodiscard]] bool isInitialized() const noexcept
    {
        return m_initialized;
    }

    /// VulkanContext::generation the resources were built against; 0 when none.
    [[nodiscard]] uint64_t generation() const noexcept
    {
        return m_generation;
    }

    [[nodiscard]] const QUuid& id() const noexcept
    {
        return m_id;
    }

    [[nodiscard]] const std::string& name() const noexcept
    {
        return m_name;
    }

protected:
    /**
     * @brief Creates a compatible render pass and calls createResources() with it.
     *
     * Override only to build without the render pass step.
     */
    virtual bool build(const VulkanContext& ctx, VkFormat colorFormat, VkSampleCountFlagBits samples);

    /// Builds pipeline layout, pipeline and buffers. renderPass only lives for this call.
    virtual bool createResources(const VulkanContext& ctx, VkRenderPass renderPass, VkSampleCountFlagBits samples) = 0;

    /// Records the draw; the pipeline is already bound.
    virtual void record(VkCommandBuffer cmd, const Camera& camera) = 0;

    /// Extra resources owned by the derived class.
    virtual void releaseResources() noexcept
    {
    }

    /// Same resources, device already destroyed: clear the handles only.
    virtual void forgetResources() noexcept
    {
    }

    VkDevice         m_device         = VK_NULL_HANDLE;
    VkPipelineLayout m_pipelineLayout = VK_NULL_HANDLE;
    VkPipeline       m_pipeline       = VK_NULL_HANDLE;

    GpuBuffer m_vertexBuffer;
    GpuBuffer m_indexBuffer;

private:
    void abandon() noexcept;

private:
    QUuid       m_id;
    std::string m_name;
    uint64_t    m_generation  = 0;
    bool        m_initialized = false;
};
