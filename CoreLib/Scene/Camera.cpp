#include "Camera.hpp"

#include <algorithm>
#include <cstring>
#include <glm/gtc/matrix_transform.hpp>

#include "Diagnostics.hpp"
#include "VkDebugNames.hpp"
#include "VulkanContext.hpp"

Camera::Camera() : m_id{QUuid::createUuid()}
{
}

Camera::~Camera() noexcept
{
    releaseBinding();
}

void Camera::setPosition(const glm::vec3& position)
{
    m_position = position;
    updateMatrices();
}

void Camera::lookAt(const glm::vec3& target)
{
    m_target = target;
    updateMatrices();
}

void Camera::setUp(const glm::vec3& up)
{
    m_up = up;
    updateMatrices();
}

void Camera::setAspect(float aspect)
{
    m_aspect = std::max(aspect, kMinAspect);
    updateProjection();
    updateMatrices();
}

void Camera::updateMatrices()
{
    m_view           = glm::lookAtRH(m_position, m_target, m_up);
    m_viewProjection = m_projection * m_view;
}

std::array<std::byte, sizeof(CameraUniforms)> Camera::packUniforms() const noexcept
{
    CameraUniforms u = {};
    u.viewProjection = m_viewProjection;
    u.position       = m_position;
    u.pad0           = 0.0f;

    std::array<std::byte, sizeof(CameraUniforms)> out = {};
    std::memcpy(out.data(), &u, sizeof(u));
    return out;
}

bool Camera::ensureBinding(const VulkanContext& ctx)
{
    if (m_bindingGeneration != 0)
    {
        if (m_bindingGeneration == ctx.generation)
            return true;

        // Built on a device that no longer exists.
        m_set = VK_NULL_HANDLE;
        m_pool.forget();
        m_setLayout.forget();
        m_uniformBuffer.forget();
        m_bindingGeneration = 0;
    }

    if (!ctx.device || !ctx.physicalDevice || ctx.generation == 0)
    {
        diag::error("Camera: Cannot create the GPU binding without a device.", {}, DiagCode::CameraBindingFailed);
        return false;
    }

    if (!createBinding(ctx))
    {
        releaseBinding();
        return false;
    }

    m_bindingGeneration = ctx.generation;

    updateProjection();
    updateMatrices();
    return true;
}

bool Camera::createBinding(const VulkanContext& ctx)
{
    auto failed = [&](const char* what) {
        diag::error("Camera: Could not create the GPU binding.",
                    {what, "Camera id: " + m_id.toString(QUuid::WithoutBraces).toStdString()},
                    DiagCode::CameraBindingFailed);
        return false;
    };

    if (!m_uniformBuffer.create(ctx.device,
                                ctx.physicalDevice,
                                kUniformSize,
                                VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT,
                                VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
                                true))
    {
        return failed("Uniform buffer");
    }

    vkutil::name(ctx.device, m_uniformBuffer.buffer(), "Camera.Uniforms");

    const DescriptorBindingInfo binding = vkutil::cameraBlockBinding();
    if (!m_setLayout.create(ctx.device, std::span<const DescriptorBindingInfo>(&binding, 1)))
        return failed("Descriptor set layout");

    const VkDescriptorPoolSize poolSize = {VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, 1};
    if (!m_pool.create(ctx.device, std::span<const VkDescriptorPoolSize>(&poolSize, 1), 1))
        return failed("Descriptor pool");

    m_set = m_pool.allocate(m_setLayout.layout());
    if (!m_set)
        return failed("Descriptor set");

    vkutil::name(ctx.device, m_set, "Camera.Set");
    vkutil::writeUniformBuffer(ctx.device, m_set, binding.binding, m_uniformBuffer.buffer(), kUniformSize);
    return true;
}

bool Camera::writeUniformsToQueue()
{
    if (!hasBinding() || !m_uniformBuffer.valid())
    {
        diag::error("Camera: No uniform buffer to write to.",
                    {"Call ensureBinding() (Scene::prepare() does) first."},
                    DiagCode::CameraUniformBufferMissing);
        return false;
    }

    const auto bytes = packUniforms();
    return m_uniformBuffer.upload(bytes.data(), bytes.size());
}

void Camera::releaseBinding() noexcept
{
    // Sets die with their pool.
    m_set = VK_NULL_HANDLE;
    m_pool.destroy();
    m_setLayout.destroy();
    m_uniformBuffer.destroy();
    m_bindingGeneration = 0;
}
