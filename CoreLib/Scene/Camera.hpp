// ============================================================================
// Camera.hpp  (Vulkan conventions: RH + ZO + projection Y-flip)
// ============================================================================

#pragma once

#include <QUuid>
#include <array>
#include <cstddef>
#include <cstdint>
#include <glm/glm.hpp>
#include <vulkan/vulkan.h>

#include "Descriptors.hpp"
#include "GpuBuffer.hpp"

struct VulkanContext;

/**
 * @brief Camera uniform block as the shaders see it (std140).
 *
 *  - bytes  0..63 viewProjection (column-major)
 *  - bytes 64..75 position xyz
 *  - bytes 76..79 zero
 */
struct CameraUniforms
{
    glm::mat4 viewProjection = glm::mat4(1.0f);
    glm::vec3 position       = glm::vec3(0.0f);
    float     pad0           = 0.0f;
};

static_assert(sizeof(CameraUniforms) == 80, "CameraUniforms must match the std140 camera block");
static_assert(offsetof(CameraUniforms, viewProjection) == 0);
static_assert(offsetof(CameraUniforms, position) == 64);

/**
 * @brief Abstract camera: view state, matrices and the GPU binding (set 0).
 *
 * Every setter recomputes the matrices immediately; there is no dirty flag.
 * Derived classes own the projection and implement updateProjection().
 *
 * The GPU binding (uniform buffer + descriptor set) is created on demand by
 * ensureBinding() and stays until releaseBinding() or destruction. It belongs
 * to one device generation: ensureBinding() with a newer context drops the
 * old handles (without calling the old device) and builds a new binding.
 */
class Camera
{
public:
    static constexpr VkDeviceSize kUniformSize = sizeof(CameraUniforms);
    static constexpr float        kMinAspect   = 1e-6f;

    Camera();
    virtual ~Camera() noexcept;

    Camera(const Camera&)            = delete;
    Camera& operator=(const Camera&) = delete;

    // ------------------------------------------------------------
    // View state
    // ------------------------------------------------------------
    void setPosition(const glm::vec3& position);
    void lookAt(const glm::vec3& target);
    void setUp(const glm::vec3& up);

    /// Clamped to >= kMinAspect.
    void setAspect(float aspect);

    [[nodiscard]] const glm::vec3& position() const noexcept
    {
        return m_position;
    }

    [[nodiscard]] const glm::vec3& target() const noexcept
    {
        return m_target;
    }

    [[nodiscard]] const glm::vec3& up() const noexcept
    {
        return m_up;
    }

    [[nodiscard]] float aspect() const noexcept
    {
        return m_aspect;
    }

    [[nodiscard]] const glm::mat4& view() const noexcept
    {
        return m_view;
    }

    [[nodiscard]] const glm::mat4& projection() const noexcept
    {
        return m_projection;
    }

    [[nodiscard]] const glm::mat4& viewProjection() const noexcept
    {
        return m_viewProjection;
    }

    [[nodiscard]] const QUuid& id() const noexcept
    {
        return m_id;
    }

    // ------------------------------------------------------------
    // Uniforms
    // ------------------------------------------------------------

    /// Byte image of the camera block; identical state gives identical bytes.
    [[nodiscard]] std::array<std::byte, sizeof(CameraUniforms)> packUniforms() const noexcept;

    /**
     * @brief Create buffer, layout, pool and set once per device generation.
     *
     * Later calls with the same generation are no-ops. Returns false (and
     * leaves nothing half-built) on failure.
     */
    bool ensureBinding(const VulkanContext& ctx);

    /// Copies packUniforms() into the uniform buffer. Needs ensureBinding().
    bool writeUniformsToQueue();

    void releaseBinding() noexcept;

    [[nodiscard]] bool hasBinding() const noexcept
    {
        return m_set != VK_NULL_HANDLE;
    }

    /// Generation of the device the binding was built on; 0 when unbound.
    [[nodiscard]] uint64_t bindingGeneration() const noexcept
    {
        return m_bindingGeneration;
    }

    [[nodiscard]] VkDescriptorSet descriptorSet() const noexcept
    {
        return m_set;
    }

    [[nodiscard]] VkDescriptorSetLayout descriptorSetLayout() const noexcept
    {
        return m_setLayout.layout();
    }

protected:
    /// Recomputes m_projection from the derived parameters and m_aspect.
    virtual void updateProjection() = 0;

    /// Builds the uniform buffer and set 0. On failure ensureBinding() releases the rest.
    virtual bool createBinding(const VulkanContext& ctx);

    /// view, projection and viewProjection.
    void updateMatrices();

    glm::mat4 m_projection = glm::mat4(1.0f);

private:
    QUuid m_id;

    glm::vec3 m_position = glm::vec3(0.0f, 0.0f, 5.0f);
    glm::vec3 m_target   = glm::vec3(0.0f);
    glm::vec3 m_up       = glm::vec3(0.0f, 1.0f, 0.0f);
    float     m_aspect   = 1.0f;

    glm::mat4 m_view           = glm::mat4(1.0f);
    glm::mat4 m_viewProjection = glm::mat4(1.0f);

    // GPU binding (set 0)
    GpuBuffer           m_uniformBuffer;
    DescriptorSetLayout m_setLayout;
    DescriptorPool      m_pool;
    VkDescriptorSet     m_set = VK_NULL_HANDLE;

    uint64_t m_bindingGeneration = 0;
};
