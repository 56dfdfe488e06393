#pragma once

#include <array>
#include <cstdint>
#include <glm/mat4x4.hpp>

#include "Descriptors.hpp"
#include "Renderable.hpp"

/**
 * @brief Unit cube (-1..1) with per-vertex colors, drawn through the camera.
 *
 * Set 0 is the camera block; the model matrix is a 64-byte vertex push
 * constant.
 */
class ColoredCube final : public Renderable
{
public:
    /// Interleaved pos3 + color3, stride 24.
    static constexpr std::array<float, 48> kVertices = {
        -1.0f, -1.0f, 1.0f, 1.0f, 0.0f, 0.0f,
        1.0f, -1.0f, 1.0f, 0.0f, 1.0f, 0.0f,
        1.0f, 1.0f, 1.0f, 0.0f, 0.0f, 1.0f,
        -1.0f, 1.0f, 1.0f, 1.0f, 1.0f, 1.0f,
        -1.0f, -1.0f, -1.0f, 1.0f, 0.0f, 0.0f,
        1.0f, -1.0f, -1.0f, 0.0f, 1.0f, 0.0f,
        1.0f, 1.0f, -1.0f, 0.0f, 0.0f, 1.0f,
        -1.0f, 1.0f, -1.0f, 1.0f, 1.0f, 1.0f,
    };

    static constexpr std::array<uint16_t, 36> kIndices = {
        0, 1, 2, 2, 3, 0, // front
        1, 5, 6, 6, 2, 1, // right
        5, 4, 7, 7, 6, 5, // back
        4, 0, 3, 3, 7, 4, // left
        3, 2, 6, 6, 7, 3, // top
        4, 5, 1, 1, 0, 4, // bottom
    };

    static constexpr uint32_t kVertexStride = sizeof(float) * 6;

    explicit ColoredCube(std::string name = "ColoredCube");
    ~ColoredCube() noexcept override;

    void setModelMatrix(const glm::mat4& model) noexcept
    {
        m_model = model;
    }

    [[nodiscard]] const glm::mat4& modelMatrix() const noexcept
    {
        return m_model;
    }

protected:
    bool createResources(const VulkanContext& ctx, VkRenderPass renderPass, VkSampleCountFlagBits samples) override;
    void record(VkCommandBuffer cmd, const Camera& camera) override;
    void releaseResources() noexcept override;
    void forgetResources() noexcept override;

private:
    glm::mat4 m_model = glm::mat4(1.0f);

    // Same shape as Camera's layout, so the camera's set binds at set 0.
    DescriptorSetLayout m_cameraLayout;
};
