#pragma once

#include <array>

#include "Color.hpp"
#include "Renderable.hpp"

/**
 * @brief Single flat-shaded triangle in clip space.
 *
 * Ignores the camera. Color goes through a fragment push constant, so
 * setColor() is free at any time.
 */
class FlatTriangle final : public Renderable
{
public:
    /// vec2 positions, stride 8.
    static constexpr std::array<float, 6> kVertices = {
        0.0f, 0.7f,
        -0.7f, -0.7f,
        0.7f, -0.7f,
    };

    static constexpr Color kDefaultColor = {1.0f, 0.5f, 0.0f, 1.0f};

    explicit FlatTriangle(std::string name = "FlatTriangle");
    ~FlatTriangle() noexcept override;

    void setColor(const Color& color) noexcept
    {
        m_color = color.clamped();
    }

    [[nodiscard]] const Color& color() const noexcept
    {
        return m_color;
    }

protected:
    bool createResources(const VulkanContext& ctx, VkRenderPass renderPass, VkSampleCountFlagBits samples) override;
    void record(VkCommandBuffer cmd, const Camera& camera) override;

private:
    Color m_color = kDefaultColor;
};
