#pragma once

#include "Camera.hpp"

/**
 * @brief Perspective projection, Vulkan clip space (ZO, Y flipped).
 *
 * Defaults: fov 60 degrees, aspect 1, near 0.1, far 1000.
 */
class PerspectiveCamera final : public Camera
{
public:
    static constexpr float kMinFovDegrees = 1.0f;
    static constexpr float kMaxFovDegrees = 179.0f;
    static constexpr float kMinNear       = 1e-4f;
    static constexpr float kMinDepthRange = 1e-3f;

    PerspectiveCamera();
    PerspectiveCamera(float fovDegrees, float aspect, float nearPlane, float farPlane);

    /// Clamped to [1, 179].
    void setFieldOfViewInDegrees(float degrees);

    /// Clamped to >= 1e-4. Far is pushed out if it would fall behind near.
    void setNear(float nearPlane);

    /// Clamped to >= near + 1e-3.
    void setFar(float farPlane);

    [[nodiscard]] float fieldOfViewInDegrees() const noexcept
    {
        return m_fovDegrees;
    }

    [[nodiscard]] float nearPlane() const noexcept
    {
        return m_near;
    }

    [[nodiscard]] float farPlane() const noexcept
    {
        return m_far;
    }

protected:
    void updateProjection() override;

private:
    float m_fovDegrees = 60.0f;
    float m_near       = 0.1f;
    float m_far        = 1000.0f;
};
