#include "PerspectiveCamera.hpp"

#include <algorithm>
#include <glm/gtc/matrix_transform.hpp>

PerspectiveCamera::PerspectiveCamera()
{
    updateProjection();
    updateMatrices();
}

PerspectiveCamera::PerspectiveCamera(float fovDegrees, float aspect, float nearPlane, float farPlane)
{
    m_fovDegrees = std::clamp(fovDegrees, kMinFovDegrees, kMaxFovDegrees);
    m_near       = std::max(nearPlane, kMinNear);
    m_far        = std::max(farPlane, m_near + kMinDepthRange);

    // setAspect() recomputes everything.
    setAspect(aspect);
}

void PerspectiveCamera::setFieldOfViewInDegrees(float degrees)
{
    m_fovDegrees = std::clamp(degrees, kMinFovDegrees, kMaxFovDegrees);
    updateProjection();
    updateMatrices();
}

void PerspectiveCamera::setNear(float nearPlane)
{
    m_near = std::max(nearPlane, kMinNear);
    m_far  = std::max(m_far, m_near + kMinDepthRange);
    updateProjection();
    updateMatrices();
}

void PerspectiveCamera::setFar(float farPlane)
{
    m_far = std::max(farPlane, m_near + kMinDepthRange);
    updateProjection();
    updateMatrices();
}

void PerspectiveCamera::updateProjection()
{
    m_projection = glm::perspectiveRH_ZO(glm::radians(m_fovDegrees), aspect(), m_near, m_far);

    // Vulkan clip space: Y down
    m_projection[1][1] *= -1.0f;
}
