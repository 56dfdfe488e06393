//=============================================================================
// Scene.hpp
//=============================================================================
#pragma once

#include <QUuid>
#include <vector>
#include <vulkan/vulkan.h>

#include "RenderStatus.hpp"

class Renderer;
class Renderable;
class Camera;
struct FrameSession;
struct VulkanContext;

/**
 * @brief Ordered, non-owning list of renderables bound to one camera.
 *
 * Responsibilities:
 * - Keep renderables in insertion order (draw order)
 * - prepare(): initialize every renderable against the renderer's targets
 *   and create the camera's GPU binding
 * - render(): record every renderable into an open frame session
 *
 * Renderables and the camera are owned by the caller and must outlive
 * the scene (or be removed first).
 *
 * A prepared scene belongs to one device generation. Frames recorded on any
 * other generation are refused until prepare() runs again; call
 * releaseGpuResources() before the device goes away so nothing is leaked.
 */
class Scene
{
public:
    Scene();
    ~Scene() = default;

    Scene(const Scene&)            = delete;
    Scene& operator=(const Scene&) = delete;

    /// Ignores nullptr and duplicates. Clears the prepared flag.
    void addRenderable(Renderable* renderable);

    /// Removes by identity. The renderable is not disposed.
    void removeRenderable(Renderable* renderable);

    void clearRenderables() noexcept;

    [[nodiscard]] const std::vector<Renderable*>& renderables() const noexcept
    {
        return m_renderables;
    }

    /**
     * @brief Initialize renderables (serially, in order) and bind the camera.
     *
     * Stops at the first failure; the scene stays unprepared.
     */
    [[nodiscard]] RenderStatus prepare(Renderer& renderer, Camera& camera);

    /// Same, against an explicit device and target format (headless use).
    [[nodiscard]] RenderStatus prepare(const VulkanContext&  ctx,
                                       VkFormat              colorFormat,
                                       VkSampleCountFlagBits samples,
                                       Camera&               camera);

    /**
     * @brief Records each renderable into session.cmd.
     *
     * UsageError before prepare(), and when session comes from a different
     * device generation than the one the scene was prepared on.
     */
    RenderStatus render(const FrameSession& session);

    /// Disposes every renderable and the camera binding. The device must still be alive.
    void releaseGpuResources() noexcept;

    [[nodiscard]] bool isPrepared() const noexcept
    {
        return m_prepared;
    }

    /// Device generation of the last successful prepare(); 0 when unprepared.
    [[nodiscard]] uint64_t generation() const noexcept
    {
        return m_generation;
    }

    /// nullptr before the first prepare().
    [[nodiscard]] Camera* camera() const noexcept
    {
        return m_camera;
    }

    [[nodiscard]] const QUuid& id() const noexcept
    {
        return m_id;
    }

private:
    QUuid                    m_id;
    std::vector<Renderable*> m_renderables;
    Camera*                  m_camera     = nullptr;
    uint64_t                 m_generation = 0;
    bool                     m_prepared   = false;
};
