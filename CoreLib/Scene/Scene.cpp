//=============================================================================
// Scene.cpp
//=============================================================================
#include "Scene.hpp"

#include <QElapsedTimer>
#include <algorithm>
#include <string>

#include "Camera.hpp"
#include "Diagnostics.hpp"
#include "FrameSession.hpp"
#include "Renderable.hpp"
#include "Renderer.hpp"
#include "VulkanContext.hpp"

Scene::Scene() : m_id{QUuid::createUuid()}
{
}

void Scene::addRenderable(Renderable* renderable)
{
    if (!renderable)
        return;

    if (std::find(m_renderables.begin(), m_renderables.end(), renderable) != m_renderables.end())
        return;

    m_renderables.push_back(renderable);
    m_prepared = false;
}

void Scene::removeRenderable(Renderable* renderable)
{
    m_renderables.erase(std::remove(m_renderables.begin(), m_renderables.end(), renderable), m_renderables.end());
}

void Scene::clearRenderables() noexcept
{
    m_renderables.clear();
}

RenderStatus Scene::prepare(Renderer& renderer, Camera& camera)
{
    m_prepared = false;

    if (!renderer.hasInitialized())
    {
        diag::error("Scene: The renderer has not been initialized.",
                    {"Call Renderer::initialize() before Scene::prepare()."},
                    DiagCode::SceneRendererNotInitialized);
        return RenderStatus::UsageError;
    }

    return prepare(renderer.context(), renderer.colorFormat(), renderer.sampleCount(), camera);
}

RenderStatus Scene::prepare(const VulkanContext& ctx, VkFormat colorFormat, VkSampleCountFlagBits samples, Camera& camera)
{
    m_prepared   = false;
    m_generation = 0;

    if (!contextReady(ctx))
    {
        diag::error("Scene: No device to prepare against.", {}, DiagCode::SceneRendererNotInitialized);
        return RenderStatus::UsageError;
    }

    // Set before anything is built so releaseGpuResources() also covers a failed prepare.
    m_camera = &camera;

    QElapsedTimer timer;
    timer.start();

    for (size_t i = 0; i < m_renderables.size(); ++i)
    {
        Renderable* r = m_renderables[i];
        if (!r->initialize(ctx, colorFormat, samples))
        {
            diag::error("Scene: A renderable failed to initialize.",
                        {"Renderable: " + r->name(),
                         "Index: " + std::to_string(i),
                         "Scene id: " + m_id.toString(QUuid::WithoutBraces).toStdString()},
                        DiagCode::SceneRenderableInitFailed);
            return RenderStatus::DeviceRequestError;
        }
    }

    if (!camera.ensureBinding(ctx))
        return RenderStatus::DeviceRequestError;

    m_generation = ctx.generation;
    m_prepared   = true;

    diag::log("Scene: Prepared.",
              {"Renderables: " + std::to_string(m_renderables.size()),
               "Time: " + std::to_string(timer.elapsed()) + " ms"},
              DiagCode::ScenePrepared);

    return RenderStatus::Ok;
}

RenderStatus Scene::render(const FrameSession& session)
{
    if (!m_prepared || !m_camera)
    {
        diag::error("Scene: render() called before prepare().", {}, DiagCode::SceneNotPrepared);
        return RenderStatus::UsageError;
    }

    if (session.generation != m_generation)
    {
        diag::error("Scene: The scene was prepared on a different device.",
                    {"Prepared on generation: " + std::to_string(m_generation),
                     "Frame generation: " + std::to_string(session.generation),
                     "Call prepare() again after the renderer was re-initialized."},
                    DiagCode::SceneStaleDevice);
        m_prepared = false;
        return RenderStatus::UsageError;
    }

    for (Renderable* r : m_renderables)
        r->render(session.cmd, *m_camera);

    return RenderStatus::Ok;
}

void Scene::releaseGpuResources() noexcept
{
    for (Renderable* r : m_renderables)
        r->dispose();

    if (m_camera)
        m_camera->releaseBinding();

    m_prepared   = false;
    m_generation = 0;
}
