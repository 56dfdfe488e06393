//============================================================
// RenderWindow.cpp
//============================================================
#include "RenderWindow.hpp"

#include <QExposeEvent>
#include <QMetaObject>
#include <QPlatformSurfaceEvent>
#include <QResizeEvent>
#include <QVulkanInstance>
#include <glm/gtc/matrix_transform.hpp>

#include "Diagnostics.hpp"
#include "FrameSession.hpp"

namespace
{
    // Radians per simulation step (deltaTime is in steps).
    constexpr float kCubeSpinPerStep = 0.01f;
} // namespace

RenderWindow::RenderWindow(QVulkanInstance* instance, const RendererSettings& settings, std::optional<double> pixelRatioOverride) :
    m_renderer(settings),
    m_pixelRatioOverride(pixelRatioOverride)
{
    setSurfaceType(QSurface::VulkanSurface);
    setVulkanInstance(instance);

    m_camera.setPosition(glm::vec3(0.0f, 2.0f, 6.0f));
    m_camera.lookAt(glm::vec3(0.0f));

    m_triangle.setColor(Color{1.0f, 0.5f, 0.0f, 1.0f});

    m_scene.addRenderable(&m_cube);
    m_scene.addRenderable(&m_triangle);

    // Runs inside Renderer::shutdown() before the device goes away.
    m_renderer.addDeviceReleaseListener([this](const VulkanContext&) { m_scene.releaseGpuResources(); });

    m_thread.addEventListener(ThreadEvent::Update, [this](const ThreadTick& tick) { renderFrame(tick); });
}

RenderWindow::~RenderWindow()
{
    releaseGpu();
}

bool RenderWindow::event(QEvent* e)
{
    // Everything holding the surface must go before Qt destroys it.
    if (e->type() == QEvent::PlatformSurface)
    {
        auto* pe = static_cast<QPlatformSurfaceEvent*>(e);
        if (pe->surfaceEventType() == QPlatformSurfaceEvent::SurfaceAboutToBeDestroyed)
            releaseGpu();
    }

    return QWindow::event(e);
}

void RenderWindow::exposeEvent(QExposeEvent* e)
{
    QWindow::exposeEvent(e);

    if (!isExposed() || m_renderer.hasInitialized() || m_initFailed)
        return;

    initializeRenderer();
}

void RenderWindow::resizeEvent(QResizeEvent* e)
{
    QWindow::resizeEvent(e);

    m_renderer.containerResized(width(), height());
    updateCameraAspect();
}

void RenderWindow::initializeRenderer()
{
    QVulkanInstance* qvk = vulkanInstance();
    if (!qvk)
        return;

    if (!handle())
        create();

    VkSurfaceKHR surface = QVulkanInstance::surfaceForWindow(this);
    if (!surface)
    {
        m_initFailed = true;
        emit initializationFailed(tr("The window has no Vulkan surface."));
        return;
    }

    // The platform ratio is read once, here, and handed down explicitly.
    if (!m_renderer.setDevicePixelRatio(m_pixelRatioOverride.value_or(devicePixelRatio())))
        diag::warn("RenderWindow: Using the default pixel ratio.");

    m_renderer.containerResized(width(), height());
    if (!m_renderer.trackContainerSize(0, true))
        m_renderer.setSize(width(), height());

    const RenderStatus status = m_renderer.initialize(qvk->vkInstance(), surface);
    if (status != RenderStatus::Ok)
    {
        m_initFailed = true;
        emit initializationFailed(QString::fromLatin1(toString(status)));
        return;
    }

    m_renderer.device()->addDeviceLostListener([this](const std::string& reason) {
        // Reported from inside a frame; let the event loop deliver it.
        const QString text = QString::fromStdString(reason);
        QMetaObject::invokeMethod(this, [this, text]() { emit deviceLost(text); }, Qt::QueuedConnection);
    });

    updateCameraAspect();

    if (m_scene.prepare(m_renderer, m_camera) != RenderStatus::Ok)
    {
        m_initFailed = true;
        emit initializationFailed(tr("The scene could not be prepared."));
        return;
    }

    m_thread.start();
}

void RenderWindow::renderFrame(const ThreadTick& tick)
{
    if (m_renderer.isDeviceLost())
    {
        if (!m_lostHandled)
        {
            m_lostHandled = true;
            m_thread.stop();
        }
        return;
    }

    m_cubeAngle += kCubeSpinPerStep * float(tick.deltaTime);
    m_cube.setModelMatrix(glm::rotate(glm::mat4(1.0f), m_cubeAngle, glm::vec3(0.3f, 1.0f, 0.0f)));

    FrameSession session = {};
    if (m_renderer.beginFrame(session) != RenderStatus::Ok)
        return;

    m_camera.writeUniformsToQueue();
    m_scene.render(session);

    if (m_renderer.endFrame(session) == RenderStatus::DeviceLost)
        return;

    if (tick.frameRate != m_lastFps)
    {
        m_lastFps = tick.frameRate;
        emit frameRateChanged(tick.frameRate);
    }
}

void RenderWindow::updateCameraAspect() noexcept
{
    if (height() <= 0)
        return;

    m_camera.setAspect(float(width()) / float(height()));
}

void RenderWindow::releaseGpu() noexcept
{
    if (m_thread.isRunning())
        m_thread.stop();

    // The scene is released through the device release listener.
    m_renderer.shutdown();
}
