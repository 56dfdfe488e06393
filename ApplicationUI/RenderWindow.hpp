//============================================================
// RenderWindow.hpp
//============================================================
#pragma once

#include <QString>
#include <QWindow>
#include <optional>

#include "ColoredCube.hpp"
#include "FlatTriangle.hpp"
#include "PerspectiveCamera.hpp"
#include "Renderer.hpp"
#include "Scene.hpp"
#include "Thread.hpp"

class QVulkanInstance;

/**
 * @brief Vulkan surface window hosting the demo scene.
 *
 * The renderer is initialized on the first expose (the platform surface
 * only exists then). The Thread scheduler drives one frame per Update.
 */
class RenderWindow final : public QWindow
{
    Q_OBJECT
public:
    /**
     * @param pixelRatioOverride When set, used instead of the window's own ratio.
     */
    RenderWindow(QVulkanInstance* instance, const RendererSettings& settings, std::optional<double> pixelRatioOverride);
    ~RenderWindow() override;

    [[nodiscard]] Renderer& renderer() noexcept
    {
        return m_renderer;
    }

    [[nodiscard]] Thread& scheduler() noexcept
    {
        return m_thread;
    }

signals:
    void frameRateChanged(int fps);
    void initializationFailed(QString reason);
    void deviceLost(QString reason);

protected:
    bool event(QEvent* e) override;
    void exposeEvent(QExposeEvent* e) override;
    void resizeEvent(QResizeEvent* e) override;

private:
    void initializeRenderer();
    void renderFrame(const ThreadTick& tick);
    void releaseGpu() noexcept;
    void updateCameraAspect() noexcept;

private:
    Renderer          m_renderer;
    Scene             m_scene;
    PerspectiveCamera m_camera;
    ColoredCube       m_cube;
    FlatTriangle      m_triangle;
    Thread            m_thread;

    std::optional<double> m_pixelRatioOverride;

    float m_cubeAngle   = 0.0f;
    int   m_lastFps     = -1;
    bool  m_initFailed  = false;
    bool  m_lostHandled = false;
};
