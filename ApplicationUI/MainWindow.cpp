#include "MainWindow.hpp"

#include <QCloseEvent>
#include <QLabel>
#include <QMessageBox>
#include <QStatusBar>
#include <QWidget>

#include "RenderWindow.hpp"

MainWindow::MainWindow(QVulkanInstance* instance, const RendererSettings& settings, std::optional<double> pixelRatioOverride, QWidget* parent) :
    QMainWindow(parent)
{
    resize(int(settings.canvasWidth), int(settings.canvasHeight) + 24);
    setWindowTitle("Flux3D Viewer");

    // ------------------------------------------------------------
    // Central widget: the Vulkan window, wrapped for widget layouts
    // ------------------------------------------------------------
    m_renderWindow = new RenderWindow(instance, settings, pixelRatioOverride);

    QWidget* container = QWidget::createWindowContainer(m_renderWindow, this);
    container->setFocusPolicy(Qt::StrongFocus);
    container->setMinimumSize(64, 64);
    setCentralWidget(container);

    // ------------------------------------------------------------
    // Status bar
    // ------------------------------------------------------------
    m_deviceLabel = new QLabel(tr("No device"), this);
    m_fpsLabel    = new QLabel(tr("-- fps"), this);
    statusBar()->addWidget(m_deviceLabel, 1);
    statusBar()->addPermanentWidget(m_fpsLabel);

    connect(m_renderWindow, &RenderWindow::frameRateChanged, this, &MainWindow::onFrameRateChanged);
    connect(m_renderWindow, &RenderWindow::initializationFailed, this, &MainWindow::onInitializationFailed);
    connect(m_renderWindow, &RenderWindow::deviceLost, this, &MainWindow::onDeviceLost);
}

MainWindow::~MainWindow() noexcept
{
    // The container owns the window; nothing else to release here.
    m_renderWindow = nullptr;
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    if (m_renderWindow && m_renderWindow->scheduler().isRunning())
        m_renderWindow->scheduler().stop();

    QMainWindow::closeEvent(event);
}

void MainWindow::onFrameRateChanged(int fps)
{
    m_fpsLabel->setText(tr("%1 fps").arg(fps));

    if (m_renderWindow && m_renderWindow->renderer().hasInitialized())
    {
        const VulkanContext& ctx = m_renderWindow->renderer().context();
        m_deviceLabel->setText(tr("%1 | %2x MSAA")
                                   .arg(QString::fromUtf8(ctx.deviceProps.deviceName))
                                   .arg(int(m_renderWindow->renderer().sampleCount())));
    }
}

void MainWindow::onInitializationFailed(const QString& reason)
{
    m_deviceLabel->setText(tr("Renderer unavailable"));

    QMessageBox::critical(this,
                          tr("Vulkan Error"),
                          tr("The renderer could not start (%1). "
                             "This application requires a Vulkan-capable GPU and driver.")
                              .arg(reason));
}

void MainWindow::onDeviceLost(const QString& reason)
{
    m_deviceLabel->setText(tr("Device lost"));
    m_fpsLabel->setText(tr("-- fps"));

    QMessageBox::warning(this,
                         tr("Device Lost"),
                         tr("The GPU device was lost and rendering has stopped.\n\n%1").arg(reason));
}
