#ifndef MAINWINDOW_HPP
#define MAINWINDOW_HPP

#include <QMainWindow>
#include <optional>

#include "RendererSettings.hpp"

class QLabel;
class QVulkanInstance;
class RenderWindow;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    MainWindow(QVulkanInstance* instance, const RendererSettings& settings, std::optional<double> pixelRatioOverride, QWidget* parent = nullptr);
    ~MainWindow() noexcept override;

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onFrameRateChanged(int fps);
    void onInitializationFailed(const QString& reason);
    void onDeviceLost(const QString& reason);

private:
    RenderWindow* m_renderWindow = nullptr;
    QLabel*       m_fpsLabel     = nullptr;
    QLabel*       m_deviceLabel  = nullptr;
};
#endif // MAINWINDOW_HPP
