#ifdef _WIN32
extern "C" {
// For NVIDIA Optimus
__declspec(dllexport) unsigned long NvOptimusEnablement = 0x00000001;

// For AMD Switchable Graphics
__declspec(dllexport) int AmdPowerXpressRequestHighPerformance = 1;
}
#endif

#include <QApplication>
#include <QCommandLineParser>
#include <QMessageBox>
#include <QRegularExpression>
#include <QVulkanInstance>
#include <optional>

#include "Color.hpp"
#include "Diagnostics.hpp"
#include "MainWindow.hpp"
#include "RendererSettings.hpp"

namespace
{
    struct ViewerOptions
    {
        RendererSettings      settings;
        std::optional<double> pixelRatio;
    };

    // -------------------------------------------------------------------------
    // Command line -> RendererSettings. Bad values keep the default with a warning.
    // -------------------------------------------------------------------------
    ViewerOptions parseOptions(const QApplication& app)
    {
        QCommandLineParser parser;
        parser.setApplicationDescription("Flux3D viewer");
        parser.addHelpOption();

        const QCommandLineOption sizeOpt("size", "Logical canvas size.", "WxH");
        const QCommandLineOption msaaOpt("msaa", "MSAA sample count (1, 2, 4 or 8).", "N");
        const QCommandLineOption dprOpt("dpr", "Device pixel ratio override.", "R");
        const QCommandLineOption powerOpt("power", "Adapter power preference.", "low|high");
        const QCommandLineOption clearOpt("clear", "Clear color.", "#rrggbb[aa]");
        const QCommandLineOption validationOpt("validation", "Enable Vulkan validation layers.");

        parser.addOptions({sizeOpt, msaaOpt, dprOpt, powerOpt, clearOpt, validationOpt});
        parser.process(app);

        ViewerOptions out;
        RendererSettings& s = out.settings;

        if (parser.isSet(sizeOpt))
        {
            static const QRegularExpression re("^(\\d+)x(\\d+)$");
            const QRegularExpressionMatch   m = re.match(parser.value(sizeOpt));
            if (m.hasMatch())
            {
                s.canvasWidth  = m.captured(1).toUInt();
                s.canvasHeight = m.captured(2).toUInt();
            }
            else
            {
                diag::warn("Viewer: Ignoring --size, expected WxH.", {parser.value(sizeOpt).toStdString()});
            }
        }

        if (parser.isSet(msaaOpt))
        {
            bool           ok = false;
            const uint32_t n  = parser.value(msaaOpt).toUInt(&ok);
            if (ok)
            {
                s.msaaSampleCount = n;
                s.antialiasing    = n > 1;
            }
            else
            {
                diag::warn("Viewer: Ignoring --msaa, expected a number.", {parser.value(msaaOpt).toStdString()});
            }
        }

        if (parser.isSet(dprOpt))
        {
            bool         ok = false;
            const double r  = parser.value(dprOpt).toDouble(&ok);
            if (ok)
                out.pixelRatio = r;
            else
                diag::warn("Viewer: Ignoring --dpr, expected a number.", {parser.value(dprOpt).toStdString()});
        }

        if (parser.isSet(powerOpt))
        {
            const QString p = parser.value(powerOpt).toLower();
            if (p == "low")
                s.powerPreference = PowerPreference::LowPower;
            else if (p == "high")
                s.powerPreference = PowerPreference::HighPerformance;
            else
                diag::warn("Viewer: Ignoring --power, expected low or high.", {p.toStdString()});
        }

        if (parser.isSet(clearOpt))
        {
            const std::optional<Color> c = Color::fromHex(parser.value(clearOpt).toStdString());
            if (c)
                s.clearColor = *c;
            else
                diag::warn("Viewer: Ignoring --clear, expected #rrggbb or #rrggbbaa.", {parser.value(clearOpt).toStdString()});
        }

        s.enableValidation = parser.isSet(validationOpt);
        return out;
    }

    void enableVulkanValidationLayer(QVulkanInstance& instance)
    {
        const auto supported = instance.supportedLayers();
        if (!supported.contains("VK_LAYER_KHRONOS_validation"))
        {
            diag::warn("Viewer: VK_LAYER_KHRONOS_validation not available on this system.");
            return;
        }

        instance.setLayers({"VK_LAYER_KHRONOS_validation"});
        instance.setExtensions({"VK_EXT_debug_utils"});
    }
} // namespace

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    QApplication::setApplicationName("Flux3D");

    const ViewerOptions options = parseOptions(app);

    QVulkanInstance instance;
    instance.setApiVersion(QVersionNumber(1, 1));

    if (options.settings.enableValidation)
        enableVulkanValidationLayer(instance);

    if (!instance.create())
    {
        QMessageBox::critical(nullptr,
                              QObject::tr("Vulkan Error"),
                              QObject::tr("Failed to create a Vulkan instance. "
                                          "This application requires a Vulkan-capable GPU and driver."));
        return EXIT_FAILURE;
    }

    int result = 0;
    {
        MainWindow win(&instance, options.settings, options.pixelRatio);
        win.show();
        result = app.exec();
    }

    // Windows (and their surfaces) are gone before the instance.
    return result;
}
