#include "RendererSettings.hpp"

#include <algorithm>
#include <cmath>

const char* toString(DeviceFeature f) noexcept
{
    switch (f)
    {
        case DeviceFeature::SamplerAnisotropy:
            return "samplerAnisotropy";
        case DeviceFeature::FillModeNonSolid:
            return "fillModeNonSolid";
        case DeviceFeature::WideLines:
            return "wideLines";
        case DeviceFeature::GeometryShader:
            return "geometryShader";
        case DeviceFeature::SampleRateShading:
            return "sampleRateShading";
        case DeviceFeature::DepthClamp:
            return "depthClamp";
        case DeviceFeature::IndependentBlend:
            return "independentBlend";
        case DeviceFeature::MultiDrawIndirect:
            return "multiDrawIndirect";
        case DeviceFeature::TextureCompressionBC:
            return "textureCompressionBC";
    }
    return "unknown";
}

RendererSettings resolveSettings(const RendererSettings& in)
{
    RendererSettings out = in;

    out.canvasWidth  = std::max<uint32_t>(1u, in.canvasWidth);
    out.canvasHeight = std::max<uint32_t>(1u, in.canvasHeight);

    if (!std::isfinite(in.devicePixelRatio) || in.devicePixelRatio <= 0.0)
        out.devicePixelRatio = 1.0;

    if (!in.antialiasing)
        out.msaaSampleCount = 1;

    out.usageFlags |= VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;

    if (out.depthFormat == VK_FORMAT_UNDEFINED)
        out.depthFormat = VK_FORMAT_D32_SFLOAT;

    return out;
}

std::vector<std::string> describeSettings(const RendererSettings& s)
{
    std::vector<std::string> lines;
    lines.reserve(8);

    lines.push_back("canvas: " + std::to_string(s.canvasWidth) + "x" + std::to_string(s.canvasHeight));
    lines.push_back("devicePixelRatio: " + std::to_string(s.devicePixelRatio));
    lines.push_back(std::string("powerPreference: ") +
                    (s.powerPreference == PowerPreference::HighPerformance ? "high-performance" : "low-power"));
    lines.push_back(std::string("antialiasing: ") + (s.antialiasing ? "on" : "off") +
                    " (" + std::to_string(s.msaaSampleCount) + " samples requested)");
    lines.push_back("clearColor: " + s.clearColor.toHex());
    lines.push_back(std::string("validation: ") + (s.enableValidation ? "on" : "off"));

    if (!s.requiredFeatures.empty())
    {
        std::string feats = "requiredFeatures:";
        for (DeviceFeature f : s.requiredFeatures)
            feats += std::string(" ") + toString(f);
        lines.push_back(feats);
    }

    return lines;
}
