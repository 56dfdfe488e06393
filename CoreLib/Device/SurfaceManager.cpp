//============================================================
// SurfaceManager.cpp
//============================================================
#include "SurfaceManager.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include "Diagnostics.hpp"

namespace
{
    uint32_t nonNegative(int v) noexcept
    {
        return v > 0 ? uint32_t(v) : 0u;
    }
} // namespace

SurfaceManager::SurfaceManager(uint32_t width, uint32_t height, double defaultPixelRatio) noexcept
{
    m_defaultRatio = clampPixelRatio(defaultPixelRatio);
    m_ratio        = m_defaultRatio;
    m_logical      = {width, height};
    m_physical     = computePhysicalSize(width, height, m_ratio);
}

SurfaceSize SurfaceManager::computePhysicalSize(uint32_t width, uint32_t height, double ratio) noexcept
{
    const double w = std::floor(double(width) * ratio);
    const double h = std::floor(double(height) * ratio);

    // Out-of-range double to uint32_t is undefined; saturate first.
    constexpr double kMax = double(std::numeric_limits<uint32_t>::max());

    SurfaceSize s = {};
    s.width       = uint32_t(std::clamp(w, 1.0, kMax));
    s.height      = uint32_t(std::clamp(h, 1.0, kMax));
    return s;
}

double SurfaceManager::clampPixelRatio(double ratio) noexcept
{
    if (!std::isfinite(ratio) || ratio <= 0.0)
        return kMinPixelRatio;

    return std::clamp(ratio, kMinPixelRatio, kMaxPixelRatio);
}

void SurfaceManager::setSize(int width, int height)
{
    applySize(nonNegative(width), nonNegative(height), m_ratio);
}

bool SurfaceManager::setDevicePixelRatio(double ratio)
{
    if (!std::isfinite(ratio) || ratio <= 0.0)
    {
        diag::error("SurfaceManager: Device pixel ratio must be greater than 0. Falling back to the default ratio.",
                    {"Provided value: " + std::to_string(ratio),
                     "Default ratio: " + std::to_string(m_defaultRatio)},
                    DiagCode::SurfaceInvalidPixelRatio);

        applySize(m_logical.width, m_logical.height, m_defaultRatio);
        return false;
    }

    if (ratio >= kHighPixelRatio)
    {
        diag::warn("SurfaceManager: A device pixel ratio of 2 or higher may cause performance issues.",
                   {"Requested ratio: " + std::to_string(ratio),
                    "Consider a ratio between 1 and 2 on weaker GPUs."},
                   DiagCode::SurfaceHighPixelRatio);
    }

    if (ratio >= kExtremePixelRatio)
    {
        diag::warn("SurfaceManager: A device pixel ratio of 10 or higher is not recommended.",
                   {"Render targets grow with the square of the ratio.",
                    "Expect severe slowdowns or allocation failures."},
                   DiagCode::SurfaceHighPixelRatio);
    }

    applySize(m_logical.width, m_logical.height, clampPixelRatio(ratio));
    return true;
}

bool SurfaceManager::trackContainerSize(int margin, bool autoTrack)
{
    if (!m_container)
    {
        diag::error("SurfaceManager: Cannot size to container, its size is not known yet.",
                    {"Call containerResized() from the hosting window first."},
                    DiagCode::SurfaceContainerUnknown);
        return false;
    }

    m_margin    = std::max(0, margin);
    m_autoTrack = autoTrack;

    setSize(int(m_container->width) - m_margin, int(m_container->height) - m_margin);
    return true;
}

void SurfaceManager::stopTrackingContainer() noexcept
{
    m_autoTrack = false;
}

void SurfaceManager::containerResized(int width, int height)
{
    m_container = SurfaceSize{nonNegative(width), nonNegative(height)};

    if (m_autoTrack)
        setSize(width - m_margin, height - m_margin);
}

void SurfaceManager::setColorFormat(VkFormat format) noexcept
{
    m_colorFormat = format;
}

int SurfaceManager::addChangeListener(ChangeListener fn)
{
    if (!fn)
        return 0;

    const int id = m_nextListenerId++;
    m_listeners.push_back({id, std::move(fn)});
    return id;
}

void SurfaceManager::removeChangeListener(int id) noexcept
{
    std::erase_if(m_listeners, [id](const Listener& l) { return l.id == id; });
}

void SurfaceManager::applySize(uint32_t width, uint32_t height, double ratio)
{
    const SurfaceSize physical = computePhysicalSize(width, height, ratio);

    const bool changed = physical != m_physical || ratio != m_ratio;

    m_logical  = {width, height};
    m_ratio    = ratio;
    m_physical = physical;

    if (changed)
        notifyChanged();
}

void SurfaceManager::notifyChanged()
{
    // Snapshot: a listener may unregister itself.
    const std::vector<Listener> listeners = m_listeners;
    for (const Listener& l : listeners)
        l.fn(*this);
}
