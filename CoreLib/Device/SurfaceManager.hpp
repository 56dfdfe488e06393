#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>
#include <vulkan/vulkan.h>

struct SurfaceSize
{
    uint32_t width  = 1;
    uint32_t height = 1;

    bool operator==(const SurfaceSize&) const = default;
};

/**
 * @brief Owns the logical size, pixel ratio and physical (render) size.
 *
 * Physical size = max(1, floor(logical * ratio)) per axis, so a render target
 * sized from it is never zero-sized.
 *
 * Every accepted change that alters the physical size or the ratio invokes the
 * registered change listeners synchronously (no batching). The renderer uses
 * this to mark its render targets stale.
 */
class SurfaceManager
{
public:
    using ChangeListener = std::function<void(const SurfaceManager&)>;

    static constexpr double kMinPixelRatio       = 1.0;
    static constexpr double kMaxPixelRatio       = 100.0;
    static constexpr double kHighPixelRatio      = 2.0;
    static constexpr double kExtremePixelRatio   = 10.0;

    explicit SurfaceManager(uint32_t width = 800, uint32_t height = 600, double defaultPixelRatio = 1.0) noexcept;

    SurfaceManager(const SurfaceManager&)            = delete;
    SurfaceManager& operator=(const SurfaceManager&) = delete;

    /// Negative values are treated as 0 (physical size still clamps to 1).
    void setSize(int width, int height);

    /// Returns false for ratio <= 0 (falls back to the default ratio).
    bool setDevicePixelRatio(double ratio);

    /**
     * @brief Size the surface to (container - margin).
     *
     * Needs a container size first (containerResized()). With autoTrack, every
     * later containerResized() re-applies the margin.
     */
    bool trackContainerSize(int margin, bool autoTrack);
    void stopTrackingContainer() noexcept;

    /// Reports the current size of the hosting container (window, widget).
    void containerResized(int width, int height);

    void     setColorFormat(VkFormat format) noexcept;
    VkFormat colorFormat() const noexcept
    {
        return m_colorFormat;
    }

    [[nodiscard]] SurfaceSize logicalSize() const noexcept
    {
        return m_logical;
    }

    [[nodiscard]] SurfaceSize physicalSize() const noexcept
    {
        return m_physical;
    }

    [[nodiscard]] double devicePixelRatio() const noexcept
    {
        return m_ratio;
    }

    [[nodiscard]] bool isTrackingContainer() const noexcept
    {
        return m_autoTrack;
    }

    int  addChangeListener(ChangeListener fn);
    void removeChangeListener(int id) noexcept;

    // ------------------------------------------------------------
    // Pure helpers
    // ------------------------------------------------------------
    [[nodiscard]] static SurfaceSize computePhysicalSize(uint32_t width, uint32_t height, double ratio) noexcept;
    [[nodiscard]] static double      clampPixelRatio(double ratio) noexcept;

private:
    void applySize(uint32_t width, uint32_t height, double ratio);
    void notifyChanged();

private:
    SurfaceSize m_logical  = {};
    SurfaceSize m_physical = {};
    double      m_ratio    = 1.0;
    double      m_defaultRatio = 1.0;
    VkFormat    m_colorFormat  = VK_FORMAT_UNDEFINED;

    std::optional<SurfaceSize> m_container = {};
    int                        m_margin    = 0;
    bool                       m_autoTrack = false;

    struct Listener
    {
        int            id = 0;
        ChangeListener fn;
    };
    std::vector<Listener> m_listeners;
    int                   m_nextListenerId = 1;
};
