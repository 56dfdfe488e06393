#pragma once

#include <algorithm>
#include <cstdint>
#include <memory>
#include <vector>

#include "DeviceContext.hpp"
#include "Diagnostics.hpp"

/// Captures every diagnostic emitted while alive.
class DiagCapture
{
public:
    DiagCapture()
    {
        diag::setSink([this](const DiagRecord& r) { m_records.push_back(r); });
    }

    ~DiagCapture()
    {
        diag::resetSink();
    }

    DiagCapture(const DiagCapture&)            = delete;
    DiagCapture& operator=(const DiagCapture&) = delete;

    [[nodiscard]] const std::vector<DiagRecord>& records() const noexcept
    {
        return m_records;
    }

    [[nodiscard]] size_t count(DiagCode code) const
    {
        return size_t(std::count_if(m_records.begin(), m_records.end(), [code](const DiagRecord& r) {
            return r.code == code;
        }));
    }

    [[nodiscard]] size_t count(DiagSeverity severity) const
    {
        return size_t(std::count_if(m_records.begin(), m_records.end(), [severity](const DiagRecord& r) {
            return r.severity == severity;
        }));
    }

    void clear() noexcept
    {
        m_records.clear();
    }

private:
    std::vector<DiagRecord> m_records;
};

/// Headless device for GPU tests; nullptr when this machine has none.
inline std::unique_ptr<DeviceContext> acquireHeadlessDevice()
{
    DiagCapture quiet;

    auto device = std::make_unique<DeviceContext>();
    if (device->requestDevice(VK_NULL_HANDLE, DeviceRequest{}) != RenderStatus::Ok)
        return nullptr;

    return device;
}

/// Non-null handles that are never dereferenced; for code paths that only
/// compare handles and generations. Passing it to a Vulkan call is a bug.
inline VulkanContext unreachableContext(uint64_t generation)
{
    VulkanContext ctx  = {};
    ctx.device         = reinterpret_cast<VkDevice>(uintptr_t(0x1000));
    ctx.physicalDevice = reinterpret_cast<VkPhysicalDevice>(uintptr_t(0x2000));
    ctx.graphicsQueue  = reinterpret_cast<VkQueue>(uintptr_t(0x3000));
    ctx.generation     = generation;
    return ctx;
}
